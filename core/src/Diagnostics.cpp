#include <vpncore/Diagnostics.hpp>

namespace vpn {

std::expected<void, Error> MetadataStore::putMetadata(std::string_view key, std::string_view value) {
    if (key.empty()) {
        return std::unexpected(Error("metadata key must not be empty"));
    }
    std::scoped_lock lock(_mutex);
    _metadata.insert_or_assign(std::string(key), pmtv::pmt(std::string(value)));
    ++_putCounts[std::string(key)];
    return {};
}

property_map MetadataStore::snapshot() const {
    std::scoped_lock lock(_mutex);
    return _metadata;
}

std::optional<std::string> MetadataStore::get(std::string_view key) const {
    std::scoped_lock lock(_mutex);
    const auto       it = _metadata.find(std::string(key));
    if (it == _metadata.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<std::string>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

std::size_t MetadataStore::putCount(std::string_view key) const {
    std::scoped_lock lock(_mutex);
    const auto       it = _putCounts.find(std::string(key));
    return it == _putCounts.end() ? 0UZ : it->second;
}

} // namespace vpn
