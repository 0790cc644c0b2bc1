#include <boost/ut.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include <vpncore/thread/thread_pool.hpp>

const boost::ut::suite<"vpn::thread_pool BasicThreadPool"> basicThreadPool = [] {
    using namespace boost::ut;
    using namespace std::chrono_literals;
    using namespace vpn::thread_pool;

    "construction"_test = [] {
        expect(nothrow([] { BasicThreadPool("test", 4U, 4U); }));
        expect(throws<std::invalid_argument>([] { BasicThreadPool("zero", 0U, 1U); }));
        expect(throws<std::invalid_argument>([] { BasicThreadPool("zero", 1U, 0U); }));

        BasicThreadPool pool("bounds", 3U, 2U);
        expect(eq(pool.minThreads(), 2U)) << "minimum is clamped to the maximum";
        expect(eq(pool.maxThreads(), 2U));
        expect(eq(pool.numThreads(), 2UZ));
    };

    "workers carry the pool name"_test = [] {
        BasicThreadPool          pool("named", 1U, 1U);
        std::atomic<std::size_t> done{0UZ};
        std::string              workerName;
        pool.execute([&] {
            workerName = thread::getThreadName();
            done       = 1UZ;
            done.notify_all();
        });
        done.wait(0UZ);
        expect(eq(workerName, std::string("named#0")));
    };

    "pool grows while all workers are blocked"_test = [] {
        std::atomic<std::size_t> started{0UZ};
        std::atomic<std::size_t> finished{0UZ};
        std::atomic_bool         release{false};
        BasicThreadPool          pool("grow", 1U, 4U);
        for (std::size_t i = 0UZ; i < 3UZ; ++i) {
            pool.execute([&] {
                started.fetch_add(1UZ);
                started.notify_all();
                release.wait(false);
                finished.fetch_add(1UZ);
                finished.notify_all();
            });
        }
        for (std::size_t i = 0UZ; i < 3UZ; ++i) {
            started.wait(i);
        }
        expect(eq(started.load(), 3UZ)) << "three blocking tasks run concurrently";
        expect(that % pool.numThreads() >= 3UZ);
        expect(that % pool.numThreads() <= 4UZ);

        release = true;
        release.notify_all();
        for (std::size_t i = 0UZ; i < 3UZ; ++i) {
            finished.wait(i);
        }
        expect(eq(finished.load(), 3UZ));
    };

    "idle workers retire down to the minimum"_test = [] {
        std::atomic<std::size_t> started{0UZ};
        std::atomic_bool         release{false};
        BasicThreadPool          pool("retire", 1U, 4U, 10ms);
        for (std::size_t i = 0UZ; i < 4UZ; ++i) {
            pool.execute([&] {
                started.fetch_add(1UZ);
                started.notify_all();
                release.wait(false);
            });
        }
        for (std::size_t i = 0UZ; i < 4UZ; ++i) {
            started.wait(i);
        }
        expect(eq(pool.numThreads(), 4UZ));
        release = true;
        release.notify_all();

        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (pool.numThreads() > 1UZ && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        expect(eq(pool.numThreads(), 1UZ));
    };

    "queued tasks are drained on shutdown"_test = [] {
        std::atomic<std::size_t> counter{0UZ};
        {
            BasicThreadPool pool("drain", 1U, 1U);
            for (std::size_t i = 0UZ; i < 16UZ; ++i) {
                pool.execute([&counter] { counter.fetch_add(1UZ); });
            }
        }
        expect(eq(counter.load(), 16UZ));
    };

    "execute after shutdown throws"_test = [] {
        auto pool = makeIoPool("closed", 1U, 1U);
        expect(pool->name() == "closed");
        expect(!pool->isShutdown());
        pool->requestShutdown();
        expect(pool->isShutdown());
        expect(nothrow([&] { pool->requestShutdown(); })) << "shutdown is idempotent";
        expect(throws<std::logic_error>([&] { pool->execute([] {}); }));
    };
};

int main() { /* tests are statically executed */ }
