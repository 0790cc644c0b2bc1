#include <boost/ut.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <vpncore/Error.hpp>
#include <vpncore/OneShotFuture.hpp>

const boost::ut::suite<"vpn::OneShotFuture"> oneShotFutureTests = [] {
    using namespace boost::ut;
    using namespace std::chrono_literals;

    "continuations fire in registration order on completion"_test = [] {
        vpn::OneShotFuture<int>  future;
        std::vector<std::string> calls;
        future.onComplete([&](const int& v) { calls.push_back("first:" + std::to_string(v)); });
        future.onComplete([&](const int& v) { calls.push_back("second:" + std::to_string(v)); });
        expect(eq(future.numPendingContinuations(), 2UZ));
        expect(calls.empty());

        future.complete(7);
        expect(calls == std::vector<std::string>{"first:7", "second:7"});
        expect(eq(future.numPendingContinuations(), 0UZ));
    };

    "late registration fires immediately"_test = [] {
        vpn::OneShotFuture<int> future;
        future.complete(3);
        int seen = 0;
        future.onComplete([&](const int& v) { seen = v; });
        expect(eq(seen, 3));
    };

    "the same continuation registered twice fires twice"_test = [] {
        vpn::OneShotFuture<int> future;
        int                     count        = 0;
        auto                    continuation = [&count](const int&) { ++count; };
        future.onComplete(continuation);
        future.onComplete(continuation);
        future.complete(1);
        expect(eq(count, 2));
    };

    "second complete throws and keeps the first value"_test = [] {
        vpn::OneShotFuture<int> future;
        int                     count = 0;
        future.onComplete([&count](const int&) { ++count; });
        future.complete(1);
        expect(throws<vpn::exception>([&] { future.complete(2); }));
        expect(eq(future.getBlocking(), 1));
        expect(eq(count, 1));
    };

    "a throwing continuation does not starve the following ones"_test = [] {
        vpn::OneShotFuture<int> future;
        int                     secondCalls = 0;
        future.onComplete([](const int&) { throw std::runtime_error("consumer bug"); });
        future.onComplete([&secondCalls](const int&) { ++secondCalls; });

        expect(nothrow([&] { future.complete(9); }));
        expect(eq(secondCalls, 1));
        expect(future.isComplete());
        expect(eq(future.getBlocking(), 9));
    };

    "peek and isComplete"_test = [] {
        vpn::OneShotFuture<std::string> future;
        expect(!future.isComplete());
        expect(!future.peek().has_value());
        future.complete("done");
        expect(future.isComplete());
        expect(future.peek() == std::optional<std::string>("done"));
    };

    "getBlocking waits for another thread"_test = [] {
        vpn::OneShotFuture<int> future;
        std::thread             producer([&] {
            std::this_thread::sleep_for(10ms);
            future.complete(42);
        });
        expect(eq(future.getBlocking(), 42));
        producer.join();
    };

    "getBlocking with timeout"_test = [] {
        vpn::OneShotFuture<int> future;
        expect(!future.getBlocking(10ms).has_value());
        future.complete(5);
        expect(future.getBlocking(10ms) == std::optional<int>(5));
    };

    "continuations run on the completing thread"_test = [] {
        vpn::OneShotFuture<int> future;
        std::thread::id         continuationThread;
        future.onComplete([&](const int&) { continuationThread = std::this_thread::get_id(); });
        std::thread::id completingThread;
        std::thread     producer([&] {
            completingThread = std::this_thread::get_id();
            future.complete(1);
        });
        producer.join();
        expect(continuationThread == completingThread);
    };
};

int main() { /* tests are statically executed */ }
