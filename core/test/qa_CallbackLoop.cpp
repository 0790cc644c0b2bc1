#include <boost/ut.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include <vpncore/CallbackLoop.hpp>
#include <vpncore/Error.hpp>

const boost::ut::suite<"vpn::CallbackLoop"> callbackLoopTests = [] {
    using namespace boost::ut;
    using namespace std::chrono_literals;

    "callbacks run in posting order on the driving thread"_test = [] {
        vpn::CallbackLoop loop("order");
        std::vector<int>  order;
        for (int i = 0; i < 5; ++i) {
            loop.post([&order, i] { order.push_back(i); });
        }
        expect(eq(loop.numPending(), 5UZ));
        expect(!loop.isCallbackThread());
        expect(eq(loop.processPending(), 5UZ));
        expect(loop.isCallbackThread());
        expect(order == std::vector<int>{0, 1, 2, 3, 4});
        expect(eq(loop.numProcessed(), 5UZ));
    };

    "processPending leaves callbacks posted by callbacks for the next round"_test = [] {
        vpn::CallbackLoop loop;
        int               count = 0;
        loop.post([&] {
            ++count;
            loop.post([&] { ++count; });
        });
        expect(eq(loop.processPending(), 1UZ));
        expect(eq(count, 1));
        expect(eq(loop.processPending(), 1UZ));
        expect(eq(count, 2));
    };

    "posting from other threads"_test = [] {
        vpn::CallbackLoop        loop;
        std::atomic<std::size_t> count{0UZ};
        std::vector<std::thread> producers;
        for (int t = 0; t < 4; ++t) {
            producers.emplace_back([&] {
                for (int i = 0; i < 25; ++i) {
                    loop.post([&count] { count.fetch_add(1UZ); });
                }
            });
        }
        for (auto& producer : producers) {
            producer.join();
        }
        expect(loop.processUntil([&] { return count.load() == 100UZ; }, 2s));
    };

    "processUntil times out"_test = [] {
        vpn::CallbackLoop loop;
        const auto        start = std::chrono::steady_clock::now();
        expect(!loop.processUntil([] { return false; }, 30ms));
        expect(std::chrono::steady_clock::now() - start >= 30ms);
    };

    "processFor waits for late callbacks"_test = [] {
        vpn::CallbackLoop loop;
        std::atomic_bool  ran{false};
        std::thread       poster([&] {
            std::this_thread::sleep_for(10ms);
            loop.post([&ran] { ran = true; });
        });
        loop.processFor(200ms);
        poster.join();
        expect(ran.load());
    };

    "throwing callback does not stop the loop"_test = [] {
        vpn::CallbackLoop loop;
        bool              ran = false;
        loop.post([] { throw std::runtime_error("callback failure"); });
        loop.post([&ran] { ran = true; });
        expect(nothrow([&] { loop.processPending(); }));
        expect(ran);
    };

    "owned thread"_test = [] {
        vpn::CallbackLoop loop("cb-thread");
        std::atomic_bool  onLoopThread{false};
        std::atomic_bool  done{false};
        loop.startThread();
        expect(throws<vpn::exception>([&] { loop.startThread(); }));
        loop.post([&] {
            onLoopThread = loop.isCallbackThread();
            done         = true;
            done.notify_all();
        });
        done.wait(false);
        expect(onLoopThread.load());
        expect(!loop.isCallbackThread());
        expect(throws<vpn::exception>([&] { loop.processPending(); })) << "loop is driven by its own thread";
        loop.stopThread();
    };

    "run returns after requestStop and drains the queue"_test = [] {
        vpn::CallbackLoop loop;
        int               count = 0;
        loop.post([&] { ++count; });
        loop.post([&] {
            ++count;
            loop.requestStop();
        });
        loop.post([&] { ++count; });
        loop.run();
        expect(eq(count, 3));
    };
};

int main() { /* tests are statically executed */ }
