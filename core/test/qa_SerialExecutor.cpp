#include <boost/ut.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <vpncore/thread/SerialExecutor.hpp>
#include <vpncore/thread/thread_pool.hpp>

const boost::ut::suite<"vpn::thread_pool SerialExecutor"> serialExecutor = [] {
    using namespace boost::ut;
    using namespace vpn::thread_pool;

    "null executor is rejected"_test = [] { expect(throws<std::invalid_argument>([] { SerialExecutor executor(nullptr); })); };

    "tasks run in submission order and never overlap"_test = [] {
        SerialExecutor   executor(makeIoPool("serial", 1U, 4U));
        std::mutex       mutex;
        std::vector<int> order;
        std::atomic<int> concurrent{0};
        std::atomic<int> maxConcurrent{0};

        for (int i = 0; i < 50; ++i) {
            executor.execute([&, i] {
                const int now  = concurrent.fetch_add(1) + 1;
                int       seen = maxConcurrent.load();
                while (now > seen && !maxConcurrent.compare_exchange_weak(seen, now)) {
                }
                if (i % 10 == 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
                {
                    std::scoped_lock lock(mutex);
                    order.push_back(i);
                }
                concurrent.fetch_sub(1);
            });
        }
        executor.waitUntilIdle();

        expect(eq(order.size(), 50UZ));
        for (int i = 0; i < static_cast<int>(order.size()); ++i) {
            expect(eq(order[static_cast<std::size_t>(i)], i));
        }
        expect(eq(maxConcurrent.load(), 1));
        expect(eq(executor.numTasksExecuted(), 50UZ));
        expect(eq(executor.numTasksPending(), 0UZ));
    };

    "a throwing task does not block the following ones"_test = [] {
        SerialExecutor   executor(makeIoPool("serial-throw", 1U, 2U));
        std::atomic<int> ran{0};
        executor.execute([] { throw std::runtime_error("task failure"); });
        executor.execute([&ran] { ++ran; });
        executor.waitUntilIdle();
        expect(eq(ran.load(), 1));
        expect(eq(executor.numTasksExecuted(), 2UZ));
    };

    "a task throwing a foreign exception does not stop the worker"_test = [] {
        SerialExecutor   executor(makeIoPool("serial-foreign", 1U, 1U));
        std::atomic<int> ran{0};
        executor.execute([] { throw 7; });
        executor.execute([&ran] { ++ran; });
        executor.waitUntilIdle();
        expect(eq(ran.load(), 1));
        expect(eq(executor.numTasksExecuted(), 2UZ));
    };

    "execute does not block the caller"_test = [] {
        SerialExecutor   executor(makeIoPool("serial-block", 1U, 2U));
        std::atomic_bool release{false};
        executor.execute([&release] { release.wait(false); });

        const auto start = std::chrono::steady_clock::now();
        executor.execute([] {});
        expect(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(100));
        expect(eq(executor.numTasksPending(), 2UZ));

        release = true;
        release.notify_all();
        executor.waitUntilIdle();
        expect(eq(executor.numTasksPending(), 0UZ));
    };

    "refused task releases waiters"_test = [] {
        auto pool = makeIoPool("serial-closed", 1U, 1U);
        pool->requestShutdown();
        SerialExecutor executor(pool);
        expect(throws<std::logic_error>([&] { executor.execute([] {}); }));
        executor.waitUntilIdle(); // must not hang
        expect(eq(executor.numTasksExecuted(), 0UZ));
    };
};

int main() { /* tests are statically executed */ }
