#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "Common/Errors.h"
#include "Dispatch/Batch.h"
#include "Dispatch/BoundedQueue.h"
#include "Timing/Deadline.h"

using namespace boost;
using namespace std::chrono_literals;

namespace {
    asio::awaitable<int> sleep_then(const std::chrono::milliseconds delay, const int value) {
        asio::steady_timer timer{co_await asio::this_coro::executor, delay};
        co_await timer.async_wait(asio::use_awaitable);
        co_return value;
    }

    asio::awaitable<void> drive_queue(std::shared_ptr<nasync::dispatch::bounded_queue> queue) {
        const auto delays = {120, 40, 80, 10, 60};
        std::vector<nasync::result_handle<int>> handles;
        auto index = 0;
        for (const auto delay : delays) {
            const auto value = index++;
            handles.push_back(queue->push([delay, value] { return sleep_then(std::chrono::milliseconds(delay), value); },
                                          "job-" + std::to_string(value)));
        }
        std::printf("queue: %zu running, %zu pending\n", queue->running().size(), queue->pending());
        for (const auto &handle : handles) std::printf("queue: result %d\n", co_await handle.get());
    }

    asio::awaitable<void> drive_deadline() {
        const auto fast = nasync::timing::with_timeout(sleep_then, {50ms, true, "sleep_then"});
        std::printf("deadline: fast call returned %d\n", co_await fast(10ms, 42));
        try {
            co_await fast(200ms, 7);
        }
        catch (nasync::timeout_expired_error &e) {
            std::printf("deadline: %s\n", e.what());
        }
    }

    asio::awaitable<void> drive_batch() {
        const auto odd = [](const int value) -> asio::awaitable<bool> {
            co_await sleep_then(std::chrono::milliseconds(value), 0);
            co_return value % 2 == 1;
        };
        std::vector<int> every_items{1, 3, 5};
        const auto all_odd = co_await nasync::dispatch::async_every(std::move(every_items), odd);
        std::vector<int> filter_items{5, 2, 7, 4};
        const auto kept = co_await nasync::dispatch::async_filter(std::move(filter_items), odd);
        std::printf("batch: all odd %s, kept %zu of 4\n", all_odd ? "yes" : "no", kept.size());
    }
}

int main(int argc, char **argv) {
    const auto limit = argc > 1 ? std::strtoul(argv[1], nullptr, 10) : 2ul;
    asio::io_context context;
    try {
        const auto queue = nasync::dispatch::bounded_queue::create(context.get_executor(), {limit});
        asio::co_spawn(context, drive_queue(queue), nasync::report_escaped{"demo queue"});
        asio::co_spawn(context, drive_deadline(), nasync::report_escaped{"demo deadline"});
        asio::co_spawn(context, drive_batch(), nasync::report_escaped{"demo batch"});
        context.run();
    }
    catch (std::exception &e) {
        std::printf("demo: %s\n", e.what());
        return 1;
    }
}
