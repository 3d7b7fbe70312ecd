#pragma once

#include <chrono>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <utility>
#include "Common/Errors.h"
#include "Common/Result.h"

namespace nasync::test {
    using test_clock = std::chrono::steady_clock;

    inline asio::awaitable<void> delay(const std::chrono::milliseconds duration) {
        asio::steady_timer timer{co_await asio::this_coro::executor, duration};
        co_await timer.async_wait(asio::use_awaitable);
    }

    template <class Awaitable>
    void spawn(asio::io_context &context, Awaitable &&work) {
        asio::co_spawn(context, std::forward<Awaitable>(work), report_escaped{"test"});
    }

    // Sets the flag when destroyed, which shows a suspended coroutine frame was released.
    struct unwind_flag {
        bool &flag;

        ~unwind_flag() { flag = true; }
    };

    inline std::chrono::milliseconds since(const test_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(test_clock::now() - start);
    }
}
