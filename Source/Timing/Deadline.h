#pragma once

#include "Common/Errors.h"
#include "Common/Result.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace nasync::timing {
    struct deadline_options {
        std::chrono::milliseconds timeout{5000};
        // when false, an expired call is left pending forever instead of failing
        bool reject_on_timeout = true;
        // reported by timeout_expired_error; empty means anonymous
        std::string name;
    };

    // Throws std::invalid_argument for a negative timeout.
    void validate(const deadline_options &options);

    template <class F, class... Args>
    using deadline_result_t = typename std::invoke_result_t<F &, Args &...>::value_type;

    // Callable with the signature of F that stops waiting for F's awaitable once the
    // deadline passes. The wrapped operation itself keeps running; a result that
    // arrives late is discarded. Every call starts its own timer.
    template <class F>
    class deadline_wrapper {
    public:
        deadline_wrapper(F func, deadline_options options)
                : m_func(std::move(func)), m_options(std::move(options)) { validate(m_options); }

        template <class... Args>
        asio::awaitable<deadline_result_t<F, std::decay_t<Args>...>> operator()(Args &&... args) const {
            return race(m_func, m_options, std::decay_t<Args>(std::forward<Args>(args))...);
        }

        [[nodiscard]] const deadline_options &options() const noexcept { return m_options; }

    private:
        F m_func;
        deadline_options m_options;

        template <class... Args>
        static asio::awaitable<deadline_result_t<F, Args...>> race(F func, deadline_options options, Args... args) {
            using value_type = deadline_result_t<F, Args...>;

            const auto executor = co_await asio::this_coro::executor;
            result_promise<value_type> promise;
            const auto handle = promise.handle();

            auto deadline = std::make_shared<asio::steady_timer>(executor, options.timeout);
            deadline->async_wait([promise, options](const boost::system::error_code &ec) mutable {
                if (ec == asio::error::operation_aborted) return;
                if (options.reject_on_timeout)
                    promise.reject(std::make_exception_ptr(timeout_expired_error(options.name, options.timeout)));
                else promise.abandon();
            });

            // this frame keeps no promise, so an abandoned call is released once relay ends
            asio::co_spawn(executor, relay(std::move(promise), deadline, std::move(func), std::move(args)...),
                           report_escaped{"deadline_wrapper"});

            if constexpr (std::is_void_v<value_type>) co_await handle.get();
            else co_return co_await handle.get();
        }

        template <class T, class... Args>
        static asio::awaitable<void> relay(result_promise<T> promise, std::shared_ptr<asio::steady_timer> deadline,
                                           F func, Args... args) {
            std::exception_ptr error;
            try {
                if constexpr (std::is_void_v<T>) {
                    co_await std::invoke(func, args...);
                    deadline->cancel();
                    promise.resolve();
                } else {
                    auto value = co_await std::invoke(func, args...);
                    deadline->cancel();
                    promise.resolve(std::move(value));
                }
                co_return;
            }
            catch (...) {
                error = std::current_exception();
            }
            deadline->cancel();
            promise.reject(std::move(error));
        }
    };

    template <class F>
    [[nodiscard]] deadline_wrapper<std::decay_t<F>> with_timeout(F &&func, deadline_options options = {}) {
        return deadline_wrapper<std::decay_t<F>>(std::forward<F>(func), std::move(options));
    }
}
