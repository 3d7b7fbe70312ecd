#pragma once

#include <utility>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace nasync {
    namespace asio = boost::asio;

    template <class T>
    class result_promise;

    namespace detail {
        class result_waiter {
        public:
            virtual ~result_waiter() = default;

            virtual void complete() = 0;
        };

        template <class Handler>
        class parked_handler final : public result_waiter {
        public:
            explicit parked_handler(Handler handler) : m_handler(std::move(handler)) {}

            void complete() override { asio::post(std::move(m_handler)); }

        private:
            Handler m_handler;
        };

        // One-shot state shared by the promises and handles of a result. Parked waiters
        // hold no executor work, so a result that never settles does not keep run() busy.
        template <class T>
        class result_state {
        public:
            using storage_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

            // Only the first of resolve/reject/abandon gets through.
            [[nodiscard]] bool close() noexcept { return !std::exchange(m_closed, true); }

            template <class... U>
            void store(U &&... value) {
                m_value.emplace(std::forward<U>(value)...);
                notify();
            }

            void fail(std::exception_ptr error) {
                m_error = std::move(error);
                notify();
            }

            template <class Handler>
            void park(Handler handler) {
                if (m_settled) asio::post(std::move(handler));
                else if (!m_orphaned)
                    m_waiters.push_back(std::make_unique<parked_handler<Handler>>(std::move(handler)));
                // otherwise nothing can settle it: dropping the handler unwinds the waiter
            }

            // The last promise went away unsettled. Waiters are dropped, never resumed.
            void orphan() {
                m_orphaned = true;
                const auto dropped = std::move(m_waiters);
                m_waiters.clear();
            }

            [[nodiscard]] bool closed() const noexcept { return m_closed; }

            [[nodiscard]] bool settled() const noexcept { return m_settled; }

            [[nodiscard]] bool failed() const noexcept { return m_settled && m_error; }

            [[nodiscard]] const std::exception_ptr &error() const noexcept { return m_error; }

            [[nodiscard]] storage_type &value() { return *m_value; }

        private:
            std::optional<storage_type> m_value;
            std::exception_ptr m_error;
            std::vector<std::unique_ptr<result_waiter>> m_waiters;
            bool m_closed = false;
            bool m_settled = false;
            bool m_orphaned = false;

            void notify() {
                m_settled = true;
                const auto ready = std::move(m_waiters);
                m_waiters.clear();
                for (const auto &waiter : ready) waiter->complete();
            }
        };

        // Owned jointly by every copy of a promise.
        template <class T>
        class result_writer {
        public:
            explicit result_writer(std::shared_ptr<result_state<T>> state) noexcept: m_state(std::move(state)) {}

            result_writer(const result_writer &) = delete;

            result_writer &operator=(const result_writer &) = delete;

            ~result_writer() {
                if (!m_state->settled()) m_state->orphan();
            }

            [[nodiscard]] const std::shared_ptr<result_state<T>> &state() const noexcept { return m_state; }

        private:
            std::shared_ptr<result_state<T>> m_state;
        };
    }

    // Reading side of a one-shot result. Copies observe the same result. A move-only
    // value is handed to the first reader.
    template <class T>
    class result_handle {
    public:
        using value_type = T;

        result_handle() = default;

        [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(m_state); }

        [[nodiscard]] bool settled() const noexcept { return m_state && m_state->settled(); }

        [[nodiscard]] bool failed() const noexcept { return m_state && m_state->failed(); }

        // Suspends until settled, then returns the value or rethrows the error.
        // A result that never settles leaves the caller suspended; once no promise is
        // left the suspended coroutine is destroyed without being resumed.
        [[nodiscard]] asio::awaitable<T> get() const { return wait(m_state); }

        // Non-suspending access for already settled results.
        T value() const {
            if (!settled()) throw std::logic_error("result_handle::value: result is not settled");
            return extract(*m_state);
        }

    private:
        friend class result_promise<T>;

        using state_type = detail::result_state<T>;

        std::shared_ptr<state_type> m_state;

        explicit result_handle(std::shared_ptr<state_type> state) noexcept: m_state(std::move(state)) {}

        static asio::awaitable<T> wait(std::shared_ptr<state_type> state) {
            if (!state) throw std::logic_error("result_handle::get: empty handle");
            if (!state->settled())
                co_await asio::async_initiate<const asio::use_awaitable_t<> &, void()>(
                        [state](auto handler) { state->park(std::move(handler)); }, asio::use_awaitable);
            if constexpr (std::is_void_v<T>) extract(*state);
            else co_return extract(*state);
        }

        static T extract(state_type &state) {
            if (state.error()) std::rethrow_exception(state.error());
            if constexpr (std::is_void_v<T>) return;
            else if constexpr (std::is_copy_constructible_v<T>) return state.value();
            else return std::move(state.value());
        }
    };

    // Writing side of a one-shot result. Copies share the settle-once guard, so two
    // racing producers may hold it and only the first settlement counts.
    template <class T>
    class result_promise {
    public:
        result_promise()
                : m_writer(std::make_shared<detail::result_writer<T>>(std::make_shared<detail::result_state<T>>())) {}

        [[nodiscard]] result_handle<T> handle() const noexcept { return result_handle<T>(m_writer->state()); }

        template <class... U>
        bool resolve(U &&... value) {
            if (!state().close()) return false;
            state().store(std::forward<U>(value)...);
            return true;
        }

        bool reject(std::exception_ptr error) {
            if (!state().close()) return false;
            state().fail(std::move(error));
            return true;
        }

        // Closes without settling: handles stay pending forever and later
        // resolve/reject calls are discarded.
        bool abandon() noexcept { return state().close(); }

        [[nodiscard]] bool closed() const noexcept { return state().closed(); }

    private:
        std::shared_ptr<detail::result_writer<T>> m_writer;

        detail::result_state<T> &state() const noexcept { return *m_writer->state(); }
    };
}
