#pragma once

#include "Common/Result.h"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>

namespace nasync::dispatch {
    struct queue_options {
        std::size_t concurrency_limit = 2;
    };

    // Ticket generated per push. Identity is the id, the name is a diagnostic label.
    struct task_ref {
        std::uint64_t id = 0;
        std::string name;

        bool operator<(const task_ref &r) const noexcept { return id < r.id; }

        bool operator==(const task_ref &r) const noexcept { return id == r.id; }
    };

    template <class F>
    using task_result_t = typename std::invoke_result_t<F &>::value_type;

    // Runs at most concurrency_limit tasks at once on a single executor, starting
    // pending tasks in push order. Not thread-safe: use it from the thread running
    // the executor, or before that thread starts.
    class bounded_queue final : public std::enable_shared_from_this<bounded_queue> {
        struct ctor_token {};

    public:
        // Throws std::invalid_argument when concurrency_limit is 0.
        static std::shared_ptr<bounded_queue> create(asio::any_io_executor executor, queue_options options = {});

        bounded_queue(ctor_token, asio::any_io_executor executor, queue_options options);

        bounded_queue(const bounded_queue &) = delete;

        bounded_queue &operator=(const bounded_queue &) = delete;

        // Admits a callable returning asio::awaitable<T>. The handle settles once the
        // task finishes, with its value or the exception it threw. Each call is a
        // separate submission, even for the same callable object.
        template <class F>
        result_handle<task_result_t<F>> push(F task, std::string name = {}) {
            auto body = std::make_unique<task_node<F>>(std::move(task));
            auto handle = body->handle();
            admit(std::move(name), std::move(body));
            return handle;
        }

        // Drops every task that has not started. Their handles never settle.
        void clear();

        [[nodiscard]] std::set<task_ref> running() const { return m_running; }

        [[nodiscard]] std::size_t pending() const noexcept { return m_pending.size(); }

        [[nodiscard]] std::size_t concurrency_limit() const noexcept { return m_options.concurrency_limit; }

        [[nodiscard]] const asio::any_io_executor &get_executor() const noexcept { return m_executor; }

    private:
        // A pushed task bound to the promise its handle reads from.
        class node {
        public:
            virtual ~node() = default;

            // Runs the task to completion and keeps its outcome.
            virtual asio::awaitable<void> start() = 0;

            // Settles the handle with the kept outcome.
            virtual void deliver() = 0;
        };

        template <class F>
        class task_node final : public node {
        public:
            using value_type = task_result_t<F>;

            explicit task_node(F task) : m_task(std::move(task)) {}

            result_handle<value_type> handle() const { return m_promise.handle(); }

            asio::awaitable<void> start() override {
                try {
                    if constexpr (std::is_void_v<value_type>) {
                        co_await std::invoke(m_task);
                        m_value.emplace();
                    } else m_value.emplace(co_await std::invoke(m_task));
                }
                catch (...) {
                    m_error = std::current_exception();
                }
            }

            void deliver() override {
                if (m_error) m_promise.reject(std::move(m_error));
                else if constexpr (std::is_void_v<value_type>) m_promise.resolve();
                else m_promise.resolve(std::move(*m_value));
            }

        private:
            using storage_type = std::conditional_t<std::is_void_v<value_type>, std::monostate, value_type>;

            F m_task;
            result_promise<value_type> m_promise;
            std::optional<storage_type> m_value;
            std::exception_ptr m_error;
        };

        asio::any_io_executor m_executor;
        queue_options m_options;
        std::deque<task_ref> m_pending;
        std::set<task_ref> m_running;
        // result binding of every task admitted and not yet settled
        std::unordered_map<std::uint64_t, std::unique_ptr<node>> m_bindings;
        std::uint64_t m_next_id = 1;
        bool m_scheduling = false;

        void admit(std::string name, std::unique_ptr<node> body);

        void run();

        void settle(const task_ref &ref);

        static asio::awaitable<void> execute(std::shared_ptr<bounded_queue> self, task_ref ref, node &body);
    };
}
