#include "BoundedQueue.h"
#include "Common/Errors.h"
#include <boost/asio/co_spawn.hpp>
#include <stdexcept>
#include <utility>

namespace nasync::dispatch {
    namespace {
        class scheduling_scope {
        public:
            explicit scheduling_scope(bool &flag) noexcept: m_flag(flag) { m_flag = true; }

            scheduling_scope(const scheduling_scope &) = delete;

            scheduling_scope &operator=(const scheduling_scope &) = delete;

            ~scheduling_scope() noexcept { m_flag = false; }

        private:
            bool &m_flag;
        };
    }

    std::shared_ptr<bounded_queue> bounded_queue::create(asio::any_io_executor executor, queue_options options) {
        if (options.concurrency_limit == 0)
            throw std::invalid_argument("bounded_queue::create: concurrency_limit must be at least 1");
        return std::make_shared<bounded_queue>(ctor_token{}, std::move(executor), options);
    }

    bounded_queue::bounded_queue(ctor_token, asio::any_io_executor executor, queue_options options)
            : m_executor(std::move(executor)), m_options(options) {}

    void bounded_queue::clear() {
        for (const auto &ref : m_pending) m_bindings.erase(ref.id);
        m_pending.clear();
    }

    void bounded_queue::admit(std::string name, std::unique_ptr<node> body) {
        const auto id = m_next_id++;
        m_bindings.emplace(id, std::move(body));
        m_pending.push_back({id, name.empty() ? "#" + std::to_string(id) : std::move(name)});
        run();
    }

    void bounded_queue::run() {
        // a settlement reached from inside this pass is picked up by the loop below
        if (m_scheduling) return;
        scheduling_scope scope{m_scheduling};
        while (m_running.size() < m_options.concurrency_limit && !m_pending.empty()) {
            auto ref = std::move(m_pending.front());
            m_pending.pop_front();
            const auto it = m_bindings.find(ref.id);
            if (it == m_bindings.end())
                internal_consistency_failure("no result binding recorded for queued task " + ref.name);
            m_running.insert(ref);
            // co_spawn posts, so the body never starts inside push()
            asio::co_spawn(m_executor, execute(shared_from_this(), std::move(ref), *it->second),
                           report_escaped{"bounded_queue"});
        }
    }

    // body stays owned by m_bindings until settle() takes it out
    asio::awaitable<void> bounded_queue::execute(std::shared_ptr<bounded_queue> self, task_ref ref, node &body) {
        co_await body.start();
        self->settle(ref);
    }

    void bounded_queue::settle(const task_ref &ref) {
        const auto it = m_bindings.find(ref.id);
        if (it == m_bindings.end())
            internal_consistency_failure("no result binding recorded for finished task " + ref.name);
        m_running.erase(ref);
        const auto body = std::move(it->second);
        m_bindings.erase(it);
        body->deliver();
        run();
    }
}
