#pragma once

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>

namespace nasync {
    // Raised by a timeout-wrapped call whose deadline fired first.
    class timeout_expired_error : public std::runtime_error {
    public:
        timeout_expired_error(const std::string &function_name, std::chrono::milliseconds timeout);

        [[nodiscard]] const std::string &function_name() const noexcept { return m_function_name; }

        [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

    private:
        std::string m_function_name;
        std::chrono::milliseconds m_timeout;
    };

    // Broken internal bookkeeping. Reports on stderr and aborts.
    [[noreturn]] void internal_consistency_failure(const std::string &what) noexcept;

    // co_spawn completion handler that reports an exception escaping a detached coroutine.
    struct report_escaped {
        const char *where;

        void operator()(std::exception_ptr error) const noexcept;
    };
}
