#include "Errors.h"
#include <cstdio>
#include <cstdlib>

namespace {
    constexpr auto anonymous_function_name = "<anonymous>";

    std::string describe_timeout(const std::string &name, const std::chrono::milliseconds timeout) {
        return "Timeout-wrapped function " + name + " took longer than "
               + std::to_string(timeout.count()) + "ms to resolve";
    }
}

namespace nasync {
    timeout_expired_error::timeout_expired_error(const std::string &function_name,
                                                 const std::chrono::milliseconds timeout)
            : std::runtime_error(describe_timeout(function_name.empty() ? anonymous_function_name : function_name,
                                                  timeout)),
              m_function_name(function_name.empty() ? anonymous_function_name : function_name),
              m_timeout(timeout) {}

    void internal_consistency_failure(const std::string &what) noexcept {
        std::fprintf(stderr, "nasync: internal consistency failure: %s\n", what.c_str());
        std::fflush(stderr);
        std::abort();
    }

    void report_escaped::operator()(std::exception_ptr error) const noexcept {
        if (!error) return;
        try {
            std::rethrow_exception(error);
        }
        catch (std::exception &e) {
            std::fprintf(stderr, "%s: escaped exception: %s\n", where, e.what());
        }
        catch (...) {
            std::fprintf(stderr, "%s: escaped exception of unknown type\n", where);
        }
    }
}
