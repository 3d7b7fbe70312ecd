#include "Deadline.h"
#include <stdexcept>

namespace nasync::timing {
    void validate(const deadline_options &options) {
        if (options.timeout.count() < 0)
            throw std::invalid_argument("with_timeout: timeout must not be negative, got "
                                        + std::to_string(options.timeout.count()) + "ms");
    }
}
