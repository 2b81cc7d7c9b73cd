#include "cube_entrypoint/core/error_codes.hpp"

namespace cube_entrypoint {
namespace core {

std::string to_string(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::IGNORE: return "IGNORE";
        case FailurePolicy::WARN: return "WARN";
        case FailurePolicy::ABORT: return "ABORT";
        default: return "UNKNOWN";
    }
}

}
}
