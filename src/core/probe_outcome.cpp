#include "include/probe_outcome.hpp"

namespace netcheck {

std::string_view kind_name(ProbeErrorKind kind) noexcept {
    switch (kind) {
        case ProbeErrorKind::Timeout:
            return "timeout";
        case ProbeErrorKind::NotFound:
            return "not found";
        case ProbeErrorKind::ResolutionError:
            return "resolution error";
        case ProbeErrorKind::Unknown:
            break;
    }
    return "unknown";
}

}  // namespace netcheck
