#include "streambridge/bridge/lifecycle_guard.hpp"

namespace streambridge {

std::string_view to_string(downstream_status status) noexcept {
    switch (status) {
    case downstream_status::open:
        return "open";
    case downstream_status::canceled:
        return "canceled";
    }
    return "unknown";
}

} // namespace streambridge
