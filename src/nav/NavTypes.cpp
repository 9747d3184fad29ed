#include "trailnav/nav/NavTypes.hpp"

namespace trailnav::nav {

const char* ToString(PathStatus s) noexcept {
    switch (s) {
    case PathStatus::Found:     return "found";
    case PathStatus::NoRoute:   return "no-route";
    case PathStatus::Exhausted: return "exhausted";
    case PathStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace trailnav::nav
