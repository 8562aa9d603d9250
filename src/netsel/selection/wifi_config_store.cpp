#include "netsel/selection/wifi_config_store.hpp"

namespace netsel::selection {

const char* to_string(StoreErr e) noexcept {
    switch (e) {
        case StoreErr::Invalid:  return "invalid";
        case StoreErr::NotFound: return "not_found";
        case StoreErr::Capacity: return "capacity";
        case StoreErr::Rejected: return "rejected";
    }
    return "unknown";
}

} // namespace netsel::selection
