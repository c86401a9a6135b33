#include "Device.h"

namespace application {

boost::json::object Device::countersToJson() const {
    return {
        {"address", address},
        {"sent", counters.sent},
        {"received", counters.received},
        {"nak", counters.nak}
    };
}

} // namespace application
