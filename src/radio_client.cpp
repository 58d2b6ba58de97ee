// ============================================================================
// radio_client.cpp — implementation for meshlink/radio_client.hpp
// ============================================================================

#include "meshlink/radio_client.hpp"

namespace meshlink {

const char* capability_name(Capability c) {
    switch (c) {
        case Capability::SendText:          return "send_text";
        case Capability::Reboot:            return "reboot";
        case Capability::SetPrimaryChannel: return "set_primary_channel";
    }
    return "unknown";
}

} // namespace meshlink
