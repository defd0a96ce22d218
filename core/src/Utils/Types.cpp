#include "oreonpickup/Types.h"

namespace OreonPickup {

// ═══════════════════════════════════════════════════════════
// PickupError
// ═══════════════════════════════════════════════════════════

const char* errorToString(PickupError error) {
    switch (error) {
        case PickupError::None:                 return "none";
        case PickupError::DiscoveryUnavailable: return "discovery_unavailable";
        case PickupError::AdvertiseFailed:      return "advertise_failed";
        case PickupError::PortInUse:            return "port_in_use";
        case PickupError::ConnectionRefused:    return "connection_refused";
        case PickupError::ConnectTimeout:       return "connect_timeout";
        case PickupError::ReadTimeout:          return "read_timeout";
        case PickupError::NetworkError:         return "network_error";
        case PickupError::InvalidCode:          return "invalid_code";
        case PickupError::MalformedMessage:     return "malformed_message";
        case PickupError::Cancelled:            return "cancelled";
        case PickupError::TimedOut:             return "timed_out";
        case PickupError::StorageIOError:       return "storage_io_error";
        case PickupError::InvalidArgument:      return "invalid_argument";
        default:                                return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// PairingRole / PairingState
// ═══════════════════════════════════════════════════════════

const char* roleToString(PairingRole role) {
    switch (role) {
        case PairingRole::Responder: return "responder";
        case PairingRole::Initiator: return "initiator";
        default:                     return "unknown";
    }
}

const char* stateToString(PairingState state) {
    switch (state) {
        case PairingState::Idle:             return "idle";
        case PairingState::Listening:        return "listening";
        case PairingState::Verifying:        return "verifying";
        case PairingState::Connecting:       return "connecting";
        case PairingState::AwaitingResponse: return "awaiting_response";
        case PairingState::Paired:           return "paired";
        case PairingState::Rejected:         return "rejected";
        case PairingState::Failed:           return "failed";
        case PairingState::Cancelled:        return "cancelled";
        default:                             return "unknown";
    }
}

bool isTerminalState(PairingState state) {
    return state == PairingState::Paired ||
           state == PairingState::Rejected ||
           state == PairingState::Failed ||
           state == PairingState::Cancelled;
}

bool isActiveState(PairingState state) {
    return state == PairingState::Listening ||
           state == PairingState::Verifying ||
           state == PairingState::Connecting ||
           state == PairingState::AwaitingResponse;
}

} // namespace OreonPickup
