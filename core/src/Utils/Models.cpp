#include "oreonpickup/Models.h"
#include <chrono>

namespace OreonPickup {

std::string DiscoveredPeer::primaryAddress() const {
    return addresses.empty() ? std::string() : addresses.front();
}

std::string DiscoveredPeer::derivedId() const {
    return makeDeviceId(hostname, primaryAddress());
}

std::string makeDeviceId(const std::string& hostname, const std::string& ip) {
    return hostname + "@" + ip;
}

std::map<std::string, DiscoveredPeer> collapseByDerivedId(const PeerSet& peers) {
    std::map<std::string, DiscoveredPeer> result;

    for (const auto& [serviceName, peer] : peers) {
        if (peer.addresses.empty()) continue;

        std::string id = peer.derivedId();
        auto it = result.find(id);
        if (it == result.end() || it->second.seenSequence < peer.seenSequence) {
            result[id] = peer;
        }
    }

    return result;
}

int64_t unixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace OreonPickup
