#pragma once

#include "export.h"
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace OreonPickup {

// ═══════════════════════════════════════════════════════════
// Обнаруженный пир (живёт пока жив PeerDiscovery)
// ═══════════════════════════════════════════════════════════

struct DiscoveredPeer {
    std::string serviceName;                    // Имя объявления mDNS (нестабильно между рестартами)
    std::string hostname;
    std::vector<std::string> addresses;         // Первый основной
    uint16_t port = 0;
    std::map<std::string, std::string> properties;  // TXT: hostname, version
    uint64_t seenSequence = 0;                  // Порядковый номер последнего события

    /// Основной адрес или пустая строка
    std::string primaryAddress() const;

    /// hostname@primaryAddress, ключ для trust store
    std::string derivedId() const;
};

/// Набор пиров по serviceName
using PeerSet = std::map<std::string, DiscoveredPeer>;

/// Снимок набора пиров. revision строго растёт от снимка к снимку.
struct PeerSnapshot {
    uint64_t revision = 0;
    PeerSet peers;
};

// ═══════════════════════════════════════════════════════════
// Сопряжённое устройство (хранится в state файле)
// ═══════════════════════════════════════════════════════════

struct PairedDevice {
    std::string deviceId;       // hostname@ip
    std::string hostname;
    std::string ip;
    uint16_t port = 0;
    int64_t pairedAt = 0;       // Unix timestamp

    bool operator==(const PairedDevice& other) const {
        return deviceId == other.deviceId &&
               hostname == other.hostname &&
               ip == other.ip &&
               port == other.port &&
               pairedAt == other.pairedAt;
    }
    bool operator!=(const PairedDevice& other) const { return !(*this == other); }
};

/// Пир с точки зрения UI: уже схлопнут по derivedId
struct PeerView {
    DiscoveredPeer peer;
    std::string deviceId;
    bool isPaired = false;
};

// ═══════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════

/// Единый формат deviceId для discovery, pairing и trust store
OP_API std::string makeDeviceId(const std::string& hostname, const std::string& ip);

/// Схлопнуть набор по derivedId, оставляя самую свежую запись.
/// Пиры без адреса пропускаются.
OP_API std::map<std::string, DiscoveredPeer> collapseByDerivedId(const PeerSet& peers);

/// Текущее время в Unix секундах
OP_API int64_t unixNow();

} // namespace OreonPickup
