// PickupManager.h — Точка входа для GUI / CLI
// Владеет trust store, discovery и pairing; жизненный цикл задаёт вызывающий:
// создать → пользоваться → уничтожить (деструктор останавливает всё).

#pragma once

#include "export.h"
#include "Config.h"
#include "Models.h"
#include "Types.h"
#include "NotificationQueue.h"
#include "Network/Discovery.h"
#include "Network/PairingCoordinator.h"
#include <string>
#include <vector>
#include <map>
#include <memory>

namespace OreonPickup {

class TrustStore;

class OP_API PickupManager {
public:
    explicit PickupManager(PickupConfig config = {},
                           MdnsClientFactory factory = defaultMdnsClientFactory());
    ~PickupManager();

    // Запрет копирования
    PickupManager(const PickupManager&) = delete;
    PickupManager& operator=(const PickupManager&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Discovery
    // ═══════════════════════════════════════════════════════════

    bool startBrowsing(PeerDiscovery::PeersCallback callback);
    void stopBrowsing();

    /// port = 0 → config().port
    bool advertise(uint16_t port = 0);
    void stopAdvertising();

    /// Пиры, схлопнутые по deviceId, с отметкой isPaired
    std::vector<PeerView> discoveredPeers() const;

    // ═══════════════════════════════════════════════════════════
    // Pairing
    // ═══════════════════════════════════════════════════════════

    /// @throws std::invalid_argument при неверной длине кода в конфигурации
    std::string generateCode() const;

    /// Слушать config().port. Объявление в mDNS не включается.
    bool startResponder(const std::string& code,
                        PairingCoordinator::ResultCallback callback = nullptr);

    void stopSession();

    /// Блокирующий initiator
    PairingResult initiate(const std::string& ip, uint16_t port, const std::string& code);

    PairingState pairingState() const;
    NotificationQueue<PairingEvent>& pairingEvents();

    // ═══════════════════════════════════════════════════════════
    // Trust store
    // ═══════════════════════════════════════════════════════════

    std::map<std::string, PairedDevice> listPaired() const;

    /// false только при ошибке записи
    bool unpair(const std::string& deviceId);

    // ═══════════════════════════════════════════════════════════
    // Доступ к компонентам
    // ═══════════════════════════════════════════════════════════

    const PickupConfig& config() const;
    PeerDiscovery& discovery();
    PairingCoordinator& pairing();
    TrustStore& trustStore();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace OreonPickup
