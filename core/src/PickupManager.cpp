// PickupManager.cpp — Сборка компонентов ядра

#include "oreonpickup/PickupManager.h"
#include "oreonpickup/TrustStore.h"
#include <spdlog/spdlog.h>

namespace OreonPickup {

class PickupManager::Impl {
public:
    Impl(PickupConfig config, MdnsClientFactory factory)
        : m_config(std::move(config))
        , m_store(std::make_shared<TrustStore>(m_config.stateFile))
        , m_discovery(m_config, std::move(factory))
        , m_pairing(m_config, m_store) {
        for (const auto& problem : m_config.validate()) {
            spdlog::warn("PickupManager: config: {}", problem);
        }
        spdlog::info("PickupManager: state file {}", m_store->getPath());
    }

    ~Impl() {
        // Сначала pairing: его поток пишет в trust store
        m_pairing.stopSession();
        m_discovery.stopBrowsing();
        m_discovery.stopAdvertising();
    }

    PickupConfig m_config;
    std::shared_ptr<TrustStore> m_store;
    PeerDiscovery m_discovery;
    PairingCoordinator m_pairing;
};

PickupManager::PickupManager(PickupConfig config, MdnsClientFactory factory)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(factory))) {}

PickupManager::~PickupManager() = default;

// ═══════════════════════════════════════════════════════════
// Discovery
// ═══════════════════════════════════════════════════════════

bool PickupManager::startBrowsing(PeerDiscovery::PeersCallback callback) {
    return m_impl->m_discovery.startBrowsing(std::move(callback));
}

void PickupManager::stopBrowsing() {
    m_impl->m_discovery.stopBrowsing();
}

bool PickupManager::advertise(uint16_t port) {
    return m_impl->m_discovery.advertise(port != 0 ? port : m_impl->m_config.port);
}

void PickupManager::stopAdvertising() {
    m_impl->m_discovery.stopAdvertising();
}

std::vector<PeerView> PickupManager::discoveredPeers() const {
    auto collapsed = collapseByDerivedId(m_impl->m_discovery.getPeers());
    auto paired = m_impl->m_store->list();

    std::vector<PeerView> result;
    result.reserve(collapsed.size());
    for (auto& [deviceId, peer] : collapsed) {
        PeerView view;
        view.deviceId = deviceId;
        view.isPaired = paired.count(deviceId) > 0;
        view.peer = std::move(peer);
        result.push_back(std::move(view));
    }
    return result;
}

// ═══════════════════════════════════════════════════════════
// Pairing
// ═══════════════════════════════════════════════════════════

std::string PickupManager::generateCode() const {
    return m_impl->m_pairing.generateCode();
}

bool PickupManager::startResponder(const std::string& code,
                                   PairingCoordinator::ResultCallback callback) {
    return m_impl->m_pairing.startResponder(code, std::move(callback));
}

void PickupManager::stopSession() {
    m_impl->m_pairing.stopSession();
}

PairingResult PickupManager::initiate(const std::string& ip, uint16_t port, const std::string& code) {
    return m_impl->m_pairing.initiate(ip, port, code);
}

PairingState PickupManager::pairingState() const {
    return m_impl->m_pairing.getState();
}

NotificationQueue<PairingEvent>& PickupManager::pairingEvents() {
    return m_impl->m_pairing.events();
}

// ═══════════════════════════════════════════════════════════
// Trust store
// ═══════════════════════════════════════════════════════════

std::map<std::string, PairedDevice> PickupManager::listPaired() const {
    return m_impl->m_store->list();
}

bool PickupManager::unpair(const std::string& deviceId) {
    if (!m_impl->m_store->remove(deviceId)) {
        spdlog::error("PickupManager: unpair {} failed: {}", deviceId, m_impl->m_store->getLastError());
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════
// Доступ к компонентам
// ═══════════════════════════════════════════════════════════

const PickupConfig& PickupManager::config() const {
    return m_impl->m_config;
}

PeerDiscovery& PickupManager::discovery() {
    return m_impl->m_discovery;
}

PairingCoordinator& PickupManager::pairing() {
    return m_impl->m_pairing;
}

TrustStore& PickupManager::trustStore() {
    return *m_impl->m_store;
}

} // namespace OreonPickup
