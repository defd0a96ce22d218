// Discovery.cpp — Набор пиров из событий mDNS и доставка снимков

#include "oreonpickup/Network/Discovery.h"
#include "oreonpickup/NotificationQueue.h"
#include "oreonpickup/Logging.h"
#include <spdlog/spdlog.h>
#include <thread>
#include <memory>
#include <atomic>
#include <mutex>
#include <chrono>
#include <cerrno>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #include <iphlpapi.h>
    #pragma comment(lib, "ws2_32.lib")
    #pragma comment(lib, "iphlpapi.lib")
#else
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <ifaddrs.h>
    #include <net/if.h>
#endif

namespace OreonPickup {

namespace {

/// Проверка UTF-8 (без overlong и суррогатов)
bool isValidUtf8(const std::string& data) {
    size_t i = 0;
    while (i < data.size()) {
        unsigned char c = static_cast<unsigned char>(data[i]);

        size_t extra;
        uint32_t codepoint;
        if (c < 0x80) {
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            codepoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            codepoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            codepoint = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= data.size()) return false;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char next = static_cast<unsigned char>(data[i + k]);
            if ((next & 0xC0) != 0x80) return false;
            codepoint = (codepoint << 6) | (next & 0x3F);
        }

        static const uint32_t minimum[] = {0, 0x80, 0x800, 0x10000};
        if (codepoint < minimum[extra]) return false;
        if (codepoint > 0x10FFFF) return false;
        if (codepoint >= 0xD800 && codepoint <= 0xDFFF) return false;

        i += extra + 1;
    }
    return true;
}

/// "key=value" → пара. Ключ обязателен, значение может быть пустым.
bool decodeTxtRecord(const std::string& raw, std::string& key, std::string& value) {
    auto pos = raw.find('=');
    if (pos == std::string::npos || pos == 0) return false;
    if (!isValidUtf8(raw)) return false;

    key = raw.substr(0, pos);
    value = raw.substr(pos + 1);
    return true;
}

/// "bob.local." → "bob"
std::string stripLocalDomain(std::string host) {
    if (!host.empty() && host.back() == '.') host.pop_back();
    const std::string suffix = ".local";
    if (host.size() > suffix.size() &&
        host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0) {
        host.erase(host.size() - suffix.size());
    }
    return host;
}

/// Состояние одного цикла browse. Поток доставки держит его через shared_ptr
/// и не обращается к PeerDiscovery, поэтому поток, остановленный из
/// собственного callback'а, переживает уничтожение объекта.
struct SnapshotDispatch {
    NotificationQueue<PeerSnapshot> snapshots;
    uint64_t lastDelivered = 0;         // Только поток доставки

    std::mutex callbackMutex;
    PeerDiscovery::PeersCallback callback;

    explicit SnapshotDispatch(PeerDiscovery::PeersCallback cb)
        : callback(std::move(cb)) {}

    /// После возврата новых вызовов callback'а не будет
    void close() {
        snapshots.close();
        std::lock_guard<std::mutex> lock(callbackMutex);
        callback = nullptr;
    }
};

void dispatchLoop(const std::shared_ptr<SnapshotDispatch>& dispatch) {
    while (true) {
        auto next = dispatch->snapshots.waitPop();
        if (!next) break;    // Очередь закрыта

        // Отдаём только самый свежий из накопившихся
        PeerSnapshot latest = std::move(*next);
        while (auto more = dispatch->snapshots.tryPop()) {
            if (more->revision > latest.revision) {
                latest = std::move(*more);
            }
        }

        if (latest.revision <= dispatch->lastDelivered) continue;
        dispatch->lastDelivered = latest.revision;

        PeerDiscovery::PeersCallback callback;
        {
            std::lock_guard<std::mutex> lock(dispatch->callbackMutex);
            callback = dispatch->callback;
        }
        if (callback) {
            callback(latest);
        }
    }
}

/// Закрыть очередь и дождаться потока. Вызывать без m_controlMutex.
void finishDispatch(const std::shared_ptr<SnapshotDispatch>& dispatch, std::thread worker) {
    if (dispatch) {
        dispatch->close();
    }
    if (!worker.joinable()) return;

    if (worker.get_id() == std::this_thread::get_id()) {
        // stopBrowsing из самого callback'а: цикл завершится после возврата,
        // всё его состояние принадлежит dispatch
        worker.detach();
    } else {
        worker.join();
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════
// PeerDiscovery::Impl
// ═══════════════════════════════════════════════════════════

class PeerDiscovery::Impl {
public:
    Impl(const PickupConfig& config, MdnsClientFactory factory)
        : m_config(config)
        , m_factory(std::move(factory)) {}

    ~Impl() {
        stopBrowsing();
        stopAdvertising();
    }

    bool startBrowsing(PeersCallback callback) {
        std::shared_ptr<SnapshotDispatch> failedDispatch;
        std::thread failedWorker;
        {
            std::lock_guard<std::mutex> control(m_controlMutex);
            if (m_browsing) return true;

            auto client = acquireClient();
            if (!client) {
                return false;
            }

            auto dispatch = std::make_shared<SnapshotDispatch>(std::move(callback));
            {
                std::lock_guard<std::mutex> lock(m_peersMutex);
                m_dispatch = dispatch;
            }
            m_dispatcher = std::thread([dispatch]() { dispatchLoop(dispatch); });

            bool started = client->startBrowse(m_config.serviceType,
                                               [this](const ServiceEvent& event) { handleEvent(event); });
            if (started) {
                m_browsing = true;
                spdlog::info("Discovery: browsing for {}", m_config.serviceType);
                return true;
            }

            setError(PickupError::DiscoveryUnavailable, "Browse failed: " + client->getLastError());
            spdlog::error("Discovery: {}", getLastError());
            {
                std::lock_guard<std::mutex> lock(m_peersMutex);
                failedDispatch = std::move(m_dispatch);
            }
            failedWorker = std::move(m_dispatcher);
            releaseClientIfUnused();
        }

        finishDispatch(failedDispatch, std::move(failedWorker));
        return false;
    }

    /// Поток доставки останавливается вне m_controlMutex: callback
    /// может вызывать любые методы PeerDiscovery.
    void stopBrowsing() {
        std::shared_ptr<SnapshotDispatch> dispatch;
        std::thread worker;
        {
            std::lock_guard<std::mutex> control(m_controlMutex);
            if (!m_browsing) return;

            if (m_client) {
                m_client->stopBrowse();
            }
            m_browsing = false;

            {
                std::lock_guard<std::mutex> lock(m_peersMutex);
                m_peers.clear();
                dispatch = std::move(m_dispatch);
            }
            worker = std::move(m_dispatcher);

            releaseClientIfUnused();
        }

        finishDispatch(dispatch, std::move(worker));
        spdlog::info("Discovery: browsing stopped");
    }

    bool advertise(uint16_t port) {
        std::lock_guard<std::mutex> control(m_controlMutex);
        if (m_advertising) {
            spdlog::warn("Discovery: service already advertised");
            return true;
        }

        auto client = acquireClient();
        if (!client) {
            return false;
        }

        std::string host = m_config.resolvedHostname();

        ServiceAdvert advert;
        advert.serviceType = m_config.serviceType;
        advert.instanceName = SERVICE_NAME_PREFIX + host;
        advert.hostName = host + ".local";
        advert.port = port;
        advert.txt["hostname"] = host;
        advert.txt["version"] = m_config.serviceVersion;

        if (!client->publish(advert)) {
            setError(PickupError::AdvertiseFailed, "Advertise failed: " + client->getLastError());
            spdlog::error("Discovery: {}", getLastError());
            releaseClientIfUnused();
            return false;
        }

        m_advertising = true;
        spdlog::info("Discovery: advertising '{}' on port {}", advert.instanceName, port);
        return true;
    }

    void stopAdvertising() {
        std::lock_guard<std::mutex> control(m_controlMutex);
        if (!m_advertising) return;

        if (m_client) {
            m_client->unpublish();
        }
        m_advertising = false;

        releaseClientIfUnused();
        spdlog::info("Discovery: advertising stopped");
    }

    bool isBrowsing() const {
        std::lock_guard<std::mutex> control(m_controlMutex);
        return m_browsing;
    }

    bool isAdvertising() const {
        std::lock_guard<std::mutex> control(m_controlMutex);
        return m_advertising;
    }

    bool hasMdnsClient() const {
        std::lock_guard<std::mutex> control(m_controlMutex);
        return m_client != nullptr;
    }

    PeerSet getPeers() const {
        std::lock_guard<std::mutex> lock(m_peersMutex);
        return m_peers;
    }

    uint64_t getRevision() const {
        std::lock_guard<std::mutex> lock(m_peersMutex);
        return m_revision;
    }

    PickupError getLastErrorCode() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastErrorCode;
    }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastError;
    }

private:
    PickupConfig m_config;
    MdnsClientFactory m_factory;

    // Порядок блокировок: m_controlMutex → внутренние блокировки клиента.
    // m_peersMutex никогда не держится во время вызовов клиента.
    mutable std::mutex m_controlMutex;
    std::shared_ptr<MdnsClient> m_client;
    bool m_browsing = false;
    bool m_advertising = false;

    mutable std::mutex m_peersMutex;
    PeerSet m_peers;
    uint64_t m_revision = 0;
    uint64_t m_sequence = 0;

    std::shared_ptr<SnapshotDispatch> m_dispatch;     // Под m_peersMutex
    std::thread m_dispatcher;                           // Под m_controlMutex

    mutable std::mutex m_errorMutex;
    PickupError m_lastErrorCode = PickupError::None;
    std::string m_lastError;

    void setError(PickupError code, const std::string& message) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastErrorCode = code;
        m_lastError = message;
    }

    /// Вызывается под m_controlMutex
    std::shared_ptr<MdnsClient> acquireClient() {
        if (m_client) return m_client;

        if (m_factory) {
            m_client = m_factory();
        }
        if (!m_client) {
            setError(PickupError::DiscoveryUnavailable, "mDNS is not available");
            spdlog::warn("Discovery: mDNS is not available, continuing without discovery");
            return nullptr;
        }
        setError(PickupError::None, "");
        spdlog::debug("Discovery: mDNS client created");
        return m_client;
    }

    /// Вызывается под m_controlMutex
    void releaseClientIfUnused() {
        if (m_browsing || m_advertising || !m_client) return;
        m_client.reset();
        spdlog::debug("Discovery: mDNS client released");
    }

    // ═══════════════════════════════════════════════════════════
    // События mDNS (поток клиента)
    // ═══════════════════════════════════════════════════════════

    void handleEvent(const ServiceEvent& event) {
        if (event.kind == ServiceEvent::Kind::Removed) {
            std::lock_guard<std::mutex> lock(m_peersMutex);
            if (m_peers.erase(event.serviceName) == 0) return;
            spdlog::debug("Discovery: removed '{}'", event.serviceName);
            publishLocked();
            return;
        }

        DiscoveredPeer peer;
        peer.serviceName = event.serviceName;
        peer.addresses = event.addresses;
        peer.port = event.port;

        for (const auto& raw : event.txtRecords) {
            std::string key, value;
            if (!decodeTxtRecord(raw, key, value)) {
                spdlog::warn("Discovery: dropping '{}': bad TXT record '{}'",
                             event.serviceName, truncateForLog(raw));
                return;
            }
            peer.properties[key] = value;
        }

        auto it = peer.properties.find("hostname");
        peer.hostname = (it != peer.properties.end() && !it->second.empty())
            ? it->second
            : stripLocalDomain(event.hostName);

        std::lock_guard<std::mutex> lock(m_peersMutex);
        peer.seenSequence = ++m_sequence;
        spdlog::debug("Discovery: {} '{}' ({}:{})",
                      event.kind == ServiceEvent::Kind::Added ? "added" : "updated",
                      peer.serviceName, peer.primaryAddress(), peer.port);
        m_peers[peer.serviceName] = std::move(peer);
        publishLocked();
    }

    /// Вызывается под m_peersMutex
    void publishLocked() {
        PeerSnapshot snapshot;
        snapshot.revision = ++m_revision;
        snapshot.peers = m_peers;
        if (m_dispatch) {
            m_dispatch->snapshots.push(std::move(snapshot));
        }
    }
};

// ═══════════════════════════════════════════════════════════
// PeerDiscovery
// ═══════════════════════════════════════════════════════════

PeerDiscovery::PeerDiscovery(const PickupConfig& config, MdnsClientFactory factory)
    : m_impl(std::make_unique<Impl>(config, std::move(factory))) {}

PeerDiscovery::~PeerDiscovery() = default;

bool PeerDiscovery::startBrowsing(PeersCallback callback) {
    return m_impl->startBrowsing(std::move(callback));
}

void PeerDiscovery::stopBrowsing() {
    m_impl->stopBrowsing();
}

bool PeerDiscovery::isBrowsing() const {
    return m_impl->isBrowsing();
}

PeerSet PeerDiscovery::getPeers() const {
    return m_impl->getPeers();
}

uint64_t PeerDiscovery::getRevision() const {
    return m_impl->getRevision();
}

bool PeerDiscovery::advertise(uint16_t port) {
    return m_impl->advertise(port);
}

void PeerDiscovery::stopAdvertising() {
    m_impl->stopAdvertising();
}

bool PeerDiscovery::isAdvertising() const {
    return m_impl->isAdvertising();
}

bool PeerDiscovery::hasMdnsClient() const {
    return m_impl->hasMdnsClient();
}

PickupError PeerDiscovery::getLastErrorCode() const {
    return m_impl->getLastErrorCode();
}

std::string PeerDiscovery::getLastError() const {
    return m_impl->getLastError();
}

// ═══════════════════════════════════════════════════════════
// Сетевые адреса
// ═══════════════════════════════════════════════════════════

std::vector<std::string> PeerDiscovery::getLocalIpAddresses() {
    std::vector<std::string> addresses;

#ifdef _WIN32
    ULONG bufferSize = 15000;
    std::vector<uint8_t> buffer(bufferSize);
    auto* adapters = reinterpret_cast<IP_ADAPTER_ADDRESSES*>(buffer.data());

    ULONG result = GetAdaptersAddresses(AF_INET,
        GAA_FLAG_SKIP_DNS_SERVER | GAA_FLAG_SKIP_MULTICAST,
        nullptr, adapters, &bufferSize);

    if (result == ERROR_BUFFER_OVERFLOW) {
        buffer.resize(bufferSize);
        adapters = reinterpret_cast<IP_ADAPTER_ADDRESSES*>(buffer.data());
        result = GetAdaptersAddresses(AF_INET,
            GAA_FLAG_SKIP_DNS_SERVER | GAA_FLAG_SKIP_MULTICAST,
            nullptr, adapters, &bufferSize);
    }

    if (result == NO_ERROR) {
        for (auto* adapter = adapters; adapter; adapter = adapter->Next) {
            if (adapter->OperStatus != IfOperStatusUp) continue;
            if (adapter->IfType == IF_TYPE_SOFTWARE_LOOPBACK) continue;

            for (auto* addr = adapter->FirstUnicastAddress; addr; addr = addr->Next) {
                if (addr->Address.lpSockaddr->sa_family != AF_INET) continue;
                auto* sin = reinterpret_cast<sockaddr_in*>(addr->Address.lpSockaddr);
                char ip[INET_ADDRSTRLEN];
                inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
                addresses.push_back(ip);
            }
        }
    }
#else
    struct ifaddrs* ifap;
    if (getifaddrs(&ifap) == 0) {
        for (auto* ifa = ifap; ifa; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr) continue;
            if (ifa->ifa_addr->sa_family != AF_INET) continue;
            if (!(ifa->ifa_flags & IFF_UP)) continue;
            if (ifa->ifa_flags & IFF_LOOPBACK) continue;

            auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
            char ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
            addresses.push_back(ip);
        }
        freeifaddrs(ifap);
    } else {
        spdlog::warn("Discovery: getifaddrs() failed: {}", errno);
    }
#endif

    return addresses;
}

std::string PeerDiscovery::getLocalHostname() {
    return PickupConfig{}.resolvedHostname();
}

// ═══════════════════════════════════════════════════════════
// Фабрика по умолчанию
// ═══════════════════════════════════════════════════════════

MdnsClientFactory defaultMdnsClientFactory() {
    return []() { return createAvahiClient(); };
}

} // namespace OreonPickup
