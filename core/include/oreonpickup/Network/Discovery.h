// Discovery.h — Обнаружение и объявление устройств через mDNS (DNS-SD)
// Тип сервиса: _oreon-pickup._tcp.local., TXT: hostname, version

#pragma once

#include "../export.h"
#include "../Config.h"
#include "../Models.h"
#include "../Types.h"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <cstdint>

namespace OreonPickup {

// ═══════════════════════════════════════════════════════════
// MdnsClient: граница с mDNS стеком
// ═══════════════════════════════════════════════════════════

/// Событие браузера после resolve
struct ServiceEvent {
    enum class Kind {
        Added,
        Updated,
        Removed     // Заполнен только serviceName
    };

    Kind kind = Kind::Added;
    std::string serviceName;
    std::string hostName;                   // Как его сообщил mDNS ("bob.local")
    std::vector<std::string> addresses;
    uint16_t port = 0;
    std::vector<std::string> txtRecords;    // Сырые записи "key=value"
};

/// Что объявляем о себе
struct ServiceAdvert {
    std::string serviceType;
    std::string instanceName;
    std::string hostName;
    uint16_t port = 0;
    std::map<std::string, std::string> txt;
};

/// Один экземпляр обслуживает и browse, и publish.
/// EventHandler вызывается из потока mDNS стека.
class OP_API MdnsClient {
public:
    using EventHandler = std::function<void(const ServiceEvent&)>;

    virtual ~MdnsClient() = default;

    virtual bool startBrowse(const std::string& serviceType, EventHandler handler) = 0;

    /// После возврата handler больше не вызывается
    virtual void stopBrowse() = 0;

    virtual bool publish(const ServiceAdvert& advert) = 0;
    virtual void unpublish() = 0;

    virtual std::string getLastError() const = 0;
};

/// nullptr = mDNS недоступен
using MdnsClientFactory = std::function<std::shared_ptr<MdnsClient>()>;

/// Клиент avahi-daemon. nullptr если библиотека собрана без Avahi
/// или демон недоступен.
OP_API std::shared_ptr<MdnsClient> createAvahiClient();

OP_API MdnsClientFactory defaultMdnsClientFactory();

// ═══════════════════════════════════════════════════════════
// PeerDiscovery
// ═══════════════════════════════════════════════════════════

/// Browse и advertise делят один MdnsClient: он создаётся первым из
/// вызовов и уничтожается только когда остановлены оба.
class OP_API PeerDiscovery {
public:
    /// Полный набор пиров после каждого изменения.
    /// Вызывается асинхронно из потока доставки, никогда внутри startBrowsing.
    using PeersCallback = std::function<void(const PeerSnapshot&)>;

    explicit PeerDiscovery(const PickupConfig& config,
                           MdnsClientFactory factory = defaultMdnsClientFactory());
    ~PeerDiscovery();

    // Запрет копирования
    PeerDiscovery(const PeerDiscovery&) = delete;
    PeerDiscovery& operator=(const PeerDiscovery&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Browse
    // ═══════════════════════════════════════════════════════════

    /// Повторный вызов во время browse: no-op, возвращает true.
    /// false + DiscoveryUnavailable если mDNS стек не поднялся.
    bool startBrowsing(PeersCallback callback);

    /// Идемпотентно. После возврата callback больше не вызывается.
    void stopBrowsing();

    bool isBrowsing() const;

    /// Текущий набор (по serviceName)
    PeerSet getPeers() const;

    /// Ревизия последнего снимка
    uint64_t getRevision() const;

    // ═══════════════════════════════════════════════════════════
    // Advertise
    // ═══════════════════════════════════════════════════════════

    /// Объявить это устройство на порту port.
    /// Повторный вызов: предупреждение, возвращает true.
    bool advertise(uint16_t port);

    /// Идемпотентно
    void stopAdvertising();

    bool isAdvertising() const;

    /// Есть ли сейчас живой MdnsClient
    bool hasMdnsClient() const;

    // ═══════════════════════════════════════════════════════════
    // Ошибки и сетевые адреса
    // ═══════════════════════════════════════════════════════════

    PickupError getLastErrorCode() const;
    std::string getLastError() const;

    /// IPv4 адреса поднятых не-loopback интерфейсов
    static std::vector<std::string> getLocalIpAddresses();

    /// Имя хоста системы
    static std::string getLocalHostname();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace OreonPickup
