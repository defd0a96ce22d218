// AvahiMdnsClient.cpp — MdnsClient поверх avahi-client (Linux)
// Без Avahi createAvahiClient() возвращает nullptr и discovery недоступен.

#include "oreonpickup/Network/Discovery.h"
#include <spdlog/spdlog.h>

#ifdef OREONPICKUP_HAS_AVAHI

#include <avahi-client/client.h>
#include <avahi-client/publish.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/alternative.h>
#include <avahi-common/thread-watch.h>

#include <mutex>
#include <map>
#include <set>
#include <optional>

namespace OreonPickup {

namespace {

/// "_oreon-pickup._tcp.local." → "_oreon-pickup._tcp" (домен Avahi добавляет сам)
std::string toAvahiType(std::string type) {
    if (!type.empty() && type.back() == '.') type.pop_back();
    const std::string suffix = ".local";
    if (type.size() > suffix.size() &&
        type.compare(type.size() - suffix.size(), suffix.size(), suffix) == 0) {
        type.erase(type.size() - suffix.size());
    }
    return type;
}

// ═══════════════════════════════════════════════════════════
// AvahiMdnsClient
// ═══════════════════════════════════════════════════════════

/// Все обращения к объектам Avahi идут под avahi_threaded_poll_lock,
/// callback'и Avahi выполняются в потоке poll'а, который уже держит эту блокировку.
class AvahiMdnsClient : public MdnsClient {
public:
    AvahiMdnsClient() = default;

    ~AvahiMdnsClient() override {
        if (m_poll) {
            avahi_threaded_poll_stop(m_poll);
        }

        // Поток poll'а остановлен: блокировка больше не нужна
        freeResolvers();
        if (m_browser) {
            avahi_service_browser_free(m_browser);
        }
        if (m_group) {
            avahi_entry_group_free(m_group);
        }
        if (m_name) {
            avahi_free(m_name);
        }
        if (m_client) {
            avahi_client_free(m_client);
        }
        if (m_poll) {
            avahi_threaded_poll_free(m_poll);
        }
    }

    // Запрет копирования
    AvahiMdnsClient(const AvahiMdnsClient&) = delete;
    AvahiMdnsClient& operator=(const AvahiMdnsClient&) = delete;

    bool init() {
        m_poll = avahi_threaded_poll_new();
        if (!m_poll) {
            setError("Failed to create Avahi poll");
            return false;
        }

        int error = 0;
        m_client = avahi_client_new(avahi_threaded_poll_get(m_poll),
                                    static_cast<AvahiClientFlags>(0),
                                    clientCallback, this, &error);
        if (!m_client) {
            setError("Failed to create Avahi client: " + std::string(avahi_strerror(error)));
            return false;
        }

        if (avahi_threaded_poll_start(m_poll) < 0) {
            setError("Failed to start Avahi poll thread");
            return false;
        }
        return true;
    }

    bool startBrowse(const std::string& serviceType, EventHandler handler) override {
        avahi_threaded_poll_lock(m_poll);

        m_handler = std::move(handler);
        m_browser = avahi_service_browser_new(
            m_client,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_INET,       // Pairing работает по IPv4
            toAvahiType(serviceType).c_str(),
            nullptr,
            static_cast<AvahiLookupFlags>(0),
            browseCallback,
            this
        );

        bool ok = m_browser != nullptr;
        if (!ok) {
            setError("Failed to create service browser: " +
                     std::string(avahi_strerror(avahi_client_errno(m_client))));
            m_handler = nullptr;
        }

        avahi_threaded_poll_unlock(m_poll);
        return ok;
    }

    void stopBrowse() override {
        avahi_threaded_poll_lock(m_poll);

        freeResolvers();
        if (m_browser) {
            avahi_service_browser_free(m_browser);
            m_browser = nullptr;
        }
        m_handler = nullptr;

        avahi_threaded_poll_unlock(m_poll);
    }

    bool publish(const ServiceAdvert& advert) override {
        avahi_threaded_poll_lock(m_poll);

        m_advert = advert;
        if (m_name) avahi_free(m_name);
        m_name = avahi_strdup(advert.instanceName.c_str());

        bool ok = true;
        if (avahi_client_get_state(m_client) == AVAHI_CLIENT_S_RUNNING) {
            ok = registerService(m_client);
        }

        if (!ok) {
            m_advert.reset();
        }

        avahi_threaded_poll_unlock(m_poll);
        return ok;
    }

    void unpublish() override {
        avahi_threaded_poll_lock(m_poll);

        m_advert.reset();
        if (m_group) {
            avahi_entry_group_reset(m_group);
            avahi_entry_group_free(m_group);
            m_group = nullptr;
        }

        avahi_threaded_poll_unlock(m_poll);
    }

    std::string getLastError() const override {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastError;
    }

private:
    AvahiThreadedPoll* m_poll = nullptr;
    AvahiClient* m_client = nullptr;
    AvahiServiceBrowser* m_browser = nullptr;
    AvahiEntryGroup* m_group = nullptr;
    char* m_name = nullptr;                         // Текущее имя (меняется при коллизии)

    EventHandler m_handler;
    std::optional<ServiceAdvert> m_advert;

    // "iface/name" → resolver. Resolver живёт до REMOVE и сообщает об обновлениях TXT.
    std::map<std::string, AvahiServiceResolver*> m_resolvers;
    std::set<std::string> m_announced;              // Имена, о которых уже сообщили

    mutable std::mutex m_errorMutex;
    std::string m_lastError;

    void setError(const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(m_errorMutex);
            m_lastError = message;
        }
        spdlog::error("AvahiMdnsClient: {}", message);
    }

    void freeResolvers() {
        for (auto& [key, resolver] : m_resolvers) {
            avahi_service_resolver_free(resolver);
        }
        m_resolvers.clear();
        m_announced.clear();
    }

    static std::string resolverKey(AvahiIfIndex interface, const char* name) {
        return std::to_string(interface) + "/" + name;
    }

    bool hasResolverFor(const std::string& name) const {
        for (const auto& [key, resolver] : m_resolvers) {
            if (key.compare(key.find('/') + 1, std::string::npos, name) == 0) return true;
        }
        return false;
    }

    // ═══════════════════════════════════════════════════════════
    // Публикация
    // ═══════════════════════════════════════════════════════════

    /// Вызывается под блокировкой poll'а (или из его потока)
    bool registerService(AvahiClient* client) {
        if (!m_advert) return true;

        if (!m_group) {
            m_group = avahi_entry_group_new(client, groupCallback, this);
            if (!m_group) {
                setError("Failed to create entry group: " +
                         std::string(avahi_strerror(avahi_client_errno(client))));
                return false;
            }
        }

        if (!avahi_entry_group_is_empty(m_group)) return true;

        while (true) {
            AvahiStringList* txt = nullptr;
            for (const auto& [key, value] : m_advert->txt) {
                txt = avahi_string_list_add_pair(txt, key.c_str(), value.c_str());
            }

            // Host = nullptr: Avahi публикует сервис на собственном <host>.local
            int ret = avahi_entry_group_add_service_strlst(
                m_group,
                AVAHI_IF_UNSPEC,
                AVAHI_PROTO_UNSPEC,
                static_cast<AvahiPublishFlags>(0),
                m_name,
                toAvahiType(m_advert->serviceType).c_str(),
                nullptr,
                nullptr,
                m_advert->port,
                txt
            );
            avahi_string_list_free(txt);

            if (ret == AVAHI_ERR_COLLISION) {
                renameAfterCollision();
                avahi_entry_group_reset(m_group);
                continue;
            }
            if (ret < 0) {
                setError("Failed to add service: " + std::string(avahi_strerror(ret)));
                avahi_entry_group_reset(m_group);
                return false;
            }
            break;
        }

        int ret = avahi_entry_group_commit(m_group);
        if (ret < 0) {
            setError("Failed to commit service: " + std::string(avahi_strerror(ret)));
            return false;
        }
        return true;
    }

    void renameAfterCollision() {
        char* alternative = avahi_alternative_service_name(m_name);
        spdlog::warn("AvahiMdnsClient: name collision, renaming '{}' to '{}'", m_name, alternative);
        avahi_free(m_name);
        m_name = alternative;
    }

    static void groupCallback(AvahiEntryGroup* group, AvahiEntryGroupState state, void* userdata) {
        auto* self = static_cast<AvahiMdnsClient*>(userdata);

        switch (state) {
            case AVAHI_ENTRY_GROUP_ESTABLISHED:
                spdlog::info("AvahiMdnsClient: service '{}' established", self->m_name);
                break;
            case AVAHI_ENTRY_GROUP_COLLISION:
                self->renameAfterCollision();
                avahi_entry_group_reset(group);
                self->registerService(avahi_entry_group_get_client(group));
                break;
            case AVAHI_ENTRY_GROUP_FAILURE:
                self->setError("Entry group failure: " + std::string(avahi_strerror(
                    avahi_client_errno(avahi_entry_group_get_client(group)))));
                break;
            case AVAHI_ENTRY_GROUP_UNCOMMITED:
            case AVAHI_ENTRY_GROUP_REGISTERING:
                break;
        }
    }

    static void clientCallback(AvahiClient* client, AvahiClientState state, void* userdata) {
        auto* self = static_cast<AvahiMdnsClient*>(userdata);

        switch (state) {
            case AVAHI_CLIENT_S_RUNNING:
                // Сервер поднялся (или сменил имя хоста): публикуем отложенное
                self->registerService(client);
                break;
            case AVAHI_CLIENT_FAILURE:
                self->setError("Client failure: " + std::string(avahi_strerror(avahi_client_errno(client))));
                break;
            case AVAHI_CLIENT_S_COLLISION:
            case AVAHI_CLIENT_S_REGISTERING:
                if (self->m_group) {
                    avahi_entry_group_reset(self->m_group);
                }
                break;
            case AVAHI_CLIENT_CONNECTING:
                break;
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Browse
    // ═══════════════════════════════════════════════════════════

    static void browseCallback(AvahiServiceBrowser* browser,
                               AvahiIfIndex interface,
                               AvahiProtocol protocol,
                               AvahiBrowserEvent event,
                               const char* name,
                               const char* type,
                               const char* domain,
                               AvahiLookupResultFlags /*flags*/,
                               void* userdata) {
        auto* self = static_cast<AvahiMdnsClient*>(userdata);

        switch (event) {
            case AVAHI_BROWSER_NEW: {
                auto key = resolverKey(interface, name);
                if (self->m_resolvers.count(key)) break;

                auto* resolver = avahi_service_resolver_new(
                    avahi_service_browser_get_client(browser),
                    interface,
                    protocol,
                    name,
                    type,
                    domain,
                    AVAHI_PROTO_INET,
                    static_cast<AvahiLookupFlags>(0),
                    resolveCallback,
                    userdata
                );
                if (resolver) {
                    self->m_resolvers[key] = resolver;
                } else {
                    spdlog::warn("AvahiMdnsClient: cannot resolve '{}'", name);
                }
                break;
            }

            case AVAHI_BROWSER_REMOVE: {
                auto it = self->m_resolvers.find(resolverKey(interface, name));
                if (it != self->m_resolvers.end()) {
                    avahi_service_resolver_free(it->second);
                    self->m_resolvers.erase(it);
                }

                // Пропал со всех интерфейсов
                if (!self->hasResolverFor(name) && self->m_announced.erase(name) > 0) {
                    ServiceEvent removed;
                    removed.kind = ServiceEvent::Kind::Removed;
                    removed.serviceName = name;
                    if (self->m_handler) self->m_handler(removed);
                }
                break;
            }

            case AVAHI_BROWSER_FAILURE:
                self->setError("Browser failure: " + std::string(avahi_strerror(
                    avahi_client_errno(avahi_service_browser_get_client(browser)))));
                break;

            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                break;
        }
    }

    static void resolveCallback(AvahiServiceResolver* /*resolver*/,
                                AvahiIfIndex /*interface*/,
                                AvahiProtocol /*protocol*/,
                                AvahiResolverEvent event,
                                const char* name,
                                const char* /*type*/,
                                const char* /*domain*/,
                                const char* hostName,
                                const AvahiAddress* address,
                                uint16_t port,
                                AvahiStringList* txt,
                                AvahiLookupResultFlags /*flags*/,
                                void* userdata) {
        auto* self = static_cast<AvahiMdnsClient*>(userdata);

        if (event != AVAHI_RESOLVER_FOUND) {
            spdlog::debug("AvahiMdnsClient: resolve of '{}' failed", name ? name : "");
            return;
        }

        ServiceEvent found;
        found.kind = self->m_announced.insert(name).second
            ? ServiceEvent::Kind::Added
            : ServiceEvent::Kind::Updated;
        found.serviceName = name;
        found.hostName = hostName ? hostName : "";
        found.port = port;

        if (address) {
            char addr[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(addr, sizeof(addr), address);
            found.addresses.emplace_back(addr);
        }

        for (AvahiStringList* item = txt; item; item = avahi_string_list_get_next(item)) {
            found.txtRecords.emplace_back(
                reinterpret_cast<const char*>(avahi_string_list_get_text(item)),
                avahi_string_list_get_size(item));
        }

        if (self->m_handler) {
            self->m_handler(found);
        }
    }
};

} // namespace

std::shared_ptr<MdnsClient> createAvahiClient() {
    auto client = std::make_shared<AvahiMdnsClient>();
    if (!client->init()) {
        spdlog::warn("AvahiMdnsClient: {}", client->getLastError());
        return nullptr;
    }
    return client;
}

} // namespace OreonPickup

#else // OREONPICKUP_HAS_AVAHI

namespace OreonPickup {

std::shared_ptr<MdnsClient> createAvahiClient() {
    spdlog::debug("AvahiMdnsClient: built without Avahi support");
    return nullptr;
}

} // namespace OreonPickup

#endif // OREONPICKUP_HAS_AVAHI
