// TrustStore.cpp — JSON state файл с сопряжёнными устройствами

#include "oreonpickup/TrustStore.h"
#include "oreonpickup/Config.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace OreonPickup {

using json = nlohmann::json;

namespace {

constexpr const char* KEY_PAIRED_DEVICES = "paired_devices";

// Один mutex на файл: несколько TrustStore на один путь сериализуются
std::shared_ptr<std::mutex> mutexForPath(const std::string& path) {
    static std::mutex registryMutex;
    static std::map<std::string, std::weak_ptr<std::mutex>> registry;

    std::string key = fs::absolute(fs::path(path)).lexically_normal().string();

    std::lock_guard<std::mutex> lock(registryMutex);
    auto existing = registry[key].lock();
    if (existing) return existing;

    auto created = std::make_shared<std::mutex>();
    registry[key] = created;
    return created;
}

std::optional<PairedDevice> deviceFromJson(const std::string& deviceId, const json& j) {
    if (!j.is_object()) return std::nullopt;

    PairedDevice device;
    device.deviceId = deviceId;

    // Старые записи могут не иметь hostname/ip — восстанавливаем из id
    auto at = deviceId.rfind('@');
    std::string idHost = at == std::string::npos ? deviceId : deviceId.substr(0, at);
    std::string idIp = at == std::string::npos ? std::string() : deviceId.substr(at + 1);

    device.hostname = (j.contains("hostname") && j["hostname"].is_string())
        ? j["hostname"].get<std::string>() : idHost;
    device.ip = (j.contains("ip") && j["ip"].is_string())
        ? j["ip"].get<std::string>() : idIp;

    device.port = DEFAULT_PORT;
    if (j.contains("port") && j["port"].is_number_integer()) {
        auto port = j["port"].get<int64_t>();
        if (port >= 0 && port <= 65535) {
            device.port = static_cast<uint16_t>(port);
        }
    }

    // paired_at бывает дробным (time.time() в старых файлах)
    if (j.contains("paired_at")) {
        const auto& pairedAt = j["paired_at"];
        if (pairedAt.is_number_integer()) {
            device.pairedAt = pairedAt.get<int64_t>();
        } else if (pairedAt.is_number_float()) {
            device.pairedAt = static_cast<int64_t>(pairedAt.get<double>());
        }
    }

    return device;
}

json deviceToJson(const PairedDevice& device) {
    return json{
        {"hostname", device.hostname},
        {"ip", device.ip},
        {"port", device.port},
        {"paired_at", device.pairedAt}
    };
}

} // namespace

// ═══════════════════════════════════════════════════════════
// TrustStore::Impl
// ═══════════════════════════════════════════════════════════

class TrustStore::Impl {
public:
    explicit Impl(const std::string& stateFile)
        : m_path(stateFile)
        , m_fileMutex(mutexForPath(stateFile)) {
        spdlog::debug("TrustStore: Using {}", m_path);
    }

    const std::string& getPath() const { return m_path; }

    TrustState load() {
        std::lock_guard<std::mutex> lock(*m_fileMutex);
        return readLocked();
    }

    bool save(const TrustState& state) {
        std::lock_guard<std::mutex> lock(*m_fileMutex);
        return writeLocked(state);
    }

    bool addOrUpdate(const std::string& deviceId, const PairedDevice& record) {
        if (deviceId.empty()) {
            setError(PickupError::InvalidArgument, "Empty device id");
            spdlog::warn("TrustStore: Attempted to add device with empty id");
            return false;
        }

        std::lock_guard<std::mutex> lock(*m_fileMutex);
        TrustState state = readLocked();

        PairedDevice stored = record;
        stored.deviceId = deviceId;
        state.pairedDevices[deviceId] = stored;

        spdlog::info("TrustStore: Adding/updating paired device {} ({}:{})",
            deviceId, stored.ip, stored.port);
        return writeLocked(state);
    }

    bool remove(const std::string& deviceId) {
        std::lock_guard<std::mutex> lock(*m_fileMutex);
        TrustState state = readLocked();

        auto it = state.pairedDevices.find(deviceId);
        if (it == state.pairedDevices.end()) {
            spdlog::warn("TrustStore: Attempted to remove non-existent paired device: {}", deviceId);
            return true;
        }

        state.pairedDevices.erase(it);
        spdlog::info("TrustStore: Removing paired device: {}", deviceId);
        return writeLocked(state);
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
    std::string m_path;
    std::shared_ptr<std::mutex> m_fileMutex;

    mutable std::mutex m_errorMutex;
    PickupError m_lastErrorCode = PickupError::None;
    std::string m_lastError;

    void setError(PickupError code, const std::string& message) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastErrorCode = code;
        m_lastError = message;
    }

    void clearError() {
        setError(PickupError::None, "");
    }

    TrustState readLocked() {
        TrustState state;

        std::error_code ec;
        if (!fs::exists(m_path, ec)) {
            spdlog::debug("TrustStore: State file {} not found, starting empty", m_path);
            clearError();
            return state;
        }

        std::ifstream file(m_path);
        if (!file) {
            setError(PickupError::StorageIOError, "Cannot open state file: " + m_path);
            spdlog::error("TrustStore: Cannot open {}, using empty state", m_path);
            return state;
        }

        json j;
        try {
            j = json::parse(file);
        } catch (const json::parse_error& e) {
            markCorrupt(std::string("parse error: ") + e.what());
            return state;
        }

        if (!j.is_object()) {
            markCorrupt("top-level value is not an object");
            return state;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.key() == KEY_PAIRED_DEVICES) continue;
            state.otherFields[it.key()] = it.value().dump();
        }

        if (j.contains(KEY_PAIRED_DEVICES)) {
            const auto& devices = j[KEY_PAIRED_DEVICES];
            if (!devices.is_object()) {
                spdlog::warn("TrustStore: '{}' is not an object, ignoring it", KEY_PAIRED_DEVICES);
            } else {
                for (auto it = devices.begin(); it != devices.end(); ++it) {
                    auto device = deviceFromJson(it.key(), it.value());
                    if (!device) {
                        spdlog::warn("TrustStore: Skipping invalid entry '{}'", it.key());
                        continue;
                    }
                    state.pairedDevices[it.key()] = *device;
                }
            }
        }

        clearError();
        return state;
    }

    void markCorrupt(const std::string& reason) {
        setError(PickupError::StorageIOError, "State file corrupt: " + reason);
        spdlog::warn("TrustStore: State file {} is corrupt ({}), using empty state", m_path, reason);

        std::error_code ec;
        fs::copy_file(m_path, m_path + ".corrupt", fs::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::warn("TrustStore: Failed to back up corrupt state file: {}", ec.message());
        }
    }

    bool writeLocked(const TrustState& state) {
        json j = json::object();

        for (const auto& [key, rawValue] : state.otherFields) {
            if (key == KEY_PAIRED_DEVICES) continue;
            try {
                j[key] = json::parse(rawValue);
            } catch (const json::parse_error& e) {
                spdlog::warn("TrustStore: Dropping unparsable field '{}': {}", key, e.what());
            }
        }

        json devices = json::object();
        for (const auto& [deviceId, device] : state.pairedDevices) {
            devices[deviceId] = deviceToJson(device);
        }
        j[KEY_PAIRED_DEVICES] = devices;

        std::error_code ec;
        fs::path target(m_path);
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                return fail("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
            }
        }

        std::string tmpPath = m_path + ".tmp";
        {
            std::ofstream file(tmpPath, std::ios::trunc);
            if (!file) {
                return fail("Cannot open " + tmpPath + " for writing");
            }
            file << j.dump(2);
            file.flush();
            if (!file) {
                file.close();
                fs::remove(tmpPath, ec);
                return fail("Failed to write " + tmpPath);
            }
        }

        fs::rename(tmpPath, m_path, ec);
        if (ec) {
            std::string message = "Failed to replace " + m_path + ": " + ec.message();
            fs::remove(tmpPath, ec);
            return fail(message);
        }

        clearError();
        spdlog::debug("TrustStore: State written to {} ({} paired devices)",
            m_path, state.pairedDevices.size());
        return true;
    }

    bool fail(const std::string& message) {
        setError(PickupError::StorageIOError, message);
        spdlog::error("TrustStore: {}", message);
        return false;
    }
};

// ═══════════════════════════════════════════════════════════
// TrustStore Public Interface
// ═══════════════════════════════════════════════════════════

TrustStore::TrustStore(const std::string& stateFile)
    : m_impl(std::make_unique<Impl>(stateFile)) {}

TrustStore::~TrustStore() = default;

const std::string& TrustStore::getPath() const {
    return m_impl->getPath();
}

TrustState TrustStore::load() const {
    return m_impl->load();
}

bool TrustStore::save(const TrustState& state) {
    return m_impl->save(state);
}

bool TrustStore::addOrUpdate(const std::string& deviceId, const PairedDevice& record) {
    return m_impl->addOrUpdate(deviceId, record);
}

bool TrustStore::remove(const std::string& deviceId) {
    return m_impl->remove(deviceId);
}

std::map<std::string, PairedDevice> TrustStore::list() const {
    return m_impl->load().pairedDevices;
}

std::optional<PairedDevice> TrustStore::get(const std::string& deviceId) const {
    auto devices = list();
    auto it = devices.find(deviceId);
    if (it == devices.end()) return std::nullopt;
    return it->second;
}

bool TrustStore::isPaired(const std::string& deviceId) const {
    return get(deviceId).has_value();
}

PickupError TrustStore::getLastErrorCode() const {
    return m_impl->getLastErrorCode();
}

std::string TrustStore::getLastError() const {
    return m_impl->getLastError();
}

} // namespace OreonPickup
