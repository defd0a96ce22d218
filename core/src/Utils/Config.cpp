// Config.cpp — Загрузка настроек из JSON и окружения

#include "oreonpickup/Config.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>

#ifdef _WIN32
    #include <winsock2.h>
#else
    #include <unistd.h>
#endif

namespace OreonPickup {

using json = nlohmann::json;

namespace {

bool parsePort(const std::string& text, uint16_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || value < 0 || value > 65535) {
        return false;
    }
    out = static_cast<uint16_t>(value);
    return true;
}

bool parsePositive(const std::string& text, long& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || value <= 0) {
        return false;
    }
    out = value;
    return true;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

// Читает целое поле, если оно есть и попадает в [minValue, maxValue]
template <typename T>
void readInt(const json& j, const char* key, T& out, long long minValue, long long maxValue) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        spdlog::warn("Config: '{}' must be an integer, ignored", key);
        return;
    }
    long long value = v.get<long long>();
    if (value < minValue || value > maxValue) {
        spdlog::warn("Config: '{}' = {} out of range [{}, {}], ignored", key, value, minValue, maxValue);
        return;
    }
    out = static_cast<T>(value);
}

void readString(const json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (!v.is_string()) {
        spdlog::warn("Config: '{}' must be a string, ignored", key);
        return;
    }
    out = v.get<std::string>();
}

} // namespace

// ═══════════════════════════════════════════════════════════
// PickupConfig
// ═══════════════════════════════════════════════════════════

bool PickupConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Config: Cannot open {}, using defaults", path);
        return false;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        spdlog::warn("Config: Failed to parse {}: {}", path, e.what());
        return false;
    }

    if (!j.is_object()) {
        spdlog::warn("Config: {} is not a JSON object, using defaults", path);
        return false;
    }

    readString(j, "service_type", serviceType);
    readString(j, "service_version", serviceVersion);
    readInt(j, "port", port, 0, 65535);
    readInt(j, "code_length", codeLength,
            static_cast<long long>(MIN_CODE_LENGTH), static_cast<long long>(MAX_CODE_LENGTH));
    readInt(j, "pairing_timeout_seconds", pairingTimeoutSeconds, 1, MAX_PAIRING_TIMEOUT_SECONDS);
    readInt(j, "connect_timeout_ms", connectTimeoutMs, 1, 10 * 60 * 1000);
    readInt(j, "read_timeout_ms", readTimeoutMs, 1, 10 * 60 * 1000);
    readInt(j, "poll_interval_ms", pollIntervalMs, 1, 999);
    readInt(j, "stop_grace_ms", stopGraceMs, 0, 60 * 1000);
    readInt(j, "max_message_bytes", maxMessageBytes, 64, 16 * 1024 * 1024);
    readString(j, "state_file", stateFile);
    readString(j, "hostname", hostname);

    spdlog::debug("Config: Loaded {}", path);
    return true;
}

void PickupConfig::applyEnvironment() {
    if (const char* value = env("OREON_PICKUP_PORT")) {
        if (!parsePort(value, port)) {
            spdlog::warn("Config: Invalid OREON_PICKUP_PORT '{}'", value);
        }
    }

    if (const char* value = env("OREON_PICKUP_STATE_FILE")) {
        stateFile = value;
    }

    if (const char* value = env("OREON_PICKUP_CODE_LENGTH")) {
        long length = 0;
        if (parsePositive(value, length) &&
            static_cast<size_t>(length) >= MIN_CODE_LENGTH &&
            static_cast<size_t>(length) <= MAX_CODE_LENGTH) {
            codeLength = static_cast<size_t>(length);
        } else {
            spdlog::warn("Config: Invalid OREON_PICKUP_CODE_LENGTH '{}'", value);
        }
    }

    if (const char* value = env("OREON_PICKUP_PAIRING_TIMEOUT")) {
        long seconds = 0;
        if (parsePositive(value, seconds) && seconds <= MAX_PAIRING_TIMEOUT_SECONDS) {
            pairingTimeoutSeconds = static_cast<int>(seconds);
        } else {
            spdlog::warn("Config: Invalid OREON_PICKUP_PAIRING_TIMEOUT '{}'", value);
        }
    }
}

std::vector<std::string> PickupConfig::validate() const {
    std::vector<std::string> problems;

    if (serviceType.empty() || serviceType.front() != '_') {
        problems.push_back("service_type must look like _name._tcp.local.");
    }
    if (codeLength < MIN_CODE_LENGTH || codeLength > MAX_CODE_LENGTH) {
        problems.push_back("code_length must be between " + std::to_string(MIN_CODE_LENGTH) +
                           " and " + std::to_string(MAX_CODE_LENGTH));
    }
    if (pairingTimeoutSeconds <= 0 || pairingTimeoutSeconds > MAX_PAIRING_TIMEOUT_SECONDS) {
        problems.push_back("pairing_timeout_seconds must be between 1 and " +
                           std::to_string(MAX_PAIRING_TIMEOUT_SECONDS));
    }
    if (connectTimeoutMs <= 0 || readTimeoutMs <= 0) {
        problems.push_back("connect/read timeouts must be positive");
    }
    if (pollIntervalMs <= 0 || pollIntervalMs >= 1000) {
        problems.push_back("poll_interval_ms must be in (0, 1000)");
    }
    if (stopGraceMs < 0) {
        problems.push_back("stop_grace_ms must not be negative");
    }
    if (maxMessageBytes < 64) {
        problems.push_back("max_message_bytes is too small");
    }
    if (stateFile.empty()) {
        problems.push_back("state_file must not be empty");
    }

    return problems;
}

std::string PickupConfig::resolvedHostname() const {
    if (!hostname.empty()) return hostname;

    char buffer[256] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
        spdlog::warn("Config: gethostname() failed, using 'localhost'");
        return "localhost";
    }
    return std::string(buffer);
}

std::string PickupConfig::defaultStateFile() {
    if (const char* xdg = env("XDG_DATA_HOME")) {
        return std::string(xdg) + "/oreon-pickup/state.json";
    }
#ifdef _WIN32
    if (const char* appData = env("LOCALAPPDATA")) {
        return std::string(appData) + "\\oreon-pickup\\state.json";
    }
#endif
    if (const char* home = env("HOME")) {
        return std::string(home) + "/.local/share/oreon-pickup/state.json";
    }
    return "/tmp/oreon-pickup/state.json";
}

} // namespace OreonPickup
