// Config.h — Настройки ядра Oreon Pickup
// Значения по умолчанию + переопределение из JSON файла и переменных окружения

#pragma once

#include "export.h"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace OreonPickup {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr const char* DEFAULT_SERVICE_TYPE = "_oreon-pickup._tcp.local.";
constexpr const char* SERVICE_VERSION = "0.1.0";
constexpr const char* SERVICE_NAME_PREFIX = "Oreon Pickup on ";
constexpr uint16_t DEFAULT_PORT = 50309;            // Объявляемый порт и порт responder'а
constexpr size_t DEFAULT_CODE_LENGTH = 4;
constexpr size_t MIN_CODE_LENGTH = 1;
constexpr size_t MAX_CODE_LENGTH = 9;
constexpr int PAIRING_TIMEOUT_SECONDS = 60;         // Дедлайн ожидания подключения
constexpr int MAX_PAIRING_TIMEOUT_SECONDS = 24 * 60 * 60;
constexpr int CONNECT_TIMEOUT_MS = 10000;
constexpr int READ_TIMEOUT_MS = 10000;
constexpr int POLL_INTERVAL_MS = 250;               // Гранулярность проверки флага stop
constexpr int STOP_GRACE_MS = 2000;                 // Ограниченный join при остановке
constexpr size_t MAX_MESSAGE_BYTES = 64 * 1024;
constexpr size_t MAX_PENDING_EVENTS = 256;            // Невычитанные события pairing

// ═══════════════════════════════════════════════════════════
// PickupConfig
// ═══════════════════════════════════════════════════════════

struct OP_API PickupConfig {
    std::string serviceType = DEFAULT_SERVICE_TYPE;
    std::string serviceVersion = SERVICE_VERSION;
    uint16_t port = DEFAULT_PORT;                   // 0 = эфемерный порт (тесты)
    size_t codeLength = DEFAULT_CODE_LENGTH;
    int pairingTimeoutSeconds = PAIRING_TIMEOUT_SECONDS;
    int connectTimeoutMs = CONNECT_TIMEOUT_MS;
    int readTimeoutMs = READ_TIMEOUT_MS;
    int pollIntervalMs = POLL_INTERVAL_MS;
    int stopGraceMs = STOP_GRACE_MS;
    size_t maxMessageBytes = MAX_MESSAGE_BYTES;
    std::string stateFile = defaultStateFile();
    std::string hostname;                           // Пусто = gethostname()

    /// Прочитать JSON объект с snake_case ключами поверх текущих значений.
    /// Неверные значения логируются и пропускаются.
    /// @return false если файл не читается или не является JSON объектом
    bool loadFromFile(const std::string& path);

    /// OREON_PICKUP_PORT, OREON_PICKUP_STATE_FILE,
    /// OREON_PICKUP_CODE_LENGTH, OREON_PICKUP_PAIRING_TIMEOUT
    void applyEnvironment();

    /// Список проблем (пусто = конфигурация корректна)
    std::vector<std::string> validate() const;

    /// hostname или имя хоста системы
    std::string resolvedHostname() const;

    /// $XDG_DATA_HOME/oreon-pickup/state.json, затем ~/.local/share/...
    static std::string defaultStateFile();
};

} // namespace OreonPickup
