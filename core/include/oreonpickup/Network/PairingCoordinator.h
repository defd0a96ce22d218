// PairingCoordinator.h — Сессия pairing по коду (responder или initiator)
// Одновременно активна не больше одной сессии: старт новой сначала
// останавливает предыдущую.

#pragma once

#include "../export.h"
#include "../Config.h"
#include "../Models.h"
#include "../Types.h"
#include "../NotificationQueue.h"
#include <string>
#include <memory>
#include <functional>
#include <optional>
#include <cstdint>

namespace OreonPickup {

class TrustStore;

// ═══════════════════════════════════════════════════════════
// Результат и события сессии
// ═══════════════════════════════════════════════════════════

struct PairingResult {
    bool success = false;           // Рукопожатие принято обеими сторонами
    bool persisted = false;         // Устройство записано в trust store
    PairingRole role = PairingRole::Responder;
    PairingState finalState = PairingState::Idle;
    PickupError error = PickupError::None;
    std::string reason;             // Причина отказа / текст ошибки
    std::optional<PairedDevice> device;

    /// Успех, который пережил перезапуск процесса
    bool ok() const { return success && persisted; }
};

struct PairingEvent {
    uint64_t sessionId = 0;
    PairingRole role = PairingRole::Responder;
    PairingState state = PairingState::Idle;
    PickupError error = PickupError::None;
    std::string detail;
};

// ═══════════════════════════════════════════════════════════
// PairingCoordinator
// ═══════════════════════════════════════════════════════════

class OP_API PairingCoordinator {
public:
    /// Вызывается из рабочего потока сессии после терминального состояния
    using ResultCallback = std::function<void(const PairingResult&)>;

    /// Вызывается из рабочего потока на каждый переход
    using StateCallback = std::function<void(const PairingEvent&)>;

    PairingCoordinator(const PickupConfig& config, std::shared_ptr<TrustStore> store);
    ~PairingCoordinator();

    // Запрет копирования
    PairingCoordinator(const PairingCoordinator&) = delete;
    PairingCoordinator& operator=(const PairingCoordinator&) = delete;

    /// Код длины config.codeLength
    /// @throws std::invalid_argument если длина вне допустимого диапазона
    std::string generateCode() const;

    /// Слушать config.port и ждать одного подключения с этим кодом.
    /// Порт открывается синхронно: занятый порт → false и PortInUse.
    bool startResponder(const std::string& code, ResultCallback callback = nullptr);

    /// То же на явном порту (0 = эфемерный, см. getBoundPort)
    bool startResponder(const std::string& code, uint16_t port, ResultCallback callback);

    /// Подключиться к пиру и предъявить код (асинхронно)
    bool startInitiator(const std::string& ip, uint16_t port, const std::string& code,
                        ResultCallback callback = nullptr);

    /// Блокирующий вариант startInitiator.
    /// Ограничен connectTimeoutMs + readTimeoutMs.
    PairingResult initiate(const std::string& ip, uint16_t port, const std::string& code);

    /// Остановить текущую сессию. Идемпотентно.
    /// Ждёт рабочий поток не дольше config.stopGraceMs.
    void stopSession();

    PairingState getState() const;
    bool isActive() const;

    /// Порт responder'а текущей сессии (0 если не слушаем)
    uint16_t getBoundPort() const;

    /// Id текущей (или последней) сессии, 0 до первого старта
    uint64_t getSessionId() const;

    /// Результат последней завершившейся сессии
    std::optional<PairingResult> getLastResult() const;

    /// Ждать завершения текущей сессии
    /// @return true если сессии нет или она завершилась
    bool waitForCompletion(int timeoutMs);

    /// Очередь всех переходов состояния (UI вычитывает сам).
    /// Хранит не больше MAX_PENDING_EVENTS: если её не читать,
    /// старые события вытесняются новыми.
    NotificationQueue<PairingEvent>& events();

    void onStateChanged(StateCallback callback);

    /// Последняя ошибка старта сессии
    PickupError getLastErrorCode() const;
    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace OreonPickup
