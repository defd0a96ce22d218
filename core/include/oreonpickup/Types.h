#pragma once

#include "export.h"
#include <cstdint>
#include <string>

namespace OreonPickup {

// ═══════════════════════════════════════════════════════════
// Ошибки ядра (discovery, pairing, trust store)
// ═══════════════════════════════════════════════════════════

enum class PickupError : int32_t {
    None = 0,
    DiscoveryUnavailable = 1,   // mDNS стек недоступен, discovery просто пустой
    AdvertiseFailed = 2,        // Ошибка регистрации сервиса
    PortInUse = 3,              // Порт responder'а занят (класс AdvertiseFailed)
    ConnectionRefused = 4,
    ConnectTimeout = 5,
    ReadTimeout = 6,
    NetworkError = 7,           // Прочие ошибки сокетов
    InvalidCode = 8,            // Код отклонён другой стороной
    MalformedMessage = 9,       // Пир прислал не JSON / обрезанный JSON
    Cancelled = 10,             // Сессия остановлена вызовом stop
    TimedOut = 11,              // Истёк дедлайн ожидания подключения
    StorageIOError = 12,        // Файл состояния не читается / не пишется
    InvalidArgument = 13
};

OP_API const char* errorToString(PickupError error);

// ═══════════════════════════════════════════════════════════
// Pairing: роль и состояние сессии
// ═══════════════════════════════════════════════════════════

enum class PairingRole : int32_t {
    Responder = 0,      // Показывает код и ждёт подключения
    Initiator = 1       // Вводит код и подключается к пиру
};

OP_API const char* roleToString(PairingRole role);

/// Idle -> Listening -> Verifying -> Paired | Rejected | Failed -> Idle
/// Idle -> Connecting -> AwaitingResponse -> Paired | Rejected | Failed -> Idle
/// Любое нетерминальное -> Cancelled (stop или дедлайн) -> Idle
enum class PairingState : int32_t {
    Idle = 0,
    Listening = 1,
    Verifying = 2,
    Connecting = 3,
    AwaitingResponse = 4,
    Paired = 5,
    Rejected = 6,       // Код не совпал
    Failed = 7,         // Сетевая ошибка или битое сообщение
    Cancelled = 8       // Stop или таймаут (см. PickupError::TimedOut)
};

OP_API const char* stateToString(PairingState state);

/// Paired / Rejected / Failed / Cancelled
OP_API bool isTerminalState(PairingState state);

/// Listening / Verifying / Connecting / AwaitingResponse
OP_API bool isActiveState(PairingState state);

} // namespace OreonPickup
