// PairingProtocol.h — Протокол pairing: один JSON документ в каждую сторону
//
// Запрос:  {"type":"pairing_request","code":"1234","hostname":"alice-laptop"}
// Успех:   {"type":"pairing_confirm","status":"success","hostname":"bob-desktop"}
// Отказ:   {"type":"pairing_confirm","status":"failure","reason":"Invalid code"}

#pragma once

#include "../export.h"
#include "../Config.h"
#include <string>
#include <optional>
#include <cstddef>

namespace OreonPickup {

// ═══════════════════════════════════════════════════════════
// Константы протокола
// ═══════════════════════════════════════════════════════════

constexpr const char* MSG_PAIRING_REQUEST = "pairing_request";
constexpr const char* MSG_PAIRING_CONFIRM = "pairing_confirm";
constexpr const char* STATUS_SUCCESS = "success";
constexpr const char* STATUS_FAILURE = "failure";
constexpr const char* REASON_INVALID_CODE = "Invalid code";
constexpr const char* REASON_MALFORMED = "Malformed message";
constexpr const char* UNKNOWN_DEVICE_NAME = "Unknown Device";

// ═══════════════════════════════════════════════════════════
// Сообщения
// ═══════════════════════════════════════════════════════════

struct OP_API PairingRequest {
    std::string type = MSG_PAIRING_REQUEST;
    std::string code;
    std::string hostname;

    /// Тип сообщения верный (код не проверяется)
    bool isPairingRequest() const { return type == MSG_PAIRING_REQUEST; }

    std::string toJson() const;

    /// nullopt если это не JSON объект или поля не того типа
    static std::optional<PairingRequest> fromJson(const std::string& json);
};

struct OP_API PairingConfirm {
    bool success = false;
    std::string hostname;       // Только при успехе
    std::string reason;         // Только при отказе

    static PairingConfirm accepted(const std::string& hostname);
    static PairingConfirm rejected(const std::string& reason);

    std::string toJson() const;

    /// Успех только при type == pairing_confirm и status == success.
    /// nullopt если это не JSON объект или поля не того типа.
    static std::optional<PairingConfirm> fromJson(const std::string& json);
};

// ═══════════════════════════════════════════════════════════
// JsonMessageReader — сборка одного JSON документа из TCP потока
// ═══════════════════════════════════════════════════════════

/// recv() может вернуть документ по частям: копим байты, пока документ
/// не станет разбираемым, пир не закроет соединение или не превышен лимит.
class OP_API JsonMessageReader {
public:
    enum class Status {
        Incomplete,     // Нужны ещё данные
        Complete,       // document() содержит целый JSON документ
        Malformed       // Не JSON объект или превышен лимит
    };

    explicit JsonMessageReader(size_t maxBytes = MAX_MESSAGE_BYTES);

    /// Добавить принятые байты
    Status feed(const char* data, size_t size);

    /// Пир закрыл соединение: незавершённый документ становится Malformed
    Status finish();

    Status status() const { return m_status; }
    const std::string& document() const { return m_buffer; }
    size_t size() const { return m_buffer.size(); }

private:
    size_t m_maxBytes;
    std::string m_buffer;
    Status m_status = Status::Incomplete;

    Status evaluate();
};

} // namespace OreonPickup
