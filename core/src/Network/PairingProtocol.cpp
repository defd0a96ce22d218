// PairingProtocol.cpp — Сериализация pairing сообщений

#include "oreonpickup/Network/PairingProtocol.h"
#include <nlohmann/json.hpp>
#include <cctype>

namespace OreonPickup {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// PairingRequest
// ═══════════════════════════════════════════════════════════

std::string PairingRequest::toJson() const {
    json j = {
        {"type", type},
        {"code", code},
        {"hostname", hostname}
    };
    return j.dump();
}

std::optional<PairingRequest> PairingRequest::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object()) return std::nullopt;

        PairingRequest r;
        r.type = j.value("type", "");
        r.code = j.value("code", "");
        r.hostname = j.value("hostname", "");
        return r;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// PairingConfirm
// ═══════════════════════════════════════════════════════════

PairingConfirm PairingConfirm::accepted(const std::string& hostname) {
    PairingConfirm c;
    c.success = true;
    c.hostname = hostname;
    return c;
}

PairingConfirm PairingConfirm::rejected(const std::string& reason) {
    PairingConfirm c;
    c.success = false;
    c.reason = reason;
    return c;
}

std::string PairingConfirm::toJson() const {
    json j = {
        {"type", MSG_PAIRING_CONFIRM},
        {"status", success ? STATUS_SUCCESS : STATUS_FAILURE}
    };
    if (success) {
        j["hostname"] = hostname;
    } else {
        j["reason"] = reason;
    }
    return j.dump();
}

std::optional<PairingConfirm> PairingConfirm::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object()) return std::nullopt;

        PairingConfirm c;
        c.success = j.value("type", "") == MSG_PAIRING_CONFIRM &&
                    j.value("status", "") == STATUS_SUCCESS;
        c.hostname = j.value("hostname", "");
        c.reason = j.value("reason", c.success ? "" : "Unknown");
        return c;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ═══════════════════════════════════════════════════════════
// JsonMessageReader
// ═══════════════════════════════════════════════════════════

JsonMessageReader::JsonMessageReader(size_t maxBytes)
    : m_maxBytes(maxBytes) {}

JsonMessageReader::Status JsonMessageReader::feed(const char* data, size_t size) {
    if (m_status != Status::Incomplete) return m_status;

    m_buffer.append(data, size);
    m_status = evaluate();
    return m_status;
}

JsonMessageReader::Status JsonMessageReader::finish() {
    if (m_status == Status::Incomplete) {
        m_status = Status::Malformed;
    }
    return m_status;
}

JsonMessageReader::Status JsonMessageReader::evaluate() {
    if (m_buffer.size() > m_maxBytes) {
        return Status::Malformed;
    }

    // Документ протокола всегда объект: мусор в начале виден сразу
    for (char c : m_buffer) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c != '{') return Status::Malformed;
        break;
    }

    return json::accept(m_buffer) ? Status::Complete : Status::Incomplete;
}

} // namespace OreonPickup
