#include "oreonpickup/Logging.h"
#include <spdlog/spdlog.h>

namespace OreonPickup {

void setLogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: spdlog::set_level(spdlog::level::trace); break;
        case LogLevel::Debug: spdlog::set_level(spdlog::level::debug); break;
        case LogLevel::Info:  spdlog::set_level(spdlog::level::info); break;
        case LogLevel::Warn:  spdlog::set_level(spdlog::level::warn); break;
        case LogLevel::Error: spdlog::set_level(spdlog::level::err); break;
        case LogLevel::Off:   spdlog::set_level(spdlog::level::off); break;
    }
}

std::string truncateForLog(const std::string& raw, size_t maxBytes) {
    std::string result;
    size_t count = raw.size() < maxBytes ? raw.size() : maxBytes;
    result.reserve(count + 3);

    for (size_t i = 0; i < count; ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        result.push_back((c >= 0x20 && c < 0x7f) ? static_cast<char>(c) : '.');
    }
    if (raw.size() > maxBytes) {
        result += "...";
    }
    return result;
}

} // namespace OreonPickup
