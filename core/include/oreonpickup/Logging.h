#pragma once

#include "export.h"
#include <string>
#include <cstddef>

namespace OreonPickup {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/// Уровень логирования библиотеки (sinks настраивает приложение)
OP_API void setLogLevel(LogLevel level);

/// Обрезать сырые данные для лога, непечатаемые байты заменяются на '.'
OP_API std::string truncateForLog(const std::string& raw, size_t maxBytes = 64);

} // namespace OreonPickup
