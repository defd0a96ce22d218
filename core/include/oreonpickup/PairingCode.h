// PairingCode.h — Генерация кода сопряжения
// Код вводится человеком, поэтому короткий, но непредсказуемый (OpenSSL RNG)

#pragma once

#include "export.h"
#include "Config.h"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace OreonPickup {

/// Равномерно случайная строка из length десятичных цифр (ведущие нули сохраняются)
/// @throws std::invalid_argument если length вне [MIN_CODE_LENGTH, MAX_CODE_LENGTH]
/// @throws std::runtime_error если RAND_bytes не сработал
OP_API std::string generatePairingCode(size_t length = DEFAULT_CODE_LENGTH);

/// Строка из одних цифр длиной [MIN_CODE_LENGTH, MAX_CODE_LENGTH]
OP_API bool isValidPairingCode(const std::string& code);

namespace Crypto {

/// Криптографически стойкие случайные байты
OP_API std::vector<uint8_t> randomBytes(size_t count);

} // namespace Crypto

} // namespace OreonPickup
