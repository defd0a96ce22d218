// test_pairing_code.cpp — Тесты генерации кода сопряжения

#include <gtest/gtest.h>
#include "oreonpickup/PairingCode.h"
#include <algorithm>
#include <array>
#include <set>
#include <stdexcept>

using namespace OreonPickup;

TEST(PairingCodeTest, DefaultIsFourDigits) {
    auto code = generatePairingCode();
    EXPECT_EQ(code.size(), 4u);
    EXPECT_TRUE(isValidPairingCode(code));
}

TEST(PairingCodeTest, EveryValidLengthProducesDigitsOnly) {
    for (size_t length = MIN_CODE_LENGTH; length <= MAX_CODE_LENGTH; ++length) {
        for (int i = 0; i < 20; ++i) {
            auto code = generatePairingCode(length);
            ASSERT_EQ(code.size(), length);
            ASSERT_TRUE(std::all_of(code.begin(), code.end(),
                                    [](char c) { return c >= '0' && c <= '9'; })) << code;
        }
    }
}

TEST(PairingCodeTest, InvalidLengthThrows) {
    EXPECT_THROW(generatePairingCode(0), std::invalid_argument);
    EXPECT_THROW(generatePairingCode(MAX_CODE_LENGTH + 1), std::invalid_argument);
}

TEST(PairingCodeTest, DigitsAreRoughlyUniform) {
    std::array<int, 10> counts{};
    const int samples = 5000;

    for (int i = 0; i < samples; ++i) {
        for (char c : generatePairingCode(4)) {
            counts[c - '0']++;
        }
    }

    // 20000 цифр, ожидание 2000 на цифру. Граница ±15% далеко за 5 сигмами.
    for (int digit = 0; digit < 10; ++digit) {
        EXPECT_GT(counts[digit], 1700) << "digit " << digit;
        EXPECT_LT(counts[digit], 2300) << "digit " << digit;
    }
}

TEST(PairingCodeTest, CodesAreNotRepeated) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(generatePairingCode(9));
    }
    EXPECT_GT(seen.size(), 95u);
}

TEST(PairingCodeTest, Validation) {
    EXPECT_TRUE(isValidPairingCode("0000"));
    EXPECT_TRUE(isValidPairingCode("7"));
    EXPECT_TRUE(isValidPairingCode("123456789"));

    EXPECT_FALSE(isValidPairingCode(""));
    EXPECT_FALSE(isValidPairingCode("1234567890"));
    EXPECT_FALSE(isValidPairingCode("12a4"));
    EXPECT_FALSE(isValidPairingCode(" 1234"));
    EXPECT_FALSE(isValidPairingCode("-123"));
}

TEST(CryptoTest, RandomBytesSize) {
    EXPECT_TRUE(Crypto::randomBytes(0).empty());
    EXPECT_EQ(Crypto::randomBytes(32).size(), 32u);
    EXPECT_NE(Crypto::randomBytes(32), Crypto::randomBytes(32));
}
