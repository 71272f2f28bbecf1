#include <gtest/gtest.h>

#include <stdexcept>

#include "plonksha/util.h"

TEST(util, rotate_right)
{
    const uint32_t n = 0x6a09e667;
    EXPECT_EQ(rotateRight32(n, 0), n);
    EXPECT_EQ(rotateRight32(n, 32), n);
    EXPECT_EQ(rotateRight32(n, 2), 0xda827999);
    EXPECT_EQ(rotateRight32(n, 6), 0x9da82799);
    EXPECT_EQ(rotateRight32(n, 11), 0xcced413c);
    EXPECT_EQ(rotateRight32(n, 13), 0x333b504f);
    EXPECT_EQ(rotateRight32(n, 22), 0x27999da8);
    EXPECT_EQ(rotateRight32(n, 25), 0x04f333b5);
}

TEST(util, rotate_extract)
{
    // nothing is dropped without extraction
    EXPECT_EQ(rotateExtract(0x7ff, 0, 0), 0x7ffu);
    EXPECT_EQ(rotateExtract(0x7ff, 0, 10), 0x3ffu);
    EXPECT_EQ(rotateExtract(0x400, 3, 10), 0u);
    EXPECT_EQ(rotateExtract(0x401, 3, 10), 0x20000000u);
    EXPECT_EQ(rotateExtract(0x1, 2, 0), 0x40000000u);
}

TEST(util, digits)
{
    std::vector<uint64_t> digits = convertIntToDigits(2400, 7, 4);
    ASSERT_EQ(digits.size(), 4);
    for (uint64_t d : digits) {
        EXPECT_EQ(d, 6);
    }
    EXPECT_EQ(convertDigitsToInt(digits, 7), 2400);

    digits = convertIntToDigits(27, 4, 3);
    EXPECT_EQ(digits, std::vector<uint64_t>({3, 2, 1}));
    EXPECT_EQ(convertDigitsToInt(digits, 4), 27);

    EXPECT_THROW(convertIntToDigits(2401, 7, 4), std::out_of_range);
    EXPECT_THROW(convertIntToDigits(1, 1, 4), std::invalid_argument);
}

TEST(util, sha256_functions)
{
    // first round of SHA-256 on the initial hash value
    EXPECT_EQ(sha256Choose(0x510e527f, 0x9b05688c, 0x1f83d9ab), 0x1f85c98c);
    EXPECT_EQ(sha256Majority(0x6a09e667, 0xbb67ae85, 0x3c6ef372), 0x3a6fe667);
    EXPECT_EQ(sha256BigSigma0(0x6a09e667), 0xce20b47e);
    EXPECT_EQ(sha256BigSigma1(0x510e527f), 0x3587272b);
}

TEST(util, digit_functions)
{
    for (uint32_t e = 0; e < 2; e++) {
        for (uint32_t f = 0; f < 2; f++) {
            for (uint32_t g = 0; g < 2; g++) {
                EXPECT_EQ(chooseDigit(e + 2 * f + 3 * g), sha256Choose(e, f, g) & 1);
                EXPECT_EQ(majorityDigit(e + f + g), sha256Majority(e, f, g) & 1);
                EXPECT_EQ(xorDigit(e + f + g), (e ^ f ^ g) & 1);
            }
        }
    }

    EXPECT_THROW(chooseDigit(7), std::out_of_range);
    EXPECT_THROW(majorityDigit(4), std::out_of_range);
}
