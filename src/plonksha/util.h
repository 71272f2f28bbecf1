#ifndef PLONKSHA_UTIL_H_
#define PLONKSHA_UTIL_H_

#include <cstddef>
#include <cstdint>
#include <vector>

uint32_t rotateRight32(uint32_t x, size_t rotation);

// Drops everything above the lowest `extraction` bits (0 keeps the value as
// is) and then rotates the remainder right as a 32-bit word.
uint64_t rotateExtract(uint64_t value, size_t rotation, size_t extraction);

std::vector<uint64_t> convertIntToDigits(uint64_t value, uint64_t base, size_t num_digits);
uint64_t convertDigitsToInt(const std::vector<uint64_t>& digits, uint64_t base);

uint32_t sha256Choose(uint32_t e, uint32_t f, uint32_t g);
uint32_t sha256Majority(uint32_t a, uint32_t b, uint32_t c);
uint32_t sha256BigSigma0(uint32_t a);
uint32_t sha256BigSigma1(uint32_t e);

// Digit-wise boolean functions used by the normalization tables.
// For choose the digit is e + 2f + 3g, for majority it is a + b + c.
uint64_t chooseDigit(uint64_t digit);
uint64_t majorityDigit(uint64_t digit);
uint64_t xorDigit(uint64_t digit);

#endif // PLONKSHA_UTIL_H_
