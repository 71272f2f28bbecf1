#include "plonksha/util.h"
#include "plonksha/PlonkSha.h"

#include <stdexcept>

uint32_t rotateRight32(uint32_t x, size_t rotation) {
    rotation %= PLONKSHA_REG_WIDTH;
    if (rotation == 0) {
        return x;
    }
    return (x >> rotation) | (x << (PLONKSHA_REG_WIDTH - rotation));
}

uint64_t rotateExtract(uint64_t value, size_t rotation, size_t extraction) {
    if (extraction > 0) {
        value &= (uint64_t(1) << extraction) - 1;
    }
    return rotateRight32(static_cast<uint32_t>(value), rotation);
}

std::vector<uint64_t> convertIntToDigits(uint64_t value, uint64_t base, size_t num_digits) {
    if (base < 2) {
        throw std::invalid_argument("digit base must be at least 2");
    }

    std::vector<uint64_t> digits(num_digits, 0);
    for (size_t i = 0; i < num_digits; i++) {
        digits[i] = value % base;
        value /= base;
    }

    if (value != 0) {
        throw std::out_of_range("value does not fit into the requested number of digits");
    }

    return digits;
}

uint64_t convertDigitsToInt(const std::vector<uint64_t>& digits, uint64_t base) {
    uint64_t result = 0;
    for (size_t i = digits.size(); i > 0; i--) {
        result = result * base + digits[i - 1];
    }
    return result;
}

uint32_t sha256Choose(uint32_t e, uint32_t f, uint32_t g) {
    return (e & f) ^ (~e & g);
}

uint32_t sha256Majority(uint32_t a, uint32_t b, uint32_t c) {
    return (a & b) ^ (a & c) ^ (b & c);
}

uint32_t sha256BigSigma0(uint32_t a) {
    return rotateRight32(a, 2) ^ rotateRight32(a, 13) ^ rotateRight32(a, 22);
}

uint32_t sha256BigSigma1(uint32_t e) {
    return rotateRight32(e, 6) ^ rotateRight32(e, 11) ^ rotateRight32(e, 25);
}

uint64_t chooseDigit(uint64_t digit) {
    // e + 2f + 3g is ambiguous only for 3 = (0,0,1) = (1,1,0),
    // and both of those choose a one
    static const uint64_t table[7] = {0, 0, 0, 1, 0, 1, 1};
    if (digit >= PLONKSHA_CHOOSE_BASE) {
        throw std::out_of_range("choose digit out of range");
    }
    return table[digit];
}

uint64_t majorityDigit(uint64_t digit) {
    if (digit >= PLONKSHA_MAJORITY_BASE) {
        throw std::out_of_range("majority digit out of range");
    }
    return digit >= 2 ? 1 : 0;
}

uint64_t xorDigit(uint64_t digit) {
    return digit & 1;
}
