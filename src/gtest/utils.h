#ifndef PLONKSHA_GTEST_UTILS_H_
#define PLONKSHA_GTEST_UTILS_H_

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "libsnark/common/default_types/r1cs_ppzksnark_pp.hpp"

#include "plonksha/circuit/num.hpp"
#include "plonksha/field_utils.hpp"

typedef libsnark::Fr<libsnark::default_r1cs_ppzksnark_pp> FieldT;

// Reads a sparse value back as a binary word, or returns UINT64_MAX if some
// digit is not a bit.
inline uint64_t decode_sparse(const FieldT& x, uint64_t base)
{
    std::vector<uint64_t> digits;
    if (!libplonksha::split_into_chunks(x, base, 64, digits)) {
        return UINT64_MAX;
    }

    uint64_t result = 0;
    for (size_t i = 0; i < digits.size(); i++) {
        if (digits[i] > 1) {
            return UINT64_MAX;
        }
        result |= digits[i] << i;
    }
    return result;
}

inline uint64_t value_u64(const libplonksha::num<FieldT>& n)
{
    return libplonksha::field_low_u64(*n.get_value());
}

inline libplonksha::num<FieldT> alloc_input(libplonksha::plonk_constraint_system<FieldT>& cs, uint64_t x)
{
    return libplonksha::num<FieldT>(libplonksha::allocated_num<FieldT>::alloc(cs, [x]() {
        return libplonksha::field_from_u64<FieldT>(x);
    }));
}

// input of a circuit laid out without a witness
inline libplonksha::num<FieldT> alloc_unknown(libplonksha::plonk_constraint_system<FieldT>& cs)
{
    return libplonksha::num<FieldT>(libplonksha::allocated_num<FieldT>::alloc(cs, []() {
        return libplonksha::grab(std::optional<FieldT>());
    }));
}

inline std::vector<uint32_t> sample_words(size_t count, uint32_t seed)
{
    std::mt19937 rng(seed);
    std::vector<uint32_t> words = {0, 1, 0xffffffff, 0x80000000, 0x6a09e667};
    while (words.size() < count) {
        words.push_back(rng());
    }
    return words;
}

#endif // PLONKSHA_GTEST_UTILS_H_
