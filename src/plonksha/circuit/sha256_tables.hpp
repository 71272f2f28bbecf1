#ifndef PLONKSHA_CIRCUIT_SHA256_TABLES_HPP_
#define PLONKSHA_CIRCUIT_SHA256_TABLES_HPP_

#include <cstdint>
#include <string>

#include "plonksha/plonk/lookup_table.hpp"

namespace libplonksha {

/**
 * For every chunk k of `bits` bits returns the sparse form of k together with
 * the sparse form of k rotated right by `rotation` as a 32-bit word.
 * A nonzero `extraction` forgets everything above the lowest `extraction`
 * bits of the key before both conversions, which lets the highest chunk of a
 * register absorb a one-bit overflow.
 */
template<typename FieldT>
class sha256_sparse_rotate_table : public lookup_table<FieldT> {
public:
    sha256_sparse_rotate_table(size_t bits, size_t rotation, size_t extraction,
                               uint64_t base, const std::string& name);
};

/**
 * Base of the normalization tables: a key is a number of `num_chunks` digits
 * in `base`, the value is sum_i f(digit_i) * 2^i for a digit function f with
 * values in {0, 1}.
 */
template<typename FieldT>
class sha256_digit_reduction_table : public lookup_table<FieldT> {
protected:
    sha256_digit_reduction_table(uint64_t base, size_t num_chunks,
                                 uint64_t (*digit_function)(uint64_t),
                                 const std::string& name);
};

// radix 7, digit = e + 2f + 3g, f = Ch
template<typename FieldT>
class sha256_choose_table : public sha256_digit_reduction_table<FieldT> {
public:
    sha256_choose_table(size_t num_chunks, const std::string& name);
};

// radix 4, digit = a + b + c, f = Maj
template<typename FieldT>
class sha256_majority_table : public sha256_digit_reduction_table<FieldT> {
public:
    sha256_majority_table(size_t num_chunks, const std::string& name);
};

// f = parity of the digit, in any base
template<typename FieldT>
class sha256_normalization_table : public sha256_digit_reduction_table<FieldT> {
public:
    sha256_normalization_table(uint64_t base, size_t num_chunks, const std::string& name);
};

}

#include "plonksha/circuit/sha256_tables.tcc"

#endif // PLONKSHA_CIRCUIT_SHA256_TABLES_HPP_
