#ifndef PLONKSHA_FIELD_UTILS_HPP_
#define PLONKSHA_FIELD_UTILS_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "libsnark/algebra/fields/bigint.hpp"

namespace libplonksha {

template<typename FieldT>
FieldT field_from_u64(uint64_t x);

/* Lowest 64-bit limb of the canonical (not Montgomery) representation */
template<typename FieldT>
uint64_t field_low_u64(const FieldT& x);

/* True when the canonical representation has no bits above limb 0 */
template<typename FieldT>
bool field_fits_u64(const FieldT& x);

/* n^exp computed in the field; n^0 is one */
template<typename FieldT>
FieldT u64_exp_to_ff(uint64_t n, uint64_t exp);

/*
 * Re-encode the bits of n as digits of the given base:
 * sum_i bit_i(n) * base^i. The result exceeds 64 bits for any
 * realistic base, hence it is built in the field.
 */
template<typename FieldT>
FieldT map_into_sparse_form(uint64_t n, uint64_t base);

/*
 * Split the canonical integer of x into num_chunks little-endian digits of
 * the given divisor. Returns false if x does not fit, i.e. if
 * x >= divisor^num_chunks.
 */
template<typename FieldT>
bool split_into_chunks(const FieldT& x, uint64_t divisor, size_t num_chunks,
                       std::vector<uint64_t>& chunks);

}

#include "plonksha/field_utils.tcc"

#endif // PLONKSHA_FIELD_UTILS_HPP_
