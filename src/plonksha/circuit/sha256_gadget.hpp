#ifndef PLONKSHA_CIRCUIT_SHA256_GADGET_HPP_
#define PLONKSHA_CIRCUIT_SHA256_GADGET_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <utility>

#include "plonksha/PlonkSha.h"
#include "plonksha/circuit/num.hpp"
#include "plonksha/circuit/sha256_tables.hpp"
#include "plonksha/plonk/constraint_system.hpp"

namespace libplonksha {

// How far a value may be from the 32-bit range. The gadget handles at most
// 4 bits of overflow itself.
enum class overflow_tracker {
    NoOverflow,
    OneBitOverflow,
    SmallOverflow,
    SignificantOverflow
};

// See the comment before convert_into_sparse_majority_form.
enum class majority_strategy {
    UseTwoTables,
    RawOverflowCheck
};

template<typename FieldT>
class num_with_tracker {
public:
    num<FieldT> value;
    overflow_tracker tracker;

    num_with_tracker(const num<FieldT>& value, overflow_tracker tracker)
        : value(value), tracker(tracker) {}
};

// all rotations are in sparse form as well
template<typename FieldT>
class sparse_ch_value {
public:
    num<FieldT> normal;
    num<FieldT> sparse;
    num<FieldT> rot6;
    num<FieldT> rot11;
    num<FieldT> rot25;

    sparse_ch_value(const num<FieldT>& normal, const num<FieldT>& sparse,
                    const num<FieldT>& rot6, const num<FieldT>& rot11, const num<FieldT>& rot25)
        : normal(normal), sparse(sparse), rot6(rot6), rot11(rot11), rot25(rot25) {}
};

template<typename FieldT>
class sparse_maj_value {
public:
    num<FieldT> normal;
    num<FieldT> sparse;
    num<FieldT> rot2;
    num<FieldT> rot13;
    num<FieldT> rot22;

    sparse_maj_value(const num<FieldT>& normal, const num<FieldT>& sparse,
                     const num<FieldT>& rot2, const num<FieldT>& rot13, const num<FieldT>& rot22)
        : normal(normal), sparse(sparse), rot2(rot2), rot13(rot13), rot22(rot22) {}
};

/**
 * Tables and settings of the sparse-form SHA-256 gadget for one circuit.
 *
 * The constructor registers every table in the constraint system; after that
 * the object is never modified and is shared by all gadget invocations of
 * the circuit.
 */
template<typename FieldT>
class sha256_gadget_params {
private:
    majority_strategy maj_strategy;

    // see the comment before normalize
    size_t ch_base_num_of_chunks;
    size_t maj_base_num_of_chunks;

    // tables used for chooser (ch)
    lookup_table_handle<FieldT> sha256_base7_rot6_table;
    lookup_table_handle<FieldT> sha256_base7_rot3_extr10_table;
    lookup_table_handle<FieldT> sha256_ch_normalization_table;
    lookup_table_handle<FieldT> sha256_ch_xor_table;

    // tables used for majority (maj), the extraction table exists only
    // with majority_strategy::UseTwoTables
    lookup_table_handle<FieldT> sha256_base4_rot2_table;
    lookup_table_handle<FieldT> sha256_base4_rot2_extr10_table;
    lookup_table_handle<FieldT> sha256_maj_normalization_table;
    lookup_table_handle<FieldT> sha256_maj_xor_table;

    static FieldT converter_helper(uint64_t n, uint64_t sparse_base, size_t rotation);
    static allocated_num<FieldT> allocate_limb(plonk_constraint_system<FieldT>& cs,
                                               const allocated_num<FieldT>& var,
                                               size_t limb_index);
    static allocated_num<FieldT> allocate_sparse_rotation(plonk_constraint_system<FieldT>& cs,
                                                          const allocated_num<FieldT>& var,
                                                          uint64_t sparse_base,
                                                          size_t rotation);

public:
    sha256_gadget_params(plonk_constraint_system<FieldT>& cs,
                         majority_strategy strategy,
                         std::optional<size_t> ch_base_num_of_chunks = std::nullopt,
                         std::optional<size_t> maj_base_num_of_chunks = std::nullopt);

    majority_strategy get_majority_strategy() const { return maj_strategy; }
    size_t get_ch_base_num_of_chunks() const { return ch_base_num_of_chunks; }
    size_t get_maj_base_num_of_chunks() const { return maj_base_num_of_chunks; }

    const lookup_table_handle<FieldT>& base7_rot6_table() const { return sha256_base7_rot6_table; }
    const lookup_table_handle<FieldT>& base7_rot3_extr10_table() const { return sha256_base7_rot3_extr10_table; }
    const lookup_table_handle<FieldT>& ch_normalization_table() const { return sha256_ch_normalization_table; }
    const lookup_table_handle<FieldT>& ch_xor_table() const { return sha256_ch_xor_table; }
    const lookup_table_handle<FieldT>& base4_rot2_table() const { return sha256_base4_rot2_table; }
    const lookup_table_handle<FieldT>& base4_rot2_extr10_table() const { return sha256_base4_rot2_extr10_table; }
    const lookup_table_handle<FieldT>& maj_normalization_table() const { return sha256_maj_normalization_table; }
    const lookup_table_handle<FieldT>& maj_xor_table() const { return sha256_maj_xor_table; }

    // x must be below 2^36: returns (x mod 2^32, bits 32..33, bits 34..35)
    static std::array<FieldT, 3> extract_32_from_constant(const FieldT& x);
    static num<FieldT> extract_32_from_overflowed_num(plonk_constraint_system<FieldT>& cs,
                                                      const num<FieldT>& var);

    static allocated_num<FieldT> query_table1(plonk_constraint_system<FieldT>& cs,
                                              const lookup_table_handle<FieldT>& table,
                                              const allocated_num<FieldT>& key);
    static std::pair<allocated_num<FieldT>, allocated_num<FieldT>> query_table2(
        plonk_constraint_system<FieldT>& cs,
        const lookup_table_handle<FieldT>& table,
        const allocated_num<FieldT>& key);

    sparse_ch_value<FieldT> convert_into_sparse_chooser_form(plonk_constraint_system<FieldT>& cs,
                                                             const num_with_tracker<FieldT>& input) const;
    sparse_maj_value<FieldT> convert_into_sparse_majority_form(plonk_constraint_system<FieldT>& cs,
                                                               const num_with_tracker<FieldT>& input) const;

    static num<FieldT> normalize(plonk_constraint_system<FieldT>& cs,
                                 const num<FieldT>& input,
                                 const lookup_table_handle<FieldT>& table,
                                 uint64_t base,
                                 size_t num_chunks);

    // Ch(e, f, g)
    num<FieldT> choose(plonk_constraint_system<FieldT>& cs,
                       const sparse_ch_value<FieldT>& e,
                       const sparse_ch_value<FieldT>& f,
                       const sparse_ch_value<FieldT>& g) const;
    // Σ1(e) = (e >>> 6) ^ (e >>> 11) ^ (e >>> 25)
    num<FieldT> sigma1(plonk_constraint_system<FieldT>& cs,
                       const sparse_ch_value<FieldT>& e) const;
    // Maj(a, b, c)
    num<FieldT> majority(plonk_constraint_system<FieldT>& cs,
                         const sparse_maj_value<FieldT>& a,
                         const sparse_maj_value<FieldT>& b,
                         const sparse_maj_value<FieldT>& c) const;
    // Σ0(a) = (a >>> 2) ^ (a >>> 13) ^ (a >>> 22)
    num<FieldT> sigma0(plonk_constraint_system<FieldT>& cs,
                       const sparse_maj_value<FieldT>& a) const;
};

}

#include "plonksha/circuit/sha256_gadget.tcc"
#include "plonksha/circuit/sha256_overflow.tcc"
#include "plonksha/circuit/sha256_sparse_form.tcc"
#include "plonksha/circuit/sha256_normalize.tcc"

#endif // PLONKSHA_CIRCUIT_SHA256_GADGET_HPP_
