#include <stdexcept>

#include "libsnark/common/profiling.hpp"

#include "plonksha/SynthesisError.hpp"
#include "plonksha/field_utils.hpp"
#include "plonksha/util.h"

namespace libplonksha {

template<typename FieldT>
sha256_gadget_params<FieldT>::sha256_gadget_params(
    plonk_constraint_system<FieldT>& cs,
    majority_strategy strategy,
    std::optional<size_t> ch_base_num_of_chunks,
    std::optional<size_t> maj_base_num_of_chunks)
    : maj_strategy(strategy),
      ch_base_num_of_chunks(ch_base_num_of_chunks.value_or(PLONKSHA_CH_BASE_DEFAULT_NUM_OF_CHUNKS)),
      maj_base_num_of_chunks(maj_base_num_of_chunks.value_or(PLONKSHA_MAJ_BASE_DEFAULT_NUM_OF_CHUNKS))
{
    libsnark::enter_block("Call to sha256_gadget_params::sha256_gadget_params");

    sha256_base7_rot6_table = cs.add_table(std::make_shared<const sha256_sparse_rotate_table<FieldT>>(
        PLONKSHA_GADGET_CHUNK_SIZE, 6, 0, PLONKSHA_CHOOSE_BASE, "sha256_base7_rot6_table"));
    sha256_base7_rot3_extr10_table = cs.add_table(std::make_shared<const sha256_sparse_rotate_table<FieldT>>(
        PLONKSHA_GADGET_CHUNK_SIZE, 3, PLONKSHA_GADGET_CHUNK_SIZE - 1, PLONKSHA_CHOOSE_BASE,
        "sha256_base7_rot3_extr10_table"));

    sha256_base4_rot2_table = cs.add_table(std::make_shared<const sha256_sparse_rotate_table<FieldT>>(
        PLONKSHA_GADGET_CHUNK_SIZE, 2, 0, PLONKSHA_MAJORITY_BASE, "sha256_base4_rot2_table"));
    if (maj_strategy == majority_strategy::UseTwoTables) {
        sha256_base4_rot2_extr10_table = cs.add_table(std::make_shared<const sha256_sparse_rotate_table<FieldT>>(
            PLONKSHA_GADGET_CHUNK_SIZE, 2, PLONKSHA_GADGET_CHUNK_SIZE - 1, PLONKSHA_MAJORITY_BASE,
            "sha256_base4_rot2_extr10_table"));
    }

    sha256_ch_normalization_table = cs.add_table(std::make_shared<const sha256_choose_table<FieldT>>(
        this->ch_base_num_of_chunks, "sha256_ch_normalization_table"));
    sha256_maj_normalization_table = cs.add_table(std::make_shared<const sha256_majority_table<FieldT>>(
        this->maj_base_num_of_chunks, "sha256_maj_normalization_table"));
    sha256_ch_xor_table = cs.add_table(std::make_shared<const sha256_normalization_table<FieldT>>(
        PLONKSHA_CHOOSE_BASE, this->ch_base_num_of_chunks, "sha256_ch_xor_table"));
    sha256_maj_xor_table = cs.add_table(std::make_shared<const sha256_normalization_table<FieldT>>(
        PLONKSHA_MAJORITY_BASE, this->maj_base_num_of_chunks, "sha256_maj_xor_table"));

    libsnark::leave_block("Call to sha256_gadget_params::sha256_gadget_params");
}

template<typename FieldT>
FieldT sha256_gadget_params<FieldT>::converter_helper(uint64_t n, uint64_t sparse_base, size_t rotation)
{
    const uint32_t word = static_cast<uint32_t>(n & 0xffffffff);
    return map_into_sparse_form<FieldT>(rotateRight32(word, rotation), sparse_base);
}

template<typename FieldT>
allocated_num<FieldT> sha256_gadget_params<FieldT>::allocate_limb(
    plonk_constraint_system<FieldT>& cs,
    const allocated_num<FieldT>& var,
    size_t limb_index)
{
    const std::optional<FieldT>& value = var.get_value();
    return allocated_num<FieldT>::alloc(cs, [&value, limb_index]() {
        // the highest limb also catches bit 32 of a one-bit overflow
        const uint64_t x = field_low_u64(grab(value));
        const uint64_t mask = (uint64_t(1) << PLONKSHA_GADGET_CHUNK_SIZE) - 1;
        return field_from_u64<FieldT>((x >> (PLONKSHA_GADGET_CHUNK_SIZE * limb_index)) & mask);
    });
}

template<typename FieldT>
allocated_num<FieldT> sha256_gadget_params<FieldT>::allocate_sparse_rotation(
    plonk_constraint_system<FieldT>& cs,
    const allocated_num<FieldT>& var,
    uint64_t sparse_base,
    size_t rotation)
{
    const std::optional<FieldT>& value = var.get_value();
    return allocated_num<FieldT>::alloc(cs, [&value, sparse_base, rotation]() {
        return converter_helper(field_low_u64(grab(value)), sparse_base, rotation);
    });
}

template<typename FieldT>
allocated_num<FieldT> sha256_gadget_params<FieldT>::query_table1(
    plonk_constraint_system<FieldT>& cs,
    const lookup_table_handle<FieldT>& table,
    const allocated_num<FieldT>& key)
{
    if (table->output_arity() != 1) {
        throw std::invalid_argument("table " + table->name() + " has more than one output");
    }

    // the padding variable cannot be created inside of the batch
    const allocated_num<FieldT> zero = allocated_num<FieldT>::alloc_zero(cs);

    std::optional<FieldT> output;
    if (key.get_value()) {
        output = table->query({*key.get_value()})[0];
    }
    const allocated_num<FieldT> first = allocated_num<FieldT>::alloc(cs, [&output]() { return grab(output); });

    const plonk_wires wires = {{key.get_variable(), first.get_variable(), zero.get_variable(), zero.get_variable()}};
    cs.begin_gates_batch_for_step();
    cs.allocate_variables_without_gate(wires);
    cs.apply_single_lookup_gate(std::vector<plonk_variable>(wires.begin(), wires.begin() + table->width()), table);
    cs.end_gates_batch_for_step();

    return first;
}

template<typename FieldT>
std::pair<allocated_num<FieldT>, allocated_num<FieldT>> sha256_gadget_params<FieldT>::query_table2(
    plonk_constraint_system<FieldT>& cs,
    const lookup_table_handle<FieldT>& table,
    const allocated_num<FieldT>& key)
{
    if (table->output_arity() != 2) {
        throw std::invalid_argument("table " + table->name() + " does not have two outputs");
    }

    const allocated_num<FieldT> zero = allocated_num<FieldT>::alloc_zero(cs);

    std::optional<FieldT> first_value;
    std::optional<FieldT> second_value;
    if (key.get_value()) {
        const std::vector<FieldT> outputs = table->query({*key.get_value()});
        first_value = outputs[0];
        second_value = outputs[1];
    }
    const allocated_num<FieldT> first = allocated_num<FieldT>::alloc(cs, [&first_value]() { return grab(first_value); });
    const allocated_num<FieldT> second = allocated_num<FieldT>::alloc(cs, [&second_value]() { return grab(second_value); });

    const plonk_wires wires = {{key.get_variable(), first.get_variable(), second.get_variable(), zero.get_variable()}};
    cs.begin_gates_batch_for_step();
    cs.allocate_variables_without_gate(wires);
    cs.apply_single_lookup_gate(std::vector<plonk_variable>(wires.begin(), wires.begin() + table->width()), table);
    cs.end_gates_batch_for_step();

    return std::make_pair(first, second);
}

template<typename FieldT>
num<FieldT> sha256_gadget_params<FieldT>::choose(
    plonk_constraint_system<FieldT>& cs,
    const sparse_ch_value<FieldT>& e,
    const sparse_ch_value<FieldT>& f,
    const sparse_ch_value<FieldT>& g) const
{
    // every digit of e + 2f + 3g is one of 0..6 and determines Ch of its bits
    const num<FieldT> combined = num<FieldT>::lc(
        cs, {FieldT::one(), FieldT(2), FieldT(3)}, {e.sparse, f.sparse, g.sparse});
    return normalize(cs, combined, sha256_ch_normalization_table, PLONKSHA_CHOOSE_BASE, ch_base_num_of_chunks);
}

template<typename FieldT>
num<FieldT> sha256_gadget_params<FieldT>::sigma1(
    plonk_constraint_system<FieldT>& cs,
    const sparse_ch_value<FieldT>& e) const
{
    const num<FieldT> combined = num<FieldT>::lc(
        cs, {FieldT::one(), FieldT::one(), FieldT::one()}, {e.rot6, e.rot11, e.rot25});
    return normalize(cs, combined, sha256_ch_xor_table, PLONKSHA_CHOOSE_BASE, ch_base_num_of_chunks);
}

template<typename FieldT>
num<FieldT> sha256_gadget_params<FieldT>::majority(
    plonk_constraint_system<FieldT>& cs,
    const sparse_maj_value<FieldT>& a,
    const sparse_maj_value<FieldT>& b,
    const sparse_maj_value<FieldT>& c) const
{
    const num<FieldT> combined = num<FieldT>::lc(
        cs, {FieldT::one(), FieldT::one(), FieldT::one()}, {a.sparse, b.sparse, c.sparse});
    return normalize(cs, combined, sha256_maj_normalization_table, PLONKSHA_MAJORITY_BASE, maj_base_num_of_chunks);
}

template<typename FieldT>
num<FieldT> sha256_gadget_params<FieldT>::sigma0(
    plonk_constraint_system<FieldT>& cs,
    const sparse_maj_value<FieldT>& a) const
{
    const num<FieldT> combined = num<FieldT>::lc(
        cs, {FieldT::one(), FieldT::one(), FieldT::one()}, {a.rot2, a.rot13, a.rot22});
    return normalize(cs, combined, sha256_maj_xor_table, PLONKSHA_MAJORITY_BASE, maj_base_num_of_chunks);
}

}
