#include <vector>

namespace libplonksha {

template<typename FieldT>
std::array<FieldT, 3> sha256_gadget_params<FieldT>::extract_32_from_constant(const FieldT& x)
{
    const uint64_t repr = field_low_u64(x);
    if (!field_fits_u64(x) || (repr >> (PLONKSHA_REG_WIDTH + 4)) != 0) {
        throw unsupported_overflow();
    }

    return {{
        field_from_u64<FieldT>(repr & 0xffffffff),
        field_from_u64<FieldT>((repr >> PLONKSHA_REG_WIDTH) & 3),
        field_from_u64<FieldT>(repr >> (PLONKSHA_REG_WIDTH + 2))
    }};
}

/*
 * Reduces a value below 2^36 to its low 32 bits.
 *
 * The low word is accumulated two bits at a time, a_k = x_32 >> (32 - 2k),
 * starting from a_0 = 0:
 *
 *   [a_0,  a_1,  a_2,  a_3 ]  range_check_32_gate
 *   [a_4,  a_5,  a_6,  a_7 ]  range_check_32_gate
 *   [a_8,  a_9,  a_10, a_11]  range_check_32_gate
 *   [a_12, a_13, a_14, a_15]  range_check_32_gate
 *   [a_16, of_l, of_h, x   ]  in04_range_gate(1), in04_range_gate(2),
 *                             a_16 + 2^32 * of_l + 2^34 * of_h - x = 0
 *
 * so a_16 = x mod 2^32.
 */
template<typename FieldT>
num<FieldT> sha256_gadget_params<FieldT>::extract_32_from_overflowed_num(
    plonk_constraint_system<FieldT>& cs,
    const num<FieldT>& var)
{
    if (var.is_constant()) {
        return num<FieldT>(extract_32_from_constant(var.get_constant())[0]);
    }

    const allocated_num<FieldT>& x = var.get_allocated();
    std::optional<uint64_t> repr;
    if (x.get_value()) {
        repr = field_low_u64(*x.get_value());
    }

    const size_t num_accumulators = PLONKSHA_REG_WIDTH / 2;
    std::vector<allocated_num<FieldT>> accumulators = {allocated_num<FieldT>::alloc_zero(cs)};
    for (size_t k = 1; k <= num_accumulators; k++) {
        accumulators.push_back(allocated_num<FieldT>::alloc(cs, [&repr, k]() {
            const uint64_t word = grab(repr) & 0xffffffff;
            return field_from_u64<FieldT>(word >> (PLONKSHA_REG_WIDTH - 2 * k));
        }));
    }

    const allocated_num<FieldT> of_l = allocated_num<FieldT>::alloc(cs, [&repr]() {
        return field_from_u64<FieldT>((grab(repr) >> PLONKSHA_REG_WIDTH) & 3);
    });
    const allocated_num<FieldT> of_h = allocated_num<FieldT>::alloc(cs, [&repr]() {
        return field_from_u64<FieldT>(grab(repr) >> (PLONKSHA_REG_WIDTH + 2));
    });

    for (size_t i = 0; i < num_accumulators / 4; i++) {
        cs.new_single_gate_for_trace_step(
            range_check_32_gate<FieldT>(),
            {},
            {{accumulators[4 * i].get_variable(), accumulators[4 * i + 1].get_variable(),
              accumulators[4 * i + 2].get_variable(), accumulators[4 * i + 3].get_variable()}}
        );
    }

    const allocated_num<FieldT>& extracted = accumulators[num_accumulators];
    const plonk_wires wires = {{extracted.get_variable(), of_l.get_variable(), of_h.get_variable(), x.get_variable()}};
    const FieldT zero = FieldT::zero();

    cs.begin_gates_batch_for_step();
    cs.new_gate_in_batch(in04_range_gate<FieldT>(1), {}, wires);
    cs.new_gate_in_batch(in04_range_gate<FieldT>(2), {}, wires);
    cs.new_gate_in_batch(
        main_gate<FieldT>(),
        {FieldT::one(), u64_exp_to_ff<FieldT>(2, PLONKSHA_REG_WIDTH), u64_exp_to_ff<FieldT>(2, PLONKSHA_REG_WIDTH + 2),
         -FieldT::one(), zero, zero, zero},
        wires
    );
    cs.end_gates_batch_for_step();

    return num<FieldT>(extracted);
}

}
