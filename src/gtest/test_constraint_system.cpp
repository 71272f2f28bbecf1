#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "plonksha/SynthesisError.hpp"
#include "plonksha/circuit/sha256_tables.hpp"
#include "plonksha/plonk/constraint_system.hpp"

#include "utils.h"

using namespace libplonksha;

namespace {

lookup_table_handle<FieldT> small_xor_table()
{
    // 16 rows: two base-4 digits
    return std::make_shared<const sha256_normalization_table<FieldT>>(4, 2, "small_xor_table");
}

std::vector<FieldT> main_gate_coefficients(int a, int b, int c, int d, int m, int constant, int d_next)
{
    return {FieldT(a), FieldT(b), FieldT(c), FieldT(d), FieldT(m), FieldT(constant), FieldT(d_next)};
}

}

TEST(constraint_system, explicit_zero)
{
    plonk_constraint_system<FieldT> cs;
    EXPECT_EQ(cs.num_rows(), 0);

    plonk_variable zero = cs.get_explicit_zero();
    EXPECT_EQ(cs.num_rows(), 1);
    EXPECT_EQ(cs.get_explicit_zero(), zero);
    EXPECT_EQ(cs.num_rows(), 1);
    EXPECT_EQ(*cs.get_value(zero), FieldT::zero());
    EXPECT_TRUE(cs.is_satisfied());

    cs.set_value(zero, FieldT::one());
    EXPECT_FALSE(cs.is_satisfied());
}

TEST(constraint_system, setup_mode_never_evaluates_closures)
{
    plonk_constraint_system<FieldT> cs(false);
    size_t calls = 0;
    plonk_variable var = cs.alloc([&calls]() { calls++; return FieldT::one(); });

    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(cs.get_value(var));
    EXPECT_EQ(cs.num_variables(), 1);

    // the explicit zero is public and keeps its value
    EXPECT_TRUE(cs.get_value(cs.get_explicit_zero()));
}

TEST(constraint_system, missing_assignment)
{
    plonk_constraint_system<FieldT> cs;
    EXPECT_THROW(alloc_unknown(cs), assignment_missing);
}

TEST(constraint_system, main_gate)
{
    plonk_constraint_system<FieldT> cs;
    plonk_variable a = cs.alloc([]() { return FieldT(3); });
    plonk_variable b = cs.alloc([]() { return FieldT(5); });
    plonk_variable c = cs.alloc([]() { return FieldT(2); });
    plonk_variable d = cs.alloc([]() { return FieldT(28); });

    // 3*5 + 3 + 2*5 - 28 = 0
    cs.new_single_gate_for_trace_step(main_gate<FieldT>(), main_gate_coefficients(1, 2, 0, -1, 1, 0, 0), {{a, b, c, d}});
    EXPECT_TRUE(cs.is_satisfied());
    EXPECT_EQ(cs.num_gates(), 1);

    cs.set_value(d, FieldT(27));
    EXPECT_FALSE(cs.is_satisfied());
}

TEST(constraint_system, main_gate_uses_next_row)
{
    plonk_constraint_system<FieldT> cs;
    plonk_variable a = cs.alloc([]() { return FieldT(4); });
    plonk_variable carry = cs.alloc([]() { return FieldT(6); });
    plonk_variable total = cs.alloc([]() { return FieldT(10); });

    // a - total + d_next = 0, then carry - d = 0
    cs.new_single_gate_for_trace_step(main_gate<FieldT>(), main_gate_coefficients(1, 0, 0, -1, 0, 0, 1), {{a, a, a, total}});
    EXPECT_FALSE(cs.is_satisfied());

    cs.new_single_gate_for_trace_step(main_gate<FieldT>(), main_gate_coefficients(1, 0, 0, -1, 0, 0, 0), {{carry, carry, carry, carry}});
    EXPECT_TRUE(cs.is_satisfied());
}

TEST(constraint_system, range_gates)
{
    plonk_constraint_system<FieldT> cs;
    std::vector<plonk_variable> vars;
    // accumulators of the 2-bit digits 3, 2, 1, 0
    const int accumulated[] = {0, 3, 14, 57, 228};
    for (int value : accumulated) {
        vars.push_back(cs.alloc([value]() { return FieldT(value); }));
    }
    plonk_variable three = cs.alloc([]() { return FieldT(3); });

    cs.new_single_gate_for_trace_step(range_check_32_gate<FieldT>(), {}, {{vars[0], vars[1], vars[2], vars[3]}});
    // the range check looks at the next row
    EXPECT_FALSE(cs.is_satisfied());

    cs.begin_gates_batch_for_step();
    cs.new_gate_in_batch(in04_range_gate<FieldT>(1), {}, {{vars[4], three, three, three}});
    cs.new_gate_in_batch(in04_range_gate<FieldT>(3), {}, {{vars[4], three, three, three}});
    cs.end_gates_batch_for_step();
    EXPECT_TRUE(cs.is_satisfied());

    cs.set_value(vars[4], FieldT(232));
    EXPECT_FALSE(cs.is_satisfied());
    cs.set_value(vars[4], FieldT(228));
    cs.set_value(three, FieldT(4));
    EXPECT_FALSE(cs.is_satisfied());

    EXPECT_THROW(in04_range_gate<FieldT>(4), std::invalid_argument);
}

TEST(constraint_system, batch_protocol)
{
    plonk_constraint_system<FieldT> cs;
    plonk_variable zero = cs.get_explicit_zero();
    plonk_variable one = cs.alloc([]() { return FieldT::one(); });

    EXPECT_THROW(cs.end_gates_batch_for_step(), std::logic_error);
    EXPECT_THROW(cs.new_gate_in_batch(in04_range_gate<FieldT>(0), {}, {{one, one, one, one}}), std::logic_error);

    cs.begin_gates_batch_for_step();
    EXPECT_THROW(cs.begin_gates_batch_for_step(), std::logic_error);
    // a closed step needs its wires
    EXPECT_THROW(cs.end_gates_batch_for_step(), std::logic_error);

    cs.new_gate_in_batch(in04_range_gate<FieldT>(0), {}, {{one, one, one, one}});
    EXPECT_THROW(cs.new_gate_in_batch(in04_range_gate<FieldT>(0), {}, {{zero, one, one, one}}), std::logic_error);
    EXPECT_THROW(cs.new_gate_in_batch(main_gate<FieldT>(), {FieldT::one()}, {{one, one, one, one}}), std::logic_error);
    cs.end_gates_batch_for_step();

    EXPECT_EQ(cs.num_rows(), 2);
    EXPECT_TRUE(cs.is_satisfied());
}

TEST(constraint_system, lookup_gate)
{
    plonk_constraint_system<FieldT> cs;
    lookup_table_handle<FieldT> table = small_xor_table();
    plonk_variable zero = cs.get_explicit_zero();

    // 0x9 = digits (1, 2) -> bits (1, 0)
    plonk_variable key = cs.alloc([]() { return FieldT(9); });
    plonk_variable value = cs.alloc([]() { return FieldT(1); });

    cs.begin_gates_batch_for_step();
    cs.allocate_variables_without_gate({{key, value, zero, zero}});
    EXPECT_THROW(cs.apply_single_lookup_gate({key, value, zero}, table), std::logic_error);
    cs.end_gates_batch_for_step();

    EXPECT_EQ(cs.add_table(table), table);
    EXPECT_EQ(cs.get_table("small_xor_table"), table);
    EXPECT_EQ(cs.num_tables(), 1);

    cs.begin_gates_batch_for_step();
    cs.allocate_variables_without_gate({{key, value, zero, zero}});
    EXPECT_THROW(cs.apply_single_lookup_gate({key, zero, value}, table), std::logic_error);
    EXPECT_THROW(cs.apply_single_lookup_gate({key, value}, table), std::logic_error);
    cs.apply_single_lookup_gate({key, value, zero}, table);
    cs.end_gates_batch_for_step();

    EXPECT_EQ(cs.num_lookups(), 1);
    EXPECT_TRUE(cs.is_satisfied());

    cs.set_value(value, FieldT(3));
    EXPECT_FALSE(cs.is_satisfied());
}

TEST(constraint_system, table_registration)
{
    plonk_constraint_system<FieldT> cs;
    cs.add_table(small_xor_table());

    EXPECT_THROW(cs.add_table(small_xor_table()), table_registration_error);
    EXPECT_THROW(cs.add_table(lookup_table_handle<FieldT>()), table_registration_error);
    EXPECT_THROW(cs.get_table("sha256_ch_xor_table"), std::out_of_range);
    EXPECT_EQ(cs.num_tables(), 1);
}
