#include <gtest/gtest.h>

#include <stdexcept>

#include "plonksha/circuit/num.hpp"

#include "utils.h"

using namespace libplonksha;

TEST(num, constants)
{
    num<FieldT> c(FieldT(42));
    EXPECT_TRUE(c.is_constant());
    EXPECT_EQ(*c.get_value(), FieldT(42));

    plonk_constraint_system<FieldT> cs;
    num<FieldT> v = alloc_input(cs, 7);
    EXPECT_FALSE(v.is_constant());
    EXPECT_EQ(*v.get_value(), FieldT(7));
    EXPECT_EQ(cs.num_rows(), 0);
}

TEST(num, ternary_lc_eq)
{
    plonk_constraint_system<FieldT> cs;
    allocated_num<FieldT> a = alloc_input(cs, 3).get_allocated();
    allocated_num<FieldT> b = alloc_input(cs, 5).get_allocated();
    allocated_num<FieldT> c = alloc_input(cs, 7).get_allocated();
    allocated_num<FieldT> target = alloc_input(cs, 3 + 2 * 5 + 4 * 7).get_allocated();

    allocated_num<FieldT>::ternary_lc_eq(cs, {{FieldT(1), FieldT(2), FieldT(4)}}, {{a, b, c}}, target);
    EXPECT_EQ(cs.num_rows(), 1);
    EXPECT_TRUE(cs.is_satisfied());

    cs.set_value(b.get_variable(), FieldT(6));
    EXPECT_FALSE(cs.is_satisfied());
}

TEST(num, lc_eq_chains_rows)
{
    for (size_t num_terms = 1; num_terms <= 8; num_terms++) {
        plonk_constraint_system<FieldT> cs;
        std::vector<allocated_num<FieldT>> vars;
        std::vector<FieldT> coefficients;
        uint64_t total = 5;
        for (size_t i = 0; i < num_terms; i++) {
            vars.push_back(alloc_input(cs, 10 + i).get_allocated());
            coefficients.push_back(field_from_u64<FieldT>(uint64_t(1) << i));
            total += (10 + i) << i;
        }
        allocated_num<FieldT> target = alloc_input(cs, total).get_allocated();

        allocated_num<FieldT>::lc_eq(cs, coefficients, vars, target, FieldT(5));

        // explicit zero and one row per three terms
        EXPECT_EQ(cs.num_rows(), 1 + (num_terms + 2) / 3);
        EXPECT_TRUE(cs.is_satisfied()) << num_terms << " terms";

        cs.set_value(vars.back().get_variable(), FieldT(1000));
        EXPECT_FALSE(cs.is_satisfied()) << num_terms << " terms";
    }
}

TEST(num, lc_eq_rejects_mismatched_terms)
{
    plonk_constraint_system<FieldT> cs;
    allocated_num<FieldT> a = alloc_input(cs, 1).get_allocated();
    EXPECT_THROW(allocated_num<FieldT>::lc_eq(cs, {FieldT(1), FieldT(2)}, {a}, a), std::invalid_argument);
    EXPECT_THROW(allocated_num<FieldT>::lc_eq(cs, {}, {}, a), std::invalid_argument);
}

TEST(num, lc_folds_constants)
{
    plonk_constraint_system<FieldT> cs;

    num<FieldT> folded = num<FieldT>::lc(
        cs, {FieldT(1), FieldT(2), FieldT(3)}, {FieldT(1), FieldT(10), FieldT(100)});
    ASSERT_TRUE(folded.is_constant());
    EXPECT_EQ(folded.get_constant(), FieldT(321));
    EXPECT_EQ(cs.num_rows(), 0);

    num<FieldT> mixed = num<FieldT>::lc(
        cs, {FieldT(1), FieldT(2), FieldT(3)}, {FieldT(1), alloc_input(cs, 10), alloc_input(cs, 100)});
    ASSERT_FALSE(mixed.is_constant());
    EXPECT_EQ(*mixed.get_value(), FieldT(321));
    EXPECT_TRUE(cs.is_satisfied());

    cs.set_value(mixed.get_allocated().get_variable(), FieldT(320));
    EXPECT_FALSE(cs.is_satisfied());
}

TEST(num, lc_in_setup_mode)
{
    plonk_constraint_system<FieldT> cs(false);
    num<FieldT> sum = num<FieldT>::lc(
        cs, {FieldT(1), FieldT(1)}, {alloc_unknown(cs), alloc_unknown(cs)});
    EXPECT_FALSE(sum.get_value());
    EXPECT_EQ(cs.num_rows(), 2);
}
