#include <stdexcept>

#include "plonksha/SynthesisError.hpp"

namespace libplonksha {

template<typename FieldT>
FieldT grab(const std::optional<FieldT>& value)
{
    if (!value) {
        throw assignment_missing();
    }
    return *value;
}

template<typename FieldT>
allocated_num<FieldT> allocated_num<FieldT>::alloc(
    plonk_constraint_system<FieldT>& cs,
    const std::function<FieldT()>& value)
{
    plonk_variable var = cs.alloc(value);
    return allocated_num(var, cs.get_value(var));
}

template<typename FieldT>
allocated_num<FieldT> allocated_num<FieldT>::alloc_zero(plonk_constraint_system<FieldT>& cs)
{
    plonk_variable var = cs.get_explicit_zero();
    return allocated_num(var, cs.get_value(var));
}

template<typename FieldT>
void allocated_num<FieldT>::ternary_lc_eq(
    plonk_constraint_system<FieldT>& cs,
    const std::array<FieldT, 3>& coefficients,
    const std::array<allocated_num, 3>& vars,
    const allocated_num& target)
{
    const FieldT zero = FieldT::zero();

    cs.new_single_gate_for_trace_step(
        main_gate<FieldT>(),
        {coefficients[0], coefficients[1], coefficients[2], -FieldT::one(), zero, zero, zero},
        {{vars[0].variable, vars[1].variable, vars[2].variable, target.variable}}
    );
}

template<typename FieldT>
void allocated_num<FieldT>::lc_eq(
    plonk_constraint_system<FieldT>& cs,
    const std::vector<FieldT>& coefficients,
    const std::vector<allocated_num>& vars,
    const allocated_num& target,
    const FieldT& constant)
{
    if (coefficients.size() != vars.size() || vars.empty()) {
        throw std::invalid_argument("linear combination needs one coefficient per variable");
    }

    // Three terms fit into a step, and the rest of the sum is carried to the
    // next step through its d wire:
    //
    //   row j: [v_3j, v_3j+1, v_3j+2, r_j],  r_0 = target
    //          c_a*a + c_b*b + c_c*c (+ constant) - r_j + r_{j+1} = 0
    //
    // The last row has no carry.
    const FieldT zero = FieldT::zero();
    const FieldT one = FieldT::one();
    const allocated_num padding = alloc_zero(cs);
    const size_t num_rows = (vars.size() + 2) / 3;

    std::vector<std::array<allocated_num, 3>> terms;
    std::vector<std::array<FieldT, 3>> coeffs;
    for (size_t j = 0; j < num_rows; j++) {
        std::array<allocated_num, 3> row_terms = {{padding, padding, padding}};
        std::array<FieldT, 3> row_coeffs = {{zero, zero, zero}};
        for (size_t k = 0; k < 3 && 3 * j + k < vars.size(); k++) {
            row_terms[k] = vars[3 * j + k];
            row_coeffs[k] = coefficients[3 * j + k];
        }
        terms.push_back(row_terms);
        coeffs.push_back(row_coeffs);
    }

    // the carries are allocated upfront so that the rows stay adjacent
    std::vector<allocated_num> carries = {target};
    for (size_t j = 0; j + 1 < num_rows; j++) {
        std::optional<FieldT> carry;
        bool known = static_cast<bool>(carries[j].value);
        FieldT partial = (j == 0) ? constant : zero;
        for (size_t k = 0; k < 3; k++) {
            known = known && static_cast<bool>(terms[j][k].value);
            if (known) {
                partial += coeffs[j][k] * *terms[j][k].value;
            }
        }
        if (known) {
            carry = *carries[j].value - partial;
        }
        carries.push_back(alloc(cs, [&carry]() { return grab(carry); }));
    }

    for (size_t j = 0; j < num_rows; j++) {
        const bool has_carry = (j + 1 < num_rows);
        cs.new_single_gate_for_trace_step(
            main_gate<FieldT>(),
            {coeffs[j][0], coeffs[j][1], coeffs[j][2], -one, zero,
             (j == 0) ? constant : zero, has_carry ? one : zero},
            {{terms[j][0].variable, terms[j][1].variable, terms[j][2].variable, carries[j].variable}}
        );
    }
}

template<typename FieldT>
std::optional<FieldT> num<FieldT>::get_value() const
{
    if (is_constant()) {
        return get_constant();
    }
    return get_allocated().get_value();
}

template<typename FieldT>
num<FieldT> num<FieldT>::lc(
    plonk_constraint_system<FieldT>& cs,
    const std::vector<FieldT>& coefficients,
    const std::vector<num>& nums)
{
    if (coefficients.size() != nums.size()) {
        throw std::invalid_argument("linear combination needs one coefficient per term");
    }

    FieldT constant = FieldT::zero();
    std::vector<FieldT> var_coeffs;
    std::vector<allocated_num<FieldT>> vars;
    for (size_t i = 0; i < nums.size(); i++) {
        if (nums[i].is_constant()) {
            constant += coefficients[i] * nums[i].get_constant();
        } else {
            var_coeffs.push_back(coefficients[i]);
            vars.push_back(nums[i].get_allocated());
        }
    }

    if (vars.empty()) {
        return num(constant);
    }

    std::optional<FieldT> sum = constant;
    for (size_t i = 0; i < vars.size() && sum; i++) {
        if (vars[i].get_value()) {
            *sum += var_coeffs[i] * *vars[i].get_value();
        } else {
            sum = std::nullopt;
        }
    }

    allocated_num<FieldT> result = allocated_num<FieldT>::alloc(cs, [&sum]() { return grab(sum); });
    allocated_num<FieldT>::lc_eq(cs, var_coeffs, vars, result, constant);

    return num(result);
}

}
