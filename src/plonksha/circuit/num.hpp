#ifndef PLONKSHA_CIRCUIT_NUM_HPP_
#define PLONKSHA_CIRCUIT_NUM_HPP_

#include <array>
#include <functional>
#include <optional>
#include <variant>
#include <vector>

#include "plonksha/plonk/constraint_system.hpp"

namespace libplonksha {

template<typename FieldT>
FieldT grab(const std::optional<FieldT>& value);

/**
 * A variable of the constraint system together with its witness value.
 * The value is empty whenever the circuit is laid out without a
 * witness.
 */
template<typename FieldT>
class allocated_num {
private:
    plonk_variable variable;
    std::optional<FieldT> value;

    allocated_num(const plonk_variable& variable, const std::optional<FieldT>& value)
        : variable(variable), value(value) {}

public:
    static allocated_num alloc(plonk_constraint_system<FieldT>& cs,
                               const std::function<FieldT()>& value);
    static allocated_num alloc_zero(plonk_constraint_system<FieldT>& cs);

    const plonk_variable& get_variable() const { return variable; }
    const std::optional<FieldT>& get_value() const { return value; }

    // coefficients[0] * vars[0] + coefficients[1] * vars[1] + coefficients[2] * vars[2] == target
    static void ternary_lc_eq(plonk_constraint_system<FieldT>& cs,
                              const std::array<FieldT, 3>& coefficients,
                              const std::array<allocated_num, 3>& vars,
                              const allocated_num& target);

    // sum_i coefficients[i] * vars[i] + constant == target, for any number of terms
    static void lc_eq(plonk_constraint_system<FieldT>& cs,
                      const std::vector<FieldT>& coefficients,
                      const std::vector<allocated_num>& vars,
                      const allocated_num& target,
                      const FieldT& constant = FieldT::zero());
};

/**
 * A circuit value: either a constant known when the circuit is compiled or
 * an allocated variable. Arithmetic on constants never touches the
 * constraint system.
 */
template<typename FieldT>
class num {
private:
    std::variant<FieldT, allocated_num<FieldT>> repr;

public:
    num(const FieldT& constant) : repr(constant) {}
    num(const allocated_num<FieldT>& allocated) : repr(allocated) {}

    bool is_constant() const { return repr.index() == 0; }
    const FieldT& get_constant() const { return std::get<FieldT>(repr); }
    const allocated_num<FieldT>& get_allocated() const { return std::get<allocated_num<FieldT>>(repr); }

    std::optional<FieldT> get_value() const;

    static num lc(plonk_constraint_system<FieldT>& cs,
                  const std::vector<FieldT>& coefficients,
                  const std::vector<num>& nums);
};

}

#include "plonksha/circuit/num.tcc"

#endif // PLONKSHA_CIRCUIT_NUM_HPP_
