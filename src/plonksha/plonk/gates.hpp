#ifndef PLONKSHA_PLONK_GATES_HPP_
#define PLONKSHA_PLONK_GATES_HPP_

#include "plonksha/plonk/variable.hpp"

#include <array>
#include <string>
#include <vector>

namespace libplonksha {

template<typename FieldT>
using plonk_row_values = std::array<FieldT, PLONK_STATE_WIDTH>;

/**
 * A custom gate: a polynomial identity over the four wires of one trace step
 * (and optionally the wires of the following step), parameterized by
 * per-application selector coefficients.
 */
template<typename FieldT>
class plonk_gate {
public:
    virtual ~plonk_gate() {}

    virtual std::string name() const = 0;
    virtual size_t num_coefficients() const = 0;
    virtual bool uses_next_row() const { return false; }

    // `next` is only dereferenced when uses_next_row() holds
    virtual bool is_satisfied(const std::vector<FieldT>& coefficients,
                              const plonk_row_values<FieldT>& row,
                              const plonk_row_values<FieldT>* next) const = 0;
};

/**
 * The width-4 main gate with selectors in the order
 * [q_a, q_b, q_c, q_d, q_m, q_const, q_d_next]:
 *
 *   q_a*a + q_b*b + q_c*c + q_d*d + q_m*a*b + q_const + q_d_next*d_next = 0
 */
template<typename FieldT>
class main_gate : public plonk_gate<FieldT> {
public:
    static const size_t NUM_SELECTORS = 7;

    std::string name() const { return "main_gate_with_d_next"; }
    size_t num_coefficients() const { return NUM_SELECTORS; }
    bool uses_next_row() const { return true; }
    bool is_satisfied(const std::vector<FieldT>& coefficients,
                      const plonk_row_values<FieldT>& row,
                      const plonk_row_values<FieldT>* next) const;
};

/**
 * Checks that the row holds a chain of accumulators growing by one base-4
 * digit per wire: b - 4a, c - 4b, d - 4c and a_next - 4d are all in [0, 3].
 * Four consecutive rows starting from zero range check a 32-bit value that
 * ends up in the first wire of the fifth row.
 */
template<typename FieldT>
class range_check_32_gate : public plonk_gate<FieldT> {
public:
    std::string name() const { return "range_check_32_gate"; }
    size_t num_coefficients() const { return 0; }
    bool uses_next_row() const { return true; }
    bool is_satisfied(const std::vector<FieldT>& coefficients,
                      const plonk_row_values<FieldT>& row,
                      const plonk_row_values<FieldT>* next) const;
};

// wire `column` of the row is one of 0, 1, 2, 3
template<typename FieldT>
class in04_range_gate : public plonk_gate<FieldT> {
private:
    size_t column;
public:
    explicit in04_range_gate(size_t column);

    std::string name() const;
    size_t num_coefficients() const { return 0; }
    bool is_satisfied(const std::vector<FieldT>& coefficients,
                      const plonk_row_values<FieldT>& row,
                      const plonk_row_values<FieldT>* next) const;
};

}

#include "plonksha/plonk/gates.tcc"

#endif // PLONKSHA_PLONK_GATES_HPP_
