#ifndef PLONKSHA_PLONK_VARIABLE_HPP_
#define PLONKSHA_PLONK_VARIABLE_HPP_

#include <array>
#include <cstddef>

namespace libplonksha {

typedef size_t var_index_t;

/**
 * Handle to a witness slot of a plonk_constraint_system. The handle carries
 * no value; values live in the constraint system.
 */
class plonk_variable {
public:
    var_index_t index;

    plonk_variable() : index(0) {}
    explicit plonk_variable(var_index_t index) : index(index) {}

    bool operator==(const plonk_variable& other) const { return index == other.index; }
    bool operator!=(const plonk_variable& other) const { return index != other.index; }
};

// every step of the trace spans four wires (a, b, c, d)
static const size_t PLONK_STATE_WIDTH = 4;

typedef std::array<plonk_variable, PLONK_STATE_WIDTH> plonk_wires;

}

#endif // PLONKSHA_PLONK_VARIABLE_HPP_
