#include <cassert>
#include <stdexcept>
#include <string>

namespace libplonksha {

template<typename FieldT>
bool is_in_04_range(const FieldT& x)
{
    FieldT candidate = FieldT::zero();
    for (size_t i = 0; i < 4; i++) {
        if (x == candidate) {
            return true;
        }
        candidate += FieldT::one();
    }
    return false;
}

template<typename FieldT>
bool main_gate<FieldT>::is_satisfied(
    const std::vector<FieldT>& coefficients,
    const plonk_row_values<FieldT>& row,
    const plonk_row_values<FieldT>* next) const
{
    assert(coefficients.size() == NUM_SELECTORS);

    FieldT acc = coefficients[0] * row[0]
               + coefficients[1] * row[1]
               + coefficients[2] * row[2]
               + coefficients[3] * row[3]
               + coefficients[4] * row[0] * row[1]
               + coefficients[5];

    if (!coefficients[6].is_zero()) {
        if (next == nullptr) {
            return false;
        }
        acc += coefficients[6] * (*next)[3];
    }

    return acc.is_zero();
}

template<typename FieldT>
bool range_check_32_gate<FieldT>::is_satisfied(
    const std::vector<FieldT>& coefficients,
    const plonk_row_values<FieldT>& row,
    const plonk_row_values<FieldT>* next) const
{
    if (next == nullptr) {
        return false;
    }

    const FieldT four = FieldT(4);
    return is_in_04_range(row[1] - four * row[0])
        && is_in_04_range(row[2] - four * row[1])
        && is_in_04_range(row[3] - four * row[2])
        && is_in_04_range((*next)[0] - four * row[3]);
}

template<typename FieldT>
in04_range_gate<FieldT>::in04_range_gate(size_t column) : column(column)
{
    if (column >= PLONK_STATE_WIDTH) {
        throw std::invalid_argument("range gate column is out of the state width");
    }
}

template<typename FieldT>
std::string in04_range_gate<FieldT>::name() const
{
    return "in04_range_gate_" + std::to_string(column);
}

template<typename FieldT>
bool in04_range_gate<FieldT>::is_satisfied(
    const std::vector<FieldT>& coefficients,
    const plonk_row_values<FieldT>& row,
    const plonk_row_values<FieldT>* next) const
{
    return is_in_04_range(row[column]);
}

}
