#include "plonksha/SynthesisError.hpp"
#include "plonksha/field_utils.hpp"

namespace libplonksha {

template<typename FieldT>
lookup_table<FieldT>::lookup_table(const std::string& name, size_t output_arity)
    : table_name(name), arity(output_arity)
{
    if (output_arity == 0 || output_arity >= PLONKSHA_LOOKUP_TABLE_WIDTH) {
        throw table_registration_error("unsupported output arity for lookup table " + name);
    }
}

template<typename FieldT>
void lookup_table<FieldT>::push_row(const FieldT& first, const FieldT& second)
{
    if (arity == 1 && !second.is_zero()) {
        throw std::logic_error("single output table " + table_name + " got a second value");
    }
    entries.push_back({{first, second}});
}

template<typename FieldT>
void lookup_table<FieldT>::reserve_rows(size_t num_rows)
{
    if (num_rows == 0 || num_rows > PLONKSHA_MAX_TABLE_ROWS) {
        throw table_registration_error("unsupported size for lookup table " + table_name);
    }
    entries.reserve(num_rows);
}

template<typename FieldT>
bool lookup_table<FieldT>::is_valid_key(const FieldT& key) const
{
    return field_fits_u64(key) && field_low_u64(key) < entries.size();
}

template<typename FieldT>
std::vector<FieldT> lookup_table<FieldT>::query(const std::vector<FieldT>& keys) const
{
    if (keys.size() != 1 || !is_valid_key(keys[0])) {
        throw table_domain_error(table_name);
    }

    const auto& entry = entries[field_low_u64(keys[0])];
    return std::vector<FieldT>(entry.begin(), entry.end());
}

template<typename FieldT>
bool lookup_table<FieldT>::contains(const std::vector<FieldT>& row) const
{
    if (row.size() != width() || !is_valid_key(row[0])) {
        return false;
    }

    const auto& entry = entries[field_low_u64(row[0])];
    return entry[0] == row[1] && entry[1] == row[2];
}

}
