#ifndef PLONKSHA_PLONK_LOOKUP_TABLE_HPP_
#define PLONKSHA_PLONK_LOOKUP_TABLE_HPP_

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "plonksha/PlonkSha.h"

namespace libplonksha {

/**
 * A lookup table with one key column and two value columns. The keys are
 * exactly the integers [0, size()), so rows are stored by key. Tables with a
 * single output keep zero in the last column.
 *
 * Tables are immutable once built and are handed out as
 * std::shared_ptr<const lookup_table<FieldT>>.
 */
template<typename FieldT>
class lookup_table {
private:
    std::string table_name;
    size_t arity;
    std::vector<std::array<FieldT, PLONKSHA_LOOKUP_TABLE_WIDTH - 1>> entries;

protected:
    lookup_table(const std::string& name, size_t output_arity);

    // rows have to be pushed in the order of their keys
    void push_row(const FieldT& first, const FieldT& second);
    void reserve_rows(size_t num_rows);

public:
    virtual ~lookup_table() {}

    const std::string& name() const { return table_name; }
    size_t width() const { return PLONKSHA_LOOKUP_TABLE_WIDTH; }
    size_t output_arity() const { return arity; }
    size_t size() const { return entries.size(); }

    bool is_valid_key(const FieldT& key) const;

    // returns width() - 1 values, throws table_domain_error outside the domain
    std::vector<FieldT> query(const std::vector<FieldT>& keys) const;

    // checks a full [key, value, value] row
    bool contains(const std::vector<FieldT>& row) const;
};

template<typename FieldT>
using lookup_table_handle = std::shared_ptr<const lookup_table<FieldT>>;

}

#include "plonksha/plonk/lookup_table.tcc"

#endif // PLONKSHA_PLONK_LOOKUP_TABLE_HPP_
