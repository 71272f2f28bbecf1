#include <boost/format.hpp>

namespace libplonksha {

/*
 * Maps a sparse accumulator back to a binary word. The 32 digits of the
 * input are cut into slices of num_chunks digits, every slice is looked up
 * in a table keyed by base^num_chunks values and the table outputs are glued
 * with powers of two:
 *
 *   input  = sum_j slice_j * base^(num_chunks * j)
 *   output = sum_j table(slice_j) * 2^(num_chunks * j)
 */
template<typename FieldT>
num<FieldT> sha256_gadget_params<FieldT>::normalize(
    plonk_constraint_system<FieldT>& cs,
    const num<FieldT>& input,
    const lookup_table_handle<FieldT>& table,
    uint64_t base,
    size_t num_chunks)
{
    if (num_chunks == 0 || num_chunks > PLONKSHA_REG_WIDTH || base < 2) {
        throw std::invalid_argument("unsupported normalization parameters");
    }

    uint64_t slice_base = 1;
    for (size_t i = 0; i < num_chunks; i++) {
        if (slice_base > PLONKSHA_MAX_TABLE_ROWS / base) {
            throw std::invalid_argument("normalization slices are too wide");
        }
        slice_base *= base;
    }
    if (table->size() != slice_base || table->output_arity() != 1) {
        throw std::invalid_argument((boost::format("table %s does not hold %d digits of base %d")
                                     % table->name() % num_chunks % base).str());
    }

    const size_t num_slices = (PLONKSHA_REG_WIDTH + num_chunks - 1) / num_chunks;

    if (input.is_constant()) {
        std::vector<uint64_t> chunks;
        if (!split_into_chunks(input.get_constant(), slice_base, num_slices, chunks)) {
            throw table_domain_error(table->name());
        }

        FieldT result = FieldT::zero();
        for (size_t j = 0; j < num_slices; j++) {
            const FieldT normalized = table->query({field_from_u64<FieldT>(chunks[j])})[0];
            result += normalized * field_from_u64<FieldT>(uint64_t(1) << (num_chunks * j));
        }
        return num<FieldT>(result);
    }

    const allocated_num<FieldT>& x = input.get_allocated();
    std::optional<std::vector<uint64_t>> chunk_values;
    if (x.get_value()) {
        std::vector<uint64_t> chunks;
        if (!split_into_chunks(*x.get_value(), slice_base, num_slices, chunks)) {
            throw table_domain_error(table->name());
        }
        chunk_values = chunks;
    }

    std::vector<allocated_num<FieldT>> slices;
    std::vector<allocated_num<FieldT>> outputs;
    std::vector<FieldT> slice_coefficients;
    std::vector<FieldT> output_coefficients;
    for (size_t j = 0; j < num_slices; j++) {
        slices.push_back(allocated_num<FieldT>::alloc(cs, [&chunk_values, j]() {
            return field_from_u64<FieldT>(grab(chunk_values)[j]);
        }));
        outputs.push_back(query_table1(cs, table, slices.back()));
        slice_coefficients.push_back(u64_exp_to_ff<FieldT>(slice_base, j));
        output_coefficients.push_back(field_from_u64<FieldT>(uint64_t(1) << (num_chunks * j)));
    }

    allocated_num<FieldT>::lc_eq(cs, slice_coefficients, slices, x);

    std::optional<FieldT> result_value = FieldT::zero();
    for (size_t j = 0; j < num_slices && result_value; j++) {
        if (outputs[j].get_value()) {
            *result_value += output_coefficients[j] * *outputs[j].get_value();
        } else {
            result_value = std::nullopt;
        }
    }

    const allocated_num<FieldT> result = allocated_num<FieldT>::alloc(cs, [&result_value]() {
        return grab(result_value);
    });
    allocated_num<FieldT>::lc_eq(cs, output_coefficients, outputs, result);

    return num<FieldT>(result);
}

}
