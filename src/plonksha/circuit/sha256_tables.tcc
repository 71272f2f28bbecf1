#include <boost/format.hpp>

#include "libsnark/common/profiling.hpp"

#include "plonksha/PlonkSha.h"
#include "plonksha/SynthesisError.hpp"
#include "plonksha/field_utils.hpp"
#include "plonksha/util.h"

namespace libplonksha {

template<typename FieldT>
sha256_sparse_rotate_table<FieldT>::sha256_sparse_rotate_table(
    size_t bits, size_t rotation, size_t extraction, uint64_t base, const std::string& name)
    : lookup_table<FieldT>(name, 2)
{
    if (bits == 0 || bits > PLONKSHA_REG_WIDTH || extraction > bits || base < 2) {
        throw table_registration_error("unsupported parameters for table " + name);
    }

    const uint64_t num_rows = uint64_t(1) << bits;
    if (num_rows > PLONKSHA_MAX_TABLE_ROWS) {
        throw table_registration_error((boost::format("table %s would have %d rows") % name % num_rows).str());
    }

    libsnark::enter_block("Build " + name);

    this->reserve_rows(num_rows);
    for (uint64_t key = 0; key < num_rows; key++) {
        const uint64_t extracted = (extraction > 0) ? rotateExtract(key, 0, extraction) : key;
        this->push_row(
            map_into_sparse_form<FieldT>(extracted, base),
            map_into_sparse_form<FieldT>(rotateExtract(key, rotation, extraction), base)
        );
    }

    libsnark::leave_block("Build " + name);
}

template<typename FieldT>
sha256_digit_reduction_table<FieldT>::sha256_digit_reduction_table(
    uint64_t base, size_t num_chunks, uint64_t (*digit_function)(uint64_t), const std::string& name)
    : lookup_table<FieldT>(name, 1)
{
    if (base < 2 || num_chunks == 0 || num_chunks > PLONKSHA_REG_WIDTH) {
        throw table_registration_error("unsupported parameters for table " + name);
    }

    uint64_t num_rows = 1;
    for (size_t i = 0; i < num_chunks; i++) {
        if (num_rows > PLONKSHA_MAX_TABLE_ROWS / base) {
            throw table_registration_error(
                (boost::format("table %s with %d digits of base %d is too large") % name % num_chunks % base).str());
        }
        num_rows *= base;
    }

    libsnark::enter_block("Build " + name);

    this->reserve_rows(num_rows);
    for (uint64_t key = 0; key < num_rows; key++) {
        const std::vector<uint64_t> digits = convertIntToDigits(key, base, num_chunks);
        uint64_t normalized = 0;
        for (size_t i = 0; i < num_chunks; i++) {
            normalized |= digit_function(digits[i]) << i;
        }
        this->push_row(field_from_u64<FieldT>(normalized), FieldT::zero());
    }

    libsnark::leave_block("Build " + name);
}

template<typename FieldT>
sha256_choose_table<FieldT>::sha256_choose_table(size_t num_chunks, const std::string& name)
    : sha256_digit_reduction_table<FieldT>(PLONKSHA_CHOOSE_BASE, num_chunks, chooseDigit, name)
{
}

template<typename FieldT>
sha256_majority_table<FieldT>::sha256_majority_table(size_t num_chunks, const std::string& name)
    : sha256_digit_reduction_table<FieldT>(PLONKSHA_MAJORITY_BASE, num_chunks, majorityDigit, name)
{
}

template<typename FieldT>
sha256_normalization_table<FieldT>::sha256_normalization_table(
    uint64_t base, size_t num_chunks, const std::string& name)
    : sha256_digit_reduction_table<FieldT>(base, num_chunks, xorDigit, name)
{
}

}
