#include <gtest/gtest.h>

#include "plonksha/PlonkSha.h"
#include "plonksha/SynthesisError.hpp"
#include "plonksha/circuit/sha256_tables.hpp"
#include "plonksha/util.h"

#include "utils.h"

using namespace libplonksha;

TEST(sha256_tables, rotate_table)
{
    sha256_sparse_rotate_table<FieldT> table(PLONKSHA_GADGET_CHUNK_SIZE, 6, 0, 7, "rot6");
    EXPECT_EQ(table.name(), "rot6");
    EXPECT_EQ(table.size(), 2048);
    EXPECT_EQ(table.width(), 3);
    EXPECT_EQ(table.output_arity(), 2);

    for (uint64_t key : {0, 1, 63, 64, 1024, 1537, 2047}) {
        std::vector<FieldT> values = table.query({field_from_u64<FieldT>(key)});
        ASSERT_EQ(values.size(), 2);
        EXPECT_EQ(decode_sparse(values[0], 7), key);
        EXPECT_EQ(decode_sparse(values[1], 7), rotateRight32(key, 6));
        EXPECT_TRUE(table.contains({field_from_u64<FieldT>(key), values[0], values[1]}));
        if (key != 0) {
            EXPECT_FALSE(table.contains({field_from_u64<FieldT>(key), values[1], values[0]}));
        }
    }

    EXPECT_FALSE(table.is_valid_key(FieldT(2048)));
    EXPECT_THROW(table.query({FieldT(2048)}), table_domain_error);
    EXPECT_THROW(table.query({-FieldT::one()}), table_domain_error);
}

TEST(sha256_tables, extraction_drops_the_top_bit)
{
    sha256_sparse_rotate_table<FieldT> table(PLONKSHA_GADGET_CHUNK_SIZE, 2, PLONKSHA_GADGET_CHUNK_SIZE - 1, 4, "rot2_extr10");

    for (uint64_t key : {0, 5, 1023}) {
        std::vector<FieldT> low = table.query({field_from_u64<FieldT>(key)});
        std::vector<FieldT> high = table.query({field_from_u64<FieldT>(key + 1024)});
        EXPECT_EQ(low, high);
        EXPECT_EQ(decode_sparse(low[0], 4), key);
        EXPECT_EQ(decode_sparse(low[1], 4), rotateRight32(key, 2));
    }
}

TEST(sha256_tables, normalization_tables)
{
    sha256_choose_table<FieldT> ch(PLONKSHA_CH_BASE_DEFAULT_NUM_OF_CHUNKS, "ch");
    sha256_majority_table<FieldT> maj(PLONKSHA_MAJ_BASE_DEFAULT_NUM_OF_CHUNKS, "maj");
    sha256_normalization_table<FieldT> ch_xor(7, PLONKSHA_CH_BASE_DEFAULT_NUM_OF_CHUNKS, "ch_xor");
    sha256_normalization_table<FieldT> maj_xor(4, PLONKSHA_MAJ_BASE_DEFAULT_NUM_OF_CHUNKS, "maj_xor");

    EXPECT_EQ(ch.size(), 2401);
    EXPECT_EQ(maj.size(), 4096);
    EXPECT_EQ(ch_xor.size(), 2401);
    EXPECT_EQ(maj_xor.size(), 4096);
    EXPECT_EQ(ch.output_arity(), 1);

    // digits 3, 5, 0, 6 in base 7
    const uint64_t ch_key = 3 + 5 * 7 + 0 * 49 + 6 * 343;
    EXPECT_EQ(ch.query({field_from_u64<FieldT>(ch_key)}), std::vector<FieldT>({FieldT(1 + 2 + 8), FieldT::zero()}));
    EXPECT_EQ(ch_xor.query({field_from_u64<FieldT>(ch_key)})[0], FieldT(1 + 2));

    // digits 0, 1, 2, 3, 2, 1 in base 4
    const uint64_t maj_key = convertDigitsToInt({0, 1, 2, 3, 2, 1}, 4);
    EXPECT_EQ(maj.query({field_from_u64<FieldT>(maj_key)})[0], FieldT(4 + 8 + 16));
    EXPECT_EQ(maj_xor.query({field_from_u64<FieldT>(maj_key)})[0], FieldT(2 + 8 + 32));

    EXPECT_TRUE(ch.contains({field_from_u64<FieldT>(ch_key), FieldT(11), FieldT::zero()}));
    EXPECT_FALSE(ch.contains({field_from_u64<FieldT>(ch_key), FieldT(11), FieldT::one()}));
    EXPECT_THROW(ch.query({FieldT(2401)}), table_domain_error);
}

TEST(sha256_tables, unsupported_parameters)
{
    EXPECT_THROW(sha256_choose_table<FieldT>(0, "empty"), table_registration_error);
    EXPECT_THROW(sha256_majority_table<FieldT>(13, "huge"), table_registration_error);
    EXPECT_THROW(sha256_sparse_rotate_table<FieldT>(0, 1, 0, 7, "no_bits"), table_registration_error);
    EXPECT_THROW(sha256_sparse_rotate_table<FieldT>(11, 1, 12, 7, "wide_extraction"), table_registration_error);
    EXPECT_THROW(sha256_sparse_rotate_table<FieldT>(32, 1, 0, 7, "too_many_rows"), table_registration_error);
}
