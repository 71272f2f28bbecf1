namespace libplonksha {

/*
 * The register is split into 11-bit limbs (low, mid, high), each limb is
 * mapped into base 7 by a table that also returns the sparse form of a fixed
 * rotation of the limb, and the sparse forms of the whole register are glued
 * back from the limbs:
 *
 *   x       = low + 2^11 mid + 2^22 high
 *   sparse  = s(low) + 7^11 s(mid) + 7^22 s(high)
 *   x >>> 6  : r6(low) + 7^5 s(mid) + 7^16 s(high)
 *   x >>> 11 : s(mid) + 7^11 s(high) + 7^21 s(low)
 *   x >>> 25 : r3(high) + 7^7 s(low) + 7^18 s(mid)
 *
 * The high limb has 10 significant bits. It is looked up in a table that
 * drops the 11th bit, which is where a one-bit overflow ends up.
 */
template<typename FieldT>
sparse_ch_value<FieldT> sha256_gadget_params<FieldT>::convert_into_sparse_chooser_form(
    plonk_constraint_system<FieldT>& cs,
    const num_with_tracker<FieldT>& input) const
{
    num<FieldT> var = input.value;
    switch (input.tracker) {
        case overflow_tracker::SignificantOverflow:
            throw unsupported_overflow();
        case overflow_tracker::SmallOverflow:
            var = extract_32_from_overflowed_num(cs, input.value);
            break;
        default:
            break;
    }

    const uint64_t base = PLONKSHA_CHOOSE_BASE;

    if (var.is_constant()) {
        const uint64_t n = field_low_u64(var.get_constant());
        return sparse_ch_value<FieldT>(
            var,
            converter_helper(n, base, 0),
            converter_helper(n, base, 6),
            converter_helper(n, base, 11),
            converter_helper(n, base, 25)
        );
    }

    const allocated_num<FieldT> x = var.get_allocated();
    const allocated_num<FieldT> low = allocate_limb(cs, x, 0);
    const allocated_num<FieldT> mid = allocate_limb(cs, x, 1);
    const allocated_num<FieldT> high = allocate_limb(cs, x, 2);

    const std::pair<allocated_num<FieldT>, allocated_num<FieldT>> low_parts =
        query_table2(cs, sha256_base7_rot6_table, low);
    const std::pair<allocated_num<FieldT>, allocated_num<FieldT>> mid_parts =
        query_table2(cs, sha256_base7_rot6_table, mid);
    const std::pair<allocated_num<FieldT>, allocated_num<FieldT>> high_parts =
        query_table2(cs, sha256_base7_rot3_extr10_table, high);

    const FieldT one = FieldT::one();
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(2, PLONKSHA_GADGET_CHUNK_SIZE), u64_exp_to_ff<FieldT>(2, 2 * PLONKSHA_GADGET_CHUNK_SIZE)}},
        {{low, mid, high}},
        x
    );

    const allocated_num<FieldT> sparse = allocate_sparse_rotation(cs, x, base, 0);
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(base, 11), u64_exp_to_ff<FieldT>(base, 22)}},
        {{low_parts.first, mid_parts.first, high_parts.first}},
        sparse
    );

    const allocated_num<FieldT> rot6 = allocate_sparse_rotation(cs, x, base, 6);
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(base, 5), u64_exp_to_ff<FieldT>(base, 16)}},
        {{low_parts.second, mid_parts.first, high_parts.first}},
        rot6
    );

    const allocated_num<FieldT> rot11 = allocate_sparse_rotation(cs, x, base, 11);
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(base, 11), u64_exp_to_ff<FieldT>(base, 21)}},
        {{mid_parts.first, high_parts.first, low_parts.first}},
        rot11
    );

    const allocated_num<FieldT> rot25 = allocate_sparse_rotation(cs, x, base, 25);
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(base, 7), u64_exp_to_ff<FieldT>(base, 18)}},
        {{high_parts.second, low_parts.first, mid_parts.first}},
        rot25
    );

    return sparse_ch_value<FieldT>(x, sparse, rot6, rot11, rot25);
}

/*
 * Same construction in base 4 with rotations 2, 13 and 22:
 *
 *   sparse  = s(low) + 4^11 s(mid) + 4^22 s(high)
 *   x >>> 2  : r2(low) + 4^9 s(mid) + 4^20 s(high)
 *   x >>> 13 : r2(mid) + 4^9 s(high) + 4^19 s(low)
 *   x >>> 22 : s(high) + 4^10 s(low) + 4^21 s(mid)
 *
 * With majority_strategy::UseTwoTables the high limb goes through a table
 * that drops the overflow bit, as in the chooser. RawOverflowCheck saves
 * that table: a one-bit overflow is then removed by the overflow extractor
 * before the split, and the high limb uses the ordinary rotate table.
 */
template<typename FieldT>
sparse_maj_value<FieldT> sha256_gadget_params<FieldT>::convert_into_sparse_majority_form(
    plonk_constraint_system<FieldT>& cs,
    const num_with_tracker<FieldT>& input) const
{
    bool needs_extraction = false;
    switch (input.tracker) {
        case overflow_tracker::SignificantOverflow:
            throw unsupported_overflow();
        case overflow_tracker::SmallOverflow:
            needs_extraction = true;
            break;
        case overflow_tracker::OneBitOverflow:
            needs_extraction = (maj_strategy == majority_strategy::RawOverflowCheck);
            break;
        default:
            break;
    }

    const num<FieldT> var = needs_extraction ? extract_32_from_overflowed_num(cs, input.value) : input.value;
    const uint64_t base = PLONKSHA_MAJORITY_BASE;

    if (var.is_constant()) {
        const uint64_t n = field_low_u64(var.get_constant());
        return sparse_maj_value<FieldT>(
            var,
            converter_helper(n, base, 0),
            converter_helper(n, base, 2),
            converter_helper(n, base, 13),
            converter_helper(n, base, 22)
        );
    }

    const lookup_table_handle<FieldT>& high_table = (maj_strategy == majority_strategy::UseTwoTables)
        ? sha256_base4_rot2_extr10_table
        : sha256_base4_rot2_table;

    const allocated_num<FieldT> x = var.get_allocated();
    const allocated_num<FieldT> low = allocate_limb(cs, x, 0);
    const allocated_num<FieldT> mid = allocate_limb(cs, x, 1);
    const allocated_num<FieldT> high = allocate_limb(cs, x, 2);

    const std::pair<allocated_num<FieldT>, allocated_num<FieldT>> low_parts =
        query_table2(cs, sha256_base4_rot2_table, low);
    const std::pair<allocated_num<FieldT>, allocated_num<FieldT>> mid_parts =
        query_table2(cs, sha256_base4_rot2_table, mid);
    const std::pair<allocated_num<FieldT>, allocated_num<FieldT>> high_parts =
        query_table2(cs, high_table, high);

    const FieldT one = FieldT::one();
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(2, PLONKSHA_GADGET_CHUNK_SIZE), u64_exp_to_ff<FieldT>(2, 2 * PLONKSHA_GADGET_CHUNK_SIZE)}},
        {{low, mid, high}},
        x
    );

    const allocated_num<FieldT> sparse = allocate_sparse_rotation(cs, x, base, 0);
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(base, 11), u64_exp_to_ff<FieldT>(base, 22)}},
        {{low_parts.first, mid_parts.first, high_parts.first}},
        sparse
    );

    const allocated_num<FieldT> rot2 = allocate_sparse_rotation(cs, x, base, 2);
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(base, 9), u64_exp_to_ff<FieldT>(base, 20)}},
        {{low_parts.second, mid_parts.first, high_parts.first}},
        rot2
    );

    const allocated_num<FieldT> rot13 = allocate_sparse_rotation(cs, x, base, 13);
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(base, 9), u64_exp_to_ff<FieldT>(base, 19)}},
        {{mid_parts.second, high_parts.first, low_parts.first}},
        rot13
    );

    const allocated_num<FieldT> rot22 = allocate_sparse_rotation(cs, x, base, 22);
    allocated_num<FieldT>::ternary_lc_eq(
        cs,
        {{one, u64_exp_to_ff<FieldT>(base, 10), u64_exp_to_ff<FieldT>(base, 21)}},
        {{high_parts.first, low_parts.first, mid_parts.first}},
        rot22
    );

    return sparse_maj_value<FieldT>(x, sparse, rot2, rot13, rot22);
}

}
