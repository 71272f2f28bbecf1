#include <cassert>
#include <gmp.h>

namespace libplonksha {

template<typename FieldT>
FieldT field_from_u64(uint64_t x)
{
    return FieldT(libsnark::bigint<FieldT::num_limbs>(x));
}

template<typename FieldT>
uint64_t field_low_u64(const FieldT& x)
{
    return x.as_bigint().data[0];
}

template<typename FieldT>
bool field_fits_u64(const FieldT& x)
{
    const libsnark::bigint<FieldT::num_limbs> repr = x.as_bigint();
    for (mp_size_t i = 1; i < FieldT::num_limbs; i++) {
        if (repr.data[i] != 0) {
            return false;
        }
    }
    return true;
}

template<typename FieldT>
FieldT u64_exp_to_ff(uint64_t n, uint64_t exp)
{
    return field_from_u64<FieldT>(n) ^ exp;
}

template<typename FieldT>
FieldT map_into_sparse_form(uint64_t n, uint64_t base)
{
    const FieldT field_base = field_from_u64<FieldT>(base);
    FieldT result = FieldT::zero();

    for (size_t i = 64; i > 0; i--) {
        result = result * field_base;
        if ((n >> (i - 1)) & 1) {
            result += FieldT::one();
        }
    }

    return result;
}

template<typename FieldT>
bool split_into_chunks(const FieldT& x, uint64_t divisor, size_t num_chunks,
                       std::vector<uint64_t>& chunks)
{
    assert(divisor >= 2);

    mpz_t acc;
    mpz_init(acc);
    x.as_bigint().to_mpz(acc);

    chunks.assign(num_chunks, 0);
    for (size_t i = 0; i < num_chunks; i++) {
        chunks[i] = mpz_fdiv_q_ui(acc, acc, divisor);
    }

    const bool fits = (mpz_sgn(acc) == 0);
    mpz_clear(acc);

    return fits;
}

}
