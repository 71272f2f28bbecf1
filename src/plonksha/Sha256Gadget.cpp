#include "libsnark/common/default_types/r1cs_ppzksnark_pp.hpp"

#include "plonksha/circuit/sha256_gadget.hpp"

namespace libplonksha {

typedef libsnark::Fr<libsnark::default_r1cs_ppzksnark_pp> FieldT;

template class lookup_table<FieldT>;
template class sha256_sparse_rotate_table<FieldT>;
template class sha256_choose_table<FieldT>;
template class sha256_majority_table<FieldT>;
template class sha256_normalization_table<FieldT>;

template class plonk_constraint_system<FieldT>;
template class allocated_num<FieldT>;
template class num<FieldT>;

template class sha256_gadget_params<FieldT>;

}
