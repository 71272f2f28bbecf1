#include "gmock/gmock.h"

#include "libsnark/common/default_types/r1cs_ppzksnark_pp.hpp"
#include "libsnark/common/profiling.hpp"

int main(int argc, char **argv) {
    libsnark::default_r1cs_ppzksnark_pp::init_public_params();
    libsnark::inhibit_profiling_info = true;
    libsnark::inhibit_profiling_counters = true;

    testing::InitGoogleMock(&argc, argv);

    return RUN_ALL_TESTS();
}
