#ifndef _PLONKSHA_CONSTANTS_H_
#define _PLONKSHA_CONSTANTS_H_

#define PLONKSHA_REG_WIDTH 32
#define PLONKSHA_GADGET_CHUNK_SIZE 11
#define PLONKSHA_NUM_REG_LIMBS 3

// sparse bases for the two boolean functions of the compression round
#define PLONKSHA_CHOOSE_BASE 7
#define PLONKSHA_MAJORITY_BASE 4

// 7^4 and 4^6 keep the normalization tables close to the 2^11 rows
// of the rotate tables
#define PLONKSHA_CH_BASE_DEFAULT_NUM_OF_CHUNKS 4
#define PLONKSHA_MAJ_BASE_DEFAULT_NUM_OF_CHUNKS 6

#define PLONKSHA_LOOKUP_TABLE_WIDTH 3
#define PLONKSHA_MAX_TABLE_ROWS (1 << 24)

#endif // _PLONKSHA_CONSTANTS_H_
