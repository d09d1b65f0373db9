#ifndef _SPCONSTANTS_H_
#define _SPCONSTANTS_H_

#define SP_FIELD_ELEMENT_SIZE 32
#define SP_G1_SIZE 64
#define SP_G2_SIZE 128
#define SP_PROOF_SIZE 256

#define SP_TREE_DEPTH 20
#define SP_TREE_DEPTH_TESTING 4
#define SP_MIN_TREE_DEPTH 4
#define SP_MAX_TREE_DEPTH 24

#define SP_DEFAULT_ROOT_HISTORY 100
#define SP_MIN_ROOT_HISTORY 3

#define SP_MAX_JS_INPUTS 4
#define SP_MAX_JS_OUTPUTS 4

#define SP_MAX_BATCH_SIZE 16
#define SP_MAX_PENDING_DEPOSITS 100

// Smallest amount a schema-v2 withdrawal may move
#define SP_MIN_WITHDRAWAL_AMOUNT 100
// The relayer fee may be at most amount / SP_MAX_FEE_DIVISOR
#define SP_MAX_FEE_DIVISOR 10

#define SP_WITHDRAW_SCHEMA_VERSION 2

#endif // _SPCONSTANTS_H_
