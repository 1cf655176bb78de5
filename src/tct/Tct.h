#ifndef _TCTCONSTANTS_H_
#define _TCTCONSTANTS_H_

#define TCT_HASH_SIZE 32
#define TCT_COMMITMENT_SIZE 32

// Every tier (block, epoch, eternity) is a quaternary tree of depth 8,
// so each tier holds 4^8 = 65536 items and a position packs into 48 bits.
#define TCT_ARITY 4
#define TCT_TIER_DEPTH 8
#define TCT_TIER_POSITION_BITS 16

#endif // _TCTCONSTANTS_H_
