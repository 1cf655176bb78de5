#ifndef TCT_GTEST_UTILS_H
#define TCT_GTEST_UTILS_H

#include "fs.h"

#include "tct/Commitment.hpp"

#include <stdint.h>

//! A distinct, deterministic commitment for every `n`.
libtct::Commitment TestCommitment(uint32_t n);

//! A fresh, not yet existing path under the system temp directory.
fs::path UniqueTempPath();

#endif
