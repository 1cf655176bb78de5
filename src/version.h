// Copyright (c) 2012-2014 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef TCT_VERSION_H
#define TCT_VERSION_H

/**
 * client and on-disk format versioning
 */

static const int CLIENT_VERSION_MAJOR = 0;
static const int CLIENT_VERSION_MINOR = 3;
static const int CLIENT_VERSION_REVISION = 0;

static const int CLIENT_VERSION =
                           1000000 * CLIENT_VERSION_MAJOR
                         +   10000 * CLIENT_VERSION_MINOR
                         +     100 * CLIENT_VERSION_REVISION;

//! version of the serialized tree layout; bumped whenever a tier's encoding changes
static const int TREE_SERIALIZATION_VERSION = 1;

//! oldest serialized tree layout this build still reads
static const int MIN_TREE_SERIALIZATION_VERSION = 1;

#endif // TCT_VERSION_H
