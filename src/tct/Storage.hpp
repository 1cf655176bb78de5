#ifndef TCT_STORAGE_H_
#define TCT_STORAGE_H_

#include <cassert>
#include <optional>
#include <string>
#include <utility>

#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

#include "dbwrapper.h"
#include "fs.h"

#include "Hash.hpp"
#include "Tree.hpp"

namespace libtct {

static const std::string DEFAULT_TREE_KEY = "commitments";
//! -dbcache default (MiB)
static const int64_t DEFAULT_DB_CACHE = 16;
//! max. -dbcache (MiB)
static const int64_t MAX_DB_CACHE = sizeof(void*) > 4 ? 16384 : 1024;
//! min. -dbcache (MiB)
static const int64_t MIN_DB_CACHE = 4;

//! LevelDB cache size in bytes for a `-dbcache` value in MiB, clamped to the allowed range.
size_t DbCacheBytes(int64_t nMiB);

/**
 * Persists commitment trees in LevelDB under an application key.
 *
 * The serialized tree and its root are written in one batch, so a reader
 * never sees a root that does not belong to the stored tree. Trees are
 * loaded back exactly as written: cached digests and forgotten leaves
 * included.
 */
class TreeStore {
private:
    CDBWrapper db;

public:
    TreeStore(const fs::path& path, size_t nCacheSize, bool fWipe = false);

    /**
     * Load the tree stored under `key`. Returns false if there is none and
     * throws dbwrapper_error if the stored bytes do not decode.
     */
    bool Load(const std::string& key, CommitmentTree& tree) const;
    void Commit(const std::string& key, const CommitmentTree& tree);
    std::optional<Hash> ReadRoot(const std::string& key) const;
    void Erase(const std::string& key);
};

/**
 * A commitment tree shared between threads: one writer at a time, any
 * number of concurrent readers.
 *
 * Frontier digests are cached lazily inside the tree, so computing one is a
 * write. Every writer recomputes the root before giving up the exclusive
 * lock, which leaves all caches filled and makes readers pure lookups.
 */
class SharedTree {
private:
    mutable boost::shared_mutex cs_tree;
    CommitmentTree tree;

public:
    SharedTree() { }
    explicit SharedTree(CommitmentTree treeIn) : tree(std::move(treeIn)) {
        tree.root();
    }

    template<typename F>
    auto Read(F f) const {
        boost::shared_lock<boost::shared_mutex> lock(cs_tree);
        return f(static_cast<const CommitmentTree&>(tree));
    }

    template<typename F>
    auto Write(F f) {
        boost::unique_lock<boost::shared_mutex> lock(cs_tree);
        auto result = f(tree);
        tree.root();
        assert(tree.is_hash_cached());
        return result;
    }

    tl::expected<Position, InsertError> Insert(const Commitment& commitment);
    Hash Root() const;
    std::optional<Proof> Witness(const Commitment& commitment) const;
    bool Forget(const Commitment& commitment);
    CommitmentTree Snapshot() const;

    bool Load(const TreeStore& store, const std::string& key);
    void Commit(TreeStore& store, const std::string& key) const;
};

}

#endif // TCT_STORAGE_H_
