#include "Storage.hpp"

#include "logging.h"

#include <algorithm>

namespace libtct {

static const char DB_TREE = 't';
static const char DB_ROOT = 'r';

size_t DbCacheBytes(int64_t nMiB)
{
    nMiB = std::max(nMiB, MIN_DB_CACHE);
    nMiB = std::min(nMiB, MAX_DB_CACHE);
    return (size_t)nMiB << 20;
}

TreeStore::TreeStore(const fs::path& path, size_t nCacheSize, bool fWipe)
    : db(path, nCacheSize, fWipe)
{
}

bool TreeStore::Load(const std::string& key, CommitmentTree& tree) const
{
    if (!db.Exists(std::make_pair(DB_TREE, key))) {
        return false;
    }
    CommitmentTree loaded;
    if (!db.Read(std::make_pair(DB_TREE, key), loaded)) {
        throw dbwrapper_error("stored commitment tree '" + key + "' is corrupt");
    }
    tree = std::move(loaded);
    LogPrint("tct", "loaded commitment tree '%s' with root %s\n", key, tree.root().GetHex());
    return true;
}

void TreeStore::Commit(const std::string& key, const CommitmentTree& tree)
{
    Hash root = tree.root();
    CDBBatch batch;
    batch.Write(std::make_pair(DB_TREE, key), tree);
    batch.Write(std::make_pair(DB_ROOT, key), root);
    db.WriteBatch(batch, true);
    LogPrint("tct", "committed commitment tree '%s' with root %s\n", key, root.GetHex());
}

std::optional<Hash> TreeStore::ReadRoot(const std::string& key) const
{
    Hash root;
    if (!db.Read(std::make_pair(DB_ROOT, key), root)) {
        return std::nullopt;
    }
    return root;
}

void TreeStore::Erase(const std::string& key)
{
    CDBBatch batch;
    batch.Erase(std::make_pair(DB_TREE, key));
    batch.Erase(std::make_pair(DB_ROOT, key));
    db.WriteBatch(batch, true);
}

tl::expected<Position, InsertError> SharedTree::Insert(const Commitment& commitment)
{
    return Write([&](CommitmentTree& t) { return t.insert(commitment); });
}

Hash SharedTree::Root() const
{
    return Read([](const CommitmentTree& t) { return t.root(); });
}

std::optional<Proof> SharedTree::Witness(const Commitment& commitment) const
{
    return Read([&](const CommitmentTree& t) { return t.witness(commitment); });
}

bool SharedTree::Forget(const Commitment& commitment)
{
    return Write([&](CommitmentTree& t) { return t.forget(commitment); });
}

CommitmentTree SharedTree::Snapshot() const
{
    return Read([](const CommitmentTree& t) { return t; });
}

bool SharedTree::Load(const TreeStore& store, const std::string& key)
{
    return Write([&](CommitmentTree& t) { return store.Load(key, t); });
}

void SharedTree::Commit(TreeStore& store, const std::string& key) const
{
    Read([&](const CommitmentTree& t) { store.Commit(key, t); return true; });
}

}
