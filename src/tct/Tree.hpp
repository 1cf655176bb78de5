#ifndef TCT_TREE_H_
#define TCT_TREE_H_

#include <ios>
#include <map>
#include <optional>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include "serialize.h"
#include "version.h"

#include "AuthPath.hpp"
#include "Commitment.hpp"
#include "Frontier.hpp"
#include "Hash.hpp"
#include "Tct.h"

namespace libtct {

/**
 * Position of a commitment in the tree, packed as
 * `epoch (16 bits) | block (16 bits) | commitment (16 bits)`.
 */
class Position {
private:
    uint64_t value;

public:
    Position() : value(0) { }
    explicit Position(uint64_t value) : value(value) { }
    Position(uint16_t epoch, uint16_t block, uint16_t commitment);

    uint64_t index() const { return value; }
    uint16_t epoch() const { return (value >> (2 * TCT_TIER_POSITION_BITS)) & 0xffff; }
    uint16_t block() const { return (value >> TCT_TIER_POSITION_BITS) & 0xffff; }
    uint16_t commitment() const { return value & 0xffff; }

    //! "epoch/block/commitment"
    std::string ToString() const;
    //! Accepts "epoch/block/commitment" or a plain leaf index.
    static std::optional<Position> FromString(const std::string& str);

    friend bool operator==(const Position& a, const Position& b) { return a.value == b.value; }
    friend bool operator!=(const Position& a, const Position& b) { return a.value != b.value; }
    friend bool operator<(const Position& a, const Position& b) { return a.value < b.value; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(value);
    }
};

enum class InsertError {
    TreeFull,
    EpochFull,
    BlockFull,
};

std::string InsertErrorString(InsertError error);

/** A commitment, where it sits, and the path from it to the root. */
class Proof {
public:
    Commitment commitment;
    Position position;
    AuthPath path;

    Proof() { }
    Proof(const Commitment& commitment, Position position, AuthPath path)
        : commitment(commitment), position(position), path(std::move(path)) { }

    Hash root() const;
    bool verify(const Hash& expectedRoot) const { return root() == expectedRoot; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(commitment);
        READWRITE(position);
        READWRITE(path);
    }
};

/**
 * The ledger's commitment tree: commitments grouped into blocks, blocks into
 * epochs, epochs into the whole history, each level a tier of the same shape.
 *
 * The current block and epoch are opened on demand. Ending a block or epoch
 * seals it and moves the position to the start of the next one; ending one
 * that never received a commitment records it with the `Hash::one()` digest.
 * Only commitments that are still kept in memory are in the lookup index.
 */
class CommitmentTree {
public:
    typedef frontier::Top<Commitment, TCT_ARITY, TCT_TIER_DEPTH> Block;
    typedef frontier::Top<Block, TCT_ARITY, TCT_TIER_DEPTH> Epoch;
    typedef frontier::Top<Epoch, TCT_ARITY, TCT_TIER_DEPTH> Eternity;

private:
    Eternity eternity;
    std::map<Commitment, Position> index;

    void open_epoch();

public:
    CommitmentTree() { }

    tl::expected<Position, InsertError> insert(const Commitment& commitment);

    //! Seal the current block. Returns the root of the block just ended.
    tl::expected<Hash, InsertError> end_block();
    //! Seal the current epoch. Returns the root of the epoch just ended.
    tl::expected<Hash, InsertError> end_epoch();

    Hash root() const { return eternity.hash(); }
    //! True when `root()` and `witness()` can run without filling a cache.
    bool is_hash_cached() const { return eternity.is_hash_cached(); }
    Hash current_block_root() const;
    Hash current_epoch_root() const;

    //! Position of the next commitment, or nothing when the tree is full.
    std::optional<Position> position() const;
    bool is_empty() const { return eternity.is_empty(); }

    std::optional<Proof> witness(Position position) const;
    std::optional<Proof> witness(const Commitment& commitment) const;

    bool forget(Position position);
    bool forget(const Commitment& commitment);

    std::optional<Position> position_of(const Commitment& commitment) const;
    /**
     * Number of distinct commitments in the lookup index. A commitment inserted
     * more than once is counted once, at its latest position.
     */
    size_t size() const { return index.size(); }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        uint8_t version = TREE_SERIALIZATION_VERSION;
        READWRITE(version);
        if (version < MIN_TREE_SERIALIZATION_VERSION || version > TREE_SERIALIZATION_VERSION) {
            throw std::ios_base::failure("unsupported commitment tree version");
        }
        READWRITE(eternity);

        std::vector<std::pair<Commitment, Position>> entries;
        if (ser_action.ForRead()) {
            READWRITE(entries);
            index.clear();
            for (const auto& entry : entries) {
                index.insert(entry);
            }
        } else {
            entries.assign(index.begin(), index.end());
            READWRITE(entries);
        }
    }
};

}

#endif // TCT_TREE_H_
