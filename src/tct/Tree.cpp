#include "Tree.hpp"

#include "logging.h"
#include "util/strencodings.h"
#include "util/unwrap.h"

#include <cassert>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace libtct {

Position::Position(uint16_t epoch, uint16_t block, uint16_t commitment)
    : value(((uint64_t)epoch << (2 * TCT_TIER_POSITION_BITS)) |
            ((uint64_t)block << TCT_TIER_POSITION_BITS) |
            (uint64_t)commitment)
{
}

std::string Position::ToString() const
{
    return tfm::format("%d/%d/%d", epoch(), block(), commitment());
}

std::optional<Position> Position::FromString(const std::string& str)
{
    std::vector<std::string> parts;
    boost::split(parts, str, boost::is_any_of("/"));

    if (parts.size() == 1) {
        int64_t n;
        if (!ParseInt64(parts[0], &n) || n < 0 || n >= ((int64_t)1 << (3 * TCT_TIER_POSITION_BITS))) {
            return std::nullopt;
        }
        return Position((uint64_t)n);
    }
    if (parts.size() != 3) {
        return std::nullopt;
    }
    uint16_t fields[3];
    for (size_t i = 0; i < 3; i++) {
        int64_t n;
        if (!ParseInt64(parts[i], &n) || n < 0 || n > 0xffff) {
            return std::nullopt;
        }
        fields[i] = (uint16_t)n;
    }
    return Position(fields[0], fields[1], fields[2]);
}

std::string InsertErrorString(InsertError error)
{
    switch (error) {
    case InsertError::TreeFull:
        return "tree is full";
    case InsertError::EpochFull:
        return "current epoch is full";
    case InsertError::BlockFull:
        return "current block is full";
    }
    return "unknown insertion error";
}

Hash Proof::root() const
{
    return path.root(commitment.hash(), position.index());
}

void CommitmentTree::open_epoch()
{
    if (eternity.is_empty()) {
        try_unwrap(eternity.insert(Epoch())) or_assert;
    }
}

tl::expected<Position, InsertError> CommitmentTree::insert(const Commitment& commitment)
{
    std::optional<uint64_t> next = eternity.position();
    if (!next) {
        return tl::unexpected(InsertError::TreeFull);
    }
    open_epoch();

    auto inserted = eternity.update([&](Epoch& epoch) {
        if (epoch.is_empty()) {
            try_unwrap(epoch.insert(Block())) or_assert;
        }
        auto result = epoch.update([&](Block& block) {
            return block.insert(commitment).has_value();
        });
        return result.value_or(false);
    });

    if (!inserted.value_or(false)) {
        InsertError error = InsertError::BlockFull;
        if (!eternity.position()) {
            error = InsertError::TreeFull;
        } else if (const Epoch* epoch = eternity.focus()) {
            if (!epoch->position()) {
                error = InsertError::EpochFull;
            }
        }
        LogPrint("tct", "cannot insert commitment %s: %s\n", commitment.GetHex(), InsertErrorString(error));
        return tl::unexpected(error);
    }

    Position position(*next);
    index[commitment] = position;
    LogPrint("tct", "inserted commitment %s at %s\n", commitment.GetHex(), position.ToString());
    return position;
}

tl::expected<Hash, InsertError> CommitmentTree::end_block()
{
    open_epoch();

    // The current epoch is never forgotten, so the update always reaches it.
    tl::expected<Hash, InsertError> ended = try_unwrap(eternity.update([](Epoch& epoch) -> tl::expected<Hash, InsertError> {
        if (epoch.is_empty()) {
            try_unwrap(epoch.insert(Block())) or_assert;
        }
        Hash blockRoot = epoch.focus()->hash();
        if (!epoch.insert(Block())) {
            return tl::unexpected(InsertError::EpochFull);
        }
        return blockRoot;
    })) or_assert;

    if (ended) {
        LogPrint("tct", "ended block with root %s, next position %s\n", ended->GetHex(),
                 position() ? position()->ToString() : "none");
    }
    return ended;
}

tl::expected<Hash, InsertError> CommitmentTree::end_epoch()
{
    open_epoch();

    Hash epochRoot = eternity.focus()->hash();
    if (!eternity.insert(Epoch())) {
        return tl::unexpected(InsertError::TreeFull);
    }
    LogPrint("tct", "ended epoch with root %s, next position %s\n", epochRoot.GetHex(),
             position() ? position()->ToString() : "none");
    return epochRoot;
}

Hash CommitmentTree::current_block_root() const
{
    if (const Epoch* epoch = eternity.focus()) {
        if (const Block* block = epoch->focus()) {
            return block->hash();
        }
    }
    return Block().hash();
}

Hash CommitmentTree::current_epoch_root() const
{
    if (const Epoch* epoch = eternity.focus()) {
        return epoch->hash();
    }
    return Epoch().hash();
}

std::optional<Position> CommitmentTree::position() const
{
    std::optional<uint64_t> next = eternity.position();
    if (!next) {
        return std::nullopt;
    }
    return Position(*next);
}

std::optional<Proof> CommitmentTree::witness(Position position) const
{
    auto found = eternity.witness(position.index());
    if (!found) {
        return std::nullopt;
    }
    return Proof(found->second, position, std::move(found->first));
}

std::optional<Proof> CommitmentTree::witness(const Commitment& commitment) const
{
    Position position = try_unwrap(position_of(commitment)) or_return;
    return witness(position);
}

bool CommitmentTree::forget(Position position)
{
    // Learn which commitment lives here before its content goes away.
    auto found = eternity.witness(position.index());
    if (!eternity.forget(position.index())) {
        return false;
    }
    if (found) {
        auto it = index.find(found->second);
        if (it != index.end() && it->second == position) {
            index.erase(it);
        }
    }
    LogPrint("tct", "forgot commitment at %s\n", position.ToString());
    return true;
}

bool CommitmentTree::forget(const Commitment& commitment)
{
    auto it = index.find(commitment);
    if (it == index.end()) {
        return false;
    }
    return forget(it->second);
}

std::optional<Position> CommitmentTree::position_of(const Commitment& commitment) const
{
    auto it = index.find(commitment);
    if (it == index.end()) {
        return std::nullopt;
    }
    return it->second;
}

}
