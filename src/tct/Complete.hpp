#ifndef TCT_COMPLETE_H_
#define TCT_COMPLETE_H_

#include <cassert>
#include <ios>
#include <stdint.h>
#include <vector>

#include "serialize.h"

#include "Hash.hpp"
#include "Item.hpp"
#include "Node.hpp"

namespace libtct {
namespace complete {

/**
 * A finalized internal node. Its digest is computed once, when the frontier
 * it came from is finalized, and never changes afterwards: forgetting a leaf
 * below only turns nodes into their digests.
 *
 * A branch finalized before it filled up has fewer than `Arity` children; the
 * missing slots count as `Hash::zero()`.
 */
template<typename Child, size_t Arity>
class Branch {
    static_assert(Arity >= 2, "a branch needs at least two children");

private:
    std::vector<Node<Child>> children;
    Hash cachedHash;

public:
    static constexpr uint8_t HEIGHT = TierTraits<Child>::HEIGHT + 1;
    static constexpr uint64_t CHILD_CAPACITY = TierTraits<Child>::CAPACITY;
    static constexpr uint64_t CAPACITY = Arity * CHILD_CAPACITY;
    typedef typename TierTraits<Child>::LeafItem LeafItem;
    typedef Branch Complete;

    Branch() { }
    Branch(std::vector<Node<Child>> childrenIn, const Hash& hash)
        : children(std::move(childrenIn)), cachedHash(hash)
    {
        assert(!children.empty() && children.size() <= Arity);
    }

    Hash hash() const { return cachedHash; }
    std::optional<Hash> cached_hash() const { return cachedHash; }

    size_t size() const { return children.size(); }
    const Node<Child>& child(size_t i) const { return children.at(i); }

    //! True once every child has been reduced to its digest.
    bool is_pruned() const {
        for (const auto& node : children) {
            if (node.is_kept()) {
                return false;
            }
        }
        return true;
    }

    LeafWitness<LeafItem> witness(uint64_t index) const {
        if (index >= CAPACITY) {
            return std::nullopt;
        }
        size_t slot = index / CHILD_CAPACITY;
        if (slot >= children.size()) {
            return std::nullopt;
        }
        LeafWitness<LeafItem> result = children[slot].witness(index % CHILD_CAPACITY);
        if (result) {
            result->first.push_level(siblings(slot));
        }
        return result;
    }

    bool forget(uint64_t index) {
        if (index >= CAPACITY) {
            return false;
        }
        size_t slot = index / CHILD_CAPACITY;
        if (slot >= children.size()) {
            return false;
        }
        return children[slot].forget(index % CHILD_CAPACITY);
    }

    //! Digests of every child slot but `slot`, left to right.
    std::vector<Hash> siblings(size_t slot) const {
        std::vector<Hash> result;
        result.reserve(Arity - 1);
        for (size_t i = 0; i < Arity; i++) {
            if (i == slot) {
                continue;
            }
            result.push_back(i < children.size() ? children[i].hash() : Hash::zero());
        }
        return result;
    }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(children);
        READWRITE(cachedHash);
        if (ser_action.ForRead() && (children.empty() || children.size() > Arity)) {
            throw std::ios_base::failure("complete branch has an invalid number of children");
        }
    }
};

template<typename Item, size_t Arity, size_t Depth>
struct TierBuilder {
    typedef Branch<typename TierBuilder<Item, Arity, Depth - 1>::type, Arity> type;
};

template<typename Item, size_t Arity>
struct TierBuilder<Item, Arity, 0> {
    typedef Item type;
};

//! `Depth` levels of `Arity`-ary branches over `Item`.
template<typename Item, size_t Arity, size_t Depth>
using Tier = typename TierBuilder<Item, Arity, Depth>::type;

/**
 * A finalized top-level tier. Finalizing an empty frontier gives the
 * hash-only node `Hash::one()`.
 */
template<typename Item, size_t Arity, size_t Depth>
class Top {
public:
    typedef Tier<Item, Arity, Depth> Inner;

    static constexpr uint8_t HEIGHT = TierTraits<Inner>::HEIGHT;
    static constexpr uint64_t CAPACITY = TierTraits<Inner>::CAPACITY;
    typedef typename TierTraits<Inner>::LeafItem LeafItem;
    typedef Top Complete;

private:
    Node<Inner> inner;

public:
    Top() : inner(Node<Inner>::HashOnly(Hash::one())) { }
    explicit Top(Node<Inner> innerIn) : inner(std::move(innerIn)) { }

    Hash hash() const { return inner.hash(); }
    std::optional<Hash> cached_hash() const { return inner.cached_hash(); }

    const Node<Inner>& root() const { return inner; }

    bool is_pruned() const { return inner.is_hash(); }

    LeafWitness<LeafItem> witness(uint64_t index) const {
        return inner.witness(index);
    }

    bool forget(uint64_t index) {
        return inner.forget(index);
    }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(inner);
    }
};

}
}

#endif // TCT_COMPLETE_H_
