#ifndef TCT_FRONTIER_H_
#define TCT_FRONTIER_H_

#include <cassert>
#include <ios>
#include <optional>
#include <stdint.h>
#include <type_traits>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include "logging.h"
#include "serialize.h"

#include "Complete.hpp"
#include "Hash.hpp"
#include "Item.hpp"
#include "Node.hpp"

namespace libtct {
namespace frontier {

/**
 * The bottom of a frontier: a single item.
 *
 * A leaf is always full as far as inserting items goes. When the item is
 * itself a tier it can still grow, but only through `update`, and the leaf
 * reports that tier's next position as its own.
 */
template<typename T>
class Leaf {
public:
    typedef T Item;

    static constexpr uint8_t HEIGHT = TierTraits<T>::HEIGHT;
    static constexpr uint64_t CAPACITY = TierTraits<T>::CAPACITY;
    typedef typename TierTraits<T>::LeafItem LeafItem;
    typedef typename TierTraits<T>::Complete Complete;

private:
    Node<T> item;

public:
    Leaf() { }
    explicit Leaf(T value) : item(Node<T>::Kept(std::move(value))) { }

    bool is_full() const { return true; }

    std::optional<uint64_t> position() const {
        if (const T* value = item.kept()) {
            return PositionOf(*value);
        }
        return std::nullopt;
    }

    Hash hash() const { return item.hash(); }
    std::optional<Hash> cached_hash() const { return item.cached_hash(); }

    const T* focus() const { return item.kept(); }

    bool is_hash_cached() const {
        if constexpr (TierTraits<T>::IS_LEAF) {
            return true;
        } else {
            const T* value = item.kept();
            return value == nullptr || value->is_hash_cached();
        }
    }

    tl::expected<void, T> insert(T value) {
        return tl::unexpected(std::move(value));
    }

    template<typename F>
    std::optional<std::invoke_result_t<F&, T&>> update(F& f) {
        return item.update(f);
    }

    Witness<T> witness(uint64_t index) const {
        return item.witness(index);
    }

    bool forget(uint64_t index) {
        return item.forget(index);
    }

    Node<Complete> finalize() && {
        if constexpr (TierTraits<T>::IS_LEAF) {
            return std::move(item);
        } else {
            T* value = item.kept();
            if (value == nullptr) {
                return Node<Complete>::HashOnly(item.hash());
            }
            Complete finished = std::move(*value).finalize();
            if (finished.is_pruned()) {
                return Node<Complete>::HashOnly(finished.hash());
            }
            return Node<Complete>::Kept(std::move(finished));
        }
    }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(item);
        if (ser_action.ForRead() && !TierTraits<T>::IS_LEAF && item.is_hash()) {
            throw std::ios_base::failure("open tier stored as a bare hash");
        }
    }
};

/**
 * An internal node on the right edge of a growing tree.
 *
 * `siblings` are the finalized children to the left of the focus and
 * `current` is the focus itself. Every slot right of the focus is empty.
 * The node digest is cached until the next insert or update.
 */
template<typename Child, size_t Arity>
class Branch {
    static_assert(Arity >= 2, "a branch needs at least two children");

public:
    typedef typename Child::Item Item;

    static constexpr uint8_t HEIGHT = Child::HEIGHT + 1;
    static constexpr uint64_t CHILD_CAPACITY = Child::CAPACITY;
    static constexpr uint64_t CAPACITY = Arity * CHILD_CAPACITY;
    typedef typename Child::LeafItem LeafItem;
    typedef complete::Branch<typename Child::Complete, Arity> Complete;

private:
    std::vector<Node<typename Child::Complete>> siblings;
    Child current;
    mutable std::optional<Hash> hashCache;

    std::vector<Hash> sibling_hashes(size_t slot) const {
        std::vector<Hash> result;
        result.reserve(Arity - 1);
        for (size_t i = 0; i < Arity; i++) {
            if (i == slot) {
                continue;
            } else if (i < siblings.size()) {
                result.push_back(siblings[i].hash());
            } else if (i == siblings.size()) {
                result.push_back(current.hash());
            } else {
                result.push_back(Hash::zero());
            }
        }
        return result;
    }

public:
    Branch() { }
    explicit Branch(Item item) : current(std::move(item)) { }

    bool is_full() const {
        return siblings.size() + 1 == Arity && current.is_full();
    }

    std::optional<uint64_t> position() const {
        uint64_t offset = siblings.size() * CHILD_CAPACITY;
        if (auto inner = current.position()) {
            return offset + *inner;
        }
        if (siblings.size() + 1 < Arity) {
            return offset + CHILD_CAPACITY;
        }
        return std::nullopt;
    }

    Hash hash() const {
        if (!hashCache) {
            std::vector<Hash> children;
            children.reserve(Arity);
            for (const auto& sibling : siblings) {
                children.push_back(sibling.hash());
            }
            children.push_back(current.hash());
            children.resize(Arity, Hash::zero());
            hashCache = Hash::of_node(HEIGHT, children);
        }
        return *hashCache;
    }

    std::optional<Hash> cached_hash() const { return hashCache; }

    //! True when this node and every frontier node below it has its digest cached.
    bool is_hash_cached() const { return hashCache.has_value() && current.is_hash_cached(); }

    const Item* focus() const { return current.focus(); }

    tl::expected<void, Item> insert(Item item) {
        if (!current.is_full()) {
            auto result = current.insert(std::move(item));
            // A focus that is not full always accepts the item.
            assert(result.has_value());
            hashCache.reset();
            return result;
        }
        if (siblings.size() + 1 >= Arity) {
            return tl::unexpected(std::move(item));
        }
        siblings.push_back(std::move(current).finalize());
        current = Child(std::move(item));
        hashCache.reset();
        return {};
    }

    template<typename F>
    std::optional<std::invoke_result_t<F&, Item&>> update(F& f) {
        hashCache.reset();
        return current.update(f);
    }

    LeafWitness<LeafItem> witness(uint64_t index) const {
        if (index >= CAPACITY) {
            return std::nullopt;
        }
        size_t slot = index / CHILD_CAPACITY;
        uint64_t rest = index % CHILD_CAPACITY;
        LeafWitness<LeafItem> result;
        if (slot < siblings.size()) {
            result = siblings[slot].witness(rest);
        } else if (slot == siblings.size()) {
            result = current.witness(rest);
        }
        if (result) {
            result->first.push_level(sibling_hashes(slot));
        }
        return result;
    }

    bool forget(uint64_t index) {
        if (index >= CAPACITY) {
            return false;
        }
        size_t slot = index / CHILD_CAPACITY;
        uint64_t rest = index % CHILD_CAPACITY;
        if (slot < siblings.size()) {
            return siblings[slot].forget(rest);
        } else if (slot == siblings.size()) {
            return current.forget(rest);
        }
        return false;
    }

    Node<Complete> finalize() && {
        Hash digest = hash();
        std::vector<Node<typename Child::Complete>> children = std::move(siblings);
        children.push_back(std::move(current).finalize());
        bool pruned = true;
        for (const auto& node : children) {
            if (node.is_kept()) {
                pruned = false;
                break;
            }
        }
        if (pruned) {
            return Node<Complete>::HashOnly(digest);
        }
        return Node<Complete>::Kept(Complete(std::move(children), digest));
    }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(siblings);
        READWRITE(current);
        READWRITE(hashCache);
        if (ser_action.ForRead() && siblings.size() >= Arity) {
            throw std::ios_base::failure("frontier branch has too many children");
        }
    }
};

template<typename T, size_t Arity, size_t Depth>
struct TierBuilder {
    typedef Branch<typename TierBuilder<T, Arity, Depth - 1>::type, Arity> type;
};

template<typename T, size_t Arity>
struct TierBuilder<T, Arity, 0> {
    typedef Leaf<T> type;
};

//! `Depth` levels of `Arity`-ary frontier branches over a leaf holding `T`.
template<typename T, size_t Arity, size_t Depth>
using Tier = typename TierBuilder<T, Arity, Depth>::type;

/**
 * A whole tier: nothing at all until the first insertion, then a frontier
 * tier of fixed arity and depth.
 *
 * An empty top hashes to `Hash::one()`, and so does the complete top it
 * finalizes into. A full top never finalizes on its own: `insert` hands
 * the item back and the caller decides when the tier is done.
 */
template<typename T, size_t Arity, size_t Depth>
class Top {
public:
    typedef T Item;
    typedef Tier<T, Arity, Depth> Inner;

    static constexpr uint8_t HEIGHT = Inner::HEIGHT;
    static constexpr uint64_t CAPACITY = Inner::CAPACITY;
    typedef typename Inner::LeafItem LeafItem;
    typedef complete::Top<typename TierTraits<T>::Complete, Arity, Depth> Complete;

private:
    std::optional<Inner> inner;

public:
    Top() { }

    bool is_empty() const { return !inner.has_value(); }
    bool is_full() const { return inner && inner->is_full(); }

    //! Leaf position the next item would get, counted in `LeafItem`s.
    std::optional<uint64_t> position() const {
        if (!inner) {
            return 0;
        }
        return inner->position();
    }

    Hash hash() const {
        return inner ? inner->hash() : Hash::one();
    }

    std::optional<Hash> cached_hash() const {
        if (!inner) {
            return Hash::one();
        }
        return inner->cached_hash();
    }

    //! The most recently inserted item, if it is still kept.
    const T* focus() const {
        return inner ? inner->focus() : nullptr;
    }

    /**
     * True when no digest on the frontier is left to compute, so `hash()`
     * and `witness()` only read. Any insert or update clears the caches on
     * its path until the next `hash()`.
     */
    bool is_hash_cached() const {
        return !inner || inner->is_hash_cached();
    }

    tl::expected<void, T> insert(T item) {
        if (!inner) {
            inner.emplace(std::move(item));
            return {};
        }
        auto result = inner->insert(std::move(item));
        if (!result) {
            LogPrint("tct", "tier at height %d is full, insertion rejected\n", (int)HEIGHT);
        }
        return result;
    }

    /**
     * Apply `f` to the most recently inserted item in place. Returns nothing
     * when the tier is empty or that item has been forgotten.
     */
    template<typename F>
    std::optional<std::invoke_result_t<F&, T&>> update(F f) {
        if (!inner) {
            return std::nullopt;
        }
        return inner->update(f);
    }

    LeafWitness<LeafItem> witness(uint64_t index) const {
        if (!inner) {
            return std::nullopt;
        }
        return inner->witness(index);
    }

    bool forget(uint64_t index) {
        if (!inner) {
            return false;
        }
        return inner->forget(index);
    }

    // An open tier always stays in memory.
    bool is_pruned() const { return false; }

    Complete finalize() && {
        if (!inner) {
            return Complete(Node<typename Complete::Inner>::HashOnly(Hash::one()));
        }
        LogPrint("tct", "finalizing tier at height %d\n", (int)HEIGHT);
        Complete finished(std::move(*inner).finalize());
        inner.reset();
        return finished;
    }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(inner);
    }
};

}
}

#endif // TCT_FRONTIER_H_
