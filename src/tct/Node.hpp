#ifndef TCT_NODE_H_
#define TCT_NODE_H_

#include <cassert>
#include <optional>
#include <stdint.h>
#include <type_traits>
#include <variant>

#include "logging.h"
#include "serialize.h"

#include "Hash.hpp"
#include "Item.hpp"

namespace libtct {

/**
 * A child slot of the tree: either the kept value itself or only its digest.
 *
 * The transition is one way. Once a node is hash-only its content is gone,
 * and the stored digest is exactly what the kept value hashed to, so nothing
 * above the node can tell the two states apart by hash.
 *
 * A kept raw leaf carries its digest alongside, computed when the value is
 * stored or changed through `update`, so hashing never touches the value.
 */
template<typename T>
class Node {
private:
    std::variant<T, Hash> inner;
    Hash leafDigest;

    explicit Node(std::variant<T, Hash> innerIn) : inner(std::move(innerIn)) {
        remember_digest();
    }

    void remember_digest() {
        if constexpr (TierTraits<T>::IS_LEAF) {
            if (const T* value = kept()) {
                leafDigest = value->hash();
            }
        }
    }

public:
    // Only used as the target of deserialization.
    Node() : inner(Hash::zero()) { }

    static Node Kept(T value) {
        return Node(std::variant<T, Hash>(std::in_place_index<0>, std::move(value)));
    }
    static Node HashOnly(const Hash& hash) {
        return Node(std::variant<T, Hash>(std::in_place_index<1>, hash));
    }

    bool is_kept() const { return inner.index() == 0; }
    bool is_hash() const { return inner.index() == 1; }

    T* kept() { return std::get_if<0>(&inner); }
    const T* kept() const { return std::get_if<0>(&inner); }

    Hash hash() const {
        if (const T* value = kept()) {
            if constexpr (TierTraits<T>::IS_LEAF) {
                return leafDigest;
            } else {
                return value->hash();
            }
        }
        return std::get<1>(inner);
    }

    std::optional<Hash> cached_hash() const {
        if (const T* value = kept()) {
            if constexpr (TierTraits<T>::IS_LEAF) {
                return leafDigest;
            } else {
                return value->cached_hash();
            }
        }
        return std::get<1>(inner);
    }

    //! Apply `f` to the kept value. Nothing if the node is hash-only.
    template<typename F>
    std::optional<std::invoke_result_t<F&, T&>> update(F& f) {
        typedef std::invoke_result_t<F&, T&> R;
        T* value = kept();
        if (value == nullptr) {
            return std::nullopt;
        }
        std::optional<R> result(std::in_place, f(*value));
        remember_digest();
        return result;
    }

    Witness<T> witness(uint64_t index) const {
        if (const T* value = kept()) {
            return WitnessOf(*value, index);
        }
        return std::nullopt;
    }

    //! Drop the content, keeping its digest. False if already hash-only.
    bool forget() {
        if (is_hash()) {
            return false;
        }
        Hash digest = hash();
        if constexpr (TierTraits<T>::IS_LEAF) {
            assert(digest == std::get<0>(inner).hash());
        }
        inner.template emplace<1>(digest);
        return true;
    }

    /**
     * Forget the leaf at `index` below this node. A subtree whose last kept
     * leaf goes away collapses into its digest.
     */
    bool forget(uint64_t index) {
        T* value = kept();
        if (value == nullptr) {
            return false;
        }
        if constexpr (TierTraits<T>::IS_LEAF) {
            return index == 0 && forget();
        } else {
            bool forgotten = value->forget(index);
            if (forgotten && value->is_pruned()) {
                LogPrint("tct", "pruning forgotten subtree at height %d\n", (int)TierTraits<T>::HEIGHT);
                forget();
            }
            return forgotten;
        }
    }

    template<typename Stream>
    void Serialize(Stream& s) const {
        if (const T* value = kept()) {
            ::Serialize(s, (uint8_t)0x01);
            ::Serialize(s, *value);
        } else {
            ::Serialize(s, (uint8_t)0x00);
            ::Serialize(s, std::get<1>(inner));
        }
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t tag;
        ::Unserialize(s, tag);
        if (tag == 0x01) {
            T value;
            ::Unserialize(s, value);
            inner.template emplace<0>(std::move(value));
            remember_digest();
        } else if (tag == 0x00) {
            Hash digest;
            ::Unserialize(s, digest);
            inner.template emplace<1>(digest);
        } else {
            throw std::ios_base::failure("non-canonical node tag");
        }
    }
};

}

#endif // TCT_NODE_H_
