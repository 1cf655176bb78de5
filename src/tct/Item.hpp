#ifndef TCT_ITEM_H_
#define TCT_ITEM_H_

#include <optional>
#include <stdint.h>
#include <type_traits>
#include <utility>

#include "AuthPath.hpp"
#include "Hash.hpp"

namespace libtct {

/**
 * What the tree engine knows about a type it stores.
 *
 * A type without a `HEIGHT` member is a raw leaf: it sits at height 0, holds
 * exactly one position and is its own complete form. Anything exposing
 * `HEIGHT` is itself a tier (a frontier or complete subtree) and reports its
 * height, its capacity in leaf positions, the raw leaf type it witnesses and
 * the type it finalizes into.
 */
template<typename T, typename = void>
struct TierTraits {
    static constexpr bool IS_LEAF = true;
    static constexpr uint8_t HEIGHT = 0;
    static constexpr uint64_t CAPACITY = 1;
    typedef T LeafItem;
    typedef T Complete;
};

template<typename T>
struct TierTraits<T, std::void_t<decltype(T::HEIGHT)>> {
    static constexpr bool IS_LEAF = false;
    static constexpr uint8_t HEIGHT = T::HEIGHT;
    static constexpr uint64_t CAPACITY = T::CAPACITY;
    typedef typename T::LeafItem LeafItem;
    typedef typename T::Complete Complete;
};

//! A leaf value together with the path proving it.
template<typename L>
using LeafWitness = std::optional<std::pair<AuthPath, L>>;

template<typename T>
using Witness = LeafWitness<typename TierTraits<T>::LeafItem>;

// The helpers below are total over raw leaves and tiers, so the recursion in
// the frontier and complete trees never has to ask what its children are.

//! Next free leaf position inside `item`, or nothing when it is full.
template<typename T>
std::optional<uint64_t> PositionOf(const T& item)
{
    if constexpr (TierTraits<T>::IS_LEAF) {
        return std::nullopt;
    } else {
        return item.position();
    }
}

template<typename T>
Witness<T> WitnessOf(const T& item, uint64_t index)
{
    if constexpr (TierTraits<T>::IS_LEAF) {
        if (index != 0) {
            return std::nullopt;
        }
        return std::make_pair(AuthPath(), item);
    } else {
        return item.witness(index);
    }
}

}

#endif // TCT_ITEM_H_
