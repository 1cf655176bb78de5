#ifndef TCT_AUTHPATH_H_
#define TCT_AUTHPATH_H_

#include <stdint.h>
#include <vector>

#include "serialize.h"

#include "Hash.hpp"

namespace libtct {

/**
 * The sibling digests needed to recompute a root from one leaf.
 *
 * `levels[0]` holds the siblings next to the leaf, `levels[depth()-1]` the
 * siblings directly below the root. Each level lists its siblings left to
 * right with the path's own child left out, so a level of an arity-A node
 * holds A-1 digests.
 */
class AuthPath {
public:
    std::vector<std::vector<Hash>> levels;

    AuthPath() { }
    AuthPath(std::vector<std::vector<Hash>> levels) : levels(levels) { }

    size_t depth() const { return levels.size(); }

    //! Append the siblings of the next level up.
    void push_level(std::vector<Hash> siblings);

    //! Fold the path over `leaf` at `position` (a leaf-order index).
    Hash root(const Hash& leaf, uint64_t position) const;

    bool verify(const Hash& leaf, uint64_t position, const Hash& expectedRoot) const {
        return root(leaf, position) == expectedRoot;
    }

    friend bool operator==(const AuthPath& a, const AuthPath& b) { return a.levels == b.levels; }
    friend bool operator!=(const AuthPath& a, const AuthPath& b) { return a.levels != b.levels; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(levels);
        if (ser_action.ForRead()) {
            for (const auto& level : levels) {
                if (level.empty()) {
                    throw std::ios_base::failure("empty authentication path level");
                }
            }
        }
    }
};

}

#endif // TCT_AUTHPATH_H_
