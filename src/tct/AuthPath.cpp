#include "AuthPath.hpp"

namespace libtct {

void AuthPath::push_level(std::vector<Hash> siblings)
{
    levels.push_back(std::move(siblings));
}

Hash AuthPath::root(const Hash& leaf, uint64_t position) const
{
    Hash current = leaf;
    for (size_t i = 0; i < levels.size(); i++) {
        const std::vector<Hash>& siblings = levels[i];
        uint64_t arity = siblings.size() + 1;
        size_t slot = position % arity;
        position /= arity;

        std::vector<Hash> children;
        children.reserve(arity);
        children.insert(children.end(), siblings.begin(), siblings.begin() + slot);
        children.push_back(current);
        children.insert(children.end(), siblings.begin() + slot, siblings.end());

        current = Hash::of_node(i + 1, children);
    }
    return current;
}

}
