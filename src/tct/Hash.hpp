#ifndef TCT_HASH_H_
#define TCT_HASH_H_

#include <array>
#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

#include "serialize.h"

#include "Tct.h"

namespace libtct {

/**
 * A node or leaf digest of the commitment tree.
 *
 * Digests are pure values. Two of them are reserved: `zero()` stands for an
 * absent subtree and `one()` for a top-level container that never received
 * an item.
 */
class Hash {
private:
    std::array<unsigned char, TCT_HASH_SIZE> data;

public:
    Hash() { data.fill(0); }
    explicit Hash(const std::array<unsigned char, TCT_HASH_SIZE>& bytes) : data(bytes) { }

    static Hash zero();
    static Hash one();

    //! Digest of a raw leaf value.
    static Hash of_leaf(const unsigned char* value, size_t len);
    //! Digest of an internal node at `height` (leaves sit at height 0).
    static Hash of_node(uint8_t height, const std::vector<Hash>& children);

    std::string GetHex() const;
    static std::optional<Hash> FromHex(const std::string& str);

    const unsigned char* begin() const { return data.data(); }
    const unsigned char* end() const { return data.data() + data.size(); }
    unsigned int size() const { return data.size(); }

    friend bool operator==(const Hash& a, const Hash& b) { return a.data == b.data; }
    friend bool operator!=(const Hash& a, const Hash& b) { return a.data != b.data; }
    friend bool operator<(const Hash& a, const Hash& b) { return a.data < b.data; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(data);
    }
};

}

#endif // TCT_HASH_H_
