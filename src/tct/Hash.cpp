#include "Hash.hpp"

#include "util/strencodings.h"

#include <algorithm>
#include <stdexcept>
#include <string.h>

#include <sodium.h>

namespace libtct {

static const unsigned char LEAF_PERSONALIZATION[crypto_generichash_blake2b_PERSONALBYTES + 1] =
    "TCT_Leaf_Hash___";
static const char NODE_PERSONALIZATION_PREFIX[] = "TCT_Node_Hash_";

Hash Hash::zero()
{
    return Hash();
}

Hash Hash::one()
{
    std::array<unsigned char, TCT_HASH_SIZE> bytes = {};
    bytes[0] = 1;
    return Hash(bytes);
}

Hash Hash::of_leaf(const unsigned char* value, size_t len)
{
    std::array<unsigned char, TCT_HASH_SIZE> digest;
    if (crypto_generichash_blake2b_salt_personal(digest.data(), digest.size(),
                                                 value, len,
                                                 NULL, 0, // No key.
                                                 NULL,    // No salt.
                                                 LEAF_PERSONALIZATION
                                                ) != 0)
    {
        throw std::logic_error("hash function failure");
    }
    return Hash(digest);
}

Hash Hash::of_node(uint8_t height, const std::vector<Hash>& children)
{
    // "TCT_Node_Hash_" || height as little-endian uint16
    unsigned char personalization[crypto_generichash_blake2b_PERSONALBYTES] = {};
    memcpy(personalization, NODE_PERSONALIZATION_PREFIX, 14);
    personalization[14] = height;
    personalization[15] = 0;

    std::vector<unsigned char> block;
    block.reserve(children.size() * TCT_HASH_SIZE);
    for (const Hash& child : children) {
        block.insert(block.end(), child.begin(), child.end());
    }

    std::array<unsigned char, TCT_HASH_SIZE> digest;
    if (crypto_generichash_blake2b_salt_personal(digest.data(), digest.size(),
                                                 block.data(), block.size(),
                                                 NULL, 0, // No key.
                                                 NULL,    // No salt.
                                                 personalization
                                                ) != 0)
    {
        throw std::logic_error("hash function failure");
    }
    return Hash(digest);
}

std::string Hash::GetHex() const
{
    return HexStr(data.begin(), data.end());
}

std::optional<Hash> Hash::FromHex(const std::string& str)
{
    if (str.size() != 2 * TCT_HASH_SIZE || !IsHex(str)) {
        return std::nullopt;
    }
    std::vector<unsigned char> bytes = ParseHex(str);
    std::array<unsigned char, TCT_HASH_SIZE> arr;
    std::copy(bytes.begin(), bytes.end(), arr.begin());
    return Hash(arr);
}

}
