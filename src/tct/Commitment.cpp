#include "Commitment.hpp"

#include "util/strencodings.h"

#include <algorithm>

namespace libtct {

Hash Commitment::hash() const
{
    return Hash::of_leaf(bytes.data(), bytes.size());
}

std::string Commitment::GetHex() const
{
    return HexStr(bytes.begin(), bytes.end());
}

std::optional<Commitment> Commitment::FromHex(const std::string& str)
{
    if (str.size() != 2 * TCT_COMMITMENT_SIZE || !IsHex(str)) {
        return std::nullopt;
    }
    std::vector<unsigned char> parsed = ParseHex(str);
    std::array<unsigned char, TCT_COMMITMENT_SIZE> arr;
    std::copy(parsed.begin(), parsed.end(), arr.begin());
    return Commitment(arr);
}

}
