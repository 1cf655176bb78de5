#ifndef TCT_COMMITMENT_H_
#define TCT_COMMITMENT_H_

#include <array>
#include <optional>
#include <string>

#include "serialize.h"

#include "Hash.hpp"
#include "Tct.h"

namespace libtct {

/** A note commitment, the raw item recorded at each leaf of the tree. */
class Commitment {
private:
    std::array<unsigned char, TCT_COMMITMENT_SIZE> bytes;

public:
    Commitment() { bytes.fill(0); }
    explicit Commitment(const std::array<unsigned char, TCT_COMMITMENT_SIZE>& bytes) : bytes(bytes) { }

    Hash hash() const;

    const std::array<unsigned char, TCT_COMMITMENT_SIZE>& GetBytes() const { return bytes; }

    std::string GetHex() const;
    static std::optional<Commitment> FromHex(const std::string& str);

    friend bool operator==(const Commitment& a, const Commitment& b) { return a.bytes == b.bytes; }
    friend bool operator!=(const Commitment& a, const Commitment& b) { return a.bytes != b.bytes; }
    friend bool operator<(const Commitment& a, const Commitment& b) { return a.bytes < b.bytes; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(bytes);
    }
};

}

#endif // TCT_COMMITMENT_H_
