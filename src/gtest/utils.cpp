#include "gtest/utils.h"

libtct::Commitment TestCommitment(uint32_t n)
{
    std::array<unsigned char, TCT_COMMITMENT_SIZE> bytes = {};
    bytes[0] = n & 0xff;
    bytes[1] = (n >> 8) & 0xff;
    bytes[2] = (n >> 16) & 0xff;
    bytes[3] = (n >> 24) & 0xff;
    bytes[TCT_COMMITMENT_SIZE - 1] = 0xcc;
    return libtct::Commitment(bytes);
}

fs::path UniqueTempPath()
{
    return fs::temp_directory_path() / fs::unique_path("tct_test_%%%%%%%%");
}
