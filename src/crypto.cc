#include "crypto.hh"

/* ***************** crc32 ***************** */

nalstream::crypto::crc32::digest::digest()
{
}

nalstream::crypto::crc32::digest::~digest()
{
}

void nalstream::crypto::crc32::digest::update(const uint8_t *data, size_t len)
{
    if (data && len)
        crc_.Update(data, len);
}

uint32_t nalstream::crypto::crc32::digest::final()
{
    uint32_t out = 0;

    crc_.TruncatedFinal((uint8_t *)&out, sizeof(uint32_t));
    return out;
}

uint32_t nalstream::crypto::crc32::calculate_crc32(const uint8_t *input, size_t len)
{
    CryptoPP::CRC32 crc32;
    uint32_t out;

    crc32.Update(input, len);
    crc32.TruncatedFinal((uint8_t *)&out, sizeof(uint32_t));

    return out;
}
