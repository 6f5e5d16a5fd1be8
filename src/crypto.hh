#pragma once

#include <cryptopp/crc.h>

#include <cstddef>
#include <cstdint>

namespace nalstream {

    namespace crypto {

        namespace crc32 {

            /* incremental CRC-32 for inputs that are not contiguous in memory */
            class digest {
                public:
                    digest();
                    ~digest();

                    void update(const uint8_t *data, size_t len);
                    uint32_t final();

                private:
                    CryptoPP::CRC32 crc_;
            };

            uint32_t calculate_crc32(const uint8_t *input, size_t len);
        }
    }
}
