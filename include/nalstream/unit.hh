#pragma once

#include "util.hh"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nalstream {

    /** \brief Opaque handle of a decoder session, created by nalstream::decoder::create() */
    typedef uint64_t session_handle;

    /** \brief Value of a session handle that is not bound to any decoder session */
    constexpr session_handle NLS_INVALID_SESSION = 0;

    namespace unit {

        /**
         * \brief One self-contained output chunk of the encoder
         *
         * \details Encoded units are moved through the library, never copied
         * once they have been handed over by the encoder */
        struct encoded_unit {
            nls_unit_kind_t kind = NLS_UNIT_FRAME;
            std::vector<uint8_t> data;
        };

        /**
         * \brief Configuration units that must reach the decoder before any frame
         *
         * \details The set is complete once both the primary and the secondary unit are present.
         * A complete set is not modified, a new set is built on renegotiation instead */
        struct configuration_set {
            std::vector<uint8_t> primary;
            std::vector<uint8_t> secondary;

            /* CRC-32 of primary || secondary, valid only when the set is complete */
            uint32_t fingerprint = 0;

            bool complete() const
            {
                return !primary.empty() && !secondary.empty();
            }
        };

        /**
         * \brief Frame produced by the decoder
         *
         * \details If status is not NLS_OK, the decoder failed to decode the unit
         * and the rest of the fields are not valid */
        struct decoded_frame {
            nls_error_t status = NLS_OK;
            uint32_t width = 0;
            uint32_t height = 0;

            /* running number of the unit that was submitted to the decoder */
            uint64_t sequence = 0;

            std::vector<uint8_t> data;
        };

        /* Allocate an encoded unit and classify it using its first byte
         *
         * Return pointer to unit on success
         * Return nullptr and set nls_errno if "data" is nullptr or "len" is 0 */
        encoded_unit *alloc_unit(const uint8_t *data, size_t len);

        /* Deallocate a unit returned by alloc_unit() or binder::pull_frame()
         *
         * Return NLS_OK on success
         * Return NLS_INVALID_VALUE if the pointer is nullptr */
        nls_error_t dealloc_unit(encoded_unit *unit);
        nls_error_t dealloc_frame(decoded_frame *frame);

        /* Build a configuration set from two units and compute its fingerprint */
        configuration_set make_configuration(std::vector<uint8_t> primary, std::vector<uint8_t> secondary);

        /* Split an H.264 Annex-B elementary stream into classified units, start codes removed */
        std::vector<encoded_unit> split_annexb(const uint8_t *data, size_t len);

        /* Append "unit" to "out" with a 4-byte Annex-B start code in front of it */
        void append_annexb(std::vector<uint8_t>& out, const encoded_unit& unit);
    }
}
