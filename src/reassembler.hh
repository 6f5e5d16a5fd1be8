#pragma once

#include "nalstream/unit.hh"
#include "nalstream/util.hh"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nalstream {

    /* Reconstructs encoded units from the length-prefixed byte stream of one inbound stream.
     *
     * The transport may split the stream at any byte, so the reassembler keeps the
     * bytes of an incomplete packet in its receive buffer until the rest arrives.
     *
     * Only one thread (the read context of the inbound stream) may use an object. */
    class reassembler {
        public:
            reassembler(size_t max_unit_size);
            ~reassembler();

            /* Append "len" bytes to the tail of the receive buffer
             *
             * Return NLS_OK on success
             * Return NLS_INVALID_VALUE if "data" is nullptr */
            nls_error_t push_bytes(const uint8_t *data, size_t len);

            /* Extract the next complete unit from the receive buffer
             *
             * Units are returned in the order their packets were written. Call this
             * until it returns NLS_NOT_READY after each push_bytes().
             *
             * Return NLS_PKT_READY if "out" contains a unit
             * Return NLS_NOT_READY if the buffer does not hold a complete packet
             * Return NLS_PROTOCOL_ERROR if a zero-length or oversized packet was consumed,
             * no unit is returned but the caller should keep pulling */
            nls_error_t pull_unit(nalstream::unit::encoded_unit& out);

            /* Push "len" bytes and collect all units that became ready
             *
             * Return NLS_OK if no protocol violations were encountered
             * Return NLS_PROTOCOL_ERROR if at least one packet was rejected */
            nls_error_t feed(const uint8_t *data, size_t len, std::vector<nalstream::unit::encoded_unit>& out);

            /* Discard buffered bytes and any pending skip */
            void reset();

            /* Number of buffered bytes that have not been consumed yet */
            size_t buffered() const;

            size_t protocol_violations() const;

        private:
            /* Remove "n" bytes from the front of the buffer */
            void consume(size_t n);

            std::vector<uint8_t> buffer_;

            /* read position, bytes before this have been consumed */
            size_t head_;

            /* payload bytes of a rejected oversized packet that are still to arrive */
            size_t skip_;

            size_t max_unit_size_;
            size_t violations_;
    };
}
