#pragma once

#include "nalstream/decoder.hh"
#include "nalstream/unit.hh"
#include "nalstream/util.hh"

#include "counters.hh"

#include <memory>
#include <string>

namespace nalstream {

    class bootstrap;
    class decode_gate;
    class reassembler;

    /* State of the one peer a binder is bound to.
     *
     * A sending binding only identifies the peer, the outbound stream is written by the
     * packetizer of the binder. A receiving binding owns the reassembler, the bootstrap
     * state machine and the decode gate of the inbound stream.
     *
     * The binding is discarded when the peer goes away, a reconnecting peer always
     * gets a fresh binding. */
    class peer_binding {
        public:
            peer_binding(const std::string& peer, int nce_flags, std::shared_ptr<nalstream::counters> stats);
            ~peer_binding();

            /* Prepare the inbound path of a receiving binding
             *
             * Return NLS_OK on success
             * Return NLS_INVALID_VALUE if "dec" is nullptr */
            nls_error_t init_receiver(std::shared_ptr<nalstream::decoder> dec, size_t max_unit_size,
                size_t max_pending_frames);

            /* Reassemble "data" and drive the bootstrap and the decoder with the completed units.
             * Must be called only from the read context of the inbound stream
             *
             * Return NLS_OK on success
             * Return NLS_PROTOCOL_ERROR if the chunk contained packets that were rejected
             * Return NLS_NOT_INITIALIZED if the binding is not receiving or has been closed */
            nls_error_t process_bytes(const uint8_t *data, size_t len);

            /* Stop all decode submissions and invalidate the decoder session */
            void close();
            bool closed() const;

            /* See decode_gate::pull_frame() */
            nalstream::unit::decoded_frame *pull_frame(int timeout_ms);

            const std::string& peer() const;
            uint32_t id() const;
            bool receiving() const;

        private:
            void handle_unit(const nalstream::unit::encoded_unit& unit);

            std::string peer_;
            int nce_flags_;

            /* random tag used to pair log lines and fault reports with the binding */
            uint32_t id_;

            std::shared_ptr<nalstream::counters> stats_;

            std::unique_ptr<nalstream::reassembler> reassembler_;
            std::unique_ptr<nalstream::bootstrap> bootstrap_;
            std::unique_ptr<nalstream::decode_gate> gate_;
    };
}
