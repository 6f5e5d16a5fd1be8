#pragma once

#include "decoder.hh"
#include "transport.hh"
#include "unit.hh"
#include "util.hh"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace nalstream {

    /// \cond DO_NOT_DOCUMENT
    struct counters;
    class packetizer;
    class peer_binding;
    /// \endcond

    /**
     * \brief Snapshot of the binder counters
     *
     * \details Counters keep growing over peer bindings, they are never reset
     */
    struct stats {
        /* sending side */
        uint64_t units_sent = 0;               ///< Packets written completely to the outbound stream
        uint64_t bytes_sent = 0;               ///< Bytes written, length prefixes included
        uint64_t frames_dropped_saturated = 0; ///< Frames dropped because the send queue was full
        uint64_t frames_dropped_no_config = 0; ///< Frames dropped because no configuration set was known
        uint64_t frames_dropped_no_peer = 0;   ///< Frames dropped because no peer was bound
        uint64_t config_enqueue_timeouts = 0;  ///< Configuration units that did not fit in the send queue
        uint64_t write_faults = 0;             ///< Outbound streams torn down after a write failure

        /* receiving side */
        uint64_t bytes_received = 0;           ///< Bytes received from the bound peer
        uint64_t units_received = 0;           ///< Units reassembled from the inbound stream
        uint64_t bytes_from_unbound_peer = 0;  ///< Bytes dropped because they came from another peer
        uint64_t protocol_violations = 0;      ///< Zero-length and oversized packets
        uint64_t units_dropped_not_ready = 0;  ///< Units dropped before the decoder session was ready
        uint64_t renegotiations = 0;           ///< Configuration changes that replaced the decoder session

        /* decoder */
        uint64_t sessions_created = 0;
        uint64_t sessions_invalidated = 0;
        uint64_t decoder_create_errors = 0;
        uint64_t decode_errors = 0;
        uint64_t frames_decoded = 0;
        uint64_t frames_dropped_unpulled = 0;  ///< Decoded frames dropped because pull_frame() fell behind

        /* peers */
        uint64_t peers_bound = 0;
        uint64_t peers_rejected = 0;

        /** CRC-32 fingerprint of the configuration set of the active decoder session, 0 if there is none */
        uint32_t config_fingerprint = 0;
    };

    /**
     * \brief Binds one peer of a transport to the encoder or the decoder
     *
     * \details A sending binder (#NCE_SENDER) writes the units handed to push_unit()
     * to the outbound stream of the bound peer. A receiving binder (#NCE_RECEIVER)
     * reconstructs units from the inbound stream of the bound peer, bootstraps the decoder
     * with the configuration units and forwards the frames to it.
     *
     * The first peer that connects is bound, other peers are rejected until it disconnects.
     */
    class binder {
        public:
            /**
             * \brief Create a binder
             *
             * \param nce_flags Exactly one of #NCE_SENDER and #NCE_RECEIVER
             * \param transport Transport whose peer events drive the binder
             * \param dec Decoder, required for a receiving binder, ignored otherwise
             */
            binder(int nce_flags, std::shared_ptr<nalstream::transport> transport,
                std::shared_ptr<nalstream::decoder> dec);
            ~binder();

            /**
             * \brief Validate the parameters and install the transport handlers
             *
             * \retval NLS_OK            On success
             * \retval NLS_INITIALIZED   If the binder has been initialized already
             * \retval NLS_INVALID_VALUE If the flags do not select exactly one role,
             * the transport is nullptr or a receiving binder has no decoder
             */
            nls_error_t init();

            /**
             * \brief Configure the binder, see ::NLS_CTX_CONFIGURATION_FLAGS
             *
             * \details New values take effect when the next peer is bound
             *
             * \retval NLS_OK            On success
             * \retval NLS_INVALID_VALUE If the flag is unknown or the value is out of range
             */
            nls_error_t configure_ctx(int ncc_flag, ssize_t value);

            /**
             * \brief Current value of a configuration flag
             *
             * \return Value of the flag, -1 if the flag is unknown
             */
            int get_configuration_value(int ncc_flag);

            /**
             * \brief Handle a peer state change reported by the transport
             *
             * \retval NLS_OK            On success
             * \retval NLS_PEER_REJECTED If another peer is bound already
             * \retval NLS_NOT_FOUND     If an unbound peer disconnected
             * \retval NLS_NOT_INITIALIZED If init() has not been called
             */
            nls_error_t peer_state_changed(const std::string& peer, nls_peer_state_t state);

            /**
             * \brief Handle bytes of an inbound stream reported by the transport
             *
             * \retval NLS_OK             On success
             * \retval NLS_NOT_FOUND      If the bytes came from a peer that is not bound
             * \retval NLS_PROTOCOL_ERROR If packets of the chunk were rejected, the stream continues
             */
            nls_error_t bytes_received(const std::string& peer, const uint8_t *data, size_t len);

            /**
             * \brief Hand over one unit produced by the encoder
             *
             * \details The unit is classified by its first byte and copied into the send queue.
             * A configuration unit takes the place of the newest queued frame when the send
             * queue is full. The call blocks only when the queue holds nothing but configuration
             * units, see #NCC_CONFIG_ENQUEUE_TIMEOUT_MS.
             *
             * \retval NLS_OK            If the unit was queued or cached
             * \retval NLS_NOT_READY     If a frame was dropped
             * \retval NLS_TIMEOUT       If a configuration unit could not be queued in time
             * \retval NLS_INVALID_VALUE If "data" is nullptr or "len" is 0
             * \retval NLS_NOT_INITIALIZED If the binder is not an initialized sending binder
             */
            nls_error_t push_unit(const uint8_t *data, size_t len);
            nls_error_t push_unit(nalstream::unit::encoded_unit&& unit);

            /**
             * \brief Wait for the next decoded frame
             *
             * \details Blocks until a frame is available or the binder is destroyed
             *
             * \return Decoded frame, release it with nalstream::unit::dealloc_frame()
             * \retval nullptr If no frame is available, nls_errno tells why
             */
            nalstream::unit::decoded_frame *pull_frame();

            /**
             * \brief Wait at most "timeout_ms" milliseconds for the next decoded frame
             *
             * \return Decoded frame, release it with nalstream::unit::dealloc_frame()
             * \retval nullptr If no frame arrived in time, nls_errno is set to NLS_TIMEOUT
             */
            nalstream::unit::decoded_frame *pull_frame(size_t timeout_ms);

            /** \brief Snapshot of the counters */
            nalstream::stats get_stats() const;

            /** \brief Identifier of the bound peer, empty if no peer is bound */
            std::string active_peer() const;

        private:
            nls_error_t bind_peer(const std::string& peer);
            nls_error_t unbind_peer(const std::string& peer);
            void handle_write_fault(uint32_t binding_id, const std::string& peer, nls_error_t reason);

            /* Release the resources of a binding that has already been detached */
            void teardown(std::shared_ptr<nalstream::peer_binding> binding);

            nalstream::unit::decoded_frame *wait_frame(int timeout_ms);

            int nce_flags_;
            bool initialized_;

            std::shared_ptr<nalstream::transport> transport_;
            std::shared_ptr<nalstream::decoder> decoder_;
            std::shared_ptr<nalstream::counters> stats_;
            std::unique_ptr<nalstream::packetizer> packetizer_;

            /* serializes binding and teardown, never taken by the writer thread */
            std::mutex lifecycle_mtx_;

            mutable std::mutex binding_mtx_;
            std::condition_variable binding_cond_;
            std::shared_ptr<nalstream::peer_binding> active_;
            bool closing_;

            /* configuration applied to the next binding */
            size_t send_queue_size_;
            int config_timeout_ms_;
            int write_timeout_ms_;
            size_t max_unit_size_;
            size_t max_pending_frames_;
    };
}
