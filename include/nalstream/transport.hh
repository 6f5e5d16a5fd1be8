#pragma once

#include "util.hh"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace nalstream {

    /* Called by the transport from its read context when bytes of an inbound stream arrive */
    typedef std::function<void(const std::string& peer, const uint8_t *data, size_t len)> bytes_handler;

    /* Called by the transport when the state of a peer changes */
    typedef std::function<void(const std::string& peer, nls_peer_state_t state)> state_handler;

    /**
     * \brief Interface of the pairwise, ordered byte-stream transport
     *
     * \details The transport delivers bytes in order but with arbitrary chunk boundaries.
     * nalstream::tcp_transport is the implementation shipped with the library, other
     * peer-to-peer channels can be plugged in by implementing this interface. */
    class transport {
        public:
            virtual ~transport() {}

            /**
             * \brief Open an outbound stream to a connected peer
             *
             * \retval NLS_OK        On success
             * \retval NLS_NOT_FOUND If the peer is not connected
             */
            virtual nls_error_t open_stream(const std::string& peer) = 0;

            /**
             * \brief Write bytes to the outbound stream of a peer
             *
             * \details The transport may accept fewer bytes than requested.
             *
             * \return Number of bytes accepted, 0 if nothing could be accepted right now,
             * negative value if the stream is broken */
            virtual ssize_t write(const std::string& peer, const uint8_t *data, size_t len) = 0;

            /**
             * \brief Close the outbound stream of a peer */
            virtual void close_stream(const std::string& peer) = 0;

            /**
             * \brief Install the handlers that receive transport events
             *
             * \details Empty handlers uninstall the previous ones. After this call returns,
             * the old handlers are not called anymore. */
            virtual void install_handlers(bytes_handler on_bytes, state_handler on_state) = 0;
    };
}
