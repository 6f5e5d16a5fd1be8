/// \file util.hh
#pragma once

/// \cond DO_NOT_DOCUMENT
#ifdef _WIN32
#include <winsock2.h>
#include <windows.h>
#else
#include <sys/time.h>
#endif

// ssize_t definition for all systems
#if defined(_MSC_VER)
typedef SSIZE_T ssize_t;
#else
#include <sys/types.h>
#endif

#include <stdint.h>

/// \endcond

/**
 * \enum NLS_ERROR
 *
 * \brief nalstream error codes
 *
 * \details These error values are returned from various nalstream functions. Functions that return a pointer set nls_errno global value that should be checked if a function call failed
 */
typedef enum NLS_ERROR {
    /// \cond DO_NOT_DOCUMENT
    NLS_PKT_READY           = 5,
    NLS_INTERRUPTED         = 2,
    NLS_NOT_READY           = 1,
    /// \endcond

    NLS_OK                  = 0,    ///< Success
    NLS_GENERIC_ERROR       = -1,   ///< Generic error condition
    NLS_SOCKET_ERROR        = -2,   ///< Failed to create socket
    NLS_BIND_ERROR          = -3,   ///< Failed to bind to interface
    NLS_INVALID_VALUE       = -4,   ///< Invalid value
    NLS_SEND_ERROR          = -5,   ///< Writing to the outbound stream failed
    NLS_MEMORY_ERROR        = -6,   ///< Memory allocation failed
    NLS_INITIALIZED         = -8,   ///< Object already initialized
    NLS_NOT_INITIALIZED     = -9,   ///< Object has not been initialized
    NLS_RECV_ERROR          = -11,  ///< Reading from the inbound stream failed
    NLS_TIMEOUT             = -12,  ///< Operation timed out
    NLS_NOT_FOUND           = -13,  ///< Object not found
    NLS_PROTOCOL_ERROR      = -14,  ///< Received packet violates the framing protocol
    NLS_PEER_REJECTED       = -15,  ///< Another peer is already bound
    NLS_DECODER_ERROR       = -16,  ///< External decoder rejected a configuration or a unit
} nls_error_t;

/**
 * \enum NLS_UNIT_KIND
 *
 * \brief Kind of an encoded unit, derived from its leading marker byte
 */
typedef enum NLS_UNIT_KIND {
    NLS_UNIT_FRAME            = 0, ///< Coded frame, decodable only after bootstrap
    NLS_UNIT_CONFIG_PRIMARY   = 1, ///< First configuration unit (H.264 SPS)
    NLS_UNIT_CONFIG_SECONDARY = 2, ///< Second configuration unit (H.264 PPS)
} nls_unit_kind_t;

/**
 * \enum NLS_PEER_STATE
 *
 * \brief Peer states reported by the transport
 */
typedef enum NLS_PEER_STATE {
    NLS_PEER_CONNECTING   = 0,
    NLS_PEER_CONNECTED    = 1,
    NLS_PEER_DISCONNECTED = 2,
} nls_peer_state_t;

/**
 * \enum NLS_CTX_ENABLE_FLAGS
 *
 * \brief Flags given to nalstream::binder constructor, they select the role of the binder
 */
enum NLS_CTX_ENABLE_FLAGS {
    NCE_NO_FLAGS = 0,

    /** Bound peer receives our encoded units. An outbound stream is opened
     * to the peer as soon as it connects. */
    NCE_SENDER   = 1 << 0,

    /** Bound peer sends us encoded units, which are reassembled and
     * forwarded to the decoder once bootstrap has completed */
    NCE_RECEIVER = 1 << 1,

    /// \cond DO_NOT_DOCUMENT
    NCE_LAST     = 1 << 2
    /// \endcond
};

/**
 * \enum NLS_CTX_CONFIGURATION_FLAGS
 *
 * \brief Configuration flags given to nalstream::binder::configure_ctx
 *
 * \details New values are applied to the next peer binding
 */
enum NLS_CTX_CONFIGURATION_FLAGS {
    /// \cond DO_NOT_DOCUMENT
    NCC_NO_FLAGS = 0,
    /// \endcond

    /** How many units can wait in the send queue before frames are dropped.
     *
     * Default is 64 */
    NCC_SEND_QUEUE_SIZE = 1,

    /** How many milliseconds a configuration unit may wait for space in a send queue
     * full of configuration units. Queued frames are dropped to make room for
     * configuration before it waits. Frames never wait.
     *
     * Default is 200 milliseconds */
    NCC_CONFIG_ENQUEUE_TIMEOUT_MS = 2,

    /** How many milliseconds a packet write may stall (transport accepting no bytes)
     * before the stream is considered broken and the peer is torn down.
     *
     * Default is 1000 milliseconds */
    NCC_WRITE_TIMEOUT_MS = 3,

    /** Largest unit accepted by the receiver, larger packets are protocol violations.
     *
     * Default is 8 MB */
    NCC_MAX_UNIT_SIZE = 4,

    /** How many decoded frames are kept for pull_frame() before the oldest is dropped.
     *
     * Default is 64 */
    NCC_MAX_PENDING_FRAMES = 5,

    /** Size of one read from the inbound stream (nalstream::tcp_transport).
     *
     * Default is 16 kB */
    NCC_READ_BUFFER_SIZE = 6,

    /// \cond DO_NOT_DOCUMENT
    NCC_LAST
    /// \endcond
};

extern thread_local nls_error_t nls_errno;
