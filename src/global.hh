#pragma once

#include <cstddef>
#include <cstdint>

namespace nalstream {
    /* every packet starts with a 4-byte big-endian payload length */
    constexpr size_t LENGTH_PREFIX_SIZE = 4;

    constexpr size_t DEFAULT_MAX_UNIT_SIZE = 8 * 1024 * 1024;

    constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 64;
    constexpr int DEFAULT_CONFIG_ENQUEUE_TIMEOUT_MS = 200;
    constexpr int DEFAULT_WRITE_TIMEOUT_MS = 1000;

    /* how long the writer sleeps when the transport accepted no bytes */
    constexpr int WRITE_BACKOFF_MS = 2;

    constexpr size_t DEFAULT_MAX_PENDING_FRAMES = 64;

    constexpr size_t DEFAULT_READ_BUFFER_SIZE = 16 * 1024;

    /* receive buffer is compacted once the consumed prefix grows past this */
    constexpr size_t RECEIVE_BUFFER_COMPACT_THRESHOLD = 64 * 1024;

    constexpr int DEFAULT_POLL_TIMEOUT_MS = 100;
}
