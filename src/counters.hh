#pragma once

#include <atomic>
#include <cstdint>

namespace nalstream {

    /* Event counters shared by all components of one binder.
     * Counters keep growing over peer bindings, see nalstream::stats for their meaning */
    struct counters {
        std::atomic<uint64_t> units_sent{0};
        std::atomic<uint64_t> bytes_sent{0};
        std::atomic<uint64_t> frames_dropped_saturated{0};
        std::atomic<uint64_t> frames_dropped_no_config{0};
        std::atomic<uint64_t> frames_dropped_no_peer{0};
        std::atomic<uint64_t> config_enqueue_timeouts{0};
        std::atomic<uint64_t> write_faults{0};

        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> units_received{0};
        std::atomic<uint64_t> bytes_from_unbound_peer{0};
        std::atomic<uint64_t> protocol_violations{0};
        std::atomic<uint64_t> units_dropped_not_ready{0};
        std::atomic<uint64_t> renegotiations{0};

        std::atomic<uint64_t> sessions_created{0};
        std::atomic<uint64_t> sessions_invalidated{0};
        std::atomic<uint64_t> decoder_create_errors{0};
        std::atomic<uint64_t> decode_errors{0};
        std::atomic<uint64_t> frames_decoded{0};
        std::atomic<uint64_t> frames_dropped_unpulled{0};

        std::atomic<uint64_t> peers_bound{0};
        std::atomic<uint64_t> peers_rejected{0};

        std::atomic<uint32_t> config_fingerprint{0};
    };
}
