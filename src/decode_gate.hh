#pragma once

#include "nalstream/decoder.hh"
#include "nalstream/unit.hh"
#include "nalstream/util.hh"

#include "counters.hh"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <utility>

namespace nalstream {

    /* Owns the decoder session of one inbound stream.
     *
     * Session creation, decode submissions and invalidation are serialized with one mutex
     * so a session is never invalidated while a decode call might be using it. Once the
     * gate has been closed, no more calls reach the decoder.
     *
     * Decode results are kept in submission order and handed out by pull_frame() */
    class decode_gate {
        public:
            decode_gate(std::shared_ptr<nalstream::decoder> dec, std::shared_ptr<nalstream::counters> stats,
                size_t max_pending_frames);
            ~decode_gate();

            /* Create a decoder session for "config"
             *
             * Return NLS_OK on success
             * Return NLS_INITIALIZED if a session already exists
             * Return NLS_NOT_INITIALIZED if the gate has been closed
             * Return NLS_DECODER_ERROR if the decoder rejected the configuration */
            nls_error_t create(const nalstream::unit::configuration_set& config);

            /* Invalidate the current session, if there is one */
            void invalidate();

            /* Submit a frame unit to the current session
             *
             * Return NLS_OK on success
             * Return NLS_NOT_READY if there is no session
             * Return NLS_NOT_INITIALIZED if the gate has been closed
             * Return NLS_DECODER_ERROR if the decoder rejected the unit */
            nls_error_t decode(const nalstream::unit::encoded_unit& unit);

            /* Stop all future submissions, then invalidate the session.
             * Pending results are discarded and waiting pull_frame() calls return */
            void close();

            bool closed() const;

            /* Wait for the oldest decoded frame
             *
             * Frames the decoder failed to decode are counted and skipped.
             * A negative timeout waits until a frame arrives or the gate is closed.
             *
             * Return pointer to the frame on success, release with nalstream::unit::dealloc_frame()
             * Return nullptr on timeout or if the gate was closed */
            nalstream::unit::decoded_frame *pull_frame(int timeout_ms);

        private:
            void invalidate_locked();

            std::shared_ptr<nalstream::decoder> decoder_;
            std::shared_ptr<nalstream::counters> stats_;

            mutable std::mutex session_mtx_;
            nalstream::session_handle session_;
            std::atomic<bool> closed_;
            uint64_t sequence_;

            std::mutex frames_mtx_;
            std::condition_variable frames_cond_;
            std::deque<std::pair<uint64_t, std::future<nalstream::unit::decoded_frame>>> frames_;
            size_t max_pending_frames_;
    };
}
