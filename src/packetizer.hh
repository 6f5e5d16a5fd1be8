#pragma once

#include "nalstream/transport.hh"
#include "nalstream/unit.hh"
#include "nalstream/util.hh"

#include "counters.hh"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace nalstream {

    /* Called from the writer thread when the outbound stream of "peer" broke */
    typedef std::function<void(const std::string& peer, nls_error_t reason)> fault_handler;

    /* Writes the encoder output to the outbound stream of the bound peer.
     *
     * The encoder side only enqueues units into a bounded queue, a writer thread
     * frames them as length-prefixed packets and writes them to the transport.
     *
     * The packetizer remembers the latest configuration set produced by the encoder
     * and writes it first every time it is started for a peer, so a peer that joins
     * late can bootstrap its decoder before the first frame arrives. */
    class packetizer {
        public:
            packetizer(std::shared_ptr<nalstream::transport> transport,
                std::shared_ptr<nalstream::counters> stats);
            ~packetizer();

            /* Limits used by the next start() call */
            void set_queue_size(size_t size);
            void set_config_timeout(int timeout_ms);
            void set_write_timeout(int timeout_ms);

            /* Start writing to "peer". The stream must have been opened already
             *
             * The cached configuration set, if there is one, is queued before anything else,
             * followed by a primary unit still waiting for its secondary.
             * "on_fault" is called from the writer thread if the stream breaks, the
             * packetizer has stopped itself before that.
             *
             * Return NLS_OK on success
             * Return NLS_INITIALIZED if the packetizer is already running
             * Return NLS_MEMORY_ERROR if the writer thread could not be created */
            nls_error_t start(const std::string& peer, nalstream::fault_handler on_fault);

            /* Stop the writer and discard queued units
             *
             * May be called from the fault handler, the writer thread is then joined
             * by the next start() or stop() call made from another thread */
            nls_error_t stop();

            /* Hand over one unit produced by the encoder
             *
             * Configuration units always update the cached configuration set.
             *
             * Return NLS_OK if the unit was queued
             * Return NLS_NOT_READY if a frame was dropped (no peer, no configuration set or full queue)
             * Return NLS_TIMEOUT if a configuration unit found the queue full of configuration
             *                    units and the writer made no room in time */
            nls_error_t emit(nalstream::unit::encoded_unit&& unit);

        private:
            void writer(std::string peer, nalstream::fault_handler on_fault, int write_timeout_ms);

            /* Write the whole packet of "unit", retrying partial and empty writes
             *
             * Return NLS_OK on success
             * Return NLS_INTERRUPTED if the packetizer was stopped during the write
             * Return NLS_SEND_ERROR if the transport reported a broken stream
             * Return NLS_TIMEOUT if the transport accepted nothing for too long */
            nls_error_t write_packet(const std::string& peer, const nalstream::unit::encoded_unit& unit,
                int write_timeout_ms);
            nls_error_t write_range(const std::string& peer, const uint8_t *data, size_t len,
                int write_timeout_ms);

            /* Append a configuration unit, lock must be held
             *
             * A full queue gives up its newest frame. If the queue holds nothing but
             * configuration units, wait up to "timeout_ms" for the writer to make room */
            nls_error_t enqueue_locked(std::unique_lock<std::mutex>& lk,
                nalstream::unit::encoded_unit&& unit, int timeout_ms);

            /* Remove the newest queued frame, return false if there is none */
            bool evict_frame_locked();

            void update_configuration_locked(const nalstream::unit::encoded_unit& unit);

            std::shared_ptr<nalstream::transport> transport_;
            std::shared_ptr<nalstream::counters> stats_;

            size_t queue_size_;
            int config_timeout_ms_;
            int write_timeout_ms_;

            mutable std::mutex queue_mtx_;
            std::condition_variable queue_cond_;
            std::condition_variable space_cond_;
            std::deque<nalstream::unit::encoded_unit> queue_;

            std::atomic<bool> active_;
            std::atomic<bool> should_stop_;
            std::unique_ptr<std::thread> writer_;

            /* writers that stopped themselves after a fault, joined by stop() */
            std::vector<std::unique_ptr<std::thread>> retired_;

            /* primary unit of a configuration set whose secondary has not been produced yet */
            std::vector<uint8_t> pending_primary_;
            nalstream::unit::configuration_set config_;
    };
}
