#include "packetizer.hh"

#include "debug.hh"
#include "global.hh"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <system_error>
#include <utility>

static inline void write_be32(uint8_t *ptr, uint32_t value)
{
    ptr[0] = (value >> 24) & 0xff;
    ptr[1] = (value >> 16) & 0xff;
    ptr[2] = (value >>  8) & 0xff;
    ptr[3] = (value >>  0) & 0xff;
}

nalstream::packetizer::packetizer(std::shared_ptr<nalstream::transport> transport,
    std::shared_ptr<nalstream::counters> stats) :
    transport_(transport),
    stats_(stats),
    queue_size_(DEFAULT_SEND_QUEUE_SIZE),
    config_timeout_ms_(DEFAULT_CONFIG_ENQUEUE_TIMEOUT_MS),
    write_timeout_ms_(DEFAULT_WRITE_TIMEOUT_MS),
    queue_(),
    active_(false),
    should_stop_(true),
    writer_(nullptr),
    retired_(),
    pending_primary_(),
    config_()
{
}

nalstream::packetizer::~packetizer()
{
    stop();
}

void nalstream::packetizer::set_queue_size(size_t size)
{
    std::lock_guard<std::mutex> lg(queue_mtx_);
    queue_size_ = size;
}

void nalstream::packetizer::set_config_timeout(int timeout_ms)
{
    std::lock_guard<std::mutex> lg(queue_mtx_);
    config_timeout_ms_ = timeout_ms;
}

void nalstream::packetizer::set_write_timeout(int timeout_ms)
{
    std::lock_guard<std::mutex> lg(queue_mtx_);
    write_timeout_ms_ = timeout_ms;
}

nls_error_t nalstream::packetizer::start(const std::string& peer, nalstream::fault_handler on_fault)
{
    std::lock_guard<std::mutex> lg(queue_mtx_);

    if (active_)
        return NLS_INITIALIZED;

    /* writer of the previous peer may still be returning from its fault handler */
    if (writer_)
        retired_.push_back(std::move(writer_));

    queue_.clear();
    should_stop_ = false;

    if (config_.complete()) {
        nalstream::unit::encoded_unit primary;
        nalstream::unit::encoded_unit secondary;

        primary.kind   = NLS_UNIT_CONFIG_PRIMARY;
        primary.data   = config_.primary;
        secondary.kind = NLS_UNIT_CONFIG_SECONDARY;
        secondary.data = config_.secondary;

        queue_.push_back(std::move(primary));
        queue_.push_back(std::move(secondary));

        NLS_LOG_DEBUG("Configuration 0x%08x queued for %s", config_.fingerprint, peer.c_str());
    }

    /* the secondary of this primary is still to come from the encoder */
    if (!pending_primary_.empty()) {
        nalstream::unit::encoded_unit primary;

        primary.kind = NLS_UNIT_CONFIG_PRIMARY;
        primary.data = pending_primary_;

        queue_.push_back(std::move(primary));
    }

    int write_timeout = write_timeout_ms_;

    try {
        writer_ = std::unique_ptr<std::thread>(
            new std::thread(&nalstream::packetizer::writer, this, peer, on_fault, write_timeout)
        );
    } catch (const std::system_error& e) {
        NLS_LOG_ERROR("Failed to create writer thread: %s", e.what());
        should_stop_ = true;
        queue_.clear();
        return NLS_MEMORY_ERROR;
    }

    active_ = true;
    return NLS_OK;
}

nls_error_t nalstream::packetizer::stop()
{
    std::vector<std::unique_ptr<std::thread>> threads;

    {
        std::lock_guard<std::mutex> lg(queue_mtx_);

        /* called from the fault handler, writer has stopped itself already */
        if (writer_ && writer_->get_id() == std::this_thread::get_id())
            return NLS_OK;

        for (auto& thread : retired_) {
            if (thread->get_id() == std::this_thread::get_id())
                return NLS_OK;
        }

        active_      = false;
        should_stop_ = true;
        queue_.clear();

        if (writer_)
            threads.push_back(std::move(writer_));

        for (auto& thread : retired_)
            threads.push_back(std::move(thread));
        retired_.clear();
    }

    queue_cond_.notify_all();
    space_cond_.notify_all();

    for (auto& thread : threads) {
        if (thread->joinable())
            thread->join();
    }

    return NLS_OK;
}

nls_error_t nalstream::packetizer::emit(nalstream::unit::encoded_unit&& unit)
{
    if (unit.data.empty())
        return NLS_INVALID_VALUE;

    std::unique_lock<std::mutex> lk(queue_mtx_);

    if (unit.kind != NLS_UNIT_FRAME) {
        update_configuration_locked(unit);

        if (!active_)
            return NLS_OK;

        return enqueue_locked(lk, std::move(unit), config_timeout_ms_);
    }

    if (!active_) {
        ++stats_->frames_dropped_no_peer;
        NLS_LOG_DEBUG("No peer bound, dropping frame of %zu bytes", unit.data.size());
        return NLS_NOT_READY;
    }

    if (!config_.complete()) {
        ++stats_->frames_dropped_no_config;
        NLS_LOG_WARN("No configuration set known, dropping frame of %zu bytes", unit.data.size());
        return NLS_NOT_READY;
    }

    if (queue_.size() >= queue_size_) {
        ++stats_->frames_dropped_saturated;
        NLS_LOG_WARN("Send queue full (%zu units), dropping frame", queue_.size());
        return NLS_NOT_READY;
    }

    queue_.push_back(std::move(unit));
    queue_cond_.notify_one();

    return NLS_OK;
}

nls_error_t nalstream::packetizer::enqueue_locked(std::unique_lock<std::mutex>& lk,
    nalstream::unit::encoded_unit&& unit, int timeout_ms)
{
    if (queue_.size() >= queue_size_ && evict_frame_locked()) {
        ++stats_->frames_dropped_saturated;
        NLS_LOG_WARN("Send queue full (%zu units), frame dropped for a configuration unit", queue_size_);
    }

    /* only configuration units are queued, wait for the writer */
    if (queue_.size() >= queue_size_) {
        space_cond_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [this] {
            return queue_.size() < queue_size_ || !active_;
        });

        if (!active_)
            return NLS_OK;

        if (queue_.size() >= queue_size_) {
            ++stats_->config_enqueue_timeouts;
            NLS_LOG_ERROR("Configuration unit did not fit in the send queue within %d ms", timeout_ms);
            return NLS_TIMEOUT;
        }
    }

    queue_.push_back(std::move(unit));
    queue_cond_.notify_one();

    return NLS_OK;
}

bool nalstream::packetizer::evict_frame_locked()
{
    for (auto it = queue_.rbegin(); it != queue_.rend(); ++it) {
        if (it->kind == NLS_UNIT_FRAME) {
            queue_.erase(std::next(it).base());
            return true;
        }
    }

    return false;
}

void nalstream::packetizer::update_configuration_locked(const nalstream::unit::encoded_unit& unit)
{
    if (unit.kind == NLS_UNIT_CONFIG_PRIMARY) {
        pending_primary_ = unit.data;
        return;
    }

    std::vector<uint8_t> primary = pending_primary_.empty() ? config_.primary : pending_primary_;

    if (primary.empty()) {
        NLS_LOG_WARN("Secondary configuration unit produced before any primary, not caching it");
        return;
    }

    uint32_t old_fingerprint = config_.fingerprint;

    config_ = nalstream::unit::make_configuration(std::move(primary), unit.data);
    pending_primary_.clear();

    if (config_.fingerprint != old_fingerprint)
        NLS_LOG_INFO("Encoder produced configuration 0x%08x", config_.fingerprint);
}

void nalstream::packetizer::writer(std::string peer, nalstream::fault_handler on_fault, int write_timeout_ms)
{
    NLS_LOG_DEBUG("Writer for %s started", peer.c_str());

    for (;;) {
        nalstream::unit::encoded_unit unit;

        {
            std::unique_lock<std::mutex> lk(queue_mtx_);
            queue_cond_.wait(lk, [this] { return should_stop_ || !queue_.empty(); });

            if (should_stop_)
                break;

            unit = std::move(queue_.front());
            queue_.pop_front();
        }

        space_cond_.notify_one();

        nls_error_t ret = write_packet(peer, unit, write_timeout_ms);

        if (ret == NLS_OK) {
            ++stats_->units_sent;
            stats_->bytes_sent += LENGTH_PREFIX_SIZE + unit.data.size();
            continue;
        }

        if (ret == NLS_INTERRUPTED)
            break;

        {
            std::lock_guard<std::mutex> lg(queue_mtx_);

            /* stopped while writing, the stream is closed on purpose */
            if (should_stop_)
                break;

            should_stop_ = true;
            active_      = false;
            queue_.clear();
        }

        space_cond_.notify_all();

        ++stats_->write_faults;
        NLS_LOG_ERROR("Outbound stream to %s broke: %d", peer.c_str(), ret);

        if (on_fault)
            on_fault(peer, ret);
        break;
    }

    NLS_LOG_DEBUG("Writer for %s stopped", peer.c_str());
}

nls_error_t nalstream::packetizer::write_packet(const std::string& peer,
    const nalstream::unit::encoded_unit& unit, int write_timeout_ms)
{
    uint8_t header[LENGTH_PREFIX_SIZE];
    nls_error_t ret = NLS_OK;

    write_be32(header, (uint32_t)unit.data.size());

    if ((ret = write_range(peer, header, sizeof(header), write_timeout_ms)) != NLS_OK)
        return ret;

    return write_range(peer, unit.data.data(), unit.data.size(), write_timeout_ms);
}

nls_error_t nalstream::packetizer::write_range(const std::string& peer, const uint8_t *data, size_t len,
    int write_timeout_ms)
{
    size_t offset = 0;
    auto last_progress = std::chrono::steady_clock::now();

    while (offset < len) {
        ssize_t written = transport_->write(peer, data + offset, len - offset);

        if (written < 0)
            return NLS_SEND_ERROR;

        if (written > 0) {
            offset += std::min((size_t)written, len - offset);
            last_progress = std::chrono::steady_clock::now();
            continue;
        }

        if (should_stop_)
            return NLS_INTERRUPTED;

        auto stalled = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - last_progress
        ).count();

        if (stalled >= write_timeout_ms) {
            NLS_LOG_WARN("Transport accepted nothing for %d ms", (int)stalled);
            return NLS_TIMEOUT;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(WRITE_BACKOFF_MS));
    }

    return NLS_OK;
}
