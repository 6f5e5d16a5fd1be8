#include "nalstream/binder.hh"

#include "formats/h264.hh"
#include "counters.hh"
#include "debug.hh"
#include "global.hh"
#include "packetizer.hh"
#include "peer_binding.hh"

#include <chrono>
#include <limits>
#include <utility>

nalstream::binder::binder(int nce_flags, std::shared_ptr<nalstream::transport> transport,
    std::shared_ptr<nalstream::decoder> dec) :
    nce_flags_(nce_flags),
    initialized_(false),
    transport_(transport),
    decoder_(dec),
    stats_(std::make_shared<nalstream::counters>()),
    packetizer_(nullptr),
    active_(nullptr),
    closing_(false),
    send_queue_size_(DEFAULT_SEND_QUEUE_SIZE),
    config_timeout_ms_(DEFAULT_CONFIG_ENQUEUE_TIMEOUT_MS),
    write_timeout_ms_(DEFAULT_WRITE_TIMEOUT_MS),
    max_unit_size_(DEFAULT_MAX_UNIT_SIZE),
    max_pending_frames_(DEFAULT_MAX_PENDING_FRAMES)
{
}

nalstream::binder::~binder()
{
    if (initialized_)
        transport_->install_handlers(nullptr, nullptr);

    std::shared_ptr<nalstream::peer_binding> binding;

    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);

        {
            std::lock_guard<std::mutex> lg(binding_mtx_);
            closing_ = true;
            binding  = std::move(active_);
        }
        binding_cond_.notify_all();

        if (binding)
            teardown(binding);
    }

    /* joins the writer that may have stopped itself after a fault */
    if (packetizer_)
        (void)packetizer_->stop();
}

nls_error_t nalstream::binder::init()
{
    if (initialized_)
        return NLS_INITIALIZED;

    int role = nce_flags_ & (NCE_SENDER | NCE_RECEIVER);

    if (role != NCE_SENDER && role != NCE_RECEIVER) {
        NLS_LOG_ERROR("Binder must be either a sender or a receiver, flags: %d", nce_flags_);
        return NLS_INVALID_VALUE;
    }

    if (!transport_) {
        NLS_LOG_ERROR("No transport given");
        return NLS_INVALID_VALUE;
    }

    if (role == NCE_RECEIVER && !decoder_) {
        NLS_LOG_ERROR("Receiving binder needs a decoder");
        return NLS_INVALID_VALUE;
    }

    if (role == NCE_SENDER)
        packetizer_ = std::unique_ptr<nalstream::packetizer>(new nalstream::packetizer(transport_, stats_));

    transport_->install_handlers(
        [this](const std::string& peer, const uint8_t *data, size_t len) {
            (void)bytes_received(peer, data, len);
        },
        [this](const std::string& peer, nls_peer_state_t state) {
            (void)peer_state_changed(peer, state);
        }
    );

    initialized_ = true;
    return NLS_OK;
}

nls_error_t nalstream::binder::configure_ctx(int ncc_flag, ssize_t value)
{
    std::lock_guard<std::mutex> lg(binding_mtx_);

    switch (ncc_flag) {
        case NCC_SEND_QUEUE_SIZE:
            if (value <= 0)
                return NLS_INVALID_VALUE;
            send_queue_size_ = (size_t)value;
            break;

        case NCC_CONFIG_ENQUEUE_TIMEOUT_MS:
            if (value < 0 || value > std::numeric_limits<int>::max())
                return NLS_INVALID_VALUE;
            config_timeout_ms_ = (int)value;
            break;

        case NCC_WRITE_TIMEOUT_MS:
            if (value <= 0 || value > std::numeric_limits<int>::max())
                return NLS_INVALID_VALUE;
            write_timeout_ms_ = (int)value;
            break;

        case NCC_MAX_UNIT_SIZE:
            if (value <= 0 || (uint64_t)value > std::numeric_limits<uint32_t>::max())
                return NLS_INVALID_VALUE;
            max_unit_size_ = (size_t)value;
            break;

        case NCC_MAX_PENDING_FRAMES:
            if (value <= 0)
                return NLS_INVALID_VALUE;
            max_pending_frames_ = (size_t)value;
            break;

        default:
            NLS_LOG_WARN("Configuration flag %d is not supported by the binder", ncc_flag);
            return NLS_INVALID_VALUE;
    }

    return NLS_OK;
}

int nalstream::binder::get_configuration_value(int ncc_flag)
{
    std::lock_guard<std::mutex> lg(binding_mtx_);

    switch (ncc_flag) {
        case NCC_SEND_QUEUE_SIZE:
            return (int)send_queue_size_;

        case NCC_CONFIG_ENQUEUE_TIMEOUT_MS:
            return config_timeout_ms_;

        case NCC_WRITE_TIMEOUT_MS:
            return write_timeout_ms_;

        case NCC_MAX_UNIT_SIZE:
            return (int)max_unit_size_;

        case NCC_MAX_PENDING_FRAMES:
            return (int)max_pending_frames_;

        default:
            return -1;
    }
}

nls_error_t nalstream::binder::peer_state_changed(const std::string& peer, nls_peer_state_t state)
{
    if (!initialized_)
        return NLS_NOT_INITIALIZED;

    switch (state) {
        case NLS_PEER_CONNECTING:
            NLS_LOG_INFO("Peer %s is connecting", peer.c_str());
            return NLS_OK;

        case NLS_PEER_CONNECTED:
            return bind_peer(peer);

        case NLS_PEER_DISCONNECTED:
            return unbind_peer(peer);
    }

    return NLS_INVALID_VALUE;
}

nls_error_t nalstream::binder::bind_peer(const std::string& peer)
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);

    size_t queue_size, max_unit_size, max_pending;
    int config_timeout, write_timeout;

    {
        std::lock_guard<std::mutex> lg(binding_mtx_);

        if (closing_)
            return NLS_NOT_INITIALIZED;

        if (active_) {
            if (active_->peer() == peer) {
                NLS_LOG_DEBUG("Peer %s is bound already", peer.c_str());
                return NLS_OK;
            }

            ++stats_->peers_rejected;
            NLS_LOG_WARN("Peer %s rejected, %s is bound", peer.c_str(), active_->peer().c_str());
            return NLS_PEER_REJECTED;
        }

        queue_size     = send_queue_size_;
        config_timeout = config_timeout_ms_;
        write_timeout  = write_timeout_ms_;
        max_unit_size  = max_unit_size_;
        max_pending    = max_pending_frames_;
    }

    auto binding = std::make_shared<nalstream::peer_binding>(peer, nce_flags_, stats_);
    nls_error_t ret = NLS_OK;

    if (binding->receiving()) {
        if ((ret = binding->init_receiver(decoder_, max_unit_size, max_pending)) != NLS_OK)
            return ret;
    } else {
        if ((ret = transport_->open_stream(peer)) != NLS_OK) {
            NLS_LOG_ERROR("Failed to open outbound stream to %s: %d", peer.c_str(), ret);
            return ret;
        }

        uint32_t id = binding->id();

        packetizer_->set_queue_size(queue_size);
        packetizer_->set_config_timeout(config_timeout);
        packetizer_->set_write_timeout(write_timeout);

        /* published first, a write fault may arrive before start() returns */
        {
            std::lock_guard<std::mutex> lg(binding_mtx_);
            active_ = binding;
        }

        ret = packetizer_->start(peer, [this, id](const std::string& p, nls_error_t reason) {
            handle_write_fault(id, p, reason);
        });

        if (ret != NLS_OK) {
            NLS_LOG_ERROR("Failed to start packetizer for %s: %d", peer.c_str(), ret);

            {
                std::lock_guard<std::mutex> lg(binding_mtx_);
                if (active_ == binding)
                    active_ = nullptr;
            }

            transport_->close_stream(peer);
            return ret;
        }
    }

    if (binding->receiving()) {
        std::lock_guard<std::mutex> lg(binding_mtx_);
        active_ = binding;
    }
    binding_cond_.notify_all();

    ++stats_->peers_bound;
    NLS_LOG_INFO("Peer %s bound as %s, binding %08x", peer.c_str(),
        binding->receiving() ? "sender" : "receiver", binding->id());

    return NLS_OK;
}

nls_error_t nalstream::binder::unbind_peer(const std::string& peer)
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
    std::shared_ptr<nalstream::peer_binding> binding;

    {
        std::lock_guard<std::mutex> lg(binding_mtx_);

        if (!active_ || active_->peer() != peer) {
            NLS_LOG_DEBUG("Peer %s disconnected but it is not bound", peer.c_str());
            return NLS_NOT_FOUND;
        }

        binding = std::move(active_);
    }

    NLS_LOG_INFO("Peer %s disconnected, binding %08x torn down", peer.c_str(), binding->id());

    teardown(binding);
    return NLS_OK;
}

void nalstream::binder::handle_write_fault(uint32_t binding_id, const std::string& peer, nls_error_t reason)
{
    std::shared_ptr<nalstream::peer_binding> binding;

    {
        std::lock_guard<std::mutex> lg(binding_mtx_);

        /* binding may have been torn down while the write failed */
        if (!active_ || active_->id() != binding_id)
            return;

        binding = std::move(active_);
    }

    NLS_LOG_ERROR("Writing to %s failed (%d), binding %08x torn down", peer.c_str(), reason, binding_id);

    /* the packetizer has stopped itself, only the stream is left */
    transport_->close_stream(peer);
}

void nalstream::binder::teardown(std::shared_ptr<nalstream::peer_binding> binding)
{
    if (binding->receiving()) {
        binding->close();
    } else {
        (void)packetizer_->stop();
        transport_->close_stream(binding->peer());
    }
}

nls_error_t nalstream::binder::bytes_received(const std::string& peer, const uint8_t *data, size_t len)
{
    if (!data || !len)
        return NLS_INVALID_VALUE;

    std::shared_ptr<nalstream::peer_binding> binding;

    {
        std::lock_guard<std::mutex> lg(binding_mtx_);
        binding = active_;
    }

    if (!binding || binding->peer() != peer) {
        stats_->bytes_from_unbound_peer += len;
        NLS_LOG_DEBUG("Dropping %zu bytes from %s, peer is not bound", len, peer.c_str());
        return NLS_NOT_FOUND;
    }

    if (!binding->receiving()) {
        NLS_LOG_DEBUG("Sending binder does not expect data, dropping %zu bytes from %s", len, peer.c_str());
        return NLS_OK;
    }

    return binding->process_bytes(data, len);
}

nls_error_t nalstream::binder::push_unit(const uint8_t *data, size_t len)
{
    if (!data || !len)
        return NLS_INVALID_VALUE;

    nalstream::unit::encoded_unit unit;

    unit.kind = nalstream::formats::h264::classify(data[0]);
    unit.data.assign(data, data + len);

    return push_unit(std::move(unit));
}

nls_error_t nalstream::binder::push_unit(nalstream::unit::encoded_unit&& unit)
{
    if (!initialized_ || !packetizer_)
        return NLS_NOT_INITIALIZED;

    if (unit.data.empty())
        return NLS_INVALID_VALUE;

    return packetizer_->emit(std::move(unit));
}

nalstream::unit::decoded_frame *nalstream::binder::pull_frame()
{
    return wait_frame(-1);
}

nalstream::unit::decoded_frame *nalstream::binder::pull_frame(size_t timeout_ms)
{
    if (timeout_ms > (size_t)std::numeric_limits<int>::max())
        timeout_ms = std::numeric_limits<int>::max();

    return wait_frame((int)timeout_ms);
}

nalstream::unit::decoded_frame *nalstream::binder::wait_frame(int timeout_ms)
{
    if (!initialized_ || !(nce_flags_ & NCE_RECEIVER)) {
        nls_errno = NLS_NOT_INITIALIZED;
        return nullptr;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
        std::shared_ptr<nalstream::peer_binding> binding;

        {
            std::unique_lock<std::mutex> lk(binding_mtx_);
            auto bound = [this] { return closing_ || active_ != nullptr; };

            if (timeout_ms < 0) {
                binding_cond_.wait(lk, bound);
            } else if (!binding_cond_.wait_until(lk, deadline, bound)) {
                nls_errno = NLS_TIMEOUT;
                return nullptr;
            }

            if (closing_) {
                nls_errno = NLS_NOT_INITIALIZED;
                return nullptr;
            }

            binding = active_;
        }

        int remaining = -1;

        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()
            ).count();
            remaining = left > 0 ? (int)left : 0;
        }

        nalstream::unit::decoded_frame *frame = binding->pull_frame(remaining);

        if (frame)
            return frame;

        /* a torn down binding returns early, wait for the next peer unless time is up */
        if (!binding->closed() || (timeout_ms >= 0 && std::chrono::steady_clock::now() >= deadline)) {
            nls_errno = NLS_TIMEOUT;
            return nullptr;
        }
    }
}

nalstream::stats nalstream::binder::get_stats() const
{
    nalstream::stats s;

    s.units_sent               = stats_->units_sent;
    s.bytes_sent               = stats_->bytes_sent;
    s.frames_dropped_saturated = stats_->frames_dropped_saturated;
    s.frames_dropped_no_config = stats_->frames_dropped_no_config;
    s.frames_dropped_no_peer   = stats_->frames_dropped_no_peer;
    s.config_enqueue_timeouts  = stats_->config_enqueue_timeouts;
    s.write_faults             = stats_->write_faults;

    s.bytes_received           = stats_->bytes_received;
    s.units_received           = stats_->units_received;
    s.bytes_from_unbound_peer  = stats_->bytes_from_unbound_peer;
    s.protocol_violations      = stats_->protocol_violations;
    s.units_dropped_not_ready  = stats_->units_dropped_not_ready;
    s.renegotiations           = stats_->renegotiations;

    s.sessions_created         = stats_->sessions_created;
    s.sessions_invalidated     = stats_->sessions_invalidated;
    s.decoder_create_errors    = stats_->decoder_create_errors;
    s.decode_errors            = stats_->decode_errors;
    s.frames_decoded           = stats_->frames_decoded;
    s.frames_dropped_unpulled  = stats_->frames_dropped_unpulled;

    s.peers_bound              = stats_->peers_bound;
    s.peers_rejected           = stats_->peers_rejected;

    s.config_fingerprint       = stats_->config_fingerprint;

    return s;
}

std::string nalstream::binder::active_peer() const
{
    std::lock_guard<std::mutex> lg(binding_mtx_);

    if (!active_)
        return "";

    return active_->peer();
}
