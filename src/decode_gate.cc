#include "decode_gate.hh"

#include "debug.hh"

#include <chrono>
#include <exception>

nalstream::decode_gate::decode_gate(std::shared_ptr<nalstream::decoder> dec,
    std::shared_ptr<nalstream::counters> stats, size_t max_pending_frames) :
    decoder_(dec),
    stats_(stats),
    session_(NLS_INVALID_SESSION),
    closed_(false),
    sequence_(0),
    frames_(),
    max_pending_frames_(max_pending_frames)
{
}

nalstream::decode_gate::~decode_gate()
{
    close();
}

nls_error_t nalstream::decode_gate::create(const nalstream::unit::configuration_set& config)
{
    std::lock_guard<std::mutex> lg(session_mtx_);

    if (closed_)
        return NLS_NOT_INITIALIZED;

    if (session_ != NLS_INVALID_SESSION)
        return NLS_INITIALIZED;

    nalstream::session_handle session = NLS_INVALID_SESSION;
    nls_error_t ret = decoder_->create(config, session);

    if (ret != NLS_OK || session == NLS_INVALID_SESSION) {
        NLS_LOG_ERROR("Decoder failed to create a session for configuration 0x%08x: %d",
            config.fingerprint, ret);
        ++stats_->decoder_create_errors;
        return NLS_DECODER_ERROR;
    }

    session_ = session;
    ++stats_->sessions_created;
    stats_->config_fingerprint = config.fingerprint;

    NLS_LOG_DEBUG("Decoder session %llu created", (unsigned long long)session_);
    return NLS_OK;
}

void nalstream::decode_gate::invalidate()
{
    std::lock_guard<std::mutex> lg(session_mtx_);
    invalidate_locked();
}

void nalstream::decode_gate::invalidate_locked()
{
    if (session_ == NLS_INVALID_SESSION)
        return;

    NLS_LOG_DEBUG("Invalidating decoder session %llu", (unsigned long long)session_);

    decoder_->invalidate(session_);
    session_ = NLS_INVALID_SESSION;
    ++stats_->sessions_invalidated;
    stats_->config_fingerprint = 0;
}

nls_error_t nalstream::decode_gate::decode(const nalstream::unit::encoded_unit& unit)
{
    std::future<nalstream::unit::decoded_frame> frame;
    uint64_t sequence = 0;

    {
        std::lock_guard<std::mutex> lg(session_mtx_);

        if (closed_)
            return NLS_NOT_INITIALIZED;

        if (session_ == NLS_INVALID_SESSION)
            return NLS_NOT_READY;

        if (decoder_->decode(session_, unit, frame) != NLS_OK || !frame.valid()) {
            NLS_LOG_WARN("Decoder rejected a unit of %zu bytes, skipping it", unit.data.size());
            ++stats_->decode_errors;
            return NLS_DECODER_ERROR;
        }

        sequence = ++sequence_;
    }

    std::lock_guard<std::mutex> lg(frames_mtx_);

    if (closed_)
        return NLS_NOT_INITIALIZED;

    frames_.push_back(std::make_pair(sequence, std::move(frame)));

    while (frames_.size() > max_pending_frames_) {
        NLS_LOG_DEBUG("Decoded frame %llu was not pulled in time, dropping it",
            (unsigned long long)frames_.front().first);
        frames_.pop_front();
        ++stats_->frames_dropped_unpulled;
    }

    frames_cond_.notify_one();
    return NLS_OK;
}

void nalstream::decode_gate::close()
{
    {
        std::lock_guard<std::mutex> lg(session_mtx_);

        if (closed_)
            return;

        /* no submission can pass the gate after this, so the session is safe to invalidate */
        closed_ = true;
        invalidate_locked();
    }

    std::lock_guard<std::mutex> lg(frames_mtx_);
    frames_.clear();
    frames_cond_.notify_all();
}

bool nalstream::decode_gate::closed() const
{
    return closed_;
}

nalstream::unit::decoded_frame *nalstream::decode_gate::pull_frame(int timeout_ms)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
        std::pair<uint64_t, std::future<nalstream::unit::decoded_frame>> pending;

        {
            std::unique_lock<std::mutex> lk(frames_mtx_);
            auto has_frames = [this] { return !frames_.empty() || closed_; };

            if (timeout_ms < 0) {
                frames_cond_.wait(lk, has_frames);
            } else if (!frames_cond_.wait_until(lk, deadline, has_frames)) {
                return nullptr;
            }

            if (frames_.empty())
                return nullptr;

            pending = std::move(frames_.front());
            frames_.pop_front();
        }

        if (timeout_ms >= 0 &&
            pending.second.wait_until(deadline) != std::future_status::ready) {

            /* not decoded yet, put it back so the order is kept */
            std::lock_guard<std::mutex> lg(frames_mtx_);
            if (!closed_)
                frames_.push_front(std::move(pending));
            return nullptr;
        }

        nalstream::unit::decoded_frame *frame = nullptr;

        try {
            frame = new nalstream::unit::decoded_frame(pending.second.get());
        } catch (const std::future_error& e) {
            NLS_LOG_WARN("Decoded frame %llu was abandoned by the decoder: %s",
                (unsigned long long)pending.first, e.what());
            ++stats_->decode_errors;
            continue;
        } catch (const std::exception& e) {
            NLS_LOG_WARN("Decoding frame %llu failed: %s", (unsigned long long)pending.first, e.what());
            ++stats_->decode_errors;
            continue;
        }

        if (frame->status != NLS_OK) {
            NLS_LOG_WARN("Decoder failed to decode frame %llu: %d, skipping it",
                (unsigned long long)pending.first, frame->status);
            ++stats_->decode_errors;
            (void)nalstream::unit::dealloc_frame(frame);
            continue;
        }

        frame->sequence = pending.first;
        ++stats_->frames_decoded;
        return frame;
    }
}
