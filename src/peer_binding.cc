#include "peer_binding.hh"

#include "bootstrap.hh"
#include "debug.hh"
#include "decode_gate.hh"
#include "random.hh"
#include "reassembler.hh"

nalstream::peer_binding::peer_binding(const std::string& peer, int nce_flags,
    std::shared_ptr<nalstream::counters> stats) :
    peer_(peer),
    nce_flags_(nce_flags),
    id_(nalstream::random::generate_32()),
    stats_(stats),
    reassembler_(nullptr),
    bootstrap_(nullptr),
    gate_(nullptr)
{
}

nalstream::peer_binding::~peer_binding()
{
    close();

    if (reassembler_ && reassembler_->buffered())
        NLS_LOG_DEBUG("Binding %08x: discarding %zu buffered bytes", id_, reassembler_->buffered());
}

nls_error_t nalstream::peer_binding::init_receiver(std::shared_ptr<nalstream::decoder> dec,
    size_t max_unit_size, size_t max_pending_frames)
{
    if (!dec)
        return NLS_INVALID_VALUE;

    reassembler_ = std::unique_ptr<nalstream::reassembler>(new nalstream::reassembler(max_unit_size));
    bootstrap_   = std::unique_ptr<nalstream::bootstrap>(new nalstream::bootstrap());
    gate_        = std::unique_ptr<nalstream::decode_gate>(
        new nalstream::decode_gate(dec, stats_, max_pending_frames)
    );

    return NLS_OK;
}

nls_error_t nalstream::peer_binding::process_bytes(const uint8_t *data, size_t len)
{
    if (!reassembler_ || gate_->closed())
        return NLS_NOT_INITIALIZED;

    nls_error_t ret = NLS_OK;

    if ((ret = reassembler_->push_bytes(data, len)) != NLS_OK)
        return ret;

    stats_->bytes_received += len;

    for (;;) {
        nalstream::unit::encoded_unit unit;
        nls_error_t status = reassembler_->pull_unit(unit);

        if (status == NLS_NOT_READY)
            break;

        if (status == NLS_PROTOCOL_ERROR) {
            ++stats_->protocol_violations;
            ret = NLS_PROTOCOL_ERROR;
            continue;
        }

        ++stats_->units_received;
        handle_unit(unit);

        if (gate_->closed())
            return NLS_NOT_INITIALIZED;
    }

    return ret;
}

void nalstream::peer_binding::handle_unit(const nalstream::unit::encoded_unit& unit)
{
    int actions = bootstrap_->handle_unit(unit);

    if (actions & BA_DROP) {
        ++stats_->units_dropped_not_ready;
        NLS_LOG_DEBUG("Binding %08x: unit of kind %d dropped, decoder not ready", id_, unit.kind);
        return;
    }

    if (actions & BA_INVALIDATE) {
        ++stats_->renegotiations;
        gate_->invalidate();
    }

    if (actions & BA_CREATE) {
        nls_error_t ret = gate_->create(bootstrap_->configuration());

        if (ret == NLS_DECODER_ERROR)
            bootstrap_->construction_failed();
        else if (ret != NLS_OK)
            NLS_LOG_DEBUG("Binding %08x: decoder session not created: %d", id_, ret);
    }

    if (actions & BA_DECODE) {
        if (gate_->decode(unit) == NLS_NOT_READY) {
            ++stats_->units_dropped_not_ready;
            NLS_LOG_DEBUG("Binding %08x: no decoder session, frame dropped", id_);
        }
    }
}

void nalstream::peer_binding::close()
{
    if (gate_)
        gate_->close();
}

bool nalstream::peer_binding::closed() const
{
    return !gate_ || gate_->closed();
}

nalstream::unit::decoded_frame *nalstream::peer_binding::pull_frame(int timeout_ms)
{
    if (!gate_)
        return nullptr;

    return gate_->pull_frame(timeout_ms);
}

const std::string& nalstream::peer_binding::peer() const
{
    return peer_;
}

uint32_t nalstream::peer_binding::id() const
{
    return id_;
}

bool nalstream::peer_binding::receiving() const
{
    return nce_flags_ & NCE_RECEIVER;
}
