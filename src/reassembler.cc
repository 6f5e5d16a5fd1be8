#include "reassembler.hh"

#include "formats/h264.hh"
#include "debug.hh"
#include "global.hh"

#include <algorithm>
#include <utility>

static inline uint32_t read_be32(const uint8_t *ptr)
{
    return ((uint32_t)ptr[0] << 24) |
           ((uint32_t)ptr[1] << 16) |
           ((uint32_t)ptr[2] <<  8) |
           ((uint32_t)ptr[3] <<  0);
}

nalstream::reassembler::reassembler(size_t max_unit_size) :
    buffer_(),
    head_(0),
    skip_(0),
    max_unit_size_(max_unit_size),
    violations_(0)
{
}

nalstream::reassembler::~reassembler()
{
}

nls_error_t nalstream::reassembler::push_bytes(const uint8_t *data, size_t len)
{
    if (!data && len)
        return NLS_INVALID_VALUE;

    /* the rest of a rejected packet is dropped before it reaches the buffer */
    if (skip_) {
        size_t skipped = std::min(skip_, len);

        skip_ -= skipped;
        data  += skipped;
        len   -= skipped;

        if (!skip_)
            NLS_LOG_DEBUG("Oversized packet skipped, stream resynchronized");
    }

    if (len)
        buffer_.insert(buffer_.end(), data, data + len);

    return NLS_OK;
}

nls_error_t nalstream::reassembler::pull_unit(nalstream::unit::encoded_unit& out)
{
    size_t available = buffer_.size() - head_;

    if (skip_ || available < LENGTH_PREFIX_SIZE)
        return NLS_NOT_READY;

    uint32_t len = read_be32(buffer_.data() + head_);

    if (len == 0) {
        NLS_LOG_WARN("Zero-length packet received, dropping it");
        ++violations_;
        consume(LENGTH_PREFIX_SIZE);
        return NLS_PROTOCOL_ERROR;
    }

    if (len > max_unit_size_) {
        NLS_LOG_WARN("Packet of %u bytes exceeds the limit of %zu bytes, dropping it", len, max_unit_size_);
        ++violations_;

        size_t present = std::min((size_t)len, available - LENGTH_PREFIX_SIZE);

        consume(LENGTH_PREFIX_SIZE + present);
        skip_ = (size_t)len - present;
        return NLS_PROTOCOL_ERROR;
    }

    if (available < LENGTH_PREFIX_SIZE + len)
        return NLS_NOT_READY;

    const uint8_t *payload = buffer_.data() + head_ + LENGTH_PREFIX_SIZE;

    out.kind = nalstream::formats::h264::classify(payload[0]);
    out.data.assign(payload, payload + len);

    consume(LENGTH_PREFIX_SIZE + len);
    return NLS_PKT_READY;
}

nls_error_t nalstream::reassembler::feed(const uint8_t *data, size_t len, std::vector<nalstream::unit::encoded_unit>& out)
{
    nls_error_t ret = NLS_OK;

    if ((ret = push_bytes(data, len)) != NLS_OK)
        return ret;

    for (;;) {
        nalstream::unit::encoded_unit unit;
        nls_error_t status = pull_unit(unit);

        if (status == NLS_PKT_READY) {
            out.push_back(std::move(unit));
        } else if (status == NLS_PROTOCOL_ERROR) {
            ret = NLS_PROTOCOL_ERROR;
        } else {
            break;
        }
    }

    return ret;
}

void nalstream::reassembler::reset()
{
    buffer_.clear();
    head_ = 0;
    skip_ = 0;
}

size_t nalstream::reassembler::buffered() const
{
    return buffer_.size() - head_;
}

size_t nalstream::reassembler::protocol_violations() const
{
    return violations_;
}

void nalstream::reassembler::consume(size_t n)
{
    head_ += n;

    if (head_ == buffer_.size()) {
        buffer_.clear();
        head_ = 0;
    } else if (head_ >= RECEIVE_BUFFER_COMPACT_THRESHOLD) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + head_);
        head_ = 0;
    }
}
