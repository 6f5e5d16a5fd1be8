#include "h264.hh"

#include "../debug.hh"


nls_unit_kind_t nalstream::formats::h264::classify(uint8_t marker)
{
    // TODO: check the marker space again if H.265 units are ever streamed, its NAL header
    // bytes 0x27/0x28 do not mean parameter sets
    switch (marker) {
        case H264_SPS_MARKER_REF:
        case H264_SPS_MARKER_NONREF:
            return NLS_UNIT_CONFIG_PRIMARY;

        case H264_PPS_MARKER_REF:
        case H264_PPS_MARKER_NONREF:
            return NLS_UNIT_CONFIG_SECONDARY;

        default:
            break;
    }

    return NLS_UNIT_FRAME;
}

nls_unit_kind_t nalstream::formats::h264::classify(const uint8_t *data, size_t len)
{
    if (!data || !len)
        return NLS_UNIT_FRAME;

    return classify(data[0]);
}

ssize_t nalstream::formats::h264::find_start_code(const uint8_t *data, size_t len, size_t offset, uint8_t& start_len)
{
    if (data == nullptr || len < offset)
    {
        NLS_LOG_WARN("Invalid parameter found for start code lookup");
        return -1;
    }

    size_t zeros = 0;

    for (size_t pos = offset; pos < len; ++pos) {
        if (data[pos] == 0) {
            ++zeros;
            continue;
        }

        if (data[pos] == 1 && zeros >= 2) {
            start_len = (zeros >= 3) ? 4 : 3;
            return (ssize_t)(pos + 1);
        }

        zeros = 0;
    }

    return -1;
}

std::vector<nalstream::formats::nal_range> nalstream::formats::h264::split_annexb(const uint8_t *data, size_t len)
{
    std::vector<nal_range> nals;
    uint8_t start_len = 0;

    ssize_t begin = find_start_code(data, len, 0, start_len);

    while (begin != -1) {
        uint8_t next_len = 0;
        ssize_t next = find_start_code(data, len, (size_t)begin, next_len);

        size_t end = (next == -1) ? len : (size_t)next - next_len;

        /* a NAL unit never ends in a zero byte, these belong to the next start code */
        while (end > (size_t)begin && data[end - 1] == 0)
            --end;

        if (end > (size_t)begin)
            nals.push_back(std::make_pair((size_t)begin, end - (size_t)begin));

        begin = next;
    }

    NLS_LOG_DEBUG("Found %zu NAL units from %zu bytes", nals.size(), len);
    return nals;
}

void nalstream::formats::h264::append_annexb(std::vector<uint8_t>& out, const uint8_t *nal, size_t len)
{
    static const uint8_t start_code[4] = { 0x00, 0x00, 0x00, 0x01 };

    out.insert(out.end(), start_code, start_code + sizeof(start_code));
    out.insert(out.end(), nal, nal + len);
}
