#include "nalstream/unit.hh"

#include "nalstream/util.hh"

#include "formats/h264.hh"
#include "crypto.hh"
#include "debug.hh"

#include <utility>

nalstream::unit::encoded_unit *nalstream::unit::alloc_unit(const uint8_t *data, size_t len)
{
    if (!data || !len) {
        nls_errno = NLS_INVALID_VALUE;
        return nullptr;
    }

    nalstream::unit::encoded_unit *unit = new nalstream::unit::encoded_unit;

    unit->kind = nalstream::formats::h264::classify(data[0]);
    unit->data.assign(data, data + len);

    return unit;
}

nls_error_t nalstream::unit::dealloc_unit(nalstream::unit::encoded_unit *unit)
{
    if (!unit)
        return NLS_INVALID_VALUE;

    delete unit;
    return NLS_OK;
}

nls_error_t nalstream::unit::dealloc_frame(nalstream::unit::decoded_frame *frame)
{
    if (!frame)
        return NLS_INVALID_VALUE;

    delete frame;
    return NLS_OK;
}

nalstream::unit::configuration_set nalstream::unit::make_configuration(std::vector<uint8_t> primary,
    std::vector<uint8_t> secondary)
{
    nalstream::unit::configuration_set config;
    nalstream::crypto::crc32::digest crc;

    config.primary   = std::move(primary);
    config.secondary = std::move(secondary);

    crc.update(config.primary.data(), config.primary.size());
    crc.update(config.secondary.data(), config.secondary.size());
    config.fingerprint = crc.final();

    return config;
}

std::vector<nalstream::unit::encoded_unit> nalstream::unit::split_annexb(const uint8_t *data, size_t len)
{
    std::vector<nalstream::unit::encoded_unit> units;

    if (!data || !len)
        return units;

    for (auto& nal : nalstream::formats::h264::split_annexb(data, len)) {
        nalstream::unit::encoded_unit unit;

        unit.kind = nalstream::formats::h264::classify(data[nal.first]);
        unit.data.assign(data + nal.first, data + nal.first + nal.second);
        units.push_back(std::move(unit));
    }

    return units;
}

void nalstream::unit::append_annexb(std::vector<uint8_t>& out, const nalstream::unit::encoded_unit& unit)
{
    nalstream::formats::h264::append_annexb(out, unit.data.data(), unit.data.size());
}
