#pragma once

#include "nalstream/util.hh"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace nalstream {

    namespace formats {

        /* Marker bytes of the configuration units, with NRI 3 (reference) and NRI 1 */
        constexpr uint8_t H264_SPS_MARKER_REF    = 0x67;
        constexpr uint8_t H264_SPS_MARKER_NONREF = 0x27;
        constexpr uint8_t H264_PPS_MARKER_REF    = 0x68;
        constexpr uint8_t H264_PPS_MARKER_NONREF = 0x28;

        /* Offset and size of one NAL unit inside an Annex-B stream, prefix excluded */
        typedef std::pair<size_t, size_t> nal_range;

        namespace h264 {

            /* Classify a unit by its first byte only.
             *
             * Markers other than the four configuration markers are frames,
             * the decoder decides whether they are actually valid */
            nls_unit_kind_t classify(uint8_t marker);

            /* Same as classify() but safe for empty units, which are frames */
            nls_unit_kind_t classify(const uint8_t *data, size_t len);

            /* Find the next H.264 start code (0x000001 or 0x00000001) from "data",
             * starting at "offset"
             *
             * Return the offset of the first byte after the start code and
             * write the length of the start code to "start_len"
             * Return -1 if no start code was found */
            ssize_t find_start_code(const uint8_t *data, size_t len, size_t offset, uint8_t& start_len);

            /* Split an Annex-B elementary stream into NAL units
             *
             * Bytes before the first start code are ignored */
            std::vector<nal_range> split_annexb(const uint8_t *data, size_t len);

            /* Prepend a 4-byte start code to "nal" and append the result to "out" */
            void append_annexb(std::vector<uint8_t>& out, const uint8_t *nal, size_t len);
        }
    }
}
