#pragma once

#include "nalstream/util.hh"

#include <cstdint>

namespace nalstream {
    namespace random {

        /* Return a non-zero pseudo-random 32-bit value, used to tag peer bindings */
        uint32_t generate_32();
    }
}
