#pragma once

#include "nalstream/unit.hh"
#include "nalstream/util.hh"

#include <cstdint>
#include <vector>

namespace nalstream {

    enum class BOOTSTRAP_STATE {
        BS_AWAITING_PRIMARY   = 0,
        BS_AWAITING_SECONDARY = 1,
        BS_READY              = 2
    };

    /* What the caller must do after a unit has been handled.
     * If both BA_INVALIDATE and BA_CREATE are set, invalidation must happen first */
    enum BOOTSTRAP_ACTIONS {
        BA_NONE       = 0,
        BA_DROP       = 1 << 0, /* unit is unusable right now, count it as dropped */
        BA_INVALIDATE = 1 << 1, /* current decoder session must be invalidated */
        BA_CREATE     = 1 << 2, /* create decoder session from configuration() */
        BA_DECODE     = 1 << 3  /* unit is a frame that can be decoded */
    };

    /* Tracks the configuration units of one inbound stream.
     *
     * Frames are let through only after both configuration units have been seen.
     * Configuration units that differ from the active set renegotiate the session,
     * identical ones are ignored.
     *
     * The state machine does not call the decoder itself, it returns the actions
     * the caller has to perform. Only one thread may use an object. */
    class bootstrap {
        public:
            bootstrap();
            ~bootstrap();

            /* Advance the state machine with "unit"
             *
             * Return a combination of BOOTSTRAP_ACTIONS */
            int handle_unit(const nalstream::unit::encoded_unit& unit);

            /* The decoder rejected configuration(). The set is discarded and
             * the next configuration pair starts a new bootstrap attempt */
            void construction_failed();

            /* Forget all configuration, used when the peer is torn down */
            void reset();

            BOOTSTRAP_STATE get_state() const;

            /* Complete configuration set, valid when state is BS_READY */
            const nalstream::unit::configuration_set& configuration() const;

            uint64_t dropped_units() const;
            uint64_t renegotiations() const;

        private:
            int handle_primary(const std::vector<uint8_t>& data);
            int handle_secondary(const std::vector<uint8_t>& data);

            BOOTSTRAP_STATE state_;

            /* primary unit waiting for its secondary */
            std::vector<uint8_t> pending_primary_;

            nalstream::unit::configuration_set config_;

            uint64_t dropped_;
            uint64_t renegotiations_;
    };
}
