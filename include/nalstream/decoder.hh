#pragma once

#include "unit.hh"
#include "util.hh"

#include <future>

namespace nalstream {

    /**
     * \brief Interface of the external frame decoder
     *
     * \details nalstream does not decode video itself. The application implements this
     * interface on top of its codec and gives the object to nalstream::binder.
     *
     * All calls for one peer are serialized by nalstream, create() and invalidate() are never
     * called concurrently with decode() for the same session. The decoded frame may be delivered
     * on any thread through the future returned by decode(). */
    class decoder {
        public:
            virtual ~decoder() {}

            /**
             * \brief Create a decoder session from a complete configuration set
             *
             * \param config Configuration set, always complete
             * \param session Handle of the new session, must not be NLS_INVALID_SESSION on success
             *
             * \retval NLS_OK            On success
             * \retval NLS_DECODER_ERROR If the decoder rejects the configuration
             */
            virtual nls_error_t create(const nalstream::unit::configuration_set& config,
                nalstream::session_handle& session) = 0;

            /**
             * \brief Submit one frame unit for decoding
             *
             * \details Submission returns immediately, the result is delivered through "frame".
             * Frames of one session are assumed to complete in submission order.
             *
             * \retval NLS_OK            If the unit was accepted and "frame" is valid
             * \retval NLS_DECODER_ERROR If the decoder rejected the unit
             */
            virtual nls_error_t decode(nalstream::session_handle session,
                const nalstream::unit::encoded_unit& unit,
                std::future<nalstream::unit::decoded_frame>& frame) = 0;

            /**
             * \brief Invalidate a decoder session
             *
             * \details After this call the handle is not used by nalstream anymore
             */
            virtual void invalidate(nalstream::session_handle session) = 0;
    };
}
