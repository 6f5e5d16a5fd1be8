#pragma once

#include "nalstream/util.hh"

#include <memory>

namespace nalstream {
    class socket;

    namespace poll {
        /* Wait until "socket" has data to read or the peer closed the connection
         *
         * "timeout" is in milliseconds
         *
         * Return NLS_OK if the socket is readable
         * Return NLS_INTERRUPTED if the timeout is exceeded
         * Return NLS_GENERIC_ERROR if polling failed */
        nls_error_t wait_readable(std::shared_ptr<nalstream::socket> socket, int timeout);
    }
}
