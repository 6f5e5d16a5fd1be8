#include "poll.hh"

#include "socket.hh"
#include "debug.hh"

#ifdef _WIN32
#include <winsock2.h>
#else
#include <poll.h>
#endif

nls_error_t nalstream::poll::wait_readable(std::shared_ptr<nalstream::socket> socket, int timeout)
{
    if (!socket)
        return NLS_INVALID_VALUE;

#ifndef _WIN32
    struct pollfd fds;

    fds.fd      = socket->get_raw_socket();
    fds.events  = POLLIN;
    fds.revents = 0;

    int ret = ::poll(&fds, 1, timeout);

    if (ret == -1) {
        if (errno == EINTR)
            return NLS_INTERRUPTED;

        NLS_LOG_ERROR("Poll failed: %s", strerror(errno));
        return NLS_GENERIC_ERROR;
    }

    if (ret == 0)
        return NLS_INTERRUPTED;

    /* errors and hang ups are reported by the following recv() */
    return NLS_OK;
#else
    fd_set read_fds;

    FD_ZERO(&read_fds);
    FD_SET(socket->get_raw_socket(), &read_fds);

    struct timeval t_val = {
        timeout / 1000,
        (timeout % 1000) * 1000,
    };

    int ret = ::select(0, &read_fds, nullptr, nullptr, &t_val);

    if (ret < 0) {
        log_platform_error("select(2) failed");
        return NLS_GENERIC_ERROR;
    }

    return ret == 0 ? NLS_INTERRUPTED : NLS_OK;
#endif
}
