#include "socket.hh"

#include "debug.hh"

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <fcntl.h>
#include <netinet/tcp.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#include <cstring>

#ifdef _WIN32
#define SEND_FLAGS 0
#define SHUT_WR    SD_SEND
#define SHUT_RDWR  SD_BOTH
#else
#define SEND_FLAGS (MSG_DONTWAIT | MSG_NOSIGNAL)
#endif

nalstream::socket::socket() :
    socket_(-1),
    shut_write_(false)
{
}

nalstream::socket::socket(socket_t raw_socket) :
    socket_(raw_socket),
    shut_write_(false)
{
}

nalstream::socket::~socket()
{
    if (socket_ == (socket_t)-1)
        return;

#ifndef _WIN32
    close(socket_);
#else
    closesocket(socket_);
#endif
}

nls_error_t nalstream::socket::init(short family, int type, int protocol)
{
    if ((socket_ = ::socket(family, type, protocol)) == (socket_t)-1) {
        log_platform_error("socket(2) failed");
        return NLS_SOCKET_ERROR;
    }

    return NLS_OK;
}

nls_error_t nalstream::socket::setsockopt(int level, int optname, const void *optval, socklen_t optlen)
{
    if (::setsockopt(socket_, level, optname, (const char *)optval, optlen) < 0) {
        log_platform_error("setsockopt(2) failed");
        return NLS_GENERIC_ERROR;
    }

    return NLS_OK;
}

nls_error_t nalstream::socket::bind(sockaddr_in& local_address)
{
    NLS_LOG_DEBUG("Binding to address %s", sockaddr_to_string(local_address).c_str());

    if (::bind(socket_, (struct sockaddr *)&local_address, sizeof(local_address)) < 0) {
        log_platform_error("bind(2) failed");
        NLS_LOG_ERROR("Binding to port %u failed!", ntohs(local_address.sin_port));
        return NLS_BIND_ERROR;
    }

    return NLS_OK;
}

nls_error_t nalstream::socket::listen(int backlog)
{
    if (::listen(socket_, backlog) < 0) {
        log_platform_error("listen(2) failed");
        return NLS_SOCKET_ERROR;
    }

    return NLS_OK;
}

nalstream::socket *nalstream::socket::accept(sockaddr_in& remote)
{
    socklen_t len = sizeof(remote);
    socket_t client = ::accept(socket_, (struct sockaddr *)&remote, &len);

    if (client == (socket_t)-1) {
        log_platform_error("accept(2) failed");
        nls_errno = NLS_SOCKET_ERROR;
        return nullptr;
    }

    nalstream::socket *sock = new nalstream::socket(client);
    const int enable = 1;

    /* packets are written in two parts, header and payload */
    (void)sock->setsockopt(IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable));
    return sock;
}

nls_error_t nalstream::socket::connect(sockaddr_in& remote)
{
    if (::connect(socket_, (struct sockaddr *)&remote, sizeof(remote)) < 0) {
        log_platform_error("connect(2) failed");
        NLS_LOG_ERROR("Failed to connect to %s", sockaddr_to_string(remote).c_str());
        return NLS_SOCKET_ERROR;
    }

    const int enable = 1;
    (void)setsockopt(IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable));

    return NLS_OK;
}

nls_error_t nalstream::socket::send(const uint8_t *buf, size_t buf_len, int *bytes_sent)
{
    if (!buf || !buf_len)
        return NLS_INVALID_VALUE;

    ssize_t ret = ::send(socket_, (const char *)buf, buf_len, SEND_FLAGS);

    if (ret < 0) {
        if (bytes_sent)
            *bytes_sent = 0;
#ifdef _WIN32
        if (WSAGetLastError() == WSAEWOULDBLOCK)
#else
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
#endif
            return NLS_NOT_READY;

        log_platform_error("send(2) failed");
        return NLS_SEND_ERROR;
    }

    if (bytes_sent)
        *bytes_sent = (int)ret;

    return NLS_OK;
}

nls_error_t nalstream::socket::recv(uint8_t *buf, size_t buf_len, int recv_flags, int *bytes_read)
{
    if (!buf || !buf_len)
        return NLS_INVALID_VALUE;

    ssize_t ret = ::recv(socket_, (char *)buf, buf_len, recv_flags);

    if (ret < 0) {
        if (bytes_read)
            *bytes_read = 0;
#ifdef _WIN32
        if (WSAGetLastError() == WSAEWOULDBLOCK)
#else
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
#endif
            return NLS_INTERRUPTED;

        log_platform_error("recv(2) failed");
        return NLS_RECV_ERROR;
    }

    if (bytes_read)
        *bytes_read = (int)ret;

    return NLS_OK;
}

void nalstream::socket::shutdown_write()
{
    std::lock_guard<std::mutex> lg(shutdown_mtx_);

    if (shut_write_)
        return;

    shut_write_ = true;
    ::shutdown(socket_, SHUT_WR);
}

void nalstream::socket::shutdown()
{
    std::lock_guard<std::mutex> lg(shutdown_mtx_);

    shut_write_ = true;
    ::shutdown(socket_, SHUT_RDWR);
}

sockaddr_in nalstream::socket::get_local_address() const
{
    sockaddr_in addr;
    socklen_t len = sizeof(addr);

    memset(&addr, 0, sizeof(addr));

    if (::getsockname(socket_, (struct sockaddr *)&addr, &len) < 0)
        log_platform_error("getsockname(2) failed");

    return addr;
}

socket_t& nalstream::socket::get_raw_socket()
{
    return socket_;
}

sockaddr_in nalstream::socket::create_sockaddr(short family, std::string host, uint16_t port)
{
    sockaddr_in addr;

    memset(&addr, 0, sizeof(addr));
    addr.sin_family = family;
    addr.sin_port   = htons(port);

    if (host.empty())
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    else
        inet_pton(AF_INET, host.c_str(), &addr.sin_addr);

    return addr;
}

std::string nalstream::socket::sockaddr_to_string(const sockaddr_in& addr)
{
    char addr_string[INET_ADDRSTRLEN] = {0};

    inet_ntop(AF_INET, (void *)&addr.sin_addr, addr_string, sizeof(addr_string));

    std::string string(addr_string);
    string.append(":" + std::to_string(ntohs(addr.sin_port)));

    return string;
}
