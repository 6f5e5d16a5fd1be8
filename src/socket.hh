#pragma once

#include "nalstream/util.hh"

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

#include <mutex>
#include <string>

#ifdef _WIN32
typedef SOCKET socket_t;
#else
typedef int socket_t;
#endif

namespace nalstream {

#ifdef _WIN32
    typedef int socklen_t;
#endif

    /* Thin wrapper around one TCP socket, closed when the object is destroyed */
    class socket {
        public:
            socket();

            /* Take ownership of a socket returned by accept(2) */
            socket(socket_t raw_socket);
            ~socket();

            /* Create socket using "family", "type" and "protocol"
             *
             * Return NLS_OK on success
             * Return NLS_SOCKET_ERROR if creating the socket failed */
            nls_error_t init(short family, int type, int protocol);

            /* Same as setsockopt(2)
             *
             * Return NLS_OK on success
             * Return NLS_GENERIC_ERROR if setsockopt failed */
            nls_error_t setsockopt(int level, int optname, const void *optval, socklen_t optlen);

            /* Same as bind(2)
             *
             * Return NLS_OK on success
             * Return NLS_BIND_ERROR if the bind failed */
            nls_error_t bind(sockaddr_in& local_address);

            /* Same as listen(2)
             *
             * Return NLS_OK on success
             * Return NLS_SOCKET_ERROR on error */
            nls_error_t listen(int backlog);

            /* Same as accept(2), "remote" receives the address of the peer
             *
             * Return pointer to the new socket on success
             * Return nullptr on error */
            nalstream::socket *accept(sockaddr_in& remote);

            /* Same as connect(2)
             *
             * Return NLS_OK on success
             * Return NLS_SOCKET_ERROR if the connection could not be made */
            nls_error_t connect(sockaddr_in& remote);

            /* Send without blocking, write the amount of bytes accepted to "bytes_sent"
             *
             * Return NLS_OK on success
             * Return NLS_NOT_READY if the send buffer is full and "bytes_sent" is 0
             * Return NLS_SEND_ERROR if the connection is broken */
            nls_error_t send(const uint8_t *buf, size_t buf_len, int *bytes_sent);

            /* Same as recv(2), write the amount of bytes read to "bytes_read"
             *
             * Return NLS_OK on success, 0 bytes read means the peer closed the connection
             * Return NLS_INTERRUPTED if there was nothing to read
             * Return NLS_RECV_ERROR on error */
            nls_error_t recv(uint8_t *buf, size_t buf_len, int recv_flags, int *bytes_read);

            /* Same as shutdown(2) with SHUT_WR, the peer reads end of stream */
            void shutdown_write();

            /* Same as shutdown(2) with SHUT_RDWR, wakes up a blocked reader */
            void shutdown();

            /* Address the socket is bound to, valid after bind() or connect() */
            sockaddr_in get_local_address() const;

            socket_t& get_raw_socket();

            /* Create sockaddr_in object, "host" must be an IPv4 address or empty for INADDR_ANY */
            static sockaddr_in create_sockaddr(short family, std::string host, uint16_t port);

            /* Format "addr" as "address:port" */
            static std::string sockaddr_to_string(const sockaddr_in& addr);

        private:
            socket_t socket_;
            std::mutex shutdown_mtx_;
            bool shut_write_;
    };
}
