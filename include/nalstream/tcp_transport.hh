#pragma once

#include "transport.hh"
#include "util.hh"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace nalstream {

    /// \cond DO_NOT_DOCUMENT
    class socket;
    /// \endcond

    /**
     * \brief Transport over TCP connections
     *
     * \details Every accepted or connected socket is one peer, identified by the
     * "address:port" of the remote end. Each connection has a reader thread that reports
     * the peer as connected, delivers the inbound stream in chunks of at most
     * #NCC_READ_BUFFER_SIZE bytes and reports the peer as disconnected when the connection ends.
     *
     * Writes never block, the number of bytes the kernel accepted is returned.
     */
    class tcp_transport : public transport {
        public:
            tcp_transport();
            ~tcp_transport();

            /**
             * \brief Accept connections on "port"
             *
             * \param address Local IPv4 address, empty for all interfaces
             * \param port Local port, 0 to let the system pick one, see get_local_port()
             *
             * \retval NLS_OK           On success
             * \retval NLS_INITIALIZED  If the transport is already listening
             * \retval NLS_SOCKET_ERROR If the socket could not be created
             * \retval NLS_BIND_ERROR   If the address is in use
             */
            nls_error_t listen(const std::string& address, uint16_t port);

            /** \brief Port the transport is listening on, 0 if it is not listening */
            uint16_t get_local_port() const;

            /**
             * \brief Connect to a listening transport
             *
             * \details The remote end becomes a peer and is reported as connected
             * from its reader thread
             *
             * \retval NLS_OK           On success
             * \retval NLS_INVALID_VALUE If "address" is not an IPv4 address
             * \retval NLS_SOCKET_ERROR If the connection could not be made
             */
            nls_error_t connect(const std::string& address, uint16_t port);

            /**
             * \brief Close the connection to "peer"
             *
             * \details The peer is reported as disconnected from its reader thread
             *
             * \retval NLS_OK        On success
             * \retval NLS_NOT_FOUND If there is no connection to "peer"
             */
            nls_error_t disconnect(const std::string& peer);

            /**
             * \brief Configure the transport, only #NCC_READ_BUFFER_SIZE is supported
             *
             * \details The value is used by connections made after the call
             *
             * \retval NLS_OK            On success
             * \retval NLS_INVALID_VALUE If the flag is not supported or the value is not positive
             */
            nls_error_t configure_ctx(int ncc_flag, ssize_t value);

            /** \brief Identifiers of the connected peers */
            std::vector<std::string> get_peers() const;

            nls_error_t open_stream(const std::string& peer);
            ssize_t write(const std::string& peer, const uint8_t *data, size_t len);
            void close_stream(const std::string& peer);
            void install_handlers(nalstream::bytes_handler on_bytes, nalstream::state_handler on_state);

        private:
            struct connection {
                std::string peer;
                std::shared_ptr<nalstream::socket> sock;
                std::unique_ptr<std::thread> reader;
                std::atomic<bool> stream_open{false};
                std::atomic<bool> should_stop{false};
            };

            nls_error_t add_connection(std::shared_ptr<nalstream::socket> sock, const std::string& peer);

            void acceptor();
            void reader(std::shared_ptr<connection> conn, size_t buffer_size);

            /* Join readers that have finished */
            void reap();

            void report_state(const std::string& peer, nls_peer_state_t state);
            void report_bytes(const std::string& peer, const uint8_t *data, size_t len);

            std::shared_ptr<connection> find(const std::string& peer) const;

            std::shared_ptr<nalstream::socket> listener_;
            std::unique_ptr<std::thread> acceptor_;
            std::atomic<bool> should_stop_;

            mutable std::mutex conns_mtx_;
            std::map<std::string, std::shared_ptr<connection>> conns_;
            std::vector<std::shared_ptr<connection>> finished_;

            /* held while a handler runs so that uninstalling waits for it */
            std::mutex handlers_mtx_;
            nalstream::bytes_handler on_bytes_;
            nalstream::state_handler on_state_;

            std::atomic<size_t> read_buffer_size_;
    };
}
