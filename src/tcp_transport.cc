#include "nalstream/tcp_transport.hh"

#include "debug.hh"
#include "global.hh"
#include "poll.hh"
#include "socket.hh"

#include <system_error>

/* pending connections the kernel keeps before accept(2) */
static const int LISTEN_BACKLOG = 4;

nalstream::tcp_transport::tcp_transport() :
    listener_(nullptr),
    acceptor_(nullptr),
    should_stop_(false),
    conns_(),
    finished_(),
    on_bytes_(),
    on_state_(),
    read_buffer_size_(DEFAULT_READ_BUFFER_SIZE)
{
#ifdef _WIN32
    WSADATA wsd;
    int rc;

    if ((rc = WSAStartup(MAKEWORD(2, 2), &wsd)) != 0)
        log_platform_error("WSAStartup() failed");
#endif
}

nalstream::tcp_transport::~tcp_transport()
{
    should_stop_ = true;

    if (acceptor_ && acceptor_->joinable())
        acceptor_->join();

    std::vector<std::shared_ptr<connection>> conns;

    {
        std::lock_guard<std::mutex> lg(conns_mtx_);

        for (auto& conn : conns_)
            conns.push_back(conn.second);
    }

    for (auto& conn : conns) {
        conn->should_stop = true;
        conn->sock->shutdown();
    }

    for (auto& conn : conns) {
        if (conn->reader && conn->reader->joinable())
            conn->reader->join();
    }

    reap();

#ifdef _WIN32
    WSACleanup();
#endif
}

nls_error_t nalstream::tcp_transport::listen(const std::string& address, uint16_t port)
{
    if (listener_)
        return NLS_INITIALIZED;

    auto sock = std::make_shared<nalstream::socket>();
    nls_error_t ret = NLS_OK;
    const int enable = 1;

    if ((ret = sock->init(AF_INET, SOCK_STREAM, 0)) != NLS_OK)
        return ret;

    if ((ret = sock->setsockopt(SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable))) != NLS_OK)
        return ret;

    sockaddr_in local = nalstream::socket::create_sockaddr(AF_INET, address, port);

    if ((ret = sock->bind(local)) != NLS_OK)
        return ret;

    if ((ret = sock->listen(LISTEN_BACKLOG)) != NLS_OK)
        return ret;

    listener_ = sock;

    try {
        acceptor_ = std::unique_ptr<std::thread>(new std::thread(&nalstream::tcp_transport::acceptor, this));
    } catch (const std::system_error& e) {
        NLS_LOG_ERROR("Failed to create acceptor thread: %s", e.what());
        listener_ = nullptr;
        return NLS_MEMORY_ERROR;
    }

    NLS_LOG_INFO("Listening on %s",
        nalstream::socket::sockaddr_to_string(listener_->get_local_address()).c_str());
    return NLS_OK;
}

uint16_t nalstream::tcp_transport::get_local_port() const
{
    if (!listener_)
        return 0;

    return ntohs(listener_->get_local_address().sin_port);
}

nls_error_t nalstream::tcp_transport::connect(const std::string& address, uint16_t port)
{
    sockaddr_in remote = nalstream::socket::create_sockaddr(AF_INET, address, port);

    if (address.empty() || remote.sin_addr.s_addr == htonl(INADDR_ANY)) {
        NLS_LOG_ERROR("Invalid remote address '%s'", address.c_str());
        return NLS_INVALID_VALUE;
    }

    auto sock = std::make_shared<nalstream::socket>();
    nls_error_t ret = NLS_OK;

    if ((ret = sock->init(AF_INET, SOCK_STREAM, 0)) != NLS_OK)
        return ret;

    if ((ret = sock->connect(remote)) != NLS_OK)
        return ret;

    return add_connection(sock, nalstream::socket::sockaddr_to_string(remote));
}

nls_error_t nalstream::tcp_transport::disconnect(const std::string& peer)
{
    auto conn = find(peer);

    if (!conn)
        return NLS_NOT_FOUND;

    conn->should_stop = true;
    conn->sock->shutdown();

    return NLS_OK;
}

nls_error_t nalstream::tcp_transport::configure_ctx(int ncc_flag, ssize_t value)
{
    if (ncc_flag != NCC_READ_BUFFER_SIZE) {
        NLS_LOG_WARN("Configuration flag %d is not supported by the TCP transport", ncc_flag);
        return NLS_INVALID_VALUE;
    }

    if (value <= 0)
        return NLS_INVALID_VALUE;

    read_buffer_size_ = (size_t)value;
    return NLS_OK;
}

std::vector<std::string> nalstream::tcp_transport::get_peers() const
{
    std::lock_guard<std::mutex> lg(conns_mtx_);
    std::vector<std::string> peers;

    for (auto& conn : conns_)
        peers.push_back(conn.first);

    return peers;
}

nls_error_t nalstream::tcp_transport::open_stream(const std::string& peer)
{
    auto conn = find(peer);

    if (!conn || conn->should_stop)
        return NLS_NOT_FOUND;

    conn->stream_open = true;
    return NLS_OK;
}

ssize_t nalstream::tcp_transport::write(const std::string& peer, const uint8_t *data, size_t len)
{
    auto conn = find(peer);

    if (!conn || !conn->stream_open)
        return -1;

    int bytes_sent = 0;
    nls_error_t ret = conn->sock->send(data, len, &bytes_sent);

    if (ret == NLS_NOT_READY)
        return 0;

    if (ret != NLS_OK)
        return -1;

    return bytes_sent;
}

void nalstream::tcp_transport::close_stream(const std::string& peer)
{
    auto conn = find(peer);

    if (!conn || !conn->stream_open)
        return;

    conn->stream_open = false;
    conn->sock->shutdown_write();
}

void nalstream::tcp_transport::install_handlers(nalstream::bytes_handler on_bytes,
    nalstream::state_handler on_state)
{
    std::lock_guard<std::mutex> lg(handlers_mtx_);

    on_bytes_ = on_bytes;
    on_state_ = on_state;
}

nls_error_t nalstream::tcp_transport::add_connection(std::shared_ptr<nalstream::socket> sock,
    const std::string& peer)
{
    reap();

    auto conn  = std::make_shared<connection>();
    conn->peer = peer;
    conn->sock = sock;

    std::lock_guard<std::mutex> lg(conns_mtx_);

    if (conns_.find(peer) != conns_.end()) {
        NLS_LOG_ERROR("Connection to %s exists already", peer.c_str());
        return NLS_INITIALIZED;
    }

    try {
        conn->reader = std::unique_ptr<std::thread>(
            new std::thread(&nalstream::tcp_transport::reader, this, conn, (size_t)read_buffer_size_)
        );
    } catch (const std::system_error& e) {
        NLS_LOG_ERROR("Failed to create reader thread for %s: %s", peer.c_str(), e.what());
        return NLS_MEMORY_ERROR;
    }

    conns_[peer] = conn;
    return NLS_OK;
}

void nalstream::tcp_transport::acceptor()
{
    while (!should_stop_) {
        nls_error_t ret = nalstream::poll::wait_readable(listener_, DEFAULT_POLL_TIMEOUT_MS);

        if (ret == NLS_INTERRUPTED)
            continue;

        if (ret != NLS_OK) {
            NLS_LOG_ERROR("Polling the listening socket failed, no longer accepting peers");
            break;
        }

        sockaddr_in remote;
        nalstream::socket *client = listener_->accept(remote);

        if (!client)
            continue;

        std::string peer = nalstream::socket::sockaddr_to_string(remote);
        NLS_LOG_DEBUG("Accepted connection from %s", peer.c_str());

        (void)add_connection(std::shared_ptr<nalstream::socket>(client), peer);
    }
}

void nalstream::tcp_transport::reader(std::shared_ptr<connection> conn, size_t buffer_size)
{
    std::unique_ptr<uint8_t[]> buffer(new uint8_t[buffer_size]);

    report_state(conn->peer, NLS_PEER_CONNECTED);

    while (!conn->should_stop && !should_stop_) {
        nls_error_t ret = nalstream::poll::wait_readable(conn->sock, DEFAULT_POLL_TIMEOUT_MS);

        if (ret == NLS_INTERRUPTED)
            continue;

        if (ret != NLS_OK)
            break;

        int bytes_read = 0;
        ret = conn->sock->recv(buffer.get(), buffer_size, 0, &bytes_read);

        if (ret == NLS_INTERRUPTED)
            continue;

        if (ret != NLS_OK)
            break;

        if (bytes_read == 0) {
            NLS_LOG_DEBUG("Peer %s closed the connection", conn->peer.c_str());
            break;
        }

        report_bytes(conn->peer, buffer.get(), (size_t)bytes_read);
    }

    conn->stream_open = false;

    {
        std::lock_guard<std::mutex> lg(conns_mtx_);

        auto it = conns_.find(conn->peer);
        if (it != conns_.end() && it->second == conn) {
            finished_.push_back(conn);
            conns_.erase(it);
        }
    }

    report_state(conn->peer, NLS_PEER_DISCONNECTED);
}

void nalstream::tcp_transport::reap()
{
    std::vector<std::shared_ptr<connection>> finished;

    {
        std::lock_guard<std::mutex> lg(conns_mtx_);
        finished.swap(finished_);
    }

    for (auto& conn : finished) {
        if (conn->reader && conn->reader->joinable()) {
            /* a reader cannot join itself, leave it for the next round */
            if (conn->reader->get_id() == std::this_thread::get_id()) {
                std::lock_guard<std::mutex> lg(conns_mtx_);
                finished_.push_back(conn);
                continue;
            }
            conn->reader->join();
        }
    }
}

void nalstream::tcp_transport::report_state(const std::string& peer, nls_peer_state_t state)
{
    std::lock_guard<std::mutex> lg(handlers_mtx_);

    if (on_state_)
        on_state_(peer, state);
}

void nalstream::tcp_transport::report_bytes(const std::string& peer, const uint8_t *data, size_t len)
{
    std::lock_guard<std::mutex> lg(handlers_mtx_);

    if (on_bytes_)
        on_bytes_(peer, data, len);
}

std::shared_ptr<nalstream::tcp_transport::connection> nalstream::tcp_transport::find(const std::string& peer) const
{
    std::lock_guard<std::mutex> lg(conns_mtx_);

    auto it = conns_.find(peer);
    if (it == conns_.end())
        return nullptr;

    return it->second;
}
