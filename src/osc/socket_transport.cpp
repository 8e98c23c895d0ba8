#include "socket_transport.hpp"

#include "codec.hpp"

#include <eoslink/logger.hpp>

#include <cerrno>
#include <cstring>
#include <string>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>

namespace eoslink::osc
{

namespace
{

constexpr size_t READ_CHUNK            = 64 * 1024;
constexpr int    MAX_READS_PER_RECEIVE = 256;

struct AddrInfoDeleter
{
    void operator()(addrinfo* ai) const { ::freeaddrinfo(ai); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr resolve(const std::string& host, uint16_t port, int socktype)
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = socktype;

    addrinfo*   result  = nullptr;
    std::string service = std::to_string(port);
    int         rc      = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0)
    {
        EOSLINK_LOG_ERROR("osc", "cannot resolve {}:{}: {}", host, port, ::gai_strerror(rc));
        return nullptr;
    }
    return AddrInfoPtr(result);
}

int connect_stream(const TransportConfig& config)
{
    auto addrs = resolve(config.host, config.port, SOCK_STREAM);
    if (!addrs)
        return -1;

    for (addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next)
    {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0)
            continue;
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
        {
            int one = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            return fd;
        }
        ::close(fd);
    }
    EOSLINK_LOG_ERROR("osc",
                      "cannot connect to {}:{}: {}",
                      config.host,
                      config.port,
                      std::strerror(errno));
    return -1;
}

int bind_datagram(const TransportConfig& config, sockaddr_storage& peer, socklen_t& peer_len)
{
    auto addrs = resolve(config.host, config.port, SOCK_DGRAM);
    if (!addrs)
        return -1;

    addrinfo* ai = addrs.get();
    int       fd = ::socket(ai->ai_family, SOCK_DGRAM, 0);
    if (fd < 0)
    {
        EOSLINK_LOG_ERROR("osc", "udp socket: {}", std::strerror(errno));
        return -1;
    }

    sockaddr_storage local{};
    socklen_t        local_len = 0;
    if (ai->ai_family == AF_INET6)
    {
        auto* in6        = reinterpret_cast<sockaddr_in6*>(&local);
        in6->sin6_family = AF_INET6;
        in6->sin6_addr   = in6addr_any;
        in6->sin6_port   = htons(config.rx_port);
        local_len        = sizeof(sockaddr_in6);
    }
    else
    {
        auto* in4            = reinterpret_cast<sockaddr_in*>(&local);
        in4->sin_family      = AF_INET;
        in4->sin_addr.s_addr = htonl(INADDR_ANY);
        in4->sin_port        = htons(config.rx_port);
        local_len            = sizeof(sockaddr_in);
    }

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(fd, reinterpret_cast<sockaddr*>(&local), local_len) < 0)
    {
        EOSLINK_LOG_ERROR("osc", "cannot bind udp port {}: {}", config.rx_port, std::strerror(errno));
        ::close(fd);
        return -1;
    }

    std::memcpy(&peer, ai->ai_addr, ai->ai_addrlen);
    peer_len = static_cast<socklen_t>(ai->ai_addrlen);
    return fd;
}

}   // namespace

// ─── Lifetime ────────────────────────────────────────────────────────────────

SocketTransport::SocketTransport(int fd, std::unique_ptr<Framer> framer)
    : fd_(fd), framer_(std::move(framer))
{
}

SocketTransport::~SocketTransport()
{
    close();
}

SocketTransport::SocketTransport(SocketTransport&& other) noexcept
    : fd_(other.fd_),
      framer_(std::move(other.framer_)),
      peer_(other.peer_),
      peer_len_(other.peer_len_)
{
    other.fd_ = -1;
}

SocketTransport& SocketTransport::operator=(SocketTransport&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_       = other.fd_;
        framer_   = std::move(other.framer_);
        peer_     = other.peer_;
        peer_len_ = other.peer_len_;
        other.fd_ = -1;
    }
    return *this;
}

std::unique_ptr<SocketTransport> SocketTransport::connect(const TransportConfig& config)
{
    if (config.framing == FramingMode::Datagram)
    {
        sockaddr_storage peer{};
        socklen_t        peer_len = 0;
        int              fd       = bind_datagram(config, peer, peer_len);
        if (fd < 0)
            return nullptr;
        auto transport = std::make_unique<SocketTransport>(fd, make_framer(config.framing));
        transport->set_peer(peer, peer_len);
        EOSLINK_LOG_INFO("osc",
                         "udp ready for {} (tx {}, rx {})",
                         config.host,
                         config.port,
                         config.rx_port);
        return transport;
    }

    int fd = connect_stream(config);
    if (fd < 0)
        return nullptr;
    EOSLINK_LOG_INFO("osc",
                     "connected to {}:{} ({})",
                     config.host,
                     config.port,
                     framing_name(config.framing));
    return std::make_unique<SocketTransport>(fd, make_framer(config.framing));
}

void SocketTransport::set_peer(const sockaddr_storage& addr, socklen_t len)
{
    peer_     = addr;
    peer_len_ = len;
}

void SocketTransport::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
    if (framer_)
        framer_->reset();
}

// ─── Send ────────────────────────────────────────────────────────────────────

bool SocketTransport::write_exact(const uint8_t* buf, size_t len)
{
    size_t total = 0;
    while (total < len)
    {
        auto n = ::send(fd_, buf + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool SocketTransport::send(const Message& msg)
{
    if (fd_ < 0)
        return false;

    auto packet = encode_message(msg);
    auto wire   = framer_->frame(packet);

    if (framer_->mode() == FramingMode::Datagram)
    {
        auto n = ::sendto(fd_,
                          wire.data(),
                          wire.size(),
                          0,
                          reinterpret_cast<const sockaddr*>(&peer_),
                          peer_len_);
        return n == static_cast<ssize_t>(wire.size());
    }

    if (!write_exact(wire.data(), wire.size()))
    {
        EOSLINK_LOG_WARN("osc", "send failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

// ─── Receive ─────────────────────────────────────────────────────────────────

bool SocketTransport::read_available()
{
    uint8_t buf[READ_CHUNK];
    ssize_t n = 0;
    do
    {
        n = ::recv(fd_, buf, sizeof(buf), 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return true;
        EOSLINK_LOG_WARN("osc", "recv failed: {}", std::strerror(errno));
        return false;
    }
    if (n == 0 && framer_->mode() != FramingMode::Datagram)
    {
        EOSLINK_LOG_WARN("osc", "connection closed by console");
        return false;
    }

    if (!framer_->feed(std::span<const uint8_t>(buf, static_cast<size_t>(n))))
    {
        EOSLINK_LOG_ERROR("osc", "corrupt {} stream", framing_name(framer_->mode()));
        return false;
    }
    return true;
}

void SocketTransport::drain_packets(std::vector<Message>& out)
{
    while (auto packet = framer_->next_packet())
    {
        auto msgs = decode_packet(*packet);
        if (!msgs)
        {
            EOSLINK_LOG_WARN("osc", "dropping malformed packet ({} bytes)", packet->size());
            continue;
        }
        for (auto& m : *msgs)
            out.push_back(std::move(m));
    }
}

std::vector<Message> SocketTransport::receive(std::chrono::milliseconds timeout)
{
    std::vector<Message> out;
    if (fd_ < 0)
        return out;

    drain_packets(out);

    pollfd pfd{};
    pfd.fd      = fd_;
    pfd.events  = POLLIN;
    int wait_ms = out.empty() ? static_cast<int>(timeout.count()) : 0;

    for (int reads = 0; fd_ >= 0 && reads < MAX_READS_PER_RECEIVE; ++reads)
    {
        pfd.revents = 0;
        int pr      = ::poll(&pfd, 1, wait_ms);
        if (pr <= 0)
            break;   // timeout, or EINTR: the caller's deadline loop retries

        if (pfd.revents & (POLLERR | POLLNVAL))
        {
            close();
            break;
        }
        if (pfd.revents & (POLLIN | POLLHUP))
        {
            if (!read_available())
            {
                drain_packets(out);
                close();
                break;
            }
        }
        wait_ms = 0;   // only block on the first iteration
    }

    drain_packets(out);
    return out;
}

}   // namespace eoslink::osc
