#include <gtest/gtest.h>

#include "osc/codec.hpp"
#include "osc/framing.hpp"
#include "osc/socket_transport.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <thread>

using namespace eoslink::osc;

namespace
{

// Loopback listener on an ephemeral port.
class LoopbackServer
{
   public:
    explicit LoopbackServer(int type)
    {
        fd_ = ::socket(AF_INET, type, 0);
        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        if (type == SOCK_STREAM)
            ::listen(fd_, 1);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~LoopbackServer()
    {
        if (peer_ >= 0)
            ::close(peer_);
        if (fd_ >= 0)
            ::close(fd_);
    }

    uint16_t port() const { return port_; }
    int      fd() const { return fd_; }

    int accept_one()
    {
        peer_ = ::accept(fd_, nullptr, nullptr);
        return peer_;
    }
    void close_peer()
    {
        ::close(peer_);
        peer_ = -1;
    }

   private:
    int      fd_   = -1;
    int      peer_ = -1;
    uint16_t port_ = 0;
};

// Reads from `fd` through `framer` until one packet is complete.
std::optional<Message> read_message(int fd, Framer& framer)
{
    uint8_t buf[4096];
    while (framer.pending_packets() == 0)
    {
        auto n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0)
            return std::nullopt;
        framer.feed(std::span<const uint8_t>(buf, static_cast<size_t>(n)));
    }
    return decode_message(*framer.next_packet());
}

void write_all(int fd, const std::vector<uint8_t>& bytes)
{
    size_t sent = 0;
    while (sent < bytes.size())
    {
        auto n = ::send(fd, bytes.data() + sent, bytes.size() - sent, 0);
        ASSERT_GT(n, 0);
        sent += static_cast<size_t>(n);
    }
}

// Receives until `count` messages arrived or two seconds passed.
std::vector<Message> receive_n(Transport& t, size_t count)
{
    std::vector<Message> out;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (out.size() < count && std::chrono::steady_clock::now() < deadline && t.is_open())
    {
        for (auto& m : t.receive(std::chrono::milliseconds(50)))
            out.push_back(std::move(m));
    }
    return out;
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// TCP
// ═══════════════════════════════════════════════════════════════════════════════

class SocketTransportStream : public ::testing::TestWithParam<FramingMode>
{
};

TEST_P(SocketTransportStream, SendAndReceive)
{
    LoopbackServer server(SOCK_STREAM);

    TransportConfig config;
    config.host    = "127.0.0.1";
    config.port    = server.port();
    config.framing = GetParam();

    auto client = SocketTransport::connect(config);
    ASSERT_NE(client, nullptr);
    EXPECT_TRUE(client->is_open());
    EXPECT_EQ(client->framing(), GetParam());

    int peer = server.accept_one();
    ASSERT_GE(peer, 0);

    ASSERT_TRUE(client->send(Message{"/eos/ping", {std::string("hello")}}));

    auto server_framer = make_framer(GetParam());
    auto got           = read_message(peer, *server_framer);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->address, "/eos/ping");
    EXPECT_EQ(std::get<std::string>(got->args.at(0)), "hello");

    // Two replies in one write, the second inside a bundle.
    auto first  = server_framer->frame(encode_message(Message{"/eos/out/ping", {std::string("hello")}}));
    auto second = server_framer->frame(
        encode_bundle({{"/eos/out/user", {int32_t(1)}}, {"/eos/out/locked", {false}}}));
    first.insert(first.end(), second.begin(), second.end());
    write_all(peer, first);

    auto msgs = receive_n(*client, 3);
    ASSERT_EQ(msgs.size(), 3u);
    EXPECT_EQ(msgs[0].address, "/eos/out/ping");
    EXPECT_EQ(msgs[1].address, "/eos/out/user");
    EXPECT_EQ(msgs[2].address, "/eos/out/locked");
}

TEST_P(SocketTransportStream, PeerCloseClosesTransport)
{
    LoopbackServer server(SOCK_STREAM);

    TransportConfig config;
    config.port    = server.port();
    config.framing = GetParam();

    auto client = SocketTransport::connect(config);
    ASSERT_NE(client, nullptr);
    ASSERT_GE(server.accept_one(), 0);
    server.close_peer();

    auto msgs = receive_n(*client, 1);
    EXPECT_TRUE(msgs.empty());
    EXPECT_FALSE(client->is_open());
    EXPECT_FALSE(client->send(Message{"/eos/ping", {}}));
}

INSTANTIATE_TEST_SUITE_P(Framings,
                         SocketTransportStream,
                         ::testing::Values(FramingMode::PacketLength, FramingMode::Slip));

TEST(SocketTransport, ReceiveTimesOutQuietly)
{
    LoopbackServer server(SOCK_STREAM);

    TransportConfig config;
    config.port = server.port();

    auto client = SocketTransport::connect(config);
    ASSERT_NE(client, nullptr);
    ASSERT_GE(server.accept_one(), 0);

    auto start = std::chrono::steady_clock::now();
    auto msgs  = client->receive(std::chrono::milliseconds(30));
    auto took  = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(msgs.empty());
    EXPECT_TRUE(client->is_open());
    EXPECT_GE(took, std::chrono::milliseconds(25));
}

TEST(SocketTransport, ConnectRefusedReturnsNull)
{
    uint16_t port = 0;
    {
        LoopbackServer probe(SOCK_STREAM);
        port = probe.port();
    }
    TransportConfig config;
    config.port = port;
    EXPECT_EQ(SocketTransport::connect(config), nullptr);
}

TEST(SocketTransport, MoveTransfersOwnership)
{
    LoopbackServer server(SOCK_STREAM);

    TransportConfig config;
    config.port = server.port();

    auto client = SocketTransport::connect(config);
    ASSERT_NE(client, nullptr);
    int fd = client->fd();

    SocketTransport moved(std::move(*client));
    EXPECT_EQ(moved.fd(), fd);
    EXPECT_FALSE(client->is_open());
    EXPECT_TRUE(moved.is_open());
}

// ═══════════════════════════════════════════════════════════════════════════════
// UDP
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SocketTransport, DatagramRoundTrip)
{
    LoopbackServer console(SOCK_DGRAM);

    TransportConfig config;
    config.host    = "127.0.0.1";
    config.port    = console.port();
    config.rx_port = 0;   // ephemeral; the console answers to the sender address
    config.framing = FramingMode::Datagram;

    auto client = SocketTransport::connect(config);
    ASSERT_NE(client, nullptr);
    ASSERT_TRUE(client->send(Message{"/eos/get/version", {}}));

    uint8_t          buf[2048];
    sockaddr_storage from{};
    socklen_t        from_len = sizeof(from);
    auto n = ::recvfrom(console.fd(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &from_len);
    ASSERT_GT(n, 0);
    auto request = decode_message(std::span<const uint8_t>(buf, static_cast<size_t>(n)));
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->address, "/eos/get/version");

    auto reply = encode_message(Message{"/eos/out/get/version", {std::string("3.2.0")}});
    ASSERT_EQ(::sendto(console.fd(), reply.data(), reply.size(), 0,
                       reinterpret_cast<sockaddr*>(&from), from_len),
              static_cast<ssize_t>(reply.size()));

    auto msgs = receive_n(*client, 1);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].address, "/eos/out/get/version");
}
