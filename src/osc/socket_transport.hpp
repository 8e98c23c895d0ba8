#pragma once

#include "framing.hpp"

#include <eoslink/osc.hpp>

#include <memory>
#include <string>
#include <sys/socket.h>

namespace eoslink::osc
{

// ─── SocketTransport ─────────────────────────────────────────────────────────
// Owns a connected TCP socket (or a bound UDP socket plus the console's
// address) and a framer chosen from the configured FramingMode.
// Not thread-safe; the caller must synchronize.

class SocketTransport : public Transport
{
   public:
    SocketTransport(int fd, std::unique_ptr<Framer> framer);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&)            = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;
    SocketTransport(SocketTransport&& other) noexcept;
    SocketTransport& operator=(SocketTransport&& other) noexcept;

    // Resolve, create and connect (TCP) or bind (UDP) according to `config`.
    // Returns nullptr on failure; the reason is logged.
    static std::unique_ptr<SocketTransport> connect(const TransportConfig& config);

    bool                 send(const Message& msg) override;
    std::vector<Message> receive(std::chrono::milliseconds timeout) override;
    bool                 is_open() const override { return fd_ >= 0; }
    void                 close() override;

    int         fd() const { return fd_; }
    FramingMode framing() const { return framer_->mode(); }

    // UDP only: where outgoing datagrams go.
    void set_peer(const sockaddr_storage& addr, socklen_t len);

   private:
    int                     fd_ = -1;
    std::unique_ptr<Framer> framer_;
    sockaddr_storage        peer_{};
    socklen_t               peer_len_ = 0;

    bool write_exact(const uint8_t* buf, size_t len);
    // Read whatever is available into the framer. Returns false on EOF/error.
    bool read_available();
    void drain_packets(std::vector<Message>& out);
};

}   // namespace eoslink::osc
