#pragma once
#include "net/connection.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace astream::net
{
/**
 *  Connection over one TCP socket.
 *
 *  Without a timeout reads and writes are plain blocking asio calls. With
 *  one, each operation runs asynchronously and the private io_context is
 *  driven with run_for(); expiry aborts with TransportError. Timed
 *  operations must not run concurrently from two threads.
 */
class TcpConnection final : public Connection
{
public:
    using Ptr = std::unique_ptr<TcpConnection>;

    /** Throws TransportError if the peer cannot be reached. A non-zero
     *  `timeout` also bounds the connect; name resolution is not bounded. */
    static Ptr connect(const std::string& host, uint16_t port,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    /** `sock` must be open on `io`. */
    TcpConnection(std::unique_ptr<asio::io_context> io,
                  asio::ip::tcp::socket&& sock,
                  std::chrono::milliseconds timeout);
    ~TcpConnection() override;

    std::size_t read(std::span<uint8_t> buf) override;
    void        write(std::span<const uint8_t> data) override;
    void        close() noexcept override;

    [[nodiscard]] const std::string& peer() const noexcept { return peer_; }

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

private:
    /** Drives the pending async op; cancels it on expiry. */
    void run_until_done(const bool& done, const char* what);

    std::unique_ptr<asio::io_context> io_;
    asio::ip::tcp::socket             socket_;
    std::chrono::milliseconds         timeout_;
    std::string                       peer_;
    std::atomic<bool>                 closed_ {false};
};

/** Passive side: binds a port and accepts stream sessions. */
class TcpListener
{
public:
    /** Port 0 picks an ephemeral port, see port(). */
    explicit TcpListener(uint16_t port, const std::string& bind_address = "0.0.0.0");

    /** Blocks until one peer connects. */
    [[nodiscard]] TcpConnection::Ptr accept(
        std::chrono::milliseconds io_timeout = std::chrono::milliseconds{0});

    [[nodiscard]] uint16_t port() const;

    void close() noexcept;

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

private:
    asio::io_context        io_;
    asio::ip::tcp::acceptor acceptor_;
};

} // namespace astream::net
