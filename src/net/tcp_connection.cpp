#include "net/tcp_connection.hpp"
#include "core/errors.hpp"

#include <iostream>

namespace astream::net
{
using core::TransportError;

TcpConnection::TcpConnection(std::unique_ptr<asio::io_context> io,
                             asio::ip::tcp::socket&& sock,
                             std::chrono::milliseconds timeout)
    : io_(std::move(io)),
      socket_(std::move(sock)),
      timeout_(timeout)
{
    std::error_code ec;
    const auto ep = socket_.remote_endpoint(ec);
    if (!ec)
        peer_ = ep.address().to_string() + ':' + std::to_string(ep.port());

    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    if (ec)
        std::cerr << "[TCP] TCP_NODELAY not applied: " << ec.message() << '\n';
}

TcpConnection::~TcpConnection()
{
    close();
    std::error_code ec;
    socket_.close(ec);
}

TcpConnection::Ptr TcpConnection::connect(const std::string& host, uint16_t port,
                                          std::chrono::milliseconds timeout)
{
    auto io = std::make_unique<asio::io_context>();
    std::error_code ec;

    asio::ip::tcp::resolver resolver(*io);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec)
        throw TransportError("cannot resolve " + host + ": " + ec.message());

    asio::ip::tcp::socket sock(*io);
    if (timeout.count() == 0) {
        asio::connect(sock, endpoints, ec);
    } else {
        bool done = false;
        asio::async_connect(sock, endpoints,
                            [&](std::error_code e, const asio::ip::tcp::endpoint&) {
                                ec = e; done = true;
                            });
        io->run_for(timeout);
        if (!done) {
            std::error_code ignored;
            sock.close(ignored);                         // annule la tentative
            io->restart();
            io->run();
            throw TransportError("connect to " + host + ':' + std::to_string(port)
                                 + " timed out after " + std::to_string(timeout.count()) + " ms");
        }
    }
    if (ec)
        throw TransportError("cannot connect to " + host + ':' + std::to_string(port)
                             + ": " + ec.message());

    return std::make_unique<TcpConnection>(std::move(io), std::move(sock), timeout);
}

/* ─────────────────────────────────────────────────────────── */

void TcpConnection::run_until_done(const bool& done, const char* what)
{
    io_->restart();
    io_->run_for(timeout_);
    if (done)
        return;

    /* délai dépassé : on annule et on laisse le handler se terminer */
    std::error_code ignored;
    socket_.cancel(ignored);
    io_->restart();
    io_->run();
    throw TransportError(std::string(what) + " timed out after "
                         + std::to_string(timeout_.count()) + " ms");
}

std::size_t TcpConnection::read(std::span<uint8_t> buf)
{
    std::error_code ec;
    std::size_t     n = 0;

    if (timeout_.count() == 0) {
        n = asio::read(socket_, asio::buffer(buf.data(), buf.size()), ec);
    } else {
        bool done = false;
        asio::async_read(socket_, asio::buffer(buf.data(), buf.size()),
                         [&](std::error_code e, std::size_t len) {
                             ec = e; n = len; done = true;
                         });
        run_until_done(done, "read");
    }

    if (!ec || ec == asio::error::eof)
        return n;
    if (closed_)
        throw TransportError("read on locally closed connection");
    throw TransportError("read failed: " + ec.message());
}

void TcpConnection::write(std::span<const uint8_t> data)
{
    std::error_code ec;

    if (timeout_.count() == 0) {
        asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
    } else {
        bool done = false;
        asio::async_write(socket_, asio::buffer(data.data(), data.size()),
                          [&](std::error_code e, std::size_t) {
                              ec = e; done = true;
                          });
        run_until_done(done, "write");
    }

    if (!ec)
        return;
    if (closed_)
        throw TransportError("write on locally closed connection");
    throw TransportError("write failed: " + ec.message());
}

void TcpConnection::close() noexcept
{
    if (closed_.exchange(true))
        return;

    // shutdown() wakes any read/write blocked on another thread
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
}

/* ─────────────────────────────────────────────────────────── */

TcpListener::TcpListener(uint16_t port, const std::string& bind_address)
    : acceptor_(io_)
{
    std::error_code ec;
    const auto addr = asio::ip::make_address(bind_address, ec);
    if (ec)
        throw TransportError("invalid bind address " + bind_address);

    const asio::ip::tcp::endpoint ep(addr, port);

    acceptor_.open(ep.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(ep, ec);
    if (!ec) acceptor_.listen(1, ec);
    if (ec)
        throw TransportError("cannot listen on " + bind_address + ':'
                             + std::to_string(port) + ": " + ec.message());
}

TcpConnection::Ptr TcpListener::accept(std::chrono::milliseconds io_timeout)
{
    auto io = std::make_unique<asio::io_context>();
    std::error_code ec;

    asio::ip::tcp::socket sock = acceptor_.accept(*io, ec);
    if (ec)
        throw TransportError("accept failed: " + ec.message());

    return std::make_unique<TcpConnection>(std::move(io), std::move(sock), io_timeout);
}

uint16_t TcpListener::port() const
{
    std::error_code ec;
    const auto ep = acceptor_.local_endpoint(ec);
    if (ec)
        throw TransportError("listener has no local endpoint: " + ec.message());
    return ep.port();
}

void TcpListener::close() noexcept
{
    std::error_code ec;
    acceptor_.close(ec);
}

} // namespace astream::net
