// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Shared helpers for the asio-based tests. Everything runs on the test
// thread: tests drive the io_context with RunUntil() instead of a thread.

#ifndef KERNELSHIM_TEST_TEST_UTIL_HPP
#define KERNELSHIM_TEST_TEST_UTIL_HPP

#include "network/session_event.hpp"
#include <array>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace kernelshim {
namespace test {

using tcp = boost::asio::ip::tcp;

// Run handlers until pred() holds or the timeout expires
inline bool RunUntil(boost::asio::io_context& io, const std::function<bool()>& pred,
                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        io.restart();
        io.run_one_for(std::chrono::milliseconds(10));
    }
    return true;
}

// Run handlers for a fixed wall-clock period
inline void RunFor(boost::asio::io_context& io, std::chrono::milliseconds period) {
    RunUntil(io, [] { return false; }, period);
}

// Two connected loopback sockets
inline std::pair<tcp::socket, tcp::socket> MakeSocketPair(boost::asio::io_context& io) {
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    tcp::socket a(io);
    a.connect(acceptor.local_endpoint());
    tcp::socket b(io);
    acceptor.accept(b);
    return {std::move(a), std::move(b)};
}

// A loopback port with nothing listening on it
inline uint16_t UnusedPort(boost::asio::io_context& io) {
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

/**
 * Records every event a relay posts, in order
 */
class RecordingSink : public network::EventSink {
public:
    void post(network::SessionEvent event) override { events.push_back(std::move(event)); }

    size_t count(network::SessionEvent::Type type) const {
        size_t n = 0;
        for (const auto& ev : events) {
            if (ev.type == type) ++n;
        }
        return n;
    }

    bool has_exit() const { return count(network::SessionEvent::Type::EXIT) > 0; }

    std::vector<network::SessionEvent> events;
};

/**
 * Kernel stand-in: accepts on loopback and echoes every connection
 *
 * close_all() closes the kernel side of every accepted connection, which
 * the relay sees as EOF on k2c.
 */
class EchoServer {
public:
    explicit EchoServer(boost::asio::io_context& io)
        : acceptor_(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
        accept();
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }
    size_t accepted() const { return connections_.size(); }

    size_t open_connections() const {
        size_t n = 0;
        for (const auto& c : connections_) {
            if (c->socket.is_open()) ++n;
        }
        return n;
    }

    void close_all() {
        for (auto& c : connections_) {
            boost::system::error_code ec;
            c->socket.close(ec);
        }
    }

    void close(size_t index) {
        boost::system::error_code ec;
        connections_.at(index)->socket.close(ec);
    }

private:
    struct Connection {
        explicit Connection(tcp::socket s) : socket(std::move(s)) {}
        tcp::socket socket;
        std::array<char, 4096> buffer{};
    };

    void accept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) return;
            auto conn = std::make_shared<Connection>(std::move(socket));
            connections_.push_back(conn);
            echo(conn);
            accept();
        });
    }

    static void echo(std::shared_ptr<Connection> conn) {
        conn->socket.async_read_some(
            boost::asio::buffer(conn->buffer),
            [conn](const boost::system::error_code& ec, size_t n) {
                if (ec) {
                    boost::system::error_code ignored;
                    conn->socket.close(ignored);
                    return;
                }
                boost::asio::async_write(
                    conn->socket, boost::asio::buffer(conn->buffer.data(), n),
                    [conn](const boost::system::error_code& wec, size_t) {
                        if (!wec) echo(conn);
                    });
            });
    }

    tcp::acceptor acceptor_;
    std::vector<std::shared_ptr<Connection>> connections_;
};

/**
 * Async reader for a test client socket: collects bytes until EOF
 */
class ClientReader {
public:
    explicit ClientReader(tcp::socket& socket) : socket_(socket) { read(); }

    std::string data;
    bool eof = false;
    boost::system::error_code error;

private:
    void read() {
        socket_.async_read_some(boost::asio::buffer(buffer_),
                                [this](const boost::system::error_code& ec, size_t n) {
                                    if (ec) {
                                        eof = true;
                                        error = ec;
                                        return;
                                    }
                                    data.append(buffer_.data(), n);
                                    read();
                                });
    }

    tcp::socket& socket_;
    std::array<char, 4096> buffer_{};
};

// Fresh, empty directory under the system temp dir; removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("kernelshim_test_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace test
} // namespace kernelshim

#endif // KERNELSHIM_TEST_TEST_UTIL_HPP
