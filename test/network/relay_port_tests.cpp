// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/dialer.hpp"
#include "network/protocol.hpp"
#include "network/relay_port.hpp"
#include "test_util.hpp"
#include <algorithm>
#include <boost/asio/write.hpp>

using namespace kernelshim;
using namespace kernelshim::network;
using namespace kernelshim::test;
using Type = SessionEvent::Type;

namespace {

struct RelayFixture {
    boost::asio::io_context io;
    EchoServer kernel{io};
    DirectDialer dialer{io};
    RecordingSink sink;
    std::unique_ptr<RelayPort> port;

    explicit RelayFixture(uint16_t remote_port = 0, const std::string& listen_host = "127.0.0.1") {
        RelayPortConfig config;
        config.name = protocol::ports::SHELL;
        config.listen_host = listen_host;
        config.listen_port = 0;
        config.remote_host = "127.0.0.1";
        config.remote_port = remote_port ? remote_port : kernel.port();
        port = std::make_unique<RelayPort>(io, config, dialer);
    }

    tcp::socket connect() {
        tcp::socket client(io);
        client.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port->local_port()));
        return client;
    }

    void send(tcp::socket& client, const std::string& data) {
        boost::asio::write(client, boost::asio::buffer(data));
    }
};

} // namespace

TEST_CASE("RelayPort relays both directions", "[network][relay]") {
    RelayFixture f;
    REQUIRE(f.port->start(f.sink));
    CHECK(f.port->is_listening());
    CHECK(f.port->local_port() != 0);

    auto client = f.connect();
    ClientReader reader(client);
    f.send(client, "hello");

    REQUIRE(RunUntil(f.io, [&] { return reader.data == "hello"; }));
    CHECK(f.sink.count(Type::TASK_START) == 3);
    CHECK(f.sink.count(Type::TASK_END) == 0);
    CHECK(f.port->sessions_accepted() == 1);

    REQUIRE(f.sink.events.size() >= 3);
    CHECK(f.sink.events[0].task->kind() == TaskKind::SESSION);
    CHECK(f.sink.events[1].task->kind() == TaskKind::CLIENT_TO_KERNEL);
    CHECK(f.sink.events[2].task->kind() == TaskKind::KERNEL_TO_CLIENT);
}

TEST_CASE("RelayPort kernel EOF ends the session with EXIT 1", "[network][relay]") {
    RelayFixture f;
    REQUIRE(f.port->start(f.sink));

    auto client = f.connect();
    ClientReader reader(client);
    f.send(client, "ping");
    REQUIRE(RunUntil(f.io, [&] { return reader.data == "ping"; }));

    f.kernel.close_all();
    REQUIRE(RunUntil(f.io, [&] { return f.sink.has_exit() && reader.eof; }));

    // TASK_START x3, then TASK_END x3, then EXIT
    REQUIRE(f.sink.events.size() == 7);
    for (size_t i = 3; i < 6; ++i) {
        CHECK(f.sink.events[i].type == Type::TASK_END);
    }
    CHECK(f.sink.events[3].task_id == f.sink.events[0].task_id);
    CHECK(f.sink.events[6].type == Type::EXIT);
    CHECK(f.sink.events[6].status == 1);
    CHECK(f.port->is_listening());
}

TEST_CASE("RelayPort client close ends the session without EXIT", "[network][relay]") {
    RelayFixture f;
    REQUIRE(f.port->start(f.sink));

    {
        auto client = f.connect();
        ClientReader reader(client);
        f.send(client, "x");
        REQUIRE(RunUntil(f.io, [&] { return reader.data == "x"; }));
        client.shutdown(tcp::socket::shutdown_send);
        REQUIRE(RunUntil(f.io, [&] { return f.sink.count(Type::TASK_END) == 3; }));
        REQUIRE(RunUntil(f.io, [&] { return reader.eof; }));
    }

    RunFor(f.io, std::chrono::milliseconds(50));
    CHECK_FALSE(f.sink.has_exit());
    // The kernel side was closed too
    REQUIRE(RunUntil(f.io, [&] { return f.kernel.open_connections() == 0; }));
}

TEST_CASE("RelayPort kernel unreachable", "[network][relay]") {
    boost::asio::io_context probe;
    RelayFixture f(UnusedPort(probe));
    REQUIRE(f.port->start(f.sink));

    auto client = f.connect();
    ClientReader reader(client);

    REQUIRE(RunUntil(f.io, [&] { return reader.eof; }));
    REQUIRE(RunUntil(f.io, [&] { return f.sink.count(Type::TASK_END) == 1; }));
    CHECK(f.sink.count(Type::TASK_START) == 1);
    CHECK(f.sink.events[0].task->kind() == TaskKind::SESSION);
    CHECK_FALSE(f.sink.has_exit());

    // The listener keeps accepting
    CHECK(f.port->is_listening());
    auto second = f.connect();
    ClientReader second_reader(second);
    REQUIRE(RunUntil(f.io, [&] { return second_reader.eof; }));
    CHECK(f.port->sessions_accepted() == 2);
}

TEST_CASE("RelaySession cancel tears down the pair", "[network][relay]") {
    RelayFixture f;
    REQUIRE(f.port->start(f.sink));

    auto client = f.connect();
    ClientReader reader(client);
    f.send(client, "abc");
    REQUIRE(RunUntil(f.io, [&] { return reader.data == "abc"; }));

    auto session = f.sink.events[0].task;
    REQUIRE(session->kind() == TaskKind::SESSION);
    session->cancel();
    session->cancel();

    REQUIRE(RunUntil(f.io, [&] { return f.sink.count(Type::TASK_END) == 3 && reader.eof; }));
    CHECK_FALSE(f.sink.has_exit());
}

TEST_CASE("RelayPort sessions are independent", "[network][relay]") {
    RelayFixture f;
    REQUIRE(f.port->start(f.sink));

    auto a = f.connect();
    auto b = f.connect();
    ClientReader ra(a);
    ClientReader rb(b);
    f.send(a, "from-a");
    f.send(b, "from-b");
    REQUIRE(RunUntil(f.io, [&] { return ra.data == "from-a" && rb.data == "from-b"; }));

    a.shutdown(tcp::socket::shutdown_send);
    REQUIRE(RunUntil(f.io, [&] { return ra.eof; }));
    REQUIRE(RunUntil(f.io, [&] { return f.sink.count(Type::TASK_END) == 3; }));

    f.send(b, "still-here");
    REQUIRE(RunUntil(f.io, [&] { return rb.data == "from-bstill-here"; }));
    CHECK_FALSE(rb.eof);
    CHECK_FALSE(f.sink.has_exit());
}

TEST_CASE("RelayPort listens on every address of the host", "[network][relay]") {
    RelayFixture f(0, "localhost");
    REQUIRE(f.port->start(f.sink));
    REQUIRE(f.port->listener_count() >= 1);

    tcp::resolver resolver(f.io);
    std::vector<boost::asio::ip::address> addresses;
    for (const auto& entry : resolver.resolve("localhost", "0", tcp::resolver::passive)) {
        auto address = entry.endpoint().address();
        if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
            addresses.push_back(address);
        }
    }
    CHECK(f.port->listener_count() <= addresses.size());

    // Every listener shares one port; reach each one that is bound
    size_t reached = 0;
    for (const auto& address : addresses) {
        tcp::socket client(f.io);
        boost::system::error_code ec;
        client.connect(tcp::endpoint(address, f.port->local_port()), ec);
        if (ec) continue;
        ++reached;
        ClientReader reader(client);
        f.send(client, "via-" + address.to_string());
        REQUIRE(RunUntil(f.io, [&] { return reader.data == "via-" + address.to_string(); }));
        client.close();
        REQUIRE(RunUntil(f.io, [&] { return reader.eof; }));
    }
    CHECK(reached == f.port->listener_count());

    f.port->stop();
    CHECK(f.port->listener_count() == 0);
    CHECK_FALSE(f.port->is_listening());
}

TEST_CASE("RelayPort stop", "[network][relay]") {
    RelayFixture f;
    REQUIRE(f.port->start(f.sink));
    uint16_t bound = f.port->local_port();

    SECTION("start twice fails") {
        CHECK_FALSE(f.port->start(f.sink));
        CHECK(f.port->is_listening());
    }

    SECTION("stop is idempotent and refuses new clients") {
        f.port->stop();
        f.port->stop();
        CHECK_FALSE(f.port->is_listening());
        RunFor(f.io, std::chrono::milliseconds(20));

        tcp::socket client(f.io);
        boost::system::error_code ec;
        client.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), bound), ec);
        CHECK(ec);
    }

    SECTION("stop leaves live sessions running") {
        auto client = f.connect();
        ClientReader reader(client);
        f.send(client, "one");
        REQUIRE(RunUntil(f.io, [&] { return reader.data == "one"; }));

        f.port->stop();
        f.send(client, "two");
        REQUIRE(RunUntil(f.io, [&] { return reader.data == "onetwo"; }));
    }
}
