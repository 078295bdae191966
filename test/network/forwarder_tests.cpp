// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/forwarder.hpp"
#include "network/protocol.hpp"
#include "test_util.hpp"
#include <boost/asio/write.hpp>
#include <optional>

using namespace kernelshim;
using namespace kernelshim::network;
using namespace kernelshim::test;

namespace {

// client <-> [relay_client | relay_kernel] <-> kernel
struct ForwarderFixture {
    boost::asio::io_context io;
    std::pair<tcp::socket, tcp::socket> client_side = MakeSocketPair(io);
    std::pair<tcp::socket, tcp::socket> kernel_side = MakeSocketPair(io);
    tcp::socket& client = client_side.first;
    tcp::socket& relay_client = client_side.second;
    tcp::socket& relay_kernel = kernel_side.first;
    tcp::socket& kernel = kernel_side.second;

    std::shared_ptr<CompletionSlot> slot = std::make_shared<CompletionSlot>();
    std::optional<Forwarder::Outcome> outcome;

    ForwarderPtr make_c2k() {
        return std::make_shared<Forwarder>(
            "shell_port", TaskKind::CLIENT_TO_KERNEL, relay_client, relay_kernel, slot,
            protocol::COMPLETION_CLIENT_EOF,
            [this](Forwarder&, Forwarder::Outcome o) { outcome = o; });
    }

    ForwarderPtr make_k2c() {
        return std::make_shared<Forwarder>(
            "shell_port", TaskKind::KERNEL_TO_CLIENT, relay_kernel, relay_client, slot,
            protocol::COMPLETION_KERNEL_EOF,
            [this](Forwarder&, Forwarder::Outcome o) { outcome = o; });
    }
};

} // namespace

TEST_CASE("Forwarder copies bytes in order", "[network][forwarder]") {
    ForwarderFixture f;
    auto fwd = f.make_c2k();
    fwd->start();

    // Several chunks' worth of data
    std::string payload;
    for (size_t i = 0; i < 5 * protocol::RELAY_CHUNK_SIZE + 123; ++i) {
        payload.push_back(static_cast<char>('a' + i % 26));
    }
    boost::asio::async_write(f.client, boost::asio::buffer(payload),
                             [](const boost::system::error_code&, size_t) {});

    ClientReader reader(f.kernel);
    REQUIRE(RunUntil(f.io, [&] { return reader.data.size() >= payload.size(); }));
    CHECK(reader.data == payload);
    CHECK(fwd->bytes_forwarded() == payload.size());
    CHECK_FALSE(fwd->finished());
    CHECK(fwd->kind() == TaskKind::CLIENT_TO_KERNEL);
}

TEST_CASE("Forwarder offers its EOF code", "[network][forwarder]") {
    ForwarderFixture f;

    SECTION("client closes c2k") {
        auto fwd = f.make_c2k();
        fwd->start();
        f.client.shutdown(tcp::socket::shutdown_send);

        REQUIRE(RunUntil(f.io, [&] { return f.outcome.has_value(); }));
        CHECK(*f.outcome == Forwarder::Outcome::COMPLETED);
        REQUIRE(f.slot->filled());
        CHECK(*f.slot->value() == protocol::COMPLETION_CLIENT_EOF);
        CHECK(fwd->finished());
    }

    SECTION("kernel closes k2c") {
        auto fwd = f.make_k2c();
        fwd->start();
        f.kernel.close();

        REQUIRE(RunUntil(f.io, [&] { return f.outcome.has_value(); }));
        CHECK(*f.outcome == Forwarder::Outcome::COMPLETED);
        REQUIRE(f.slot->filled());
        CHECK(*f.slot->value() == protocol::COMPLETION_KERNEL_EOF);
    }

    SECTION("first offer wins") {
        f.slot->offer(7);
        auto fwd = f.make_k2c();
        fwd->start();
        f.kernel.close();

        REQUIRE(RunUntil(f.io, [&] { return f.outcome.has_value(); }));
        CHECK(*f.slot->value() == 7);
    }
}

TEST_CASE("Forwarder cancel", "[network][forwarder]") {
    ForwarderFixture f;

    SECTION("while reading") {
        auto fwd = f.make_c2k();
        fwd->start();
        RunFor(f.io, std::chrono::milliseconds(20));
        fwd->cancel();
        fwd->cancel();

        REQUIRE(RunUntil(f.io, [&] { return f.outcome.has_value(); }));
        CHECK(*f.outcome == Forwarder::Outcome::CANCELLED);
        CHECK_FALSE(f.slot->filled());
    }

    SECTION("before start") {
        auto fwd = f.make_c2k();
        fwd->cancel();
        fwd->start();

        REQUIRE(RunUntil(f.io, [&] { return f.outcome.has_value(); }));
        CHECK(*f.outcome == Forwarder::Outcome::CANCELLED);
        CHECK_FALSE(f.slot->filled());
    }

    SECTION("after completion is a no-op") {
        auto fwd = f.make_c2k();
        fwd->start();
        f.client.shutdown(tcp::socket::shutdown_send);
        REQUIRE(RunUntil(f.io, [&] { return f.outcome.has_value(); }));
        fwd->cancel();
        CHECK(*f.outcome == Forwarder::Outcome::COMPLETED);
    }
}
