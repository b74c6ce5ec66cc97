#include "dxfer/transport/loopback.hpp"

#include <gtest/gtest.h>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace asio = boost::asio;
using dxfer::protocol::Bytes;
using dxfer::transport::LoopbackEndpoints;
using dxfer::transport::LoopbackStream;
using dxfer::transport::StreamPtr;

namespace {

// Reads until eof or an error, collecting every byte
struct Collector : std::enable_shared_from_this<Collector> {
    StreamPtr stream;
    std::array<std::uint8_t, 4> buffer{};
    Bytes received;
    boost::system::error_code final_ec;

    explicit Collector(StreamPtr s) : stream(std::move(s)) {}

    void start() {
        auto self = shared_from_this();
        stream->async_read_some(asio::buffer(buffer),
            [self](const boost::system::error_code& ec, std::size_t n) {
                if (ec) {
                    self->final_ec = ec;
                    return;
                }
                self->received.insert(self->received.end(), self->buffer.begin(),
                                      self->buffer.begin() + static_cast<std::ptrdiff_t>(n));
                self->start();
            });
    }
};

} // namespace

TEST(LoopbackStreamTest, WritesArriveInOrderThenEof) {
    asio::io_context io;
    auto pair = LoopbackStream::make_pair(io, "test");

    auto collector = std::make_shared<Collector>(pair.second);
    collector->start();

    std::vector<std::size_t> written;
    for (const Bytes& chunk : {Bytes{1, 2, 3}, Bytes{4, 5, 6, 7, 8}, Bytes{9}}) {
        pair.first->async_write(std::make_shared<const Bytes>(chunk),
            [&written](const boost::system::error_code& ec, std::size_t n) {
                EXPECT_FALSE(ec);
                written.push_back(n);
            });
    }
    pair.first->close();

    io.run();

    EXPECT_EQ(written, (std::vector<std::size_t>{3, 5, 1}));
    EXPECT_EQ(collector->received, (Bytes{1, 2, 3, 4, 5, 6, 7, 8, 9}));
    EXPECT_EQ(collector->final_ec, asio::error::eof);
}

TEST(LoopbackStreamTest, LocalCloseAbortsPendingRead) {
    asio::io_context io;
    auto pair = LoopbackStream::make_pair(io, "test");

    auto collector = std::make_shared<Collector>(pair.second);
    collector->start();
    pair.second->close();

    io.run();

    EXPECT_TRUE(collector->received.empty());
    EXPECT_EQ(collector->final_ec, asio::error::operation_aborted);
}

TEST(LoopbackStreamTest, WriteAfterCloseFails) {
    asio::io_context io;
    auto pair = LoopbackStream::make_pair(io, "test");
    pair.first->close();

    boost::system::error_code result;
    pair.first->async_write(std::make_shared<const Bytes>(Bytes{1}),
        [&result](const boost::system::error_code& ec, std::size_t) { result = ec; });
    io.run();

    EXPECT_EQ(result, asio::error::shut_down);
}

TEST(LoopbackEndpointsTest, OutboundStreamsAreAcceptedByThePeer) {
    asio::io_context io;
    auto endpoints = LoopbackEndpoints::make_pair(io);

    std::vector<StreamPtr> accepted;
    endpoints.second->listen([&accepted](StreamPtr stream) { accepted.push_back(std::move(stream)); });

    StreamPtr opened;
    endpoints.first->async_open_outbound([&opened](dxfer::Result<StreamPtr> stream) {
        ASSERT_TRUE(stream.is_ok());
        opened = stream.value();
    });
    io.run();

    ASSERT_NE(opened, nullptr);
    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_EQ(endpoints.first->streams_opened(), 1u);
}

TEST(LoopbackEndpointsTest, StreamsOpenedBeforeListenAreQueued) {
    asio::io_context io;
    auto endpoints = LoopbackEndpoints::make_pair(io);

    endpoints.first->async_open_outbound([](dxfer::Result<StreamPtr>) {});
    endpoints.first->async_open_outbound([](dxfer::Result<StreamPtr>) {});
    io.run();

    std::size_t accepted = 0;
    endpoints.second->listen([&accepted](StreamPtr) { ++accepted; });
    EXPECT_EQ(accepted, 2u);
}

TEST(LoopbackEndpointsTest, ControlStreamsAreConnected) {
    asio::io_context io;
    auto endpoints = LoopbackEndpoints::make_pair(io);
    EXPECT_EQ(endpoints.first->control_stream(), endpoints.first->control_stream());

    auto collector = std::make_shared<Collector>(endpoints.second->control_stream());
    collector->start();
    endpoints.first->control_stream()->async_write(std::make_shared<const Bytes>(Bytes{7, 7}),
        [](const boost::system::error_code&, std::size_t) {});

    bool closed = false;
    endpoints.first->async_close([&closed](const dxfer::Result<void>& r) { closed = r.is_ok(); });
    io.run();

    EXPECT_TRUE(closed);
    EXPECT_TRUE(endpoints.first->is_closed());
    EXPECT_EQ(collector->received, (Bytes{7, 7}));
    EXPECT_EQ(collector->final_ec, asio::error::eof);
}

TEST(LoopbackEndpointsTest, OpenAfterCloseFails) {
    asio::io_context io;
    auto endpoints = LoopbackEndpoints::make_pair(io);
    endpoints.first->async_close([](const dxfer::Result<void>&) {});

    bool failed = false;
    endpoints.first->async_open_outbound([&failed](dxfer::Result<StreamPtr> stream) {
        failed = stream.is_error();
    });
    io.run();

    EXPECT_TRUE(failed);
}
