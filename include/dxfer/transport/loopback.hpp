#pragma once

#include "dxfer/transport/stream.hpp"

#include <boost/asio/io_context.hpp>

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dxfer::transport {

/**
 * @brief In-memory stream whose writes land in its peer's read queue
 *
 * Writes, closes and reads complete through io_context.post(), so the
 * order of operations issued on one stream is the order the peer sees.
 */
class LoopbackStream : public Stream, public std::enable_shared_from_this<LoopbackStream> {
public:
    LoopbackStream(boost::asio::io_context& io, std::string label);

    /// Create two connected ends
    static std::pair<std::shared_ptr<LoopbackStream>, std::shared_ptr<LoopbackStream>>
    make_pair(boost::asio::io_context& io, const std::string& label);

    void async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) override;
    void async_write(std::shared_ptr<const protocol::Bytes> data, IoHandler handler) override;
    void close() override;

    [[nodiscard]] std::string describe() const override { return label_; }
    [[nodiscard]] bool is_closed() const noexcept { return closed_; }

private:
    struct PendingRead {
        boost::asio::mutable_buffer buffer;
        IoHandler handler;
    };

    void deliver(const protocol::Bytes& data);
    void on_peer_closed();
    void service_pending_read();
    void complete(IoHandler handler, boost::system::error_code ec, std::size_t n);

    boost::asio::io_context& io_;
    std::string label_;
    std::weak_ptr<LoopbackStream> peer_;
    std::deque<std::uint8_t> inbound_;
    std::optional<PendingRead> pending_read_;
    bool closed_ = false;
    bool peer_closed_ = false;
};

/**
 * @brief One side of an in-process session
 *
 * Two LoopbackEndpoints created by make_pair() share a control stream;
 * streams opened on one side are accepted on the other. Used by the test
 * suite and for local self-transfers.
 */
class LoopbackEndpoints : public Endpoints, public std::enable_shared_from_this<LoopbackEndpoints> {
public:
    LoopbackEndpoints(boost::asio::io_context& io, std::string side);

    static std::pair<std::shared_ptr<LoopbackEndpoints>, std::shared_ptr<LoopbackEndpoints>>
    make_pair(boost::asio::io_context& io);

    StreamPtr control_stream() override { return control_; }
    void async_open_outbound(OpenHandler handler) override;
    void listen(AcceptHandler acceptor) override;
    void async_close(CloseHandler handler) override;

    [[nodiscard]] std::size_t streams_opened() const noexcept { return opened_; }
    [[nodiscard]] bool is_closed() const noexcept { return closed_; }

private:
    void incoming(StreamPtr stream);
    void track(const std::shared_ptr<LoopbackStream>& stream);

    boost::asio::io_context& io_;
    std::string side_;
    std::weak_ptr<LoopbackEndpoints> peer_;
    std::shared_ptr<LoopbackStream> control_;
    AcceptHandler acceptor_;
    std::deque<StreamPtr> backlog_;
    std::vector<std::weak_ptr<LoopbackStream>> streams_;
    std::size_t opened_ = 0;
    bool closed_ = false;
};

} // namespace dxfer::transport
