#pragma once

#include "dxfer/transport/stream.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dxfer::transport {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Stream backed by one TCP connection
 *
 * Writes are queued and issued one at a time, so their order on the wire
 * is the order of async_write() calls. close() lets the queue drain, then
 * shuts down the sending direction.
 */
class TcpStream : public Stream, public std::enable_shared_from_this<TcpStream> {
public:
    TcpStream(tcp::socket socket, std::string label);

    void async_read_some(asio::mutable_buffer buffer, IoHandler handler) override;
    void async_write(std::shared_ptr<const protocol::Bytes> data, IoHandler handler) override;
    void close() override;

    [[nodiscard]] std::string describe() const override { return label_; }

    /**
     * @brief close(), then invoke handler once every queued write went out
     */
    void close_after_drain(std::function<void()> handler);

private:
    struct QueuedWrite {
        std::shared_ptr<const protocol::Bytes> data;
        IoHandler handler;
    };

    void do_write();
    void finish_close();

    tcp::socket socket_;
    std::string label_;
    std::deque<QueuedWrite> queue_;
    std::vector<std::function<void()>> drained_;
    bool closing_ = false;
    bool closed_ = false;
};

/**
 * @brief Direct TCP rendition of the transport endpoints
 *
 * Every logical stream is its own TCP connection to the peer. The first
 * byte a dialer writes on a connection tags it: 'C' for the control stream
 * (always the first connection), 'T' for a transfer stream. This carries
 * no security of its own and stands in for the dilated transport when
 * running the CLI on a trusted network.
 *
 * The dialing side opens streams; the listening side accepts them.
 */
class TcpEndpoints : public Endpoints, public std::enable_shared_from_this<TcpEndpoints> {
public:
    using ReadyHandler = std::function<void(Result<std::shared_ptr<TcpEndpoints>>)>;

    static constexpr std::uint8_t kControlTag = 'C';
    static constexpr std::uint8_t kTransferTag = 'T';

    /// Dial host:port and establish the control stream
    static void async_connect(asio::io_context& io,
                              const std::string& host,
                              std::uint16_t port,
                              ReadyHandler handler);

    /**
     * @brief Listen on port until a dialer established its control stream
     *
     * @param on_listening Invoked with the bound port once accepting
     */
    static void async_listen(asio::io_context& io,
                             std::uint16_t port,
                             std::function<void(std::uint16_t)> on_listening,
                             ReadyHandler handler);

    explicit TcpEndpoints(asio::io_context& io);

    StreamPtr control_stream() override { return control_; }
    void async_open_outbound(OpenHandler handler) override;
    void listen(AcceptHandler acceptor) override;
    void async_close(CloseHandler handler) override;

    /// Transfer streams accepted before listen() was called
    [[nodiscard]] std::size_t pending_streams() const noexcept { return backlog_.size(); }
    [[nodiscard]] std::size_t tracked_streams() const noexcept { return streams_.size(); }

private:
    void do_accept();
    void read_tag(std::shared_ptr<tcp::socket> socket);
    void on_tagged(std::shared_ptr<tcp::socket> socket, std::uint8_t tag);
    std::shared_ptr<TcpStream> adopt(tcp::socket socket, const std::string& kind);

    asio::io_context& io_;
    std::unique_ptr<tcp::acceptor> acceptor_;   // Listening side only
    tcp::endpoint remote_;                      // Dialing side only
    bool dialer_ = false;
    std::shared_ptr<TcpStream> control_;
    ReadyHandler ready_;
    AcceptHandler accept_handler_;
    std::deque<StreamPtr> backlog_;
    std::vector<std::weak_ptr<TcpStream>> streams_;
    std::size_t stream_counter_ = 0;
    bool closed_ = false;
};

} // namespace dxfer::transport
