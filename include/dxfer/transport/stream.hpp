#pragma once

/**
 * @file stream.hpp
 * @brief What the file-transfer core needs from the secure transport
 *
 * The transport (key agreement, rendezvous, relays, multiplexing) is not
 * part of dxfer. It is consumed through two interfaces:
 *
 * - Stream: one ordered, reliable byte stream
 * - Endpoints: the control stream, an outbound connector, an inbound
 *   listener, and session teardown
 *
 * Both follow Boost.Asio conventions: completion handlers are invoked
 * through the io_context, never from inside the initiating call, and end
 * of stream is reported as boost::asio::error::eof.
 */

#include "dxfer/core/result.hpp"
#include "dxfer/protocol/frame.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>
#include <string>

namespace dxfer::transport {

using IoHandler = std::function<void(const boost::system::error_code&, std::size_t)>;

class Stream {
public:
    virtual ~Stream() = default;

    /**
     * @brief Read at least one byte into buffer
     *
     * Completes with eof once the peer closed and every byte it wrote has
     * been read; with operation_aborted if close() was called locally.
     */
    virtual void async_read_some(boost::asio::mutable_buffer buffer, IoHandler handler) = 0;

    /**
     * @brief Write all of data; writes are delivered in the order issued
     */
    virtual void async_write(std::shared_ptr<const protocol::Bytes> data, IoHandler handler) = 0;

    /**
     * @brief Stop writing and reading; queued writes are still delivered
     */
    virtual void close() = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

using StreamPtr = std::shared_ptr<Stream>;
using OpenHandler = std::function<void(Result<StreamPtr>)>;
using AcceptHandler = std::function<void(StreamPtr)>;
using CloseHandler = std::function<void(const Result<void>&)>;

/**
 * @brief The three endpoints of an established session, plus teardown
 */
class Endpoints {
public:
    virtual ~Endpoints() = default;

    /// Long-lived stream for session-level signals; the same object on every call
    virtual StreamPtr control_stream() = 0;

    /// Open a new stream to the peer
    virtual void async_open_outbound(OpenHandler handler) = 0;

    /// Deliver every stream the peer opens to acceptor, including ones opened before listen()
    virtual void listen(AcceptHandler acceptor) = 0;

    /**
     * @brief Tear down every stream
     *
     * Completes only after writes queued on any open stream were delivered.
     */
    virtual void async_close(CloseHandler handler) = 0;
};

/**
 * @brief Translate a transport error into the core taxonomy
 *
 * eof becomes PrematureClose; everything else is an Io error.
 */
Error to_error(const boost::system::error_code& ec, const std::string& context);

} // namespace dxfer::transport
