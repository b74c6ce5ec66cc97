#include "dxfer/transport/stream.hpp"

#include <boost/asio/error.hpp>

namespace dxfer::transport {

Error to_error(const boost::system::error_code& ec, const std::string& context) {
    if (ec == boost::asio::error::eof) {
        return Error{ErrorKind::PrematureClose, context + ": stream closed by peer"};
    }
    return Error{ErrorKind::Io, context + ": " + ec.message()};
}

} // namespace dxfer::transport
