#include "gree_network/datagram_stream.hpp"
#include "gree_network/event_loop.hpp"
#include "gree_network/logging.hpp"
#include "gree_protocol/error.hpp"

#include <stdexcept>
#include <string>

namespace gree_network {

using boost::asio::ip::udp;
using gree_protocol::StreamClosedError;
using gree_protocol::TimeoutError;
using gree_protocol::TransportError;

std::shared_ptr<DatagramStream> DatagramStream::openBroadcast(
    boost::asio::io_context& ioContext,
    const boost::asio::ip::address& localAddress,
    const Config& config,
    std::shared_ptr<spdlog::logger> logger
) {
    udp::socket socket(ioContext);
    boost::system::error_code ec;

    socket.open(localAddress.is_v6() ? udp::v6() : udp::v4(), ec);
    if (ec) {
        throw TransportError("failed to open broadcast socket: " + ec.message());
    }

    socket.set_option(udp::socket::broadcast(true), ec);
    if (ec) {
        throw TransportError("failed to enable broadcast: " + ec.message());
    }

    socket.bind(udp::endpoint(localAddress, 0), ec);
    if (ec) {
        throw TransportError("failed to bind to " + localAddress.to_string() + ": " + ec.message());
    }

    auto stream = std::make_shared<DatagramStream>(
        ioContext, std::move(socket), Mode::BROADCAST, config, std::move(logger));
    stream->start();
    return stream;
}

std::shared_ptr<DatagramStream> DatagramStream::openPointToPoint(
    boost::asio::io_context& ioContext,
    const udp::endpoint& remoteEndpoint,
    const Config& config,
    std::shared_ptr<spdlog::logger> logger
) {
    udp::socket socket(ioContext);
    boost::system::error_code ec;

    socket.open(remoteEndpoint.protocol(), ec);
    if (ec) {
        throw TransportError("failed to open socket: " + ec.message());
    }

    socket.connect(remoteEndpoint, ec);
    if (ec) {
        throw TransportError("failed to connect to " + remoteEndpoint.address().to_string() + ":" +
                             std::to_string(remoteEndpoint.port()) + ": " + ec.message());
    }

    auto stream = std::make_shared<DatagramStream>(
        ioContext, std::move(socket), Mode::POINT_TO_POINT, config, std::move(logger));
    stream->start();
    return stream;
}

DatagramStream::DatagramStream(
    boost::asio::io_context& ioContext,
    udp::socket socket,
    Mode mode,
    const Config& config,
    std::shared_ptr<spdlog::logger> logger
)
    : ioContext_(ioContext)
    , socket_(std::move(socket))
    , mode_(mode)
    , config_(config)
    , logger_(loggerOrNull(std::move(logger)))
    , receiveBuffer_(config.maxDatagramSize + 1)
    , timer_(ioContext)
{
    if (config_.maxDatagramSize == 0) {
        throw std::invalid_argument("maxDatagramSize must be positive");
    }

    boost::system::error_code ec;
    localEndpoint_ = socket_.local_endpoint(ec);
    if (mode_ == Mode::POINT_TO_POINT) {
        auto remote = socket_.remote_endpoint(ec);
        if (!ec) {
            remoteEndpoint_ = remote;
        }
    }
}

DatagramStream::~DatagramStream() {
    boost::system::error_code ec;
    socket_.close(ec);
}

void DatagramStream::start() {
    if (closed_ || receiving_) {
        return;
    }
    logger_->debug("Datagram stream listening on {}:{}", localEndpoint_.address().to_string(), localEndpoint_.port());
    doReceive();
}

void DatagramStream::send(const std::vector<uint8_t>& data) {
    if (mode_ != Mode::POINT_TO_POINT) {
        throw std::invalid_argument("Broadcast stream requires an explicit destination");
    }
    sendImpl(data, nullptr);
}

void DatagramStream::send(const std::vector<uint8_t>& data, const udp::endpoint& destination) {
    if (mode_ != Mode::BROADCAST) {
        throw std::invalid_argument("Point-to-point stream sends only to its connected peer");
    }
    sendImpl(data, &destination);
}

void DatagramStream::sendImpl(const std::vector<uint8_t>& data, const udp::endpoint* destination) {
    if (closed_) {
        throw StreamClosedError("cannot send on a closed stream");
    }

    boost::system::error_code ec;
    std::size_t sent = destination
        ? socket_.send_to(boost::asio::buffer(data), *destination, 0, ec)
        : socket_.send(boost::asio::buffer(data), 0, ec);

    if (ec) {
        throw TransportError("send failed: " + ec.message());
    }
    if (sent != data.size()) {
        throw TransportError("short send: " + std::to_string(sent) + " of " + std::to_string(data.size()) + " bytes");
    }

    if (destination) {
        logger_->trace("Sent {} bytes to {}:{}", sent, destination->address().to_string(), destination->port());
    } else {
        logger_->trace("Sent {} bytes to connected peer", sent);
    }
}

void DatagramStream::asyncRecv(std::chrono::milliseconds timeout, RecvHandler handler) {
    if (waiter_) {
        throw std::logic_error("A receive is already pending on this stream");
    }

    std::exception_ptr error;
    Datagram datagram;
    if (takeNext(error, datagram)) {
        boost::asio::post(ioContext_,
            [handler = std::move(handler), error, datagram = std::move(datagram)]() mutable {
                handler(error, std::move(datagram));
            });
        return;
    }

    waiter_ = std::move(handler);
    waiterTimeout_ = timeout;
    uint64_t generation = ++waiterGeneration_;

    timer_.expires_after(timeout);
    timer_.async_wait([self = shared_from_this(), generation](const boost::system::error_code& error) {
        self->handleTimeout(error, generation);
    });
}

DatagramStream::Datagram DatagramStream::recv(std::chrono::milliseconds timeout) {
    struct SyncState {
        bool done = false;
        std::exception_ptr error;
        Datagram datagram;
    };

    auto state = std::make_shared<SyncState>();
    asyncRecv(timeout, [state](std::exception_ptr error, Datagram datagram) {
        state->error = error;
        state->datagram = std::move(datagram);
        state->done = true;
    });

    runUntil(ioContext_, [&state] { return state->done; });

    if (state->error) {
        std::rethrow_exception(state->error);
    }
    return std::move(state->datagram);
}

void DatagramStream::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        logger_->warn("Error closing datagram socket: {}", ec.message());
    }

    logger_->debug("Datagram stream on port {} closed with {} datagram(s) queued",
                   localEndpoint_.port(), queue_.size());

    // Fail a pending receive from the loop, not from inside close()
    boost::asio::post(ioContext_, [self = shared_from_this()] { self->serviceWaiter(); });
}

void DatagramStream::doReceive() {
    receiving_ = true;
    socket_.async_receive_from(
        boost::asio::buffer(receiveBuffer_),
        senderEndpoint_,
        [self = shared_from_this()](const boost::system::error_code& error, std::size_t bytesReceived) {
            self->handleReceive(error, bytesReceived);
        }
    );
}

void DatagramStream::handleReceive(const boost::system::error_code& error, std::size_t bytesReceived) {
    receiving_ = false;

    if (closed_ || error == boost::asio::error::operation_aborted) {
        serviceWaiter();
        return;
    }

    if (error) {
        logger_->warn("Receive error on port {}: {}", localEndpoint_.port(), error.message());
        errors_.push_back(error);

        if (!isTransientError(error)) {
            serviceWaiter();
            close();
            return;
        }
    } else if (bytesReceived > config_.maxDatagramSize) {
        // One spare byte in the buffer exposes truncation; the datagram is dropped whole
        logger_->warn("Dropping datagram from {}:{} larger than {} bytes",
                      senderEndpoint_.address().to_string(), senderEndpoint_.port(), config_.maxDatagramSize);
        errors_.push_back(boost::asio::error::message_size);
    } else {
        Datagram datagram;
        datagram.payload.assign(receiveBuffer_.begin(), receiveBuffer_.begin() + bytesReceived);
        datagram.sender = senderEndpoint_;
        logger_->trace("Received {} bytes from {}:{}", bytesReceived,
                       senderEndpoint_.address().to_string(), senderEndpoint_.port());
        queue_.push_back(std::move(datagram));
    }

    serviceWaiter();

    // The waiter may have closed the stream
    if (!closed_) {
        doReceive();
    }
}

void DatagramStream::handleTimeout(const boost::system::error_code& error, uint64_t generation) {
    if (error == boost::asio::error::operation_aborted || generation != waiterGeneration_ || !waiter_) {
        return;
    }
    completeWaiter(
        std::make_exception_ptr(TimeoutError("no datagram within " + std::to_string(waiterTimeout_.count()) + "ms")),
        Datagram{});
}

void DatagramStream::serviceWaiter() {
    if (!waiter_) {
        return;
    }

    std::exception_ptr error;
    Datagram datagram;
    if (takeNext(error, datagram)) {
        completeWaiter(error, std::move(datagram));
    }
}

bool DatagramStream::takeNext(std::exception_ptr& error, Datagram& datagram) {
    if (!errors_.empty()) {
        auto code = errors_.front();
        errors_.pop_front();
        error = std::make_exception_ptr(TransportError(code.message()));
        return true;
    }

    if (!queue_.empty()) {
        datagram = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    if (closed_) {
        error = std::make_exception_ptr(StreamClosedError("no datagrams left on closed stream"));
        return true;
    }

    return false;
}

void DatagramStream::completeWaiter(std::exception_ptr error, Datagram datagram) {
    RecvHandler handler = std::move(waiter_);
    waiter_ = nullptr;
    ++waiterGeneration_;
    timer_.cancel();

    handler(error, std::move(datagram));
}

bool DatagramStream::isTransientError(const boost::system::error_code& error) {
    return error == boost::asio::error::connection_refused ||
           error == boost::asio::error::connection_reset ||
           error == boost::asio::error::host_unreachable ||
           error == boost::asio::error::network_unreachable ||
           error == boost::asio::error::message_size;
}

} // namespace gree_network
