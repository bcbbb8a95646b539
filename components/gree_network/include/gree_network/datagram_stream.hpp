#pragma once

#include <boost/asio.hpp>
#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace gree_network {

/**
 * @class DatagramStream
 * @brief One UDP socket presented as an ordered, timeout-bound receive queue
 *
 * Arriving datagrams are queued by the socket's completion handler and
 * consumed in arrival order by asyncRecv()/recv(). Transport errors reported
 * by the socket (e.g. ICMP port unreachable) go to a separate queue so that an
 * error raised between receives is not lost.
 *
 * A stream belongs to the thread driving its io_context; it is not safe to
 * use one stream from several threads.
 */
class DatagramStream : public std::enable_shared_from_this<DatagramStream> {
public:
    enum class Mode {
        BROADCAST,        ///< Unconnected; destinations given per send
        POINT_TO_POINT    ///< Connected to exactly one peer
    };

    struct Config {
        // Larger datagrams are dropped and reported as TransportError
        size_t maxDatagramSize = 65507;
    };

    struct Datagram {
        std::vector<uint8_t> payload;
        boost::asio::ip::udp::endpoint sender;
    };

    using RecvHandler = std::function<void(std::exception_ptr, Datagram)>;

    /**
     * @brief Open a broadcast-capable stream bound to an ephemeral port
     * @param localAddress Interface address to bind (any address for all)
     * @throws TransportError if the socket cannot be opened or bound
     */
    static std::shared_ptr<DatagramStream> openBroadcast(
        boost::asio::io_context& ioContext,
        const boost::asio::ip::address& localAddress,
        const Config& config,
        std::shared_ptr<spdlog::logger> logger
    );

    /**
     * @brief Open a stream connected to one remote endpoint
     * @throws TransportError if the socket cannot be opened or connected
     */
    static std::shared_ptr<DatagramStream> openPointToPoint(
        boost::asio::io_context& ioContext,
        const boost::asio::ip::udp::endpoint& remoteEndpoint,
        const Config& config,
        std::shared_ptr<spdlog::logger> logger
    );

    /**
     * @brief Take ownership of an already opened socket; call start() afterwards
     * @throws std::invalid_argument if config.maxDatagramSize is zero
     */
    DatagramStream(
        boost::asio::io_context& ioContext,
        boost::asio::ip::udp::socket socket,
        Mode mode,
        const Config& config,
        std::shared_ptr<spdlog::logger> logger
    );

    ~DatagramStream();

    DatagramStream(const DatagramStream&) = delete;
    DatagramStream& operator=(const DatagramStream&) = delete;

    /**
     * @brief Start receiving datagrams into the queue
     */
    void start();

    /**
     * @brief Send to the connected peer (point-to-point mode only)
     * @throws std::invalid_argument in broadcast mode
     * @throws TransportError on socket failure, StreamClosedError once closed
     */
    void send(const std::vector<uint8_t>& data);

    /**
     * @brief Send to an explicit destination (broadcast mode only)
     * @throws std::invalid_argument in point-to-point mode
     * @throws TransportError on socket failure, StreamClosedError once closed
     */
    void send(const std::vector<uint8_t>& data, const boost::asio::ip::udp::endpoint& destination);

    /**
     * @brief Wait for the next datagram
     *
     * The handler receives, in priority order: a queued transport error as
     * TransportError, the oldest queued datagram, StreamClosedError once the
     * stream is closed and drained, or TimeoutError after timeout. A timeout
     * leaves the stream open. The handler never runs inside this call.
     *
     * @throws std::logic_error if a receive is already pending
     */
    void asyncRecv(std::chrono::milliseconds timeout, RecvHandler handler);

    /**
     * @brief Blocking form of asyncRecv(); drives the io_context until done
     */
    Datagram recv(std::chrono::milliseconds timeout);

    /**
     * @brief Release the socket; idempotent
     *
     * Datagrams already queued remain readable. A pending receive on an empty
     * queue fails with StreamClosedError.
     */
    void close();

    bool isOpen() const { return !closed_; }

    /**
     * @brief True once closed with nothing left to consume
     */
    bool isDrained() const { return closed_ && queue_.empty() && errors_.empty(); }

    size_t pendingDatagrams() const { return queue_.size(); }
    Mode getMode() const { return mode_; }
    boost::asio::ip::udp::endpoint getLocalEndpoint() const { return localEndpoint_; }
    std::optional<boost::asio::ip::udp::endpoint> getRemoteEndpoint() const { return remoteEndpoint_; }

private:
    void doReceive();
    void handleReceive(const boost::system::error_code& error, std::size_t bytesReceived);
    void handleTimeout(const boost::system::error_code& error, uint64_t generation);
    void serviceWaiter();
    bool takeNext(std::exception_ptr& error, Datagram& datagram);
    void completeWaiter(std::exception_ptr error, Datagram datagram);
    void sendImpl(const std::vector<uint8_t>& data, const boost::asio::ip::udp::endpoint* destination);
    static bool isTransientError(const boost::system::error_code& error);

    boost::asio::io_context& ioContext_;
    boost::asio::ip::udp::socket socket_;
    Mode mode_;
    Config config_;
    std::shared_ptr<spdlog::logger> logger_;

    std::vector<uint8_t> receiveBuffer_;
    boost::asio::ip::udp::endpoint senderEndpoint_;
    boost::asio::ip::udp::endpoint localEndpoint_;
    std::optional<boost::asio::ip::udp::endpoint> remoteEndpoint_;

    std::deque<Datagram> queue_;
    std::deque<boost::system::error_code> errors_;
    bool closed_ = false;
    bool receiving_ = false;

    // Pending consumer
    RecvHandler waiter_;
    std::chrono::milliseconds waiterTimeout_{0};
    uint64_t waiterGeneration_ = 0;
    boost::asio::steady_timer timer_;
};

} // namespace gree_network
