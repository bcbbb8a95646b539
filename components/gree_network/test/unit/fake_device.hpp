#pragma once

#include "gree_protocol/cipher.hpp"
#include "gree_protocol/packet.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace gree_network {
namespace test {

/**
 * @brief Loopback UDP responder standing in for a unit
 *
 * Runs on its own thread with its own socket. The responder callback gets
 * each request and returns the datagrams to send back (possibly none).
 */
class FakeDevice {
public:
    using Bytes = std::vector<uint8_t>;
    using Responder = std::function<std::vector<Bytes>(const Bytes& request)>;

    explicit FakeDevice(Responder responder)
        : responder_(std::move(responder))
        , socket_(ioContext_, boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
    {
        socket_.non_blocking(true);
        thread_ = std::thread([this] { run(); });
    }

    ~FakeDevice() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return socket_.local_endpoint().port(); }

    std::vector<Bytes> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    // Decrypted "pack" of each request, or the bare request when it has none
    std::vector<nlohmann::json> payloads(const std::string& key) const {
        std::vector<nlohmann::json> result;
        for (const auto& request : requests()) {
            auto packet = gree_protocol::Packet::decode(request);
            if (packet.pack) {
                result.push_back(gree_protocol::Cipher::decrypt(*packet.pack, key));
            } else {
                result.push_back(nlohmann::json::parse(request.begin(), request.end()));
            }
        }
        return result;
    }

    /**
     * @brief Envelope carrying payload encrypted with key
     */
    static Bytes reply(const nlohmann::json& payload, const std::string& key, const std::string& mac = "f4911e7aca59") {
        gree_protocol::Packet packet;
        packet.clientId = mac;
        packet.targetClientId = "app";
        packet.pack = gree_protocol::Cipher::encrypt(payload, key);
        return packet.encode();
    }

private:
    void run() {
        Bytes buffer(65536);
        while (running_) {
            boost::asio::ip::udp::endpoint sender;
            boost::system::error_code ec;
            size_t received = socket_.receive_from(boost::asio::buffer(buffer), sender, 0, ec);

            if (ec == boost::asio::error::would_block) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                continue;
            }
            if (ec) {
                continue;
            }

            Bytes request(buffer.begin(), buffer.begin() + received);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            }

            for (const auto& datagram : responder_(request)) {
                socket_.send_to(boost::asio::buffer(datagram), sender, 0, ec);
            }
        }
    }

    Responder responder_;
    boost::asio::io_context ioContext_;
    boost::asio::ip::udp::socket socket_;
    std::atomic<bool> running_{true};
    mutable std::mutex mutex_;
    std::vector<Bytes> requests_;
    std::thread thread_;
};

} // namespace test
} // namespace gree_network
