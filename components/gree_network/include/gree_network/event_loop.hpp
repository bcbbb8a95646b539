#pragma once

#include <boost/asio.hpp>

#include <functional>
#include <stdexcept>

namespace gree_network {

/**
 * @brief Drive the loop on the calling thread until done() holds
 *
 * Must not be called from inside a handler running on the same loop.
 * @throws std::logic_error if the loop runs out of work first
 */
inline void runUntil(boost::asio::io_context& ioContext, const std::function<bool()>& done) {
    while (!done()) {
        if (ioContext.stopped()) {
            ioContext.restart();
        }
        if (ioContext.run_one() == 0 && !done()) {
            throw std::logic_error("Event loop ran out of work before the operation completed");
        }
    }
}

} // namespace gree_network
