#pragma once

#include "gree_protocol/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gree_protocol {

/**
 * @brief Cleartext wire envelope
 *
 * {"cid": ..., "i": 0|1, "t": "pack", "uid": 0, "tcid": <target mac>, "pack": <base64>}
 * The encrypted "pack" field carries the actual command.
 */
struct Packet {
    std::string clientId = DEFAULT_CLIENT_ID;   ///< "cid"
    int i = 0;                                  ///< 1 for bind traffic, 0 otherwise
    std::string type = "pack";                  ///< "t"
    int64_t uid = 0;
    std::string targetClientId;                 ///< "tcid"
    std::optional<std::string> pack;

    nlohmann::json toJson() const;

    /**
     * @throws ProtocolError if a present field has the wrong JSON type
     */
    static Packet fromJson(const nlohmann::json& json);

    std::vector<uint8_t> encode() const;

    /**
     * @throws ProtocolError if the datagram is not a JSON object
     */
    static Packet decode(const std::vector<uint8_t>& datagram);
};

} // namespace gree_protocol
