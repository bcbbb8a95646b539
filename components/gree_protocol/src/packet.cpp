#include "gree_protocol/packet.hpp"
#include "gree_protocol/error.hpp"

namespace gree_protocol {

nlohmann::json Packet::toJson() const {
    nlohmann::json json;
    json["cid"] = clientId;
    json["i"] = i;
    json["t"] = type;
    json["uid"] = uid;
    json["tcid"] = targetClientId;
    if (pack) {
        json["pack"] = *pack;
    }
    return json;
}

Packet Packet::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ProtocolError("envelope is not a JSON object");
    }

    Packet packet;
    try {
        packet.clientId = json.value("cid", std::string());
        packet.i = json.value("i", 0);
        packet.type = json.value("t", std::string());
        packet.uid = json.value("uid", int64_t{0});
        packet.targetClientId = json.value("tcid", std::string());
        if (json.contains("pack")) {
            packet.pack = json["pack"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(std::string("malformed envelope field: ") + e.what());
    }
    return packet;
}

std::vector<uint8_t> Packet::encode() const {
    std::string text = toJson().dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

Packet Packet::decode(const std::vector<uint8_t>& datagram) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(datagram.begin(), datagram.end());
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(std::string("datagram is not valid JSON: ") + e.what());
    }
    return fromJson(json);
}

} // namespace gree_protocol
