#include "gree_protocol/messages.hpp"
#include "gree_protocol/cipher.hpp"
#include "gree_protocol/error.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace gree_protocol {

std::string commandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::SCAN:    return "scan";
        case CommandType::DEVICE:  return "dev";
        case CommandType::BIND:    return "bind";
        case CommandType::BIND_OK: return "bindok";
        case CommandType::STATUS:  return "status";
        case CommandType::DATA:    return "dat";
        case CommandType::COMMAND: return "cmd";
        case CommandType::RESULT:  return "res";
        default:                   return "unknown";
    }
}

nlohmann::json propertyValueToJson(const PropertyValue& value) {
    if (const auto* number = std::get_if<int64_t>(&value)) {
        return *number;
    }
    return std::get<std::string>(value);
}

PropertyValue propertyValueFromJson(const nlohmann::json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::number_integer:
            return json.get<int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            uint64_t number = json.get<uint64_t>();
            if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw ProtocolError("property value out of range " + json.dump());
            }
            return static_cast<int64_t>(number);
        }
        case nlohmann::json::value_t::boolean:
            return static_cast<int64_t>(json.get<bool>() ? 1 : 0);
        case nlohmann::json::value_t::string:
            return json.get<std::string>();
        case nlohmann::json::value_t::number_float: {
            double number = json.get<double>();
            if (std::trunc(number) != number) {
                throw ProtocolError("non-integral property value " + json.dump());
            }

            // [-2^63, 2^63) is exactly representable as double bounds
            const double lowest = static_cast<double>(std::numeric_limits<int64_t>::min());
            if (number < lowest || number >= -lowest) {
                throw ProtocolError("property value out of range " + json.dump());
            }
            return static_cast<int64_t>(number);
        }
        default:
            throw ProtocolError("unsupported property value " + json.dump());
    }
}

// MessageBuilder

MessageBuilder::MessageBuilder(const Config& config) : config_(config) {
}

std::vector<uint8_t> MessageBuilder::buildScanRequest() const {
    nlohmann::json scan;
    scan["t"] = commandTypeToString(CommandType::SCAN);
    std::string text = scan.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::vector<uint8_t> MessageBuilder::buildBindRequest(const DeviceInfo& device) const {
    nlohmann::json payload;
    payload["mac"] = device.mac;
    payload["t"] = commandTypeToString(CommandType::BIND);
    payload["uid"] = 0;
    return makeEnvelope(device, 1, payload, config_.genericKey).encode();
}

std::vector<uint8_t> MessageBuilder::buildStatusRequest(const DeviceInfo& device,
                                                        const std::vector<std::string>& names,
                                                        const DeviceKey& key) const {
    nlohmann::json payload;
    payload["cols"] = names;
    payload["mac"] = device.mac;
    payload["t"] = commandTypeToString(CommandType::STATUS);
    return makeEnvelope(device, 0, payload, key).encode();
}

std::vector<uint8_t> MessageBuilder::buildCommandRequest(const DeviceInfo& device,
                                                         const PropertyMap& properties,
                                                         const DeviceKey& key) const {
    nlohmann::json values = nlohmann::json::array();
    for (const auto& entry : properties) {
        values.push_back(propertyValueToJson(entry.second));
    }

    nlohmann::json payload;
    payload["opt"] = properties.names();
    payload["p"] = values;
    payload["t"] = commandTypeToString(CommandType::COMMAND);
    return makeEnvelope(device, 0, payload, key).encode();
}

Packet MessageBuilder::makeEnvelope(const DeviceInfo& device, int i, const nlohmann::json& payload,
                                    const std::string& key) const {
    Packet packet;
    packet.clientId = config_.clientId;
    packet.i = i;
    packet.type = "pack";
    packet.uid = 0;
    packet.targetClientId = device.mac;
    packet.pack = Cipher::encrypt(payload, key);
    return packet;
}

// MessageParser

nlohmann::json MessageParser::openPayload(const std::vector<uint8_t>& datagram, const std::string& key) {
    Packet packet = Packet::decode(datagram);
    if (!packet.pack) {
        throw ProtocolError("envelope has no \"pack\" field");
    }
    return Cipher::decrypt(*packet.pack, key);
}

DeviceInfo MessageParser::parseScanResponse(const nlohmann::json& payload, const std::string& ip, uint16_t port) {
    expectType(payload, CommandType::DEVICE);

    auto text = [&payload](const char* field) -> std::string {
        auto it = payload.find(field);
        if (it == payload.end() || !it->is_string()) {
            return {};
        }
        return it->get<std::string>();
    };

    MacAddress mac = text("mac");
    if (mac.empty()) {
        mac = text("cid");
    }
    if (mac.empty()) {
        throw ProtocolError("scan reply carries no hardware identifier");
    }

    return DeviceInfo(ip, port, mac, text("name"), text("brand"), text("model"), text("ver"));
}

DeviceKey MessageParser::parseBindResponse(const nlohmann::json& payload) {
    expectType(payload, CommandType::BIND_OK);

    auto it = payload.find("key");
    if (it == payload.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ProtocolError("bind reply carries no device key");
    }
    return it->get<std::string>();
}

PropertyMap MessageParser::parseStatusResponse(const nlohmann::json& payload) {
    expectType(payload, CommandType::DATA);
    return zipLists(stringList(payload, "cols"), valueList(payload, "dat"), "status reply");
}

PropertyMap MessageParser::parseCommandResponse(const nlohmann::json& payload) {
    expectType(payload, CommandType::RESULT);
    const char* valueField = payload.contains("val") ? "val" : "p";
    return zipLists(stringList(payload, "opt"), valueList(payload, valueField), "command acknowledgment");
}

bool MessageParser::isCommandType(const nlohmann::json& payload, CommandType type) {
    auto it = payload.find("t");
    return it != payload.end() && it->is_string() && it->get<std::string>() == commandTypeToString(type);
}

void MessageParser::expectType(const nlohmann::json& payload, CommandType type) {
    auto it = payload.find("t");
    if (it == payload.end()) {
        return;
    }
    if (!isCommandType(payload, type)) {
        throw ProtocolError("expected \"" + commandTypeToString(type) + "\" reply, got " + it->dump());
    }
}

std::vector<std::string> MessageParser::stringList(const nlohmann::json& payload, const std::string& field) {
    auto it = payload.find(field);
    if (it == payload.end() || !it->is_array()) {
        throw ProtocolError("missing or non-list field \"" + field + "\"");
    }

    std::vector<std::string> result;
    result.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw ProtocolError("non-string entry in \"" + field + "\": " + item.dump());
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

std::vector<PropertyValue> MessageParser::valueList(const nlohmann::json& payload, const std::string& field) {
    auto it = payload.find(field);
    if (it == payload.end() || !it->is_array()) {
        throw ProtocolError("missing or non-list field \"" + field + "\"");
    }

    std::vector<PropertyValue> result;
    result.reserve(it->size());
    for (const auto& item : *it) {
        result.push_back(propertyValueFromJson(item));
    }
    return result;
}

PropertyMap MessageParser::zipLists(const std::vector<std::string>& names, const std::vector<PropertyValue>& values,
                                    const std::string& context) {
    if (names.size() != values.size()) {
        throw ProtocolError(context + " has " + std::to_string(names.size()) + " names but " +
                            std::to_string(values.size()) + " values");
    }
    return PropertyMap::zip(names, values);
}

} // namespace gree_protocol
