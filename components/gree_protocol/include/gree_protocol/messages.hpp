#pragma once

#include "gree_protocol/packet.hpp"
#include "gree_protocol/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace gree_protocol {

// Command types carried in the "t" field of a decrypted payload
enum class CommandType {
    SCAN,       ///< "scan" discovery request (cleartext)
    DEVICE,     ///< "dev" discovery reply
    BIND,       ///< "bind" pairing request
    BIND_OK,    ///< "bindok" pairing reply carrying the device key
    STATUS,     ///< "status" property query
    DATA,       ///< "dat" property query reply
    COMMAND,    ///< "cmd" property update
    RESULT      ///< "res" property update acknowledgment
};

std::string commandTypeToString(CommandType type);

// Conversions between wire JSON values and PropertyValue
nlohmann::json propertyValueToJson(const PropertyValue& value);

/**
 * @throws ProtocolError for values that are neither integral nor strings
 */
PropertyValue propertyValueFromJson(const nlohmann::json& json);

/**
 * @brief Builds outgoing request datagrams
 */
class MessageBuilder {
public:
    struct Config {
        std::string clientId = DEFAULT_CLIENT_ID;
        std::string genericKey = GENERIC_KEY;
    };

    MessageBuilder() : MessageBuilder(Config()) {}
    explicit MessageBuilder(const Config& config);

    /**
     * @brief Cleartext {"t": "scan"} broadcast request
     */
    std::vector<uint8_t> buildScanRequest() const;

    /**
     * @brief Bind request for a device, encrypted with the generic key
     */
    std::vector<uint8_t> buildBindRequest(const DeviceInfo& device) const;

    /**
     * @brief Status query for the given property names
     */
    std::vector<uint8_t> buildStatusRequest(const DeviceInfo& device,
                                            const std::vector<std::string>& names,
                                            const DeviceKey& key) const;

    /**
     * @brief Property update; option and value lists follow the map's order
     */
    std::vector<uint8_t> buildCommandRequest(const DeviceInfo& device,
                                             const PropertyMap& properties,
                                             const DeviceKey& key) const;

    const Config& getConfig() const { return config_; }

private:
    Packet makeEnvelope(const DeviceInfo& device, int i, const nlohmann::json& payload,
                        const std::string& key) const;

    Config config_;
};

/**
 * @brief Decodes incoming datagrams and their decrypted payloads
 *
 * A payload whose "t" field is present but differs from the expected type is
 * rejected; an absent "t" is accepted when the required fields are present.
 */
class MessageParser {
public:
    /**
     * @brief Decode the envelope and decrypt its "pack" field
     * @throws ProtocolError if the envelope is malformed or has no "pack"
     * @throws DecryptionError if the payload cannot be decrypted with key
     */
    static nlohmann::json openPayload(const std::vector<uint8_t>& datagram, const std::string& key);

    /**
     * @brief Extract identity fields from a "dev" reply
     */
    static DeviceInfo parseScanResponse(const nlohmann::json& payload, const std::string& ip, uint16_t port);

    /**
     * @brief Extract the device key from a "bindok" reply
     */
    static DeviceKey parseBindResponse(const nlohmann::json& payload);

    /**
     * @brief Zip the "cols"/"dat" lists of a "dat" reply
     */
    static PropertyMap parseStatusResponse(const nlohmann::json& payload);

    /**
     * @brief Zip the "opt"/"val" lists of a "res" reply ("p" when "val" is absent)
     */
    static PropertyMap parseCommandResponse(const nlohmann::json& payload);

    static bool isCommandType(const nlohmann::json& payload, CommandType type);

private:
    static void expectType(const nlohmann::json& payload, CommandType type);
    static std::vector<std::string> stringList(const nlohmann::json& payload, const std::string& field);
    static std::vector<PropertyValue> valueList(const nlohmann::json& payload, const std::string& field);
    static PropertyMap zipLists(const std::vector<std::string>& names, const std::vector<PropertyValue>& values,
                                const std::string& context);
};

} // namespace gree_protocol
