#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gree_protocol {

// Well-known UDP port every unit listens on
constexpr uint16_t DEFAULT_DEVICE_PORT = 7000;

// Client identifier placed in the "cid" field of outgoing envelopes
constexpr const char* DEFAULT_CLIENT_ID = "app";

// Publicly known key used for scan and bind traffic
constexpr const char* GENERIC_KEY = "a3K8Bx%2r8Y7#xDh";

// Per-device session key obtained from binding
using DeviceKey = std::string;

// Hardware identifier (MAC without separators)
using MacAddress = std::string;

// Error codes
enum class ErrorCode {
    SUCCESS = 0,
    TIMEOUT = 1,
    BINDING_TIMEOUT = 2,
    DECRYPTION_FAILURE = 3,
    PROTOCOL_VIOLATION = 4,
    TRANSPORT_FAILURE = 5,
    STREAM_CLOSED = 6,
    NOT_BOUND = 7
};

// Convert ErrorCode to string
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:            return "SUCCESS";
        case ErrorCode::TIMEOUT:            return "TIMEOUT";
        case ErrorCode::BINDING_TIMEOUT:    return "BINDING_TIMEOUT";
        case ErrorCode::DECRYPTION_FAILURE: return "DECRYPTION_FAILURE";
        case ErrorCode::PROTOCOL_VIOLATION: return "PROTOCOL_VIOLATION";
        case ErrorCode::TRANSPORT_FAILURE:  return "TRANSPORT_FAILURE";
        case ErrorCode::STREAM_CLOSED:      return "STREAM_CLOSED";
        case ErrorCode::NOT_BOUND:          return "NOT_BOUND";
        default:                            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Identity and address of a physical unit
 *
 * Created by discovery or supplied manually. Only the address and MAC are
 * required for addressing; the descriptive fields are informational.
 * Holders copy it on construction and hand it out as const&.
 */
struct DeviceInfo {
    std::string ip;
    uint16_t port = DEFAULT_DEVICE_PORT;
    MacAddress mac;
    std::string name;
    std::string brand;
    std::string model;
    std::string version;

    DeviceInfo() = default;
    DeviceInfo(const std::string& deviceIp, uint16_t devicePort, const MacAddress& deviceMac,
               const std::string& deviceName = "", const std::string& deviceBrand = "",
               const std::string& deviceModel = "", const std::string& deviceVersion = "");

    /**
     * @brief Human readable description, e.g. "living-room @ 192.168.1.20:7000 (mac: f4911e7aca59)"
     */
    std::string toString() const;

    bool operator==(const DeviceInfo& other) const;
    bool operator!=(const DeviceInfo& other) const { return !(*this == other); }
};

// A property value as carried on the wire: devices report integers, tests and
// some firmwares use strings
using PropertyValue = std::variant<int64_t, std::string>;

std::string propertyValueToString(const PropertyValue& value);

/**
 * @class PropertyMap
 * @brief Ordered name -> value mapping
 *
 * Iteration order is insertion order, which is also the order used for the
 * parallel name/value lists on the wire.
 */
class PropertyMap {
public:
    using Entry = std::pair<std::string, PropertyValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    PropertyMap() = default;
    PropertyMap(std::initializer_list<Entry> entries);

    /**
     * @brief Build a map by zipping two parallel lists
     * @throws std::invalid_argument if the lists differ in length
     */
    static PropertyMap zip(const std::vector<std::string>& names, const std::vector<PropertyValue>& values);

    // Insert or overwrite, keeping the original position of an existing name
    void set(const std::string& name, const PropertyValue& value);
    std::optional<PropertyValue> get(const std::string& name) const;
    bool contains(const std::string& name) const;
    bool erase(const std::string& name);

    std::vector<std::string> names() const;
    std::vector<PropertyValue> values() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const PropertyMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const PropertyMap& other) const { return !(*this == other); }

private:
    std::vector<Entry>::iterator find(const std::string& name);
    std::vector<Entry>::const_iterator find(const std::string& name) const;

    std::vector<Entry> entries_;
};

} // namespace gree_protocol
