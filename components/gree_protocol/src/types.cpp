#include "gree_protocol/types.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace gree_protocol {

DeviceInfo::DeviceInfo(const std::string& deviceIp, uint16_t devicePort, const MacAddress& deviceMac,
                       const std::string& deviceName, const std::string& deviceBrand,
                       const std::string& deviceModel, const std::string& deviceVersion)
    : ip(deviceIp)
    , port(devicePort)
    , mac(deviceMac)
    , name(deviceName.empty() ? deviceMac : deviceName)
    , brand(deviceBrand)
    , model(deviceModel)
    , version(deviceVersion)
{
}

std::string DeviceInfo::toString() const {
    std::ostringstream oss;
    oss << (name.empty() ? mac : name) << " @ " << ip << ":" << port << " (mac: " << mac << ")";
    return oss.str();
}

bool DeviceInfo::operator==(const DeviceInfo& other) const {
    return ip == other.ip && port == other.port && mac == other.mac &&
           name == other.name && brand == other.brand &&
           model == other.model && version == other.version;
}

std::string propertyValueToString(const PropertyValue& value) {
    if (const auto* number = std::get_if<int64_t>(&value)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(value);
}

PropertyMap::PropertyMap(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

PropertyMap PropertyMap::zip(const std::vector<std::string>& names, const std::vector<PropertyValue>& values) {
    if (names.size() != values.size()) {
        throw std::invalid_argument("Name and value lists differ in length: " +
                                    std::to_string(names.size()) + " vs " + std::to_string(values.size()));
    }

    PropertyMap map;
    for (size_t i = 0; i < names.size(); ++i) {
        map.set(names[i], values[i]);
    }
    return map;
}

void PropertyMap::set(const std::string& name, const PropertyValue& value) {
    auto it = find(name);
    if (it != entries_.end()) {
        it->second = value;
        return;
    }
    entries_.emplace_back(name, value);
}

std::optional<PropertyValue> PropertyMap::get(const std::string& name) const {
    auto it = find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PropertyMap::contains(const std::string& name) const {
    return find(name) != entries_.end();
}

bool PropertyMap::erase(const std::string& name) {
    auto it = find(name);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::vector<std::string> PropertyMap::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

std::vector<PropertyValue> PropertyMap::values() const {
    std::vector<PropertyValue> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<PropertyMap::Entry>::iterator PropertyMap::find(const std::string& name) {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&name](const Entry& entry) { return entry.first == name; });
}

std::vector<PropertyMap::Entry>::const_iterator PropertyMap::find(const std::string& name) const {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&name](const Entry& entry) { return entry.first == name; });
}

} // namespace gree_protocol
