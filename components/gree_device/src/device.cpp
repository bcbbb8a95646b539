#include "gree_device/device.hpp"
#include "gree_network/logging.hpp"
#include "gree_protocol/error.hpp"

#include <stdexcept>
#include <string>

namespace gree_device {

using gree_protocol::PropertyMap;
using gree_protocol::PropertyValue;

Device::Device(
    const gree_protocol::DeviceInfo& info,
    std::shared_ptr<gree_network::IDeviceProtocol> protocol,
    const Config& config,
    std::shared_ptr<spdlog::logger> logger
)
    : info_(info)
    , protocol_(std::move(protocol))
    , config_(config)
    , logger_(gree_network::loggerOrNull(std::move(logger)))
{
    if (!protocol_) {
        throw std::invalid_argument("Device requires a protocol implementation");
    }
}

void Device::bind() {
    bind(gree_protocol::DeviceKey());
}

void Device::bind(const gree_protocol::DeviceKey& key) {
    logger_->info("Starting device binding to {}", info_.toString());

    key_ = protocol_->bind(info_, key);

    if (!key_.empty()) {
        logger_->info("Bound to device {} using key {}", info_.mac, key_);
    }
}

void Device::updateState() {
    requireBound("update state");

    logger_->debug("Updating device properties for {}", info_.toString());
    properties_ = protocol_->requestState(allPropertyNames(), info_, key_);
}

std::optional<PropertyValue> Device::getProperty(Property property) const {
    return properties_.get(propertyName(property));
}

void Device::setProperty(Property property, int64_t value) {
    requireBound("set property");

    const auto name = propertyName(property);
    const PropertyValue newValue(value);

    auto current = properties_.get(name);
    if (current && *current == newValue) {
        return;
    }

    logger_->debug("Sending remote state update {} -> {}", name, value);

    if (config_.updatePolicy == UpdatePolicy::OPTIMISTIC) {
        properties_.set(name, newValue);
        protocol_->sendState(PropertyMap{{name, newValue}}, info_, key_);
        return;
    }

    auto acknowledged = protocol_->sendState(PropertyMap{{name, newValue}}, info_, key_);
    for (const auto& entry : acknowledged) {
        properties_.set(entry.first, entry.second);
    }
}

std::optional<int64_t> Device::intProperty(Property property) const {
    auto value = getProperty(property);
    if (!value) {
        return std::nullopt;
    }

    if (auto number = std::get_if<int64_t>(&*value)) {
        return *number;
    }

    const auto& text = std::get<std::string>(*value);
    try {
        size_t consumed = 0;
        int64_t parsed = std::stoll(text, &consumed);
        if (consumed == text.size()) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // Not numeric; fall through
    }

    logger_->warn("Property {} has non-numeric value '{}'", propertyName(property), text);
    return std::nullopt;
}

bool Device::flag(Property property) const {
    auto value = intProperty(property);
    return value && *value != 0;
}

void Device::requireBound(const char* operation) const {
    if (!isBound()) {
        throw gree_protocol::NotBoundError(std::string("cannot ") + operation + " on " + info_.toString());
    }
}

} // namespace gree_device
