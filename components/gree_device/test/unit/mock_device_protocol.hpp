#pragma once

#include "gree_network/client.hpp"
#include <gmock/gmock.h>

namespace gree_device {
namespace test {

class MockDeviceProtocol : public gree_network::IDeviceProtocol {
public:
    MOCK_METHOD(gree_protocol::DeviceKey, bind, (const gree_protocol::DeviceInfo& device), (override));
    MOCK_METHOD(gree_protocol::DeviceKey, bind,
                (const gree_protocol::DeviceInfo& device, const gree_protocol::DeviceKey& key), (override));
    MOCK_METHOD(gree_protocol::PropertyMap, requestState,
                (const std::vector<std::string>& names, const gree_protocol::DeviceInfo& device,
                 const gree_protocol::DeviceKey& key), (override));
    MOCK_METHOD(gree_protocol::PropertyMap, sendState,
                (const gree_protocol::PropertyMap& properties, const gree_protocol::DeviceInfo& device,
                 const gree_protocol::DeviceKey& key), (override));
};

} // namespace test
} // namespace gree_device
