#pragma once

#include "gree_device/props.hpp"
#include "gree_network/client.hpp"
#include "gree_protocol/types.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <optional>

namespace gree_device {

/**
 * @class Device
 * @brief A physical unit with a cached view of its properties
 *
 * The device must be bound, either with a fresh bind right after discovery
 * or with a key saved from an earlier session, before its state can be read
 * or changed. Call updateState() now and then, since the unit may also be
 * controlled from elsewhere.
 */
class Device {
public:
    /**
     * @brief When setProperty() writes to the cache
     */
    enum class UpdatePolicy {
        OPTIMISTIC,       ///< Cache updated before the command is sent; kept on failure
        ON_ACKNOWLEDGE    ///< Cache updated from the unit's acknowledgment only
    };

    struct Config {
        Config() {}
        UpdatePolicy updatePolicy = UpdatePolicy::OPTIMISTIC;
    };

    Device(
        const gree_protocol::DeviceInfo& info,
        std::shared_ptr<gree_network::IDeviceProtocol> protocol,
        const Config& config = Config(),
        std::shared_ptr<spdlog::logger> logger = nullptr
    );

    /**
     * @brief Pair with the unit and store the key it hands out
     * @throws BindingTimeoutError if the unit does not answer
     */
    void bind();

    /**
     * @brief Use a key saved from an earlier bind; an empty key binds afresh
     */
    void bind(const gree_protocol::DeviceKey& key);

    /**
     * @brief Fetch every known property and replace the cache
     * @throws NotBoundError if not bound
     */
    void updateState();

    std::optional<gree_protocol::PropertyValue> getProperty(Property property) const;

    /**
     * @brief Send a single property change, skipped if the cache already holds value
     * @throws NotBoundError if not bound
     */
    void setProperty(Property property, int64_t value);

    bool isBound() const { return !key_.empty(); }
    const gree_protocol::DeviceKey& getKey() const { return key_; }
    const gree_protocol::DeviceInfo& getInfo() const { return info_; }
    const gree_protocol::PropertyMap& getProperties() const { return properties_; }
    const Config& getConfig() const { return config_; }

    // Flags read false while unknown
    bool power() const { return flag(Property::POWER); }
    void setPower(bool value) { setProperty(Property::POWER, value ? 1 : 0); }

    std::optional<Mode> mode() const { return enumProperty<Mode>(Property::MODE); }
    void setMode(Mode value) { setProperty(Property::MODE, static_cast<int64_t>(value)); }

    std::optional<int64_t> targetTemperature() const { return intProperty(Property::TEMP_SET); }
    void setTargetTemperature(int64_t value) { setProperty(Property::TEMP_SET, value); }

    std::optional<TemperatureUnits> temperatureUnits() const {
        return enumProperty<TemperatureUnits>(Property::TEMP_UNIT);
    }
    void setTemperatureUnits(TemperatureUnits value) {
        setProperty(Property::TEMP_UNIT, static_cast<int64_t>(value));
    }

    std::optional<FanSpeed> fanSpeed() const { return enumProperty<FanSpeed>(Property::FAN_SPEED); }
    void setFanSpeed(FanSpeed value) { setProperty(Property::FAN_SPEED, static_cast<int64_t>(value)); }

    bool freshAir() const { return flag(Property::FRESH_AIR); }
    void setFreshAir(bool value) { setProperty(Property::FRESH_AIR, value ? 1 : 0); }

    bool xfan() const { return flag(Property::XFAN); }
    void setXfan(bool value) { setProperty(Property::XFAN, value ? 1 : 0); }

    bool anion() const { return flag(Property::ANION); }
    void setAnion(bool value) { setProperty(Property::ANION, value ? 1 : 0); }

    bool sleep() const { return flag(Property::SLEEP); }
    void setSleep(bool value) { setProperty(Property::SLEEP, value ? 1 : 0); }

    bool light() const { return flag(Property::LIGHT); }
    void setLight(bool value) { setProperty(Property::LIGHT, value ? 1 : 0); }

    std::optional<HorizontalSwing> horizontalSwing() const {
        return enumProperty<HorizontalSwing>(Property::SWING_HORIZ);
    }
    void setHorizontalSwing(HorizontalSwing value) {
        setProperty(Property::SWING_HORIZ, static_cast<int64_t>(value));
    }

    std::optional<VerticalSwing> verticalSwing() const {
        return enumProperty<VerticalSwing>(Property::SWING_VERT);
    }
    void setVerticalSwing(VerticalSwing value) {
        setProperty(Property::SWING_VERT, static_cast<int64_t>(value));
    }

    bool quiet() const { return flag(Property::QUIET); }
    void setQuiet(bool value) { setProperty(Property::QUIET, value ? 1 : 0); }

    bool turbo() const { return flag(Property::TURBO); }
    void setTurbo(bool value) { setProperty(Property::TURBO, value ? 1 : 0); }

    bool steadyHeat() const { return flag(Property::STEADY_HEAT); }
    void setSteadyHeat(bool value) { setProperty(Property::STEADY_HEAT, value ? 1 : 0); }

    bool powerSave() const { return flag(Property::POWER_SAVE); }
    void setPowerSave(bool value) { setProperty(Property::POWER_SAVE, value ? 1 : 0); }

private:
    std::optional<int64_t> intProperty(Property property) const;
    bool flag(Property property) const;

    template <typename Enum>
    std::optional<Enum> enumProperty(Property property) const {
        auto value = intProperty(property);
        if (!value) {
            return std::nullopt;
        }
        return static_cast<Enum>(*value);
    }

    void requireBound(const char* operation) const;

    gree_protocol::DeviceInfo info_;
    std::shared_ptr<gree_network::IDeviceProtocol> protocol_;
    Config config_;
    std::shared_ptr<spdlog::logger> logger_;

    gree_protocol::DeviceKey key_;
    gree_protocol::PropertyMap properties_;
};

} // namespace gree_device
