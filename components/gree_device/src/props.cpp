#include "gree_device/props.hpp"

#include <stdexcept>

namespace gree_device {

const std::vector<Property>& allProperties() {
    static const std::vector<Property> properties = {
        Property::POWER,
        Property::MODE,
        Property::TEMP_SET,
        Property::TEMP_UNIT,
        Property::TEMP_BIT,
        Property::FAN_SPEED,
        Property::FRESH_AIR,
        Property::XFAN,
        Property::ANION,
        Property::SLEEP,
        Property::LIGHT,
        Property::SWING_HORIZ,
        Property::SWING_VERT,
        Property::QUIET,
        Property::TURBO,
        Property::STEADY_HEAT,
        Property::POWER_SAVE
    };
    return properties;
}

std::vector<std::string> allPropertyNames() {
    std::vector<std::string> names;
    names.reserve(allProperties().size());
    for (auto property : allProperties()) {
        names.push_back(propertyName(property));
    }
    return names;
}

std::string propertyName(Property property) {
    switch (property) {
        case Property::POWER:       return "Pow";
        case Property::MODE:        return "Mod";
        case Property::TEMP_SET:    return "SetTem";
        case Property::TEMP_UNIT:   return "TemUn";
        case Property::TEMP_BIT:    return "TemRec";
        case Property::FAN_SPEED:   return "WdSpd";
        case Property::FRESH_AIR:   return "Air";
        case Property::XFAN:        return "Blo";
        case Property::ANION:       return "Health";
        case Property::SLEEP:       return "SwhSlp";
        case Property::LIGHT:       return "Lig";
        case Property::SWING_HORIZ: return "SwingLfRig";
        case Property::SWING_VERT:  return "SwUpDn";
        case Property::QUIET:       return "Quiet";
        case Property::TURBO:       return "Tur";
        case Property::STEADY_HEAT: return "StHt";
        case Property::POWER_SAVE:  return "SvSt";
    }
    throw std::invalid_argument("Unknown property");
}

std::optional<Property> propertyFromName(const std::string& name) {
    for (auto property : allProperties()) {
        if (propertyName(property) == name) {
            return property;
        }
    }
    return std::nullopt;
}

std::string modeToString(Mode mode) {
    switch (mode) {
        case Mode::AUTO: return "auto";
        case Mode::COOL: return "cool";
        case Mode::DRY:  return "dry";
        case Mode::FAN:  return "fan";
        case Mode::HEAT: return "heat";
        default:         return "unknown";
    }
}

std::string fanSpeedToString(FanSpeed speed) {
    switch (speed) {
        case FanSpeed::AUTO:        return "auto";
        case FanSpeed::LOW:         return "low";
        case FanSpeed::MEDIUM_LOW:  return "medium-low";
        case FanSpeed::MEDIUM:      return "medium";
        case FanSpeed::MEDIUM_HIGH: return "medium-high";
        case FanSpeed::HIGH:        return "high";
        default:                    return "unknown";
    }
}

} // namespace gree_device
