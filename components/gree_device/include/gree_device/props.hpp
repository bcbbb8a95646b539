#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gree_device {

/**
 * @brief Properties a unit reports and accepts
 *
 * Each maps to a fixed wire name, e.g. POWER -> "Pow".
 */
enum class Property {
    POWER,          ///< "Pow", 0/1
    MODE,           ///< "Mod", see Mode
    TEMP_SET,       ///< "SetTem", target temperature
    TEMP_UNIT,      ///< "TemUn", see TemperatureUnits
    TEMP_BIT,       ///< "TemRec", Fahrenheit rounding bit
    FAN_SPEED,      ///< "WdSpd", see FanSpeed
    FRESH_AIR,      ///< "Air"
    XFAN,           ///< "Blo", dries the coil after cool/dry
    ANION,          ///< "Health", ozone generator
    SLEEP,          ///< "SwhSlp"
    LIGHT,          ///< "Lig"
    SWING_HORIZ,    ///< "SwingLfRig", see HorizontalSwing
    SWING_VERT,     ///< "SwUpDn", see VerticalSwing
    QUIET,          ///< "Quiet"
    TURBO,          ///< "Tur"
    STEADY_HEAT,    ///< "StHt", hold 8 degrees C
    POWER_SAVE      ///< "SvSt"
};

enum class TemperatureUnits {
    C = 0,
    F = 1
};

enum class Mode {
    AUTO = 0,
    COOL = 1,
    DRY = 2,
    FAN = 3,
    HEAT = 4
};

enum class FanSpeed {
    AUTO = 0,
    LOW = 1,
    MEDIUM_LOW = 2,
    MEDIUM = 3,
    MEDIUM_HIGH = 4,
    HIGH = 5
};

enum class HorizontalSwing {
    DEFAULT = 0,
    FULL_SWING = 1,
    LEFT = 2,
    LEFT_CENTER = 3,
    CENTER = 4,
    RIGHT_CENTER = 5,
    RIGHT = 6
};

enum class VerticalSwing {
    DEFAULT = 0,
    FULL_SWING = 1,
    FIXED_UPPER = 2,
    FIXED_UPPER_MIDDLE = 3,
    FIXED_MIDDLE = 4,
    FIXED_LOWER_MIDDLE = 5,
    FIXED_LOWER = 6,
    SWING_UPPER = 7,
    SWING_UPPER_MIDDLE = 8,
    SWING_MIDDLE = 9,
    SWING_LOWER_MIDDLE = 10,
    SWING_LOWER = 11
};

// Every property, in the order used for full state requests
const std::vector<Property>& allProperties();

std::vector<std::string> allPropertyNames();

// Wire name of a property
std::string propertyName(Property property);

// Property for a wire name, if it is part of the vocabulary
std::optional<Property> propertyFromName(const std::string& name);

std::string modeToString(Mode mode);
std::string fanSpeedToString(FanSpeed speed);

} // namespace gree_device
