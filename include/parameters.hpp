#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace swisp {

/**
 * @file parameters.hpp
 * @brief Bounded grading controls and their store
 *
 * Eight integer settings mirroring the controls of a stereo camera ISP.
 * Declaration order is the cycling order of the active setting.
 */

enum class Setting {
    BRIGHTNESS = 0,
    CONTRAST,
    HUE,
    SATURATION,
    SHARPNESS,
    GAIN,
    EXPOSURE,
    WHITEBALANCE_TEMPERATURE
};

constexpr size_t SETTING_COUNT = 8;

/**
 * Thrown when a setting name is not one of the eight known names
 */
class ParameterNameError : public std::invalid_argument {
public:
    explicit ParameterNameError(const std::string& name)
        : std::invalid_argument("Unknown camera setting: " + name) {}
};

/**
 * Static description of one setting
 */
struct SettingInfo {
    Setting setting;
    const char* name;          ///< Canonical upper-case name
    const char* display_name;  ///< Label used in log lines
    int min_value;
    int max_value;
    int default_value;
};

/**
 * Look up the static description of a setting
 */
const SettingInfo& setting_info(Setting setting);

/**
 * All settings in cycling order
 */
const std::array<SettingInfo, SETTING_COUNT>& all_settings();

/**
 * Resolve a setting name
 *
 * Matching is case-insensitive and treats spaces as underscores.
 * @throws ParameterNameError if the name is unknown
 */
Setting setting_from_name(const std::string& name);

/**
 * Check a name without throwing
 */
bool is_known_setting(const std::string& name);

const char* setting_name(Setting setting);

/**
 * Clamp a value into the legal range of a setting
 */
int clamp_setting(Setting setting, int value);

/**
 * Snapshot of all eight values, consumed by the render pipeline
 */
struct ParameterSet {
    std::array<int, SETTING_COUNT> values;

    ParameterSet();

    int get(Setting setting) const {
        return values[static_cast<size_t>(setting)];
    }

    /**
     * Store a value, clamped into the setting's bounds
     */
    void set(Setting setting, int value) {
        values[static_cast<size_t>(setting)] = clamp_setting(setting, value);
    }

    bool operator==(const ParameterSet& other) const { return values == other.values; }
};

enum class Direction {
    DOWN = -1,
    UP = 1
};

/**
 * Owns the session's grading settings and the active setting
 *
 * No operation can move a value outside its declared bounds.
 */
class ParameterStore {
public:
    using Snapshot = std::map<std::string, int>;

    ParameterStore();

    int get(Setting setting) const { return params_.get(setting); }
    int get(const std::string& name) const;

    /**
     * Move a setting one step up or down, clamped to its bounds
     * @return The new value
     */
    int adjust(Setting setting, Direction direction);
    int adjust(const std::string& name, Direction direction);

    /**
     * Adjust whichever setting is currently active
     */
    int adjust_active(Direction direction);

    /**
     * Store a value, clamped to the setting's bounds
     * @return The stored value
     */
    int set(Setting setting, int value);
    int set(const std::string& name, int value);

    /**
     * Restore every setting to its default. The active setting is kept.
     */
    void reset();

    /**
     * Advance the active setting, wrapping after the last one
     * @return The new active setting
     */
    Setting cycle_active();

    Setting active() const { return active_; }

    const ParameterSet& parameters() const { return params_; }

    /**
     * Name -> value pairs sorted by name, for export
     */
    Snapshot snapshot() const;

private:
    ParameterSet params_;
    Setting active_;
    int step_;
};

} // namespace swisp
