/**
 * @file parameters.cpp
 * @brief Setting table and bounded parameter store
 */

#include "parameters.hpp"
#include <algorithm>
#include <cctype>

namespace swisp {

namespace {

const std::array<SettingInfo, SETTING_COUNT> SETTINGS = {{
    { Setting::BRIGHTNESS,               "BRIGHTNESS",               "Brightness",    -100,  100,    0 },
    { Setting::CONTRAST,                 "CONTRAST",                 "Contrast",         0,  100,    0 },
    { Setting::HUE,                      "HUE",                      "Hue",            -90,   90,    0 },
    { Setting::SATURATION,               "SATURATION",               "Saturation",    -100,  100,    0 },
    { Setting::SHARPNESS,                "SHARPNESS",                "Sharpness",        0,   60,    0 },
    { Setting::GAIN,                     "GAIN",                     "Gain",             0,  100,    0 },
    { Setting::EXPOSURE,                 "EXPOSURE",                 "Exposure",         0,  100,    0 },
    { Setting::WHITEBALANCE_TEMPERATURE, "WHITEBALANCE_TEMPERATURE", "White Balance", 2000, 8000, 5500 },
}};

std::string normalize_name(const std::string& name)
{
    std::string normalized;
    normalized.reserve(name.size());
    for (char c : name) {
        if (c == ' ') {
            normalized.push_back('_');
        }
        else {
            normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return normalized;
}

bool find_setting(const std::string& name, Setting& setting)
{
    const std::string normalized = normalize_name(name);
    for (const SettingInfo& info : SETTINGS) {
        if (normalized == info.name) {
            setting = info.setting;
            return true;
        }
    }
    return false;
}

} // anonymous namespace

const SettingInfo& setting_info(Setting setting)
{
    return SETTINGS[static_cast<size_t>(setting)];
}

const std::array<SettingInfo, SETTING_COUNT>& all_settings()
{
    return SETTINGS;
}

Setting setting_from_name(const std::string& name)
{
    Setting setting;
    if (!find_setting(name, setting)) {
        throw ParameterNameError(name);
    }
    return setting;
}

bool is_known_setting(const std::string& name)
{
    Setting setting;
    return find_setting(name, setting);
}

const char* setting_name(Setting setting)
{
    return setting_info(setting).name;
}

int clamp_setting(Setting setting, int value)
{
    const SettingInfo& info = setting_info(setting);
    return std::min(std::max(value, info.min_value), info.max_value);
}

ParameterSet::ParameterSet()
{
    for (const SettingInfo& info : SETTINGS) {
        values[static_cast<size_t>(info.setting)] = info.default_value;
    }
}

// ============================================================================
// ParameterStore
// ============================================================================

ParameterStore::ParameterStore()
    : params_()
    , active_(Setting::BRIGHTNESS)
    , step_(1)
{
}

int ParameterStore::get(const std::string& name) const
{
    return get(setting_from_name(name));
}

int ParameterStore::adjust(Setting setting, Direction direction)
{
    const int delta = static_cast<int>(direction) * step_;
    params_.set(setting, params_.get(setting) + delta);
    return params_.get(setting);
}

int ParameterStore::adjust(const std::string& name, Direction direction)
{
    return adjust(setting_from_name(name), direction);
}

int ParameterStore::adjust_active(Direction direction)
{
    return adjust(active_, direction);
}

int ParameterStore::set(Setting setting, int value)
{
    params_.set(setting, value);
    return params_.get(setting);
}

int ParameterStore::set(const std::string& name, int value)
{
    return set(setting_from_name(name), value);
}

void ParameterStore::reset()
{
    params_ = ParameterSet();
}

Setting ParameterStore::cycle_active()
{
    const size_t next = (static_cast<size_t>(active_) + 1) % SETTING_COUNT;
    active_ = static_cast<Setting>(next);
    return active_;
}

ParameterStore::Snapshot ParameterStore::snapshot() const
{
    Snapshot snap;
    for (const SettingInfo& info : SETTINGS) {
        snap[info.name] = params_.get(info.setting);
    }
    return snap;
}

} // namespace swisp
