#pragma once

#include <string>
#include "parameters.hpp"

namespace swisp {

/**
 * @file controls.hpp
 * @brief Mapping from raw key codes to parameter store commands
 *
 * The store never sees key codes. A frontend (window loop, CLI key
 * script) translates each key with command_from_key() and hands the
 * result to apply_command().
 *
 * Default bindings:
 *   '+' '='  increment the active setting
 *   '-' '_'  decrement the active setting
 *   's'      cycle the active setting
 *   'r'      reset all settings
 *   'q' ESC  quit
 */

enum class Command {
    NONE,
    INCREMENT,
    DECREMENT,
    RESET,
    CYCLE_ACTIVE,
    QUIT
};

/**
 * Translate a key code; only the low byte is significant
 */
Command command_from_key(int key);

/**
 * Perform a command against the store and log the outcome to stdout
 * @return false for QUIT, true otherwise
 */
bool apply_command(ParameterStore& store, Command command);

/**
 * Replay every character of a key script as a command
 * @return Number of commands that changed the store (NONE and QUIT excluded)
 */
size_t apply_key_script(ParameterStore& store, const std::string& script);

} // namespace swisp
