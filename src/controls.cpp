/**
 * @file controls.cpp
 * @brief Key bindings and command dispatch
 */

#include "controls.hpp"
#include <iostream>

namespace swisp {

namespace {

constexpr int KEY_ESCAPE = 27;

void print_value(const ParameterStore& store)
{
    const Setting active = store.active();
    std::cout << setting_name(active) << ": " << store.get(active) << std::endl;
}

} // anonymous namespace

Command command_from_key(int key)
{
    switch (key & 0xFF) {
        case '+':
        case '=':
            return Command::INCREMENT;
        case '-':
        case '_':
            return Command::DECREMENT;
        case 's':
            return Command::CYCLE_ACTIVE;
        case 'r':
            return Command::RESET;
        case 'q':
        case KEY_ESCAPE:
            return Command::QUIT;
        default:
            return Command::NONE;
    }
}

bool apply_command(ParameterStore& store, Command command)
{
    switch (command) {
        case Command::INCREMENT:
            store.adjust_active(Direction::UP);
            print_value(store);
            break;

        case Command::DECREMENT:
            store.adjust_active(Direction::DOWN);
            print_value(store);
            break;

        case Command::RESET:
            store.reset();
            std::cout << "Reset all settings to default" << std::endl;
            break;

        case Command::CYCLE_ACTIVE: {
            const Setting next = store.cycle_active();
            std::cout << "Switch to camera settings: " << setting_name(next)
                      << " (" << setting_info(next).display_name << ")" << std::endl;
            break;
        }

        case Command::QUIT:
            return false;

        case Command::NONE:
            break;
    }
    return true;
}

size_t apply_key_script(ParameterStore& store, const std::string& script)
{
    size_t applied = 0;
    for (char key : script) {
        const Command command = command_from_key(static_cast<unsigned char>(key));
        if (command == Command::NONE) {
            continue;
        }
        if (!apply_command(store, command)) {
            break;
        }
        applied++;
    }
    return applied;
}

} // namespace swisp
