/**
 * @file logger_config.hpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @date 2019-07-11
 */

#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "analog_key_logger/devices/analog_keyboard.hpp"
#include "analog_key_logger/errors.hpp"

namespace analog_key_logger
{
/**
 * @brief LoggerConfig gathers the run-time parameters of a logging session.
 * The default values reproduce a plain logging run on a Wooting keyboard.
 */
struct LoggerConfig
{
    LoggerConfig();

    /**
     * @brief library_path is the SDK wrapper library to load.
     */
    std::string library_path;

    /**
     * @brief output_directory receives the CSV file.
     */
    std::string output_directory;

    /**
     * @brief file_prefix starts the CSV file name.
     */
    std::string file_prefix;

    /**
     * @brief period is the duration of one polling tick in seconds.
     */
    double period;

    /**
     * @brief buffer_size is the max number of keys read per tick.
     */
    size_t buffer_size;

    KeycodeMode keycode_mode;

    /**
     * @brief excluded_keys are removed from the readings.
     */
    std::vector<uint16_t> excluded_keys;

    uint16_t start_key;
    uint16_t stop_key;

    /**
     * @brief field_separator goes between the fields of a record.
     */
    char field_separator;

    /**
     * @brief show_help is set by -h, nothing should run then.
     */
    bool show_help;
};

/**
 * @brief Fill a LoggerConfig from the program arguments.
 *
 * @param argc
 * @param argv
 * @return LoggerConfig
 * @throw ConfigError on unknown options or invalid values.
 */
LoggerConfig parse_command_line(int argc, char** argv);

/**
 * @brief Get the help text of the command line.
 *
 * @param program_name
 * @return std::string
 */
std::string usage(const std::string& program_name);

/**
 * @brief Parse a keycode mode name (hid, scancode1, virtualkey,
 * virtualkey-translate).
 *
 * @throw ConfigError
 */
KeycodeMode parse_keycode_mode(const std::string& name);

}  // namespace analog_key_logger
