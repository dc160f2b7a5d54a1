/**
 * @file analog_key_logger.cpp
 * @copyright Copyright (c) 2018-2020, New York University and Max Planck
 * Gesellschaft, License BSD-3-Clause
 * @brief Record the analog key states of a keyboard to a CSV file.
 */

#include <signal.h>

#include <atomic>
#include <iostream>
#include <memory>

#include <analog_key_logger/devices/analog_keyboard.hpp>
#include <analog_key_logger/logger_config.hpp>
#include <analog_key_logger/recording_session.hpp>

/**
 * @brief The session to stop cleanly upon ctrl+c.
 */
static std::atomic<analog_key_logger::RecordingSession*> active_session(
    nullptr);

/**
 * @brief This function is the callback upon a ctrl+c call from the terminal.
 */
void stop_handler(int)
{
    analog_key_logger::RecordingSession* session = active_session.load();
    if (session != nullptr)
    {
        session->request_stop();
    }
}

int main(int argc, char** argv)
{
    analog_key_logger::LoggerConfig config;
    try
    {
        config = analog_key_logger::parse_command_line(argc, argv);
    }
    catch (const analog_key_logger::ConfigError& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        std::cerr << analog_key_logger::usage(argv[0]);
        return analog_key_logger::exit_config_error;
    }
    if (config.show_help)
    {
        std::cout << analog_key_logger::usage(argv[0]);
        return analog_key_logger::exit_ok;
    }

    // the keyboard is loaded from the SDK wrapper library, which finds the
    // SDK core and its plugins by itself
    auto keyboard = std::make_shared<analog_key_logger::WootingAnalogKeyboard>(
        config.library_path, config.buffer_size, config.keycode_mode);
    keyboard->set_excluded_keys(config.excluded_keys);

    analog_key_logger::RecordingSession session(keyboard, config);

    active_session = &session;
    signal(SIGTERM, stop_handler);
    signal(SIGINT, stop_handler);

    int exit_code = session.run();

    signal(SIGTERM, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    active_session = nullptr;
    return exit_code;
}
