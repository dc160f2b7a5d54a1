/**
 * @file
 * @brief Print the travel of a few keys in a loop.
 * @copyright 2018-2020, New York University and Max Planck Gesellschaft,
 *            License BSD-3-Clause
 */
#include <signal.h>
#include <stdlib.h>

#include <atomic>
#include <iomanip>
#include <iostream>
#include <vector>

#include <real_time_tools/spinner.hpp>

#include <analog_key_logger/devices/analog_keyboard.hpp>

/**
 * @brief This boolean is here to kill cleanly the application upon ctrl+c
 */
std::atomic_bool StopDemo(false);

void my_handler(int)
{
    StopDemo = true;
}

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cerr << "Invalid number of arguments." << std::endl;
        std::cerr << "Usage:  " << argv[0]
                  << " <sdk_wrapper_library> [hid_code ...]" << std::endl;
        return 1;
    }

    std::string library_path(argv[1]);

    // W, A, S, D unless told otherwise
    std::vector<uint16_t> codes;
    for (int i = 2; i < argc; i++)
    {
        codes.push_back(static_cast<uint16_t>(atoi(argv[i])));
    }
    if (codes.empty())
    {
        codes = {26, 4, 22, 7};
    }

    analog_key_logger::WootingAnalogKeyboard keyboard(library_path);
    try
    {
        analog_key_logger::DeviceInfo info = keyboard.initialize();
        std::cout << "Found " << info.describe() << std::endl;
    }
    catch (const analog_key_logger::InitError& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    signal(SIGINT, my_handler);

    std::cout << std::endl;
    std::cout << "Printing the analog value of " << codes.size()
              << " keys.  Press Ctrl+C to exit." << std::endl;
    std::cout << std::endl;

    // print measurements in a loop
    real_time_tools::Spinner spinner;
    spinner.set_period(0.05);
    try
    {
        while (!StopDemo)
        {
            std::cout << std::setprecision(4) << std::fixed << "\r";
            for (size_t i = 0; i < codes.size(); i++)
            {
                std::cout << (i == 0 ? "" : " | ") << "key " << codes[i]
                          << ": " << keyboard.read_key(codes[i]);
            }
            std::cout << "      " << std::flush;

            spinner.spin();
        }
    }
    catch (const analog_key_logger::PollError& e)
    {
        std::cerr << std::endl << "ERROR: " << e.what() << std::endl;
        return 2;
    }

    std::cout << std::endl;
    return 0;
}
