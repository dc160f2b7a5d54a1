/**
 * @file analog_keyboard.hpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @date 2019-07-11
 */

#pragma once

#include <stdint.h>

#include <set>
#include <string>
#include <vector>

#include "analog_key_logger/devices/device_interface.hpp"
#include "analog_key_logger/errors.hpp"
#include "analog_key_logger/reading.hpp"
#include "analog_key_logger/utils/os_interface.hpp"

namespace analog_key_logger
{
/**
 * @brief KeycodeMode selects how the SDK numbers the keys.
 */
enum class KeycodeMode
{
    hid = 0,
    scancode1 = 1,
    virtual_key = 2,
    virtual_key_translate = 3
};

/**
 * @brief HID usage codes of the keys driving the recording.
 */
const uint16_t SCAN_CODE_ESC = 41;
const uint16_t SCAN_CODE_SPACE = 44;

/**
 * @brief DeviceInfo is the identity of the keyboard found by initialize().
 */
struct DeviceInfo
{
    DeviceInfo()
        : vendor_id(0),
          product_id(0),
          device_id(0),
          device_type(0),
          device_count(0)
    {
    }

    uint16_t vendor_id;
    uint16_t product_id;
    std::string manufacturer_name;
    std::string device_name;
    uint64_t device_id;
    int device_type;

    /**
     * @brief device_count is the number of keyboards the SDK reported. Only
     * the first one is described by the other fields.
     */
    int device_count;

    /**
     * @brief Human readable one line description.
     */
    std::string describe() const;
};

/**
 * @brief AnalogKeyboardInterface is an abstract interface to a keyboard
 * reporting the travel of every pressed key.
 */
class AnalogKeyboardInterface : public DeviceInterface
{
public:
    virtual ~AnalogKeyboardInterface()
    {
    }

    /**
     * @brief Load the native library and contact the hardware.
     *
     * @return DeviceInfo of the first connected keyboard.
     * @throw InitError
     */
    virtual DeviceInfo initialize() = 0;

    /**
     * @brief Read the current state of all the keys.
     *
     * @return Reading with one entry per pressed key, empty if no key is
     * pressed.
     * @throw PollError
     */
    virtual Reading poll() = 0;

    /**
     * @brief Read the travel of a single key.
     *
     * @param scan_code
     * @return float between 0.0 and 1.0.
     * @throw PollError
     */
    virtual float read_key(uint16_t scan_code) = 0;

    /**
     * @brief Release the native resources. Safe to call after a failed
     * initialize() and more than once.
     */
    virtual void shutdown() = 0;
};

/**
 * @brief WootingAnalogKeyboard implements the AnalogKeyboardInterface on
 * top of the Wooting Analog SDK wrapper library
 * (libwooting_analog_wrapper.so), loaded at run time.
 */
class WootingAnalogKeyboard : public AnalogKeyboardInterface
{
public:
    /**
     * @brief Result codes of the SDK C API.
     */
    enum SdkResult
    {
        RESULT_OK = 1,
        RESULT_UNINITIALIZED = -2000,
        RESULT_NO_DEVICES = -1999,
        RESULT_DEVICE_DISCONNECTED = -1998,
        RESULT_FAILURE = -1997,
        RESULT_INVALID_ARGUMENT = -1996,
        RESULT_NO_PLUGINS = -1995,
        RESULT_FUNCTION_NOT_FOUND = -1994,
        RESULT_NO_MAPPING = -1993,
        RESULT_NOT_AVAILABLE = -1992,
        RESULT_INCOMPATIBLE_VERSION = -1991,
        RESULT_DLL_NOT_FOUND = -1990
    };

    /**
     * @brief Construct a new WootingAnalogKeyboard object. Nothing is loaded
     * before initialize().
     *
     * @param library_path full file name of the SDK wrapper library.
     * @param buffer_size max number of key states read by poll().
     * @param keycode_mode numbering of the keys.
     */
    WootingAnalogKeyboard(const std::string& library_path,
                          const size_t& buffer_size = 64,
                          const KeycodeMode& keycode_mode = KeycodeMode::hid);

    /**
     * @brief Destroy the WootingAnalogKeyboard object, shutting it down.
     */
    virtual ~WootingAnalogKeyboard();

    virtual DeviceInfo initialize();

    virtual Reading poll();

    virtual float read_key(uint16_t scan_code);

    virtual void shutdown();

    /**
     * @brief Set the keys removed from the readings of poll().
     *
     * @param excluded codes to be ignored.
     */
    void set_excluded_keys(const std::vector<uint16_t>& excluded);

    /**
     * @brief Get the name of an SDK result code.
     *
     * @param result
     * @return const char*
     */
    static const char* result_name(int result);

private:
    typedef int (*InitialiseFunction)();
    typedef int (*UninitialiseFunction)();
    typedef int (*SetKeycodeModeFunction)(int mode);
    typedef float (*ReadAnalogFunction)(unsigned short code);
    typedef int (*ReadFullBufferFunction)(unsigned short* code_buffer,
                                          float* analog_buffer,
                                          unsigned int length);
    typedef int (*GetDevicesInfoFunction)(void** buffer, unsigned int length);

    /**
     * @brief Open the library and fill the function pointers.
     * @throw InitError library_not_found
     */
    void load_library();

    /**
     * @brief Query the identity of the first device, if the library
     * exports the device info function.
     */
    void read_device_info(DeviceInfo& info);

    /**
     * @brief Throw the PollError matching a negative SDK result.
     */
    void throw_poll_error(const std::string& call, int result) const;

    std::string library_path_;
    size_t buffer_size_;
    KeycodeMode keycode_mode_;

    /**
     * @brief library_ is the dlopen handle, nullptr when not loaded.
     */
    osi::LibraryHandle library_;

    /**
     * @brief is_sdk_initialised_ is true from the call to the SDK
     * initialise function until the call to its uninitialise function.
     */
    bool is_sdk_initialised_;

    InitialiseFunction initialise_;
    UninitialiseFunction uninitialise_;
    SetKeycodeModeFunction set_keycode_mode_;
    ReadAnalogFunction read_analog_;
    ReadFullBufferFunction read_full_buffer_;
    GetDevicesInfoFunction get_devices_info_;

    /**
     * @brief Buffers handed to the SDK by poll().
     */
    std::vector<unsigned short> code_buffer_;
    std::vector<float> analog_buffer_;

    std::set<uint16_t> excluded_;
};

}  // namespace analog_key_logger
