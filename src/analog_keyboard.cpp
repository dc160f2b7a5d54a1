/**
 * @file analog_keyboard.cpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @brief This file binds the Wooting Analog SDK wrapper library.
 */

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <real_time_tools/timer.hpp>

#include <analog_key_logger/devices/analog_keyboard.hpp>

namespace analog_key_logger
{
namespace
{
/**
 * @brief Layout of WootingAnalog_DeviceInfo_FFI as exported by the SDK.
 * The strings are owned by the SDK.
 */
struct DeviceInfoFfi
{
    uint16_t vendor_id;
    uint16_t product_id;
    char* manufacturer_name;
    char* device_name;
    uint64_t device_id;
    int device_type;
};

std::string describe_result(int result)
{
    std::ostringstream oss;
    oss << WootingAnalogKeyboard::result_name(result) << " (" << result << ")";
    return oss.str();
}

}  // namespace

std::string DeviceInfo::describe() const
{
    std::ostringstream oss;
    if (device_name.empty())
    {
        oss << "analog keyboard";
    }
    else
    {
        oss << device_name;
    }
    if (!manufacturer_name.empty())
    {
        oss << " by " << manufacturer_name;
    }
    oss << std::hex << std::setfill('0') << " [" << std::setw(4) << vendor_id
        << ":" << std::setw(4) << product_id << "]" << std::dec;
    if (device_id != 0)
    {
        oss << " id " << device_id;
    }
    if (device_count > 1)
    {
        oss << " (" << device_count - 1 << " more connected, ignored)";
    }
    return oss.str();
}

WootingAnalogKeyboard::WootingAnalogKeyboard(const std::string& library_path,
                                             const size_t& buffer_size,
                                             const KeycodeMode& keycode_mode)
    : library_path_(library_path),
      buffer_size_(buffer_size),
      keycode_mode_(keycode_mode),
      library_(nullptr),
      is_sdk_initialised_(false),
      initialise_(nullptr),
      uninitialise_(nullptr),
      set_keycode_mode_(nullptr),
      read_analog_(nullptr),
      read_full_buffer_(nullptr),
      get_devices_info_(nullptr),
      code_buffer_(buffer_size, 0),
      analog_buffer_(buffer_size, 0.f)
{
}

WootingAnalogKeyboard::~WootingAnalogKeyboard()
{
    shutdown();
}

void WootingAnalogKeyboard::load_library()
{
    if (library_ != nullptr)
    {
        return;
    }

    library_ = osi::open_library(library_path_);
    if (library_ == nullptr)
    {
        std::ostringstream oss;
        oss << "failed to load SDK wrapper library from " << library_path_
            << " (" << osi::last_library_error() << ")";
        throw InitError(InitError::library_not_found, oss.str());
    }

    initialise_ = osi::resolve_symbol<InitialiseFunction>(
        library_, "wooting_analog_initialise");
    uninitialise_ = osi::resolve_symbol<UninitialiseFunction>(
        library_, "wooting_analog_uninitialise");
    set_keycode_mode_ = osi::resolve_symbol<SetKeycodeModeFunction>(
        library_, "wooting_analog_set_keycode_mode");
    read_analog_ = osi::resolve_symbol<ReadAnalogFunction>(
        library_, "wooting_analog_read_analog");
    read_full_buffer_ = osi::resolve_symbol<ReadFullBufferFunction>(
        library_, "wooting_analog_read_full_buffer");
    // older SDK versions do not export it
    get_devices_info_ = osi::resolve_symbol<GetDevicesInfoFunction>(
        library_, "wooting_analog_get_connected_devices_info");

    if (initialise_ == nullptr || uninitialise_ == nullptr ||
        set_keycode_mode_ == nullptr || read_analog_ == nullptr ||
        read_full_buffer_ == nullptr)
    {
        std::ostringstream oss;
        oss << library_path_ << " is not an analog SDK wrapper library, "
            << "it lacks the wooting_analog_* functions";
        shutdown();
        throw InitError(InitError::library_not_found, oss.str());
    }
}

DeviceInfo WootingAnalogKeyboard::initialize()
{
    load_library();

    // from here on the SDK expects a matching uninitialise
    is_sdk_initialised_ = true;
    int result = initialise_();
    if (result < 0)
    {
        InitError::Kind kind = InitError::no_device;
        if (result == RESULT_DLL_NOT_FOUND || result == RESULT_NO_PLUGINS ||
            result == RESULT_FUNCTION_NOT_FOUND ||
            result == RESULT_INCOMPATIBLE_VERSION)
        {
            kind = InitError::library_not_found;
        }
        throw InitError(kind,
                        "SDK initialisation failed with error " +
                            describe_result(result));
    }
    if (result == 0)
    {
        throw InitError(InitError::no_device,
                        "SDK initialised but no analog keyboard is connected");
    }

    int mode_result = set_keycode_mode_(static_cast<int>(keycode_mode_));
    if (mode_result < 0)
    {
        throw InitError(InitError::no_device,
                        "the device rejected the keycode mode, error " +
                            describe_result(mode_result));
    }

    DeviceInfo info;
    info.device_count = result;
    read_device_info(info);
    return info;
}

void WootingAnalogKeyboard::read_device_info(DeviceInfo& info)
{
    if (get_devices_info_ == nullptr)
    {
        return;
    }

    std::vector<DeviceInfoFfi*> devices(
        static_cast<size_t>(std::max(info.device_count, 1)), nullptr);
    int count = get_devices_info_(reinterpret_cast<void**>(devices.data()),
                                  static_cast<unsigned int>(devices.size()));
    if (count <= 0 || devices[0] == nullptr)
    {
        // identity is informative only
        rt_fprintf(stderr,
                   "could not read the device info: %s\n",
                   describe_result(count).c_str());
        return;
    }

    const DeviceInfoFfi& first = *devices[0];
    info.vendor_id = first.vendor_id;
    info.product_id = first.product_id;
    if (first.manufacturer_name != nullptr)
    {
        info.manufacturer_name = first.manufacturer_name;
    }
    if (first.device_name != nullptr)
    {
        info.device_name = first.device_name;
    }
    info.device_id = first.device_id;
    info.device_type = first.device_type;
    info.device_count = std::max(info.device_count, count);
}

Reading WootingAnalogKeyboard::poll()
{
    if (!is_sdk_initialised_ || read_full_buffer_ == nullptr)
    {
        throw PollError(PollError::device_disconnected,
                        "the keyboard is not initialized");
    }

    std::fill(code_buffer_.begin(), code_buffer_.end(), 0);
    std::fill(analog_buffer_.begin(), analog_buffer_.end(), 0.f);
    int result = read_full_buffer_(code_buffer_.data(),
                                   analog_buffer_.data(),
                                   static_cast<unsigned int>(buffer_size_));
    double time_stamp = real_time_tools::Timer::get_current_time_sec();
    if (result < 0)
    {
        throw_poll_error("wooting_analog_read_full_buffer", result);
    }

    size_t populated = std::min(static_cast<size_t>(result), buffer_size_);
    std::vector<KeyState> entries;
    entries.reserve(populated);
    for (size_t i = 0; i < populated; i++)
    {
        uint16_t code = code_buffer_[i];
        // code 0 is an unset slot
        if (code == 0 || excluded_.count(code) > 0)
        {
            continue;
        }
        entries.push_back(KeyState(code, analog_buffer_[i]));
    }
    return Reading(time_stamp, entries);
}

float WootingAnalogKeyboard::read_key(uint16_t scan_code)
{
    if (!is_sdk_initialised_ || read_analog_ == nullptr)
    {
        throw PollError(PollError::device_disconnected,
                        "the keyboard is not initialized");
    }

    float value = read_analog_(scan_code);
    if (value < 0.f)
    {
        throw_poll_error("wooting_analog_read_analog", static_cast<int>(value));
    }
    return value;
}

void WootingAnalogKeyboard::shutdown()
{
    if (is_sdk_initialised_ && uninitialise_ != nullptr)
    {
        int result = uninitialise_();
        if (result < 0)
        {
            rt_fprintf(stderr,
                       "wooting_analog_uninitialise: %s\n",
                       describe_result(result).c_str());
        }
    }
    is_sdk_initialised_ = false;

    osi::close_library(library_);
    library_ = nullptr;
    initialise_ = nullptr;
    uninitialise_ = nullptr;
    set_keycode_mode_ = nullptr;
    read_analog_ = nullptr;
    read_full_buffer_ = nullptr;
    get_devices_info_ = nullptr;
}

void WootingAnalogKeyboard::set_excluded_keys(
    const std::vector<uint16_t>& excluded)
{
    excluded_ = std::set<uint16_t>(excluded.begin(), excluded.end());
}

void WootingAnalogKeyboard::throw_poll_error(const std::string& call,
                                             int result) const
{
    std::ostringstream oss;
    oss << call << " returned an error: " << describe_result(result);
    throw PollError(PollError::device_disconnected, oss.str());
}

const char* WootingAnalogKeyboard::result_name(int result)
{
    switch (result)
    {
        case RESULT_OK:
            return "Ok";
        case RESULT_UNINITIALIZED:
            return "UnInitialized";
        case RESULT_NO_DEVICES:
            return "NoDevices";
        case RESULT_DEVICE_DISCONNECTED:
            return "DeviceDisconnected";
        case RESULT_FAILURE:
            return "Failure";
        case RESULT_INVALID_ARGUMENT:
            return "InvalidArgument";
        case RESULT_NO_PLUGINS:
            return "NoPlugins";
        case RESULT_FUNCTION_NOT_FOUND:
            return "FunctionNotFound";
        case RESULT_NO_MAPPING:
            return "NoMapping";
        case RESULT_NOT_AVAILABLE:
            return "NotAvailable";
        case RESULT_INCOMPATIBLE_VERSION:
            return "IncompatibleVersion";
        case RESULT_DLL_NOT_FOUND:
            return "DLLNotFound";
    }
    return result >= 0 ? "Ok" : "Unknown";
}

}  // namespace analog_key_logger
