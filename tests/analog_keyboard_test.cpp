#include <gtest/gtest.h>

#include <analog_key_logger/devices/analog_keyboard.hpp>
#include <analog_key_logger/utils/os_interface.hpp>

using namespace analog_key_logger;

typedef void (*ResetFunction)();
typedef void (*SetResultFunction)(int);
typedef void (*PushFrameFunction)(const unsigned short*,
                                  const float*,
                                  unsigned int);
typedef void (*PushErrorFunction)(int);
typedef int (*CounterFunction)();

/**
 * @brief Opens the fake SDK a second time to script it. The library stays
 * loaded while the keyboard opens and closes it.
 */
class AnalogKeyboardTest : public ::testing::Test
{
protected:
    void SetUp()
    {
        handle_ = osi::open_library(FAKE_ANALOG_SDK_PATH);
        ASSERT_NE(handle_, nullptr) << osi::last_library_error();

        reset_ = osi::resolve_symbol<ResetFunction>(handle_, "fake_sdk_reset");
        set_initialise_result_ = osi::resolve_symbol<SetResultFunction>(
            handle_, "fake_sdk_set_initialise_result");
        set_keycode_mode_result_ = osi::resolve_symbol<SetResultFunction>(
            handle_, "fake_sdk_set_keycode_mode_result");
        push_frame_ = osi::resolve_symbol<PushFrameFunction>(
            handle_, "fake_sdk_push_frame");
        push_error_ = osi::resolve_symbol<PushErrorFunction>(
            handle_, "fake_sdk_push_error");
        keycode_mode_ = osi::resolve_symbol<CounterFunction>(
            handle_, "fake_sdk_keycode_mode");
        initialise_calls_ = osi::resolve_symbol<CounterFunction>(
            handle_, "fake_sdk_initialise_calls");
        uninitialise_calls_ = osi::resolve_symbol<CounterFunction>(
            handle_, "fake_sdk_uninitialise_calls");
        ASSERT_NE(reset_, nullptr);
        ASSERT_NE(uninitialise_calls_, nullptr);

        reset_();
    }

    void TearDown()
    {
        osi::close_library(handle_);
    }

    void push_frame(const std::vector<unsigned short>& codes,
                    const std::vector<float>& values)
    {
        push_frame_(codes.data(), values.data(), codes.size());
    }

    osi::LibraryHandle handle_;
    ResetFunction reset_;
    SetResultFunction set_initialise_result_;
    SetResultFunction set_keycode_mode_result_;
    PushFrameFunction push_frame_;
    PushErrorFunction push_error_;
    CounterFunction keycode_mode_;
    CounterFunction initialise_calls_;
    CounterFunction uninitialise_calls_;
};

TEST_F(AnalogKeyboardTest, initialize_reports_the_device)
{
    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    DeviceInfo info = keyboard.initialize();

    EXPECT_EQ(info.device_count, 1);
    EXPECT_EQ(info.vendor_id, 0x31e3);
    EXPECT_EQ(info.product_id, 0x1220);
    EXPECT_EQ(info.device_name, "Wooting Two HE");
    EXPECT_EQ(info.manufacturer_name, "Wooting");
    EXPECT_EQ(info.device_id, 42u);
    EXPECT_NE(info.describe().find("Wooting Two HE"), std::string::npos);
    EXPECT_NE(info.describe().find("31e3:1220"), std::string::npos);
    EXPECT_EQ(initialise_calls_(), 1);
    EXPECT_EQ(keycode_mode_(), 0);
}

TEST_F(AnalogKeyboardTest, keycode_mode_is_applied)
{
    WootingAnalogKeyboard keyboard(
        FAKE_ANALOG_SDK_PATH, 64, KeycodeMode::virtual_key);
    keyboard.initialize();
    EXPECT_EQ(keycode_mode_(), 2);
}

TEST_F(AnalogKeyboardTest, missing_library)
{
    WootingAnalogKeyboard keyboard("/nonexistent/libwooting_analog_wrapper.so");
    try
    {
        keyboard.initialize();
        FAIL() << "initialize() should have thrown";
    }
    catch (const InitError& e)
    {
        EXPECT_EQ(e.kind(), InitError::library_not_found);
    }
    keyboard.shutdown();
}

TEST_F(AnalogKeyboardTest, library_without_sdk_functions)
{
    WootingAnalogKeyboard keyboard("libm.so.6");
    try
    {
        keyboard.initialize();
        FAIL() << "initialize() should have thrown";
    }
    catch (const InitError& e)
    {
        EXPECT_EQ(e.kind(), InitError::library_not_found);
    }
}

TEST_F(AnalogKeyboardTest, no_device)
{
    set_initialise_result_(0);
    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    try
    {
        keyboard.initialize();
        FAIL() << "initialize() should have thrown";
    }
    catch (const InitError& e)
    {
        EXPECT_EQ(e.kind(), InitError::no_device);
    }

    // the partial initialization is undone once
    keyboard.shutdown();
    EXPECT_EQ(uninitialise_calls_(), 1);
}

TEST_F(AnalogKeyboardTest, sdk_error_codes_are_translated)
{
    set_initialise_result_(WootingAnalogKeyboard::RESULT_NO_PLUGINS);
    WootingAnalogKeyboard missing_plugins(FAKE_ANALOG_SDK_PATH);
    try
    {
        missing_plugins.initialize();
        FAIL() << "initialize() should have thrown";
    }
    catch (const InitError& e)
    {
        EXPECT_EQ(e.kind(), InitError::library_not_found);
        EXPECT_NE(std::string(e.what()).find("NoPlugins"), std::string::npos);
    }

    set_initialise_result_(WootingAnalogKeyboard::RESULT_NO_DEVICES);
    WootingAnalogKeyboard no_devices(FAKE_ANALOG_SDK_PATH);
    try
    {
        no_devices.initialize();
        FAIL() << "initialize() should have thrown";
    }
    catch (const InitError& e)
    {
        EXPECT_EQ(e.kind(), InitError::no_device);
    }
}

TEST_F(AnalogKeyboardTest, rejected_keycode_mode)
{
    set_keycode_mode_result_(WootingAnalogKeyboard::RESULT_NOT_AVAILABLE);
    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    EXPECT_THROW(keyboard.initialize(), InitError);
}

TEST_F(AnalogKeyboardTest, poll_returns_the_pressed_keys)
{
    push_frame({30, 44}, {0.75f, 1.0f});

    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    keyboard.initialize();
    Reading reading = keyboard.poll();

    ASSERT_EQ(reading.size(), 2u);
    EXPECT_EQ(reading.get_entries()[0].scan_code, 30);
    EXPECT_FLOAT_EQ(reading.get_entries()[0].analog_value, 0.75f);
    EXPECT_EQ(reading.get_entries()[1].scan_code, 44);
    EXPECT_FLOAT_EQ(reading.get_entries()[1].analog_value, 1.0f);
    EXPECT_GT(reading.get_time_stamp(), 0.0);
}

TEST_F(AnalogKeyboardTest, no_key_pressed_is_an_empty_reading)
{
    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    keyboard.initialize();
    Reading reading = keyboard.poll();
    EXPECT_EQ(reading.size(), 0u);
}

TEST_F(AnalogKeyboardTest, unset_and_excluded_keys_are_stripped)
{
    push_frame({0, 30, 4, 0, 44}, {0.5f, 0.25f, 0.5f, 0.f, 1.f});

    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    keyboard.set_excluded_keys({4});
    keyboard.initialize();
    Reading reading = keyboard.poll();

    ASSERT_EQ(reading.size(), 2u);
    EXPECT_EQ(reading.get_entries()[0].scan_code, 30);
    EXPECT_EQ(reading.get_entries()[1].scan_code, 44);
    EXPECT_FALSE(reading.contains(4));
}

TEST_F(AnalogKeyboardTest, poll_is_limited_to_the_buffer_size)
{
    push_frame({4, 5, 6, 7}, {0.1f, 0.2f, 0.3f, 0.4f});

    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH, 2);
    keyboard.initialize();
    EXPECT_EQ(keyboard.poll().size(), 2u);
}

TEST_F(AnalogKeyboardTest, disconnect_during_poll)
{
    push_frame({30}, {0.5f});
    push_error_(WootingAnalogKeyboard::RESULT_DEVICE_DISCONNECTED);

    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    keyboard.initialize();
    EXPECT_EQ(keyboard.poll().size(), 1u);
    try
    {
        keyboard.poll();
        FAIL() << "poll() should have thrown";
    }
    catch (const PollError& e)
    {
        EXPECT_EQ(e.kind(), PollError::device_disconnected);
        EXPECT_NE(std::string(e.what()).find("DeviceDisconnected"),
                  std::string::npos);
    }
}

TEST_F(AnalogKeyboardTest, poll_before_initialize)
{
    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    EXPECT_THROW(keyboard.poll(), PollError);
    EXPECT_THROW(keyboard.read_key(44), PollError);
}

TEST_F(AnalogKeyboardTest, read_key)
{
    push_frame({44}, {0.5f});
    push_error_(WootingAnalogKeyboard::RESULT_DEVICE_DISCONNECTED);

    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    keyboard.initialize();
    EXPECT_FLOAT_EQ(keyboard.read_key(44), 0.5f);
    EXPECT_THROW(keyboard.read_key(44), PollError);
}

TEST_F(AnalogKeyboardTest, shutdown_is_idempotent)
{
    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    keyboard.initialize();

    keyboard.shutdown();
    keyboard.shutdown();
    EXPECT_EQ(uninitialise_calls_(), 1);
    EXPECT_THROW(keyboard.poll(), PollError);
}

TEST_F(AnalogKeyboardTest, destructor_shuts_down)
{
    {
        WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
        keyboard.initialize();
    }
    EXPECT_EQ(uninitialise_calls_(), 1);
}

TEST_F(AnalogKeyboardTest, shutdown_without_initialize)
{
    WootingAnalogKeyboard keyboard(FAKE_ANALOG_SDK_PATH);
    keyboard.shutdown();
    EXPECT_EQ(uninitialise_calls_(), 0);
}
