/**
 * @file recording_session.hpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @date 2019-07-11
 */

#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <string>

#include <real_time_tools/timer.hpp>

#include "analog_key_logger/csv_sink.hpp"
#include "analog_key_logger/devices/analog_keyboard.hpp"
#include "analog_key_logger/logger_config.hpp"
#include "analog_key_logger/sample_formatter.hpp"

namespace analog_key_logger
{
/**
 * @brief Process exit codes of a session.
 */
enum ExitCode
{
    exit_ok = 0,
    exit_init_error = 1,
    exit_poll_error = 2,
    exit_io_error = 3,
    exit_config_error = 4
};

/**
 * @brief SessionStage lists the states of a recording session. The only
 * transitions are
 * idle -> waiting_for_start -> recording -> stopped,
 * idle -> stopped and waiting_for_start -> stopped.
 */
enum class SessionStage
{
    idle,
    waiting_for_start,
    recording,
    stopped
};

const char* stage_name(const SessionStage& stage);

/**
 * @brief SessionState is everything a session knows about itself.
 */
struct SessionState
{
    SessionState()
        : stage(SessionStage::idle),
          records_written(0),
          last_key_count(-1),
          exit_code(exit_ok)
    {
    }

    SessionStage stage;

    /**
     * @brief device is valid from the waiting_for_start stage on.
     */
    DeviceInfo device;

    /**
     * @brief log_path is empty until the recording starts.
     */
    std::string log_path;

    size_t records_written;

    /**
     * @brief last_key_count is the last key count shown to the user, -1
     * before the first one.
     */
    long last_key_count;

    int exit_code;

    /**
     * @brief error_message is empty after a normal stop.
     */
    std::string error_message;
};

/**
 * @brief RecordingSession drives one logging run: bring the keyboard up,
 * wait for the start key, log one record per tick until the stop key, then
 * release everything.
 *
 * Everything runs in the thread calling run(). request_stop() is the only
 * method which may be called from elsewhere (e.g. a signal handler).
 */
class RecordingSession
{
public:
    /**
     * @brief Construct a new RecordingSession object
     *
     * @param keyboard is shut down by run() on every exit path.
     * @param config
     * @param console receives the user messages.
     * @param error_console receives the error messages.
     */
    RecordingSession(std::shared_ptr<AnalogKeyboardInterface> keyboard,
                     const LoggerConfig& config,
                     std::ostream& console = std::cout,
                     std::ostream& error_console = std::cerr);

    virtual ~RecordingSession();

    /**
     * @brief Run the session to the stopped stage.
     *
     * @return int the exit code, see ExitCode.
     */
    int run();

    /**
     * @brief Ask the session to stop at the top of its next iteration.
     */
    void request_stop();

    const SessionState& get_state() const
    {
        return state_;
    }

protected:
    /**
     * @brief Create the destination of the records. Called once, when the
     * start key is pressed.
     *
     * @return std::shared_ptr<RecordSinkInterface>
     * @throw IoError cannot_create
     */
    virtual std::shared_ptr<RecordSinkInterface> open_sink();

private:
    /**
     * @brief Block until the start key is pressed.
     *
     * @return false if a stop was requested first.
     */
    bool wait_for_start();

    /**
     * @brief Log one record per tick until the stop key or a stop request.
     */
    void record(RecordSinkInterface& sink);

    /**
     * @brief Show the key count if it changed since the last tick.
     */
    void report_key_count(const size_t& count);

    /**
     * @brief Release the keyboard and enter the stopped stage.
     *
     * @return int the exit code.
     */
    int stop(const int& exit_code, const std::string& error_message);

    std::string key_name(const uint16_t& scan_code) const;

    std::shared_ptr<AnalogKeyboardInterface> keyboard_;
    LoggerConfig config_;
    SampleFormatter formatter_;
    std::ostream& console_;
    std::ostream& error_console_;
    SessionState state_;

    /**
     * @brief stop_requested_ is set by request_stop().
     */
    std::atomic<bool> stop_requested_;

    /**
     * @brief tick_timer_ measures the duration of the recording ticks.
     */
    real_time_tools::Timer tick_timer_;
};

}  // namespace analog_key_logger
