/**
 * @file recording_session.cpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @brief The control loop of the key logger.
 */

#include <sstream>

#include <real_time_tools/spinner.hpp>

#include <analog_key_logger/recording_session.hpp>

namespace analog_key_logger
{
namespace
{
/**
 * @brief Shuts the keyboard down when leaving the scope, whatever the exit
 * path.
 */
class KeyboardReleaser
{
public:
    explicit KeyboardReleaser(AnalogKeyboardInterface& keyboard)
        : keyboard_(keyboard)
    {
    }

    ~KeyboardReleaser()
    {
        keyboard_.shutdown();
    }

private:
    AnalogKeyboardInterface& keyboard_;
};

/**
 * @brief Closes a sink when leaving the scope.
 */
class SinkCloser
{
public:
    explicit SinkCloser(RecordSinkInterface& sink) : sink_(sink)
    {
    }

    ~SinkCloser()
    {
        sink_.close();
    }

private:
    RecordSinkInterface& sink_;
};

}  // namespace

const char* stage_name(const SessionStage& stage)
{
    switch (stage)
    {
        case SessionStage::idle:
            return "idle";
        case SessionStage::waiting_for_start:
            return "waiting for start";
        case SessionStage::recording:
            return "recording";
        case SessionStage::stopped:
            return "stopped";
    }
    return "unknown";
}

RecordingSession::RecordingSession(
    std::shared_ptr<AnalogKeyboardInterface> keyboard,
    const LoggerConfig& config,
    std::ostream& console,
    std::ostream& error_console)
    : keyboard_(keyboard),
      config_(config),
      formatter_(config.field_separator),
      console_(console),
      error_console_(error_console),
      stop_requested_(false)
{
    tick_timer_.set_memory_size(1000);
    tick_timer_.set_name("recording tick");
}

RecordingSession::~RecordingSession()
{
}

int RecordingSession::run()
{
    KeyboardReleaser releaser(*keyboard_);

    // idle ----------------------------------------------------------------
    try
    {
        state_.device = keyboard_->initialize();
    }
    catch (const InitError& e)
    {
        return stop(exit_init_error, e.what());
    }

    // waiting for start ---------------------------------------------------
    state_.stage = SessionStage::waiting_for_start;
    console_ << "> Found " << state_.device.describe() << std::endl;
    console_ << "> Press <" << key_name(config_.start_key)
             << "> to begin recording, <" << key_name(config_.stop_key)
             << "> to exit" << std::endl;

    try
    {
        if (!wait_for_start())
        {
            return stop(exit_ok, "");
        }

        std::shared_ptr<RecordSinkInterface> sink = open_sink();
        SinkCloser closer(*sink);

        // recording -------------------------------------------------------
        state_.stage = SessionStage::recording;
        state_.log_path = sink->get_path();
        console_ << "> Recording to: " << state_.log_path << std::endl;

        record(*sink);
    }
    catch (const PollError& e)
    {
        return stop(exit_poll_error, e.what());
    }
    catch (const IoError& e)
    {
        return stop(exit_io_error, e.what());
    }

    return stop(exit_ok, "");
}

void RecordingSession::request_stop()
{
    stop_requested_ = true;
}

std::shared_ptr<RecordSinkInterface> RecordingSession::open_sink()
{
    return std::make_shared<CsvSink>(config_.output_directory,
                                     config_.file_prefix);
}

bool RecordingSession::wait_for_start()
{
    real_time_tools::Spinner spinner;
    spinner.set_period(config_.period);
    while (!stop_requested_)
    {
        if (keyboard_->read_key(config_.start_key) > 0.f)
        {
            return true;
        }
        spinner.spin();
    }
    return false;
}

void RecordingSession::record(RecordSinkInterface& sink)
{
    real_time_tools::Spinner spinner;
    spinner.set_period(config_.period);
    tick_timer_.tic();
    while (!stop_requested_)
    {
        Reading reading = keyboard_->poll();
        report_key_count(reading.size());

        // the reading holding the stop key is logged as well
        sink.append(formatter_.format(reading));
        state_.records_written = sink.get_record_count();
        tick_timer_.tac_tic();

        if (reading.contains(config_.stop_key))
        {
            break;
        }
        spinner.spin();
    }
}

void RecordingSession::report_key_count(const size_t& count)
{
    if (static_cast<long>(count) == state_.last_key_count)
    {
        return;
    }
    state_.last_key_count = static_cast<long>(count);
    console_ << count << (count == 1 ? " key" : " keys") << " pressed ("
             << state_.records_written << " records)" << std::endl;
}

int RecordingSession::stop(const int& exit_code,
                           const std::string& error_message)
{
    keyboard_->shutdown();

    const SessionStage last_stage = state_.stage;
    state_.stage = SessionStage::stopped;
    state_.exit_code = exit_code;
    state_.error_message = error_message;

    if (!error_message.empty())
    {
        error_console_ << "ERROR: " << error_message << std::endl;
    }
    if (!state_.log_path.empty())
    {
        console_ << "> Recorded " << state_.records_written
                 << " data points to " << state_.log_path << std::endl;
        if (state_.records_written > 1)
        {
            tick_timer_.print_statistics();
        }
    }
    console_ << "> Stopped in the " << stage_name(last_stage) << " stage"
             << std::endl;
    return exit_code;
}

std::string RecordingSession::key_name(const uint16_t& scan_code) const
{
    if (config_.keycode_mode == KeycodeMode::hid)
    {
        if (scan_code == SCAN_CODE_SPACE)
        {
            return "Space";
        }
        if (scan_code == SCAN_CODE_ESC)
        {
            return "Esc";
        }
    }
    std::ostringstream oss;
    oss << "key " << scan_code;
    return oss.str();
}

}  // namespace analog_key_logger
