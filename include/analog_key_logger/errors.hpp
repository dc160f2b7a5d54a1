/**
 * @file errors.hpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @date 2019-07-11
 */

#pragma once

#include <stdexcept>
#include <string>

namespace analog_key_logger
{
/**
 * @brief InitError is thrown when the keyboard SDK cannot be brought up.
 */
class InitError : public std::runtime_error
{
public:
    /**
     * @brief Kind lists why the initialization failed.
     */
    enum Kind
    {
        library_not_found,
        no_device
    };

    InitError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    Kind kind() const
    {
        return kind_;
    }

private:
    Kind kind_;
};

/**
 * @brief PollError is thrown when the device stops answering mid-session.
 */
class PollError : public std::runtime_error
{
public:
    enum Kind
    {
        device_disconnected
    };

    PollError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    Kind kind() const
    {
        return kind_;
    }

private:
    Kind kind_;
};

/**
 * @brief IoError is thrown by the record sinks.
 */
class IoError : public std::runtime_error
{
public:
    enum Kind
    {
        cannot_create,
        write_failed
    };

    IoError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    Kind kind() const
    {
        return kind_;
    }

private:
    Kind kind_;
};

/**
 * @brief ConfigError is thrown for an invalid command line.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

}  // namespace analog_key_logger
