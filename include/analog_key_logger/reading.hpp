/**
 * @file reading.hpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @date 2019-07-11
 */

#pragma once

#include <stdint.h>

#include <vector>

namespace analog_key_logger
{
/**
 * @brief KeyState is one active key: its code and how far it is pressed.
 */
struct KeyState
{
    KeyState() : scan_code(0), analog_value(0.f)
    {
    }

    KeyState(uint16_t code, float value) : scan_code(code), analog_value(value)
    {
    }

    /**
     * @brief scan_code identifies the physical key, its meaning depends on
     * the keycode mode of the device (HID usage code by default).
     */
    uint16_t scan_code;

    /**
     * @brief analog_value is the normalized travel of the key, between 0.0
     * (released) and 1.0 (fully pressed).
     */
    float analog_value;
};

/**
 * @brief Reading is one time stamped snapshot of all the keys pressed at a
 * given instant. It is not modified once created.
 */
class Reading
{
public:
    /**
     * @brief Construct an empty Reading (no key pressed).
     *
     * @param time_stamp in seconds.
     */
    explicit Reading(const double& time_stamp) : time_stamp_(time_stamp)
    {
    }

    /**
     * @brief Construct a new Reading object
     *
     * @param time_stamp in seconds.
     * @param entries in the order the device returned them.
     */
    Reading(const double& time_stamp, const std::vector<KeyState>& entries)
        : time_stamp_(time_stamp), entries_(entries)
    {
    }

    /**
     * Getters
     */

    /**
     * @brief Get the time stamp
     *
     * @return const double& in seconds
     */
    const double& get_time_stamp() const
    {
        return time_stamp_;
    }

    /**
     * @brief Get the active keys
     *
     * @return const std::vector<KeyState>&
     */
    const std::vector<KeyState>& get_entries() const
    {
        return entries_;
    }

    /**
     * @brief Number of active keys.
     */
    size_t size() const
    {
        return entries_.size();
    }

    /**
     * @brief Check whether a key is part of this snapshot.
     *
     * @param scan_code
     * @return true if the key is pressed.
     */
    bool contains(uint16_t scan_code) const
    {
        for (size_t i = 0; i < entries_.size(); i++)
        {
            if (entries_[i].scan_code == scan_code)
            {
                return true;
            }
        }
        return false;
    }

private:
    /**
     * @brief the time stamp.
     */
    double time_stamp_;

    /**
     * @brief the active keys.
     */
    std::vector<KeyState> entries_;
};

}  // namespace analog_key_logger
