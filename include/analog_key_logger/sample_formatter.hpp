/**
 * @file sample_formatter.hpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @date 2019-07-11
 */

#pragma once

#include <string>

#include "analog_key_logger/reading.hpp"

namespace analog_key_logger
{
/**
 * @brief LogRecord is the text form of one Reading: a time stamp, the number
 * of active keys and the keys themselves as
 * scan_code_1|value_1|scan_code_2|value_2|...
 */
struct LogRecord
{
    LogRecord() : count(0), field_separator('\t')
    {
    }

    std::string time_stamp;
    size_t count;
    std::string entries;
    char field_separator;

    /**
     * @brief The three fields joined by the field separator, without line
     * terminator.
     */
    std::string str() const;
};

/**
 * @brief SampleFormatter serializes Readings into LogRecords.
 */
class SampleFormatter
{
public:
    /**
     * @brief Separator between the scan codes and values of the third field.
     */
    static const char ENTRY_SEPARATOR = '|';

    /**
     * @brief Construct a new SampleFormatter object
     *
     * @param field_separator goes between the three fields of a record, it
     * must differ from ENTRY_SEPARATOR.
     */
    explicit SampleFormatter(char field_separator = '\t');

    /**
     * @brief Serialize one reading. The same reading always gives the same
     * record.
     *
     * @param reading
     * @return LogRecord
     */
    LogRecord format(const Reading& reading) const;

    char field_separator() const
    {
        return field_separator_;
    }

    /**
     * @brief Shortest decimal text that reads back to the same double.
     * Integral values keep a trailing ".0".
     */
    static std::string format_number(double value);

    /**
     * @brief Shortest decimal text that reads back to the same float.
     */
    static std::string format_number(float value);

private:
    char field_separator_;
};

}  // namespace analog_key_logger
