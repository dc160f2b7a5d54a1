/**
 * @file sample_formatter.cpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @brief Text serialization of the keyboard readings.
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

#include <analog_key_logger/sample_formatter.hpp>

namespace analog_key_logger
{
namespace
{
double parse_double(const char* text)
{
    return strtod(text, nullptr);
}

float parse_float(const char* text)
{
    return strtof(text, nullptr);
}

/**
 * @brief Find the fewest significant digits that survive a round trip and
 * print them in positional notation for exponents in [-4, 16), scientific
 * notation otherwise.
 */
template <typename Type>
std::string shortest_decimal(Type value,
                             int max_digits,
                             Type (*parse)(const char*))
{
    char buffer[64];
    if (!std::isfinite(value))
    {
        snprintf(buffer, sizeof(buffer), "%g", double(value));
        return buffer;
    }

    int digits = 1;
    while (digits < max_digits)
    {
        snprintf(buffer, sizeof(buffer), "%.*e", digits - 1, double(value));
        if (parse(buffer) == value)
        {
            break;
        }
        digits++;
    }
    snprintf(buffer, sizeof(buffer), "%.*e", digits - 1, double(value));

    int exponent = atoi(strchr(buffer, 'e') + 1);
    if (exponent < -4 || exponent >= 16)
    {
        return buffer;
    }

    int decimals = digits - 1 - exponent;
    if (decimals < 0)
    {
        decimals = 0;
    }
    snprintf(buffer, sizeof(buffer), "%.*f", decimals, double(value));
    std::string text(buffer);
    if (decimals == 0)
    {
        text += ".0";
    }
    return text;
}

}  // namespace

const char SampleFormatter::ENTRY_SEPARATOR;

std::string LogRecord::str() const
{
    std::ostringstream oss;
    oss << time_stamp << field_separator << count << field_separator
        << entries;
    return oss.str();
}

SampleFormatter::SampleFormatter(char field_separator)
    : field_separator_(field_separator)
{
    if (field_separator_ == ENTRY_SEPARATOR || field_separator_ == '\n')
    {
        throw std::invalid_argument(
            "the field separator cannot be '|' or a new line");
    }
}

LogRecord SampleFormatter::format(const Reading& reading) const
{
    LogRecord record;
    record.field_separator = field_separator_;
    record.time_stamp = format_number(reading.get_time_stamp());
    record.count = reading.size();

    const std::vector<KeyState>& entries = reading.get_entries();
    for (size_t i = 0; i < entries.size(); i++)
    {
        if (i > 0)
        {
            record.entries += ENTRY_SEPARATOR;
        }
        std::ostringstream code;
        code << entries[i].scan_code;
        record.entries += code.str();
        record.entries += ENTRY_SEPARATOR;
        record.entries += format_number(entries[i].analog_value);
    }
    return record;
}

std::string SampleFormatter::format_number(double value)
{
    return shortest_decimal<double>(value, 17, &parse_double);
}

std::string SampleFormatter::format_number(float value)
{
    return shortest_decimal<float>(value, 9, &parse_float);
}

}  // namespace analog_key_logger
