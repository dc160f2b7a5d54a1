#include <gtest/gtest.h>

#include <sstream>

#include <analog_key_logger/sample_formatter.hpp>

using namespace analog_key_logger;

namespace
{
std::vector<std::string> split(const std::string& text, char separator)
{
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream iss(text);
    while (std::getline(iss, token, separator))
    {
        tokens.push_back(token);
    }
    if (!text.empty() && text[text.size() - 1] == separator)
    {
        tokens.push_back("");
    }
    return tokens;
}

}  // namespace

TEST(sample_formatter, two_keys)
{
    SampleFormatter formatter;
    Reading reading(12.5, {KeyState(30, 0.75f), KeyState(44, 1.0f)});

    LogRecord record = formatter.format(reading);
    EXPECT_EQ(record.time_stamp, "12.5");
    EXPECT_EQ(record.count, 2u);
    EXPECT_EQ(record.entries, "30|0.75|44|1.0");
    EXPECT_EQ(record.str(), "12.5\t2\t30|0.75|44|1.0");
}

TEST(sample_formatter, no_key)
{
    SampleFormatter formatter;
    LogRecord record = formatter.format(Reading(3.0));

    EXPECT_EQ(record.count, 0u);
    EXPECT_EQ(record.entries, "");
    EXPECT_EQ(record.str(), "3.0\t0\t");
}

TEST(sample_formatter, count_matches_the_entries)
{
    SampleFormatter formatter;
    std::vector<KeyState> keys;
    for (uint16_t code = 4; code < 30; code++)
    {
        LogRecord record = formatter.format(Reading(1.0, keys));
        EXPECT_EQ(record.count, keys.size());
        if (keys.empty())
        {
            EXPECT_TRUE(record.entries.empty());
        }
        else
        {
            EXPECT_EQ(split(record.entries, SampleFormatter::ENTRY_SEPARATOR)
                          .size(),
                      2 * record.count);
        }
        keys.push_back(KeyState(code, code / 64.f));
    }
}

TEST(sample_formatter, entries_keep_the_device_order)
{
    SampleFormatter formatter;
    Reading reading(7.25,
                    {KeyState(44, 0.5f), KeyState(4, 0.125f),
                     KeyState(30, 0.0f)});
    EXPECT_EQ(formatter.format(reading).entries, "44|0.5|4|0.125|30|0.0");
}

TEST(sample_formatter, field_separator)
{
    SampleFormatter formatter(',');
    Reading reading(12.5, {KeyState(30, 0.75f)});
    EXPECT_EQ(formatter.format(reading).str(), "12.5,1,30|0.75");
    EXPECT_EQ(split(formatter.format(Reading(3.0)).str(), ',').size(), 3u);

    EXPECT_THROW(SampleFormatter('|'), std::invalid_argument);
}

TEST(sample_formatter, same_reading_same_record)
{
    SampleFormatter formatter;
    Reading reading(1.5, {KeyState(26, 0.3f)});
    EXPECT_EQ(formatter.format(reading).str(), formatter.format(reading).str());
}

TEST(sample_formatter, float_values_are_printed_short)
{
    EXPECT_EQ(SampleFormatter::format_number(0.3f), "0.3");
    EXPECT_EQ(SampleFormatter::format_number(0.1f), "0.1");
    EXPECT_EQ(SampleFormatter::format_number(1.0f), "1.0");
    EXPECT_EQ(SampleFormatter::format_number(0.0f), "0.0");
    EXPECT_EQ(SampleFormatter::format_number(0.007843138f), "0.007843138");
}

TEST(sample_formatter, time_stamps_keep_their_precision)
{
    EXPECT_EQ(SampleFormatter::format_number(12.5), "12.5");
    EXPECT_EQ(SampleFormatter::format_number(3.0), "3.0");
    EXPECT_EQ(SampleFormatter::format_number(1760000000.0), "1760000000.0");
    EXPECT_EQ(SampleFormatter::format_number(1760000000.125), "1760000000.125");
    EXPECT_EQ(SampleFormatter::format_number(0.1), "0.1");
    EXPECT_EQ(SampleFormatter::format_number(1e-05), "1e-05");
}
