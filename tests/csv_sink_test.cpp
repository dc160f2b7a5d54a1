#include <gtest/gtest.h>

#include <dirent.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <sstream>

#include <analog_key_logger/csv_sink.hpp>

using namespace analog_key_logger;

/**
 * @brief Every test gets a fresh directory.
 */
class CsvSinkTest : public ::testing::Test
{
protected:
    void SetUp()
    {
        char pattern[] = "/tmp/csv_sink_test_XXXXXX";
        ASSERT_NE(mkdtemp(pattern), nullptr);
        directory_ = pattern;
    }

    void TearDown()
    {
        DIR* dir = opendir(directory_.c_str());
        if (dir != nullptr)
        {
            struct dirent* entry;
            while ((entry = readdir(dir)) != nullptr)
            {
                std::string name(entry->d_name);
                if (name != "." && name != "..")
                {
                    unlink((directory_ + "/" + name).c_str());
                }
            }
            closedir(dir);
        }
        rmdir(directory_.c_str());
    }

    std::string read_file(const std::string& path)
    {
        std::ifstream file(path.c_str());
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }

    LogRecord make_record(const std::string& time_stamp,
                          size_t count,
                          const std::string& entries)
    {
        LogRecord record;
        record.time_stamp = time_stamp;
        record.count = count;
        record.entries = entries;
        return record;
    }

    std::string directory_;
};

TEST_F(CsvSinkTest, file_name)
{
    struct tm date = {};
    date.tm_year = 2024 - 1900;
    date.tm_mon = 2;
    date.tm_mday = 7;
    date.tm_hour = 9;
    date.tm_min = 5;
    date.tm_sec = 3;
    date.tm_isdst = -1;
    time_t start_time = mktime(&date);

    EXPECT_EQ(CsvSink::make_file_name("wooting_log_", start_time),
              "wooting_log_20240307_090503.csv");
    EXPECT_EQ(CsvSink::make_file_name("wooting_log_", start_time, 2),
              "wooting_log_20240307_090503_2.csv");
}

TEST_F(CsvSinkTest, records_are_appended_in_order)
{
    std::string path;
    {
        CsvSink sink(directory_);
        path = sink.get_path();
        EXPECT_EQ(path.find(directory_ + "/wooting_log_"), 0u);
        EXPECT_TRUE(sink.is_open());

        sink.append(make_record("12.5", 2, "30|0.75|44|1.0"));
        sink.append(make_record("12.501", 0, ""));
        sink.append(make_record("12.502", 1, "41|1.0"));
        EXPECT_EQ(sink.get_record_count(), 3u);
    }

    EXPECT_EQ(read_file(path),
              "12.5\t2\t30|0.75|44|1.0\n"
              "12.501\t0\t\n"
              "12.502\t1\t41|1.0\n");
}

TEST_F(CsvSinkTest, records_are_on_disk_before_close)
{
    CsvSink sink(directory_, "session_");
    sink.append(make_record("3.0", 0, ""));
    EXPECT_EQ(read_file(sink.get_path()), "3.0\t0\t\n");
}

TEST_F(CsvSinkTest, sessions_never_share_a_file)
{
    CsvSink first(directory_);
    CsvSink second(directory_);
    CsvSink third(directory_);
    EXPECT_NE(first.get_path(), second.get_path());
    EXPECT_NE(first.get_path(), third.get_path());
    EXPECT_NE(second.get_path(), third.get_path());

    first.append(make_record("1.0", 0, ""));
    second.append(make_record("2.0", 0, ""));
    EXPECT_EQ(read_file(first.get_path()), "1.0\t0\t\n");
    EXPECT_EQ(read_file(second.get_path()), "2.0\t0\t\n");
}

TEST_F(CsvSinkTest, cannot_create)
{
    try
    {
        CsvSink sink(directory_ + "/missing/folder");
        FAIL() << "the sink should not open";
    }
    catch (const IoError& e)
    {
        EXPECT_EQ(e.kind(), IoError::cannot_create);
    }
}

TEST_F(CsvSinkTest, close_is_idempotent)
{
    CsvSink sink(directory_);
    sink.append(make_record("1.0", 0, ""));
    sink.close();
    sink.close();
    EXPECT_FALSE(sink.is_open());

    try
    {
        sink.append(make_record("2.0", 0, ""));
        FAIL() << "append() should fail on a closed sink";
    }
    catch (const IoError& e)
    {
        EXPECT_EQ(e.kind(), IoError::write_failed);
    }
    EXPECT_EQ(read_file(sink.get_path()), "1.0\t0\t\n");
}
