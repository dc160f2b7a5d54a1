/**
 * @file csv_sink.hpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @date 2019-07-11
 */

#pragma once

#include <stdio.h>
#include <time.h>

#include <string>

#include "analog_key_logger/errors.hpp"
#include "analog_key_logger/sample_formatter.hpp"

namespace analog_key_logger
{
/**
 * @brief RecordSinkInterface is an abstract destination for LogRecords.
 * Records are kept in the order they are appended.
 */
class RecordSinkInterface
{
public:
    virtual ~RecordSinkInterface()
    {
    }

    /**
     * @brief Write one record.
     *
     * @param record
     * @throw IoError write_failed
     */
    virtual void append(const LogRecord& record) = 0;

    /**
     * @brief Flush and release the destination. Idempotent.
     */
    virtual void close() = 0;

    /**
     * @brief Get where the records go.
     */
    virtual const std::string& get_path() const = 0;

    /**
     * @brief Get the number of records appended so far.
     */
    virtual size_t get_record_count() const = 0;
};

/**
 * @brief CsvSink writes the records to a new file, one line per record.
 */
class CsvSink : public RecordSinkInterface
{
public:
    /**
     * @brief Create the file <directory>/<prefix><YYYYmmdd_HHMMSS>.csv. If
     * a file with this name exists a _1, _2, ... suffix is added, an
     * existing file is never opened.
     *
     * @param directory must exist.
     * @param prefix of the file name.
     * @throw IoError cannot_create
     */
    CsvSink(const std::string& directory,
            const std::string& prefix = "wooting_log_");

    /**
     * @brief Destroy the CsvSink object, closing the file.
     */
    virtual ~CsvSink();

    virtual void append(const LogRecord& record);

    virtual void close();

    virtual const std::string& get_path() const
    {
        return path_;
    }

    virtual size_t get_record_count() const
    {
        return record_count_;
    }

    bool is_open() const
    {
        return file_ != nullptr;
    }

    /**
     * @brief Build the file name used for a session started at a given time.
     *
     * @param prefix
     * @param start_time in seconds since the epoch, local time is used.
     * @param attempt 0 for the plain name, n > 0 adds the _n suffix.
     * @return std::string
     */
    static std::string make_file_name(const std::string& prefix,
                                      const time_t& start_time,
                                      const int& attempt = 0);

    CsvSink(const CsvSink&) = delete;
    CsvSink& operator=(const CsvSink&) = delete;

private:
    FILE* file_;
    std::string path_;
    size_t record_count_;
};

}  // namespace analog_key_logger
