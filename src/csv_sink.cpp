/**
 * @file csv_sink.cpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @brief File destination of the log records.
 */

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <sstream>

#include <analog_key_logger/csv_sink.hpp>
#include <analog_key_logger/utils/os_interface.hpp>

namespace analog_key_logger
{
namespace
{
/**
 * @brief Give up looking for a free file name after this many attempts.
 */
const int MAX_NAME_ATTEMPTS = 1000;

}  // namespace

CsvSink::CsvSink(const std::string& directory, const std::string& prefix)
    : file_(nullptr), record_count_(0)
{
    std::string folder = directory.empty() ? std::string(".") : directory;
    if (folder[folder.size() - 1] != '/')
    {
        folder += '/';
    }

    time_t start_time = time(nullptr);
    int fd = -1;
    for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; attempt++)
    {
        path_ = folder + make_file_name(prefix, start_time, attempt);
        fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (fd != -1 || errno != EEXIST)
        {
            break;
        }
    }

    if (fd == -1)
    {
        std::ostringstream oss;
        oss << "cannot create log file " << path_ << ": " << strerror(errno);
        throw IoError(IoError::cannot_create, oss.str());
    }

    file_ = fdopen(fd, "w");
    if (file_ == nullptr)
    {
        std::ostringstream oss;
        oss << "cannot open a stream on " << path_ << ": " << strerror(errno);
        ::close(fd);
        throw IoError(IoError::cannot_create, oss.str());
    }
}

CsvSink::~CsvSink()
{
    close();
}

void CsvSink::append(const LogRecord& record)
{
    if (file_ == nullptr)
    {
        throw IoError(IoError::write_failed,
                      "cannot write to " + path_ + ", the file is closed");
    }

    std::string line = record.str();
    line += '\n';
    size_t written = fwrite(line.data(), 1, line.size(), file_);
    // every record reaches the disk before the next tick
    if (written != line.size() || fflush(file_) != 0)
    {
        std::ostringstream oss;
        oss << "writing to " << path_ << " failed: " << strerror(errno);
        throw IoError(IoError::write_failed, oss.str());
    }
    record_count_++;
}

void CsvSink::close()
{
    if (file_ == nullptr)
    {
        return;
    }
    if (fclose(file_) != 0)
    {
        rt_fprintf(
            stderr, "closing %s: %s\n", path_.c_str(), strerror(errno));
    }
    file_ = nullptr;
}

std::string CsvSink::make_file_name(const std::string& prefix,
                                    const time_t& start_time,
                                    const int& attempt)
{
    struct tm local_time;
    localtime_r(&start_time, &local_time);
    char date[32];
    strftime(date, sizeof(date), "%Y%m%d_%H%M%S", &local_time);

    std::ostringstream oss;
    oss << prefix << date;
    if (attempt > 0)
    {
        oss << "_" << attempt;
    }
    oss << ".csv";
    return oss.str();
}

}  // namespace analog_key_logger
