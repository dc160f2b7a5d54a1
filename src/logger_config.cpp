/**
 * @file logger_config.cpp
 * @license License BSD-3-Clause
 * @copyright Copyright (c) 2019, New York University and Max Planck
 * Gesellschaft.
 * @brief Command line of the logging programs.
 */

#include <errno.h>
#include <getopt.h>
#include <stdlib.h>
#include <string.h>

#include <sstream>

#include <analog_key_logger/logger_config.hpp>

namespace analog_key_logger
{
namespace
{
long parse_integer(const std::string& option,
                   const char* text,
                   long min_value,
                   long max_value)
{
    char* end = nullptr;
    errno = 0;
    long value = strtol(text, &end, 0);
    if (errno != 0 || end == text || *end != '\0' || value < min_value ||
        value > max_value)
    {
        std::ostringstream oss;
        oss << "invalid value '" << text << "' for " << option
            << ", expected an integer in [" << min_value << ", " << max_value
            << "]";
        throw ConfigError(oss.str());
    }
    return value;
}

uint16_t parse_key_code(const std::string& option, const char* text)
{
    return static_cast<uint16_t>(parse_integer(option, text, 1, 0xffff));
}

double parse_period(const char* text)
{
    char* end = nullptr;
    errno = 0;
    double value = strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0' || !(value > 0.0))
    {
        throw ConfigError(std::string("invalid period '") + text +
                          "', expected a positive number of seconds");
    }
    return value;
}

char parse_separator(const char* text)
{
    std::string name(text);
    if (name == "tab" || name == "\\t")
    {
        return '\t';
    }
    if (name == "comma")
    {
        return ',';
    }
    // the separator must not appear in a number, an entry or a line end
    if (name.size() != 1 ||
        strchr("|\n\r.+-eE0123456789", name[0]) != nullptr)
    {
        throw ConfigError("invalid delimiter '" + name +
                          "', expected 'tab', 'comma' or a single character "
                          "which is neither a digit, '.', '+', '-', 'e', "
                          "'|' nor a line break");
    }
    return name[0];
}

}  // namespace

LoggerConfig::LoggerConfig()
    : library_path("libwooting_analog_wrapper.so"),
      output_directory("."),
      file_prefix("wooting_log_"),
      period(0.001),
      buffer_size(64),
      keycode_mode(KeycodeMode::hid),
      start_key(SCAN_CODE_SPACE),
      stop_key(SCAN_CODE_ESC),
      field_separator('\t'),
      show_help(false)
{
}

KeycodeMode parse_keycode_mode(const std::string& name)
{
    if (name == "hid")
    {
        return KeycodeMode::hid;
    }
    if (name == "scancode1")
    {
        return KeycodeMode::scancode1;
    }
    if (name == "virtualkey")
    {
        return KeycodeMode::virtual_key;
    }
    if (name == "virtualkey-translate")
    {
        return KeycodeMode::virtual_key_translate;
    }
    throw ConfigError("unknown keycode mode '" + name + "'");
}

LoggerConfig parse_command_line(int argc, char** argv)
{
    static const struct option long_options[] = {
        {"library", required_argument, nullptr, 'l'},
        {"output-dir", required_argument, nullptr, 'o'},
        {"prefix", required_argument, nullptr, 'p'},
        {"period", required_argument, nullptr, 't'},
        {"buffer-size", required_argument, nullptr, 'b'},
        {"keycode-mode", required_argument, nullptr, 'm'},
        {"exclude", required_argument, nullptr, 'x'},
        {"start-key", required_argument, nullptr, 's'},
        {"stop-key", required_argument, nullptr, 'e'},
        {"delimiter", required_argument, nullptr, 'd'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    LoggerConfig config;

    // getopt keeps its position in globals, start over on every call
    optind = 0;
    opterr = 0;
    int opt;
    while ((opt = getopt_long(
                argc, argv, ":l:o:p:t:b:m:x:s:e:d:h", long_options, nullptr)) !=
           -1)
    {
        switch (opt)
        {
            case 'l':
                config.library_path = optarg;
                break;
            case 'o':
                config.output_directory = optarg;
                break;
            case 'p':
                config.file_prefix = optarg;
                break;
            case 't':
                config.period = parse_period(optarg);
                break;
            case 'b':
                config.buffer_size = static_cast<size_t>(
                    parse_integer("--buffer-size", optarg, 1, 4096));
                break;
            case 'm':
                config.keycode_mode = parse_keycode_mode(optarg);
                break;
            case 'x':
                config.excluded_keys.push_back(
                    parse_key_code("--exclude", optarg));
                break;
            case 's':
                config.start_key = parse_key_code("--start-key", optarg);
                break;
            case 'e':
                config.stop_key = parse_key_code("--stop-key", optarg);
                break;
            case 'd':
                config.field_separator = parse_separator(optarg);
                break;
            case 'h':
                config.show_help = true;
                break;
            case ':':
                throw ConfigError(std::string("missing value for ") +
                                  argv[optind - 1]);
            default:
                throw ConfigError(std::string("unknown option ") +
                                  argv[optind - 1]);
        }
    }

    if (optind < argc)
    {
        throw ConfigError(std::string("unexpected argument ") + argv[optind]);
    }
    if (config.start_key == config.stop_key)
    {
        throw ConfigError("the start and stop keys must differ");
    }
    for (size_t i = 0; i < config.excluded_keys.size(); i++)
    {
        if (config.excluded_keys[i] == config.stop_key)
        {
            throw ConfigError("the stop key cannot be excluded");
        }
    }
    return config;
}

std::string usage(const std::string& program_name)
{
    std::ostringstream oss;
    oss << "Usage: " << program_name << " [options]\n"
        << "Record the analog key states of a keyboard to a CSV file.\n"
        << "Press the start key (Space) to begin, the stop key (Esc) to end.\n"
        << "\n"
        << "  -l, --library PATH        SDK wrapper library "
           "(libwooting_analog_wrapper.so)\n"
        << "  -o, --output-dir DIR      directory of the log file (.)\n"
        << "  -p, --prefix PREFIX       log file name prefix (wooting_log_)\n"
        << "  -t, --period SECONDS      polling period (0.001)\n"
        << "  -b, --buffer-size N       max keys read per poll (64)\n"
        << "  -m, --keycode-mode MODE   hid, scancode1, virtualkey or "
           "virtualkey-translate (hid)\n"
        << "  -x, --exclude CODE        do not log this key, repeatable\n"
        << "  -s, --start-key CODE      key starting the recording (44)\n"
        << "  -e, --stop-key CODE       key ending the recording (41)\n"
        << "  -d, --delimiter CHAR      field separator: tab, comma or one "
           "character (tab)\n"
        << "  -h, --help                print this help\n";
    return oss.str();
}

}  // namespace analog_key_logger
