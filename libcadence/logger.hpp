#pragma once
/********************************************************************************
 *                               Cadence Project                                *
 *                         Lossless Source Verification                         *
 *                                                                              *
 *  Copyright (c) 2025 Oinkognito                                               *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <algorithm>
#include <cctype>
#include <boost/filesystem/operations.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/regex.hpp>
#include <boost/thread.hpp>
#include <chrono>
#include <format>
#include <iostream>
#include <map>
#include <optional>
#include <string>

#include <libcadence/common/api/entry.hpp>

/*
 * Boost.Log based logger for Cadence.
 *
 * Every log line carries a category tag (VERIFY, TAGS, ...). Console output is
 * colored, the rotating file sink under ~/.cache/cadence/logs gets the same
 * lines with the ANSI escapes stripped.
 */

// Force ANSI Colors (Ignoring Terminal Themes)
#define RESET  "\033[0m\033[39m\033[49m" // Reset all styles and colors
#define BOLD   "\033[1m"                 // Bold text
#define RED    "\033[38;5;124m"          // Gruvbox Red (#cc241d)
#define GREEN  "\033[38;5;142m"          // Gruvbox Green (#98971a)
#define YELLOW "\033[38;5;214m"          // Gruvbox Yellow (#d79921)
#define BLUE   "\033[38;5;109m"          // Gruvbox Blue (#458588)
#define PURPLE "\033[38;5;141m"          // Gruvbox Purple (#b16286) -> For TRACE logs

constexpr const char* ANSI_REGEX    = "\033\\[[0-9;]*m";
constexpr const char* REL_PATH_LOGS = ".cache/cadence/logs";

#define FILENAME \
  (__builtin_strrchr(__FILE__, '/') ? __builtin_strrchr(__FILE__, '/') + 1 : __FILE__)

#define LOG_FMT(str) BOLD str RESET

#define LOG_CATEGORIES               \
  X(NONE, "")                        \
  X(MAIN, "#MAIN_LOG     ")          \
  X(CONFIG, "#CONFIG_LOG   ")        \
  X(SOURCE, "#SOURCE_LOG   ")        \
  X(VERIFY, "#VERIFY_LOG   ")        \
  X(POLICY, "#POLICY_LOG   ")        \
  X(FILES, "#FILES_LOG    ")         \
  X(PATHS, "#PATHS_LOG    ")         \
  X(TAGS, "#TAGS_LOG     ")          \
  X(STREAM, "#STREAM_LOG   ")        \
  X(NAMING, "#NAMING_LOG   ")        \
  X(API, "#API_LOG      ")           \
  X(NET, "#NETWORK_LOG  ")           \
  X(TORRENT, "#TORRENT_LOG  ")

namespace libcadence::log
{

// Category tags: log::INFO<log::VERIFY>("...")
#define X(name, str)                                  \
  struct name                                         \
  {                                                   \
    static constexpr const char* prefix = LOG_FMT(str); \
  };
LOG_CATEGORIES
#undef X
#undef LOG_FMT

template <typename Tag> constexpr auto log_prefix() -> const char* { return Tag::prefix; }

// In priority order
enum class SeverityLevel
{
  Error,
  Warning,
  Info,
  Debug,
  Trace
};

inline auto parse_log_level(std::string value) -> std::optional<SeverityLevel>
{
  std::ranges::transform(value, value.begin(), [](unsigned char c) { return std::tolower(c); });

  static const std::map<std::string, SeverityLevel> names = {
    {"error", SeverityLevel::Error}, {"warn", SeverityLevel::Warning},
    {"warning", SeverityLevel::Warning}, {"info", SeverityLevel::Info},
    {"debug", SeverityLevel::Debug}, {"trace", SeverityLevel::Trace},
  };

  auto it = names.find(value);
  if (it == names.end())
    return std::nullopt;
  return it->second;
}

inline auto strip_ansi(const std::string& input) -> std::string
{
  static const boost::regex ansi_regex(ANSI_REGEX);
  return boost::regex_replace(input, ansi_regex, "");
}

inline auto get_current_timestamp() -> std::string
{
  using namespace std::chrono;

  auto now      = system_clock::now();
  auto now_time = floor<seconds>(now); // truncate to seconds
  auto now_ms   = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

  return std::format("{:%Y-%m-%d %H:%M:%S}.{:03}", now_time, now_ms.count());
}

inline void init_logging(bool with_file_sink = true)
{
  namespace bfs     = boost::filesystem;
  namespace logging = boost::log;
  namespace trivial = boost::log::trivial;
  namespace sinks   = boost::log::sinks;
  namespace expr    = boost::log::expressions;
  namespace kw      = boost::log::keywords;

  auto console_sink = logging::add_console_log(std::clog);
  console_sink->set_formatter(
    [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm)
    {
      auto severity = rec[trivial::severity];
      strm << BOLD << "[" << get_current_timestamp() << "] ";
      switch (severity ? severity.get() : trivial::info)
      {
        case trivial::trace:
          strm << PURPLE << "[TRACE]   ";
          break;
        case trivial::debug:
          strm << BLUE << "[DEBUG]   ";
          break;
        case trivial::info:
          strm << GREEN << "[INFO]    ";
          break;
        case trivial::warning:
          strm << YELLOW << "[WARN]    ";
          break;
        default:
          strm << RED << "[ERROR]   ";
          break;
      }
      strm << RESET << rec[expr::smessage];
    });
  boost::log::add_common_attributes();

  if (!with_file_sink)
    return;

  const char* home = std::getenv("HOME");
  if (!home)
  {
    std::cerr << "WARNING: Unable to determine HOME directory, file logging disabled.\n";
    return;
  }

  bfs::path                 log_dir = bfs::path(home) / REL_PATH_LOGS;
  boost::system::error_code ec;
  bfs::create_directories(log_dir, ec);
  if (ec)
  {
    std::cerr << "WARNING: Failed to create log directory: " << log_dir.string() << " ("
              << ec.message() << ")\n";
    return;
  }

  std::string log_file = (log_dir / "cadence_%Y-%m-%d_%H-%M-%S.log").string();

  // File logging (without ANSI codes)
  using text_sink = sinks::synchronous_sink<sinks::text_file_backend>;
  boost::shared_ptr<text_sink> file_sink =
    boost::make_shared<text_sink>(kw::file_name     = log_file,
                                  kw::rotation_size = 10 * 1024 * 1024, // 10 MB
                                  kw::auto_flush    = true);

  file_sink->set_formatter(
    [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm)
    {
      auto        severity    = rec[trivial::severity];
      auto        message_ref = rec[expr::smessage];
      std::string message     = message_ref ? message_ref.get() : "";

      strm << "[" << get_current_timestamp() << "] " << (severity ? severity.get() : trivial::info)
           << " " << strip_ansi(message);
    });

  boost::log::core::get()->add_sink(file_sink);
}

inline void flush_logs() { boost::log::core::get()->flush(); }

inline void set_log_level(SeverityLevel level)
{
  namespace trivial = boost::log::trivial;

  static const std::map<SeverityLevel, trivial::severity_level> level_map = {
    {SeverityLevel::Error, trivial::error}, {SeverityLevel::Warning, trivial::warning},
    {SeverityLevel::Info, trivial::info},   {SeverityLevel::Debug, trivial::debug},
    {SeverityLevel::Trace, trivial::trace},
  };

  auto it = level_map.find(level);
  if (it != level_map.end())
  {
    boost::log::core::get()->set_filter(trivial::severity >= it->second);
  }
  else
  {
    std::cerr << "Unknown log level specified.\n";
  }
}

// Macros for logging
#define THREAD_ID    BOLD << "[Worker " << boost::this_thread::get_id() << "] " << RESET
#define _TRACE_BACK_ "[" << FILENAME << ":" << __LINE__ << " - " << __func__ << "] "

#define LOG_TRACE   BOOST_LOG_TRIVIAL(trace) << _TRACE_BACK_
#define LOG_INFO    BOOST_LOG_TRIVIAL(info)
#define LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR   BOOST_LOG_TRIVIAL(error)
#define LOG_DEBUG   BOOST_LOG_TRIVIAL(debug)

// Async logging macros (include thread ID)
#define LOG_TRACE_ASYNC   BOOST_LOG_TRIVIAL(trace) << THREAD_ID << _TRACE_BACK_
#define LOG_INFO_ASYNC    BOOST_LOG_TRIVIAL(info) << THREAD_ID
#define LOG_WARNING_ASYNC BOOST_LOG_TRIVIAL(warning) << THREAD_ID
#define LOG_ERROR_ASYNC   BOOST_LOG_TRIVIAL(error) << THREAD_ID
#define LOG_DEBUG_ASYNC   BOOST_LOG_TRIVIAL(debug) << THREAD_ID

} // namespace libcadence::log
