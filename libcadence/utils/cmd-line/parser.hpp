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
#include <charconv>
#include <iostream>
#include <libcadence/common/api/entry.hpp>
#include <libcadence/common/error.hpp>
#include <libcadence/log-macros.hpp>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace libcadence::utils::cmdline
{

struct CmdArg
{
  std::vector<std::string> keys;
  std::string              description;

  CmdArg(std::initializer_list<std::string> k, std::string desc)
      : keys(k), description(std::move(desc))
  {
  }
};

/**
 * @class CmdLineParser
 * @brief `--key=value` / `--flag` command line reader.
 *
 * Every lookup marks its key as consumed so that leftovers can be reported by
 * warn_unknown_args(). Malformed arguments and unparsable values throw a
 * Config error.
 */
class CADENCE_API CmdLineParser
{
public:
  explicit CmdLineParser(std::span<char* const> argv)
  {
    for (size_t i = 1; i < argv.size(); ++i)
    {
      std::string arg = argv[i];
      if (arg == "-h")
      {
        m_args["help"] = "true";
        continue;
      }

      if (!arg.starts_with("--") || arg.size() == 2)
        throw Error(ErrorKind::Config, "Invalid argument format: " + arg);

      size_t eq_pos = arg.find('=');
      if (eq_pos != std::string::npos)
        m_args[arg.substr(2, eq_pos - 2)] = arg.substr(eq_pos + 1);
      else
        m_args[arg.substr(2)] = "true"; // boolean flag
    }
  }

  void register_arg(const CmdArg& arg) { m_registeredArgs.push_back(arg); }

  void register_args(std::initializer_list<CmdArg> args)
  {
    for (const auto& a : args)
      register_arg(a);
  }

  template <typename T> auto get(const std::string& key) const -> std::optional<T>
  {
    m_accessedKeys.insert(key);
    auto it = m_args.find(key);
    if (it == m_args.end())
      return std::nullopt;

    auto value = parse_value<T>(it->second);
    if (!value)
      throw Error(ErrorKind::Config,
                  std::format("Invalid value for --{}: `{}`", key, it->second));
    return value;
  }

  template <typename T> auto get_or(const std::string& key, T fallback) const -> T
  {
    return get<T>(key).value_or(std::move(fallback));
  }

  [[nodiscard]] auto has(const std::string& key) const -> bool
  {
    m_accessedKeys.insert(key);
    return m_args.contains(key);
  }

  [[nodiscard]] auto get_bool(const std::string& key, bool default_value = false) const -> bool
  {
    m_accessedKeys.insert(key);
    auto it = m_args.find(key);
    if (it == m_args.end())
      return default_value;
    return is_truthy(it->second);
  }

  // Returns true when every argument given was looked up at least once
  [[nodiscard]] auto warn_unknown_args() const -> bool
  {
    bool clean = true;
    for (const auto& [key, val] : m_args)
    {
      if (!m_accessedKeys.contains(key))
      {
        log::WARN<log::MAIN>("Unrecognized command line argument: --{}{}", key,
                             val != "true" ? "=" + val : std::string{});
        clean = false;
      }
    }
    return clean;
  }

  void print_usage(std::string_view program) const
  {
    std::cout << "Usage: " << program << " [options]\n\nOptions:\n";
    for (const auto& arg : m_registeredArgs)
    {
      std::string aliases;
      for (const auto& k : arg.keys)
        aliases += "--" + k + ", ";
      if (!aliases.empty())
        aliases.erase(aliases.size() - 2);

      std::cout << "  " << aliases << "\n      " << arg.description << "\n";
    }
  }

private:
  std::map<std::string, std::string> m_args;
  mutable std::set<std::string>      m_accessedKeys;
  std::vector<CmdArg>                m_registeredArgs;

  static auto is_truthy(std::string val) -> bool
  {
    std::ranges::transform(val, val.begin(), [](unsigned char c) { return std::tolower(c); });
    return val == "true" || val == "1" || val == "yes";
  }

  template <typename T> static auto parse_value(const std::string& s) -> std::optional<T>
  {
    if constexpr (std::is_same_v<T, std::string>)
    {
      return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      return is_truthy(s);
    }
    else if constexpr (std::is_integral_v<T>)
    {
      T out{};
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
      if (ec == std::errc() && ptr == s.data() + s.size())
        return out;
      return std::nullopt;
    }
    else
    {
      static_assert(sizeof(T) == 0, "unsupported command line value type");
    }
  }
};

} // namespace libcadence::utils::cmdline
