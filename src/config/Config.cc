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

#include <cstdlib>
#include <libcadence/common/error.hpp>
#include <libcadence/common/macros.hpp>
#include <libcadence/config/entry.hpp>
#include <libcadence/log-macros.hpp>
#include <toml++/toml.hpp>

using Cfg = libcadence::log::CONFIG;

namespace ConfigKeys
{
namespace Api
{
inline constexpr auto Root      = "api";
inline constexpr auto Url       = "url";
inline constexpr auto Key       = "key";
inline constexpr auto Timeout   = "timeout";
inline constexpr auto VerifyTls = "verify_tls";
} // namespace Api

namespace Verify
{
inline constexpr auto Root               = "verify";
inline constexpr auto SkipHashCheck      = "skip_hash_check";
inline constexpr auto ParallelFileChecks = "parallel_file_checks";
} // namespace Verify

namespace Targets
{
inline constexpr auto Root          = "targets";
inline constexpr auto Formats       = "formats";
inline constexpr auto AllowExisting = "allow_existing";
} // namespace Targets

namespace Log
{
inline constexpr auto Root  = "log";
inline constexpr auto Level = "level";
} // namespace Log
} // namespace ConfigKeys

namespace CliKeys
{
inline constexpr auto ApiUrl        = "apiUrl";
inline constexpr auto ApiKey        = "apiKey";
inline constexpr auto SkipHashCheck = "skipHashCheck";
inline constexpr auto Targets       = "targets";
inline constexpr auto AllowExisting = "allowExisting";
inline constexpr auto Sequential    = "sequential";
} // namespace CliKeys

namespace libcadence::config
{

namespace
{

auto parse_level_or_throw(const std::string& value, std::string_view origin) -> log::SeverityLevel
{
  auto level = log::parse_log_level(value);
  if (!level)
    throw Error(ErrorKind::Config, std::format("Unknown log level `{}` ({})", value, origin));
  return *level;
}

auto parse_table(const toml::table& table) -> Config
{
  using namespace ConfigKeys;

  Config config;

  config.api.url = table[Api::Root][Api::Url].value_or(config.api.url);
  config.api.key = table[Api::Root][Api::Key].value_or(config.api.key);
  if (auto timeout = table[Api::Root][Api::Timeout].value<int64_t>())
  {
    if (*timeout <= 0)
      throw Error(ErrorKind::Config, "`api.timeout` must be a positive number of seconds");
    config.api.timeout = std::chrono::seconds(*timeout);
  }
  config.api.verify_tls = table[Api::Root][Api::VerifyTls].value_or(config.api.verify_tls);

  config.verify.skip_hash_check =
    table[Verify::Root][Verify::SkipHashCheck].value_or(config.verify.skip_hash_check);
  config.verify.parallel_file_checks =
    table[Verify::Root][Verify::ParallelFileChecks].value_or(config.verify.parallel_file_checks);

  if (auto formats_array = table[Targets::Root][Targets::Formats].as_array())
  {
    config.targets.clear();
    for (const auto& node : *formats_array)
    {
      auto name = node.value<std::string>();
      if (!name)
        throw Error(ErrorKind::Config, "`targets.formats` must be an array of strings");
      auto target = formats::parse_target_format(*name);
      if (!target)
        throw Error(ErrorKind::Config, std::format("Unknown target format `{}`", *name));
      config.targets.insert(*target);
    }
  }
  config.allow_existing =
    table[Targets::Root][Targets::AllowExisting].value_or(config.allow_existing);

  if (auto level = table[Log::Root][Log::Level].value<std::string>())
    config.log_level = parse_level_or_throw(*level, "config file");

  return config;
}

} // namespace

auto ConfigLoader::default_path() -> std::optional<fs::path>
{
  const auto file = macros::to_string(macros::CONFIG_FILE);

  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return fs::path(xdg) / macros::to_string(macros::CONFIG_XDG_SUBDIR) / file;

  if (const char* home = std::getenv("HOME"); home && *home)
    return fs::path(home) / macros::to_string(macros::CONFIG_REL_DIR) / file;

  return std::nullopt;
}

auto ConfigLoader::load(const std::optional<fs::path>& explicit_path) -> Config
{
  if (explicit_path)
    return from_file(*explicit_path);

  const auto path = default_path();
  std::error_code ec;
  if (!path || !fs::exists(*path, ec))
  {
    log::DBG<Cfg>("No config file found, using defaults");
    return Config{};
  }
  return from_file(*path);
}

auto ConfigLoader::from_file(const fs::path& path) -> Config
{
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    throw Error(ErrorKind::Io, std::format("Config file not found: {}", path.string()));

  try
  {
    auto config = parse_table(toml::parse_file(path.string()));
    log::DBG<Cfg>("Loaded config from {}", path.string());
    return config;
  }
  catch (const toml::parse_error& e)
  {
    throw Error(ErrorKind::Config, std::format("Invalid config file {} (line {}): {}",
                                               path.string(), e.source().begin.line,
                                               std::string(e.description())));
  }
}

auto ConfigLoader::from_string(const std::string& content) -> Config
{
  try
  {
    return parse_table(toml::parse(content));
  }
  catch (const toml::parse_error& e)
  {
    throw Error(ErrorKind::Config, std::format("Invalid config (line {}): {}",
                                               e.source().begin.line,
                                               std::string(e.description())));
  }
}

void ConfigLoader::apply_overrides(Config& config, const utils::cmdline::CmdLineParser& cli)
{
  if (auto url = cli.get<std::string>(CliKeys::ApiUrl))
    config.api.url = *url;
  if (auto key = cli.get<std::string>(CliKeys::ApiKey))
    config.api.key = *key;
  if (auto targets = cli.get<std::string>(CliKeys::Targets))
    config.targets = parse_target_list(*targets);

  config.verify.skip_hash_check =
    cli.get_bool(CliKeys::SkipHashCheck, config.verify.skip_hash_check);
  config.allow_existing = cli.get_bool(CliKeys::AllowExisting, config.allow_existing);
  if (cli.get_bool(CliKeys::Sequential))
    config.verify.parallel_file_checks = false;
}

auto parse_target_list(const std::string& list) -> formats::TargetFormats
{
  formats::TargetFormats targets;
  std::size_t            start = 0;
  while (start <= list.size())
  {
    auto end = list.find(',', start);
    if (end == std::string::npos)
      end = list.size();

    const auto name = list.substr(start, end - start);
    if (!name.empty())
    {
      auto target = formats::parse_target_format(name);
      if (!target)
        throw Error(ErrorKind::Config, std::format("Unknown target format `{}`", name));
      targets.insert(*target);
    }
    start = end + 1;
  }
  return targets;
}

auto resolve_log_level(const std::optional<std::string>& cli_level, const Config& config)
  -> log::SeverityLevel
{
  if (cli_level)
    return parse_level_or_throw(*cli_level, "--logLevel");

  if (const char* env = std::getenv(macros::LOG_LEVEL_ENV.data()); env && *env)
    return parse_level_or_throw(env, macros::LOG_LEVEL_ENV);

  return config.log_level.value_or(log::SeverityLevel::Info);
}

} // namespace libcadence::config
