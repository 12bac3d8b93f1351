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

#include <filesystem>
#include <libcadence/api/entry.hpp>
#include <libcadence/common/api/entry.hpp>
#include <libcadence/formats/entry.hpp>
#include <libcadence/logger.hpp>
#include <libcadence/utils/cmd-line/parser.hpp>
#include <libcadence/verify/options.hpp>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace libcadence::config
{

/**
 * @struct Config
 * @brief Settings read from config.toml, then overridden from the command line.
 */
struct Config
{
  api::ApiOptions                   api;
  verify::VerifyOptions             verify;
  formats::TargetFormats            targets        = formats::all_targets();
  bool                              allow_existing = false;
  std::optional<log::SeverityLevel> log_level; // unset: decided by resolve_log_level()
};

class CADENCE_API ConfigLoader
{
public:
  // $XDG_CONFIG_HOME/cadence/config.toml, else $HOME/.config/cadence/config.toml
  static auto default_path() -> std::optional<fs::path>;

  // An explicitly named file must exist; the default one may be absent
  static auto load(const std::optional<fs::path>& explicit_path) -> Config;

  static auto from_file(const fs::path& path) -> Config;
  static auto from_string(const std::string& content) -> Config;

  // --apiUrl, --apiKey, --skipHashCheck, --targets, --allowExisting, --sequential
  static void apply_overrides(Config& config, const utils::cmdline::CmdLineParser& cli);
};

/**
 * Log level priority: --logLevel, then the CADENCE_LOG_LEVEL environment
 * variable, then the config file, then info. Unknown names are a Config
 * error.
 */
CADENCE_API auto resolve_log_level(const std::optional<std::string>& cli_level,
                                   const Config&                      config) -> log::SeverityLevel;

// "flac,320,v0"
CADENCE_API auto parse_target_list(const std::string& list) -> formats::TargetFormats;

} // namespace libcadence::config
