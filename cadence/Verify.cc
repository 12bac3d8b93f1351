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

#include <autogen/config.h>
#include <libcadence/common/error.hpp>
#include <libcadence/common/macros.hpp>
#include <libcadence/config/entry.hpp>
#include <libcadence/log-macros.hpp>
#include <libcadence/source/entry.hpp>
#include <libcadence/utils/cmd-line/parser.hpp>
#include <libcadence/verify/defaults.hpp>
#include <span>

extern "C"
{
#include <libavutil/log.h>
}

/*
 * @NOTE:
 *
 * FFmpeg reports through av_log() on stderr, which would interleave with our
 * own log lines. Unless `--avDbgLog` is given only its critical errors are
 * let through.
 *
 */

namespace lclog = libcadence::log;
using Main      = lclog::MAIN;

namespace cmdline = libcadence::utils::cmdline;

void DBG_AVlogCheck(const bool& avdebug_mode)
{
  if (avdebug_mode)
  {
    lclog::INFO<Main>("-- AV Debug mode enabled: AV_LOG will output verbose logs.");
    av_log_set_level(AV_LOG_DEBUG);
  }
  else
  {
    av_log_set_level(AV_LOG_QUIET);
  }
}

void register_args(cmdline::CmdLineParser& cli)
{
  cli.register_args({
    {{"source"}, "Source manifest (TOML) describing the release to verify [required]"},
    {{"config"}, "Config file (default: $XDG_CONFIG_HOME/cadence/config.toml)"},
    {{"skipHashCheck"}, "Do not download the torrent and skip the hash check"},
    {{"apiUrl"}, "Tracker base URL, e.g. https://redacted.sh"},
    {{"apiKey"}, "Tracker API key"},
    {{"targets"}, "Comma separated transcode targets: flac,320,v0"},
    {{"allowExisting"}, "Keep targets that already exist on the tracker"},
    {{"sequential"}, "Check files one at a time instead of in parallel"},
    {{"logLevel"}, "error | warn | info | debug | trace"},
    {{"avDbgLog"}, "Let FFmpeg log verbosely"},
    {{"help", "h"}, "Show this help"},
  });
}

auto run(const cmdline::CmdLineParser& cli) -> int
{
  const auto source_manifest = cli.get<std::string>("source");
  const auto config_path     = cli.get<std::string>("config");
  const auto log_level       = cli.get<std::string>("logLevel");

  std::optional<fs::path> explicit_config;
  if (config_path)
    explicit_config = *config_path;

  auto config = libcadence::config::ConfigLoader::load(explicit_config);
  libcadence::config::ConfigLoader::apply_overrides(config, cli);

  lclog::set_log_level(libcadence::config::resolve_log_level(log_level, config));
  DBG_AVlogCheck(cli.get_bool("avDbgLog"));

  if (!cli.warn_unknown_args())
    return CADENCE_RET_FAIL;

  if (!source_manifest)
  {
    lclog::ERROR<Main>("Missing --source=<manifest.toml>. See --help.");
    return CADENCE_RET_FAIL;
  }

  const auto source = libcadence::source::SourceLoader::from_file(*source_manifest);
  lclog::DBG<Main>("Verifying {} in {}", source, source.directory.string());

  libcadence::formats::TargetFormatProvider targets(config.targets, config.allow_existing);
  libcadence::verify::SourceVerifier        verifier(
    libcadence::verify::make_default_collaborators(std::move(targets), config.api), config.verify);

  const auto result = verifier.execute(source);
  return result.verified ? CADENCE_RET_SUC : CADENCE_RET_REJECTED;
}

auto main(int argc, char* argv[]) -> int
{
  INIT_CADENCE_LOGGER(true);
  lclog::set_log_level(lclog::SeverityLevel::Info);

  int ret = CADENCE_RET_FAIL;
  try
  {
    cmdline::CmdLineParser cli(std::span<char* const>(argv, argc));
    register_args(cli);

    if (cli.has("help"))
    {
      std::cout << CADENCE_PROJECT_NAME << " " << CADENCE_VERSION_STR << "\n\n";
      cli.print_usage(argv[0]);
      return CADENCE_RET_SUC;
    }

    ret = run(cli);
  }
  catch (const libcadence::Error& e)
  {
    lclog::ERROR<Main>("{}", e.what());
    lclog::DBG<Main>("Stack trace:\n{}", e.trace());
    ret = CADENCE_RET_FAIL;
  }
  catch (const std::exception& e)
  {
    lclog::ERROR<Main>("Unexpected failure: {}", e.what());
    ret = CADENCE_RET_FAIL;
  }

  lclog::flush_logs();
  return ret;
}
