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

#include <exception>
#include <libcadence/common/error.hpp>
#include <libcadence/common/macros.hpp>
#include <libcadence/log-macros.hpp>
#include <libcadence/verify/entry.hpp>
#include <numeric>
#include <tbb/parallel_for_each.h>

using Verify = libcadence::log::VERIFY;
using Policy = libcadence::log::POLICY;
using Files  = libcadence::log::FILES;

namespace libcadence::verify
{

const std::array<SourceVerifier::PhaseStep, 3> SourceVerifier::Phases = {{
  {Phase::PolicyChecked, "policy checks", &SourceVerifier::policy_checks,
   &VerificationResult::policy},
  {Phase::FileChecked, "file checks", &SourceVerifier::file_checks, &VerificationResult::files},
  {Phase::HashChecked, "hash check", &SourceVerifier::hash_check, &VerificationResult::hash},
}};

auto to_string(Phase phase) -> std::string
{
  switch (phase)
  {
    case Phase::Start:
      return "Start";
    case Phase::PolicyChecked:
      return "PolicyChecked";
    case Phase::FileChecked:
      return "FileChecked";
    case Phase::HashChecked:
      return "HashChecked";
    case Phase::Verdict:
      return "Verdict";
  }
  return "Unknown";
}

SourceVerifier::SourceVerifier(Collaborators collaborators, VerifyOptions options)
    : m_collab(std::move(collaborators)), m_options(options)
{
  auto require = [](bool present, const char* what)
  {
    if (!present)
      throw Error(ErrorKind::Config, std::format("Source verifier is missing its {}", what));
  };

  require(m_collab.collector != nullptr, "file collector");
  require(m_collab.paths != nullptr, "path evaluator");
  require(m_collab.tags != nullptr, "tag verifier");
  require(m_collab.streams != nullptr, "stream verifier");
  require(m_collab.shortener != nullptr, "naming shortener");
  require(m_collab.api != nullptr, "tracker API");
  require(m_collab.torrent != nullptr, "torrent verifier");
}

auto SourceVerifier::policy_checks(const source::Source& source) const -> rules::Rules
{
  rules::Rules found;

  if (source.torrent.scene)
    found.emplace_back(rules::SceneNotSupported{});

  // An approval flag that is explicitly set counts, not a missing one
  if (source.torrent.lossy_master_approved.value_or(false))
    found.emplace_back(rules::LossyMasterNeedsApproval{});

  if (source.torrent.lossy_web_approved.value_or(false))
    found.emplace_back(rules::LossyWebNeedsApproval{});

  const auto targets = m_collab.targets.get(source.format, source.existing);
  if (targets.empty())
    found.emplace_back(rules::NoTranscodeFormats{});

  log::TRACE<Policy>("{} eligible target(s) for {}", targets.size(), source);
  return found;
}

auto SourceVerifier::check_file(const source::Source& source, const formats::TargetFormats& targets,
                                const fs::path& file) const -> FileOutcome
{
  FileOutcome outcome;

  if (!targets.empty())
  {
    auto max_path = m_collab.paths->max_output_path(source, targets, file);
    if (max_path.size() > MAX_PATH_LENGTH)
    {
      outcome.path_too_long = true;
      outcome.rules.emplace_back(rules::PathTooLong{std::move(max_path)});
    }
  }

  auto tag_rules = m_collab.tags->check(file, source.metadata);
  outcome.rules.insert(outcome.rules.end(), std::make_move_iterator(tag_rules.begin()),
                       std::make_move_iterator(tag_rules.end()));

  auto stream_rules = m_collab.streams->check(file);
  outcome.rules.insert(outcome.rules.end(), std::make_move_iterator(stream_rules.begin()),
                       std::make_move_iterator(stream_rules.end()));

  return outcome;
}

auto SourceVerifier::file_checks(const source::Source& source) const -> rules::Rules
{
  std::error_code ec;
  if (!fs::is_directory(source.directory, ec))
    return {rules::SourceDirectoryNotFound{source.directory.string()}};

  const auto files = m_collab.collector->find_audio_files(source.directory);
  if (files.empty())
    return {rules::NoFlacFiles{source.directory.string()}};

  const auto targets = m_collab.targets.get(source.format, source.existing);

  std::vector<FileOutcome>        outcomes(files.size());
  std::vector<std::exception_ptr> errors(files.size());

  auto run_one = [&](std::size_t idx)
  {
    try
    {
      outcomes[idx] = check_file(source, targets, files[idx]);
    }
    catch (...)
    {
      errors[idx] = std::current_exception();
    }
  };

  if (m_options.parallel_file_checks && files.size() > 1)
  {
    log::DBG<Files>("Checking {} file(s) in parallel", files.size());
    std::vector<std::size_t> indices(files.size());
    std::iota(indices.begin(), indices.end(), 0);
    tbb::parallel_for_each(indices.begin(), indices.end(), run_one);
  }
  else
  {
    for (std::size_t idx = 0; idx < files.size(); ++idx)
      run_one(idx);
  }

  // First failure in file order wins so that reruns report the same error
  for (const auto& error : errors)
  {
    if (error)
      std::rethrow_exception(error);
  }

  rules::Rules found;
  bool         any_too_long = false;
  for (std::size_t idx = 0; idx < files.size(); ++idx)
  {
    auto& outcome = outcomes[idx];
    if (outcome.path_too_long)
    {
      any_too_long = true;
      m_collab.shortener->suggest_track(files[idx]);
    }
    found.insert(found.end(), std::make_move_iterator(outcome.rules.begin()),
                 std::make_move_iterator(outcome.rules.end()));
  }

  if (any_too_long)
    m_collab.shortener->suggest_album(source);

  return found;
}

auto SourceVerifier::hash_check(const source::Source& source) const -> rules::Rules
{
  if (m_options.skip_hash_check)
  {
    log::DBG<Verify>("Hash check skipped for {}", source);
    return {};
  }

  // the API handle serialises its own fetches
  auto descriptor = m_collab.api->fetch_torrent(source.torrent.id).get();
  return m_collab.torrent->verify(descriptor, source.directory).get();
}

auto SourceVerifier::execute(const source::Source& source) const -> VerificationResult
{
  VerificationResult result;
  Phase              phase = Phase::Start;

  log::INFO<Verify>("Verifying {}", source);

  for (const auto& step : Phases)
  {
    auto& slot = result.*(step.slot);
    slot       = (this->*(step.run))(source);
    phase      = step.reached;

    if (slot.empty())
    {
      log::DBG<Verify>("Passed {} {}", step.title, source);
    }
    else
    {
      log::DBG<Verify>("Failed {} {}", step.title, source);
      for (const auto& rule : slot)
        log::DBG<Verify>("⚠ {}", rule);
    }
    log::TRACE<Verify>("Reached {}", to_string(phase));

    result.rules.insert(result.rules.end(), slot.begin(), slot.end());
  }

  phase           = Phase::Verdict;
  result.verified = result.rules.empty();

  if (result.verified)
  {
    log::INFO<Verify>("Verified {}", source);
  }
  else
  {
    log::WARN<Verify>("Skipped {}", source);
    for (const auto& rule : result.rules)
      log::WARN<Verify>("{}", rule);
  }
  log::TRACE<Verify>("Reached {}", to_string(phase));

  return result;
}

} // namespace libcadence::verify
