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

#include <array>
#include <libcadence/api/interface.hpp>
#include <libcadence/common/api/entry.hpp>
#include <libcadence/ffmpeg/stream/interface.hpp>
#include <libcadence/files/interface.hpp>
#include <libcadence/flac/interface.hpp>
#include <libcadence/formats/entry.hpp>
#include <libcadence/naming/interface.hpp>
#include <libcadence/rules/entry.hpp>
#include <libcadence/source/entry.hpp>
#include <libcadence/torrent/interface.hpp>
#include <libcadence/verify/options.hpp>
#include <string>

namespace libcadence::verify
{

// Everything the verifier delegates to. All handles are required.
struct Collaborators
{
  formats::TargetFormatProvider targets;
  files::FileCollectorPtr       collector;
  files::PathEvaluatorPtr       paths;
  flac::TagVerifierPtr          tags;
  ffmpeg::StreamVerifierPtr     streams;
  naming::ShortenerPtr          shortener;
  api::TrackerApiPtr            api;
  torrent::TorrentVerifierPtr   torrent;
};

enum class Phase
{
  Start,
  PolicyChecked,
  FileChecked,
  HashChecked,
  Verdict
};

CADENCE_API auto to_string(Phase phase) -> std::string;

struct VerificationResult
{
  bool         verified = false;
  rules::Rules rules; // every finding, in phase order

  rules::Rules policy;
  rules::Rules files;
  rules::Rules hash;
};

/**
 * @class SourceVerifier
 * @brief Decides whether a source is fit to be transcoded.
 *
 * Runs the policy, file and hash phases strictly in that order. A failing
 * phase never stops the following ones; only skip_hash_check leaves a phase
 * out. The source is verified when no phase produced a rule.
 *
 * Hard errors (libcadence::Error) from any collaborator propagate out of
 * execute() and no verdict is produced.
 */
class CADENCE_API SourceVerifier
{
public:
  SourceVerifier(Collaborators collaborators, VerifyOptions options);

  auto execute(const source::Source& source) const -> VerificationResult;

  [[nodiscard]] auto policy_checks(const source::Source& source) const -> rules::Rules;
  [[nodiscard]] auto file_checks(const source::Source& source) const -> rules::Rules;
  [[nodiscard]] auto hash_check(const source::Source& source) const -> rules::Rules;

  [[nodiscard]] auto options() const -> const VerifyOptions& { return m_options; }

private:
  using PhaseFn = auto (SourceVerifier::*)(const source::Source&) const -> rules::Rules;

  struct PhaseStep
  {
    Phase                                reached;
    const char*                          title;
    PhaseFn                              run;
    rules::Rules VerificationResult::*   slot;
  };

  static const std::array<PhaseStep, 3> Phases;

  Collaborators m_collab;
  VerifyOptions m_options;

  // Tag and stream findings for one file, plus the path check when targets exist
  struct FileOutcome
  {
    bool         path_too_long = false;
    rules::Rules rules;
  };

  auto check_file(const source::Source& source, const formats::TargetFormats& targets,
                  const fs::path& file) const -> FileOutcome;
};

} // namespace libcadence::verify
