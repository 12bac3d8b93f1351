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

#include <libcadence/ffmpeg/stream/entry.hpp>
#include <libcadence/files/entry.hpp>
#include <libcadence/flac/tags.hpp>
#include <libcadence/naming/entry.hpp>
#include <libcadence/torrent/entry.hpp>
#include <libcadence/verify/defaults.hpp>

namespace libcadence::verify
{

auto make_default_collaborators(formats::TargetFormatProvider targets,
                                const api::ApiOptions&        api_options) -> Collaborators
{
  return Collaborators{
    .targets   = std::move(targets),
    .collector = std::make_shared<files::FlacCollector>(),
    .paths     = std::make_shared<files::TranscodePathEvaluator>(),
    .tags      = std::make_shared<flac::TagVerifier>(),
    .streams   = std::make_shared<ffmpeg::StreamVerifier>(),
    .shortener = std::make_shared<naming::LogShortener>(),
    .api       = std::make_shared<api::GazelleApi>(api_options),
    .torrent   = std::make_shared<torrent::TorrentVerifier>(),
  };
}

} // namespace libcadence::verify
