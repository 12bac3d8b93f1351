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
#include <libcadence/common/types.hpp>
#include <libcadence/formats/entry.hpp>
#include <libcadence/source/entry.hpp>
#include <memory>
#include <vector>

namespace libcadence::files
{

class IFileCollector
{
public:
  virtual ~IFileCollector() = default;

  // Every audio file below `directory`, in a stable order. Empty if there are none.
  virtual auto find_audio_files(const fs::path& directory) -> std::vector<fs::path> = 0;
};

class IPathEvaluator
{
public:
  virtual ~IPathEvaluator() = default;

  // Longest sub-path any transcode of `file` would occupy across `targets`
  virtual auto max_output_path(const source::Source& source, const formats::TargetFormats& targets,
                               const fs::path& file) -> SubPath = 0;
};

using FileCollectorPtr = std::shared_ptr<IFileCollector>;
using PathEvaluatorPtr = std::shared_ptr<IPathEvaluator>;

} // namespace libcadence::files
