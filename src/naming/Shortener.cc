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
#include <array>
#include <cctype>
#include <libcadence/log-macros.hpp>
#include <libcadence/naming/entry.hpp>

using Naming = libcadence::log::NAMING;

namespace libcadence::naming
{

namespace
{

constexpr std::array<std::string_view, 3> FEATURE_MARKERS = {" feat. ", " ft. ", " featuring "};

auto lowercase(std::string_view value) -> std::string
{
  std::string out(value);
  std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

auto collapse_whitespace(std::string_view value) -> std::string
{
  std::string out;
  bool        pending_space = false;
  for (char c : value)
  {
    if (std::isspace(static_cast<unsigned char>(c)))
    {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space)
      out.push_back(' ');
    pending_space = false;
    out.push_back(c);
  }
  return out;
}

// Removes "( ... )" and "[ ... ]" groups, nesting included
auto strip_brackets(std::string_view value) -> std::string
{
  std::string out;
  int         depth = 0;
  for (char c : value)
  {
    if (c == '(' || c == '[')
    {
      ++depth;
      continue;
    }
    if ((c == ')' || c == ']') && depth > 0)
    {
      --depth;
      continue;
    }
    if (depth == 0)
      out.push_back(c);
  }
  return out;
}

auto strip_features(std::string value) -> std::string
{
  const auto lower = lowercase(value);
  auto       cut   = std::string::npos;
  for (auto marker : FEATURE_MARKERS)
    cut = std::min(cut, lower.find(marker));
  if (cut != std::string::npos)
    value.erase(cut);
  return value;
}

auto propose(std::string_view original, std::string candidate) -> std::optional<std::string>
{
  candidate = collapse_whitespace(candidate);
  while (!candidate.empty() && (candidate.back() == '-' || candidate.back() == ' '))
    candidate.pop_back();

  if (candidate.empty() || candidate.size() >= original.size())
    return std::nullopt;
  return candidate;
}

} // namespace

auto shorten_title(std::string_view title) -> std::optional<std::string>
{
  return propose(title, strip_features(strip_brackets(title)));
}

auto shorten_album(std::string_view album) -> std::optional<std::string>
{
  std::string base(album);
  if (auto colon = base.find(": "); colon != std::string::npos && colon > 0)
    base.erase(colon);
  return propose(album, strip_features(strip_brackets(base)));
}

void LogShortener::suggest_track(const fs::path& file)
{
  const auto stem = file.stem().string();
  if (auto shorter = shorten_title(stem))
  {
    log::INFO<Naming>("Consider renaming track '{}' to '{}{}'", file.filename().string(),
                      *shorter, file.extension().string());
    return;
  }
  log::WARN<Naming>("Unable to suggest a shorter name for track '{}'", file.filename().string());
}

void LogShortener::suggest_album(const source::Source& source)
{
  const auto& album = source.metadata.album;
  if (auto shorter = shorten_album(album))
  {
    log::INFO<Naming>("Consider shortening album title '{}' to '{}'", album, *shorter);
    return;
  }
  log::WARN<Naming>("Unable to suggest a shorter album title for '{}'", album);
}

} // namespace libcadence::naming
