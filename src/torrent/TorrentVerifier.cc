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
#include <fstream>
#include <libcadence/common/error.hpp>
#include <libcadence/common/macros.hpp>
#include <libcadence/log-macros.hpp>
#include <libcadence/torrent/bencode.hpp>
#include <libcadence/torrent/entry.hpp>
#include <libcadence/torrent/sha1.hpp>
#include <numeric>

using Torrent = libcadence::log::TORRENT;

namespace libcadence::torrent
{

namespace
{

namespace InfoKeys
{
inline const std::string Info        = "info";
inline const std::string Name        = "name";
inline const std::string PieceLength = "piece length";
inline const std::string Pieces      = "pieces";
inline const std::string Length      = "length";
inline const std::string Files       = "files";
inline const std::string Path        = "path";
} // namespace InfoKeys

constexpr std::size_t MaxListedFiles = 5;

[[noreturn]] void malformed(std::string_view what)
{
  throw Error(ErrorKind::Torrent, std::format("Malformed torrent descriptor: {}", what));
}

auto require_int(const bencode::Value& dict, const std::string& key) -> bencode::Integer
{
  const auto* value = dict.find(key);
  if (!value || !value->is_int())
    malformed(std::format("`{}` must be an integer", key));
  return *value->as_int();
}

auto require_string(const bencode::Value& dict, const std::string& key) -> const std::string&
{
  const auto* value = dict.find(key);
  if (!value || !value->is_string())
    malformed(std::format("`{}` must be a string", key));
  return *value->as_string();
}

auto require_length(const bencode::Value& dict) -> ByteCount
{
  const auto length = require_int(dict, InfoKeys::Length);
  if (length < 0)
    malformed("negative file length");
  return static_cast<ByteCount>(length);
}

// Path components must stay inside the content root
auto is_safe_component(const std::string& part) -> bool
{
  return !part.empty() && part != "." && part != ".." && part.find('/') == std::string::npos &&
         part.find('\0') == std::string::npos;
}

auto parse_file_list(const bencode::List& list) -> std::vector<TorrentFileEntry>
{
  std::vector<TorrentFileEntry> files;
  files.reserve(list.size());

  for (const auto& item : list)
  {
    if (!item.is_dict())
      malformed("`files` entries must be dictionaries");

    const auto* path_value = item.find(InfoKeys::Path);
    if (!path_value || !path_value->is_list() || path_value->as_list()->empty())
      malformed("`files` entry without a `path` list");

    fs::path path;
    for (const auto& part : *path_value->as_list())
    {
      if (!part.is_string() || !is_safe_component(*part.as_string()))
        malformed("unsafe or invalid path component");
      path /= *part.as_string();
    }

    files.push_back({std::move(path), require_length(item)});
  }

  if (files.empty())
    malformed("empty `files` list");
  return files;
}

auto join_limited(const std::vector<std::string>& names) -> std::string
{
  std::string out;
  for (std::size_t i = 0; i < names.size() && i < MaxListedFiles; ++i)
  {
    if (i > 0)
      out += ", ";
    out += names[i];
  }
  if (names.size() > MaxListedFiles)
    out += std::format(" and {} more", names.size() - MaxListedFiles);
  return out;
}

} // namespace

auto TorrentDescriptor::total_size() const -> ByteCount
{
  return std::accumulate(files.begin(), files.end(), ByteCount{0},
                         [](ByteCount sum, const TorrentFileEntry& f) { return sum + f.length; });
}

auto TorrentDescriptor::content_path(const fs::path& directory, const TorrentFileEntry& file) const
  -> fs::path
{
  return directory / file.path;
}

auto parse_descriptor(std::span<const TorrentByte> data) -> TorrentDescriptor
{
  const auto root = bencode::decode(data);
  if (!root.is_dict())
    malformed("top level value is not a dictionary");

  const auto* info = root.find(InfoKeys::Info);
  if (!info || !info->is_dict())
    malformed("missing `info` dictionary");

  TorrentDescriptor descriptor;
  descriptor.name = require_string(*info, InfoKeys::Name);

  const auto piece_length = require_int(*info, InfoKeys::PieceLength);
  if (piece_length <= 0)
    malformed("`piece length` must be positive");
  descriptor.piece_length = static_cast<ByteCount>(piece_length);

  const auto& pieces = require_string(*info, InfoKeys::Pieces);
  if (pieces.size() % SHA1Size != 0)
    malformed("`pieces` is not a multiple of 20 bytes");
  for (std::size_t off = 0; off < pieces.size(); off += SHA1Size)
  {
    Sha1Digest digest{};
    std::copy_n(reinterpret_cast<const ui8*>(pieces.data()) + off, SHA1Size, digest.begin());
    descriptor.pieces.push_back(digest);
  }

  const auto* files = info->find(InfoKeys::Files);
  if (files)
  {
    if (!files->is_list())
      malformed("`files` must be a list");
    descriptor.files      = parse_file_list(*files->as_list());
    descriptor.multi_file = true;
  }
  else
  {
    if (!is_safe_component(descriptor.name))
      malformed("unsafe single file name");
    descriptor.files.push_back({fs::path(descriptor.name), require_length(*info)});
  }

  const auto total    = descriptor.total_size();
  const auto expected = (total + descriptor.piece_length - 1) / descriptor.piece_length;
  if (descriptor.pieces.size() != expected)
    malformed(std::format("{} piece hash(es) for {} bytes of content at piece length {}",
                          descriptor.pieces.size(), total, descriptor.piece_length));

  // info hash is taken over the exact bytes of the encoded dictionary
  const auto raw_info  = bencode::raw_value(data, InfoKeys::Info);
  descriptor.info_hash = Sha1Hasher::digest(*raw_info);

  return descriptor;
}

auto ContentCheck::summary() const -> std::string
{
  std::string out = std::format("{} of {} piece(s) failed", failed_pieces, total_pieces);
  if (!missing_files.empty())
    out += std::format("; missing: {}", join_limited(missing_files));
  if (!size_mismatches.empty())
    out += std::format("; size mismatch: {}", join_limited(size_mismatches));
  return out;
}

auto check_content(const TorrentDescriptor& descriptor, const fs::path& directory) -> ContentCheck
{
  ContentCheck result;
  result.total_pieces = descriptor.pieces.size();

  const auto&       files = descriptor.files;
  std::vector<bool> unusable(files.size(), false);

  for (std::size_t i = 0; i < files.size(); ++i)
  {
    const auto      path = descriptor.content_path(directory, files[i]);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
      result.missing_files.push_back(files[i].path.generic_string());
      unusable[i] = true;
      continue;
    }

    const auto size = fs::file_size(path, ec);
    if (ec || size != files[i].length)
    {
      result.size_mismatches.push_back(files[i].path.generic_string());
      unusable[i] = true;
    }
  }

  const auto        total = descriptor.total_size();
  std::vector<char> buffer(CADENCE_IO_CHUNK_SIZE);
  std::ifstream     stream;
  std::size_t       open_idx = files.size();
  std::size_t       file_idx = 0;
  ByteCount         file_off = 0;

  for (PieceIdx piece = 0; piece < descriptor.pieces.size(); ++piece)
  {
    const auto piece_begin = piece * descriptor.piece_length;
    ByteCount  remaining   = std::min(descriptor.piece_length, total - piece_begin);
    bool       failed      = false;
    Sha1Hasher hasher;

    while (remaining > 0)
    {
      // zero length files occupy no bytes of any piece
      while (file_off == files[file_idx].length)
      {
        ++file_idx;
        file_off = 0;
      }

      const auto& file  = files[file_idx];
      const auto  chunk = std::min(remaining, file.length - file_off);

      if (unusable[file_idx])
      {
        failed = true;
      }
      else
      {
        if (open_idx != file_idx)
        {
          stream.close();
          stream.open(descriptor.content_path(directory, file), std::ios::binary);
          if (!stream)
            throw Error(ErrorKind::Io, std::format("Unable to open {}", file.path.string()));
          stream.seekg(static_cast<std::streamoff>(file_off));
          open_idx = file_idx;
        }

        for (ByteCount left = chunk; left > 0;)
        {
          const auto want = std::min<ByteCount>(left, buffer.size());
          stream.read(buffer.data(), static_cast<std::streamsize>(want));
          if (static_cast<ByteCount>(stream.gcount()) != want)
            throw Error(ErrorKind::Io, std::format("Short read from {}", file.path.string()));
          hasher.update(std::span(reinterpret_cast<const ui8*>(buffer.data()), want));
          left -= want;
        }
      }

      file_off += chunk;
      remaining -= chunk;
    }

    if (failed || hasher.finish() != descriptor.pieces[piece])
    {
      ++result.failed_pieces;
      log::TRACE<Torrent>("Piece {} failed", piece);
    }
  }

  return result;
}

auto TorrentVerifier::verify_now(const TorrentBuffer& descriptor_bytes, const fs::path& directory)
  -> rules::Rules
{
  const auto descriptor = parse_descriptor(descriptor_bytes);
  log::INFO<Torrent>("Verifying '{}' ({} file(s), {} piece(s), info hash {})", descriptor.name,
                     descriptor.files.size(), descriptor.pieces.size(),
                     to_hex(descriptor.info_hash));

  const auto result = check_content(descriptor, directory);
  if (result.ok())
  {
    log::DBG<Torrent>("All {} piece(s) verified for {}", result.total_pieces, directory.string());
    return {};
  }

  log::DBG<Torrent>("Content check failed: {}", result.summary());
  return {rules::IncorrectHash{directory.string(), result.summary()}};
}

auto TorrentVerifier::verify(const TorrentBuffer& descriptor, const fs::path& directory)
  -> std::future<rules::Rules>
{
  return std::async(std::launch::async, [descriptor, directory]
                    { return verify_now(descriptor, directory); });
}

} // namespace libcadence::torrent
