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

#include <gtest/gtest.h>

#include <format>

#include "helpers/temp_dir.hpp"
#include "helpers/torrent_fixture.hpp"
#include <libcadence/common/error.hpp>
#include <libcadence/torrent/entry.hpp>

using namespace libcadence;
using namespace libcadence::torrent;
using cadence::test::make_torrent;
using cadence::test::TempDir;
using cadence::test::to_buffer;
using cadence::test::TorrentFile;

namespace
{

constexpr std::size_t PieceLength = 16;

// Three files whose boundaries fall inside pieces, plus an empty one
auto release_files() -> std::vector<TorrentFile>
{
  return {
    {{"01 Track.flac"}, std::string(40, 'a')},
    {{"CD2", "02 Track.flac"}, std::string(25, 'b')},
    {{"empty.log"}, ""},
    {{"cover.jpg"}, std::string(7, 'c')},
  };
}

void write_release(const TempDir& dir, const std::vector<TorrentFile>& files)
{
  for (const auto& f : files)
  {
    fs::path rel;
    for (const auto& part : f.path)
      rel /= part;
    dir.write(rel, f.content);
  }
}

auto torrent_kind(const TorrentBuffer& buffer) -> std::optional<ErrorKind>
{
  try
  {
    parse_descriptor(buffer);
  }
  catch (const Error& e)
  {
    return e.kind();
  }
  return std::nullopt;
}

} // namespace

TEST(TorrentDescriptorTest, ParsesMultiFileTorrent)
{
  const auto buffer     = make_torrent("Release", release_files(), PieceLength);
  const auto descriptor = parse_descriptor(buffer);

  EXPECT_EQ(descriptor.name, "Release");
  EXPECT_TRUE(descriptor.multi_file);
  EXPECT_EQ(descriptor.piece_length, PieceLength);
  ASSERT_EQ(descriptor.files.size(), 4u);
  EXPECT_EQ(descriptor.files[1].path, fs::path("CD2") / "02 Track.flac");
  EXPECT_EQ(descriptor.total_size(), 72u);
  EXPECT_EQ(descriptor.pieces.size(), 5u);
  EXPECT_EQ(descriptor.content_path("/music/src", descriptor.files[0]),
            fs::path("/music/src/01 Track.flac"));
}

TEST(TorrentDescriptorTest, InfoHashCoversRawInfoBytes)
{
  const auto buffer     = make_torrent("Release", release_files(), PieceLength);
  const auto descriptor = parse_descriptor(buffer);

  const auto raw = bencode::raw_value(buffer, "info");
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(descriptor.info_hash, Sha1Hasher::digest(*raw));
  EXPECT_EQ(to_hex(descriptor.info_hash).size(), 40u);
}

TEST(TorrentDescriptorTest, SingleFileTorrent)
{
  const std::string content(20, 'z');
  const auto        pieces = cadence::test::piece_hashes({{{"x"}, content}}, PieceLength);

  bencode::Dict info = {{"name", "track.flac"},
                        {"length", 20},
                        {"piece length", static_cast<int>(PieceLength)},
                        {"pieces", pieces}};
  const auto buffer = to_buffer(bencode::encode(bencode::Dict{{"info", info}}));

  const auto descriptor = parse_descriptor(buffer);
  EXPECT_FALSE(descriptor.multi_file);
  ASSERT_EQ(descriptor.files.size(), 1u);
  EXPECT_EQ(descriptor.files[0].path, fs::path("track.flac"));

  TempDir dir;
  dir.write("track.flac", content);
  EXPECT_TRUE(TorrentVerifier::verify_now(buffer, dir.path()).empty());
}

TEST(TorrentDescriptorTest, RejectsInvalidDescriptors)
{
  const auto encode = [](const bencode::Dict& info)
  { return to_buffer(bencode::encode(bencode::Dict{{"info", info}})); };
  const std::string one_piece(20, 'h');

  EXPECT_EQ(torrent_kind(to_buffer("le")), ErrorKind::Torrent);
  EXPECT_EQ(torrent_kind(to_buffer("d4:infoi1ee")), ErrorKind::Torrent);
  // pieces not a multiple of 20
  EXPECT_EQ(torrent_kind(encode({{"name", "a"}, {"length", 1}, {"piece length", 16},
                                 {"pieces", std::string(19, 'h')}})),
            ErrorKind::Torrent);
  // piece count does not cover the content
  EXPECT_EQ(torrent_kind(encode({{"name", "a"}, {"length", 40}, {"piece length", 16},
                                 {"pieces", one_piece}})),
            ErrorKind::Torrent);
  EXPECT_EQ(torrent_kind(encode({{"name", "a"}, {"length", 1}, {"piece length", 0},
                                 {"pieces", one_piece}})),
            ErrorKind::Torrent);
  // path escaping the content root
  EXPECT_EQ(torrent_kind(encode({{"name", "a"},
                                 {"piece length", 16},
                                 {"pieces", one_piece},
                                 {"files", bencode::List{bencode::Dict{
                                             {"length", 1},
                                             {"path", bencode::List{"..", "etc"}}}}}})),
            ErrorKind::Torrent);
  EXPECT_EQ(torrent_kind(encode({{"name", "../a"}, {"length", 1}, {"piece length", 16},
                                 {"pieces", one_piece}})),
            ErrorKind::Torrent);
}

TEST(TorrentVerifierTest, MatchingContentPasses)
{
  TempDir    dir;
  const auto files = release_files();
  write_release(dir, files);

  const auto buffer = make_torrent("Release", files, PieceLength);
  const auto check  = check_content(parse_descriptor(buffer), dir.path());
  EXPECT_TRUE(check.ok());
  EXPECT_EQ(check.total_pieces, 5u);

  TorrentVerifier verifier;
  EXPECT_TRUE(verifier.verify(buffer, dir.path()).get().empty());
}

TEST(TorrentVerifierTest, ModifiedByteFailsItsPiece)
{
  TempDir dir;
  auto    files = release_files();
  write_release(dir, files);
  const auto buffer = make_torrent("Release", files, PieceLength);

  // byte 45 sits in the third piece, inside the second file
  auto modified = files[1].content;
  modified[5]   = 'X';
  dir.write(fs::path("CD2") / "02 Track.flac", modified);

  const auto check = check_content(parse_descriptor(buffer), dir.path());
  EXPECT_EQ(check.failed_pieces, 1u);
  EXPECT_TRUE(check.missing_files.empty());
  EXPECT_EQ(check.summary(), "1 of 5 piece(s) failed");

  const auto found = TorrentVerifier::verify_now(buffer, dir.path());
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0],
            rules::Rule(rules::IncorrectHash{dir.path().string(), "1 of 5 piece(s) failed"}));
}

TEST(TorrentVerifierTest, MissingAndResizedFilesAreNamed)
{
  TempDir dir;
  auto    files = release_files();
  write_release(dir, files);
  const auto buffer = make_torrent("Release", files, PieceLength);

  fs::remove(dir.path() / "cover.jpg");
  dir.write("01 Track.flac", std::string(41, 'a'));

  const auto check = check_content(parse_descriptor(buffer), dir.path());
  EXPECT_FALSE(check.ok());
  EXPECT_EQ(check.missing_files, std::vector<std::string>{"cover.jpg"});
  EXPECT_EQ(check.size_mismatches, std::vector<std::string>{"01 Track.flac"});
  // pieces 0-2 touch the first file, piece 4 the cover
  EXPECT_EQ(check.failed_pieces, 4u);
  EXPECT_EQ(check.summary(),
            "4 of 5 piece(s) failed; missing: cover.jpg; size mismatch: 01 Track.flac");
}

TEST(TorrentVerifierTest, SummaryListsAtMostFiveNames)
{
  ContentCheck check;
  check.total_pieces  = 8;
  check.failed_pieces = 8;
  for (int i = 1; i <= 7; ++i)
    check.missing_files.push_back(std::format("{:02}.flac", i));

  EXPECT_EQ(check.summary(), "8 of 8 piece(s) failed; missing: 01.flac, 02.flac, 03.flac, "
                             "04.flac, 05.flac and 2 more");
}

TEST(TorrentVerifierTest, MalformedDescriptorSurfacesFromFuture)
{
  TempDir         dir;
  TorrentVerifier verifier;
  auto            pending = verifier.verify(to_buffer("not bencode"), dir.path());
  EXPECT_THROW(pending.get(), Error);
}
