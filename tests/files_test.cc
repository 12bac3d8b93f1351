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

#include "helpers/temp_dir.hpp"
#include <libcadence/common/error.hpp>
#include <libcadence/files/entry.hpp>

using namespace libcadence;
using namespace libcadence::files;
using libcadence::formats::TargetFormat;
using cadence::test::TempDir;

namespace
{

auto make_source(const fs::path& directory) -> source::Source
{
  source::Source src;
  src.directory       = directory;
  src.format          = formats::SourceFormat::Flac24;
  src.metadata.artist = "Artist";
  src.metadata.album  = "Album";
  src.metadata.year   = 2020;
  src.metadata.media  = source::Media::WEB;
  return src;
}

} // namespace

TEST(FlacCollectorTest, FindsFlacFilesRecursivelyInOrder)
{
  TempDir dir;
  dir.write("02 Second.flac", "x");
  dir.write("01 First.FLAC", "x");
  dir.write("CD2/01 Disc Two.flac", "x");
  dir.write("cover.jpg", "x");
  dir.write("notes.flac.txt", "x");
  fs::create_directories(dir.path() / "empty.flac");

  FlacCollector collector;
  const auto    files = collector.find_audio_files(dir.path());

  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0].filename(), "01 First.FLAC");
  EXPECT_EQ(files[1].filename(), "02 Second.flac");
  EXPECT_EQ(files[2], dir.path() / "CD2" / "01 Disc Two.flac");
}

TEST(FlacCollectorTest, EmptyDirectoryYieldsNothing)
{
  TempDir       dir;
  FlacCollector collector;
  EXPECT_TRUE(collector.find_audio_files(dir.path()).empty());
}

TEST(FlacCollectorTest, MissingDirectoryIsAnIoError)
{
  TempDir       dir;
  FlacCollector collector;
  try
  {
    collector.find_audio_files(dir.path() / "missing");
    FAIL() << "expected an I/O error";
  }
  catch (const Error& e)
  {
    EXPECT_EQ(e.kind(), ErrorKind::Io);
  }
}

TEST(FlacCollectorTest, DanglingLinksAreSkipped)
{
  TempDir dir;
  dir.write("01 Track.flac", "x");
  fs::create_symlink(dir.path() / "gone.flac", dir.path() / "02 Link.flac");

  FlacCollector collector;
  const auto    files = collector.find_audio_files(dir.path());
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].filename(), "01 Track.flac");
}

TEST(PathEvaluatorTest, SanitizesReleaseDirectoryName)
{
  EXPECT_EQ(sanitize_file_name(R"(AC/DC: Live? <"Best"> | \ *)"), "ACDC Live Best   ");
  EXPECT_EQ(sanitize_file_name("Plain Name"), "Plain Name");

  auto src            = make_source("/music/src");
  src.metadata.album  = "Who? What: Where";
  src.metadata.year   = std::nullopt;
  src.metadata.media  = source::Media::CD;
  EXPECT_EQ(TranscodePathEvaluator::release_dir_name(src, TargetFormat::Mp3_V0),
            "Artist - Who What Where [CD V0]");
}

TEST(PathEvaluatorTest, SubPathKeepsNestedDirectories)
{
  const auto src = make_source("/music/src");

  EXPECT_EQ(TranscodePathEvaluator::transcode_sub_path(src, TargetFormat::Mp3_320,
                                                       "/music/src/01 Track.flac"),
            "Artist - Album [2020] [WEB 320]/01 Track.mp3");
  EXPECT_EQ(TranscodePathEvaluator::transcode_sub_path(src, TargetFormat::Flac,
                                                       "/music/src/CD1/01 Track.flac"),
            "Artist - Album [2020] [WEB FLAC]/CD1/01 Track.flac");
}

TEST(PathEvaluatorTest, PicksLongestCandidate)
{
  const auto             src = make_source("/music/src");
  TranscodePathEvaluator evaluator;

  EXPECT_EQ(evaluator.max_output_path(src, formats::all_targets(), "/music/src/01 Track.flac"),
            "Artist - Album [2020] [WEB FLAC]/01 Track.flac");
  EXPECT_EQ(evaluator.max_output_path(src, {TargetFormat::Mp3_320, TargetFormat::Mp3_V0},
                                      "/music/src/01 Track.flac"),
            "Artist - Album [2020] [WEB 320]/01 Track.mp3");
  EXPECT_TRUE(evaluator.max_output_path(src, {}, "/music/src/01 Track.flac").empty());
}

TEST(PathEvaluatorTest, LengthIsCountedInBytes)
{
  auto src            = make_source("/music/src");
  src.metadata.artist = "Björk";

  const auto path = TranscodePathEvaluator::transcode_sub_path(src, TargetFormat::Mp3_V0,
                                                               "/music/src/01.flac");
  // "ö" is two bytes in UTF-8
  EXPECT_EQ(path.size(), std::string("Bjork - Album [2020] [WEB V0]/01.mp3").size() + 1);
}
