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

#include "helpers/flac_fixture.hpp"
#include "helpers/temp_dir.hpp"
#include <libcadence/common/error.hpp>
#include <libcadence/flac/tags.hpp>

using namespace libcadence;
using namespace libcadence::flac;
using cadence::test::FlacParams;
using cadence::test::TempDir;

namespace
{

auto release(source::Media media = source::Media::CD) -> source::ReleaseMetadata
{
  return {.artist = "Artist", .album = "Album", .year = 2020, .media = media};
}

auto complete_tags() -> VorbisComments
{
  return {{"ARTIST", "Artist"}, {"ALBUM", "Album"}, {"TITLE", "Title"}, {"TRACKNUMBER", "3/12"}};
}

} // namespace

TEST(TrackNumberTest, Notation)
{
  EXPECT_TRUE(is_track_number("7"));
  EXPECT_TRUE(is_track_number("07/12"));
  EXPECT_FALSE(is_track_number(""));
  EXPECT_FALSE(is_track_number("7/"));
  EXPECT_FALSE(is_track_number("/12"));
  EXPECT_FALSE(is_track_number("seven"));
  EXPECT_FALSE(is_track_number("A1"));

  EXPECT_TRUE(is_vinyl_track_number("A1"));
  EXPECT_TRUE(is_vinyl_track_number("b12"));
  EXPECT_FALSE(is_vinyl_track_number("A"));
  EXPECT_FALSE(is_vinyl_track_number("AB1"));
}

TEST(TagVerifierTest, CompleteTagsPass)
{
  EXPECT_TRUE(TagVerifier::check_comments(complete_tags(), "/x/01.flac", release()).empty());
}

TEST(TagVerifierTest, MissingAndBlankTagsAreReportedInFieldOrder)
{
  const VorbisComments comments = {{"ALBUM", "   "}, {"TRACKNUMBER", "1"}};
  const auto           found    = TagVerifier::check_comments(comments, "/x/01.flac", release());

  const rules::Rules expected = {rules::MissingArtistTag{"/x/01.flac"},
                                 rules::MissingAlbumTag{"/x/01.flac"},
                                 rules::MissingTitleTag{"/x/01.flac"}};
  EXPECT_EQ(found, expected);
}

TEST(TagVerifierTest, RepeatedFieldUsesFirstNonBlankValue)
{
  auto comments = complete_tags();
  comments.erase("TITLE");
  comments.emplace("TITLE", "");
  comments.emplace("TITLE", "Real Title");
  EXPECT_TRUE(TagVerifier::check_comments(comments, "/x/01.flac", release()).empty());
}

TEST(TagVerifierTest, InvalidTrackNumber)
{
  auto comments = complete_tags();
  comments.erase("TRACKNUMBER");
  comments.emplace("TRACKNUMBER", "one");

  const auto found = TagVerifier::check_comments(comments, "/x/01.flac", release());
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0], rules::Rule(rules::InvalidTrackNumberTag{"/x/01.flac", "one"}));
}

TEST(TagVerifierTest, VinylNotationOnlyForVinylReleases)
{
  auto comments = complete_tags();
  comments.erase("TRACKNUMBER");
  comments.emplace("TRACKNUMBER", "B2");

  EXPECT_TRUE(
    TagVerifier::check_comments(comments, "/x/01.flac", release(source::Media::Vinyl)).empty());
  EXPECT_TRUE(rules::contains<rules::InvalidTrackNumberTag>(
    TagVerifier::check_comments(comments, "/x/01.flac", release(source::Media::CD))));
}

TEST(TagVerifierTest, AlbumMismatchIsNotAFinding)
{
  auto comments = complete_tags();
  comments.erase("ALBUM");
  comments.emplace("ALBUM", "Another Album");
  EXPECT_TRUE(TagVerifier::check_comments(comments, "/x/01.flac", release()).empty());
}

TEST(TagVerifierTest, ReadsCommentsFromFlacFile)
{
  TempDir    dir;
  const auto file = dir.path() / "01 Track.flac";
  FlacParams params;
  params.tags = {{"artist", "Artist"}, {"Title", "Title"}, {"TRACKNUMBER", "1"}};
  cadence::test::write_flac(file, params);

  const auto comments = read_vorbis_comments(file);
  EXPECT_EQ(comments.count("ARTIST"), 1u);
  EXPECT_EQ(comments.count("TITLE"), 1u);
  EXPECT_EQ(comments.count("ALBUM"), 0u);

  TagVerifier verifier;
  const auto  found = verifier.check(file, release());
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0], rules::Rule(rules::MissingAlbumTag{file.string()}));
}

TEST(TagVerifierTest, FileWithoutCommentsMissesEverything)
{
  TempDir    dir;
  const auto file = dir.path() / "bare.flac";
  FlacParams params;
  params.tags.clear();
  cadence::test::write_flac(file, params);

  TagVerifier verifier;
  EXPECT_EQ(verifier.check(file, release()).size(), 4u);
}

TEST(TagVerifierTest, UnreadableFileIsADecodeError)
{
  TempDir    dir;
  const auto file = dir.write("fake.flac", "not a flac stream");

  TagVerifier verifier;
  try
  {
    (void)verifier.check(file, release());
    FAIL() << "expected a decode error";
  }
  catch (const Error& e)
  {
    EXPECT_EQ(e.kind(), ErrorKind::Decode);
  }
}
