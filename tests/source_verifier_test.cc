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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "helpers/temp_dir.hpp"
#include <boost/log/core.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/make_shared.hpp>
#include <format>
#include <future>
#include <libcadence/common/error.hpp>
#include <libcadence/verify/entry.hpp>
#include <sstream>

using namespace libcadence;
using namespace libcadence::verify;
using cadence::test::TempDir;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace
{

class MockCollector : public files::IFileCollector
{
public:
  MOCK_METHOD(std::vector<fs::path>, find_audio_files, (const fs::path&), (override));
};

class MockPaths : public files::IPathEvaluator
{
public:
  MOCK_METHOD(SubPath, max_output_path,
              (const source::Source&, const formats::TargetFormats&, const fs::path&),
              (override));
};

class MockTags : public flac::ITagVerifier
{
public:
  MOCK_METHOD(rules::Rules, check, (const fs::path&, const source::ReleaseMetadata&), (override));
};

class MockStreams : public ffmpeg::IStreamVerifier
{
public:
  MOCK_METHOD(rules::Rules, check, (const fs::path&), (override));
};

class MockShortener : public naming::IShortener
{
public:
  MOCK_METHOD(void, suggest_track, (const fs::path&), (override));
  MOCK_METHOD(void, suggest_album, (const source::Source&), (override));
};

class MockApi : public api::ITrackerApi
{
public:
  MOCK_METHOD(std::future<TorrentBuffer>, fetch_torrent, (TorrentID), (override));
};

class MockTorrent : public torrent::ITorrentVerifier
{
public:
  MOCK_METHOD(std::future<rules::Rules>, verify, (const TorrentBuffer&, const fs::path&),
              (override));
};

template <typename T> auto ready(T value) -> std::future<T>
{
  std::promise<T> promise;
  promise.set_value(std::move(value));
  return promise.get_future();
}

template <typename T> auto failed(Error error) -> std::future<T>
{
  std::promise<T> promise;
  promise.set_exception(std::make_exception_ptr(std::move(error)));
  return promise.get_future();
}

const TorrentBuffer Descriptor = {'d', 'e'};

class SourceVerifierTest : public ::testing::Test
{
protected:
  TempDir dir;

  std::shared_ptr<NiceMock<MockCollector>> collector = std::make_shared<NiceMock<MockCollector>>();
  std::shared_ptr<NiceMock<MockPaths>>     paths     = std::make_shared<NiceMock<MockPaths>>();
  std::shared_ptr<NiceMock<MockTags>>      tags      = std::make_shared<NiceMock<MockTags>>();
  std::shared_ptr<NiceMock<MockStreams>>   streams   = std::make_shared<NiceMock<MockStreams>>();
  std::shared_ptr<NiceMock<MockShortener>> shortener = std::make_shared<NiceMock<MockShortener>>();
  std::shared_ptr<NiceMock<MockApi>>       api       = std::make_shared<NiceMock<MockApi>>();
  std::shared_ptr<NiceMock<MockTorrent>>   torrent   = std::make_shared<NiceMock<MockTorrent>>();

  source::Source        source;
  std::vector<fs::path> files;

  void SetUp() override
  {
    source.directory       = dir.path();
    source.format          = formats::SourceFormat::Flac24;
    source.torrent.id      = 42;
    source.metadata.artist = "Artist";
    source.metadata.album  = "Album";
    source.metadata.media  = source::Media::CD;

    files = {dir.path() / "01.flac", dir.path() / "02.flac"};

    ON_CALL(*collector, find_audio_files(_)).WillByDefault(Return(files));
    ON_CALL(*paths, max_output_path(_, _, _)).WillByDefault(Return(SubPath("Artist/01.flac")));
    ON_CALL(*tags, check(_, _)).WillByDefault(Return(rules::Rules{}));
    ON_CALL(*streams, check(_)).WillByDefault(Return(rules::Rules{}));
    ON_CALL(*api, fetch_torrent(_))
      .WillByDefault([](TorrentID) { return ready(Descriptor); });
    ON_CALL(*torrent, verify(_, _))
      .WillByDefault([](const TorrentBuffer&, const fs::path&) { return ready(rules::Rules{}); });
  }

  auto make_verifier(VerifyOptions options = {}) const -> SourceVerifier
  {
    return SourceVerifier(
      Collaborators{
        .targets   = formats::TargetFormatProvider{},
        .collector = collector,
        .paths     = paths,
        .tags      = tags,
        .streams   = streams,
        .shortener = shortener,
        .api       = api,
        .torrent   = torrent,
      },
      options);
  }
};

} // namespace

TEST_F(SourceVerifierTest, CleanSourceIsVerified)
{
  EXPECT_CALL(*tags, check(_, _)).Times(2);
  EXPECT_CALL(*streams, check(_)).Times(2);
  EXPECT_CALL(*api, fetch_torrent(42)).Times(1);
  EXPECT_CALL(*torrent, verify(Descriptor, dir.path())).Times(1);
  EXPECT_CALL(*shortener, suggest_track(_)).Times(0);
  EXPECT_CALL(*shortener, suggest_album(_)).Times(0);

  const auto result = make_verifier().execute(source);

  EXPECT_TRUE(result.verified);
  EXPECT_TRUE(result.rules.empty());
  EXPECT_TRUE(result.policy.empty());
  EXPECT_TRUE(result.files.empty());
  EXPECT_TRUE(result.hash.empty());
}

TEST_F(SourceVerifierTest, AnnouncesTheSourceBeforeChecking)
{
  namespace sinks = boost::log::sinks;

  auto captured = boost::make_shared<std::ostringstream>();
  auto backend  = boost::make_shared<sinks::text_ostream_backend>();
  backend->add_stream(captured);
  backend->auto_flush(true);
  auto sink = boost::make_shared<sinks::synchronous_sink<sinks::text_ostream_backend>>(backend);
  boost::log::core::get()->add_sink(sink);

  EXPECT_CALL(*collector, find_audio_files(_))
    .WillOnce(
      [&](const fs::path&)
      {
        EXPECT_NE(captured->str().find(std::format("Verifying {}", source)), std::string::npos);
        return files;
      });

  (void)make_verifier({.skip_hash_check = true}).execute(source);

  boost::log::core::get()->remove_sink(sink);
  EXPECT_NE(captured->str().find("Verifying Artist - Album"), std::string::npos);
}

TEST_F(SourceVerifierTest, FindingsAreCollectedInPhaseOrder)
{
  source.torrent.scene = true;

  const auto second = files[1];
  ON_CALL(*tags, check(second, _))
    .WillByDefault(Return(rules::Rules{rules::MissingTitleTag{second.string()}}));
  ON_CALL(*torrent, verify(_, _))
    .WillByDefault(
      [](const TorrentBuffer&, const fs::path& d)
      { return ready(rules::Rules{rules::IncorrectHash{d.string(), "1 of 3 piece(s) failed"}}); });

  const auto result = make_verifier().execute(source);

  const rules::Rules expected = {
    rules::SceneNotSupported{},
    rules::MissingTitleTag{second.string()},
    rules::IncorrectHash{dir.path().string(), "1 of 3 piece(s) failed"},
  };
  EXPECT_FALSE(result.verified);
  EXPECT_EQ(result.rules, expected);
  EXPECT_EQ(result.policy, rules::Rules{rules::SceneNotSupported{}});
  EXPECT_EQ(result.files.size(), 1u);
  EXPECT_EQ(result.hash.size(), 1u);
}

TEST_F(SourceVerifierTest, ApprovalFlagsSetToTrueAreReported)
{
  source.torrent.lossy_master_approved = true;
  source.torrent.lossy_web_approved    = false;

  const auto policy = make_verifier().policy_checks(source);
  EXPECT_EQ(policy, rules::Rules{rules::LossyMasterNeedsApproval{}});

  source.torrent.lossy_master_approved.reset();
  source.torrent.lossy_web_approved = true;
  EXPECT_EQ(make_verifier().policy_checks(source), rules::Rules{rules::LossyWebNeedsApproval{}});
}

TEST_F(SourceVerifierTest, LongPathsAskForShorterNames)
{
  const std::string long_path(MAX_PATH_LENGTH + 1, 'x');
  ON_CALL(*paths, max_output_path(_, _, files[0])).WillByDefault(Return(long_path));

  EXPECT_CALL(*shortener, suggest_track(files[0])).Times(1);
  EXPECT_CALL(*shortener, suggest_track(files[1])).Times(0);
  EXPECT_CALL(*shortener, suggest_album(_)).Times(1);

  const auto result = make_verifier().execute(source);

  EXPECT_FALSE(result.verified);
  EXPECT_EQ(result.files, rules::Rules{rules::PathTooLong{long_path}});
}

TEST_F(SourceVerifierTest, PathAtTheLimitIsAccepted)
{
  ON_CALL(*paths, max_output_path(_, _, _))
    .WillByDefault(Return(std::string(MAX_PATH_LENGTH, 'x')));
  EXPECT_CALL(*shortener, suggest_album(_)).Times(0);

  EXPECT_TRUE(make_verifier().file_checks(source).empty());
}

TEST_F(SourceVerifierTest, SkippedHashCheckNeverContactsTheTracker)
{
  EXPECT_CALL(*api, fetch_torrent(_)).Times(0);
  EXPECT_CALL(*torrent, verify(_, _)).Times(0);

  const auto result = make_verifier({.skip_hash_check = true}).execute(source);
  EXPECT_TRUE(result.verified);
  EXPECT_TRUE(result.hash.empty());
}

TEST_F(SourceVerifierTest, MissingDirectoryIsASingleFinding)
{
  source.directory = dir.path() / "missing";
  EXPECT_CALL(*collector, find_audio_files(_)).Times(0);
  EXPECT_CALL(*tags, check(_, _)).Times(0);

  const auto verifier = make_verifier({.skip_hash_check = true});
  const auto first    = verifier.file_checks(source);
  const auto second   = verifier.file_checks(source);

  const rules::Rules expected = {rules::SourceDirectoryNotFound{source.directory.string()}};
  EXPECT_EQ(first, expected);
  EXPECT_EQ(second, expected);
}

TEST_F(SourceVerifierTest, EmptyDirectoryHasNoFlacFiles)
{
  ON_CALL(*collector, find_audio_files(_)).WillByDefault(Return(std::vector<fs::path>{}));
  EXPECT_EQ(make_verifier().file_checks(source),
            rules::Rules{rules::NoFlacFiles{dir.path().string()}});
}

TEST_F(SourceVerifierTest, NoTargetsSkipsPathEvaluation)
{
  source.format   = formats::SourceFormat::Flac;
  source.existing = {formats::TargetFormat::Mp3_320, formats::TargetFormat::Mp3_V0};

  EXPECT_CALL(*paths, max_output_path(_, _, _)).Times(0);
  EXPECT_CALL(*tags, check(_, _)).Times(2);

  const auto result = make_verifier({.skip_hash_check = true}).execute(source);
  EXPECT_EQ(result.policy, rules::Rules{rules::NoTranscodeFormats{}});
  EXPECT_TRUE(result.files.empty());
  EXPECT_FALSE(result.verified);
}

TEST_F(SourceVerifierTest, FileChecksRunAfterPolicyFailure)
{
  source.torrent.scene = true;
  ON_CALL(*streams, check(files[0]))
    .WillByDefault(Return(rules::Rules{rules::CorruptStream{files[0].string(), 3}}));

  const auto result = make_verifier({.skip_hash_check = true}).execute(source);
  EXPECT_EQ(result.policy.size(), 1u);
  EXPECT_EQ(result.files, rules::Rules{rules::CorruptStream{files[0].string(), 3}});
}

TEST_F(SourceVerifierTest, ParallelAndSequentialRunsAgree)
{
  files.clear();
  for (int i = 1; i <= 12; ++i)
    files.push_back(dir.path() / std::format("{:02}.flac", i));
  ON_CALL(*collector, find_audio_files(_)).WillByDefault(Return(files));

  for (std::size_t i = 0; i < files.size(); i += 2)
  {
    ON_CALL(*tags, check(files[i], _))
      .WillByDefault(Return(rules::Rules{rules::InvalidTrackNumberTag{files[i].string(), "x"}}));
    ON_CALL(*streams, check(files[i]))
      .WillByDefault(Return(rules::Rules{rules::TruncatedStream{files[i].string(), 1, 2}}));
  }

  const auto parallel   = make_verifier({.parallel_file_checks = true}).file_checks(source);
  const auto sequential = make_verifier({.parallel_file_checks = false}).file_checks(source);

  ASSERT_EQ(parallel.size(), 12u);
  EXPECT_EQ(parallel, sequential);
  // tag finding before stream finding, files in collector order
  EXPECT_EQ(parallel[0], rules::Rule(rules::InvalidTrackNumberTag{files[0].string(), "x"}));
  EXPECT_EQ(parallel[1], rules::Rule(rules::TruncatedStream{files[0].string(), 1, 2}));
  EXPECT_EQ(parallel[2], rules::Rule(rules::InvalidTrackNumberTag{files[2].string(), "x"}));
}

TEST_F(SourceVerifierTest, RepeatedRunsGiveTheSameVerdict)
{
  files.clear();
  for (int i = 1; i <= 8; ++i)
    files.push_back(dir.path() / std::format("{:02}.flac", i));
  ON_CALL(*collector, find_audio_files(_)).WillByDefault(Return(files));

  source.torrent.scene              = true;
  source.torrent.lossy_web_approved = true;

  for (std::size_t i = 1; i < files.size(); i += 3)
  {
    ON_CALL(*tags, check(files[i], _))
      .WillByDefault(Return(rules::Rules{rules::MissingArtistTag{files[i].string()}}));
    ON_CALL(*streams, check(files[i]))
      .WillByDefault(Return(rules::Rules{rules::CorruptStream{files[i].string(), 2}}));
  }
  ON_CALL(*torrent, verify(_, _))
    .WillByDefault(
      [](const TorrentBuffer&, const fs::path& d)
      { return ready(rules::Rules{rules::IncorrectHash{d.string(), "2 of 9 piece(s) failed"}}); });

  const auto verifier = make_verifier({.parallel_file_checks = true});
  const auto first    = verifier.execute(source);
  const auto second   = verifier.execute(source);

  EXPECT_FALSE(first.verified);
  EXPECT_EQ(first.verified, second.verified);
  EXPECT_EQ(first.rules, second.rules);

  ASSERT_EQ(first.rules.size(), 2u + 6u + 1u);
  EXPECT_EQ(first.rules[0], rules::Rule(rules::SceneNotSupported{}));
  EXPECT_EQ(first.rules[1], rules::Rule(rules::LossyWebNeedsApproval{}));
  EXPECT_EQ(first.rules[2], rules::Rule(rules::MissingArtistTag{files[1].string()}));
  EXPECT_EQ(first.rules[3], rules::Rule(rules::CorruptStream{files[1].string(), 2}));
  EXPECT_EQ(first.rules[7], rules::Rule(rules::CorruptStream{files[7].string(), 2}));
  EXPECT_EQ(first.rules.back(),
            rules::Rule(rules::IncorrectHash{dir.path().string(), "2 of 9 piece(s) failed"}));
}

TEST_F(SourceVerifierTest, HardErrorFromAFileCheckPropagates)
{
  ON_CALL(*streams, check(files[1]))
    .WillByDefault(Throw(Error(ErrorKind::Decode, "cannot open")));

  for (bool parallel : {true, false})
  {
    const auto verifier = make_verifier({.parallel_file_checks = parallel});
    try
    {
      (void)verifier.execute(source);
      FAIL() << "expected a decode error";
    }
    catch (const Error& e)
    {
      EXPECT_EQ(e.kind(), ErrorKind::Decode);
    }
  }
}

TEST_F(SourceVerifierTest, TrackerFailurePropagates)
{
  ON_CALL(*api, fetch_torrent(_))
    .WillByDefault([](TorrentID)
                   { return failed<TorrentBuffer>(Error(ErrorKind::Network, "unreachable")); });
  EXPECT_CALL(*torrent, verify(_, _)).Times(0);

  try
  {
    (void)make_verifier().execute(source);
    FAIL() << "expected a network error";
  }
  catch (const Error& e)
  {
    EXPECT_EQ(e.kind(), ErrorKind::Network);
  }
}

TEST_F(SourceVerifierTest, MissingCollaboratorIsRejected)
{
  try
  {
    SourceVerifier verifier(Collaborators{.targets = formats::TargetFormatProvider{},
                                          .collector = collector,
                                          .paths     = paths,
                                          .tags      = tags,
                                          .streams   = streams,
                                          .shortener = shortener,
                                          .api       = nullptr,
                                          .torrent   = torrent},
                            {});
    FAIL() << "expected a configuration error";
  }
  catch (const Error& e)
  {
    EXPECT_EQ(e.kind(), ErrorKind::Config);
  }
}

TEST(PhaseTest, Names)
{
  EXPECT_EQ(to_string(Phase::Start), "Start");
  EXPECT_EQ(to_string(Phase::PolicyChecked), "PolicyChecked");
  EXPECT_EQ(to_string(Phase::Verdict), "Verdict");
}
