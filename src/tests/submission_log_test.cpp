#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>
#include "submission/submission_log.hpp"
#include "submission/user_files.hpp"
#include "error/store_error.hpp"
#include "util/digest.hpp"
#include "test_utils.hpp"

using namespace tutor;
using namespace tutor::submission;
using tutor::test::TempDirectory;
using boost::gregorian::date;
using boost::posix_time::hours;
using boost::posix_time::minutes;

class SubmissionLogTest : public ::testing::Test {
protected:
  TempDirectory temp_dir{"submission_log_test"};
  util::Timestamp now{date(2024, 5, 1), hours(22)};
  std::unique_ptr<SubmissionLog> log;

  void SetUp() override {
    tutor::test::init_test_logging();
    log = std::make_unique<SubmissionLog>(temp_dir.path() / "submissions", [this]() { return now; });
  }

  std::filesystem::path user_dir(const std::string& user) const {
    return temp_dir.path() / "submissions" / user;
  }
};

TEST_F(SubmissionLogTest, RecordsSubmissionAndSnapshot) {
  const std::string code = "print(\"hello\")\n";
  const std::string hash = util::sha512_base32("identity of Ex1");
  ASSERT_EQ(hash.size(), util::IDENTITY_HASH_LENGTH);

  const auto event = log->append_submission("s1234567", hash, code);
  EXPECT_EQ(event.identity_hash, hash);
  EXPECT_EQ(event.submitted_at, now);

  // Snapshot is named after the hash with its padding stripped
  const auto snapshot = user_dir("s1234567") / util::strip_padding(hash);
  EXPECT_EQ(log->snapshot_path("s1234567", hash), snapshot);
  EXPECT_EQ(tutor::test::read_text(snapshot), code);
  EXPECT_EQ(log->read_snapshot("s1234567", hash), std::optional<std::string>(code));

  // The log keeps the hash as given
  EXPECT_EQ(tutor::test::read_text(user_dir("s1234567") / SUBMISSION_LOG_NAME),
            hash + " 2024-05-01T22:00:00\n");
}

TEST_F(SubmissionLogTest, ReadsEventsInOrder) {
  EXPECT_TRUE(log->read_submissions("s1234567").empty());

  log->append_submission("s1234567", "HASH_A", "a1");
  now += minutes(30);
  log->append_submission("s1234567", "HASH_B", "b1");
  now += minutes(45);
  log->append_submission("s1234567", "HASH_A", "a2");

  const auto events = log->read_submissions("s1234567");
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].identity_hash, "HASH_A");
  EXPECT_EQ(events[1].identity_hash, "HASH_B");
  EXPECT_EQ(events[2].identity_hash, "HASH_A");
  EXPECT_EQ(events[2].submitted_at, util::Timestamp(date(2024, 5, 1), hours(23) + minutes(15)));

  // Resubmission replaces the snapshot
  EXPECT_EQ(log->read_snapshot("s1234567", "HASH_A"), std::optional<std::string>("a2"));
}

TEST_F(SubmissionLogTest, KeepsFractionalSeconds) {
  now = util::Timestamp(date(2024, 5, 1), hours(22) + boost::posix_time::microseconds(250));
  log->append_submission("s1234567", "HASH_A", "x");
  const auto events = log->read_submissions("s1234567");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].submitted_at, now);
}

TEST_F(SubmissionLogTest, UnsafeHashWritesNothing) {
  for (const std::string hash : {"../escape", "a/b", "", "====", "has space", "submission_log", "admin_log="}) {
    EXPECT_THROW(log->append_submission("s1234567", hash, "code"), IntegrityError) << "Hash: " << hash;
  }
  EXPECT_FALSE(std::filesystem::exists(user_dir("s1234567") / SUBMISSION_LOG_NAME));
  EXPECT_TRUE(log->read_submissions("s1234567").empty());
}

TEST_F(SubmissionLogTest, RejectsUnsafeUsername) {
  EXPECT_THROW(log->append_submission("..", "HASH_A", "code"), InvalidNameError);
  EXPECT_THROW(log->read_submissions("a/b"), InvalidNameError);
}

TEST_F(SubmissionLogTest, MalformedLogIsFatal) {
  tutor::test::write_text(user_dir("s1234567") / SUBMISSION_LOG_NAME,
                          "HASH_A 2024-05-01T22:00:00\nHASH_B\n");
  try {
    log->read_submissions("s1234567");
    FAIL() << "Expected FormatError";
  } catch (const FormatError& e) {
    EXPECT_THAT(e.context(), ::testing::HasSubstr("record 2"));
  }

  tutor::test::write_text(user_dir("s7654321") / SUBMISSION_LOG_NAME, "HASH_A yesterday\n");
  EXPECT_THROW(log->read_submissions("s7654321"), FormatError);

  tutor::test::write_text(user_dir("s0000000") / SUBMISSION_LOG_NAME, "HASH_A 2024-05-01T22:00:00 extra\n");
  EXPECT_THROW(log->read_submissions("s0000000"), FormatError);
}

TEST_F(SubmissionLogTest, AcceptsSpaceSeparatedTimestampsAndBlankLines) {
  tutor::test::write_text(user_dir("s1234567") / SUBMISSION_LOG_NAME,
                          "\nHASH_A 2024-05-01T22:00:00.500000\r\n\n");
  const auto events = log->read_submissions("s1234567");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].identity_hash, "HASH_A");
}

TEST_F(SubmissionLogTest, ConcurrentSubmissionsAreAllRecorded) {
  const int num_threads = 4;
  const int per_thread = 25;

  std::vector<std::thread> threads;
  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i]() {
      for (int j = 0; j < per_thread; ++j) {
        log->append_submission("s1234567", "HASH_" + std::to_string(i), "code " + std::to_string(j));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(log->read_submissions("s1234567").size(), static_cast<std::size_t>(num_threads * per_thread));
}
