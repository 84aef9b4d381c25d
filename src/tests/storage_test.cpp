#include <gtest/gtest.h>
#include <memory>
#include "storage/storage.hpp"
#include "error/store_error.hpp"
#include "util/digest.hpp"
#include "test_utils.hpp"

using namespace tutor;
using tutor::test::TempDirectory;
using boost::gregorian::date;
using boost::posix_time::hours;

class StorageTest : public ::testing::Test {
protected:
  TempDirectory temp_dir{"storage_test"};
  config::StorageLayout layout;
  util::Timestamp now{date(2024, 5, 1), hours(22)};
  std::unique_ptr<Storage> storage;
  std::string hash;

  void SetUp() override {
    tutor::test::init_test_logging();
    layout = config::StorageLayout::from_base(temp_dir.path());
    hash = util::sha512_base32("CSSE1001/Functions/Ex1 revision 2");

    tutor::test::write_text(layout.exercise_hashes_file,
                            hash + " 23_01/05/24 CSSE1001 Functions Ex1\n"
                            "OTHER 23_08/05/24 CSSE1001 Functions Ex2\n");
    tutor::test::write_text(layout.hash_mappings_file, "{\"OLD\": \"" + hash + "\"}");
    tutor::test::write_text(layout.version_file, "3.1\n");

    storage = std::make_unique<Storage>(layout, [this]() { return now; });
  }
};

TEST_F(StorageTest, StandardLayout) {
  EXPECT_EQ(layout.answers_dir, temp_dir.path() / "data" / "answers");
  EXPECT_EQ(layout.submissions_dir, temp_dir.path() / "data" / "submissions");
  EXPECT_EQ(layout.exercise_hashes_file, temp_dir.path() / "data" / "submissions" / "tutorial_hashes");
  EXPECT_EQ(layout.hash_mappings_file, temp_dir.path() / "data" / "submissions" / "tutorial_hash_mappings");
  EXPECT_EQ(layout.user_info_file, temp_dir.path() / "data" / "user_info");
  EXPECT_EQ(layout.version_file, temp_dir.path() / "mpt_version");
  EXPECT_EQ(layout.package_archive, temp_dir.path() / "public" / "CSSE1001Tutorials.zip");
}

TEST_F(StorageTest, CreatesDirectoriesAndTables) {
  EXPECT_TRUE(std::filesystem::is_directory(layout.answers_dir));
  EXPECT_TRUE(std::filesystem::is_directory(layout.submissions_dir));
  EXPECT_TRUE(std::filesystem::exists(layout.user_info_file));
}

TEST_F(StorageTest, DraftThenSubmitThenStatus) {
  const store::DraftKey key{"s1", "CSSE1001", "Functions", "Ex1"};
  storage->answers().write(key, "def f(): pass\n");

  // Editing the draft after submitting does not change the snapshot
  auto code = storage->answers().read(key);
  ASSERT_TRUE(code.has_value());
  storage->submissions().append_submission("s1", hash, *code);
  storage->answers().write(key, "def f(): return 2\n");

  const auto events = storage->submissions().read_submissions("s1");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].identity_hash, hash);
  EXPECT_EQ(events[0].submitted_at, now);
  EXPECT_EQ(tutor::test::read_text(layout.submissions_dir / "s1" / util::strip_padding(hash)), "def f(): pass\n");

  const auto statuses = storage->statuses("s1");
  EXPECT_EQ(statuses.at(hash), status::ExerciseStatus::OK);
  EXPECT_EQ(statuses.at("OTHER"), status::ExerciseStatus::MISSING);
}

TEST_F(StorageTest, StatusReloadsCatalog) {
  now = util::Timestamp(date(2024, 5, 2), hours(1));
  storage->submissions().append_submission("s1", "OLD", "code");
  EXPECT_EQ(storage->statuses("s1").at(hash), status::ExerciseStatus::LATE);

  storage->admin_log().grant_late_allowance("s1", hash);
  EXPECT_EQ(storage->statuses("s1").at(hash), status::ExerciseStatus::LATE_OK);

  // Dropping the mapping leaves the old submission unresolvable
  tutor::test::write_text(layout.hash_mappings_file, "{}");
  EXPECT_THROW(storage->statuses("s1"), IntegrityError);
}

TEST_F(StorageTest, UserDirectory) {
  EXPECT_TRUE(storage->user_directory().add({"s1", "Student One", "s1@example.com", users::EnrollmentState::Enrolled}));
  EXPECT_TRUE(storage->user_directory().find("s1").has_value());
}

TEST_F(StorageTest, PackageInfo) {
  EXPECT_EQ(storage->version(), "3.1");
  EXPECT_THROW(storage->tutorials_timestamp(), PackageError);
}

TEST_F(StorageTest, MissingExerciseTable) {
  std::filesystem::remove(layout.exercise_hashes_file);
  EXPECT_THROW(storage->load_catalog(), StoreError);
}
