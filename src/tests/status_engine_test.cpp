#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include "status/status_engine.hpp"
#include "error/store_error.hpp"
#include "test_utils.hpp"

using namespace tutor;
using namespace tutor::status;
using tutor::test::TempDirectory;
using boost::gregorian::date;
using boost::posix_time::hours;
using boost::posix_time::minutes;

namespace {

// H is due 2024-05-01 23:00, G is due 2024-05-15 09:00
const char* const HASHES =
    "H 23_01/05/24 CSSE1001 Functions Ex1\n"
    "G 09_15/05/24 CSSE1001 Functions Ex2\n";

const char* const MAPPINGS = R"({"H_OLD": "H", "RETIRED": null})";

} // namespace

class StatusEngineTest : public ::testing::Test {
protected:
  TempDirectory temp_dir{"status_engine_test"};
  util::Timestamp now{date(2024, 5, 1), hours(22)};
  std::unique_ptr<submission::SubmissionLog> submissions;
  std::unique_ptr<submission::AdminLog> admin_log;
  std::unique_ptr<StatusEngine> engine;
  int catalog_loads = 0;

  void SetUp() override {
    tutor::test::init_test_logging();
    const auto dir = temp_dir.path() / "submissions";
    submissions = std::make_unique<submission::SubmissionLog>(dir, [this]() { return now; });
    admin_log = std::make_unique<submission::AdminLog>(dir);
    engine = std::make_unique<StatusEngine>(
        [this]() {
          ++catalog_loads;
          std::istringstream hashes(HASHES);
          std::istringstream mappings(MAPPINGS);
          return catalog::ExerciseCatalog(catalog::ExerciseCatalog::parse_hashes(hashes, "hashes"),
                                          catalog::ExerciseCatalog::parse_mappings(mappings, "mappings"));
        },
        *submissions, *admin_log);
  }

  void submit_at(const util::Timestamp& when, const std::string& hash) {
    now = when;
    submissions->append_submission("s1", hash, "code");
  }
};

TEST_F(StatusEngineTest, AllMissingWithoutSubmissions) {
  const auto statuses = engine->compute_statuses("s1");
  ASSERT_EQ(statuses.size(), 2u);
  EXPECT_EQ(statuses.at("H"), ExerciseStatus::MISSING);
  EXPECT_EQ(statuses.at("G"), ExerciseStatus::MISSING);
  EXPECT_EQ(catalog_loads, 1);
}

TEST_F(StatusEngineTest, OnTimeSubmissionIsOk) {
  submit_at(util::Timestamp(date(2024, 5, 1), hours(22)), "H");
  const auto statuses = engine->compute_statuses("s1");
  EXPECT_EQ(statuses.at("H"), ExerciseStatus::OK);
  EXPECT_EQ(statuses.at("G"), ExerciseStatus::MISSING);
}

TEST_F(StatusEngineTest, SubmissionAtDeadlineIsOk) {
  submit_at(util::Timestamp(date(2024, 5, 1), hours(23)), "H");
  EXPECT_EQ(engine->compute_statuses("s1").at("H"), ExerciseStatus::OK);
}

TEST_F(StatusEngineTest, LateSubmission) {
  submit_at(util::Timestamp(date(2024, 5, 2), hours(0)), "H");
  EXPECT_EQ(engine->compute_statuses("s1").at("H"), ExerciseStatus::LATE);
}

TEST_F(StatusEngineTest, LateSubmissionWithAllowance) {
  admin_log->grant_late_allowance("s1", "H");
  submit_at(util::Timestamp(date(2024, 5, 2), hours(0)), "H");
  EXPECT_EQ(engine->compute_statuses("s1").at("H"), ExerciseStatus::LATE_OK);
}

TEST_F(StatusEngineTest, AllowanceForAnotherUserDoesNotApply) {
  admin_log->grant_late_allowance("s2", "H");
  submit_at(util::Timestamp(date(2024, 5, 2), hours(0)), "H");
  EXPECT_EQ(engine->compute_statuses("s1").at("H"), ExerciseStatus::LATE);
}

TEST_F(StatusEngineTest, StaleHashResolvesThroughChain) {
  submit_at(util::Timestamp(date(2024, 5, 2), hours(0)), "H_OLD");
  admin_log->grant_late_allowance("s1", "H_OLD");

  const auto statuses = engine->compute_statuses("s1");
  EXPECT_EQ(statuses.count("H_OLD"), 0u);
  EXPECT_EQ(statuses.at("H"), ExerciseStatus::LATE_OK);
}

TEST_F(StatusEngineTest, LastEventInLogOrderWins) {
  submit_at(util::Timestamp(date(2024, 5, 2), hours(0)), "H");
  // Earlier timestamp appended later still decides the status
  submit_at(util::Timestamp(date(2024, 5, 1), hours(20)), "H");
  EXPECT_EQ(engine->compute_statuses("s1").at("H"), ExerciseStatus::OK);

  submit_at(util::Timestamp(date(2024, 5, 3), hours(0)), "H_OLD");
  EXPECT_EQ(engine->compute_statuses("s1").at("H"), ExerciseStatus::LATE);
}

TEST_F(StatusEngineTest, UnresolvableSubmissionIsIntegrityFault) {
  submit_at(util::Timestamp(date(2024, 5, 1), hours(20)), "RETIRED");
  try {
    engine->compute_statuses("s1");
    FAIL() << "Expected IntegrityError";
  } catch (const IntegrityError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Integrity);
    EXPECT_EQ(e.context(), "RETIRED");
  }
}

TEST_F(StatusEngineTest, UsesSuppliedCatalog) {
  submit_at(util::Timestamp(date(2024, 5, 1), hours(20)), "H");
  std::istringstream hashes("H 23_01/05/24 CSSE1001 Functions Ex1\n");
  const catalog::ExerciseCatalog catalog(catalog::ExerciseCatalog::parse_hashes(hashes, "hashes"), {});

  const auto statuses = engine->compute_statuses(catalog, "s1");
  ASSERT_EQ(statuses.size(), 1u);
  EXPECT_EQ(statuses.at("H"), ExerciseStatus::OK);
  EXPECT_EQ(catalog_loads, 0);
}

TEST(ExerciseStatusTest, Classify) {
  const util::Timestamp due(date(2024, 5, 1), hours(23));
  EXPECT_EQ(StatusEngine::classify(due - minutes(1), due, false), ExerciseStatus::OK);
  EXPECT_EQ(StatusEngine::classify(due, due, false), ExerciseStatus::OK);
  EXPECT_EQ(StatusEngine::classify(due + minutes(1), due, false), ExerciseStatus::LATE);
  EXPECT_EQ(StatusEngine::classify(due + minutes(1), due, true), ExerciseStatus::LATE_OK);
  EXPECT_EQ(StatusEngine::classify(due - minutes(1), due, true), ExerciseStatus::OK);
}

TEST(ExerciseStatusTest, Names) {
  std::ostringstream out;
  out << ExerciseStatus::LATE_OK;
  EXPECT_EQ(out.str(), "LATE_OK");
  EXPECT_STREQ(status_to_string(ExerciseStatus::MISSING), "MISSING");
}
