#include <gtest/gtest.h>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "sift_services/deduplication_service.hpp"

namespace sift_services {

using sift_tests::FakeEmbeddingProvider;
using sift_tests::MockUtilities::axis_vector;
using sift_tests::TestUtilities;

class DeduplicationServiceTest : public sift_tests::TaskStoreTestBase {
 protected:
  static constexpr int kDim = 16;

  void use_store(std::shared_ptr<sift_core::EmbeddingProvider> provider) {
    task_store_ = std::make_shared<sift_core::TaskStore>(*db_manager_, std::move(provider));
    service_ = std::make_unique<DeduplicationService>(task_store_);
  }

  std::shared_ptr<FakeEmbeddingProvider> fake_ = std::make_shared<FakeEmbeddingProvider>(kDim);
  std::shared_ptr<sift_core::TaskStore> task_store_;
  std::unique_ptr<DeduplicationService> service_;
};

TEST_F(DeduplicationServiceTest, NearDuplicateIsSkipped) {
  fake_->set_override("Reply to Bob about budget", axis_vector(kDim, 0));
  fake_->set_override("Reply to Bob re: budget", axis_vector(kDim, 0, 1, 0.2f));
  use_store(fake_);

  auto first = service_->ingest(TestUtilities::create_test_candidate("Reply to Bob about budget"));
  ASSERT_TRUE(first.added);

  auto second = service_->ingest(TestUtilities::create_test_candidate("Reply to Bob re: budget"));
  EXPECT_FALSE(second.added);
  EXPECT_FALSE(second.record.has_value());
  ASSERT_TRUE(second.skipped.has_value());
  EXPECT_EQ(second.skipped->candidate.name, "Reply to Bob re: budget");
  EXPECT_EQ(*second.skipped->duplicate_of.id, *first.record->id);
  EXPECT_LT(*second.skipped->duplicate_of.similarity_distance,
            DeduplicationService::DEFAULT_DUPLICATE_THRESHOLD);

  EXPECT_EQ(task_store_->count_tasks(), 1);
}

TEST_F(DeduplicationServiceTest, DistantTaskIsAdded) {
  fake_->set_override("Reply to Bob about budget", axis_vector(kDim, 0));
  fake_->set_override("Book a table for Friday", axis_vector(kDim, 5));
  use_store(fake_);

  service_->ingest(TestUtilities::create_test_candidate("Reply to Bob about budget"));
  auto outcome = service_->ingest(TestUtilities::create_test_candidate("Book a table for Friday"));

  EXPECT_TRUE(outcome.added);
  EXPECT_EQ(task_store_->count_tasks(), 2);
}

TEST_F(DeduplicationServiceTest, TextFallbackNeverSuppresses) {
  use_store(nullptr);

  EXPECT_TRUE(service_->ingest(TestUtilities::create_test_candidate("Submit report")).added);
  EXPECT_TRUE(service_->ingest(TestUtilities::create_test_candidate("Submit the report")).added);
  // Even an identical name is kept: text matches carry no distance
  EXPECT_TRUE(service_->ingest(TestUtilities::create_test_candidate("Submit report")).added);

  auto results = task_store_->find_similar_tasks("report", 5);
  EXPECT_EQ(results.size(), 3u);
}

TEST_F(DeduplicationServiceTest, ProviderOutageDoesNotSuppress) {
  use_store(fake_);
  service_->ingest(TestUtilities::create_test_candidate("Pay electricity bill"));
  fake_->set_mode(FakeEmbeddingProvider::Mode::Transient);

  auto outcome = service_->ingest(TestUtilities::create_test_candidate("Pay electricity bill"));
  EXPECT_TRUE(outcome.added);
  EXPECT_EQ(task_store_->count_tasks(), 2);
}

TEST_F(DeduplicationServiceTest, IngestBatch_ChecksAgainstEarlierEntries) {
  fake_->set_override("Reply to Bob about budget", axis_vector(kDim, 0));
  fake_->set_override("Reply to Bob re: budget", axis_vector(kDim, 0, 1, 0.2f));
  fake_->set_override("Order printer toner", axis_vector(kDim, 7));
  use_store(fake_);

  std::vector<PendingTask> batch = {
      {TestUtilities::create_test_candidate("Reply to Bob about budget"), std::nullopt},
      {TestUtilities::create_test_candidate("Reply to Bob re: budget"), std::nullopt},
      {TestUtilities::create_test_candidate("Order printer toner"), std::nullopt},
  };

  auto report = service_->ingest_batch(batch);
  ASSERT_EQ(report.added.size(), 2u);
  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.added[0].name, "Reply to Bob about budget");
  EXPECT_EQ(report.added[1].name, "Order printer toner");
  EXPECT_EQ(report.skipped[0].candidate.name, "Reply to Bob re: budget");
}

TEST_F(DeduplicationServiceTest, IsDuplicate_RequiresDistanceStrictlyBelowThreshold) {
  use_store(nullptr);
  sift_core::TaskRecord nearest;

  EXPECT_FALSE(service_->is_duplicate(nearest));
  nearest.similarity_distance = 0.05f;
  EXPECT_TRUE(service_->is_duplicate(nearest));
  nearest.similarity_distance = service_->duplicate_threshold();
  EXPECT_FALSE(service_->is_duplicate(nearest));
}

TEST_F(DeduplicationServiceTest, Constructor_ValidatesArguments) {
  use_store(nullptr);
  EXPECT_THROW(DeduplicationService(nullptr), std::invalid_argument);
  EXPECT_THROW(DeduplicationService(task_store_, 0.0f), std::invalid_argument);
  EXPECT_THROW(DeduplicationService(task_store_, 2.5f), std::invalid_argument);
  EXPECT_FLOAT_EQ(DeduplicationService(task_store_, 0.3f).duplicate_threshold(), 0.3f);
}

}  // namespace sift_services
