#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "sift_core/embedding/openai_embedding_provider.hpp"
#include "sift_core/errors.hpp"
#include "sift_core/task_store.hpp"

namespace sift_core {

using sift_tests::FakeEmbeddingProvider;
using sift_tests::TestUtilities;

class TaskStoreTest : public sift_tests::TaskStoreTestBase {
 protected:
  std::shared_ptr<TaskStore> make_store(std::shared_ptr<EmbeddingProvider> provider) {
    return std::make_shared<TaskStore>(*db_manager_, std::move(provider));
  }

  std::shared_ptr<FakeEmbeddingProvider> fake_ = std::make_shared<FakeEmbeddingProvider>(16);
};

TEST_F(TaskStoreTest, ModeFollowsProviderConfiguration) {
  auto text_store = make_store(nullptr);
  EXPECT_FALSE(text_store->semantic_search_enabled());
  EXPECT_EQ(text_store->strategy_name(), "text");

  auto vector_store = make_store(fake_);
  EXPECT_TRUE(vector_store->semantic_search_enabled());
  EXPECT_EQ(vector_store->strategy_name(), "vector");
}

TEST_F(TaskStoreTest, AddTask_AssignsIdTimestampAndEmbedding) {
  auto store = make_store(fake_);
  auto record = store->add_task(TestUtilities::create_test_candidate("Book dentist", 1),
                                std::string("Email from clinic"));

  ASSERT_TRUE(record.id.has_value());
  EXPECT_EQ(record.priority, 1);
  EXPECT_EQ(record.created_at.size(), 27u);
  EXPECT_EQ(record.embedding.size(), 16u);
  EXPECT_FALSE(record.similarity_distance.has_value());

  auto stored = store->get_task(*record.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->name, "Book dentist");
  EXPECT_EQ(stored->created_at, record.created_at);
  EXPECT_EQ(stored->embedding, record.embedding);
  EXPECT_EQ(*stored->email_context, "Email from clinic");
}

TEST_F(TaskStoreTest, AddTask_RejectsEmptyName) {
  auto store = make_store(fake_);
  EXPECT_THROW(store->add_task(TestUtilities::create_test_candidate("")), std::invalid_argument);
  EXPECT_EQ(store->count_tasks(), 0);
  EXPECT_EQ(fake_->calls(), 0);
}

TEST_F(TaskStoreTest, AddTask_StoresWithoutEmbeddingOnTransientFailure) {
  auto store = make_store(fake_);
  fake_->set_mode(FakeEmbeddingProvider::Mode::Transient);

  auto record = store->add_task(TestUtilities::create_test_candidate("Renew insurance"));
  EXPECT_FALSE(record.has_embedding());
  EXPECT_EQ(store->count_tasks(), 1);
  EXPECT_FALSE(store->get_task(*record.id)->has_embedding());
}

TEST_F(TaskStoreTest, AddTask_InvalidUtf8TextStillPersistsAndSearchFallsBack) {
  auto provider = std::make_shared<OpenAIEmbeddingProvider>(
      "sk-test", "http://127.0.0.1:9/v1", OpenAIEmbeddingProvider::DEFAULT_MODEL, 8, 1);
  auto store = make_store(provider);
  ASSERT_TRUE(store->semantic_search_enabled());

  const std::string name = "Reply to Jos\xe9 about budget";
  TaskRecord record;
  ASSERT_NO_THROW(record = store->add_task(TestUtilities::create_test_candidate(name)));
  ASSERT_TRUE(record.id.has_value());
  EXPECT_FALSE(record.has_embedding());
  EXPECT_EQ(store->count_tasks(), 1);

  std::vector<TaskRecord> results;
  ASSERT_NO_THROW(results = store->find_similar_tasks(name, 5));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(*results[0].id, *record.id);
  EXPECT_FALSE(results[0].similarity_distance.has_value());
}

TEST_F(TaskStoreTest, AddTask_WrongSizeVectorIsFatalAndWritesNothing) {
  auto store = make_store(fake_);
  fake_->set_override("Renew insurance", std::vector<float>(3, 1.0f));

  EXPECT_THROW(store->add_task(TestUtilities::create_test_candidate("Renew insurance")),
               DimensionMismatchError);
  EXPECT_EQ(store->count_tasks(), 0);
}

TEST_F(TaskStoreTest, GetRecent_NewestFirst) {
  auto store = make_store(nullptr);
  auto first = store->add_task(TestUtilities::create_test_candidate("First"));
  auto second = store->add_task(TestUtilities::create_test_candidate("Second"));
  auto third = store->add_task(TestUtilities::create_test_candidate("Third"));

  auto recent = store->get_recent_tasks(10);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(*recent[0].id, *third.id);
  EXPECT_EQ(*recent[1].id, *second.id);
  EXPECT_EQ(*recent[2].id, *first.id);
  for (const auto &task : recent) {
    EXPECT_FALSE(task.similarity_distance.has_value());
  }
  EXPECT_EQ(store->get_recent_tasks(1).size(), 1u);
  EXPECT_TRUE(store->get_recent_tasks(0).empty());
}

TEST_F(TaskStoreTest, FindSimilar_ExactNameComesFirstWithZeroDistance) {
  auto store = make_store(fake_);
  store->add_task(TestUtilities::create_test_candidate("Call the landlord"));
  auto target = store->add_task(TestUtilities::create_test_candidate("Prepare quarterly budget"));
  store->add_task(TestUtilities::create_test_candidate("Water the garden"));

  auto results = store->find_similar_tasks("Prepare quarterly budget", 3);
  ASSERT_FALSE(results.empty());
  EXPECT_EQ(*results[0].id, *target.id);
  ASSERT_TRUE(results[0].similarity_distance.has_value());
  EXPECT_LT(*results[0].similarity_distance, 1e-6f);
  for (size_t i = 1; i < results.size(); ++i) {
    EXPECT_LE(*results[i - 1].similarity_distance, *results[i].similarity_distance);
  }
}

TEST_F(TaskStoreTest, FindSimilar_TextModeReturnsMatchesByRecency) {
  auto store = make_store(nullptr);
  auto older = store->add_task(TestUtilities::create_test_candidate("Submit report"));
  auto newer = store->add_task(TestUtilities::create_test_candidate("Submit the report"));
  store->add_task(TestUtilities::create_test_candidate("Buy groceries"));

  auto results = store->find_similar_tasks("report", 5);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(*results[0].id, *newer.id);
  EXPECT_EQ(*results[1].id, *older.id);
  EXPECT_FALSE(results[0].similarity_distance.has_value());
  EXPECT_FALSE(results[1].similarity_distance.has_value());
}

TEST_F(TaskStoreTest, FindSimilar_QueryEmbeddingFailureFallsBackToText) {
  auto store = make_store(fake_);
  store->add_task(TestUtilities::create_test_candidate("Submit report"));
  fake_->set_mode(FakeEmbeddingProvider::Mode::Transient);

  auto results = store->find_similar_tasks("report", 5);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(results[0].similarity_distance.has_value());
}

TEST_F(TaskStoreTest, Delete_RemovesFromRowsAndIndex) {
  auto store = make_store(fake_);
  auto doomed = store->add_task(TestUtilities::create_test_candidate("Cancel gym membership"));
  auto kept = store->add_task(TestUtilities::create_test_candidate("Renew library card"));

  EXPECT_TRUE(store->delete_task(*doomed.id));
  EXPECT_FALSE(store->get_task(*doomed.id).has_value());

  auto similar = store->find_similar_tasks("Cancel gym membership", 5);
  for (const auto &task : similar) {
    EXPECT_NE(*task.id, *doomed.id);
  }
  for (const auto &task : store->get_recent_tasks(10)) {
    EXPECT_NE(*task.id, *doomed.id);
  }
  EXPECT_EQ(store->count_tasks(), 1);
  EXPECT_TRUE(store->get_task(*kept.id).has_value());
}

TEST_F(TaskStoreTest, Delete_UnknownIdIsFalseAndChangesNothing) {
  auto store = make_store(nullptr);
  store->add_task(TestUtilities::create_test_candidate("Keep me"));

  EXPECT_FALSE(store->delete_task(123456));
  EXPECT_FALSE(store->complete_task(123456));
  EXPECT_EQ(store->count_tasks(), 1);
}

TEST_F(TaskStoreTest, Delete_HighestIdIsNeverReused) {
  auto store = make_store(nullptr);
  auto first = store->add_task(TestUtilities::create_test_candidate("Call plumber"));
  auto second = store->add_task(TestUtilities::create_test_candidate("Pay electricity bill"));
  ASSERT_TRUE(store->delete_task(*second.id));

  auto third = store->add_task(TestUtilities::create_test_candidate("Order printer ink"));
  EXPECT_GT(*third.id, *second.id);
  EXPECT_GT(*third.id, *first.id);
}

TEST_F(TaskStoreTest, Complete_RemovesTask) {
  auto store = make_store(nullptr);
  auto task = store->add_task(TestUtilities::create_test_candidate("File expenses"));

  EXPECT_TRUE(store->complete_task(*task.id));
  EXPECT_FALSE(store->get_task(*task.id).has_value());
}

TEST_F(TaskStoreTest, Reopen_RebuildsIndexFromStoredVectors) {
  auto target_id = *make_store(fake_)
                        ->add_task(TestUtilities::create_test_candidate("Schedule car service"))
                        .id;

  reopen_database();
  auto reopened = make_store(std::make_shared<FakeEmbeddingProvider>(16));
  auto results = reopened->find_similar_tasks("Schedule car service", 1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(*results[0].id, target_id);
  EXPECT_LT(*results[0].similarity_distance, 1e-6f);
}

TEST_F(TaskStoreTest, Reopen_WithOtherDimensionIsFatal) {
  auto wide = std::make_shared<FakeEmbeddingProvider>(1536, "text-embedding-3-small");
  make_store(wide)->add_task(TestUtilities::create_test_candidate("Reply to Bob"));

  reopen_database();
  auto narrow = std::make_shared<FakeEmbeddingProvider>(8, "small-local-model");
  auto store = make_store(narrow);

  EXPECT_THROW(store->find_similar_tasks("Reply to Bob", 5), DimensionMismatchError);
  EXPECT_THROW(store->add_task(TestUtilities::create_test_candidate("Another task")),
               DimensionMismatchError);
  EXPECT_EQ(store->count_tasks(), 1);
  // Reads that need no similarity keep working
  EXPECT_EQ(store->get_recent_tasks(5).size(), 1u);
}

TEST_F(TaskStoreTest, Reopen_InTextModeIgnoresStoredVectors) {
  make_store(fake_)->add_task(TestUtilities::create_test_candidate("Submit report"));

  reopen_database();
  auto store = make_store(nullptr);
  auto results = store->find_similar_tasks("report", 5);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(results[0].similarity_distance.has_value());
}

TEST_F(TaskStoreTest, EnsureSchemaTwice_KeepsData) {
  auto store = make_store(nullptr);
  store->add_task(TestUtilities::create_test_candidate("Survives schema check"));

  db_manager_->ensure_schema();
  db_manager_->ensure_schema();

  EXPECT_EQ(store->count_tasks(), 1);
  PooledConnection conn(*db_manager_);
  int tables = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='tasks'" >> tables;
  EXPECT_EQ(tables, 1);
}

TEST_F(TaskStoreTest, ConcurrentAddsAndQueries) {
  auto store = make_store(fake_);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([store, t]() {
      for (int i = 0; i < 10; ++i) {
        store->add_task(TestUtilities::create_test_candidate("task " + std::to_string(t) + " " +
                                                             std::to_string(i)));
        store->find_similar_tasks("task", 3);
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(store->count_tasks(), 40);
  EXPECT_EQ(store->get_recent_tasks(100).size(), 40u);
}

}  // namespace sift_core
