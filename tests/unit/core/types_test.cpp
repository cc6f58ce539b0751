#include <gtest/gtest.h>

#include "sift_core/errors.hpp"
#include "sift_core/types/task.hpp"

namespace sift_core {

TEST(TaskTypesTest, PriorityToString) {
  EXPECT_EQ(priority_to_string(1), "HIGH");
  EXPECT_EQ(priority_to_string(2), "MEDIUM");
  EXPECT_EQ(priority_to_string(3), "LOW");
  EXPECT_EQ(priority_to_string(0), "UNKNOWN");
  EXPECT_EQ(priority_to_string(7), "UNKNOWN");
}

TEST(TaskTypesTest, EmbeddingTextAppendsContext) {
  EXPECT_EQ(embedding_text("Reply to Bob", std::nullopt), "Reply to Bob");
  EXPECT_EQ(embedding_text("Reply to Bob", std::string("")), "Reply to Bob");
  EXPECT_EQ(embedding_text("Reply to Bob", std::string("budget thread")),
            "Reply to Bob Context: budget thread");
}

TEST(TaskTypesTest, CandidateDefaultsToMediumPriority) {
  TaskCandidate candidate;
  EXPECT_EQ(candidate.priority, static_cast<int>(TaskPriority::Medium));
  TaskRecord record;
  EXPECT_FALSE(record.id.has_value());
  EXPECT_FALSE(record.has_embedding());
}

TEST(ErrorsTest, DimensionMismatchCarriesBothSizes) {
  DimensionMismatchError error(1536, 768, "find_similar");
  EXPECT_EQ(error.expected(), 1536u);
  EXPECT_EQ(error.actual(), 768u);
  EXPECT_EQ(error.kind(), DbErrorKind::Schema);
  EXPECT_NE(std::string(error.what()).find("Expected 1536, got 768"), std::string::npos);

  const TaskStoreError &as_base = error;
  EXPECT_NE(std::string(as_base.what()).find("find_similar"), std::string::npos);
}

TEST(ErrorsTest, ClassifiesSqliteCodes) {
  EXPECT_EQ(classify_sqlite_code(SQLITE_BUSY), DbErrorKind::BusyOrLocked);
  EXPECT_EQ(classify_sqlite_code(SQLITE_NOTADB), DbErrorKind::NotADatabase);
  EXPECT_EQ(classify_sqlite_code(SQLITE_CONSTRAINT), DbErrorKind::Constraint);
  EXPECT_EQ(kind_to_string(DbErrorKind::Full), "full");
}

TEST(ErrorsTest, OnlyBusyOrLockedIsTransient) {
  EXPECT_TRUE(TaskStoreError("insert task", DbErrorKind::BusyOrLocked).is_transient());
  EXPECT_FALSE(TaskStoreError("insert task", DbErrorKind::Constraint).is_transient());
  EXPECT_FALSE(TaskStoreError("open database", DbErrorKind::NotADatabase).is_transient());
  EXPECT_FALSE(DimensionMismatchError(16, 8, "add_task").is_transient());
}

}  // namespace sift_core
