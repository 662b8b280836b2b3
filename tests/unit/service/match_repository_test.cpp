/// @file match_repository_test.cpp
/// @brief Unit tests for record validation and InMemoryMatchRepository.

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "sfe/service/match_repository.hpp"

using namespace sfe::service;
using sfe::foundation::ErrorCode;
using sfe::model::makeFixture;
using sfe::model::makeResult;
using sfe::model::MatchRecord;

// ============================================================================
// validateMatchRecord
// ============================================================================

TEST(ValidateMatchRecordTest, AcceptsCompletedAndPending) {
    EXPECT_TRUE(validateMatchRecord(makeResult("2024-01-01", "PL", 2023, "A", "B", 0, 0)));
    EXPECT_TRUE(validateMatchRecord(makeFixture("2024-01-01", "PL", 2023, "A", "B")));
}

TEST(ValidateMatchRecordTest, RejectsEmptyTeam) {
    auto result = validateMatchRecord(makeFixture("2024-01-01", "PL", 2023, "", "B"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidMatchRecord);
}

TEST(ValidateMatchRecordTest, RejectsTeamPlayingItself) {
    auto result = validateMatchRecord(makeResult("2024-01-01", "PL", 2023, "A", "A", 1, 0));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidMatchRecord);
}

TEST(ValidateMatchRecordTest, RejectsSingleGoalCount) {
    MatchRecord record = makeFixture("2024-01-01", "PL", 2023, "A", "B");
    record.awayGoals = 1;
    auto result = validateMatchRecord(record);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidMatchRecord);
}

TEST(ValidateMatchRecordTest, RejectsNegativeGoals) {
    auto result = validateMatchRecord(makeResult("2024-01-01", "PL", 2023, "A", "B", -1, 0));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().subsystem(), "Repository");
}

// ============================================================================
// MatchQuery
// ============================================================================

TEST(MatchQueryTest, EmptyQueryMatchesEverything) {
    MatchQuery query;
    EXPECT_TRUE(query.matches(makeFixture("2024-01-01", "LaLiga", 2019, "A", "B")));
}

TEST(MatchQueryTest, FiltersByCompetitionAndSeason) {
    MatchQuery query;
    query.competition = "PL";
    query.season = 2023;
    EXPECT_TRUE(query.matches(makeFixture("2024-01-01", "PL", 2023, "A", "B")));
    EXPECT_FALSE(query.matches(makeFixture("2024-01-01", "PL", 2022, "A", "B")));
    EXPECT_FALSE(query.matches(makeFixture("2024-01-01", "FAC", 2023, "A", "B")));
}

// ============================================================================
// InMemoryMatchRepository
// ============================================================================

class InMemoryMatchRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        add(makeResult("2023-09-02", "PL", 2023, "C", "A", 1, 2));
        add(makeResult("2023-08-12", "PL", 2023, "A", "B", 3, 1));
        add(makeResult("2023-05-20", "PL", 2022, "A", "C", 0, 0));
        add(makeResult("2023-08-12", "FAC", 2023, "B", "D", 2, 2));
        add(makeFixture("2024-05-19", "PL", 2023, "B", "C"));
        add(makeFixture("2024-05-12", "PL", 2023, "A", "D"));
    }

    void add(const MatchRecord& record) {
        ASSERT_TRUE(repo_.addMatch(record).hasValue());
    }

    InMemoryMatchRepository repo_;
};

TEST_F(InMemoryMatchRepositoryTest, CountIncludesEveryRecord) {
    auto count = repo_.count();
    ASSERT_TRUE(count.hasValue());
    EXPECT_EQ(count.value(), 6u);
}

TEST_F(InMemoryMatchRepositoryTest, InvalidRecordIsNotStored) {
    auto result = repo_.addMatch(makeResult("2024-01-01", "PL", 2023, "A", "A", 1, 1));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(repo_.count().value(), 6u);
}

TEST_F(InMemoryMatchRepositoryTest, CompletedAscendingByDate) {
    auto completed = repo_.listCompleted(MatchQuery{});
    ASSERT_TRUE(completed.hasValue());
    const auto& list = completed.value();
    ASSERT_EQ(list.size(), 4u);
    EXPECT_EQ(list[0].date, "2023-05-20");
    EXPECT_EQ(list[3].date, "2023-09-02");
    for (const auto& match : list) {
        EXPECT_TRUE(match.isCompleted());
    }
}

TEST_F(InMemoryMatchRepositoryTest, SameDateKeepsInsertionOrder) {
    auto list = repo_.listCompleted(MatchQuery{}).value();
    ASSERT_EQ(list.size(), 4u);
    EXPECT_EQ(list[1].homeTeam, "A");
    EXPECT_EQ(list[2].homeTeam, "B");
}

TEST_F(InMemoryMatchRepositoryTest, PendingAscendingByDate) {
    auto pending = repo_.listPending(MatchQuery{});
    ASSERT_TRUE(pending.hasValue());
    ASSERT_EQ(pending.value().size(), 2u);
    EXPECT_EQ(pending.value()[0].homeTeam, "A");
    EXPECT_EQ(pending.value()[1].homeTeam, "B");
    EXPECT_TRUE(pending.value()[0].isPending());
}

TEST_F(InMemoryMatchRepositoryTest, FilterAppliesToBothListings) {
    MatchQuery query;
    query.competition = "PL";
    query.season = 2023;

    auto completed = repo_.listCompleted(query).value();
    ASSERT_EQ(completed.size(), 2u);
    for (const auto& match : completed) {
        EXPECT_EQ(match.competition, "PL");
        EXPECT_EQ(match.season, 2023);
    }

    query.season = 2022;
    EXPECT_TRUE(repo_.listPending(query).value().empty());
    EXPECT_EQ(repo_.listCompleted(query).value().size(), 1u);
}

TEST_F(InMemoryMatchRepositoryTest, LimitAppliesAfterOrdering) {
    MatchQuery query;
    query.limit = 2;
    auto list = repo_.listCompleted(query).value();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].date, "2023-05-20");
    EXPECT_EQ(list[1].date, "2023-08-12");
}

TEST(InMemoryMatchRepositoryConcurrencyTest, ConcurrentAddsAreAllStored) {
    InMemoryMatchRepository repo;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&repo, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto home = "H" + std::to_string(t);
                auto away = "A" + std::to_string(i);
                (void)repo.addMatch(makeResult("2024-01-01", "PL", 2023, home, away, 1, 0));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(repo.count().value(), static_cast<std::size_t>(kThreads * kPerThread));
}
