// File: tests/storage/sqlite_store_test.cpp
#include "storage/sqlite_store.hpp"
#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <stdexcept>

namespace motionrank {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

std::string GetTempDbPath() {
    static int counter = 0;
    return "/tmp/test_motionrank_" + std::to_string(std::time(nullptr)) +
           "_" + std::to_string(counter++) + ".db";
}

void RemoveDatabase(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

Solution CreateTestSolution() {
    Solution solution;
    solution.SetName("Fade in");
    solution.SetDescription("Fades the hero banner in");
    solution.SetAuthor("tester");
    solution.SetCategory(SolutionCategory::ENTRANCE);
    solution.SetTechStack(TechStack::GSAP);
    solution.SetHtmlCode("<div class=\"hero\"></div>");
    solution.SetCssCode(".hero { opacity: 0; }");
    solution.SetJsCode("gsap.to('.hero', { opacity: 1 });");
    solution.SetTags({"fade", "hero"});
    solution.SetMetrics(SolutionMetrics(80.0f, 70.0f, 60.0f, 90.0f, 50.0f));
    solution.AddUserRating(4.0f);
    solution.AddUserRating(5.0f);
    solution.IncrementUsage();
    solution.AddFavorite();
    solution.SetVersion("1.0.3");
    solution.SetParentID(SolutionID::Generate());
    solution.AddChildID(SolutionID::Generate());
    solution.SetThumbnailPath(std::string("thumbs/fade.png"));
    return solution;
}

class SqliteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = GetTempDbPath();
        config_.db_path = db_path_;
    }

    void TearDown() override {
        RemoveDatabase(db_path_);
    }

    std::string db_path_;
    SqliteStore::Config config_;
};

// ============================================================================
// Solution Tests
// ============================================================================

TEST_F(SqliteStoreTest, ConstructorCreatesDatabase) {
    {
        SqliteStore store(config_);
        EXPECT_EQ(0u, store.GetStats().total_solutions);
    }
    EXPECT_TRUE(std::filesystem::exists(db_path_));
}

TEST_F(SqliteStoreTest, UnopenablePathThrows) {
    SqliteStore::Config config;
    config.db_path = "/nonexistent_dir_motionrank/x/y.db";
    EXPECT_THROW(SqliteStore store(config), std::runtime_error);
}

TEST_F(SqliteStoreTest, SolutionSurvivesReopen) {
    Solution original = CreateTestSolution();
    {
        SqliteStore store(config_);
        ASSERT_TRUE(store.Save(original));
    }

    SqliteStore store(config_);
    auto loaded = store.LoadAll();
    ASSERT_EQ(1u, loaded.size());
    const Solution& s = loaded[0];

    EXPECT_EQ(original.GetID(), s.GetID());
    EXPECT_EQ("Fade in", s.GetName());
    EXPECT_EQ("tester", s.GetAuthor());
    EXPECT_TRUE(s.HasSameContent(original));
    EXPECT_EQ(original.GetTags(), s.GetTags());
    EXPECT_EQ(original.GetMetrics(), s.GetMetrics());
    EXPECT_FLOAT_EQ(original.GetMetrics().GetOverall(), s.GetMetrics().GetOverall());
    EXPECT_EQ(original.GetQualityTier(), s.GetQualityTier());
    EXPECT_FLOAT_EQ(4.5f, s.GetUserRating());
    EXPECT_EQ(2u, s.GetRatingCount());
    EXPECT_EQ(1u, s.GetUsageCount());
    EXPECT_EQ(1u, s.GetFavoriteCount());
    EXPECT_EQ("1.0.3", s.GetVersion());
    EXPECT_EQ(original.GetParentID(), s.GetParentID());
    EXPECT_EQ(original.GetChildIDs(), s.GetChildIDs());
    EXPECT_EQ(original.GetThumbnailPath(), s.GetThumbnailPath());
    EXPECT_FALSE(s.GetPreviewPath().has_value());
    EXPECT_EQ(original.GetCreatedAt(), s.GetCreatedAt());
    EXPECT_EQ(original.GetUpdatedAt(), s.GetUpdatedAt());
}

TEST_F(SqliteStoreTest, SaveIsUpsertKeepingOrder) {
    SqliteStore store(config_);
    Solution a = CreateTestSolution();
    Solution b = CreateTestSolution();
    store.Save(a);
    store.Save(b);

    a.SetName("renamed");
    a.SetTags({"only"});
    store.Save(a);

    auto loaded = store.LoadAll();
    ASSERT_EQ(2u, loaded.size());
    EXPECT_EQ(a.GetID(), loaded[0].GetID());
    EXPECT_EQ("renamed", loaded[0].GetName());
    EXPECT_EQ(std::vector<std::string>{"only"}, loaded[0].GetTags());
    EXPECT_EQ(b.GetID(), loaded[1].GetID());
}

TEST_F(SqliteStoreTest, RemoveDeletesSolution) {
    SqliteStore store(config_);
    Solution a = CreateTestSolution();
    store.Save(a);

    EXPECT_TRUE(store.Remove(a.GetID()));
    EXPECT_TRUE(store.LoadAll().empty());
}

TEST_F(SqliteStoreTest, CorruptRowIsSkipped) {
    SqliteStore store(config_);
    Solution good = CreateTestSolution();
    store.Save(good);
    Solution bad = CreateTestSolution();
    store.Save(bad);

    std::string sql = "UPDATE solutions SET category = 'bogus' WHERE id = '" +
                      bad.GetID().value() + "';";
    ASSERT_EQ(SQLITE_OK, sqlite3_exec(store.GetHandle(), sql.c_str(), nullptr, nullptr, nullptr));

    auto loaded = store.LoadAll();
    ASSERT_EQ(1u, loaded.size());
    EXPECT_EQ(good.GetID(), loaded[0].GetID());
    EXPECT_EQ(1u, store.GetStats().skipped_records);
}

TEST_F(SqliteStoreTest, MalformedTimestampIsSkipped) {
    SqliteStore store(config_);
    Solution bad = CreateTestSolution();
    store.Save(bad);

    ASSERT_EQ(SQLITE_OK, sqlite3_exec(store.GetHandle(),
        "UPDATE solutions SET created_at = 'last tuesday';", nullptr, nullptr, nullptr));

    EXPECT_TRUE(store.LoadAll().empty());
}

TEST_F(SqliteStoreTest, StoredOverallIsRecomputed) {
    SqliteStore store(config_);
    Solution solution = CreateTestSolution();
    store.Save(solution);

    ASSERT_EQ(SQLITE_OK, sqlite3_exec(store.GetHandle(),
        "UPDATE solutions SET overall_score = 999.0;", nullptr, nullptr, nullptr));

    auto loaded = store.LoadAll();
    ASSERT_EQ(1u, loaded.size());
    EXPECT_FLOAT_EQ(solution.GetMetrics().GetOverall(), loaded[0].GetMetrics().GetOverall());
}

// ============================================================================
// Favorites and Events
// ============================================================================

TEST_F(SqliteStoreTest, FavoritesKeepOrder) {
    std::vector<SolutionID> favorites = {
        SolutionID::Generate(), SolutionID::Generate(), SolutionID::Generate(),
    };
    {
        SqliteStore store(config_);
        ASSERT_TRUE(store.SaveFavorites(favorites));
        ASSERT_TRUE(store.SaveFavorites(favorites));  // Replaces, does not append
    }

    SqliteStore store(config_);
    EXPECT_EQ(favorites, store.LoadFavorites());
    EXPECT_EQ(3u, store.GetStats().total_favorites);
}

TEST_F(SqliteStoreTest, EventsRoundTrip) {
    BehaviorEvent view;
    view.action = ActionKind::VIEW;
    view.solution_id = SolutionID::Generate();
    view.category = SolutionCategory::EXIT;
    view.tech_stack = TechStack::SVG_ANIMATION;
    view.timestamp = Timestamp::FromMicros(1714558830123456LL);

    BehaviorEvent rate = view;
    rate.action = ActionKind::RATE;
    rate.rating = 3.5f;
    {
        SqliteStore store(config_);
        ASSERT_TRUE(store.AppendEvent(view));
        ASSERT_TRUE(store.AppendEvent(rate));
    }

    SqliteStore store(config_);
    auto events = store.LoadEvents();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(ActionKind::VIEW, events[0].action);
    EXPECT_EQ(view.solution_id, events[0].solution_id);
    EXPECT_EQ(SolutionCategory::EXIT, events[0].category);
    EXPECT_EQ(TechStack::SVG_ANIMATION, events[0].tech_stack);
    EXPECT_FALSE(events[0].rating.has_value());
    EXPECT_EQ(view.timestamp, events[0].timestamp);
    ASSERT_TRUE(events[1].rating.has_value());
    EXPECT_FLOAT_EQ(3.5f, *events[1].rating);
}

TEST_F(SqliteStoreTest, ClearEmptiesEverything) {
    SqliteStore store(config_);
    Solution solution = CreateTestSolution();
    store.Save(solution);
    store.SaveFavorites({solution.GetID()});
    BehaviorEvent event;
    event.solution_id = solution.GetID();
    store.AppendEvent(event);

    store.Clear();

    StoreStats stats = store.GetStats();
    EXPECT_EQ(0u, stats.total_solutions);
    EXPECT_EQ(0u, stats.total_favorites);
    EXPECT_EQ(0u, stats.total_events);
    EXPECT_GT(stats.disk_usage_bytes, 0u);
}

} // namespace
} // namespace motionrank
