// File: tests/storage/memory_store_test.cpp
#include "storage/memory_store.hpp"
#include <gtest/gtest.h>

namespace motionrank {
namespace {

Solution CreateTestSolution(const std::string& name) {
    Solution solution;
    solution.SetName(name);
    solution.SetCssCode(".a { opacity: 0; }");
    return solution;
}

TEST(MemoryStoreTest, StartsEmpty) {
    MemoryStore store;
    EXPECT_TRUE(store.LoadAll().empty());
    EXPECT_TRUE(store.LoadFavorites().empty());
    EXPECT_TRUE(store.LoadEvents().empty());
    EXPECT_EQ(0u, store.GetStats().total_solutions);
}

TEST(MemoryStoreTest, LoadAllKeepsInsertionOrder) {
    MemoryStore store;
    Solution a = CreateTestSolution("a");
    Solution b = CreateTestSolution("b");
    Solution c = CreateTestSolution("c");

    store.Save(a);
    store.Save(b);
    store.Save(c);

    auto all = store.LoadAll();
    ASSERT_EQ(3u, all.size());
    EXPECT_EQ("a", all[0].GetName());
    EXPECT_EQ("b", all[1].GetName());
    EXPECT_EQ("c", all[2].GetName());
}

TEST(MemoryStoreTest, SaveExistingReplacesInPlace) {
    MemoryStore store;
    Solution a = CreateTestSolution("a");
    Solution b = CreateTestSolution("b");
    store.Save(a);
    store.Save(b);

    a.SetName("a2");
    EXPECT_TRUE(store.Save(a));

    auto all = store.LoadAll();
    ASSERT_EQ(2u, all.size());
    EXPECT_EQ("a2", all[0].GetName());
    EXPECT_EQ(3u, store.GetWriteCount());
}

TEST(MemoryStoreTest, RemoveUnknownReturnsFalse) {
    MemoryStore store;
    Solution a = CreateTestSolution("a");
    store.Save(a);

    EXPECT_FALSE(store.Remove(SolutionID::Generate()));
    EXPECT_TRUE(store.Remove(a.GetID()));
    EXPECT_TRUE(store.LoadAll().empty());
}

TEST(MemoryStoreTest, FavoritesAndEvents) {
    MemoryStore store;
    SolutionID id = SolutionID::Generate();
    store.SaveFavorites({id});

    BehaviorEvent event;
    event.action = ActionKind::APPLY;
    event.solution_id = id;
    store.AppendEvent(event);

    ASSERT_EQ(1u, store.LoadFavorites().size());
    EXPECT_EQ(id, store.LoadFavorites()[0]);
    ASSERT_EQ(1u, store.LoadEvents().size());
    EXPECT_EQ(ActionKind::APPLY, store.LoadEvents()[0].action);

    StoreStats stats = store.GetStats();
    EXPECT_EQ(1u, stats.total_favorites);
    EXPECT_EQ(1u, stats.total_events);

    store.Clear();
    EXPECT_TRUE(store.LoadFavorites().empty());
    EXPECT_TRUE(store.LoadEvents().empty());
}

} // namespace
} // namespace motionrank
