#include <gtest/gtest.h>
#include "engine/TaskRegistry.hpp"

using namespace sf::engine;
using namespace sf::transfer::model;

namespace {
std::shared_ptr<TaskEntry> entry(const std::string& id, const std::string& owner) {
    TaskSnapshot t;
    t.id = id;
    t.owner = owner;
    return std::make_shared<TaskEntry>(t);
}
}

class TaskRegistryTest : public ::testing::Test {};

TEST_F(TaskRegistryTest, Insert_RejectsHeldIds) {
    TaskRegistry r(10);
    EXPECT_TRUE(r.insert(entry("t1", "alice")));
    EXPECT_FALSE(r.insert(entry("t1", "bob")));
    EXPECT_EQ(r.find("t1")->snapshot().owner, "alice");
}

TEST_F(TaskRegistryTest, List_FiltersByOwnerInInsertionOrder) {
    TaskRegistry r(10);
    r.insert(entry("t3", "alice"));
    r.insert(entry("t1", "bob"));
    r.insert(entry("t2", "alice"));

    const auto alice = r.list("alice");
    ASSERT_EQ(alice.size(), 2u);
    EXPECT_EQ(alice[0].id, "t3");
    EXPECT_EQ(alice[1].id, "t2");
    EXPECT_TRUE(r.list("carol").empty());
    EXPECT_EQ(r.all().size(), 3u);
}

TEST_F(TaskRegistryTest, Retire_EvictsOldestBeyondLimit) {
    TaskRegistry r(2);
    for (const auto* id : {"t1", "t2", "t3", "live"}) r.insert(entry(id, "alice"));

    r.retire("t1");
    r.retire("t2");
    EXPECT_EQ(r.size(), 4u);

    r.retire("t3");
    EXPECT_EQ(r.size(), 3u);
    EXPECT_EQ(r.historySize(), 2u);
    EXPECT_EQ(r.find("t1"), nullptr);
    EXPECT_NE(r.find("live"), nullptr);
    EXPECT_EQ(r.all().size(), 3u);
}

TEST_F(TaskRegistryTest, Retire_IsIdempotent) {
    TaskRegistry r(1);
    r.insert(entry("t1", "alice"));
    r.insert(entry("t2", "alice"));

    r.retire("t1");
    r.retire("t1");
    EXPECT_EQ(r.historySize(), 1u);
    EXPECT_NE(r.find("t1"), nullptr);

    r.retire("unknown");
    EXPECT_EQ(r.historySize(), 1u);
}

TEST_F(TaskRegistryTest, Snapshot_ReflectsOnlyPublishedState) {
    TaskRegistry r(10);
    const auto e = entry("t1", "alice");
    r.insert(e);

    {
        std::scoped_lock lock(e->mutex);
        e->task.state = State::Downloading;
        EXPECT_EQ(r.find("t1")->snapshot().state, State::Queued);
        e->publishSnapshot();
    }
    EXPECT_EQ(r.find("t1")->snapshot().state, State::Downloading);
}
