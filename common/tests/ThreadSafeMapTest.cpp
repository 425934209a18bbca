#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

struct Entry {
    int version;
    std::string state;

    Entry(int v = 0, const std::string& s = "") : version(v), state(s) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Entry> map;
};

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("fp-1", std::make_shared<Entry>(1, "pending"));

    auto found = map.find("fp-1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->version, 1);
    EXPECT_EQ(found->state, "pending");
    EXPECT_EQ(map.find("fp-2"), nullptr);
}

TEST_F(ThreadSafeMapTest, InsertReplacesWholeValue) {
    map.insert("fp-1", std::make_shared<Entry>(1, "pending"));
    auto before = map.find("fp-1");

    map.insert("fp-1", std::make_shared<Entry>(2, "confirmed"));

    // Старая версия у читателя не меняется
    EXPECT_EQ(before->state, "pending");
    EXPECT_EQ(map.find("fp-1")->state, "confirmed");
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, InsertIfAbsent) {
    EXPECT_TRUE(map.insertIfAbsent("fp-1", std::make_shared<Entry>(1, "first")));
    EXPECT_FALSE(map.insertIfAbsent("fp-1", std::make_shared<Entry>(2, "second")));
    EXPECT_EQ(map.find("fp-1")->state, "first");
}

TEST_F(ThreadSafeMapTest, RemoveAndContains) {
    map.insert("fp-1", std::make_shared<Entry>(1, "pending"));

    EXPECT_TRUE(map.contains("fp-1"));
    EXPECT_TRUE(map.remove("fp-1"));
    EXPECT_FALSE(map.remove("fp-1"));
    EXPECT_FALSE(map.contains("fp-1"));
}

TEST_F(ThreadSafeMapTest, RemoveIf) {
    map.insert("fp-1", std::make_shared<Entry>(1, "confirmed"));
    map.insert("fp-2", std::make_shared<Entry>(1, "pending"));
    map.insert("fp-3", std::make_shared<Entry>(1, "failed"));

    auto removed = map.removeIf([](const std::string&, const Entry& e) { return e.state != "pending"; });

    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(map.size(), 1u);
    EXPECT_TRUE(map.contains("fp-2"));
}

TEST_F(ThreadSafeMapTest, GetAllAndClear) {
    map.insert("fp-1", std::make_shared<Entry>(1));
    map.insert("fp-2", std::make_shared<Entry>(2));

    EXPECT_EQ(map.getAll().size(), 2u);

    map.clear();
    EXPECT_EQ(map.size(), 0u);
    EXPECT_TRUE(map.getAll().empty());
}

TEST_F(ThreadSafeMapTest, ConcurrentWritersOnDisjointKeys) {
    const int WRITERS = 5;
    const int PER_WRITER = 100;

    std::vector<std::thread> threads;
    for (int w = 0; w < WRITERS; ++w) {
        threads.emplace_back([this, w]() {
            for (int i = 0; i < PER_WRITER; ++i) {
                map.insert("w" + std::to_string(w) + "-" + std::to_string(i),
                           std::make_shared<Entry>(w * 1000 + i));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(map.size(), static_cast<size_t>(WRITERS * PER_WRITER));
    EXPECT_EQ(map.find("w3-42")->version, 3042);
}

TEST_F(ThreadSafeMapTest, ConcurrentReadersSeeConsistentValue) {
    map.insert("shared", std::make_shared<Entry>(0, "v0"));

    std::atomic<int> reads{0};
    std::vector<std::thread> threads;

    for (int w = 0; w < 4; ++w) {
        threads.emplace_back([this, w]() {
            for (int i = 0; i < 50; ++i) {
                int v = w * 100 + i;
                map.insert("shared", std::make_shared<Entry>(v, "v" + std::to_string(v)));
            }
        });
    }
    for (int r = 0; r < 4; ++r) {
        threads.emplace_back([this, &reads]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find("shared");
                ASSERT_NE(found, nullptr);
                EXPECT_EQ(found->state, "v" + std::to_string(found->version));
                ++reads;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(reads.load(), 400);
}
