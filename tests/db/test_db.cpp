// SHARELEDGER - Database Tests
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "shareledger/db/database.h"
#include "shareledger/db/leveldb.h"

#include <filesystem>
#include <random>

using namespace shareledger;
using namespace shareledger::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        testDir_ = std::filesystem::temp_directory_path() /
                   ("shareledger_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

// ============================================================================
// Status and Slice
// ============================================================================

TEST(StatusTest, ToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_EQ(Status::NotFound("key").ToString(), "NotFound: key");
    EXPECT_EQ(Status::Corruption("x").ToString(), "Corruption: x");
    EXPECT_TRUE(Status::NotFound().IsNotFound());
    EXPECT_TRUE(Status::IOError().IsIOError());
    EXPECT_FALSE(Status::Corruption().ok());
}

TEST(SliceTest, CompareAndPrefix) {
    std::string a = "abc";
    Slice s(a);
    EXPECT_EQ(s.size(), 3u);
    EXPECT_TRUE(s.starts_with("ab"));
    EXPECT_FALSE(s.starts_with("abcd"));
    EXPECT_TRUE(Slice("ab") < s);
    EXPECT_EQ(s.compare(Slice("abc")), 0);
    EXPECT_GT(s.compare(Slice("abb")), 0);
}

// ============================================================================
// Memory Database
// ============================================================================

TEST(MemoryDatabaseTest, PutGetDelete) {
    MemoryDatabase db;
    std::string value;

    EXPECT_TRUE(db.Get("missing", &value).IsNotFound());

    ASSERT_TRUE(db.Put("k1", "v1").ok());
    ASSERT_TRUE(db.Get("k1", &value).ok());
    EXPECT_EQ(value, "v1");
    EXPECT_TRUE(db.Exists("k1"));

    ASSERT_TRUE(db.Delete("k1").ok());
    EXPECT_FALSE(db.Exists("k1"));
    EXPECT_EQ(db.Size(), 0u);
}

TEST(MemoryDatabaseTest, BatchAppliesInOrder) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("gone", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("a", "2");
    batch.Delete("gone");
    batch.Put("b", "3");
    EXPECT_EQ(batch.Count(), 4u);
    ASSERT_TRUE(db.Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(db.Get("a", &value).ok());
    EXPECT_EQ(value, "2");
    EXPECT_FALSE(db.Exists("gone"));
    EXPECT_EQ(db.Size(), 2u);
}

TEST(MemoryDatabaseTest, IteratorIsOrdered) {
    MemoryDatabase db;
    db.Put("c", "3");
    db.Put("a", "1");
    db.Put("b", "2");

    auto it = db.NewIterator();
    std::string keys;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys += it->key().ToString();
    }
    EXPECT_EQ(keys, "abc");

    it->Seek("b");
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->value().ToString(), "2");
    EXPECT_TRUE(it->status().ok());
}

// ============================================================================
// OpenDatabase
// ============================================================================

TEST_F(DatabaseTest, OpenCreatesDirectory) {
    auto path = testDir_ / "store";
    auto [status, database] = OpenDatabase(path);
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(database, nullptr);
    EXPECT_TRUE(std::filesystem::exists(path));

    ASSERT_TRUE(database->Put("key", "value").ok());
    std::string value;
    ASSERT_TRUE(database->Get("key", &value).ok());
    EXPECT_EQ(value, "value");
}

TEST_F(DatabaseTest, DestroyRemovesDirectory) {
    auto path = testDir_ / "store";
    {
        auto [status, database] = OpenDatabase(path);
        ASSERT_TRUE(status.ok());
    }
    EXPECT_TRUE(DestroyDatabase(path).ok());
}

// ============================================================================
// Keys and Values
// ============================================================================

TEST(KeyTest, MakeKeyPrefixesParts) {
    Address holder;
    holder[0] = 0x11;

    std::string key = MakeKey(prefix::BALANCE, uint64_t(1), holder);
    ASSERT_EQ(key.size(), 1u + 8u + Address::SIZE);
    EXPECT_EQ(key[0], prefix::BALANCE);
    EXPECT_EQ(key[1], 1);
    EXPECT_EQ(static_cast<uint8_t>(key[9]), 0x11);

    EXPECT_EQ(MakeKey(prefix::META), "N");
}

TEST(KeyTest, PrefixesAreDistinct) {
    for (size_t i = 0; i < sizeof(prefix::ALL); ++i) {
        for (size_t j = i + 1; j < sizeof(prefix::ALL); ++j) {
            EXPECT_NE(prefix::ALL[i], prefix::ALL[j]);
        }
    }
}

TEST(ValueTest, DeserializeRequiresExactLength) {
    std::string encoded = SerializeToString(uint64_t(42));
    uint64_t out = 0;
    ASSERT_TRUE(DeserializeFromString(encoded, out));
    EXPECT_EQ(out, 42u);

    EXPECT_FALSE(DeserializeFromString(encoded + "x", out));
    EXPECT_FALSE(DeserializeFromString(encoded.substr(0, 4), out));
}
