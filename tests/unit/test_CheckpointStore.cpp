#include <gtest/gtest.h>
#include "hashmirror/checkpoint/Store.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace hm::checkpoint;

class CheckpointStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path checkpointPath;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "hashmirror_checkpoint_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        checkpointPath = test_dir / "hash_checkpoint.txt";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void writeCheckpoint(const std::string& content) const {
        std::ofstream out(checkpointPath, std::ios::binary);
        out << content;
    }

    static std::string readAll(const fs::path& path) {
        std::ifstream in(path);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }
};

TEST_F(CheckpointStoreTest, MissingFileLoadsEmpty) {
    Store store(checkpointPath);
    EXPECT_TRUE(store.load().empty());
    EXPECT_FALSE(fs::exists(checkpointPath));
}

TEST_F(CheckpointStoreTest, LoadTrimsDropsBlanksAndDeduplicates) {
    writeCheckpoint("a.txt\n  b.txt  \r\n\n   \ndocs/c.txt\na.txt\n");

    const auto set = Store::read(checkpointPath);
    EXPECT_EQ(set, (CheckpointSet{"a.txt", "b.txt", "docs/c.txt"}));
}

TEST_F(CheckpointStoreTest, LastLineWithoutNewline) {
    writeCheckpoint("a.txt\nb.txt");
    EXPECT_EQ(Store::read(checkpointPath).size(), 2u);
}

TEST_F(CheckpointStoreTest, AddAppendsOneLine) {
    writeCheckpoint("a.txt\n");

    Store store(checkpointPath);
    store.load();
    store.add("b.txt");

    EXPECT_TRUE(store.contains("b.txt"));
    EXPECT_EQ(readAll(checkpointPath), "a.txt\nb.txt\n");
}

TEST_F(CheckpointStoreTest, AddOfKnownPathIsNoOp) {
    writeCheckpoint("a.txt\n");

    Store store(checkpointPath);
    store.load();
    store.add("a.txt");

    EXPECT_EQ(readAll(checkpointPath), "a.txt\n");
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(CheckpointStoreTest, AddCreatesFileAndParentDirectory) {
    const auto nested = test_dir / "logs" / "hash_checkpoint.txt";
    Store store(nested);
    store.load();
    store.add("x/y.txt");

    EXPECT_EQ(readAll(nested), "x/y.txt\n");
}

TEST_F(CheckpointStoreTest, EntriesSurviveReload) {
    {
        Store store(checkpointPath);
        store.load();
        store.add("one");
        store.add("two");
    }

    Store reloaded(checkpointPath);
    EXPECT_EQ(reloaded.load(), (CheckpointSet{"one", "two"}));
}

TEST_F(CheckpointStoreTest, AppendIntoDirectoryThrows) {
    fs::create_directories(checkpointPath);
    EXPECT_THROW(Store::append(checkpointPath, "a.txt"), std::runtime_error);
}

TEST_F(CheckpointStoreTest, PathWithLineBreakIsNotRecorded) {
    Store store(checkpointPath);
    store.load();

    EXPECT_FALSE(store.add("photos\nnotes.txt"));
    EXPECT_FALSE(store.add("dos\r"));
    EXPECT_TRUE(store.add("notes.txt"));

    EXPECT_FALSE(store.contains("photos\nnotes.txt"));
    EXPECT_EQ(readAll(checkpointPath), "notes.txt\n");

    // Neither fragment can mark another file as verified
    EXPECT_EQ(Store::read(checkpointPath), (CheckpointSet{"notes.txt"}));
}
