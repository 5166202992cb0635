#include <gtest/gtest.h>
#include "hashmirror/log/Rotator.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace hm::log;

class RotatorTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path active;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "hashmirror_rotator_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        active = test_dir / "hash_verification_log.txt";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    static void writeBytes(const fs::path& path, const std::size_t n) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << std::string(n, 'x');
    }

    static std::string readAll(const fs::path& path) {
        std::ifstream in(path);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }
};

TEST_F(RotatorTest, SizeLiterals) {
    EXPECT_EQ(4_KiB, 4096u);
    EXPECT_EQ(50_MiB, 50u * 1024 * 1024);
    EXPECT_EQ(1_GiB, 1024u * 1024 * 1024);
}

TEST_F(RotatorTest, MissingFileIsLeftAlone) {
    EXPECT_FALSE(rotateIfNeeded(active, 10).has_value());
    EXPECT_FALSE(fs::exists(active));
    EXPECT_FALSE(fs::exists(test_dir / "hash_verification_log-1.txt"));
}

TEST_F(RotatorTest, BelowThresholdIsNotRotated) {
    writeBytes(active, 9);
    EXPECT_FALSE(rotateIfNeeded(active, 10).has_value());
    EXPECT_TRUE(fs::exists(active));
}

TEST_F(RotatorTest, AtThresholdRotatesToFirstArchive) {
    writeBytes(active, 10);
    const auto archived = rotateIfNeeded(active, 10);

    ASSERT_TRUE(archived.has_value());
    EXPECT_EQ(*archived, test_dir / "hash_verification_log-1.txt");
    EXPECT_FALSE(fs::exists(active));
    EXPECT_EQ(fs::file_size(*archived), 10u);
}

TEST_F(RotatorTest, ProbesPastExistingArchives) {
    writeBytes(test_dir / "hash_verification_log-1.txt", 1);
    writeBytes(test_dir / "hash_verification_log-2.txt", 1);
    writeBytes(active, 32);

    const auto archived = rotateIfNeeded(active, 16);
    ASSERT_TRUE(archived.has_value());
    EXPECT_EQ(archived->filename(), "hash_verification_log-3.txt");
    EXPECT_EQ(fs::file_size(test_dir / "hash_verification_log-1.txt"), 1u);
    EXPECT_EQ(fs::file_size(test_dir / "hash_verification_log-2.txt"), 1u);
}

TEST_F(RotatorTest, FillsLowestGapFirst) {
    writeBytes(test_dir / "hash_verification_log-1.txt", 1);
    writeBytes(test_dir / "hash_verification_log-3.txt", 1);
    writeBytes(active, 32);

    const auto archived = rotateIfNeeded(active, 16);
    ASSERT_TRUE(archived.has_value());
    EXPECT_EQ(archived->filename(), "hash_verification_log-2.txt");
}

TEST_F(RotatorTest, ArchiveNameWithoutExtension) {
    const Rotator r({ .active_path = test_dir / "mirror_log", .max_bytes = 1 });
    EXPECT_EQ(r.archivePath(4), test_dir / "mirror_log-4");
}

TEST_F(RotatorTest, UnsetThresholdNeverRotates) {
    writeBytes(active, 1024);
    const Rotator r({ .active_path = active });
    EXPECT_FALSE(r.needsRotation());
    EXPECT_FALSE(r.maybeRotate().has_value());
}

TEST_F(RotatorTest, ForceRotateIgnoresThreshold) {
    writeBytes(active, 3);
    const Rotator r({ .active_path = active, .max_bytes = 1_MiB });
    const auto archived = r.forceRotate();
    ASSERT_TRUE(archived.has_value());
    EXPECT_EQ(archived->filename(), "hash_verification_log-1.txt");
}

TEST_F(RotatorTest, HooksFireAfterRename) {
    writeBytes(active, 8);
    bool reopened = false;
    std::vector<std::string> diag;

    const Rotator r({
        .active_path = active,
        .max_bytes = 8,
        .on_reopen = [&] { reopened = !fs::exists(active); },
        .diag_log = [&](const std::string_view msg) { diag.emplace_back(msg); }
    });

    ASSERT_TRUE(r.maybeRotate().has_value());
    EXPECT_TRUE(reopened);
    ASSERT_EQ(diag.size(), 1u);
    EXPECT_NE(diag[0].find("hash_verification_log-1.txt"), std::string::npos);
}

TEST_F(RotatorTest, ArchiveNameTooLongThrowsRotationError) {
    // 255-byte file name: valid itself, but every "<stem>-N.txt" exceeds NAME_MAX
    const auto longActive = test_dir / (std::string(251, 'L') + ".txt");
    writeBytes(longActive, 11);

    const Rotator r({ .active_path = longActive, .max_bytes = 4 });
    EXPECT_THROW(r.maybeRotate(), RotationError);
    EXPECT_THROW(rotateIfNeeded(longActive, 4), RotationError);
    EXPECT_EQ(fs::file_size(longActive), 11u);
}

TEST_F(RotatorTest, RotationErrorNamesBothPaths) {
    const auto longActive = test_dir / (std::string(251, 'L') + ".txt");
    writeBytes(longActive, 8);

    try {
        rotateIfNeeded(longActive, 1);
        FAIL() << "expected RotationError";
    } catch (const RotationError& e) {
        EXPECT_EQ(e.active(), longActive);
        EXPECT_EQ(e.target().filename().string(), std::string(251, 'L') + "-1.txt");
    }
}

TEST_F(RotatorTest, RenameFailureThrowsRotationError) {
    if (::geteuid() == 0) GTEST_SKIP() << "directory permissions do not bind root";

    writeBytes(active, 8);
    const Rotator r({ .active_path = active, .max_bytes = 8 });

    fs::permissions(test_dir, fs::perms::owner_write, fs::perm_options::remove);
    EXPECT_THROW(r.maybeRotate(), RotationError);
    fs::permissions(test_dir, fs::perms::owner_write, fs::perm_options::add);
    EXPECT_TRUE(fs::exists(active));
}

TEST_F(RotatorTest, ActivePathReceivesOnlyNewWritesAfterRotation) {
    {
        std::ofstream out(active);
        out << "old line\n";
    }
    ASSERT_TRUE(rotateIfNeeded(active, 1).has_value());

    {
        std::ofstream out(active, std::ios::app);
        out << "new line\n";
    }
    EXPECT_EQ(readAll(active), "new line\n");
    EXPECT_EQ(readAll(test_dir / "hash_verification_log-1.txt"), "old line\n");
}
