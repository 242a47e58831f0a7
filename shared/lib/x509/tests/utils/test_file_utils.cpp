/**
 * @file test_file_utils.cpp
 * @brief Unit tests for file I/O helpers
 */

#include <gtest/gtest.h>
#include <pkiforge/common/exceptions.h>
#include <pkiforge/utils/file_utils.h>

#include <filesystem>
#include <random>

using namespace pkiforge::utils;
namespace fs = std::filesystem;

class FileUtilsTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("pkiforge-file-utils-" + std::to_string(rd()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
};

TEST_F(FileUtilsTest, WriteThenRead) {
    std::string path = joinPath(dir_.string(), "root.pem");
    writeFile(path, "-----BEGIN CERTIFICATE-----\n");

    EXPECT_TRUE(fileExists(path));
    EXPECT_EQ(readFile(path), "-----BEGIN CERTIFICATE-----\n");
}

TEST_F(FileUtilsTest, WriteReplacesContent) {
    std::string path = joinPath(dir_.string(), "state");
    writeFile(path, "first version");
    writeFile(path, "v2");
    EXPECT_EQ(readFile(path), "v2");
}

TEST_F(FileUtilsTest, WriteAppliesMode) {
    std::string path = joinPath(dir_.string(), "root-key.pem");
    writeFile(path, "secret", 0600);

    auto perms = fs::status(path).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
}

TEST_F(FileUtilsTest, ReadMissingFileThrows) {
    EXPECT_THROW(readFile(joinPath(dir_.string(), "missing.pem")), pkiforge::common::FilesystemException);
}

TEST_F(FileUtilsTest, WriteIntoMissingDirectoryThrows) {
    std::string path = joinPath(joinPath(dir_.string(), "nope"), "root.pem");
    EXPECT_THROW(writeFile(path, "x"), pkiforge::common::FilesystemException);
}

TEST_F(FileUtilsTest, ExistenceChecks) {
    EXPECT_TRUE(directoryExists(dir_.string()));
    EXPECT_FALSE(fileExists(dir_.string()));
    EXPECT_FALSE(directoryExists(joinPath(dir_.string(), "nope")));
}

TEST(FileUtilsPathTest, JoinPath) {
    EXPECT_EQ(joinPath("", "root.pem"), "root.pem");
    EXPECT_EQ(joinPath("out", "root.pem"), "out/root.pem");
    EXPECT_EQ(joinPath("out/", "root.pem"), "out/root.pem");
}
