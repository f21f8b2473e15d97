#include <gtest/gtest.h>
#include "shardsim/storage/shard_io.hpp"
#include "shardsim/storage/hashing.hpp"
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <vector>

using namespace shardsim::storage;
using namespace shardsim::core;

class ShardIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/shardsim_io_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        root_ = tmpl;
    }

    void TearDown() override {
        const std::string cmd = "rm -rf " + root_;
        (void)system(cmd.c_str());
    }

    static bool is_dir(const std::string& path) {
        struct stat st{};
        return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
    }

    std::string root_;
};

TEST_F(ShardIoTest, CreateDirectoriesIsRecursiveAndIdempotent) {
    const std::string dir = root_ + "/a/disk1/72/abc-0-0";
    ASSERT_TRUE(is_ok(create_directories(dir)));
    EXPECT_TRUE(is_dir(dir));
    EXPECT_TRUE(is_ok(create_directories(dir)));
    EXPECT_TRUE(is_ok(create_directories(root_ + "/a")));
}

TEST_F(ShardIoTest, CreateDirectoriesFailsOverRegularFile) {
    const std::string file = root_ + "/plain";
    std::vector<u8> data = {1, 2, 3};
    ASSERT_TRUE(is_ok(write_file(file, view_of(data), false, nullptr)));

    const Status s = create_directories(file);
    EXPECT_EQ(s.domain, StatusDomain::Storage);
    EXPECT_FALSE(is_ok(s));
}

TEST_F(ShardIoTest, WriteThenReadBack) {
    std::vector<u8> data(5000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<u8>(i * 13);
    }

    WriteStats stats;
    const std::string path = root_ + "/part.1";
    ASSERT_TRUE(is_ok(write_file(path, view_of(data), true, &stats)));
    EXPECT_EQ(stats.files, 1u);
    EXPECT_EQ(stats.bytes, 5000u);

    std::vector<u8> back;
    ASSERT_TRUE(is_ok(read_file(path, &back)));
    EXPECT_EQ(back, data);

    // Overwrite truncates.
    std::vector<u8> shorter = {9, 9};
    ASSERT_TRUE(is_ok(write_file(path, view_of(shorter), false, &stats)));
    EXPECT_EQ(stats.files, 2u);
    EXPECT_EQ(stats.bytes, 5002u);
    ASSERT_TRUE(is_ok(read_file(path, &back)));
    EXPECT_EQ(back, shorter);
}

TEST_F(ShardIoTest, ReadObjectFileReportsSizeAndMtime) {
    std::vector<u8> data(1234, 0x42);
    const std::string path = root_ + "/object.bin";
    ASSERT_TRUE(is_ok(write_file(path, view_of(data), false, nullptr)));

    std::vector<u8> back;
    FileInfo info{};
    ASSERT_TRUE(is_ok(read_object_file(path, &back, &info)));
    EXPECT_EQ(info.size_bytes, 1234u);
    EXPECT_GT(info.mod_time, 0);
    EXPECT_EQ(back, data);
}

TEST_F(ShardIoTest, MissingInputIsNotFoundInInputDomain) {
    std::vector<u8> back;
    const Status s = read_object_file(root_ + "/does-not-exist", &back, nullptr);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.domain, StatusDomain::Input);

    const Status r = read_file(root_ + "/does-not-exist", &back);
    EXPECT_EQ(r.code, StatusCode::NotFound);
    EXPECT_EQ(r.domain, StatusDomain::Storage);
}

TEST_F(ShardIoTest, DirectoryIsNotAnObject) {
    std::vector<u8> back;
    const Status s = read_object_file(root_, &back, nullptr);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Input);
}

TEST_F(ShardIoTest, WriteIntoMissingDirectoryFails) {
    std::vector<u8> data = {1};
    const Status s = write_file(root_ + "/nope/part.1", view_of(data), false, nullptr);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.domain, StatusDomain::Storage);
}

TEST_F(ShardIoTest, VerifyShardFile) {
    std::vector<u8> data(777);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<u8>(i);
    }
    Hash256 expected{};
    ASSERT_TRUE(is_ok(hash_compute(view_of(data), &expected)));

    const std::string path = root_ + "/part.1";
    ASSERT_TRUE(is_ok(write_file(path, view_of(data), false, nullptr)));

    bool valid = false;
    ASSERT_TRUE(is_ok(verify_shard_file(path, expected, data.size(), &valid)));
    EXPECT_TRUE(valid);

    // Wrong length.
    ASSERT_TRUE(is_ok(verify_shard_file(path, expected, data.size() + 1, &valid)));
    EXPECT_FALSE(valid);

    // Flipped byte.
    data[10] ^= 0xff;
    ASSERT_TRUE(is_ok(write_file(path, view_of(data), false, nullptr)));
    ASSERT_TRUE(is_ok(verify_shard_file(path, expected, data.size(), &valid)));
    EXPECT_FALSE(valid);

    EXPECT_EQ(verify_shard_file(root_ + "/gone", expected, 1, &valid).code, StatusCode::NotFound);
}
