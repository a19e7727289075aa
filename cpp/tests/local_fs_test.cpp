#include <algorithm>
#include <cerrno>
#include <fstream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include <gtest/gtest.h>

#include "sloup/fs/local_fs.hpp"
#include "test_support.hpp"

using namespace sloup::core;
using sloup::fs::PosixFs;
using sloup::fs::PosixSourceFile;

namespace {

bool exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // namespace

class LocalFsTest : public ::testing::Test {
protected:
    void SetUp() override {
        system(("rm -rf " + root_).c_str());
        mkdir(root_.c_str(), 0755);
    }

    void TearDown() override {
        system(("rm -rf " + root_).c_str());
    }

    const std::string root_{"/tmp/sloup_local_fs_test_" + std::to_string(getpid())};
    PosixFs fs_;
};

TEST_F(LocalFsTest, EnsureDirCreatesParentsAndIsIdempotent) {
    const std::string dir = root_ + "/a/b/c";
    ASSERT_TRUE(is_ok(fs_.ensure_dir(dir)));
    EXPECT_TRUE(exists(dir));
    EXPECT_TRUE(is_ok(fs_.ensure_dir(dir)));
}

TEST_F(LocalFsTest, EnsureDirOverFileIsConflict) {
    const std::string file = root_ + "/plain";
    std::ofstream(file) << "x";
    const Status s = fs_.ensure_dir(file);
    EXPECT_EQ(s.domain, StatusDomain::Fs);
    EXPECT_EQ(s.code, StatusCode::Conflict);
}

TEST_F(LocalFsTest, TempFileWriteCloseDelete) {
    std::unique_ptr<sloup::fs::TempFile> file;
    ASSERT_TRUE(is_ok(fs_.open_temp_file(root_, "segment_00000001", &file)));
    EXPECT_EQ(file->path(), root_ + "/segment_00000001");

    const std::string data = "hello segment";
    ASSERT_TRUE(is_ok(file->write({reinterpret_cast<const u8*>(data.data()), data.size()})));
    ASSERT_TRUE(is_ok(file->close()));
    EXPECT_EQ(sloup::testing::read_all(file->path()), data);

    ASSERT_TRUE(is_ok(fs_.delete_file(file->path())));
    EXPECT_FALSE(exists(file->path()));

    const Status again = fs_.delete_file(file->path());
    EXPECT_EQ(again.code, StatusCode::NotFound);
}

TEST_F(LocalFsTest, OpenTempFileInMissingDirFails) {
    std::unique_ptr<sloup::fs::TempFile> file;
    const Status s = fs_.open_temp_file(root_ + "/missing", "x", &file);
    EXPECT_EQ(s.domain, StatusDomain::Fs);
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_EQ(s.aux, static_cast<u32>(ENOENT));
}

TEST_F(LocalFsTest, RemoveDirRemovesTree) {
    ASSERT_TRUE(is_ok(fs_.ensure_dir(root_ + "/w/x")));
    std::ofstream(root_ + "/w/x/f") << "data";
    ASSERT_TRUE(is_ok(fs_.remove_dir(root_ + "/w")));
    EXPECT_FALSE(exists(root_ + "/w"));
    EXPECT_EQ(fs_.remove_dir("/").code, StatusCode::Invalid);
    EXPECT_EQ(fs_.remove_dir("").code, StatusCode::Invalid);
}

TEST_F(LocalFsTest, SourceFileReadsRanges) {
    const auto bytes = sloup::testing::pattern_bytes(5000);
    {
        std::ofstream out(root_ + "/src.bin", std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    PosixSourceFile src;
    ASSERT_TRUE(is_ok(src.open(root_ + "/src.bin")));
    EXPECT_EQ(src.size(), 5000u);

    std::vector<u8> buf(1000);
    u64 got = 0;
    ASSERT_TRUE(is_ok(src.read_range(4500, {buf.data(), buf.size()}, &got)));
    EXPECT_EQ(got, 500u);
    EXPECT_TRUE(std::equal(buf.begin(), buf.begin() + 500, bytes.begin() + 4500));

    ASSERT_TRUE(is_ok(src.read_range(6000, {buf.data(), buf.size()}, &got)));
    EXPECT_EQ(got, 0u);
}

TEST_F(LocalFsTest, SourceFileErrors) {
    PosixSourceFile missing;
    EXPECT_EQ(missing.open(root_ + "/nope").code, StatusCode::NotFound);

    PosixSourceFile dir;
    EXPECT_EQ(dir.open(root_).code, StatusCode::Unsupported);
}

TEST(LocalFsPaths, JoinAndBaseName) {
    EXPECT_EQ(sloup::fs::join_path("/tmp/", "/x"), "/tmp/x");
    EXPECT_EQ(sloup::fs::join_path(".", "sloup-work"), "./sloup-work");
    EXPECT_EQ(sloup::fs::join_path("", "x"), "x");
    EXPECT_EQ(sloup::fs::base_name("/data/images/disk.iso"), "disk.iso");
    EXPECT_EQ(sloup::fs::base_name("disk.iso"), "disk.iso");
    EXPECT_EQ(sloup::fs::base_name("dir/"), "dir");
}

TEST(ScratchDirTest, PathIsPerProcess) {
    const std::string suffix = "_" + std::to_string(getpid());
    sloup::testing::ScratchDir dir{"sloup_scratch_test"};
    EXPECT_EQ(dir.path(), "/tmp/sloup_scratch_test" + suffix);
    EXPECT_TRUE(exists(dir.path()));
}
