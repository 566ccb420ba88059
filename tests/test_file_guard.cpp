#include <gtest/gtest.h>
#include <mcp-toolbox/fs/file_guard.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace toolbox;
namespace fs = std::filesystem;

namespace {
struct TempFile {
    std::string path;
    explicit TempFile(const std::string& name)
        : path((fs::temp_directory_path() / ("mcp_toolbox_guard_" + std::to_string(getpid()) + "_" + name)).string()) {
        std::ofstream(path) << "content\n";
    }
    ~TempFile() { std::error_code ec; fs::remove(path, ec); }
};
}

TEST(FileGuard, NotReadBeforeRecord) {
    TempFile f("notread");
    FileMutationGuard g;
    EXPECT_EQ(g.check_mutation(f.path), MutationCheck::NotRead);
    EXPECT_FALSE(g.recorded(f.path).has_value());
}

TEST(FileGuard, NewFileIsAllowed) {
    FileMutationGuard g;
    EXPECT_EQ(g.check_mutation("/nonexistent/dir/new_file.txt"), MutationCheck::Ok);
}

TEST(FileGuard, OkUntilDiskMtimeMovesPastRecord) {
    TempFile f("mtime");
    FileMutationGuard g;
    auto t1 = FileMutationGuard::disk_mtime(f.path);
    ASSERT_TRUE(t1.has_value());
    g.record_read(f.path, *t1);
    EXPECT_EQ(g.check_mutation(f.path), MutationCheck::Ok);

    fs::last_write_time(f.path, *t1 - std::chrono::seconds(5));
    EXPECT_EQ(g.check_mutation(f.path), MutationCheck::Ok);

    fs::last_write_time(f.path, *t1 + std::chrono::seconds(5));
    EXPECT_EQ(g.check_mutation(f.path), MutationCheck::ModifiedSinceRead);

    g.record_read(f.path, *t1 + std::chrono::seconds(5));
    EXPECT_EQ(g.check_mutation(f.path), MutationCheck::Ok);
}

TEST(FileGuard, ExplicitCurrentTime) {
    FileMutationGuard g;
    FileTime t = FileTime::clock::now();
    g.record_read("/x", t);
    EXPECT_EQ(g.check_mutation("/x", t), MutationCheck::Ok);
    EXPECT_EQ(g.check_mutation("/x", t + std::chrono::nanoseconds(1)), MutationCheck::ModifiedSinceRead);
    EXPECT_EQ(g.check_mutation("/x", std::nullopt), MutationCheck::Ok);
    EXPECT_EQ(g.check_mutation("/y", t), MutationCheck::NotRead);
}
