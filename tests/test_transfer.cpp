#include <gtest/gtest.h>
#include <transfer/shell_fs.hpp>
#include <transfer/transfer_engine.hpp>
#include "support/local_host.hpp"

namespace fs = std::filesystem;

// Parameter: true = structured backend, false = shell fallback.
class TransferTest : public ::testing::TestWithParam<bool> {
protected:
    ScratchDir remote{"remote"};
    ScratchDir local{"local"};
    Logger logger = Logger::disabled();
    LocalHost host{remote.path(), GetParam()};
    std::unique_ptr<RemoteFs> rfs;
    std::unique_ptr<TransferEngine> engine;

    void SetUp() override {
        auto opened = open_remote_fs(host, logger);
        ASSERT_TRUE(opened.is_ok()) << opened.error;
        rfs = std::move(opened.value);
        engine = std::make_unique<TransferEngine>(*rfs, logger);
    }
};

TEST_P(TransferTest, BackendMatchesAvailability) {
    EXPECT_STREQ(rfs->backend(), GetParam() ? "local" : "shell");
}

TEST_P(TransferTest, UploadThenDownloadIsByteIdentical) {
    std::string payload;
    for (int i = 0; i < 70000; i++) payload += static_cast<char>(i * 31 % 256);
    payload += "\r\nlast line without newline";
    write_text(local / "blob.bin", payload);

    auto up = engine->upload({local / "blob.bin"}, "~/incoming", false);
    ASSERT_TRUE(up.ok()) << up.failed[0].second;
    EXPECT_EQ(read_text(remote / "incoming/blob.bin"), payload);

    auto down = engine->download({"incoming/blob.bin"}, local / "back", false);
    ASSERT_TRUE(down.ok()) << down.failed[0].second;
    EXPECT_EQ(read_text(local / "back/blob.bin"), payload);
}

TEST_P(TransferTest, UploadLeavesNoPartialFile) {
    write_text(local / "a.sh", "echo hi\n");
    auto up = engine->upload({local / "a.sh"}, "~", false);
    ASSERT_TRUE(up.ok());
    EXPECT_TRUE(fs::exists(remote / "a.sh"));
    EXPECT_FALSE(fs::exists(remote / "a.sh.part"));
}

TEST_P(TransferTest, EnsureDirIsIdempotent) {
    auto first = engine->ensure_dir("~/deep/nested/dir");
    ASSERT_TRUE(first.is_ok()) << first.error;
    auto second = engine->ensure_dir("~/deep/nested/dir");
    EXPECT_TRUE(second.is_ok()) << second.error;
    EXPECT_TRUE(fs::is_directory(remote / "deep/nested/dir"));
}

TEST_P(TransferTest, PartialFailureStillCopiesTheRest) {
    write_text(remote / "existing.txt", "here\n");

    auto report = engine->download({"existing.txt", "missing.txt"}, local.path(), false);
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].first, "missing.txt");
    ASSERT_EQ(report.transferred.size(), 1u);
    EXPECT_EQ(read_text(local / "existing.txt"), "here\n");
    EXPECT_FALSE(fs::exists(local / "missing.txt"));
}

TEST_P(TransferTest, DirectoryWithoutRecursionSkipsSubdirs) {
    write_text(remote / "tree/top.txt", "1");
    write_text(remote / "tree/sub/inner.txt", "2");

    auto flat = engine->download({"~/tree"}, local / "flat", false);
    EXPECT_TRUE(flat.ok());
    EXPECT_TRUE(fs::exists(local / "flat/tree/top.txt"));
    EXPECT_FALSE(fs::exists(local / "flat/tree/sub"));
    EXPECT_EQ(flat.skipped.size(), 1u);

    auto deep = engine->download({"~/tree"}, local / "deep", true);
    EXPECT_TRUE(deep.ok());
    EXPECT_EQ(read_text(local / "deep/tree/sub/inner.txt"), "2");
}

TEST_P(TransferTest, RecursiveUploadMirrorsTree) {
    write_text(local / "site/index.html", "<h1>x</h1>");
    write_text(local / "site/css/main.css", "body{}");

    auto report = engine->upload({local / "site"}, (remote / "www").string(), true);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(read_text(remote / "www/site/index.html"), "<h1>x</h1>");
    EXPECT_EQ(read_text(remote / "www/site/css/main.css"), "body{}");
}

TEST_P(TransferTest, MissingLocalPathIsReported) {
    auto report = engine->upload({local / "nope.txt"}, "~", false);
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_TRUE(report.transferred.empty());
}

INSTANTIATE_TEST_SUITE_P(Backends, TransferTest, ::testing::Values(true, false),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("Structured") : std::string("ShellFallback");
                         });

// ── Listing ─────────────────────────────────────────────

TEST(TransferListing, HomeSortedCaseInsensitivelyWithKinds) {
    ScratchDir remote("listing");
    write_text(remote / "beta.txt", "12345");
    write_text(remote / "Alpha.txt", "1");
    fs::create_directories(remote / "charlie");
    fs::create_directories(remote / "Delta");

    LocalHost host(remote.path(), true);
    Logger logger = Logger::disabled();
    auto rfs = open_remote_fs(host, logger);
    ASSERT_TRUE(rfs.is_ok());
    TransferEngine engine(*rfs.value, logger);

    auto listing = engine.list("~");
    ASSERT_TRUE(listing.is_ok()) << listing.error;
    EXPECT_EQ(listing.value.path, remote.path().string());
    EXPECT_FALSE(listing.value.raw);

    const auto& e = listing.value.entries;
    ASSERT_EQ(e.size(), 4u);
    EXPECT_EQ(e[0].name, "Alpha.txt");
    EXPECT_EQ(e[1].name, "beta.txt");
    EXPECT_EQ(e[2].name, "charlie");
    EXPECT_EQ(e[3].name, "Delta");
    EXPECT_FALSE(e[0].is_dir());
    EXPECT_EQ(e[1].size, 5u);
    EXPECT_TRUE(e[2].is_dir());
    EXPECT_TRUE(e[3].is_dir());
}

TEST(TransferListing, FileListsItself) {
    ScratchDir remote("listing_file");
    write_text(remote / "only.txt", "abc");
    LocalHost host(remote.path(), true);
    Logger logger = Logger::disabled();
    auto rfs = open_remote_fs(host, logger);
    ASSERT_TRUE(rfs.is_ok());
    TransferEngine engine(*rfs.value, logger);

    auto listing = engine.list("only.txt");
    ASSERT_TRUE(listing.is_ok());
    ASSERT_EQ(listing.value.entries.size(), 1u);
    EXPECT_EQ(listing.value.entries[0].name, "only.txt");
}

TEST(TransferListing, MissingPathIsPathNotFound) {
    ScratchDir remote("listing_missing");
    LocalHost host(remote.path(), true);
    Logger logger = Logger::disabled();
    auto rfs = open_remote_fs(host, logger);
    ASSERT_TRUE(rfs.is_ok());
    TransferEngine engine(*rfs.value, logger);

    auto listing = engine.list("~/nowhere");
    ASSERT_TRUE(listing.is_err());
    EXPECT_EQ(listing.kind, ErrorKind::PathNotFound);
}

TEST(TransferListing, ShellFallbackGivesRawText) {
    ScratchDir remote("listing_raw");
    write_text(remote / "visible.txt", "x");
    LocalHost host(remote.path(), false);
    Logger logger = Logger::disabled();
    auto rfs = open_remote_fs(host, logger);
    ASSERT_TRUE(rfs.is_ok());
    TransferEngine engine(*rfs.value, logger);

    auto listing = engine.list("~");
    ASSERT_TRUE(listing.is_ok());
    EXPECT_TRUE(listing.value.raw);
    EXPECT_NE(listing.value.raw_text.find("visible.txt"), std::string::npos);
}

TEST(ShellFs, ListDirReportsKindsAndSizes) {
    ScratchDir remote("shellfs");
    write_text(remote / "f.txt", "hello");
    fs::create_directories(remote / "d");
    LocalHost host(remote.path(), false);
    ShellFs shell(host);

    auto entries = shell.list_dir(remote.path().string());
    ASSERT_TRUE(entries.is_ok()) << entries.error;
    ASSERT_EQ(entries.value.size(), 2u);
    for (const auto& e : entries.value) {
        if (e.name == "f.txt") {
            EXPECT_FALSE(e.is_dir());
            EXPECT_EQ(e.size, 5u);
        } else {
            EXPECT_EQ(e.name, "d");
            EXPECT_TRUE(e.is_dir());
        }
    }

    auto missing = shell.list_dir((remote / "nope").string());
    EXPECT_EQ(missing.kind, ErrorKind::PathNotFound);
}

// ── Destination containment ─────────────────────────────

// A remote whose root holds one file plus an entry named to climb out of
// the destination. Downloads are only recorded, never written.
class RootOnlyFs : public RemoteFs {
public:
    std::vector<fs::path> destinations;

    const char* backend() const override { return "fake"; }
    Result<std::string> home() override { return Result<std::string>::Ok("/"); }
    Result<RemoteEntry> stat(const std::string& path) override {
        RemoteEntry e;
        e.name = path;
        e.kind = path == "/" ? EntryKind::Directory : EntryKind::File;
        return Result<RemoteEntry>::Ok(e);
    }
    Result<std::vector<RemoteEntry>> list_dir(const std::string&) override {
        std::vector<RemoteEntry> entries(2);
        entries[0].name = "etc_passwd_copy";
        entries[1].name = "..";
        entries[1].kind = EntryKind::Directory;
        return Result<std::vector<RemoteEntry>>::Ok(entries);
    }
    Result<void> mkdir_p(const std::string&) override { return Result<void>::Ok(); }
    Result<void> download(const std::string&, const fs::path& local) override {
        destinations.push_back(local);
        return Result<void>::Ok();
    }
    Result<void> upload(const fs::path&, const std::string&) override {
        return Result<void>::Ok();
    }
};

TEST(TransferDownload, RemoteRootLandsInsideLocalDir) {
    ScratchDir local("root_dl");
    Logger logger = Logger::disabled();
    RootOnlyFs rfs;
    TransferEngine engine(rfs, logger);

    auto report = engine.download({"/"}, local / "out", true);
    ASSERT_EQ(rfs.destinations.size(), 1u);
    EXPECT_EQ(rfs.destinations[0], local / "out" / "etc_passwd_copy");
    EXPECT_TRUE(report.failed.empty());
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0], "/..");
}
