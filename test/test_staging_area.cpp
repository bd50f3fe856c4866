// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "native_share/common/ShareError.hpp"
#include "native_share/common/Uuid.hpp"
#include "native_share/staging/FileNameSanitizer.hpp"
#include "native_share/staging/StagingArea.hpp"

using native_share::common::ShareError;
using native_share::common::ShareErrorKind;
using native_share::staging::StagedFile;
using native_share::staging::StagedFileState;
using native_share::staging::StagingArea;
using native_share::staging::StagingAreaOptions;

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool isAllowedName(const std::string& name) {
    for (unsigned char c : name) {
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                             (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

class StagingAreaTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("ns_staging_" + native_share::common::generateUuidV4());
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    StagingAreaOptions options() const {
        StagingAreaOptions opts;
        opts.root_override = root_;
        return opts;
    }

    ShareErrorKind createErrorKind(StagingArea& area, const std::string& name) {
        try {
            area.createStagedFile(name, bytes("payload"));
        } catch (const ShareError& e) {
            return e.kind();
        }
        return ShareErrorKind::None;
    }

    fs::path root_;
};

}  // namespace

TEST_F(StagingAreaTest, ConstructionDoesNotTouchDisk) {
    StagingArea area(options());
    EXPECT_EQ((root_ / "native-share").string(), area.stagingDirectory().string());
    EXPECT_FALSE(fs::exists(area.stagingDirectory()));
}

TEST_F(StagingAreaTest, EnsureCreatesOwnerOnlyDirectory) {
    StagingArea area(options());
    const auto dir = area.ensureStagingDirectory();

    ASSERT_TRUE(fs::is_directory(dir));
    const auto perms = fs::status(dir).permissions();
    EXPECT_EQ(fs::perms::none, perms & (fs::perms::group_all | fs::perms::others_all));

    // Idempotent
    EXPECT_EQ(dir.string(), area.ensureStagingDirectory().string());
}

TEST_F(StagingAreaTest, TightensPreexistingSharedDirectory) {
    const auto dir = root_ / "native-share";
    fs::create_directories(dir);
    fs::permissions(dir, fs::perms::all, fs::perm_options::replace);

    StagingArea area(options());
    const auto file = area.createStagedFile("secret.txt", bytes("sec"));

    const auto dir_perms = fs::status(dir).permissions() & fs::perms::all;
    EXPECT_EQ(fs::perms::owner_all, dir_perms);
    const auto file_perms = fs::status(file.path).permissions();
    EXPECT_EQ(fs::perms::none, file_perms & (fs::perms::group_all | fs::perms::others_all));
    EXPECT_EQ("sec", readFile(file.path));
}

TEST_F(StagingAreaTest, StagedFilesAreOwnerOnly) {
    StagingArea area(options());
    const auto file = area.createStagedFile("private.bin", bytes("data"));

    const auto perms = fs::status(file.path).permissions();
    EXPECT_NE(fs::perms::none, perms & fs::perms::owner_read);
    EXPECT_EQ(fs::perms::none, perms & (fs::perms::group_all | fs::perms::others_all));
}

TEST_F(StagingAreaTest, RejectsSymlinkedStagingDirectory) {
    fs::create_directories(root_ / "elsewhere");
    fs::create_directory_symlink(root_ / "elsewhere", root_ / "native-share");

    StagingArea area(options());
    try {
        area.ensureStagingDirectory();
        FAIL() << "expected ShareError";
    } catch (const ShareError& e) {
        EXPECT_EQ(ShareErrorKind::Io, e.kind());
    }
}

TEST_F(StagingAreaTest, WritesPayloadUnderUniqueName) {
    StagingArea area(options());
    const auto file = area.createStagedFile("report.pdf", bytes("hello"), "application/pdf");

    EXPECT_EQ("report.pdf", file.untrusted_name);
    EXPECT_EQ("report.pdf", file.sanitized_name);
    ASSERT_GT(file.unique_name.size(), 37u);
    EXPECT_TRUE(native_share::common::isCanonicalUuid(file.unique_name.substr(0, 36)));
    EXPECT_EQ("-report.pdf", file.unique_name.substr(36));
    EXPECT_EQ(file.unique_name, file.path.filename().string());
    EXPECT_EQ("application/pdf", file.mime_type);
    EXPECT_EQ(5u, file.size);

    EXPECT_EQ("hello", readFile(file.path));
    EXPECT_EQ(StagedFileState::Written, area.state(file));
}

TEST_F(StagingAreaTest, DefaultsMimeType) {
    StagingArea area(options());
    const auto file = area.createStagedFile("blob", bytes("x"));
    EXPECT_EQ("application/octet-stream", file.mime_type);
}

TEST_F(StagingAreaTest, LeavesNoPartialFiles) {
    StagingArea area(options());
    area.createStagedFile("a.txt", bytes("a"));
    area.createStagedFile("b.txt", bytes(""));

    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator(area.stagingDirectory())) {
        EXPECT_NE('.', entry.path().filename().string().front());
        ++count;
    }
    EXPECT_EQ(2u, count);
}

TEST_F(StagingAreaTest, IdenticalNamesProduceDistinctFiles) {
    StagingArea area(options());
    const auto first = area.createStagedFile("photo.jpg", bytes("one"));
    const auto second = area.createStagedFile("photo.jpg", bytes("two"));

    EXPECT_NE(first.path.string(), second.path.string());
    EXPECT_TRUE(fs::exists(first.path));
    EXPECT_TRUE(fs::exists(second.path));
    EXPECT_EQ(2u, area.trackedFiles().size());
}

TEST_F(StagingAreaTest, HostileNamesStayInsideStagingDirectory) {
    StagingArea area(options());
    const auto dir = fs::canonical(area.ensureStagingDirectory());

    const std::vector<std::string> names = {
        "/etc/passwd",
        "C:\\Windows\\system32\\drivers\\etc\\hosts",
        std::string("innocent.txt\0evil.sh", 20),
        "nested/dir/file.txt",
        "%2e%2e%2fescape.txt",
        "~/.ssh/id_rsa",
    };
    for (const auto& name : names) {
        const auto file = area.createStagedFile(name, bytes("payload"));
        EXPECT_EQ(dir.string(), fs::canonical(file.path).parent_path().string()) << name;
        EXPECT_TRUE(native_share::staging::FileNameSanitizer::isDirectChildOf(file.path, dir));
        EXPECT_TRUE(isAllowedName(file.unique_name)) << file.unique_name;
    }
}

TEST_F(StagingAreaTest, ParentReferencesAreRejectedWithoutWriting) {
    StagingArea area(options());
    EXPECT_EQ(ShareErrorKind::PathTraversal, createErrorKind(area, "../../etc/passwd"));
    EXPECT_EQ(ShareErrorKind::PathTraversal, createErrorKind(area, "..\\..\\boot.ini"));
    EXPECT_EQ(ShareErrorKind::PathTraversal, createErrorKind(area, ".."));

    EXPECT_TRUE(fs::is_empty(area.stagingDirectory()));
    EXPECT_FALSE(fs::exists(root_ / "etc"));
    EXPECT_TRUE(area.trackedFiles().empty());
}

TEST_F(StagingAreaTest, EmptySanitizedNameIsRejected) {
    StagingArea area(options());
    EXPECT_EQ(ShareErrorKind::Naming, createErrorKind(area, ""));
    EXPECT_EQ(ShareErrorKind::Naming, createErrorKind(area, "???"));
    EXPECT_EQ(ShareErrorKind::Naming, createErrorKind(area, "folder/"));
    EXPECT_TRUE(fs::is_empty(area.stagingDirectory()));
}

TEST_F(StagingAreaTest, EnforcesPayloadLimit) {
    auto opts = options();
    opts.max_payload_bytes = 4;
    StagingArea area(opts);

    EXPECT_NO_THROW(area.createStagedFile("ok.bin", bytes("1234")));
    EXPECT_EQ(ShareErrorKind::Naming, createErrorKind(area, "big.bin"));
    EXPECT_EQ(1u, area.trackedFiles().size());
}

TEST_F(StagingAreaTest, TracksLifecycleStates) {
    StagingArea area(options());
    const auto file = area.createStagedFile("doc.txt", bytes("doc"));
    EXPECT_EQ(StagedFileState::Written, area.state(file));

    area.markPresented(file);
    EXPECT_EQ(StagedFileState::Presented, area.state(file))
        << native_share::staging::stagedFileStateToString(area.state(file));
    EXPECT_STREQ("presented", native_share::staging::stagedFileStateToString(area.state(file)));

    area.releaseStagedFile(file);
    EXPECT_EQ(StagedFileState::Released, area.state(file));
    EXPECT_FALSE(fs::exists(file.path));
    EXPECT_TRUE(area.trackedFiles().empty());
}

TEST_F(StagingAreaTest, ReleaseToleratesMissingFile) {
    StagingArea area(options());
    const auto file = area.createStagedFile("gone.txt", bytes("x"));
    fs::remove(file.path);

    EXPECT_NO_THROW(area.releaseStagedFile(file));
    EXPECT_NO_THROW(area.releaseStagedFile(file));
    EXPECT_EQ(StagedFileState::Released, area.state(file));
}

TEST_F(StagingAreaTest, ReleaseTrackedFilesDeletesEverything) {
    StagingArea area(options());
    const auto a = area.createStagedFile("a.txt", bytes("a"));
    const auto b = area.createStagedFile("b.txt", bytes("b"));

    EXPECT_TRUE(area.releaseTrackedFiles().empty());
    EXPECT_FALSE(fs::exists(a.path));
    EXPECT_FALSE(fs::exists(b.path));
    EXPECT_TRUE(area.trackedFiles().empty());
    EXPECT_TRUE(fs::exists(area.stagingDirectory()));
}

TEST_F(StagingAreaTest, CleanupAllOnMissingDirectoryIsNoOp) {
    StagingArea area(options());
    EXPECT_NO_THROW(area.cleanupAll());
    EXPECT_FALSE(fs::exists(area.stagingDirectory()));
}

TEST_F(StagingAreaTest, CleanupAllRemovesUntrackedFilesToo) {
    StagingArea area(options());
    const auto file = area.createStagedFile("tracked.txt", bytes("t"));
    {
        std::ofstream stray(area.stagingDirectory() / "leftover-from-crash.txt");
        stray << "stray";
    }

    area.cleanupAll();
    EXPECT_FALSE(fs::exists(area.stagingDirectory()));
    EXPECT_EQ(StagedFileState::Released, area.state(file));

    // Usable again afterwards
    const auto again = area.createStagedFile("again.txt", bytes("a"));
    EXPECT_TRUE(fs::exists(again.path));
}

TEST_F(StagingAreaTest, ConcurrentCreatesAreAllTracked) {
    StagingArea area(options());
    constexpr int kThreads = 4;
    constexpr int kFilesPerThread = 8;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&area]() {
            for (int i = 0; i < kFilesPerThread; ++i) {
                area.createStagedFile("same.txt", bytes("data"));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<std::size_t>(kThreads * kFilesPerThread), area.trackedFiles().size());
    std::size_t on_disk = 0;
    for (const auto& entry : fs::directory_iterator(area.stagingDirectory())) {
        (void)entry;
        ++on_disk;
    }
    EXPECT_EQ(static_cast<std::size_t>(kThreads * kFilesPerThread), on_disk);
}
