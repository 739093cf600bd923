#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "stitchfs/storage/local_storage.h"
#include "stitchfs/upload/assembler.h"
#include "stitchfs/upload/chunk_receiver.h"

namespace {

using stitchfs::core::ErrorCode;
using stitchfs::upload::FinalizeRequest;

std::filesystem::path MakeTempDir() {
    const auto name = "stitchfs_assembler_" + Poco::UUIDGenerator().createOne().toString();
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::create_directories(dir);
    return dir;
}

std::string ReadAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Staging store whose recursive delete always fails.
class UndeletableStagingStore : public stitchfs::storage::LocalStagingStore {
public:
    using LocalStagingStore::LocalStagingStore;

    stitchfs::core::Result<void> RemoveDirRecursive(const std::string&) override {
        return stitchfs::core::MakeError(ErrorCode::kIoError, "Permission denied");
    }
};

class BrokenWriter : public stitchfs::storage::DestinationWriter {
public:
    stitchfs::core::Result<void> Append(const std::string&) override {
        return stitchfs::core::MakeError(ErrorCode::kIoError, "Input/output error");
    }
    stitchfs::core::Result<void> CloseAndFlush() override { return stitchfs::core::Ok(); }
    std::uint64_t bytes_written() const override { return 0; }
};

// Destination whose writes fail after the stream opens.
class BrokenDestinationStore : public stitchfs::storage::DestinationStore {
public:
    stitchfs::core::Result<std::unique_ptr<stitchfs::storage::DestinationWriter>>
    OpenAppendStream(const std::string&) override {
        std::unique_ptr<stitchfs::storage::DestinationWriter> writer(new BrokenWriter());
        return stitchfs::core::Result<std::unique_ptr<stitchfs::storage::DestinationWriter>>(
            std::move(writer));
    }
};

// Wires a receiver and an assembler over temp directories.
class AssemblyFixture : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = MakeTempDir();
        staging_root_ = root_ / "staging";
        public_root_ = root_ / "public";
        staging_ = std::make_shared<stitchfs::storage::LocalStagingStore>(staging_root_.string());
        Build(false);
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    void Build(bool atomic_publish) {
        destination_ = std::make_shared<stitchfs::storage::LocalDestinationStore>(
            public_root_.string(), atomic_publish);
        receiver_ = std::make_unique<stitchfs::upload::ChunkReceiver>(staging_, namer_);
        assembler_ = std::make_unique<stitchfs::upload::Assembler>(
            staging_, destination_, namer_, 1000,
            std::make_shared<stitchfs::upload::SessionLockTable>());
    }

    void Put(const std::string& session, int index, const std::string& payload) {
        ASSERT_TRUE(receiver_->Receive(session, std::to_string(index), payload).ok());
    }

    std::filesystem::path root_;
    std::filesystem::path staging_root_;
    std::filesystem::path public_root_;
    stitchfs::upload::PathNamer namer_{"/uploads"};
    std::shared_ptr<stitchfs::storage::LocalStagingStore> staging_;
    std::shared_ptr<stitchfs::storage::LocalDestinationStore> destination_;
    std::unique_ptr<stitchfs::upload::ChunkReceiver> receiver_;
    std::unique_ptr<stitchfs::upload::Assembler> assembler_;
};

}  // namespace

TEST_F(AssemblyFixture, ConcatenatesChunksInIndexOrder) {
    Put("abc-1", 0, "AAAA");
    Put("abc-1", 1, "BB");

    auto result = assembler_->Finalize(FinalizeRequest{"abc-1", "out.bin", 2});
    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result.value().path, "/uploads/out.bin");
    EXPECT_EQ(result.value().size_bytes, 6u);
    EXPECT_EQ(result.value().sha256,
              "e50b2631f174b40fab9feb415165c2a6409e2e79d85dd74f64fb7512fae0ac5f");
    EXPECT_EQ(ReadAll(public_root_ / "out.bin"), "AAAABB");
    EXPECT_FALSE(std::filesystem::exists(staging_root_ / "abc-1"));
}

TEST_F(AssemblyFixture, RoundTripsBinaryChunksReceivedOutOfOrder) {
    std::vector<std::string> chunks;
    std::string expected;
    for (int i = 0; i < 12; ++i) {
        std::string chunk;
        for (int j = 0; j < 257 * (i + 1); ++j) {
            chunk.push_back(static_cast<char>((i * 31 + j * 7) & 0xff));
        }
        chunks.push_back(chunk);
        expected += chunk;
    }
    for (int i = static_cast<int>(chunks.size()) - 1; i >= 0; --i) {
        Put("Bin_Session-7", i, chunks[static_cast<std::size_t>(i)]);
    }

    auto result = assembler_->Finalize(
        FinalizeRequest{"Bin_Session-7", "data.bin", static_cast<std::int64_t>(chunks.size())});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().size_bytes, expected.size());
    EXPECT_EQ(ReadAll(public_root_ / "data.bin"), expected);
}

TEST_F(AssemblyFixture, IdenticalContentHasIdenticalDigest) {
    Put("one", 0, "hello ");
    Put("one", 1, "world");
    Put("two", 0, "hello world");

    auto first = assembler_->Finalize(FinalizeRequest{"one", "a.txt", 2});
    auto second = assembler_->Finalize(FinalizeRequest{"two", "b.txt", 1});
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value().sha256, second.value().sha256);
}

TEST_F(AssemblyFixture, UsesLatestPayloadForResentChunk) {
    Put("s", 0, "stale");
    Put("s", 1, "-tail");
    Put("s", 0, "fresh");

    auto result = assembler_->Finalize(FinalizeRequest{"s", "out.txt", 2});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(ReadAll(public_root_ / "out.txt"), "fresh-tail");
}

TEST_F(AssemblyFixture, RejectsChunkCountOutOfRangeWithoutSideEffects) {
    Put("keep", 0, "data");

    for (const std::int64_t total : {std::int64_t{0}, std::int64_t{-1}, std::int64_t{1001}}) {
        auto result = assembler_->Finalize(FinalizeRequest{"keep", "out.bin", total});
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error().code, ErrorCode::kInvalidChunkCount);
    }
    EXPECT_TRUE(std::filesystem::exists(staging_root_ / "keep" / "chunk_0"));
    EXPECT_FALSE(std::filesystem::exists(public_root_ / "out.bin"));
}

TEST_F(AssemblyFixture, AcceptsChunkCountAtCeiling) {
    for (int i = 0; i < 1000; ++i) {
        Put("big", i, "x");
    }
    auto result = assembler_->Finalize(FinalizeRequest{"big", "big.bin", 1000});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().size_bytes, 1000u);
}

TEST_F(AssemblyFixture, RejectsInvalidSessionIdWithoutWriting) {
    auto result = assembler_->Finalize(FinalizeRequest{"../staging", "out.bin", 1});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kInvalidSessionId);
    EXPECT_TRUE(std::filesystem::is_empty(public_root_));
}

TEST_F(AssemblyFixture, RejectsUnpublishableDestinationName) {
    Put("s", 0, "data");
    for (const std::string name : {"", "..", "/", "a/..", "a/../"}) {
        auto result = assembler_->Finalize(FinalizeRequest{"s", name, 1});
        ASSERT_FALSE(result.ok()) << name;
        EXPECT_EQ(result.error().code, ErrorCode::kInvalidDestinationName) << name;
    }
    EXPECT_TRUE(std::filesystem::exists(staging_root_ / "s"));
}

TEST_F(AssemblyFixture, TrailingSeparatorKeepsLastNamedSegment) {
    Put("s", 0, "data");

    auto result = assembler_->Finalize(FinalizeRequest{"s", "nested/out.bin/", 1});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().path, "/uploads/out.bin");
    EXPECT_EQ(ReadAll(public_root_ / "out.bin"), "data");
}

TEST_F(AssemblyFixture, OverlongSessionIdIsRejected) {
    auto result =
        assembler_->Finalize(FinalizeRequest{std::string(100000, 'a'), "out.bin", 1});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kInvalidSessionId);
    EXPECT_TRUE(std::filesystem::is_empty(public_root_));
}

TEST_F(AssemblyFixture, UnknownSessionIsNotFound) {
    auto result = assembler_->Finalize(FinalizeRequest{"never-seen", "out.bin", 1});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kSessionNotFound);
    EXPECT_FALSE(std::filesystem::exists(public_root_ / "out.bin"));
}

TEST_F(AssemblyFixture, TraversalInDestinationStaysInsideRoot) {
    Put("x", 0, "root:x:0:0");

    auto result = assembler_->Finalize(FinalizeRequest{"x", "../../etc/passwd", 1});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().path, "/uploads/passwd");
    EXPECT_EQ(ReadAll(public_root_ / "passwd"), "root:x:0:0");
    EXPECT_FALSE(std::filesystem::exists(root_ / "etc"));
}

TEST_F(AssemblyFixture, MissingChunkFailsAndStillCleansUp) {
    Put("gap", 0, "AAAA");
    Put("gap", 2, "CC");

    auto result = assembler_->Finalize(FinalizeRequest{"gap", "gap.bin", 3});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kAssemblyFailed);
    EXPECT_EQ(result.error().cause, ErrorCode::kMissingChunk);
    EXPECT_NE(result.error().message.find("incomplete"), std::string::npos);
    EXPECT_EQ(result.error().message.find(staging_root_.string()), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(staging_root_ / "gap"));
    // Bytes written before the gap are not rolled back.
    EXPECT_EQ(ReadAll(public_root_ / "gap.bin"), "AAAA");
}

TEST_F(AssemblyFixture, AtomicPublishLeavesNothingOnFailure) {
    Build(true);
    Put("gap", 0, "AAAA");

    auto result = assembler_->Finalize(FinalizeRequest{"gap", "gap.bin", 2});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().cause, ErrorCode::kMissingChunk);
    EXPECT_EQ(result.error().message.find("incomplete"), std::string::npos);
    EXPECT_NE(result.error().message.find("no file was published"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(staging_root_ / "gap"));
    EXPECT_TRUE(std::filesystem::is_empty(public_root_));
}

TEST_F(AssemblyFixture, AtomicPublishWritesCompleteFile) {
    Build(true);
    Put("ok", 0, "AAAA");
    Put("ok", 1, "BB");

    auto result = assembler_->Finalize(FinalizeRequest{"ok", "out.bin", 2});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(ReadAll(public_root_ / "out.bin"), "AAAABB");
}

TEST_F(AssemblyFixture, DestinationWriteErrorIsReportedAsAssemblyFailure) {
    Put("s", 0, "data");
    stitchfs::upload::Assembler broken(staging_, std::make_shared<BrokenDestinationStore>(),
                                       namer_, 1000, nullptr);

    auto result = broken.Finalize(FinalizeRequest{"s", "out.bin", 1});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kAssemblyFailed);
    EXPECT_EQ(result.error().cause, ErrorCode::kIoError);
    EXPECT_EQ(result.error().message.find("Input/output"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(staging_root_ / "s"));
}

TEST_F(AssemblyFixture, CleanupFailureDoesNotChangeResult) {
    auto sticky = std::make_shared<UndeletableStagingStore>(staging_root_.string());
    stitchfs::upload::ChunkReceiver receiver(sticky, namer_);
    stitchfs::upload::Assembler assembler(sticky, destination_, namer_, 1000, nullptr);
    ASSERT_TRUE(receiver.Receive("s", "0", "data").ok());

    auto result = assembler.Finalize(FinalizeRequest{"s", "out.bin", 1});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(ReadAll(public_root_ / "out.bin"), "data");
    EXPECT_TRUE(std::filesystem::exists(staging_root_ / "s"));
}

TEST_F(AssemblyFixture, ConcurrentFinalizeOnOneSessionIsSerialized) {
    for (int i = 0; i < 50; ++i) {
        Put("race", i, std::string(1024, static_cast<char>('a' + i % 26)));
    }

    std::atomic<int> succeeded{0};
    std::atomic<int> not_found{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            auto result = assembler_->Finalize(FinalizeRequest{"race", "race.bin", 50});
            if (result.ok()) {
                succeeded.fetch_add(1);
            } else if (result.error().code == ErrorCode::kSessionNotFound) {
                not_found.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(not_found.load(), 3);
    EXPECT_EQ(std::filesystem::file_size(public_root_ / "race.bin"), 50u * 1024u);
}
