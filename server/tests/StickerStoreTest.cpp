#include "StickerStore.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace Qalla;

namespace {

    class StickerStoreTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            dir = fs::temp_directory_path() / (std::string("qalla_stickers_") + info->name());
            fs::remove_all(dir);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }

        size_t FileCount() const {
            if (!fs::exists(dir)) return 0;
            size_t n = 0;
            for (const auto& entry : fs::directory_iterator(dir)) {
                (void)entry;
                ++n;
            }
            return n;
        }

        fs::path dir;
    };

    std::vector<uint8_t> Bytes(size_t n, uint8_t seed = 1) {
        std::vector<uint8_t> out(n);
        for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(seed + i);
        return out;
    }

} // namespace

TEST_F(StickerStoreTest, OnlyRasterImageTypesAreAccepted) {
    EXPECT_TRUE(StickerStore::IsAllowedMime("image/png"));
    EXPECT_TRUE(StickerStore::IsAllowedMime("image/webp"));
    EXPECT_TRUE(StickerStore::IsAllowedMime("image/gif"));
    EXPECT_FALSE(StickerStore::IsAllowedMime("image/jpeg"));
    EXPECT_FALSE(StickerStore::IsAllowedMime("image/svg+xml"));
    EXPECT_FALSE(StickerStore::IsAllowedMime(""));

    StickerStore store(dir, 1024);
    auto result = store.Begin("text/html", 10);
    EXPECT_FALSE(result.upload);
    EXPECT_EQ(result.error, "Invalid file type");
    EXPECT_EQ(FileCount(), 0u);
}

TEST_F(StickerStoreTest, RejectsEmptyAndOversizedUploads) {
    StickerStore store(dir, 1024);

    auto empty = store.Begin("image/png", 0);
    EXPECT_FALSE(empty.upload);
    EXPECT_EQ(empty.error, "No file uploaded");

    auto big = store.Begin("image/png", 1025);
    EXPECT_FALSE(big.upload);
    EXPECT_EQ(big.error, "File too large");

    auto exact = store.Begin("image/png", 1024);
    EXPECT_TRUE(exact.upload);
}

TEST_F(StickerStoreTest, CompletedUploadIsReadableByUrl) {
    StickerStore store(dir, 1024);
    auto result = store.Begin("image/webp", 6);
    ASSERT_TRUE(result.upload);
    const std::string fileName = result.upload->FileName();
    EXPECT_EQ(fs::path(fileName).extension().string(), ".webp");

    const auto data = Bytes(6);
    ASSERT_TRUE(result.upload->Write(data.data(), 4));
    ASSERT_TRUE(result.upload->Write(data.data() + 4, 2));
    EXPECT_TRUE(result.upload->Finish());
    result.upload.reset();

    const std::string url = StickerStore::UrlFor(fileName);
    EXPECT_EQ(url, "/stickers/" + fileName);
    auto read = store.Read(url);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, data);
}

TEST_F(StickerStoreTest, WritingPastDeclaredSizeFails) {
    StickerStore store(dir, 1024);
    auto result = store.Begin("image/png", 4);
    ASSERT_TRUE(result.upload);
    const auto data = Bytes(5);
    EXPECT_FALSE(result.upload->Write(data.data(), data.size()));
    EXPECT_EQ(result.upload->Received(), 0u);
}

TEST_F(StickerStoreTest, IncompleteUploadLeavesNoFile) {
    StickerStore store(dir, 1024);
    auto result = store.Begin("image/gif", 10);
    ASSERT_TRUE(result.upload);
    const auto data = Bytes(3);
    ASSERT_TRUE(result.upload->Write(data.data(), data.size()));
    EXPECT_FALSE(result.upload->Finish());
    result.upload.reset();
    EXPECT_EQ(FileCount(), 0u);
}

TEST_F(StickerStoreTest, AbandonedUploadIsDeleted) {
    StickerStore store(dir, 1024);
    {
        auto result = store.Begin("image/png", 10);
        ASSERT_TRUE(result.upload);
        const auto data = Bytes(5);
        ASSERT_TRUE(result.upload->Write(data.data(), data.size()));
        EXPECT_EQ(FileCount(), 1u);
    }
    EXPECT_EQ(FileCount(), 0u);
}

TEST_F(StickerStoreTest, ReadRejectsPathsOutsideTheStore) {
    fs::create_directories(dir);
    std::ofstream(dir / "ok.png", std::ios::binary) << "png";
    std::ofstream(dir.parent_path() / "qalla_outside.txt") << "secret";

    StickerStore store(dir, 1024);
    EXPECT_TRUE(store.Read("/stickers/ok.png").has_value());
    EXPECT_FALSE(store.Read("/stickers/../qalla_outside.txt").has_value());
    EXPECT_FALSE(store.Read("/stickers/..").has_value());
    EXPECT_FALSE(store.Read("/stickers/").has_value());
    EXPECT_FALSE(store.Read("/stickers/missing.png").has_value());
    EXPECT_FALSE(store.Read("/uploads/ok.png").has_value());
    EXPECT_FALSE(store.Read("ok.png").has_value());

    std::error_code ec;
    fs::remove(dir.parent_path() / "qalla_outside.txt", ec);
}
