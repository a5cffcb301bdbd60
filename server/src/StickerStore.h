#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Qalla {

    // One in-flight upload. The partial file is deleted on destruction unless
    // Finish() saw exactly the declared number of bytes.
    class StickerUpload {
    public:
        StickerUpload(std::filesystem::path path, std::string fileName, size_t expectedSize);
        ~StickerUpload();

        StickerUpload(const StickerUpload&) = delete;
        StickerUpload& operator=(const StickerUpload&) = delete;

        bool IsOpen() const { return m_File.is_open(); }
        // False if the chunk would exceed the declared size or the write failed.
        bool Write(const uint8_t* data, size_t len);
        bool Finish();

        const std::string& FileName() const { return m_FileName; }
        size_t Received() const { return m_Received; }

    private:
        void Discard();

        std::filesystem::path m_Path;
        std::string           m_FileName;
        std::ofstream         m_File;
        size_t                m_Expected{ 0 };
        size_t                m_Received{ 0 };
        bool                  m_Committed{ false };
    };

    // ---------------------------------------------------------------------------
    // Directory-backed store for sticker images. Only a small set of raster
    // types is accepted; stored files are addressed as "/stickers/<file>".
    // ---------------------------------------------------------------------------
    class StickerStore {
    public:
        static constexpr const char* kUrlPrefix = "/stickers/";

        struct BeginResult {
            std::unique_ptr<StickerUpload> upload;
            std::string                    error;   // set when upload is null
        };

        StickerStore(std::filesystem::path directory, size_t maxBytes);

        static bool IsAllowedMime(const std::string& mime);
        static std::string UrlFor(const std::string& fileName);

        BeginResult Begin(const std::string& mime, size_t size) const;

        // Contents of a stored sticker; nullopt for URLs outside the store.
        std::optional<std::vector<uint8_t>> Read(const std::string& url) const;

    private:
        std::filesystem::path m_Directory;
        size_t                m_MaxBytes;
    };

} // namespace Qalla
