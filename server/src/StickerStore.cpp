#include "StickerStore.h"
#include "Identifiers.h"
#include "Logger.h"
#include <cstdio>
#include <ctime>
#include <system_error>

namespace fs = std::filesystem;

namespace Qalla {

    namespace {

        const char* ExtensionFor(const std::string& mime) {
            if (mime == "image/png") return ".png";
            if (mime == "image/webp") return ".webp";
            if (mime == "image/gif") return ".gif";
            return nullptr;
        }

        bool IsPlainFileName(const std::string& name) {
            if (name.empty() || name == "." || name == "..") return false;
            for (char c : name) {
                const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                    || (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
                if (!ok) return false;
            }
            return true;
        }

    } // namespace

    // ---------------------------------------------------------------------------
    // StickerUpload
    // ---------------------------------------------------------------------------

    StickerUpload::StickerUpload(fs::path path, std::string fileName, size_t expectedSize)
        : m_Path(std::move(path))
        , m_FileName(std::move(fileName))
        , m_Expected(expectedSize)
    {
        m_File.open(m_Path, std::ios::binary | std::ios::trunc);
    }

    StickerUpload::~StickerUpload() {
        if (!m_Committed) Discard();
    }

    bool StickerUpload::Write(const uint8_t* data, size_t len) {
        if (!m_File.is_open()) return false;
        if (m_Received + len > m_Expected) return false;
        m_File.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        if (!m_File) return false;
        m_Received += len;
        return true;
    }

    bool StickerUpload::Finish() {
        if (!m_File.is_open()) return false;
        m_File.close();
        if (m_File.fail() || m_Received != m_Expected) {
            Discard();
            return false;
        }
        m_Committed = true;
        return true;
    }

    void StickerUpload::Discard() {
        if (m_File.is_open()) m_File.close();
        std::error_code ec;
        fs::remove(m_Path, ec);
    }

    // ---------------------------------------------------------------------------
    // StickerStore
    // ---------------------------------------------------------------------------

    StickerStore::StickerStore(fs::path directory, size_t maxBytes)
        : m_Directory(std::move(directory))
        , m_MaxBytes(maxBytes)
    {
    }

    bool StickerStore::IsAllowedMime(const std::string& mime) {
        return ExtensionFor(mime) != nullptr;
    }

    std::string StickerStore::UrlFor(const std::string& fileName) {
        return std::string(kUrlPrefix) + fileName;
    }

    StickerStore::BeginResult StickerStore::Begin(const std::string& mime, size_t size) const {
        BeginResult result;
        const char* ext = ExtensionFor(mime);
        if (!ext) { result.error = "Invalid file type"; return result; }
        if (size == 0) { result.error = "No file uploaded"; return result; }
        if (size > m_MaxBytes) { result.error = "File too large"; return result; }

        std::error_code ec;
        fs::create_directories(m_Directory, ec);
        if (ec) {
            std::fprintf(stderr, "[Qalla Server] Cannot create sticker dir %s: %s\n",
                m_Directory.string().c_str(), ec.message().c_str());
            result.error = "Upload unavailable";
            return result;
        }

        std::string fileName = std::to_string(std::time(nullptr)) + "_" + RandomHex(8) + ext;
        auto upload = std::make_unique<StickerUpload>(m_Directory / fileName, fileName, size);
        if (!upload->IsOpen()) {
            result.error = "Upload unavailable";
            return result;
        }
        RelayTrace::log("step=sticker_begin file=" + fileName + " size=" + std::to_string(size));
        result.upload = std::move(upload);
        return result;
    }

    std::optional<std::vector<uint8_t>> StickerStore::Read(const std::string& url) const {
        const std::string prefix = kUrlPrefix;
        if (url.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
        const std::string name = url.substr(prefix.size());
        if (!IsPlainFileName(name)) return std::nullopt;

        std::error_code ec;
        const fs::path path = m_Directory / name;
        if (!fs::is_regular_file(path, ec) || ec) return std::nullopt;
        const auto size = fs::file_size(path, ec);
        if (ec || size > m_MaxBytes) return std::nullopt;

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) return std::nullopt;
        std::vector<uint8_t> data(static_cast<size_t>(size));
        if (size > 0 && !in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size)))
            return std::nullopt;
        return data;
    }

} // namespace Qalla
