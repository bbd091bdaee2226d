#include <support/image_store.hpp>
#include <support/media_types.hpp>
#include <drogon/drogon.h>
#include <drogon/utils/Utilities.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <regex>

namespace imagestash {

static const std::regex imageNamePattern(
    "[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}\\.[a-z]{2,4}");

std::shared_ptr<ImageStore> ImageStore::instance() {
    static std::shared_ptr<ImageStore> store = []() -> std::shared_ptr<ImageStore> {
        const auto& storeConfig = drogon::app().getCustomConfig()["image_store"];
        std::filesystem::path storagePath = storeConfig.get("storage_path", "images").asString();

        std::error_code ec;
        std::filesystem::create_directories(storagePath, ec);
        if (ec) {
            LOG_ERROR << "Cannot create image storage directory " << storagePath << ": " << ec.message();
            return nullptr;
        }

        LOG_INFO << "Image store path: " << std::filesystem::absolute(storagePath, ec);
        return std::make_shared<ImageStore>(storagePath);
    }();
    return store;
}

ImageStore::ImageStore(std::filesystem::path storagePath, UuidGenerator uuidGenerator, FileOpener fileOpener)
    : storagePath_(std::move(storagePath)),
      uuidGenerator_(std::move(uuidGenerator)),
      fileOpener_(std::move(fileOpener)) {}

std::string ImageStore::save(std::istream& image, const std::string& contentType) {
    auto extension = media::extensionFor(contentType);
    if (!extension) {
        throw UnsupportedContentType(contentType);
    }

    std::string name = uuidGenerator_() + *extension;
    auto imagePath = storagePath_ / name;

    auto out = fileOpener_(imagePath, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out || !*out) {
        throw StorageError("Cannot create " + imagePath.string());
    }

    std::array<char, chunkSize> chunk;
    std::uintmax_t written = 0;
    while (image.read(chunk.data(), chunk.size()) || image.gcount() > 0) {
        out->write(chunk.data(), image.gcount());
        if (!*out) {
            out.reset();
            discard(imagePath);
            throw StorageError("Write failed for " + imagePath.string() + " after " + std::to_string(written) + " bytes");
        }
        written += static_cast<std::uintmax_t>(image.gcount());
    }

    if (image.bad()) {
        out.reset();
        discard(imagePath);
        throw StorageError("Upload stream failed while writing " + imagePath.string());
    }

    out->flush();
    if (!*out) {
        out.reset();
        discard(imagePath);
        throw StorageError("Flush failed for " + imagePath.string());
    }

    LOG_DEBUG << "Stored " << name << " (" << written << " bytes)";
    return name;
}

std::optional<OpenedImage> ImageStore::open(const std::string& name) const {
    // Only names shaped like generated ones may reach the filesystem
    if (!isValidName(name)) {
        LOG_DEBUG << "Rejected image name: " << name;
        return std::nullopt;
    }

    auto imagePath = storagePath_ / name;
    auto in = fileOpener_(imagePath, std::ios::in | std::ios::binary);
    if (!in || !*in) {
        LOG_DEBUG << "Image not found: " << imagePath;
        return std::nullopt;
    }

    in->seekg(0, std::ios::end);
    auto end = in->tellg();
    in->seekg(0, std::ios::beg);
    if (end < 0 || !*in) {
        LOG_WARN << "Cannot determine size of " << imagePath;
        return std::nullopt;
    }

    OpenedImage opened;
    opened.stream = std::move(in);
    opened.length = static_cast<std::uintmax_t>(end);
    return opened;
}

bool ImageStore::isValidName(const std::string& name) {
    return std::regex_match(name, imageNamePattern);
}

std::string ImageStore::defaultUuid() {
    // drogon renders the 16 uuid bytes as bare hex; add the 8-4-4-4-12 grouping
    std::string hex = drogon::utils::getUuid();
    hex.erase(std::remove(hex.begin(), hex.end(), '-'), hex.end());
    std::transform(hex.begin(), hex.end(), hex.begin(), [](unsigned char c) { return std::tolower(c); });

    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::unique_ptr<std::iostream> ImageStore::defaultOpen(const std::filesystem::path& path, std::ios_base::openmode mode) {
    return std::make_unique<std::fstream>(path, mode);
}

void ImageStore::discard(const std::filesystem::path& path) const {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        LOG_ERROR << "Failed to remove partial image " << path << ": " << ec.message();
    }
}

}
