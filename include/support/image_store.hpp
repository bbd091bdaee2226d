#ifndef IMAGESTASH_IMAGE_STORE_HPP
#define IMAGESTASH_IMAGE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <ios>
#include <istream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace imagestash {

// Raised when the backing filesystem refuses a write.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised by save() for a MIME type with no known file extension.
class UnsupportedContentType : public std::invalid_argument {
public:
    explicit UnsupportedContentType(const std::string& contentType)
        : std::invalid_argument("No file extension known for content type '" + contentType + "'") {}
};

struct OpenedImage {
    std::unique_ptr<std::istream> stream;
    std::uintmax_t length = 0;
};

/**
 * @brief Flat directory of uploaded images named "<uuid>.<ext>".
 *
 * Names are generated on save and checked against the same shape on open, so a
 * client-supplied name can never resolve outside the storage directory.
 */
class ImageStore {
public:
    using UuidGenerator = std::function<std::string()>;
    using FileOpener = std::function<std::unique_ptr<std::iostream>(const std::filesystem::path&, std::ios_base::openmode)>;

    static constexpr std::size_t chunkSize = 4096;

    /**
     * @brief Process-wide store rooted at custom_config.image_store.storage_path.
     * @return nullptr if the storage directory cannot be created.
     */
    static std::shared_ptr<ImageStore> instance();

    explicit ImageStore(std::filesystem::path storagePath,
                        UuidGenerator uuidGenerator = defaultUuid,
                        FileOpener fileOpener = defaultOpen);
    virtual ~ImageStore() = default;

    /**
     * @brief Copies an upload into a freshly named file.
     * @param image Body stream, read until exhausted.
     * @param contentType Normalized MIME type declared by the client.
     * @return The generated name. The file is complete when this returns.
     * @throws UnsupportedContentType if contentType has no known extension.
     * @throws StorageError if the file cannot be created or written.
     */
    virtual std::string save(std::istream& image, const std::string& contentType);

    /**
     * @brief Opens a stored image for reading.
     * @return std::nullopt if the name is malformed or no such file can be opened.
     */
    virtual std::optional<OpenedImage> open(const std::string& name) const;

    static bool isValidName(const std::string& name);

    const std::filesystem::path& storagePath() const { return storagePath_; }

    // Lowercase, hyphenated v4 UUID.
    static std::string defaultUuid();
    static std::unique_ptr<std::iostream> defaultOpen(const std::filesystem::path& path, std::ios_base::openmode mode);

private:
    void discard(const std::filesystem::path& path) const;

    std::filesystem::path storagePath_;
    UuidGenerator uuidGenerator_;
    FileOpener fileOpener_;
};

}

#endif // IMAGESTASH_IMAGE_STORE_HPP
