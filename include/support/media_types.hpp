#ifndef IMAGESTASH_MEDIA_TYPES_HPP
#define IMAGESTASH_MEDIA_TYPES_HPP

#include <drogon/HttpTypes.h>
#include <optional>
#include <string>
#include <string_view>

namespace imagestash::media {
    struct MediaType {
        std::string_view mimeType;
        std::string_view extension;
        drogon::ContentType code;
    };

    /**
     * @brief Reduces a Content-Type header value to its bare lowercase MIME type.
     *
     * "Image/PNG; charset=binary" becomes "image/png".
     */
    std::string normalize(std::string_view headerValue);

    /**
     * @brief Returns the extension (with leading dot) conventionally used for a MIME type.
     * @return std::nullopt if the type is not a known image type.
     */
    std::optional<std::string> extensionFor(std::string_view mimeType);

    // Falls back to application/octet-stream for unknown extensions.
    const MediaType& typeForName(std::string_view fileName);

    // Only GIF, JPEG and PNG may be uploaded.
    bool isAllowedUpload(std::string_view mimeType);
}

#endif // IMAGESTASH_MEDIA_TYPES_HPP
