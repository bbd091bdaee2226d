#include <support/media_types.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace imagestash::media {

// The first entry for a MIME type is its preferred extension.
static constexpr std::array<MediaType, 10> knownTypes{{
    {"image/gif", ".gif", drogon::CT_IMAGE_GIF},
    {"image/jpeg", ".jpg", drogon::CT_IMAGE_JPG},
    {"image/jpeg", ".jpeg", drogon::CT_IMAGE_JPG},
    {"image/jpeg", ".jpe", drogon::CT_IMAGE_JPG},
    {"image/png", ".png", drogon::CT_IMAGE_PNG},
    {"image/bmp", ".bmp", drogon::CT_IMAGE_BMP},
    {"image/webp", ".webp", drogon::CT_IMAGE_WEBP},
    {"image/x-icon", ".ico", drogon::CT_IMAGE_XICON},
    {"image/vnd.microsoft.icon", ".ico", drogon::CT_IMAGE_XICON},
    {"image/svg+xml", ".svg", drogon::CT_IMAGE_SVG_XML},
}};

static constexpr MediaType octetStream{"application/octet-stream", "", drogon::CT_APPLICATION_OCTET_STREAM};

static constexpr std::array<std::string_view, 3> uploadTypes{"image/gif", "image/jpeg", "image/png"};

static std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string normalize(std::string_view headerValue) {
    auto end = headerValue.find(';');
    if (end != std::string_view::npos) headerValue = headerValue.substr(0, end);

    auto start = headerValue.find_first_not_of(" \t");
    if (start == std::string_view::npos) return "";
    auto last = headerValue.find_last_not_of(" \t");
    return toLower(headerValue.substr(start, last - start + 1));
}

std::optional<std::string> extensionFor(std::string_view mimeType) {
    for (const auto& type : knownTypes) {
        if (type.mimeType == mimeType) return std::string(type.extension);
    }
    return std::nullopt;
}

const MediaType& typeForName(std::string_view fileName) {
    auto dot = fileName.find_last_of('.');
    if (dot == std::string_view::npos) return octetStream;

    std::string extension = toLower(fileName.substr(dot));
    for (const auto& type : knownTypes) {
        if (type.extension == extension) return type;
    }
    return octetStream;
}

bool isAllowedUpload(std::string_view mimeType) {
    return std::find(uploadTypes.begin(), uploadTypes.end(), mimeType) != uploadTypes.end();
}

}
