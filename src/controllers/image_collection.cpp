#include <controllers/image_collection.hpp>
#include <filters/image_type_filter.hpp>
#include <support/media_types.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

namespace imagestash {
    // Example listing; stored images are not enumerated.
    static const char* const exampleHref = "/images/1eaf6ef1-7f2d-4ecc-a8d5-6e8adba7cc0e.png";

    static bool prefersJson(const std::string& accept) {
        return accept.find("application/json") != std::string::npos &&
               accept.find("application/msgpack") == std::string::npos;
    }

    void ImageCollectionController::list(const drogon::HttpRequestPtr& req, Callback_t callback) {
        if (prefersJson(req->getHeader("accept"))) {
            Json::Value root;
            Json::Value image;
            image["href"] = exampleHref;
            root["images"].append(image);
            callback(drogon::HttpResponse::newHttpJsonResponse(root));
            return;
        }

        nlohmann::json image = {{"href", exampleHref}};
        nlohmann::json doc;
        doc["images"] = nlohmann::json::array({image});
        std::vector<std::uint8_t> packed = nlohmann::json::to_msgpack(doc);

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(std::string(packed.begin(), packed.end()));
        resp->setContentTypeCodeAndCustomString(drogon::CT_CUSTOM, "application/msgpack");
        callback(resp);
    }

    void ImageCollectionController::upload(const drogon::HttpRequestPtr& req, Callback_t callback) {
        auto imageStore = store();
        if (!imageStore) {
            callback(newErrorResponse(drogon::k500InternalServerError, "Internal Server Error", "Image store not configured"));
            return;
        }

        const auto contentType = media::normalize(req->getHeader("content-type"));
        std::istringstream body(std::string(req->body()));

        std::string name;
        try {
            name = imageStore->save(body, contentType);
        } catch (const UnsupportedContentType& e) {
            LOG_WARN << e.what();
            callback(newErrorResponse(drogon::k400BadRequest, "Bad request", "Unsupported image type"));
            return;
        }
        // StorageError propagates to the application exception handler

        LOG_INFO << "Stored upload as " << name;
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k201Created);
        resp->addHeader("Location", "/images/" + name);
        callback(resp);
    }
}
