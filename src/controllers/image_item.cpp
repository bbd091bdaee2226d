#include <controllers/image_item.hpp>
#include <support/media_types.hpp>

namespace imagestash {
    void ImageItemController::get(const drogon::HttpRequestPtr& req, Callback_t callback, const std::string& name) {
        auto imageStore = store();
        if (!imageStore) {
            callback(newErrorResponse(drogon::k500InternalServerError, "Internal Server Error", "Image store not configured"));
            return;
        }

        const auto contentType = media::typeForName(name).code;

        auto opened = imageStore->open(name);
        if (!opened) {
            auto resp = drogon::HttpResponse::newHttpResponse();
            resp->setStatusCode(drogon::k404NotFound);
            resp->setContentTypeCode(drogon::CT_NONE);
            callback(resp);
            return;
        }

        // Content-Length is declared up front so drogon does not fall back to chunked encoding
        auto resp = drogon::HttpResponse::newStreamResponse(newChunkReader(std::move(opened->stream)));
        resp->setContentTypeCode(contentType);
        resp->addHeader("Content-Length", std::to_string(opened->length));
        callback(resp);
    }
}
