#ifndef IMAGESTASH_CONTROLLERS_HPP
#define IMAGESTASH_CONTROLLERS_HPP
#include <drogon/drogon.h>
#include <istream>
#include <memory>
#include <string>

namespace imagestash {
    using Callback_t = std::function<void(const drogon::HttpResponsePtr &)>&&;

    // Error document: {"title": ..., "description": ...}
    inline drogon::HttpResponsePtr newErrorResponse(drogon::HttpStatusCode code,
                                                    const std::string &title,
                                                    const std::string &description = "") {
        Json::Value body;
        body["title"] = title;
        if (!description.empty()) body["description"] = description;
        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(code);
        return resp;
    }

    /**
     * @brief Adapts an input stream to drogon's stream-response callback.
     *
     * Each call copies at most `length` bytes into `buffer` and returns the
     * count; 0 ends the body. A null buffer means drogon is done with the
     * response, and the stream is released.
     */
    inline std::function<std::size_t(char *, std::size_t)> newChunkReader(std::unique_ptr<std::istream> stream) {
        auto source = std::shared_ptr<std::istream>(std::move(stream));
        return [source](char *buffer, std::size_t length) mutable -> std::size_t {
            if (!buffer || !source) {
                source.reset();
                return 0;
            }
            source->read(buffer, static_cast<std::streamsize>(length));
            auto count = static_cast<std::size_t>(source->gcount());
            if (count == 0) source.reset();
            return count;
        };
    }
}

#endif //IMAGESTASH_CONTROLLERS_HPP
