#ifndef IMAGESTASH_ERROR_HANDLER_HPP
#define IMAGESTASH_ERROR_HANDLER_HPP

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <exception>
#include <functional>

namespace imagestash {
    /**
     * @brief Application-wide handler for exceptions escaping a controller.
     *
     * Logs the exception and answers 500 with a generic body; the exception
     * text never reaches the client.
     */
    void handleUncaughtException(const std::exception &e,
                                 const drogon::HttpRequestPtr &req,
                                 std::function<void(const drogon::HttpResponsePtr &)> &&callback);
}

#endif //IMAGESTASH_ERROR_HANDLER_HPP
