#include <support/error_handler.hpp>
#include <support/controllers.hpp>

namespace imagestash {
    void handleUncaughtException(const std::exception &e,
                                 const drogon::HttpRequestPtr &req,
                                 std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
        LOG_ERROR << "Unhandled exception for " << req->methodString() << " " << req->getPath() << ": " << e.what();
        callback(newErrorResponse(drogon::k500InternalServerError, "Internal Server Error"));
    }
}
