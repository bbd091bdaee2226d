#ifndef IMAGESTASH_IMAGE_TYPE_FILTER_HPP
#define IMAGESTASH_IMAGE_TYPE_FILTER_HPP

#include <drogon/HttpFilter.h>
#include <drogon/HttpResponse.h>
#include <support/controllers.hpp>
#include <support/media_types.hpp>

namespace imagestash {
    // Rejects uploads whose declared Content-Type is not GIF, JPEG or PNG.
    class ImageTypeFilter : public drogon::HttpFilter<ImageTypeFilter> {
    public:
        void doFilter(const drogon::HttpRequestPtr &req,
                      drogon::FilterCallback &&fcb,
                      drogon::FilterChainCallback &&fccb) override {
            const auto contentType = media::normalize(req->getHeader("content-type"));
            if (media::isAllowedUpload(contentType)) {
                fccb();
                return;
            }
            LOG_DEBUG << "Rejected upload with content type '" << contentType << "'";
            fcb(newErrorResponse(drogon::k400BadRequest, "Bad request",
                                 "Image type not allowed. Must be PNG, JPEG, or GIF"));
        }
    };
}

#endif //IMAGESTASH_IMAGE_TYPE_FILTER_HPP
