#ifndef IMAGESTASH_IMAGE_COLLECTION_HPP
#define IMAGESTASH_IMAGE_COLLECTION_HPP
#include <drogon/HttpController.h>

#include <support/controllers.hpp>
#include <support/image_store.hpp>

namespace imagestash {
    class ImageCollectionController : public drogon::HttpController<ImageCollectionController>
    {
    public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(ImageCollectionController::list, "/images", drogon::Get);
    ADD_METHOD_TO(ImageCollectionController::upload, "/images", drogon::Post, "imagestash::ImageTypeFilter");
    METHOD_LIST_END

    ImageCollectionController() = default;
    explicit ImageCollectionController(std::shared_ptr<ImageStore> store) : store_(std::move(store)) {}

    void list(const drogon::HttpRequestPtr& req, Callback_t callback);
    void upload(const drogon::HttpRequestPtr& req, Callback_t callback);

    private:
    std::shared_ptr<ImageStore> store() const { return store_ ? store_ : ImageStore::instance(); }

    std::shared_ptr<ImageStore> store_;
    };
}

#endif //IMAGESTASH_IMAGE_COLLECTION_HPP
