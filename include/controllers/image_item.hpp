#ifndef IMAGESTASH_IMAGE_ITEM_HPP
#define IMAGESTASH_IMAGE_ITEM_HPP
#include <drogon/HttpController.h>

#include <support/controllers.hpp>
#include <support/image_store.hpp>

namespace imagestash {
    class ImageItemController : public drogon::HttpController<ImageItemController>
    {
    public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(ImageItemController::get, "/images/{1}", drogon::Get);
    METHOD_LIST_END

    ImageItemController() = default;
    explicit ImageItemController(std::shared_ptr<ImageStore> store) : store_(std::move(store)) {}

    void get(const drogon::HttpRequestPtr& req, Callback_t callback, const std::string& name);

    private:
    std::shared_ptr<ImageStore> store() const { return store_ ? store_ : ImageStore::instance(); }

    std::shared_ptr<ImageStore> store_;
    };
}

#endif //IMAGESTASH_IMAGE_ITEM_HPP
