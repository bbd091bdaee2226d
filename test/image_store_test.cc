#include <drogon/drogon_test.h>
#include <support/image_store.hpp>
#include "test_helpers.hpp"
#include <fstream>
#include <sstream>

using imagestash::ImageStore;
using namespace imagestash::test;

static const std::string fixedUuid = "1eaf6ef1-7f2d-4ecc-a8d5-6e8adba7cc0e";

DROGON_TEST(ImageStoreRejectsMalformedNames)
{
    TempDir dir;
    int opens = 0;
    ImageStore store(dir.path(), [] { return fixedUuid; },
                     [&opens](const std::filesystem::path& path, std::ios_base::openmode mode) {
                         ++opens;
                         return ImageStore::defaultOpen(path, mode);
                     });

    const std::vector<std::string> names = {
        "",
        "../../etc/passwd.png",
        "../../etc/passwd",
        "../" + fixedUuid + ".png",
        "sub/" + fixedUuid + ".png",
        fixedUuid,
        fixedUuid + ".",
        fixedUuid + ".p",
        fixedUuid + ".tiffs",
        fixedUuid + ".PNG",
        fixedUuid + ".png\n",
        fixedUuid + ".png/..",
        "1EAF6EF1-7F2D-4ECC-A8D5-6E8ADBA7CC0E.png",
        "1eaf6ef17f2d4ecca8d56e8adba7cc0e.png",
        "1eaf6ef1-7f2d-4ecc-a8d5-6e8adba7cc0g.png",
        " " + fixedUuid + ".png",
    };
    for (const auto& name : names) {
        CHECK(!ImageStore::isValidName(name));
        CHECK(!store.open(name).has_value());
    }
    CHECK(opens == 0);

    CHECK(ImageStore::isValidName(fixedUuid + ".png"));
    CHECK(ImageStore::isValidName(fixedUuid + ".jpeg"));
}

DROGON_TEST(ImageStoreNamesCarryTheContentTypeExtension)
{
    TempDir dir;
    ImageStore store(dir.path(), [] { return fixedUuid; });

    const std::vector<std::pair<std::string, std::string>> cases = {
        {"image/gif", ".gif"},
        {"image/jpeg", ".jpg"},
        {"image/png", ".png"},
    };
    for (const auto& c : cases) {
        std::istringstream body("GIF89a");
        auto name = store.save(body, c.first);
        CHECK(name == fixedUuid + c.second);
        CHECK(ImageStore::isValidName(name));
        CHECK(std::filesystem::exists(dir.path() / name));
    }
}

DROGON_TEST(ImageStoreRoundTripsTrickledUpload)
{
    TempDir dir;
    ImageStore store(dir.path());

    const std::string original = randomBytes(10000);
    TrickleBuf trickle(original, 7);
    std::istream upload(&trickle);

    auto name = store.save(upload, "image/png");
    CHECK(ImageStore::isValidName(name));
    CHECK(std::filesystem::file_size(dir.path() / name) == 10000);

    auto opened = store.open(name);
    REQUIRE(opened.has_value());
    CHECK(opened->length == original.size());
    CHECK(readAll(*opened->stream) == original);
}

DROGON_TEST(ImageStoreReadsAreRepeatable)
{
    TempDir dir;
    ImageStore store(dir.path());

    std::istringstream upload(randomBytes(5000, 7));
    auto name = store.save(upload, "image/jpeg");

    auto first = store.open(name);
    auto second = store.open(name);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->length == second->length);
    CHECK(readAll(*first->stream) == readAll(*second->stream));
}

DROGON_TEST(ImageStoreSavesEmptyUpload)
{
    TempDir dir;
    ImageStore store(dir.path());

    std::istringstream upload("");
    auto name = store.save(upload, "image/gif");
    auto opened = store.open(name);
    REQUIRE(opened.has_value());
    CHECK(opened->length == 0);
}

DROGON_TEST(ImageStoreMissingFileIsNotFound)
{
    TempDir dir;
    ImageStore store(dir.path());
    CHECK(!store.open(fixedUuid + ".png").has_value());
}

DROGON_TEST(ImageStoreRejectsUnknownContentType)
{
    TempDir dir;
    ImageStore store(dir.path());

    std::istringstream upload("data");
    CHECK_THROWS_AS(store.save(upload, "application/pdf"), imagestash::UnsupportedContentType);
    CHECK_THROWS_AS(store.save(upload, ""), imagestash::UnsupportedContentType);
    CHECK(dir.fileCount() == 0);
}

DROGON_TEST(ImageStoreReportsUnwritableDirectory)
{
    TempDir dir;
    ImageStore store(dir.path() / "missing");

    std::istringstream upload("data");
    CHECK_THROWS_AS(store.save(upload, "image/png"), imagestash::StorageError);
}

namespace {
    // Accepts nothing, so the first write puts the stream in a failed state.
    class FullDiskBuf : public std::streambuf {
    protected:
        int_type overflow(int_type) override { return traits_type::eof(); }
        std::streamsize xsputn(const char*, std::streamsize) override { return 0; }
    };

    class FullDiskStream : public std::iostream {
    public:
        FullDiskStream() : std::iostream(nullptr) { rdbuf(&buf_); }

    private:
        FullDiskBuf buf_;
    };
}

DROGON_TEST(ImageStoreRemovesPartialFileOnWriteFailure)
{
    TempDir dir;
    ImageStore store(dir.path(), [] { return fixedUuid; },
                     [](const std::filesystem::path& path, std::ios_base::openmode) -> std::unique_ptr<std::iostream> {
                         std::ofstream(path, std::ios::binary) << "partial";
                         return std::make_unique<FullDiskStream>();
                     });

    std::istringstream upload(randomBytes(8192));
    CHECK_THROWS_AS(store.save(upload, "image/png"), imagestash::StorageError);
    CHECK(!std::filesystem::exists(dir.path() / (fixedUuid + ".png")));
}

DROGON_TEST(ImageStoreDefaultUuidIsCanonical)
{
    auto first = ImageStore::defaultUuid();
    auto second = ImageStore::defaultUuid();
    CHECK(first.size() == 36);
    CHECK(first != second);
    CHECK(ImageStore::isValidName(first + ".png"));
    CHECK(ImageStore::isValidName(second + ".gif"));
}
