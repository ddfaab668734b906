#include <doctest/doctest.h>
#include "AssetCache.h"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace {

struct FakeSource {
    int width = 0;
};

// Owns a shared counter so destruction of resources is observable
struct FakeResource {
    int width = 0;
    std::shared_ptr<int> liveCount;

    FakeResource(int w, std::shared_ptr<int> live) : width(w), liveCount(std::move(live)) { ++*liveCount; }
    FakeResource(FakeResource&& other) noexcept : width(other.width), liveCount(std::move(other.liveCount)) {}
    FakeResource& operator=(FakeResource&&) = delete;
    ~FakeResource() {
        if (liveCount) --*liveCount;
    }
};

class FakeUploader : public IAssetUploader<FakeSource, FakeResource> {
public:
    std::optional<FakeResource> upload(const AssetId& id, const FakeSource& source) override {
        uploads.push_back(id.name);
        if (failing.count(id.name) != 0) {
            return std::nullopt;
        }
        return FakeResource(source.width, live);
    }

    std::vector<std::string> uploads;
    std::set<std::string> failing;
    std::shared_ptr<int> live = std::make_shared<int>(0);
};

using Cache = AssetCache<FakeSource, FakeResource>;

// Reads the cache's view of the asset from inside its own upload
class ObservingUploader : public IAssetUploader<FakeSource, FakeResource> {
public:
    explicit ObservingUploader(const Cache& cache) : cache_(cache) {}

    std::optional<FakeResource> upload(const AssetId& id, const FakeSource& source) override {
        seen.push_back(cache_.state(id));
        return FakeResource(source.width, live);
    }

    std::vector<AssetState> seen;
    std::shared_ptr<int> live = std::make_shared<int>(0);

private:
    const Cache& cache_;
};

Cache::Decoder decodeTo(int width, int* calls = nullptr) {
    return [width, calls]() -> std::optional<FakeSource> {
        if (calls) ++*calls;
        return FakeSource{width};
    };
}

std::optional<FakeSource> decodeFails() {
    return std::nullopt;
}

}

TEST_SUITE("AssetCache") {
    TEST_CASE("load without a device leaves the asset pending") {
        Cache cache("Test");
        CHECK(cache.load(AssetId("logo"), decodeTo(128)));
        CHECK(cache.state(AssetId("logo")) == AssetState::Pending);
        CHECK(cache.get(AssetId("logo")) == nullptr);
        CHECK(cache.sourceCount() == 1);
        CHECK(cache.readyCount() == 0);
    }

    TEST_CASE("unknown ids are unrequested") {
        Cache cache("Test");
        CHECK(cache.state(AssetId("missing")) == AssetState::Unrequested);
        CHECK_FALSE(cache.contains(AssetId("missing")));
    }

    TEST_CASE("load with a device uploads immediately") {
        Cache cache("Test");
        FakeUploader uploader;
        CHECK(cache.onDeviceReady(uploader) == 0);

        CHECK(cache.load(AssetId("hero"), decodeTo(64)));
        CHECK(cache.state(AssetId("hero")) == AssetState::Ready);
        const FakeResource* resource = cache.get(AssetId("hero"));
        REQUIRE(resource != nullptr);
        CHECK(resource->width == 64);
        CHECK(uploader.uploads == std::vector<std::string>{"hero"});
    }

    TEST_CASE("loading the same id twice decodes once and keeps the first source") {
        Cache cache("Test");
        int decodes = 0;
        CHECK(cache.load(AssetId("logo"), decodeTo(128, &decodes)));
        CHECK(cache.load(AssetId("logo"), decodeTo(7, &decodes)));
        CHECK(decodes == 1);
        REQUIRE(cache.source(AssetId("logo")) != nullptr);
        CHECK(cache.source(AssetId("logo"))->width == 128);
        CHECK(cache.sourceCount() == 1);
    }

    TEST_CASE("device ready replays every pending asset in load order") {
        Cache cache("Test");
        CHECK(cache.load(AssetId("c"), decodeTo(3)));
        CHECK(cache.load(AssetId("a"), decodeTo(1)));
        CHECK(cache.load(AssetId("b"), decodeTo(2)));

        FakeUploader uploader;
        CHECK(cache.onDeviceReady(uploader) == 3);
        CHECK(uploader.uploads == std::vector<std::string>{"c", "a", "b"});
        CHECK(cache.readyCount() == 3);
        CHECK(*uploader.live == 3);
    }

    TEST_CASE("device loss destroys resources and the next device restores them") {
        Cache cache("Test");
        FakeUploader first;
        cache.onDeviceReady(first);
        CHECK(cache.load(AssetId("logo"), decodeTo(128)));
        CHECK(cache.load(AssetId("hero"), decodeTo(64)));
        CHECK(*first.live == 2);

        cache.onDeviceLost();
        CHECK(*first.live == 0);
        CHECK_FALSE(cache.hasDevice());
        CHECK(cache.get(AssetId("logo")) == nullptr);
        CHECK(cache.state(AssetId("logo")) == AssetState::Pending);
        CHECK(cache.sourceCount() == 2);

        FakeUploader second;
        CHECK(cache.onDeviceReady(second) == 2);
        CHECK(cache.state(AssetId("logo")) == AssetState::Ready);
        CHECK(cache.state(AssetId("hero")) == AssetState::Ready);
        CHECK(cache.get(AssetId("hero"))->width == 64);
        CHECK(*second.live == 2);
    }

    TEST_CASE("loads made while the device is gone are uploaded on return") {
        Cache cache("Test");
        FakeUploader uploader;
        cache.onDeviceReady(uploader);
        cache.onDeviceLost();

        CHECK(cache.load(AssetId("late"), decodeTo(9)));
        CHECK(cache.state(AssetId("late")) == AssetState::Pending);
        CHECK(uploader.uploads.empty());

        CHECK(cache.onDeviceReady(uploader) == 1);
        CHECK(cache.state(AssetId("late")) == AssetState::Ready);
    }

    TEST_CASE("decode failure leaves the asset unrequested") {
        Cache cache("Test");
        FakeUploader uploader;
        cache.onDeviceReady(uploader);

        CHECK_FALSE(cache.load(AssetId("broken"), decodeFails));
        CHECK(cache.state(AssetId("broken")) == AssetState::Unrequested);
        CHECK(uploader.uploads.empty());

        // A later load may still succeed
        CHECK(cache.load(AssetId("broken"), decodeTo(4)));
        CHECK(cache.state(AssetId("broken")) == AssetState::Ready);
    }

    TEST_CASE("upload failure keeps the asset pending for the next replay") {
        Cache cache("Test");
        FakeUploader uploader;
        uploader.failing.insert("flaky");
        cache.onDeviceReady(uploader);

        CHECK(cache.load(AssetId("flaky"), decodeTo(5)));
        CHECK(cache.state(AssetId("flaky")) == AssetState::Pending);
        CHECK(cache.get(AssetId("flaky")) == nullptr);

        uploader.failing.clear();
        CHECK(cache.onDeviceReady(uploader) == 1);
        CHECK(cache.state(AssetId("flaky")) == AssetState::Ready);
    }

    TEST_CASE("replay skips assets that are already ready") {
        Cache cache("Test");
        FakeUploader uploader;
        cache.onDeviceReady(uploader);
        CHECK(cache.load(AssetId("logo"), decodeTo(1)));
        uploader.uploads.clear();

        CHECK(cache.onDeviceReady(uploader) == 0);
        CHECK(uploader.uploads.empty());
    }

    TEST_CASE("an asset reads as uploading while its uploader runs") {
        Cache cache("Test");
        ObservingUploader uploader(cache);
        CHECK(cache.load(AssetId("logo"), decodeTo(128)));
        CHECK(cache.onDeviceReady(uploader) == 1);
        CHECK(cache.load(AssetId("hero"), decodeTo(64)));

        CHECK(uploader.seen == std::vector<AssetState>{AssetState::Uploading, AssetState::Uploading});
        CHECK(cache.state(AssetId("logo")) == AssetState::Ready);
        CHECK(cache.state(AssetId("hero")) == AssetState::Ready);
    }

    TEST_CASE("state names") {
        CHECK(std::string(toString(AssetState::Unrequested)) == "Unrequested");
        CHECK(std::string(toString(AssetState::Pending)) == "Pending");
        CHECK(std::string(toString(AssetState::Uploading)) == "Uploading");
        CHECK(std::string(toString(AssetState::Ready)) == "Ready");
    }
}
