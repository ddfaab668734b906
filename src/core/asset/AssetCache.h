#pragma once

// ============================================================================
// AssetCache.h - Per-asset GPU resource state machine
// ============================================================================
//
// Each asset moves Unrequested -> Pending -> Uploading -> Ready.
//
//   load(id, decode)      decode once, keep the CPU-side source forever
//   onDeviceReady(u)      remember the uploader, upload every decoded source
//                         that has no GPU resource yet (replay)
//   onDeviceLost()        destroy every GPU resource, forget the uploader;
//                         sources stay, so the next onDeviceReady restores all
//
// The uploader is the device-bound half (SpriteAssetManager,
// ModelAssetManager). Tests plug in a fake one and drive the state machine
// without a GPU.

#include "AssetId.h"
#include <SDL3/SDL_log.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

enum class AssetState : uint8_t {
    Unrequested,  // Never loaded, or decoding failed
    Pending,      // Source decoded, no GPU resource
    Uploading,    // Uploader running; uploads are synchronous, so only the uploader itself sees this
    Ready         // GPU resource present
};

inline const char* toString(AssetState state) {
    switch (state) {
        case AssetState::Unrequested: return "Unrequested";
        case AssetState::Pending: return "Pending";
        case AssetState::Uploading: return "Uploading";
        case AssetState::Ready: return "Ready";
    }
    return "Unknown";
}

/** Device-bound half of an asset cache: turns a decoded source into a GPU resource. */
template<typename Source, typename Resource>
class IAssetUploader {
public:
    virtual ~IAssetUploader() = default;
    virtual std::optional<Resource> upload(const AssetId& id, const Source& source) = 0;
};

template<typename Source, typename Resource>
class AssetCache {
public:
    using Uploader = IAssetUploader<Source, Resource>;
    using Decoder = std::function<std::optional<Source>()>;

    explicit AssetCache(std::string name) : name_(std::move(name)) {}

    AssetCache(const AssetCache&) = delete;
    AssetCache& operator=(const AssetCache&) = delete;

    ~AssetCache() {
        // GPU resources go before anything they depend on
        resources_.clear();
    }

    /**
     * Records the uploader and uploads every decoded asset that is not Ready,
     * in load order. Returns the number of resources created.
     */
    size_t onDeviceReady(Uploader& uploader) {
        uploader_ = &uploader;
        size_t uploaded = 0;
        for (const auto& id : loadOrder_) {
            if (resources_.count(id) != 0) {
                continue;
            }
            if (uploadOne(id, sources_.at(id))) {
                ++uploaded;
            }
        }
        SDL_Log("%s: device ready, uploaded %zu of %zu assets",
            name_.c_str(), uploaded, sources_.size());
        return uploaded;
    }

    void onDeviceLost() {
        size_t destroyed = resources_.size();
        resources_.clear();
        uploading_.clear();
        uploader_ = nullptr;
        SDL_Log("%s: device lost, destroyed %zu GPU resources", name_.c_str(), destroyed);
    }

    /**
     * Decodes and stores the source for id. A second load of an id that is
     * already decoded is ignored and succeeds; the first source wins.
     * Returns false only when decoding fails.
     */
    bool load(const AssetId& id, const Decoder& decode) {
        if (sources_.count(id) != 0) {
            return true;
        }

        std::optional<Source> source = decode();
        if (!source) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s: failed to decode asset '%s'",
                name_.c_str(), id.c_str());
            return false;
        }

        auto [it, inserted] = sources_.emplace(id, std::move(*source));
        loadOrder_.push_back(id);

        if (uploader_) {
            // Failure is logged and leaves the asset Pending for the next replay
            uploadOne(id, it->second);
        }
        return true;
    }

    // Null unless Ready; never loads, never blocks
    const Resource* get(const AssetId& id) const {
        auto it = resources_.find(id);
        return it != resources_.end() ? &it->second : nullptr;
    }

    const Source* source(const AssetId& id) const {
        auto it = sources_.find(id);
        return it != sources_.end() ? &it->second : nullptr;
    }

    AssetState state(const AssetId& id) const {
        if (resources_.count(id) != 0) return AssetState::Ready;
        if (uploading_.count(id) != 0) return AssetState::Uploading;
        if (sources_.count(id) != 0) return AssetState::Pending;
        return AssetState::Unrequested;
    }

    bool contains(const AssetId& id) const { return sources_.count(id) != 0; }
    size_t readyCount() const { return resources_.size(); }
    size_t sourceCount() const { return sources_.size(); }
    bool hasDevice() const { return uploader_ != nullptr; }
    const std::string& name() const { return name_; }

private:
    // The id is marked before the uploader runs so state() answers Uploading from inside it
    bool uploadOne(const AssetId& id, const Source& source) {
        uploading_.insert(id);
        std::optional<Resource> resource = uploader_->upload(id, source);
        uploading_.erase(id);

        if (!resource) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s: upload of '%s' failed, asset stays pending",
                name_.c_str(), id.c_str());
            return false;
        }
        resources_.emplace(id, std::move(*resource));
        return true;
    }

    std::string name_;
    Uploader* uploader_ = nullptr;
    std::unordered_map<AssetId, Source> sources_;
    std::vector<AssetId> loadOrder_;
    std::unordered_set<AssetId> uploading_;
    std::unordered_map<AssetId, Resource> resources_;
};
