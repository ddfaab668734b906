#pragma once

#include <functional>
#include <string>
#include <utility>

/**
 * AssetId - Application-level name of a drawable resource ("logo", "hero")
 *
 * Caches key by this value, never by a GPU handle, so the same id survives
 * device loss and refers to the re-uploaded resource afterwards.
 */
struct AssetId {
    std::string name;

    AssetId() = default;
    explicit AssetId(std::string n) : name(std::move(n)) {}
    explicit AssetId(const char* n) : name(n) {}

    bool empty() const { return name.empty(); }
    const char* c_str() const { return name.c_str(); }

    bool operator==(const AssetId& other) const { return name == other.name; }
    bool operator!=(const AssetId& other) const { return name != other.name; }
    bool operator<(const AssetId& other) const { return name < other.name; }
};

namespace std {
template<>
struct hash<AssetId> {
    size_t operator()(const AssetId& id) const noexcept {
        return hash<string>{}(id.name);
    }
};
}
