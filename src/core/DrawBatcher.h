#pragma once

#include <cstdint>
#include <vector>

template<typename Key>
struct DrawBatch {
    Key key;
    uint32_t firstInstance = 0;
    uint32_t instanceCount = 0;
};

namespace DrawBatcher {

/**
 * Groups contiguous runs of equal keys into one batch each. keys[i] is the
 * resource of instance i, so the batches cover [0, keys.size()) in order
 * and a key that reappears later starts a new batch.
 */
template<typename Key>
std::vector<DrawBatch<Key>> buildBatches(const std::vector<Key>& keys) {
    std::vector<DrawBatch<Key>> batches;
    for (uint32_t i = 0; i < static_cast<uint32_t>(keys.size()); ++i) {
        if (!batches.empty() && batches.back().key == keys[i]) {
            ++batches.back().instanceCount;
        } else {
            batches.push_back(DrawBatch<Key>{keys[i], i, 1});
        }
    }
    return batches;
}

}
