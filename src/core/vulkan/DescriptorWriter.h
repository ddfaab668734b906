#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <vector>

/**
 * DescriptorWriter - Batches descriptor writes for one set
 *
 *   DescriptorWriter()
 *       .sampledImage(BINDING_POST_SCENE_COLOR, sampler, sceneColorView)
 *       .uniformBuffer(BINDING_POST_UBO, buffer, sizeof(PostUniforms))
 *       .update(device, set);
 *
 * Each entry keeps its own buffer or image info, and update() points the
 * vk::WriteDescriptorSet array into them, so nothing has to outlive the call.
 */
class DescriptorWriter {
public:
    DescriptorWriter() = default;

    DescriptorWriter& uniformBuffer(uint32_t binding, vk::Buffer buffer, vk::DeviceSize range = VK_WHOLE_SIZE) {
        Entry entry;
        entry.binding = binding;
        entry.type = vk::DescriptorType::eUniformBuffer;
        entry.buffer = vk::DescriptorBufferInfo{buffer, 0, range};
        entries_.push_back(entry);
        return *this;
    }

    // Sampled in SHADER_READ_ONLY_OPTIMAL, the layout every texture and target ends in
    DescriptorWriter& sampledImage(uint32_t binding, vk::Sampler sampler, vk::ImageView view) {
        Entry entry;
        entry.binding = binding;
        entry.type = vk::DescriptorType::eCombinedImageSampler;
        entry.image = vk::DescriptorImageInfo{sampler, view, vk::ImageLayout::eShaderReadOnlyOptimal};
        entries_.push_back(entry);
        return *this;
    }

    void update(const vk::raii::Device& device, vk::DescriptorSet set) const {
        if (entries_.empty()) return;

        std::vector<vk::WriteDescriptorSet> writes;
        writes.reserve(entries_.size());
        for (const auto& entry : entries_) {
            auto write = vk::WriteDescriptorSet{}
                .setDstSet(set)
                .setDstBinding(entry.binding)
                .setDescriptorType(entry.type)
                .setDescriptorCount(1);
            if (entry.type == vk::DescriptorType::eUniformBuffer) {
                write.setPBufferInfo(&entry.buffer);
            } else {
                write.setPImageInfo(&entry.image);
            }
            writes.push_back(write);
        }
        device.updateDescriptorSets(writes, nullptr);
    }

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        uint32_t binding = 0;
        vk::DescriptorType type = vk::DescriptorType::eUniformBuffer;
        vk::DescriptorBufferInfo buffer;
        vk::DescriptorImageInfo image;
    };

    std::vector<Entry> entries_;
};
