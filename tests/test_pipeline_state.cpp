#include <doctest/doctest.h>
#include "DescriptorSetLayoutBuilder.h"
#include "GraphicsPipelineFactory.h"
#include "RenderPasses.h"
#include "InstanceRecords.h"
#include "Samplers.h"
#include "Texture.h"
#include "VertexInputBuilder.h"
#include "shaders/bindings.h"

TEST_SUITE("GraphicsPipelineFactory") {
    TEST_CASE("alpha blending is straight alpha over the destination") {
        auto blend = GraphicsPipelineFactory::blendAttachment(GraphicsPipelineFactory::BlendMode::Alpha);
        CHECK(blend.blendEnable == vk::True);
        CHECK(blend.srcColorBlendFactor == vk::BlendFactor::eSrcAlpha);
        CHECK(blend.dstColorBlendFactor == vk::BlendFactor::eOneMinusSrcAlpha);
        CHECK(blend.colorBlendOp == vk::BlendOp::eAdd);
        CHECK(blend.srcAlphaBlendFactor == vk::BlendFactor::eOne);
        CHECK(blend.dstAlphaBlendFactor == vk::BlendFactor::eOneMinusSrcAlpha);
    }

    TEST_CASE("opaque pipelines write every channel without blending") {
        auto blend = GraphicsPipelineFactory::blendAttachment(GraphicsPipelineFactory::BlendMode::None);
        CHECK(blend.blendEnable == vk::False);
        CHECK(blend.colorWriteMask == (vk::ColorComponentFlagBits::eR | vk::ColorComponentFlagBits::eG |
                                       vk::ColorComponentFlagBits::eB | vk::ColorComponentFlagBits::eA));
    }
}

TEST_SUITE("DescriptorSetLayoutBuilder") {
    TEST_CASE("material layout is one fragment sampler at the material binding") {
        auto layout = DescriptorSetLayoutBuilder::material();
        REQUIRE(layout.getBindings().size() == 1);
        const auto& binding = layout.getBindings()[0];
        CHECK(binding.binding == BINDING_MATERIAL_TEXTURE);
        CHECK(binding.descriptorType == vk::DescriptorType::eCombinedImageSampler);
        CHECK(binding.stageFlags == vk::ShaderStageFlags(vk::ShaderStageFlagBits::eFragment));
    }

    TEST_CASE("post layout pairs the scene color with its uniforms") {
        auto layout = DescriptorSetLayoutBuilder::postProcessInput();
        REQUIRE(layout.getBindings().size() == 2);
        CHECK(layout.getBindings()[0].binding == BINDING_POST_SCENE_COLOR);
        CHECK(layout.getBindings()[1].binding == BINDING_POST_UBO);
        CHECK(layout.getBindings()[1].descriptorType == vk::DescriptorType::eUniformBuffer);
    }

    TEST_CASE("pool sizes scale with the set count") {
        auto sizes = DescriptorSetLayoutBuilder::postProcessInput().poolSizes(64);
        REQUIRE(sizes.size() == 2);
        CHECK(sizes[0].type == vk::DescriptorType::eCombinedImageSampler);
        CHECK(sizes[0].descriptorCount == 64);
        CHECK(sizes[1].descriptorCount == 64);
    }

    TEST_CASE("frame uniforms default to the vertex stage") {
        auto layout = DescriptorSetLayoutBuilder::frameUniforms();
        REQUIRE(layout.getBindings().size() == 1);
        CHECK(layout.getBindings()[0].binding == BINDING_FRAME_UBO);
        CHECK(layout.getBindings()[0].stageFlags == DescriptorSetLayoutBuilder::VertexStage);
        CHECK(layout.poolSizes(2)[0].descriptorCount == 2);
    }
}

TEST_SUITE("VertexInputBuilder") {
    TEST_CASE("instanced input uses a per-vertex and a per-instance binding") {
        auto input = VertexInputBuilder::instanced<QuadVertex, SpriteInstance>();
        const auto& bindings = input.getBindings();
        REQUIRE(bindings.size() == 2);
        CHECK(bindings[0].binding == VERTEX_BINDING);
        CHECK(bindings[0].stride == sizeof(QuadVertex));
        CHECK(bindings[0].inputRate == vk::VertexInputRate::eVertex);
        CHECK(bindings[1].binding == INSTANCE_BINDING);
        CHECK(bindings[1].stride == sizeof(SpriteInstance));
        CHECK(bindings[1].inputRate == vk::VertexInputRate::eInstance);
    }

    TEST_CASE("attribute stereotypes pick the float formats") {
        auto attr = AttributeBuilder::vec3(LOC_SPRITE_TRANSFORM, offsetof(SpriteInstance, column0), INSTANCE_BINDING);
        CHECK(attr.location == LOC_SPRITE_TRANSFORM);
        CHECK(attr.binding == INSTANCE_BINDING);
        CHECK(attr.format == vk::Format::eR32G32B32Sfloat);
        CHECK(attr.offset == 8);
        CHECK(AttributeBuilder::float1(0, 0).format == vk::Format::eR32Sfloat);
    }
}

TEST_SUITE("Samplers") {
    TEST_CASE("sprites sample nearest and clamp") {
        auto info = Samplers::createInfo(SamplerKind::Sprite);
        CHECK(info.magFilter == vk::Filter::eNearest);
        CHECK(info.minFilter == vk::Filter::eNearest);
        CHECK(info.addressModeU == vk::SamplerAddressMode::eClampToEdge);
        CHECK(info.addressModeV == vk::SamplerAddressMode::eClampToEdge);
    }

    TEST_CASE("scene color is filtered but never wraps") {
        auto info = Samplers::createInfo(SamplerKind::SceneColor);
        CHECK(info.magFilter == vk::Filter::eLinear);
        CHECK(info.addressModeU == vk::SamplerAddressMode::eClampToEdge);
    }

    TEST_CASE("materials repeat") {
        auto info = Samplers::createInfo(SamplerKind::Material);
        CHECK(info.magFilter == vk::Filter::eLinear);
        CHECK(info.addressModeW == vk::SamplerAddressMode::eRepeat);
        CHECK(info.maxLod == doctest::Approx(0.0f));
    }
}

TEST_SUITE("GraphicsPipelineFactory presets") {
    TEST_CASE("default preset tests and writes depth") {
        auto state = GraphicsPipelineFactory::presetState(GraphicsPipelineFactory::Preset::Default);
        CHECK(state.depthTest);
        CHECK(state.depthWrite);
        CHECK(state.vertexInput);
    }

    TEST_CASE("fullscreen quad has no vertex input, depth or blending") {
        auto state = GraphicsPipelineFactory::presetState(GraphicsPipelineFactory::Preset::FullscreenQuad);
        CHECK_FALSE(state.depthTest);
        CHECK_FALSE(state.depthWrite);
        CHECK_FALSE(state.vertexInput);
        CHECK(state.blend == GraphicsPipelineFactory::BlendMode::None);
    }

    TEST_CASE("sprites blend without depth") {
        auto state = GraphicsPipelineFactory::presetState(GraphicsPipelineFactory::Preset::Sprite2D);
        CHECK_FALSE(state.depthTest);
        CHECK(state.vertexInput);
        CHECK(state.blend == GraphicsPipelineFactory::BlendMode::Alpha);
    }
}

TEST_SUITE("RenderPasses") {
    TEST_CASE("scene color is cleared and left for sampling") {
        auto color = RenderPasses::sceneColor(vk::Format::eR8G8B8A8Unorm);
        CHECK(color.load == vk::AttachmentLoadOp::eClear);
        CHECK(color.finalLayout == vk::ImageLayout::eShaderReadOnlyOptimal);
    }

    TEST_CASE("post hands the swapchain image to the sprite pass, which presents it") {
        auto post = RenderPasses::postColor(vk::Format::eB8G8R8A8Srgb);
        auto sprite = RenderPasses::spriteColor(vk::Format::eB8G8R8A8Srgb);
        CHECK(post.finalLayout == sprite.initialLayout);
        CHECK(sprite.load == vk::AttachmentLoadOp::eLoad);
        CHECK(sprite.finalLayout == vk::ImageLayout::ePresentSrcKHR);
    }

    TEST_CASE("describe copies every field") {
        auto desc = RenderPasses::describe(RenderPasses::sceneDepth(vk::Format::eD32Sfloat));
        CHECK(desc.format == vk::Format::eD32Sfloat);
        CHECK(desc.storeOp == vk::AttachmentStoreOp::eDontCare);
        CHECK(desc.samples == vk::SampleCountFlagBits::e1);
        CHECK(desc.finalLayout == vk::ImageLayout::eDepthStencilAttachmentOptimal);
    }

    TEST_CASE("depth pass orders the previous frame's late depth writes before its clear") {
        auto dep = RenderPasses::externalDependency(true);
        CHECK(dep.srcSubpass == VK_SUBPASS_EXTERNAL);
        CHECK(dep.dstSubpass == 0);
        CHECK((dep.srcStageMask & vk::PipelineStageFlagBits::eLateFragmentTests));
        CHECK((dep.srcStageMask & vk::PipelineStageFlagBits::eEarlyFragmentTests));
        CHECK((dep.srcAccessMask & vk::AccessFlagBits::eDepthStencilAttachmentWrite));
        CHECK((dep.dstStageMask & vk::PipelineStageFlagBits::eEarlyFragmentTests));
        CHECK((dep.dstAccessMask & vk::AccessFlagBits::eDepthStencilAttachmentWrite));
    }

    TEST_CASE("color-only passes depend on color output alone") {
        auto dep = RenderPasses::externalDependency(false);
        CHECK(dep.srcStageMask == vk::PipelineStageFlags(vk::PipelineStageFlagBits::eColorAttachmentOutput));
        CHECK(dep.srcAccessMask == vk::AccessFlags(vk::AccessFlagBits::eColorAttachmentWrite));
        CHECK_FALSE((dep.dstAccessMask & vk::AccessFlagBits::eDepthStencilAttachmentWrite));
    }
}

TEST_SUITE("Texture") {
    TEST_CASE("sampled image info is a single-mip transfer destination") {
        auto info = Texture::sampledImageInfo(128, 64, vk::Format::eR8G8B8A8Srgb);
        CHECK(info.extent.width == 128);
        CHECK(info.extent.height == 64);
        CHECK(info.extent.depth == 1);
        CHECK(info.mipLevels == 1);
        CHECK(info.tiling == vk::ImageTiling::eOptimal);
        CHECK(info.initialLayout == vk::ImageLayout::eUndefined);
        CHECK(info.usage == (vk::ImageUsageFlagBits::eTransferDst | vk::ImageUsageFlagBits::eSampled));
    }
}
