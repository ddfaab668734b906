// Descriptor sets, bindings and vertex attribute locations shared by C++ and GLSL
// C++: #include "shaders/bindings.h"
// GLSL: #include "bindings.h"

#ifndef BINDINGS_H
#define BINDINGS_H

// =============================================================================
// Descriptor sets (every pass)
// =============================================================================
#define SET_FRAME                       0   // Frame-global: screen, camera or post uniforms
#define SET_MATERIAL                    1   // Per-asset material

// Set 0
#define BINDING_FRAME_UBO               0   // ScreenUniforms / CameraUniforms
#define BINDING_POST_SCENE_COLOR        0   // Post-process: sampled scene color
#define BINDING_POST_UBO                1   // Post-process: PostUniforms

// Set 1
#define BINDING_MATERIAL_TEXTURE        0   // Sprite texture / mesh base color

// =============================================================================
// Vertex input
// =============================================================================
#define VERTEX_BINDING                  0   // Static per-vertex buffer
#define INSTANCE_BINDING                1   // Per-instance buffer

// Sprite pass
#define LOC_SPRITE_POSITION             0
#define LOC_SPRITE_TEXCOORD             1
#define LOC_SPRITE_SIZE                 2
#define LOC_SPRITE_TRANSFORM            3   // 3 columns: 3, 4, 5
#define LOC_SPRITE_ALPHA                6

// Model pass
#define LOC_MODEL_POSITION              0
#define LOC_MODEL_NORMAL                1
#define LOC_MODEL_TEXCOORD              2
#define LOC_MODEL_TRANSFORM             3   // 4 columns: 3, 4, 5, 6
#define LOC_MODEL_ALPHA                 7

#endif // BINDINGS_H
