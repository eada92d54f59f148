#pragma once

#include "nomat/pga/Motor.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace nomat::scene
{
    // --- Skeleton Structures ---
    struct Skin
    {
        std::string name;
        std::vector<uint32_t> joints;               // Indices into node hierarchy
        std::vector<glm::mat4> inverseBindMatrices; // Raw bind pose -> joint space, as loaded
        std::vector<pga::Motor> inverseBindMotors;  // Derived once at load, immutable afterwards
        int skeletonRootNode = -1;

        // 8 floats per joint, joint order. Layout of the renderer's skin block.
        std::vector<float> jointMotors;
    };

    // --- Animation Structures ---
    enum class AnimationPath
    {
        Translation,
        Rotation
    };

    struct AnimationSampler
    {
        std::vector<float> inputs;      // Time keys, ascending
        std::vector<glm::vec4> outputs; // Translation in xyz, rotation quaternion as (x, y, z, w)

        // Search cursor, reused between evaluations.
        size_t curFrame = 0;
        float curTime = 0.0f;
    };

    struct AnimationChannel
    {
        uint32_t samplerIndex = 0;
        uint32_t targetNode = 0; // Index into node hierarchy
        AnimationPath path = AnimationPath::Translation;
    };

    struct Animation
    {
        std::string name;
        std::vector<AnimationSampler> samplers;
        std::vector<AnimationChannel> channels;
        float duration = 0.0f;
    };

    struct AnimationState
    {
        uint32_t animIndex = 0;
        float currentTime = 0.0f;
        bool isLooping = true;
        bool isPlaying = true;
    };

    // AnimationState with isLooping taken from the anim_defaultLooping CVar.
    AnimationState makeAnimationState(uint32_t animIndex);
} // namespace nomat::scene
