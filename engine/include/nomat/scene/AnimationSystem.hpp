#pragma once
#include "nomat/scene/Model.hpp"
#include <vector>

namespace nomat::scene
{
    class AnimationSystem
    {
    public:
        // Advances state by dt (looping or clamping at the duration) and evaluates it.
        static void update(Model& model, AnimationState& state, float dt);

        // Advances both states and cross-fades them, blend = 0 gives A, 1 gives B.
        static void updateBlending(Model& model, AnimationState& stateA, AnimationState& stateB, float blend, float dt);

        /**
         * @brief Samples every channel of one animation at time and writes the node
         * translation/rotation. Touched nodes get their local motor rebuilt and are marked
         * dirty. Out of range indices are clamped to the last animation.
         */
        static void evaluate(Model& model, uint32_t animIndex, float time);

        static void evaluateBlended(Model& model, uint32_t animA, float timeA, uint32_t animB, float timeB,
                                    float blend);

        struct KeyframeLookup
        {
            size_t frame = 0; // First key with inputs[frame] >= time, or the last key
            float u = 1.0f;   // Position between key frame-1 (0) and key frame (1)
        };

        // Keyframe search starting at the sampler cursor when time moves forward.
        static KeyframeLookup findKeyframe(AnimationSampler& sampler, float time);

        static glm::vec3 sampleTranslation(AnimationSampler& sampler, float time);
        static glm::quat sampleRotation(AnimationSampler& sampler, float time);

        // Rebuilds the local motor from rotation/translation, applies the parent scale
        // patch and marks the node dirty.
        static void rebuildLocalTransform(SceneGraph& scene, int nodeIndex);

    private:
        static void applyChannels(Model& model, Animation& anim, float time, const float* blend,
                                  std::vector<uint8_t>& touched);
        static void rebuildTouched(Model& model, const std::vector<uint8_t>& touched);
        static void advance(AnimationState& state, const Animation& anim, float dt);
    };
} // namespace nomat::scene
