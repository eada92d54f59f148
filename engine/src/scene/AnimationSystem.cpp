#include "nomat/scene/AnimationSystem.hpp"
#include "nomat/core/common.hpp"
#include "nomat/core/profiler.hpp"
#include "nomat/core/cvar.hpp"
#include "nomat/scene/ScaleCompensation.hpp"
#include <algorithm>
#include <cmath>

namespace nomat::scene
{
    AUTO_CVAR_BOOL(anim_defaultLooping, "Whether new animation states loop", true, core::CVarFlags::save);

    AnimationState makeAnimationState(uint32_t animIndex)
    {
        AnimationState state;
        state.animIndex = animIndex;
        state.isLooping = anim_defaultLooping.get();
        return state;
    }

    static glm::quat toQuat(const glm::vec4& v)
    {
        return {v.w, v.x, v.y, v.z};
    }

    static uint32_t clampAnimIndex(const Model& model, uint32_t index)
    {
        return std::min(index, util::u32(model.animations().size() - 1));
    }

    void AnimationSystem::advance(AnimationState& state, const Animation& anim, float dt)
    {
        state.currentTime += dt;
        if (state.currentTime > anim.duration)
        {
            if (state.isLooping)
            {
                state.currentTime = anim.duration > 0.0f ? std::fmod(state.currentTime, anim.duration) : 0.0f;
            }
            else
            {
                state.currentTime = anim.duration;
                state.isPlaying = false;
            }
        }
    }

    void AnimationSystem::update(Model& model, AnimationState& state, float dt)
    {
        NOMAT_PROFILE_FUNCTION();
        if (!state.isPlaying || model.animations().empty())
        {
            return;
        }

        state.animIndex = clampAnimIndex(model, state.animIndex);
        advance(state, model.animations()[state.animIndex], dt);
        evaluate(model, state.animIndex, state.currentTime);
    }

    void AnimationSystem::updateBlending(Model& model, AnimationState& stateA, AnimationState& stateB, float blend,
                                         float dt)
    {
        NOMAT_PROFILE_FUNCTION();
        if (model.animations().empty())
        {
            return;
        }

        const bool hasA = stateA.isPlaying;
        const bool hasB = stateB.isPlaying;
        if (!hasA && !hasB) return;

        stateA.animIndex = clampAnimIndex(model, stateA.animIndex);
        stateB.animIndex = clampAnimIndex(model, stateB.animIndex);

        if (hasA && hasB) {
            advance(stateA, model.animations()[stateA.animIndex], dt);
            advance(stateB, model.animations()[stateB.animIndex], dt);
            evaluateBlended(model, stateA.animIndex, stateA.currentTime, stateB.animIndex, stateB.currentTime, blend);
        } else if (hasA) {
            advance(stateA, model.animations()[stateA.animIndex], dt);
            evaluate(model, stateA.animIndex, stateA.currentTime);
        } else {
            advance(stateB, model.animations()[stateB.animIndex], dt);
            evaluate(model, stateB.animIndex, stateB.currentTime);
        }
    }

    void AnimationSystem::evaluate(Model& model, uint32_t animIndex, float time)
    {
        NOMAT_PROFILE_FUNCTION();
        if (model.animations().empty())
        {
            return;
        }

        std::vector<uint8_t> touched(model.scene().size(), 0);
        applyChannels(model, model.animations()[clampAnimIndex(model, animIndex)], time, nullptr, touched);
        rebuildTouched(model, touched);
    }

    void AnimationSystem::evaluateBlended(Model& model, uint32_t animA, float timeA, uint32_t animB, float timeB,
                                          float blend)
    {
        NOMAT_PROFILE_FUNCTION();
        if (model.animations().empty())
        {
            return;
        }

        std::vector<uint8_t> touched(model.scene().size(), 0);
        applyChannels(model, model.animations()[clampAnimIndex(model, animA)], timeA, nullptr, touched);
        applyChannels(model, model.animations()[clampAnimIndex(model, animB)], timeB, &blend, touched);
        rebuildTouched(model, touched);
    }

    AnimationSystem::KeyframeLookup AnimationSystem::findKeyframe(AnimationSampler& sampler, float time)
    {
        const auto& in = sampler.inputs;
        if (in.empty())
        {
            throw cpptrace::invalid_argument("findKeyframe: sampler has no keys");
        }
        const size_t last = in.size() - 1;

        size_t frame = time >= sampler.curTime ? std::min(sampler.curFrame, last) : 0;
        while (frame < last && in[frame] < time)
        {
            ++frame;
        }

        sampler.curFrame = frame;
        sampler.curTime = time;

        KeyframeLookup result;
        result.frame = frame;
        if (frame == 0 || time >= in[frame])
        {
            result.u = 1.0f;
        }
        else
        {
            result.u = std::clamp((time - in[frame - 1]) / (in[frame] - in[frame - 1]), 0.0f, 1.0f);
        }
        return result;
    }

    glm::vec3 AnimationSystem::sampleTranslation(AnimationSampler& sampler, float time)
    {
        const auto [frame, u] = findKeyframe(sampler, time);
        const auto& out = sampler.outputs;
        if (u == 1.0f) return glm::vec3(out[frame]);
        if (u == 0.0f) return glm::vec3(out[frame - 1]);
        return glm::mix(glm::vec3(out[frame - 1]), glm::vec3(out[frame]), u);
    }

    glm::quat AnimationSystem::sampleRotation(AnimationSampler& sampler, float time)
    {
        const auto [frame, u] = findKeyframe(sampler, time);
        const auto& out = sampler.outputs;
        if (u == 1.0f) return toQuat(out[frame]);
        if (u == 0.0f) return toQuat(out[frame - 1]);

        // Renormalized lerp along the shorter arc.
        const glm::quat a = toQuat(out[frame - 1]);
        const glm::quat b = pga::shortestPath(a, toQuat(out[frame]));
        return glm::normalize(a * (1.0f - u) + b * u);
    }

    void AnimationSystem::applyChannels(Model& model, Animation& anim, float time, const float* blend,
                                        std::vector<uint8_t>& touched)
    {
        auto& scene = model.scene();
        for (const auto& ch : anim.channels)
        {
            auto& sampler = anim.samplers[ch.samplerIndex];
            Node& node = scene.node(static_cast<int>(ch.targetNode));
            touched[ch.targetNode] = 1;

            if (ch.path == AnimationPath::Translation)
            {
                const glm::vec3 t = sampleTranslation(sampler, time);
                if (blend != nullptr)
                {
                    node.translation = glm::mix(node.translation.value_or(glm::vec3(0.0f)), t, *blend);
                }
                else
                {
                    node.translation = t;
                }
            }
            else
            {
                const glm::quat r = sampleRotation(sampler, time);
                if (blend != nullptr)
                {
                    const glm::quat current = node.rotation.value_or(glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
                    const glm::quat target = pga::shortestPath(current, r);
                    node.rotation = glm::normalize(current * (1.0f - *blend) + target * *blend);
                }
                else
                {
                    node.rotation = r;
                }
            }
        }
    }

    void AnimationSystem::rebuildTouched(Model& model, const std::vector<uint8_t>& touched)
    {
        for (size_t i = 0; i < touched.size(); ++i)
        {
            if (touched[i] != 0)
            {
                rebuildLocalTransform(model.scene(), static_cast<int>(i));
            }
        }
    }

    void AnimationSystem::rebuildLocalTransform(SceneGraph& scene, int nodeIndex)
    {
        Node& node = scene.node(nodeIndex);
        node.transform = composeLocalTransform(node);
        ScaleCompensation::compensate(node.transform, ScaleCompensation::parentWorldScale(scene, node));
        scene.markAsChanged(nodeIndex);
    }
} // namespace nomat::scene
