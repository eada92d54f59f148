#include "nomat/scene/Model.hpp"
#include "nomat/core/common.hpp"
#include "nomat/scene/ScaleCompensation.hpp"
#include "nomat/scene/SkinningSystem.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace nomat::scene
{
    int Model::createNode(int parent, std::string name)
    {
        return m_scene.createNode(parent, std::move(name));
    }

    uint32_t Model::addSkin(Skin skin)
    {
        m_skins.push_back(std::move(skin));
        return util::u32(m_skins.size() - 1);
    }

    uint32_t Model::addAnimation(Animation animation)
    {
        m_animations.push_back(std::move(animation));
        return util::u32(m_animations.size() - 1);
    }

    core::Result<void> Model::validate() const
    {
        const size_t nodeCount = m_scene.size();

        for (size_t i = 0; i < nodeCount; ++i)
        {
            const Node& n = m_scene.nodes()[i];
            if (n.skinIndex >= 0 && util::sz(n.skinIndex) >= m_skins.size())
            {
                return core::Unexpected<std::string>(std::format("node {} ('{}') references skin {} of {}", i, n.name,
                                                    n.skinIndex, m_skins.size()));
            }
        }

        for (size_t s = 0; s < m_skins.size(); ++s)
        {
            const Skin& skin = m_skins[s];
            for (uint32_t joint : skin.joints)
            {
                if (joint >= nodeCount)
                {
                    return core::Unexpected<std::string>(std::format("skin {} ('{}') joint {} out of range ({} nodes)", s,
                                                        skin.name, joint, nodeCount));
                }
            }
            if (!skin.inverseBindMatrices.empty() && skin.inverseBindMatrices.size() != skin.joints.size())
            {
                return core::Unexpected<std::string>(std::format("skin {} ('{}') has {} inverse bind matrices for {} joints", s,
                                                    skin.name, skin.inverseBindMatrices.size(), skin.joints.size()));
            }
            if (skin.skeletonRootNode >= 0 && util::sz(skin.skeletonRootNode) >= nodeCount)
            {
                return core::Unexpected<std::string>(std::format("skin {} ('{}') skeleton root {} out of range", s, skin.name,
                                                    skin.skeletonRootNode));
            }
        }

        for (size_t a = 0; a < m_animations.size(); ++a)
        {
            const Animation& anim = m_animations[a];
            for (const auto& sampler : anim.samplers)
            {
                if (sampler.inputs.empty())
                {
                    return core::Unexpected<std::string>(std::format("animation {} ('{}') has a sampler without keys", a, anim.name));
                }
                if (sampler.outputs.size() != sampler.inputs.size())
                {
                    return core::Unexpected<std::string>(std::format("animation {} ('{}') sampler has {} times but {} values", a,
                                                        anim.name, sampler.inputs.size(), sampler.outputs.size()));
                }
                if (!std::is_sorted(sampler.inputs.begin(), sampler.inputs.end()))
                {
                    return core::Unexpected<std::string>(std::format("animation {} ('{}') key times are not ascending", a, anim.name));
                }
            }
            for (const auto& ch : anim.channels)
            {
                if (ch.samplerIndex >= anim.samplers.size())
                {
                    return core::Unexpected<std::string>(std::format("animation {} ('{}') channel sampler {} out of range", a,
                                                        anim.name, ch.samplerIndex));
                }
                if (ch.targetNode >= nodeCount)
                {
                    return core::Unexpected<std::string>(std::format("animation {} ('{}') channel target {} out of range", a,
                                                        anim.name, ch.targetNode));
                }
            }
        }
        return {};
    }

    core::Result<void> Model::finalize()
    {
        NOMAT_PROFILE_FUNCTION();
        if (m_finalized)
        {
            return core::Unexpected<std::string>(std::string("model is already finalized"));
        }

        if (auto valid = validate(); !valid)
        {
            core::Logger::error("Model validation failed: {}", valid.error());
            return valid;
        }

        std::vector<uint8_t> animated(m_scene.size(), 0);
        for (const auto& anim : m_animations)
        {
            for (const auto& ch : anim.channels)
            {
                animated[ch.targetNode] = 1;
            }
        }

        // Nodes without raw sources keep the motor the loader set. Animated ones get
        // sources derived from it, so channel writes start from the same pose.
        for (size_t i = 0; i < m_scene.size(); ++i)
        {
            Node& n = m_scene.nodes()[i];
            if (hasTransformSources(n))
            {
                n.transform = composeLocalTransform(n);
            }
            else if (animated[i] != 0)
            {
                setSourcesFromTransform(n);
            }
        }

        for (auto& skin : m_skins)
        {
            skin.inverseBindMotors.clear();
            skin.inverseBindMotors.reserve(skin.joints.size());
            if (skin.inverseBindMatrices.empty())
            {
                skin.inverseBindMotors.assign(skin.joints.size(), pga::kIdentity);
            }
            else
            {
                for (const auto& m : skin.inverseBindMatrices)
                {
                    skin.inverseBindMotors.push_back(pga::fromMatrix4(m));
                }
            }
        }

        for (auto& anim : m_animations)
        {
            anim.duration = 0.0f;
            for (const auto& sampler : anim.samplers)
            {
                anim.duration = std::max(anim.duration, sampler.inputs.back());
            }
        }

        completeAnimations();

        ScaleCompensation::computeWorldScales(m_scene);
        ScaleCompensation::compensateScene(m_scene, m_skins);

        m_scene.markAllChanged();
        m_finalized = true;

        core::Logger::info("Model finalized: {} nodes, {} skins, {} animations", m_scene.size(), m_skins.size(),
                           m_animations.size());
        return {};
    }

    void Model::completeAnimations()
    {
        std::vector<std::pair<uint32_t, AnimationPath>> animated;
        for (const auto& anim : m_animations)
        {
            for (const auto& ch : anim.channels)
            {
                std::pair key{ch.targetNode, ch.path};
                if (std::find(animated.begin(), animated.end(), key) == animated.end())
                {
                    animated.push_back(key);
                }
            }
        }

        size_t added = 0;
        for (auto& anim : m_animations)
        {
            for (const auto& entry : animated)
            {
                const uint32_t target = entry.first;
                const AnimationPath path = entry.second;
                const bool present = std::any_of(anim.channels.begin(), anim.channels.end(),
                                                 [&](const AnimationChannel& ch) {
                                                     return ch.targetNode == target && ch.path == path;
                                                 });
                if (present)
                {
                    continue;
                }

                const Node& n = m_scene.node(static_cast<int>(target));
                AnimationSampler hold;
                hold.inputs.push_back(0.0f);
                if (path == AnimationPath::Translation)
                {
                    hold.outputs.emplace_back(n.translation.value_or(glm::vec3(0.0f)), 0.0f);
                }
                else
                {
                    const glm::quat q = n.rotation.value_or(glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
                    hold.outputs.emplace_back(q.x, q.y, q.z, q.w);
                }

                anim.samplers.push_back(std::move(hold));
                anim.channels.push_back({util::u32(anim.samplers.size() - 1), target, path});
                ++added;
            }
        }

        if (added > 0)
        {
            core::Logger::debug("Synthesized {} hold channels across {} animations", added, m_animations.size());
        }
    }

    size_t Model::update(const pga::Motor& rootMotor)
    {
        NOMAT_PROFILE_FUNCTION();
        m_scene.updateTransforms(rootMotor);
        return SkinningSystem::update(m_scene, m_skins);
    }
}
