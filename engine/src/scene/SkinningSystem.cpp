#include "nomat/scene/SkinningSystem.hpp"
#include "nomat/core/common.hpp"
#include <array>
#include <cstring>
#include <string>
#include <glm/gtc/type_ptr.hpp>

namespace nomat::scene
{
    int SkinningSystem::skeletonRoot(const Skin& skin)
    {
        if (skin.skeletonRootNode >= 0)
        {
            return skin.skeletonRootNode;
        }
        return skin.joints.empty() ? -1 : static_cast<int>(skin.joints.front());
    }

    pga::Motor SkinningSystem::skeletonFrame(const SceneGraph& scene, const Skin& skin)
    {
        const int root = skeletonRoot(skin);
        if (root < 0)
        {
            return pga::kIdentity;
        }
        const int parent = scene.node(root).parentIndex;
        return parent >= 0 ? scene.node(parent).worldTransform : scene.rootMotor();
    }

    bool SkinningSystem::needsUpdate(const SceneGraph& scene, const Skin& skin)
    {
        if (skin.jointMotors.size() != skin.joints.size() * kFloatsPerJoint)
        {
            return true;
        }
        for (uint32_t joint : skin.joints)
        {
            if (scene.wasUpdated(static_cast<int>(joint)))
            {
                return true;
            }
        }
        return false;
    }

    void SkinningSystem::rebuild(const SceneGraph& scene, Skin& skin)
    {
        if (skin.inverseBindMotors.size() < skin.joints.size())
        {
            throw cpptrace::length_error("skin '" + skin.name + "' has " +
                                         std::to_string(skin.inverseBindMotors.size()) +
                                         " inverse bind motors for " + std::to_string(skin.joints.size()) +
                                         " joints");
        }

        skin.jointMotors.resize(skin.joints.size() * kFloatsPerJoint);

        const pga::Motor toSkeleton = pga::reverse(skeletonFrame(scene, skin));

        pga::Motor m;
        float* dst = skin.jointMotors.data();
        for (size_t i = 0; i < skin.joints.size(); ++i)
        {
            const Node& joint = scene.node(static_cast<int>(skin.joints[i]));
            pga::compose(joint.worldTransform, skin.inverseBindMotors[i], m);
            pga::compose(toSkeleton, m, m);
            std::memcpy(dst, glm::value_ptr(m), kFloatsPerJoint * sizeof(float));
            dst += kFloatsPerJoint;
        }
    }

    size_t SkinningSystem::update(const SceneGraph& scene, std::vector<Skin>& skins)
    {
        NOMAT_PROFILE_FUNCTION();
        size_t rebuilt = 0;
        for (auto& skin : skins)
        {
            if (!needsUpdate(scene, skin))
            {
                continue;
            }
            rebuild(scene, skin);
            ++rebuilt;
        }
        return rebuilt;
    }

    pga::Motor SkinningSystem::skinMotor(const Skin& skin, size_t joint)
    {
        util::checkIndex(joint, skin.jointMotors.size() / kFloatsPerJoint, "skin joint");
        pga::Motor m;
        std::memcpy(glm::value_ptr(m), skin.jointMotors.data() + joint * kFloatsPerJoint,
                    kFloatsPerJoint * sizeof(float));
        return m;
    }

    pga::Motor SkinningSystem::blendVertex(const Skin& skin, const glm::uvec4& joints, const glm::vec4& weights)
    {
        const std::array<pga::Motor, 4> motors{skinMotor(skin, joints.x), skinMotor(skin, joints.y),
                                               skinMotor(skin, joints.z), skinMotor(skin, joints.w)};
        const std::array<float, 4> w{weights.x, weights.y, weights.z, weights.w};
        return pga::blend(motors, w);
    }

    glm::vec3 SkinningSystem::skinPoint(const Skin& skin, const glm::uvec4& joints, const glm::vec4& weights,
                                        const glm::vec3& position)
    {
        return pga::applyToPoint(blendVertex(skin, joints, weights), position);
    }
}
