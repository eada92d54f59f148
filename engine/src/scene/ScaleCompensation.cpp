#include "nomat/scene/ScaleCompensation.hpp"
#include "nomat/core/common.hpp"
#include <cmath>

namespace nomat::scene::ScaleCompensation
{
    static bool isUniform(const glm::vec3& s)
    {
        return std::abs(s.x / s.y - 1.0f) <= pga::kUniformScaleTolerance &&
               std::abs(s.y / s.z - 1.0f) <= pga::kUniformScaleTolerance;
    }

    glm::vec3 ownScale(const Node& node)
    {
        if (node.scale)
        {
            return *node.scale;
        }
        if (node.matrix)
        {
            const glm::mat4& m = *node.matrix;
            return {glm::length(glm::vec3(m[0])), glm::length(glm::vec3(m[1])), glm::length(glm::vec3(m[2]))};
        }
        return glm::vec3(1.0f);
    }

    void computeWorldScales(SceneGraph& scene)
    {
        for (int e : scene.topoOrder())
        {
            Node& n = scene.node(e);
            n.ownScale = ownScale(n);
            n.worldScale = parentWorldScale(scene, n) * n.ownScale;

            if (!isUniform(n.ownScale))
            {
                core::Logger::warn("Node '{}' has non-uniform scale ({}, {}, {}), skinned positions are approximate",
                                   n.name, n.ownScale.x, n.ownScale.y, n.ownScale.z);
            }
        }
    }

    glm::vec3 parentWorldScale(const SceneGraph& scene, const Node& node)
    {
        return node.parentIndex >= 0 ? scene.node(node.parentIndex).worldScale : glm::vec3(1.0f);
    }

    void compensate(pga::Motor& motor, const glm::vec3& parentScale)
    {
        motor[1][0] *= parentScale.x;
        motor[1][1] *= parentScale.y;
        motor[1][2] *= parentScale.z;
        motor[1][3] *= parentScale.z;
    }

    void compensateScene(SceneGraph& scene, std::vector<Skin>& skins)
    {
        for (auto& skin : skins)
        {
            for (size_t j = 0; j < skin.joints.size() && j < skin.inverseBindMotors.size(); ++j)
            {
                const Node& joint = scene.node(static_cast<int>(skin.joints[j]));
                compensate(skin.inverseBindMotors[j], parentWorldScale(scene, joint));
            }
        }

        for (Node& n : scene.nodes())
        {
            compensate(n.transform, parentWorldScale(scene, n));
        }
    }
}
