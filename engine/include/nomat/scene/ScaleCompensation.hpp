#pragma once
#include "nomat/scene/Animation.hpp"
#include "nomat/scene/SceneGraph.hpp"
#include <vector>

namespace nomat::scene
{
    /**
     * Motors carry no scale. Vertex data is pre-scaled by the cumulative world scale of
     * its node, so the translation part of every local motor (and of every inverse bind
     * motor) is scaled by the world scale of the parent to land at the same positions a
     * scale-aware matrix pipeline would produce.
     */
    namespace ScaleCompensation
    {
        // Own scale from node.scale, else from the matrix column lengths, else 1.
        glm::vec3 ownScale(const Node& node);

        // Top-down worldScale = parent.worldScale * ownScale. Warns on non-uniform scale.
        void computeWorldScales(SceneGraph& scene);

        glm::vec3 parentWorldScale(const SceneGraph& scene, const Node& node);

        void compensate(pga::Motor& motor, const glm::vec3& parentScale);

        // One-time load pass over all node transforms and inverse bind motors.
        void compensateScene(SceneGraph& scene, std::vector<Skin>& skins);
    }
}
