#pragma once
#include "nomat/scene/Animation.hpp"
#include "nomat/scene/SceneGraph.hpp"
#include <span>
#include <vector>

namespace nomat::scene
{
    class SkinningSystem
    {
    public:
        static constexpr size_t kFloatsPerJoint = 8;

        /**
         * @brief Rebuilds the joint motor buffer of every skin touched this frame.
         * Must run after SceneGraph::updateTransforms. A skin is rebuilt when any of its
         * joints was updated, or when its buffer has never been built.
         *
         * Joint motors are relative to the parent frame of the skeleton root, as if the
         * skeleton were resolved from an identity parent. Ancestors of the skeleton and the
         * placement motor are left out, the renderer applies the mesh node's world motor
         * on top.
         * @return Number of skins rebuilt.
         */
        static size_t update(const SceneGraph& scene, std::vector<Skin>& skins);

        // Unconditional rebuild of one skin.
        static void rebuild(const SceneGraph& scene, Skin& skin);

        // skeletonRootNode, or the first joint when the skin names none. -1 for an empty skin.
        static int skeletonRoot(const Skin& skin);

        // World motor of the skeleton root's parent, the root motor for a root skeleton.
        static pga::Motor skeletonFrame(const SceneGraph& scene, const Skin& skin);

        static bool needsUpdate(const SceneGraph& scene, const Skin& skin);

        // Reads back the packed motor of one joint.
        static pga::Motor skinMotor(const Skin& skin, size_t joint);

        // CPU evaluation of the renderer's per-vertex blend over up to 4 joints.
        static pga::Motor blendVertex(const Skin& skin, const glm::uvec4& joints, const glm::vec4& weights);
        static glm::vec3 skinPoint(const Skin& skin, const glm::uvec4& joints, const glm::vec4& weights,
                                   const glm::vec3& position);
    };
}
