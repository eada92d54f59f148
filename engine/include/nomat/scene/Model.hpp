#pragma once

#include "nomat/core/result.hpp"
#include "nomat/scene/Animation.hpp"
#include "nomat/scene/SceneGraph.hpp"
#include <string>
#include <vector>

namespace nomat::scene
{
    /**
     * @brief Nodes, skins and animations of one loaded scene.
     *
     * The external loader populates the model through createNode/addSkin/addAnimation and
     * calls finalize() once. After that the model is driven per frame:
     * AnimationSystem first, then update().
     */
    class Model
    {
    public:
        int createNode(int parent = -1, std::string name = {});
        Node& node(int index) { return m_scene.node(index); }
        const Node& node(int index) const { return m_scene.node(index); }

        uint32_t addSkin(Skin skin);
        uint32_t addAnimation(Animation animation);

        /**
         * @brief Validates loader data and prepares the model for evaluation.
         *
         * Builds local motors, converts inverse bind matrices to motors, computes animation
         * durations, synthesizes hold channels for properties animated elsewhere, computes
         * world scales and applies scale compensation. On error the model is left untouched.
         */
        core::Result<void> finalize();
        bool isFinalized() const { return m_finalized; }

        // Resolves world motors, then skin buffers. Returns the number of skins rebuilt.
        size_t update(const pga::Motor& rootMotor = pga::kIdentity);

        // Adds a one-key channel holding the rest value for every (node, path) that some
        // animation animates and another does not.
        void completeAnimations();

        SceneGraph& scene() { return m_scene; }
        const SceneGraph& scene() const { return m_scene; }
        std::vector<Skin>& skins() { return m_skins; }
        const std::vector<Skin>& skins() const { return m_skins; }
        std::vector<Animation>& animations() { return m_animations; }
        const std::vector<Animation>& animations() const { return m_animations; }

    private:
        core::Result<void> validate() const;

        SceneGraph m_scene;
        std::vector<Skin> m_skins;
        std::vector<Animation> m_animations;
        bool m_finalized = false;
    };
}
