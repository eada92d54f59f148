#pragma once
#include "nomat/scene/Node.hpp"
#include <cstddef>
#include <vector>

namespace nomat::scene {

    class SceneGraph {
    public:
        // Appends a node. parent == -1 creates a root.
        int createNode(int parent = -1, std::string name = {});

        Node& node(int index);
        const Node& node(int index) const;
        size_t size() const { return m_nodes.size(); }
        std::vector<Node>& nodes() { return m_nodes; }
        const std::vector<Node>& nodes() const { return m_nodes; }
        const std::vector<int>& roots() const { return m_roots; }

        // Parent-before-child order over all nodes.
        const std::vector<int>& topoOrder();

        /**
         * @brief Resolves world motors top-down.
         * Dirty nodes get world = compose(parentWorld, local) and pass the dirty state to
         * their children. Roots use rootMotor as parent world. Nodes updated in the
         * previous pass return to Clean first.
         * @return Number of nodes recomputed.
         */
        size_t updateTransforms(const pga::Motor& rootMotor = pga::kIdentity);

        // Placement motor used by the last updateTransforms pass.
        const pga::Motor& rootMotor() const { return m_rootMotor; }

        void markAsChanged(int index);
        void markAllChanged();

        bool wasUpdated(int index) const { return node(index).state == TransformState::Updated; }

    private:
        void updateTopoOrder();

        std::vector<Node> m_nodes;
        std::vector<int> m_roots;
        std::vector<int> m_topoOrder;
        bool m_hierarchyDirty = false;

        pga::Motor m_rootMotor = pga::kIdentity;
        bool m_hasRootMotor = false;
    };
}
