#include "nomat/scene/SceneGraph.hpp"
#include "nomat/core/common.hpp"
#include <stack>

namespace nomat::scene {

    int SceneGraph::createNode(int parent, std::string name) {
        if (parent >= 0) {
            util::checkIndex(util::sz(parent), m_nodes.size(), "parent node");
        }

        const int index = static_cast<int>(m_nodes.size());
        Node& n = m_nodes.emplace_back();
        n.name = std::move(name);
        n.parentIndex = parent;

        if (parent >= 0) {
            m_nodes[util::sz(parent)].children.push_back(index);
        } else {
            m_roots.push_back(index);
        }

        m_hierarchyDirty = true;
        return index;
    }

    Node& SceneGraph::node(int index) {
        util::checkIndex(util::sz(index), m_nodes.size(), "node");
        return m_nodes[util::sz(index)];
    }

    const Node& SceneGraph::node(int index) const {
        util::checkIndex(util::sz(index), m_nodes.size(), "node");
        return m_nodes[util::sz(index)];
    }

    const std::vector<int>& SceneGraph::topoOrder() {
        if (m_hierarchyDirty) updateTopoOrder();
        return m_topoOrder;
    }

    void SceneGraph::updateTopoOrder() {
        m_topoOrder.clear();
        m_topoOrder.reserve(m_nodes.size());

        std::stack<int> stack;
        for (auto it = m_roots.rbegin(); it != m_roots.rend(); ++it) {
            stack.push(*it);
        }

        while (!stack.empty()) {
            const int e = stack.top();
            stack.pop();
            m_topoOrder.push_back(e);

            const auto& children = m_nodes[util::sz(e)].children;
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                stack.push(*it);
            }
        }
        m_hierarchyDirty = false;
    }

    size_t SceneGraph::updateTransforms(const pga::Motor& rootMotor) {
        NOMAT_PROFILE_FUNCTION();

        if (!m_hasRootMotor || rootMotor != m_rootMotor) {
            m_rootMotor = rootMotor;
            m_hasRootMotor = true;
            for (int r : m_roots) markAsChanged(r);
        }

        for (Node& n : m_nodes) {
            if (n.state == TransformState::Updated) n.state = TransformState::Clean;
        }

        size_t recomputed = 0;
        for (int e : topoOrder()) {
            Node& n = m_nodes[util::sz(e)];
            if (n.state != TransformState::Dirty) continue;

            const pga::Motor& parentWorld =
                n.parentIndex >= 0 ? m_nodes[util::sz(n.parentIndex)].worldTransform : m_rootMotor;
            pga::compose(parentWorld, n.transform, n.worldTransform);
            n.state = TransformState::Updated;
            ++recomputed;

            for (int child : n.children) {
                m_nodes[util::sz(child)].state = TransformState::Dirty;
            }
        }
        return recomputed;
    }

    void SceneGraph::markAsChanged(int index) {
        node(index).state = TransformState::Dirty;
    }

    void SceneGraph::markAllChanged() {
        for (Node& n : m_nodes) n.state = TransformState::Dirty;
    }
}
