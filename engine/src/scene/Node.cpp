#include "nomat/scene/Node.hpp"

namespace nomat::scene {

    bool hasTransformSources(const Node& node) {
        return node.rotation || node.translation || node.matrix;
    }

    pga::Motor composeLocalTransform(const Node& node) {
        if (!node.rotation && !node.translation) {
            return node.matrix ? pga::fromMatrix4(*node.matrix) : pga::kIdentity;
        }

        pga::Motor m = node.rotation ? pga::fromRotation(*node.rotation) : pga::kIdentity;
        if (node.translation) {
            m = pga::composeTR(pga::fromTranslation(*node.translation), m);
        }
        return m;
    }

    void setSourcesFromTransform(Node& node) {
        const pga::Motor& m = node.transform;
        // Inverse of fromRotation: [w, -x, -y, -z].
        node.rotation = glm::quat(m[0][0], -m[0][1], -m[0][2], -m[0][3]);
        node.translation = pga::applyToOrigin(m);
    }
}
