#include <doctest/doctest.h>
#include "MotorTestUtils.hpp"
#include "nomat/scene/ScaleCompensation.hpp"
#include <glm/gtc/matrix_transform.hpp>

using namespace nomat;
using namespace nomat::scene;
using nomat::test::checkMotor;
using nomat::test::checkVec3;

TEST_CASE("Scale Compensation") {
    SUBCASE("Own scale sources") {
        Node n;
        checkVec3(ScaleCompensation::ownScale(n), glm::vec3(1.0f));

        n.matrix = glm::scale(glm::mat4(1.0f), glm::vec3(3.0f));
        checkVec3(ScaleCompensation::ownScale(n), glm::vec3(3.0f));

        n.scale = glm::vec3(0.5f);
        checkVec3(ScaleCompensation::ownScale(n), glm::vec3(0.5f));
    }

    SUBCASE("Only the translational part is patched") {
        pga::Motor m = pga::makeMotor(0.1f, 0.2f, 0.3f, 0.4f, 1.0f, 1.0f, 1.0f, 1.0f);
        ScaleCompensation::compensate(m, {2.0f, 3.0f, 4.0f});
        checkMotor(m, pga::makeMotor(0.1f, 0.2f, 0.3f, 0.4f, 2.0f, 3.0f, 4.0f, 4.0f));
    }

    SUBCASE("World scale accumulates down the hierarchy") {
        SceneGraph scene;
        const int root = scene.createNode(-1, "root");
        const int mid = scene.createNode(root, "mid");
        const int leaf = scene.createNode(mid, "leaf");
        scene.node(root).scale = glm::vec3(2.0f);
        scene.node(mid).scale = glm::vec3(1.5f);

        ScaleCompensation::computeWorldScales(scene);
        checkVec3(scene.node(leaf).worldScale, glm::vec3(3.0f));
        checkVec3(ScaleCompensation::parentWorldScale(scene, scene.node(leaf)), glm::vec3(3.0f));
        checkVec3(ScaleCompensation::parentWorldScale(scene, scene.node(root)), glm::vec3(1.0f));
    }

    SUBCASE("Compensated motors land where a scaled matrix chain puts them") {
        SceneGraph scene;
        const int root = scene.createNode(-1, "root");
        const int child = scene.createNode(root, "child");

        const glm::vec3 rootT(1.0f, 0.0f, 0.0f);
        const glm::vec3 childT(0.0f, 1.0f, 0.0f);
        const glm::quat rootR = glm::angleAxis(glm::radians(90.0f), glm::vec3(0, 0, 1));

        Node& r = scene.node(root);
        r.translation = rootT;
        r.rotation = rootR;
        r.scale = glm::vec3(2.0f);
        r.transform = composeLocalTransform(r);

        Node& c = scene.node(child);
        c.translation = childT;
        c.transform = composeLocalTransform(c);

        std::vector<Skin> skins(1);
        skins[0].joints = {static_cast<uint32_t>(child)};
        skins[0].inverseBindMotors = {pga::fromTranslation({0.0f, -1.0f, 0.0f})};

        ScaleCompensation::computeWorldScales(scene);
        ScaleCompensation::compensateScene(scene, skins);
        scene.updateTransforms();

        const glm::mat4 rootM = glm::translate(glm::mat4(1.0f), rootT) * glm::mat4_cast(rootR) *
                                glm::scale(glm::mat4(1.0f), glm::vec3(2.0f));
        const glm::mat4 childM = rootM * glm::translate(glm::mat4(1.0f), childT);
        checkVec3(pga::applyToOrigin(scene.node(child).worldTransform), glm::vec3(childM[3]));

        // Inverse bind translation is scaled by the joint's parent scale too.
        checkVec3(pga::applyToOrigin(skins[0].inverseBindMotors[0]), {0.0f, -2.0f, 0.0f});
    }
}
