#include <doctest/doctest.h>
#include "MotorTestUtils.hpp"
#include "nomat/scene/AnimationSystem.hpp"
#include "nomat/scene/Model.hpp"
#include "nomat/scene/SkinningSystem.hpp"
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

using namespace nomat;
using namespace nomat::scene;
using nomat::test::checkMotor;
using nomat::test::checkVec3;

namespace {

AnimationSampler keys(std::vector<float> times, std::vector<glm::vec4> values) {
    AnimationSampler s;
    s.inputs = std::move(times);
    s.outputs = std::move(values);
    return s;
}

// Two joint chain with a skin bound in the rest pose.
Model skinnedModel() {
    Model model;
    const int root = model.createNode(-1, "root");
    const int tip = model.createNode(root, "tip");
    const int mesh = model.createNode(-1, "mesh");

    model.node(root).translation = glm::vec3(0.0f, 1.0f, 0.0f);
    model.node(tip).translation = glm::vec3(0.0f, 2.0f, 0.0f);
    model.node(mesh).skinIndex = 0;

    Skin skin;
    skin.name = "chain";
    skin.joints = {static_cast<uint32_t>(root), static_cast<uint32_t>(tip)};
    skin.skeletonRootNode = root;
    skin.inverseBindMatrices = {glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, -1.0f, 0.0f)),
                                glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, -3.0f, 0.0f))};
    model.addSkin(std::move(skin));
    return model;
}

} // namespace

TEST_CASE("Model Finalize") {
    Model model = skinnedModel();

    SUBCASE("Bind pose produces identity skin motors") {
        REQUIRE(model.finalize().has_value());
        CHECK(model.isFinalized());
        CHECK(model.update() == 1);

        const Skin& skin = model.skins()[0];
        REQUIRE(skin.inverseBindMotors.size() == 2);
        checkMotor(SkinningSystem::skinMotor(skin, 0), pga::kIdentity);
        checkMotor(SkinningSystem::skinMotor(skin, 1), pga::kIdentity);
        checkVec3(pga::applyToOrigin(model.node(1).worldTransform), {0.0f, 3.0f, 0.0f});
    }

    SUBCASE("Second update without changes rebuilds nothing") {
        REQUIRE(model.finalize().has_value());
        model.update();
        CHECK(model.update() == 0);
    }

    SUBCASE("Placement change rebuilds the skin") {
        REQUIRE(model.finalize().has_value());
        model.update();
        CHECK(model.update(pga::fromTranslation({1.0f, 0.0f, 0.0f})) == 1);
    }

    SUBCASE("Missing inverse bind matrices default to identity") {
        model.skins()[0].inverseBindMatrices.clear();
        REQUIRE(model.finalize().has_value());
        checkMotor(model.skins()[0].inverseBindMotors[1], pga::kIdentity);
    }

    SUBCASE("Finalize runs once") {
        REQUIRE(model.finalize().has_value());
        const auto again = model.finalize();
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().find("already") != std::string::npos);
    }

    SUBCASE("Animation duration is the last key of any sampler") {
        Animation anim;
        anim.samplers.push_back(keys({0.0f, 1.5f}, {glm::vec4(0.0f), glm::vec4(1.0f)}));
        anim.samplers.push_back(keys({0.0f, 0.5f, 2.25f}, {glm::vec4(0.0f), glm::vec4(0.0f), glm::vec4(0.0f)}));
        anim.channels.push_back({0, 0, AnimationPath::Translation});
        anim.channels.push_back({1, 1, AnimationPath::Translation});
        model.addAnimation(std::move(anim));

        REQUIRE(model.finalize().has_value());
        CHECK(model.animations()[0].duration == 2.25f);
    }
}

TEST_CASE("Model Motor Only Nodes") {
    Model model;
    const int base = model.createNode(-1, "base");
    const int arm = model.createNode(-1, "arm");
    model.node(base).transform = pga::fromTranslation({1.0f, 0.0f, 0.0f});
    model.node(arm).transform = pga::compose(pga::fromTranslation({0.0f, 2.0f, 0.0f}),
                                             pga::fromRotation(glm::angleAxis(glm::radians(90.0f), glm::vec3(0.0f, 0.0f, 1.0f))));

    const glm::quat turn = glm::angleAxis(glm::radians(45.0f), glm::vec3(0.0f, 0.0f, 1.0f));
    Animation swing;
    swing.name = "swing";
    swing.samplers.push_back(keys({0.0f}, {glm::vec4(turn.x, turn.y, turn.z, turn.w)}));
    swing.channels.push_back({0, static_cast<uint32_t>(arm), AnimationPath::Rotation});
    model.addAnimation(std::move(swing));

    REQUIRE(model.finalize().has_value());
    model.update();

    SUBCASE("Finalize keeps the motor set by the loader") {
        CHECK_FALSE(hasTransformSources(model.node(base)));
        checkVec3(pga::applyToOrigin(model.node(base).worldTransform), {1.0f, 0.0f, 0.0f});
        checkVec3(pga::applyToOrigin(model.node(arm).worldTransform), {0.0f, 2.0f, 0.0f});
    }

    SUBCASE("Animated node gets sources from its motor") {
        REQUIRE(model.node(arm).translation.has_value());
        checkVec3(*model.node(arm).translation, {0.0f, 2.0f, 0.0f});
        checkVec3(*model.node(arm).rotation * glm::vec3(1.0f, 0.0f, 0.0f), {0.0f, 1.0f, 0.0f});
    }

    SUBCASE("Rotation channel keeps the translation from the motor") {
        AnimationSystem::evaluate(model, 0, 0.0f);
        model.update();
        const float c = std::sqrt(0.5f);
        checkVec3(pga::applyToOrigin(model.node(arm).worldTransform), {0.0f, 2.0f, 0.0f});
        checkVec3(pga::applyToPoint(model.node(arm).worldTransform, {1.0f, 0.0f, 0.0f}), {c, 2.0f + c, 0.0f});
    }
}

TEST_CASE("Model Validation") {
    Model model = skinnedModel();

    auto expectError = [&](const char* fragment) {
        const auto result = model.finalize();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().find(fragment) != std::string::npos);
        CHECK_FALSE(model.isFinalized());
    };

    SUBCASE("Node skin index") {
        model.node(2).skinIndex = 3;
        expectError("skin 3");
    }

    SUBCASE("Joint out of range") {
        model.skins()[0].joints.push_back(9);
        expectError("joint 9");
    }

    SUBCASE("Inverse bind count") {
        model.skins()[0].inverseBindMatrices.pop_back();
        expectError("inverse bind");
    }

    SUBCASE("Skeleton root") {
        model.skins()[0].skeletonRootNode = 12;
        expectError("skeleton root");
    }

    SUBCASE("Sampler without keys") {
        Animation anim;
        anim.samplers.emplace_back();
        model.addAnimation(std::move(anim));
        expectError("without keys");
    }

    SUBCASE("Sampler value count") {
        Animation anim;
        anim.samplers.push_back(keys({0.0f, 1.0f}, {glm::vec4(0.0f)}));
        model.addAnimation(std::move(anim));
        expectError("2 times but 1 values");
    }

    SUBCASE("Unsorted key times") {
        Animation anim;
        anim.samplers.push_back(keys({1.0f, 0.5f}, {glm::vec4(0.0f), glm::vec4(0.0f)}));
        model.addAnimation(std::move(anim));
        expectError("ascending");
    }

    SUBCASE("Channel sampler index") {
        Animation anim;
        anim.samplers.push_back(keys({0.0f}, {glm::vec4(0.0f)}));
        anim.channels.push_back({4, 0, AnimationPath::Rotation});
        model.addAnimation(std::move(anim));
        expectError("sampler 4");
    }

    SUBCASE("Channel target") {
        Animation anim;
        anim.samplers.push_back(keys({0.0f}, {glm::vec4(0.0f)}));
        anim.channels.push_back({0, 40, AnimationPath::Translation});
        model.addAnimation(std::move(anim));
        expectError("target 40");
    }

    SUBCASE("Failed validation leaves local motors untouched") {
        model.node(2).skinIndex = 3;
        REQUIRE_FALSE(model.finalize().has_value());
        checkMotor(model.node(0).transform, pga::kIdentity);
    }
}

TEST_CASE("Model Hold Channels") {
    Model model;
    const int body = model.createNode(-1, "body");
    const int head = model.createNode(body, "head");
    const glm::quat restTilt = glm::angleAxis(0.3f, glm::vec3(1.0f, 0.0f, 0.0f));
    model.node(body).translation = glm::vec3(0.0f, 1.0f, 0.0f);
    model.node(head).rotation = restTilt;

    Animation walk;
    walk.name = "walk";
    walk.samplers.push_back(keys({0.0f, 1.0f}, {glm::vec4(0.0f), glm::vec4(0.0f, 0.0f, 2.0f, 0.0f)}));
    walk.channels.push_back({0, static_cast<uint32_t>(body), AnimationPath::Translation});
    model.addAnimation(std::move(walk));

    Animation nod;
    nod.name = "nod";
    nod.samplers.push_back(keys({0.0f, 0.5f}, {glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), glm::vec4(0.0f, 0.0f, 0.0f, 1.0f)}));
    nod.channels.push_back({0, static_cast<uint32_t>(head), AnimationPath::Rotation});
    model.addAnimation(std::move(nod));

    REQUIRE(model.finalize().has_value());

    SUBCASE("Every animation covers every animated property") {
        for (const auto& anim : model.animations()) {
            CHECK(anim.channels.size() == 2);
        }
    }

    SUBCASE("Hold channel carries the rest translation") {
        const Animation& n = model.animations()[1];
        const AnimationChannel& hold = n.channels.back();
        CHECK(hold.targetNode == static_cast<uint32_t>(body));
        CHECK(hold.path == AnimationPath::Translation);

        const AnimationSampler& s = n.samplers[hold.samplerIndex];
        REQUIRE(s.inputs.size() == 1);
        CHECK(s.inputs[0] == 0.0f);
        checkVec3(glm::vec3(s.outputs[0]), {0.0f, 1.0f, 0.0f});
    }

    SUBCASE("Hold channel carries the rest rotation as x, y, z, w") {
        const Animation& w = model.animations()[0];
        const AnimationChannel& hold = w.channels.back();
        CHECK(hold.targetNode == static_cast<uint32_t>(head));
        CHECK(hold.path == AnimationPath::Rotation);

        const glm::vec4 v = w.samplers[hold.samplerIndex].outputs[0];
        CHECK(v.x == doctest::Approx(restTilt.x));
        CHECK(v.w == doctest::Approx(restTilt.w));
    }

    SUBCASE("Durations ignore hold channels") {
        CHECK(model.animations()[0].duration == 1.0f);
        CHECK(model.animations()[1].duration == 0.5f);
    }
}
