#include "nomat/core/common.hpp"
#include "nomat/core/cvar.hpp"
#include "nomat/scene/AnimationSystem.hpp"
#include "nomat/scene/Model.hpp"
#include "nomat/scene/SkinningSystem.hpp"

#include <array>
#include <exception>
#include <filesystem>

#include <glm/gtc/matrix_transform.hpp>

using namespace nomat;

namespace {

AUTO_CVAR_INT(arm_frames, "Frames simulated by the skinned arm sample", 48, core::CVarFlags::save);
AUTO_CVAR_FLOAT(arm_frameTime, "Seconds per simulated frame", 1.0f / 24.0f, core::CVarFlags::save);

glm::vec4 rotationKey(float degrees) {
    const glm::quat q = glm::angleAxis(glm::radians(degrees), glm::vec3(0.0f, 0.0f, 1.0f));
    return {q.x, q.y, q.z, q.w};
}

// shoulder -> elbow -> wrist along +x, one unit apart, plus the mesh node that owns the skin.
scene::Model buildArm() {
    scene::Model model;
    const int shoulder = model.createNode(-1, "shoulder");
    const int elbow = model.createNode(shoulder, "elbow");
    const int wrist = model.createNode(elbow, "wrist");
    const int mesh = model.createNode(-1, "armMesh");

    model.node(elbow).translation = glm::vec3(1.0f, 0.0f, 0.0f);
    model.node(wrist).translation = glm::vec3(1.0f, 0.0f, 0.0f);
    model.node(mesh).skinIndex = 0;

    scene::Skin skin;
    skin.name = "arm";
    skin.skeletonRootNode = shoulder;
    skin.joints = {util::u32(shoulder), util::u32(elbow), util::u32(wrist)};
    for (float x : {0.0f, 1.0f, 2.0f}) {
        skin.inverseBindMatrices.push_back(glm::translate(glm::mat4(1.0f), glm::vec3(-x, 0.0f, 0.0f)));
    }
    model.addSkin(std::move(skin));

    scene::Animation wave;
    wave.name = "wave";

    scene::AnimationSampler shoulderKeys;
    shoulderKeys.inputs = {0.0f, 1.0f, 2.0f};
    shoulderKeys.outputs = {rotationKey(0.0f), rotationKey(30.0f), rotationKey(0.0f)};

    scene::AnimationSampler elbowKeys;
    elbowKeys.inputs = {0.0f, 0.5f, 1.0f, 1.5f, 2.0f};
    elbowKeys.outputs = {rotationKey(0.0f), rotationKey(90.0f), rotationKey(175.0f), rotationKey(90.0f),
                         rotationKey(0.0f)};

    wave.samplers = {shoulderKeys, elbowKeys};
    wave.channels = {{0, util::u32(shoulder), scene::AnimationPath::Rotation},
                     {1, util::u32(elbow), scene::AnimationPath::Rotation}};
    model.addAnimation(std::move(wave));
    return model;
}

} // namespace

int main(int argc, char** argv) {
    core::Logger::init();

    if (argc > 1) {
        core::CVarSystem::loadFromIni(std::filesystem::path(argv[1]));
    }

    try {
        scene::Model model = buildArm();
        if (auto result = model.finalize(); !result) {
            core::Logger::error("Failed to prepare arm: {}", result.error());
            core::Logger::shutdown();
            return 1;
        }

        // Vertices along the forearm, bound to elbow and wrist.
        const std::array<glm::vec3, 3> vertices{glm::vec3(1.0f, 0.1f, 0.0f), glm::vec3(1.5f, 0.1f, 0.0f),
                                                glm::vec3(2.0f, 0.1f, 0.0f)};
        const std::array<glm::vec4, 3> weights{glm::vec4(1.0f, 0.0f, 0.0f, 0.0f), glm::vec4(0.5f, 0.5f, 0.0f, 0.0f),
                                               glm::vec4(0.0f, 1.0f, 0.0f, 0.0f)};
        const glm::uvec4 joints(1, 2, 0, 0);

        const pga::Motor placement = pga::fromTranslation({0.0f, 1.5f, 0.0f});
        scene::AnimationState state = scene::makeAnimationState(0);
        const int frames = arm_frames.get();
        const float dt = arm_frameTime.get();

        for (int frame = 0; frame < frames; ++frame) {
            NOMAT_PROFILE_FRAME_MARK();
            scene::AnimationSystem::update(model, state, dt);
            const size_t rebuilt = model.update(placement);

            const scene::Skin& skin = model.skins()[0];
            for (size_t v = 0; v < vertices.size(); ++v) {
                const glm::vec3 p = scene::SkinningSystem::skinPoint(skin, joints, weights[v], vertices[v]);
                core::Logger::debug("frame {} vertex {}: ({:.3f}, {:.3f}, {:.3f})", frame, v, p.x, p.y, p.z);
            }

            const glm::vec3 tip = pga::applyToOrigin(model.node(2).worldTransform);
            core::Logger::info("t={:.3f} skins rebuilt={} wrist=({:.3f}, {:.3f}, {:.3f})", state.currentTime, rebuilt,
                               tip.x, tip.y, tip.z);
        }
    } catch (const std::exception& e) {
        core::Logger::fatal("Skinned arm sample failed: {}", e.what());
        core::Logger::shutdown();
        return 1;
    }

    core::Logger::shutdown();
    return 0;
}
