#pragma once
#include "nomat/pga/Motor.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nomat::scene {

// Clean   : world motor is current and did not change this frame.
// Dirty   : local motor or an ancestor changed, world motor must be recomputed.
// Updated : world motor was recomputed during the last resolver pass.
enum class TransformState : uint8_t {
    Clean,
    Dirty,
    Updated
};

struct Node {
    std::string name;

    // Local motor, parent space. Scale compensated once finalized.
    pga::Motor transform = pga::kIdentity;
    pga::Motor worldTransform = pga::kIdentity;
    TransformState state = TransformState::Dirty;

    // Raw glTF-style sources. Animation writes rotation/translation.
    std::optional<glm::quat> rotation;
    std::optional<glm::vec3> translation;
    std::optional<glm::vec3> scale;
    std::optional<glm::mat4> matrix;

    int parentIndex = -1;
    std::vector<int> children;
    int skinIndex = -1;

    glm::vec3 ownScale{1.0f};
    glm::vec3 worldScale{1.0f};
};

// Node helpers, defined in src/scene/Node.cpp.

bool hasTransformSources(const Node& node);

// Local motor from the raw sources: rotation then translation, or the matrix when the
// node has neither. Scale is not part of the result.
pga::Motor composeLocalTransform(const Node& node);

// Fills rotation and translation from the local motor, for nodes delivered with a motor
// only. The motor must be normalized.
void setSourcesFromTransform(Node& node);

} // namespace nomat::scene
