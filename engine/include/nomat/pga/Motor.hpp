#pragma once

/**
 * @file Motor.hpp
 * @brief 3D Projective Geometric Algebra motors, lines, points and directions.
 *
 * Layouts match the shader-side motor type consumed by the renderer:
 *
 *   motor     : mat2x4 : [ s, e23, e31, e12 | e01, e02, e03, e0123 ]
 *   line      : mat2x3 : [ e23, e31, e12 | e01, e02, e03 ]
 *   point     : vec3   : [ e032, e013, e021 ] with implied 1 e123
 *   direction : vec3   : [ e032, e013, e021 ] with implied 0 e123
 *
 * Column 0 of a motor is its rotational part, column 1 its translational part.
 * Sandwich products assume normalized motors.
 */

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <span>

namespace nomat::pga
{
    using Motor = glm::mat2x4;
    using Line = glm::mat2x3;
    using Point = glm::vec3;
    using Direction = glm::vec3;

    inline Motor makeMotor(float s, float e23, float e31, float e12,
                           float e01, float e02, float e03, float e0123)
    {
        return Motor(glm::vec4(s, e23, e31, e12), glm::vec4(e01, e02, e03, e0123));
    }

    inline Line makeLine(float e23, float e31, float e12, float e01, float e02, float e03)
    {
        return Line(glm::vec3(e23, e31, e12), glm::vec3(e01, e02, e03));
    }

    inline const Motor kIdentity = makeMotor(1.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f);

    inline const Line kE23 = makeLine(1, 0, 0, 0, 0, 0);
    inline const Line kE31 = makeLine(0, 1, 0, 0, 0, 0);
    inline const Line kE12 = makeLine(0, 0, 1, 0, 0, 0);
    inline const Line kE01 = makeLine(0, 0, 0, 1, 0, 0);
    inline const Line kE02 = makeLine(0, 0, 0, 0, 1, 0);
    inline const Line kE03 = makeLine(0, 0, 0, 0, 0, 1);

    // Column scale deviation tolerated by fromMatrix3 before rescaling.
    inline constexpr float kUniformScaleTolerance = 1e-4f;

    // --- Composition ---------------------------------------------------------

    /**
     * @brief Geometric product ab of two general motors. 48 muls, 40 adds.
     */
    [[nodiscard]] Motor compose(const Motor& a, const Motor& b);
    void compose(const Motor& a, const Motor& b, Motor& out);

    // Specialized products. r = pure rotation [s,e23,e31,e12,0,0,0,0],
    // t = pure translation [1,0,0,0,e01,e02,e03,0], m = general motor.
    [[nodiscard]] Motor composeRR(const Motor& r1, const Motor& r2);
    [[nodiscard]] Motor composeRT(const Motor& r, const Motor& t);
    [[nodiscard]] Motor composeTR(const Motor& t, const Motor& r);
    [[nodiscard]] Motor composeTT(const Motor& t1, const Motor& t2);
    [[nodiscard]] Motor composeMR(const Motor& m, const Motor& r);
    [[nodiscard]] Motor composeRM(const Motor& r, const Motor& m);
    [[nodiscard]] Motor composeMT(const Motor& m, const Motor& t);
    [[nodiscard]] Motor composeTM(const Motor& t, const Motor& m);

    // --- Sandwich products ---------------------------------------------------

    /**
     * @brief Applies a normalized motor to a Euclidean point. 21 muls, 18 adds.
     */
    [[nodiscard]] Point applyToPoint(const Motor& a, const Point& p);

    /**
     * @brief Applies a normalized motor to an ideal point. Translation has no effect.
     */
    [[nodiscard]] Direction applyToDirection(const Motor& a, const Direction& d);

    /**
     * @brief Applies a normalized motor to the origin. 15 muls, 9 adds.
     */
    [[nodiscard]] Point applyToOrigin(const Motor& a);

    // --- Unary operations ----------------------------------------------------

    [[nodiscard]] Motor reverse(const Motor& a);
    void reverse(const Motor& a, Motor& out);

    /**
     * @brief General exponential of a line.
     * A line without Euclidean part yields a pure translation [1,0,0,0,e01,e02,e03,0].
     */
    [[nodiscard]] Motor expBivector(const Line& b);

    // Rotation by angle around a normalized Euclidean line through its own axis.
    [[nodiscard]] Motor expRotation(float angle, const Line& axis);
    // Translation along a normalized ideal line.
    [[nodiscard]] Motor expTranslation(float distance, const Line& direction);

    /**
     * @brief Logarithm of a normalized motor, inverse of expBivector.
     * Near the identity rotation (|s - 1| < 1e-6) only the translation part is kept.
     */
    [[nodiscard]] Line logMotor(const Motor& m);

    /**
     * @brief Restores both motor invariants after a weighted combination.
     */
    [[nodiscard]] Motor normalizeMotor(const Motor& a);
    void normalizeMotor(const Motor& a, Motor& out);

    /**
     * @brief Square root of a normalized motor ("half motor").
     * When s == -1 the rotational part of a + 1 vanishes. The root is then taken of -a,
     * which represents the same rigid transform, so the result squares to -a.
     */
    [[nodiscard]] Motor sqrtMotor(const Motor& a);

    // --- Conversions ---------------------------------------------------------

    /**
     * @brief Converts a rotation matrix to a rotation motor.
     * Columns with a length outside 1 +- kUniformScaleTolerance are rescaled first.
     * Non-uniform scale is reported as a warning and gives an approximate result.
     */
    [[nodiscard]] Motor fromMatrix3(const glm::mat3& m);

    // Rigid 4x4 (column-major, translation in column 3) to motor.
    [[nodiscard]] Motor fromMatrix4(const glm::mat4& m);

    // glTF rotation quaternion to motor [w, -x, -y, -z, 0, 0, 0, 0].
    [[nodiscard]] Motor fromRotation(const glm::quat& q);

    // Translation motor that moves the origin to t.
    [[nodiscard]] Motor fromTranslation(const glm::vec3& t);

    // --- Helpers -------------------------------------------------------------

    [[nodiscard]] float rotationDot(const Motor& a, const Motor& b);

    [[nodiscard]] bool isNormalized(const Motor& a, float tolerance = 1e-4f);

    /**
     * @brief Picks the representative of candidate on the same half of the double cover
     * as current: candidate is negated when their rotational dot product is <= 0.
     */
    [[nodiscard]] Motor shortestPath(const Motor& current, const Motor& candidate);
    [[nodiscard]] glm::quat shortestPath(const glm::quat& current, const glm::quat& candidate);

    /**
     * @brief Weighted motor blend as done per vertex for skinning.
     * Each motor is sign-corrected against the running sum before it is accumulated.
     * The result is renormalized. Spans must have equal length.
     */
    [[nodiscard]] Motor blend(std::span<const Motor> motors, std::span<const float> weights);
}
