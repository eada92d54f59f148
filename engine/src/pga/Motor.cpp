#include "nomat/pga/Motor.hpp"
#include "nomat/core/common.hpp"
#include "nomat/core/cvar.hpp"
#include <algorithm>
#include <cmath>

namespace nomat::pga
{
    AUTO_CVAR_FLOAT(pga_normTolerance, "Tolerance of the normalized-motor check in debug builds", 1e-3f);

    Motor compose(const Motor& a, const Motor& b)
    {
        Motor res;
        compose(a, b, res);
        return res;
    }

    void compose(const Motor& a, const Motor& b, Motor& out)
    {
        const float a0 = a[0][0], a1 = a[0][1], a2 = a[0][2], a3 = a[0][3];
        const float a4 = a[1][0], a5 = a[1][1], a6 = a[1][2], a7 = a[1][3];
        const float b0 = b[0][0], b1 = b[0][1], b2 = b[0][2], b3 = b[0][3];
        const float b4 = b[1][0], b5 = b[1][1], b6 = b[1][2], b7 = b[1][3];

        // out may alias a or b, everything is read before the first write.
        out[0][0] = a0 * b0 - a1 * b1 - a2 * b2 - a3 * b3;
        out[0][1] = a0 * b1 + a1 * b0 + a3 * b2 - a2 * b3;
        out[0][2] = a0 * b2 + a1 * b3 + a2 * b0 - a3 * b1;
        out[0][3] = a0 * b3 + a2 * b1 + a3 * b0 - a1 * b2;
        out[1][0] = a0 * b4 + a3 * b5 + a4 * b0 + a6 * b2 - a1 * b7 - a2 * b6 - a5 * b3 - a7 * b1;
        out[1][1] = a0 * b5 + a1 * b6 + a4 * b3 + a5 * b0 - a2 * b7 - a3 * b4 - a6 * b1 - a7 * b2;
        out[1][2] = a0 * b6 + a2 * b4 + a5 * b1 + a6 * b0 - a1 * b5 - a3 * b7 - a4 * b2 - a7 * b3;
        out[1][3] = a0 * b7 + a1 * b4 + a2 * b5 + a3 * b6 + a4 * b1 + a5 * b2 + a6 * b3 + a7 * b0;
    }

    // Rotational part of a product, shared by the rotation-only variants.
    static glm::vec4 rotorProduct(const glm::vec4& a, const glm::vec4& b)
    {
        return {a[0] * b[0] - a[1] * b[1] - a[2] * b[2] - a[3] * b[3],
                a[0] * b[1] + a[1] * b[0] + a[3] * b[2] - a[2] * b[3],
                a[0] * b[2] + a[1] * b[3] + a[2] * b[0] - a[3] * b[1],
                a[0] * b[3] + a[2] * b[1] + a[3] * b[0] - a[1] * b[2]};
    }

    Motor composeRR(const Motor& r1, const Motor& r2)
    {
        return Motor(rotorProduct(r1[0], r2[0]), glm::vec4(0.0f));
    }

    Motor composeRT(const Motor& r, const Motor& t)
    {
        const float a0 = r[0][0], a1 = r[0][1], a2 = r[0][2], a3 = r[0][3];
        const float b4 = t[1][0], b5 = t[1][1], b6 = t[1][2];
        return makeMotor(a0, a1, a2, a3,
                         a0 * b4 + a3 * b5 - a2 * b6,
                         a0 * b5 + a1 * b6 - a3 * b4,
                         a0 * b6 + a2 * b4 - a1 * b5,
                         a1 * b4 + a2 * b5 + a3 * b6);
    }

    Motor composeTR(const Motor& t, const Motor& r)
    {
        const float a4 = t[1][0], a5 = t[1][1], a6 = t[1][2];
        const float b0 = r[0][0], b1 = r[0][1], b2 = r[0][2], b3 = r[0][3];
        return makeMotor(b0, b1, b2, b3,
                         a4 * b0 + a6 * b2 - a5 * b3,
                         a4 * b3 + a5 * b0 - a6 * b1,
                         a5 * b1 + a6 * b0 - a4 * b2,
                         a4 * b1 + a5 * b2 + a6 * b3);
    }

    Motor composeTT(const Motor& t1, const Motor& t2)
    {
        return makeMotor(1.0f, 0.0f, 0.0f, 0.0f,
                         t1[1][0] + t2[1][0], t1[1][1] + t2[1][1], t1[1][2] + t2[1][2], 0.0f);
    }

    Motor composeMR(const Motor& m, const Motor& r)
    {
        const float a4 = m[1][0], a5 = m[1][1], a6 = m[1][2], a7 = m[1][3];
        const float b0 = r[0][0], b1 = r[0][1], b2 = r[0][2], b3 = r[0][3];
        return Motor(rotorProduct(m[0], r[0]),
                     glm::vec4(a4 * b0 + a6 * b2 - a5 * b3 - a7 * b1,
                               a4 * b3 + a5 * b0 - a6 * b1 - a7 * b2,
                               a5 * b1 + a6 * b0 - a4 * b2 - a7 * b3,
                               a4 * b1 + a5 * b2 + a6 * b3 + a7 * b0));
    }

    Motor composeRM(const Motor& r, const Motor& m)
    {
        const float a0 = r[0][0], a1 = r[0][1], a2 = r[0][2], a3 = r[0][3];
        const float b4 = m[1][0], b5 = m[1][1], b6 = m[1][2], b7 = m[1][3];
        return Motor(rotorProduct(r[0], m[0]),
                     glm::vec4(a0 * b4 + a3 * b5 - a1 * b7 - a2 * b6,
                               a0 * b5 + a1 * b6 - a2 * b7 - a3 * b4,
                               a0 * b6 + a2 * b4 - a1 * b5 - a3 * b7,
                               a0 * b7 + a1 * b4 + a2 * b5 + a3 * b6));
    }

    Motor composeMT(const Motor& m, const Motor& t)
    {
        const float a0 = m[0][0], a1 = m[0][1], a2 = m[0][2], a3 = m[0][3];
        const float b4 = t[1][0], b5 = t[1][1], b6 = t[1][2];
        return Motor(m[0],
                     glm::vec4(m[1][0] + a0 * b4 + a3 * b5 - a2 * b6,
                               m[1][1] + a0 * b5 + a1 * b6 - a3 * b4,
                               m[1][2] + a0 * b6 + a2 * b4 - a1 * b5,
                               m[1][3] + a1 * b4 + a2 * b5 + a3 * b6));
    }

    Motor composeTM(const Motor& t, const Motor& m)
    {
        const float a4 = t[1][0], a5 = t[1][1], a6 = t[1][2];
        const float b0 = m[0][0], b1 = m[0][1], b2 = m[0][2], b3 = m[0][3];
        return Motor(m[0],
                     glm::vec4(m[1][0] + a4 * b0 + a6 * b2 - a5 * b3,
                               m[1][1] + a4 * b3 + a5 * b0 - a6 * b1,
                               m[1][2] + a5 * b1 + a6 * b0 - a4 * b2,
                               m[1][3] + a4 * b1 + a5 * b2 + a6 * b3));
    }

    Point applyToPoint(const Motor& a, const Point& p)
    {
        NOMAT_ASSERT(isNormalized(a, pga_normTolerance.get()), "applyToPoint requires a normalized motor");
        const float a0 = a[0][0], a1 = a[0][1], a2 = a[0][2], a3 = a[0][3];
        const float a4 = a[1][0], a5 = a[1][1], a6 = a[1][2], a7 = a[1][3];
        const float b0 = p.x, b1 = p.y, b2 = p.z;
        const float s0 = a1 * b2 - a3 * b0 - a5;
        const float s1 = a3 * b1 - a2 * b2 - a4;
        const float s2 = a2 * b0 - a1 * b1 - a6;

        return {b0 + 2.0f * (a3 * s0 + a0 * s1 - a1 * a7 - a2 * s2),
                b1 + 2.0f * (a1 * s2 + a0 * s0 - a2 * a7 - a3 * s1),
                b2 + 2.0f * (a2 * s1 + a0 * s2 - a3 * a7 - a1 * s0)};
    }

    Direction applyToDirection(const Motor& a, const Direction& d)
    {
        NOMAT_ASSERT(isNormalized(a, pga_normTolerance.get()), "applyToDirection requires a normalized motor");
        const float a0 = a[0][0], a1 = a[0][1], a2 = a[0][2], a3 = a[0][3];
        const float b0 = d.x, b1 = d.y, b2 = d.z;
        const float s0 = a1 * b2 - a3 * b0;
        const float s1 = a3 * b1 - a2 * b2;
        const float s2 = a2 * b0 - a1 * b1;

        return {b0 + 2.0f * (a3 * s0 + a0 * s1 - a2 * s2),
                b1 + 2.0f * (a1 * s2 + a0 * s0 - a3 * s1),
                b2 + 2.0f * (a2 * s1 + a0 * s2 - a1 * s0)};
    }

    Point applyToOrigin(const Motor& a)
    {
        NOMAT_ASSERT(isNormalized(a, pga_normTolerance.get()), "applyToOrigin requires a normalized motor");
        const float a0 = a[0][0], a1 = a[0][1], a2 = a[0][2], a3 = a[0][3];
        const float a4 = a[1][0], a5 = a[1][1], a6 = a[1][2], a7 = a[1][3];
        return {2.0f * (a2 * a6 - a0 * a4 - a1 * a7 - a3 * a5),
                2.0f * (a3 * a4 - a0 * a5 - a1 * a6 - a2 * a7),
                2.0f * (a1 * a5 - a0 * a6 - a2 * a4 - a3 * a7)};
    }

    Motor reverse(const Motor& a)
    {
        Motor res;
        reverse(a, res);
        return res;
    }

    void reverse(const Motor& a, Motor& out)
    {
        out[0] = glm::vec4(a[0][0], -a[0][1], -a[0][2], -a[0][3]);
        out[1] = glm::vec4(-a[1][0], -a[1][1], -a[1][2], a[1][3]);
    }

    Motor expBivector(const Line& b)
    {
        const float l = b[0][0] * b[0][0] + b[0][1] * b[0][1] + b[0][2] * b[0][2];
        if (l == 0.0f)
        {
            return makeMotor(1.0f, 0.0f, 0.0f, 0.0f, b[1][0], b[1][1], b[1][2], 0.0f);
        }

        const float a = std::sqrt(l);
        const float m = b[0][0] * b[1][0] + b[0][1] * b[1][1] + b[0][2] * b[1][2];
        const float c = std::cos(a);
        const float s = std::sin(a) / a;
        const float t = m / l * (c - s);

        return makeMotor(c, b[0][0] * s, b[0][1] * s, b[0][2] * s,
                         b[1][0] * s + b[0][0] * t,
                         b[1][1] * s + b[0][1] * t,
                         b[1][2] * s + b[0][2] * t,
                         m * s);
    }

    Motor expRotation(float angle, const Line& axis)
    {
        const float s = std::sin(angle);
        return makeMotor(std::cos(angle), axis[0][0] * s, axis[0][1] * s, axis[0][2] * s,
                         0.0f, 0.0f, 0.0f, 0.0f);
    }

    Motor expTranslation(float distance, const Line& direction)
    {
        return makeMotor(1.0f, 0.0f, 0.0f, 0.0f,
                         distance * direction[1][0], distance * direction[1][1], distance * direction[1][2], 0.0f);
    }

    Line logMotor(const Motor& m)
    {
        const float s = m[0][0];
        if (std::abs(s - 1.0f) < 1e-6f)
        {
            return makeLine(0.0f, 0.0f, 0.0f, m[1][0], m[1][1], m[1][2]);
        }

        const float a = 1.0f / (1.0f - s * s);
        const float b = std::acos(std::clamp(s, -1.0f, 1.0f)) * std::sqrt(a);
        const float c = a * m[1][3] * (1.0f - s * b);

        return makeLine(m[0][1] * b, m[0][2] * b, m[0][3] * b,
                        m[1][0] * b + m[0][1] * c,
                        m[1][1] * b + m[0][2] * c,
                        m[1][2] * b + m[0][3] * c);
    }

    Motor normalizeMotor(const Motor& a)
    {
        Motor res;
        normalizeMotor(a, res);
        return res;
    }

    void normalizeMotor(const Motor& a, Motor& out)
    {
        const float a0 = a[0][0], a1 = a[0][1], a2 = a[0][2], a3 = a[0][3];
        const float a4 = a[1][0], a5 = a[1][1], a6 = a[1][2], a7 = a[1][3];

        const float s = 1.0f / std::sqrt(a0 * a0 + a1 * a1 + a2 * a2 + a3 * a3);
        const float d = (a7 * a0 - (a4 * a1 + a5 * a2 + a6 * a3)) * s * s;

        out[0] = glm::vec4(a0 * s, a1 * s, a2 * s, a3 * s);
        out[1] = glm::vec4(a4 * s + a1 * s * d,
                           a5 * s + a2 * s * d,
                           a6 * s + a3 * s * d,
                           a7 * s - a0 * s * d);
    }

    Motor sqrtMotor(const Motor& a)
    {
        Motor shifted = a;
        shifted[0][0] += 1.0f;
        if (glm::dot(shifted[0], shifted[0]) < 1e-12f)
        {
            shifted = -a;
            shifted[0][0] += 1.0f;
        }
        return normalizeMotor(shifted);
    }

    Motor fromMatrix3(const glm::mat3& matrix)
    {
        glm::mat3 m = matrix;

        // Quick scale check, a full SVD is not worth it for loader data.
        const glm::vec3 scale(glm::length(m[0]), glm::length(m[1]), glm::length(m[2]));
        if (std::abs(scale.x - 1.0f) > kUniformScaleTolerance ||
            std::abs(scale.y - 1.0f) > kUniformScaleTolerance ||
            std::abs(scale.z - 1.0f) > kUniformScaleTolerance)
        {
            m[0] /= scale.x;
            m[1] /= scale.y;
            m[2] /= scale.z;
            if (std::abs(scale.x / scale.y - 1.0f) > kUniformScaleTolerance ||
                std::abs(scale.y / scale.z - 1.0f) > kUniformScaleTolerance)
            {
                core::Logger::warn("fromMatrix3: non uniformly scaled matrix ({}, {}, {}), rotation is approximate",
                                   scale.x, scale.y, scale.z);
            }
        }

        const float m00 = m[0][0], m01 = m[0][1], m02 = m[0][2];
        const float m10 = m[1][0], m11 = m[1][1], m12 = m[1][2];
        const float m20 = m[2][0], m21 = m[2][1], m22 = m[2][2];

        Motor r;
        if (m00 + m11 + m22 > 0.0f)
        {
            r = makeMotor(m00 + m11 + m22 + 1.0f, m21 - m12, m02 - m20, m10 - m01, 0, 0, 0, 0);
        }
        else if (m00 > m11 && m00 > m22)
        {
            r = makeMotor(m21 - m12, 1.0f + m00 - m11 - m22, m01 + m10, m02 + m20, 0, 0, 0, 0);
        }
        else if (m11 > m22)
        {
            r = makeMotor(m02 - m20, m01 + m10, 1.0f + m11 - m00 - m22, m12 + m21, 0, 0, 0, 0);
        }
        else
        {
            r = makeMotor(m10 - m01, m02 + m20, m12 + m21, 1.0f + m22 - m00 - m11, 0, 0, 0, 0);
        }
        return normalizeMotor(r);
    }

    Motor fromMatrix4(const glm::mat4& m)
    {
        const Motor t = makeMotor(1.0f, 0.0f, 0.0f, 0.0f, -0.5f * m[3][0], -0.5f * m[3][1], -0.5f * m[3][2], 0.0f);
        return composeTR(t, fromMatrix3(glm::mat3(m)));
    }

    Motor fromRotation(const glm::quat& q)
    {
        return normalizeMotor(makeMotor(q.w, -q.x, -q.y, -q.z, 0.0f, 0.0f, 0.0f, 0.0f));
    }

    Motor fromTranslation(const glm::vec3& t)
    {
        return makeMotor(1.0f, 0.0f, 0.0f, 0.0f, -0.5f * t.x, -0.5f * t.y, -0.5f * t.z, 0.0f);
    }

    float rotationDot(const Motor& a, const Motor& b)
    {
        return glm::dot(a[0], b[0]);
    }

    bool isNormalized(const Motor& a, float tolerance)
    {
        const float norm = glm::dot(a[0], a[0]);
        const float ortho = a[0][0] * a[1][3] - (a[0][1] * a[1][0] + a[0][2] * a[1][1] + a[0][3] * a[1][2]);
        return std::abs(norm - 1.0f) <= tolerance && std::abs(ortho) <= tolerance;
    }

    Motor shortestPath(const Motor& current, const Motor& candidate)
    {
        return rotationDot(current, candidate) <= 0.0f ? -candidate : candidate;
    }

    glm::quat shortestPath(const glm::quat& current, const glm::quat& candidate)
    {
        return glm::dot(current, candidate) <= 0.0f ? -candidate : candidate;
    }

    Motor blend(std::span<const Motor> motors, std::span<const float> weights)
    {
        NOMAT_ASSERT(motors.size() == weights.size(), "blend: one weight per motor");
        const size_t count = std::min(motors.size(), weights.size());
        if (count == 0)
        {
            return kIdentity;
        }

        Motor r = weights[0] * motors[0];
        for (size_t k = 1; k < count; ++k)
        {
            r += weights[k] * shortestPath(r, motors[k]);
        }
        return normalizeMotor(r);
    }
}
