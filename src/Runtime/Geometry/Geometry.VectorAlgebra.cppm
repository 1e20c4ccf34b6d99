module;

#include <array>
#include <cstddef>
#include <span>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

export module Geometry:VectorAlgebra;

import Core.Error;

export namespace Geometry::VectorAlgebra
{
    // =========================================================================
    // Polygon measures
    // =========================================================================

    // Sum of p_i x p_(i+1) over the closed polygon: the dual vector of the
    // polygon's area bivector, i.e. twice its vector area. Its direction is
    // the right-hand normal of the traversal order.
    [[nodiscard]] glm::dvec3 DirectedArea(std::span<const glm::dvec3> polygon);

    // The polygon is flat when every edge vector is orthogonal to its
    // directed area (A ^ e == 0) within tolerance.
    [[nodiscard]] bool IsFlat(std::span<const glm::dvec3> polygon, double tolerance);

    // =========================================================================
    // Rotations
    // =========================================================================

    // Rotation by `angle` radians about the unit axis, right-hand rule.
    [[nodiscard]] glm::dquat AxisRotation(const glm::dvec3& axis, double angle);

    // Smallest rotation taking direction `from` to direction `to`. Zero-length
    // inputs give the identity; opposite directions give a half turn about an
    // arbitrary perpendicular axis.
    [[nodiscard]] glm::dquat RotationBetween(const glm::dvec3& from, const glm::dvec3& to);

    // Sandwich q p q^-1 applied about `pivot`.
    [[nodiscard]] glm::dvec3 RotateAbout(const glm::dquat& rotation, const glm::dvec3& pivot, const glm::dvec3& point);

    // =========================================================================
    // Lines and spheres
    // =========================================================================

    // Foot of the perpendicular from p onto the line through a and b.
    // Returns a when the line is degenerate.
    [[nodiscard]] glm::dvec3 ProjectPointToLine(const glm::dvec3& p, const glm::dvec3& a, const glm::dvec3& b);

    struct Sphere
    {
        glm::dvec3 Center{0.0};
        double Radius{0.0};
    };

    struct SphereIntersection
    {
        // Count is 2 for two distinct points and 1 for a tangent contact (both
        // entries equal). With n = (c2 - c1) x (c3 - c1), Points[0] lies on the
        // +n side of the centre plane and Points[1] on the -n side.
        std::array<glm::dvec3, 2> Points{};
        std::size_t Count{0};
    };

    struct SphereIntersectionParams
    {
        // Negative discriminants down to -Tolerance are treated as tangency.
        double DiscriminantTolerance{1e-10};

        // Minimum distance between centres and from the third centre to the
        // line of the first two.
        double DegeneracyTolerance{1e-12};
    };

    // Fails with NegativeDiscriminant when the spheres share no point and with
    // DegenerateGeometry when the centres are coincident or collinear.
    [[nodiscard]] Core::Expected<SphereIntersection> IntersectThreeSpheres(
        const Sphere& s1, const Sphere& s2, const Sphere& s3,
        const SphereIntersectionParams& params = {});
}
