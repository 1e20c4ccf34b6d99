module;

#include <cmath>
#include <numbers>
#include <span>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

module Geometry:VectorAlgebra.Impl;

import Core.Error;
import :VectorAlgebra;
import :Validation;

namespace Geometry::VectorAlgebra
{
    glm::dvec3 DirectedArea(std::span<const glm::dvec3> polygon)
    {
        glm::dvec3 area(0.0);
        const std::size_t n = polygon.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            area += glm::cross(polygon[i], polygon[(i + 1) % n]);
        }
        return area;
    }

    bool IsFlat(std::span<const glm::dvec3> polygon, double tolerance)
    {
        const glm::dvec3 area = DirectedArea(polygon);
        const std::size_t n = polygon.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            const glm::dvec3 edge = polygon[(i + 1) % n] - polygon[i];
            if (std::abs(glm::dot(area, edge)) >= tolerance) return false;
        }
        return true;
    }

    glm::dquat AxisRotation(const glm::dvec3& axis, double angle)
    {
        return glm::angleAxis(angle, axis);
    }

    glm::dquat RotationBetween(const glm::dvec3& from, const glm::dvec3& to)
    {
        if (Validation::IsZero(from) || Validation::IsZero(to))
        {
            return glm::dquat(1.0, 0.0, 0.0, 0.0);
        }

        const glm::dvec3 a = glm::normalize(from);
        const glm::dvec3 b = glm::normalize(to);
        const glm::dvec3 axis = glm::cross(a, b);
        const double sine = glm::length(axis);
        const double cosine = glm::dot(a, b);

        if (sine < 1e-15)
        {
            if (cosine > 0.0) return glm::dquat(1.0, 0.0, 0.0, 0.0);

            // Half turn about any axis perpendicular to a.
            const glm::dvec3 helper = std::abs(a.x) < 0.9 ? glm::dvec3(1.0, 0.0, 0.0) : glm::dvec3(0.0, 1.0, 0.0);
            return glm::angleAxis(std::numbers::pi, glm::normalize(glm::cross(a, helper)));
        }

        return glm::angleAxis(std::atan2(sine, cosine), axis / sine);
    }

    glm::dvec3 RotateAbout(const glm::dquat& rotation, const glm::dvec3& pivot, const glm::dvec3& point)
    {
        return pivot + rotation * (point - pivot);
    }

    glm::dvec3 ProjectPointToLine(const glm::dvec3& p, const glm::dvec3& a, const glm::dvec3& b)
    {
        if (Validation::IsDegenerateSegment(a, b)) return a;
        const glm::dvec3 ab = b - a;
        return a + (glm::dot(ab, p - a) / glm::dot(ab, ab)) * ab;
    }

    // -------------------------------------------------------------------------
    // Trilateration in the frame of the centres:
    //   ex along c2 - c1, ey in the centre plane, ez = ex x ey.
    // The common points are base +/- z ez with
    //   x = (r1^2 - r2^2 + d^2) / 2d
    //   y = (r1^2 - r3^2 + i^2 + j^2) / 2j - (i/j) x
    //   z^2 = r1^2 - x^2 - y^2.
    // -------------------------------------------------------------------------
    Core::Expected<SphereIntersection> IntersectThreeSpheres(
        const Sphere& s1, const Sphere& s2, const Sphere& s3,
        const SphereIntersectionParams& params)
    {
        const glm::dvec3 c12 = s2.Center - s1.Center;
        const double d = glm::length(c12);
        if (d < params.DegeneracyTolerance)
        {
            return Core::Err(Core::ErrorCode::DegenerateGeometry, "coincident sphere centers");
        }
        const glm::dvec3 ex = c12 / d;

        const glm::dvec3 c13 = s3.Center - s1.Center;
        const double i = glm::dot(ex, c13);
        const glm::dvec3 perp = c13 - i * ex;
        const double j = glm::length(perp);
        if (j < params.DegeneracyTolerance)
        {
            return Core::Err(Core::ErrorCode::DegenerateGeometry, "collinear sphere centers");
        }
        const glm::dvec3 ey = perp / j;
        const glm::dvec3 ez = glm::cross(ex, ey);

        const double r1 = s1.Radius;
        const double r2 = s2.Radius;
        const double r3 = s3.Radius;

        const double x = (r1 * r1 - r2 * r2 + d * d) / (2.0 * d);
        const double y = (r1 * r1 - r3 * r3 + i * i + j * j) / (2.0 * j) - (i / j) * x;
        double discriminant = r1 * r1 - x * x - y * y;

        if (discriminant < 0.0)
        {
            if (discriminant > -params.DiscriminantTolerance)
            {
                discriminant = 0.0;
            }
            else
            {
                return Core::Err(Core::ErrorCode::NegativeDiscriminant,
                                 "negative discriminant {:.3g}: spheres do not intersect", discriminant);
            }
        }

        const double z = std::sqrt(discriminant);
        const glm::dvec3 base = s1.Center + x * ex + y * ey;

        SphereIntersection result;
        result.Points[0] = base + z * ez;
        result.Points[1] = base - z * ez;
        result.Count = discriminant > 0.0 ? 2u : 1u;
        return result;
    }
}
