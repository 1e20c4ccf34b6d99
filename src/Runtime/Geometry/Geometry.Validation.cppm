module;
#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/norm.hpp>

#include <cmath>

export module Geometry:Validation;

export namespace Geometry::Validation
{
    // =========================================================================
    // VALIDATION UTILITIES
    // =========================================================================

    constexpr double EPSILON = 1e-12;

    // --- Vector Validation ---

    inline bool IsFinite(const glm::dvec3& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    inline bool IsZero(const glm::dvec3& v, double epsilon = EPSILON)
    {
        return glm::length2(v) < epsilon * epsilon;
    }

    // --- Tolerant comparisons ---

    // Every component of a - b is below tolerance in magnitude.
    inline bool ComponentsEqual(const glm::dvec3& a, const glm::dvec3& b, double tolerance)
    {
        const glm::dvec3 d = glm::abs(a - b);
        return d.x < tolerance && d.y < tolerance && d.z < tolerance;
    }

    inline bool IsDegenerateSegment(const glm::dvec3& a, const glm::dvec3& b, double epsilon = EPSILON)
    {
        return glm::distance2(a, b) < epsilon * epsilon;
    }
}
