module;

#include <cmath>
#include <expected>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

module Folding:MeshQueries.Impl;

import Core.Error;
import Geometry;
import :MeshQueries;

namespace Folding
{
    using Core::ErrorCode;
    using Geometry::Halfedge::Mesh;

    namespace
    {
        bool HasSplitSuffix(std::string_view name)
        {
            return name.size() >= 2 && name[name.size() - 2] == '.' &&
                   (name.back() == '0' || name.back() == '1');
        }
    }

    std::string MergeNames(std::string_view a, std::string_view b)
    {
        if (HasSplitSuffix(a) && HasSplitSuffix(b) && a != b &&
            a.substr(0, a.size() - 2) == b.substr(0, b.size() - 2))
        {
            return std::string(a.substr(0, a.size() - 2));
        }
        std::string merged = "[";
        merged += a;
        merged += '|';
        merged += b;
        merged += ']';
        return merged;
    }

    std::string_view BaseName(std::string_view name)
    {
        const auto dot = name.find('.');
        return dot == std::string_view::npos ? name : name.substr(0, dot);
    }

    bool IsTipName(std::string_view name)
    {
        return name.find('^') != std::string_view::npos;
    }

    Core::Expected<bool> TouchesBoundary(const Mesh& mesh, VertexHandle v)
    {
        if (!mesh.HasBoundary()) return false;

        auto outgoing = mesh.OutgoingHalfedges(v);
        if (!outgoing) return std::unexpected(outgoing.error());
        for (HalfedgeHandle h : *outgoing)
        {
            if (mesh.IsBoundary(h)) return true;
        }
        return false;
    }

    Core::Expected<VertexHandle> ResolveVertex(const Mesh& mesh, std::string_view name, bool requireBoundary)
    {
        const auto v = mesh.FindVertex(name);
        if (!v)
        {
            return Core::Err(ErrorCode::NameNotFound, "found 0 vertices named \"{}\"", name);
        }
        if (requireBoundary)
        {
            auto touches = TouchesBoundary(mesh, *v);
            if (!touches) return std::unexpected(touches.error());
            if (!*touches)
            {
                return Core::Err(ErrorCode::NotBoundaryAdjacent, "vertex \"{}\" is not on the boundary", name);
            }
        }
        return *v;
    }

    Core::Expected<LoopHandle> FindUniqueFace(const Mesh& mesh, VertexHandle p, VertexHandle q)
    {
        auto outgoing = mesh.OutgoingHalfedges(p);
        if (!outgoing) return std::unexpected(outgoing.error());

        LoopHandle found{};
        std::size_t count = 0;
        for (HalfedgeHandle h : *outgoing)
        {
            const LoopHandle loop = mesh.Loop(h);
            if (mesh.IsBoundary(h)) continue;

            auto halfedges = mesh.LoopHalfedges(loop);
            if (!halfedges) return std::unexpected(halfedges.error());
            for (HalfedgeHandle x : *halfedges)
            {
                if (mesh.ToVertex(x) == q)
                {
                    found = loop;
                    ++count;
                    break;
                }
            }
        }

        if (count != 1)
        {
            return Core::Err(ErrorCode::NotUnique, "found {} faces containing {} and {}",
                             count, mesh.Name(p), mesh.Name(q));
        }
        return found;
    }

    Core::Expected<HalfedgeHandle> IncomingInLoop(const Mesh& mesh, LoopHandle loop, VertexHandle v)
    {
        auto halfedges = mesh.LoopHalfedges(loop);
        if (!halfedges) return std::unexpected(halfedges.error());

        HalfedgeHandle found{};
        std::size_t count = 0;
        for (HalfedgeHandle h : *halfedges)
        {
            if (mesh.ToVertex(h) == v)
            {
                found = h;
                ++count;
            }
        }
        if (count != 1)
        {
            return Core::Err(ErrorCode::NotUnique, "found {} halfedges into {} in loop {}",
                             count, mesh.Name(v), mesh.Name(loop));
        }
        return found;
    }

    Core::Expected<HalfedgeHandle> OutgoingInLoop(const Mesh& mesh, VertexHandle v, LoopHandle loop)
    {
        auto outgoing = mesh.OutgoingHalfedges(v);
        if (!outgoing) return std::unexpected(outgoing.error());

        HalfedgeHandle found{};
        std::size_t count = 0;
        for (HalfedgeHandle h : *outgoing)
        {
            if (mesh.Loop(h) == loop)
            {
                found = h;
                ++count;
            }
        }
        if (count != 1)
        {
            return Core::Err(ErrorCode::NotUnique, "found {} halfedges out of {} in loop {}",
                             count, mesh.Name(v), mesh.Name(loop));
        }
        return found;
    }

    Core::Expected<VertexSet> CollectVertices(const Mesh& mesh, VertexHandle start, const VertexSet& border)
    {
        VertexSet seen;
        std::vector<VertexHandle> stack{start};
        while (!stack.empty())
        {
            const VertexHandle v = stack.back();
            stack.pop_back();
            if (border.contains(v) || seen.contains(v)) continue;
            seen.insert(v);

            auto outgoing = mesh.OutgoingHalfedges(v);
            if (!outgoing) return std::unexpected(outgoing.error());
            for (HalfedgeHandle h : *outgoing)
            {
                stack.push_back(mesh.ToVertex(h));
            }
        }
        return seen;
    }

    bool Intersects(const VertexSet& a, const VertexSet& b)
    {
        for (VertexHandle v : a)
        {
            if (b.contains(v)) return true;
        }
        return false;
    }

    std::string DescribeVertices(const Mesh& mesh, const VertexSet& vertices)
    {
        std::string out;
        for (VertexHandle v : vertices)
        {
            if (!out.empty()) out += ' ';
            out += mesh.Name(v);
        }
        return out;
    }

    Core::Expected<std::vector<glm::dvec3>> LoopPositions(const Mesh& mesh, LoopHandle loop)
    {
        auto halfedges = mesh.LoopHalfedges(loop);
        if (!halfedges) return std::unexpected(halfedges.error());

        std::vector<glm::dvec3> positions;
        positions.reserve(halfedges->size());
        for (HalfedgeHandle h : *halfedges)
        {
            positions.push_back(mesh.Position(mesh.ToVertex(h)));
        }
        return positions;
    }

    Core::Expected<glm::dvec3> LoopArea(const Mesh& mesh, LoopHandle loop)
    {
        auto positions = LoopPositions(mesh, loop);
        if (!positions) return std::unexpected(positions.error());
        return Geometry::VectorAlgebra::DirectedArea(*positions);
    }

    Core::Expected<bool> IsLoopFlat(const Mesh& mesh, LoopHandle loop, double tolerance)
    {
        auto positions = LoopPositions(mesh, loop);
        if (!positions) return std::unexpected(positions.error());
        return Geometry::VectorAlgebra::IsFlat(*positions, tolerance);
    }

    Core::Expected<glm::dvec3> FaceOrientation(const Mesh& mesh, HalfedgeHandle h)
    {
        auto area = LoopArea(mesh, mesh.Loop(h));
        if (!area) return std::unexpected(area.error());
        const glm::dvec3 edge = mesh.Position(mesh.ToVertex(h)) - mesh.Position(mesh.FromVertex(h));
        return glm::cross(*area, edge);
    }

    Core::Expected<bool> IsBetweenCoplanarLoops(const Mesh& mesh, HalfedgeHandle h, double tolerance)
    {
        const LoopHandle l1 = mesh.Loop(h);
        const LoopHandle l2 = mesh.Loop(mesh.OppositeHalfedge(h));

        for (LoopHandle l : {l1, l2})
        {
            auto flat = IsLoopFlat(mesh, l, tolerance);
            if (!flat) return std::unexpected(flat.error());
            if (!*flat)
            {
                return Core::Err(ErrorCode::NotFlat, "loop {} is not flat", mesh.Name(l));
            }
        }

        auto a1 = LoopArea(mesh, l1);
        if (!a1) return std::unexpected(a1.error());
        auto a2 = LoopArea(mesh, l2);
        if (!a2) return std::unexpected(a2.error());

        const double n1 = glm::length(*a1);
        const double n2 = glm::length(*a2);
        if (n1 < tolerance || n2 < tolerance) return true;

        return Geometry::Validation::ComponentsEqual(*a1 / n1, *a2 / n2, tolerance);
    }

    double EdgeLength(const Mesh& mesh, HalfedgeHandle h)
    {
        return glm::distance(mesh.Position(mesh.FromVertex(h)), mesh.Position(mesh.ToVertex(h)));
    }

    void RotateVertices(Mesh& mesh, const VertexSet& vertices, const glm::dquat& rotation, const glm::dvec3& pivot)
    {
        for (VertexHandle v : vertices)
        {
            mesh.Position(v) = Geometry::VectorAlgebra::RotateAbout(rotation, pivot, mesh.Position(v));
        }
    }
}
