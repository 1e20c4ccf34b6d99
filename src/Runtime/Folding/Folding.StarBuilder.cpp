module;

#include <array>
#include <charconv>
#include <cmath>
#include <expected>
#include <numbers>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

module Folding:StarBuilder.Impl;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;
import :MeshQueries;
import :StarBuilder;

namespace Folding::StarBuilder
{
    using Core::ErrorCode;
    using Geometry::Halfedge::Mesh;

    namespace
    {
        constexpr double kHalfRoot3 = std::numbers::sqrt3 / 2.0;

        // Indexed by clock direction; 0 is unused.
        constexpr std::array<std::array<double, 2>, 13> kSteps{{
            {0.0, 0.0},
            {kHalfRoot3, 1.5},
            {kHalfRoot3, 0.5},
            {2.0 * kHalfRoot3, 0.0},
            {kHalfRoot3, -0.5},
            {kHalfRoot3, -1.5},
            {0.0, -1.0},
            {-kHalfRoot3, -1.5},
            {-kHalfRoot3, -0.5},
            {-2.0 * kHalfRoot3, 0.0},
            {-kHalfRoot3, 0.5},
            {-kHalfRoot3, 1.5},
            {0.0, 1.0},
        }};

        constexpr std::string_view kWhitespace = " \t\r\f\v";

        std::string_view Trim(std::string_view s)
        {
            const auto first = s.find_first_not_of(kWhitespace);
            if (first == std::string_view::npos) return {};
            const auto last = s.find_last_not_of(kWhitespace);
            return s.substr(first, last - first + 1);
        }

        glm::dvec3 Rotate60(const glm::dvec3& d)
        {
            constexpr double c = 0.5;
            constexpr double s = kHalfRoot3;
            return {c * d.x - s * d.y, s * d.x + c * d.y, 0.0};
        }
    }

    Core::Expected<glm::dvec3> LatticeStep(int clockDirection)
    {
        if (clockDirection < 1 || clockDirection > 12)
        {
            return Core::Err(ErrorCode::InvalidArgument, "unknown step {}", clockDirection);
        }
        const auto& step = kSteps[static_cast<std::size_t>(clockDirection)];
        return glm::dvec3(step[0], step[1], 0.0);
    }

    std::vector<std::string_view> ContentLines(std::string_view text)
    {
        std::vector<std::string_view> lines;
        std::size_t pos = 0;
        while (pos <= text.size())
        {
            auto end = text.find('\n', pos);
            if (end == std::string_view::npos) end = text.size();
            const std::string_view line = Trim(text.substr(pos, end - pos));
            pos = end + 1;

            if (line.empty() || line.starts_with("//") || line.starts_with('#')) continue;
            lines.push_back(line);
        }
        return lines;
    }

    std::vector<std::string_view> Tokenize(std::string_view line)
    {
        std::vector<std::string_view> out;
        std::size_t pos = 0;
        while (pos < line.size())
        {
            const auto start = line.find_first_not_of(kWhitespace, pos);
            if (start == std::string_view::npos) break;
            auto end = line.find_first_of(kWhitespace, start);
            if (end == std::string_view::npos) end = line.size();
            out.push_back(line.substr(start, end - start));
            pos = end;
        }
        return out;
    }

    Core::Expected<StarDefinition> ParseDefinition(std::string_view text)
    {
        StarDefinition definition;
        glm::dvec3 current(0.0);

        for (std::string_view line : ContentLines(text))
        {
            const auto tokens = Tokenize(line);

            StarEdge edge;
            edge.Name = std::string(tokens.front());
            edge.From = current;

            for (std::size_t i = 1; i < tokens.size(); ++i)
            {
                const std::string_view token = tokens[i];
                int direction = 0;
                const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), direction);
                if (ec != std::errc{} || ptr != token.data() + token.size())
                {
                    return Core::Err(ErrorCode::InvalidFormat, "step \"{}\" of edge {} is not an integer",
                                     token, edge.Name);
                }
                auto step = LatticeStep(direction);
                if (!step)
                {
                    return Core::Err(ErrorCode::InvalidArgument, "unknown step {} in edge {}", direction, edge.Name);
                }
                current += *step;
            }

            edge.Inner = edge.From + Rotate60(current - edge.From);
            definition.Edges.push_back(std::move(edge));
        }

        definition.End = current;
        return definition;
    }

    // -------------------------------------------------------------------------
    // Build
    // -------------------------------------------------------------------------
    //
    // Starting from a core (one vertex, one self-loop edge between "star" and
    // "boundary"), every outline edge splits the boundary halfedge twice:
    // first to add the tip, then the inner vertex. The core vertex ends up
    // between the last inner vertex and the first tip and is contracted away.
    Core::Result Build(Mesh& mesh, const StarDefinition& definition, const Tolerances& tolerances,
                       Core::Log::Sink& trace)
    {
        if (mesh.VertexCount() != 0)
        {
            return Core::Err(ErrorCode::InvalidState, "star must be built into an empty mesh");
        }
        if (definition.Edges.empty())
        {
            return Core::Err(ErrorCode::InvalidArgument, "star definition has no edges");
        }

        std::set<std::string_view> names;
        for (const StarEdge& edge : definition.Edges)
        {
            if (!names.insert(edge.Name).second)
            {
                return Core::Err(ErrorCode::DuplicateName, "edge name \"{}\" used twice", edge.Name);
            }
        }

        const double closure = glm::dot(definition.End, definition.End);
        if (closure > tolerances.PolygonClosure)
        {
            return Core::Err(ErrorCode::PolygonNotClosed, "polygon not closed: outline ends at ({:.6g}, {:.6g})",
                             definition.End.x, definition.End.y);
        }

        mesh.SetNeighborhoodLimit(tolerances.NeighborhoodLimit);

        auto core = mesh.AddCore();
        if (!core) return std::unexpected(core.error());

        const auto [inner, outer] = *core;
        const Geometry::LoopHandle star = mesh.Loop(inner);
        const Geometry::LoopHandle boundary = mesh.Loop(outer);
        mesh.RenameLoop(star, "star");
        mesh.RenameLoop(boundary, "boundary");
        mesh.SetBoundaryLoop(boundary);

        const Geometry::VertexHandle center = mesh.ToVertex(inner);
        if (auto renamed = mesh.RenameVertex(center, "(star center)"); !renamed) return renamed;
        mesh.Position(center) = glm::dvec3(0.0);

        std::vector<Geometry::VertexHandle> tips;
        tips.reserve(definition.Edges.size());

        for (std::size_t k = 0; k < definition.Edges.size(); ++k)
        {
            const StarEdge& edge = definition.Edges[k];

            auto first = mesh.SplitEdgeAcross(outer);
            if (!first) return std::unexpected(first.error());
            const Geometry::VertexHandle tip = mesh.FromVertex(first->First);
            if (auto renamed = mesh.RenameVertex(tip, "(tip " + std::to_string(k) + ")"); !renamed) return renamed;
            mesh.Position(tip) = edge.From;
            tips.push_back(tip);

            auto second = mesh.SplitEdgeAcross(outer);
            if (!second) return std::unexpected(second.error());
            const Geometry::VertexHandle inward = mesh.FromVertex(second->First);
            if (auto renamed = mesh.RenameVertex(inward, edge.Name); !renamed) return renamed;
            mesh.Position(inward) = edge.Inner;

            mesh.SetPeers(first->Second, second->Second);
        }

        auto merged = mesh.ContractEdge(outer);
        if (!merged) return std::unexpected(merged.error());

        for (Geometry::VertexHandle tip : tips)
        {
            auto alongBoundary = OutgoingInLoop(mesh, tip, boundary);
            if (!alongBoundary) return std::unexpected(alongBoundary.error());
            auto alongStar = OutgoingInLoop(mesh, tip, star);
            if (!alongStar) return std::unexpected(alongStar.error());

            std::string name = "[" + mesh.Name(mesh.ToVertex(*alongBoundary)) + "^" +
                               mesh.Name(mesh.ToVertex(*alongStar)) + "]";
            if (auto renamed = mesh.RenameVertex(tip, std::move(name)); !renamed) return renamed;
        }

        Core::Log::Trace(trace, "star with {} edges: {} vertices, {} boundary peers",
                         definition.Edges.size(), mesh.VertexCount(), mesh.PeeredHalfedges().size());
        return Core::Ok();
    }
}
