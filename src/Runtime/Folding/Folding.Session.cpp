module;

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

module Folding:Session.Impl;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;
import :StarBuilder;
import :Inspection;
import :Script;
import :Session;

namespace Folding
{
    using Core::ErrorCode;

    Session::Session(Tolerances tolerances)
        : m_Tolerances(tolerances)
    {
        m_Mesh.SetNeighborhoodLimit(m_Tolerances.NeighborhoodLimit);
    }

    Core::Result Session::Setup(std::string_view definition)
    {
        m_Mesh = Geometry::Halfedge::Mesh{};
        m_Mesh.SetNeighborhoodLimit(m_Tolerances.NeighborhoodLimit);
        m_Steps.clear();
        m_Failed = false;

        Core::Log::StringSink sink;
        Core::Result outcome = [&]() -> Core::Result {
            auto parsed = StarBuilder::ParseDefinition(definition);
            if (!parsed) return std::unexpected(parsed.error());
            return StarBuilder::Build(m_Mesh, *parsed, m_Tolerances, sink);
        }();
        return Record("setup", sink, std::move(outcome));
    }

    Core::Result Session::RunOperation(std::string_view name, std::span<const std::string_view> args)
    {
        std::string title(name);
        for (std::string_view arg : args)
        {
            title += ' ';
            title += arg;
        }

        auto command = ParseCommand(name, args);
        if (!command)
        {
            Core::Log::StringSink sink;
            return Record(std::move(title), sink, std::unexpected(command.error()));
        }
        return RunStep(std::move(title), *command);
    }

    Core::Expected<std::size_t> Session::RunScript(std::string_view script, std::size_t maxSteps)
    {
        std::size_t executed = 0;
        for (std::string_view line : StarBuilder::ContentLines(script))
        {
            if (executed == maxSteps) break;

            const std::size_t number = m_Steps.size();
            Core::Result outcome = Core::Ok();
            if (auto command = ParseCommand(line))
            {
                outcome = RunStep(std::string(line), *command);
            }
            else
            {
                Core::Log::StringSink sink;
                outcome = Record(std::string(line), sink, std::unexpected(command.error()));
            }
            ++executed;

            if (!outcome)
            {
                return Core::Err(outcome.error().Code, "step #{} \"{}\": {}", number, line, outcome.error().Message);
            }
        }
        return executed;
    }

    Core::Result Session::CheckConsistency() const
    {
        return Folding::CheckConsistency(m_Mesh, m_Tolerances);
    }

    Core::Expected<MeshSnapshot> Session::Snapshot() const
    {
        return TakeSnapshot(m_Mesh);
    }

    // -------------------------------------------------------------------------
    // Steps
    // -------------------------------------------------------------------------

    Core::Result Session::RunStep(std::string title, const Command& command)
    {
        Core::Log::StringSink sink;
        if (m_Failed)
        {
            return Core::Err(ErrorCode::InvalidState, "\"{}\" refused: an earlier step failed", title);
        }
        if (m_Steps.empty())
        {
            return Record(std::move(title), sink,
                          Core::Err(ErrorCode::InvalidState, "no star has been set up"));
        }

        Core::Log::Debug("step #{}: {}", m_Steps.size(), title);
        Core::Result outcome = Apply(m_Mesh, command, m_Tolerances, sink);
        return Record(std::move(title), sink, std::move(outcome));
    }

    Core::Result Session::Record(std::string title, Core::Log::StringSink& sink, Core::Result outcome)
    {
        if (outcome)
        {
            outcome = Folding::CheckConsistency(m_Mesh, m_Tolerances);
        }
        if (outcome)
        {
            outcome = DescribeMesh(m_Mesh, m_Tolerances, sink);
        }
        if (outcome)
        {
            const double drift = MaxPeerLengthDrift(m_Mesh);
            if (drift > 0.1 * m_Tolerances.PeerLength)
            {
                Core::Log::Warn("step #{} ({}): peer lengths drift by {:.3g}", m_Steps.size(), title, drift);
            }
        }

        StepRecord record;
        record.Title = std::move(title);
        record.Trace = sink.Take();
        if (!outcome)
        {
            m_Failed = true;
            record.Failure = outcome.error();
            Core::Log::Error("Failure at step #{} ({}): [{}] {}", m_Steps.size(), record.Title,
                             Core::ErrorCodeToString(outcome.error().Code), outcome.error().Message);
        }
        m_Steps.push_back(std::move(record));
        return outcome;
    }
}
