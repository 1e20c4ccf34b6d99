module;

#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module Folding:Session;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;
import :Inspection;
import :Script;

export namespace Folding
{
    // One executed line: the setup or a script command.
    struct StepRecord
    {
        std::string Title;
        std::string Trace;                  // operator trace followed by the mesh report
        std::optional<Core::Error> Failure;

        [[nodiscard]] bool Succeeded() const { return !Failure.has_value(); }
    };

    // =========================================================================
    // Session
    // =========================================================================
    //
    // Owns one mesh and drives it through a star setup and a sequence of
    // operations. After every successful step the consistency check runs and
    // a mesh report is appended to the step's trace. The first failure is
    // logged and recorded; the mesh is left as the failing step made it, and
    // further steps are refused until the next Setup().
    class Session
    {
    public:
        explicit Session(Tolerances tolerances = {});

        // Discards the current mesh and builds the star described by `definition`.
        [[nodiscard]] Core::Result Setup(std::string_view definition);

        [[nodiscard]] Core::Result RunOperation(std::string_view name, std::span<const std::string_view> args);

        // Runs at most maxSteps commands. Returns the number of commands
        // executed; the error of the first failing command otherwise.
        [[nodiscard]] Core::Expected<std::size_t> RunScript(
            std::string_view script, std::size_t maxSteps = std::numeric_limits<std::size_t>::max());

        [[nodiscard]] Core::Result CheckConsistency() const;
        [[nodiscard]] Core::Expected<MeshSnapshot> Snapshot() const;

        [[nodiscard]] const Geometry::Halfedge::Mesh& GetMesh() const { return m_Mesh; }
        [[nodiscard]] const Tolerances& GetTolerances() const { return m_Tolerances; }
        [[nodiscard]] const std::vector<StepRecord>& GetSteps() const { return m_Steps; }
        [[nodiscard]] bool IsFailed() const { return m_Failed; }

    private:
        [[nodiscard]] Core::Result RunStep(std::string title, const Command& command);
        [[nodiscard]] Core::Result Record(std::string title, Core::Log::StringSink& sink, Core::Result outcome);

        Tolerances m_Tolerances;
        Geometry::Halfedge::Mesh m_Mesh;
        std::vector<StepRecord> m_Steps;
        bool m_Failed{false};
    };
}
