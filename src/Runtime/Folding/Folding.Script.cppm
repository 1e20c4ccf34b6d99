module;

#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

export module Folding:Script;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;
import :Bend;
import :Reattach;
import :Relaxation;

export namespace Folding
{
    // =========================================================================
    // Operation script
    // =========================================================================
    //
    //   bend <angle> <v1> <v2> [<v3> ...]
    //   bend2 <+|-> <p> <q> <r>
    //   reattach <p> <q>
    //   contract <iterations>
    //
    // One command per line; blank lines and lines starting with "//" or "#"
    // are skipped. Numbers must parse completely.

    using Command = std::variant<BendParams, Bend2Params, ReattachParams, ContractParams>;

    struct ScriptStep
    {
        std::string Text;   // the trimmed source line
        Command Operation;
    };

    [[nodiscard]] Core::Expected<Command> ParseCommand(std::string_view name, std::span<const std::string_view> args);
    [[nodiscard]] Core::Expected<Command> ParseCommand(std::string_view line);

    // Fails on the first malformed line, naming its 1-based command index.
    [[nodiscard]] Core::Expected<std::vector<ScriptStep>> ParseScript(std::string_view text);

    [[nodiscard]] std::string_view CommandName(const Command& command);

    // Runs one command against the mesh.
    [[nodiscard]] Core::Result Apply(Geometry::Halfedge::Mesh& mesh, const Command& command,
                                     const Tolerances& tolerances, Core::Log::Sink& trace);
}
