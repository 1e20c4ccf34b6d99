module;

#include <charconv>
#include <cmath>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

module Folding:Script.Impl;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;
import :StarBuilder;
import :Bend;
import :Reattach;
import :Relaxation;
import :Script;

namespace Folding
{
    using Core::ErrorCode;

    namespace
    {
        template <typename T>
        Core::Expected<T> ParseNumber(std::string_view token, std::string_view what)
        {
            T value{};
            const char* first = token.data();
            const char* last = token.data() + token.size();
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (token.empty() || ec != std::errc{} || ptr != last)
            {
                return Core::Err(ErrorCode::InvalidFormat, "{} \"{}\" is not a number", what, token);
            }
            if constexpr (std::is_floating_point_v<T>)
            {
                if (!std::isfinite(value))
                {
                    return Core::Err(ErrorCode::InvalidFormat, "{} \"{}\" is not finite", what, token);
                }
            }
            return value;
        }

        std::vector<std::string> ToStrings(std::span<const std::string_view> tokens)
        {
            return {tokens.begin(), tokens.end()};
        }

        Core::Expected<Command> ParseBend(std::span<const std::string_view> args)
        {
            if (args.size() < 3)
            {
                return Core::Err(ErrorCode::InvalidArgument, "bend needs an angle and at least two vertices");
            }
            auto angle = ParseNumber<double>(args[0], "bend angle");
            if (!angle) return std::unexpected(angle.error());
            return BendParams{*angle, ToStrings(args.subspan(1))};
        }

        Core::Expected<Command> ParseBend2(std::span<const std::string_view> args)
        {
            if (args.size() != 4)
            {
                return Core::Err(ErrorCode::InvalidArgument, "bend2 needs 4 arguments, got {}", args.size());
            }

            Bend2Params params;
            if (args[0] == "+")
            {
                params.Choice = Bend2Choice::Plus;
            }
            else if (args[0] == "-")
            {
                params.Choice = Bend2Choice::Minus;
            }
            else
            {
                return Core::Err(ErrorCode::InvalidArgument, "bend2 choice must be + or -, got \"{}\"", args[0]);
            }
            params.P = std::string(args[1]);
            params.Q = std::string(args[2]);
            params.R = std::string(args[3]);
            return params;
        }

        Core::Expected<Command> ParseReattach(std::span<const std::string_view> args)
        {
            if (args.size() != 2)
            {
                return Core::Err(ErrorCode::InvalidArgument, "reattach needs 2 arguments, got {}", args.size());
            }
            return ReattachParams{std::string(args[0]), std::string(args[1])};
        }

        Core::Expected<Command> ParseContract(std::span<const std::string_view> args)
        {
            if (args.size() != 1)
            {
                return Core::Err(ErrorCode::InvalidArgument, "contract needs 1 argument, got {}", args.size());
            }
            auto iterations = ParseNumber<long long>(args[0], "contract iteration count");
            if (!iterations) return std::unexpected(iterations.error());
            if (*iterations < 1)
            {
                return Core::Err(ErrorCode::OutOfRange, "contract needs at least one iteration, got {}", *iterations);
            }
            return ContractParams{static_cast<std::size_t>(*iterations)};
        }
    }

    // =========================================================================
    // Parsing
    // =========================================================================

    Core::Expected<Command> ParseCommand(std::string_view name, std::span<const std::string_view> args)
    {
        if (name == "bend") return ParseBend(args);
        if (name == "bend2") return ParseBend2(args);
        if (name == "reattach") return ParseReattach(args);
        if (name == "contract") return ParseContract(args);
        return Core::Err(ErrorCode::InvalidArgument, "unknown command \"{}\"", name);
    }

    Core::Expected<Command> ParseCommand(std::string_view line)
    {
        const std::vector<std::string_view> tokens = StarBuilder::Tokenize(line);
        if (tokens.empty())
        {
            return Core::Err(ErrorCode::InvalidFormat, "empty command");
        }
        return ParseCommand(tokens.front(), std::span<const std::string_view>(tokens).subspan(1));
    }

    Core::Expected<std::vector<ScriptStep>> ParseScript(std::string_view text)
    {
        std::vector<ScriptStep> steps;
        for (std::string_view line : StarBuilder::ContentLines(text))
        {
            auto command = ParseCommand(line);
            if (!command)
            {
                return Core::Err(command.error().Code, "step #{} \"{}\": {}", steps.size() + 1, line,
                                 command.error().Message);
            }
            steps.push_back({std::string(line), std::move(*command)});
        }
        return steps;
    }

    std::string_view CommandName(const Command& command)
    {
        return std::visit([](const auto& params) -> std::string_view {
            using T = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<T, BendParams>) return "bend";
            else if constexpr (std::is_same_v<T, Bend2Params>) return "bend2";
            else if constexpr (std::is_same_v<T, ReattachParams>) return "reattach";
            else return "contract";
        }, command);
    }

    // =========================================================================
    // Dispatch
    // =========================================================================

    Core::Result Apply(Geometry::Halfedge::Mesh& mesh, const Command& command, const Tolerances& tolerances,
                       Core::Log::Sink& trace)
    {
        return std::visit([&](const auto& params) -> Core::Result {
            using T = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<T, BendParams>)
            {
                auto r = Bend(mesh, params, tolerances, trace);
                if (!r) return std::unexpected(r.error());
            }
            else if constexpr (std::is_same_v<T, Bend2Params>)
            {
                auto r = Bend2(mesh, params, tolerances, trace);
                if (!r) return std::unexpected(r.error());
            }
            else if constexpr (std::is_same_v<T, ReattachParams>)
            {
                auto r = Reattach(mesh, params, tolerances, trace);
                if (!r) return std::unexpected(r.error());
            }
            else
            {
                auto r = Contract(mesh, params, tolerances, trace);
                if (!r) return std::unexpected(r.error());
            }
            return Core::Ok();
        }, command);
    }
}
