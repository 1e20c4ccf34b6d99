#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

import Core.Error;
import Core.Logging;
import Folding;

using namespace Core;

namespace
{
    constexpr std::string_view kUsage =
        "usage: starfold [options]\n"
        "  --example <name>            run a built-in example (default: thurston)\n"
        "  --polygon <file>            read the star definition from a file\n"
        "  --script <file>             read the operation script from a file\n"
        "  --steps <k>                 stop after k script steps\n"
        "  --verbose                   print the trace of every step\n"
        "  --snapshot                  print the final mesh\n"
        "  --list                      list the built-in examples\n"
        "  --coincidence <x>           coincidence / flatness tolerance\n"
        "  --peer-length <x>           allowed peer length difference\n"
        "  --closure <x>               allowed squared closing offset of the outline\n"
        "  --neighborhood-limit <n>    bound on vertex and loop walks\n";

    struct Options
    {
        std::string Example{"thurston"};
        std::optional<std::string> PolygonFile;
        std::optional<std::string> ScriptFile;
        std::optional<std::size_t> Steps;
        bool Verbose{false};
        bool Snapshot{false};
        bool List{false};
        bool Help{false};
        Folding::Tolerances Tolerances;
    };

    template <typename T>
    Expected<T> ParseValue(std::string_view flag, std::string_view text)
    {
        T value{};
        const char* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), last, value);
        if (text.empty() || ec != std::errc{} || ptr != last)
        {
            return Err(ErrorCode::InvalidArgument, "{}: invalid value \"{}\"", flag, text);
        }
        return value;
    }

    Expected<Options> ParseOptions(int argc, char** argv)
    {
        Options options;
        const std::vector<std::string_view> args(argv + 1, argv + argc);

        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string_view flag = args[i];

            if (flag == "--verbose") { options.Verbose = true; continue; }
            if (flag == "--snapshot") { options.Snapshot = true; continue; }
            if (flag == "--list") { options.List = true; continue; }
            if (flag == "--help" || flag == "-h") { options.Help = true; continue; }

            if (i + 1 >= args.size())
            {
                return Err(ErrorCode::InvalidArgument, "unknown option or missing value: {}", flag);
            }
            const std::string_view value = args[++i];

            if (flag == "--example")
            {
                options.Example = std::string(value);
            }
            else if (flag == "--polygon")
            {
                options.PolygonFile = std::string(value);
            }
            else if (flag == "--script")
            {
                options.ScriptFile = std::string(value);
            }
            else if (flag == "--steps")
            {
                auto steps = ParseValue<std::size_t>(flag, value);
                if (!steps) return std::unexpected(steps.error());
                options.Steps = *steps;
            }
            else if (flag == "--coincidence")
            {
                auto x = ParseValue<double>(flag, value);
                if (!x) return std::unexpected(x.error());
                options.Tolerances.Coincidence = *x;
            }
            else if (flag == "--peer-length")
            {
                auto x = ParseValue<double>(flag, value);
                if (!x) return std::unexpected(x.error());
                options.Tolerances.PeerLength = *x;
            }
            else if (flag == "--closure")
            {
                auto x = ParseValue<double>(flag, value);
                if (!x) return std::unexpected(x.error());
                options.Tolerances.PolygonClosure = *x;
            }
            else if (flag == "--neighborhood-limit")
            {
                auto n = ParseValue<std::size_t>(flag, value);
                if (!n) return std::unexpected(n.error());
                options.Tolerances.NeighborhoodLimit = *n;
            }
            else
            {
                return Err(ErrorCode::InvalidArgument, "unknown option: {}", flag);
            }
        }
        return options;
    }

    Expected<std::string> ReadFile(const std::string& path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            return Err(ErrorCode::FileNotFound, "cannot open {}", path);
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        if (file.bad())
        {
            return Err(ErrorCode::FileReadError, "failed reading {}", path);
        }
        return contents.str();
    }

    void ListExamples()
    {
        for (const Folding::Examples::Example& example : Folding::Examples::All())
        {
            std::cout << std::format("{:12} {}\n", example.Name, example.Label);
            std::cout << std::format("{:12} {}\n", "", example.Info);
        }
    }

    void PrintSteps(const Folding::Session& session)
    {
        const auto& steps = session.GetSteps();
        for (std::size_t i = 0; i < steps.size(); ++i)
        {
            std::cout << std::format("===== #{} {}\n{}", i, steps[i].Title, steps[i].Trace);
        }
    }
}

int main(int argc, char** argv)
{
    auto options = ParseOptions(argc, argv);
    if (!options)
    {
        Log::Error("{}", options.error().Message);
        std::cerr << kUsage;
        return EXIT_FAILURE;
    }
    if (options->Help)
    {
        std::cout << kUsage;
        return EXIT_SUCCESS;
    }
    if (options->List)
    {
        ListExamples();
        return EXIT_SUCCESS;
    }

    std::string setup;
    std::string transform;
    if (!options->PolygonFile || !options->ScriptFile)
    {
        const auto example = Folding::Examples::Find(options->Example);
        if (!example)
        {
            Log::Error("unknown example \"{}\" (try --list)", options->Example);
            return EXIT_FAILURE;
        }
        setup = std::string(example->Setup);
        transform = std::string(example->Transform);
    }
    if (options->PolygonFile)
    {
        auto text = ReadFile(*options->PolygonFile);
        if (!text)
        {
            Log::Error("{}", text.error().Message);
            return EXIT_FAILURE;
        }
        setup = std::move(*text);
    }
    if (options->ScriptFile)
    {
        auto text = ReadFile(*options->ScriptFile);
        if (!text)
        {
            Log::Error("{}", text.error().Message);
            return EXIT_FAILURE;
        }
        transform = std::move(*text);
    }

    Folding::Session session(options->Tolerances);

    auto ready = session.Setup(setup);
    std::optional<std::size_t> executed;
    if (ready)
    {
        auto ran = options->Steps ? session.RunScript(transform, *options->Steps) : session.RunScript(transform);
        if (ran) executed = *ran;
    }

    if (options->Verbose) PrintSteps(session);

    const auto& steps = session.GetSteps();
    if (executed)
    {
        Log::Info("{} steps succeeded", *executed);
    }
    else
    {
        const std::size_t failed = steps.empty() ? 0 : steps.size() - 1;
        const std::string reason = steps.empty() || !steps.back().Failure ? std::string("setup failed")
                                                                          : steps.back().Failure->Message;
        Log::Error("Failure at step #{}: {}", failed, reason);
    }

    if (options->Snapshot)
    {
        auto snapshot = session.Snapshot();
        if (!snapshot)
        {
            Log::Error("snapshot failed: {}", snapshot.error().Message);
            return EXIT_FAILURE;
        }
        std::cout << Folding::FormatSnapshot(*snapshot);
    }

    const auto& mesh = session.GetMesh();
    Log::Info("mesh: {} vertices, {} edges, {} faces, {}", mesh.VertexCount(), mesh.EdgeCount(), mesh.FaceCount(),
              mesh.HasBoundary() ? "open" : "closed");

    return executed ? EXIT_SUCCESS : EXIT_FAILURE;
}
