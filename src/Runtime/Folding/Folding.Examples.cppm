module;

#include <optional>
#include <span>
#include <string_view>

export module Folding:Examples;

export namespace Folding::Examples
{
    // A star definition together with the script that folds it.
    struct Example
    {
        std::string_view Name;
        std::string_view Label;
        std::string_view Info;
        std::string_view Setup;
        std::string_view Transform;
    };

    [[nodiscard]] std::span<const Example> All();

    [[nodiscard]] std::optional<Example> Find(std::string_view name);
}
