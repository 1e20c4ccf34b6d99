module;

#include <array>
#include <optional>
#include <span>
#include <string_view>

module Folding:Examples.Impl;

import :Examples;

namespace Folding::Examples
{
    namespace
    {
        constexpr std::string_view kThurstonSetup = R"(
a 11
b 10
c 10 9
d 9 8
e 7
f 6 6
g 5
h 4 4
i 4 3
j 2 2
k 1 12 12
)";

        constexpr std::string_view kThurstonTransform = R"(
reattach j i
reattach i k
reattach b c
reattach e d
reattach j.1 a
bend2 + k a b.0
bend2 + k c d
bend2 + e.0 b j.1
bend2 + k d f
// bend2 + j.1 k h
bend2 + f g h
bend2 + e f k
// bend2 + i.0 h f
reattach k h
// bend2 + j.0 h i.0
reattach i.0 h
bend2 + h k j.1
reattach j.0 h
)";

        constexpr std::string_view kIcosahedronSetup = R"(
a 9 8
b 7
c 6
d 5
e 4
f 3
g 2
h 1
i 12
j 11
k 10
)";

        constexpr std::string_view kIcosahedronTransform = R"(
reattach k a
reattach i j
reattach j a
reattach k b
reattach e d
reattach i.0 h
reattach g f

// At this point the icosahedron faces are "reunited".
// Now add edges to separate them from one another.

// The dihedral angle of an icosahedron is 138.2 deg, so the
// bending angle is 180 - 138.2 = 41.8 deg = 0.729 rad.
// (A slightly smaller angle such as 0.68 gives a
// "sliced icosahedron".)
bend .729 k.1 c
bend .729 c e.0
bend .729 b c
bend .729 c d

bend .729 g.1 i.0.0
bend .729 g.1 h
bend .729 h j.0
bend .729 h a
bend .729 f h

bend .729 i.1 k.0
bend .729 j.1 k.0
bend .729 j.1 b
bend .729 a b
bend .729 e.1 g.0
bend .729 e.1 f
bend .729 d f

bend .729 b d
bend .729 f a
bend .729 a d

// Pull the sheet shut and glue the seams.
contract 200
)";

        constexpr std::array kExamples{
            Example{"thurston", "Thurston",
                    "From https://arxiv.org/pdf/math/9801088, Figure 15;\n"
                    "see also https://mathstodon.xyz/@johncarlosbaez/113369111554515465",
                    kThurstonSetup, kThurstonTransform},
            Example{"icosahedron", "Icosahedron",
                    "From https://mathstodon.xyz/@GerardWestendorp/113374197385229562",
                    kIcosahedronSetup, kIcosahedronTransform},
            Example{"empty", "Empty", "Define your own star and folding.", "a", ""},
        };
    }

    std::span<const Example> All()
    {
        return kExamples;
    }

    std::optional<Example> Find(std::string_view name)
    {
        for (const Example& example : kExamples)
        {
            if (example.Name == name) return example;
        }
        return std::nullopt;
    }
}
