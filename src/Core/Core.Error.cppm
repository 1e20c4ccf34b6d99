module;

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

export module Core.Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. Expected<T>         - For FALLIBLE operations. Every kernel primitive and
    //                          every folding operator returns one. The error
    //                          carries a code for control flow and a message
    //                          naming the vertices/loops involved.
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome
    //                          (name lookup, halfedge search between vertices).
    //
    // 3. Assertions          - For programmer errors only (handle out of range).
    //                          Precondition failures of mesh edits are runtime
    //                          errors and go through Expected.
    //
    // A failed operation leaves the mesh in its partial state. Callers record
    // the failure and re-run from scratch; nothing is rolled back or retried.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,
        OutOfRange = 303,

        // Folding errors (700-799)
        DuplicateName = 700,
        NameNotFound = 701,
        NotUnique = 702,
        NotBoundaryAdjacent = 703,
        PeerMismatch = 704,
        TopologyViolation = 705,
        InvariantViolation = 706,
        NotFlat = 707,
        NotCoplanar = 708,
        NotTriangulated = 709,
        NegativeDiscriminant = 710,
        DegenerateGeometry = 711,
        AlignmentFailed = 712,
        OverlappingParts = 713,
        PolygonNotClosed = 714,
        NeighborhoodTooLarge = 715,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:              return "Success";
            case ErrorCode::FileNotFound:         return "FileNotFound";
            case ErrorCode::FileReadError:        return "FileReadError";
            case ErrorCode::InvalidArgument:      return "InvalidArgument";
            case ErrorCode::InvalidState:         return "InvalidState";
            case ErrorCode::InvalidFormat:        return "InvalidFormat";
            case ErrorCode::OutOfRange:           return "OutOfRange";
            case ErrorCode::DuplicateName:        return "DuplicateName";
            case ErrorCode::NameNotFound:         return "NameNotFound";
            case ErrorCode::NotUnique:            return "NotUnique";
            case ErrorCode::NotBoundaryAdjacent:  return "NotBoundaryAdjacent";
            case ErrorCode::PeerMismatch:         return "PeerMismatch";
            case ErrorCode::TopologyViolation:    return "TopologyViolation";
            case ErrorCode::InvariantViolation:   return "InvariantViolation";
            case ErrorCode::NotFlat:              return "NotFlat";
            case ErrorCode::NotCoplanar:          return "NotCoplanar";
            case ErrorCode::NotTriangulated:      return "NotTriangulated";
            case ErrorCode::NegativeDiscriminant: return "NegativeDiscriminant";
            case ErrorCode::DegenerateGeometry:   return "DegenerateGeometry";
            case ErrorCode::AlignmentFailed:      return "AlignmentFailed";
            case ErrorCode::OverlappingParts:     return "OverlappingParts";
            case ErrorCode::PolygonNotClosed:     return "PolygonNotClosed";
            case ErrorCode::NeighborhoodTooLarge: return "NeighborhoodTooLarge";
            default:                              return "Unknown";
        }
    }

    struct Error
    {
        ErrorCode Code{ErrorCode::Unknown};
        std::string Message;
    };

    template<typename T>
    using Expected = std::expected<T, Error>;

    // Helper to create success result
    template<typename T>
    Expected<std::decay_t<T>> Ok(T&& value)
    {
        return Expected<std::decay_t<T>>(std::forward<T>(value));
    }

    // Helper to create error result. Converts to any Expected<T>.
    template<typename... Args>
    [[nodiscard]] std::unexpected<Error> Err(ErrorCode code, std::format_string<Args...> fmt, Args&&... args)
    {
        return std::unexpected(Error{code, std::format(fmt, std::forward<Args>(args)...)});
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    inline Result Ok()
    {
        return Result(unit);
    }
}
