module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where the caller MUST
    //                          handle failure:
    //                          - Building a mesh from a polygon soup
    //                          - Topology edits whose preconditions can fail
    //                          - Checked handle lookups
    //
    // 2. std::optional<T>    - For QUERIES where "absent" is a valid outcome:
    //                          - The face of a boundary halfedge
    //                          - The outgoing halfedge of an isolated vertex
    //                          - Searching for an edge between two vertices
    //
    // 3. Assertions          - For INVARIANTS on unchecked hot-path accessors.
    //                          If violated, indicates a bug, not a runtime error.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Input errors (100-199): raised while resolving a polygon soup.
        NonManifoldEdge = 100,
        NonManifoldVertex = 101,     // a vertex fan misses some of its faces (surfaces touching at a point)
        DegenerateFace = 102,        // fewer than three indices, or a repeated index
        UnresolvedBoundary = 103,
        VertexIndexOutOfRange = 104, // face index >= number of positions

        // Topology-safety errors (200-299): an edit was rejected before touching any link.
        CollapseWouldCreateNonManifold = 200,
        FlipRequiresTriangles = 201,
        FlipWouldDuplicateEdge = 202,
        BoundaryEdgeUnsupported = 203,
        VertexStillReferenced = 204,
        OperationWouldCreateDegenerateFace = 205,

        // Internal consistency errors (300-399): link maintenance is broken.
        DanglingHandle = 300,
        CorruptTopology = 301,

        // Generic
        InvalidArgument = 900,
        Unknown = 999
    };

    enum class ErrorCategory : uint8_t
    {
        None,
        Input,
        TopologySafety,
        InternalConsistency,
        Generic
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                            return "Success";
            case ErrorCode::NonManifoldEdge:                    return "NonManifoldEdge";
            case ErrorCode::NonManifoldVertex:                  return "NonManifoldVertex";
            case ErrorCode::DegenerateFace:                     return "DegenerateFace";
            case ErrorCode::UnresolvedBoundary:                 return "UnresolvedBoundary";
            case ErrorCode::VertexIndexOutOfRange:              return "VertexIndexOutOfRange";
            case ErrorCode::CollapseWouldCreateNonManifold:     return "CollapseWouldCreateNonManifold";
            case ErrorCode::FlipRequiresTriangles:              return "FlipRequiresTriangles";
            case ErrorCode::FlipWouldDuplicateEdge:             return "FlipWouldDuplicateEdge";
            case ErrorCode::BoundaryEdgeUnsupported:            return "BoundaryEdgeUnsupported";
            case ErrorCode::VertexStillReferenced:              return "VertexStillReferenced";
            case ErrorCode::OperationWouldCreateDegenerateFace: return "OperationWouldCreateDegenerateFace";
            case ErrorCode::DanglingHandle:                     return "DanglingHandle";
            case ErrorCode::CorruptTopology:                    return "CorruptTopology";
            case ErrorCode::InvalidArgument:                    return "InvalidArgument";
            default:                                            return "Unknown";
        }
    }

    constexpr ErrorCategory CategoryOf(ErrorCode code)
    {
        const auto value = static_cast<uint32_t>(code);
        if (value == 0) return ErrorCategory::None;
        if (value >= 100 && value < 200) return ErrorCategory::Input;
        if (value >= 200 && value < 300) return ErrorCategory::TopologySafety;
        if (value >= 300 && value < 400) return ErrorCategory::InternalConsistency;
        return ErrorCategory::Generic;
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
