module;

#include <span>

export module Geometry:Validation;

import Core;
import :Handle;
import :HalfedgeMesh;

export namespace Geometry::Halfedge
{
    // Full structural check of the link graph. Returns the first violation:
    // DanglingHandle when a link names a freed record, CorruptTopology for any
    // other broken invariant. The violation is logged at Error level.
    [[nodiscard]] Core::Result ValidateTopology(const Mesh& mesh);

    // Same per-halfedge checks restricted to the rings of the given vertices
    // and the faces incident to them. Freed vertices in the list are skipped.
    [[nodiscard]] Core::Result ValidateNeighborhood(const Mesh& mesh, std::span<const VertexHandle> vertices);
}
