module;

#include <cstdint>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Geometry:MeshBuilder;

import Core;
import :Handle;
import :HalfedgeMesh;

export namespace Geometry::Halfedge
{
    // Indexed face list: Faces[i] lists the vertex indices of face i in
    // counter-clockwise order.
    struct PolygonSoup
    {
        std::vector<glm::vec3> Positions;
        std::vector<std::vector<std::uint32_t>> Faces;
    };

    struct BuildParams
    {
        // Cache normal and centroid on every face; operators keep them current.
        bool ComputeFaceAttributes{true};
    };

    // Resolves a polygon soup into a linked Mesh in two phases: every record is
    // allocated with self-referencing placeholder links, then every link is
    // patched exactly once. Non-manifold or inconsistently oriented input is
    // rejected; no partially linked Mesh is ever returned.
    class LinkResolver
    {
    public:
        [[nodiscard]] static Core::Expected<Mesh> Resolve(std::span<const glm::vec3> positions,
                                                          std::span<const std::vector<std::uint32_t>> faces,
                                                          const BuildParams& params);
    };

    [[nodiscard]] Core::Expected<Mesh> BuildMesh(std::span<const glm::vec3> positions,
                                                 std::span<const std::vector<std::uint32_t>> faces,
                                                 const BuildParams& params = {});

    [[nodiscard]] Core::Expected<Mesh> BuildMesh(const PolygonSoup& soup, const BuildParams& params = {});

    // Live vertices are renumbered densely in store order. Fails if a face
    // cycle cannot be walked.
    [[nodiscard]] Core::Expected<PolygonSoup> ToPolygonSoup(const Mesh& mesh);
}
