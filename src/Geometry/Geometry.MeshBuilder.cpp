module;

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Geometry:MeshBuilder.Impl;

import Core;
import :Handle;
import :HalfedgeMesh;
import :MeshBuilder;
import :Traversal;

namespace Geometry::Halfedge
{
    namespace
    {
        [[nodiscard]] std::uint64_t DirectedKey(std::uint32_t from, std::uint32_t to)
        {
            return (static_cast<std::uint64_t>(from) << 32) | to;
        }

        Core::Result ValidateFaces(std::size_t vertexCount, std::span<const std::vector<std::uint32_t>> faces)
        {
            std::unordered_set<std::uint32_t> seen;
            for (std::size_t fi = 0; fi < faces.size(); ++fi)
            {
                const auto& face = faces[fi];
                if (face.size() < 3)
                {
                    Core::Log::Warn("BuildMesh: face {} has only {} vertices", fi, face.size());
                    return Core::Err(Core::ErrorCode::DegenerateFace);
                }

                seen.clear();
                for (const std::uint32_t idx : face)
                {
                    if (idx >= vertexCount)
                    {
                        Core::Log::Warn("BuildMesh: face {} references vertex {} of {}", fi, idx, vertexCount);
                        return Core::Err(Core::ErrorCode::VertexIndexOutOfRange);
                    }
                    if (!seen.insert(idx).second)
                    {
                        Core::Log::Warn("BuildMesh: face {} repeats vertex {}", fi, idx);
                        return Core::Err(Core::ErrorCode::DegenerateFace);
                    }
                }
            }
            return Core::Ok();
        }
    }

    // =========================================================================
    // LinkResolver
    // =========================================================================

    Core::Expected<Mesh> LinkResolver::Resolve(std::span<const glm::vec3> positions,
                                               std::span<const std::vector<std::uint32_t>> faces,
                                               const BuildParams& params)
    {
        if (auto ok = ValidateFaces(positions.size(), faces); !ok) return std::unexpected(ok.error());

        std::size_t cornerCount = 0;
        for (const auto& face : faces) cornerCount += face.size();

        Mesh mesh;
        mesh.m_Vertices.Reserve(positions.size());
        mesh.m_Halfedges.Reserve(2 * cornerCount);
        mesh.m_Faces.Reserve(faces.size());

        std::vector<VertexHandle> vertices;
        vertices.reserve(positions.size());
        for (const glm::vec3& p : positions) vertices.push_back(mesh.NewVertex(p));

        // -----------------------------------------------------------------
        // Phase 1: face halfedges with placeholder links
        // -----------------------------------------------------------------
        std::unordered_map<std::uint64_t, HalfedgeHandle> directed;
        directed.reserve(cornerCount);

        std::vector<HalfedgeHandle> faceHalfedges;
        faceHalfedges.reserve(cornerCount);

        auto allocateHalfedge = [&mesh](VertexHandle origin) {
            const HalfedgeHandle h = mesh.m_Halfedges.Allocate(HalfedgeRecord{});
            mesh.m_Halfedges[h] = HalfedgeRecord{origin, h, h, h, std::nullopt};
            return h;
        };

        std::vector<HalfedgeHandle> ring;
        for (std::size_t fi = 0; fi < faces.size(); ++fi)
        {
            const auto& face = faces[fi];
            const std::size_t n = face.size();

            ring.clear();
            for (std::size_t i = 0; i < n; ++i)
            {
                const std::uint32_t from = face[i];
                const std::uint32_t to = face[(i + 1) % n];

                const HalfedgeHandle h = allocateHalfedge(vertices[from]);
                if (!directed.emplace(DirectedKey(from, to), h).second)
                {
                    Core::Log::Warn("BuildMesh: directed edge {} -> {} appears twice (face {})", from, to, fi);
                    return std::unexpected(Core::ErrorCode::NonManifoldEdge);
                }
                ring.push_back(h);
            }

            const FaceHandle f = mesh.NewFace(ring.front());
            for (std::size_t i = 0; i < n; ++i)
            {
                mesh.SetNextHalfedge(ring[i], ring[(i + 1) % n]);
                mesh.SetFace(ring[i], f);
            }
            faceHalfedges.insert(faceHalfedges.end(), ring.begin(), ring.end());
        }

        // -----------------------------------------------------------------
        // Phase 2: twins; unmatched halfedges get a boundary twin
        // -----------------------------------------------------------------
        std::unordered_map<VertexHandle, HalfedgeHandle> boundaryOut;
        std::vector<HalfedgeHandle> boundary;

        for (const auto& [key, h] : directed)
        {
            const auto from = static_cast<std::uint32_t>(key >> 32);
            const auto to = static_cast<std::uint32_t>(key & 0xffffffffu);

            if (const auto it = directed.find(DirectedKey(to, from)); it != directed.end())
            {
                mesh.SetTwins(h, it->second);
                continue;
            }

            const HalfedgeHandle b = allocateHalfedge(vertices[to]);
            mesh.SetTwins(h, b);
            boundary.push_back(b);

            if (!boundaryOut.emplace(vertices[to], b).second)
            {
                Core::Log::Warn("BuildMesh: vertex {} has more than one boundary gap", to);
                return std::unexpected(Core::ErrorCode::UnresolvedBoundary);
            }
        }

        // -----------------------------------------------------------------
        // Phase 3: chain boundary halfedges into loops
        // -----------------------------------------------------------------
        std::unordered_set<HalfedgeHandle> hasPrev;
        for (const HalfedgeHandle b : boundary)
        {
            const VertexHandle dest = mesh.ToVertex(b);
            const auto it = boundaryOut.find(dest);
            if (it == boundaryOut.end() || !hasPrev.insert(it->second).second)
            {
                Core::Log::Warn("BuildMesh: boundary chain through vertex {} cannot be closed", dest);
                return std::unexpected(Core::ErrorCode::UnresolvedBoundary);
            }
            mesh.SetNextHalfedge(b, it->second);
        }

        // -----------------------------------------------------------------
        // Phase 4: outgoing links, boundary halfedges preferred
        // -----------------------------------------------------------------
        std::unordered_map<VertexHandle, std::size_t> outgoingCount;
        for (const HalfedgeHandle h : faceHalfedges)
        {
            const VertexHandle v = mesh.FromVertex(h);
            if (!mesh.Halfedge(v)) mesh.SetHalfedge(v, h);
            ++outgoingCount[v];
        }
        for (const auto& [v, b] : boundaryOut)
        {
            mesh.SetHalfedge(v, b);
            ++outgoingCount[v];
        }

        // A single fan must reach every halfedge leaving the vertex; two
        // surfaces touching at a point produce two separate fans.
        const std::size_t limit = mesh.TraversalLimit();
        for (const auto& [v, expected] : outgoingCount)
        {
            const HalfedgeHandle start = *mesh.Halfedge(v);
            HalfedgeHandle h = start;
            std::size_t count = 0;
            do
            {
                ++count;
                h = mesh.CWRotatedHalfedge(h);
            } while (h != start && count <= limit);

            if (count != expected)
            {
                Core::Log::Warn("BuildMesh: vertex {} fan reaches {} of {} halfedges", v.Index, count, expected);
                return std::unexpected(Core::ErrorCode::NonManifoldVertex);
            }
        }

        if (params.ComputeFaceAttributes) mesh.UpdateAllFaceAttributes();

        Core::Log::Debug("BuildMesh: {} vertices, {} edges, {} faces, {} boundary halfedges", mesh.VertexCount(),
                         mesh.EdgeCount(), mesh.FaceCount(), boundary.size());

        return mesh;
    }

    Core::Expected<Mesh> BuildMesh(std::span<const glm::vec3> positions,
                                   std::span<const std::vector<std::uint32_t>> faces,
                                   const BuildParams& params)
    {
        return LinkResolver::Resolve(positions, faces, params);
    }

    Core::Expected<Mesh> BuildMesh(const PolygonSoup& soup, const BuildParams& params)
    {
        return LinkResolver::Resolve(soup.Positions, soup.Faces, params);
    }

    // =========================================================================
    // Export
    // =========================================================================

    Core::Expected<PolygonSoup> ToPolygonSoup(const Mesh& mesh)
    {
        PolygonSoup soup;
        soup.Positions.reserve(mesh.VertexCount());
        soup.Faces.reserve(mesh.FaceCount());

        std::unordered_map<VertexHandle, std::uint32_t> index;
        index.reserve(mesh.VertexCount());
        for (const VertexHandle v : mesh.Vertices().Handles())
        {
            index.emplace(v, static_cast<std::uint32_t>(soup.Positions.size()));
            soup.Positions.push_back(mesh.Position(v));
        }

        for (const FaceHandle f : mesh.Faces().Handles())
        {
            auto corners = Collect(FaceVertices(mesh, f));
            if (!corners) return std::unexpected(corners.error());

            std::vector<std::uint32_t> face;
            face.reserve(corners->size());
            for (const VertexHandle v : *corners)
            {
                const auto it = index.find(v);
                if (it == index.end()) return std::unexpected(Core::ErrorCode::DanglingHandle);
                face.push_back(it->second);
            }
            soup.Faces.push_back(std::move(face));
        }

        return soup;
    }
}
