module;

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <unordered_set>

module Geometry:Validation.Impl;

import Core;
import :Handle;
import :HalfedgeMesh;
import :Validation;

namespace Geometry::Halfedge
{
    namespace
    {
        Core::Result Violation(Core::ErrorCode code, const char* what, std::uint32_t index)
        {
            Core::Log::Error("Topology validation failed ({}): {} at index {}",
                             Core::ErrorCodeToString(code), what, index);
            return Core::Err(code);
        }

        Core::Result Dangling(const char* what, std::uint32_t index)
        {
            return Violation(Core::ErrorCode::DanglingHandle, what, index);
        }

        Core::Result Corrupt(const char* what, std::uint32_t index)
        {
            return Violation(Core::ErrorCode::CorruptTopology, what, index);
        }

        // -----------------------------------------------------------------
        // Per-halfedge invariants
        // -----------------------------------------------------------------
        Core::Result CheckHalfedge(const Mesh& mesh, HalfedgeHandle h)
        {
            const auto& halfedges = mesh.Halfedges();

            auto rec = halfedges.Get(h);
            if (!rec) return Dangling("halfedge", h.Index);
            const HalfedgeRecord& r = **rec;

            if (!mesh.IsValid(r.Origin)) return Dangling("halfedge origin", h.Index);
            if (!mesh.IsValid(r.Twin)) return Dangling("halfedge twin", h.Index);
            if (!mesh.IsValid(r.Next)) return Dangling("halfedge next", h.Index);
            if (!mesh.IsValid(r.Prev)) return Dangling("halfedge prev", h.Index);
            if (r.Face && !mesh.IsValid(*r.Face)) return Dangling("halfedge face", h.Index);

            if (r.Twin == h) return Corrupt("halfedge is its own twin", h.Index);
            if (mesh.TwinHalfedge(r.Twin) != h) return Corrupt("twin(twin(h)) != h", h.Index);
            if (mesh.FromVertex(r.Twin) == r.Origin) return Corrupt("edge joins a vertex to itself", h.Index);

            if (mesh.PrevHalfedge(r.Next) != h) return Corrupt("prev(next(h)) != h", h.Index);
            if (mesh.NextHalfedge(r.Prev) != h) return Corrupt("next(prev(h)) != h", h.Index);

            if (mesh.FromVertex(r.Next) != mesh.FromVertex(r.Twin))
                return Corrupt("origin(next(h)) != destination(h)", h.Index);

            if (mesh.Face(r.Next) != r.Face) return Corrupt("face differs along next", h.Index);

            return Core::Ok();
        }

        // -----------------------------------------------------------------
        // Face cycle: closes, every member names the face, length >= 3
        // -----------------------------------------------------------------
        Core::Result CheckFace(const Mesh& mesh, FaceHandle f)
        {
            auto rec = mesh.Faces().Get(f);
            if (!rec) return Dangling("face", f.Index);

            const HalfedgeHandle start = (*rec)->Halfedge;
            if (!mesh.IsValid(start)) return Dangling("face halfedge", f.Index);
            if (mesh.Face(start) != f) return Corrupt("face halfedge belongs to another face", f.Index);

            const std::size_t limit = mesh.TraversalLimit();
            std::size_t count = 0;
            HalfedgeHandle h = start;
            do
            {
                if (auto ok = CheckHalfedge(mesh, h); !ok) return ok;
                if (mesh.Face(h) != f) return Corrupt("face cycle leaves the face", f.Index);
                h = mesh.NextHalfedge(h);
                if (++count > limit) return Corrupt("face cycle does not close", f.Index);
            } while (h != start);

            if (count < 3) return Corrupt("face with fewer than three sides", f.Index);
            return Core::Ok();
        }

        // -----------------------------------------------------------------
        // Vertex ring: closes, every member originates at the vertex.
        // Returns the ring length through ringSize.
        // -----------------------------------------------------------------
        Core::Result CheckVertex(const Mesh& mesh, VertexHandle v, std::size_t& ringSize)
        {
            ringSize = 0;

            auto rec = mesh.Vertices().Get(v);
            if (!rec) return Dangling("vertex", v.Index);

            const auto start = (*rec)->Halfedge;
            if (!start) return Core::Ok();
            if (!mesh.IsValid(*start)) return Dangling("vertex halfedge", v.Index);

            const std::size_t limit = mesh.TraversalLimit();
            HalfedgeHandle h = *start;
            do
            {
                if (auto ok = CheckHalfedge(mesh, h); !ok) return ok;
                if (mesh.FromVertex(h) != v) return Corrupt("vertex ring member does not originate at vertex", v.Index);
                h = mesh.CWRotatedHalfedge(h);
                if (++ringSize > limit) return Corrupt("vertex ring does not close", v.Index);
            } while (h != *start);

            return Core::Ok();
        }
    }

    Core::Result ValidateTopology(const Mesh& mesh)
    {
        if (mesh.HalfedgeCount() % 2 != 0) return Corrupt("odd halfedge count", 0);

        // Directed edge uniqueness and per-vertex outgoing counts.
        std::unordered_set<std::uint64_t> directed;
        std::unordered_map<VertexHandle, std::size_t> outgoing;
        directed.reserve(mesh.HalfedgeCount());

        for (const HalfedgeHandle h : mesh.Halfedges().Handles())
        {
            if (auto ok = CheckHalfedge(mesh, h); !ok) return ok;

            const VertexHandle a = mesh.FromVertex(h);
            const VertexHandle b = mesh.ToVertex(h);
            const std::uint64_t key = (static_cast<std::uint64_t>(a.Index) << 32) | b.Index;
            if (!directed.insert(key).second) return Corrupt("duplicate directed edge", h.Index);

            ++outgoing[a];
        }

        for (const FaceHandle f : mesh.Faces().Handles())
        {
            if (auto ok = CheckFace(mesh, f); !ok) return ok;
        }

        for (const VertexHandle v : mesh.Vertices().Handles())
        {
            std::size_t ringSize = 0;
            if (auto ok = CheckVertex(mesh, v, ringSize); !ok) return ok;

            const auto it = outgoing.find(v);
            const std::size_t expected = it == outgoing.end() ? 0 : it->second;
            if (ringSize != expected) return Corrupt("vertex ring misses outgoing halfedges", v.Index);
        }

        return Core::Ok();
    }

    Core::Result ValidateNeighborhood(const Mesh& mesh, std::span<const VertexHandle> vertices)
    {
        std::unordered_set<FaceHandle> faces;

        for (const VertexHandle v : vertices)
        {
            if (!mesh.IsValid(v)) continue;

            std::size_t ringSize = 0;
            if (auto ok = CheckVertex(mesh, v, ringSize); !ok) return ok;

            const auto start = mesh.Halfedge(v);
            if (!start) continue;

            HalfedgeHandle h = *start;
            do
            {
                if (auto f = mesh.Face(h)) faces.insert(*f);
                if (auto f = mesh.Face(mesh.TwinHalfedge(h))) faces.insert(*f);
                h = mesh.CWRotatedHalfedge(h);
            } while (h != *start);
        }

        for (const FaceHandle f : faces)
        {
            if (auto ok = CheckFace(mesh, f); !ok) return ok;
        }

        return Core::Ok();
    }
}
