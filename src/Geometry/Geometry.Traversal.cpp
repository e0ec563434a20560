module;

#include <cstddef>
#include <expected>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

module Geometry:Traversal.Impl;

import Core;
import :Handle;
import :HalfedgeMesh;
import :Traversal;

namespace Geometry::Halfedge
{
    // =========================================================================
    // HalfedgeLoopIterator
    // =========================================================================

    HalfedgeLoopIterator::HalfedgeLoopIterator(const Mesh* mesh, std::optional<HalfedgeHandle> start, LoopKind kind,
                                               std::size_t limit, bool* corrupt)
        : m_Mesh(mesh), m_Kind(kind), m_Limit(limit), m_Corrupt(corrupt)
    {
        if (!start) return;

        if (!m_Mesh->Halfedges().Contains(*start))
        {
            Fail();
            return;
        }

        m_Start = *start;
        m_Current = *start;
        m_Steps = 0;
        m_Done = false;
    }

    std::optional<HalfedgeHandle> HalfedgeLoopIterator::Step() const
    {
        const auto& halfedges = m_Mesh->Halfedges();

        auto current = halfedges.Get(m_Current);
        if (!current) return std::nullopt;

        HalfedgeHandle next;
        switch (m_Kind)
        {
        case LoopKind::FaceCycle:
            next = (*current)->Next;
            break;
        case LoopKind::VertexRing:
        {
            auto twin = halfedges.Get((*current)->Twin);
            if (!twin) return std::nullopt;
            next = (*twin)->Next;
            break;
        }
        case LoopKind::EdgePair:
            next = (*current)->Twin;
            break;
        }

        if (!halfedges.Contains(next)) return std::nullopt;
        return next;
    }

    void HalfedgeLoopIterator::Fail()
    {
        if (m_Corrupt) *m_Corrupt = true;
        m_Done = true;
    }

    HalfedgeLoopIterator& HalfedgeLoopIterator::operator++()
    {
        if (m_Done) return *this;

        const auto next = Step();
        if (!next)
        {
            Fail();
            return *this;
        }

        if (*next == m_Start)
        {
            m_Done = true;
            return *this;
        }

        // A valid loop never revisits more halfedges than the mesh holds.
        if (++m_Steps >= m_Limit)
        {
            Fail();
            return *this;
        }

        m_Current = *next;
        return *this;
    }

    // =========================================================================
    // HalfedgeLoop
    // =========================================================================

    HalfedgeLoop::HalfedgeLoop(const Mesh& mesh, std::optional<HalfedgeHandle> start, LoopKind kind,
                               Core::ErrorCode startError)
        : m_Mesh(&mesh), m_Start(start), m_Kind(kind), m_StartError(startError)
    {
    }

    HalfedgeLoopIterator HalfedgeLoop::begin() const
    {
        m_Corrupt = false;
        if (m_StartError != Core::ErrorCode::Success) return {};
        return HalfedgeLoopIterator(m_Mesh, m_Start, m_Kind, m_Mesh->TraversalLimit(), &m_Corrupt);
    }

    Core::Result HalfedgeLoop::Status() const
    {
        if (m_StartError != Core::ErrorCode::Success) return Core::Err(m_StartError);
        if (m_Corrupt) return Core::Err(Core::ErrorCode::CorruptTopology);
        return Core::Ok();
    }

    // =========================================================================
    // Projections
    // =========================================================================

    std::optional<VertexHandle> FromVertexProjection::Apply(const Mesh& mesh, HalfedgeHandle h)
    {
        return mesh.FromVertex(h);
    }

    std::optional<VertexHandle> ToVertexProjection::Apply(const Mesh& mesh, HalfedgeHandle h)
    {
        const HalfedgeHandle twin = mesh.TwinHalfedge(h);
        if (!mesh.IsValid(twin)) return std::nullopt;
        return mesh.FromVertex(twin);
    }

    std::optional<FaceHandle> FaceProjection::Apply(const Mesh& mesh, HalfedgeHandle h)
    {
        return mesh.Face(h);
    }

    std::optional<FaceHandle> OppositeFaceProjection::Apply(const Mesh& mesh, HalfedgeHandle h)
    {
        const HalfedgeHandle twin = mesh.TwinHalfedge(h);
        if (!mesh.IsValid(twin)) return std::nullopt;
        return mesh.Face(twin);
    }

    // =========================================================================
    // Range factories
    // =========================================================================

    HalfedgeLoop FaceHalfedges(const Mesh& mesh, FaceHandle f)
    {
        auto face = mesh.Faces().Get(f);
        if (!face) return HalfedgeLoop(mesh, std::nullopt, LoopKind::FaceCycle, face.error());
        return HalfedgeLoop(mesh, (*face)->Halfedge, LoopKind::FaceCycle);
    }

    HalfedgeLoop VertexOutgoingHalfedges(const Mesh& mesh, VertexHandle v)
    {
        auto vertex = mesh.Vertices().Get(v);
        if (!vertex) return HalfedgeLoop(mesh, std::nullopt, LoopKind::VertexRing, vertex.error());
        return HalfedgeLoop(mesh, (*vertex)->Halfedge, LoopKind::VertexRing);
    }

    ProjectedLoop<FaceProjection> VertexFaces(const Mesh& mesh, VertexHandle v)
    {
        return ProjectedLoop<FaceProjection>(VertexOutgoingHalfedges(mesh, v));
    }

    ProjectedLoop<ToVertexProjection> VertexVertices(const Mesh& mesh, VertexHandle v)
    {
        return ProjectedLoop<ToVertexProjection>(VertexOutgoingHalfedges(mesh, v));
    }

    ProjectedLoop<FromVertexProjection> FaceVertices(const Mesh& mesh, FaceHandle f)
    {
        return ProjectedLoop<FromVertexProjection>(FaceHalfedges(mesh, f));
    }

    ProjectedLoop<OppositeFaceProjection> FaceFaces(const Mesh& mesh, FaceHandle f)
    {
        return ProjectedLoop<OppositeFaceProjection>(FaceHalfedges(mesh, f));
    }

    HalfedgeLoop EdgeHalfedges(const Mesh& mesh, HalfedgeHandle h)
    {
        if (auto rec = mesh.Halfedges().Get(h); !rec)
            return HalfedgeLoop(mesh, std::nullopt, LoopKind::EdgePair, rec.error());
        return HalfedgeLoop(mesh, h, LoopKind::EdgePair);
    }

    ProjectedLoop<FromVertexProjection> EdgeVertices(const Mesh& mesh, HalfedgeHandle h)
    {
        return ProjectedLoop<FromVertexProjection>(EdgeHalfedges(mesh, h));
    }

    ProjectedLoop<FaceProjection> EdgeFaces(const Mesh& mesh, HalfedgeHandle h)
    {
        return ProjectedLoop<FaceProjection>(EdgeHalfedges(mesh, h));
    }

    // =========================================================================
    // Boundary loops
    // =========================================================================
    //
    // Every boundary halfedge belongs to exactly one boundary cycle. Walk each
    // unvisited one with Next until it closes.

    Core::Expected<std::vector<BoundaryLoop>> FindBoundaryLoops(const Mesh& mesh)
    {
        std::vector<BoundaryLoop> loops;
        std::unordered_set<HalfedgeHandle> visited;

        for (const HalfedgeHandle h : mesh.Halfedges().Handles())
        {
            if (!mesh.IsBoundary(h) || visited.contains(h)) continue;

            HalfedgeLoop cycle(mesh, h, LoopKind::FaceCycle);
            BoundaryLoop loop;
            for (const HalfedgeHandle b : cycle)
            {
                if (!mesh.IsBoundary(b))
                {
                    Core::Log::Error("FindBoundaryLoops: boundary cycle from {} reaches face halfedge {}", h, b);
                    return Core::Err<std::vector<BoundaryLoop>>(Core::ErrorCode::CorruptTopology);
                }
                visited.insert(b);
                loop.Halfedges.push_back(b);
                loop.Vertices.push_back(mesh.FromVertex(b));
            }

            if (auto status = cycle.Status(); !status)
            {
                Core::Log::Error("FindBoundaryLoops: boundary cycle from {} does not close", h);
                return std::unexpected(status.error());
            }

            loops.push_back(std::move(loop));
        }

        return loops;
    }
}
