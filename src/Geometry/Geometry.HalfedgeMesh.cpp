module;

#include <cassert>
#include <cmath>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

module Geometry:HalfedgeMesh.Impl;

import Core;
import :Handle;
import :HalfedgeMesh;
import :Validation;

namespace Geometry::Halfedge
{
    namespace
    {
        // Minimum signed distance for a point to count as strictly in front of a face.
        constexpr float kVisibilityEpsilon = 1e-7f;
    }

    Mesh::Mesh() = default;
    Mesh::Mesh(const Mesh& rhs) = default;
    Mesh::~Mesh() = default;
    Mesh& Mesh::operator=(const Mesh& rhs) = default;

    void Mesh::Clear()
    {
        m_Vertices.Clear();
        m_Halfedges.Clear();
        m_Faces.Clear();
    }

    VertexHandle Mesh::AddVertex(glm::vec3 position)
    {
        return NewVertex(position);
    }

    // =========================================================================
    // Allocation
    // =========================================================================

    VertexHandle Mesh::NewVertex(glm::vec3 position)
    {
        return m_Vertices.Allocate(VertexRecord{position, std::nullopt});
    }

    HalfedgeHandle Mesh::NewEdge(VertexHandle start, VertexHandle end)
    {
        assert(start != end);

        const HalfedgeHandle h0 = m_Halfedges.Allocate(HalfedgeRecord{});
        const HalfedgeHandle h1 = m_Halfedges.Allocate(HalfedgeRecord{});

        // Self-loops until the caller links the pair into cycles.
        m_Halfedges[h0] = HalfedgeRecord{start, h1, h0, h0, std::nullopt};
        m_Halfedges[h1] = HalfedgeRecord{end, h0, h1, h1, std::nullopt};

        return h0;
    }

    FaceHandle Mesh::NewFace(HalfedgeHandle h)
    {
        return m_Faces.Allocate(FaceRecord{h, std::nullopt});
    }

    void Mesh::FreeEdge(HalfedgeHandle h)
    {
        const HalfedgeHandle t = TwinHalfedge(h);
        FreeHalfedge(t);
        FreeHalfedge(h);
    }

    void Mesh::FreeHalfedge(HalfedgeHandle h)
    {
        if (auto ok = m_Halfedges.Free(h); !ok)
            Core::Log::Error("FreeHalfedge: halfedge {} already freed", h);
    }

    void Mesh::FreeFace(FaceHandle f)
    {
        if (auto ok = m_Faces.Free(f); !ok)
            Core::Log::Error("FreeFace: face {} already freed", f);
    }

    void Mesh::FreeVertex(VertexHandle v)
    {
        if (auto ok = m_Vertices.Free(v); !ok)
            Core::Log::Error("FreeVertex: vertex {} already freed", v);
    }

    // =========================================================================
    // Link maintenance
    // =========================================================================

    void Mesh::SetNextHalfedge(HalfedgeHandle h, HalfedgeHandle next)
    {
        m_Halfedges[h].Next = next;
        m_Halfedges[next].Prev = h;
    }

    void Mesh::SetTwins(HalfedgeHandle a, HalfedgeHandle b)
    {
        m_Halfedges[a].Twin = b;
        m_Halfedges[b].Twin = a;
    }

    // Keep a boundary halfedge as the outgoing link of a boundary vertex, so that
    // IsBoundary(v) stays a constant-time check.
    void Mesh::AdjustOutgoingHalfedge(VertexHandle v)
    {
        const auto start = Halfedge(v);
        if (!start) return;

        const std::size_t maxIter = TraversalLimit();
        std::size_t iter = 0;
        HalfedgeHandle h = *start;
        do
        {
            if (IsBoundary(h))
            {
                SetHalfedge(v, h);
                return;
            }
            h = CWRotatedHalfedge(h);
            if (++iter > maxIter) return; // safety: broken connectivity
        } while (h != *start);
    }

    Core::Result Mesh::VerifyNeighborhood(std::span<const VertexHandle> vertices, const char* operation) const
    {
        if (auto ok = ValidateNeighborhood(*this, vertices); !ok)
        {
            Core::Log::Error("{}: neighborhood failed validation after edit ({})", operation,
                             Core::ErrorCodeToString(ok.error()));
            return Core::Err(Core::ErrorCode::CorruptTopology);
        }
        return Core::Ok();
    }

    // =========================================================================
    // Predicates
    // =========================================================================

    bool Mesh::IsBoundary(VertexHandle v) const
    {
        const auto h = Halfedge(v);
        return !h || IsBoundary(*h);
    }

    bool Mesh::IsBoundary(FaceHandle f) const
    {
        const HalfedgeHandle start = Halfedge(f);
        const std::size_t maxIter = TraversalLimit();
        std::size_t iter = 0;
        HalfedgeHandle h = start;
        do
        {
            if (IsBoundary(TwinHalfedge(h))) return true;
            h = NextHalfedge(h);
            if (++iter > maxIter) break;
        } while (h != start);
        return false;
    }

    bool Mesh::IsManifold(VertexHandle v) const
    {
        int gaps = 0;
        const auto start = Halfedge(v);
        if (start)
        {
            const std::size_t maxIter = TraversalLimit();
            std::size_t iter = 0;
            HalfedgeHandle h = *start;
            do
            {
                if (IsBoundary(h)) ++gaps;
                h = CWRotatedHalfedge(h);
                if (++iter > maxIter) return false;
            } while (h != *start);
        }
        return gaps < 2;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<HalfedgeHandle> Mesh::FindHalfedge(VertexHandle start, VertexHandle end) const
    {
        assert(IsValid(start) && IsValid(end));

        const auto first = Halfedge(start);
        if (!first) return std::nullopt;

        const std::size_t maxIter = TraversalLimit();
        std::size_t iter = 0;
        HalfedgeHandle h = *first;
        do
        {
            if (ToVertex(h) == end) return h;
            h = CWRotatedHalfedge(h);
            if (++iter > maxIter) break;
        } while (h != *first);

        return std::nullopt;
    }

    bool Mesh::AreFacesAdjacent(FaceHandle a, FaceHandle b) const
    {
        if (a == b) return false;

        const HalfedgeHandle start = Halfedge(a);
        const std::size_t maxIter = TraversalLimit();
        std::size_t iter = 0;
        HalfedgeHandle h = start;
        do
        {
            if (Face(TwinHalfedge(h)) == b) return true;
            h = NextHalfedge(h);
            if (++iter > maxIter) break;
        } while (h != start);
        return false;
    }

    std::size_t Mesh::Valence(VertexHandle v) const
    {
        std::size_t count = 0;
        const auto start = Halfedge(v);
        if (start)
        {
            const std::size_t maxIter = TraversalLimit();
            HalfedgeHandle h = *start;
            do
            {
                ++count;
                h = CWRotatedHalfedge(h);
                if (count > maxIter) return count; // safety: broken connectivity
            } while (h != *start);
        }
        return count;
    }

    std::size_t Mesh::Valence(FaceHandle f) const
    {
        std::size_t count = 0;
        const HalfedgeHandle start = Halfedge(f);
        const std::size_t maxIter = TraversalLimit();
        HalfedgeHandle h = start;
        do
        {
            ++count;
            h = NextHalfedge(h);
            if (count > maxIter) return count;
        } while (h != start);
        return count;
    }

    // =========================================================================
    // Face geometry
    // =========================================================================

    // Newell's method: robust for planar polygons of any size, reduces to the
    // cross product for triangles.
    glm::vec3 Mesh::ComputeFaceNormal(FaceHandle f) const
    {
        glm::vec3 n(0.0f);

        const HalfedgeHandle start = Halfedge(f);
        const std::size_t maxIter = TraversalLimit();
        std::size_t iter = 0;
        HalfedgeHandle h = start;
        do
        {
            const glm::vec3& a = Position(FromVertex(h));
            const glm::vec3& b = Position(ToVertex(h));
            n += glm::cross(a, b);
            h = NextHalfedge(h);
            if (++iter > maxIter) break;
        } while (h != start);

        const float len = glm::length(n);
        return (len > 1e-12f) ? (n / len) : glm::vec3(0.0f);
    }

    glm::vec3 Mesh::ComputeFaceCentroid(FaceHandle f) const
    {
        glm::vec3 sum(0.0f);
        std::size_t count = 0;

        const HalfedgeHandle start = Halfedge(f);
        const std::size_t maxIter = TraversalLimit();
        HalfedgeHandle h = start;
        do
        {
            sum += Position(FromVertex(h));
            h = NextHalfedge(h);
            if (++count > maxIter) break;
        } while (h != start);

        return count > 0 ? sum / static_cast<float>(count) : sum;
    }

    void Mesh::UpdateFaceAttributes(FaceHandle f)
    {
        m_Faces[f].Attributes = FaceAttributes{ComputeFaceNormal(f), ComputeFaceCentroid(f)};
    }

    void Mesh::UpdateAllFaceAttributes()
    {
        for (const FaceHandle f : m_Faces.Handles()) UpdateFaceAttributes(f);
    }

    void Mesh::RefreshFaceAttributes(FaceHandle f)
    {
        if (m_Faces[f].Attributes) UpdateFaceAttributes(f);
    }

    void Mesh::RefreshFaceAttributesAround(VertexHandle v)
    {
        const auto start = Halfedge(v);
        if (!start) return;

        const std::size_t maxIter = TraversalLimit();
        std::size_t iter = 0;
        HalfedgeHandle h = *start;
        do
        {
            if (auto f = Face(h)) RefreshFaceAttributes(*f);
            h = CWRotatedHalfedge(h);
            if (++iter > maxIter) return;
        } while (h != *start);
    }

    float Mesh::FaceSignedDistance(FaceHandle f, glm::vec3 point) const
    {
        const auto attributes = FaceAttributesOf(f);
        const glm::vec3 normal = attributes ? attributes->Normal : ComputeFaceNormal(f);
        const glm::vec3 centroid = attributes ? attributes->Centroid : ComputeFaceCentroid(f);
        return glm::dot(normal, point - centroid);
    }

    float Mesh::FaceDistance(FaceHandle f, glm::vec3 point) const
    {
        return std::abs(FaceSignedDistance(f, point));
    }

    bool Mesh::CanFaceSee(FaceHandle f, glm::vec3 point) const
    {
        return FaceSignedDistance(f, point) > kVisibilityEpsilon;
    }
}
