module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Geometry:HalfedgeMesh;

import Core;
import :Handle;

export namespace Geometry::Halfedge
{
    // Origin-based connectivity: a halfedge stores the vertex it leaves from,
    // its destination is the origin of its twin.
    struct VertexRecord
    {
        glm::vec3 Position{0.0f};
        std::optional<HalfedgeHandle> Halfedge{}; // outgoing; empty => isolated
    };

    struct HalfedgeRecord
    {
        VertexHandle Origin{};
        HalfedgeHandle Twin{};
        HalfedgeHandle Next{};
        HalfedgeHandle Prev{};
        std::optional<FaceHandle> Face{}; // empty => boundary
    };

    struct FaceAttributes
    {
        glm::vec3 Normal{0.0f, 0.0f, 1.0f};
        glm::vec3 Centroid{0.0f};
    };

    struct FaceRecord
    {
        HalfedgeHandle Halfedge{};
        std::optional<FaceAttributes> Attributes{};
    };

    using VertexStore = Core::SlotMap<VertexRecord, VertexHandle>;
    using HalfedgeStore = Core::SlotMap<HalfedgeRecord, HalfedgeHandle>;
    using FaceStore = Core::SlotMap<FaceRecord, FaceHandle>;

    struct SplitParams
    {
        // Connect the new vertex to the opposite corner of every adjacent face
        // that was a triangle before the split.
        bool TriangulateAdjacentFaces{false};
    };

    class LinkResolver;

    class Mesh
    {
    public:
        Mesh();
        Mesh(const Mesh& rhs);
        Mesh(Mesh&&) noexcept = default;
        ~Mesh();

        Mesh& operator=(const Mesh& rhs);
        Mesh& operator=(Mesh&&) noexcept = default;

        // Entity stores (checked lookups fail with DanglingHandle)
        [[nodiscard]] const VertexStore& Vertices() const noexcept { return m_Vertices; }
        [[nodiscard]] const HalfedgeStore& Halfedges() const noexcept { return m_Halfedges; }
        [[nodiscard]] const FaceStore& Faces() const noexcept { return m_Faces; }

        // Adds an isolated vertex.
        [[nodiscard]] VertexHandle AddVertex(glm::vec3 position);

        void Clear();

        // Sizes
        [[nodiscard]] std::size_t VertexCount() const noexcept { return m_Vertices.Size(); }
        [[nodiscard]] std::size_t HalfedgeCount() const noexcept { return m_Halfedges.Size(); }
        [[nodiscard]] std::size_t EdgeCount() const noexcept { return m_Halfedges.Size() / 2u; }
        [[nodiscard]] std::size_t FaceCount() const noexcept { return m_Faces.Size(); }

        [[nodiscard]] bool IsEmpty() const noexcept { return VertexCount() == 0; }

        // V - E + F
        [[nodiscard]] std::int64_t EulerCharacteristic() const noexcept
        {
            return static_cast<std::int64_t>(VertexCount()) - static_cast<std::int64_t>(EdgeCount()) +
                   static_cast<std::int64_t>(FaceCount());
        }

        // Upper bound on the length of any face cycle or vertex ring of a valid mesh.
        [[nodiscard]] std::size_t TraversalLimit() const noexcept { return HalfedgeCount() + 1u; }

        // Validity
        [[nodiscard]] bool IsValid(VertexHandle v) const noexcept { return m_Vertices.Contains(v); }
        [[nodiscard]] bool IsValid(HalfedgeHandle h) const noexcept { return m_Halfedges.Contains(h); }
        [[nodiscard]] bool IsValid(FaceHandle f) const noexcept { return m_Faces.Contains(f); }

        // Connectivity access (unchecked: handles must be live)
        [[nodiscard]] std::optional<HalfedgeHandle> Halfedge(VertexHandle v) const { return m_Vertices[v].Halfedge; }
        [[nodiscard]] HalfedgeHandle Halfedge(FaceHandle f) const { return m_Faces[f].Halfedge; }

        [[nodiscard]] VertexHandle FromVertex(HalfedgeHandle h) const { return m_Halfedges[h].Origin; }
        [[nodiscard]] VertexHandle ToVertex(HalfedgeHandle h) const { return FromVertex(TwinHalfedge(h)); }

        [[nodiscard]] HalfedgeHandle TwinHalfedge(HalfedgeHandle h) const { return m_Halfedges[h].Twin; }
        [[nodiscard]] HalfedgeHandle NextHalfedge(HalfedgeHandle h) const { return m_Halfedges[h].Next; }
        [[nodiscard]] HalfedgeHandle PrevHalfedge(HalfedgeHandle h) const { return m_Halfedges[h].Prev; }

        [[nodiscard]] std::optional<FaceHandle> Face(HalfedgeHandle h) const { return m_Halfedges[h].Face; }

        // Rotation around FromVertex(h)
        [[nodiscard]] HalfedgeHandle CWRotatedHalfedge(HalfedgeHandle h) const { return NextHalfedge(TwinHalfedge(h)); }
        [[nodiscard]] HalfedgeHandle CCWRotatedHalfedge(HalfedgeHandle h) const { return TwinHalfedge(PrevHalfedge(h)); }

        [[nodiscard]] bool IsBoundary(HalfedgeHandle h) const { return !Face(h).has_value(); }
        [[nodiscard]] bool IsBoundaryEdge(HalfedgeHandle h) const { return IsBoundary(h) || IsBoundary(TwinHalfedge(h)); }
        [[nodiscard]] bool IsBoundary(VertexHandle v) const;
        [[nodiscard]] bool IsBoundary(FaceHandle f) const;

        [[nodiscard]] bool IsIsolated(VertexHandle v) const { return !Halfedge(v).has_value(); }
        [[nodiscard]] bool IsManifold(VertexHandle v) const;

        // Geometry payload
        [[nodiscard]] const glm::vec3& Position(VertexHandle v) const { return m_Vertices[v].Position; }
        [[nodiscard]] glm::vec3& Position(VertexHandle v) { return m_Vertices[v].Position; }

        [[nodiscard]] glm::vec3 ComputeFaceNormal(FaceHandle f) const;
        [[nodiscard]] glm::vec3 ComputeFaceCentroid(FaceHandle f) const;
        [[nodiscard]] std::optional<FaceAttributes> FaceAttributesOf(FaceHandle f) const { return m_Faces[f].Attributes; }
        void UpdateFaceAttributes(FaceHandle f);
        void UpdateAllFaceAttributes();

        [[nodiscard]] float FaceDistance(FaceHandle f, glm::vec3 point) const;
        [[nodiscard]] float FaceSignedDistance(FaceHandle f, glm::vec3 point) const;
        [[nodiscard]] bool CanFaceSee(FaceHandle f, glm::vec3 point) const;

        // Queries
        [[nodiscard]] std::optional<HalfedgeHandle> FindHalfedge(VertexHandle start, VertexHandle end) const;
        [[nodiscard]] bool AreFacesAdjacent(FaceHandle a, FaceHandle b) const;

        [[nodiscard]] std::size_t Valence(VertexHandle v) const;
        [[nodiscard]] std::size_t Valence(FaceHandle f) const;

        // ---------------------------------------------------------------------
        // Mutation operators
        // ---------------------------------------------------------------------
        // Every operator checks its preconditions before rewriting a single
        // link. On a topology-safety error the mesh is unchanged.

        [[nodiscard]] Core::Expected<VertexHandle> SplitEdge(HalfedgeHandle h, glm::vec3 position,
                                                             const SplitParams& params = {});
        [[nodiscard]] Core::Expected<VertexHandle> SplitEdgeAt(HalfedgeHandle h, float t,
                                                               const SplitParams& params = {});

        [[nodiscard]] Core::Result CanCollapse(HalfedgeHandle h) const;
        [[nodiscard]] Core::Expected<VertexHandle> CollapseEdge(HalfedgeHandle h);
        [[nodiscard]] Core::Expected<VertexHandle> CollapseEdge(HalfedgeHandle h, glm::vec3 newPosition);

        [[nodiscard]] Core::Result CanFlip(HalfedgeHandle h) const;
        [[nodiscard]] Core::Expected<HalfedgeHandle> FlipEdge(HalfedgeHandle h);

        Core::Result DeleteFace(FaceHandle f);
        Core::Result DeleteEdge(HalfedgeHandle h);
        Core::Result DeleteVertex(VertexHandle v);

        [[nodiscard]] Core::Expected<VertexHandle> PokeFace(FaceHandle f, glm::vec3 position);
        [[nodiscard]] Core::Expected<FaceHandle> DissolveVertex(VertexHandle v);
        [[nodiscard]] Core::Expected<std::vector<FaceHandle>> ConeFaces(std::span<const FaceHandle> faces,
                                                                        glm::vec3 apex);

    private:
        friend class LinkResolver;

        // Link writers
        void SetFromVertex(HalfedgeHandle h, VertexHandle v) { m_Halfedges[h].Origin = v; }
        void SetFace(HalfedgeHandle h, std::optional<FaceHandle> f) { m_Halfedges[h].Face = f; }
        void SetHalfedge(VertexHandle v, std::optional<HalfedgeHandle> h) { m_Vertices[v].Halfedge = h; }
        void SetHalfedge(FaceHandle f, HalfedgeHandle h) { m_Faces[f].Halfedge = h; }
        void SetNextHalfedge(HalfedgeHandle h, HalfedgeHandle next);
        void SetTwins(HalfedgeHandle a, HalfedgeHandle b);

        [[nodiscard]] VertexHandle NewVertex(glm::vec3 position);
        [[nodiscard]] HalfedgeHandle NewEdge(VertexHandle start, VertexHandle end);
        [[nodiscard]] FaceHandle NewFace(HalfedgeHandle h);
        void FreeEdge(HalfedgeHandle h);
        void FreeHalfedge(HalfedgeHandle h);
        void FreeFace(FaceHandle f);
        void FreeVertex(VertexHandle v);

        void AdjustOutgoingHalfedge(VertexHandle v);
        void RefreshFaceAttributes(FaceHandle f);
        void RefreshFaceAttributesAround(VertexHandle v);

        [[nodiscard]] Core::Result VerifyNeighborhood(std::span<const VertexHandle> vertices, const char* operation) const;

        VertexStore m_Vertices;
        HalfedgeStore m_Halfedges;
        FaceStore m_Faces;
    };
}
