module;

#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <optional>
#include <type_traits>
#include <vector>

export module Geometry:Traversal;

import Core;
import :Handle;
import :HalfedgeMesh;

export namespace Geometry::Halfedge
{
    // =========================================================================
    // Circulators
    // =========================================================================
    //
    // Lazy walks over the link structure. A walk starts at a halfedge and
    // repeatedly steps until the start recurs:
    //   FaceCycle  : h -> Next(h)          (boundary of a face)
    //   VertexRing : h -> Next(Twin(h))    (outgoing halfedges around Origin(h))
    //
    // Every step resolves records through the checked store lookup. A walk that
    // meets a freed record, or does not close within Mesh::TraversalLimit()
    // steps, stops early and the owning range reports CorruptTopology from
    // Status(). Ranges may be iterated any number of times; each begin()
    // restarts the walk and clears the status.

    enum class LoopKind : std::uint8_t
    {
        FaceCycle,
        VertexRing,
        EdgePair // h, then twin(h)
    };

    class HalfedgeLoopIterator
    {
    public:
        using value_type = HalfedgeHandle;
        using difference_type = std::ptrdiff_t;

        HalfedgeLoopIterator() = default;
        HalfedgeLoopIterator(const Mesh* mesh, std::optional<HalfedgeHandle> start, LoopKind kind,
                             std::size_t limit, bool* corrupt);

        [[nodiscard]] HalfedgeHandle operator*() const { return m_Current; }

        HalfedgeLoopIterator& operator++();
        HalfedgeLoopIterator operator++(int)
        {
            HalfedgeLoopIterator tmp = *this;
            ++*this;
            return tmp;
        }

        [[nodiscard]] bool operator==(std::default_sentinel_t) const { return m_Done; }

    private:
        [[nodiscard]] std::optional<HalfedgeHandle> Step() const;
        void Fail();

        const Mesh* m_Mesh = nullptr;
        HalfedgeHandle m_Start{};
        HalfedgeHandle m_Current{};
        LoopKind m_Kind = LoopKind::FaceCycle;
        std::size_t m_Limit = 0;
        std::size_t m_Steps = 0;
        bool* m_Corrupt = nullptr;
        bool m_Done = true;
    };

    class HalfedgeLoop
    {
    public:
        HalfedgeLoop(const Mesh& mesh, std::optional<HalfedgeHandle> start, LoopKind kind,
                     Core::ErrorCode startError = Core::ErrorCode::Success);

        [[nodiscard]] HalfedgeLoopIterator begin() const;
        [[nodiscard]] std::default_sentinel_t end() const { return {}; }

        [[nodiscard]] bool Empty() const noexcept { return !m_Start.has_value(); }

        // Outcome of the most recent walk.
        [[nodiscard]] Core::Result Status() const;

        [[nodiscard]] const Mesh& GetMesh() const noexcept { return *m_Mesh; }

    private:
        const Mesh* m_Mesh;
        std::optional<HalfedgeHandle> m_Start;
        LoopKind m_Kind;
        Core::ErrorCode m_StartError;
        mutable bool m_Corrupt{false};
    };

    // -------------------------------------------------------------------------
    // Projected loops: map each visited halfedge to an entity, skipping the
    // halfedges the projection rejects (e.g. boundary halfedges for faces).
    // -------------------------------------------------------------------------

    struct FromVertexProjection
    {
        using ValueType = VertexHandle;
        [[nodiscard]] static std::optional<VertexHandle> Apply(const Mesh& mesh, HalfedgeHandle h);
    };

    struct ToVertexProjection
    {
        using ValueType = VertexHandle;
        [[nodiscard]] static std::optional<VertexHandle> Apply(const Mesh& mesh, HalfedgeHandle h);
    };

    struct FaceProjection
    {
        using ValueType = FaceHandle;
        [[nodiscard]] static std::optional<FaceHandle> Apply(const Mesh& mesh, HalfedgeHandle h);
    };

    struct OppositeFaceProjection
    {
        using ValueType = FaceHandle;
        [[nodiscard]] static std::optional<FaceHandle> Apply(const Mesh& mesh, HalfedgeHandle h);
    };

    template <typename Projection>
    class ProjectedLoop
    {
    public:
        using value_type = typename Projection::ValueType;

        class Iterator
        {
        public:
            using value_type = typename Projection::ValueType;
            using difference_type = std::ptrdiff_t;

            Iterator() = default;
            Iterator(const Mesh* mesh, HalfedgeLoopIterator it) : m_Mesh(mesh), m_It(it) { Settle(); }

            [[nodiscard]] value_type operator*() const { return *m_Value; }

            Iterator& operator++()
            {
                ++m_It;
                Settle();
                return *this;
            }

            Iterator operator++(int)
            {
                Iterator tmp = *this;
                ++*this;
                return tmp;
            }

            [[nodiscard]] bool operator==(std::default_sentinel_t) const { return !m_Value.has_value(); }

        private:
            void Settle()
            {
                while (!(m_It == std::default_sentinel))
                {
                    m_Value = Projection::Apply(*m_Mesh, *m_It);
                    if (m_Value) return;
                    ++m_It;
                }
                m_Value.reset();
            }

            const Mesh* m_Mesh = nullptr;
            HalfedgeLoopIterator m_It{};
            std::optional<value_type> m_Value{};
        };

        explicit ProjectedLoop(HalfedgeLoop loop) : m_Loop(loop) {}

        [[nodiscard]] Iterator begin() const { return Iterator(&m_Loop.GetMesh(), m_Loop.begin()); }
        [[nodiscard]] std::default_sentinel_t end() const { return {}; }

        [[nodiscard]] Core::Result Status() const { return m_Loop.Status(); }

    private:
        HalfedgeLoop m_Loop;
    };

    // Halfedges of a face boundary, starting at Halfedge(f).
    [[nodiscard]] HalfedgeLoop FaceHalfedges(const Mesh& mesh, FaceHandle f);
    // Outgoing halfedges around v (twin-then-next rotation), starting at Halfedge(v).
    [[nodiscard]] HalfedgeLoop VertexOutgoingHalfedges(const Mesh& mesh, VertexHandle v);

    [[nodiscard]] ProjectedLoop<FaceProjection> VertexFaces(const Mesh& mesh, VertexHandle v);
    [[nodiscard]] ProjectedLoop<ToVertexProjection> VertexVertices(const Mesh& mesh, VertexHandle v);
    [[nodiscard]] ProjectedLoop<FromVertexProjection> FaceVertices(const Mesh& mesh, FaceHandle f);
    [[nodiscard]] ProjectedLoop<OppositeFaceProjection> FaceFaces(const Mesh& mesh, FaceHandle f);

    // The two halfedges of the edge through h: h first, then its twin.
    [[nodiscard]] HalfedgeLoop EdgeHalfedges(const Mesh& mesh, HalfedgeHandle h);
    // Source of h, then its target.
    [[nodiscard]] ProjectedLoop<FromVertexProjection> EdgeVertices(const Mesh& mesh, HalfedgeHandle h);
    // Face of h, then the face of its twin; boundary sides are skipped.
    [[nodiscard]] ProjectedLoop<FaceProjection> EdgeFaces(const Mesh& mesh, HalfedgeHandle h);

    // Eagerly gather a walk; fails with the range's Status() if the walk broke.
    template <typename Range>
    [[nodiscard]] auto Collect(const Range& range) -> Core::Expected<std::vector<std::remove_cvref_t<decltype(*range.begin())>>>
    {
        std::vector<std::remove_cvref_t<decltype(*range.begin())>> out;
        for (auto item : range) out.push_back(item);
        if (auto status = range.Status(); !status) return std::unexpected(status.error());
        return out;
    }

    // =========================================================================
    // Boundary loops
    // =========================================================================

    struct BoundaryLoop
    {
        // Ordered boundary halfedges (one per edge in the loop)
        std::vector<HalfedgeHandle> Halfedges;

        // Origin of each halfedge, in the same order
        std::vector<VertexHandle> Vertices;
    };

    [[nodiscard]] Core::Expected<std::vector<BoundaryLoop>> FindBoundaryLoops(const Mesh& mesh);
}
