module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <expected>
#include <initializer_list>
#include <optional>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <glm/glm.hpp>

module Geometry:HalfedgeMesh.Operators;

import Core;
import :Handle;
import :HalfedgeMesh;
import :Traversal;

namespace Geometry::Halfedge
{
    // =========================================================================
    // Edge split
    // =========================================================================
    //
    //  Before: h: a->b inside face (a, b, c), t: b->a inside face (b, a, d)
    //  After:  h: a->m, g: m->b, t: m->a, gt: b->m
    //          with TriangulateAdjacentFaces:
    //            (a, m, c), (m, b, c) from spoke s: m->c
    //            (b, m, d), (m, a, d) from spoke u: m->d
    //
    // h keeps its origin and ends at m, t now starts at m, and the new pair
    // (g, gt) spans m-b. The spokes s and u are only added when the adjacent
    // face was a triangle and triangulation is requested.

    Core::Expected<VertexHandle> Mesh::SplitEdge(HalfedgeHandle h, glm::vec3 position, const SplitParams& params)
    {
        if (!IsValid(h)) return std::unexpected(Core::ErrorCode::DanglingHandle);

        const HalfedgeHandle t = TwinHalfedge(h);
        const VertexHandle a = FromVertex(h);
        const VertexHandle b = FromVertex(t);

        const HalfedgeHandle hn = NextHalfedge(h);
        const HalfedgeHandle hp = PrevHalfedge(h);
        const HalfedgeHandle tn = NextHalfedge(t);
        const HalfedgeHandle tp = PrevHalfedge(t);

        const std::optional<FaceHandle> fh = Face(h);
        const std::optional<FaceHandle> ft = Face(t);

        const bool splitFaceH = params.TriangulateAdjacentFaces && fh && Valence(*fh) == 3;
        const bool splitFaceT = params.TriangulateAdjacentFaces && ft && Valence(*ft) == 3;

        const VertexHandle m = NewVertex(position);
        const HalfedgeHandle g = NewEdge(m, b);
        const HalfedgeHandle gt = TwinHalfedge(g);

        SetFromVertex(t, m);

        SetNextHalfedge(h, g);
        SetNextHalfedge(g, hn);
        SetFace(g, fh);

        SetNextHalfedge(tp, gt);
        SetNextHalfedge(gt, t);
        SetFace(gt, ft);

        SetHalfedge(m, g);
        if (Halfedge(b) == t) SetHalfedge(b, gt);

        std::vector<VertexHandle> touched{a, b, m};

        if (splitFaceH)
        {
            const VertexHandle c = FromVertex(hp);
            const HalfedgeHandle s = NewEdge(m, c);
            const HalfedgeHandle st = TwinHalfedge(s);

            SetNextHalfedge(h, s);
            SetNextHalfedge(s, hp);
            SetFace(s, fh);
            SetHalfedge(*fh, h);

            const FaceHandle f2 = NewFace(g);
            SetNextHalfedge(g, hn);
            SetNextHalfedge(hn, st);
            SetNextHalfedge(st, g);
            SetFace(g, f2);
            SetFace(hn, f2);
            SetFace(st, f2);

            if (m_Faces[*fh].Attributes) UpdateFaceAttributes(f2);
            touched.push_back(c);
        }

        if (splitFaceT)
        {
            const VertexHandle d = FromVertex(tp);
            const HalfedgeHandle u = NewEdge(m, d);
            const HalfedgeHandle ut = TwinHalfedge(u);

            SetNextHalfedge(gt, u);
            SetNextHalfedge(u, tp);
            SetNextHalfedge(tp, gt);
            SetFace(u, ft);
            SetHalfedge(*ft, gt);

            const FaceHandle f3 = NewFace(t);
            SetNextHalfedge(t, tn);
            SetNextHalfedge(tn, ut);
            SetNextHalfedge(ut, t);
            SetFace(t, f3);
            SetFace(tn, f3);
            SetFace(ut, f3);

            if (m_Faces[*ft].Attributes) UpdateFaceAttributes(f3);
            touched.push_back(d);
        }

        for (const VertexHandle v : touched) AdjustOutgoingHalfedge(v);
        RefreshFaceAttributesAround(m);

        if (auto ok = VerifyNeighborhood(touched, "SplitEdge"); !ok) return std::unexpected(ok.error());
        return m;
    }

    Core::Expected<VertexHandle> Mesh::SplitEdgeAt(HalfedgeHandle h, float t, const SplitParams& params)
    {
        if (!IsValid(h)) return std::unexpected(Core::ErrorCode::DanglingHandle);
        if (!std::isfinite(t) || t < 0.0f || t > 1.0f)
        {
            Core::Log::Debug("SplitEdgeAt: parameter {} outside [0, 1]", t);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        const glm::vec3 position = glm::mix(Position(FromVertex(h)), Position(ToVertex(h)), t);
        return SplitEdge(h, position, params);
    }

    // =========================================================================
    // Edge collapse
    // =========================================================================
    //
    // Collapsing h (a -> b) removes b and keeps a. Preconditions:
    //  1. Link condition: the common neighbors of a and b are exactly the
    //     opposite vertices of the adjacent triangles.
    //  2. An interior edge must not join two boundary vertices (would pinch).
    //  3. An opposite vertex loses one edge; it must keep valence >= 3 if
    //     interior and >= 2 if on the boundary.
    //  4. The two adjacent triangles must not share their opposite vertex.

    Core::Result Mesh::CanCollapse(HalfedgeHandle h) const
    {
        if (!IsValid(h)) return Core::Err(Core::ErrorCode::DanglingHandle);

        const HalfedgeHandle t = TwinHalfedge(h);
        const VertexHandle a = FromVertex(h);
        const VertexHandle b = FromVertex(t);

        std::optional<VertexHandle> c;
        std::optional<VertexHandle> d;
        if (const auto fh = Face(h); fh && Valence(*fh) == 3) c = ToVertex(NextHalfedge(h));
        if (const auto ft = Face(t); ft && Valence(*ft) == 3) d = ToVertex(NextHalfedge(t));

        if (c && d && *c == *d)
        {
            Core::Log::Debug("CanCollapse: adjacent triangles of {} share opposite vertex {}", h, *c);
            return Core::Err(Core::ErrorCode::CollapseWouldCreateNonManifold);
        }

        if (IsBoundary(a) && IsBoundary(b) && !IsBoundaryEdge(h))
        {
            Core::Log::Debug("CanCollapse: interior edge {} joins two boundary vertices", h);
            return Core::Err(Core::ErrorCode::CollapseWouldCreateNonManifold);
        }

        auto ringA = Collect(VertexVertices(*this, a));
        if (!ringA) return std::unexpected(ringA.error());
        auto ringB = Collect(VertexVertices(*this, b));
        if (!ringB) return std::unexpected(ringB.error());

        const std::unordered_set<VertexHandle> neighborsA(ringA->begin(), ringA->end());
        for (const VertexHandle n : *ringB)
        {
            if (!neighborsA.contains(n)) continue;
            if ((c && n == *c) || (d && n == *d)) continue;

            Core::Log::Debug("CanCollapse: link condition fails for {} at common neighbor {}", h, n);
            return Core::Err(Core::ErrorCode::CollapseWouldCreateNonManifold);
        }

        for (const auto& opposite : {c, d})
        {
            if (!opposite) continue;
            const std::size_t minValence = IsBoundary(*opposite) ? 3u : 4u;
            if (Valence(*opposite) < minValence)
            {
                Core::Log::Debug("CanCollapse: collapsing {} drops vertex {} below minimum valence", h, *opposite);
                return Core::Err(Core::ErrorCode::CollapseWouldCreateNonManifold);
            }
        }

        return Core::Ok();
    }

    Core::Expected<VertexHandle> Mesh::CollapseEdge(HalfedgeHandle h)
    {
        if (!IsValid(h)) return std::unexpected(Core::ErrorCode::DanglingHandle);
        return CollapseEdge(h, Position(FromVertex(h)));
    }

    Core::Expected<VertexHandle> Mesh::CollapseEdge(HalfedgeHandle h, glm::vec3 newPosition)
    {
        if (auto ok = CanCollapse(h); !ok) return std::unexpected(ok.error());

        const HalfedgeHandle t = TwinHalfedge(h);
        const VertexHandle a = FromVertex(h);
        const VertexHandle b = FromVertex(t);

        const HalfedgeHandle hn = NextHalfedge(h);
        const HalfedgeHandle hp = PrevHalfedge(h);
        const HalfedgeHandle tn = NextHalfedge(t);
        const HalfedgeHandle tp = PrevHalfedge(t);

        const std::optional<FaceHandle> fh = Face(h);
        const std::optional<FaceHandle> ft = Face(t);
        const bool triangleH = fh && Valence(*fh) == 3;
        const bool triangleT = ft && Valence(*ft) == 3;

        auto ringB = Collect(VertexOutgoingHalfedges(*this, b));
        if (!ringB) return std::unexpected(ringB.error());

        std::vector<VertexHandle> touched{a};

        // Every halfedge leaving b now leaves a.
        for (const HalfedgeHandle o : *ringB) SetFromVertex(o, a);

        // Candidates for a's outgoing link, gathered before any record is freed.
        std::vector<HalfedgeHandle> candidates;
        if (const auto current = Halfedge(a)) candidates.push_back(*current);
        candidates.insert(candidates.end(), ringB->begin(), ringB->end());

        if (triangleH)
        {
            // Triangle (a, b, c) degenerates: glue twin(hn) to twin(hp).
            const VertexHandle c = FromVertex(hp);
            const HalfedgeHandle x = TwinHalfedge(hn); // c -> b, now c -> a
            const HalfedgeHandle y = TwinHalfedge(hp); // a -> c
            SetTwins(x, y);
            if (Halfedge(c) == hp) SetHalfedge(c, x);
            candidates.push_back(y);

            FreeHalfedge(hn);
            FreeHalfedge(hp);
            FreeFace(*fh);
            touched.push_back(c);
        }
        else
        {
            SetNextHalfedge(hp, hn);
            if (fh && Halfedge(*fh) == h) SetHalfedge(*fh, hn);
        }

        if (triangleT)
        {
            // Triangle (b, a, d) degenerates: glue twin(tn) to twin(tp).
            const VertexHandle d = FromVertex(tp);
            const HalfedgeHandle x = TwinHalfedge(tn); // d -> a
            const HalfedgeHandle y = TwinHalfedge(tp); // b -> d, now a -> d
            SetTwins(x, y);
            if (Halfedge(d) == tp) SetHalfedge(d, x);
            candidates.push_back(y);

            FreeHalfedge(tn);
            FreeHalfedge(tp);
            FreeFace(*ft);
            touched.push_back(d);
        }
        else
        {
            SetNextHalfedge(tp, tn);
            if (ft && Halfedge(*ft) == t) SetHalfedge(*ft, tn);
            candidates.push_back(tn);
        }

        FreeEdge(h);
        FreeVertex(b);

        SetHalfedge(a, std::nullopt);
        for (const HalfedgeHandle o : candidates)
        {
            if (IsValid(o) && FromVertex(o) == a)
            {
                SetHalfedge(a, o);
                break;
            }
        }

        for (const VertexHandle v : touched) AdjustOutgoingHalfedge(v);

        Position(a) = newPosition;
        RefreshFaceAttributesAround(a);

        if (auto ok = VerifyNeighborhood(touched, "CollapseEdge"); !ok) return std::unexpected(ok.error());
        return a;
    }

    // =========================================================================
    // Edge flip
    // =========================================================================
    //
    //  Before: f0 = (h: a->b, hn: b->c, hp: c->a)
    //          f1 = (t: b->a, tn: a->d, tp: d->b)
    //  After:  f0 = (h: c->d, tp: d->b, hn: b->c)
    //          f1 = (t: d->c, hp: c->a, tn: a->d)

    Core::Result Mesh::CanFlip(HalfedgeHandle h) const
    {
        if (!IsValid(h)) return Core::Err(Core::ErrorCode::DanglingHandle);

        const HalfedgeHandle t = TwinHalfedge(h);
        const auto f0 = Face(h);
        const auto f1 = Face(t);
        if (!f0 || !f1)
        {
            Core::Log::Debug("CanFlip: {} is a boundary edge", h);
            return Core::Err(Core::ErrorCode::BoundaryEdgeUnsupported);
        }

        if (Valence(*f0) != 3 || Valence(*f1) != 3)
        {
            Core::Log::Debug("CanFlip: faces around {} are not both triangles", h);
            return Core::Err(Core::ErrorCode::FlipRequiresTriangles);
        }

        const VertexHandle c = ToVertex(NextHalfedge(h));
        const VertexHandle d = ToVertex(NextHalfedge(t));
        if (c == d || FindHalfedge(c, d))
        {
            Core::Log::Debug("CanFlip: diagonal {} - {} already exists", c, d);
            return Core::Err(Core::ErrorCode::FlipWouldDuplicateEdge);
        }

        return Core::Ok();
    }

    Core::Expected<HalfedgeHandle> Mesh::FlipEdge(HalfedgeHandle h)
    {
        if (auto ok = CanFlip(h); !ok) return std::unexpected(ok.error());

        const HalfedgeHandle t = TwinHalfedge(h);
        const HalfedgeHandle hn = NextHalfedge(h);
        const HalfedgeHandle hp = PrevHalfedge(h);
        const HalfedgeHandle tn = NextHalfedge(t);
        const HalfedgeHandle tp = PrevHalfedge(t);

        const VertexHandle a = FromVertex(h);
        const VertexHandle b = FromVertex(t);
        const VertexHandle c = FromVertex(hp);
        const VertexHandle d = FromVertex(tp);

        const FaceHandle f0 = *Face(h);
        const FaceHandle f1 = *Face(t);

        SetFromVertex(h, c);
        SetFromVertex(t, d);

        SetNextHalfedge(h, tp);
        SetNextHalfedge(tp, hn);
        SetNextHalfedge(hn, h);

        SetNextHalfedge(t, hp);
        SetNextHalfedge(hp, tn);
        SetNextHalfedge(tn, t);

        SetFace(tp, f0);
        SetFace(hp, f1);
        SetHalfedge(f0, h);
        SetHalfedge(f1, t);

        if (Halfedge(a) == h) SetHalfedge(a, tn);
        if (Halfedge(b) == t) SetHalfedge(b, hn);

        const VertexHandle touched[] = {a, b, c, d};
        for (const VertexHandle v : touched) AdjustOutgoingHalfedge(v);

        RefreshFaceAttributes(f0);
        RefreshFaceAttributes(f1);

        if (auto ok = VerifyNeighborhood(touched, "FlipEdge"); !ok) return std::unexpected(ok.error());
        return h;
    }

    // =========================================================================
    // Deletion
    // =========================================================================
    //
    // Removing a face turns its halfedges into boundary halfedges. An edge whose
    // twin was already boundary is removed entirely: the two boundary cycles it
    // separated are spliced together, and an endpoint left without edges is
    // pruned.

    Core::Result Mesh::DeleteFace(FaceHandle f)
    {
        if (!IsValid(f)) return Core::Err(Core::ErrorCode::DanglingHandle);

        auto cycle = Collect(FaceHalfedges(*this, f));
        if (!cycle) return std::unexpected(cycle.error());

        std::vector<HalfedgeHandle> deletedEdges;
        std::vector<VertexHandle> verts;
        deletedEdges.reserve(3);
        verts.reserve(cycle->size());

        for (const HalfedgeHandle h : *cycle)
        {
            SetFace(h, std::nullopt);
            if (IsBoundary(TwinHalfedge(h))) deletedEdges.push_back(h);
            verts.push_back(FromVertex(h));
        }

        std::unordered_set<VertexHandle> pruned;
        for (const HalfedgeHandle h0 : deletedEdges)
        {
            const HalfedgeHandle h1 = TwinHalfedge(h0);
            const VertexHandle v0 = FromVertex(h1); // destination of h0
            const VertexHandle v1 = FromVertex(h0);
            const HalfedgeHandle next0 = NextHalfedge(h0);
            const HalfedgeHandle prev0 = PrevHalfedge(h0);
            const HalfedgeHandle next1 = NextHalfedge(h1);
            const HalfedgeHandle prev1 = PrevHalfedge(h1);

            SetNextHalfedge(prev0, next1);
            SetNextHalfedge(prev1, next0);

            if (Halfedge(v0) == h1)
            {
                if (next0 == h1)
                {
                    SetHalfedge(v0, std::nullopt);
                    pruned.insert(v0);
                }
                else
                {
                    SetHalfedge(v0, next0);
                }
            }

            if (Halfedge(v1) == h0)
            {
                if (next1 == h0)
                {
                    SetHalfedge(v1, std::nullopt);
                    pruned.insert(v1);
                }
                else
                {
                    SetHalfedge(v1, next1);
                }
            }
        }

        for (const HalfedgeHandle h : deletedEdges) FreeEdge(h);
        FreeFace(f);

        std::vector<VertexHandle> remaining;
        remaining.reserve(verts.size());
        for (const VertexHandle v : verts)
        {
            if (pruned.contains(v)) continue;
            AdjustOutgoingHalfedge(v);
            remaining.push_back(v);
        }
        for (const VertexHandle v : pruned) FreeVertex(v);

        Core::Log::Debug("DeleteFace: removed {} ({} edges, {} vertices pruned)", f, deletedEdges.size(),
                         pruned.size());

        return VerifyNeighborhood(remaining, "DeleteFace");
    }

    Core::Result Mesh::DeleteEdge(HalfedgeHandle h)
    {
        if (!IsValid(h)) return Core::Err(Core::ErrorCode::DanglingHandle);

        const std::optional<FaceHandle> f0 = Face(h);
        const std::optional<FaceHandle> f1 = Face(TwinHalfedge(h));

        if (f0)
        {
            if (auto ok = DeleteFace(*f0); !ok) return ok;
        }
        if (f1 && IsValid(*f1))
        {
            if (auto ok = DeleteFace(*f1); !ok) return ok;
        }
        return Core::Ok();
    }

    Core::Result Mesh::DeleteVertex(VertexHandle v)
    {
        if (!IsValid(v)) return Core::Err(Core::ErrorCode::DanglingHandle);
        if (!IsIsolated(v))
        {
            Core::Log::Debug("DeleteVertex: {} still has incident edges", v);
            return Core::Err(Core::ErrorCode::VertexStillReferenced);
        }

        FreeVertex(v);
        return Core::Ok();
    }

    // =========================================================================
    // Poke face
    // =========================================================================
    //
    // Replaces the n-gon f = (h_0 .. h_{n-1}), h_i: v_i -> v_{i+1}, by n triangles
    // (h_i, v_{i+1} -> p, p -> v_i) around a new vertex p. The first triangle
    // reuses f.

    Core::Expected<VertexHandle> Mesh::PokeFace(FaceHandle f, glm::vec3 position)
    {
        if (!IsValid(f)) return std::unexpected(Core::ErrorCode::DanglingHandle);

        auto cycle = Collect(FaceHalfedges(*this, f));
        if (!cycle) return std::unexpected(cycle.error());

        const std::vector<HalfedgeHandle>& boundary = *cycle;
        const std::size_t n = boundary.size();
        const bool trackAttributes = m_Faces[f].Attributes.has_value();

        const VertexHandle p = NewVertex(position);

        // spokes[i]: p -> v_i, its twin v_i -> p
        std::vector<HalfedgeHandle> spokes(n);
        std::vector<VertexHandle> touched{p};
        for (std::size_t i = 0; i < n; ++i)
        {
            const VertexHandle vi = FromVertex(boundary[i]);
            spokes[i] = NewEdge(p, vi);
            touched.push_back(vi);
        }

        for (std::size_t i = 0; i < n; ++i)
        {
            const HalfedgeHandle hi = boundary[i];
            const HalfedgeHandle in = TwinHalfedge(spokes[(i + 1) % n]);
            const HalfedgeHandle out = spokes[i];

            const FaceHandle fi = (i == 0) ? f : NewFace(hi);
            SetHalfedge(fi, hi);

            SetNextHalfedge(hi, in);
            SetNextHalfedge(in, out);
            SetNextHalfedge(out, hi);

            SetFace(hi, fi);
            SetFace(in, fi);
            SetFace(out, fi);

            if (trackAttributes) UpdateFaceAttributes(fi);
        }

        SetHalfedge(p, spokes[0]);

        if (auto ok = VerifyNeighborhood(touched, "PokeFace"); !ok) return std::unexpected(ok.error());
        return p;
    }

    // =========================================================================
    // Dissolve vertex
    // =========================================================================
    //
    // Removes an interior vertex v with its spokes out_i: v -> w_i and merges
    // the incident faces into one polygon. Face f_i (the face of out_i) keeps
    // its chain Next(out_i) .. Prev(Prev(out_i)), running from w_i to w_{i-1};
    // chains are stitched in reverse ring order.

    Core::Expected<FaceHandle> Mesh::DissolveVertex(VertexHandle v)
    {
        if (!IsValid(v)) return std::unexpected(Core::ErrorCode::DanglingHandle);
        if (IsBoundary(v))
        {
            Core::Log::Debug("DissolveVertex: {} is on the boundary", v);
            return std::unexpected(Core::ErrorCode::BoundaryEdgeUnsupported);
        }

        auto ring = Collect(VertexOutgoingHalfedges(*this, v));
        if (!ring) return std::unexpected(ring.error());

        const std::vector<HalfedgeHandle>& spokes = *ring;
        const std::size_t n = spokes.size();
        if (n < 3)
        {
            Core::Log::Debug("DissolveVertex: {} has valence {}", v, n);
            return std::unexpected(Core::ErrorCode::OperationWouldCreateDegenerateFace);
        }

        // Gather each face's chain and check the merged polygon is simple.
        std::vector<HalfedgeHandle> first(n);
        std::vector<HalfedgeHandle> last(n);
        std::vector<HalfedgeHandle> chain;
        std::unordered_set<VertexHandle> corners;
        for (std::size_t i = 0; i < n; ++i)
        {
            if (IsBoundary(spokes[i])) return std::unexpected(Core::ErrorCode::BoundaryEdgeUnsupported);

            first[i] = NextHalfedge(spokes[i]);
            last[i] = PrevHalfedge(PrevHalfedge(spokes[i]));

            HalfedgeHandle h = first[i];
            std::size_t guard = 0;
            while (true)
            {
                if (!corners.insert(FromVertex(h)).second)
                {
                    Core::Log::Debug("DissolveVertex: merged face around {} repeats vertex {}", v, FromVertex(h));
                    return std::unexpected(Core::ErrorCode::OperationWouldCreateDegenerateFace);
                }
                chain.push_back(h);
                if (h == last[i]) break;
                h = NextHalfedge(h);
                if (++guard > TraversalLimit()) return std::unexpected(Core::ErrorCode::CorruptTopology);
            }
        }

        const FaceHandle merged = *Face(spokes[0]);
        const bool trackAttributes = m_Faces[merged].Attributes.has_value();

        std::vector<FaceHandle> dropped;
        dropped.reserve(n - 1);
        for (std::size_t i = 1; i < n; ++i) dropped.push_back(*Face(spokes[i]));

        std::vector<VertexHandle> touched;
        touched.reserve(n);
        for (std::size_t i = 0; i < n; ++i)
        {
            const VertexHandle w = ToVertex(spokes[i]);
            if (Halfedge(w) == TwinHalfedge(spokes[i])) SetHalfedge(w, first[i]);
            touched.push_back(w);

            SetNextHalfedge(last[i], first[(i + n - 1) % n]);
        }

        for (const HalfedgeHandle h : chain) SetFace(h, merged);
        SetHalfedge(merged, first[0]);

        for (const HalfedgeHandle s : spokes) FreeEdge(s);
        for (const FaceHandle f : dropped) FreeFace(f);
        FreeVertex(v);

        for (const VertexHandle w : touched) AdjustOutgoingHalfedge(w);
        if (trackAttributes) UpdateFaceAttributes(merged);

        if (auto ok = VerifyNeighborhood(touched, "DissolveVertex"); !ok) return std::unexpected(ok.error());
        return merged;
    }

    // =========================================================================
    // Cone faces
    // =========================================================================
    //
    // Removes a patch of faces and closes the hole with a triangle fan to a new
    // apex. The horizon is the set of patch halfedges whose twin lies outside
    // the patch; those halfedges are kept and become the bases of the new
    // triangles. Interior edges and vertices of the patch are freed.

    Core::Expected<std::vector<FaceHandle>> Mesh::ConeFaces(std::span<const FaceHandle> faces, glm::vec3 apex)
    {
        if (faces.empty()) return std::unexpected(Core::ErrorCode::InvalidArgument);

        std::unordered_set<FaceHandle> patch;
        for (const FaceHandle f : faces)
        {
            if (!IsValid(f)) return std::unexpected(Core::ErrorCode::DanglingHandle);
            patch.insert(f);
        }

        bool trackAttributes = false;
        std::vector<HalfedgeHandle> interiorEdges;
        std::unordered_map<VertexHandle, HalfedgeHandle> horizonFrom;
        std::unordered_set<VertexHandle> patchVertices;
        std::size_t horizonCount = 0;

        for (const FaceHandle f : patch)
        {
            trackAttributes = trackAttributes || m_Faces[f].Attributes.has_value();

            auto cycle = Collect(FaceHalfedges(*this, f));
            if (!cycle) return std::unexpected(cycle.error());

            for (const HalfedgeHandle h : *cycle)
            {
                patchVertices.insert(FromVertex(h));

                const auto across = Face(TwinHalfedge(h));
                if (across && patch.contains(*across))
                {
                    // Record each interior edge once.
                    if (h < TwinHalfedge(h)) interiorEdges.push_back(h);
                    continue;
                }

                if (!horizonFrom.emplace(FromVertex(h), h).second)
                {
                    Core::Log::Debug("ConeFaces: horizon pinches at vertex {}", FromVertex(h));
                    return std::unexpected(Core::ErrorCode::UnresolvedBoundary);
                }
                ++horizonCount;
            }
        }

        if (horizonCount < 3) return std::unexpected(Core::ErrorCode::UnresolvedBoundary);

        // Order the horizon into a single loop.
        std::vector<HalfedgeHandle> horizon;
        horizon.reserve(horizonCount);
        {
            const HalfedgeHandle start = horizonFrom.begin()->second;
            HalfedgeHandle h = start;
            do
            {
                horizon.push_back(h);
                const auto it = horizonFrom.find(ToVertex(h));
                if (it == horizonFrom.end() || horizon.size() > horizonCount)
                    return std::unexpected(Core::ErrorCode::UnresolvedBoundary);
                h = it->second;
            } while (h != start);
        }

        if (horizon.size() != horizonCount)
        {
            Core::Log::Debug("ConeFaces: horizon splits into several loops");
            return std::unexpected(Core::ErrorCode::UnresolvedBoundary);
        }

        std::vector<VertexHandle> interiorVertices;
        for (const VertexHandle v : patchVertices)
        {
            if (!horizonFrom.contains(v)) interiorVertices.push_back(v);
        }

        // Preconditions hold; rewrite.
        for (const HalfedgeHandle h : interiorEdges) FreeEdge(h);
        for (const FaceHandle f : patch) FreeFace(f);
        for (const VertexHandle v : interiorVertices) FreeVertex(v);

        const std::size_t n = horizon.size();
        const VertexHandle p = NewVertex(apex);

        // trail[i]: p -> x_i; its twin x_i -> p closes triangle i - 1.
        std::vector<HalfedgeHandle> trail(n);
        std::vector<VertexHandle> touched{p};
        for (std::size_t i = 0; i < n; ++i)
        {
            const VertexHandle xi = FromVertex(horizon[i]);
            trail[i] = NewEdge(p, xi);
            SetHalfedge(xi, horizon[i]);
            touched.push_back(xi);
        }

        std::vector<FaceHandle> created;
        created.reserve(n);
        for (std::size_t i = 0; i < n; ++i)
        {
            const HalfedgeHandle base = horizon[i];
            const HalfedgeHandle lead = TwinHalfedge(trail[(i + 1) % n]);
            const HalfedgeHandle back = trail[i];

            const FaceHandle f = NewFace(base);
            SetNextHalfedge(base, lead);
            SetNextHalfedge(lead, back);
            SetNextHalfedge(back, base);
            SetFace(base, f);
            SetFace(lead, f);
            SetFace(back, f);

            if (trackAttributes) UpdateFaceAttributes(f);
            created.push_back(f);
        }

        SetHalfedge(p, trail[0]);
        for (const VertexHandle v : touched) AdjustOutgoingHalfedge(v);

        Core::Log::Debug("ConeFaces: replaced {} faces by {} around apex {}", patch.size(), n, p);

        if (auto ok = VerifyNeighborhood(touched, "ConeFaces"); !ok) return std::unexpected(ok.error());
        return created;
    }
}
