module;

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

export module Geometry:HalfedgeMesh;

import Core.Error;
import :Properties;

export namespace Geometry::Halfedge
{
    struct VertexConnectivity
    {
        HalfedgeHandle Halfedge{};  // outgoing
    };

    struct HalfedgeConnectivity
    {
        VertexHandle Vertex{};     // to-vertex
        LoopHandle Loop{};         // face or boundary
        HalfedgeHandle Next{};
        HalfedgeHandle Prev{};
    };

    struct LoopConnectivity
    {
        HalfedgeHandle Halfedge{};  // first
    };

    // Which of the two sides of a split receives a fresh record.
    //   Left  - the first side is new, the second keeps the original.
    //   Right - the first side keeps the original, the second is new.
    //   Both  - both sides are new and the original is retired.
    enum class SplitSide
    {
        Left,
        Right,
        Both
    };

    // The two halfedges of a freshly created edge.
    struct HalfedgePair
    {
        HalfedgeHandle First{};
        HalfedgeHandle Second{};
    };

    inline constexpr std::size_t kDefaultNeighborhoodLimit = 50;

    // =========================================================================
    // Named DCEL for a 2-manifold with (at most) one boundary loop.
    // =========================================================================
    //
    // Records live in property columns indexed by handles. The two halfedges
    // of edge e are 2e and 2e+1, so Opposite is an index flip. Deleted records
    // stay in their columns flagged as deleted; meshes here are small and are
    // never compacted.
    //
    // Every editing primitive validates its preconditions before touching the
    // connectivity, so a failed edit leaves the mesh as it was.
    class Mesh
    {
    public:
        Mesh();
        Mesh(const Mesh& rhs);
        Mesh(Mesh&&) noexcept = default;
        ~Mesh();

        Mesh& operator=(const Mesh& rhs);
        Mesh& operator=(Mesh&&) noexcept = default;

        void Clear();

        // Sizes
        [[nodiscard]] std::size_t VerticesSize() const noexcept { return m_Vertices.Size(); }
        [[nodiscard]] std::size_t HalfedgesSize() const noexcept { return m_Halfedges.Size(); }
        [[nodiscard]] std::size_t EdgesSize() const noexcept { return m_Edges.Size(); }
        [[nodiscard]] std::size_t LoopsSize() const noexcept { return m_Loops.Size(); }

        [[nodiscard]] std::size_t VertexCount() const noexcept { return VerticesSize() - m_DeletedVertices; }
        [[nodiscard]] std::size_t EdgeCount() const noexcept { return EdgesSize() - m_DeletedEdges; }
        [[nodiscard]] std::size_t HalfedgeCount() const noexcept { return 2u * EdgeCount(); }
        [[nodiscard]] std::size_t LoopCount() const noexcept { return LoopsSize() - m_DeletedLoops; }
        [[nodiscard]] std::size_t FaceCount() const noexcept { return LoopCount() - (HasBoundary() ? 1u : 0u); }

        [[nodiscard]] std::size_t NeighborhoodLimit() const noexcept { return m_NeighborhoodLimit; }
        void SetNeighborhoodLimit(std::size_t limit) noexcept { m_NeighborhoodLimit = limit; }

        // Validity / deletion
        [[nodiscard]] bool IsValid(VertexHandle v) const { return v.Index < VerticesSize(); }
        [[nodiscard]] bool IsValid(HalfedgeHandle h) const { return h.Index < HalfedgesSize(); }
        [[nodiscard]] bool IsValid(EdgeHandle e) const { return e.Index < EdgesSize(); }
        [[nodiscard]] bool IsValid(LoopHandle l) const { return l.Index < LoopsSize(); }

        [[nodiscard]] bool IsDeleted(VertexHandle v) const { return m_VDeleted[v]; }
        [[nodiscard]] bool IsDeleted(HalfedgeHandle h) const { return m_EDeleted[Edge(h)]; }
        [[nodiscard]] bool IsDeleted(EdgeHandle e) const { return m_EDeleted[e]; }
        [[nodiscard]] bool IsDeleted(LoopHandle l) const { return m_LDeleted[l]; }

        [[nodiscard]] bool IsLive(VertexHandle v) const { return IsValid(v) && !IsDeleted(v); }
        [[nodiscard]] bool IsLive(HalfedgeHandle h) const { return IsValid(h) && !IsDeleted(h); }
        [[nodiscard]] bool IsLive(LoopHandle l) const { return IsValid(l) && !IsDeleted(l); }

        // Connectivity access
        [[nodiscard]] HalfedgeHandle Halfedge(VertexHandle v) const { return m_VConn[v].Halfedge; }
        [[nodiscard]] HalfedgeHandle Halfedge(LoopHandle l) const { return m_LConn[l].Halfedge; }

        [[nodiscard]] VertexHandle ToVertex(HalfedgeHandle h) const { return m_HConn[h].Vertex; }
        [[nodiscard]] VertexHandle FromVertex(HalfedgeHandle h) const { return ToVertex(OppositeHalfedge(h)); }
        [[nodiscard]] LoopHandle Loop(HalfedgeHandle h) const { return m_HConn[h].Loop; }

        [[nodiscard]] HalfedgeHandle NextHalfedge(HalfedgeHandle h) const { return m_HConn[h].Next; }
        [[nodiscard]] HalfedgeHandle PrevHalfedge(HalfedgeHandle h) const { return m_HConn[h].Prev; }

        [[nodiscard]] HalfedgeHandle OppositeHalfedge(HalfedgeHandle h) const
        {
            return HalfedgeHandle{static_cast<PropertyIndex>(h.Index ^ 1u)};
        }

        // Next outgoing halfedge around FromVertex(h).
        [[nodiscard]] HalfedgeHandle CWRotatedHalfedge(HalfedgeHandle h) const { return NextHalfedge(OppositeHalfedge(h)); }

        [[nodiscard]] EdgeHandle Edge(HalfedgeHandle h) const { return EdgeHandle{static_cast<PropertyIndex>(h.Index >> 1u)}; }
        [[nodiscard]] HalfedgeHandle Halfedge(EdgeHandle e, unsigned int i) const
        {
            return HalfedgeHandle{static_cast<PropertyIndex>((e.Index << 1u) + (i & 1u))};
        }

        // Geometry payload
        [[nodiscard]] const glm::dvec3& Position(VertexHandle v) const { return m_VPoint[v]; }
        [[nodiscard]] glm::dvec3& Position(VertexHandle v) { return m_VPoint[v]; }

        // Names
        [[nodiscard]] const std::string& Name(VertexHandle v) const { return m_VName[v]; }
        [[nodiscard]] const std::string& Name(LoopHandle l) const { return m_LName[l]; }

        [[nodiscard]] std::optional<VertexHandle> FindVertex(std::string_view name) const;
        [[nodiscard]] std::optional<LoopHandle> FindLoop(std::string_view name) const;

        // Fails if another live vertex already carries the name.
        [[nodiscard]] Core::Result RenameVertex(VertexHandle v, std::string name);
        // Loop names are diagnostic; collisions get a "#n" suffix.
        void RenameLoop(LoopHandle l, std::string name);

        [[nodiscard]] bool IsFace(LoopHandle l) const { return m_LIsFace[l]; }

        // Boundary
        [[nodiscard]] bool HasBoundary() const { return m_Boundary.IsValid() && !IsDeleted(m_Boundary); }
        [[nodiscard]] LoopHandle BoundaryLoop() const { return HasBoundary() ? m_Boundary : LoopHandle{}; }
        void SetBoundaryLoop(LoopHandle l);
        [[nodiscard]] bool IsBoundary(HalfedgeHandle h) const { return HasBoundary() && Loop(h) == m_Boundary; }

        // Peers: symmetric links between boundary halfedges awaiting gluing.
        [[nodiscard]] HalfedgeHandle Peer(HalfedgeHandle h) const { return m_HPeer[h]; }
        [[nodiscard]] bool HasPeer(HalfedgeHandle h) const { return m_HPeer[h].IsValid(); }
        void SetPeers(HalfedgeHandle a, HalfedgeHandle b);
        // Unlinks h and its peer.
        void ClearPeer(HalfedgeHandle h);
        // Halfedges carrying a peer, in the order the links were made.
        [[nodiscard]] const std::vector<HalfedgeHandle>& PeeredHalfedges() const noexcept { return m_PeerOrder; }

        // Enumeration of live records
        [[nodiscard]] std::vector<VertexHandle> Vertices() const;
        [[nodiscard]] std::vector<LoopHandle> Loops() const;
        [[nodiscard]] std::vector<EdgeHandle> Edges() const;

        // Cycle walks bounded by NeighborhoodLimit().
        [[nodiscard]] Core::Expected<std::vector<HalfedgeHandle>> OutgoingHalfedges(VertexHandle v) const;
        [[nodiscard]] Core::Expected<std::vector<HalfedgeHandle>> LoopHalfedges(LoopHandle l) const;
        [[nodiscard]] Core::Expected<std::size_t> Valence(LoopHandle l) const;

        // Unique halfedge from -> to; zero or several matches fail.
        [[nodiscard]] Core::Expected<HalfedgeHandle> FindHalfedge(VertexHandle from, VertexHandle to) const;

        // =====================================================================
        // Record creation
        // =====================================================================

        [[nodiscard]] Core::Expected<VertexHandle> MakeVertex(std::string name);
        [[nodiscard]] LoopHandle MakeLoop(std::string name, bool isFace);

        // First lies in loopA and points to vB, Second lies in loopB and points
        // to vA. Anchors vA, vB, loopA and loopB on the new halfedges. Next/Prev
        // are left for the caller to link.
        [[nodiscard]] HalfedgePair MakeEdge(LoopHandle loopA, LoopHandle loopB, VertexHandle vA, VertexHandle vB);

        // =====================================================================
        // Topology edits
        // =====================================================================

        // Seed: vertex "core" with one self-loop edge separating face "core1"
        // from loop "core2". First lies in core1.
        [[nodiscard]] Core::Expected<HalfedgePair> AddCore();

        // Inverse of AddCore. v must carry a single self-loop edge.
        [[nodiscard]] Core::Result DropCore(VertexHandle v);

        // h0 and h1 point to the same vertex v. The incoming arc reached from
        // h0 by Prev(Opposite(.)) up to (excluding) h1 is retargeted to v0, the
        // rest to v1, and a new edge v0 -> v1 is inserted after h0 and h1.
        // New vertices are named "<v>.0" / "<v>.1".
        [[nodiscard]] Core::Expected<HalfedgePair> SplitVertex(HalfedgeHandle h0, HalfedgeHandle h1, SplitSide create);

        // h0 and h1 lie in the same loop l. The arc reached from h0 by Prev up
        // to (excluding) h1 moves to l0, the rest to l1, and a new edge
        // ToVertex(h0) -> ToVertex(h1) closes both. New loops are named
        // "<l>.0" / "<l>.1". Returns {halfedge in l0, halfedge in l1}.
        [[nodiscard]] Core::Expected<HalfedgePair> SplitLoop(HalfedgeHandle h0, HalfedgeHandle h1, SplitSide create);

        // Inserts a vertex before ToVertex(h) in both adjacent loops.
        [[nodiscard]] Core::Expected<HalfedgePair> SplitEdgeAcross(HalfedgeHandle h);
        [[nodiscard]] Core::Expected<HalfedgePair> SplitEdgeAlong(HalfedgeHandle h);

        // Merges ToVertex(h) into FromVertex(h) and removes the edge.
        [[nodiscard]] Core::Expected<VertexHandle> ContractEdge(HalfedgeHandle h);

        // Removes the edge of h and merges Loop(h) into Loop(Opposite(h)).
        [[nodiscard]] Core::Expected<LoopHandle> DropEdge(HalfedgeHandle h);

        // Structural invariants: connectivity consistency, live references,
        // bounded cycles and unique names.
        [[nodiscard]] Core::Result Check() const;

    private:
        void EnsureProperties();

        [[nodiscard]] VertexHandle NewVertex();
        [[nodiscard]] HalfedgeHandle NewEdge();
        [[nodiscard]] LoopHandle NewLoop();

        void SetNextHalfedge(HalfedgeHandle h, HalfedgeHandle next);
        void DeleteVertex(VertexHandle v);
        void DeleteEdge(HalfedgeHandle h);
        void DeleteLoop(LoopHandle l);

        [[nodiscard]] std::string UniqueLoopName(std::string name) const;
        [[nodiscard]] Core::Result CheckHalfedge(HalfedgeHandle h) const;

        // Storage
        PropertySet m_Vertices;
        PropertySet m_Halfedges;
        PropertySet m_Edges;
        PropertySet m_Loops;

        // Core properties
        VertexProperty<glm::dvec3> m_VPoint;
        VertexProperty<std::string> m_VName;
        VertexProperty<VertexConnectivity> m_VConn;
        HalfedgeProperty<HalfedgeConnectivity> m_HConn;
        HalfedgeProperty<HalfedgeHandle> m_HPeer;
        LoopProperty<LoopConnectivity> m_LConn;
        LoopProperty<std::string> m_LName;
        LoopProperty<bool> m_LIsFace;

        VertexProperty<bool> m_VDeleted;
        EdgeProperty<bool> m_EDeleted;
        LoopProperty<bool> m_LDeleted;

        PropertyIndex m_DeletedVertices{0};
        PropertyIndex m_DeletedEdges{0};
        PropertyIndex m_DeletedLoops{0};

        std::unordered_map<std::string, VertexHandle> m_VertexIndex;
        std::unordered_map<std::string, LoopHandle> m_LoopIndex;
        std::vector<HalfedgeHandle> m_PeerOrder;

        LoopHandle m_Boundary{};
        std::size_t m_NeighborhoodLimit{kDefaultNeighborhoodLimit};
    };
}
