module;

#include <algorithm>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Geometry:HalfedgeMesh.Impl;

import Core.Error;
import :HalfedgeMesh;
import :Properties;

namespace Geometry::Halfedge
{
    using Core::ErrorCode;

    Mesh::Mesh()
    {
        EnsureProperties();
    }

    // Property views point into the registry they were created from, so a
    // copy has to rebind them to its own cloned columns.
    Mesh::Mesh(const Mesh& rhs)
        : m_Vertices(rhs.m_Vertices),
          m_Halfedges(rhs.m_Halfedges),
          m_Edges(rhs.m_Edges),
          m_Loops(rhs.m_Loops),
          m_DeletedVertices(rhs.m_DeletedVertices),
          m_DeletedEdges(rhs.m_DeletedEdges),
          m_DeletedLoops(rhs.m_DeletedLoops),
          m_VertexIndex(rhs.m_VertexIndex),
          m_LoopIndex(rhs.m_LoopIndex),
          m_PeerOrder(rhs.m_PeerOrder),
          m_Boundary(rhs.m_Boundary),
          m_NeighborhoodLimit(rhs.m_NeighborhoodLimit)
    {
        EnsureProperties();
    }

    Mesh::~Mesh() = default;

    Mesh& Mesh::operator=(const Mesh& rhs)
    {
        if (this == &rhs) return *this;
        Mesh copy(rhs);
        *this = std::move(copy);
        return *this;
    }

    void Mesh::EnsureProperties()
    {
        m_VPoint = VertexProperty<glm::dvec3>(m_Vertices.GetOrAdd<glm::dvec3>("v:point", glm::dvec3(0.0)));
        m_VName = VertexProperty<std::string>(m_Vertices.GetOrAdd<std::string>("v:name", {}));
        m_VConn = VertexProperty<VertexConnectivity>(m_Vertices.GetOrAdd<VertexConnectivity>("v:connectivity", {}));
        m_HConn = HalfedgeProperty<HalfedgeConnectivity>(m_Halfedges.GetOrAdd<HalfedgeConnectivity>("h:connectivity", {}));
        m_HPeer = HalfedgeProperty<HalfedgeHandle>(m_Halfedges.GetOrAdd<HalfedgeHandle>("h:peer", {}));
        m_LConn = LoopProperty<LoopConnectivity>(m_Loops.GetOrAdd<LoopConnectivity>("l:connectivity", {}));
        m_LName = LoopProperty<std::string>(m_Loops.GetOrAdd<std::string>("l:name", {}));
        m_LIsFace = LoopProperty<bool>(m_Loops.GetOrAdd<bool>("l:face", true));

        m_VDeleted = VertexProperty<bool>(m_Vertices.GetOrAdd<bool>("v:deleted", false));
        m_EDeleted = EdgeProperty<bool>(m_Edges.GetOrAdd<bool>("e:deleted", false));
        m_LDeleted = LoopProperty<bool>(m_Loops.GetOrAdd<bool>("l:deleted", false));
    }

    void Mesh::Clear()
    {
        m_Vertices.Clear();
        m_Halfedges.Clear();
        m_Edges.Clear();
        m_Loops.Clear();

        EnsureProperties();

        m_DeletedVertices = 0;
        m_DeletedEdges = 0;
        m_DeletedLoops = 0;
        m_VertexIndex.clear();
        m_LoopIndex.clear();
        m_PeerOrder.clear();
        m_Boundary = {};
    }

    // -------------------------------------------------------------------------
    // Storage
    // -------------------------------------------------------------------------

    VertexHandle Mesh::NewVertex()
    {
        m_Vertices.Resize(VerticesSize() + 1);
        return VertexHandle{static_cast<PropertyIndex>(VerticesSize() - 1)};
    }

    HalfedgeHandle Mesh::NewEdge()
    {
        // One edge => 2 halfedges.
        m_Edges.Resize(EdgesSize() + 1);
        m_Halfedges.Resize(HalfedgesSize() + 2);
        return HalfedgeHandle{static_cast<PropertyIndex>(HalfedgesSize() - 2)};
    }

    LoopHandle Mesh::NewLoop()
    {
        m_Loops.Resize(LoopsSize() + 1);
        return LoopHandle{static_cast<PropertyIndex>(LoopsSize() - 1)};
    }

    void Mesh::SetNextHalfedge(HalfedgeHandle h, HalfedgeHandle next)
    {
        m_HConn[h].Next = next;
        m_HConn[next].Prev = h;
    }

    void Mesh::DeleteVertex(VertexHandle v)
    {
        if (m_VDeleted[v]) return;
        m_VertexIndex.erase(m_VName[v]);
        m_VDeleted[v] = true;
        ++m_DeletedVertices;
    }

    void Mesh::DeleteEdge(HalfedgeHandle h)
    {
        const EdgeHandle e = Edge(h);
        if (m_EDeleted[e]) return;
        ClearPeer(h);
        ClearPeer(OppositeHalfedge(h));
        m_EDeleted[e] = true;
        ++m_DeletedEdges;
    }

    void Mesh::DeleteLoop(LoopHandle l)
    {
        if (m_LDeleted[l]) return;
        m_LoopIndex.erase(m_LName[l]);
        m_LDeleted[l] = true;
        ++m_DeletedLoops;
    }

    // -------------------------------------------------------------------------
    // Names
    // -------------------------------------------------------------------------

    std::optional<VertexHandle> Mesh::FindVertex(std::string_view name) const
    {
        const auto it = m_VertexIndex.find(std::string(name));
        if (it == m_VertexIndex.end()) return std::nullopt;
        return it->second;
    }

    std::optional<LoopHandle> Mesh::FindLoop(std::string_view name) const
    {
        const auto it = m_LoopIndex.find(std::string(name));
        if (it == m_LoopIndex.end()) return std::nullopt;
        return it->second;
    }

    Core::Result Mesh::RenameVertex(VertexHandle v, std::string name)
    {
        if (!IsLive(v))
        {
            return Core::Err(ErrorCode::InvalidArgument, "cannot rename dead vertex {}", v.Index);
        }
        if (m_VName[v] == name) return Core::Ok();
        if (FindVertex(name))
        {
            return Core::Err(ErrorCode::DuplicateName, "vertex name \"{}\" is already taken", name);
        }
        m_VertexIndex.erase(m_VName[v]);
        m_VertexIndex.emplace(name, v);
        m_VName[v] = std::move(name);
        return Core::Ok();
    }

    std::string Mesh::UniqueLoopName(std::string name) const
    {
        if (!FindLoop(name)) return name;
        for (std::size_t k = 1;; ++k)
        {
            std::string candidate = name + "#" + std::to_string(k);
            if (!FindLoop(candidate)) return candidate;
        }
    }

    void Mesh::RenameLoop(LoopHandle l, std::string name)
    {
        if (m_LName[l] == name) return;
        m_LoopIndex.erase(m_LName[l]);
        name = UniqueLoopName(std::move(name));
        m_LoopIndex.emplace(name, l);
        m_LName[l] = std::move(name);
    }

    void Mesh::SetBoundaryLoop(LoopHandle l)
    {
        m_Boundary = l;
        if (l.IsValid()) m_LIsFace[l] = false;
    }

    // -------------------------------------------------------------------------
    // Peers
    // -------------------------------------------------------------------------

    void Mesh::SetPeers(HalfedgeHandle a, HalfedgeHandle b)
    {
        ClearPeer(a);
        ClearPeer(b);
        m_HPeer[a] = b;
        m_HPeer[b] = a;
        m_PeerOrder.push_back(a);
        if (b != a) m_PeerOrder.push_back(b);
    }

    void Mesh::ClearPeer(HalfedgeHandle h)
    {
        const HalfedgeHandle other = m_HPeer[h];
        if (!other.IsValid()) return;
        m_HPeer[h] = {};
        m_HPeer[other] = {};
        std::erase_if(m_PeerOrder, [&](HalfedgeHandle x) { return x == h || x == other; });
    }

    // -------------------------------------------------------------------------
    // Enumeration
    // -------------------------------------------------------------------------

    std::vector<VertexHandle> Mesh::Vertices() const
    {
        std::vector<VertexHandle> out;
        out.reserve(VertexCount());
        for (std::size_t i = 0; i < VerticesSize(); ++i)
        {
            const VertexHandle v{static_cast<PropertyIndex>(i)};
            if (!IsDeleted(v)) out.push_back(v);
        }
        return out;
    }

    std::vector<LoopHandle> Mesh::Loops() const
    {
        std::vector<LoopHandle> out;
        out.reserve(LoopCount());
        for (std::size_t i = 0; i < LoopsSize(); ++i)
        {
            const LoopHandle l{static_cast<PropertyIndex>(i)};
            if (!IsDeleted(l)) out.push_back(l);
        }
        return out;
    }

    std::vector<EdgeHandle> Mesh::Edges() const
    {
        std::vector<EdgeHandle> out;
        out.reserve(EdgeCount());
        for (std::size_t i = 0; i < EdgesSize(); ++i)
        {
            const EdgeHandle e{static_cast<PropertyIndex>(i)};
            if (!IsDeleted(e)) out.push_back(e);
        }
        return out;
    }

    Core::Expected<std::vector<HalfedgeHandle>> Mesh::OutgoingHalfedges(VertexHandle v) const
    {
        if (!IsLive(v))
        {
            return Core::Err(ErrorCode::InvalidArgument, "vertex {} is not live", v.Index);
        }

        std::vector<HalfedgeHandle> out;
        const HalfedgeHandle start = Halfedge(v);
        if (!start.IsValid()) return out;

        HalfedgeHandle h = start;
        do
        {
            out.push_back(h);
            if (out.size() > m_NeighborhoodLimit)
            {
                return Core::Err(ErrorCode::NeighborhoodTooLarge,
                                 "too many halfedges around vertex {}", m_VName[v]);
            }
            h = CWRotatedHalfedge(h);
        } while (h != start && h.IsValid());

        return out;
    }

    Core::Expected<std::vector<HalfedgeHandle>> Mesh::LoopHalfedges(LoopHandle l) const
    {
        if (!IsLive(l))
        {
            return Core::Err(ErrorCode::InvalidArgument, "loop {} is not live", l.Index);
        }

        std::vector<HalfedgeHandle> out;
        const HalfedgeHandle start = Halfedge(l);
        if (!start.IsValid()) return out;

        HalfedgeHandle h = start;
        do
        {
            out.push_back(h);
            if (out.size() > m_NeighborhoodLimit)
            {
                return Core::Err(ErrorCode::NeighborhoodTooLarge,
                                 "too many halfedges in loop {}", m_LName[l]);
            }
            h = NextHalfedge(h);
        } while (h != start && h.IsValid());

        return out;
    }

    Core::Expected<std::size_t> Mesh::Valence(LoopHandle l) const
    {
        auto halfedges = LoopHalfedges(l);
        if (!halfedges) return std::unexpected(halfedges.error());
        return halfedges->size();
    }

    Core::Expected<HalfedgeHandle> Mesh::FindHalfedge(VertexHandle from, VertexHandle to) const
    {
        auto outgoing = OutgoingHalfedges(from);
        if (!outgoing) return std::unexpected(outgoing.error());

        HalfedgeHandle found{};
        std::size_t count = 0;
        for (HalfedgeHandle h : *outgoing)
        {
            if (ToVertex(h) == to)
            {
                found = h;
                ++count;
            }
        }
        if (count != 1)
        {
            return Core::Err(ErrorCode::NotUnique, "found {} halfedges from {} to {}",
                             count, m_VName[from], IsValid(to) ? m_VName[to] : std::string("?"));
        }
        return found;
    }

    // =========================================================================
    // Record creation
    // =========================================================================

    Core::Expected<VertexHandle> Mesh::MakeVertex(std::string name)
    {
        if (FindVertex(name))
        {
            return Core::Err(ErrorCode::DuplicateName, "vertex name \"{}\" is already taken", name);
        }
        const VertexHandle v = NewVertex();
        m_VertexIndex.emplace(name, v);
        m_VName[v] = std::move(name);
        return v;
    }

    LoopHandle Mesh::MakeLoop(std::string name, bool isFace)
    {
        const LoopHandle l = NewLoop();
        name = UniqueLoopName(std::move(name));
        m_LoopIndex.emplace(name, l);
        m_LName[l] = std::move(name);
        m_LIsFace[l] = isFace;
        return l;
    }

    HalfedgePair Mesh::MakeEdge(LoopHandle loopA, LoopHandle loopB, VertexHandle vA, VertexHandle vB)
    {
        const HalfedgeHandle h0 = NewEdge();
        const HalfedgeHandle h1 = OppositeHalfedge(h0);

        m_HConn[h0].Vertex = vB;
        m_HConn[h0].Loop = loopA;
        m_HConn[h1].Vertex = vA;
        m_HConn[h1].Loop = loopB;

        m_VConn[vA].Halfedge = h0;
        m_LConn[loopA].Halfedge = h0;
        m_VConn[vB].Halfedge = h1;
        m_LConn[loopB].Halfedge = h1;

        return {h0, h1};
    }

    // =========================================================================
    // AddCore / DropCore
    // =========================================================================

    Core::Expected<HalfedgePair> Mesh::AddCore()
    {
        auto v = MakeVertex("core");
        if (!v) return std::unexpected(v.error());

        const LoopHandle l0 = MakeLoop("core1", true);
        const LoopHandle l1 = MakeLoop("core2", true);
        const HalfedgePair e = MakeEdge(l0, l1, *v, *v);
        SetNextHalfedge(e.First, e.First);
        SetNextHalfedge(e.Second, e.Second);
        m_VConn[*v].Halfedge = e.First;
        m_LConn[l0].Halfedge = e.First;
        m_LConn[l1].Halfedge = e.Second;
        return e;
    }

    Core::Result Mesh::DropCore(VertexHandle v)
    {
        if (!IsLive(v))
        {
            return Core::Err(ErrorCode::InvalidArgument, "vertex {} is not live", v.Index);
        }

        const HalfedgeHandle h = Halfedge(v);
        const HalfedgeHandle t = OppositeHalfedge(h);
        if (!h.IsValid() || NextHalfedge(h) != h || NextHalfedge(t) != t || ToVertex(h) != v)
        {
            return Core::Err(ErrorCode::TopologyViolation, "vertex {} is not a core", m_VName[v]);
        }

        const LoopHandle l0 = Loop(h);
        const LoopHandle l1 = Loop(t);
        DeleteEdge(h);
        DeleteVertex(v);
        DeleteLoop(l0);
        DeleteLoop(l1);
        return Core::Ok();
    }

    // =========================================================================
    // SplitVertex
    // =========================================================================
    //
    // Incoming halfedges of v in rotation order (h -> Prev(Opposite(h))):
    //
    //        ... h1 ... | h0 ...
    //     [   v1 arc   ]|[ v0 arc ]
    //
    // The new edge runs v0 -> v1; its first halfedge follows h0 in Loop(h0),
    // its second follows h1 in Loop(h1).
    Core::Expected<HalfedgePair> Mesh::SplitVertex(HalfedgeHandle h0, HalfedgeHandle h1, SplitSide create)
    {
        if (!IsLive(h0) || !IsLive(h1))
        {
            return Core::Err(ErrorCode::InvalidArgument, "SplitVertex: dead halfedge");
        }

        const VertexHandle v = ToVertex(h0);
        if (ToVertex(h1) != v)
        {
            return Core::Err(ErrorCode::TopologyViolation,
                             "SplitVertex: halfedges point to different vertices {} and {}",
                             m_VName[v], m_VName[ToVertex(h1)]);
        }

        // Walk once without mutating to bound the arc.
        std::vector<HalfedgeHandle> arc0;
        std::vector<HalfedgeHandle> arc1;
        {
            HalfedgeHandle h = h0;
            do
            {
                arc0.push_back(h);
                h = PrevHalfedge(OppositeHalfedge(h));
                if (arc0.size() > m_NeighborhoodLimit)
                {
                    return Core::Err(ErrorCode::NeighborhoodTooLarge, "SplitVertex: runaway walk around {}", m_VName[v]);
                }
            } while (h != h1);

            while (h != h0)
            {
                arc1.push_back(h);
                h = PrevHalfedge(OppositeHalfedge(h));
                if (arc1.size() > m_NeighborhoodLimit)
                {
                    return Core::Err(ErrorCode::NeighborhoodTooLarge, "SplitVertex: runaway walk around {}", m_VName[v]);
                }
            }
        }

        const std::string baseName = m_VName[v];
        const bool makeV0 = create != SplitSide::Right;
        const bool makeV1 = create != SplitSide::Left;
        if ((makeV0 && FindVertex(baseName + ".0")) || (makeV1 && FindVertex(baseName + ".1")))
        {
            return Core::Err(ErrorCode::DuplicateName, "SplitVertex: child name of {} is already taken", baseName);
        }

        VertexHandle v0 = v;
        VertexHandle v1 = v;
        if (makeV0)
        {
            auto created = MakeVertex(baseName + ".0");
            if (!created) return std::unexpected(created.error());
            v0 = *created;
        }
        if (makeV1)
        {
            auto created = MakeVertex(baseName + ".1");
            if (!created) return std::unexpected(created.error());
            v1 = *created;
        }

        for (HalfedgeHandle h : arc0) m_HConn[h].Vertex = v0;
        for (HalfedgeHandle h : arc1) m_HConn[h].Vertex = v1;

        const HalfedgePair e = MakeEdge(Loop(h0), Loop(h1), v0, v1);

        const HalfedgeHandle n0 = NextHalfedge(h0);
        SetNextHalfedge(h0, e.First);
        SetNextHalfedge(e.First, n0);

        const HalfedgeHandle n1 = NextHalfedge(h1);
        SetNextHalfedge(h1, e.Second);
        SetNextHalfedge(e.Second, n1);

        if (create == SplitSide::Both)
        {
            Position(v0) = Position(v);
            Position(v1) = Position(v);
            DeleteVertex(v);
        }

        return e;
    }

    // =========================================================================
    // SplitLoop
    // =========================================================================
    Core::Expected<HalfedgePair> Mesh::SplitLoop(HalfedgeHandle h0, HalfedgeHandle h1, SplitSide create)
    {
        if (!IsLive(h0) || !IsLive(h1))
        {
            return Core::Err(ErrorCode::InvalidArgument, "SplitLoop: dead halfedge");
        }

        const LoopHandle l = Loop(h0);
        if (Loop(h1) != l)
        {
            return Core::Err(ErrorCode::TopologyViolation, "SplitLoop: halfedges lie in different loops {} and {}",
                             m_LName[l], m_LName[Loop(h1)]);
        }

        std::vector<HalfedgeHandle> arc0;
        std::vector<HalfedgeHandle> arc1;
        {
            HalfedgeHandle h = h0;
            do
            {
                arc0.push_back(h);
                h = PrevHalfedge(h);
                if (arc0.size() > m_NeighborhoodLimit)
                {
                    return Core::Err(ErrorCode::NeighborhoodTooLarge, "SplitLoop: runaway walk in {}", m_LName[l]);
                }
            } while (h != h1);

            while (h != h0)
            {
                arc1.push_back(h);
                h = PrevHalfedge(h);
                if (arc1.size() > m_NeighborhoodLimit)
                {
                    return Core::Err(ErrorCode::NeighborhoodTooLarge, "SplitLoop: runaway walk in {}", m_LName[l]);
                }
            }
        }

        const std::string baseName = m_LName[l];
        const bool isFace = m_LIsFace[l];
        const LoopHandle l0 = create == SplitSide::Right ? l : MakeLoop(baseName + ".0", isFace);
        const LoopHandle l1 = create == SplitSide::Left ? l : MakeLoop(baseName + ".1", isFace);

        for (HalfedgeHandle h : arc0) m_HConn[h].Loop = l0;
        for (HalfedgeHandle h : arc1) m_HConn[h].Loop = l1;

        const HalfedgePair e = MakeEdge(l0, l1, ToVertex(h0), ToVertex(h1));

        const HalfedgeHandle n0 = NextHalfedge(h0);
        const HalfedgeHandle n1 = NextHalfedge(h1);
        SetNextHalfedge(h0, e.First);
        SetNextHalfedge(e.First, n1);
        if (h0 == h1)
        {
            SetNextHalfedge(e.Second, e.Second);
        }
        else
        {
            SetNextHalfedge(h1, e.Second);
            SetNextHalfedge(e.Second, n0);
        }

        if (create == SplitSide::Both)
        {
            if (m_Boundary == l) m_Boundary = {};
            DeleteLoop(l);
        }

        return e;
    }

    Core::Expected<HalfedgePair> Mesh::SplitEdgeAcross(HalfedgeHandle h)
    {
        if (!IsLive(h))
        {
            return Core::Err(ErrorCode::InvalidArgument, "SplitEdgeAcross: dead halfedge");
        }
        return SplitVertex(PrevHalfedge(OppositeHalfedge(h)), h, SplitSide::Left);
    }

    Core::Expected<HalfedgePair> Mesh::SplitEdgeAlong(HalfedgeHandle h)
    {
        if (!IsLive(h))
        {
            return Core::Err(ErrorCode::InvalidArgument, "SplitEdgeAlong: dead halfedge");
        }
        return SplitLoop(h, PrevHalfedge(h), SplitSide::Left);
    }

    // =========================================================================
    // ContractEdge
    // =========================================================================
    //
    // Three shapes are handled:
    //   - Opposite(h) == Next(h): ToVertex(h) is a dangling end; both sides of
    //     the edge are the same loop, which is stitched around it.
    //   - Opposite(h) == Prev(h): mirror case at the other side.
    //   - otherwise both adjacent loops are relinked around the gap.
    Core::Expected<VertexHandle> Mesh::ContractEdge(HalfedgeHandle h)
    {
        if (!IsLive(h))
        {
            return Core::Err(ErrorCode::InvalidArgument, "ContractEdge: dead halfedge");
        }

        const HalfedgeHandle t = OppositeHalfedge(h);
        const VertexHandle to = ToVertex(h);
        const VertexHandle from = ToVertex(t);
        const LoopHandle loop = Loop(h);
        const LoopHandle twinLoop = Loop(t);
        const HalfedgeHandle prev = PrevHalfedge(h);
        const HalfedgeHandle next = NextHalfedge(h);
        const HalfedgeHandle twinPrev = PrevHalfedge(t);
        const HalfedgeHandle twinNext = NextHalfedge(t);

        if (to == from)
        {
            return Core::Err(ErrorCode::TopologyViolation, "ContractEdge: self-loop at {}", m_VName[to]);
        }
        if (t == next && t == prev)
        {
            return Core::Err(ErrorCode::TopologyViolation, "ContractEdge: isolated edge {} - {}",
                             m_VName[from], m_VName[to]);
        }
        if ((t == next || t == prev) && loop != twinLoop)
        {
            return Core::Err(ErrorCode::TopologyViolation, "ContractEdge: dangling edge {} - {} between loops {} and {}",
                             m_VName[from], m_VName[to], m_LName[loop], m_LName[twinLoop]);
        }

        auto outgoing = OutgoingHalfedges(to);
        if (!outgoing) return std::unexpected(outgoing.error());

        for (HalfedgeHandle o : *outgoing)
        {
            m_HConn[OppositeHalfedge(o)].Vertex = from;
        }

        if (t == next)
        {
            SetNextHalfedge(prev, twinNext);
            m_LConn[loop].Halfedge = twinNext;
            m_VConn[from].Halfedge = twinNext;
        }
        else if (t == prev)
        {
            SetNextHalfedge(twinPrev, next);
            m_LConn[loop].Halfedge = next;
            m_VConn[from].Halfedge = next;
        }
        else
        {
            SetNextHalfedge(prev, next);
            SetNextHalfedge(twinPrev, twinNext);
            m_LConn[loop].Halfedge = next;
            m_LConn[twinLoop].Halfedge = twinNext;
            m_VConn[from].Halfedge = next;
        }

        DeleteVertex(to);
        DeleteEdge(h);
        return from;
    }

    // =========================================================================
    // DropEdge
    // =========================================================================
    Core::Expected<LoopHandle> Mesh::DropEdge(HalfedgeHandle h)
    {
        if (!IsLive(h))
        {
            return Core::Err(ErrorCode::InvalidArgument, "DropEdge: dead halfedge");
        }

        const HalfedgeHandle t = OppositeHalfedge(h);
        const VertexHandle to = ToVertex(h);
        const VertexHandle from = ToVertex(t);
        const LoopHandle loop = Loop(h);
        const LoopHandle twinLoop = Loop(t);
        const HalfedgeHandle prev = PrevHalfedge(h);
        const HalfedgeHandle next = NextHalfedge(h);
        const HalfedgeHandle twinPrev = PrevHalfedge(t);
        const HalfedgeHandle twinNext = NextHalfedge(t);

        // Also rejects dangling edges, whose two sides always share a loop.
        if (loop == twinLoop)
        {
            return Core::Err(ErrorCode::TopologyViolation, "DropEdge: both sides of {} - {} lie in loop {}",
                             m_VName[from], m_VName[to], m_LName[loop]);
        }

        std::vector<HalfedgeHandle> absorbed;
        for (HalfedgeHandle x = next; x != h; x = NextHalfedge(x))
        {
            absorbed.push_back(x);
            if (absorbed.size() > m_NeighborhoodLimit)
            {
                return Core::Err(ErrorCode::NeighborhoodTooLarge, "DropEdge: runaway walk in {}", m_LName[loop]);
            }
        }

        for (HalfedgeHandle x : absorbed) m_HConn[x].Loop = twinLoop;

        SetNextHalfedge(twinPrev, next);
        SetNextHalfedge(prev, twinNext);
        m_VConn[from].Halfedge = twinNext;
        m_VConn[to].Halfedge = next;
        m_LConn[twinLoop].Halfedge = twinNext;

        if (m_Boundary == loop) m_Boundary = {};
        DeleteLoop(loop);
        DeleteEdge(h);
        return twinLoop;
    }

    // =========================================================================
    // Check
    // =========================================================================

    Core::Result Mesh::CheckHalfedge(HalfedgeHandle h) const
    {
        if (!IsValid(h) || IsDeleted(h))
        {
            return Core::Err(ErrorCode::InvariantViolation, "halfedge {} is dead", h.Index);
        }
        const VertexHandle to = ToVertex(h);
        if (!IsValid(to) || IsDeleted(to))
        {
            return Core::Err(ErrorCode::InvariantViolation, "halfedge {} points to a dead vertex", h.Index);
        }
        const LoopHandle loop = Loop(h);
        if (!IsValid(loop) || IsDeleted(loop))
        {
            return Core::Err(ErrorCode::InvariantViolation, "halfedge {} -> {} lies in a dead loop", h.Index, m_VName[to]);
        }
        const HalfedgeHandle next = NextHalfedge(h);
        const HalfedgeHandle prev = PrevHalfedge(h);
        if (!IsValid(next) || !IsValid(prev) || PrevHalfedge(next) != h || NextHalfedge(prev) != h)
        {
            return Core::Err(ErrorCode::InvariantViolation, "halfedge {} -> {} in loop {} has broken next/prev links",
                             h.Index, m_VName[to], m_LName[loop]);
        }
        if (IsDeleted(next) || IsDeleted(prev))
        {
            return Core::Err(ErrorCode::InvariantViolation, "halfedge {} -> {} links to a dead halfedge", h.Index, m_VName[to]);
        }
        if (Loop(next) != loop)
        {
            return Core::Err(ErrorCode::InvariantViolation, "halfedge {} -> {} and its successor disagree on the loop",
                             h.Index, m_VName[to]);
        }
        return Core::Ok();
    }

    Core::Result Mesh::Check() const
    {
        std::unordered_set<std::string> names;

        for (VertexHandle v : Vertices())
        {
            if (!names.insert(m_VName[v]).second)
            {
                return Core::Err(ErrorCode::InvariantViolation, "duplicate vertex name {}", m_VName[v]);
            }
            const auto found = FindVertex(m_VName[v]);
            if (!found || *found != v)
            {
                return Core::Err(ErrorCode::InvariantViolation, "vertex {} missing from the name index", m_VName[v]);
            }

            auto outgoing = OutgoingHalfedges(v);
            if (!outgoing) return std::unexpected(outgoing.error());
            if (outgoing->empty())
            {
                return Core::Err(ErrorCode::InvariantViolation, "vertex {} has no halfedge", m_VName[v]);
            }
            for (HalfedgeHandle h : *outgoing)
            {
                if (auto ok = CheckHalfedge(h); !ok) return ok;
                if (FromVertex(h) != v)
                {
                    return Core::Err(ErrorCode::InvariantViolation, "halfedge {} around {} starts at {}",
                                     h.Index, m_VName[v], m_VName[FromVertex(h)]);
                }
            }
        }

        names.clear();
        for (LoopHandle l : Loops())
        {
            if (!names.insert(m_LName[l]).second)
            {
                return Core::Err(ErrorCode::InvariantViolation, "duplicate loop name {}", m_LName[l]);
            }

            auto halfedges = LoopHalfedges(l);
            if (!halfedges) return std::unexpected(halfedges.error());
            if (halfedges->empty())
            {
                return Core::Err(ErrorCode::InvariantViolation, "loop {} has no halfedge", m_LName[l]);
            }
            for (HalfedgeHandle h : *halfedges)
            {
                if (auto ok = CheckHalfedge(h); !ok) return ok;
                if (Loop(h) != l)
                {
                    return Core::Err(ErrorCode::InvariantViolation, "halfedge {} reached from loop {} belongs to {}",
                                     h.Index, m_LName[l], m_LName[Loop(h)]);
                }
            }
        }

        // Catches cycles no vertex or loop anchor reaches.
        for (EdgeHandle e : Edges())
        {
            for (unsigned int i = 0; i < 2; ++i)
            {
                if (auto ok = CheckHalfedge(Halfedge(e, i)); !ok) return ok;
            }
        }

        if (m_Boundary.IsValid() && IsDeleted(m_Boundary))
        {
            return Core::Err(ErrorCode::InvariantViolation, "boundary loop {} is dead", m_Boundary.Index);
        }

        return Core::Ok();
    }
}
