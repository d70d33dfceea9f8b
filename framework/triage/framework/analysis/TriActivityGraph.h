/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriActivityGraph.h
 * Contains the definition of the TriActivityGraph class.
 */

#ifndef _TRI_ACTIVITYGRAPH_H
#define _TRI_ACTIVITYGRAPH_H

#include "triage/framework/framework_i.h"
#include "triage/framework/artifacts/TriArtifact.h"
#include "TriAnomalySettings.h"

#include <map>
#include <vector>

/**
 * Relations between two activities.  An edge carries a bit mask of these.
 */
enum TRI_EDGE_KIND {
    TRI_EDGE_SAME_SOURCE = 1,       ///< extracted from the same file
    TRI_EDGE_SAME_SESSION = 2,      ///< same user within the session window
    TRI_EDGE_SAME_IDENTITY = 4,     ///< same device serial, program or target
    TRI_EDGE_TEMPORAL = 8           ///< close in time
};

/**
 * Undirected graph over the timestamped artifacts of a case.  Nodes are
 * kept in timeline order.  Members of a source, session or identity group
 * are chained in time order rather than connected pairwise, which keeps
 * the edge count linear in the group size.
 */
class TRI_FRAMEWORK_API TriActivityGraph
{
public:
    typedef std::map<size_t, unsigned int> Neighbors;

    /**
     * Build the graph.  Artifacts without a timestamp are dropped.
     */
    TriActivityGraph(const std::vector<TriArtifact> &artifacts, const TriAnomalySettings &settings);

    size_t size() const { return m_nodes.size(); }
    const TriArtifact &getNode(size_t index) const;
    const Neighbors &getNeighbors(size_t index) const;

    /// Number of undirected edges.
    size_t edgeCount() const;
    /// Number of undirected edges carrying the given relation.
    size_t edgeCount(TRI_EDGE_KIND kind) const;

    /// Session owner of an artifact (lower case profile or user name), empty if none.
    static std::string sessionOwner(const TriArtifact &artifact);
    /// Device or program identity of an artifact, empty if none.
    static std::string identity(const TriArtifact &artifact);

private:
    void addEdge(size_t a, size_t b, TRI_EDGE_KIND kind);
    void chain(const std::map<std::string, std::vector<size_t> > &groups, TRI_EDGE_KIND kind, int64_t maxGap);
    void linkTemporal(int64_t window, unsigned int maxNeighbors);

    std::vector<TriArtifact> m_nodes;
    std::vector<Neighbors> m_adjacency;
};

#endif
