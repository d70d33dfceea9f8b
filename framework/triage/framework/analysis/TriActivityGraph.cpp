/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriActivityGraph.h"
#include "triage/framework/timeline/TriTimelineBuilder.h"
#include "triage/framework/utilities/TriException.h"
#include "triage/framework/utilities/TriUtilities.h"

#include <algorithm>
#include <sstream>

namespace
{
    bool timelineLess(const TriArtifact &a, const TriArtifact &b)
    {
        return TriTimelineBuilder::eventLess(TriTimelineBuilder::toEvent(a), TriTimelineBuilder::toEvent(b));
    }

    const char *IDENTITY_ATTRIBUTES[] = { "serial", "executable", "program", "target_path" };
}

TriActivityGraph::TriActivityGraph(const std::vector<TriArtifact> &artifacts, const TriAnomalySettings &settings)
{
    for (std::vector<TriArtifact>::const_iterator it = artifacts.begin(); it != artifacts.end(); ++it) {
        if (it->hasTimestamp())
            m_nodes.push_back(*it);
    }
    std::stable_sort(m_nodes.begin(), m_nodes.end(), timelineLess);
    m_adjacency.resize(m_nodes.size());

    std::map<std::string, std::vector<size_t> > sources;
    std::map<std::string, std::vector<size_t> > sessions;
    std::map<std::string, std::vector<size_t> > identities;

    // Nodes are in time order, so each group list is too.
    for (size_t i = 0; i < m_nodes.size(); ++i) {
        const TriArtifact &node = m_nodes[i];
        if (!node.getSourcePath().empty())
            sources[TriUtilities::toLower(node.getSourcePath())].push_back(i);

        std::string owner = sessionOwner(node);
        if (!owner.empty())
            sessions[owner].push_back(i);

        std::string id = identity(node);
        if (!id.empty())
            identities[id].push_back(i);
    }

    chain(sources, TRI_EDGE_SAME_SOURCE, -1);
    chain(sessions, TRI_EDGE_SAME_SESSION, settings.sessionWindowSeconds);
    chain(identities, TRI_EDGE_SAME_IDENTITY, -1);
    linkTemporal(settings.temporalAdjacencySeconds, settings.maxTemporalNeighbors);
}

const TriArtifact &TriActivityGraph::getNode(size_t index) const
{
    if (index >= m_nodes.size()) {
        std::stringstream msg;
        msg << "TriActivityGraph::getNode: node " << index << " out of range (" << m_nodes.size() << " nodes)";
        throw TriOutOfRangeException(msg.str());
    }
    return m_nodes[index];
}

const TriActivityGraph::Neighbors &TriActivityGraph::getNeighbors(size_t index) const
{
    if (index >= m_adjacency.size()) {
        std::stringstream msg;
        msg << "TriActivityGraph::getNeighbors: node " << index << " out of range (" << m_adjacency.size() << " nodes)";
        throw TriOutOfRangeException(msg.str());
    }
    return m_adjacency[index];
}

size_t TriActivityGraph::edgeCount() const
{
    size_t count = 0;
    for (std::vector<Neighbors>::const_iterator it = m_adjacency.begin(); it != m_adjacency.end(); ++it)
        count += it->size();
    return count / 2;
}

size_t TriActivityGraph::edgeCount(TRI_EDGE_KIND kind) const
{
    size_t count = 0;
    for (std::vector<Neighbors>::const_iterator it = m_adjacency.begin(); it != m_adjacency.end(); ++it) {
        for (Neighbors::const_iterator edge = it->begin(); edge != it->end(); ++edge) {
            if (edge->second & kind)
                ++count;
        }
    }
    return count / 2;
}

std::string TriActivityGraph::sessionOwner(const TriArtifact &artifact)
{
    std::string owner = artifact.getString("profile");
    if (owner.empty())
        owner = artifact.getString("user_name");
    return TriUtilities::toLower(owner);
}

std::string TriActivityGraph::identity(const TriArtifact &artifact)
{
    for (size_t i = 0; i < sizeof(IDENTITY_ATTRIBUTES) / sizeof(IDENTITY_ATTRIBUTES[0]); ++i) {
        std::string value = artifact.getString(IDENTITY_ATTRIBUTES[i]);
        if (!value.empty())
            return std::string(IDENTITY_ATTRIBUTES[i]) + ":" + TriUtilities::toLower(value);
    }
    return "";
}

void TriActivityGraph::addEdge(size_t a, size_t b, TRI_EDGE_KIND kind)
{
    if (a == b)
        return;
    m_adjacency[a][b] |= kind;
    m_adjacency[b][a] |= kind;
}

void TriActivityGraph::chain(const std::map<std::string, std::vector<size_t> > &groups, TRI_EDGE_KIND kind,
    int64_t maxGap)
{
    for (std::map<std::string, std::vector<size_t> >::const_iterator group = groups.begin(); group != groups.end(); ++group) {
        const std::vector<size_t> &members = group->second;
        for (size_t i = 1; i < members.size(); ++i) {
            int64_t gap = m_nodes[members[i]].getTimestamp() - m_nodes[members[i - 1]].getTimestamp();
            if (maxGap < 0 || gap <= maxGap)
                addEdge(members[i - 1], members[i], kind);
        }
    }
}

void TriActivityGraph::linkTemporal(int64_t window, unsigned int maxNeighbors)
{
    for (size_t i = 0; i < m_nodes.size(); ++i) {
        unsigned int linked = 0;
        for (size_t j = i + 1; j < m_nodes.size() && linked < maxNeighbors; ++j) {
            if (m_nodes[j].getTimestamp() - m_nodes[i].getTimestamp() > window)
                break;
            addEdge(i, j, TRI_EDGE_TEMPORAL);
            ++linked;
        }
    }
}
