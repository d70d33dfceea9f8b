/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriTimelineBuilder.cpp
 * Contains the implementation of the TriTimelineBuilder class.
 */

#include "TriTimelineBuilder.h"
#include "triage/framework/utilities/TriUtilities.h"

#include <algorithm>
#include <ostream>

namespace
{
    class EventCollector : public TriArtifactVisitor
    {
    public:
        explicit EventCollector(std::vector<TriTimelineEvent> &events) : m_events(events) {}

        virtual bool visit(const TriArtifact &artifact)
        {
            if (artifact.hasTimestamp())
                m_events.push_back(TriTimelineBuilder::toEvent(artifact));
            return true;
        }

    private:
        std::vector<TriTimelineEvent> &m_events;
    };
}

TriTimelineFilter::TriTimelineFilter()
    : hasStartTime(false), startTime(0), hasEndTime(false), endTime(0), offset(0), limit(0)
{
}

TriTimelineBuilder::TriTimelineBuilder(const TriArtifactStore &store)
    : m_store(store)
{
}

TriTimelineEvent TriTimelineBuilder::toEvent(const TriArtifact &artifact)
{
    TriTimelineEvent event;
    event.caseId = artifact.getCaseId();
    event.timestamp = artifact.getTimestamp();
    event.type = artifact.getType();
    event.typeName = TriArtifactTypes::getName(artifact.getType());
    event.description = artifact.getDescription();
    event.naturalKey = artifact.getNaturalKey();
    event.artifactId = artifact.getId();
    return event;
}

bool TriTimelineBuilder::eventLess(const TriTimelineEvent &a, const TriTimelineEvent &b)
{
    if (a.timestamp != b.timestamp)
        return a.timestamp < b.timestamp;
    if (a.typeName != b.typeName)
        return a.typeName < b.typeName;
    return a.naturalKey < b.naturalKey;
}

std::vector<TriTimelineEvent> TriTimelineBuilder::build(const std::string &caseId,
    const TriTimelineFilter &filter) const
{
    std::vector<TRI_ARTIFACT_TYPE> types = filter.types.empty() ? TriArtifactTypes::all() : filter.types;

    TriArtifactFilter query;
    query.timestampedOnly = true;
    query.hasStartTime = filter.hasStartTime;
    query.startTime = filter.startTime;
    query.hasEndTime = filter.hasEndTime;
    query.endTime = filter.endTime;

    std::vector<TriTimelineEvent> events;
    EventCollector collector(events);
    for (std::vector<TRI_ARTIFACT_TYPE>::const_iterator it = types.begin(); it != types.end(); ++it)
        m_store.query(caseId, *it, query, collector);

    std::sort(events.begin(), events.end(), eventLess);

    if (filter.offset >= events.size())
        return std::vector<TriTimelineEvent>();
    std::vector<TriTimelineEvent>::iterator first = events.begin() + filter.offset;
    std::vector<TriTimelineEvent>::iterator last = events.end();
    if (filter.limit && filter.limit < (uint64_t)(last - first))
        last = first + filter.limit;
    return std::vector<TriTimelineEvent>(first, last);
}

uint64_t TriTimelineBuilder::countEvents(const std::string &caseId) const
{
    return build(caseId).size();
}

namespace
{
    std::string escapeField(const std::string &field, bool escapeSeparator)
    {
        std::string escaped;
        escaped.reserve(field.size());
        for (std::string::const_iterator c = field.begin(); c != field.end(); ++c) {
            if (*c == '\\')
                escaped += "\\\\";
            else if (*c == '\n')
                escaped += "\\n";
            else if (*c == '\r')
                escaped += "\\r";
            else if (*c == '|' && escapeSeparator)
                escaped += "\\|";
            else
                escaped += *c;
        }
        return escaped;
    }
}

void TriTimelineBuilder::write(std::ostream &out, const std::vector<TriTimelineEvent> &events)
{
    for (std::vector<TriTimelineEvent>::const_iterator it = events.begin(); it != events.end(); ++it) {
        // the natural key is written last and keeps its own '|' separators
        out << TriUtilities::formatTime(it->timestamp) << '|' << it->typeName << '|'
            << escapeField(it->description, true) << '|' << escapeField(it->naturalKey, false) << '\n';
    }
}
