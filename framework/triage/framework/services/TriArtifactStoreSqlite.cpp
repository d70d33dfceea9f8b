/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriArtifactStoreSqlite.cpp
 * Contains the implementation of the TriArtifactStoreSqlite class.
 */

#include "TriArtifactStoreSqlite.h"
#include "TriServices.h"
#include "triage/framework/utilities/TriException.h"

#include "Poco/Thread.h"

#include <sstream>

#define STORE_MAX_RETRY_COUNT 50    // how many times will we retry a locked database
#define STORE_RETRY_WAIT 100        // how long (in milliseconds) to wait between retries

namespace
{
    const char * const REPORT_INDICATOR = "indicator";
    const char * const REPORT_RECOMMENDATION = "recommendation";

    /// LIKE pattern matching the text anywhere, with '\' as escape character.
    std::string likePattern(const std::string &text)
    {
        std::string pattern = "%";
        for (std::string::const_iterator it = text.begin(); it != text.end(); ++it) {
            if (*it == '%' || *it == '_' || *it == '\\')
                pattern += '\\';
            pattern += *it;
        }
        pattern += "%";
        return pattern;
    }
}

TriArtifactStoreSqlite::Statement::Statement(sqlite3 *db, const std::string &sql)
    : m_db(db), m_stmt(NULL)
{
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &m_stmt, NULL) != SQLITE_OK) {
        std::stringstream msg;
        msg << "TriArtifactStoreSqlite - Error preparing \"" << sql << "\": " << sqlite3_errmsg(m_db);
        LOGERROR(msg.str());
        throw TriStoreException(msg.str());
    }
}

TriArtifactStoreSqlite::Statement::~Statement()
{
    sqlite3_finalize(m_stmt);
}

bool TriArtifactStoreSqlite::Statement::step()
{
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;

    std::stringstream msg;
    msg << "TriArtifactStoreSqlite - Error executing \"" << sqlite3_sql(m_stmt) << "\": " << sqlite3_errmsg(m_db);
    LOGERROR(msg.str());
    throw TriStoreException(msg.str());
}

void TriArtifactStoreSqlite::Statement::checkBind(int rc)
{
    if (rc != SQLITE_OK) {
        std::stringstream msg;
        msg << "TriArtifactStoreSqlite - Error binding parameter: " << sqlite3_errmsg(m_db);
        throw TriStoreException(msg.str());
    }
}

void TriArtifactStoreSqlite::Statement::bindText(int index, const std::string &value)
{
    checkBind(sqlite3_bind_text(m_stmt, index, value.c_str(), (int)value.size(), SQLITE_TRANSIENT));
}

void TriArtifactStoreSqlite::Statement::bindInt64(int index, int64_t value)
{
    checkBind(sqlite3_bind_int64(m_stmt, index, (sqlite3_int64)value));
}

void TriArtifactStoreSqlite::Statement::bindDouble(int index, double value)
{
    checkBind(sqlite3_bind_double(m_stmt, index, value));
}

void TriArtifactStoreSqlite::Statement::bindNull(int index)
{
    checkBind(sqlite3_bind_null(m_stmt, index));
}

bool TriArtifactStoreSqlite::Statement::isNull(int column) const
{
    return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
}

std::string TriArtifactStoreSqlite::Statement::getText(int column) const
{
    const unsigned char *text = sqlite3_column_text(m_stmt, column);
    if (text == NULL)
        return std::string();
    return std::string((const char *)text, sqlite3_column_bytes(m_stmt, column));
}

int64_t TriArtifactStoreSqlite::Statement::getInt64(int column) const
{
    return (int64_t)sqlite3_column_int64(m_stmt, column);
}

double TriArtifactStoreSqlite::Statement::getDouble(int column) const
{
    return sqlite3_column_double(m_stmt, column);
}

TriArtifactStoreSqlite::Transaction::Transaction(TriArtifactStoreSqlite &store)
    : m_store(store), m_done(false)
{
    m_store.exec("BEGIN IMMEDIATE");
}

TriArtifactStoreSqlite::Transaction::~Transaction()
{
    if (!m_done) {
        if (sqlite3_exec(m_store.m_db, "ROLLBACK", NULL, NULL, NULL) != SQLITE_OK) {
            std::stringstream msg;
            msg << "TriArtifactStoreSqlite - ROLLBACK Error: " << sqlite3_errmsg(m_store.m_db);
            LOGERROR(msg.str());
        }
    }
}

void TriArtifactStoreSqlite::Transaction::commit()
{
    m_store.exec("COMMIT");
    m_done = true;
}

TriArtifactStoreSqlite::TriArtifactStoreSqlite(const std::string &dbFilePath)
    : m_dbFilePath(dbFilePath), m_db(NULL)
{
}

TriArtifactStoreSqlite::~TriArtifactStoreSqlite()
{
    close();
}

void TriArtifactStoreSqlite::close()
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    if (m_db) {
        if (sqlite3_close(m_db) != SQLITE_OK) {
            std::stringstream msg;
            msg << "TriArtifactStoreSqlite::close - Error closing database: " << sqlite3_errmsg(m_db);
            LOGERROR(msg.str());
        }
        m_db = NULL;
    }
}

/*
 * If the database file exists this method will open it otherwise
 * it will create a new database.  The busy handler retries statements
 * while another process holds the database lock.
 */
void TriArtifactStoreSqlite::open()
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    if (m_db)
        return;

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(m_dbFilePath.c_str(), &m_db, flags, NULL) != SQLITE_OK) {
        std::stringstream msg;
        msg << "TriArtifactStoreSqlite::open - Can't open database " << m_dbFilePath << ": "
            << (m_db ? sqlite3_errmsg(m_db) : "out of memory");
        LOGERROR(msg.str());
        sqlite3_close(m_db);
        m_db = NULL;
        throw TriStoreException(msg.str());
    }

    if (sqlite3_busy_handler(m_db, TriArtifactStoreSqlite::busyHandler, m_db) != SQLITE_OK) {
        std::stringstream msg;
        msg << "TriArtifactStoreSqlite::open - Failed to set busy handler: " << sqlite3_errmsg(m_db);
        LOGERROR(msg.str());
        sqlite3_close(m_db);
        m_db = NULL;
        throw TriStoreException(msg.str());
    }

    exec("PRAGMA foreign_keys = ON");
    createSchema();

    LOGINFO("Artifact store opened: " + m_dbFilePath);
}

int TriArtifactStoreSqlite::busyHandler(void * /*db*/, int count)
{
    if (count < STORE_MAX_RETRY_COUNT) {
        Poco::Thread::sleep(STORE_RETRY_WAIT * count);
        return 1;
    }
    return 0;
}

void TriArtifactStoreSqlite::checkOpen() const
{
    if (!m_db)
        throw TriStoreException("TriArtifactStoreSqlite - database is not open");
}

void TriArtifactStoreSqlite::exec(const std::string &sql) const
{
    char *errmsg = NULL;
    if (sqlite3_exec(m_db, sql.c_str(), NULL, NULL, &errmsg) != SQLITE_OK) {
        std::stringstream msg;
        msg << "TriArtifactStoreSqlite - Error executing \"" << sql << "\": " << (errmsg ? errmsg : "unknown error");
        LOGERROR(msg.str());
        sqlite3_free(errmsg);
        throw TriStoreException(msg.str());
    }
}

std::string TriArtifactStoreSqlite::tableName(TRI_ARTIFACT_TYPE type)
{
    if (type <= TRI_ART_UNKNOWN || type >= TRI_ART_END) {
        std::stringstream msg;
        msg << "TriArtifactStoreSqlite - invalid artifact type " << (int)type;
        throw TriStoreException(msg.str());
    }
    return "art_" + TriArtifactTypes::getName(type);
}

void TriArtifactStoreSqlite::createSchema()
{
    std::vector<TRI_ARTIFACT_TYPE> types = TriArtifactTypes::all();
    for (std::vector<TRI_ARTIFACT_TYPE>::const_iterator it = types.begin(); it != types.end(); ++it) {
        std::string table = tableName(*it);
        exec("CREATE TABLE IF NOT EXISTS " + table + " (id INTEGER PRIMARY KEY, case_id TEXT NOT NULL, "
            "natural_key TEXT NOT NULL, source_path TEXT, source_offset INTEGER, timestamp INTEGER, "
            "first_seen INTEGER, last_seen INTEGER, description TEXT, UNIQUE(case_id, natural_key))");
        exec("CREATE INDEX IF NOT EXISTS " + table + "_case_time ON " + table + "(case_id, timestamp)");
    }

    exec("CREATE TABLE IF NOT EXISTS artifact_attributes (artifact_type INTEGER NOT NULL, "
        "artifact_id INTEGER NOT NULL, name TEXT NOT NULL, value_type INTEGER NOT NULL, value_text TEXT, "
        "value_int64 INTEGER, value_double NUMERIC(20, 10))");
    exec("CREATE INDEX IF NOT EXISTS attrs_artifact ON artifact_attributes(artifact_type, artifact_id)");

    exec("CREATE TABLE IF NOT EXISTS image_summary (case_id TEXT PRIMARY KEY, format TEXT, size INTEGER, "
        "sector_size INTEGER, segment_count INTEGER, allocated_bytes INTEGER, unallocated_bytes INTEGER, "
        "md5 TEXT, sha1 TEXT)");
    exec("CREATE TABLE IF NOT EXISTS image_partitions (case_id TEXT NOT NULL, part_index INTEGER, "
        "description TEXT, start_offset INTEGER, size INTEGER, allocated INTEGER)");

    exec("CREATE TABLE IF NOT EXISTS anomaly_reports (id INTEGER PRIMARY KEY AUTOINCREMENT, case_id TEXT NOT NULL, "
        "generated_at INTEGER, anomalies_detected INTEGER, total_activities INTEGER, model_accuracy REAL, "
        "risk_level TEXT, overall_risk_score REAL, scorer TEXT)");
    exec("CREATE INDEX IF NOT EXISTS reports_case ON anomaly_reports(case_id)");
    exec("CREATE TABLE IF NOT EXISTS anomaly_report_lines (report_id INTEGER NOT NULL "
        "REFERENCES anomaly_reports(id) ON DELETE CASCADE, kind TEXT NOT NULL, seq INTEGER, text TEXT)");
}

TriArtifactStore::UpsertResult TriArtifactStoreSqlite::upsert(const TriArtifact &artifact)
{
    if (artifact.getCaseId().empty() || artifact.getNaturalKey().empty())
        throw TriStoreException("TriArtifactStoreSqlite::upsert - artifact has no case id or natural key");

    Poco::Mutex::ScopedLock lock(m_mutex);
    checkOpen();

    std::string table = tableName(artifact.getType());
    Transaction transaction(*this);

    Statement select(m_db, "SELECT id, first_seen, last_seen, timestamp FROM " + table + " WHERE case_id = ? AND natural_key = ?");
    select.bindText(1, artifact.getCaseId());
    select.bindText(2, artifact.getNaturalKey());

    if (select.step()) {
        int64_t id = select.getInt64(0);
        if (!artifact.hasSeenRange()) {
            transaction.commit();
            return DUPLICATE_IGNORED;
        }

        int64_t firstSeen = artifact.getFirstSeen();
        int64_t lastSeen = artifact.getLastSeen();
        bool widened = select.isNull(1);
        if (!widened) {
            int64_t storedFirst = select.getInt64(1);
            int64_t storedLast = select.getInt64(2);
            widened = firstSeen < storedFirst || lastSeen > storedLast;
            if (storedFirst < firstSeen)
                firstSeen = storedFirst;
            if (storedLast > lastSeen)
                lastSeen = storedLast;
        }

        if (!widened) {
            transaction.commit();
            return DUPLICATE_IGNORED;
        }

        // a ranged artifact is placed on the timeline at its first sighting
        int64_t timestamp = firstSeen;
        if (!select.isNull(3) && select.getInt64(3) < timestamp)
            timestamp = select.getInt64(3);

        Statement update(m_db, "UPDATE " + table + " SET timestamp = ?, first_seen = ?, last_seen = ? WHERE id = ?");
        update.bindInt64(1, timestamp);
        update.bindInt64(2, firstSeen);
        update.bindInt64(3, lastSeen);
        update.bindInt64(4, id);
        update.step();
        transaction.commit();
        return MERGED;
    }

    Statement insert(m_db, "INSERT INTO " + table + " (case_id, natural_key, source_path, source_offset, timestamp, "
        "first_seen, last_seen, description) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    insert.bindText(1, artifact.getCaseId());
    insert.bindText(2, artifact.getNaturalKey());
    insert.bindText(3, artifact.getSourcePath());
    insert.bindInt64(4, (int64_t)artifact.getSourceOffset());
    if (artifact.hasTimestamp())
        insert.bindInt64(5, artifact.getTimestamp());
    else
        insert.bindNull(5);
    if (artifact.hasSeenRange()) {
        insert.bindInt64(6, artifact.getFirstSeen());
        insert.bindInt64(7, artifact.getLastSeen());
    }
    else {
        insert.bindNull(6);
        insert.bindNull(7);
    }
    insert.bindText(8, artifact.getDescription());
    insert.step();

    insertAttributes(artifact.getType(), (int64_t)sqlite3_last_insert_rowid(m_db), artifact.getAttributes());
    transaction.commit();
    return STORED;
}

void TriArtifactStoreSqlite::insertAttributes(TRI_ARTIFACT_TYPE type, int64_t artifactId,
    const std::vector<TriArtifactAttribute> &attributes)
{
    for (std::vector<TriArtifactAttribute>::const_iterator it = attributes.begin(); it != attributes.end(); ++it) {
        Statement insert(m_db, "INSERT INTO artifact_attributes (artifact_type, artifact_id, name, value_type, "
            "value_text, value_int64, value_double) VALUES (?, ?, ?, ?, ?, ?, ?)");
        insert.bindInt64(1, (int64_t)type);
        insert.bindInt64(2, artifactId);
        insert.bindText(3, it->getName());
        insert.bindInt64(4, (int64_t)it->getValueType());
        insert.bindNull(5);
        insert.bindNull(6);
        insert.bindNull(7);
        switch (it->getValueType()) {
        case TRI_STRING:
            insert.bindText(5, it->getValueString());
            break;
        case TRI_LONG:
            insert.bindInt64(6, it->getValueLong());
            break;
        case TRI_DOUBLE:
            insert.bindDouble(7, it->getValueDouble());
            break;
        }
        insert.step();
    }
}

void TriArtifactStoreSqlite::loadAttributes(TriArtifact &artifact) const
{
    Statement select(m_db, "SELECT name, value_type, value_text, value_int64, value_double FROM artifact_attributes "
        "WHERE artifact_type = ? AND artifact_id = ? ORDER BY rowid");
    select.bindInt64(1, (int64_t)artifact.getType());
    select.bindInt64(2, (int64_t)artifact.getId());
    while (select.step()) {
        std::string name = select.getText(0);
        switch (select.getInt64(1)) {
        case TRI_LONG:
            artifact.addAttribute(name, select.getInt64(3));
            break;
        case TRI_DOUBLE:
            artifact.addAttribute(name, select.getDouble(4));
            break;
        default:
            artifact.addAttribute(name, select.getText(2));
            break;
        }
    }
}

void TriArtifactStoreSqlite::query(const std::string &caseId, TRI_ARTIFACT_TYPE type, const TriArtifactFilter &filter,
    TriArtifactVisitor &visitor) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    checkOpen();

    std::string table = tableName(type);
    std::stringstream sql;
    sql << "SELECT id, natural_key, source_path, source_offset, timestamp, first_seen, last_seen, description FROM "
        << table << " t WHERE case_id = ?";
    if (filter.hasStartTime)
        sql << " AND timestamp >= ?";
    if (filter.hasEndTime)
        sql << " AND timestamp <= ?";
    if (filter.timestampedOnly)
        sql << " AND timestamp IS NOT NULL";
    if (!filter.text.empty()) {
        sql << " AND (natural_key LIKE ? ESCAPE '\\' OR description LIKE ? ESCAPE '\\'"
            << " OR EXISTS (SELECT 1 FROM artifact_attributes a WHERE a.artifact_type = " << (int)type
            << " AND a.artifact_id = t.id AND a.value_text LIKE ? ESCAPE '\\'))";
    }
    sql << " ORDER BY id LIMIT ? OFFSET ?";

    Statement select(m_db, sql.str());
    int param = 1;
    select.bindText(param++, caseId);
    if (filter.hasStartTime)
        select.bindInt64(param++, filter.startTime);
    if (filter.hasEndTime)
        select.bindInt64(param++, filter.endTime);
    if (!filter.text.empty()) {
        std::string pattern = likePattern(filter.text);
        for (int i = 0; i < 3; i++)
            select.bindText(param++, pattern);
    }
    select.bindInt64(param++, filter.limit ? (int64_t)filter.limit : -1);
    select.bindInt64(param++, (int64_t)filter.offset);

    while (select.step()) {
        TriArtifact artifact(type, caseId);
        artifact.setId((uint64_t)select.getInt64(0));
        artifact.setNaturalKey(select.getText(1));
        artifact.setSource(select.getText(2), (uint64_t)select.getInt64(3));
        if (!select.isNull(4))
            artifact.setTimestamp(select.getInt64(4));
        if (!select.isNull(5))
            artifact.setSeenRange(select.getInt64(5), select.getInt64(6));
        artifact.setDescription(select.getText(7));
        loadAttributes(artifact);

        if (!visitor.visit(artifact))
            break;
    }
}

std::map<TRI_ARTIFACT_TYPE, uint64_t> TriArtifactStoreSqlite::countByType(const std::string &caseId) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    checkOpen();

    std::map<TRI_ARTIFACT_TYPE, uint64_t> counts;
    std::vector<TRI_ARTIFACT_TYPE> types = TriArtifactTypes::all();
    for (std::vector<TRI_ARTIFACT_TYPE>::const_iterator it = types.begin(); it != types.end(); ++it) {
        Statement count(m_db, "SELECT count(*) FROM " + tableName(*it) + " WHERE case_id = ?");
        count.bindText(1, caseId);
        if (count.step() && count.getInt64(0) > 0)
            counts[*it] = (uint64_t)count.getInt64(0);
    }
    return counts;
}

uint64_t TriArtifactStoreSqlite::deleteCase(const std::string &caseId)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    checkOpen();

    Transaction transaction(*this);
    uint64_t removed = 0;

    std::vector<TRI_ARTIFACT_TYPE> types = TriArtifactTypes::all();
    for (std::vector<TRI_ARTIFACT_TYPE>::const_iterator it = types.begin(); it != types.end(); ++it) {
        std::string table = tableName(*it);

        Statement attrs(m_db, "DELETE FROM artifact_attributes WHERE artifact_type = ? AND artifact_id IN "
            "(SELECT id FROM " + table + " WHERE case_id = ?)");
        attrs.bindInt64(1, (int64_t)*it);
        attrs.bindText(2, caseId);
        attrs.step();

        Statement rows(m_db, "DELETE FROM " + table + " WHERE case_id = ?");
        rows.bindText(1, caseId);
        rows.step();
        removed += (uint64_t)sqlite3_changes(m_db);
    }

    const char * const caseTables[] = { "image_summary", "image_partitions", "anomaly_reports" };
    for (size_t i = 0; i < sizeof(caseTables) / sizeof(caseTables[0]); i++) {
        Statement rows(m_db, std::string("DELETE FROM ") + caseTables[i] + " WHERE case_id = ?");
        rows.bindText(1, caseId);
        rows.step();
    }

    transaction.commit();

    std::stringstream msg;
    msg << "TriArtifactStoreSqlite::deleteCase - removed " << removed << " artifacts of case " << caseId;
    LOGINFO(msg.str());
    return removed;
}

void TriArtifactStoreSqlite::saveImageSummary(const std::string &caseId, const TriImageSummary &summary)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    checkOpen();

    Transaction transaction(*this);

    Statement insert(m_db, "INSERT OR REPLACE INTO image_summary (case_id, format, size, sector_size, segment_count, "
        "allocated_bytes, unallocated_bytes, md5, sha1) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    insert.bindText(1, caseId);
    insert.bindText(2, summary.format);
    insert.bindInt64(3, (int64_t)summary.size);
    insert.bindInt64(4, (int64_t)summary.sectorSize);
    insert.bindInt64(5, (int64_t)summary.segmentCount);
    insert.bindInt64(6, (int64_t)summary.allocatedBytes);
    insert.bindInt64(7, (int64_t)summary.unallocatedBytes);
    insert.bindText(8, summary.md5);
    insert.bindText(9, summary.sha1);
    insert.step();

    Statement clear(m_db, "DELETE FROM image_partitions WHERE case_id = ?");
    clear.bindText(1, caseId);
    clear.step();

    for (std::vector<TriPartitionInfo>::const_iterator it = summary.partitions.begin(); it != summary.partitions.end(); ++it) {
        Statement part(m_db, "INSERT INTO image_partitions (case_id, part_index, description, start_offset, size, "
            "allocated) VALUES (?, ?, ?, ?, ?, ?)");
        part.bindText(1, caseId);
        part.bindInt64(2, (int64_t)it->index);
        part.bindText(3, it->description);
        part.bindInt64(4, (int64_t)it->startOffset);
        part.bindInt64(5, (int64_t)it->size);
        part.bindInt64(6, it->allocated ? 1 : 0);
        part.step();
    }

    transaction.commit();
}

bool TriArtifactStoreSqlite::getImageSummary(const std::string &caseId, TriImageSummary &summary) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    checkOpen();

    Statement select(m_db, "SELECT format, size, sector_size, segment_count, allocated_bytes, unallocated_bytes, "
        "md5, sha1 FROM image_summary WHERE case_id = ?");
    select.bindText(1, caseId);
    if (!select.step())
        return false;

    summary = TriImageSummary();
    summary.format = select.getText(0);
    summary.size = (uint64_t)select.getInt64(1);
    summary.sectorSize = (unsigned int)select.getInt64(2);
    summary.segmentCount = (unsigned int)select.getInt64(3);
    summary.allocatedBytes = (uint64_t)select.getInt64(4);
    summary.unallocatedBytes = (uint64_t)select.getInt64(5);
    summary.md5 = select.getText(6);
    summary.sha1 = select.getText(7);

    Statement parts(m_db, "SELECT part_index, description, start_offset, size, allocated FROM image_partitions "
        "WHERE case_id = ? ORDER BY part_index");
    parts.bindText(1, caseId);
    while (parts.step()) {
        TriPartitionInfo part;
        part.index = (unsigned int)parts.getInt64(0);
        part.description = parts.getText(1);
        part.startOffset = (uint64_t)parts.getInt64(2);
        part.size = (uint64_t)parts.getInt64(3);
        part.allocated = parts.getInt64(4) != 0;
        summary.partitions.push_back(part);
    }
    return true;
}

uint64_t TriArtifactStoreSqlite::addReport(const TriAnomalyReport &report)
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    checkOpen();

    Transaction transaction(*this);

    Statement insert(m_db, "INSERT INTO anomaly_reports (case_id, generated_at, anomalies_detected, total_activities, "
        "model_accuracy, risk_level, overall_risk_score, scorer) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    insert.bindText(1, report.caseId);
    insert.bindInt64(2, report.generatedAt);
    insert.bindInt64(3, (int64_t)report.anomaliesDetected);
    insert.bindInt64(4, (int64_t)report.totalActivities);
    insert.bindDouble(5, report.modelAccuracy);
    insert.bindText(6, TriAnomalyReport::riskLevelName(report.riskLevel));
    insert.bindDouble(7, report.overallRiskScore);
    insert.bindText(8, report.scorerName);
    insert.step();
    int64_t reportId = (int64_t)sqlite3_last_insert_rowid(m_db);

    const std::vector<std::string> *lists[] = { &report.criticalIndicators, &report.recommendations };
    const char * const kinds[] = { REPORT_INDICATOR, REPORT_RECOMMENDATION };
    for (size_t l = 0; l < 2; l++) {
        for (size_t i = 0; i < lists[l]->size(); i++) {
            Statement line(m_db, "INSERT INTO anomaly_report_lines (report_id, kind, seq, text) VALUES (?, ?, ?, ?)");
            line.bindInt64(1, reportId);
            line.bindText(2, kinds[l]);
            line.bindInt64(3, (int64_t)i);
            line.bindText(4, (*lists[l])[i]);
            line.step();
        }
    }

    transaction.commit();
    return (uint64_t)reportId;
}

bool TriArtifactStoreSqlite::getLatestReport(const std::string &caseId, TriAnomalyReport &report) const
{
    Poco::Mutex::ScopedLock lock(m_mutex);
    checkOpen();

    Statement select(m_db, "SELECT id, generated_at, anomalies_detected, total_activities, model_accuracy, "
        "risk_level, overall_risk_score, scorer FROM anomaly_reports WHERE case_id = ? ORDER BY id DESC LIMIT 1");
    select.bindText(1, caseId);
    if (!select.step())
        return false;

    report = TriAnomalyReport();
    report.id = (uint64_t)select.getInt64(0);
    report.caseId = caseId;
    report.generatedAt = select.getInt64(1);
    report.anomaliesDetected = (uint64_t)select.getInt64(2);
    report.totalActivities = (uint64_t)select.getInt64(3);
    report.modelAccuracy = select.getDouble(4);
    report.riskLevel = TriAnomalyReport::riskLevelFromName(select.getText(5));
    report.overallRiskScore = select.getDouble(6);
    report.scorerName = select.getText(7);

    Statement lines(m_db, "SELECT kind, text FROM anomaly_report_lines WHERE report_id = ? ORDER BY kind, seq");
    lines.bindInt64(1, (int64_t)report.id);
    while (lines.step()) {
        if (lines.getText(0) == REPORT_INDICATOR)
            report.criticalIndicators.push_back(lines.getText(1));
        else
            report.recommendations.push_back(lines.getText(1));
    }
    return true;
}
