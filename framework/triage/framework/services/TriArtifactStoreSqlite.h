/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriArtifactStoreSqlite.h
 * Contains the interface of the TriArtifactStoreSqlite class.
 */

#ifndef _TRI_ARTIFACTSTORESQLITE_H
#define _TRI_ARTIFACTSTORESQLITE_H

#include "TriArtifactStore.h"

#include "Poco/Mutex.h"
#include "sqlite3.h"

/**
 * SQLite implementation of TriArtifactStore.  Each artifact type has its
 * own table with a unique (case_id, natural_key) constraint and an index on
 * (case_id, timestamp); attributes of all types share one table.
 */
class TRI_FRAMEWORK_API TriArtifactStoreSqlite : public TriArtifactStore
{
public:
    /**
     * Set the database location.  Must call open() before the object can
     * be used.
     * @param dbFilePath Path of the database file, ":memory:" for a
     * private in-memory database.
     */
    explicit TriArtifactStoreSqlite(const std::string &dbFilePath);
    virtual ~TriArtifactStoreSqlite();

    /**
     * Open the database, creating the file and the schema if needed.
     * @throws TriStoreException
     */
    void open();
    void close();

    const std::string &getDbFilePath() const { return m_dbFilePath; }

    virtual UpsertResult upsert(const TriArtifact &artifact);
    virtual void query(const std::string &caseId, TRI_ARTIFACT_TYPE type, const TriArtifactFilter &filter,
        TriArtifactVisitor &visitor) const;
    virtual std::map<TRI_ARTIFACT_TYPE, uint64_t> countByType(const std::string &caseId) const;
    virtual uint64_t deleteCase(const std::string &caseId);

    virtual void saveImageSummary(const std::string &caseId, const TriImageSummary &summary);
    virtual bool getImageSummary(const std::string &caseId, TriImageSummary &summary) const;

    virtual uint64_t addReport(const TriAnomalyReport &report);
    virtual bool getLatestReport(const std::string &caseId, TriAnomalyReport &report) const;

private:
    /// A prepared statement, finalized when it goes out of scope.
    class Statement
    {
    public:
        Statement(sqlite3 *db, const std::string &sql);
        ~Statement();

        /**
         * Execute or advance to the next row.
         * @returns false when done.
         * @throws TriStoreException on an SQLite error.
         */
        bool step();

        void bindText(int index, const std::string &value);
        void bindInt64(int index, int64_t value);
        void bindDouble(int index, double value);
        void bindNull(int index);

        bool isNull(int column) const;
        std::string getText(int column) const;
        int64_t getInt64(int column) const;
        double getDouble(int column) const;

    private:
        Statement(const Statement&);
        Statement& operator=(const Statement&);

        void checkBind(int rc);

        sqlite3 *m_db;
        sqlite3_stmt *m_stmt;
    };

    /// Rolls back unless commit() was called.
    class Transaction
    {
    public:
        explicit Transaction(TriArtifactStoreSqlite &store);
        ~Transaction();
        void commit();

    private:
        Transaction(const Transaction&);
        Transaction& operator=(const Transaction&);

        TriArtifactStoreSqlite &m_store;
        bool m_done;
    };

    void exec(const std::string &sql) const;
    void createSchema();
    void checkOpen() const;
    void insertAttributes(TRI_ARTIFACT_TYPE type, int64_t artifactId, const std::vector<TriArtifactAttribute> &attributes);
    void loadAttributes(TriArtifact &artifact) const;

    static std::string tableName(TRI_ARTIFACT_TYPE type);
    static int busyHandler(void *db, int count);

    std::string m_dbFilePath;
    sqlite3 *m_db;
    mutable Poco::Mutex m_mutex;

    // Prohibit copying.
    TriArtifactStoreSqlite(const TriArtifactStoreSqlite&);
    TriArtifactStoreSqlite& operator=(const TriArtifactStoreSqlite&);
};

#endif
