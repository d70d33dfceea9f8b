/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file TriEvidenceDatabase.h
 * Contains the interface of the TriEvidenceDatabase class.
 */

#ifndef _TRI_EVIDENCEDATABASE_H
#define _TRI_EVIDENCEDATABASE_H

#include "triage/framework/framework_i.h"
#include "Poco/TemporaryFile.h"
#include "sqlite3.h"

#include <string>
#include <vector>
#include <stdint.h>

/**
 * Read-only access to an SQLite database found inside an image, such as a
 * browser history.  The content is copied to a temporary file first since
 * SQLite needs a real file and must not touch journal files of the
 * evidence.
 */
class TRI_FRAMEWORK_API TriEvidenceDatabase
{
public:
    /// A prepared statement, finalized when it goes out of scope.
    class Statement
    {
    public:
        Statement(sqlite3 *db, const std::string &sql);
        ~Statement();

        /**
         * Advance to the next row.
         * @returns false when there are no more rows.
         * @throws TriCorruptStructureException on an SQLite error.
         */
        bool step();

        void bindText(int index, const std::string &value);

        bool isNull(int column) const;
        std::string getText(int column) const;
        int64_t getInt64(int column) const;

    private:
        Statement(const Statement&);
        Statement& operator=(const Statement&);

        sqlite3 *m_db;
        sqlite3_stmt *m_stmt;
    };

    /**
     * @param content The database file content.
     * @param label Name used in error messages.
     * @throws TriCorruptStructureException if the content is not an SQLite database.
     */
    TriEvidenceDatabase(const std::vector<uint8_t> &content, const std::string &label);
    ~TriEvidenceDatabase();

    bool hasTable(const std::string &table);

    sqlite3 *handle() const { return m_db; }

private:
    TriEvidenceDatabase(const TriEvidenceDatabase&);
    TriEvidenceDatabase& operator=(const TriEvidenceDatabase&);

    Poco::TemporaryFile m_tempFile;
    sqlite3 *m_db;
    std::string m_label;
};

#endif
