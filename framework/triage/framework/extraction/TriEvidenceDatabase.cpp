/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "TriEvidenceDatabase.h"
#include "triage/framework/utilities/TriException.h"

#include "Poco/FileStream.h"

#include <sstream>

namespace
{
    const char SQLITE_HEADER[] = "SQLite format 3";
}

TriEvidenceDatabase::Statement::Statement(sqlite3 *db, const std::string &sql) : m_db(db), m_stmt(NULL)
{
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &m_stmt, NULL) != SQLITE_OK) {
        std::stringstream msg;
        msg << "TriEvidenceDatabase - Error preparing query: " << sqlite3_errmsg(m_db);
        if (m_stmt)
            sqlite3_finalize(m_stmt);
        m_stmt = NULL;
        throw TriCorruptStructureException(msg.str());
    }
}

TriEvidenceDatabase::Statement::~Statement()
{
    if (m_stmt)
        sqlite3_finalize(m_stmt);
}

bool TriEvidenceDatabase::Statement::step()
{
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;

    std::stringstream msg;
    msg << "TriEvidenceDatabase - Error reading rows: " << sqlite3_errmsg(m_db);
    throw TriCorruptStructureException(msg.str());
}

void TriEvidenceDatabase::Statement::bindText(int index, const std::string &value)
{
    if (sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        std::stringstream msg;
        msg << "TriEvidenceDatabase - Error binding parameter: " << sqlite3_errmsg(m_db);
        throw TriCorruptStructureException(msg.str());
    }
}

bool TriEvidenceDatabase::Statement::isNull(int column) const
{
    return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
}

std::string TriEvidenceDatabase::Statement::getText(int column) const
{
    const unsigned char *text = sqlite3_column_text(m_stmt, column);
    if (text == NULL)
        return std::string();
    return std::string((const char *)text, (size_t)sqlite3_column_bytes(m_stmt, column));
}

int64_t TriEvidenceDatabase::Statement::getInt64(int column) const
{
    return (int64_t)sqlite3_column_int64(m_stmt, column);
}

TriEvidenceDatabase::TriEvidenceDatabase(const std::vector<uint8_t> &content, const std::string &label)
    : m_db(NULL), m_label(label)
{
    if (content.size() < sizeof(SQLITE_HEADER) ||
        std::string((const char *)&content[0], sizeof(SQLITE_HEADER) - 1) != SQLITE_HEADER) {
        throw TriCorruptStructureException("TriEvidenceDatabase - Not an SQLite database: " + label);
    }

    {
        Poco::FileOutputStream out(m_tempFile.path(), std::ios::binary | std::ios::trunc);
        out.write((const char *)&content[0], (std::streamsize)content.size());
        out.close();
        if (!out.good()) {
            throw TriFileException("TriEvidenceDatabase - Error writing temporary copy of " + label);
        }
    }

    if (sqlite3_open_v2(m_tempFile.path().c_str(), &m_db, SQLITE_OPEN_READONLY, NULL) != SQLITE_OK) {
        std::stringstream msg;
        msg << "TriEvidenceDatabase - Error opening " << label << ": " << sqlite3_errmsg(m_db);
        sqlite3_close(m_db);
        m_db = NULL;
        throw TriCorruptStructureException(msg.str());
    }
}

TriEvidenceDatabase::~TriEvidenceDatabase()
{
    if (m_db)
        sqlite3_close(m_db);
}

bool TriEvidenceDatabase::hasTable(const std::string &table)
{
    Statement stmt(m_db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bindText(1, table);
    return stmt.step();
}
