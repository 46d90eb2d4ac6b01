#include "core/index/record_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>
#include <QStringList>
#include <QThread>

#include <algorithm>
#include <cstring>

namespace lc {

namespace {

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

ParagraphRecord readRecord(sqlite3_stmt* stmt)
{
    ParagraphRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.location.docId = sqlite3_column_int64(stmt, 1);
    record.location.chapterId = sqlite3_column_int64(stmt, 2);
    record.location.paragraphId = sqlite3_column_int64(stmt, 3);
    record.text = columnText(stmt, 4);
    return record;
}

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = columnText(stmt, 0).toInt();
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

} // namespace

RecordStore::~RecordStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<RecordStore> RecordStore::open(const QString& dbPath)
{
    RecordStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool RecordStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(lcStore, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    // Set busy_timeout FIRST via C API, before running any SQL.
    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(lcStore, "Failed to set connection pragmas");
        return false;
    }

    // Readers opening while the ingester holds a batch transaction skip the
    // write-heavy schema creation entirely.
    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='paragraphs'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(lcStore, "Failed to set database pragmas");
            return false;
        }

        {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(m_db, "PRAGMA journal_mode", -1, &stmt, nullptr) == SQLITE_OK
                && sqlite3_step(stmt) == SQLITE_ROW) {
                const QString mode = columnText(stmt, 0);
                if (mode != QLatin1String("wal")) {
                    LOG_WARN(lcStore, "Expected WAL journal mode, got: %s", qUtf8Printable(mode));
                }
            }
            sqlite3_finalize(stmt);
        }

        if (!execSql(kSchemaV1)) {
            LOG_ERROR(lcStore, "Failed to create schema");
            return false;
        }

        if (!execSql(kDefaultSettings)) {
            LOG_ERROR(lcStore, "Failed to insert default settings");
            return false;
        }
    }

    const int version = currentSchemaVersion(m_db);
    if (version > kCurrentSchemaVersion) {
        LOG_ERROR(lcStore, "Schema version %d is newer than supported version %d",
                  version, kCurrentSchemaVersion);
        return false;
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(lcStore, "Database opened successfully: %s", qUtf8Printable(dbPath));
    return true;
}

bool RecordStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(lcStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Records ─────────────────────────────────────────────────

std::optional<int64_t> RecordStore::put(const ParagraphRecord& record)
{
    if (record.text.trimmed().isEmpty()) {
        LOG_WARN(lcStore, "put rejected empty text for doc=%lld chapter=%lld paragraph=%lld",
                 static_cast<long long>(record.location.docId),
                 static_cast<long long>(record.location.chapterId),
                 static_cast<long long>(record.location.paragraphId));
        return std::nullopt;
    }

    const char* sql = R"(
        INSERT INTO paragraphs (doc_id, chapter_id, paragraph_id, text, stored_at)
        VALUES (?1, ?2, ?3, ?4, ?5)
        ON CONFLICT(doc_id, chapter_id, paragraph_id) DO UPDATE SET
            text = excluded.text,
            stored_at = excluded.stored_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lcStore, "put prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray textUtf8 = record.text.toUtf8();
    sqlite3_bind_int64(stmt, 1, record.location.docId);
    sqlite3_bind_int64(stmt, 2, record.location.chapterId);
    sqlite3_bind_int64(stmt, 3, record.location.paragraphId);
    sqlite3_bind_text(stmt, 4, textUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 5, static_cast<double>(QDateTime::currentSecsSinceEpoch()));

    // sqlite3_busy_timeout's handler is not invoked when SQLite detects a
    // potential WAL deadlock; retry SQLITE_BUSY at the application level.
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < 5 && rc == SQLITE_BUSY; ++attempt) {
        if (attempt > 0) {
            sqlite3_reset(stmt);
            QThread::msleep(50 * attempt);
        }
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(lcStore, "put step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    // sqlite3_last_insert_rowid is stale when ON CONFLICT DO UPDATE fires,
    // so read the id back by location.
    auto stored = findByLocation(record.location);
    if (!stored.has_value()) {
        LOG_ERROR(lcStore, "put: row not found after successful upsert");
        return std::nullopt;
    }
    return stored->id;
}

std::optional<ParagraphRecord> RecordStore::getById(int64_t id)
{
    const char* sql = R"(
        SELECT id, doc_id, chapter_id, paragraph_id, text
        FROM paragraphs WHERE id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, id);

    std::optional<ParagraphRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readRecord(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<ParagraphRecord> RecordStore::findByLocation(const ParagraphLocation& location)
{
    const char* sql = R"(
        SELECT id, doc_id, chapter_id, paragraph_id, text
        FROM paragraphs
        WHERE doc_id = ?1 AND chapter_id = ?2 AND paragraph_id = ?3
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, location.docId);
    sqlite3_bind_int64(stmt, 2, location.chapterId);
    sqlite3_bind_int64(stmt, 3, location.paragraphId);

    std::optional<ParagraphRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readRecord(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::unordered_map<int64_t, ParagraphRecord> RecordStore::getMany(const std::vector<int64_t>& ids)
{
    std::unordered_map<int64_t, ParagraphRecord> result;
    if (ids.empty()) {
        return result;
    }
    result.reserve(ids.size());

    // Stay well below SQLITE_MAX_VARIABLE_NUMBER.
    constexpr size_t kMaxIdsPerQuery = 500;

    for (size_t offset = 0; offset < ids.size(); offset += kMaxIdsPerQuery) {
        const size_t batchSize = std::min(kMaxIdsPerQuery, ids.size() - offset);

        // Build: SELECT ... FROM paragraphs WHERE id IN (?1, ?2, ...)
        QString sql = QStringLiteral(
            "SELECT id, doc_id, chapter_id, paragraph_id, text"
            " FROM paragraphs WHERE id IN (");

        QStringList placeholders;
        placeholders.reserve(static_cast<int>(batchSize));
        for (size_t i = 0; i < batchSize; ++i) {
            placeholders.push_back(QStringLiteral("?%1").arg(static_cast<int>(i) + 1));
        }
        sql += placeholders.join(QStringLiteral(", ")) + QStringLiteral(")");

        sqlite3_stmt* stmt = nullptr;
        const QByteArray sqlUtf8 = sql.toUtf8();
        if (sqlite3_prepare_v2(m_db, sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(lcStore, "getMany prepare: %s", sqlite3_errmsg(m_db));
            return result;
        }

        for (size_t i = 0; i < batchSize; ++i) {
            sqlite3_bind_int64(stmt, static_cast<int>(i) + 1, ids[offset + i]);
        }

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            ParagraphRecord record = readRecord(stmt);
            const int64_t id = record.id;
            result[id] = std::move(record);
        }
        if (rc != SQLITE_DONE) {
            LOG_WARN(lcStore, "getMany step failed: %s", sqlite3_errmsg(m_db));
        }
        sqlite3_finalize(stmt);
    }
    return result;
}

bool RecordStore::remove(int64_t id)
{
    const char* sql = "DELETE FROM paragraphs WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lcStore, "remove prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, id);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

int RecordStore::count()
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM paragraphs", -1, &stmt, nullptr)
        != SQLITE_OK) {
        return 0;
    }
    int total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return total;
}

std::vector<int64_t> RecordStore::allIds()
{
    std::vector<int64_t> ids;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT id FROM paragraphs ORDER BY id", -1, &stmt, nullptr)
        != SQLITE_OK) {
        LOG_ERROR(lcStore, "allIds prepare: %s", sqlite3_errmsg(m_db));
        return ids;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> RecordStore::getSetting(const QString& key)
{
    const char* sql = "SELECT value FROM settings WHERE key = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<QString> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool RecordStore::setSetting(const QString& key, const QString& value)
{
    const char* sql = "INSERT OR REPLACE INTO settings (key, value) VALUES (?1, ?2)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valueUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, valueUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Transactions ────────────────────────────────────────────

bool RecordStore::beginTransaction()
{
    return execSql("BEGIN TRANSACTION");
}

bool RecordStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool RecordStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

bool RecordStore::deleteAll()
{
    // FTS5 virtual table must be cleared explicitly (no CASCADE)
    if (!execSql("DELETE FROM paragraphs_fts")) {
        LOG_ERROR(lcStore, "deleteAll: failed to clear paragraphs_fts");
        return false;
    }

    bool hasPayloadTable = false;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db,
                "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='vector_points'",
                -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            hasPayloadTable = sqlite3_column_int(stmt, 0) > 0;
        }
        sqlite3_finalize(stmt);
    }
    if (hasPayloadTable && !execSql("DELETE FROM vector_points")) {
        LOG_ERROR(lcStore, "deleteAll: failed to clear vector_points");
        return false;
    }

    if (!execSql("DELETE FROM paragraphs")) {
        LOG_ERROR(lcStore, "deleteAll: failed to clear paragraphs");
        return false;
    }
    LOG_INFO(lcStore, "deleteAll: all stored paragraphs cleared");
    return true;
}

bool RecordStore::integrityCheck() const
{
    if (!m_db) return false;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, "PRAGMA integrity_check;", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return false;

    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = (result && strcmp(result, "ok") == 0);
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace lc
