#include "core/vector/vector_store.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <QDateTime>

namespace lc {

namespace {

constexpr const char* kCreateVectorPointsSql = R"(
    CREATE TABLE IF NOT EXISTS vector_points (
        id INTEGER PRIMARY KEY,
        doc_id INTEGER NOT NULL,
        chapter_id INTEGER NOT NULL,
        paragraph_id INTEGER NOT NULL,
        model_id TEXT NOT NULL,
        embedded_at REAL NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_vector_points_location
        ON vector_points(doc_id, chapter_id, paragraph_id);
)";

constexpr const char* kAddSql = R"(
    INSERT OR REPLACE INTO vector_points (
        id, doc_id, chapter_id, paragraph_id, model_id, embedded_at
    ) VALUES (?1, ?2, ?3, ?4, ?5, ?6)
)";
constexpr const char* kRemoveSql = "DELETE FROM vector_points WHERE id = ?1";
constexpr const char* kGetSql =
    "SELECT doc_id, chapter_id, paragraph_id FROM vector_points WHERE id = ?1";
constexpr const char* kCountSql = "SELECT COUNT(*) FROM vector_points";
constexpr const char* kAllIdsSql = "SELECT id FROM vector_points ORDER BY id";
constexpr const char* kClearSql = "DELETE FROM vector_points";

bool execSql(sqlite3* db, const char* sql)
{
    if (!db) {
        return false;
    }
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(lcVector, "vector_points SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

} // namespace

VectorStore::VectorStore(sqlite3* db)
    : m_db(db)
{
    m_ready = prepareStatements();
    if (!m_ready) {
        LOG_ERROR(lcVector, "VectorStore failed to prepare statements");
    }
}

VectorStore::~VectorStore()
{
    sqlite3_finalize(m_addStmt);
    sqlite3_finalize(m_removeStmt);
    sqlite3_finalize(m_getStmt);
    sqlite3_finalize(m_countStmt);
    sqlite3_finalize(m_allIdsStmt);
    sqlite3_finalize(m_clearStmt);
}

bool VectorStore::addPoint(int64_t id, const ParagraphLocation& location,
                           const std::string& modelId)
{
    if (!m_ready) {
        return false;
    }

    const QByteArray modelUtf8(modelId.data(), static_cast<int>(modelId.size()));
    const double embeddedAt = static_cast<double>(QDateTime::currentSecsSinceEpoch());

    sqlite3_bind_int64(m_addStmt, 1, id);
    sqlite3_bind_int64(m_addStmt, 2, location.docId);
    sqlite3_bind_int64(m_addStmt, 3, location.chapterId);
    sqlite3_bind_int64(m_addStmt, 4, location.paragraphId);
    sqlite3_bind_text(m_addStmt, 5, modelUtf8.constData(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(m_addStmt, 6, embeddedAt);

    const int rc = sqlite3_step(m_addStmt);
    resetStatement(m_addStmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lcVector, "addPoint id=%lld failed: %s",
                  static_cast<long long>(id), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool VectorStore::removePoint(int64_t id)
{
    if (!m_ready) {
        return false;
    }
    sqlite3_bind_int64(m_removeStmt, 1, id);
    const int rc = sqlite3_step(m_removeStmt);
    resetStatement(m_removeStmt);
    return rc == SQLITE_DONE;
}

std::optional<ParagraphLocation> VectorStore::getLocation(int64_t id)
{
    if (!m_ready) {
        return std::nullopt;
    }
    sqlite3_bind_int64(m_getStmt, 1, id);

    std::optional<ParagraphLocation> result;
    if (sqlite3_step(m_getStmt) == SQLITE_ROW) {
        ParagraphLocation location;
        location.docId = sqlite3_column_int64(m_getStmt, 0);
        location.chapterId = sqlite3_column_int64(m_getStmt, 1);
        location.paragraphId = sqlite3_column_int64(m_getStmt, 2);
        result = location;
    }
    resetStatement(m_getStmt);
    return result;
}

std::unordered_map<int64_t, ParagraphLocation> VectorStore::getLocations(
    const std::vector<int64_t>& ids)
{
    std::unordered_map<int64_t, ParagraphLocation> result;
    result.reserve(ids.size());
    for (const int64_t id : ids) {
        if (auto location = getLocation(id)) {
            result.emplace(id, *location);
        }
    }
    return result;
}

int VectorStore::countPoints()
{
    if (!m_ready) {
        return 0;
    }
    int total = 0;
    if (sqlite3_step(m_countStmt) == SQLITE_ROW) {
        total = sqlite3_column_int(m_countStmt, 0);
    }
    resetStatement(m_countStmt);
    return total;
}

std::vector<int64_t> VectorStore::allIds()
{
    std::vector<int64_t> ids;
    if (!m_ready) {
        return ids;
    }
    while (sqlite3_step(m_allIdsStmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(m_allIdsStmt, 0));
    }
    resetStatement(m_allIdsStmt);
    return ids;
}

bool VectorStore::clearAll()
{
    if (!m_ready) {
        return false;
    }
    const int rc = sqlite3_step(m_clearStmt);
    resetStatement(m_clearStmt);
    return rc == SQLITE_DONE;
}

bool VectorStore::prepareStatements()
{
    if (!m_db) {
        return false;
    }

    if (!execSql(m_db, kCreateVectorPointsSql)) {
        return false;
    }

    if (sqlite3_prepare_v2(m_db, kAddSql, -1, &m_addStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kRemoveSql, -1, &m_removeStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kGetSql, -1, &m_getStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kCountSql, -1, &m_countStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kAllIdsSql, -1, &m_allIdsStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    if (sqlite3_prepare_v2(m_db, kClearSql, -1, &m_clearStmt, nullptr) != SQLITE_OK) {
        return false;
    }
    return true;
}

void VectorStore::resetStatement(sqlite3_stmt* stmt)
{
    if (!stmt) {
        return;
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

} // namespace lc
