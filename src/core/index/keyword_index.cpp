#include "core/index/keyword_index.h"
#include "core/shared/logging.h"

#include <QStringList>

#include <chrono>

namespace lc {

namespace {

struct SearchDeadline {
    std::chrono::steady_clock::time_point at;
    bool expired = false;
};

// Returning non-zero from the progress handler interrupts the running
// statement with SQLITE_INTERRUPT.
int deadlineProgressHandler(void* context)
{
    auto* deadline = static_cast<SearchDeadline*>(context);
    if (std::chrono::steady_clock::now() >= deadline->at) {
        deadline->expired = true;
        return 1;
    }
    return 0;
}

constexpr int kProgressHandlerOps = 1000;

} // namespace

KeywordIndex::KeywordIndex(sqlite3* db)
    : m_db(db)
{
}

bool KeywordIndex::index(int64_t id, const QString& text)
{
    // FTS5 has no upsert; delete then insert keeps re-indexing idempotent.
    if (!remove(id)) {
        return false;
    }

    const char* sql = "INSERT INTO paragraphs_fts (rowid, text) VALUES (?1, ?2)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lcIndex, "index prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray textUtf8 = text.toUtf8();
    sqlite3_bind_int64(stmt, 1, id);
    sqlite3_bind_text(stmt, 2, textUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(lcIndex, "index failed for id=%lld: %s",
                  static_cast<long long>(id), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool KeywordIndex::remove(int64_t id)
{
    const char* sql = "DELETE FROM paragraphs_fts WHERE rowid = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lcIndex, "remove prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, id);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

int KeywordIndex::count()
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM paragraphs_fts", -1, &stmt, nullptr)
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

std::vector<int64_t> KeywordIndex::allIds()
{
    std::vector<int64_t> ids;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT rowid FROM paragraphs_fts ORDER BY rowid",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lcIndex, "allIds prepare failed: %s", sqlite3_errmsg(m_db));
        return ids;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

bool KeywordIndex::optimize()
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db,
        "INSERT INTO paragraphs_fts(paragraphs_fts) VALUES('optimize')",
        nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_WARN(lcIndex, "FTS5 optimize failed: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

QString KeywordIndex::sanitizeQuery(const QString& raw)
{
    QString replaced;
    replaced.reserve(raw.size());
    for (const QChar ch : raw) {
        if (ch.isLetterOrNumber() || ch.isSpace()) {
            replaced.append(ch);
        } else {
            replaced.append(QLatin1Char(' '));
        }
    }

    const QStringList words = replaced.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    QStringList terms;
    terms.reserve(words.size());
    for (const QString& word : words) {
        // Upper-case operators would be parsed as FTS5 syntax; lower-case
        // forms are plain terms.
        if (word == QLatin1String("AND") || word == QLatin1String("OR")
            || word == QLatin1String("NOT") || word == QLatin1String("NEAR")) {
            terms.push_back(word.toLower());
        } else {
            terms.push_back(word);
        }
    }
    return terms.join(QLatin1Char(' '));
}

QString KeywordIndex::buildMatchExpression(const QString& sanitized) const
{
    if (m_matchMode == MatchMode::AllTerms) {
        return sanitized;
    }
    return sanitized.split(QLatin1Char(' '), Qt::SkipEmptyParts).join(QStringLiteral(" OR "));
}

std::optional<std::vector<SearchHit>> KeywordIndex::search(const QString& query, int k,
                                                           int timeoutMs)
{
    if (k <= 0) {
        return std::vector<SearchHit>{};
    }

    const QString sanitized = sanitizeQuery(query);
    if (sanitized.isEmpty()) {
        LOG_DEBUG(lcIndex, "FTS5 search skipped after sanitization");
        return std::vector<SearchHit>{};
    }
    if (sanitized != query) {
        LOG_DEBUG(lcIndex, "FTS5 query sanitized from '%s' to '%s'",
                  qUtf8Printable(query), qUtf8Printable(sanitized));
    }

    const char* sql = R"(
        SELECT rowid, rank
        FROM paragraphs_fts
        WHERE paragraphs_fts MATCH ?1
        ORDER BY rank
        LIMIT ?2
    )";

    std::lock_guard<std::mutex> lock(m_searchMutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(lcIndex, "FTS5 search prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray matchUtf8 = buildMatchExpression(sanitized).toUtf8();
    sqlite3_bind_text(stmt, 1, matchUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, k);

    SearchDeadline deadline;
    if (timeoutMs > 0) {
        deadline.at = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        sqlite3_progress_handler(m_db, kProgressHandlerOps, deadlineProgressHandler, &deadline);
    }

    std::vector<SearchHit> hits;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        SearchHit hit;
        hit.id = sqlite3_column_int64(stmt, 0);
        hit.rank = static_cast<int>(hits.size());
        hit.rawScore = sqlite3_column_double(stmt, 1);
        hits.push_back(hit);
    }

    if (timeoutMs > 0) {
        sqlite3_progress_handler(m_db, 0, nullptr, nullptr);
    }

    if (rc != SQLITE_DONE) {
        if (deadline.expired) {
            LOG_WARN(lcIndex, "FTS5 search exceeded %d ms deadline", timeoutMs);
        } else {
            LOG_WARN(lcIndex, "FTS5 search failed: %s", sqlite3_errmsg(m_db));
        }
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    sqlite3_finalize(stmt);

    LOG_DEBUG(lcIndex, "FTS5 search '%s' returned %d hits",
              qUtf8Printable(sanitized), static_cast<int>(hits.size()));
    return hits;
}

} // namespace lc
