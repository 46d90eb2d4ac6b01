#pragma once

#include "core/shared/search_sources.h"

#include <QString>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace lc {

// KeywordIndex: FTS5 table over paragraph text with rowid == record id.
// Borrows the connection owned by RecordStore; does not close it.
class KeywordIndex : public KeywordSource {
public:
    enum class MatchMode {
        AllTerms,   // implicit AND between terms (FTS5 default)
        AnyTerms,   // terms joined with OR
    };

    explicit KeywordIndex(sqlite3* db);

    KeywordIndex(const KeywordIndex&) = delete;
    KeywordIndex& operator=(const KeywordIndex&) = delete;

    // Re-indexing an id replaces its previous text.
    bool index(int64_t id, const QString& text);
    bool remove(int64_t id);
    int count();
    std::vector<int64_t> allIds();
    bool optimize();

    // bm25-ordered hits, at most k. rawScore is the FTS5 rank (lower is
    // better). timeoutMs <= 0 disables the deadline.
    std::optional<std::vector<SearchHit>> search(const QString& query, int k,
                                                 int timeoutMs) override;

    void setMatchMode(MatchMode mode) { m_matchMode = mode; }
    MatchMode matchMode() const { return m_matchMode; }

    // Replace everything that is not a letter, digit or whitespace with a
    // space, lower-case the FTS5 operators, collapse whitespace.
    static QString sanitizeQuery(const QString& raw);

private:
    QString buildMatchExpression(const QString& sanitized) const;

    sqlite3* m_db = nullptr;
    MatchMode m_matchMode = MatchMode::AllTerms;
    std::mutex m_searchMutex;
};

} // namespace lc
