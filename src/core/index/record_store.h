#pragma once

#include "core/shared/search_sources.h"
#include "core/shared/types.h"

#include <QString>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace lc {

// RecordStore: owner of the SQLite database and of the canonical
// paragraph text. The keyword index and the vector payload table live in
// the same database and borrow the handle via rawDb().
class RecordStore : public RecordSource {
public:
    ~RecordStore() override;

    // Move-only (owns sqlite3* handle)
    RecordStore(RecordStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    RecordStore& operator=(RecordStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema and sets pragmas on first open.
    static std::optional<RecordStore> open(const QString& dbPath);

    // ── Records ─────────────────────────────────────────────

    // Store a record and return its id. record.id is ignored: the store
    // assigns ids. Putting an existing location again keeps its id and
    // replaces the text. Empty text is rejected.
    std::optional<int64_t> put(const ParagraphRecord& record);

    std::optional<ParagraphRecord> getById(int64_t id);
    std::optional<ParagraphRecord> findByLocation(const ParagraphLocation& location);
    std::unordered_map<int64_t, ParagraphRecord> getMany(const std::vector<int64_t>& ids) override;

    bool remove(int64_t id);
    int count();
    std::vector<int64_t> allIds();

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── Transactions ────────────────────────────────────────

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    // Delete every record, keyword entry and vector payload row.
    bool deleteAll();

    // Returns true if database passes PRAGMA integrity_check
    bool integrityCheck() const;

    sqlite3* rawDb() const { return m_db; }

private:
    RecordStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    sqlite3* m_db = nullptr;
};

} // namespace lc
