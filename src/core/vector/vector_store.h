#pragma once

#include "core/shared/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace lc {

// Payload rows for the vector index: one row per HNSW label carrying the
// paragraph location it was embedded from. Lives in the record store's
// database and borrows its connection.
class VectorStore {
public:
    explicit VectorStore(sqlite3* db);
    ~VectorStore();

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    bool isReady() const { return m_ready; }

    bool addPoint(int64_t id, const ParagraphLocation& location, const std::string& modelId);
    bool removePoint(int64_t id);
    std::optional<ParagraphLocation> getLocation(int64_t id);
    std::unordered_map<int64_t, ParagraphLocation> getLocations(const std::vector<int64_t>& ids);
    int countPoints();
    std::vector<int64_t> allIds();
    bool clearAll();

private:
    bool prepareStatements();
    static void resetStatement(sqlite3_stmt* stmt);

    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_addStmt = nullptr;
    sqlite3_stmt* m_removeStmt = nullptr;
    sqlite3_stmt* m_getStmt = nullptr;
    sqlite3_stmt* m_countStmt = nullptr;
    sqlite3_stmt* m_allIdsStmt = nullptr;
    sqlite3_stmt* m_clearStmt = nullptr;
    bool m_ready = false;
};

} // namespace lc
