#pragma once

#include <QJsonObject>

#include <cstdint>
#include <vector>

namespace lc {

class KeywordIndex;
class RecordStore;
class VectorIndex;
class VectorStore;

struct ConsistencyReport {
    int records = 0;
    int keywordEntries = 0;
    int vectorLabels = 0;
    int payloadRows = 0;

    // Record ids absent from one of the indexes.
    std::vector<int64_t> missingKeyword;
    std::vector<int64_t> missingVector;
    std::vector<int64_t> missingPayload;
    // Index entries with no record behind them.
    std::vector<int64_t> orphanKeyword;
    std::vector<int64_t> orphanVector;
    std::vector<int64_t> orphanPayload;
    // Payload location differs from the record's location.
    std::vector<int64_t> locationMismatches;

    bool isConsistent() const;
    QJsonObject toJson() const;
};

// A record must exist in the store and in both indexes, or nowhere.
class ConsistencyChecker {
public:
    static ConsistencyReport check(RecordStore& store, KeywordIndex& keyword,
                                   VectorIndex& vectors, VectorStore& payloads);
};

} // namespace lc
