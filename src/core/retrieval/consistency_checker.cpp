#include "core/retrieval/consistency_checker.h"
#include "core/index/keyword_index.h"
#include "core/index/record_store.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"
#include "core/vector/vector_store.h"

#include <QJsonArray>

#include <algorithm>
#include <iterator>

namespace lc {

namespace {

// Both inputs sorted ascending; returns ids in `left` not in `right`.
std::vector<int64_t> difference(const std::vector<int64_t>& left, const std::vector<int64_t>& right)
{
    std::vector<int64_t> out;
    std::set_difference(left.begin(), left.end(), right.begin(), right.end(),
                        std::back_inserter(out));
    return out;
}

QJsonArray toJsonArray(const std::vector<int64_t>& ids)
{
    QJsonArray array;
    for (int64_t id : ids) {
        array.append(static_cast<qint64>(id));
    }
    return array;
}

} // namespace

bool ConsistencyReport::isConsistent() const
{
    return missingKeyword.empty() && missingVector.empty() && missingPayload.empty()
        && orphanKeyword.empty() && orphanVector.empty() && orphanPayload.empty()
        && locationMismatches.empty();
}

QJsonObject ConsistencyReport::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("consistent")] = isConsistent();
    json[QStringLiteral("records")] = records;
    json[QStringLiteral("keyword_entries")] = keywordEntries;
    json[QStringLiteral("vector_labels")] = vectorLabels;
    json[QStringLiteral("payload_rows")] = payloadRows;
    json[QStringLiteral("missing_keyword")] = toJsonArray(missingKeyword);
    json[QStringLiteral("missing_vector")] = toJsonArray(missingVector);
    json[QStringLiteral("missing_payload")] = toJsonArray(missingPayload);
    json[QStringLiteral("orphan_keyword")] = toJsonArray(orphanKeyword);
    json[QStringLiteral("orphan_vector")] = toJsonArray(orphanVector);
    json[QStringLiteral("orphan_payload")] = toJsonArray(orphanPayload);
    json[QStringLiteral("location_mismatches")] = toJsonArray(locationMismatches);
    return json;
}

ConsistencyReport ConsistencyChecker::check(RecordStore& store, KeywordIndex& keyword,
                                            VectorIndex& vectors, VectorStore& payloads)
{
    std::vector<int64_t> recordIds = store.allIds();
    std::vector<int64_t> keywordIds = keyword.allIds();
    std::vector<int64_t> vectorIds = vectors.labels();
    std::vector<int64_t> payloadIds = payloads.allIds();
    std::sort(recordIds.begin(), recordIds.end());
    std::sort(keywordIds.begin(), keywordIds.end());
    std::sort(payloadIds.begin(), payloadIds.end());

    ConsistencyReport report;
    report.records = static_cast<int>(recordIds.size());
    report.keywordEntries = static_cast<int>(keywordIds.size());
    report.vectorLabels = static_cast<int>(vectorIds.size());
    report.payloadRows = static_cast<int>(payloadIds.size());

    report.missingKeyword = difference(recordIds, keywordIds);
    report.missingVector = difference(recordIds, vectorIds);
    report.missingPayload = difference(recordIds, payloadIds);
    report.orphanKeyword = difference(keywordIds, recordIds);
    report.orphanVector = difference(vectorIds, recordIds);
    report.orphanPayload = difference(payloadIds, recordIds);

    std::vector<int64_t> shared;
    std::set_intersection(recordIds.begin(), recordIds.end(), payloadIds.begin(), payloadIds.end(),
                          std::back_inserter(shared));
    const auto records = store.getMany(shared);
    const auto locations = payloads.getLocations(shared);
    for (int64_t id : shared) {
        const auto record = records.find(id);
        const auto location = locations.find(id);
        if (record == records.end() || location == locations.end()) {
            continue;
        }
        if (record->second.location != location->second) {
            report.locationMismatches.push_back(id);
        }
    }

    if (!report.isConsistent()) {
        LOG_WARN(lcRetrieval,
                 "Consistency check failed: missing(kw=%d vec=%d payload=%d) "
                 "orphan(kw=%d vec=%d payload=%d) mismatched=%d",
                 static_cast<int>(report.missingKeyword.size()),
                 static_cast<int>(report.missingVector.size()),
                 static_cast<int>(report.missingPayload.size()),
                 static_cast<int>(report.orphanKeyword.size()),
                 static_cast<int>(report.orphanVector.size()),
                 static_cast<int>(report.orphanPayload.size()),
                 static_cast<int>(report.locationMismatches.size()));
    }
    return report;
}

} // namespace lc
