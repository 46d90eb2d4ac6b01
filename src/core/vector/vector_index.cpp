#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <cmath>
#include <limits>

namespace lc {

namespace {

constexpr int kMetaVersion = 1;

} // namespace

VectorIndex::VectorIndex()
{
}

VectorIndex::VectorIndex(const IndexMetadata& metadata)
    : m_metadata(metadata)
{
}

VectorIndex::~VectorIndex()
{
}

bool VectorIndex::configure(const IndexMetadata& metadata)
{
    if (m_index) {
        qCWarning(lcVector) << "VectorIndex::configure ignored: index already initialized";
        return false;
    }
    if (metadata.dimensions <= 0) {
        qCWarning(lcVector) << "VectorIndex::configure rejected invalid dimensions:"
                            << metadata.dimensions;
        return false;
    }
    m_metadata = metadata;
    return true;
}

bool VectorIndex::create(int initialCapacity)
{
    if (m_metadata.dimensions <= 0) {
        qCCritical(lcVector) << "VectorIndex::create requires a positive dimension";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        const int capacity = std::max(initialCapacity, 1);
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_metadata.dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        return true;
    } catch (const std::exception& e) {
        qCCritical(lcVector) << "VectorIndex::create failed:" << e.what();
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::load(const std::string& indexPath, const std::string& metaPath)
{
    QFileInfo indexInfo(QString::fromStdString(indexPath));
    if (!indexInfo.exists() || !indexInfo.isFile()) {
        qCWarning(lcVector) << "VectorIndex::load missing index file:" << indexInfo.filePath();
        return false;
    }

    // Truncated graphs crash hnswlib during deserialization; reject blobs
    // smaller than the fixed header.
    constexpr qint64 kMinSerializedIndexBytes = 96;
    if (indexInfo.size() < kMinSerializedIndexBytes) {
        qCCritical(lcVector) << "VectorIndex::load index payload too small:" << indexInfo.size();
        return false;
    }

    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::ReadOnly)) {
        qCCritical(lcVector) << "VectorIndex::load failed to open meta file:" << metaFile.fileName();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument metaDoc = QJsonDocument::fromJson(metaFile.readAll(), &parseError);
    metaFile.close();
    if (parseError.error != QJsonParseError::NoError || !metaDoc.isObject()) {
        qCCritical(lcVector) << "VectorIndex::load invalid meta JSON:" << parseError.errorString();
        return false;
    }

    const QJsonObject meta = metaDoc.object();
    const int dimensions = meta.value(QStringLiteral("dimensions")).toInt(-1);
    if (dimensions <= 0) {
        qCCritical(lcVector) << "VectorIndex::load missing/invalid dimensions in metadata";
        return false;
    }
    if (m_metadata.dimensions > 0 && dimensions != m_metadata.dimensions) {
        qCCritical(lcVector) << "VectorIndex::load dimension mismatch:" << dimensions
                             << "expected" << m_metadata.dimensions;
        return false;
    }

    m_metadata.dimensions = dimensions;
    m_metadata.schemaVersion = meta.value(QStringLiteral("version")).toInt(kMetaVersion);
    m_metadata.modelId = meta.value(QStringLiteral("model_id"))
                             .toString(QStringLiteral("unknown"))
                             .toStdString();

    const int efConstruction = meta.value(QStringLiteral("ef_construction")).toInt(kEfConstruction);
    const int m = meta.value(QStringLiteral("m")).toInt(kM);
    if (efConstruction != kEfConstruction || m != kM) {
        qCWarning(lcVector) << "VectorIndex::load metadata params differ from compiled defaults"
                            << "ef_construction=" << efConstruction
                            << "m=" << m;
    }

    const uint64_t totalElementsMeta =
        meta.value(QStringLiteral("total_elements")).toVariant().toULongLong();

    uint64_t targetCapacity = static_cast<uint64_t>(kInitialCapacity);
    targetCapacity = std::max(targetCapacity, totalElementsMeta + 1);
    targetCapacity = std::max(targetCapacity, totalElementsMeta * 2);

    if (targetCapacity > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        qCCritical(lcVector) << "VectorIndex::load target capacity too large:" << targetCapacity;
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_metadata.dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(m_space.get());
        m_index->loadIndex(indexPath, m_space.get(), static_cast<size_t>(targetCapacity));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        LOG_INFO(lcVector, "Loaded vector index: %d elements (%d deleted), dims=%d",
                 static_cast<int>(m_index->getCurrentElementCount()),
                 static_cast<int>(m_index->getDeletedCount()), m_metadata.dimensions);
        return true;
    } catch (const std::exception& e) {
        qCCritical(lcVector) << "VectorIndex::load failed:" << e.what();
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::save(const std::string& indexPath, const std::string& metaPath)
{
    if (!m_index) {
        qCWarning(lcVector) << "VectorIndex::save called with unavailable index";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            m_index->saveIndex(indexPath);
        } catch (const std::exception& e) {
            qCCritical(lcVector) << "VectorIndex::save failed to persist index:" << e.what();
            return false;
        }
    }

    QJsonObject meta;
    meta.insert(QStringLiteral("version"), kMetaVersion);
    meta.insert(QStringLiteral("model_id"), QString::fromStdString(m_metadata.modelId));
    meta.insert(QStringLiteral("dimensions"), m_metadata.dimensions);
    meta.insert(QStringLiteral("total_elements"), totalElements());
    meta.insert(QStringLiteral("deleted_elements"), deletedElements());
    meta.insert(QStringLiteral("ef_construction"), kEfConstruction);
    meta.insert(QStringLiteral("m"), kM);
    meta.insert(QStringLiteral("last_persisted"),
                QDateTime::currentDateTimeUtc().toString(Qt::ISODate));

    QFile metaFile(QString::fromStdString(metaPath));
    if (!metaFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCCritical(lcVector) << "VectorIndex::save failed to open meta file for write:"
                             << metaFile.fileName();
        return false;
    }

    const QJsonDocument doc(meta);
    const qint64 written = metaFile.write(doc.toJson(QJsonDocument::Indented));
    metaFile.close();
    if (written < 0) {
        qCCritical(lcVector) << "VectorIndex::save failed writing meta file:" << metaFile.fileName();
        return false;
    }
    return true;
}

VectorIndex::Status VectorIndex::upsert(int64_t id, const std::vector<float>& embedding)
{
    if (!m_index) {
        qCWarning(lcVector) << "VectorIndex::upsert called with unavailable index";
        return Status::Unavailable;
    }
    if (static_cast<int>(embedding.size()) != m_metadata.dimensions) {
        LOG_WARN(lcVector, "upsert id=%lld dimension mismatch: got %d, index has %d",
                 static_cast<long long>(id), static_cast<int>(embedding.size()),
                 m_metadata.dimensions);
        return Status::DimensionMismatch;
    }
    if (id < 0) {
        LOG_WARN(lcVector, "upsert rejected negative id=%lld", static_cast<long long>(id));
        return Status::BackendError;
    }

    std::vector<float> normalized = embedding;
    normalize(normalized);

    std::lock_guard<std::mutex> lock(m_mutex);

    if (!ensureCapacityForOneMore()) {
        return Status::BackendError;
    }

    try {
        // addPoint on an existing label updates it in place and clears a
        // delete mark.
        m_index->addPoint(normalized.data(), static_cast<hnswlib::labeltype>(id));
        return Status::Ok;
    } catch (const std::exception& e) {
        qCCritical(lcVector) << "VectorIndex::upsert failed:" << e.what();
        return Status::BackendError;
    }
}

bool VectorIndex::remove(int64_t id)
{
    if (!m_index) {
        qCWarning(lcVector) << "VectorIndex::remove called with unavailable index";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!isLiveLabel(id)) {
        return false;
    }
    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(id));
        return true;
    } catch (const std::exception& e) {
        qCCritical(lcVector) << "VectorIndex::remove failed:" << e.what();
        return false;
    }
}

bool VectorIndex::contains(int64_t id) const
{
    if (!m_index) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return isLiveLabel(id);
}

bool VectorIndex::isLiveLabel(int64_t id) const
{
    if (id < 0) {
        return false;
    }
    std::unique_lock<std::mutex> lookupLock(m_index->label_lookup_lock);
    const auto it = m_index->label_lookup_.find(static_cast<hnswlib::labeltype>(id));
    if (it == m_index->label_lookup_.end()) {
        return false;
    }
    return !m_index->isMarkedDeleted(it->second);
}

std::vector<int64_t> VectorIndex::labels() const
{
    std::vector<int64_t> result;
    if (!m_index) {
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    {
        std::unique_lock<std::mutex> lookupLock(m_index->label_lookup_lock);
        result.reserve(m_index->label_lookup_.size());
        for (const auto& entry : m_index->label_lookup_) {
            if (!m_index->isMarkedDeleted(entry.second)) {
                result.push_back(static_cast<int64_t>(entry.first));
            }
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

VectorIndex::Status VectorIndex::search(const std::vector<float>& query, int k,
                                        std::vector<SearchHit>* hits)
{
    if (hits) {
        hits->clear();
    }
    if (!m_index) {
        return Status::Unavailable;
    }
    if (static_cast<int>(query.size()) != m_metadata.dimensions) {
        LOG_WARN(lcVector, "search dimension mismatch: query has %d, index has %d",
                 static_cast<int>(query.size()), m_metadata.dimensions);
        return Status::DimensionMismatch;
    }
    if (k <= 0 || hits == nullptr) {
        return Status::Ok;
    }

    std::vector<float> normalized = query;
    normalize(normalized);

    struct KnnResult {
        int64_t label;
        float distance;
    };
    std::vector<KnnResult> results;

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        if (m_index->getCurrentElementCount() == m_index->getDeletedCount()) {
            return Status::Ok;
        }
        m_index->setEf(static_cast<size_t>(std::max(kEfSearch, k)));
        auto queue = m_index->searchKnn(normalized.data(), static_cast<size_t>(k));
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<int64_t>(entry.second), entry.first});
        }
    } catch (const std::exception& e) {
        qCCritical(lcVector) << "VectorIndex::search failed:" << e.what();
        return Status::BackendError;
    }

    std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        return a.label < b.label;
    });

    hits->reserve(results.size());
    for (const KnnResult& result : results) {
        SearchHit hit;
        hit.id = result.label;
        hit.rank = static_cast<int>(hits->size());
        hit.rawScore = 1.0 - static_cast<double>(result.distance);
        hits->push_back(hit);
    }
    return Status::Ok;
}

int VectorIndex::totalElements() const
{
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getCurrentElementCount());
}

int VectorIndex::deletedElements() const
{
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getDeletedCount());
}

int VectorIndex::activeElements() const
{
    return totalElements() - deletedElements();
}

bool VectorIndex::needsRebuild() const
{
    const int total = totalElements();
    if (total <= 0) {
        return false;
    }
    return static_cast<double>(deletedElements()) / static_cast<double>(total) > 0.20;
}

bool VectorIndex::isAvailable() const
{
    return m_index != nullptr;
}

int VectorIndex::dimensions() const
{
    return m_metadata.dimensions;
}

const VectorIndex::IndexMetadata& VectorIndex::metadata() const
{
    return m_metadata;
}

void VectorIndex::normalize(std::vector<float>& vector)
{
    double sumSquares = 0.0;
    for (const float value : vector) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }
    if (sumSquares <= 0.0) {
        return;
    }
    const float inverseNorm = static_cast<float>(1.0 / std::sqrt(sumSquares));
    for (float& value : vector) {
        value *= inverseNorm;
    }
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        qCCritical(lcVector) << "VectorIndex has zero max elements";
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    if (newCapacity <= maxElements) {
        qCCritical(lcVector) << "VectorIndex resize overflow";
        return false;
    }

    try {
        m_index->resizeIndex(newCapacity);
        qCInfo(lcVector) << "VectorIndex resized to capacity" << static_cast<qulonglong>(newCapacity);
        return true;
    } catch (const std::exception& e) {
        qCCritical(lcVector) << "VectorIndex resize failed:" << e.what();
        return false;
    }
}

} // namespace lc
