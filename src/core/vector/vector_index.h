#pragma once

#include "core/shared/search_sources.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace lc {

// HNSW graph over paragraph embeddings. Labels are record ids, so the
// graph needs no id mapping of its own. Vectors are L2-normalised on entry
// which makes inner-product distance equal to cosine distance.
class VectorIndex : public VectorSource {
public:
    using Status = VectorSearchStatus;

    struct IndexMetadata {
        int schemaVersion = 1;
        int dimensions = 0;
        std::string modelId = "unknown";
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 10000;

    VectorIndex();
    explicit VectorIndex(const IndexMetadata& metadata);
    ~VectorIndex() override;

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool configure(const IndexMetadata& metadata);
    bool create(int initialCapacity = kInitialCapacity);
    bool load(const std::string& indexPath, const std::string& metaPath);
    bool save(const std::string& indexPath, const std::string& metaPath);

    // Insert or replace the vector stored under id. Re-upserting a removed
    // id revives it.
    Status upsert(int64_t id, const std::vector<float>& embedding);
    bool remove(int64_t id);
    bool contains(int64_t id) const;

    // Live (non-deleted) labels in ascending order.
    std::vector<int64_t> labels() const;

    // Nearest neighbours by cosine similarity, best first. rawScore is the
    // similarity (1 - inner-product distance).
    Status search(const std::vector<float>& query, int k,
                  std::vector<SearchHit>* hits) override;

    int totalElements() const;
    int deletedElements() const;
    int activeElements() const;
    bool needsRebuild() const;
    bool isAvailable() const;
    int dimensions() const override;
    const IndexMetadata& metadata() const;

    static void normalize(std::vector<float>& vector);

private:
    bool ensureCapacityForOneMore();
    bool isLiveLabel(int64_t id) const;

    IndexMetadata m_metadata;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    mutable std::mutex m_mutex;
};

} // namespace lc
