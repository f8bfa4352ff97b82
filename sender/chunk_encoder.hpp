#pragma once

// ============================================================
// chunk_encoder.hpp -- Concurrent production of wire records
//
// Scatter/gather over ThreadPool: every chunk is an independent task,
// every task reports a record or a typed failure, and the gathered
// records are re-sorted by index. Output is identical for any pool size
// and for the sequential path used below the threshold.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

using EncodeFn = std::function<WireRecord(const Chunk&)>;

struct EncodeFailure {
    u32         index = 0;
    std::string error;
};

struct EncodeReport {
    std::vector<WireRecord>    records;     // sorted by index
    std::vector<EncodeFailure> failures;    // sorted by index
    bool                       cancelled = false;

    bool ok() const { return failures.empty() && !cancelled; }
    std::vector<u32> failed_indices() const;
};

class ChunkEncoder {
public:
    // max_workers 0 = ThreadPool::default_size()
    explicit ChunkEncoder(size_t max_workers = 0,
                          size_t parallel_threshold = DEFAULT_PARALLEL_THRESHOLD,
                          bool parallel = true);

    EncodeReport encode_all(const std::vector<Chunk>& chunks, const EncodeFn& fn);

    // Safe from a signal handler: queued tasks are dropped, running ones finish
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

    // Whether encode_all would use the pool for this many chunks
    bool uses_pool(size_t count) const { return parallel_ && count > threshold_; }

    size_t worker_count() const { return workers_; }

private:
    EncodeReport run_sequential(const std::vector<Chunk>& chunks, const EncodeFn& fn);
    EncodeReport run_parallel(const std::vector<Chunk>& chunks, const EncodeFn& fn);

    size_t            workers_;
    size_t            threshold_;
    bool              parallel_;
    std::atomic<bool> cancelled_{false};
};
