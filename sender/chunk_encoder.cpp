// ============================================================
// chunk_encoder.cpp -- Concurrent production of wire records
// ============================================================

#include "chunk_encoder.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <future>

std::vector<u32> EncodeReport::failed_indices() const {
    std::vector<u32> v;
    v.reserve(failures.size());
    for (auto& f : failures) v.push_back(f.index);
    return v;
}

ChunkEncoder::ChunkEncoder(size_t max_workers, size_t parallel_threshold, bool parallel)
    : workers_(max_workers ? max_workers : ThreadPool::default_size())
    , threshold_(parallel_threshold)
    , parallel_(parallel)
{}

static void sort_report(EncodeReport& rep) {
    std::sort(rep.records.begin(), rep.records.end(),
              [](const WireRecord& a, const WireRecord& b) { return a.index < b.index; });
    std::sort(rep.failures.begin(), rep.failures.end(),
              [](const EncodeFailure& a, const EncodeFailure& b) { return a.index < b.index; });
}

EncodeReport ChunkEncoder::encode_all(const std::vector<Chunk>& chunks, const EncodeFn& fn) {
    EncodeReport rep = uses_pool(chunks.size()) ? run_parallel(chunks, fn)
                                                : run_sequential(chunks, fn);
    sort_report(rep);
    if (!rep.failures.empty()) {
        LOG_ERROR("Encoding failed for " + std::to_string(rep.failures.size()) + " of " +
                  std::to_string(chunks.size()) + " chunks");
    }
    return rep;
}

EncodeReport ChunkEncoder::run_sequential(const std::vector<Chunk>& chunks, const EncodeFn& fn) {
    EncodeReport rep;
    rep.records.reserve(chunks.size());
    for (const auto& c : chunks) {
        if (cancelled_.load()) {
            rep.cancelled = true;
            break;
        }
        try {
            rep.records.push_back(fn(c));
        } catch (const std::exception& e) {
            LOG_ERROR("Chunk " + std::to_string(c.index) + ": " + e.what());
            rep.failures.push_back({c.index, e.what()});
        }
    }
    return rep;
}

EncodeReport ChunkEncoder::run_parallel(const std::vector<Chunk>& chunks, const EncodeFn& fn) {
    EncodeReport rep;
    rep.records.reserve(chunks.size());

    size_t n_threads = std::min(workers_, chunks.size());
    LOG_DEBUG("Encoding " + std::to_string(chunks.size()) + " chunks on " +
              std::to_string(n_threads) + " threads");

    ThreadPool pool(n_threads);
    std::vector<std::future<WireRecord>> futures;
    futures.reserve(chunks.size());
    for (const auto& c : chunks) {
        futures.push_back(pool.submit([&fn, &c]() { return fn(c); }));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        // Wake periodically so a cancel request is seen while tasks are queued
        while (futures[i].wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
            if (cancelled_.load() && pool.pending() > 0) {
                size_t dropped = pool.cancel_pending();
                LOG_WARN("Cancelled " + std::to_string(dropped) + " queued chunk tasks");
            }
        }
        try {
            rep.records.push_back(futures[i].get());
        } catch (const std::future_error&) {
            // Dropped by cancel_pending before it ran
            rep.cancelled = true;
        } catch (const std::exception& e) {
            LOG_ERROR("Chunk " + std::to_string(chunks[i].index) + ": " + e.what());
            rep.failures.push_back({chunks[i].index, e.what()});
        }
    }
    if (cancelled_.load()) rep.cancelled = true;
    return rep;
}
