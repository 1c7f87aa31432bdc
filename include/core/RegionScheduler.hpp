#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "core/ClusterNumberer.hpp"
#include "core/Collaborators.hpp"
#include "core/DataStructs.hpp"
#include "io/OutputMultiplexer.hpp"
#include "io/TimeoutLog.hpp"

namespace IsoLinkage {

struct SchedulerOptions {
    std::optional<std::chrono::milliseconds> deadline;  ///< Per-region budget, none if empty
    int threads = 1;                                    ///< OpenMP workers
    size_t max_pending = 0;                             ///< Regions pulled ahead of the oldest uncommitted one, 0 for 4 x threads
};

/**
 * @brief 處理結果統計
 */
struct SchedulerSummary {
    size_t regions = 0;           ///< Regions pulled from the source
    size_t completed = 0;         ///< Regions committed
    size_t timed_out = 0;         ///< Regions discarded by their deadline
    size_t empty_regions = 0;     ///< Completed regions without any cluster
    size_t skipped_clusters = 0;  ///< Candidate clusters without elements
    size_t clusters = 0;          ///< ClusterIds issued
    size_t element_records = 0;
    size_t isoform_records = 0;
    double elapsed_ms = 0.0;
};

/**
 * @brief 依序（或平行）處理 linkage regions 的核心類別
 *
 * 此類別負責：
 * 1. 從 RegionSource 逐一取出 region（lazy）
 * 2. 為每個 region 建立獨立的 RegionTimer 與 CancellationToken
 * 3. 呼叫 ElementIdentifier 與 TranscriptIdentifier
 * 4. 依 region 輸入順序 commit：分配 ClusterId、寫入十個輸出檔案
 * 5. Timeout 的 region 整個丟棄並寫入 timeout log
 *
 * Error policy:
 * - RegionTimeout: region discarded, logged, processing continues
 * - anything else: no new regions are pulled, later in-flight regions are
 *   cancelled, earlier ones finish and commit, then the first error is rethrown
 *
 * Thread-safety:
 * - RegionSource::next() is called under source_mutex_
 * - Commits (ClusterId assignment + writes) happen under commit_mutex_ in
 *   region input order, so output is identical for any thread count
 * - At most max_pending regions are pulled beyond the oldest uncommitted one;
 *   intake blocks on commit_cv_ until that region commits, which bounds the
 *   outcomes buffered behind a slow region
 */
class RegionScheduler {
public:
    /**
     * @param elements Element identification collaborator
     * @param transcripts Transcript identification collaborator
     * @param output Open output streams (must outlive the scheduler)
     * @param numberer Run-global ClusterId counter
     * @param timeout_log Timeout log, may be null
     * @param options Deadline and worker count
     */
    RegionScheduler(const ElementIdentifier& elements, const TranscriptIdentifier& transcripts,
                    OutputMultiplexer& output, ClusterNumberer& numberer, TimeoutLog* timeout_log,
                    const SchedulerOptions& options);

    /**
     * @brief Consumes all regions.
     *
     * @param regions Lazy region sequence, consumed exactly once
     * @return Statistics of the run
     * @throws The first fatal (non-timeout) error raised while processing
     */
    SchedulerSummary process(RegionSource& regions);

    /**
     * @brief 輸出處理摘要報告
     */
    void print_summary(const SchedulerSummary& summary) const;

private:
    enum class Status { COMPLETED, TIMED_OUT, CANCELLED };

    struct RegionOutcome {
        Status status = Status::COMPLETED;
        Region region;
        std::chrono::milliseconds deadline{0};
        std::vector<std::pair<GeneCluster, TranscriptSet>> clusters;
        size_t skipped_clusters = 0;
    };

    const ElementIdentifier& elements_;
    const TranscriptIdentifier& transcripts_;
    OutputMultiplexer& output_;
    ClusterNumberer& numberer_;
    TimeoutLog* timeout_log_;
    SchedulerOptions options_;
    size_t window_;

    // Region intake
    std::mutex source_mutex_;
    size_t next_index_ = 0;
    bool exhausted_ = false;

    // Ordered commit
    std::mutex commit_mutex_;
    std::map<size_t, RegionOutcome> pending_;
    size_t next_commit_ = 0;
    std::condition_variable commit_cv_;
    SchedulerSummary summary_;

    // Fatal error state
    std::mutex fatal_mutex_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> fatal_index_{static_cast<size_t>(-1)};
    std::exception_ptr fatal_error_;

    void worker_loop(RegionSource& regions);

    /**
     * @brief Blocks until the next region index fits in the commit window or a fatal error stops intake.
     *
     * Called with source_mutex_ held.
     */
    void wait_for_window();

    /**
     * @brief Wakes a worker blocked in wait_for_window() after a fatal error.
     *
     * Must not be called with commit_mutex_ held.
     */
    void wake_intake();

    /**
     * @brief Steps 1-4 for one region: arm, identify elements and transcripts, disarm.
     */
    RegionOutcome analyze_region(const Region& region, size_t index);

    /**
     * @brief Queues an outcome and commits every outcome that is next in input order.
     */
    void submit(size_t index, RegionOutcome&& outcome);

    void commit(RegionOutcome& outcome);

    void record_fatal(size_t index, std::exception_ptr error);

    /**
     * @brief A region must stop when a region earlier in input order failed fatally.
     */
    bool should_stop(size_t index) const {
        return stop_.load(std::memory_order_acquire) && index > fatal_index_.load(std::memory_order_acquire);
    }
};

}  // namespace IsoLinkage
