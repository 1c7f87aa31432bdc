#include "core/RegionScheduler.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "core/Errors.hpp"
#include "io/BedFormat.hpp"
#include "utils/Logger.hpp"

namespace IsoLinkage {

RegionScheduler::RegionScheduler(const ElementIdentifier& elements, const TranscriptIdentifier& transcripts,
                                 OutputMultiplexer& output, ClusterNumberer& numberer, TimeoutLog* timeout_log,
                                 const SchedulerOptions& options)
    : elements_(elements),
      transcripts_(transcripts),
      output_(output),
      numberer_(numberer),
      timeout_log_(timeout_log),
      options_(options) {
    options_.threads = std::max(1, options_.threads);
    window_ = options_.max_pending > 0 ? options_.max_pending : 4 * static_cast<size_t>(options_.threads);
    window_ = std::max(window_, static_cast<size_t>(options_.threads));

    std::stringstream ss;
    ss << "RegionScheduler initialized:\n"
       << "  Threads: " << options_.threads << "\n"
       << "  Commit window: " << window_ << " regions\n"
       << "  Time out: "
       << (options_.deadline ? TimeoutLog::format_deadline(*options_.deadline) : std::string("none"));
    LOG_INFO(ss.str());
}

SchedulerSummary RegionScheduler::process(RegionSource& regions) {
    next_index_ = 0;
    exhausted_ = false;
    pending_.clear();
    next_commit_ = 0;
    summary_ = SchedulerSummary();
    stop_.store(false);
    fatal_index_.store(static_cast<size_t>(-1));
    fatal_error_ = nullptr;

    auto t_start = std::chrono::steady_clock::now();

    const int num_threads = options_.threads;
#pragma omp parallel num_threads(num_threads) if (num_threads > 1)
    {
        worker_loop(regions);
    }

    auto t_end = std::chrono::steady_clock::now();
    summary_.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    if (fatal_error_) {
        LOG_ERROR("Region processing aborted after " + std::to_string(summary_.completed) +
                  " committed regions");
        std::rethrow_exception(fatal_error_);
    }

    LOG_INFO("All regions processed in " + std::to_string(summary_.elapsed_ms) + " ms");
    return summary_;
}

void RegionScheduler::worker_loop(RegionSource& regions) {
    while (!stop_.load(std::memory_order_acquire)) {
        Region region;
        size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(source_mutex_);
            if (exhausted_ || stop_.load(std::memory_order_acquire)) {
                break;
            }
            wait_for_window();
            if (stop_.load(std::memory_order_acquire)) {
                break;
            }
            try {
                if (!regions.next(region)) {
                    exhausted_ = true;
                    break;
                }
            } catch (...) {
                exhausted_ = true;
                record_fatal(next_index_, std::current_exception());
                break;
            }
            index = next_index_++;
        }

        try {
            RegionOutcome outcome = analyze_region(region, index);
            submit(index, std::move(outcome));
        } catch (...) {
            record_fatal(index, std::current_exception());
            wake_intake();
        }
    }
}

void RegionScheduler::wait_for_window() {
    std::unique_lock<std::mutex> lock(commit_mutex_);
    commit_cv_.wait(lock, [this] {
        return stop_.load(std::memory_order_acquire) || next_index_ - next_commit_ < window_;
    });
}

void RegionScheduler::wake_intake() {
    {
        // Pairs with the predicate check in wait_for_window()
        std::lock_guard<std::mutex> lock(commit_mutex_);
    }
    commit_cv_.notify_all();
}

RegionScheduler::RegionOutcome RegionScheduler::analyze_region(const Region& region, size_t index) {
    RegionOutcome outcome;
    outcome.region = region;
    outcome.deadline = options_.deadline.value_or(std::chrono::milliseconds(0));

    RegionTimer timer(options_.deadline, [this, index] { return should_stop(index); });
    timer.arm();

    try {
        LOG_DEBUG("Start identifying elements in " + region.to_string());
        std::vector<GeneCluster> clusters = elements_.identify(region, timer.token());
        LOG_DEBUG("Finish identifying elements in " + region.to_string());

        for (auto& cluster : clusters) {
            if (!cluster.has_element()) {
                outcome.skipped_clusters++;
                continue;
            }
            timer.token().throw_if_cancelled();

            LOG_DEBUG("Start identifying transcript for " + cluster.to_string());
            TranscriptSet transcripts = transcripts_.identify(cluster, timer.token());
            LOG_DEBUG("Finish identifying transcript for " + cluster.to_string());

            outcome.clusters.emplace_back(std::move(cluster), std::move(transcripts));
        }
    } catch (const RegionTimeout& e) {
        timer.disarm();
        outcome.status = Status::TIMED_OUT;
        if (!options_.deadline) {
            outcome.deadline = e.deadline();
        }
        outcome.clusters.clear();
        return outcome;
    } catch (const RegionCancelled&) {
        outcome.status = Status::CANCELLED;
        outcome.clusters.clear();
        return outcome;
    }

    // A collaborator that ignores the token still loses its result after the deadline.
    if (timer.disarm() == RegionTimer::State::FIRED) {
        outcome.status = Status::TIMED_OUT;
        outcome.clusters.clear();
    }
    return outcome;
}

void RegionScheduler::submit(size_t index, RegionOutcome&& outcome) {
    std::lock_guard<std::mutex> lock(commit_mutex_);
    summary_.regions++;
    pending_.emplace(index, std::move(outcome));

    while (next_commit_ < fatal_index_.load(std::memory_order_acquire)) {
        auto it = pending_.find(next_commit_);
        if (it == pending_.end()) {
            break;
        }
        try {
            commit(it->second);
        } catch (...) {
            record_fatal(it->first, std::current_exception());
            break;
        }
        pending_.erase(it);
        next_commit_++;
    }
    commit_cv_.notify_all();
}

void RegionScheduler::commit(RegionOutcome& outcome) {
    const Region& region = outcome.region;

    switch (outcome.status) {
        case Status::CANCELLED:
            return;

        case Status::TIMED_OUT:
            summary_.timed_out++;
            LOG_WARNING("TimeOut (" + TimeoutLog::format_deadline(outcome.deadline) + "): " + region.to_string());
            if (timeout_log_) {
                timeout_log_->record(region, outcome.deadline);
            }
            return;

        case Status::COMPLETED:
            break;
    }

    summary_.skipped_clusters += outcome.skipped_clusters;
    if (outcome.clusters.empty()) {
        summary_.empty_regions++;
        summary_.completed++;
        LOG_DEBUG("No gene cluster in " + region.to_string());
        return;
    }

    RecordBatch batch;
    size_t num_elements = 0;
    size_t num_isoforms = 0;

    for (const auto& [cluster, transcripts] : outcome.clusters) {
        const std::string cluster_id = numberer_.next();

        for (auto t : kAllElementTypes) {
            int ordinal = 0;
            for (const auto& element : cluster.of(t)) {
                batch.lines(t).push_back(BedFormatter::element_record(element, cluster_id, ++ordinal));
                num_elements++;
            }
        }

        std::array<int, kNumIsoformCategories> ordinals{};
        for (const auto& isoform : transcripts.isoforms) {
            int& ordinal = ordinals[static_cast<size_t>(isoform.category)];
            batch.lines(isoform.category).push_back(BedFormatter::isoform_record(isoform, cluster_id, ++ordinal));
            num_isoforms++;
        }

        summary_.clusters++;
    }

    output_.write_batch(batch);

    summary_.element_records += num_elements;
    summary_.isoform_records += num_isoforms;
    summary_.completed++;

    LOG_DEBUG("Region " + region.to_string() + " committed: " + std::to_string(outcome.clusters.size()) +
              " clusters, " + std::to_string(num_isoforms) + " isoforms");
}

void RegionScheduler::record_fatal(size_t index, std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    if (!fatal_error_ || index < fatal_index_.load(std::memory_order_acquire)) {
        fatal_error_ = error;
        fatal_index_.store(index, std::memory_order_release);
    }
    stop_.store(true, std::memory_order_release);
}

void RegionScheduler::print_summary(const SchedulerSummary& summary) const {
    std::stringstream ss;
    ss << "\n=== Processing Summary ===\n"
       << "Total regions: " << summary.regions << "\n"
       << "Completed: " << summary.completed << "\n"
       << "  Without clusters: " << summary.empty_regions << "\n"
       << "Timed out: " << summary.timed_out << "\n"
       << "Gene clusters written: " << summary.clusters << "\n"
       << "Clusters skipped (no element): " << summary.skipped_clusters << "\n"
       << "Element records: " << summary.element_records << "\n"
       << "Isoform records: " << summary.isoform_records << "\n"
       << "Total processing time: " << std::fixed << std::setprecision(1) << summary.elapsed_ms << " ms\n"
       << "Average time per region: "
       << (summary.regions > 0 ? summary.elapsed_ms / static_cast<double>(summary.regions) : 0.0) << " ms";
    LOG_INFO(ss.str());
}

}  // namespace IsoLinkage
