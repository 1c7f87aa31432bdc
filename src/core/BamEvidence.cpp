#include "core/BamEvidence.hpp"

#include <omp.h>

#include <algorithm>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace IsoLinkage {

namespace {

ReadFilterConfig filter_from(const AnalysisParams& params) {
    ReadFilterConfig filter;
    filter.min_mapq = params.min_mapq;
    return filter;
}

}  // namespace

BamAlignmentSource::BamAlignmentSource(std::vector<std::string> ngs_paths, std::vector<std::string> tgs_paths,
                                       const AnalysisParams& params, int num_slots)
    : ngs_paths_(std::move(ngs_paths)),
      tgs_paths_(std::move(tgs_paths)),
      ngs_parser_(EvidenceKind::NGS, params.strand_rule, filter_from(params)),
      tgs_parser_(EvidenceKind::TGS, params.strand_rule, filter_from(params)),
      slots_(static_cast<size_t>(std::max(1, num_slots))) {
}

BamAlignmentSource::ReaderSet& BamAlignmentSource::readers_for_thread() {
    const size_t slot = static_cast<size_t>(omp_get_thread_num());
    if (slot >= slots_.size()) {
        throw ResourceError("No BAM reader slot for thread " + std::to_string(slot));
    }

    ReaderSet& set = slots_[slot];
    if (set.opened) {
        return set;
    }

    // Opening serialized: htslib index loading hits the filesystem hard
    std::lock_guard<std::mutex> lock(slots_mutex_);
    try {
        for (const auto& path : ngs_paths_) {
            set.ngs.push_back(std::make_unique<BamReader>(path));
        }
        for (const auto& path : tgs_paths_) {
            set.tgs.push_back(std::make_unique<BamReader>(path));
        }
    } catch (const std::runtime_error& e) {
        set.ngs.clear();
        set.tgs.clear();
        throw ResourceError(e.what());
    }
    set.opened = true;
    LOG_DEBUG("Opened " + std::to_string(set.ngs.size() + set.tgs.size()) + " BAM readers for slot " +
              std::to_string(slot));
    return set;
}

std::vector<ReadAlignment> BamAlignmentSource::fetch(const Region& region, EvidenceKind kind,
                                                     const CancellationToken& token) {
    ReaderSet& set = readers_for_thread();
    auto& readers = kind == EvidenceKind::NGS ? set.ngs : set.tgs;
    const ReadParser& parser = kind == EvidenceKind::NGS ? ngs_parser_ : tgs_parser_;

    std::vector<ReadAlignment> reads;
    size_t visited = 0;

    for (auto& reader : readers) {
        reader->for_each_read(region.chrom, region.start, region.end, [&](const bam1_t* b) {
            if (++visited % kPollInterval == 0) {
                token.throw_if_cancelled();
            }
            if (!parser.should_keep(b)) {
                return;
            }
            ReadAlignment aln = parser.parse(b);
            if (!aln.blocks.empty()) {
                reads.push_back(std::move(aln));
            }
        });
    }

    token.throw_if_cancelled();
    return reads;
}

}  // namespace IsoLinkage
