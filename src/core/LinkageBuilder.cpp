#include "core/LinkageBuilder.hpp"

#include <algorithm>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace IsoLinkage {

namespace {

ReadFilterConfig filter_config(const AnalysisParams& params) {
    ReadFilterConfig filter;
    filter.min_mapq = params.min_mapq;
    return filter;
}

void add_annotation_spans(const TranscriptAnnotation& annotation, const std::string& chrom,
                          std::vector<Interval>& spans) {
    for (const auto& tx : annotation.on(chrom)) {
        spans.push_back({tx.start(), tx.end()});
    }
}

}  // namespace

BamLinkageBuilder::BamLinkageBuilder(const std::vector<std::string>& bam_paths, const AnalysisParams& params,
                                     const ExternalEvidence* evidence)
    : filter_(EvidenceKind::NGS, params.strand_rule, filter_config(params)), evidence_(evidence) {
    if (bam_paths.empty()) {
        throw ResourceError("No evidence files for linkage building");
    }

    for (const auto& path : bam_paths) {
        try {
            readers_.push_back(std::make_unique<BamReader>(path));
        } catch (const std::runtime_error& e) {
            throw ResourceError(e.what());
        }
    }

    chroms_ = readers_.front()->target_names();
    LOG_INFO("Linkage building over " + std::to_string(chroms_.size()) + " chromosomes from " +
             std::to_string(readers_.size()) + " evidence files");
}

std::vector<Interval> BamLinkageBuilder::merge_spans(std::vector<Interval> spans) {
    std::sort(spans.begin(), spans.end());

    std::vector<Interval> merged;
    for (const auto& span : spans) {
        if (span.length() <= 0) {
            continue;
        }
        if (!merged.empty() && span.start < merged.back().end) {
            merged.back().end = std::max(merged.back().end, span.end);
        } else {
            merged.push_back(span);
        }
    }
    return merged;
}

bool BamLinkageBuilder::load_next_chromosome() {
    while (chrom_pos_ < chroms_.size()) {
        const std::string& chrom = chroms_[chrom_pos_++];

        std::vector<Interval> spans;
        for (auto& reader : readers_) {
            int64_t len = reader->target_length(chrom);
            if (len <= 0) {
                continue;
            }
            reader->for_each_read(chrom, 0, static_cast<int32_t>(len), [&](const bam1_t* b) {
                if (filter_.should_keep(b)) {
                    spans.push_back({static_cast<int32_t>(b->core.pos), static_cast<int32_t>(bam_endpos(b))});
                }
            });
        }

        if (spans.empty()) {
            LOG_DEBUG("No reads on " + chrom + ", skipped");
            continue;
        }

        if (evidence_) {
            add_annotation_spans(evidence_->ngs_annotation, chrom, spans);
            add_annotation_spans(evidence_->confirmed_annotation, chrom, spans);
        }

        current_chrom_ = chrom;
        current_ = merge_spans(std::move(spans));
        current_pos_ = 0;
        LOG_INFO(chrom + ": " + std::to_string(current_.size()) + " linkage regions");
        return true;
    }
    return false;
}

bool BamLinkageBuilder::next(Region& out) {
    while (current_pos_ >= current_.size()) {
        if (!load_next_chromosome()) {
            return false;
        }
    }

    const Interval& span = current_[current_pos_++];
    out.chrom = current_chrom_;
    out.start = span.start;
    out.end = span.end;
    emitted_++;
    return true;
}

}  // namespace IsoLinkage
