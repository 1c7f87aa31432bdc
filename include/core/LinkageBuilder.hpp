#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/Annotation.hpp"
#include "core/BamReader.hpp"
#include "core/Collaborators.hpp"
#include "core/Config.hpp"
#include "core/ReadParser.hpp"

namespace IsoLinkage {

/**
 * @brief Lazy RegionSource that yields linkage regions from BAM coverage.
 *
 * Works one chromosome at a time, in the header order of the first BAM:
 * the spans of all usable reads from every file, together with the spans
 * of annotation transcripts, are merged into disjoint intervals which are
 * then handed out in position order. Chromosomes without reads are
 * skipped.
 *
 * Not thread-safe; the RegionScheduler serializes next().
 */
class BamLinkageBuilder : public RegionSource {
public:
    /**
     * @param bam_paths NGS and TGS files; the first one defines chromosome order.
     * @param params Read filter parameters.
     * @param evidence Optional annotations whose transcripts extend regions.
     * @throws ResourceError if a BAM file cannot be opened.
     */
    BamLinkageBuilder(const std::vector<std::string>& bam_paths, const AnalysisParams& params,
                      const ExternalEvidence* evidence = nullptr);

    bool next(Region& out) override;

    /**
     * @brief Sorts spans and merges the overlapping ones.
     *
     * Touching spans ([a,b) and [b,c)) stay separate.
     */
    static std::vector<Interval> merge_spans(std::vector<Interval> spans);

    size_t regions_emitted() const { return emitted_; }

private:
    bool load_next_chromosome();

    std::vector<std::unique_ptr<BamReader>> readers_;
    ReadParser filter_;
    const ExternalEvidence* evidence_;

    std::vector<std::string> chroms_;
    size_t chrom_pos_ = 0;

    std::string current_chrom_;
    std::vector<Interval> current_;
    size_t current_pos_ = 0;
    size_t emitted_ = 0;
};

}  // namespace IsoLinkage
