#pragma once

#include <Eigen/Dense>

#include <vector>

#include "core/Annotation.hpp"
#include "core/Collaborators.hpp"
#include "core/Config.hpp"
#include "utils/FastaReader.hpp"

namespace IsoLinkage {

/**
 * @brief Baseline ElementIdentifier over short- and long-read evidence.
 *
 * Per region:
 *   1. Introns from CIGAR N gaps of all reads (plus annotation introns).
 *   2. Per-base coverage (Eigen::VectorXi) and PIR for every intron.
 *   3. Internal, TSS and TES exons from spliced long reads and annotation
 *      transcripts; terminal exons merged within txs_diff.
 *   4. Connected components per strand become gene clusters.
 *
 * Thread-safe as long as the AlignmentSource and FastaReader are.
 */
class ElementFinder : public ElementIdentifier {
public:
    /**
     * @param reads Evidence source, shared by all workers.
     * @param params txs_diff and pir_cutoff are used here.
     * @param evidence Optional external sites and annotations.
     * @param genome Optional genome for splice-motif strand resolution.
     */
    ElementFinder(AlignmentSource& reads, const AnalysisParams& params, const ExternalEvidence* evidence = nullptr,
                  FastaReader* genome = nullptr);

    std::vector<GeneCluster> identify(const Region& region, const CancellationToken& token) const override;

    /**
     * @brief mean / (mean + support), 0 when both are 0.
     */
    static double percent_intron_retention(double mean_coverage, int junction_support);

    /**
     * @brief Per-base coverage of read blocks over the region.
     */
    static Eigen::VectorXi coverage(const Region& region, const std::vector<ReadAlignment>& reads);

private:
    struct TerminalEnd;

    std::vector<GenomicElement> find_introns(const Region& region, const std::vector<ReadAlignment>& reads,
                                             const Eigen::VectorXi& cov) const;

    std::vector<GenomicElement> find_exons(const Region& region, const std::vector<const ReadAlignment*>& spliced,
                                           const CancellationToken& token) const;

    std::vector<GenomicElement> merge_terminal(const Region& region, ElementType type,
                                               std::vector<TerminalEnd>& ends) const;

    Strand resolve_strand(const std::string& chrom, const Interval& intron, int plus_reads, int minus_reads,
                          Strand region_majority) const;

    AlignmentSource& reads_;
    AnalysisParams params_;
    const ExternalEvidence* evidence_;
    FastaReader* genome_;
};

}  // namespace IsoLinkage
