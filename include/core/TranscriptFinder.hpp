#pragma once

#include <vector>

#include "core/Annotation.hpp"
#include "core/Collaborators.hpp"
#include "core/Config.hpp"

namespace IsoLinkage {

/**
 * @brief Baseline TranscriptIdentifier.
 *
 * Collapses the cluster's long-read chains by strand and intron chain,
 * then classifies each isoform with precedence A > C > R > F > M > P.
 * Stateless after construction; safe to share between threads.
 */
class TranscriptFinder : public TranscriptIdentifier {
public:
    explicit TranscriptFinder(const AnalysisParams& params, const ExternalEvidence* evidence = nullptr);

    TranscriptSet identify(const GeneCluster& cluster, const CancellationToken& token) const override;

private:
    IsoformCategory classify(const GeneCluster& cluster, const Isoform& isoform,
                             const std::vector<Interval>& introns) const;

    /**
     * @brief true if the terminal exon lies on a confident TSS/TES exon of the cluster.
     *
     * The splice-side coordinate must match exactly; the free end must be
     * within txs_diff.
     */
    bool on_confident_end(const GeneCluster& cluster, ElementType type, const Interval& exon,
                          bool free_end_left) const;

    AnalysisParams params_;
    const ExternalEvidence* evidence_;
};

}  // namespace IsoLinkage
