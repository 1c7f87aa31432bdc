#pragma once

#include <vector>

#include "core/Cancellation.hpp"
#include "core/DataStructs.hpp"

namespace IsoLinkage {

/**
 * @brief Lazy, finite, non-restartable sequence of disjoint regions,
 * ordered by genomic position.
 *
 * Not thread-safe: the scheduler serializes calls to next().
 */
class RegionSource {
public:
    virtual ~RegionSource() = default;

    /**
     * @brief Produces the next region.
     * @return false once the sequence is exhausted.
     */
    virtual bool next(Region& out) = 0;
};

/**
 * @brief Supplies read alignments overlapping a region.
 *
 * Implementations must be safe to call concurrently from different
 * OpenMP threads.
 */
class AlignmentSource {
public:
    virtual ~AlignmentSource() = default;

    virtual std::vector<ReadAlignment> fetch(const Region& region, EvidenceKind kind,
                                             const CancellationToken& token) = 0;
};

/**
 * @brief Finds introns/exons in one region and groups them into gene clusters.
 *
 * Evidence sources and external annotations are bound at construction.
 * Long-running implementations must poll the token.
 */
class ElementIdentifier {
public:
    virtual ~ElementIdentifier() = default;

    virtual std::vector<GeneCluster> identify(const Region& region, const CancellationToken& token) const = 0;
};

/**
 * @brief Assembles and classifies the isoforms of one gene cluster.
 */
class TranscriptIdentifier {
public:
    virtual ~TranscriptIdentifier() = default;

    virtual TranscriptSet identify(const GeneCluster& cluster, const CancellationToken& token) const = 0;
};

}  // namespace IsoLinkage
