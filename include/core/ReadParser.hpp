#pragma once

#include <htslib/sam.h>

#include "core/DataStructs.hpp"
#include "core/Types.hpp"

namespace IsoLinkage {

/**
 * @brief Configuration for read filtering criteria.
 */
struct ReadFilterConfig {
    int min_mapq = 0;  ///< Minimum mapping quality
};

/**
 * @brief Converts BAM records into ReadAlignment blocks.
 *
 * This class handles:
 * - Filtering secondary, supplementary, duplicate, QC-fail and unmapped reads
 * - Splitting the alignment into blocks at reference skips (CIGAR N)
 * - Inferring the transcript strand from the library rule or strand tags
 *
 * Thread-safe: This class is stateless and can be used from multiple threads.
 */
class ReadParser {
public:
    ReadParser(EvidenceKind kind, StrandRule rule, const ReadFilterConfig& config = {});

    /**
     * @brief Checks if a read passes all filtering criteria.
     */
    bool should_keep(const bam1_t* b) const;

    /**
     * @brief Parses a BAM record into blocks and strand.
     *
     * M, =, X and D extend the current block; N closes it and starts the
     * next one; I, S, H and P do not consume the reference.
     */
    ReadAlignment parse(const bam1_t* b) const;

    /**
     * @brief Transcript strand of a read.
     *
     * NGS reads follow the library rule (single_end: XS tag only). Long
     * reads use the XS tag, then the minimap2 ts tag, then alignment
     * orientation.
     */
    Strand determine_strand(const bam1_t* b) const;

    /**
     * @brief Strand from the XS:A tag, UNKNOWN if absent.
     */
    static Strand strand_from_xs(const bam1_t* b);

    const ReadFilterConfig& get_config() const { return config_; }

private:
    EvidenceKind kind_;
    StrandRule rule_;
    ReadFilterConfig config_;
};

}  // namespace IsoLinkage
