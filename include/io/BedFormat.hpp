#pragma once

#include <string>

#include "core/DataStructs.hpp"

namespace IsoLinkage {

/**
 * @brief Formats elements and isoforms as tab-delimited interval records.
 *
 * Every record ends with the owning cluster id as its last column:
 *
 * Elements (BED6+1):
 * ```
 * chrom  start  end  c_7.I1  support  strand  c_7
 * ```
 *
 * Isoforms (BED12+1):
 * ```
 * chrom  start  end  c_7.F1  support  strand  thickStart  thickEnd  0  blockCount  blockSizes  blockStarts  c_7
 * ```
 */
class BedFormatter {
public:
    /**
     * @brief One BED6+1 line (with trailing newline).
     *
     * @param element The intron or exon
     * @param cluster_id Owning cluster, e.g. "c_7"
     * @param ordinal 1-based rank of the element within its category
     */
    static std::string element_record(const GenomicElement& element, const std::string& cluster_id, int ordinal);

    /**
     * @brief One BED12+1 line (with trailing newline).
     *
     * @param isoform Assembled transcript (exons sorted)
     * @param cluster_id Owning cluster, e.g. "c_7"
     * @param ordinal 1-based rank of the isoform within its category
     */
    static std::string isoform_record(const Isoform& isoform, const std::string& cluster_id, int ordinal);

    /**
     * @brief BED score column: support capped to the [0, 1000] range.
     */
    static int bed_score(int support);
};

}  // namespace IsoLinkage
