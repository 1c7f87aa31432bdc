#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "Types.hpp"

namespace IsoLinkage {

/**
 * @brief Half-open genomic interval [start, end), 0-based.
 */
struct Interval {
    int32_t start = 0;
    int32_t end = 0;

    int32_t length() const { return end - start; }
    bool overlaps(const Interval& o) const { return start < o.end && o.start < end; }
    bool contains(const Interval& o) const { return start <= o.start && o.end <= end; }

    bool operator==(const Interval& o) const { return start == o.start && end == o.end; }
    bool operator!=(const Interval& o) const { return !(*this == o); }
    bool operator<(const Interval& o) const {
        return start != o.start ? start < o.start : end < o.end;
    }
};

/**
 * @brief A linkage region: the unit of scheduling.
 *
 * No gene cluster spans two regions. Created by a RegionSource, consumed
 * exactly once by the RegionScheduler.
 */
struct Region {
    std::string chrom;
    int32_t start = 0;  ///< 0-based inclusive
    int32_t end = 0;    ///< 0-based exclusive

    /**
     * @brief Printable identity, e.g. "chr1:1000-2000".
     */
    std::string to_string() const {
        return chrom + ":" + std::to_string(start) + "-" + std::to_string(end);
    }

    int32_t length() const { return end - start; }
};

/**
 * @brief Spliced alignment of one read, reduced to what element
 * identification needs.
 *
 * Consecutive blocks are separated by reference skips (CIGAR N), so the gap
 * between two blocks is an intron.
 */
struct ReadAlignment {
    int32_t start = 0;             ///< Alignment start (0-based)
    int32_t end = 0;               ///< Alignment end (0-based, exclusive)
    Strand strand = Strand::UNKNOWN;
    EvidenceKind kind = EvidenceKind::NGS;
    std::vector<Interval> blocks;  ///< Aligned blocks, sorted

    bool is_spliced() const { return blocks.size() > 1; }

    std::vector<Interval> introns() const {
        std::vector<Interval> result;
        for (size_t i = 1; i < blocks.size(); ++i) {
            result.push_back({blocks[i - 1].end, blocks[i].start});
        }
        return result;
    }
};

/**
 * @brief One intron or exon discovered inside a region.
 */
struct GenomicElement {
    std::string chrom;
    int32_t start = 0;
    int32_t end = 0;
    Strand strand = Strand::UNKNOWN;
    ElementType type = ElementType::INTRON;
    int support = 0;         ///< Number of supporting reads

    // Introns only
    double pir = 0.0;        ///< Percent intron retention
    bool retained = false;   ///< pir >= cutoff

    // TSS/TES exons only
    bool confident = false;  ///< >= 2 reads or an external site

    Interval interval() const { return {start, end}; }
};

/**
 * @brief Collapsed long-read exon chain assigned to a cluster.
 */
struct ReadChain {
    Strand strand = Strand::UNKNOWN;
    std::vector<Interval> exons;
    int support = 0;

    int32_t start() const { return exons.empty() ? 0 : exons.front().start; }
    int32_t end() const { return exons.empty() ? 0 : exons.back().end; }

    std::vector<Interval> introns() const {
        std::vector<Interval> result;
        for (size_t i = 1; i < exons.size(); ++i) {
            result.push_back({exons[i - 1].end, exons[i].start});
        }
        return result;
    }
};

/**
 * @brief Elements and long-read chains of one gene within a region.
 *
 * No two clusters of the same region share an exon.
 */
struct GeneCluster {
    int index = 0;  ///< Region-local discovery order
    std::string chrom;
    Strand strand = Strand::UNKNOWN;
    int32_t start = 0;
    int32_t end = 0;
    std::array<std::vector<GenomicElement>, kNumElementTypes> elements;
    std::vector<ReadChain> chains;

    std::vector<GenomicElement>& of(ElementType t) { return elements[static_cast<size_t>(t)]; }
    const std::vector<GenomicElement>& of(ElementType t) const { return elements[static_cast<size_t>(t)]; }

    size_t num_elements() const {
        size_t n = 0;
        for (const auto& v : elements) n += v.size();
        return n;
    }

    bool has_element() const { return num_elements() > 0; }

    std::string to_string() const {
        return chrom + ":" + std::to_string(start) + "-" + std::to_string(end) + "(" + strand_to_char(strand) + ")";
    }
};

/**
 * @brief An assembled, classified transcript.
 */
struct Isoform {
    std::string chrom;
    Strand strand = Strand::UNKNOWN;
    std::vector<Interval> exons;  ///< Sorted, non-overlapping
    IsoformCategory category = IsoformCategory::P;
    int support = 0;

    int32_t start() const { return exons.empty() ? 0 : exons.front().start; }
    int32_t end() const { return exons.empty() ? 0 : exons.back().end; }
};

/**
 * @brief Result of transcript identification for one cluster.
 */
struct TranscriptSet {
    std::vector<Isoform> isoforms;

    bool empty() const { return isoforms.empty(); }
    size_t size() const { return isoforms.size(); }
};

}  // namespace IsoLinkage
