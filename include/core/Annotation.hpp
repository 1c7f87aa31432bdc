#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace IsoLinkage {

/**
 * @brief An externally supported transcription start or end site.
 */
struct SiteRecord {
    std::string chrom;
    int32_t pos = 0;  ///< 0-based
    Strand strand = Strand::UNKNOWN;
};

/**
 * @brief One transcript from a BED12 annotation.
 */
struct AnnotatedTranscript {
    std::string chrom;
    std::string name;
    Strand strand = Strand::UNKNOWN;
    std::vector<Interval> exons;  ///< Sorted, absolute coordinates

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
 * @brief Sorted TSS or TES positions per chromosome.
 */
class SiteIndex {
public:
    /**
     * @brief Loads "chrom<TAB>site<TAB>strand" lines; '#' lines are skipped.
     * @throws std::runtime_error if the file cannot be opened or a line is malformed.
     */
    static SiteIndex load(const std::string& path);

    void add(const SiteRecord& site);

    /**
     * @brief Sorts positions; must be called after the last add().
     */
    void finalize();

    /**
     * @brief Nearest site on the same chromosome and strand within max_dist.
     * @return true and sets out when one exists. Ties go to the upstream site:
     *         the lower coordinate on the plus strand, the higher on the minus strand.
     */
    bool nearest(const std::string& chrom, Strand strand, int32_t pos, int32_t max_dist, int32_t& out) const;

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

private:
    std::map<std::string, std::vector<int32_t>> sites_[2];  ///< Indexed by PLUS, MINUS
    size_t count_ = 0;
};

/**
 * @brief BED12 transcript annotation indexed by chromosome.
 */
class TranscriptAnnotation {
public:
    /**
     * @brief Loads a BED12 file.
     * @throws std::runtime_error if the file cannot be opened or a line is malformed.
     */
    static TranscriptAnnotation load(const std::string& path);

    /**
     * @brief Parses one BED12 line. Exposed for tests.
     * @throws std::invalid_argument for a malformed line.
     */
    static AnnotatedTranscript parse_bed12(const std::string& line);

    void add(AnnotatedTranscript tx);

    /**
     * @brief Transcripts whose span overlaps [start, end).
     */
    std::vector<const AnnotatedTranscript*> overlapping(const std::string& chrom, int32_t start, int32_t end) const;

    /**
     * @brief true if a transcript on the strand has exactly this intron chain.
     */
    bool has_intron_chain(const std::string& chrom, Strand strand, const std::vector<Interval>& introns) const;

    const std::vector<AnnotatedTranscript>& on(const std::string& chrom) const;

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

private:
    std::map<std::string, std::vector<AnnotatedTranscript>> by_chrom_;
    size_t count_ = 0;
};

/**
 * @brief All optional external evidence, loaded once before scheduling.
 */
struct ExternalEvidence {
    SiteIndex tss;
    SiteIndex tes;
    TranscriptAnnotation ngs_annotation;        ///< --ann
    TranscriptAnnotation confirmed_annotation;  ///< --cfm-ann
};

}  // namespace IsoLinkage
