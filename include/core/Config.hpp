#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"

namespace IsoLinkage {

/**
 * @brief Tuning parameters read by the region-local collaborators.
 *
 * Copied out of Config once and passed by const reference into every
 * collaborator, so parallel region analyses share it without locking.
 */
struct AnalysisParams {
    StrandRule strand_rule = StrandRule::SINGLE_END;  ///< NGS library type
    int txs_diff = 500;                               ///< Distance cutoff between two TSSs/TESs (bp)
    double pir_cutoff = 0.5;                          ///< PIR cutoff for intron retention
    int min_mapq = 0;                                 ///< Minimum mapping quality for a read to count
};

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Populated once by Utils::ArgParser and read-only afterwards.
 * Validated by both CLI11 (basic checks) and validate() (htslib-level checks).
 */
struct Config {
    // Input/Output
    std::string output_dir;                    ///< Output folder for assembled transcripts (Required)
    std::vector<std::string> ngs_bam_paths;    ///< Short-read BAM files (Required, indexed)
    std::vector<std::string> tgs_bam_paths;    ///< Long-read BAM files (Required, indexed)

    // External evidence
    std::string tss_path;            ///< TSS sites (chrom<TAB>site<TAB>strand)
    std::string tes_path;            ///< TES sites (chrom<TAB>site<TAB>strand)
    std::string ann_path;            ///< NGS-based annotation, BED12
    std::string cfm_ann_path;        ///< Confirmed annotation, BED12
    std::string genome_fasta_path;   ///< Genome FASTA (with .fai)

    // Options
    StrandRule strand_rule = StrandRule::SINGLE_END;
    double pir_cutoff = 0.5;
    int txs_diff = 500;
    int time_out_sec = 0;  ///< Per-region time budget in seconds, 0 disables
    int min_mapq = 0;
    int threads = 1;

    // Logging
    LogLevel log_level = LogLevel::LOG_WARN;
    std::string log_file;

    /**
     * @brief Validates configuration logic and evidence files.
     *
     * Checks what CLI11 cannot: BAM headers and indexes, FASTA index,
     * numeric relationships.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    AnalysisParams analysis_params() const {
        AnalysisParams p;
        p.strand_rule = strand_rule;
        p.txs_diff = txs_diff;
        p.pir_cutoff = pir_cutoff;
        p.min_mapq = min_mapq;
        return p;
    }

    /**
     * @brief Per-region deadline, empty when --time-out is not set.
     */
    std::optional<std::chrono::milliseconds> region_deadline() const {
        if (time_out_sec <= 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(static_cast<int64_t>(time_out_sec) * 1000);
    }

    static std::string rule_to_string(StrandRule rule);

    /**
     * @brief Parses "1++,1--,2+-,2-+", "1+-,1-+,2++,2--" or "single_end".
     * @throws std::invalid_argument for anything else.
     */
    static StrandRule rule_from_string(const std::string& s);
};

}  // namespace IsoLinkage
