#pragma once

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

#include "core/Config.hpp"

#ifndef ISOLINKAGE_VERSION
#define ISOLINKAGE_VERSION "0.0.0"
#endif

namespace IsoLinkage {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges). BAM/FASTA index checks are left to
     * Config::validate().
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @param exit_code Set to the process exit code when false is returned
     *        (0 for --help/--version, non-zero for a parse error).
     * @return true if parsing was successful and execution should continue.
     */
    static bool parse(int argc, char** argv, Config& config, int& exit_code) {
        CLI::App app{"IsoLinkage - transcript assembly from short- and long-read evidence"};
        app.set_version_flag("--version", ISOLINKAGE_VERSION);

        // Input/Output
        app.add_option("-o,--output", config.output_dir, "Output folder for assembled transcripts (Required)")
            ->required();

        app.add_option("--ngs", config.ngs_bam_paths, "Short-read BAM file(s), indexed (Required)")
            ->required()
            ->expected(1, -1)
            ->check(CLI::ExistingFile);

        app.add_option("--tgs", config.tgs_bam_paths, "Long-read BAM file(s), indexed (Required)")
            ->required()
            ->expected(1, -1)
            ->check(CLI::ExistingFile);

        // External evidence
        app.add_option("--tss", config.tss_path, "TSS sites: chrom<TAB>site<TAB>strand")
            ->check(CLI::ExistingFile);

        app.add_option("--tes", config.tes_path, "TES sites: chrom<TAB>site<TAB>strand")
            ->check(CLI::ExistingFile);

        app.add_option("--ann", config.ann_path, "NGS-based transcript annotation (BED12)")
            ->check(CLI::ExistingFile);

        app.add_option("--cfm-ann", config.cfm_ann_path, "Confirmed transcript annotation (BED12)")
            ->check(CLI::ExistingFile);

        app.add_option("-g,--genome", config.genome_fasta_path, "Genome FASTA with .fai, orients unstranded introns")
            ->check(CLI::ExistingFile);

        // Parameters
        std::string rule_str = "single_end";
        app.add_option("-r,--rule", rule_str,
                       "NGS library type: 1++,1--,2+-,2-+ | 1+-,1-+,2++,2-- | single_end (Default: single_end)")
            ->check(CLI::IsMember({"1++,1--,2+-,2-+", "1+-,1-+,2++,2--", "single_end"}));

        app.add_option("--pir", config.pir_cutoff, "PIR cutoff for intron retention (Default: 0.5)")
            ->check(CLI::Range(0.0, 1.0));

        app.add_option("--dtxs", config.txs_diff, "Distance cutoff between two TSSs/TESs in bp (Default: 500)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--time-out", config.time_out_sec, "Per-region time budget in seconds (Default: none)")
            ->check(CLI::PositiveNumber);

        app.add_option("--min-mapq", config.min_mapq, "Minimum mapping quality (Default: 0)")
            ->check(CLI::Range(0, 255));

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: 1)")
            ->check(CLI::PositiveNumber);

        // Logging
        int verbosity = 0;
        app.add_flag("-v", verbosity, "Verbose mode, -vv for debug output");

        std::string log_level_str;
        app.add_option("--log-level", log_level_str, "Logging level: error, warn, info, debug (Default: warn)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Also write log messages to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // --help and --version end up here too, with exit code 0
            exit_code = app.exit(e);
            return false;
        }

        config.strand_rule = Config::rule_from_string(rule_str);

        if (verbosity >= 2) {
            config.log_level = LogLevel::LOG_DEBUG;
        } else if (verbosity == 1) {
            config.log_level = LogLevel::LOG_INFO;
        }

        // An explicit --log-level wins over -v
        static const std::map<std::string, LogLevel> log_level_map = {{"error", LogLevel::LOG_ERROR},
                                                                      {"warn", LogLevel::LOG_WARN},
                                                                      {"info", LogLevel::LOG_INFO},
                                                                      {"debug", LogLevel::LOG_DEBUG}};
        if (!log_level_str.empty()) {
            std::string log_lower = log_level_str;
            std::transform(log_lower.begin(), log_lower.end(), log_lower.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            auto it = log_level_map.find(log_lower);
            if (it != log_level_map.end()) {
                config.log_level = it->second;
            }
        }

        exit_code = 0;
        return true;
    }
};

}  // namespace Utils
}  // namespace IsoLinkage
