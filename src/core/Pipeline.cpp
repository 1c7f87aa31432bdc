#include "core/Pipeline.hpp"

#include <filesystem>
#include <memory>

#include "core/BamEvidence.hpp"
#include "core/ClusterNumberer.hpp"
#include "core/ElementFinder.hpp"
#include "core/LinkageBuilder.hpp"
#include "core/TranscriptFinder.hpp"
#include "io/OutputMultiplexer.hpp"
#include "io/TimeoutLog.hpp"
#include "utils/FastaReader.hpp"
#include "utils/Logger.hpp"

namespace IsoLinkage {

Pipeline::Pipeline(const Config& config) : config_(config) {
}

void Pipeline::load_external_evidence() {
    Utils::ScopedLogger scope("loading external evidence", LogLevel::LOG_DEBUG);

    if (!config_.tss_path.empty()) {
        evidence_.tss = SiteIndex::load(config_.tss_path);
    }
    if (!config_.tes_path.empty()) {
        evidence_.tes = SiteIndex::load(config_.tes_path);
    }
    if (!config_.ann_path.empty()) {
        evidence_.ngs_annotation = TranscriptAnnotation::load(config_.ann_path);
    }
    if (!config_.cfm_ann_path.empty()) {
        evidence_.confirmed_annotation = TranscriptAnnotation::load(config_.cfm_ann_path);
    }
}

SchedulerSummary Pipeline::run() {
    load_external_evidence();

    const AnalysisParams params = config_.analysis_params();

    std::unique_ptr<FastaReader> genome;
    if (!config_.genome_fasta_path.empty()) {
        genome = std::make_unique<FastaReader>(config_.genome_fasta_path);
    }

    // Streams first: a bad output directory fails before any region runs
    OutputMultiplexer output(config_.output_dir);
    TimeoutLog timeout_log((std::filesystem::path(config_.output_dir) / TimeoutLog::kDefaultFileName).string());

    LOG_INFO("Start building linkage");
    std::vector<std::string> all_bams = config_.ngs_bam_paths;
    all_bams.insert(all_bams.end(), config_.tgs_bam_paths.begin(), config_.tgs_bam_paths.end());
    BamLinkageBuilder linkage(all_bams, params, &evidence_);

    BamAlignmentSource reads(config_.ngs_bam_paths, config_.tgs_bam_paths, params, config_.threads);
    ElementFinder elements(reads, params, &evidence_, genome.get());
    TranscriptFinder transcripts(params, &evidence_);
    ClusterNumberer numberer;

    SchedulerOptions options;
    options.deadline = config_.region_deadline();
    options.threads = config_.threads;

    RegionScheduler scheduler(elements, transcripts, output, numberer, &timeout_log, options);
    SchedulerSummary summary = scheduler.process(linkage);

    output.close();
    scheduler.print_summary(summary);
    LOG_INFO("Output directory: " + config_.output_dir);
    LOG_INFO("End");
    return summary;
}

}  // namespace IsoLinkage
