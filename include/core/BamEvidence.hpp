#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/BamReader.hpp"
#include "core/Collaborators.hpp"
#include "core/Config.hpp"
#include "core/ReadParser.hpp"

namespace IsoLinkage {

/**
 * @brief AlignmentSource backed by the indexed NGS and TGS BAM files.
 *
 * Each OpenMP thread gets its own set of BamReader handles, opened on
 * first use and kept until the source is destroyed. The slot is chosen by
 * omp_get_thread_num(), so num_slots must cover the scheduler's thread
 * count.
 */
class BamAlignmentSource : public AlignmentSource {
public:
    BamAlignmentSource(std::vector<std::string> ngs_paths, std::vector<std::string> tgs_paths,
                       const AnalysisParams& params, int num_slots);

    /**
     * @brief Fetches filtered, parsed alignments of one evidence kind.
     *
     * Reads from all files of that kind are concatenated in file order.
     * The token is polled every kPollInterval records.
     */
    std::vector<ReadAlignment> fetch(const Region& region, EvidenceKind kind,
                                     const CancellationToken& token) override;

    const std::vector<std::string>& paths(EvidenceKind kind) const {
        return kind == EvidenceKind::NGS ? ngs_paths_ : tgs_paths_;
    }

    static constexpr size_t kPollInterval = 256;

private:
    struct ReaderSet {
        std::vector<std::unique_ptr<BamReader>> ngs;
        std::vector<std::unique_ptr<BamReader>> tgs;
        bool opened = false;
    };

    ReaderSet& readers_for_thread();

    std::vector<std::string> ngs_paths_;
    std::vector<std::string> tgs_paths_;
    ReadParser ngs_parser_;
    ReadParser tgs_parser_;

    std::vector<ReaderSet> slots_;
    std::mutex slots_mutex_;
};

}  // namespace IsoLinkage
