#pragma once

#include "core/Annotation.hpp"
#include "core/Config.hpp"
#include "core/RegionScheduler.hpp"

namespace IsoLinkage {

/**
 * @brief Wires the BAM-backed collaborators to the RegionScheduler for one run.
 *
 * Order of work:
 *   1. load external sites and annotations
 *   2. open the ten output streams and the timeout log
 *   3. build linkage regions lazily and schedule them
 *   4. close the streams and print the summary
 *
 * Any fatal error propagates out of run(); the output streams are closed
 * by RAII on the way out and keep the records committed so far.
 */
class Pipeline {
public:
    explicit Pipeline(const Config& config);

    /**
     * @throws ResourceError, CollaboratorError or any other fatal error.
     */
    SchedulerSummary run();

    const ExternalEvidence& evidence() const { return evidence_; }

private:
    void load_external_evidence();

    const Config& config_;
    ExternalEvidence evidence_;
};

}  // namespace IsoLinkage
