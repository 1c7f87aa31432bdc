#include "core/TranscriptFinder.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <utility>

#include "utils/Logger.hpp"

namespace IsoLinkage {

TranscriptFinder::TranscriptFinder(const AnalysisParams& params, const ExternalEvidence* evidence)
    : params_(params), evidence_(evidence) {
}

bool TranscriptFinder::on_confident_end(const GeneCluster& cluster, ElementType type, const Interval& exon,
                                        bool free_end_left) const {
    for (const auto& e : cluster.of(type)) {
        if (!e.confident || e.strand != cluster.strand) continue;
        if (free_end_left) {
            if (e.end == exon.end && std::abs(e.start - exon.start) <= params_.txs_diff) return true;
        } else {
            if (e.start == exon.start && std::abs(e.end - exon.end) <= params_.txs_diff) return true;
        }
    }
    return false;
}

IsoformCategory TranscriptFinder::classify(const GeneCluster& cluster, const Isoform& isoform,
                                           const std::vector<Interval>& introns) const {
    if (evidence_ && evidence_->confirmed_annotation.has_intron_chain(isoform.chrom, isoform.strand, introns)) {
        return IsoformCategory::A;
    }
    if (evidence_ && evidence_->ngs_annotation.has_intron_chain(isoform.chrom, isoform.strand, introns)) {
        return IsoformCategory::C;
    }

    for (const auto& intron : cluster.of(ElementType::INTRON)) {
        if (!intron.retained || intron.strand != isoform.strand) continue;
        for (const auto& exon : isoform.exons) {
            if (exon.contains(intron.interval())) {
                return IsoformCategory::R;
            }
        }
    }

    const Interval& left = isoform.exons.front();
    const Interval& right = isoform.exons.back();
    bool tss_ok;
    bool tes_ok;
    if (isoform.strand == Strand::PLUS) {
        tss_ok = on_confident_end(cluster, ElementType::TSS_EXON, left, true);
        tes_ok = on_confident_end(cluster, ElementType::TES_EXON, right, false);
    } else {
        tss_ok = on_confident_end(cluster, ElementType::TSS_EXON, right, false);
        tes_ok = on_confident_end(cluster, ElementType::TES_EXON, left, true);
    }

    if (tss_ok && tes_ok) return IsoformCategory::F;
    if (tss_ok || tes_ok) return IsoformCategory::M;
    return IsoformCategory::P;
}

TranscriptSet TranscriptFinder::identify(const GeneCluster& cluster, const CancellationToken& token) const {
    struct Group {
        int support = 0;
        int32_t start = 0;
        int32_t end = 0;
    };

    // Collapse by strand and intron chain; ends are the extreme read ends
    std::map<std::pair<Strand, std::vector<Interval>>, Group> groups;
    for (const auto& chain : cluster.chains) {
        std::vector<Interval> introns = chain.introns();
        if (introns.empty()) continue;

        auto key = std::make_pair(chain.strand, std::move(introns));
        auto [it, inserted] = groups.try_emplace(std::move(key));
        Group& g = it->second;
        if (inserted) {
            g.start = chain.start();
            g.end = chain.end();
        } else {
            g.start = std::min(g.start, chain.start());
            g.end = std::max(g.end, chain.end());
        }
        g.support += chain.support;
    }

    TranscriptSet result;
    for (const auto& [key, g] : groups) {
        token.throw_if_cancelled();

        const auto& introns = key.second;
        Isoform isoform;
        isoform.chrom = cluster.chrom;
        isoform.strand = key.first;
        isoform.support = g.support;

        int32_t pos = g.start;
        for (const auto& intron : introns) {
            isoform.exons.push_back({pos, intron.start});
            pos = intron.end;
        }
        isoform.exons.push_back({pos, g.end});

        isoform.category = classify(cluster, isoform, introns);
        result.isoforms.push_back(std::move(isoform));
    }

    std::stable_sort(result.isoforms.begin(), result.isoforms.end(), [](const Isoform& a, const Isoform& b) {
        if (a.start() != b.start()) return a.start() < b.start();
        if (a.end() != b.end()) return a.end() < b.end();
        return a.exons < b.exons;
    });

    LOG_DEBUG(cluster.to_string() + ": " + std::to_string(result.size()) + " isoforms from " +
              std::to_string(cluster.chains.size()) + " chains");
    return result;
}

}  // namespace IsoLinkage
