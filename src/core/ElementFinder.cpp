#include "core/ElementFinder.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <numeric>
#include <tuple>

#include "utils/Logger.hpp"

namespace IsoLinkage {

namespace {

using ElementKey = std::tuple<int32_t, int32_t, Strand>;

constexpr size_t kChainPollInterval = 256;

/**
 * @brief Union-find over element indices; the smaller index becomes the root.
 */
class DisjointSet {
public:
    explicit DisjointSet(size_t n) : parent_(n) { std::iota(parent_.begin(), parent_.end(), size_t(0)); }

    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a != b) {
            parent_[std::max(a, b)] = std::min(a, b);
        }
    }

private:
    std::vector<size_t> parent_;
};

bool element_less(const GenomicElement& a, const GenomicElement& b) {
    return std::tie(a.start, a.end, a.strand) < std::tie(b.start, b.end, b.strand);
}

void extend(GeneCluster& cluster, int32_t start, int32_t end) {
    cluster.start = std::min(cluster.start, start);
    cluster.end = std::max(cluster.end, end);
}

}  // namespace

struct ElementFinder::TerminalEnd {
    Strand strand;
    int32_t boundary;  ///< Splice-side coordinate, shared by merged ends
    int32_t free_end;  ///< Transcript start or end coordinate
    int weight;        ///< 1 per read, 0 per annotation transcript
};

ElementFinder::ElementFinder(AlignmentSource& reads, const AnalysisParams& params, const ExternalEvidence* evidence,
                             FastaReader* genome)
    : reads_(reads), params_(params), evidence_(evidence), genome_(genome) {
}

double ElementFinder::percent_intron_retention(double mean_coverage, int junction_support) {
    double denom = mean_coverage + static_cast<double>(junction_support);
    if (denom <= 0.0) {
        return 0.0;
    }
    return mean_coverage / denom;
}

Eigen::VectorXi ElementFinder::coverage(const Region& region, const std::vector<ReadAlignment>& reads) {
    Eigen::VectorXi cov = Eigen::VectorXi::Zero(std::max<int32_t>(0, region.length()));
    for (const auto& read : reads) {
        for (const auto& block : read.blocks) {
            int32_t s = std::max(block.start, region.start);
            int32_t e = std::min(block.end, region.end);
            if (e > s) {
                cov.segment(s - region.start, e - s).array() += 1;
            }
        }
    }
    return cov;
}

Strand ElementFinder::resolve_strand(const std::string& chrom, const Interval& intron, int plus_reads,
                                     int minus_reads, Strand region_majority) const {
    if (genome_) {
        Strand motif = genome_->motif_strand(chrom, intron);
        if (motif != Strand::UNKNOWN) {
            return motif;
        }
    }
    if (plus_reads > minus_reads) return Strand::PLUS;
    if (minus_reads > plus_reads) return Strand::MINUS;
    return region_majority;
}

std::vector<GenomicElement> ElementFinder::find_introns(const Region& region, const std::vector<ReadAlignment>& reads,
                                                        const Eigen::VectorXi& cov) const {
    struct Votes {
        int plus = 0;
        int minus = 0;
        int unknown = 0;
    };

    std::map<std::pair<int32_t, int32_t>, Votes> votes;
    int plus_reads = 0;
    int minus_reads = 0;

    for (const auto& read : reads) {
        if (read.strand == Strand::PLUS) plus_reads++;
        if (read.strand == Strand::MINUS) minus_reads++;

        for (const auto& intron : read.introns()) {
            if (intron.length() <= 0) continue;
            Votes& v = votes[{intron.start, intron.end}];
            switch (read.strand) {
                case Strand::PLUS: v.plus++; break;
                case Strand::MINUS: v.minus++; break;
                case Strand::UNKNOWN: v.unknown++; break;
            }
        }
    }

    const Strand majority = plus_reads > minus_reads   ? Strand::PLUS
                            : minus_reads > plus_reads ? Strand::MINUS
                                                       : Strand::UNKNOWN;

    std::map<ElementKey, int> support;
    for (const auto& [coords, v] : votes) {
        if (v.plus > 0) support[ElementKey(coords.first, coords.second, Strand::PLUS)] += v.plus;
        if (v.minus > 0) support[ElementKey(coords.first, coords.second, Strand::MINUS)] += v.minus;
        if (v.unknown > 0) {
            Strand s = resolve_strand(region.chrom, {coords.first, coords.second}, v.plus, v.minus, majority);
            if (s == Strand::UNKNOWN) {
                LOG_DEBUG("Unstranded intron dropped: " + region.chrom + ":" + std::to_string(coords.first) + "-" +
                          std::to_string(coords.second));
                continue;
            }
            support[ElementKey(coords.first, coords.second, s)] += v.unknown;
        }
    }

    if (evidence_) {
        for (const auto* annotation : {&evidence_->ngs_annotation, &evidence_->confirmed_annotation}) {
            for (const auto* tx : annotation->overlapping(region.chrom, region.start, region.end)) {
                if (tx->strand == Strand::UNKNOWN) continue;
                for (const auto& intron : tx->introns()) {
                    if (intron.length() > 0 && intron.start >= region.start && intron.end <= region.end) {
                        support.emplace(ElementKey(intron.start, intron.end, tx->strand), 0);
                    }
                }
            }
        }
    }

    std::vector<GenomicElement> introns;
    introns.reserve(support.size());
    for (const auto& [key, count] : support) {
        GenomicElement e;
        e.chrom = region.chrom;
        e.start = std::get<0>(key);
        e.end = std::get<1>(key);
        e.strand = std::get<2>(key);
        e.type = ElementType::INTRON;
        e.support = count;

        int32_t s = std::max(e.start, region.start);
        int32_t t = std::min(e.end, region.end);
        double mean = 0.0;
        if (t > s) {
            mean = cov.segment(s - region.start, t - s).cast<double>().mean();
        }
        e.pir = percent_intron_retention(mean, count);
        e.retained = e.pir >= params_.pir_cutoff;
        introns.push_back(e);
    }
    return introns;
}

std::vector<GenomicElement> ElementFinder::merge_terminal(const Region& region, ElementType type,
                                                          std::vector<TerminalEnd>& ends) const {
    std::sort(ends.begin(), ends.end(), [](const TerminalEnd& a, const TerminalEnd& b) {
        return std::tie(a.strand, a.boundary, a.free_end) < std::tie(b.strand, b.boundary, b.free_end);
    });

    const SiteIndex* sites = nullptr;
    if (evidence_) {
        sites = type == ElementType::TSS_EXON ? &evidence_->tss : &evidence_->tes;
    }

    std::vector<GenomicElement> result;
    size_t i = 0;
    while (i < ends.size()) {
        size_t j = i;
        while (j + 1 < ends.size() && ends[j + 1].strand == ends[i].strand &&
               ends[j + 1].boundary == ends[i].boundary &&
               ends[j + 1].free_end - ends[j].free_end <= params_.txs_diff) {
            ++j;
        }

        std::map<int32_t, int> votes;
        int support = 0;
        for (size_t k = i; k <= j; ++k) {
            votes[ends[k].free_end] += ends[k].weight;
            support += ends[k].weight;
        }

        // Mode of the free ends; ties go to the leftmost position
        int32_t site = votes.begin()->first;
        int best = -1;
        for (const auto& [pos, n] : votes) {
            if (n > best) {
                best = n;
                site = pos;
            }
        }

        bool external = false;
        int32_t snapped = 0;
        if (sites && sites->nearest(region.chrom, ends[i].strand, site, params_.txs_diff, snapped)) {
            site = snapped;
            external = true;
        }

        GenomicElement e;
        e.chrom = region.chrom;
        e.strand = ends[i].strand;
        e.type = type;
        const int32_t boundary = ends[i].boundary;
        if (ends[i].free_end < boundary) {
            e.start = site;
            e.end = boundary;
        } else {
            e.start = boundary;
            e.end = site;
        }
        e.support = support;
        e.confident = support >= 2 || external;

        if (e.end > e.start) {
            result.push_back(e);
        } else {
            LOG_DEBUG("Terminal exon collapsed after snapping at " + region.chrom + ":" + std::to_string(boundary));
        }
        i = j + 1;
    }
    return result;
}

std::vector<GenomicElement> ElementFinder::find_exons(const Region& region,
                                                      const std::vector<const ReadAlignment*>& spliced,
                                                      const CancellationToken& token) const {
    std::map<ElementKey, int> internal;
    std::vector<TerminalEnd> tss_ends;
    std::vector<TerminalEnd> tes_ends;

    auto add_chain = [&](const std::vector<Interval>& blocks, Strand strand, int weight) {
        if (blocks.size() < 2 || strand == Strand::UNKNOWN) {
            return;
        }
        const Interval& first = blocks.front();
        const Interval& last = blocks.back();
        TerminalEnd left{strand, first.end, first.start, weight};
        TerminalEnd right{strand, last.start, last.end, weight};
        if (strand == Strand::PLUS) {
            tss_ends.push_back(left);
            tes_ends.push_back(right);
        } else {
            tss_ends.push_back(right);
            tes_ends.push_back(left);
        }
        for (size_t k = 1; k + 1 < blocks.size(); ++k) {
            internal[ElementKey(blocks[k].start, blocks[k].end, strand)] += weight;
        }
    };

    size_t n = 0;
    for (const auto* read : spliced) {
        if (++n % kChainPollInterval == 0) {
            token.throw_if_cancelled();
        }
        add_chain(read->blocks, read->strand, 1);
    }

    if (evidence_) {
        for (const auto* annotation : {&evidence_->ngs_annotation, &evidence_->confirmed_annotation}) {
            for (const auto* tx : annotation->overlapping(region.chrom, region.start, region.end)) {
                if (tx->start() >= region.start && tx->end() <= region.end) {
                    add_chain(tx->exons, tx->strand, 0);
                }
            }
        }
    }

    std::vector<GenomicElement> exons;
    for (const auto& [key, count] : internal) {
        GenomicElement e;
        e.chrom = region.chrom;
        e.start = std::get<0>(key);
        e.end = std::get<1>(key);
        e.strand = std::get<2>(key);
        e.type = ElementType::INTERNAL_EXON;
        e.support = count;
        exons.push_back(e);
    }

    auto tss = merge_terminal(region, ElementType::TSS_EXON, tss_ends);
    auto tes = merge_terminal(region, ElementType::TES_EXON, tes_ends);
    exons.insert(exons.end(), tss.begin(), tss.end());
    exons.insert(exons.end(), tes.begin(), tes.end());
    return exons;
}

std::vector<GeneCluster> ElementFinder::identify(const Region& region, const CancellationToken& token) const {
    std::vector<ReadAlignment> reads = reads_.fetch(region, EvidenceKind::NGS, token);
    const size_t num_ngs = reads.size();
    {
        std::vector<ReadAlignment> tgs = reads_.fetch(region, EvidenceKind::TGS, token);
        reads.insert(reads.end(), std::make_move_iterator(tgs.begin()), std::make_move_iterator(tgs.end()));
    }
    token.throw_if_cancelled();

    Eigen::VectorXi cov = coverage(region, reads);
    std::vector<GenomicElement> elements = find_introns(region, reads, cov);
    const size_t num_introns = elements.size();
    token.throw_if_cancelled();

    std::vector<const ReadAlignment*> spliced;
    std::vector<const ReadAlignment*> unspliced;
    for (size_t i = num_ngs; i < reads.size(); ++i) {
        const ReadAlignment& read = reads[i];
        if (read.strand == Strand::UNKNOWN || read.blocks.empty()) continue;
        (read.is_spliced() ? spliced : unspliced).push_back(&read);
    }

    std::vector<GenomicElement> exons = find_exons(region, spliced, token);
    elements.insert(elements.end(), exons.begin(), exons.end());
    token.throw_if_cancelled();

    // Connected components: overlapping exons, and introns sharing a boundary with an exon
    DisjointSet components(elements.size());

    std::vector<size_t> exon_order(elements.size() - num_introns);
    std::iota(exon_order.begin(), exon_order.end(), num_introns);
    std::sort(exon_order.begin(), exon_order.end(), [&](size_t a, size_t b) {
        return std::tie(elements[a].strand, elements[a].start) < std::tie(elements[b].strand, elements[b].start);
    });

    size_t run_root = 0;
    int32_t run_end = 0;
    bool in_run = false;
    for (size_t idx : exon_order) {
        const GenomicElement& e = elements[idx];
        if (in_run && e.strand == elements[run_root].strand && e.start < run_end) {
            components.unite(run_root, idx);
            run_end = std::max(run_end, e.end);
        } else {
            run_root = idx;
            run_end = e.end;
            in_run = true;
        }
    }

    std::map<std::pair<Strand, int32_t>, std::vector<size_t>> exon_by_start;
    std::map<std::pair<Strand, int32_t>, std::vector<size_t>> exon_by_end;
    for (size_t idx = num_introns; idx < elements.size(); ++idx) {
        exon_by_start[{elements[idx].strand, elements[idx].start}].push_back(idx);
        exon_by_end[{elements[idx].strand, elements[idx].end}].push_back(idx);
    }
    for (size_t idx = 0; idx < num_introns; ++idx) {
        const GenomicElement& intron = elements[idx];
        auto left = exon_by_end.find({intron.strand, intron.start});
        if (left != exon_by_end.end()) {
            for (size_t other : left->second) components.unite(idx, other);
        }
        auto right = exon_by_start.find({intron.strand, intron.end});
        if (right != exon_by_start.end()) {
            for (size_t other : right->second) components.unite(idx, other);
        }
    }

    std::map<size_t, GeneCluster> by_root;
    for (size_t idx = 0; idx < elements.size(); ++idx) {
        const GenomicElement& e = elements[idx];
        auto [it, inserted] = by_root.try_emplace(components.find(idx));
        GeneCluster& cluster = it->second;
        if (inserted) {
            cluster.chrom = region.chrom;
            cluster.strand = e.strand;
            cluster.start = e.start;
            cluster.end = e.end;
        }
        extend(cluster, e.start, e.end);
        cluster.of(e.type).push_back(e);
    }

    // Long-read chains join the cluster of their first intron
    std::map<ElementKey, size_t> intron_index;
    for (size_t idx = 0; idx < num_introns; ++idx) {
        intron_index.emplace(ElementKey(elements[idx].start, elements[idx].end, elements[idx].strand), idx);
    }
    for (const auto* read : spliced) {
        const Interval first = {read->blocks[0].end, read->blocks[1].start};
        auto it = intron_index.find(ElementKey(first.start, first.end, read->strand));
        if (it == intron_index.end()) continue;

        GeneCluster& cluster = by_root[components.find(it->second)];
        ReadChain chain;
        chain.strand = read->strand;
        chain.exons = read->blocks;
        chain.support = 1;
        extend(cluster, chain.start(), chain.end());
        cluster.chains.push_back(std::move(chain));
    }

    std::vector<GeneCluster> clusters;
    clusters.reserve(by_root.size());
    for (auto& [root, cluster] : by_root) {
        clusters.push_back(std::move(cluster));
    }

    // Unspliced long reads away from every element form element-less clusters
    std::vector<const ReadAlignment*> orphans;
    for (const auto* read : unspliced) {
        bool touches = false;
        for (const auto& cluster : clusters) {
            if (cluster.strand == read->strand && cluster.start < read->end && read->start < cluster.end) {
                touches = true;
                break;
            }
        }
        if (!touches) orphans.push_back(read);
    }
    std::sort(orphans.begin(), orphans.end(), [](const ReadAlignment* a, const ReadAlignment* b) {
        return std::tie(a->strand, a->start, a->end) < std::tie(b->strand, b->start, b->end);
    });
    for (const auto* read : orphans) {
        ReadChain chain;
        chain.strand = read->strand;
        chain.exons = read->blocks;
        chain.support = 1;

        bool merged = false;
        if (!clusters.empty()) {
            GeneCluster& last = clusters.back();
            if (!last.has_element() && last.strand == read->strand && read->start < last.end) {
                extend(last, read->start, read->end);
                last.chains.push_back(std::move(chain));
                merged = true;
            }
        }
        if (!merged) {
            GeneCluster cluster;
            cluster.chrom = region.chrom;
            cluster.strand = read->strand;
            cluster.start = read->start;
            cluster.end = read->end;
            cluster.chains.push_back(std::move(chain));
            clusters.push_back(std::move(cluster));
        }
    }

    for (auto& cluster : clusters) {
        for (auto& typed : cluster.elements) {
            std::sort(typed.begin(), typed.end(), element_less);
        }
        std::stable_sort(cluster.chains.begin(), cluster.chains.end(),
                         [](const ReadChain& a, const ReadChain& b) { return a.exons < b.exons; });
    }
    std::stable_sort(clusters.begin(), clusters.end(), [](const GeneCluster& a, const GeneCluster& b) {
        return std::tie(a.start, a.end, a.strand) < std::tie(b.start, b.end, b.strand);
    });
    for (size_t i = 0; i < clusters.size(); ++i) {
        clusters[i].index = static_cast<int>(i);
    }

    LOG_DEBUG(region.to_string() + ": " + std::to_string(reads.size()) + " reads, " +
              std::to_string(num_introns) + " introns, " + std::to_string(exons.size()) + " exons, " +
              std::to_string(clusters.size()) + " clusters");
    return clusters;
}

}  // namespace IsoLinkage
