#include "core/Annotation.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace IsoLinkage {

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> fields;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        fields.push_back(item);
    }
    return fields;
}

std::vector<int32_t> parse_int_list(const std::string& s) {
    std::vector<int32_t> values;
    for (const auto& item : split(s, ',')) {
        if (item.empty()) continue;
        values.push_back(static_cast<int32_t>(std::stol(item)));
    }
    return values;
}

bool skip_line(const std::string& line) {
    if (line.empty() || line[0] == '#') return true;
    return line.compare(0, 5, "track") == 0 || line.compare(0, 7, "browser") == 0;
}

Strand parse_strand(const std::string& s) {
    if (s == "+") return Strand::PLUS;
    if (s == "-") return Strand::MINUS;
    throw std::invalid_argument("invalid strand '" + s + "'");
}

}  // namespace

// ============================================================================
// SiteIndex
// ============================================================================

SiteIndex SiteIndex::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open site file: " + path);
    }

    SiteIndex index;
    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (skip_line(line)) continue;

        auto fields = split(line, '\t');
        try {
            if (fields.size() < 3) {
                throw std::invalid_argument("expected 3 columns");
            }
            SiteRecord site;
            site.chrom = fields[0];
            site.pos = static_cast<int32_t>(std::stol(fields[1]));
            site.strand = parse_strand(fields[2]);
            index.add(site);
        } catch (const std::exception& e) {
            throw std::runtime_error(path + ":" + std::to_string(line_num) + ": " + e.what());
        }
    }

    index.finalize();
    LOG_INFO("Loaded " + std::to_string(index.size()) + " sites from " + path);
    return index;
}

void SiteIndex::add(const SiteRecord& site) {
    if (site.strand == Strand::UNKNOWN) {
        return;
    }
    sites_[static_cast<int>(site.strand)][site.chrom].push_back(site.pos);
    count_++;
}

void SiteIndex::finalize() {
    for (auto& by_strand : sites_) {
        for (auto& [chrom, positions] : by_strand) {
            std::sort(positions.begin(), positions.end());
            positions.erase(std::unique(positions.begin(), positions.end()), positions.end());
        }
    }
}

bool SiteIndex::nearest(const std::string& chrom, Strand strand, int32_t pos, int32_t max_dist,
                        int32_t& out) const {
    if (strand == Strand::UNKNOWN) {
        return false;
    }
    const auto& by_chrom = sites_[static_cast<int>(strand)];
    auto it = by_chrom.find(chrom);
    if (it == by_chrom.end() || it->second.empty()) {
        return false;
    }

    const auto& positions = it->second;
    auto hi = std::lower_bound(positions.begin(), positions.end(), pos);
    bool found = false;
    int32_t best_dist = max_dist + 1;

    if (hi != positions.begin()) {
        int32_t d = pos - *(hi - 1);
        if (d <= max_dist) {
            out = *(hi - 1);
            best_dist = d;
            found = true;
        }
    }
    if (hi != positions.end()) {
        int32_t d = *hi - pos;
        // Upstream is the higher coordinate on the minus strand
        bool wins_tie = (d == best_dist && strand == Strand::MINUS);
        if (d <= max_dist && (d < best_dist || wins_tie)) {
            out = *hi;
            found = true;
        }
    }
    return found;
}

// ============================================================================
// TranscriptAnnotation
// ============================================================================

AnnotatedTranscript TranscriptAnnotation::parse_bed12(const std::string& line) {
    auto fields = split(line, '\t');
    if (fields.size() < 12) {
        throw std::invalid_argument("expected 12 BED columns, got " + std::to_string(fields.size()));
    }

    AnnotatedTranscript tx;
    tx.chrom = fields[0];
    tx.name = fields[3];
    tx.strand = parse_strand(fields[5]);

    const int32_t chrom_start = static_cast<int32_t>(std::stol(fields[1]));
    const int32_t chrom_end = static_cast<int32_t>(std::stol(fields[2]));
    const int block_count = std::stoi(fields[9]);
    std::vector<int32_t> sizes = parse_int_list(fields[10]);
    std::vector<int32_t> starts = parse_int_list(fields[11]);

    if (block_count <= 0 || static_cast<int>(sizes.size()) != block_count ||
        static_cast<int>(starts.size()) != block_count) {
        throw std::invalid_argument("block count does not match block lists");
    }

    for (int i = 0; i < block_count; ++i) {
        Interval exon{chrom_start + starts[i], chrom_start + starts[i] + sizes[i]};
        if (exon.length() <= 0 || exon.end > chrom_end) {
            throw std::invalid_argument("block " + std::to_string(i + 1) + " outside transcript");
        }
        if (!tx.exons.empty() && exon.start < tx.exons.back().end) {
            throw std::invalid_argument("blocks overlap or are unsorted");
        }
        tx.exons.push_back(exon);
    }
    return tx;
}

TranscriptAnnotation TranscriptAnnotation::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open annotation file: " + path);
    }

    TranscriptAnnotation annotation;
    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (skip_line(line)) continue;

        try {
            annotation.add(parse_bed12(line));
        } catch (const std::exception& e) {
            throw std::runtime_error(path + ":" + std::to_string(line_num) + ": " + e.what());
        }
    }

    for (auto& [chrom, txs] : annotation.by_chrom_) {
        std::stable_sort(txs.begin(), txs.end(), [](const AnnotatedTranscript& a, const AnnotatedTranscript& b) {
            return a.start() < b.start();
        });
    }

    LOG_INFO("Loaded " + std::to_string(annotation.size()) + " transcripts from " + path);
    return annotation;
}

void TranscriptAnnotation::add(AnnotatedTranscript tx) {
    by_chrom_[tx.chrom].push_back(std::move(tx));
    count_++;
}

std::vector<const AnnotatedTranscript*> TranscriptAnnotation::overlapping(const std::string& chrom, int32_t start,
                                                                          int32_t end) const {
    std::vector<const AnnotatedTranscript*> result;
    auto it = by_chrom_.find(chrom);
    if (it == by_chrom_.end()) {
        return result;
    }
    for (const auto& tx : it->second) {
        if (tx.start() < end && start < tx.end()) {
            result.push_back(&tx);
        }
    }
    return result;
}

bool TranscriptAnnotation::has_intron_chain(const std::string& chrom, Strand strand,
                                            const std::vector<Interval>& introns) const {
    if (introns.empty()) {
        return false;
    }
    for (const auto* tx : overlapping(chrom, introns.front().start, introns.back().end)) {
        if (tx->strand == strand && tx->introns() == introns) {
            return true;
        }
    }
    return false;
}

const std::vector<AnnotatedTranscript>& TranscriptAnnotation::on(const std::string& chrom) const {
    static const std::vector<AnnotatedTranscript> kEmpty;
    auto it = by_chrom_.find(chrom);
    return it == by_chrom_.end() ? kEmpty : it->second;
}

}  // namespace IsoLinkage
