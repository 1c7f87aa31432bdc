#include "core/ReadParser.hpp"

namespace IsoLinkage {

namespace {

inline bool is_reverse(const bam1_t* b) {
    return (b->core.flag & BAM_FREVERSE) != 0;
}

inline bool is_read2(const bam1_t* b) {
    return (b->core.flag & BAM_FPAIRED) && (b->core.flag & BAM_FREAD2);
}

Strand tag_strand(const bam1_t* b, const char tag[2]) {
    uint8_t* aux = bam_aux_get(b, tag);
    if (!aux || aux[0] != 'A') {
        return Strand::UNKNOWN;
    }
    return strand_from_char(bam_aux2A(aux));
}

}  // namespace

ReadParser::ReadParser(EvidenceKind kind, StrandRule rule, const ReadFilterConfig& config)
    : kind_(kind), rule_(rule), config_(config) {
}

bool ReadParser::should_keep(const bam1_t* b) const {
    const uint16_t flag = b->core.flag;
    if (flag & (BAM_FUNMAP | BAM_FSECONDARY | BAM_FSUPPLEMENTARY | BAM_FDUP | BAM_FQCFAIL)) {
        return false;
    }
    if (b->core.qual < config_.min_mapq) {
        return false;
    }
    return b->core.n_cigar > 0;
}

Strand ReadParser::strand_from_xs(const bam1_t* b) {
    return tag_strand(b, "XS");
}

Strand ReadParser::determine_strand(const bam1_t* b) const {
    Strand xs = strand_from_xs(b);
    if (xs != Strand::UNKNOWN) {
        return xs;
    }

    if (kind_ == EvidenceKind::TGS) {
        // minimap2 ts:A is relative to the read orientation
        Strand ts = tag_strand(b, "ts");
        if (ts != Strand::UNKNOWN) {
            if (!is_reverse(b)) return ts;
            return ts == Strand::PLUS ? Strand::MINUS : Strand::PLUS;
        }
        return is_reverse(b) ? Strand::MINUS : Strand::PLUS;
    }

    // Unpaired reads are treated as read 1
    const bool read2 = is_read2(b);
    switch (rule_) {
        case StrandRule::FORWARD:
            // 1++,1--,2+-,2-+
            return (is_reverse(b) != read2) ? Strand::MINUS : Strand::PLUS;
        case StrandRule::REVERSE:
            // 1+-,1-+,2++,2--
            return (is_reverse(b) != read2) ? Strand::PLUS : Strand::MINUS;
        case StrandRule::SINGLE_END:
            break;
    }
    return Strand::UNKNOWN;
}

ReadAlignment ReadParser::parse(const bam1_t* b) const {
    ReadAlignment aln;
    aln.kind = kind_;
    aln.start = static_cast<int32_t>(b->core.pos);
    aln.end = static_cast<int32_t>(bam_endpos(b));
    aln.strand = determine_strand(b);

    const uint32_t* cigar = bam_get_cigar(b);
    int32_t pos = aln.start;
    int32_t block_start = pos;

    for (uint32_t i = 0; i < b->core.n_cigar; ++i) {
        const int op = bam_cigar_op(cigar[i]);
        const int32_t len = static_cast<int32_t>(bam_cigar_oplen(cigar[i]));

        if (op == BAM_CREF_SKIP) {
            if (pos > block_start) {
                aln.blocks.push_back({block_start, pos});
            }
            pos += len;
            block_start = pos;
        } else if (bam_cigar_type(op) & 2) {
            // consumes reference: M, D, =, X
            pos += len;
        }
    }
    if (pos > block_start) {
        aln.blocks.push_back({block_start, pos});
    }

    return aln;
}

}  // namespace IsoLinkage
