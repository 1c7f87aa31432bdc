#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace IsoLinkage {

/**
 * @brief Strand of a read, element or transcript.
 *
 * For reads the strand is the inferred transcript strand (see StrandRule),
 * not the raw alignment orientation.
 */
enum class Strand : uint8_t {
    PLUS = 0,    ///< Forward strand (+)
    MINUS = 1,   ///< Reverse strand (-)
    UNKNOWN = 2  ///< Strand cannot be determined (.)
};

inline char strand_to_char(Strand s) {
    switch (s) {
        case Strand::PLUS: return '+';
        case Strand::MINUS: return '-';
        default: return '.';
    }
}

inline Strand strand_from_char(char c) {
    if (c == '+') return Strand::PLUS;
    if (c == '-') return Strand::MINUS;
    return Strand::UNKNOWN;
}

/**
 * @brief NGS library type, used to infer the transcript strand of short reads.
 */
enum class StrandRule {
    FORWARD,    ///< "1++,1--,2+-,2-+"
    REVERSE,    ///< "1+-,1-+,2++,2--"
    SINGLE_END  ///< "single_end": strand from XS tag only
};

/**
 * @brief Kind of evidence file.
 */
enum class EvidenceKind {
    NGS,  ///< Short-read RNA-seq
    TGS   ///< Long reads (PacBio / ONT)
};

/**
 * @brief The four element categories, in output stream order.
 */
enum class ElementType : uint8_t {
    INTRON = 0,
    INTERNAL_EXON = 1,
    TSS_EXON = 2,
    TES_EXON = 3
};

constexpr std::size_t kNumElementTypes = 4;

constexpr std::array<ElementType, kNumElementTypes> kAllElementTypes = {
    ElementType::INTRON, ElementType::INTERNAL_EXON, ElementType::TSS_EXON, ElementType::TES_EXON};

/**
 * @brief The six isoform categories, in output stream order.
 *
 * Precedence when several apply: A > C > R > F > M > P.
 */
enum class IsoformCategory : uint8_t {
    F = 0,  ///< Full-length: both ends on confident TSS/TES exons
    A = 1,  ///< Intron chain matches a confirmed annotation
    R = 2,  ///< Contains a retained intron
    M = 3,  ///< One end on a confident TSS/TES exon
    C = 4,  ///< Intron chain matches an NGS-based annotation
    P = 5   ///< Partial: no confident end
};

constexpr std::size_t kNumIsoformCategories = 6;

constexpr std::array<IsoformCategory, kNumIsoformCategories> kAllIsoformCategories = {
    IsoformCategory::F, IsoformCategory::A, IsoformCategory::R,
    IsoformCategory::M, IsoformCategory::C, IsoformCategory::P};

inline char category_to_char(IsoformCategory c) {
    static const char kLetters[] = {'F', 'A', 'R', 'M', 'C', 'P'};
    return kLetters[static_cast<int>(c)];
}

/**
 * @brief Short code used in element record names (I, E, S, T).
 */
inline char element_type_code(ElementType t) {
    switch (t) {
        case ElementType::INTRON: return 'I';
        case ElementType::INTERNAL_EXON: return 'E';
        case ElementType::TSS_EXON: return 'S';
        case ElementType::TES_EXON: return 'T';
    }
    return '?';
}

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,  ///< Only errors
    LOG_WARN = 1,   ///< Errors and warnings
    LOG_INFO = 2,   ///< Normal operational messages
    LOG_DEBUG = 3   ///< Per-region progress
};

}  // namespace IsoLinkage
