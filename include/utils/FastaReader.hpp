#pragma once

#include <htslib/faidx.h>

#include <mutex>
#include <string>

#include "core/DataStructs.hpp"

namespace IsoLinkage {

/**
 * @brief RAII wrapper for FASTA file reading with HTSlib.
 *
 * Sequences are fetched on demand to minimize memory usage. A single
 * instance is shared by all region workers; fetches are serialized with
 * an internal mutex because faidx keeps per-handle file state.
 *
 * Usage:
 *   FastaReader fasta("hg38.fa");
 *   std::string seq = fasta.fetch_sequence("chr17", 7577000, 7579000);
 */
class FastaReader {
public:
    /**
     * @brief Constructs a FASTA reader for the specified file.
     * @param fasta_path Path to the FASTA file (must have a .fai index).
     * @throws std::runtime_error if file cannot be opened or indexed.
     */
    explicit FastaReader(const std::string& fasta_path);

    ~FastaReader();

    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;

    /**
     * @brief Fetches a subsequence from the reference genome.
     *
     * @param chr Chromosome name (e.g., "chr17", "17").
     * @param start 0-based inclusive start position.
     * @param end 0-based exclusive end position.
     * @return Uppercase DNA sequence, or empty string if region invalid.
     */
    std::string fetch_sequence(const std::string& chr, int32_t start, int32_t end);

    /**
     * @brief Strand implied by the splice-site dinucleotides of an intron.
     *
     * GT..AG gives PLUS, CT..AC gives MINUS, anything else UNKNOWN.
     */
    Strand motif_strand(const std::string& chr, const Interval& intron);

    /**
     * @brief Classifies donor/acceptor dinucleotides. Exposed for tests.
     */
    static Strand strand_of_motif(const std::string& donor, const std::string& acceptor);

    /**
     * @brief Gets the length of a chromosome.
     * @return Length in bp, or -1 if chromosome not found.
     */
    int64_t get_chr_length(const std::string& chr) const;

    bool is_loaded() const { return fai_ != nullptr; }

    const std::string& get_path() const { return fasta_path_; }

private:
    std::string fasta_path_;
    faidx_t* fai_;
    std::mutex mutex_;
};

}  // namespace IsoLinkage
