#pragma once

#include <htslib/sam.h>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace IsoLinkage {

/**
 * @brief RAII wrapper for indexed BAM reading with HTSlib.
 *
 * Not thread-safe: each thread should own its instance to avoid file
 * pointer contention (see BamAlignmentSource).
 *
 * Usage:
 *   BamReader reader("sample.bam");
 *   reader.for_each_read("chr17", 7577000, 7578000, [](const bam1_t* b) { ... });
 */
class BamReader {
public:
    /**
     * @brief Opens a BAM file and loads its index.
     * @param bam_path Path to the BAM file (must have a .bai/.csi index).
     * @param n_threads Number of decompression threads (default 1).
     * @throws std::runtime_error if the file, header or index cannot be loaded.
     */
    explicit BamReader(const std::string& bam_path, int n_threads = 1);

    ~BamReader();

    // Disable copy, allow move
    BamReader(const BamReader&) = delete;
    BamReader& operator=(const BamReader&) = delete;
    BamReader(BamReader&&) noexcept;
    BamReader& operator=(BamReader&&) noexcept;

    /**
     * @brief Visits every record overlapping [start, end).
     *
     * The record passed to the callback is reused between calls; copy what
     * you need. Exceptions thrown by the callback propagate after the
     * iterator is released.
     *
     * @return Number of records visited. Unknown chromosomes visit nothing.
     * @throws CollaboratorError on a truncated or corrupt file.
     */
    size_t for_each_read(const std::string& chr, int32_t start, int32_t end,
                         const std::function<void(const bam1_t*)>& fn);

    /**
     * @brief Reference sequence names in header order.
     */
    std::vector<std::string> target_names() const;

    /**
     * @brief Reference length in bp, or -1 if the chromosome is not in the header.
     */
    int64_t target_length(const std::string& chr) const;

    const sam_hdr_t* get_header() const { return hdr_; }

    bool is_open() const { return fp_ != nullptr; }

    const std::string& get_path() const { return bam_path_; }

private:
    std::string bam_path_;
    samFile* fp_;
    sam_hdr_t* hdr_;
    hts_idx_t* idx_;

    void release();
};

}  // namespace IsoLinkage
