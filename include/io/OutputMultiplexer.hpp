#pragma once

#include <array>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "core/Types.hpp"

namespace IsoLinkage {

/**
 * @brief Records of one committed cluster (or region), grouped per output stream.
 */
struct RecordBatch {
    std::array<std::vector<std::string>, kNumElementTypes> element_lines;
    std::array<std::vector<std::string>, kNumIsoformCategories> isoform_lines;

    std::vector<std::string>& lines(ElementType t) { return element_lines[static_cast<size_t>(t)]; }
    std::vector<std::string>& lines(IsoformCategory c) { return isoform_lines[static_cast<size_t>(c)]; }

    size_t size() const {
        size_t n = 0;
        for (const auto& v : element_lines) n += v.size();
        for (const auto& v : isoform_lines) n += v.size();
        return n;
    }

    bool empty() const { return size() == 0; }
};

/**
 * @brief 負責管理一次執行的十個分類輸出檔案
 *
 * Output directory layout:
 * ```
 * output/
 *   intron.bed6          # introns
 *   internal_exon.bed6   # internal exons
 *   tss_exon.bed6        # TSS exons
 *   tes_exon.bed6        # TES exons
 *   isoF.bed12           # full-length isoforms
 *   isoA.bed12           # confirmed-annotation isoforms
 *   isoR.bed12           # intron-retention isoforms
 *   isoM.bed12           # one-end-anchored isoforms
 *   isoC.bed12           # NGS-annotation isoforms
 *   isoP.bed12           # partial isoforms
 *   timeout.log          # written by TimeoutLog, appended across runs
 * ```
 *
 * The ten streams are acquired together by the constructor and released
 * together by close() or the destructor, whichever comes first. Writing
 * goes through write_batch(), which serializes writers; the raw stream
 * accessors bypass that lock.
 */
class OutputMultiplexer {
public:
    static constexpr size_t kNumStreams = kNumElementTypes + kNumIsoformCategories;

    /**
     * @brief Creates the directory if absent and opens all ten streams, truncating them.
     *
     * @param output_dir Output directory
     * @throws ResourceError if the directory or any stream cannot be created;
     *         streams opened before the failure are closed again.
     */
    explicit OutputMultiplexer(const std::string& output_dir);

    /**
     * @brief Closes all streams that are still open. Never throws.
     */
    ~OutputMultiplexer();

    OutputMultiplexer(const OutputMultiplexer&) = delete;
    OutputMultiplexer& operator=(const OutputMultiplexer&) = delete;

    /**
     * @brief Flushes and closes all ten streams.
     *
     * Idempotent. Streams that never opened are skipped.
     *
     * @throws ResourceError if any stream failed to flush.
     */
    void close();

    bool is_closed() const { return closed_; }

    /**
     * @brief Appends a batch of records under the writer lock.
     *
     * Every stream the batch touches is flushed before returning, so a write
     * failure (e.g. a full disk) surfaces here and not later in close().
     *
     * @throws ResourceError after close() or on a write or flush failure.
     */
    void write_batch(const RecordBatch& batch);

    /**
     * @brief The four element streams: intron, internal exon, TSS exon, TES exon.
     *
     * Raw access, not synchronized with write_batch() and not checked against
     * close(). Only valid before close(), from a single writer.
     */
    std::array<std::ofstream*, kNumElementTypes> element_streams();

    /**
     * @brief The six isoform streams: F, A, R, M, C, P.
     *
     * Same restrictions as element_streams().
     */
    std::array<std::ofstream*, kNumIsoformCategories> isoform_streams();

    /**
     * @brief Raw stream of one category. Same restrictions as element_streams().
     */
    std::ofstream& stream(ElementType t) { return streams_[index_of(t)]; }
    std::ofstream& stream(IsoformCategory c) { return streams_[index_of(c)]; }

    const std::string& output_dir() const { return output_dir_; }

    /**
     * @brief Full path of the file backing a category.
     */
    std::string path_of(ElementType t) const;
    std::string path_of(IsoformCategory c) const;

    static const char* file_name(ElementType t);
    static const char* file_name(IsoformCategory c);

    /**
     * @brief All ten file names in stream order.
     */
    static std::array<std::string, kNumStreams> all_file_names();

private:
    std::string output_dir_;
    std::array<std::ofstream, kNumStreams> streams_;
    bool closed_ = false;
    std::mutex mutex_;

    static size_t index_of(ElementType t) { return static_cast<size_t>(t); }
    static size_t index_of(IsoformCategory c) { return kNumElementTypes + static_cast<size_t>(c); }

    /**
     * @brief Flushes and closes every open stream.
     * @return false if any stream was in a failed state.
     */
    bool close_streams();

    /**
     * @brief Writes and flushes lines to one stream.
     * @throws ResourceError if the stream fails.
     */
    static void append_lines(std::ofstream& out, const std::vector<std::string>& lines, const char* name);
};

}  // namespace IsoLinkage
