#include "core/BamReader.hpp"

#include <memory>
#include <stdexcept>

#include "core/Errors.hpp"

namespace IsoLinkage {

namespace {

struct BamRecordDeleter {
    void operator()(bam1_t* b) const { bam_destroy1(b); }
};

struct HtsIterDeleter {
    void operator()(hts_itr_t* it) const { hts_itr_destroy(it); }
};

}  // namespace

BamReader::BamReader(const std::string& bam_path, int n_threads)
    : bam_path_(bam_path), fp_(nullptr), hdr_(nullptr), idx_(nullptr) {
    fp_ = sam_open(bam_path.c_str(), "r");
    if (!fp_) {
        throw std::runtime_error("Failed to open BAM file: " + bam_path);
    }

    if (n_threads > 1) {
        if (hts_set_threads(fp_, n_threads) != 0) {
            release();
            throw std::runtime_error("Failed to set threads for BAM: " + bam_path);
        }
    }

    hdr_ = sam_hdr_read(fp_);
    if (!hdr_) {
        release();
        throw std::runtime_error("Failed to read BAM header: " + bam_path);
    }

    idx_ = sam_index_load(fp_, bam_path.c_str());
    if (!idx_) {
        release();
        throw std::runtime_error("Failed to load BAM index: " + bam_path);
    }
}

BamReader::~BamReader() {
    release();
}

void BamReader::release() {
    if (idx_) hts_idx_destroy(idx_);
    if (hdr_) sam_hdr_destroy(hdr_);
    if (fp_) sam_close(fp_);
    idx_ = nullptr;
    hdr_ = nullptr;
    fp_ = nullptr;
}

BamReader::BamReader(BamReader&& other) noexcept
    : bam_path_(std::move(other.bam_path_)), fp_(other.fp_), hdr_(other.hdr_), idx_(other.idx_) {
    other.fp_ = nullptr;
    other.hdr_ = nullptr;
    other.idx_ = nullptr;
}

BamReader& BamReader::operator=(BamReader&& other) noexcept {
    if (this != &other) {
        release();

        bam_path_ = std::move(other.bam_path_);
        fp_ = other.fp_;
        hdr_ = other.hdr_;
        idx_ = other.idx_;

        other.fp_ = nullptr;
        other.hdr_ = nullptr;
        other.idx_ = nullptr;
    }
    return *this;
}

size_t BamReader::for_each_read(const std::string& chr, int32_t start, int32_t end,
                                const std::function<void(const bam1_t*)>& fn) {
    if (!fp_ || !hdr_ || !idx_) {
        return 0;
    }

    int tid = sam_hdr_name2tid(hdr_, chr.c_str());
    if (tid < 0) {
        return 0;
    }

    std::unique_ptr<hts_itr_t, HtsIterDeleter> iter(sam_itr_queryi(idx_, tid, start, end));
    if (!iter) {
        return 0;
    }

    std::unique_ptr<bam1_t, BamRecordDeleter> b(bam_init1());
    size_t visited = 0;
    int ret;
    while ((ret = sam_itr_next(fp_, iter.get(), b.get())) >= 0) {
        fn(b.get());
        visited++;
    }

    // -1 is end of iteration, anything lower is a read error
    if (ret < -1) {
        throw CollaboratorError("Error while reading " + bam_path_ + " at " + chr + ":" + std::to_string(start) +
                                "-" + std::to_string(end));
    }

    return visited;
}

std::vector<std::string> BamReader::target_names() const {
    std::vector<std::string> names;
    if (!hdr_) {
        return names;
    }
    int n = sam_hdr_nref(hdr_);
    names.reserve(n);
    for (int i = 0; i < n; ++i) {
        names.emplace_back(sam_hdr_tid2name(hdr_, i));
    }
    return names;
}

int64_t BamReader::target_length(const std::string& chr) const {
    if (!hdr_) {
        return -1;
    }
    int tid = sam_hdr_name2tid(hdr_, chr.c_str());
    if (tid < 0) {
        return -1;
    }
    return static_cast<int64_t>(sam_hdr_tid2len(hdr_, tid));
}

}  // namespace IsoLinkage
