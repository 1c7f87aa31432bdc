#include "utils/FastaReader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace IsoLinkage {

FastaReader::FastaReader(const std::string& fasta_path) : fasta_path_(fasta_path), fai_(nullptr) {
    fai_ = fai_load(fasta_path.c_str());
    if (!fai_) {
        throw std::runtime_error("Failed to load FASTA index: " + fasta_path + ".fai");
    }
}

FastaReader::~FastaReader() {
    if (fai_) {
        fai_destroy(fai_);
    }
}

std::string FastaReader::fetch_sequence(const std::string& chr, int32_t start, int32_t end) {
    if (!fai_ || start < 0 || end <= start) {
        return "";
    }

    // faidx_fetch_seq takes an inclusive end
    hts_pos_t len = 0;
    char* seq = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seq = faidx_fetch_seq64(fai_, chr.c_str(), start, end - 1, &len);
    }

    if (!seq || len <= 0) {
        if (seq) free(seq);
        return "";
    }

    std::string result(seq, static_cast<size_t>(len));
    free(seq);

    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::toupper(c); });
    return result;
}

Strand FastaReader::strand_of_motif(const std::string& donor, const std::string& acceptor) {
    if (donor == "GT" && acceptor == "AG") return Strand::PLUS;
    if (donor == "CT" && acceptor == "AC") return Strand::MINUS;
    return Strand::UNKNOWN;
}

Strand FastaReader::motif_strand(const std::string& chr, const Interval& intron) {
    if (intron.length() < 4) {
        return Strand::UNKNOWN;
    }
    std::string donor = fetch_sequence(chr, intron.start, intron.start + 2);
    std::string acceptor = fetch_sequence(chr, intron.end - 2, intron.end);
    return strand_of_motif(donor, acceptor);
}

int64_t FastaReader::get_chr_length(const std::string& chr) const {
    if (!fai_) {
        return -1;
    }
    return faidx_seq_len(fai_, chr.c_str());
}

}  // namespace IsoLinkage
