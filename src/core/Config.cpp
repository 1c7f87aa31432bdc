#include "core/Config.hpp"

#include <htslib/faidx.h>
#include <htslib/hts.h>
#include <htslib/sam.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace IsoLinkage {

namespace {

bool check_bam(const std::string& path, const std::string& label) {
    samFile* fp = sam_open(path.c_str(), "r");
    if (fp == NULL) {
        std::cerr << "Error: Cannot open " << label << " BAM file: " << path << std::endl;
        return false;
    }

    bool valid = true;
    sam_hdr_t* hdr = sam_hdr_read(fp);
    if (hdr == NULL) {
        std::cerr << "Error: Cannot read header from " << label << " BAM file: " << path << std::endl;
        valid = false;
    } else {
        sam_hdr_destroy(hdr);
    }

    // Regions are fetched by random access, so the index is mandatory here.
    hts_idx_t* idx = sam_index_load(fp, path.c_str());
    if (idx == NULL) {
        std::cerr << "Error: " << label << " BAM index not found: " << path << std::endl;
        valid = false;
    } else {
        hts_idx_destroy(idx);
    }

    sam_close(fp);
    return valid;
}

bool check_optional_file(const std::string& path, const std::string& label) {
    if (path.empty()) {
        return true;
    }
    if (!std::filesystem::is_regular_file(path)) {
        std::cerr << "Error: Cannot find " << label << " file: " << path << std::endl;
        return false;
    }
    return true;
}

}  // namespace

bool Config::validate() const {
    bool valid = true;

    if (output_dir.empty()) {
        std::cerr << "Error: Output directory is required." << std::endl;
        valid = false;
    }

    if (ngs_bam_paths.empty()) {
        std::cerr << "Error: At least one NGS BAM file is required." << std::endl;
        valid = false;
    }
    for (const auto& path : ngs_bam_paths) {
        valid = check_bam(path, "NGS") && valid;
    }

    if (tgs_bam_paths.empty()) {
        std::cerr << "Error: At least one TGS BAM file is required." << std::endl;
        valid = false;
    }
    for (const auto& path : tgs_bam_paths) {
        valid = check_bam(path, "TGS") && valid;
    }

    valid = check_optional_file(tss_path, "TSS") && valid;
    valid = check_optional_file(tes_path, "TES") && valid;
    valid = check_optional_file(ann_path, "annotation") && valid;
    valid = check_optional_file(cfm_ann_path, "confirmed annotation") && valid;

    if (!genome_fasta_path.empty()) {
        faidx_t* fai = fai_load(genome_fasta_path.c_str());
        if (fai == NULL) {
            std::cerr << "Error: Cannot load genome FASTA (or .fai index missing): " << genome_fasta_path
                      << std::endl;
            valid = false;
        } else {
            fai_destroy(fai);
        }
    }

    if (pir_cutoff < 0.0 || pir_cutoff > 1.0) {
        std::cerr << "Error: PIR cutoff must be between 0.0 and 1.0." << std::endl;
        valid = false;
    }

    if (txs_diff < 0) {
        std::cerr << "Error: TSS/TES distance cutoff must not be negative." << std::endl;
        valid = false;
    }

    if (time_out_sec < 0) {
        std::cerr << "Error: Time out must be positive." << std::endl;
        valid = false;
    }

    if (threads < 1) {
        std::cerr << "Error: Thread count must be at least 1." << std::endl;
        valid = false;
    }

    return valid;
}

void Config::print() const {
    auto join = [](const std::vector<std::string>& v) {
        std::string s;
        for (size_t i = 0; i < v.size(); ++i) {
            s += (i > 0 ? ", " : "") + v[i];
        }
        return s;
    };

    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "Output Dir: " << output_dir << std::endl;
    std::cout << "NGS BAM: " << join(ngs_bam_paths) << std::endl;
    std::cout << "TGS BAM: " << join(tgs_bam_paths) << std::endl;
    std::cout << "TSS: " << (tss_path.empty() ? "None" : tss_path) << std::endl;
    std::cout << "TES: " << (tes_path.empty() ? "None" : tes_path) << std::endl;
    std::cout << "Annotation: " << (ann_path.empty() ? "None" : ann_path) << std::endl;
    std::cout << "Confirmed Annotation: " << (cfm_ann_path.empty() ? "None" : cfm_ann_path) << std::endl;
    std::cout << "Genome: " << (genome_fasta_path.empty() ? "None" : genome_fasta_path) << std::endl;
    std::cout << "Rule: " << rule_to_string(strand_rule) << std::endl;
    std::cout << "PIR Cutoff: " << pir_cutoff << std::endl;
    std::cout << "TSS/TES Distance: " << txs_diff << " bp" << std::endl;
    std::cout << "Time Out: " << (time_out_sec > 0 ? std::to_string(time_out_sec) + " s" : "None") << std::endl;
    std::cout << "Min MapQ: " << min_mapq << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "---------------------" << std::endl;
}

std::string Config::rule_to_string(StrandRule rule) {
    switch (rule) {
        case StrandRule::FORWARD: return "1++,1--,2+-,2-+";
        case StrandRule::REVERSE: return "1+-,1-+,2++,2--";
        case StrandRule::SINGLE_END: return "single_end";
    }
    return "single_end";
}

StrandRule Config::rule_from_string(const std::string& s) {
    if (s == "1++,1--,2+-,2-+") return StrandRule::FORWARD;
    if (s == "1+-,1-+,2++,2--") return StrandRule::REVERSE;
    if (s == "single_end") return StrandRule::SINGLE_END;
    throw std::invalid_argument("Unknown library rule: " + s);
}

}  // namespace IsoLinkage
