#include "io/OutputMultiplexer.hpp"

#include <filesystem>
#include <system_error>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace IsoLinkage {

namespace fs = std::filesystem;

const char* OutputMultiplexer::file_name(ElementType t) {
    switch (t) {
        case ElementType::INTRON: return "intron.bed6";
        case ElementType::INTERNAL_EXON: return "internal_exon.bed6";
        case ElementType::TSS_EXON: return "tss_exon.bed6";
        case ElementType::TES_EXON: return "tes_exon.bed6";
    }
    return "";
}

const char* OutputMultiplexer::file_name(IsoformCategory c) {
    switch (c) {
        case IsoformCategory::F: return "isoF.bed12";
        case IsoformCategory::A: return "isoA.bed12";
        case IsoformCategory::R: return "isoR.bed12";
        case IsoformCategory::M: return "isoM.bed12";
        case IsoformCategory::C: return "isoC.bed12";
        case IsoformCategory::P: return "isoP.bed12";
    }
    return "";
}

std::array<std::string, OutputMultiplexer::kNumStreams> OutputMultiplexer::all_file_names() {
    std::array<std::string, kNumStreams> names;
    for (auto t : kAllElementTypes) {
        names[index_of(t)] = file_name(t);
    }
    for (auto c : kAllIsoformCategories) {
        names[index_of(c)] = file_name(c);
    }
    return names;
}

std::string OutputMultiplexer::path_of(ElementType t) const {
    return (fs::path(output_dir_) / file_name(t)).string();
}

std::string OutputMultiplexer::path_of(IsoformCategory c) const {
    return (fs::path(output_dir_) / file_name(c)).string();
}

OutputMultiplexer::OutputMultiplexer(const std::string& output_dir) : output_dir_(output_dir) {
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec || !fs::is_directory(output_dir_)) {
        throw ResourceError("Cannot create output directory: " + output_dir_ +
                            (ec ? " (" + ec.message() + ")" : ""));
    }

    const auto names = all_file_names();
    for (size_t i = 0; i < kNumStreams; ++i) {
        const std::string path = (fs::path(output_dir_) / names[i]).string();
        streams_[i].open(path, std::ios::out | std::ios::trunc);
        if (!streams_[i].is_open()) {
            close_streams();
            closed_ = true;
            throw ResourceError("Cannot open output file for writing: " + path);
        }
    }

    LOG_DEBUG("Opened " + std::to_string(kNumStreams) + " output streams in " + output_dir_);
}

OutputMultiplexer::~OutputMultiplexer() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    if (!close_streams()) {
        LOG_ERROR("Failed to flush output streams in " + output_dir_);
    }
}

bool OutputMultiplexer::close_streams() {
    bool ok = true;
    for (auto& s : streams_) {
        if (!s.is_open()) {
            continue;
        }
        s.flush();
        if (!s.good()) {
            ok = false;
        }
        s.close();
        if (s.fail()) {
            ok = false;
        }
    }
    return ok;
}

void OutputMultiplexer::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    if (!close_streams()) {
        throw ResourceError("Failed to flush output streams in " + output_dir_);
    }
    LOG_DEBUG("Closed output streams in " + output_dir_);
}

void OutputMultiplexer::write_batch(const RecordBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw ResourceError("Write to closed output streams in " + output_dir_);
    }

    for (auto t : kAllElementTypes) {
        append_lines(streams_[index_of(t)], batch.element_lines[static_cast<size_t>(t)], file_name(t));
    }
    for (auto c : kAllIsoformCategories) {
        append_lines(streams_[index_of(c)], batch.isoform_lines[static_cast<size_t>(c)], file_name(c));
    }
}

void OutputMultiplexer::append_lines(std::ofstream& out, const std::vector<std::string>& lines, const char* name) {
    if (lines.empty()) {
        return;
    }
    for (const auto& line : lines) {
        out << line;
    }
    out.flush();
    if (!out.good()) {
        throw ResourceError(std::string("Write failed: ") + name);
    }
}

std::array<std::ofstream*, kNumElementTypes> OutputMultiplexer::element_streams() {
    std::array<std::ofstream*, kNumElementTypes> result{};
    for (auto t : kAllElementTypes) {
        result[static_cast<size_t>(t)] = &streams_[index_of(t)];
    }
    return result;
}

std::array<std::ofstream*, kNumIsoformCategories> OutputMultiplexer::isoform_streams() {
    std::array<std::ofstream*, kNumIsoformCategories> result{};
    for (auto c : kAllIsoformCategories) {
        result[static_cast<size_t>(c)] = &streams_[index_of(c)];
    }
    return result;
}

}  // namespace IsoLinkage
