#include "io/BedFormat.hpp"

#include <algorithm>
#include <sstream>

namespace IsoLinkage {

int BedFormatter::bed_score(int support) {
    return std::clamp(support, 0, 1000);
}

std::string BedFormatter::element_record(const GenomicElement& element, const std::string& cluster_id,
                                         int ordinal) {
    std::ostringstream oss;
    oss << element.chrom << "\t"
        << element.start << "\t"
        << element.end << "\t"
        << cluster_id << "." << element_type_code(element.type) << ordinal << "\t"
        << bed_score(element.support) << "\t"
        << strand_to_char(element.strand) << "\t"
        << cluster_id << "\n";
    return oss.str();
}

std::string BedFormatter::isoform_record(const Isoform& isoform, const std::string& cluster_id, int ordinal) {
    const int32_t tx_start = isoform.start();
    const int32_t tx_end = isoform.end();

    std::ostringstream sizes;
    std::ostringstream starts;
    for (size_t i = 0; i < isoform.exons.size(); ++i) {
        if (i > 0) {
            sizes << ",";
            starts << ",";
        }
        sizes << isoform.exons[i].length();
        starts << (isoform.exons[i].start - tx_start);
    }

    std::ostringstream oss;
    oss << isoform.chrom << "\t"
        << tx_start << "\t"
        << tx_end << "\t"
        << cluster_id << "." << category_to_char(isoform.category) << ordinal << "\t"
        << bed_score(isoform.support) << "\t"
        << strand_to_char(isoform.strand) << "\t"
        << tx_start << "\t"
        << tx_end << "\t"
        << "0\t"
        << isoform.exons.size() << "\t"
        << sizes.str() << "\t"
        << starts.str() << "\t"
        << cluster_id << "\n";
    return oss.str();
}

}  // namespace IsoLinkage
