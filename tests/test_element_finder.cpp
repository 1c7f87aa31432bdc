#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "core/ElementFinder.hpp"
#include "core/Errors.hpp"

using namespace IsoLinkage;
using namespace IsoLinkage::Testing;

namespace {

class MemoryAlignmentSource : public AlignmentSource {
public:
    std::vector<ReadAlignment> ngs;
    std::vector<ReadAlignment> tgs;

    std::vector<ReadAlignment> fetch(const Region& region, EvidenceKind kind, const CancellationToken&) override {
        std::vector<ReadAlignment> out;
        for (const auto& r : kind == EvidenceKind::NGS ? ngs : tgs) {
            if (r.start < region.end && region.start < r.end) out.push_back(r);
        }
        return out;
    }
};

ReadAlignment make_read(EvidenceKind kind, Strand strand, std::vector<Interval> blocks) {
    ReadAlignment r;
    r.kind = kind;
    r.strand = strand;
    r.blocks = std::move(blocks);
    r.start = r.blocks.front().start;
    r.end = r.blocks.back().end;
    return r;
}

const GenomicElement* find(const GeneCluster& c, ElementType t, int32_t start, int32_t end) {
    for (const auto& e : c.of(t)) {
        if (e.start == start && e.end == end) return &e;
    }
    return nullptr;
}

}  // namespace

class ElementFinderTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Two long reads of one three-exon gene on the plus strand
        reads_.tgs.push_back(make_read(EvidenceKind::TGS, Strand::PLUS, {{1000, 1200}, {1500, 1600}, {2000, 2300}}));
        reads_.tgs.push_back(make_read(EvidenceKind::TGS, Strand::PLUS, {{1010, 1200}, {1500, 1600}, {2000, 2250}}));
        // Short reads: one stranded junction read, one unstranded
        reads_.ngs.push_back(make_read(EvidenceKind::NGS, Strand::PLUS, {{1150, 1200}, {1500, 1550}}));
        reads_.ngs.push_back(make_read(EvidenceKind::NGS, Strand::UNKNOWN, {{1550, 1600}, {2000, 2050}}));

        params_.txs_diff = 500;
        params_.pir_cutoff = 0.5;
    }

    MemoryAlignmentSource reads_;
    AnalysisParams params_;
    Region region_{"chr1", 0, 10000};
};

TEST(ElementFinderMathTest, PercentIntronRetention) {
    EXPECT_DOUBLE_EQ(ElementFinder::percent_intron_retention(3.0, 1), 0.75);
    EXPECT_DOUBLE_EQ(ElementFinder::percent_intron_retention(0.0, 5), 0.0);
    EXPECT_DOUBLE_EQ(ElementFinder::percent_intron_retention(0.0, 0), 0.0);
    EXPECT_DOUBLE_EQ(ElementFinder::percent_intron_retention(2.0, 0), 1.0);
}

TEST(ElementFinderMathTest, CoverageCountsBlocksOnly) {
    Region region{"chr1", 100, 110};
    std::vector<ReadAlignment> reads = {
        make_read(EvidenceKind::NGS, Strand::PLUS, {{95, 102}, {106, 120}}),
        make_read(EvidenceKind::NGS, Strand::PLUS, {{104, 108}}),
    };
    Eigen::VectorXi cov = ElementFinder::coverage(region, reads);
    ASSERT_EQ(cov.size(), 10);
    Eigen::VectorXi expected(10);
    expected << 1, 1, 0, 0, 1, 1, 2, 2, 1, 1;
    EXPECT_EQ(cov, expected);
}

TEST_F(ElementFinderTest, FindsIntronsAndExonsOfOneGene) {
    ElementFinder finder(reads_, params_);
    auto clusters = finder.identify(region_, CancellationToken::none());

    ASSERT_EQ(clusters.size(), 1u);
    const GeneCluster& c = clusters[0];
    EXPECT_EQ(c.strand, Strand::PLUS);
    EXPECT_EQ(c.start, 1000);
    EXPECT_EQ(c.end, 2300);

    ASSERT_EQ(c.of(ElementType::INTRON).size(), 2u);
    const GenomicElement* i1 = find(c, ElementType::INTRON, 1200, 1500);
    ASSERT_NE(i1, nullptr);
    EXPECT_EQ(i1->support, 3);
    EXPECT_FALSE(i1->retained);

    // The unstranded junction read takes the strand of the long reads
    const GenomicElement* i2 = find(c, ElementType::INTRON, 1600, 2000);
    ASSERT_NE(i2, nullptr);
    EXPECT_EQ(i2->strand, Strand::PLUS);
    EXPECT_EQ(i2->support, 3);

    ASSERT_EQ(c.of(ElementType::INTERNAL_EXON).size(), 1u);
    EXPECT_EQ(c.of(ElementType::INTERNAL_EXON)[0].support, 2);

    // Free ends 1000/1010 and 2250/2300 merge; ties go to the leftmost site
    ASSERT_EQ(c.of(ElementType::TSS_EXON).size(), 1u);
    const GenomicElement& tss = c.of(ElementType::TSS_EXON)[0];
    EXPECT_EQ(tss.start, 1000);
    EXPECT_EQ(tss.end, 1200);
    EXPECT_EQ(tss.support, 2);
    EXPECT_TRUE(tss.confident);

    ASSERT_EQ(c.of(ElementType::TES_EXON).size(), 1u);
    EXPECT_EQ(c.of(ElementType::TES_EXON)[0].start, 2000);
    EXPECT_EQ(c.of(ElementType::TES_EXON)[0].end, 2250);

    EXPECT_EQ(c.chains.size(), 2u);
}

TEST_F(ElementFinderTest, DistantEndsStaySeparate) {
    params_.txs_diff = 5;
    ElementFinder finder(reads_, params_);
    auto clusters = finder.identify(region_, CancellationToken::none());

    ASSERT_EQ(clusters.size(), 1u);
    const auto& tss = clusters[0].of(ElementType::TSS_EXON);
    ASSERT_EQ(tss.size(), 2u);
    EXPECT_EQ(tss[0].support, 1);
    EXPECT_FALSE(tss[0].confident);
}

TEST_F(ElementFinderTest, ExternalSiteSnapsAndConfirms) {
    params_.txs_diff = 5;
    ExternalEvidence evidence;
    evidence.tss.add({"chr1", 1012, Strand::PLUS});
    evidence.tss.finalize();

    ElementFinder finder(reads_, params_, &evidence);
    auto clusters = finder.identify(region_, CancellationToken::none());

    ASSERT_EQ(clusters.size(), 1u);
    const GenomicElement* snapped = find(clusters[0], ElementType::TSS_EXON, 1012, 1200);
    ASSERT_NE(snapped, nullptr);
    EXPECT_EQ(snapped->support, 1);
    EXPECT_TRUE(snapped->confident);
}

TEST_F(ElementFinderTest, RetainedIntronFromIntronicCoverage) {
    for (int i = 0; i < 10; ++i) {
        reads_.ngs.push_back(make_read(EvidenceKind::NGS, Strand::PLUS, {{1200, 1500}}));
    }
    ElementFinder finder(reads_, params_);
    auto clusters = finder.identify(region_, CancellationToken::none());

    ASSERT_EQ(clusters.size(), 1u);
    const GenomicElement* intron = find(clusters[0], ElementType::INTRON, 1200, 1500);
    ASSERT_NE(intron, nullptr);
    EXPECT_DOUBLE_EQ(intron->pir, 10.0 / 13.0);
    EXPECT_TRUE(intron->retained);
}

TEST_F(ElementFinderTest, UnsplicedLongReadFormsElementlessCluster) {
    reads_.tgs.push_back(make_read(EvidenceKind::TGS, Strand::MINUS, {{8000, 8500}}));
    reads_.tgs.push_back(make_read(EvidenceKind::TGS, Strand::MINUS, {{8400, 8900}}));

    ElementFinder finder(reads_, params_);
    auto clusters = finder.identify(region_, CancellationToken::none());

    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_TRUE(clusters[0].has_element());
    EXPECT_FALSE(clusters[1].has_element());
    EXPECT_EQ(clusters[1].start, 8000);
    EXPECT_EQ(clusters[1].end, 8900);
    EXPECT_EQ(clusters[1].chains.size(), 2u);
    EXPECT_EQ(clusters[1].index, 1);
}

TEST_F(ElementFinderTest, OppositeStrandsMakeSeparateClusters) {
    reads_.tgs.push_back(make_read(EvidenceKind::TGS, Strand::MINUS, {{1050, 1180}, {1700, 1900}}));

    ElementFinder finder(reads_, params_);
    auto clusters = finder.identify(region_, CancellationToken::none());

    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0].strand, Strand::PLUS);
    EXPECT_EQ(clusters[1].strand, Strand::MINUS);
    // Minus strand: TSS is the right-hand exon
    ASSERT_EQ(clusters[1].of(ElementType::TSS_EXON).size(), 1u);
    EXPECT_EQ(clusters[1].of(ElementType::TSS_EXON)[0].start, 1700);
    ASSERT_EQ(clusters[1].of(ElementType::TES_EXON).size(), 1u);
    EXPECT_EQ(clusters[1].of(ElementType::TES_EXON)[0].end, 1180);
}

TEST_F(ElementFinderTest, AnnotationIntronAddedWithoutSupport) {
    ExternalEvidence evidence;
    evidence.ngs_annotation.add(
        TranscriptAnnotation::parse_bed12("chr1\t1000\t2300\ttx\t0\t+\t1000\t2300\t0\t3\t200,300,300\t0,500,1000"));

    ElementFinder finder(reads_, params_, &evidence);
    auto clusters = finder.identify(region_, CancellationToken::none());

    ASSERT_EQ(clusters.size(), 1u);
    const GenomicElement* intron = find(clusters[0], ElementType::INTRON, 1800, 2000);
    ASSERT_NE(intron, nullptr);
    EXPECT_EQ(intron->support, 0);
}

TEST_F(ElementFinderTest, UnresolvableIntronIsDropped) {
    MemoryAlignmentSource reads;
    reads.ngs.push_back(make_read(EvidenceKind::NGS, Strand::UNKNOWN, {{100, 200}, {300, 400}}));

    ElementFinder finder(reads, params_);
    auto clusters = finder.identify(region_, CancellationToken::none());
    EXPECT_TRUE(clusters.empty());
}

TEST_F(ElementFinderTest, EmptyRegionHasNoClusters) {
    ElementFinder finder(reads_, params_);
    auto clusters = finder.identify({"chr1", 50000, 60000}, CancellationToken::none());
    EXPECT_TRUE(clusters.empty());
}

TEST_F(ElementFinderTest, StopRequestCancelsRegion) {
    ElementFinder finder(reads_, params_);
    RegionTimer timer(std::nullopt, [] { return true; });
    EXPECT_THROW(finder.identify(region_, timer.token()), RegionCancelled);
}
