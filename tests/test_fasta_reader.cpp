#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "utils/FastaReader.hpp"

using namespace IsoLinkage;
using namespace IsoLinkage::Testing;

class FastaReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 0-3 AAAA | 4-5 GT | 6-11 | 12-13 AG | 14-17 | 18-19 CT | 20-25 | 26-27 AC | 28-31
        const std::string seq = "aaaaGTCCCCCCAGAAAACTGGGGGGACAAAA";
        write_file(dir_.file("genome.fa"), ">chr1 test\n" + seq + "\n");
        fasta_path_ = dir_.file("genome.fa");
    }

    TempDir dir_;
    std::string fasta_path_;
};

TEST_F(FastaReaderTest, FetchUppercases) {
    FastaReader fasta(fasta_path_);
    EXPECT_TRUE(fasta.is_loaded());
    EXPECT_EQ(fasta.get_chr_length("chr1"), 32);
    EXPECT_EQ(fasta.fetch_sequence("chr1", 0, 6), "AAAAGT");
    EXPECT_EQ(fasta.fetch_sequence("chr1", 6, 6), "");
    EXPECT_EQ(fasta.fetch_sequence("chrZ", 0, 6), "");
    EXPECT_EQ(fasta.get_chr_length("chrZ"), -1);
}

TEST_F(FastaReaderTest, SpliceMotifStrand) {
    FastaReader fasta(fasta_path_);
    EXPECT_EQ(fasta.motif_strand("chr1", {4, 14}), Strand::PLUS);
    EXPECT_EQ(fasta.motif_strand("chr1", {18, 28}), Strand::MINUS);
    EXPECT_EQ(fasta.motif_strand("chr1", {0, 10}), Strand::UNKNOWN);
    EXPECT_EQ(fasta.motif_strand("chr1", {4, 6}), Strand::UNKNOWN);
}

TEST(FastaMotifTest, StrandOfMotif) {
    EXPECT_EQ(FastaReader::strand_of_motif("GT", "AG"), Strand::PLUS);
    EXPECT_EQ(FastaReader::strand_of_motif("CT", "AC"), Strand::MINUS);
    EXPECT_EQ(FastaReader::strand_of_motif("GC", "AG"), Strand::UNKNOWN);
    EXPECT_EQ(FastaReader::strand_of_motif("", ""), Strand::UNKNOWN);
}

TEST(FastaMotifTest, MissingFileThrows) {
    EXPECT_THROW(FastaReader reader("/nonexistent/genome.fa"), std::runtime_error);
}
