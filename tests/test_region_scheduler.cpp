#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <set>
#include <thread>

#include "TestUtils.hpp"
#include "core/ClusterNumberer.hpp"
#include "core/Errors.hpp"
#include "core/RegionScheduler.hpp"
#include "io/OutputMultiplexer.hpp"
#include "io/TimeoutLog.hpp"

using namespace IsoLinkage;
using namespace IsoLinkage::Testing;

namespace {

class VectorRegionSource : public RegionSource {
public:
    explicit VectorRegionSource(std::vector<Region> regions) : regions_(std::move(regions)) {}

    bool next(Region& out) override {
        if (pos_ >= regions_.size()) {
            return false;
        }
        out = regions_[pos_++];
        return true;
    }

    size_t pulled() const { return pos_; }

private:
    std::vector<Region> regions_;
    size_t pos_ = 0;
};

/**
 * @brief What the fake element finder does for one region.
 */
struct RegionPlan {
    int clusters = 1;            ///< Clusters with elements
    int empty_clusters = 0;      ///< Element-less clusters
    bool stall = false;          ///< Poll the token until it fires
    bool fail = false;           ///< Throw a CollaboratorError
    int work_ms = 0;             ///< Sleep before answering
};

class FakeElementIdentifier : public ElementIdentifier {
public:
    std::map<int32_t, RegionPlan> plans;  ///< Keyed by region start

    int32_t watched_start = -1;                       ///< Region whose run is observed
    mutable std::atomic<bool> watched_running{false};
    mutable std::atomic<int32_t> furthest_started{0};  ///< Largest start begun while the watched region ran

    std::vector<GeneCluster> identify(const Region& region, const CancellationToken& token) const override {
        RegionPlan plan;
        auto it = plans.find(region.start);
        if (it != plans.end()) plan = it->second;

        if (region.start == watched_start) {
            watched_running.store(true);
        } else if (watched_running.load()) {
            int32_t seen = furthest_started.load();
            while (region.start > seen && !furthest_started.compare_exchange_weak(seen, region.start)) {
            }
        }
        std::vector<GeneCluster> clusters = build(region, plan, token);
        if (region.start == watched_start) {
            watched_running.store(false);
        }
        return clusters;
    }

private:
    static std::vector<GeneCluster> build(const Region& region, const RegionPlan& plan,
                                          const CancellationToken& token) {
        if (plan.fail) {
            throw CollaboratorError("cannot read evidence for " + region.to_string());
        }
        if (plan.work_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(plan.work_ms));
        }
        if (plan.stall) {
            auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (std::chrono::steady_clock::now() < give_up) {
                token.throw_if_cancelled();
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }

        std::vector<GeneCluster> clusters;
        for (int i = 0; i < plan.clusters; ++i) {
            GeneCluster c;
            c.index = i;
            c.chrom = region.chrom;
            c.strand = Strand::PLUS;
            c.start = region.start + i * 100;
            c.end = c.start + 60;

            GenomicElement intron;
            intron.chrom = c.chrom;
            intron.start = c.start + 20;
            intron.end = c.start + 40;
            intron.strand = Strand::PLUS;
            intron.type = ElementType::INTRON;
            intron.support = 3;
            c.of(ElementType::INTRON).push_back(intron);

            GenomicElement tss = intron;
            tss.start = c.start;
            tss.end = c.start + 20;
            tss.type = ElementType::TSS_EXON;
            tss.confident = true;
            c.of(ElementType::TSS_EXON).push_back(tss);

            clusters.push_back(c);
        }
        for (int i = 0; i < plan.empty_clusters; ++i) {
            GeneCluster c;
            c.chrom = region.chrom;
            c.strand = Strand::MINUS;
            c.start = region.start + 500 + i * 10;
            c.end = c.start + 5;
            clusters.push_back(c);
        }
        return clusters;
    }
};

class FakeTranscriptIdentifier : public TranscriptIdentifier {
public:
    bool ignore_token = false;

    TranscriptSet identify(const GeneCluster& cluster, const CancellationToken& token) const override {
        if (!ignore_token) {
            token.throw_if_cancelled();
        }
        TranscriptSet set;
        Isoform iso;
        iso.chrom = cluster.chrom;
        iso.strand = cluster.strand;
        iso.exons = {{cluster.start, cluster.start + 20}, {cluster.start + 40, cluster.end}};
        iso.category = IsoformCategory::F;
        iso.support = 2;
        set.isoforms.push_back(iso);
        return set;
    }
};

std::vector<Region> make_regions(int n) {
    std::vector<Region> regions;
    for (int i = 0; i < n; ++i) {
        regions.push_back({"chr1", 10000 * (i + 1), 10000 * (i + 1) + 1000});
    }
    return regions;
}

/**
 * @brief Cluster ids found in the last column of all ten streams.
 */
std::multiset<std::string> cluster_ids_in(const std::string& dir) {
    std::multiset<std::string> ids;
    for (const auto& name : OutputMultiplexer::all_file_names()) {
        for (const auto& line : read_lines((std::filesystem::path(dir) / name).string())) {
            ids.insert(line.substr(line.rfind('\t') + 1));
        }
    }
    return ids;
}

std::set<std::string> expected_ids(size_t n) {
    std::set<std::string> ids;
    for (size_t i = 1; i <= n; ++i) {
        ids.insert(ClusterNumberer::format(i));
    }
    return ids;
}

std::set<std::string> distinct(const std::multiset<std::string>& ids) {
    return std::set<std::string>(ids.begin(), ids.end());
}

}  // namespace

class RegionSchedulerTest : public ::testing::Test {
protected:
    SchedulerSummary run(std::vector<Region> regions, const SchedulerOptions& options) {
        VectorRegionSource source(std::move(regions));
        OutputMultiplexer output(dir_.str());
        TimeoutLog timeout_log(dir_.file(TimeoutLog::kDefaultFileName));
        RegionScheduler scheduler(elements_, transcripts_, output, numberer_, &timeout_log, options);
        SchedulerSummary summary = scheduler.process(source);
        output.close();
        return summary;
    }

    TempDir dir_;
    FakeElementIdentifier elements_;
    FakeTranscriptIdentifier transcripts_;
    ClusterNumberer numberer_;
};

TEST_F(RegionSchedulerTest, SequentialRunNumbersClustersInOrder) {
    elements_.plans[10000].clusters = 2;

    SchedulerSummary summary = run(make_regions(3), SchedulerOptions{});

    EXPECT_EQ(summary.regions, 3u);
    EXPECT_EQ(summary.completed, 3u);
    EXPECT_EQ(summary.clusters, 4u);
    EXPECT_EQ(numberer_.issued(), 4u);

    auto introns = read_lines(dir_.file("intron.bed6"));
    ASSERT_EQ(introns.size(), 4u);
    EXPECT_EQ(split_tabs(introns[0]).back(), "c_1");
    EXPECT_EQ(split_tabs(introns[1]).back(), "c_2");
    EXPECT_EQ(split_tabs(introns[2])[1], "20020");
    EXPECT_EQ(split_tabs(introns[2]).back(), "c_3");
    EXPECT_EQ(split_tabs(introns[3]).back(), "c_4");

    EXPECT_EQ(distinct(cluster_ids_in(dir_.str())), expected_ids(4));
}

TEST_F(RegionSchedulerTest, TimedOutRegionIsDiscardedAndLogged) {
    elements_.plans[20000].stall = true;

    SchedulerOptions options;
    options.deadline = std::chrono::milliseconds(1000);
    SchedulerSummary summary = run(make_regions(3), options);

    EXPECT_EQ(summary.timed_out, 1u);
    EXPECT_EQ(summary.completed, 2u);
    EXPECT_EQ(numberer_.issued(), 2u);

    // Region 1 gets c_1, region 3 gets c_2
    auto introns = read_lines(dir_.file("intron.bed6"));
    ASSERT_EQ(introns.size(), 2u);
    EXPECT_EQ(split_tabs(introns[0])[1], "10020");
    EXPECT_EQ(split_tabs(introns[0]).back(), "c_1");
    EXPECT_EQ(split_tabs(introns[1])[1], "30020");
    EXPECT_EQ(split_tabs(introns[1]).back(), "c_2");
    EXPECT_EQ(distinct(cluster_ids_in(dir_.str())), expected_ids(2));

    auto log = read_lines(dir_.file("timeout.log"));
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].rfind("TimeOut (1s): chr1\t20000\t21000\t", 0), 0u);
}

TEST_F(RegionSchedulerTest, ElementlessClusterGetsNoId) {
    elements_.plans[10000].clusters = 1;
    elements_.plans[10000].empty_clusters = 1;

    SchedulerSummary summary = run(make_regions(1), SchedulerOptions{});

    EXPECT_EQ(numberer_.issued(), 1u);
    EXPECT_EQ(summary.skipped_clusters, 1u);
    EXPECT_EQ(distinct(cluster_ids_in(dir_.str())), expected_ids(1));

    // The element-less cluster was on the minus strand; nothing of it is written
    for (const auto& line : read_lines(dir_.file("isoF.bed12"))) {
        EXPECT_EQ(split_tabs(line)[5], "+");
    }
}

TEST_F(RegionSchedulerTest, RegionWithOnlyEmptyClustersWritesNothing) {
    elements_.plans[10000].clusters = 0;
    elements_.plans[10000].empty_clusters = 2;

    SchedulerSummary summary = run(make_regions(1), SchedulerOptions{});

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(summary.empty_regions, 1u);
    EXPECT_EQ(numberer_.issued(), 0u);
    EXPECT_TRUE(cluster_ids_in(dir_.str()).empty());
}

TEST_F(RegionSchedulerTest, FatalErrorKeepsEarlierRegions) {
    elements_.plans[30000].fail = true;

    EXPECT_THROW(run(make_regions(5), SchedulerOptions{}), CollaboratorError);

    // Regions 1 and 2 committed, nothing after region 3
    EXPECT_EQ(distinct(cluster_ids_in(dir_.str())), expected_ids(2));
    auto introns = read_lines(dir_.file("intron.bed6"));
    ASSERT_EQ(introns.size(), 2u);
    EXPECT_EQ(split_tabs(introns[1])[1], "20020");
}

TEST_F(RegionSchedulerTest, FatalErrorWithWorkersKeepsEarlierRegions) {
    // Region 2 is slow, so region 3 fails while region 2 is still in flight
    elements_.plans[20000].work_ms = 200;
    elements_.plans[30000].fail = true;

    SchedulerOptions options;
    options.threads = 2;
    EXPECT_THROW(run(make_regions(8), options), CollaboratorError);

    EXPECT_EQ(distinct(cluster_ids_in(dir_.str())), expected_ids(2));
    auto introns = read_lines(dir_.file("intron.bed6"));
    ASSERT_EQ(introns.size(), 2u);
    EXPECT_EQ(split_tabs(introns[0])[1], "10020");
    EXPECT_EQ(split_tabs(introns[1])[1], "20020");
}

TEST_F(RegionSchedulerTest, FailureOnFirstRegionLeavesEmptyFiles) {
    elements_.plans[10000].fail = true;

    EXPECT_THROW(run(make_regions(3), SchedulerOptions{}), CollaboratorError);

    for (const auto& name : OutputMultiplexer::all_file_names()) {
        EXPECT_TRUE(std::filesystem::exists(dir_.file(name))) << name;
        EXPECT_TRUE(read_file(dir_.file(name)).empty()) << name;
    }
}

TEST_F(RegionSchedulerTest, TwoWorkersHundredRegionsGapFree) {
    for (int i = 0; i < 100; ++i) {
        RegionPlan& plan = elements_.plans[10000 * (i + 1)];
        plan.clusters = i % 3;
        plan.empty_clusters = (i % 4 == 0) ? 1 : 0;
        plan.work_ms = i % 5;
    }

    SchedulerOptions options;
    options.threads = 2;
    SchedulerSummary summary = run(make_regions(100), options);

    EXPECT_EQ(summary.regions, 100u);
    EXPECT_EQ(summary.completed, 100u);
    const size_t n = numberer_.issued();
    EXPECT_EQ(n, summary.clusters);
    EXPECT_EQ(n, 99u);  // 33 regions x 1 + 33 regions x 2
    EXPECT_EQ(distinct(cluster_ids_in(dir_.str())), expected_ids(n));
}

TEST_F(RegionSchedulerTest, TimeoutWithWorkersCancelsOnlyItsRegion) {
    elements_.plans[60000].stall = true;

    SchedulerOptions options;
    options.threads = 2;
    options.deadline = std::chrono::milliseconds(300);
    SchedulerSummary summary = run(make_regions(20), options);

    EXPECT_EQ(summary.regions, 20u);
    EXPECT_EQ(summary.timed_out, 1u);
    EXPECT_EQ(summary.completed, 19u);
    EXPECT_EQ(numberer_.issued(), 19u);
    EXPECT_EQ(distinct(cluster_ids_in(dir_.str())), expected_ids(19));

    for (const auto& line : read_lines(dir_.file("intron.bed6"))) {
        EXPECT_NE(split_tabs(line)[1], "60020");
    }

    auto log = read_lines(dir_.file("timeout.log"));
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].rfind("TimeOut (0.3s): chr1\t60000\t61000\t", 0), 0u);
}

TEST_F(RegionSchedulerTest, LateResultIgnoringTokenIsDiscarded) {
    // Neither collaborator polls; both regions answer well after the deadline
    transcripts_.ignore_token = true;
    elements_.plans[20000].clusters = 2;
    elements_.plans[20000].work_ms = 500;
    elements_.plans[30000].clusters = 0;
    elements_.plans[30000].empty_clusters = 1;
    elements_.plans[30000].work_ms = 500;

    SchedulerOptions options;
    options.deadline = std::chrono::milliseconds(200);
    SchedulerSummary summary = run(make_regions(4), options);

    EXPECT_EQ(summary.timed_out, 2u);
    EXPECT_EQ(summary.completed, 2u);
    EXPECT_EQ(numberer_.issued(), 2u);

    auto introns = read_lines(dir_.file("intron.bed6"));
    ASSERT_EQ(introns.size(), 2u);
    EXPECT_EQ(split_tabs(introns[0])[1], "10020");
    EXPECT_EQ(split_tabs(introns[0]).back(), "c_1");
    EXPECT_EQ(split_tabs(introns[1])[1], "40020");
    EXPECT_EQ(split_tabs(introns[1]).back(), "c_2");
    EXPECT_EQ(distinct(cluster_ids_in(dir_.str())), expected_ids(2));

    auto log = read_lines(dir_.file("timeout.log"));
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].rfind("TimeOut (0.2s): chr1\t20000\t21000\t", 0), 0u);
    EXPECT_EQ(log[1].rfind("TimeOut (0.2s): chr1\t30000\t31000\t", 0), 0u);
}

TEST_F(RegionSchedulerTest, SlowRegionBoundsRegionsPulledAhead) {
    // Region 0 runs with no deadline while three workers race ahead
    elements_.plans[10000].work_ms = 500;
    elements_.watched_start = 10000;

    SchedulerOptions options;
    options.threads = 4;
    options.max_pending = 8;
    SchedulerSummary summary = run(make_regions(300), options);

    EXPECT_EQ(summary.completed, 300u);
    EXPECT_EQ(distinct(cluster_ids_in(dir_.str())), expected_ids(300));

    // Only region indices 1..7 may start before region 0 commits
    const int32_t furthest = elements_.furthest_started.load();
    EXPECT_GT(furthest, 10000);
    EXPECT_LE(furthest, 80000);
}

TEST(RegionSchedulerDeterminismTest, RerunsAreByteIdentical) {
    FakeElementIdentifier elements;
    for (int i = 0; i < 20; ++i) {
        elements.plans[10000 * (i + 1)].clusters = (i % 3) + 1;
        elements.plans[10000 * (i + 1)].work_ms = (i * 7) % 4;
    }
    FakeTranscriptIdentifier transcripts;

    TempDir root;
    auto run_into = [&](const std::string& sub, int threads) {
        std::string dir = root.file(sub);
        VectorRegionSource source(make_regions(20));
        OutputMultiplexer output(dir);
        ClusterNumberer numberer;
        SchedulerOptions options;
        options.threads = threads;
        RegionScheduler scheduler(elements, transcripts, output, numberer, nullptr, options);
        scheduler.process(source);
        output.close();
        return dir;
    };

    std::string a = run_into("a", 1);
    std::string b = run_into("b", 1);
    std::string c = run_into("c", 3);

    for (const auto& name : OutputMultiplexer::all_file_names()) {
        std::string content = read_file((std::filesystem::path(a) / name).string());
        EXPECT_EQ(content, read_file((std::filesystem::path(b) / name).string())) << name;
        EXPECT_EQ(content, read_file((std::filesystem::path(c) / name).string())) << name;
    }
}
