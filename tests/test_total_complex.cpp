#include <gtest/gtest.h>
#include <graph_complex/errors.hpp>
#include <graph_complex/total_complex.hpp>
#include "test_helpers.hpp"
#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>

using namespace graph_complex;
namespace fs = std::filesystem;

namespace {

GradingKey odd(int v, int l) { return GradingKey::ordinary(v, l, EdgeParity::Odd); }

// Dimensions from a fixed table; unlisted gradings are empty.
std::function<std::size_t(const GradingKey&)> dimensions(std::map<GradingKey, std::size_t> table) {
    return [table](const GradingKey& key) -> std::size_t {
        auto it = table.find(key);
        return it == table.end() ? 0 : it->second;
    };
}

} // namespace

class TotalComplexTest : public ::testing::Test {
protected:
    test_utils::TempDir dir;
    std::shared_ptr<FileStore> store = std::make_shared<FileStore>(dir.path());
    std::shared_ptr<const GraphOracle> oracle = std::make_shared<RefinementOracle>();
    std::shared_ptr<const GraphFamily> ordinary = make_family(ComplexFamily::Ordinary);
    EngineConfig config;

    void SetUp() override {
        config.jobs = 4;
        config.store_root = dir.path();
    }
};

// === SLICES ===

TEST_F(TotalComplexTest, SliceGradingsByVertexCount) {
    DegreeSlice slice(3);
    auto keys = slice.gradings();
    ASSERT_EQ(keys.size(), 4u);
    EXPECT_EQ(keys[0], odd(0, 3));
    EXPECT_EQ(keys[3], odd(3, 0));
    EXPECT_EQ(slice.below(), DegreeSlice(2));
    EXPECT_EQ(slice.above(), DegreeSlice(4));
    EXPECT_EQ(slice.to_string(), "ordinary/odd_edges(deg=3)");

    EXPECT_TRUE(DegreeSlice(-1).gradings().empty());
}

TEST_F(TotalComplexTest, LayoutOffsetsFollowComponents) {
    SliceLayout layout = SliceLayout::build(DegreeSlice(12), dimensions({{odd(6, 6), 1}, {odd(7, 5), 1}}));
    EXPECT_EQ(layout.dimension(), 2u);
    EXPECT_EQ(layout.offset_of(odd(6, 6)), 0u);
    EXPECT_EQ(layout.offset_of(odd(7, 5)), 1u);
    EXPECT_EQ(layout.dimension_of(odd(7, 5)), 1u);
    EXPECT_EQ(layout.dimension_of(odd(5, 7)), 0u);
    EXPECT_THROW(layout.offset_of(odd(7, 6)), std::invalid_argument);
}

// === ASSEMBLY ===

TEST_F(TotalComplexTest, BlocksLandAtComponentOffsets) {
    // Slice 12: (6,6) and (7,5), one generator each. Slice 11: (5,6) empty, (6,5) two generators.
    SliceLayout domain = SliceLayout::build(DegreeSlice(12), dimensions({{odd(6, 6), 1}, {odd(7, 5), 1}}));
    SliceLayout target = SliceLayout::build(DegreeSlice(11), dimensions({{odd(6, 5), 2}}));

    BlockLookup block = [](OperatorKind kind, const GradingKey& key) -> std::optional<SparseMatrix> {
        if (kind == OperatorKind::Delete && key == odd(6, 6)) {
            return test_utils::make_matrix(2, 1, {{0, 0, 1}, {1, 0, -1}});
        }
        if (kind == OperatorKind::Contract && key == odd(7, 5)) {
            return test_utils::make_matrix(2, 1, {{1, 0, 2}});
        }
        return std::nullopt;
    };

    SparseMatrix total = assemble_total_differential(domain, target, *ordinary, block);
    EXPECT_EQ(total.rows(), 2u);
    EXPECT_EQ(total.cols(), 2u);
    EXPECT_EQ(total.at(0, 0), 1);
    EXPECT_EQ(total.at(1, 0), -1);
    EXPECT_EQ(total.at(0, 1), 0);
    EXPECT_EQ(total.at(1, 1), 2);
}

TEST_F(TotalComplexTest, MisfitBlocksAreRejected) {
    SliceLayout domain = SliceLayout::build(DegreeSlice(12), dimensions({{odd(7, 5), 1}}));
    SliceLayout target = SliceLayout::build(DegreeSlice(11), dimensions({{odd(6, 5), 2}}));
    BlockLookup wrong_shape = [](OperatorKind, const GradingKey&) -> std::optional<SparseMatrix> {
        return SparseMatrix(3, 1);
    };
    EXPECT_THROW(assemble_total_differential(domain, target, *ordinary, wrong_shape), std::invalid_argument);

    BlockLookup none = [](OperatorKind, const GradingKey&) -> std::optional<SparseMatrix> { return std::nullopt; };
    EXPECT_THROW(assemble_total_differential(domain, domain, *ordinary, none), std::invalid_argument);
    EXPECT_TRUE(assemble_total_differential(domain, target, *ordinary, none).is_zero());
}

// === COHOMOLOGY ===

TEST_F(TotalComplexTest, OddBicomplexCohomology) {
    TotalComplexRunner runner(config, store, oracle);
    TotalComplexReport report = runner.run(7, 12);
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.failures.empty());

    const auto& table = report.table;
    ASSERT_EQ(table.entries.size(), 6u);
    EXPECT_EQ(table.dimension_at(7), 1);
    EXPECT_EQ(table.dimension_at(8), 0);
    EXPECT_EQ(table.dimension_at(9), 0);
    EXPECT_EQ(table.dimension_at(10), 0);
    EXPECT_EQ(table.dimension_at(11), 1);
    EXPECT_EQ(table.dimension_at(12), 0);
    EXPECT_EQ(table.dimension_at(13), -1);

    const TotalCohomologyEntry& top = table.entries.back();
    EXPECT_EQ(top.slice, DegreeSlice(12));
    EXPECT_EQ(top.slice_dimension, 2u);
    EXPECT_EQ(top.rank_out, 1u);
    EXPECT_EQ(top.rank_in, 1u);

    const TotalCheck* check = report.check(12);
    ASSERT_NE(check, nullptr);
    EXPECT_EQ(check->outcome, CheckOutcome::Passed);
    EXPECT_EQ(check->residual_entries, 0u);
    ASSERT_NE(report.check(7), nullptr);
    EXPECT_EQ(report.check(7)->outcome, CheckOutcome::Trivial);

    std::string tsv = test_utils::read_text(store->total_table_path(table.domain));
    EXPECT_NE(tsv.find("ordinary\todd_edges\t11\t1\n"), std::string::npos);
    EXPECT_TRUE(fs::exists(store->total_rank_path(DegreeSlice(12), table.domain)));
}

TEST_F(TotalComplexTest, ModularDomainAgrees) {
    config.rank.domain = CoefficientDomain::from_tag("p32003");
    TotalComplexRunner runner(config, store, oracle);
    TotalComplexReport report = runner.run(10, 11);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.table.dimension_at(10), 0);
    EXPECT_EQ(report.table.dimension_at(11), 1);
}

TEST_F(TotalComplexTest, SecondRunLoadsStoredRanks) {
    TotalComplexRunner(config, store, oracle).run(11, 12);

    // A stored total rank is reused as is
    const CoefficientDomain domain = config.rank.domain;
    store->save_total_rank(DegreeSlice(12), Rank{0, domain, "edited"});
    TotalComplexReport again = TotalComplexRunner(config, store, oracle).run(11, 12);
    EXPECT_TRUE(again.ok());
    EXPECT_EQ(again.components.counters.computed, 0u);
    EXPECT_EQ(again.table.dimension_at(11), 2);

    config.ignore_existing = true;
    TotalComplexReport fresh = TotalComplexRunner(config, store, oracle).run(11, 12);
    EXPECT_EQ(fresh.table.dimension_at(11), 1);
    EXPECT_EQ(store->load_total_rank(DegreeSlice(12), domain)->value, 1u);
}

TEST_F(TotalComplexTest, CorruptTotalRankIsRecomputed) {
    TotalComplexRunner(config, store, oracle).run(11, 12);
    test_utils::write_text(store->total_rank_path(DegreeSlice(12), config.rank.domain), "not a rank\n");

    TotalComplexReport report = TotalComplexRunner(config, store, oracle).run(11, 12);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.table.dimension_at(11), 1);
}

TEST_F(TotalComplexTest, ExportsMergeAcrossRuns) {
    TotalComplexRunner(config, store, oracle).run(10, 11);
    TotalComplexRunner(config, store, oracle).run(7, 7);

    std::string tsv = test_utils::read_text(store->total_table_path(config.rank.domain));
    EXPECT_EQ(tsv, "family\tsub_type\tdegree\tdimension\n"
                   "ordinary\todd_edges\t7\t1\n"
                   "ordinary\todd_edges\t10\t0\n"
                   "ordinary\todd_edges\t11\t1\n");
}

TEST_F(TotalComplexTest, EmptyRangeIsRejected) {
    TotalComplexRunner runner(config, store, oracle);
    EXPECT_THROW(runner.run(5, 4), std::invalid_argument);
    EXPECT_THROW(TotalComplexRunner(config, nullptr, oracle), std::invalid_argument);
}

TEST_F(TotalComplexTest, LowDegreesAreEmpty) {
    TotalComplexReport report = TotalComplexRunner(config, store, oracle).run(0, 3);
    EXPECT_TRUE(report.ok());
    ASSERT_EQ(report.table.entries.size(), 4u);
    for (const auto& entry : report.table.entries) {
        EXPECT_EQ(entry.slice_dimension, 0u);
        EXPECT_EQ(entry.dimension, 0u);
    }
}

TEST_F(TotalComplexTest, PresetCancellationAssemblesNothing) {
    CancellationFlag cancel{true};
    TotalComplexReport report = TotalComplexRunner(config, store, oracle).run(7, 12, &cancel);
    EXPECT_TRUE(report.cancelled);
    EXPECT_FALSE(report.ok());
    EXPECT_TRUE(report.table.entries.empty());
}
