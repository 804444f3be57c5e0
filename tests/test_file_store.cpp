#include <gtest/gtest.h>
#include <graph_complex/errors.hpp>
#include <graph_complex/store.hpp>
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

using namespace graph_complex;
namespace fs = std::filesystem;

class FileStoreTest : public ::testing::Test {
protected:
    test_utils::TempDir dir;
    FileStore store{dir.path()};
    CoefficientDomain q = CoefficientDomain::rational();

    GradingKey k4_key = GradingKey::ordinary(4, 3, EdgeParity::Odd);
    OperatorId contract{OperatorKind::Contract, GradingKey::ordinary(7, 5, EdgeParity::Odd),
                        GradingKey::ordinary(6, 5, EdgeParity::Odd)};

    Basis k4_basis() {
        Graph k4 = test_utils::complete_graph(4);
        return Basis(k4_key, {GraphGenerator{k4, k4.to_g6()}});
    }

    std::size_t count_files(const std::string& needle) {
        std::size_t n = 0;
        for (const auto& entry : fs::recursive_directory_iterator(dir.path())) {
            if (entry.path().filename().string().find(needle) != std::string::npos) ++n;
        }
        return n;
    }
};

// === LAYOUT ===

TEST_F(FileStoreTest, PathsFollowLayout) {
    EXPECT_EQ(store.basis_path(k4_key), dir.path() / "ordinary" / "odd_edges" / "basis" / "gra4_3.g6");
    EXPECT_EQ(store.matrix_path(contract), dir.path() / "ordinary" / "odd_edges" / "contract_edges" / "D7_5.sms");
    EXPECT_EQ(store.rank_path(contract, CoefficientDomain::prime(32003)),
              dir.path() / "ordinary" / "odd_edges" / "contract_edges" / "D7_5.rank.p32003.txt");
    CheckId check{CheckKind::AntiCommute, OperatorKind::Contract, OperatorKind::Delete, k4_key};
    EXPECT_EQ(store.finding_path(check, q),
              dir.path() / "ordinary" / "odd_edges" / "contract_edges" / "checks" / "anti_commute_delete_4_3.Q.txt");
    EXPECT_EQ(store.cohomology_path(OperatorKind::Contract, k4_key, q),
              dir.path() / "ordinary" / "odd_edges" / "contract_edges" / "cohomology" / "H4_3.Q.txt");
    auto hairy = GradingKey::hairy(1, 0, 3, EdgeParity::Even, EdgeParity::Odd);
    EXPECT_EQ(store.basis_path(hairy), dir.path() / "hairy" / "even_edges_odd_hairs" / "basis" / "gra1_0_3.g6");
    EXPECT_THROW(FileStore(""), std::invalid_argument);
}

// === ROUND TRIPS ===

TEST_F(FileStoreTest, AbsentEntriesLoadAsNothing) {
    EXPECT_FALSE(store.load_basis(k4_key).has_value());
    EXPECT_FALSE(store.load_matrix(contract).has_value());
    EXPECT_FALSE(store.load_rank(contract, q).has_value());
    EXPECT_FALSE(store.load_cohomology(OperatorKind::Contract, k4_key, q).has_value());
}

TEST_F(FileStoreTest, BasisRoundTrip) {
    store.save_basis(k4_basis());
    EXPECT_EQ(test_utils::read_text(store.basis_path(k4_key)), "1\nC~\n");
    auto loaded = store.load_basis(k4_key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, k4_basis());

    Basis empty(GradingKey::ordinary(5, 4, EdgeParity::Odd), {});
    store.save_basis(empty);
    auto loaded_empty = store.load_basis(empty.key());
    ASSERT_TRUE(loaded_empty.has_value());
    EXPECT_TRUE(loaded_empty->empty());
}

TEST_F(FileStoreTest, MatrixRankAndCohomologyRoundTrip) {
    store.save_matrix(contract, test_utils::toy_matrix());
    EXPECT_EQ(*store.load_matrix(contract), test_utils::toy_matrix());

    store.save_rank(contract, Rank{2, q, "elimination"});
    auto rank = store.load_rank(contract, q);
    ASSERT_TRUE(rank.has_value());
    EXPECT_EQ(rank->value, 2u);
    EXPECT_EQ(rank->backend, "elimination");
    EXPECT_FALSE(store.load_rank(contract, CoefficientDomain::prime(32003)).has_value());

    CohomologyEntry entry{k4_key, OperatorKind::Contract, 1, 0, 0, 1};
    store.save_cohomology(entry, q);
    EXPECT_EQ(*store.load_cohomology(OperatorKind::Contract, k4_key, q), entry);
}

TEST_F(FileStoreTest, FindingRoundTrip) {
    ValidationFinding finding;
    finding.id = CheckId{CheckKind::SquareZero, OperatorKind::Contract, OperatorKind::Contract, k4_key};
    finding.outcome = CheckOutcome::Failed;
    finding.residual_entries = 3;
    finding.message = "three residual entries";
    store.save_finding(finding, q);
    auto loaded = store.load_finding(finding.id, q);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->id, finding.id);
    EXPECT_EQ(loaded->outcome, CheckOutcome::Failed);
    EXPECT_EQ(loaded->residual_entries, 3u);
    EXPECT_EQ(loaded->message, finding.message);
}

TEST_F(FileStoreTest, RankWithoutBackendLoadsAsStore) {
    test_utils::write_text(store.rank_path(contract, q), "4 Q\n");
    EXPECT_EQ(store.load_rank(contract, q)->backend, "store");
}

// === CORRUPTION ===

TEST_F(FileStoreTest, CorruptBasisFilesAreDetected) {
    const std::vector<std::string> broken{
        "",
        "x\nC~\n",
        "2\nC~\n",          // count mismatch
        "1\nC~\nC~\n",
        "1\n!!\n",          // undecodable
        "1\nCs\n",          // wrong edge count
        "1\n\n",
    };
    for (const auto& text : broken) {
        test_utils::write_text(store.basis_path(k4_key), text);
        EXPECT_THROW(store.load_basis(k4_key), StoreCorruptionError) << text;
    }
}

TEST_F(FileStoreTest, UnsortedBasisIsCorrupt) {
    auto key = GradingKey::ordinary(6, 4, EdgeParity::Odd);
    Graph a = test_utils::prism();
    Graph b = test_utils::k33();
    std::string first = std::max(a.to_g6(), b.to_g6());
    std::string second = std::min(a.to_g6(), b.to_g6());
    test_utils::write_text(store.basis_path(key), "2\n" + first + "\n" + second + "\n");
    EXPECT_THROW(store.load_basis(key), StoreCorruptionError);
}

TEST_F(FileStoreTest, CorruptRanksAndCohomologyAreDetected) {
    for (const std::string& text : {"", "two Q\n", "2\n", "2 p7\n", "2 Q backend extra\n", "-1 Q\n"}) {
        test_utils::write_text(store.rank_path(contract, q), text);
        EXPECT_THROW(store.load_rank(contract, q), StoreCorruptionError) << text;
    }
    for (const std::string& text : {"1 1 0 0\n", "2 1 0 0 Q\n", "0 1 2 0 Q\n", "1 1 0 0 p5\n"}) {
        test_utils::write_text(store.cohomology_path(OperatorKind::Contract, k4_key, q), text);
        EXPECT_THROW(store.load_cohomology(OperatorKind::Contract, k4_key, q), StoreCorruptionError) << text;
    }
    test_utils::write_text(store.matrix_path(contract), "2 3 M\n1 1 1\n");
    EXPECT_THROW(store.load_matrix(contract), StoreCorruptionError);
}

TEST_F(FileStoreTest, CorruptFindingsAreDetected) {
    CheckId id{CheckKind::SquareZero, OperatorKind::Contract, OperatorKind::Contract, k4_key};
    for (const std::string& text : {"", "maybe 0\n", "passed\n", "passed x\n", "passed 0 0\n"}) {
        test_utils::write_text(store.finding_path(id, q), text);
        EXPECT_THROW(store.load_finding(id, q), StoreCorruptionError) << text;
    }
}

// === PUBLICATION ===

TEST_F(FileStoreTest, AtomicWritesLeaveNoTemporaries) {
    store.save_basis(k4_basis());
    store.save_matrix(contract, test_utils::toy_matrix());
    store.save_matrix(contract, test_utils::toy_matrix());
    EXPECT_EQ(count_files(".tmp."), 0u);
    write_file_atomically(dir.path() / "deep" / "nested" / "file.txt", "content");
    EXPECT_EQ(test_utils::read_text(dir.path() / "deep" / "nested" / "file.txt"), "content");
}

TEST_F(FileStoreTest, ConcurrentReadersNeverSeePartialFiles) {
    const fs::path path = dir.path() / "shared.txt";
    const std::string small(10, 'a');
    const std::string large(200000, 'b');
    write_file_atomically(path, small);
    std::atomic<bool> stop{false};
    std::atomic<std::size_t> torn{0};
    std::thread reader([&] {
        while (!stop.load()) {
            std::string seen = test_utils::read_text(path);
            if (seen != small && seen != large) ++torn;
        }
    });
    for (int i = 0; i < 50; ++i) {
        write_file_atomically(path, i % 2 ? small : large);
    }
    stop.store(true);
    reader.join();
    EXPECT_EQ(torn.load(), 0u);
}

TEST_F(FileStoreTest, ExportWritesTsvPerDomain) {
    CohomologyTable table;
    table.domain = q;
    store.export_table(table);
    EXPECT_FALSE(fs::exists(store.table_path(OperatorKind::Contract, k4_key, q)));

    table.entries.push_back(CohomologyEntry{k4_key, OperatorKind::Contract, 1, 0, 0, 1});
    store.export_table(table);
    std::string text = test_utils::read_text(store.table_path(OperatorKind::Contract, k4_key, q));
    EXPECT_NE(text.find("ordinary\todd_edges\t4\t3\t0\t1"), std::string::npos);
}

TEST_F(FileStoreTest, ExportMergesWithEarlierRows) {
    const GradingKey wheel5 = GradingKey::ordinary(6, 5, EdgeParity::Odd);
    const GradingKey empty = GradingKey::ordinary(5, 4, EdgeParity::Odd);
    const fs::path path = store.table_path(OperatorKind::Contract, k4_key, q);

    CohomologyTable wide;
    wide.domain = q;
    wide.entries = {CohomologyEntry{k4_key, OperatorKind::Contract, 1, 0, 0, 1},
                    CohomologyEntry{empty, OperatorKind::Contract, 0, 0, 0, 0},
                    CohomologyEntry{wheel5, OperatorKind::Contract, 2, 1, 0, 1}};
    store.export_table(wide);

    CohomologyTable narrow;
    narrow.domain = q;
    narrow.entries = {CohomologyEntry{empty, OperatorKind::Contract, 3, 1, 0, 2}};
    store.export_table(narrow);

    EXPECT_EQ(test_utils::read_text(path),
              "family\tsub_type\tvertices\tloops\thairs\tdimension\n"
              "ordinary\todd_edges\t4\t3\t0\t1\n"
              "ordinary\todd_edges\t5\t4\t0\t2\n"
              "ordinary\todd_edges\t6\t5\t0\t1\n");
}

TEST_F(FileStoreTest, UnreadableExportIsRewritten) {
    const fs::path path = store.table_path(OperatorKind::Contract, k4_key, q);
    test_utils::write_text(path, "not a table\n");
    CohomologyTable table;
    table.domain = q;
    table.entries = {CohomologyEntry{k4_key, OperatorKind::Contract, 1, 0, 0, 1}};
    store.export_table(table);
    EXPECT_EQ(test_utils::read_text(path),
              "family\tsub_type\tvertices\tloops\thairs\tdimension\n"
              "ordinary\todd_edges\t4\t3\t0\t1\n");
}

// === CELL LOCKS ===

TEST_F(FileStoreTest, CellLocksSerializeSameCellOnly) {
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            auto lock = store.lock_cell("basis/k4");
            int now = ++inside;
            int prev = max_inside.load();
            while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --inside;
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(max_inside.load(), 1);

    auto a = store.lock_cell("cell/a");
    auto b = store.lock_cell("cell/b");
    EXPECT_TRUE(a.owns_lock());
    EXPECT_TRUE(b.owns_lock());
}

TEST_F(FileStoreTest, ReleasedCellLocksAreForgotten) {
    for (int i = 0; i < 10000; ++i) {
        auto lock = store.lock_cell("rank/contract/Q/ordinary/odd_edges(v=" + std::to_string(i) + ",l=5)");
        ASSERT_TRUE(lock.owns_lock());
    }
    EXPECT_EQ(store.active_cell_locks(), 0u);

    std::atomic<bool> acquired{false};
    std::thread waiter;
    {
        auto held = store.lock_cell("basis/k4");
        auto moved = std::move(held);
        EXPECT_TRUE(moved.owns_lock());
        waiter = std::thread([&] {
            auto lock = store.lock_cell("basis/k4");
            acquired.store(true);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_FALSE(acquired.load());
        EXPECT_EQ(store.active_cell_locks(), 1u);
    }
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(store.active_cell_locks(), 0u);
}
