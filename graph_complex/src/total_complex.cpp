#include <graph_complex/total_complex.hpp>
#include <graph_complex/errors.hpp>
#include <graph_complex/log.hpp>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_map>

namespace graph_complex {

namespace {

const OperatorKind kTotalParts[] = {OperatorKind::Contract, OperatorKind::Delete};

std::string shape(const SparseMatrix& m) {
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

} // namespace

// =============================================================================
// SliceLayout
// =============================================================================

std::size_t SliceLayout::offset_of(const GradingKey& key) const {
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (components[i] == key) return offsets[i];
    }
    throw std::invalid_argument(key.to_string() + " is not a component of " + slice.to_string());
}

std::size_t SliceLayout::dimension_of(const GradingKey& key) const {
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (components[i] == key) return offsets[i + 1] - offsets[i];
    }
    return 0;
}

SliceLayout SliceLayout::build(const DegreeSlice& slice,
                               const std::function<std::size_t(const GradingKey&)>& dimension_of) {
    SliceLayout layout;
    layout.slice = slice;
    layout.components = slice.gradings();
    layout.offsets.push_back(0);
    for (const auto& key : layout.components) {
        layout.offsets.push_back(layout.offsets.back() + dimension_of(key));
    }
    return layout;
}

SparseMatrix assemble_total_differential(const SliceLayout& domain, const SliceLayout& target,
                                         const GraphFamily& family, const BlockLookup& block) {
    if (target.slice != domain.slice.below()) {
        throw std::invalid_argument("Total differential maps " + domain.slice.to_string() + " into " +
                                    domain.slice.below().to_string() + ", not " + target.slice.to_string());
    }

    SparseMatrix total(target.dimension(), domain.dimension());
    for (const auto& key : domain.components) {
        const std::size_t cols = domain.dimension_of(key);
        if (cols == 0) continue;
        for (OperatorKind kind : kTotalParts) {
            const GradingKey image = family.target_of(kind, key);
            const std::size_t rows = target.dimension_of(image);
            if (rows == 0) continue;
            std::optional<SparseMatrix> m = block(kind, key);
            if (!m) continue;
            if (m->rows() != rows || m->cols() != cols) {
                throw std::invalid_argument(std::string(operator_name(kind)) + " block " + shape(*m) + " out of " +
                                            key.to_string() + " does not fit " + std::to_string(rows) + "x" +
                                            std::to_string(cols));
            }
            const std::size_t row_offset = target.offset_of(image);
            const std::size_t col_offset = domain.offset_of(key);
            for (const auto& [pos, value] : m->data()) {
                total.add(row_offset + pos.first, col_offset + pos.second, value);
            }
        }
    }
    return total;
}

// =============================================================================
// Report
// =============================================================================

const TotalCheck* TotalComplexReport::check(int degree) const {
    for (const auto& c : checks) {
        if (c.slice.degree() == degree) return &c;
    }
    return nullptr;
}

bool TotalComplexReport::ok() const {
    if (cancelled || !failures.empty() || !components.ok()) return false;
    return std::none_of(checks.begin(), checks.end(), [](const TotalCheck& c) {
        return c.outcome == CheckOutcome::Failed;
    });
}

// =============================================================================
// TotalComplexRunner
// =============================================================================

TotalComplexRunner::TotalComplexRunner(EngineConfig config, std::shared_ptr<PersistentStore> store,
                                       std::shared_ptr<const GraphOracle> oracle)
    : TotalComplexRunner(config, std::move(store), std::move(oracle),
                         std::make_shared<RankComputationEngine>(config.rank)) {}

TotalComplexRunner::TotalComplexRunner(EngineConfig config, std::shared_ptr<PersistentStore> store,
                                       std::shared_ptr<const GraphOracle> oracle,
                                       std::shared_ptr<const RankComputationEngine> engine)
    : config_(std::move(config)), store_(std::move(store)), oracle_(std::move(oracle)),
      family_(make_family(ComplexFamily::Ordinary)), engine_(std::move(engine)) {
    if (!store_ || !oracle_ || !engine_) {
        throw std::invalid_argument("TotalComplexRunner requires a store, an oracle and a rank engine");
    }
}

Rank TotalComplexRunner::total_rank(const DegreeSlice& slice, const SparseMatrix& differential,
                                    const CancellationFlag* cancel) {
    const CoefficientDomain domain = config_.rank.domain;
    if (differential.is_zero()) return Rank{0, domain, "trivial"};

    auto lock = store_->lock_cell("total/" + slice.to_string() + "/" + domain.tag());
    if (!config_.ignore_existing) {
        try {
            if (auto stored = store_->load_total_rank(slice, domain)) {
                if (stored->value <= std::min(differential.rows(), differential.cols())) return *stored;
                GC_LOG_WARN("[total] stored rank %zu exceeds the %s differential out of %s; recomputing",
                            stored->value, shape(differential).c_str(), slice.to_string().c_str());
            }
        } catch (const StoreCorruptionError& e) {
            GC_LOG_WARN("[total] %s: %s; recomputing", slice.to_string().c_str(), e.what());
        }
    }

    Rank rank = engine_->compute(differential, domain, cancel);
    store_->save_total_rank(slice, rank);
    return rank;
}

TotalComplexReport TotalComplexRunner::run(int min_degree, int max_degree, const CancellationFlag* cancel) {
    if (min_degree > max_degree) {
        throw std::invalid_argument("Empty degree range " + std::to_string(min_degree) + ":" +
                                    std::to_string(max_degree));
    }

    TotalComplexReport report;
    report.table.domain = config_.rank.domain;
    const auto cancelled = [cancel] { return cancel && cancel->load(); };

    // Bases and blocks of every slice the differentials touch
    ComputationRequest request;
    request.stages = {Stage::Basis, Stage::Operator};
    request.differentials = {OperatorKind::Contract, OperatorKind::Delete};
    for (int d = min_degree; d <= max_degree + 1; ++d) {
        for (const auto& key : DegreeSlice(d).gradings()) {
            if (family_->is_valid(key)) request.keys.push_back(key);
        }
    }
    GC_LOG_INFO("[total] degrees %d..%d over %s: %zu component gradings", min_degree, max_degree,
                config_.rank.domain.tag().c_str(), request.keys.size());
    if (!request.keys.empty()) {
        JobScheduler scheduler(config_, store_, oracle_, family_, engine_);
        report.components = scheduler.run(request, cancel);
    }
    if (report.components.cancelled || cancelled()) {
        report.cancelled = true;
        return report;
    }
    if (!report.components.ok()) {
        GC_LOG_ERROR("[total] component cells failed; no total cohomology assembled");
        return report;
    }

    std::unordered_map<GradingKey, std::size_t> dimensions;
    const auto dimension_of = [&](const GradingKey& key) -> std::size_t {
        if (!family_->is_valid(key)) return 0;
        auto it = dimensions.find(key);
        if (it != dimensions.end()) return it->second;
        auto basis = store_->load_basis(key);
        if (!basis) throw NotBuiltError(key.to_string() + " has no stored basis");
        dimensions.emplace(key, basis->size());
        return basis->size();
    };
    const BlockLookup block = [&](OperatorKind kind, const GradingKey& domain) -> std::optional<SparseMatrix> {
        const GradingKey target = family_->target_of(kind, domain);
        if (!family_->is_valid(domain) || !family_->is_valid(target)) return std::nullopt;
        auto m = store_->load_matrix(OperatorId{kind, domain, target});
        if (!m) throw NotBuiltError(OperatorId{kind, domain, target}.to_string() + " has no stored matrix");
        return m;
    };

    std::map<int, SliceLayout> layouts;
    std::map<int, SparseMatrix> differentials;
    std::map<int, std::size_t> ranks;
    try {
        for (int d = min_degree - 1; d <= max_degree + 1; ++d) {
            layouts.emplace(d, SliceLayout::build(DegreeSlice(d), dimension_of));
        }
        for (int d = min_degree; d <= max_degree + 1; ++d) {
            differentials.emplace(d, assemble_total_differential(layouts.at(d), layouts.at(d - 1), *family_, block));
        }
    } catch (const GraphComplexError& e) {
        report.failures.push_back(CellFailure{"total", Stage::Operator, e.category(), e.what(), "", false});
        return report;
    }

    for (int d = min_degree; d <= max_degree + 1; ++d) {
        const DegreeSlice slice(d);
        try {
            ranks[d] = total_rank(slice, differentials.at(d), cancel).value;
        } catch (const RankSolverError& e) {
            if (e.kind() == SolverFailure::Cancelled) {
                report.cancelled = true;
                return report;
            }
            report.failures.push_back(CellFailure{slice.to_string(), Stage::Rank, e.category(), e.what(), "", false});
        } catch (const GraphComplexError& e) {
            report.failures.push_back(CellFailure{slice.to_string(), Stage::Rank, e.category(), e.what(), "", false});
        }
    }

    for (int d = min_degree; d <= max_degree; ++d) {
        TotalCheck check;
        check.slice = DegreeSlice(d);
        const SparseMatrix& first = differentials.at(d + 1);
        const SparseMatrix& second = differentials.at(d);
        if (first.is_zero() || second.is_zero()) {
            check.outcome = CheckOutcome::Trivial;
        } else {
            SparseMatrix product = multiply(second, first, config_.rank.domain);
            check.residual_entries = product.nnz();
            check.outcome = product.is_zero() ? CheckOutcome::Passed : CheckOutcome::Failed;
            if (check.outcome == CheckOutcome::Failed) {
                check.message = std::to_string(check.residual_entries) + " nonzero entries";
                GC_LOG_WARN("validation violation: total square_zero at %s has %zu nonzero entries",
                            check.slice.to_string().c_str(), check.residual_entries);
            }
        }
        report.checks.push_back(check);
    }

    for (int d = min_degree; d <= max_degree; ++d) {
        const DegreeSlice slice(d);
        if (!ranks.count(d) || !ranks.count(d + 1)) {
            const DegreeSlice missing = ranks.count(d) ? slice.above() : slice;
            report.failures.push_back(
                CellFailure{slice.to_string(), Stage::Cohomology, "", "", missing.to_string(), true});
            continue;
        }
        try {
            report.table.entries.push_back(
                assembler_.assemble(slice, layouts.at(d).dimension(), ranks.at(d), ranks.at(d + 1)));
        } catch (const CohomologyAssemblyError& e) {
            report.failures.push_back(
                CellFailure{slice.to_string(), Stage::Cohomology, e.category(), e.what(), "", false});
        }
    }

    store_->export_total_table(report.table);
    GC_LOG_INFO("[total] done: %zu entries, %zu failures", report.table.entries.size(), report.failures.size());
    return report;
}

} // namespace graph_complex
