#include <graph_complex/scheduler.hpp>
#include <graph_complex/errors.hpp>
#include <graph_complex/log.hpp>
#include <job_system/job_system.hpp>
#include <algorithm>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace graph_complex {

// =============================================================================
// GradingRange / RunReport
// =============================================================================

std::vector<GradingKey> GradingRange::keys() const {
    if (min_vertices > max_vertices || min_loops > max_loops || min_hairs > max_hairs) {
        throw std::invalid_argument("Empty grading range");
    }
    std::vector<GradingKey> result;
    for (int l = min_loops; l <= max_loops; ++l) {
        for (int v = min_vertices; v <= max_vertices; ++v) {
            if (family == ComplexFamily::Ordinary) {
                result.push_back(GradingKey::ordinary(v, l, edge_parity));
                continue;
            }
            for (int h = min_hairs; h <= max_hairs; ++h) {
                result.push_back(GradingKey::hairy(v, l, h, edge_parity, hair_parity));
            }
        }
    }
    return result;
}

const CohomologyTable* RunReport::table(OperatorKind differential) const {
    for (const auto& t : tables) {
        if (t.differential == differential) return &t;
    }
    return nullptr;
}

bool RunReport::ok() const {
    if (cancelled || !failures.empty()) return false;
    return std::none_of(findings.begin(), findings.end(), [](const ValidationFinding& f) {
        return f.outcome == CheckOutcome::Failed;
    });
}

// =============================================================================
// Cells
// =============================================================================

namespace {

enum class CellState {
    Waiting,
    Done,
    Failed,
    Skipped,
    Cancelled
};

enum class Outcome {
    Computed,
    Loaded,
    Trivial
};

// Store lookup; a corrupt or inconsistent entry reads as absent.
template<typename T, typename Load>
std::optional<T> load_or_discard(const std::string& cell_id, bool& corrupted, Load&& load) {
    try {
        return load();
    } catch (const StoreCorruptionError& e) {
        GC_LOG_WARN("[scheduler] %s: %s; recomputing", cell_id.c_str(), e.what());
        corrupted = true;
        return std::nullopt;
    }
}

template<typename T>
const T& require(const std::shared_ptr<const T>& artifact, const std::string& cell_id) {
    if (!artifact) throw NotBuiltError(cell_id + " produced nothing");
    return *artifact;
}

long clamp_priority(std::size_t work) {
    return static_cast<long>(std::min<std::size_t>(work, std::numeric_limits<long>::max()));
}

} // namespace

struct JobScheduler::Cell {
    std::string id;
    Stage stage = Stage::Basis;
    GradingKey key;
    OperatorKind kind = OperatorKind::Contract;
    OperatorKind second = OperatorKind::Contract;
    CheckKind check = CheckKind::SquareZero;

    /**
     * Positional, per stage:
     *   Operator:   basis(domain), basis(target)
     *   Rank:       operator
     *   Validate:   square zero: d(key), d(target); anti-commute:
     *               d1(key), d2(d1 target), d2(key), d1(d2 target)
     *   Cohomology: basis(key), rank(out of key), rank(into key)
     */
    std::vector<Cell*> dependencies;
    std::vector<Cell*> dependents;
    std::atomic<std::size_t> pending{0};

    CellState state = CellState::Waiting;
    bool trivial = false;
    bool corrupted = false;
    std::string upstream;

    std::shared_ptr<const Basis> basis;
    std::shared_ptr<const SparseMatrix> matrix;
    OperatorId op;
    Rank rank;
    std::optional<ValidationFinding> finding;
    CohomologyEntry entry;
};

struct JobScheduler::RunState {
    const GraphFamily& family;
    CoefficientDomain domain;
    bool ignore_existing;
    job_system::JobSystem<Stage> jobs;

    std::map<std::string, std::unique_ptr<Cell>> cells;

    std::mutex mutex;
    RunCounters counters;
    std::vector<CellFailure> failures;

    RunState(const GraphFamily& f, CoefficientDomain d, bool ignore, std::size_t threads)
        : family(f), domain(d), ignore_existing(ignore), jobs(threads) {}

    Cell* find_or_add(const std::string& id, Stage stage, const GradingKey& key, bool& created) {
        auto& slot = cells[id];
        created = !slot;
        if (created) {
            slot = std::make_unique<Cell>();
            slot->id = id;
            slot->stage = stage;
            slot->key = key;
        }
        return slot.get();
    }

    void depend(Cell* cell, Cell* dependency) {
        cell->dependencies.push_back(dependency);
        dependency->dependents.push_back(cell);
    }

    Cell* basis(const GradingKey& key) {
        bool created = false;
        return find_or_add(std::string("basis/") + key.to_string(), Stage::Basis, key, created);
    }

    Cell* op(OperatorKind kind, const GradingKey& key) {
        bool created = false;
        Cell* cell = find_or_add(std::string("operator/") + operator_name(kind) + "/" + key.to_string(),
                                 Stage::Operator, key, created);
        if (created) {
            cell->kind = kind;
            depend(cell, basis(key));
            depend(cell, basis(family.target_of(kind, key)));
        }
        return cell;
    }

    Cell* rank(OperatorKind kind, const GradingKey& key) {
        bool created = false;
        Cell* cell = find_or_add(std::string("rank/") + operator_name(kind) + "/" + domain.tag() + "/" +
                                 key.to_string(), Stage::Rank, key, created);
        if (created) {
            cell->kind = kind;
            depend(cell, op(kind, key));
        }
        return cell;
    }

    Cell* square_zero(OperatorKind kind, const GradingKey& key) {
        bool created = false;
        Cell* cell = find_or_add(std::string("check/") + check_name(CheckKind::SquareZero) + "/" +
                                 operator_name(kind) + "/" + domain.tag() + "/" + key.to_string(),
                                 Stage::Validate, key, created);
        if (created) {
            cell->kind = cell->second = kind;
            cell->check = CheckKind::SquareZero;
            depend(cell, op(kind, key));
            depend(cell, op(kind, family.target_of(kind, key)));
        }
        return cell;
    }

    Cell* anti_commute(const AntiCommuteRequest& request, const GradingKey& key) {
        const CheckKind check = request.commute ? CheckKind::Commute : CheckKind::AntiCommute;
        bool created = false;
        Cell* cell = find_or_add(std::string("check/") + check_name(check) + "/" + operator_name(request.first) +
                                 "," + operator_name(request.second) + "/" + domain.tag() + "/" + key.to_string(),
                                 Stage::Validate, key, created);
        if (created) {
            cell->kind = request.first;
            cell->second = request.second;
            cell->check = check;
            depend(cell, op(request.first, key));
            depend(cell, op(request.second, family.target_of(request.first, key)));
            depend(cell, op(request.second, key));
            depend(cell, op(request.first, family.target_of(request.second, key)));
        }
        return cell;
    }

    Cell* cohomology(OperatorKind kind, const GradingKey& key) {
        bool created = false;
        Cell* cell = find_or_add(std::string("cohomology/") + operator_name(kind) + "/" + domain.tag() + "/" +
                                 key.to_string(), Stage::Cohomology, key, created);
        if (created) {
            cell->kind = kind;
            depend(cell, basis(key));
            depend(cell, rank(kind, key));
            depend(cell, rank(kind, family.source_of(kind, key)));
        }
        return cell;
    }

    void count(Cell& cell, Outcome outcome) {
        std::lock_guard<std::mutex> lock(mutex);
        switch (outcome) {
            case Outcome::Computed:
                ++counters.computed;
                if (cell.corrupted) ++counters.recomputed_after_corruption;
                break;
            case Outcome::Loaded: ++counters.loaded; break;
            case Outcome::Trivial: ++counters.trivial; break;
        }
        cell.trivial = outcome == Outcome::Trivial;
        cell.state = CellState::Done;
    }

    void fail(Cell& cell, const std::string& category, const std::string& message) {
        GC_LOG_ERROR("[scheduler] %s failed: %s", cell.id.c_str(), message.c_str());
        std::lock_guard<std::mutex> lock(mutex);
        ++counters.failed;
        failures.push_back(CellFailure{cell.id, cell.stage, category, message, "", false});
        cell.state = CellState::Failed;
    }

    void skip(Cell& cell) {
        GC_LOG_WARN("[scheduler] %s skipped: %s did not complete", cell.id.c_str(), cell.upstream.c_str());
        std::lock_guard<std::mutex> lock(mutex);
        ++counters.skipped;
        failures.push_back(CellFailure{cell.id, cell.stage, "Skipped", "dependency did not complete",
                                       cell.upstream, true});
        cell.state = CellState::Skipped;
    }

    void cancel(Cell& cell) {
        std::lock_guard<std::mutex> lock(mutex);
        ++counters.cancelled;
        cell.state = CellState::Cancelled;
    }
};

// =============================================================================
// JobScheduler
// =============================================================================

JobScheduler::JobScheduler(EngineConfig config, std::shared_ptr<PersistentStore> store,
                           std::shared_ptr<const GraphOracle> oracle, std::shared_ptr<const GraphFamily> family)
    : JobScheduler(config, std::move(store), std::move(oracle), std::move(family),
                   std::make_shared<RankComputationEngine>(config.rank)) {}

JobScheduler::JobScheduler(EngineConfig config, std::shared_ptr<PersistentStore> store,
                           std::shared_ptr<const GraphOracle> oracle, std::shared_ptr<const GraphFamily> family,
                           std::shared_ptr<const RankComputationEngine> engine)
    : config_(std::move(config)), store_(std::move(store)), oracle_(oracle), family_(family),
      engine_(std::move(engine)), basis_builder_(oracle, family), operator_builder_(oracle, family) {
    if (!store_ || !oracle_ || !family_ || !engine_) {
        throw std::invalid_argument("JobScheduler requires a store, an oracle, a family and a rank engine");
    }
}

void JobScheduler::plan(RunState& state, const ComputationRequest& request) const {
    const auto wants = [&request](Stage stage) { return request.stages.count(stage) > 0; };

    for (const auto& key : request.keys) {
        if (key.family() != family_->id()) {
            throw std::invalid_argument(key.to_string() + " does not belong to the " +
                                        family_name(family_->id()) + " family");
        }
        for (OperatorKind kind : request.differentials) {
            if (!family_->supports(kind, key)) {
                throw std::invalid_argument(std::string(operator_name(kind)) + " is not defined on " +
                                            key.to_string());
            }
        }
        for (const auto& pair : request.anti_commute) {
            if (pair.first == pair.second || !family_->supports(pair.first, key) ||
                !family_->supports(pair.second, key)) {
                throw std::invalid_argument(std::string("Cannot check ") + operator_name(pair.first) + " against " +
                                            operator_name(pair.second) + " on " + key.to_string());
            }
            GradingKey a = family_->target_of(pair.second, family_->target_of(pair.first, key));
            GradingKey b = family_->target_of(pair.first, family_->target_of(pair.second, key));
            if (a != b) {
                throw std::invalid_argument(std::string(operator_name(pair.first)) + " and " +
                                            operator_name(pair.second) + " do not meet from " + key.to_string());
            }
        }
    }

    for (const auto& key : request.keys) {
        if (wants(Stage::Basis)) state.basis(key);
        for (OperatorKind kind : request.differentials) {
            if (wants(Stage::Operator)) state.op(kind, key);
            if (wants(Stage::Rank)) state.rank(kind, key);
            if (wants(Stage::Validate)) state.square_zero(kind, key);
            if (wants(Stage::Cohomology)) state.cohomology(kind, key);
        }
        if (wants(Stage::Validate)) {
            for (const auto& pair : request.anti_commute) state.anti_commute(pair, key);
        }
    }

    for (auto& [id, cell] : state.cells) {
        cell->pending.store(cell->dependencies.size());
    }
}

long JobScheduler::priority_of(const Cell& cell) const {
    switch (cell.stage) {
        case Stage::Basis:
            return clamp_priority(family_->work_estimate(cell.key));
        case Stage::Operator: {
            const auto& domain = cell.dependencies[0]->basis;
            if (!domain || !family_->is_valid(cell.key)) return 0;
            return clamp_priority(domain->size() * family_->num_edges(cell.key));
        }
        case Stage::Rank:
        case Stage::Validate: {
            std::size_t work = 0;
            for (const Cell* dep : cell.dependencies) {
                if (dep->matrix) work += dep->matrix->nnz();
            }
            return clamp_priority(work);
        }
        case Stage::Cohomology:
            return 0;
    }
    return 0;
}

RunReport JobScheduler::run(const ComputationRequest& request, const CancellationFlag* external_cancel) {
    if (external_cancel && external_cancel->load()) cancel_.store(true);
    RunState state(*family_, config_.rank.domain, config_.ignore_existing, config_.jobs);
    plan(state, request);

    GC_LOG_INFO("[scheduler] %zu cells over %zu gradings, domain %s, %zu workers", state.cells.size(),
                request.keys.size(), state.domain.tag().c_str(), state.jobs.get_num_workers());

    if (!state.cells.empty()) {
        state.jobs.start();
        for (auto& [id, cell] : state.cells) {
            if (cell->dependencies.empty()) {
                Cell* ready = cell.get();
                state.jobs.submit_function([this, &state, ready]() { execute(state, *ready); },
                                           ready->stage, priority_of(*ready));
            }
        }
        state.jobs.wait_for_completion_with_abort([this, external_cancel]() {
            if (external_cancel && external_cancel->load() && !cancel_.load()) {
                GC_LOG_WARN("[scheduler] cancellation requested");
                cancel_.store(true);
            }
            return false;
        });
        state.jobs.shutdown();

        if (state.jobs.has_error()) {
            cancel_.store(false);
            throw std::runtime_error(std::string("Worker pool failed: ") + state.jobs.get_error_description() +
                                     ": " + state.jobs.get_error_message());
        }
    }

    RunReport report = collect(state, request);
    cancel_.store(false);
    GC_LOG_INFO("[scheduler] done: %zu computed, %zu loaded, %zu trivial, %zu failed, %zu skipped, %zu cancelled",
                report.counters.computed, report.counters.loaded, report.counters.trivial,
                report.counters.failed, report.counters.skipped, report.counters.cancelled);
    return report;
}

void JobScheduler::execute(RunState& state, Cell& cell) {
    if (cancel_.load()) {
        state.cancel(cell);
    } else if (!cell.upstream.empty()) {
        if (cell.stage == Stage::Validate) {
            cell.finding = ComplexValidator::inconclusive(
                CheckId{cell.check, cell.kind, cell.second, cell.key}, cell.upstream + " did not complete");
        }
        state.skip(cell);
    } else {
        try {
            run_cell(state, cell);
        } catch (const RankSolverError& e) {
            if (e.kind() == SolverFailure::Cancelled) {
                state.cancel(cell);
            } else {
                state.fail(cell, e.category(), e.what());
            }
        } catch (const GraphComplexError& e) {
            state.fail(cell, e.category(), e.what());
        } catch (const std::exception& e) {
            state.fail(cell, "Internal error", e.what());
        }
    }
    finish(state, cell);
}

void JobScheduler::finish(RunState& state, Cell& cell) {
    const bool incomplete = cell.state != CellState::Done;
    for (Cell* dependent : cell.dependents) {
        if (incomplete && cell.state != CellState::Cancelled) {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (dependent->upstream.empty()) {
                dependent->upstream = cell.state == CellState::Skipped ? cell.upstream : cell.id;
            }
        }
        if (dependent->pending.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            state.jobs.submit_function([this, &state, dependent]() { execute(state, *dependent); },
                                       dependent->stage, priority_of(*dependent));
        }
    }
}

void JobScheduler::run_cell(RunState& state, Cell& cell) {
    switch (cell.stage) {
        case Stage::Basis: run_basis(state, cell); break;
        case Stage::Operator: run_operator(state, cell); break;
        case Stage::Rank: run_rank(state, cell); break;
        case Stage::Validate: run_validate(state, cell); break;
        case Stage::Cohomology: run_cohomology(state, cell); break;
    }
}

// =============================================================================
// Stages
// =============================================================================

void JobScheduler::run_basis(RunState& state, Cell& cell) {
    if (!family_->is_valid(cell.key)) {
        cell.basis = std::make_shared<const Basis>(cell.key, std::vector<GraphGenerator>{});
        state.count(cell, Outcome::Trivial);
        return;
    }

    auto lock = store_->lock_cell(cell.id);
    if (!state.ignore_existing) {
        auto stored = load_or_discard<Basis>(cell.id, cell.corrupted, [&] { return store_->load_basis(cell.key); });
        if (stored) {
            GC_DEBUG_LOG("[scheduler] loaded %s", cell.id.c_str());
            cell.basis = std::make_shared<const Basis>(std::move(*stored));
            state.count(cell, Outcome::Loaded);
            return;
        }
    }

    Basis basis = basis_builder_.build(cell.key);
    store_->save_basis(basis);
    cell.basis = std::make_shared<const Basis>(std::move(basis));
    state.count(cell, Outcome::Computed);
}

void JobScheduler::run_operator(RunState& state, Cell& cell) {
    const Basis& domain = require(cell.dependencies[0]->basis, cell.dependencies[0]->id);
    const Basis& target = require(cell.dependencies[1]->basis, cell.dependencies[1]->id);
    cell.op = OperatorId{cell.kind, domain.key(), target.key()};

    if (!family_->is_valid(domain.key()) || !family_->is_valid(target.key())) {
        cell.matrix = std::make_shared<const SparseMatrix>(target.size(), domain.size());
        state.count(cell, Outcome::Trivial);
        return;
    }

    auto lock = store_->lock_cell(cell.id);
    if (!state.ignore_existing) {
        auto stored = load_or_discard<SparseMatrix>(cell.id, cell.corrupted, [&]() -> std::optional<SparseMatrix> {
            auto m = store_->load_matrix(cell.op);
            if (m && (m->rows() != target.size() || m->cols() != domain.size())) {
                throw StoreCorruptionError(cell.id, "stored shape " + std::to_string(m->rows()) + "x" +
                                           std::to_string(m->cols()) + " does not match bases " +
                                           std::to_string(target.size()) + "x" + std::to_string(domain.size()));
            }
            return m;
        });
        if (stored) {
            GC_DEBUG_LOG("[scheduler] loaded %s", cell.id.c_str());
            cell.matrix = std::make_shared<const SparseMatrix>(std::move(*stored));
            state.count(cell, Outcome::Loaded);
            return;
        }
    }

    SparseMatrix matrix = operator_builder_.build(cell.kind, domain, target);
    store_->save_matrix(cell.op, matrix);
    cell.matrix = std::make_shared<const SparseMatrix>(std::move(matrix));
    state.count(cell, Outcome::Computed);
}

void JobScheduler::run_rank(RunState& state, Cell& cell) {
    const Cell& op = *cell.dependencies[0];
    cell.op = op.op;

    if (op.trivial) {
        cell.rank = Rank{0, state.domain, "trivial"};
        state.count(cell, Outcome::Trivial);
        return;
    }

    const SparseMatrix& matrix = require(op.matrix, op.id);
    auto lock = store_->lock_cell(cell.id);
    if (!state.ignore_existing) {
        auto stored = load_or_discard<Rank>(cell.id, cell.corrupted, [&]() -> std::optional<Rank> {
            auto r = store_->load_rank(cell.op, state.domain);
            if (r && r->value > std::min(matrix.rows(), matrix.cols())) {
                throw StoreCorruptionError(cell.id, "stored rank " + std::to_string(r->value) +
                                           " exceeds matrix dimensions");
            }
            return r;
        });
        if (stored) {
            GC_DEBUG_LOG("[scheduler] loaded %s", cell.id.c_str());
            cell.rank = *stored;
            state.count(cell, Outcome::Loaded);
            return;
        }
    }

    cell.rank = engine_->compute(matrix, state.domain, &cancel_);
    store_->save_rank(cell.op, cell.rank);
    GC_LOG_INFO("[scheduler] rank %s = %zu (%s)", cell.op.to_string().c_str(), cell.rank.value,
                cell.rank.backend.c_str());
    state.count(cell, Outcome::Computed);
}

void JobScheduler::run_validate(RunState& state, Cell& cell) {
    const CheckId id{cell.check, cell.kind, cell.second, cell.key};
    const ComplexValidator validator(state.domain);

    const auto compute = [&]() {
        const auto m = [&cell](std::size_t i) -> const SparseMatrix& {
            return require(cell.dependencies[i]->matrix, cell.dependencies[i]->id);
        };
        if (cell.check == CheckKind::SquareZero) {
            return validator.square_zero(cell.kind, cell.key, m(0), m(1));
        }
        return validator.anti_commute(cell.kind, cell.second, cell.key, m(0), m(1), m(2), m(3),
                                      cell.check == CheckKind::Commute);
    };

    const bool all_trivial = std::all_of(cell.dependencies.begin(), cell.dependencies.end(),
                                         [](const Cell* dep) { return dep->trivial; });
    if (all_trivial) {
        cell.finding = compute();
        state.count(cell, Outcome::Trivial);
        return;
    }

    auto lock = store_->lock_cell(cell.id);
    if (!state.ignore_existing) {
        auto stored = load_or_discard<ValidationFinding>(cell.id, cell.corrupted,
                                                         [&] { return store_->load_finding(id, state.domain); });
        if (stored) {
            GC_DEBUG_LOG("[scheduler] loaded %s", cell.id.c_str());
            cell.finding = std::move(stored);
            state.count(cell, Outcome::Loaded);
            return;
        }
    }

    cell.finding = compute();
    store_->save_finding(*cell.finding, state.domain);
    state.count(cell, Outcome::Computed);
}

void JobScheduler::run_cohomology(RunState& state, Cell& cell) {
    const Basis& basis = require(cell.dependencies[0]->basis, cell.dependencies[0]->id);
    const Rank& rank_out = cell.dependencies[1]->rank;
    const Rank& rank_in = cell.dependencies[2]->rank;

    if (!family_->is_valid(cell.key)) {
        cell.entry = assembler_.assemble(cell.key, cell.kind, 0, 0, 0);
        state.count(cell, Outcome::Trivial);
        return;
    }

    auto lock = store_->lock_cell(cell.id);
    if (!state.ignore_existing) {
        auto stored = load_or_discard<CohomologyEntry>(cell.id, cell.corrupted,
                                                       [&]() -> std::optional<CohomologyEntry> {
            auto e = store_->load_cohomology(cell.kind, cell.key, state.domain);
            if (e && (e->basis_dimension != basis.size() || e->rank_out != rank_out.value ||
                      e->rank_in != rank_in.value)) {
                throw StoreCorruptionError(cell.id, "stored entry is stale");
            }
            return e;
        });
        if (stored) {
            GC_DEBUG_LOG("[scheduler] loaded %s", cell.id.c_str());
            cell.entry = *stored;
            state.count(cell, Outcome::Loaded);
            return;
        }
    }

    cell.entry = assembler_.assemble(cell.key, cell.kind, basis.size(), rank_out.value, rank_in.value);
    store_->save_cohomology(cell.entry, state.domain);
    GC_LOG_INFO("[scheduler] H %s = %zu", cell.key.to_string().c_str(), cell.entry.dimension);
    state.count(cell, Outcome::Computed);
}

// =============================================================================
// Report
// =============================================================================

RunReport JobScheduler::collect(RunState& state, const ComputationRequest& request) const {
    RunReport report;
    report.counters = state.counters;
    report.cancelled = cancel_.load();
    report.failures = state.failures;
    std::sort(report.failures.begin(), report.failures.end(),
              [](const CellFailure& a, const CellFailure& b) { return a.cell < b.cell; });

    for (const auto& [id, cell] : state.cells) {
        if (cell->stage == Stage::Validate && cell->finding) {
            report.findings.push_back(*cell->finding);
        }
    }

    if (request.stages.count(Stage::Cohomology) == 0) return report;

    for (OperatorKind kind : request.differentials) {
        CohomologyTable table;
        table.differential = kind;
        table.domain = state.domain;
        for (const auto& key : request.keys) {
            const Cell* cell = state.cohomology(kind, key);
            if (cell->state == CellState::Done && !cell->trivial) {
                table.entries.push_back(cell->entry);
            }
        }
        table.sort();
        table.entries.erase(std::unique(table.entries.begin(), table.entries.end()), table.entries.end());
        for (const auto& finding : report.findings) {
            if (finding.id.first == kind || finding.id.second == kind) {
                table.findings.push_back(finding);
            }
        }

        // One report file per parity convention
        std::map<std::string, CohomologyTable> exports;
        for (const auto& entry : table.entries) {
            auto& part = exports[entry.key.sub_type()];
            part.differential = kind;
            part.domain = state.domain;
            part.entries.push_back(entry);
        }
        for (const auto& [sub_type, part] : exports) {
            try {
                store_->export_table(part);
            } catch (const std::runtime_error& e) {
                GC_LOG_ERROR("[scheduler] cannot export %s table: %s", sub_type.c_str(), e.what());
                report.failures.push_back(CellFailure{std::string("export/") + operator_name(kind) + "/" + sub_type,
                                                      Stage::Cohomology, "Export error", e.what(), "", false});
            }
        }
        report.tables.push_back(std::move(table));
    }
    return report;
}

} // namespace graph_complex
