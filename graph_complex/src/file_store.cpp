#include <graph_complex/store.hpp>
#include <graph_complex/errors.hpp>
#include <graph_complex/graph_family.hpp>
#include <graph_complex/log.hpp>
#include <graph_complex/sms_format.hpp>
#include <atomic>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace graph_complex {

// =============================================================================
// PersistentStore
// =============================================================================

PersistentStore::CellLock::CellLock(PersistentStore& store, std::string cell_id, std::mutex& mutex)
    : store_(&store), cell_id_(std::move(cell_id)), lock_(mutex) {}

PersistentStore::CellLock::CellLock(CellLock&& other) noexcept
    : store_(std::exchange(other.store_, nullptr)), cell_id_(std::move(other.cell_id_)),
      lock_(std::move(other.lock_)) {}

PersistentStore::CellLock::~CellLock() {
    if (!store_) return;
    if (lock_.owns_lock()) lock_.unlock();
    store_->release_cell(cell_id_);
}

PersistentStore::CellLock PersistentStore::lock_cell(const std::string& cell_id) {
    CellMutex* entry = nullptr;
    {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        entry = &cell_locks_[cell_id];
        ++entry->holders;
    }
    // Map nodes are stable and the entry outlives its last holder
    return CellLock(*this, cell_id, entry->mutex);
}

void PersistentStore::release_cell(const std::string& cell_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto it = cell_locks_.find(cell_id);
    if (it != cell_locks_.end() && --it->second.holders == 0) {
        cell_locks_.erase(it);
    }
}

std::size_t PersistentStore::active_cell_locks() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return cell_locks_.size();
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

std::atomic<unsigned long> temp_counter{0};

// Whole file, or nullopt if it does not exist.
std::optional<std::string> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StoreCorruptionError(path.string(), "cannot open for reading");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::size_t parse_count(const std::string& token, const fs::path& path, const char* what) {
    if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos) {
        throw StoreCorruptionError(path.string(), std::string("malformed ") + what + " '" + token + "'");
    }
    try {
        return static_cast<std::size_t>(std::stoull(token));
    } catch (const std::out_of_range&) {
        throw StoreCorruptionError(path.string(), std::string(what) + " out of range");
    }
}

void expect_domain(const std::string& token, CoefficientDomain domain, const fs::path& path) {
    if (token != domain.tag()) {
        throw StoreCorruptionError(path.string(), "domain tag '" + token + "', expected '" + domain.tag() + "'");
    }
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

// Integer columns of a tab separated row, or nullopt if any is missing or not a number.
std::optional<std::vector<long>> row_key(const std::string& row, const std::vector<std::size_t>& key_columns) {
    std::vector<std::string> fields;
    std::istringstream in(row);
    std::string field;
    while (std::getline(in, field, '\t')) fields.push_back(field);

    std::vector<long> key;
    for (std::size_t column : key_columns) {
        if (column >= fields.size() || fields[column].empty() ||
            fields[column].find_first_not_of("-0123456789") != std::string::npos) {
            return std::nullopt;
        }
        try {
            key.push_back(std::stol(fields[column]));
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return key;
}

/**
 * Rows of `fresh` replace the rows of the table at `path` that share their
 * key columns; other stored rows are kept. Output is ordered by key.
 * A stored table with another header or an unreadable row is dropped.
 */
std::string merge_table(const fs::path& path, const std::string& fresh, const std::vector<std::size_t>& key_columns) {
    const std::vector<std::string> fresh_lines = split_lines(fresh);
    if (fresh_lines.empty()) return fresh;
    const std::string& header = fresh_lines.front();

    std::map<std::vector<long>, std::string> rows;
    if (auto stored = read_file(path)) {
        const std::vector<std::string> lines = split_lines(*stored);
        bool readable = !lines.empty() && lines.front() == header;
        for (std::size_t i = 1; readable && i < lines.size(); ++i) {
            auto key = row_key(lines[i], key_columns);
            if (!key) {
                readable = false;
                break;
            }
            rows[*key] = lines[i];
        }
        if (!readable) {
            GC_LOG_WARN("[store] %s is unreadable; rewriting it from this run only", path.string().c_str());
            rows.clear();
        }
    }

    for (std::size_t i = 1; i < fresh_lines.size(); ++i) {
        auto key = row_key(fresh_lines[i], key_columns);
        if (!key) throw std::invalid_argument("Malformed table row '" + fresh_lines[i] + "'");
        rows[*key] = fresh_lines[i];
    }

    std::string merged = header + "\n";
    for (const auto& [key, row] : rows) merged += row + "\n";
    return merged;
}

// "<rank> <domain> [backend]"
std::optional<Rank> read_rank(const fs::path& path, CoefficientDomain domain) {
    auto content = read_file(path);
    if (!content) return std::nullopt;

    std::istringstream in(*content);
    std::string value, tag, backend, extra;
    if (!(in >> value >> tag)) {
        throw StoreCorruptionError(path.string(), "expected '<rank> <domain> [backend]'");
    }
    in >> backend;
    if (in >> extra) {
        throw StoreCorruptionError(path.string(), "trailing data '" + extra + "'");
    }
    expect_domain(tag, domain, path);
    return Rank{parse_count(value, path, "rank"), domain, backend.empty() ? std::string("store") : backend};
}

std::string format_rank(const Rank& rank) {
    std::ostringstream out;
    out << rank.value << " " << rank.domain.tag();
    if (!rank.backend.empty()) out << " " << rank.backend;
    out << "\n";
    return out.str();
}

std::string operator_dir(OperatorKind kind) {
    return std::string(operator_name(kind)) + "_edges";
}

} // namespace

void write_file_atomically(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path temp = path;
    temp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(temp_counter.fetch_add(1));
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + temp.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            throw std::runtime_error("Write to " + temp.string() + " failed");
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw std::runtime_error("Cannot publish " + path.string() + ": " + ec.message());
    }
}

// =============================================================================
// FileStore paths
// =============================================================================

FileStore::FileStore(fs::path root) : root_(std::move(root)) {
    if (root_.empty()) {
        throw std::invalid_argument("FileStore root must not be empty");
    }
}

fs::path FileStore::family_dir(const GradingKey& key) const {
    return root_ / family_name(key.family()) / key.sub_type();
}

fs::path FileStore::basis_path(const GradingKey& key) const {
    return family_dir(key) / "basis" / ("gra" + key.params() + ".g6");
}

fs::path FileStore::matrix_path(const OperatorId& op) const {
    return family_dir(op.domain) / operator_dir(op.kind) / ("D" + op.domain.params() + ".sms");
}

fs::path FileStore::rank_path(const OperatorId& op, CoefficientDomain domain) const {
    return family_dir(op.domain) / operator_dir(op.kind) /
           ("D" + op.domain.params() + ".rank." + domain.tag() + ".txt");
}

fs::path FileStore::finding_path(const CheckId& id, CoefficientDomain domain) const {
    std::string name = check_name(id.kind);
    if (id.kind != CheckKind::SquareZero) {
        name += std::string("_") + operator_name(id.second);
    }
    return family_dir(id.key) / operator_dir(id.first) / "checks" /
           (name + "_" + id.key.params() + "." + domain.tag() + ".txt");
}

fs::path FileStore::cohomology_path(OperatorKind differential, const GradingKey& key,
                                    CoefficientDomain domain) const {
    return family_dir(key) / operator_dir(differential) / "cohomology" /
           ("H" + key.params() + "." + domain.tag() + ".txt");
}

fs::path FileStore::table_path(OperatorKind differential, const GradingKey& sample,
                               CoefficientDomain domain) const {
    return family_dir(sample) / operator_dir(differential) / ("cohomology." + domain.tag() + ".tsv");
}

fs::path FileStore::total_rank_path(const DegreeSlice& slice, CoefficientDomain domain) const {
    return family_dir(GradingKey::ordinary(0, 0, EdgeParity::Odd)) / "total" /
           ("D" + std::to_string(slice.degree()) + ".rank." + domain.tag() + ".txt");
}

fs::path FileStore::total_table_path(CoefficientDomain domain) const {
    return family_dir(GradingKey::ordinary(0, 0, EdgeParity::Odd)) / "total" /
           ("cohomology." + domain.tag() + ".tsv");
}

// =============================================================================
// Basis
// =============================================================================

std::optional<Basis> FileStore::load_basis(const GradingKey& key) const {
    const fs::path path = basis_path(key);
    auto content = read_file(path);
    if (!content) return std::nullopt;

    std::istringstream in(*content);
    std::string line;
    if (!std::getline(in, line)) {
        throw StoreCorruptionError(path.string(), "missing generator count");
    }
    const std::size_t count = parse_count(line, path, "generator count");

    auto family = make_family(key.family());
    const std::size_t vertices = family->num_vertices(key);
    const std::size_t edges = family->num_edges(key);

    std::vector<GraphGenerator> generators;
    generators.reserve(count);
    while (std::getline(in, line)) {
        if (line.empty()) {
            throw StoreCorruptionError(path.string(), "empty line at generator " + std::to_string(generators.size()));
        }
        Graph g;
        try {
            g = Graph::from_g6(line);
        } catch (const std::invalid_argument& e) {
            throw StoreCorruptionError(path.string(), "undecodable graph6 '" + line + "': " + e.what());
        }
        if (g.num_vertices() != vertices || g.num_edges() != edges) {
            throw StoreCorruptionError(path.string(), "generator '" + line + "' has " +
                                       std::to_string(g.num_vertices()) + " vertices and " +
                                       std::to_string(g.num_edges()) + " edges");
        }
        if (!generators.empty() && !(generators.back().g6 < line)) {
            throw StoreCorruptionError(path.string(), "generators not strictly sorted at '" + line + "'");
        }
        generators.push_back(GraphGenerator{std::move(g), line});
    }
    if (generators.size() != count) {
        throw StoreCorruptionError(path.string(), "header announces " + std::to_string(count) +
                                   " generators, found " + std::to_string(generators.size()));
    }
    return Basis(key, std::move(generators));
}

void FileStore::save_basis(const Basis& basis) {
    std::ostringstream out;
    out << basis.size() << "\n";
    for (const auto& generator : basis.generators()) {
        out << generator.g6 << "\n";
    }
    write_file_atomically(basis_path(basis.key()), out.str());
    GC_DEBUG_LOG("[store] saved basis %s (%zu)", basis.key().to_string().c_str(), basis.size());
}

// =============================================================================
// Matrices and ranks
// =============================================================================

std::optional<SparseMatrix> FileStore::load_matrix(const OperatorId& op) const {
    const fs::path path = matrix_path(op);
    auto content = read_file(path);
    if (!content) return std::nullopt;
    std::istringstream in(*content);
    return read_sms(in, path.string());
}

void FileStore::save_matrix(const OperatorId& op, const SparseMatrix& matrix) {
    std::ostringstream out;
    write_sms(out, matrix);
    write_file_atomically(matrix_path(op), out.str());
}

std::optional<Rank> FileStore::load_rank(const OperatorId& op, CoefficientDomain domain) const {
    return read_rank(rank_path(op, domain), domain);
}

void FileStore::save_rank(const OperatorId& op, const Rank& rank) {
    write_file_atomically(rank_path(op, rank.domain), format_rank(rank));
}

std::optional<Rank> FileStore::load_total_rank(const DegreeSlice& slice, CoefficientDomain domain) const {
    return read_rank(total_rank_path(slice, domain), domain);
}

void FileStore::save_total_rank(const DegreeSlice& slice, const Rank& rank) {
    write_file_atomically(total_rank_path(slice, rank.domain), format_rank(rank));
}

// =============================================================================
// Findings and cohomology
// =============================================================================

std::optional<ValidationFinding> FileStore::load_finding(const CheckId& id, CoefficientDomain domain) const {
    const fs::path path = finding_path(id, domain);
    auto content = read_file(path);
    if (!content) return std::nullopt;

    std::istringstream in(*content);
    std::string header;
    if (!std::getline(in, header)) {
        throw StoreCorruptionError(path.string(), "empty finding");
    }
    std::istringstream fields(header);
    std::string outcome, residual, extra;
    if (!(fields >> outcome >> residual) || (fields >> extra)) {
        throw StoreCorruptionError(path.string(), "expected '<outcome> <residual>'");
    }

    ValidationFinding finding;
    finding.id = id;
    try {
        finding.outcome = parse_outcome(outcome);
    } catch (const std::invalid_argument& e) {
        throw StoreCorruptionError(path.string(), e.what());
    }
    finding.residual_entries = parse_count(residual, path, "residual count");
    std::getline(in, finding.message);
    return finding;
}

void FileStore::save_finding(const ValidationFinding& finding, CoefficientDomain domain) {
    std::ostringstream out;
    out << outcome_name(finding.outcome) << " " << finding.residual_entries << "\n" << finding.message << "\n";
    write_file_atomically(finding_path(finding.id, domain), out.str());
}

std::optional<CohomologyEntry> FileStore::load_cohomology(OperatorKind differential, const GradingKey& key,
                                                          CoefficientDomain domain) const {
    const fs::path path = cohomology_path(differential, key, domain);
    auto content = read_file(path);
    if (!content) return std::nullopt;

    std::istringstream in(*content);
    std::string dim, n, rank_out, rank_in, tag, extra;
    if (!(in >> dim >> n >> rank_out >> rank_in >> tag) || (in >> extra)) {
        throw StoreCorruptionError(path.string(), "expected '<dim> <n> <rank_out> <rank_in> <domain>'");
    }
    expect_domain(tag, domain, path);

    CohomologyEntry entry;
    entry.key = key;
    entry.differential = differential;
    entry.dimension = parse_count(dim, path, "dimension");
    entry.basis_dimension = parse_count(n, path, "basis dimension");
    entry.rank_out = parse_count(rank_out, path, "rank");
    entry.rank_in = parse_count(rank_in, path, "rank");
    if (entry.rank_out > entry.basis_dimension || entry.rank_in > entry.basis_dimension - entry.rank_out ||
        entry.dimension != entry.basis_dimension - entry.rank_out - entry.rank_in) {
        throw StoreCorruptionError(path.string(), "dimension inconsistent with basis size and ranks");
    }
    return entry;
}

void FileStore::save_cohomology(const CohomologyEntry& entry, CoefficientDomain domain) {
    std::ostringstream out;
    out << entry.dimension << " " << entry.basis_dimension << " " << entry.rank_out << " " << entry.rank_in
        << " " << domain.tag() << "\n";
    write_file_atomically(cohomology_path(entry.differential, entry.key, domain), out.str());
}

void FileStore::export_table(const CohomologyTable& table) {
    if (table.entries.empty()) return;
    std::ostringstream out;
    table.write_tsv(out);
    const fs::path path = table_path(table.differential, table.entries.front().key, table.domain);

    // vertices, loops, hairs
    auto lock = lock_cell("export/" + path.string());
    const std::string merged = merge_table(path, out.str(), {2, 3, 4});
    write_file_atomically(path, merged);
    GC_LOG_INFO("[store] wrote %s (%zu new entries, %zu rows)", path.string().c_str(), table.entries.size(),
                split_lines(merged).size() - 1);
}

void FileStore::export_total_table(const TotalCohomologyTable& table) {
    if (table.entries.empty()) return;
    std::ostringstream out;
    table.write_tsv(out);
    const fs::path path = total_table_path(table.domain);

    auto lock = lock_cell("export/" + path.string());
    const std::string merged = merge_table(path, out.str(), {2});
    write_file_atomically(path, merged);
    GC_LOG_INFO("[store] wrote %s (%zu new entries, %zu rows)", path.string().c_str(), table.entries.size(),
                split_lines(merged).size() - 1);
}

} // namespace graph_complex
