#ifndef GRAPH_COMPLEX_CONFIG_HPP
#define GRAPH_COMPLEX_CONFIG_HPP

#include <graph_complex/log.hpp>
#include <graph_complex/types.hpp>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace graph_complex {

/**
 * One external exact-rank solver.
 *
 * Argument placeholders: {matrix} (path of the SMS file), {modulus}
 * (prime, or 0 for the rationals), {threads}.
 */
struct SolverBackendConfig {
    std::string name = "graph_complex_rank";
    std::string executable;
    std::vector<std::string> arguments{"{matrix}", "--modulus", "{modulus}", "--threads", "{threads}"};
    unsigned threads = 1;
    std::chrono::milliseconds timeout{std::chrono::minutes(30)};
    std::size_t memory_limit_mb = 0;  // 0: no ceiling
};

struct RankConfig {
    CoefficientDomain domain = CoefficientDomain::rational();

    // Matrices within both limits are ranked in-process.
    std::size_t in_process_max_entries = 200000;
    std::size_t in_process_max_dimension = 20000;

    // Tried in order; each gets attempts_per_backend tries.
    std::vector<SolverBackendConfig> backends;
    unsigned attempts_per_backend = 2;

    std::filesystem::path scratch_dir;  // empty: system temporary directory
};

struct EngineConfig {
    std::filesystem::path store_root = "gc_data";
    std::size_t jobs = 0;  // 0: hardware concurrency
    bool ignore_existing = false;
    log::Level log_level = log::Level::Info;
    std::size_t max_oracle_vertices = 12;
    RankConfig rank;
};

log::Level parse_log_level(const std::string& text);

/**
 * `key = value` lines, '#' comments, and `[solver NAME]` sections holding
 * one backend each. Throws std::invalid_argument naming the offending line.
 */
EngineConfig parse_config(std::istream& in, const std::string& source);
EngineConfig load_config(const std::filesystem::path& path);

} // namespace graph_complex

#endif // GRAPH_COMPLEX_CONFIG_HPP
