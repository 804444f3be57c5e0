// Runs a block of gradings through the pipeline and prints the cohomology.
//
//   graph_complex --vertices A:B --loops A:B [options]
//   graph_complex --total-degrees A:B [options]
//
// Exit status 0 when every cell completed and no check failed, 1 otherwise,
// 2 on bad usage or configuration.

#include <graph_complex/config.hpp>
#include <graph_complex/graph_family.hpp>
#include <graph_complex/graph_oracle.hpp>
#include <graph_complex/log.hpp>
#include <graph_complex/scheduler.hpp>
#include <graph_complex/store.hpp>
#include <graph_complex/total_complex.hpp>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::atomic<bool> interrupted{false};

void on_interrupt(int) {
    interrupted.store(true);
}

void usage() {
    fprintf(stderr,
            "usage: graph_complex --vertices A:B --loops A:B [options]\n"
            "       graph_complex --total-degrees A:B [options]\n"
            "  --total-degrees A:B       total complex of the ordinary odd-edge bicomplex\n"
            "  --config FILE             engine configuration\n"
            "  --family ordinary|hairy   (default ordinary)\n"
            "  --edges odd|even          edge parity (default odd)\n"
            "  --hair-parity odd|even    hairy family only (default even)\n"
            "  --hairs A:B               hairy family only\n"
            "  --differential NAME       contract (default) or delete; repeatable\n"
            "  --stage NAME              basis, operator, rank, validate, cohomology; repeatable\n"
            "  --anti-commute D1,D2      also check d1 d2 + d2 d1 = 0\n"
            "  --commute D1,D2           also check d1 d2 - d2 d1 = 0\n"
            "  --store DIR               overrides store_root\n"
            "  --jobs N                  overrides jobs\n"
            "  --modulus P               rank over GF(P) instead of the rationals\n"
            "  --ignore-existing         recompute stored entries\n");
}

void parse_bounds(const std::string& text, int& low, int& high) {
    std::size_t colon = text.find(':');
    try {
        std::size_t used = 0;
        if (colon == std::string::npos) {
            low = high = std::stoi(text, &used);
            if (used != text.size()) throw std::invalid_argument(text);
            return;
        }
        low = std::stoi(text.substr(0, colon), &used);
        if (used != colon) throw std::invalid_argument(text);
        const std::string upper = text.substr(colon + 1);
        high = std::stoi(upper, &used);
        if (used != upper.size()) throw std::invalid_argument(text);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid range '" + text + "', expected A:B");
    }
}

graph_complex::AntiCommuteRequest parse_pair(const std::string& text, bool commute) {
    std::size_t comma = text.find(',');
    if (comma == std::string::npos) {
        throw std::invalid_argument("Invalid operator pair '" + text + "', expected D1,D2");
    }
    return graph_complex::AntiCommuteRequest{graph_complex::parse_operator(text.substr(0, comma)),
                                             graph_complex::parse_operator(text.substr(comma + 1)), commute};
}

void print_failures(const std::vector<graph_complex::CellFailure>& failures) {
    for (const auto& failure : failures) {
        if (failure.skipped) {
            fprintf(stderr, "%s: skipped, %s did not complete\n", failure.cell.c_str(), failure.upstream.c_str());
        } else {
            fprintf(stderr, "%s: %s: %s\n", failure.cell.c_str(), failure.category.c_str(),
                    failure.message.c_str());
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace graph_complex;

    std::string config_path;
    std::string store_override;
    std::string jobs_override;
    std::string modulus_override;
    bool ignore_existing = false;
    bool have_vertices = false;
    bool have_loops = false;
    bool have_degrees = false;
    int min_degree = 0;
    int max_degree = 0;
    GradingRange range;
    ComputationRequest request;
    std::vector<OperatorKind> differentials;
    std::set<Stage> stages;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                usage();
                return 0;
            } else if (arg == "--ignore-existing") {
                ignore_existing = true;
                continue;
            }
            if (i + 1 >= argc) {
                usage();
                return 2;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                config_path = value;
            } else if (arg == "--family") {
                range.family = parse_family(value);
            } else if (arg == "--edges") {
                range.edge_parity = parse_parity(value);
            } else if (arg == "--hair-parity") {
                range.hair_parity = parse_parity(value);
            } else if (arg == "--vertices") {
                parse_bounds(value, range.min_vertices, range.max_vertices);
                have_vertices = true;
            } else if (arg == "--loops") {
                parse_bounds(value, range.min_loops, range.max_loops);
                have_loops = true;
            } else if (arg == "--total-degrees") {
                parse_bounds(value, min_degree, max_degree);
                have_degrees = true;
            } else if (arg == "--hairs") {
                parse_bounds(value, range.min_hairs, range.max_hairs);
            } else if (arg == "--differential") {
                differentials.push_back(parse_operator(value));
            } else if (arg == "--stage") {
                stages.insert(parse_stage(value));
            } else if (arg == "--anti-commute" || arg == "--commute") {
                request.anti_commute.push_back(parse_pair(value, arg == "--commute"));
            } else if (arg == "--store") {
                store_override = value;
            } else if (arg == "--jobs") {
                jobs_override = value;
            } else if (arg == "--modulus") {
                modulus_override = value;
            } else {
                fprintf(stderr, "unknown option: %s\n", arg.c_str());
                usage();
                return 2;
            }
        }
        if (!have_degrees && (!have_vertices || !have_loops)) {
            usage();
            return 2;
        }

        EngineConfig config = config_path.empty() ? EngineConfig{} : load_config(config_path);
        if (!store_override.empty()) config.store_root = store_override;
        if (!jobs_override.empty()) config.jobs = std::stoul(jobs_override);
        if (!modulus_override.empty()) config.rank.domain = CoefficientDomain::from_tag("p" + modulus_override);
        if (ignore_existing) config.ignore_existing = true;
        log::set_log_level(config.log_level);

        if (have_degrees) {
            if (range.family != ComplexFamily::Ordinary || range.edge_parity != EdgeParity::Odd) {
                throw std::invalid_argument("--total-degrees needs the ordinary family with odd edges");
            }
            auto store = std::make_shared<FileStore>(config.store_root);
            auto oracle = std::make_shared<RefinementOracle>(config.max_oracle_vertices);
            TotalComplexRunner runner(config, store, oracle);

            std::signal(SIGINT, on_interrupt);
            std::signal(SIGTERM, on_interrupt);
            TotalComplexReport report = runner.run(min_degree, max_degree, &interrupted);

            report.table.write_tsv(std::cout);
            for (const auto& check : report.checks) {
                if (check.outcome != CheckOutcome::Failed) continue;
                fprintf(stderr, "square_zero at %s: failed %s\n", check.slice.to_string().c_str(),
                        check.message.c_str());
            }
            print_failures(report.components.failures);
            print_failures(report.failures);
            if (report.cancelled) fprintf(stderr, "cancelled\n");
            return report.ok() ? 0 : 1;
        }

        request.keys = range.keys();
        if (!differentials.empty()) request.differentials = differentials;
        if (!stages.empty()) request.stages = stages;

        auto store = std::make_shared<FileStore>(config.store_root);
        auto oracle = std::make_shared<RefinementOracle>(config.max_oracle_vertices);
        JobScheduler scheduler(config, store, oracle, make_family(range.family));

        std::signal(SIGINT, on_interrupt);
        std::signal(SIGTERM, on_interrupt);
        RunReport report = scheduler.run(request, &interrupted);

        for (const auto& table : report.tables) {
            table.write_tsv(std::cout);
        }
        for (const auto& finding : report.findings) {
            if (finding.outcome == CheckOutcome::Passed || finding.outcome == CheckOutcome::Trivial) continue;
            fprintf(stderr, "%s: %s %s\n", finding.id.to_string().c_str(), outcome_name(finding.outcome),
                    finding.message.c_str());
        }
        print_failures(report.failures);
        const auto& c = report.counters;
        fprintf(stderr, "%zu computed, %zu loaded, %zu trivial, %zu failed, %zu skipped, %zu cancelled\n",
                c.computed, c.loaded, c.trivial, c.failed, c.skipped, c.cancelled);
        return report.ok() ? 0 : 1;
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "%s\n", e.what());
        return 2;
    } catch (const std::exception& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
}
