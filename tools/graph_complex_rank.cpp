// Exact rank of a sparse matrix in SMS format.
//
//   graph_complex_rank MATRIX.sms [--modulus P | --rational] [--threads N]
//
// Prints the rank on standard output. Exit status 0 on success, 1 on a
// malformed matrix or failed computation, 2 on bad usage.
// --threads splits modular elimination into row blocks; rational ranks use one thread.

#include <graph_complex/errors.hpp>
#include <graph_complex/log.hpp>
#include <graph_complex/rank_backend.hpp>
#include <graph_complex/sms_format.hpp>
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

void usage() {
    fprintf(stderr,
            "usage: graph_complex_rank MATRIX.sms [--modulus P | --rational] [--threads N]\n"
            "  --modulus P    rank over GF(P); 0 means the rationals\n"
            "  --rational     rank over the rationals (default)\n"
            "  --threads N    workers for modular elimination (default 1); rational ranks use one\n");
}

bool parse_unsigned(const std::string& text, unsigned long long& value) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    // Standard output carries the result only
    graph_complex::log::set_log_level(graph_complex::log::Level::Warn);

    std::string matrix_path;
    unsigned long long modulus = 0;
    unsigned long long threads = 1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--rational") {
            modulus = 0;
        } else if ((arg == "--modulus" || arg == "--threads") && i + 1 < argc) {
            unsigned long long& target = arg == "--modulus" ? modulus : threads;
            if (!parse_unsigned(argv[++i], target)) {
                fprintf(stderr, "invalid value for %s: %s\n", arg.c_str(), argv[i]);
                return 2;
            }
        } else if (arg.find("--modulus=") == 0 || arg.find("--threads=") == 0) {
            const bool is_modulus = arg[2] == 'm';
            if (!parse_unsigned(arg.substr(arg.find('=') + 1), is_modulus ? modulus : threads)) {
                fprintf(stderr, "invalid argument: %s\n", arg.c_str());
                return 2;
            }
        } else if (matrix_path.empty() && !arg.empty() && arg[0] != '-') {
            matrix_path = arg;
        } else {
            usage();
            return 2;
        }
    }
    if (matrix_path.empty() || threads == 0) {
        usage();
        return 2;
    }

    try {
        graph_complex::CoefficientDomain domain = modulus == 0
            ? graph_complex::CoefficientDomain::rational()
            : graph_complex::CoefficientDomain::prime(modulus);

        std::ifstream in(matrix_path);
        if (!in) {
            fprintf(stderr, "cannot open %s\n", matrix_path.c_str());
            return 1;
        }
        graph_complex::SparseMatrix m = graph_complex::read_sms(in, matrix_path);

        graph_complex::EliminationRankBackend backend(static_cast<std::size_t>(threads));
        printf("%zu\n", backend.compute(m, domain));
        return 0;
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "%s\n", e.what());
        return 2;
    } catch (const std::exception& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
}
