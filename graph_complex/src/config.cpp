#include <graph_complex/config.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace graph_complex {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

std::string location(const std::string& source, std::size_t line) {
    return source + ":" + std::to_string(line);
}

unsigned long long parse_unsigned(const std::string& value, const std::string& where) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(where + ": expected a non-negative integer, got '" + value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(where + ": integer out of range '" + value + "'");
    }
}

bool parse_bool(const std::string& value, const std::string& where) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::invalid_argument(where + ": expected a boolean, got '" + value + "'");
}

std::vector<std::string> split_words(const std::string& value) {
    std::istringstream iss(value);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

} // namespace

log::Level parse_log_level(const std::string& text) {
    if (text == "debug") return log::Level::Debug;
    if (text == "info") return log::Level::Info;
    if (text == "warn") return log::Level::Warn;
    if (text == "error") return log::Level::Error;
    if (text == "off") return log::Level::Off;
    throw std::invalid_argument("Unknown log level '" + text + "'");
}

EngineConfig parse_config(std::istream& in, const std::string& source) {
    EngineConfig config;
    SolverBackendConfig* solver = nullptr;

    std::string raw;
    std::size_t line_number = 0;
    while (std::getline(in, raw)) {
        ++line_number;
        const std::string where = location(source, line_number);
        std::string line = trim(raw.substr(0, raw.find('#')));
        if (line.empty()) continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                throw std::invalid_argument(where + ": unterminated section header");
            }
            auto words = split_words(line.substr(1, line.size() - 2));
            if (words.size() != 2 || words[0] != "solver") {
                throw std::invalid_argument(where + ": expected [solver NAME]");
            }
            config.rank.backends.emplace_back();
            solver = &config.rank.backends.back();
            solver->name = words[1];
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(where + ": expected key = value");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        try {
            if (solver) {
                if (key == "executable") solver->executable = value;
                else if (key == "arguments") solver->arguments = split_words(value);
                else if (key == "threads") solver->threads = static_cast<unsigned>(parse_unsigned(value, where));
                else if (key == "timeout_ms") solver->timeout = std::chrono::milliseconds(parse_unsigned(value, where));
                else if (key == "memory_limit_mb") solver->memory_limit_mb = parse_unsigned(value, where);
                else throw std::invalid_argument(where + ": unknown solver key '" + key + "'");
                continue;
            }

            if (key == "store_root") config.store_root = value;
            else if (key == "jobs") config.jobs = parse_unsigned(value, where);
            else if (key == "ignore_existing") config.ignore_existing = parse_bool(value, where);
            else if (key == "log_level") config.log_level = parse_log_level(value);
            else if (key == "max_oracle_vertices") config.max_oracle_vertices = parse_unsigned(value, where);
            else if (key == "rank.domain") config.rank.domain = CoefficientDomain::from_tag(value);
            else if (key == "rank.in_process_max_entries") config.rank.in_process_max_entries = parse_unsigned(value, where);
            else if (key == "rank.in_process_max_dimension") config.rank.in_process_max_dimension = parse_unsigned(value, where);
            else if (key == "rank.attempts_per_backend") config.rank.attempts_per_backend = static_cast<unsigned>(parse_unsigned(value, where));
            else if (key == "rank.scratch_dir") config.rank.scratch_dir = value;
            else throw std::invalid_argument(where + ": unknown key '" + key + "'");
        } catch (const std::invalid_argument& e) {
            std::string message = e.what();
            if (message.compare(0, where.size(), where) == 0) throw;
            throw std::invalid_argument(where + ": " + message);
        }
    }

    for (const auto& backend : config.rank.backends) {
        if (backend.executable.empty()) {
            throw std::invalid_argument(source + ": solver '" + backend.name + "' has no executable");
        }
    }
    if (config.rank.attempts_per_backend == 0) {
        throw std::invalid_argument(source + ": rank.attempts_per_backend must be positive");
    }
    return config;
}

EngineConfig load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::invalid_argument("Cannot open config file " + path.string());
    }
    return parse_config(in, path.string());
}

} // namespace graph_complex
