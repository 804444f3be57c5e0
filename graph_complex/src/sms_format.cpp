#include <graph_complex/sms_format.hpp>
#include <graph_complex/errors.hpp>
#include <istream>
#include <ostream>
#include <sstream>

namespace graph_complex {

void write_sms(std::ostream& out, const SparseMatrix& m) {
    out << m.rows() << " " << m.cols() << " M\n";
    for (const auto& [index, value] : m.data()) {
        out << index.first + 1 << " " << index.second + 1 << " " << value << "\n";
    }
    out << "0 0 0\n";
}

SparseMatrix read_sms(std::istream& in, const std::string& source) {
    std::string line;
    if (!std::getline(in, line)) {
        throw StoreCorruptionError(source, "missing matrix header");
    }

    std::istringstream header(line);
    long long rows = -1, cols = -1;
    std::string type;
    if (!(header >> rows >> cols >> type) || rows < 0 || cols < 0 || type != "M") {
        throw StoreCorruptionError(source, "malformed matrix header '" + line + "'");
    }

    SparseMatrix m(static_cast<std::size_t>(rows), static_cast<std::size_t>(cols));
    bool terminated = false;
    std::size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (terminated) {
            if (line.find_first_not_of(" \t\r") != std::string::npos) {
                throw StoreCorruptionError(source, "data after terminator at line " + std::to_string(line_number));
            }
            continue;
        }

        std::istringstream fields(line);
        long long r = 0, c = 0, v = 0;
        std::string extra;
        if (!(fields >> r >> c >> v) || (fields >> extra)) {
            throw StoreCorruptionError(source, "malformed entry at line " + std::to_string(line_number));
        }
        if (r == 0 && c == 0 && v == 0) {
            terminated = true;
            continue;
        }
        if (r < 1 || c < 1 || r > rows || c > cols) {
            throw StoreCorruptionError(source, "index out of range at line " + std::to_string(line_number));
        }
        if (v == 0) {
            throw StoreCorruptionError(source, "explicit zero at line " + std::to_string(line_number));
        }
        auto row = static_cast<std::size_t>(r - 1);
        auto col = static_cast<std::size_t>(c - 1);
        if (m.at(row, col) != 0) {
            throw StoreCorruptionError(source, "duplicate entry at line " + std::to_string(line_number));
        }
        m.set(row, col, v);
    }

    if (!terminated) {
        throw StoreCorruptionError(source, "missing terminator line");
    }
    return m;
}

} // namespace graph_complex
