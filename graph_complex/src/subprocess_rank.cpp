#include <graph_complex/rank_backend.hpp>
#include <graph_complex/errors.hpp>
#include <graph_complex/log.hpp>
#include <graph_complex/sms_format.hpp>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace graph_complex {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> g_scratch_counter{0};

// Removes the scratch files of one solver invocation.
struct ScratchFiles {
    fs::path matrix;
    fs::path out;
    fs::path err;

    ~ScratchFiles() {
        std::error_code ec;
        fs::remove(matrix, ec);
        fs::remove(out, ec);
        fs::remove(err, ec);
    }
};

int open_write_file(const fs::path& path) {
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        throw RankSolverError(SolverFailure::Launch, "cannot open " + path.string() + ": " + std::strerror(errno));
    }
    return fd;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string first_line(const std::string& text) {
    auto end = text.find('\n');
    return text.substr(0, end);
}

} // namespace

SubprocessRankBackend::SubprocessRankBackend(SolverBackendConfig config, fs::path scratch_dir)
    : config_(std::move(config)), scratch_dir_(std::move(scratch_dir)) {
    if (config_.executable.empty()) {
        throw std::invalid_argument("Solver backend '" + config_.name + "' has no executable");
    }
    if (scratch_dir_.empty()) {
        scratch_dir_ = fs::temp_directory_path();
    }
}

std::vector<std::string> SubprocessRankBackend::command_line(const fs::path& matrix_path,
                                                             CoefficientDomain domain) const {
    std::vector<std::string> args{config_.executable};
    for (const auto& arg : config_.arguments) {
        std::string expanded = replace_all(arg, "{matrix}", matrix_path.string());
        expanded = replace_all(expanded, "{modulus}", std::to_string(domain.modulus));
        expanded = replace_all(expanded, "{threads}", std::to_string(config_.threads));
        args.push_back(std::move(expanded));
    }
    return args;
}

std::size_t SubprocessRankBackend::compute(const SparseMatrix& m, CoefficientDomain domain,
                                           const CancellationFlag* cancel) const {
    std::error_code ec;
    fs::create_directories(scratch_dir_, ec);
    if (ec) {
        throw RankSolverError(SolverFailure::Launch, "cannot create scratch directory " + scratch_dir_.string());
    }

    std::ostringstream stem;
    stem << "gc_rank_" << ::getpid() << "_" << g_scratch_counter.fetch_add(1);
    ScratchFiles files{scratch_dir_ / (stem.str() + ".sms"),
                       scratch_dir_ / (stem.str() + ".out"),
                       scratch_dir_ / (stem.str() + ".err")};
    {
        std::ofstream out(files.matrix);
        write_sms(out, m);
        if (!out) {
            throw RankSolverError(SolverFailure::Launch, "cannot write " + files.matrix.string());
        }
    }

    // Built before fork; the child must not allocate.
    const auto args = command_line(files.matrix, domain);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    int stdout_fd = open_write_file(files.out);
    int stderr_fd = open_write_file(files.err);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(stdout_fd);
        ::close(stderr_fd);
        throw RankSolverError(SolverFailure::Launch, "fork failed");
    }

    if (pid == 0) {
        if (config_.memory_limit_mb > 0) {
            rlimit limit;
            limit.rlim_cur = static_cast<rlim_t>(config_.memory_limit_mb) * 1024 * 1024;
            limit.rlim_max = limit.rlim_cur;
            ::setrlimit(RLIMIT_AS, &limit);
        }
        if (::dup2(stdout_fd, STDOUT_FILENO) < 0 || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
            _exit(127);
        }
        ::close(stdout_fd);
        ::close(stderr_fd);
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    ::close(stdout_fd);
    ::close(stderr_fd);

    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    int status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            ::kill(pid, SIGKILL);
            throw RankSolverError(SolverFailure::Launch, "waitpid failed for " + config_.name);
        }

        bool cancelled = cancel && cancel->load(std::memory_order_relaxed);
        if (cancelled || std::chrono::steady_clock::now() >= deadline) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            if (cancelled) {
                throw RankSolverError(SolverFailure::Cancelled, config_.name + " killed on cancellation");
            }
            throw RankSolverError(SolverFailure::Timeout,
                                  config_.name + " exceeded " + std::to_string(config_.timeout.count()) + " ms");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (WIFSIGNALED(status)) {
        throw RankSolverError(SolverFailure::ExitCode,
                              config_.name + " terminated by signal " + std::to_string(WTERMSIG(status)));
    }
    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 1;
    if (exit_code != 0) {
        throw RankSolverError(SolverFailure::ExitCode, config_.name + " exited with code " +
                              std::to_string(exit_code) + ": " + first_line(read_file(files.err)));
    }

    std::istringstream output(read_file(files.out));
    long long value = -1;
    std::string extra;
    if (!(output >> value) || (output >> extra) || value < 0) {
        throw RankSolverError(SolverFailure::Unparsable, config_.name + " printed no single non-negative integer");
    }
    auto rank = static_cast<std::size_t>(value);
    if (rank > std::min(m.rows(), m.cols())) {
        throw RankSolverError(SolverFailure::Unparsable, config_.name + " reported rank " + std::to_string(rank) +
                              " for a " + std::to_string(m.rows()) + "x" + std::to_string(m.cols()) + " matrix");
    }
    GC_DEBUG_LOG("%s: rank %zu", config_.name.c_str(), rank);
    return rank;
}

} // namespace graph_complex
