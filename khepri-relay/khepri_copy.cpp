#include "khepri_copy.hpp"
#include "khepri_common.hpp"

#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <pthread.h>
#include <sys/stat.h>
#include <sys/wait.h>

RsyncCopyEngine::RsyncCopyEngine(std::string rsync_path) : rsync_path_(std::move(rsync_path)) {}

RsyncCopyEngine::~RsyncCopyEngine() {
    stop();
}

// -----------------------------------------------------------------------------
// Khepri Relay: rsync output parsing
// -----------------------------------------------------------------------------
RsyncLine RsyncCopyEngine::parse_output_line(const std::string& line) {
    RsyncLine result;
    std::string t = khepri_trim(line);
    if (t.empty()) return result;

    // Progress meter: "  1,234,567  42%  10.00MB/s    0:00:03"
    size_t i = 0;
    while (i < t.size() && (isdigit(static_cast<unsigned char>(t[i])) || t[i] == ',')) ++i;
    if (i > 0 && i < t.size() && (t[i] == ' ' || t[i] == '\t')) {
        size_t j = t.find_first_not_of(" \t", i);
        size_t k = j;
        while (k < t.size() && isdigit(static_cast<unsigned char>(t[k]))) ++k;
        if (j != std::string::npos && k > j && k < t.size() && t[k] == '%') {
            result.kind = RsyncLineKind::Progress;
            result.percent = std::stod(t.substr(j, k - j));
            if (result.percent > 100) result.percent = 100;
            return result;
        }
    }

    auto starts_with = [&t](const char* prefix) {
        return t.compare(0, strlen(prefix), prefix) == 0;
    };

    static const char* const chatter[] = {
        "sending incremental file list", "receiving incremental file list",
        "building file list", "created directory ", "rsync: ", "rsync error: ",
        "skipping non-regular file",
    };
    for (const char* prefix : chatter) {
        if (starts_with(prefix)) return result;
    }

    // Closing summary lines.
    if (starts_with("sent ") && t.find(" bytes") != std::string::npos &&
        t.find("received ") != std::string::npos) {
        return result;
    }
    if (starts_with("total size is ") && t.find("speedup is") != std::string::npos) {
        return result;
    }

    // File-list counter: "1234 files...", "1234 files to consider".
    if (i > 0 && i < t.size() && t[i] == ' ' && t.find(',') > i) {
        std::string rest = t.substr(i + 1);
        if (rest == "file to consider" || rest == "files to consider" || rest == "files...") {
            return result;
        }
    }

    // Directory entries end in a slash; only files are reported.
    if (t.back() == '/') return result;

    result.kind = RsyncLineKind::FileStarted;
    result.name = line;
    while (!result.name.empty() && (result.name.back() == '\r' || result.name.back() == '\n')) {
        result.name.pop_back();
    }
    return result;
}

void RsyncCopyEngine::handle_line(const std::string& line, const std::string& source) {
    if (line.compare(0, 5, "rsync") == 0) {
        KHEPRI_LOG_WARN("copy", "%s", line.c_str());
    }

    RsyncLine parsed = parse_output_line(line);
    switch (parsed.kind) {
    case RsyncLineKind::FileStarted: {
        uint64_t size = 0;
        struct stat st{};
        if (lstat(khepri_join(source, parsed.name).c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
            size = static_cast<uint64_t>(st.st_size);
        }
        if (on_file_started_) on_file_started_(parsed.name, size);
        break;
    }
    case RsyncLineKind::Progress:
        if (on_progress_) on_progress_(parsed.percent);
        break;
    case RsyncLineKind::Ignored:
        break;
    }
}

// -----------------------------------------------------------------------------
// Khepri Relay: child process control
// -----------------------------------------------------------------------------
bool RsyncCopyEngine::start(const std::string& source, const std::string& destination,
                            const CopyOptions& options) {
    std::lock_guard<std::mutex> lk(mtx_);

    if (active_.load(std::memory_order_acquire)) {
        KHEPRI_LOG_ERROR("copy", "Copy already running, refusing to start %s", source.c_str());
        return false;
    }
    if (watcher_.joinable()) {
        watcher_.join();
    }

    // Argument strings must outlive the exec; build them before forking.
    std::vector<std::string> args = {
        rsync_path_, "-a", "--partial", "--progress", "--no-inc-recursive", "--outbuf=L",
    };
    if (options.bandwidth_limit_kbps > 0) {
        args.push_back("--bwlimit=" + std::to_string(options.bandwidth_limit_kbps));
    }
    args.push_back(source.back() == '/' ? source : source + "/");
    args.push_back(destination.back() == '/' ? destination : destination + "/");

    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        KHEPRI_LOG_ERROR("copy", "pipe2 failed: %s", strerror(errno));
        return false;
    }
    unique_fd read_end(fds[0]);
    unique_fd write_end(fds[1]);

    pid_t pid = fork();
    if (pid < 0) {
        KHEPRI_LOG_ERROR("copy", "fork failed: %s", strerror(errno));
        return false;
    }

    if (pid == 0) {
        // Mask and ignored dispositions survive exec; rsync needs the defaults.
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        signal(SIGPIPE, SIG_DFL);

        setpgid(0, 0);
        dup2(write_end.get(), STDOUT_FILENO);
        dup2(write_end.get(), STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        execv(argv[0], argv.data());
        _exit(127);
    }

    setpgid(pid, pid);
    write_end.reset();

    pid_ = pid;
    active_.store(true, std::memory_order_release);

    int out_fd = read_end.release();
    watcher_ = std::thread([this, out_fd, pid, source] { watch(out_fd, pid, source); });
#if defined(__linux__)
    pthread_setname_np(watcher_.native_handle(), "khepri-copy");
#endif

    KHEPRI_LOG_INFO("copy", "Started rsync (PID=%d): %s -> %s", pid, source.c_str(), destination.c_str());
    return true;
}

void RsyncCopyEngine::watch(int out_fd, pid_t pid, std::string source) {
    khepri_block_signals_in_worker_threads();
    unique_fd fd(out_fd);
    std::string pending;
    char buf[4096];

    for (;;) {
        ssize_t n = read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            KHEPRI_LOG_WARN("copy", "Reading rsync output failed: %s", strerror(errno));
            break;
        }
        if (n == 0) break;

        for (ssize_t i = 0; i < n; ++i) {
            char c = buf[i];
            if (c == '\r' || c == '\n') {
                if (!pending.empty()) handle_line(pending, source);
                pending.clear();
            } else {
                pending.push_back(c);
            }
        }
    }
    if (!pending.empty()) handle_line(pending, source);
    fd.reset();

    CopyResult result;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);

    if (r < 0) {
        result.message = std::string("waitpid failed: ") + strerror(errno);
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.success = result.exit_code == 0;
        result.message = result.success ? "completed" : "rsync exited with code " + std::to_string(result.exit_code);
    } else if (WIFSIGNALED(status)) {
        result.message = "rsync terminated by signal " + std::to_string(WTERMSIG(status));
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        pid_ = -1;
    }
    active_.store(false, std::memory_order_release);

    if (result.success) {
        KHEPRI_LOG_INFO("copy", "rsync (PID=%d) finished: %s", pid, result.message.c_str());
    } else {
        KHEPRI_LOG_ERROR("copy", "rsync (PID=%d) failed: %s", pid, result.message.c_str());
    }

    if (on_completed_) on_completed_(result);
}

bool RsyncCopyEngine::signal_group(int sig) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (pid_ <= 0) return false;
    if (kill(-pid_, sig) != 0) {
        KHEPRI_LOG_WARN("copy", "kill(%d, %d) failed: %s", -pid_, sig, strerror(errno));
        return false;
    }
    return true;
}

bool RsyncCopyEngine::pause() {
    if (!signal_group(SIGSTOP)) return false;
    KHEPRI_LOG_INFO("copy", "rsync paused");
    return true;
}

bool RsyncCopyEngine::resume() {
    if (!signal_group(SIGCONT)) return false;
    KHEPRI_LOG_INFO("copy", "rsync resumed");
    return true;
}

void RsyncCopyEngine::stop() {
    if (active_.load(std::memory_order_acquire)) {
        KHEPRI_LOG_INFO("copy", "Stopping rsync");
        if (signal_group(SIGTERM)) {
            // A stopped process group only sees SIGTERM once continued.
            signal_group(SIGCONT);
        }

        auto deadline = std::chrono::steady_clock::now() + constants::COPY_STOP_GRACE;
        while (active_.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (active_.load(std::memory_order_acquire)) {
            KHEPRI_LOG_WARN("copy", "rsync not responding, sending SIGKILL");
            signal_group(SIGKILL);
        }
    }

    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id()) {
        watcher_.join();
    }
}

bool RsyncCopyEngine::active() const {
    return active_.load(std::memory_order_acquire);
}
