// -----------------------------------------------------------------------------
// Khepri Relay: unattended relocation of per-user incoming data
// Spools incoming directories, copies them to the destination with rsync and
// keeps the local copy in a grace location
// -----------------------------------------------------------------------------

#include "khepri_common.hpp"
#include "khepri_config.hpp"
#include "khepri_copy.hpp"
#include "khepri_orchestrator.hpp"
#include "khepri_status.hpp"
#include "khepri_storage.hpp"
#include "khepri_system.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <fcntl.h>
#include <pwd.h>
#include <unistd.h>
#include <sys/file.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/capability.h>
#include <systemd/sd-daemon.h>

// CLI constants
constexpr const char* PID_DIR = "/run/khepri";
constexpr const char* PID_FILE = "/run/khepri/khepri-relay.pid";

static ConfigHolder khepri_config;

// -----------------------------------------------------------------------------
// Khepri Relay: ensures single instance
// -----------------------------------------------------------------------------
class PidFileLock {
    unique_fd fd_;
    std::string path_;

public:
    explicit PidFileLock(const std::string& path) : path_(path) {
        fd_.reset(open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
        if (!fd_) {
            KHEPRI_LOG_ERROR("khepri", "Cannot open pidfile %s: %s", path.c_str(), strerror(errno));
            throw std::runtime_error("pidfile open failed");
        }

        if (flock(fd_.get(), LOCK_EX | LOCK_NB) != 0) {
            if (errno == EWOULDBLOCK) {
                char buf[32];
                ssize_t n = read(fd_.get(), buf, sizeof(buf) - 1);
                if (n > 0) {
                    buf[n] = 0;
                    KHEPRI_LOG_ERROR("khepri", "Another instance already running (PID: %s)", khepri_trim(buf).c_str());
                } else {
                    KHEPRI_LOG_ERROR("khepri", "Another instance already running");
                }
                throw std::runtime_error("pidfile locked");
            }
            KHEPRI_LOG_ERROR("khepri", "flock failed on pidfile: %s", strerror(errno));
            throw std::runtime_error("pidfile lock failed");
        }

        if (ftruncate(fd_.get(), 0) != 0) {
            KHEPRI_LOG_WARN("khepri", "Failed to truncate pidfile %s: %s", path_.c_str(), strerror(errno));
        }
        lseek(fd_.get(), 0, SEEK_SET);
        char pid_str[32];
        snprintf(pid_str, sizeof(pid_str), "%d\n", getpid());
        ssize_t written = write(fd_.get(), pid_str, strlen(pid_str));
        if (written != static_cast<ssize_t>(strlen(pid_str))) {
            KHEPRI_LOG_WARN("khepri", "Short write to pidfile %s", path_.c_str());
        }
        fsync(fd_.get());

        KHEPRI_LOG_DEBUG("khepri", "Acquired pidfile lock: %s", path.c_str());
    }

    ~PidFileLock() {
        if (fd_) {
            if (ftruncate(fd_.get(), 0) != 0) {
                KHEPRI_LOG_WARN("khepri", "Failed to truncate pidfile %s on cleanup: %s",
                                path_.c_str(), strerror(errno));
            }
            unlink(path_.c_str());
        }
    }
};

static std::unique_ptr<PidFileLock> g_pid_lock;

// -----------------------------------------------------------------------------
// Khepri Relay: signal handling for graceful shutdown/reload
// -----------------------------------------------------------------------------
static std::atomic<bool> khepri_shutdown{false};
static std::atomic<bool> khepri_reload{false};
static std::atomic<bool> khepri_dump_metrics{false};
static std::atomic<int> khepri_shutdown_signal{0};

static void khepri_safe_signal_handler(int sig, siginfo_t* info, void* context) noexcept {
    (void)info;
    (void)context;

    if (sig == SIGHUP) {
        khepri_reload.store(true, std::memory_order_release);
        return;
    }
    if (sig == SIGUSR1) {
        khepri_dump_metrics.store(true, std::memory_order_release);
        return;
    }

    // SIGTERM / SIGINT
    if (!khepri_shutdown.exchange(true, std::memory_order_acq_rel)) {
        khepri_shutdown_signal.store(sig, std::memory_order_release);
    }
}

static void khepri_install_signal_handlers() noexcept {
    struct sigaction sa{};
    sa.sa_sigaction = khepri_safe_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_SIGINFO | SA_RESTART;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
    sigaction(SIGUSR1, &sa, nullptr);

    signal(SIGPIPE, SIG_IGN);
}

// -----------------------------------------------------------------------------
// Khepri Relay: security, privilege dropping and isolation
// -----------------------------------------------------------------------------
static bool khepri_drop_capabilities() noexcept {
#ifdef __linux__
    cap_t caps = cap_get_proc();
    if (!caps) return false;

    cap_value_t cap_list[] = {
        CAP_DAC_OVERRIDE,
        CAP_DAC_READ_SEARCH,
        CAP_SYS_ADMIN,
        CAP_SYS_RAWIO,
        CAP_NET_ADMIN,
        CAP_SYS_PTRACE
    };
    const int ncaps = sizeof(cap_list) / sizeof(cap_list[0]);

    if (cap_set_flag(caps, CAP_EFFECTIVE, ncaps, cap_list, CAP_CLEAR) != 0 ||
        cap_set_flag(caps, CAP_PERMITTED, ncaps, cap_list, CAP_CLEAR) != 0 ||
        cap_set_flag(caps, CAP_INHERITABLE, ncaps, cap_list, CAP_CLEAR) != 0 ||
        cap_set_proc(caps) != 0) {
        cap_free(caps);
        return false;
    }

    cap_free(caps);
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        KHEPRI_LOG_WARN("khepri", "PR_SET_NO_NEW_PRIVS failed: %s", strerror(errno));
    }

    KHEPRI_LOG_INFO("khepri", "Dropped all dangerous capabilities");
    return true;
#else
    return true;
#endif
}

static bool khepri_drop_privileges(const Config& cfg) noexcept {
    if (getuid() == 0 && !cfg.run_as_user.empty()) {
        struct passwd* pw = getpwnam(cfg.run_as_user.c_str());
        if (!pw) {
            KHEPRI_LOG_ERROR("khepri", "User '%s' not found", cfg.run_as_user.c_str());
            return false;
        }

        if (setgid(pw->pw_gid) != 0) {
            KHEPRI_LOG_ERROR("khepri", "setgid failed: %s", strerror(errno));
            return false;
        }

        if (setuid(pw->pw_uid) != 0) {
            KHEPRI_LOG_ERROR("khepri", "setuid failed: %s", strerror(errno));
            return false;
        }

        if (!khepri_drop_capabilities()) {
            KHEPRI_LOG_WARN("khepri", "Failed to drop capabilities, continuing with reduced security");
        }

        KHEPRI_LOG_INFO("khepri", "Dropped privileges to UID=%d GID=%d", pw->pw_uid, pw->pw_gid);
    }

    return true;
}

static void khepri_set_resource_limits() noexcept {
#ifdef __linux__
    struct rlimit core_limit = {0, 0};
    if (setrlimit(RLIMIT_CORE, &core_limit) != 0) {
        KHEPRI_LOG_WARN("khepri", "Cannot disable core dumps: %s", strerror(errno));
    }

    prctl(PR_SET_DUMPABLE, 0);

    KHEPRI_LOG_DEBUG("khepri", "Resource limits and security settings applied");
#endif
}

// -----------------------------------------------------------------------------
// Khepri Relay: integration with systemd for status notifications
// -----------------------------------------------------------------------------
#ifdef __linux__
class SystemdNotifier {
    std::atomic<bool> ready_{false};

public:
    void notify_ready() noexcept {
        if (ready_.exchange(true)) return;

        char buf[256];
        snprintf(buf, sizeof(buf),
                 "READY=1\n"
                 "STATUS=Khepri relay operational\n"
                 "MAINPID=%lu",
                 (unsigned long)getpid());

        sd_notify(0, buf);

        const char* watchdog_usec = getenv("WATCHDOG_USEC");
        if (watchdog_usec) {
            try {
                uint64_t usec = std::stoull(watchdog_usec);
                if (usec > 0) {
                    start_watchdog_pinger(usec / 2);
                }
            } catch (const std::exception& e) {
                KHEPRI_LOG_WARN("khepri", "Ignoring WATCHDOG_USEC='%s': %s", watchdog_usec, e.what());
            }
        }
    }

    void notify_reloading() noexcept {
        sd_notify(0, "RELOADING=1\nSTATUS=Reloading configuration");
    }

    void notify_reloaded() noexcept {
        sd_notify(0, "READY=1\nSTATUS=Khepri relay operational");
    }

    void notify_stopping() noexcept {
        sd_notify(0, "STOPPING=1\nSTATUS=Shutting down");
    }

    void update_status(const char* status) noexcept {
        char buf[256];
        snprintf(buf, sizeof(buf), "STATUS=%s", status);
        sd_notify(0, buf);
    }

private:
    void start_watchdog_pinger(uint64_t interval_usec) {
        std::thread([interval_usec] {
            khepri_block_signals_in_worker_threads();
            while (!khepri_shutdown.load(std::memory_order_acquire)) {
                std::this_thread::sleep_for(std::chrono::microseconds(interval_usec));
                sd_notify(0, "WATCHDOG=1");
            }
        }).detach();
    }
};

static SystemdNotifier g_systemd_notifier;
#endif

// -----------------------------------------------------------------------------
// Khepri Relay: runtime handling of SIGHUP and SIGUSR1
// -----------------------------------------------------------------------------
static void khepri_handle_config_reload(KhepriOrchestrator& orchestrator) noexcept {
    if (!khepri_reload.exchange(false, std::memory_order_acq_rel)) return;

#ifdef __linux__
    g_systemd_notifier.notify_reloading();
#endif
    auto cfg = khepri_load_config_from_env();
    if (!cfg) {
        KHEPRI_LOG_ERROR("khepri", "Failed to reload config, keeping previous configuration");
    } else {
        auto previous = khepri_config.load();
        if (previous && previous->service_timer_ms != cfg->service_timer_ms) {
            KHEPRI_LOG_INFO("khepri", "Service timer changes from %d to %d ms",
                            previous->service_timer_ms, cfg->service_timer_ms);
        }
        khepri_config.store(cfg);
        orchestrator.reload(cfg);
        KHEPRI_LOG_INFO("khepri", "Config reloaded via SIGHUP");
    }
#ifdef __linux__
    g_systemd_notifier.notify_reloaded();
#endif
}

static void khepri_handle_metrics_dump() noexcept {
    if (!khepri_dump_metrics.exchange(false, std::memory_order_acq_rel)) return;

    char buf[2048];
    if (khepri_get_metrics(buf, sizeof(buf)) < 0) {
        KHEPRI_LOG_WARN("khepri", "Metrics do not fit the output buffer");
        return;
    }
    KHEPRI_LOG_INFO("metrics", "\n%s", buf);
}

// -----------------------------------------------------------------------------
// CLI Command implementations
// -----------------------------------------------------------------------------

// Double fork daemonization (classic Unix daemon)
static void daemonize() noexcept {
    pid_t pid = fork();
    if (pid < 0) {
        std::exit(1);
    }
    if (pid > 0) {
        std::exit(0);  // Parent exits
    }

    if (setsid() < 0) {
        std::exit(1);
    }

    pid = fork();
    if (pid < 0) {
        std::exit(1);
    }
    if (pid > 0) {
        std::exit(0);  // First child exits
    }

    umask(027);
    if (chdir("/") != 0) {
        std::exit(1);
    }

    int fd = open("/dev/null", O_RDWR);
    if (fd >= 0) {
        dup2(fd, STDIN_FILENO);
        dup2(fd, STDOUT_FILENO);
        dup2(fd, STDERR_FILENO);
        if (fd > 2) close(fd);
    }
}

static pid_t khepri_read_pidfile() noexcept {
    FILE* f = fopen(PID_FILE, "r");
    if (!f) return -1;
    pid_t pid = -1;
    if (fscanf(f, "%d", &pid) != 1) {
        pid = 0;
    }
    fclose(f);
    return pid;
}

// Shared by start and foreground; only start forks, and only with DAEMONIZE set.
static int khepri_run_service(bool foreground) noexcept {
    auto cfg = khepri_load_config_from_env();
    if (!cfg) {
        fprintf(stderr, "ERROR: Invalid configuration, refusing to start\n");
        return 1;
    }
    khepri_config.store(cfg);
    const bool daemon = !foreground && cfg->daemonize;

    if (mkdir(PID_DIR, 0755) != 0 && errno != EEXIST) {
        fprintf(stderr, "ERROR: Cannot create %s: %s\n", PID_DIR, strerror(errno));
        return 1;
    }

    pid_t running = khepri_read_pidfile();
    if (running > 0 && kill(running, 0) == 0) {
        fprintf(stderr, "ERROR: Khepri relay already running (PID %d)\n", running);
        return 1;
    }

    if (daemon) {
        daemonize();
    }

    khepri_log_init("khepri-relay", cfg->use_syslog);
    khepri_set_daemon_mode(daemon);

    try {
        g_pid_lock = std::make_unique<PidFileLock>(PID_FILE);
    } catch (const std::exception& e) {
        KHEPRI_LOG_ERROR("khepri", "Failed to acquire pidfile lock: %s", e.what());
        khepri_log_close();
        return 1;
    }

    khepri_install_signal_handlers();
    khepri_set_resource_limits();

    if (!khepri_drop_privileges(*cfg)) {
        g_pid_lock.reset();
        khepri_log_close();
        return 1;
    }

    int rc = 0;
    try {
        StatusStore status(cfg->status_file);
        LinuxHostProbe probe;
        RsyncCopyEngine engine(cfg->rsync_path);
        KhepriOrchestrator orchestrator(cfg, status, probe, engine);

#ifdef __linux__
        orchestrator.notifier().set_status_sink([](const std::string& line) {
            g_systemd_notifier.update_status(line.c_str());
        });
#endif

        if (!orchestrator.initialize()) {
            KHEPRI_LOG_ERROR("khepri", "Startup checks failed, exiting");
            rc = 1;
        } else {
            orchestrator.start();
#ifdef __linux__
            g_systemd_notifier.notify_ready();
#endif
            KHEPRI_LOG_INFO("khepri", "Daemon started successfully");

            while (!khepri_shutdown.load(std::memory_order_acquire)) {
                khepri_handle_config_reload(orchestrator);
                khepri_handle_metrics_dump();
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

            KHEPRI_LOG_INFO("khepri", "Received signal %d, initiating shutdown",
                            khepri_shutdown_signal.load(std::memory_order_acquire));
#ifdef __linux__
            g_systemd_notifier.notify_stopping();
#endif
            orchestrator.stop();
        }
    } catch (const std::exception& e) {
        KHEPRI_LOG_ERROR("khepri", "Fatal error: %s", e.what());
        rc = 1;
    }

    g_pid_lock.reset();
    if (rc == 0) {
        KHEPRI_LOG_INFO("khepri", "Khepri relay exited successfully");
    }
    khepri_log_close();
    return rc;
}

// Command: start
static int cmd_start() noexcept {
    return khepri_run_service(false);
}

// Command: foreground
static int cmd_foreground() noexcept {
    return khepri_run_service(true);
}

// Command: stop
static int cmd_stop() noexcept {
    pid_t pid = khepri_read_pidfile();
    if (pid < 0) {
        printf("INFO: Khepri relay not running (no pidfile)\n");
        return 0;
    }
    if (pid == 0) {
        fprintf(stderr, "ERROR: Invalid pidfile\n");
        unlink(PID_FILE);
        return 1;
    }

    if (kill(pid, SIGTERM) != 0) {
        if (errno == ESRCH) {
            unlink(PID_FILE);
            printf("INFO: Process not found, stale pidfile removed\n");
            return 0;
        }
        perror("kill(SIGTERM)");
        return 1;
    }

    for (int i = 0; i < 100; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (kill(pid, 0) != 0 && errno == ESRCH) {
            unlink(PID_FILE);
            printf("Khepri relay stopped gracefully\n");
            return 0;
        }

        if (i == 20 && kill(pid, SIGINT) != 0 && errno != ESRCH) {
            perror("kill(SIGINT)");
        }
    }

    fprintf(stderr, "WARNING: Process %d not responding, sending SIGKILL\n", pid);

    if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        perror("kill(SIGKILL)");
        return 1;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    unlink(PID_FILE);

    printf("Khepri relay force stopped\n");
    return 0;
}

static void khepri_print_status_record() noexcept {
    std::string path = Config().status_file;
    if (const char* v = getenv("STATUS_FILE")) path = v;

    try {
        StatusStore status(path);
        if (!status.load()) {
            printf("No readable status record at %s\n", path.c_str());
            return;
        }
        printf("%s\n", status.summary().c_str());
    } catch (const std::exception& e) {
        fprintf(stderr, "ERROR: Reading %s failed: %s\n", path.c_str(), e.what());
    }
}

// Command: status
static int cmd_status() noexcept {
    khepri_set_log_level("error");

    pid_t pid = khepri_read_pidfile();
    int rc;
    if (pid < 0) {
        printf("Service status: STOPPED\n");
        rc = 3;
    } else if (pid == 0) {
        printf("Service status: STOPPED (corrupted pidfile)\n");
        rc = 3;
    } else if (kill(pid, 0) == 0) {
        printf("Service status: RUNNING (PID %d)\n", pid);
        rc = 0;
    } else {
        unlink(PID_FILE);
        printf("Service status: STOPPED (stale pidfile removed)\n");
        rc = 3;
    }

    khepri_print_status_record();
    return rc;
}

// Command: grace-report
static int cmd_grace_report() noexcept {
    auto cfg = khepri_load_config_from_env();
    if (!cfg) {
        fprintf(stderr, "ERROR: Invalid configuration\n");
        return 1;
    }

    try {
        LinuxHostProbe probe;
        StorageStatus storage(cfg->done_path(), cfg->space_monitoring, cfg->grace_period_days,
                              std::chrono::seconds(cfg->storage_update_sec), probe);
        storage.update_free_space(true);
        storage.update_grace(true);

        printf("Free space:\n%s\n\n%s\n", storage.free_space_summary().c_str(),
               storage.grace_summary().c_str());
    } catch (const std::exception& e) {
        fprintf(stderr, "ERROR: Grace report failed: %s\n", e.what());
        return 1;
    }
    return 0;
}

// -----------------------------------------------------------------------------
// Khepri Relay: entry point and CLI handling
// -----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s {start|stop|status|foreground|grace-report}\n", argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "start") {
        return cmd_start();
    } else if (cmd == "stop") {
        return cmd_stop();
    } else if (cmd == "status") {
        return cmd_status();
    } else if (cmd == "foreground") {
        return cmd_foreground();
    } else if (cmd == "grace-report") {
        return cmd_grace_report();
    }

    fprintf(stderr, "ERROR: Unknown command: %s\n", cmd.c_str());
    return 1;
}
