#pragma once

// -----------------------------------------------------------------------------
// Khepri Relay: copy engine boundary and the rsync-backed implementation
// -----------------------------------------------------------------------------

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <sys/types.h>

struct CopyOptions {
    uint64_t bandwidth_limit_kbps = 0;
};

struct CopyResult {
    bool success = false;
    int exit_code = -1;
    std::string message;
};

// Drives one external copy at a time. Callbacks arrive on a thread owned by
// the engine, never on the caller's thread.
class CopyEngine {
public:
    using FileStartedFn = std::function<void(const std::string& name, uint64_t size)>;
    using ProgressFn = std::function<void(double percent_of_file)>;
    using CompletedFn = std::function<void(const CopyResult& result)>;

    virtual ~CopyEngine() = default;

    void set_callbacks(FileStartedFn file_started, ProgressFn progress, CompletedFn completed) {
        on_file_started_ = std::move(file_started);
        on_progress_ = std::move(progress);
        on_completed_ = std::move(completed);
    }

    // Fails when a copy is already active.
    virtual bool start(const std::string& source, const std::string& destination,
                       const CopyOptions& options) = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;

    // Best-effort; returns once the copy process is gone.
    virtual void stop() = 0;

    virtual bool active() const = 0;

protected:
    FileStartedFn on_file_started_;
    ProgressFn on_progress_;
    CompletedFn on_completed_;
};

enum class RsyncLineKind { Ignored, FileStarted, Progress };

struct RsyncLine {
    RsyncLineKind kind = RsyncLineKind::Ignored;
    std::string name;
    double percent = 0;
};

class RsyncCopyEngine : public CopyEngine {
public:
    explicit RsyncCopyEngine(std::string rsync_path);
    ~RsyncCopyEngine() override;

    RsyncCopyEngine(const RsyncCopyEngine&) = delete;
    RsyncCopyEngine& operator=(const RsyncCopyEngine&) = delete;

    bool start(const std::string& source, const std::string& destination,
               const CopyOptions& options) override;
    bool pause() override;
    bool resume() override;
    void stop() override;
    bool active() const override;

    // Classifies one line of "rsync --progress" output.
    static RsyncLine parse_output_line(const std::string& line);

private:
    void watch(int out_fd, pid_t pid, std::string source);
    void handle_line(const std::string& line, const std::string& source);
    bool signal_group(int sig);

    std::string rsync_path_;
    mutable std::mutex mtx_;
    pid_t pid_ = -1;
    std::atomic<bool> active_{false};
    std::thread watcher_;
};
