#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "SnapshotDiff.h"

namespace bacnet_scan {

struct DiffTask {
    std::string path_a;
    std::string path_b;
    std::string output_dir; // merged graph goes to <output_dir>/<a>_vs_<b>.nt; empty = no output
};

// Owned queue of diff jobs served by a fixed set of worker threads. A job
// whose diff throws fails its future with that exception.
class DiffWorkerPool {
public:
    using DiffFunction = std::function<DiffOutcome(const std::string&, const std::string&, const std::string&)>;

    // diff defaults to diff_snapshot_files.
    explicit DiffWorkerPool(size_t workers, DiffFunction diff = DiffFunction());
    ~DiffWorkerPool();
    DiffWorkerPool(const DiffWorkerPool&) = delete;
    DiffWorkerPool& operator=(const DiffWorkerPool&) = delete;

    // Throws std::runtime_error after shutdown().
    std::future<DiffOutcome> submit(DiffTask task);
    size_t pending() const;
    size_t in_progress() const;
    // Finishes queued jobs, then joins the workers. Idempotent.
    void shutdown();

    static std::string merged_name(const std::string& path_a, const std::string& path_b);
private:
    struct Job {
        DiffTask task;
        std::promise<DiffOutcome> promise;
    };
    void worker_loop();
    void finish_job();

    DiffFunction diff_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    std::vector<std::thread> workers_;
    size_t active_ = 0;
    bool stopping_ = false;
};

}
