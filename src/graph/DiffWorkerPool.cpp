#include "DiffWorkerPool.h"
#include "../core/Logging.h"
#include <filesystem>
#include <exception>
#include <stdexcept>
#include <utility>

namespace bacnet_scan {

DiffWorkerPool::DiffWorkerPool(size_t workers, DiffFunction diff) : diff_(std::move(diff)) {
    if(!diff_) diff_ = diff_snapshot_files;
    if(workers == 0) workers = 1;
    for(size_t i = 0; i < workers; ++i) workers_.emplace_back([this]{ worker_loop(); });
}

DiffWorkerPool::~DiffWorkerPool(){ shutdown(); }

std::string DiffWorkerPool::merged_name(const std::string& path_a, const std::string& path_b){
    namespace fs = std::filesystem;
    return fs::path(path_a).stem().string() + "_vs_" + fs::path(path_b).stem().string() + ".nt";
}

std::future<DiffOutcome> DiffWorkerPool::submit(DiffTask task){
    std::lock_guard<std::mutex> lock(mutex_);
    if(stopping_) throw std::runtime_error("diff worker pool is shut down");
    queue_.push_back(Job{std::move(task), std::promise<DiffOutcome>()});
    auto fut = queue_.back().promise.get_future();
    cv_.notify_one();
    return fut;
}

size_t DiffWorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t DiffWorkerPool::in_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void DiffWorkerPool::shutdown(){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for(auto& t : workers_) if(t.joinable()) t.join();
    workers_.clear();
}

void DiffWorkerPool::finish_job(){
    std::lock_guard<std::mutex> lock(mutex_);
    --active_;
}

void DiffWorkerPool::worker_loop(){
    while(true){
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]{ return stopping_ || !queue_.empty(); });
            if(queue_.empty()) return; // stopping and drained
            job = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }
        std::string out;
        if(!job.task.output_dir.empty()){
            out = (std::filesystem::path(job.task.output_dir) / merged_name(job.task.path_a, job.task.path_b)).string();
            std::error_code ec;
            std::filesystem::create_directories(job.task.output_dir, ec);
        }
        Logger::instance().debug("diff worker: " + job.task.path_a + " vs " + job.task.path_b);
        try {
            DiffOutcome outcome = diff_(job.task.path_a, job.task.path_b, out);
            finish_job();
            job.promise.set_value(std::move(outcome));
        } catch(const std::exception& ex){
            Logger::instance().error("diff worker: " + job.task.path_a + " vs " + job.task.path_b + " failed: " + ex.what());
            finish_job();
            job.promise.set_exception(std::current_exception());
        }
    }
}

}
