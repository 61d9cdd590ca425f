#include "recload/monitor.h"
#include "recload/archive.h"
#include "recload/log.h"
#include "recload/utilities.h"
#include "recload/worker_pool.h"

#include <cstddef>
#include <cstdio>
#include <utility>

namespace recload {

JobMonitor::JobMonitor(unsigned thread_count)
    : thread_count_(thread_count ? thread_count : 1),
      started_(std::chrono::steady_clock::now()) {}

JobMonitor::~JobMonitor() {
    stop_reporter();
}

void JobMonitor::attach_pool(WorkerPool* pool) {
    std::lock_guard<std::mutex> lk(mu_);
    pool_ = pool;
}

void JobMonitor::register_archive(const std::string& key, std::shared_ptr<ZipArchive> archive) {
    if (!archive) return;
    const auto& names = archive->entry_names();
    if (names.empty()) {
        archive->close();
        return;
    }
    ArchiveRef ref;
    ref.pending.insert(names.begin(), names.end());
    ref.archive = std::move(archive);

    std::lock_guard<std::mutex> lk(mu_);
    archives_[key].push_back(std::move(ref));
}

size_t JobMonitor::open_archives() const {
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = 0;
    for (const auto& kv : archives_) n += kv.second.size();
    return n;
}

void JobMonitor::close_archives() {
    std::map<std::string, std::vector<ArchiveRef>> left;
    {
        std::lock_guard<std::mutex> lk(mu_);
        left.swap(archives_);
    }
    for (auto& kv : left) {
        for (auto& ref : kv.second) {
            log_debug("closing " + ref.archive->path().string() + " with " +
                      std::to_string(ref.pending.size()) + " unprocessed entries");
            ref.archive->close();
        }
    }
}

bool JobMonitor::try_halt(std::exception_ptr cause) {
    WorkerPool* pool = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (halted_.load()) return false;
        halt_cause_ = cause;
        halted_.store(true);
        pool = pool_;
    }
    log_error("halting job: " + (cause ? exception_message(cause) : std::string("no cause given")));
    if (pool) {
        const size_t dropped = pool->shutdown_now();
        if (dropped) log_warn("dropped " + std::to_string(dropped) + " queued work units");
    }
    return true;
}

void JobMonitor::halt(std::exception_ptr cause) {
    (void)try_halt(std::move(cause));
}

bool JobMonitor::halted() const {
    return halted_.load();
}

std::exception_ptr JobMonitor::halt_cause() const {
    std::lock_guard<std::mutex> lk(mu_);
    return halt_cause_;
}

void JobMonitor::cleanup(const std::string& file_basename, const std::string& entry_path) {
    std::shared_ptr<ZipArchive> done;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = archives_.find(file_basename);
        if (it == archives_.end()) return; // plain file: nothing held open

        auto& refs = it->second;
        for (size_t i = 0; i < refs.size(); ++i) {
            auto pos = refs[i].pending.find(entry_path);
            if (pos == refs[i].pending.end()) continue;
            refs[i].pending.erase(pos);
            if (refs[i].pending.empty()) {
                done = std::move(refs[i].archive);
                refs.erase(refs.begin() + (std::ptrdiff_t)i);
                if (refs.empty()) archives_.erase(it);
            }
            break;
        }
    }
    log_debug("cleanup " + file_basename + " " + entry_path);
    if (done) done->close();
}

void JobMonitor::increment_skipped(const std::string& reason) {
    skipped_.fetch_add(1);
    log_debug("skipped: " + reason);
}

void JobMonitor::add(const std::string& uri, const TimedEvent& event) {
    records_.fetch_add(1);
    bytes_.fetch_add(event.bytes());
    if (log_enabled(LogLevel::Debug)) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.3f", event.duration_ms());
        log_debug("loaded " + uri + " bytes=" + std::to_string(event.bytes()) + " ms=" + buf);
    }
}

void JobMonitor::reset_worker_pool() {
    if (pool_reset_.exchange(true)) return;
    WorkerPool* pool = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        pool = pool_;
    }
    log_info("start id found, resizing worker pool to " + std::to_string(thread_count_) + " threads");
    if (pool) pool->resize(thread_count_);
}

void JobMonitor::record_failure(const std::string& context, const Error& error) {
    failed_.fetch_add(1);
    std::lock_guard<std::mutex> lk(mu_);
    failures_.push_back(UnitFailure{context, error});
}

std::vector<UnitFailure> JobMonitor::failures() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failures_;
}

MonitorStats JobMonitor::snapshot() const {
    MonitorStats s;
    s.records = records_.load();
    s.skipped = skipped_.load();
    s.committed = s.records >= s.skipped ? s.records - s.skipped : 0;
    s.failed = failed_.load();
    s.bytes = bytes_.load();
    s.elapsed_ms = std::chrono::duration<double, std::milli>(
                       std::chrono::steady_clock::now() - started_).count();
    if (s.elapsed_ms > 0.0) {
        s.records_per_sec = (double)s.records * 1000.0 / s.elapsed_ms;
        s.bytes_per_sec = (double)s.bytes * 1000.0 / s.elapsed_ms;
    }
    s.halted = halted_.load();
    std::exception_ptr cause = halt_cause();
    if (cause) s.halt_reason = exception_message(cause);
    return s;
}

void JobMonitor::start_reporter(unsigned interval_sec) {
    if (interval_sec == 0 || reporter_.joinable()) return;
    {
        std::lock_guard<std::mutex> lk(report_mu_);
        report_stop_ = false;
    }
    reporter_ = std::thread([this, interval_sec] { report_loop(interval_sec); });
}

void JobMonitor::stop_reporter() {
    {
        std::lock_guard<std::mutex> lk(report_mu_);
        report_stop_ = true;
    }
    report_cv_.notify_all();
    if (reporter_.joinable()) reporter_.join();
}

void JobMonitor::report_loop(unsigned interval_sec) {
    std::unique_lock<std::mutex> lk(report_mu_);
    while (!report_cv_.wait_for(lk, std::chrono::seconds(interval_sec), [&] { return report_stop_; })) {
        const MonitorStats s = snapshot();
        char rate[64];
        std::snprintf(rate, sizeof(rate), "%.1f", s.records_per_sec);
        log_info("progress records=" + std::to_string(s.records) +
                 " committed=" + std::to_string(s.committed) +
                 " skipped=" + std::to_string(s.skipped) +
                 " failed=" + std::to_string(s.failed) +
                 " bytes=" + std::to_string(s.bytes) +
                 " rec/s=" + rate);
    }
}

} // namespace recload
