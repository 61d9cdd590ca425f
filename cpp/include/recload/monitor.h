#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "recload/errors.h"
#include "recload/timed_event.h"

namespace recload {

class WorkerPool;
class ZipArchive;

// Shared coordination object every loader of a job reports to.
// All methods may be called concurrently.
class Monitor {
public:
    virtual ~Monitor() = default;

    // Job-fatal: stop dispatching work. The first cause wins.
    virtual void halt(std::exception_ptr cause) = 0;
    virtual bool halted() const = 0;

    // A work unit identified by (file basename, entry path) is done with its input.
    virtual void cleanup(const std::string& file_basename, const std::string& entry_path) = 0;

    virtual void increment_skipped(const std::string& reason) = 0;

    // One call per record outcome, committed or skipped.
    virtual void add(const std::string& uri, const TimedEvent& event) = 0;

    // The start id was found: widen the pool to full concurrency. Idempotent.
    virtual void reset_worker_pool() = 0;
};

struct MonitorStats {
    uint64_t records{0};   // committed + skipped
    uint64_t committed{0};
    uint64_t skipped{0};
    uint64_t failed{0};    // work units that ended record-fatal
    uint64_t bytes{0};
    double elapsed_ms{0.0};
    double records_per_sec{0.0};
    double bytes_per_sec{0.0};
    bool halted{false};
    std::string halt_reason;
};

struct UnitFailure {
    std::string context; // uri or record path
    Error error;
};

class JobMonitor : public Monitor {
public:
    explicit JobMonitor(unsigned thread_count = 1);
    ~JobMonitor() override;

    JobMonitor(const JobMonitor&) = delete;
    JobMonitor& operator=(const JobMonitor&) = delete;

    // Pool to widen on reset_worker_pool() and to shut down on halt(). Not owned.
    void attach_pool(WorkerPool* pool);

    // Entries of `archive` report cleanup() under `key`, which must be unique per archive
    // (Job uses the archive's path). The archive is closed once every entry has been cleaned up.
    void register_archive(const std::string& key, std::shared_ptr<ZipArchive> archive);
    size_t open_archives() const;
    // Closes whatever is still registered (entries dropped by a halt never report).
    void close_archives();

    // Periodic progress lines on the log; 0 disables.
    void start_reporter(unsigned interval_sec);
    void stop_reporter();

    void record_failure(const std::string& context, const Error& error);
    std::vector<UnitFailure> failures() const;

    // halt() that tells whether this call was the one that halted the job.
    bool try_halt(std::exception_ptr cause);

    void halt(std::exception_ptr cause) override;
    bool halted() const override;
    void cleanup(const std::string& file_basename, const std::string& entry_path) override;
    void increment_skipped(const std::string& reason) override;
    void add(const std::string& uri, const TimedEvent& event) override;
    void reset_worker_pool() override;

    std::exception_ptr halt_cause() const;
    MonitorStats snapshot() const;
    bool pool_was_reset() const { return pool_reset_.load(); }

private:
    void report_loop(unsigned interval_sec);

    const unsigned thread_count_;
    const std::chrono::steady_clock::time_point started_;

    std::atomic<uint64_t> records_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> bytes_{0};

    std::atomic<bool> halted_{false};
    std::atomic<bool> pool_reset_{false};

    mutable std::mutex mu_;
    std::exception_ptr halt_cause_;
    WorkerPool* pool_{nullptr};
    std::vector<UnitFailure> failures_;

    struct ArchiveRef {
        std::shared_ptr<ZipArchive> archive;
        std::multiset<std::string> pending; // entries not yet cleaned up
    };
    std::map<std::string, std::vector<ArchiveRef>> archives_; // by registration key

    std::mutex report_mu_;
    std::condition_variable report_cv_;
    bool report_stop_{false};
    std::thread reporter_;
};

} // namespace recload
