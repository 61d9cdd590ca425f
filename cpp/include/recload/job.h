// recload/cpp/include/recload/job.h
#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "recload/archive.h"
#include "recload/charset.h"
#include "recload/config.h"
#include "recload/monitor.h"

namespace recload {

// One input for one Loader: a plain file or one entry of a zip archive.
struct WorkUnit {
    std::filesystem::path file;           // the file itself, or the archive
    std::string basename;                 // file name (archive name for entries)
    std::string record_path;              // relative to the input root, or the entry name
    std::shared_ptr<ZipArchive> archive;  // set for archive entries
};

struct JobResult {
    MonitorStats stats;
    std::vector<UnitFailure> failures;
    uint64_t units{0};  // work units dispatched
    bool halted{false};
    std::string halt_reason;
};

// Walks the configured inputs and runs one Loader per work unit on a worker pool.
class Job {
public:
    explicit Job(Configuration cfg);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    // Blocks until every dispatched unit is done or the job halted.
    JobResult run();

    // Operator abort: no new units are dispatched, queued ones are dropped.
    // false if the job had already halted.
    bool halt(const std::string& reason);

    JobMonitor& monitor() { return *monitor_; }
    const Configuration& configuration() const { return *cfg_; }

    // Files under `root` whose names match input_pattern, sorted; `root` may be a file.
    std::vector<WorkUnit> discover_files(const std::filesystem::path& root) const;

private:
    void dispatch(WorkerPool& pool, const WorkUnit& unit);
    void run_unit(const WorkUnit& unit, const std::string& connection);
    void expand_archive(WorkerPool& pool, const WorkUnit& zip_unit);

    std::shared_ptr<const Configuration> cfg_;
    std::shared_ptr<const CharsetDecoder> decoder_;
    std::unique_ptr<JobMonitor> monitor_;
    std::atomic<uint64_t> next_connection_{0};
    std::atomic<uint64_t> units_{0};
};

// true for names ending in ".zip" (any case)
bool is_zip_name(const std::string& name);

} // namespace recload
