// recload/cpp/src/job.cpp
#include "recload/job.h"
#include "recload/errors.h"
#include "recload/loader.h"
#include "recload/log.h"
#include "recload/worker_pool.h"

#include <algorithm>
#include <regex>
#include <sstream>
#include <utility>

#include "text_common.h"

namespace fs = std::filesystem;

namespace recload {

namespace {

// What a Loader working on one archive entry reports to. Cleanup goes out under
// the archive's path, since two archives in different directories may share a name.
class ArchiveEntryMonitor : public Monitor {
public:
    ArchiveEntryMonitor(JobMonitor& job, std::string key)
        : job_(job), key_(std::move(key)) {}

    void halt(std::exception_ptr cause) override { job_.halt(std::move(cause)); }
    bool halted() const override { return job_.halted(); }
    void cleanup(const std::string&, const std::string& entry_path) override { job_.cleanup(key_, entry_path); }
    void increment_skipped(const std::string& reason) override { job_.increment_skipped(reason); }
    void add(const std::string& uri, const TimedEvent& event) override { job_.add(uri, event); }
    void reset_worker_pool() override { job_.reset_worker_pool(); }

private:
    JobMonitor& job_;
    const std::string key_;
};

std::string archive_key(const WorkUnit& unit) {
    return unit.file.lexically_normal().string();
}

} // namespace

bool is_zip_name(const std::string& name) {
    const std::string n = to_lower_copy(name);
    return n.size() > 4 && n.compare(n.size() - 4, 4, ".zip") == 0;
}

Job::Job(Configuration cfg) {
    cfg.validate();
    cfg_ = std::make_shared<const Configuration>(std::move(cfg));
    decoder_ = cfg_->decoder();
    monitor_ = std::make_unique<JobMonitor>(cfg_->thread_count());
}

bool Job::halt(const std::string& reason) {
    return monitor_->try_halt(std::make_exception_ptr(FatalError(reason)));
}

std::vector<WorkUnit> Job::discover_files(const fs::path& root) const {
    std::vector<WorkUnit> out;
    std::error_code ec;

    // an explicitly named file is taken as is
    if (fs::is_regular_file(root, ec)) {
        const std::string name = root.filename().string();
        out.push_back(WorkUnit{root, name, name, nullptr});
        return out;
    }
    if (!fs::is_directory(root, ec)) throw IoError("no such file or directory: " + root.string());

    const std::regex re(cfg_->input_pattern());

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) { ec.clear(); continue; }
        if (!it->is_regular_file(ec) || ec) { ec.clear(); continue; }

        const fs::path p = it->path();
        const std::string name = p.filename().string();
        if (!std::regex_match(name, re)) continue;

        std::string rel = fs::relative(p, root, ec).generic_string();
        if (ec || rel.empty()) { ec.clear(); rel = name; }
        out.push_back(WorkUnit{p, name, rel, nullptr});
    }

    std::sort(out.begin(), out.end(), [](const WorkUnit& a, const WorkUnit& b) {
        return a.record_path < b.record_path;
    });
    return out;
}

JobResult Job::run() {
    const bool resuming = cfg_->resume_point().active();
    const unsigned threads = resuming ? 1u : cfg_->thread_count();
    if (resuming) log_info("scanning for START_ID " + cfg_->start_id().value_or("") + " with one worker");

    WorkerPool pool(threads, cfg_->queue_capacity());
    monitor_->attach_pool(&pool);
    monitor_->start_reporter(cfg_->report_interval_sec());

    try {
        for (const auto& input : cfg_->input_paths()) {
            if (monitor_->halted()) break;

            std::vector<WorkUnit> units;
            try {
                units = discover_files(input);
            } catch (const IoError& e) {
                log_warn(std::string("skipping input: ") + e.what());
                monitor_->record_failure(input, Error{e.code(), e.what()});
                if (cfg_->fatal_errors()) monitor_->halt(std::current_exception());
                continue;
            }
            log_debug("input " + input + ": " + std::to_string(units.size()) + " files");

            for (const auto& u : units) {
                if (monitor_->halted()) break;
                if (is_zip_name(u.basename)) expand_archive(pool, u);
                else dispatch(pool, u);
            }
        }
    } catch (const std::exception& e) {
        log_error(std::string("input discovery failed: ") + e.what());
        monitor_->halt(std::current_exception());
    }

    pool.close();
    try {
        pool.join();
    } catch (const std::exception&) {
        monitor_->halt(std::current_exception());
    }
    monitor_->attach_pool(nullptr);
    monitor_->stop_reporter();
    monitor_->close_archives();

    JobResult r;
    r.stats = monitor_->snapshot();
    r.failures = monitor_->failures();
    r.units = units_.load();
    r.halted = r.stats.halted;
    r.halt_reason = r.stats.halt_reason;

    log_info("finished units=" + std::to_string(r.units) +
             " committed=" + std::to_string(r.stats.committed) +
             " skipped=" + std::to_string(r.stats.skipped) +
             " failed=" + std::to_string(r.stats.failed) +
             (r.halted ? " halted: " + r.halt_reason : std::string()));
    return r;
}

void Job::expand_archive(WorkerPool& pool, const WorkUnit& zip_unit) {
    std::shared_ptr<ZipArchive> archive;
    try {
        archive = ZipArchive::open(zip_unit.file);
    } catch (const IoError& e) {
        log_warn(std::string("skipping archive: ") + e.what());
        monitor_->record_failure(zip_unit.file.string(), Error{e.code(), e.what()});
        if (cfg_->fatal_errors()) monitor_->halt(std::current_exception());
        return;
    }

    // copy: the registry may close the archive before this loop ends
    const std::vector<std::string> entries = archive->entry_names();
    monitor_->register_archive(archive_key(zip_unit), archive);

    for (const auto& name : entries) {
        if (monitor_->halted()) break;
        dispatch(pool, WorkUnit{zip_unit.file, zip_unit.basename, name, archive});
    }
}

void Job::dispatch(WorkerPool& pool, const WorkUnit& unit) {
    const auto& conns = cfg_->connection_strings();
    const std::string conn = conns[next_connection_.fetch_add(1) % conns.size()];

    units_.fetch_add(1);
    if (!pool.submit([this, unit, conn] { run_unit(unit, conn); })) {
        units_.fetch_sub(1);
        if (unit.archive) monitor_->cleanup(archive_key(unit), unit.record_path);
    }
}

void Job::run_unit(const WorkUnit& unit, const std::string& connection) {
    if (monitor_->halted()) {
        if (unit.archive) monitor_->cleanup(archive_key(unit), unit.record_path);
        return;
    }

    const std::string where = unit.archive ? unit.file.string() + "!" + unit.record_path
                                           : unit.file.string();
    ArchiveEntryMonitor entry_monitor(*monitor_, unit.archive ? archive_key(unit) : std::string());
    LoadResult r;
    {
        Loader loader;
        try {
            loader.set_configuration(cfg_);
            loader.set_monitor(unit.archive ? static_cast<Monitor*>(&entry_monitor) : monitor_.get());
            loader.set_file_basename(unit.basename);
            loader.set_record_path(unit.record_path);
            if (unit.archive) {
                loader.bind_input(std::make_unique<std::istringstream>(unit.archive->read_entry(unit.record_path)),
                                  decoder_);
            } else {
                loader.bind_input(unit.file, decoder_);
            }
            loader.set_connection_uri(connection);
            r = loader.execute();
        } catch (const LoaderException& e) {
            log_warn("Exception " + std::string(e.what()) + " while preparing " + where);
            r.outcome = Outcome::RecordFatal;
            r.error = Error{e.code(), e.what()};
            r.cause = std::current_exception();
            r.context = where;
        } catch (const std::exception& e) {
            log_error("cannot prepare " + where + ": " + e.what());
            monitor_->halt(std::current_exception());
            return;
        } catch (...) {
            log_error("cannot prepare " + where + ": non-standard exception");
            monitor_->halt(std::current_exception());
            return;
        }
    }

    log_debug(where + ": " + outcome_name(r.outcome) + " committed=" + std::to_string(r.committed) +
              " skipped=" + std::to_string(r.skipped));
    if (r.outcome == Outcome::RecordFatal) {
        monitor_->record_failure(r.context.empty() ? where : r.context, r.error);
        if (cfg_->fatal_errors()) monitor_->halt(r.cause);
    }
}

} // namespace recload
