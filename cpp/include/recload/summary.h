#pragma once
#include <filesystem>

#include <nlohmann/json.hpp>

#include "recload/config.h"
#include "recload/job.h"
#include "recload/monitor.h"

namespace recload {

nlohmann::json stats_to_json(const MonitorStats& s);

// {"status": ..., "stats": {...}, "failures": [...], "config": {...}, "finished_at_utc": ...}
nlohmann::json summary_to_json(const JobResult& r, const Configuration& cfg);

// Writes <p>.tmp then renames it over <p>. false on failure (already logged).
bool write_summary(const std::filesystem::path& p, const nlohmann::json& j);

// 0 ok, 2 halted, 3 finished with failed units
int exit_status(const JobResult& r);

} // namespace recload
