#include "recload/summary.h"
#include "recload/format.h"
#include "recload/log.h"

#include <fstream>

using json = nlohmann::json;

namespace recload {

static bool write_text_file_tmp(const std::filesystem::path& tmp, const std::string& content) {
    std::ofstream out(tmp, std::ios::binary);
    if (!out) return false;
    out.write(content.data(), (std::streamsize)content.size());
    out.flush();
    return (bool)out;
}

json stats_to_json(const MonitorStats& s) {
    json j;
    j["records"] = s.records;
    j["committed"] = s.committed;
    j["skipped"] = s.skipped;
    j["failed"] = s.failed;
    j["bytes"] = s.bytes;
    j["elapsed_ms"] = s.elapsed_ms;
    j["records_per_sec"] = s.records_per_sec;
    j["bytes_per_sec"] = s.bytes_per_sec;
    j["halted"] = s.halted;
    if (s.halted) j["halt_reason"] = s.halt_reason;
    return j;
}

int exit_status(const JobResult& r) {
    if (r.halted) return 2;
    if (!r.failures.empty()) return 3;
    return 0;
}

json summary_to_json(const JobResult& r, const Configuration& cfg) {
    json j;
    const int rc = exit_status(r);
    j["status"] = rc == 0 ? "ok" : (rc == 2 ? "halted" : "failed_units");
    j["units"] = r.units;
    j["stats"] = stats_to_json(r.stats);

    json failures = json::array();
    for (const auto& f : r.failures) {
        failures.push_back({
            {"context", f.context},
            {"code", error_code_name(f.error.code)},
            {"message", f.error.message},
        });
    }
    j["failures"] = std::move(failures);
    j["config"] = cfg.to_json();
    j["finished_at_utc"] = utc_now_iso();
    return j;
}

bool write_summary(const std::filesystem::path& p, const json& j) {
    std::filesystem::path tmp = p;
    tmp += ".tmp";
    if (!write_text_file_tmp(tmp, j.dump(2))) {
        log_error("cannot write summary: " + tmp.string());
        return false;
    }
    return atomic_replace_file_best_effort(tmp, p);
}

} // namespace recload
