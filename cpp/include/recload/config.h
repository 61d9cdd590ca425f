#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "recload/charset.h"
#include "recload/format.h"
#include "recload/log.h"

namespace recload {

// The job-wide "skip until this identifier" marker.
// Shared by every loader of a job; cleared at most once.
class ResumePoint {
public:
    enum class Decision {
        Inactive, // no start id pending: process normally
        Mismatch, // still scanning: skip this record
        Matched,  // this caller found the start id and cleared it
    };

    ResumePoint() = default;
    explicit ResumePoint(std::optional<std::string> id);

    bool active() const { return active_.load(std::memory_order_acquire); }
    std::optional<std::string> get() const;
    void set(std::optional<std::string> id);

    // Compares and, on a match, clears under one lock: only one caller sees Matched.
    // On Mismatch, *expected receives the pending start id.
    Decision evaluate(const std::string& id, std::string* expected = nullptr);

private:
    mutable std::mutex mu_;
    std::optional<std::string> id_;
    std::atomic<bool> active_{false};
};

class Configuration {
public:
    Configuration();

    static Configuration from_json(const nlohmann::json& j);
    static Configuration from_file(const std::filesystem::path& p);

    // Applies one "key" = "value" setting (JSON keys, env and CLI share these names).
    // Throws std::invalid_argument for unknown keys and bad values.
    void set(const std::string& key, const std::string& value);

    // RECLOAD_<KEY> variables override whatever is set.
    void apply_env();

    // Throws FatalError on an unusable configuration.
    void validate() const;

    // -- resume --
    ResumePoint& resume_point() const { return *resume_; }
    std::optional<std::string> start_id() const { return resume_->get(); }
    void set_start_id(std::optional<std::string> id) const { resume_->set(std::move(id)); }

    // -- connection --
    const std::vector<std::string>& connection_strings() const { return connection_strings_; }
    const std::string& content_factory() const { return content_factory_; }

    // -- input --
    const std::vector<std::string>& input_paths() const { return input_paths_; }
    void add_input_path(const std::string& p) { input_paths_.push_back(p); }
    const std::string& input_pattern() const { return input_pattern_; }
    const std::string& input_encoding() const { return input_encoding_; }
    MalformedInputAction input_malformed_action() const { return malformed_action_; }
    std::shared_ptr<const CharsetDecoder> decoder() const;
    bool input_normalize_paths() const { return input_normalize_paths_; }
    const std::string& input_strip_prefix() const { return input_strip_prefix_; }
    const std::string& loader() const { return loader_; }
    const std::string& id_name() const { return id_name_; }
    const std::string& content_key() const { return content_key_; }
    char field_delimiter() const { return field_delimiter_; }
    size_t id_field_index() const { return id_field_index_; }

    // -- output --
    bool use_filename_ids() const { return use_filename_ids_ || id_name_ == FILENAME_ID; }
    bool use_filename_collection() const { return use_filename_collection_; }
    const std::vector<std::string>& output_collections() const { return output_collections_; }
    // Ends with '/' whenever it is not empty.
    std::string uri_prefix() const;
    const std::string& uri_suffix() const { return uri_suffix_; }
    bool skip_existing() const { return skip_existing_; }
    bool error_existing() const { return error_existing_; }
    DocumentFormat format() const { return format_; }

    // -- job --
    unsigned thread_count() const { return thread_count_; }
    size_t queue_capacity() const;
    bool fatal_errors() const { return fatal_errors_; }
    LogLevel log_level() const { return log_level_; }
    unsigned report_interval_sec() const { return report_interval_sec_; }
    int status_port() const { return status_port_; }
    const std::string& summary_path() const { return summary_path_; }

    nlohmann::json to_json() const;

    static constexpr const char* FILENAME_ID = "#FILENAME";

private:
    std::shared_ptr<ResumePoint> resume_;

    std::vector<std::string> connection_strings_{"sqlite:recload.sqlite"};
    std::string content_factory_{"sqlite"};

    std::vector<std::string> input_paths_;
    std::string input_pattern_{".+"};
    std::string input_encoding_{"UTF-8"};
    MalformedInputAction malformed_action_{MalformedInputAction::Report};
    bool input_normalize_paths_{false};
    std::string input_strip_prefix_;
    std::string loader_{"file"};
    std::string id_name_{FILENAME_ID};
    std::string content_key_{"content"};
    char field_delimiter_{','};
    size_t id_field_index_{0};

    bool use_filename_ids_{false};
    bool use_filename_collection_{false};
    std::vector<std::string> output_collections_;
    std::string uri_prefix_;
    std::string uri_suffix_;
    bool skip_existing_{false};
    bool error_existing_{false};
    DocumentFormat format_{DocumentFormat::Xml};

    unsigned thread_count_{1};
    size_t queue_capacity_{0}; // 0 => 4 * threads
    bool fatal_errors_{true};
    LogLevel log_level_{LogLevel::Info};
    unsigned report_interval_sec_{60};
    int status_port_{0};
    std::string summary_path_;
};

} // namespace recload
