// recload/cpp/src/config.cpp
#include "recload/config.h"
#include "recload/errors.h"
#include "recload/utilities.h"

#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "text_common.h"

using json = nlohmann::json;

namespace recload {

// -------------------- ResumePoint --------------------

ResumePoint::ResumePoint(std::optional<std::string> id) {
    set(std::move(id));
}

std::optional<std::string> ResumePoint::get() const {
    std::lock_guard<std::mutex> lk(mu_);
    return id_;
}

void ResumePoint::set(std::optional<std::string> id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (id && id->empty()) id.reset();
    id_ = std::move(id);
    active_.store(id_.has_value(), std::memory_order_release);
}

ResumePoint::Decision ResumePoint::evaluate(const std::string& id, std::string* expected) {
    if (!active()) return Decision::Inactive;

    std::lock_guard<std::mutex> lk(mu_);
    if (!id_) return Decision::Inactive; // cleared by another loader meanwhile
    if (*id_ != id) {
        if (expected) *expected = *id_;
        return Decision::Mismatch;
    }
    id_.reset();
    active_.store(false, std::memory_order_release);
    return Decision::Matched;
}

// -------------------- Configuration --------------------

namespace {

const char* const kKeys[] = {
    "connection_string", "content_factory",
    "input_path", "input_pattern", "input_encoding", "input_malformed_action",
    "input_normalize_paths", "input_strip_prefix",
    "loader", "id_name", "content_key", "field_delimiter", "id_field_index",
    "use_filename_ids", "use_filename_collection", "output_collections",
    "uri_prefix", "uri_suffix", "skip_existing", "error_existing", "start_id", "format",
    "thread_count", "queue_capacity", "fatal_errors", "log_level",
    "report_interval_sec", "status_port", "summary_path",
};

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> split_commas(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, ',')) {
        std::string t = trim(cur);
        if (!t.empty()) out.push_back(std::move(t));
    }
    return out;
}

long parse_long(const std::string& key, const std::string& v, long min_v) {
    size_t used = 0;
    long n = 0;
    try {
        n = std::stol(v, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": not an integer: " + v);
    }
    if (used != v.size()) throw std::invalid_argument(key + ": not an integer: " + v);
    if (n < min_v) throw std::invalid_argument(key + ": must be >= " + std::to_string(min_v));
    return n;
}

std::string json_scalar_to_string(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_null()) return "";
    return v.dump();
}

} // namespace

Configuration::Configuration() : resume_(std::make_shared<ResumePoint>()) {}

void Configuration::set(const std::string& key, const std::string& value) {
    const std::string k = to_lower_copy(key);

    if (k == "connection_string") {
        connection_strings_ = split_ws(value);
    } else if (k == "content_factory") {
        content_factory_ = to_lower_copy(value);
    } else if (k == "input_path") {
        for (auto& p : split_ws(value)) input_paths_.push_back(p);
    } else if (k == "input_pattern") {
        input_pattern_ = value;
    } else if (k == "input_encoding") {
        input_encoding_ = value;
    } else if (k == "input_malformed_action") {
        malformed_action_ = parse_malformed_action(value);
    } else if (k == "input_normalize_paths") {
        input_normalize_paths_ = string_to_boolean(value);
    } else if (k == "input_strip_prefix") {
        input_strip_prefix_ = value;
    } else if (k == "loader") {
        loader_ = to_lower_copy(value);
    } else if (k == "id_name") {
        id_name_ = value;
    } else if (k == "content_key") {
        content_key_ = value;
    } else if (k == "field_delimiter") {
        if (value == "\\t" || value == "tab") field_delimiter_ = '\t';
        else if (value.size() == 1) field_delimiter_ = value[0];
        else throw std::invalid_argument("field_delimiter: expected one character");
    } else if (k == "id_field_index") {
        id_field_index_ = (size_t)parse_long(k, value, 0);
    } else if (k == "use_filename_ids") {
        use_filename_ids_ = string_to_boolean(value);
    } else if (k == "use_filename_collection") {
        use_filename_collection_ = string_to_boolean(value);
    } else if (k == "output_collections") {
        output_collections_ = split_commas(value);
    } else if (k == "uri_prefix") {
        uri_prefix_ = value;
    } else if (k == "uri_suffix") {
        uri_suffix_ = value;
    } else if (k == "skip_existing") {
        skip_existing_ = string_to_boolean(value);
    } else if (k == "error_existing") {
        error_existing_ = string_to_boolean(value);
    } else if (k == "start_id") {
        resume_->set(value.empty() ? std::nullopt : std::optional<std::string>(value));
    } else if (k == "format") {
        format_ = parse_format(value);
    } else if (k == "thread_count") {
        thread_count_ = (unsigned)parse_long(k, value, 1);
    } else if (k == "queue_capacity") {
        queue_capacity_ = (size_t)parse_long(k, value, 0);
    } else if (k == "fatal_errors") {
        fatal_errors_ = string_to_boolean(value, true);
    } else if (k == "log_level") {
        log_level_ = parse_log_level(value);
    } else if (k == "report_interval_sec") {
        report_interval_sec_ = (unsigned)parse_long(k, value, 0);
    } else if (k == "status_port") {
        status_port_ = (int)parse_long(k, value, 0);
    } else if (k == "summary_path") {
        summary_path_ = value;
    } else {
        throw std::invalid_argument("unknown configuration key: " + key);
    }
}

Configuration Configuration::from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("configuration must be a JSON object");

    Configuration cfg;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& v = it.value();
        if (v.is_array()) {
            std::vector<std::string> items;
            for (auto& e : v) items.push_back(json_scalar_to_string(e));
            const std::string k = to_lower_copy(it.key());
            if (k == "input_path") {
                for (auto& p : items) cfg.input_paths_.push_back(p);
            } else if (k == "output_collections") {
                cfg.set(k, join(items, ","));
            } else {
                cfg.set(k, join(items, " "));
            }
            continue;
        }
        cfg.set(it.key(), json_scalar_to_string(v));
    }
    return cfg;
}

Configuration Configuration::from_file(const std::filesystem::path& p) {
    std::ifstream in(p);
    if (!in) throw std::invalid_argument("cannot open configuration file: " + p.string());
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw std::invalid_argument("failed parsing " + p.string() + ": " + e.what());
    }
    return from_json(j);
}

void Configuration::apply_env() {
    for (const char* key : kKeys) {
        const std::string env_name = "RECLOAD_" + to_upper_copy(key);
        const char* v = std::getenv(env_name.c_str());
        if (!v) continue;
        if (std::string(key) == "input_path") input_paths_.clear();
        set(key, v);
    }
}

void Configuration::validate() const {
    if (connection_strings_.empty()) throw FatalError("connection_string is empty");
    if (content_factory_ != "sqlite" && content_factory_ != "filesystem") {
        throw FatalError("unknown content_factory: " + content_factory_);
    }
    if (loader_ != "file" && loader_ != "jsonl" && loader_ != "delimited") {
        throw FatalError("unknown loader: " + loader_);
    }
    if (loader_ != "file" && id_name_ == FILENAME_ID && !use_filename_ids_) {
        log_warn("loader " + loader_ + " with id_name #FILENAME: every record of a file gets the same uri");
    }
    if (thread_count_ < 1) throw FatalError("thread_count must be >= 1");
    try {
        (void)CharsetDecoder::for_name(input_encoding_, malformed_action_);
        std::regex re(input_pattern_);
        (void)re;
    } catch (const std::regex_error& e) {
        throw FatalError("invalid input_pattern: " + input_pattern_ + " (" + e.what() + ")");
    } catch (const std::invalid_argument& e) {
        throw FatalError(e.what());
    }
}

std::shared_ptr<const CharsetDecoder> Configuration::decoder() const {
    return CharsetDecoder::for_name(input_encoding_, malformed_action_);
}

std::string Configuration::uri_prefix() const {
    if (!uri_prefix_.empty() && uri_prefix_.back() != '/') return uri_prefix_ + "/";
    return uri_prefix_;
}

size_t Configuration::queue_capacity() const {
    return queue_capacity_ ? queue_capacity_ : (size_t)thread_count_ * 4;
}

json Configuration::to_json() const {
    json j;
    j["connection_string"] = connection_strings_;
    j["content_factory"] = content_factory_;
    j["input_path"] = input_paths_;
    j["input_pattern"] = input_pattern_;
    j["input_encoding"] = input_encoding_;
    j["input_normalize_paths"] = input_normalize_paths_;
    j["input_strip_prefix"] = input_strip_prefix_;
    j["loader"] = loader_;
    j["id_name"] = id_name_;
    j["use_filename_ids"] = use_filename_ids();
    j["use_filename_collection"] = use_filename_collection_;
    j["output_collections"] = output_collections_;
    j["uri_prefix"] = uri_prefix();
    j["uri_suffix"] = uri_suffix_;
    j["skip_existing"] = skip_existing_;
    j["error_existing"] = error_existing_;
    auto sid = start_id();
    j["start_id"] = sid ? json(*sid) : json(nullptr);
    j["format"] = format_name(format_);
    j["thread_count"] = thread_count_;
    j["fatal_errors"] = fatal_errors_;
    return j;
}

} // namespace recload
