// recload/cpp/include/recload/loader.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "recload/charset.h"
#include "recload/config.h"
#include "recload/content.h"
#include "recload/errors.h"
#include "recload/format.h"
#include "recload/monitor.h"
#include "recload/record_reader.h"
#include "recload/timed_event.h"

namespace recload {

// Takes the records of one work unit from "discovered" to "committed or skipped".
//
// Usage: set_configuration, set_monitor, set_connection_uri (or set_content_factory),
// optionally set_file_basename / set_record_path / set_format, then bind_input and
// execute() exactly once. Resources are released on every exit path of execute()
// and again (no-op) by the destructor.
class Loader {
public:
    enum class State {
        Idle,
        InputBound,
        Processing,
        Committed,
        Skipped,
        Failed,
        Cleaned,
    };

    enum class InputState {
        Unbound,
        FileBound,   // opened lazily by execute()
        StreamBound,
        Consumed,
    };

    using ReaderFactory = std::function<std::unique_ptr<RecordReader>(
        std::istream& in, const CharsetDecoder& decoder, DocumentFormat fmt,
        const std::optional<std::string>& record_path)>;

    Loader() = default;
    ~Loader();

    Loader(const Loader&) = delete;
    Loader& operator=(const Loader&) = delete;

    // -- wiring --
    void set_configuration(std::shared_ptr<const Configuration> cfg);
    void set_monitor(Monitor* monitor); // not owned; must outlive the loader
    void set_connection_uri(const std::string& uri);
    void set_content_factory(std::unique_ptr<ContentFactory> factory);
    void set_file_basename(const std::optional<std::string>& name);
    void set_record_path(const std::string& path);
    void set_format(DocumentFormat fmt);
    void set_reader_factory(ReaderFactory f) { reader_factory_ = std::move(f); }

    // Throws std::invalid_argument on a null stream/decoder, std::logic_error once processing started.
    void bind_input(std::unique_ptr<std::istream> in, std::shared_ptr<const CharsetDecoder> decoder);
    void bind_input(const std::filesystem::path& file, std::shared_ptr<const CharsetDecoder> decoder);

    // Runs the unit. Never throws: job-fatal conditions halt the monitor,
    // record-fatal ones are logged and returned with their cause.
    LoadResult execute();

    // execute(), rethrowing a record-fatal cause.
    void call();

    // Releases record, input, monitor bookkeeping and connection. Idempotent.
    void cleanup() noexcept;

    // -- per-record primitives --

    // prefix + file basename + "/" + clean id + suffix. Throws IoError on a null or empty id.
    std::string compose_uri(const std::optional<std::string>& raw_id) const;

    // true => skip the record (already counted as skipped).
    bool check_id_and_uri(const std::string& raw_id, const std::string& uri);

    // Commits the current content.
    void insert();

    // Reports the current record once; later calls for the same record do nothing.
    void update_monitor(uint64_t bytes);

    // Drops the current content handle and uri.
    void cleanup_record() noexcept;

    State state() const { return state_; }
    InputState input_state() const { return input_state_; }
    const std::optional<std::string>& current_record_path() const { return current_record_path_; }
    const std::optional<std::string>& current_file_basename() const { return current_file_basename_; }
    const std::string& current_uri() const { return current_uri_; }
    DocumentFormat format() const { return format_; }
    uint64_t committed() const { return committed_; }
    uint64_t skipped() const { return skipped_; }

private:
    void open_input();
    void process();
    void process_record(Record& rec);
    bool check_start_id(const std::string& id);
    bool check_existing_uri(const std::string& uri);
    Content& open_content(const std::string& uri);
    const Configuration& config() const;

    std::shared_ptr<const Configuration> config_;
    Monitor* monitor_{nullptr};
    std::unique_ptr<ContentFactory> factory_;
    std::unique_ptr<Content> content_;
    ReaderFactory reader_factory_;

    State state_{State::Idle};
    InputState input_state_{InputState::Unbound};
    std::filesystem::path input_file_;
    std::unique_ptr<std::istream> input_;
    std::shared_ptr<const CharsetDecoder> decoder_;

    DocumentFormat format_{DocumentFormat::None};
    bool format_explicit_{false};
    DocumentFormat record_format_{DocumentFormat::None};

    std::optional<std::string> file_basename_;         // as given, for monitor cleanup
    std::optional<std::string> current_file_basename_; // extension stripped, for uris
    std::optional<std::string> entry_path_;            // as given, for monitor cleanup
    std::optional<std::string> current_record_path_;   // normalized / escaped
    std::string current_uri_;

    TimedEvent event_;
    bool record_reported_{false};
    bool halted_early_{false};
    bool cleaned_{false};

    uint64_t committed_{0};
    uint64_t skipped_{0};
};

} // namespace recload
