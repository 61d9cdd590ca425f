// recload/cpp/src/loader.cpp
#include "recload/loader.h"
#include "recload/log.h"
#include "recload/utilities.h"

#include <fstream>
#include <ios>
#include <new>
#include <stdexcept>

namespace fs = std::filesystem;

namespace recload {

namespace {

// Runs Loader::cleanup() when execute() leaves its scope, whichever way.
class CleanupGuard {
public:
    explicit CleanupGuard(Loader& loader) : loader_(loader) {}
    ~CleanupGuard() { loader_.cleanup(); }

    CleanupGuard(const CleanupGuard&) = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;

private:
    Loader& loader_;
};

} // namespace

Loader::~Loader() {
    cleanup();
}

// -------------------- wiring --------------------

const Configuration& Loader::config() const {
    if (!config_) throw FatalError("must call set_configuration() first");
    return *config_;
}

void Loader::set_configuration(std::shared_ptr<const Configuration> cfg) {
    if (!cfg) throw std::invalid_argument("null configuration");
    config_ = std::move(cfg);
    if (!format_explicit_) format_ = config_->format();
}

void Loader::set_monitor(Monitor* monitor) {
    monitor_ = monitor;
}

void Loader::set_connection_uri(const std::string& uri) {
    if (!config_) throw FatalError("must call set_configuration() before set_connection_uri()");

    std::unique_ptr<ContentFactory> f = make_content_factory(config_->content_factory());
    f->set_configuration(config_);
    f->set_connection_uri(uri);
    set_content_factory(std::move(f));
}

void Loader::set_content_factory(std::unique_ptr<ContentFactory> factory) {
    if (factory_) factory_->close();
    factory_ = std::move(factory);
    if (factory_ && file_basename_ && config_ && config_->use_filename_collection()) {
        factory_->set_file_basename(*file_basename_);
    }
}

void Loader::set_file_basename(const std::optional<std::string>& name) {
    file_basename_ = name;
    if (!name) {
        current_file_basename_.reset();
        return;
    }
    current_file_basename_ = strip_extension(name);
    log_debug("using file basename = " + *name);

    // the factory only hears about it when collections come from file names
    if (factory_ && config().use_filename_collection()) {
        factory_->set_file_basename(*name);
    }
}

void Loader::set_record_path(const std::string& path) {
    entry_path_ = path;
    std::string p = config().input_normalize_paths() ? normalize_slashes(path) : path;
    if (config().use_filename_ids()) p = escape_uri_path(p);
    current_record_path_ = std::move(p);
}

void Loader::set_format(DocumentFormat fmt) {
    format_ = fmt;
    format_explicit_ = true;
}

void Loader::bind_input(std::unique_ptr<std::istream> in, std::shared_ptr<const CharsetDecoder> decoder) {
    if (!in) throw std::invalid_argument("null input stream");
    if (!decoder) throw std::invalid_argument("null charset decoder");
    if (state_ != State::Idle && state_ != State::InputBound) {
        throw std::logic_error("input may not be rebound after processing started");
    }
    input_file_.clear();
    input_ = std::move(in);
    decoder_ = std::move(decoder);
    input_state_ = InputState::StreamBound;
    state_ = State::InputBound;
}

void Loader::bind_input(const fs::path& file, std::shared_ptr<const CharsetDecoder> decoder) {
    if (file.empty()) throw std::invalid_argument("null input file");
    if (!decoder) throw std::invalid_argument("null charset decoder");
    if (state_ != State::Idle && state_ != State::InputBound) {
        throw std::logic_error("input may not be rebound after processing started");
    }

    // opened by execute()
    std::error_code ec;
    fs::path canon = fs::weakly_canonical(file, ec);
    if (ec) {
        ec.clear();
        canon = fs::absolute(file, ec);
        if (ec) throw IoError("cannot resolve " + file.string() + ": " + ec.message());
    }
    input_.reset();
    input_file_ = canon;
    decoder_ = std::move(decoder);
    input_state_ = InputState::FileBound;
    state_ = State::InputBound;
}

// -------------------- lifecycle --------------------

LoadResult Loader::execute() {
    LoadResult result;
    {
        CleanupGuard guard(*this);

        auto fail_record = [&](ErrorCode code, const std::string& msg) {
            std::string context = current_uri_;
            if (context.empty()) context = current_record_path_ ? *current_record_path_ : input_file_.string();
            log_warn("Exception " + msg + " while processing " + context);
            result.outcome = Outcome::RecordFatal;
            result.error = Error{code, msg};
            result.cause = std::current_exception();
            result.context = context;
            state_ = State::Failed;
        };
        auto halt_job = [&](const std::string& msg) {
            result.outcome = Outcome::JobFatal;
            result.error = Error{ErrorCode::Fatal, msg};
            result.cause = std::current_exception();
            result.context = current_uri_;
            state_ = State::Failed;
            if (monitor_) monitor_->halt(result.cause);
            else log_error("job-fatal error with no monitor to halt: " + msg);
        };

        try {
            if (cleaned_) throw std::logic_error("loader was already executed");
            if (!monitor_) throw FatalError("must call set_monitor() before execute()");
            (void)config();

            open_input();
            event_ = TimedEvent();
            state_ = State::Processing;
            process();

            if (halted_early_) {
                result.outcome = Outcome::JobFatal;
                result.error = Error{ErrorCode::Halted, "job halted"};
                state_ = State::Failed;
            } else if (committed_ == 0 && skipped_ > 0) {
                result.outcome = Outcome::Skip;
                state_ = State::Skipped;
            } else {
                result.outcome = Outcome::Success;
                state_ = State::Committed;
            }
        } catch (const LoaderException& e) {
            fail_record(e.code(), e.what());
        } catch (const std::ios_base::failure& e) {
            fail_record(ErrorCode::IoError, e.what());
        } catch (const std::bad_alloc& e) {
            halt_job(std::string("out of memory: ") + e.what());
        } catch (const std::exception& e) {
            halt_job(e.what());
        } catch (...) {
            halt_job("non-standard exception");
        }
    }
    result.committed = committed_;
    result.skipped = skipped_;
    return result;
}

void Loader::call() {
    LoadResult r = execute();
    if (r.outcome == Outcome::RecordFatal && r.cause) std::rethrow_exception(r.cause);
}

void Loader::open_input() {
    if (input_state_ != InputState::FileBound) return;

    log_debug("processing " + input_file_.string());
    auto in = std::make_unique<std::ifstream>(input_file_, std::ios::binary);
    if (!*in) throw IoError("cannot open " + input_file_.string());
    input_ = std::move(in);
    input_state_ = InputState::StreamBound;
}

void Loader::process() {
    if (!input_ || !decoder_) throw FatalError("caller must set input");

    if (!current_record_path_ && !input_file_.empty()) {
        set_record_path(input_file_.filename().string());
    }

    const DocumentFormat fmt = format_ == DocumentFormat::None ? DocumentFormat::Xml : format_;
    std::unique_ptr<RecordReader> reader =
        reader_factory_ ? reader_factory_(*input_, *decoder_, fmt, current_record_path_)
                        : make_record_reader(config(), *input_, *decoder_, fmt, current_record_path_);
    if (!reader) throw FatalError("no record reader");
    input_state_ = InputState::Consumed;

    Record rec;
    while (!monitor_->halted()) {
        rec = Record();
        if (!reader->next(rec)) return;
        process_record(rec);
    }
    halted_early_ = true;
    log_debug("job halted, stopping " + (current_record_path_ ? *current_record_path_ : input_file_.string()));
}

void Loader::process_record(Record& rec) {
    const std::string uri = compose_uri(rec.id);
    current_uri_ = uri;
    record_format_ = rec.format != DocumentFormat::None ? rec.format : format_;
    const uint64_t bytes = rec.payload.size();

    if (check_id_and_uri(*rec.id, uri)) {
        update_monitor(bytes);
        ++skipped_;
        cleanup_record();
        return;
    }

    open_content(uri).set_payload(std::move(rec.payload));
    insert();
    update_monitor(bytes);
    ++committed_;
    cleanup_record();
}

void Loader::cleanup() noexcept {
    if (cleaned_) return;
    cleaned_ = true;

    cleanup_record();

    if (monitor_ && file_basename_ && entry_path_) {
        try {
            monitor_->cleanup(*file_basename_, *entry_path_);
        } catch (const std::exception& e) {
            log_warn(std::string("monitor cleanup failed: ") + e.what());
        }
    }

    input_.reset();
    if (input_state_ != InputState::Unbound) input_state_ = InputState::Consumed;

    if (factory_) {
        try {
            factory_->close();
        } catch (const std::exception& e) {
            log_warn(std::string("closing connection failed: ") + e.what());
        }
    }
    state_ = State::Cleaned;
}

// -------------------- per-record primitives --------------------

std::string Loader::compose_uri(const std::optional<std::string>& raw_id) const {
    if (!raw_id) throw IoError("id may not be null");

    std::string clean_id = trim(*raw_id);

    const std::string& strip = config().input_strip_prefix();
    if (!strip.empty()) clean_id = replace_first(clean_id, strip, "");

    if (clean_id.empty()) throw IoError("id may not be empty");

    // uri_prefix() already ends in '/'
    std::string base = config().uri_prefix();
    if (current_file_basename_ && !config().use_filename_ids()) base += *current_file_basename_;
    if (!base.empty()) {
        if (base.back() != '/') base += '/';
        size_t lead = 0;
        while (lead < clean_id.size() && clean_id[lead] == '/') ++lead;
        clean_id.erase(0, lead);
        if (clean_id.empty()) throw IoError("id may not be empty");
    }

    std::string uri = base + clean_id + config().uri_suffix();
    return uri;
}

bool Loader::check_id_and_uri(const std::string& raw_id, const std::string& uri) {
    return check_start_id(raw_id) || check_existing_uri(uri);
}

bool Loader::check_start_id(const std::string& id) {
    std::string expected;
    switch (config().resume_point().evaluate(id, &expected)) {
        case ResumePoint::Decision::Inactive:
            return false;
        case ResumePoint::Decision::Mismatch:
            // still scanning: don't open the content
            monitor_->increment_skipped("id " + id + " != " + expected);
            return true;
        case ResumePoint::Decision::Matched:
            log_info("found START_ID " + id);
            monitor_->reset_worker_pool();
            return false;
    }
    return false;
}

bool Loader::check_existing_uri(const std::string& uri) {
    if (!config().skip_existing() && !config().error_existing()) return false;

    const bool exists = open_content(uri).check_document_uri(uri);
    log_debug("checking for uri " + uri + " = " + (exists ? "true" : "false"));
    if (!exists) return false;

    if (config().error_existing()) {
        throw IoError("ERROR_EXISTING=true, cannot overwrite existing document: " + uri,
                      ErrorCode::ExistingDocument);
    }
    monitor_->increment_skipped("existing uri " + uri);
    return true;
}

Content& Loader::open_content(const std::string& uri) {
    if (!content_) {
        if (!factory_) throw FatalError("no content factory: call set_connection_uri() first");
        const DocumentFormat fmt = record_format_ != DocumentFormat::None ? record_format_ : format_;
        content_ = factory_->new_content(uri, fmt);
        if (!content_) throw FatalError("content factory returned no content for " + uri);
    }
    return *content_;
}

void Loader::insert() {
    if (!content_) throw FatalError("no content to insert for " + current_uri_);
    log_debug("inserting " + current_uri_);
    content_->insert();
}

void Loader::update_monitor(uint64_t bytes) {
    if (record_reported_) return;
    if (!monitor_) throw FatalError("must call set_monitor() first");

    // skipped records are counted too
    event_.increment(bytes);
    event_.stop();
    monitor_->add(current_uri_, event_);
    record_reported_ = true;
}

void Loader::cleanup_record() noexcept {
    if (content_) {
        try {
            content_->close();
        } catch (const std::exception& e) {
            log_warn(std::string("closing content failed: ") + e.what());
        }
        content_.reset();
    }
    current_uri_.clear();
    record_format_ = DocumentFormat::None;
    record_reported_ = false;
    event_ = TimedEvent();
}

} // namespace recload
