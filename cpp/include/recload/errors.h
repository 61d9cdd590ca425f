#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace recload {

enum class ErrorCode {
    Ok = 0,
    IoError,
    ParseError,
    ExistingDocument,
    StoreError,
    Fatal,
    Halted,
};

const char* error_code_name(ErrorCode c);

struct Error {
    ErrorCode code{ErrorCode::Ok};
    std::string message;
};

class RecloadException : public std::runtime_error {
public:
    explicit RecloadException(const std::string& msg, ErrorCode code = ErrorCode::Fatal)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Record-level failure: logged with context and surfaced to the caller.
class LoaderException : public RecloadException {
public:
    explicit LoaderException(const std::string& msg, ErrorCode code = ErrorCode::IoError)
        : RecloadException(msg, code) {}
};

class IoError : public LoaderException {
public:
    explicit IoError(const std::string& msg, ErrorCode code = ErrorCode::IoError)
        : LoaderException(msg, code) {}
};

class StoreError : public LoaderException {
public:
    explicit StoreError(const std::string& msg) : LoaderException(msg, ErrorCode::StoreError) {}
};

// Job-level failure: the loader converts it into a monitor halt.
class FatalError : public RecloadException {
public:
    explicit FatalError(const std::string& msg) : RecloadException(msg, ErrorCode::Fatal) {}
};

enum class Outcome {
    Success,
    Skip,
    RecordFatal,
    JobFatal,
};

const char* outcome_name(Outcome o);

// Result of one Loader::execute() call.
struct LoadResult {
    Outcome outcome{Outcome::Success};
    Error error;
    std::exception_ptr cause;
    uint64_t committed{0};
    uint64_t skipped{0};
    std::string context; // uri or record path at the time of failure
};

} // namespace recload
