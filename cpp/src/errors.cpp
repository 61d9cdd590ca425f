#include "recload/errors.h"

namespace recload {

const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:               return "ok";
        case ErrorCode::IoError:          return "io_error";
        case ErrorCode::ParseError:       return "parse_error";
        case ErrorCode::ExistingDocument: return "existing_document";
        case ErrorCode::StoreError:       return "store_error";
        case ErrorCode::Fatal:            return "fatal";
        case ErrorCode::Halted:           return "halted";
    }
    return "unknown";
}

const char* outcome_name(Outcome o) {
    switch (o) {
        case Outcome::Success:     return "success";
        case Outcome::Skip:        return "skip";
        case Outcome::RecordFatal: return "record_fatal";
        case Outcome::JobFatal:    return "job_fatal";
    }
    return "unknown";
}

} // namespace recload
