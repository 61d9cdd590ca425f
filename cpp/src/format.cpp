// recload/cpp/src/format.cpp
#include "recload/format.h"
#include "recload/log.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace recload {

const char* format_name(DocumentFormat f) {
    switch (f) {
        case DocumentFormat::Xml:    return "xml";
        case DocumentFormat::Text:   return "text";
        case DocumentFormat::Binary: return "binary";
        case DocumentFormat::None:   break;
    }
    return "none";
}

DocumentFormat parse_format(const std::string& s) {
    std::string v = s;
    for (auto& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "xml") return DocumentFormat::Xml;
    if (v == "text" || v == "txt") return DocumentFormat::Text;
    if (v == "binary" || v == "bin") return DocumentFormat::Binary;
    throw std::invalid_argument("unknown document format: " + s);
}

static std::tm utc_tm_now() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return tm;
}

std::string utc_now_iso() {
    const std::tm tm = utc_tm_now();
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin) {
    try {
        std::error_code ec;
        std::filesystem::create_directories(fin.parent_path(), ec);

        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::filesystem::remove(fin, ec);
        ec.clear();
        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        log_error("atomic_replace failed: " + ec.message() +
                  " tmp=" + tmp.string() + " fin=" + fin.string());
        return false;
    } catch (const std::exception& e) {
        log_error(std::string("atomic_replace exception: ") + e.what() +
                  " tmp=" + tmp.string() + " fin=" + fin.string());
        return false;
    }
}

} // namespace recload
