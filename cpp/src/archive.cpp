// recload/cpp/src/archive.cpp
#include "recload/archive.h"
#include "recload/errors.h"
#include "recload/log.h"

#include <zip.h>

namespace fs = std::filesystem;

namespace recload {

bool zip_entry_name_is_safe(const std::string& name) {
    if (name.empty()) return false;
    if (name.find('\0') != std::string::npos) return false;
    if (name[0] == '/') return false;
    if (name.find('\\') != std::string::npos) return false;

    fs::path rel = fs::path(name).lexically_normal();
    if (rel.empty()) return false;
    if (rel.is_absolute()) return false;

    for (const auto& part : rel) {
        if (part.string() == "..") return false;
    }
    return true;
}

ZipArchive::ZipArchive(fs::path p, zip_t* za) : path_(std::move(p)), za_(za) {}

ZipArchive::~ZipArchive() {
    close();
}

std::shared_ptr<ZipArchive> ZipArchive::open(const fs::path& p) {
    int err = 0;
    zip_t* za = zip_open(p.string().c_str(), ZIP_RDONLY, &err);
    if (!za) throw IoError("zip_open failed for " + p.string() + " err=" + std::to_string(err));

    std::shared_ptr<ZipArchive> a(new ZipArchive(p, za));

    zip_int64_t n = zip_get_num_entries(za, 0);
    if (n < 0) throw IoError("zip_get_num_entries failed for " + p.string());

    a->entries_.reserve((size_t)n);
    for (zip_uint64_t i = 0; i < (zip_uint64_t)n; ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(za, i, 0, &st) != 0) continue;

        std::string name = st.name ? st.name : "";
        if (name.empty()) continue;
        if (!zip_entry_name_is_safe(name)) throw IoError("unsafe zip entry: " + name + " in " + p.string());
        if (name.back() == '/') continue; // directory entry

        a->entries_.push_back(std::move(name));
    }
    log_debug("opened " + p.string() + " entries=" + std::to_string(a->entries_.size()));
    return a;
}

std::string ZipArchive::read_entry(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!za_) throw IoError("zip archive already closed: " + path_.string());

    zip_file_t* zf = zip_fopen(za_, name.c_str(), 0);
    if (!zf) throw IoError("zip_fopen failed for entry: " + name + " in " + path_.string());
    auto zf_guard = std::unique_ptr<zip_file_t, decltype(&zip_fclose)>(zf, &zip_fclose);

    std::string out;
    char buf[1 << 16];
    while (true) {
        zip_int64_t rd = zip_fread(zf, buf, sizeof(buf));
        if (rd < 0) throw IoError("zip_fread failed for entry: " + name + " in " + path_.string());
        if (rd == 0) break;
        out.append(buf, (size_t)rd);
    }
    return out;
}

void ZipArchive::close() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!za_) return;
    zip_discard(za_); // read-only: nothing to write back
    za_ = nullptr;
    log_debug("closed " + path_.string());
}

bool ZipArchive::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return za_ != nullptr;
}

} // namespace recload
