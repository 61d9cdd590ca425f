#include "recload/fs_content.h"
#include "recload/errors.h"
#include "recload/log.h"

#include <atomic>
#include <fstream>
#include <functional>
#include <thread>

namespace fs = std::filesystem;

namespace recload {

namespace {

std::atomic<uint64_t> g_tmp_seq{0};

class FilesystemContent : public Content {
public:
    FilesystemContent(const FilesystemContentFactory* factory, std::string uri)
        : factory_(factory), uri_(std::move(uri)) {}

    const std::string& uri() const override { return uri_; }

    bool check_document_uri(const std::string& uri) override {
        std::error_code ec;
        return fs::is_regular_file(factory_->document_path(uri), ec);
    }

    void set_payload(std::string bytes) override {
        payload_ = std::move(bytes);
        has_payload_ = true;
    }

    void insert() override {
        if (!has_payload_) throw IoError("no payload for " + uri_);
        const fs::path fin = factory_->document_path(uri_);
        fs::path tmp = fin;
        tmp += ".tmp." + std::to_string(g_tmp_seq.fetch_add(1)) + "." +
               std::to_string(std::hash<std::thread::id>()(std::this_thread::get_id()));

        std::error_code ec;
        fs::create_directories(fin.parent_path(), ec);
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) throw IoError("cannot write: " + tmp.string());
            out.write(payload_.data(), (std::streamsize)payload_.size());
            out.flush();
            if (!out) throw IoError("short write: " + tmp.string());
        }
        if (!atomic_replace_file_best_effort(tmp, fin)) {
            fs::remove(tmp, ec);
            throw IoError("cannot store " + uri_ + " at " + fin.string());
        }
    }

    void close() override {
        payload_.clear();
        payload_.shrink_to_fit();
        has_payload_ = false;
    }

private:
    const FilesystemContentFactory* factory_;
    std::string uri_;
    std::string payload_;
    bool has_payload_{false};
};

} // namespace

void FilesystemContentFactory::set_connection_uri(const std::string& uri) {
    connection_uri_ = uri;
    std::string dir = uri.rfind("file:", 0) == 0 ? uri.substr(5) : uri;
    // "file:///data" => "/data"
    if (dir.rfind("//", 0) == 0) dir = dir.substr(2);
    if (dir.empty()) throw IoError("empty directory in connection uri: " + uri);

    root_ = fs::path(dir);
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (!fs::is_directory(root_, ec)) throw IoError("not a directory: " + root_.string());
    open_ = true;
    log_debug("storing documents under " + root_.string());
}

fs::path FilesystemContentFactory::document_path(const std::string& uri) const {
    std::string rel = uri;
    while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    if (rel.empty()) throw IoError("empty document uri");

    const fs::path p(rel);
    for (const auto& part : p) {
        if (part == "..") throw IoError("uri may not contain '..': " + uri);
    }
    return root_ / p;
}

std::unique_ptr<Content> FilesystemContentFactory::new_content(const std::string& uri, DocumentFormat fmt) {
    (void)fmt;
    if (!open_) throw IoError("filesystem store is not open");
    return std::make_unique<FilesystemContent>(this, uri);
}

void FilesystemContentFactory::close() {
    open_ = false;
}

} // namespace recload
