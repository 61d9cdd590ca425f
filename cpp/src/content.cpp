#include "recload/content.h"
#include "recload/errors.h"
#include "recload/fs_content.h"
#include "recload/log.h"
#include "recload/sqlite_content.h"

#include "text_common.h"

namespace recload {

void ContentFactory::set_configuration(std::shared_ptr<const Configuration> cfg) {
    config_ = std::move(cfg);
}

void ContentFactory::set_file_basename(const std::string& name) {
    file_basename_ = name;
    log_debug("collection from file basename: " + name);
}

std::vector<std::string> ContentFactory::collections() const {
    std::vector<std::string> out;
    if (config_) out = config_->output_collections();
    if (file_basename_ && !file_basename_->empty()) out.push_back(*file_basename_);
    return out;
}

std::unique_ptr<ContentFactory> make_content_factory(const std::string& kind) {
    const std::string k = to_lower_copy(kind);
    if (k == "sqlite") return std::make_unique<SqliteContentFactory>();
    if (k == "filesystem") return std::make_unique<FilesystemContentFactory>();
    throw FatalError("unknown content factory: " + kind);
}

} // namespace recload
