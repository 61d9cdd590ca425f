// recload/cpp/tools/recload_main.cpp
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include "recload/config.h"
#include "recload/errors.h"
#include "recload/job.h"
#include "recload/log.h"
#include "recload/summary.h"
#include "status_server.h"

static void usage(std::ostream& os) {
    os << "Usage: recload [--config FILE] [--<key> VALUE ...] [INPUT ...]\n"
          "  keys: connection_string content_factory input_path input_pattern input_encoding\n"
          "        input_malformed_action input_normalize_paths input_strip_prefix loader id_name\n"
          "        content_key field_delimiter id_field_index use_filename_ids use_filename_collection\n"
          "        output_collections uri_prefix uri_suffix skip_existing error_existing start_id\n"
          "        format thread_count queue_capacity fatal_errors log_level report_interval_sec\n"
          "        status_port summary_path\n"
          "  RECLOAD_<KEY> environment variables override the config file; flags override both.\n"
          "  exit status: 0 ok, 1 usage/config error, 2 halted, 3 failed units\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> settings;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            usage(std::cout);
            return 0;
        }
        if (a.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "recload: missing value for " << a << "\n";
                usage(std::cerr);
                return 1;
            }
            std::string key = a.substr(2);
            for (auto& c : key) {
                if (c == '-') c = '_';
            }
            if (key == "config") config_path = argv[++i];
            else settings.emplace_back(key, argv[++i]);
            continue;
        }
        inputs.push_back(a);
    }

    recload::Configuration cfg;
    try {
        if (!config_path.empty()) cfg = recload::Configuration::from_file(config_path);
        cfg.apply_env();
        for (const auto& kv : settings) cfg.set(kv.first, kv.second);
        for (const auto& in : inputs) cfg.add_input_path(in);
        if (cfg.input_paths().empty()) throw std::invalid_argument("no input paths given");
        recload::set_log_level(cfg.log_level());
    } catch (const std::exception& e) {
        std::cerr << "recload: " << e.what() << "\n";
        usage(std::cerr);
        return 1;
    }

    try {
        recload::Job job(cfg);

        std::unique_ptr<StatusServer> status;
        if (cfg.status_port() > 0) {
            status = std::make_unique<StatusServer>(job, "127.0.0.1", cfg.status_port());
            if (!status->start()) status.reset();
        }

        recload::JobResult r = job.run();
        if (status) status->stop();

        nlohmann::json j = recload::summary_to_json(r, job.configuration());
        std::cout << j.dump() << "\n";
        if (!cfg.summary_path().empty() && !recload::write_summary(cfg.summary_path(), j)) {
            std::cerr << "recload: cannot write summary to " << cfg.summary_path() << "\n";
        }
        return recload::exit_status(r);
    } catch (const recload::FatalError& e) {
        std::cerr << "recload: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "recload failed: " << e.what() << "\n";
        return 2;
    }
}
