// service/status_server.cpp
#include "status_server.h"

#include "httplib.h"
#include <nlohmann/json.hpp>

#include "recload/job.h"
#include "recload/log.h"
#include "recload/summary.h"

using json = nlohmann::json;

static void reply_json(httplib::Response& res, int status, const json& j) {
  res.status = status;
  res.set_content(j.dump(), "application/json; charset=utf-8");
}

StatusServer::StatusServer(recload::Job& job, std::string host, int port)
  : job_(job), host_(std::move(host)), port_(port), app_(std::make_unique<httplib::Server>()) {}

StatusServer::~StatusServer() {
  stop();
}

bool StatusServer::start() {
  app_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
    reply_json(res, 200, {{"ok", true}});
  });

  app_->Get("/v1/status", [this](const httplib::Request&, httplib::Response& res) {
    json j = recload::stats_to_json(job_.monitor().snapshot());
    j["open_archives"] = job_.monitor().open_archives();
    reply_json(res, 200, j);
  });

  // operator abort
  app_->Post("/v1/halt", [this](const httplib::Request&, httplib::Response& res) {
    const bool was_halted = !job_.halt("halted by operator");
    reply_json(res, was_halted ? 409 : 202, {{"halted", true}, {"already_halted", was_halted}});
  });

  if (port_ > 0) {
    if (!app_->bind_to_port(host_, port_)) {
      recload::log_error("status server cannot bind " + host_ + ":" + std::to_string(port_));
      return false;
    }
  } else {
    port_ = app_->bind_to_any_port(host_);
    if (port_ < 0) {
      recload::log_error("status server cannot bind " + host_);
      return false;
    }
  }

  th_ = std::thread([this] { app_->listen_after_bind(); });
  recload::log_info("status server listening on " + host_ + ":" + std::to_string(port_));
  return true;
}

void StatusServer::stop() {
  if (!th_.joinable()) return;
  app_->stop();
  th_.join();
}
