// service/status_server.h
#pragma once
#include <memory>
#include <string>
#include <thread>

namespace httplib { class Server; }
namespace recload { class Job; }

// GET /health, GET /v1/status, POST /v1/halt for one running job.
class StatusServer {
public:
  StatusServer(recload::Job& job, std::string host, int port);
  ~StatusServer();

  StatusServer(const StatusServer&) = delete;
  StatusServer& operator=(const StatusServer&) = delete;

  // false if the port cannot be bound
  bool start();
  void stop();

  int port() const { return port_; }

private:
  recload::Job& job_;
  std::string host_;
  int port_;
  std::unique_ptr<httplib::Server> app_;
  std::thread th_;
};
