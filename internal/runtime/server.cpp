#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace coordinator::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services, std::chrono::milliseconds shutdown_grace)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), shutdown_grace_(shutdown_grace) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) {
    throw std::logic_error("gRPC server already started");
  }

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  COORDINATOR_LOG_INFO("gRPC server listening",
                       {observability::StringField("bind_address", bind_address_), observability::IntField("port", selected_port_),
                        observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Stop() {
  if (!grpc_server_) return;

  COORDINATOR_LOG_INFO("gRPC server draining", {observability::IntField("grace_ms", shutdown_grace_.count())});
  grpc_server_->Shutdown(std::chrono::system_clock::now() + shutdown_grace_);
  grpc_server_.reset();
}

} // namespace coordinator::runtime
