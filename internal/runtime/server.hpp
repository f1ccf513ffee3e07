#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace coordinator::runtime {

/*
  Owns the gRPC server and the service adapters registered on it.

  Stop() refuses new calls at once and gives in-flight calls the grace
  period to finish before they are cancelled. Binding "host:0" picks a
  free port; Port() reports it after Start().
*/
class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
         std::chrono::milliseconds shutdown_grace = std::chrono::seconds(5));
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  int Port() const {
    return selected_port_;
  }

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::chrono::milliseconds                     shutdown_grace_;
  int                                           selected_port_ = 0;
  std::unique_ptr<::grpc::Server>               grpc_server_;
};

} // namespace coordinator::runtime
