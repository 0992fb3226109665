#include <pthread.h>
#include <signal.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "executor/errors.hpp"
#include "executor/executor_builder.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "grpc++/server_context.h"
#include "grpc/grpc.h"
#include "manager/config.hpp"
#include "manager/manager.hpp"
#include "proto/sandbox.grpc.pb.h"
#include "util/cancellation.hpp"
#include "util/flags.hpp"

DEFINE_string(address, "0.0.0.0", "address to listen on");
DEFINE_int32(port, 7070, "port to listen on");

namespace {

grpc::Status ErrorStatus(const std::exception& e, grpc::StatusCode code) {
  return grpc::Status(code, e.what());
}

class SandboxServiceImpl : public proto::Sandbox::Service {
 public:
  SandboxServiceImpl(const manager::Manager* manager,
                     executor::Executor* executor)
      : manager_(manager), executor_(executor) {}

  grpc::Status Execute(grpc::ServerContext* context,
                       const proto::ExecuteRequest* request,
                       proto::ExecuteResult* response) override {
    util::CancellationScope scope;
    scope.SetProbe([context]() { return context->IsCancelled(); });
    if (context->deadline() != std::chrono::system_clock::time_point::max()) {
      auto remaining = context->deadline() - std::chrono::system_clock::now();
      scope.SetDeadline(
          util::CancellationScope::Clock::now() +
          std::chrono::duration_cast<util::CancellationScope::Clock::duration>(
              remaining));
    }
    VLOG(1) << "Execute from " << context->peer() << ": "
            << request->language();
    try {
      *response = executor_->Execute(*request, scope);
      return grpc::Status::OK;
    } catch (const executor::config_error& e) {
      LOG(ERROR) << "Execute: " << e.what();
      return ErrorStatus(e, grpc::StatusCode::FAILED_PRECONDITION);
    } catch (const executor::invalid_request& e) {
      LOG(INFO) << "Execute rejected: " << e.what();
      return ErrorStatus(e, grpc::StatusCode::INVALID_ARGUMENT);
    } catch (const executor::infrastructure_error& e) {
      return ErrorStatus(e, grpc::StatusCode::UNAVAILABLE);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Execute: " << e.what();
      return ErrorStatus(e, grpc::StatusCode::INTERNAL);
    }
  }

  grpc::Status Kill(grpc::ServerContext* context,
                    const proto::KillRequest* request,
                    proto::KillResponse* response) override {
    try {
      executor_->Kill(request->id());
      return grpc::Status::OK;
    } catch (const executor::execution_not_found& e) {
      return ErrorStatus(e, grpc::StatusCode::NOT_FOUND);
    }
  }

  grpc::Status Stats(grpc::ServerContext* context,
                     const proto::StatsRequest* request,
                     proto::ExecutorStats* response) override {
    *response = executor_->Stats();
    return grpc::Status::OK;
  }

  grpc::Status ListLanguages(grpc::ServerContext* context,
                             const proto::ListLanguagesRequest* request,
                             proto::ListLanguagesResponse* response) override {
    for (const proto::LanguageTemplate& tmpl : manager_->Templates()) {
      *response->add_templates() = tmpl;
    }
    return grpc::Status::OK;
  }

 private:
  const manager::Manager* manager_;
  executor::Executor* executor_;
};

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Serves the codebox sandbox over gRPC");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  // SIGINT and SIGTERM are handled by the shutdown thread. They are blocked
  // before any other thread starts.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  std::unique_ptr<manager::Manager> manager;
  try {
    manager.reset(new manager::Manager(manager::DefaultConfig()));
  } catch (const std::exception& e) {
    LOG(FATAL) << "Invalid configuration: " << e.what();
  }
  std::unique_ptr<executor::Executor> executor =
      executor::ExecutorBuilder::Get(manager.get());
  SandboxServiceImpl service(manager.get(), executor.get());

  std::string server_address = FLAGS_address + ":" + std::to_string(FLAGS_port);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  CHECK(server) << "Could not listen on " << server_address;
  LOG(INFO) << "Server listening on " << server_address;

  std::thread shutdown([&signals, &server, &executor]() {
    int signal = 0;
    sigwait(&signals, &signal);
    LOG(INFO) << "Received signal " << signal << ", shutting down";
    executor->Close();
    server->Shutdown(std::chrono::system_clock::now() +
                     std::chrono::seconds(10));
  });
  server->Wait();
  shutdown.join();
}
