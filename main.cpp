#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "executor/executor_builder.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manager/config.hpp"
#include "manager/manager.hpp"
#include "util/cancellation.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(language, "", "language of the program, such as python or cpp");
DEFINE_string(code, "", "source code to run");
DEFINE_string(code_file, "", "file with the source code to run, instead of --code");
DEFINE_string(stdin_file, "", "file to feed to the standard input of the program");
DEFINE_string(project, "", "project the execution belongs to");
DEFINE_string(mode, "",
              "isolation mode: docker, gvisor or firecracker (default: "
              "--isolation)");
DEFINE_int64(timeout_ms, 0, "timeout of the execution in milliseconds");

namespace {
std::atomic<bool> interrupted{false};
void Interrupt(int) { interrupted = true; }
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs a program in the codebox sandbox and prints the result as JSON");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  proto::ExecuteRequest request;
  request.set_language(FLAGS_language);
  request.set_project_id(FLAGS_project);
  request.set_timeout_ms(FLAGS_timeout_ms);
  try {
    request.set_code(FLAGS_code_file.empty() ? FLAGS_code
                                             : util::File::Read(FLAGS_code_file));
    if (!FLAGS_stdin_file.empty()) {
      request.set_stdin(util::File::Read(FLAGS_stdin_file));
    }
  } catch (const std::system_error& e) {
    std::cerr << "codebox: " << e.what() << std::endl;
    return 1;
  }
  if (!FLAGS_mode.empty()) {
    proto::IsolationMode mode;
    if (!manager::ParseIsolationMode(FLAGS_mode, &mode)) {
      std::cerr << "codebox: unknown isolation mode " << FLAGS_mode
                << std::endl;
      return 1;
    }
    request.set_isolation(mode);
  }

  std::unique_ptr<manager::Manager> manager;
  std::unique_ptr<executor::Executor> executor;
  proto::ExecuteResult result;
  // Ctrl-C kills the execution, which still produces a result.
  std::signal(SIGINT, Interrupt);
  std::signal(SIGTERM, Interrupt);
  util::CancellationScope scope;
  scope.SetProbe([]() { return interrupted.load(); });
  try {
    manager.reset(new manager::Manager(manager::DefaultConfig()));
    executor = executor::ExecutorBuilder::Get(manager.get());
    result = executor->Execute(request, scope);
  } catch (const std::exception& e) {
    std::cerr << "codebox: " << e.what() << std::endl;
    return 1;
  }

  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  auto status =
      google::protobuf::util::MessageToJsonString(result, &json, options);
  if (!status.ok()) {
    std::cerr << "codebox: " << status.ToString() << std::endl;
    return 1;
  }
  std::cout << json;
  return 0;
}
