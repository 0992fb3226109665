#include "executor/sandbox_executor.hpp"

#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "executor/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "manager/language.hpp"
#include "util/file.hpp"

namespace {

using ::testing::_;
using ::testing::Contains;
using ::testing::DoAll;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgPointee;
using ::testing::Throw;

const std::string test_tmpdir = "/tmp/codebox_testdir";

// In-memory container runtime. A container runs the program returned by the
// hook when it is waited for.
class FakeRuntime : public executor::ContainerRuntime {
 public:
  struct Program {
    int32_t exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    // Runs until the scope ends.
    bool hang = false;
  };
  using Hook = std::function<Program(const executor::ContainerSpec& spec)>;
  // Runs while the container is being started, without the runtime lock.
  using StartHook = std::function<void()>;

  void SetProgram(Hook hook) {
    absl::MutexLock lock(&mutex_);
    hook_ = std::move(hook);
  }
  void SetImagesPresent(bool present) {
    absl::MutexLock lock(&mutex_);
    images_present_ = present;
  }
  void FailStart(const std::string& msg) {
    absl::MutexLock lock(&mutex_);
    start_error_ = msg;
  }
  void OnStart(StartHook hook) {
    absl::MutexLock lock(&mutex_);
    start_hook_ = std::move(hook);
  }
  void FailFinishStdin(const std::string& msg) {
    absl::MutexLock lock(&mutex_);
    finish_stdin_error_ = msg;
  }
  void FailAttach(const std::string& msg) {
    absl::MutexLock lock(&mutex_);
    attach_error_ = msg;
  }
  void FailLogs(const std::string& msg) {
    absl::MutexLock lock(&mutex_);
    logs_error_ = msg;
  }

  bool HasImage(const std::string& image,
                const util::CancellationScope& scope) override {
    absl::MutexLock lock(&mutex_);
    return images_present_ || pulled_.count(image);
  }
  void PullImage(const std::string& image,
                 const util::CancellationScope& scope) override {
    absl::MutexLock lock(&mutex_);
    pulled_.insert(image);
  }
  std::string Create(const executor::ContainerSpec& spec,
                     const util::CancellationScope& scope) override {
    absl::MutexLock lock(&mutex_);
    std::string id = "container-" + std::to_string(++created_);
    containers_[id].spec = spec;
    last_spec_ = spec;
    return id;
  }
  void Start(const std::string& id,
             const util::CancellationScope& scope) override {
    StartHook hook;
    {
      absl::MutexLock lock(&mutex_);
      hook = start_hook_;
    }
    if (hook) hook();
    absl::MutexLock lock(&mutex_);
    if (!start_error_.empty()) throw executor::infrastructure_error(start_error_);
    // Like the docker client, which is killed when the scope ends.
    if (scope.Done()) throw executor::infrastructure_error("start: interrupted");
    containers_.at(id).started = true;
  }
  void AttachStdin(const std::string& id, const std::string& data,
                   const util::CancellationScope& scope) override {
    absl::MutexLock lock(&mutex_);
    if (!attach_error_.empty()) {
      throw executor::infrastructure_error(attach_error_);
    }
    containers_.at(id).stdin_data = data;
  }
  void FinishStdin(const std::string& id, int32_t exit_code,
                   const util::CancellationScope& scope) override {
    absl::MutexLock lock(&mutex_);
    if (!finish_stdin_error_.empty()) {
      throw executor::infrastructure_error(finish_stdin_error_);
    }
    containers_.at(id).stdin_finished = true;
  }
  bool Wait(const std::string& id, const util::CancellationScope& scope,
            int32_t* exit_code) override {
    Hook hook;
    executor::ContainerSpec spec;
    {
      absl::MutexLock lock(&mutex_);
      hook = hook_;
      spec = containers_.at(id).spec;
    }
    Program program = hook ? hook(spec) : Program();
    {
      absl::MutexLock lock(&mutex_);
      containers_.at(id).program = program;
    }
    if (program.hang) {
      while (!scope.SleepFor(std::chrono::milliseconds(10))) {
      }
      return false;
    }
    *exit_code = program.exit_code;
    return true;
  }
  void Logs(const std::string& id, int64_t max_bytes,
            const util::CancellationScope& scope,
            executor::ContainerOutput* output) override {
    absl::MutexLock lock(&mutex_);
    const Program& program = containers_.at(id).program;
    output->stdout_data = program.stdout_data.substr(0, max_bytes);
    output->stderr_data = program.stderr_data.substr(0, max_bytes);
    if (!logs_error_.empty()) throw executor::infrastructure_error(logs_error_);
  }
  void Kill(const std::string& id) override {
    absl::MutexLock lock(&mutex_);
    containers_.at(id).killed = true;
  }
  void Remove(const std::string& id) override {
    absl::MutexLock lock(&mutex_);
    containers_.at(id).removed = true;
  }

  size_t Created() {
    absl::MutexLock lock(&mutex_);
    return created_;
  }
  // Containers created and not removed.
  size_t Live() {
    absl::MutexLock lock(&mutex_);
    size_t live = 0;
    for (const auto& kv : containers_) {
      if (!kv.second.removed) live++;
    }
    return live;
  }
  bool Killed(const std::string& id) {
    absl::MutexLock lock(&mutex_);
    return containers_.at(id).killed;
  }
  bool Started(const std::string& id) {
    absl::MutexLock lock(&mutex_);
    return containers_.at(id).started;
  }
  bool StdinFinished(const std::string& id) {
    absl::MutexLock lock(&mutex_);
    return containers_.at(id).stdin_finished;
  }
  bool Removed(const std::string& id) {
    absl::MutexLock lock(&mutex_);
    return containers_.at(id).removed;
  }
  std::string Stdin(const std::string& id) {
    absl::MutexLock lock(&mutex_);
    return containers_.at(id).stdin_data;
  }
  std::set<std::string> Pulled() {
    absl::MutexLock lock(&mutex_);
    return pulled_;
  }
  executor::ContainerSpec LastSpec() {
    absl::MutexLock lock(&mutex_);
    return last_spec_;
  }

 private:
  struct Container {
    executor::ContainerSpec spec;
    bool started = false;
    bool killed = false;
    bool removed = false;
    std::string stdin_data;
    bool stdin_finished = false;
    Program program;
  };

  absl::Mutex mutex_;
  Hook hook_ ABSL_GUARDED_BY(mutex_);
  bool images_present_ ABSL_GUARDED_BY(mutex_) = true;
  StartHook start_hook_ ABSL_GUARDED_BY(mutex_);
  std::string start_error_ ABSL_GUARDED_BY(mutex_);
  std::string finish_stdin_error_ ABSL_GUARDED_BY(mutex_);
  std::string attach_error_ ABSL_GUARDED_BY(mutex_);
  std::string logs_error_ ABSL_GUARDED_BY(mutex_);
  std::set<std::string> pulled_ ABSL_GUARDED_BY(mutex_);
  size_t created_ ABSL_GUARDED_BY(mutex_) = 0;
  std::map<std::string, Container> containers_ ABSL_GUARDED_BY(mutex_);
  executor::ContainerSpec last_spec_ ABSL_GUARDED_BY(mutex_);
};

class MockContainerRuntime : public executor::ContainerRuntime {
 public:
  MOCK_METHOD(bool, HasImage,
              (const std::string&, const util::CancellationScope&),
              (override));
  MOCK_METHOD(void, PullImage,
              (const std::string&, const util::CancellationScope&),
              (override));
  MOCK_METHOD(std::string, Create,
              (const executor::ContainerSpec&, const util::CancellationScope&),
              (override));
  MOCK_METHOD(void, Start,
              (const std::string&, const util::CancellationScope&),
              (override));
  MOCK_METHOD(void, AttachStdin,
              (const std::string&, const std::string&,
               const util::CancellationScope&),
              (override));
  MOCK_METHOD(void, FinishStdin,
              (const std::string&, int32_t, const util::CancellationScope&),
              (override));
  MOCK_METHOD(bool, Wait,
              (const std::string&, const util::CancellationScope&, int32_t*),
              (override));
  MOCK_METHOD(void, Logs,
              (const std::string&, int64_t, const util::CancellationScope&,
               executor::ContainerOutput*),
              (override));
  MOCK_METHOD(void, Kill, (const std::string&), (override));
  MOCK_METHOD(void, Remove, (const std::string&), (override));
};

FakeRuntime::Program Output(const std::string& stdout_data,
                            const std::string& stderr_data = "",
                            int32_t exit_code = 0) {
  FakeRuntime::Program program;
  program.stdout_data = stdout_data;
  program.stderr_data = stderr_data;
  program.exit_code = exit_code;
  return program;
}

FakeRuntime::Program Hang() {
  FakeRuntime::Program program;
  program.hang = true;
  return program;
}

proto::ExecuteRequest Request(const std::string& language,
                              const std::string& code) {
  proto::ExecuteRequest request;
  request.set_language(language);
  request.set_code(code);
  return request;
}

bool WaitForActive(const executor::Executor& executor, size_t count) {
  for (int i = 0; i < 500; i++) {
    if (executor.ActiveCount() == count) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

class SandboxExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tmp_.reset(new util::TempDir(test_tmpdir));
    config_ = manager::DefaultConfig();
    config_.workspace_root = tmp_->Path() + "/workspaces";
    config_.package_cache_root = tmp_->Path() + "/cache";
    config_.enable_package_cache = true;
    config_.keep_workspaces = false;
    config_.isolation = proto::CONTAINER;
    config_.gvisor_runtime = "runsc";
    config_.allowed_runtimes = {"runc", "runsc"};
    config_.firecracker_proxy_cmd = "";
    config_.pull_images = false;
    config_.network_enabled = false;
    config_.read_only_rootfs = true;
    config_.no_new_privileges = true;
    config_.tmpfs_size = "64m";
  }

  // Creates the executor from config_, with a fake runtime unless one is
  // given.
  void Build(std::unique_ptr<executor::ContainerRuntime> runtime = nullptr) {
    manager_.reset(new manager::Manager(config_));
    if (!runtime) {
      fake_ = new FakeRuntime();
      runtime.reset(fake_);
    }
    executor_.reset(
        new executor::SandboxExecutor(manager_.get(), std::move(runtime)));
  }

  std::string WorkspacePath(const std::string& id) {
    return manager_->WorkspaceRootForProject("") + "/" + id;
  }

  std::unique_ptr<util::TempDir> tmp_;
  manager::ManagerConfig config_;
  std::unique_ptr<manager::Manager> manager_;
  FakeRuntime* fake_ = nullptr;
  std::unique_ptr<executor::SandboxExecutor> executor_;
  util::CancellationScope scope_;
};

/*
 * Outcomes
 */

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, HappyPath) {
  Build();
  fake_->SetProgram([](const executor::ContainerSpec& spec) {
    std::string code = util::File::Read(spec.mounts[0].host_path + "/main.py");
    return code == "print(1+1)" ? Output("2\n") : Output("", "bad code", 1);
  });
  proto::ExecuteResult result =
      executor_->Execute(Request("python", "print(1+1)"), scope_);
  EXPECT_EQ(result.status(), proto::COMPLETED);
  EXPECT_EQ(result.exit_code(), 0);
  EXPECT_EQ(result.output(), "2\n");
  EXPECT_EQ(result.error_output(), "");
  EXPECT_THAT(result.warnings(), IsEmpty());
  EXPECT_EQ(result.id().size(), 36u);
  EXPECT_EQ(result.image(), "python:3.12-slim-bookworm");
  EXPECT_EQ(result.isolation(), proto::CONTAINER);
  EXPECT_FALSE(result.container_id().empty());
  EXPECT_GT(result.started_at_ms(), 0);
  EXPECT_GE(result.completed_at_ms(), result.started_at_ms());
  EXPECT_FALSE(result.timed_out());
  EXPECT_FALSE(result.killed());

  EXPECT_EQ(executor_->ActiveCount(), 0u);
  EXPECT_EQ(fake_->Live(), 0u);
  EXPECT_FALSE(util::File::Exists(WorkspacePath(result.id())));
  proto::ExecutorStats stats = executor_->Stats();
  EXPECT_EQ(stats.total(), 1);
  EXPECT_EQ(stats.success(), 1);
  EXPECT_EQ(stats.active(), 0);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, NonZeroExitIsFailed) {
  Build();
  fake_->SetProgram([](const executor::ContainerSpec&) {
    return Output("", "Traceback", 3);
  });
  proto::ExecuteResult result =
      executor_->Execute(Request("py", "raise SystemExit(3)"), scope_);
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_EQ(result.exit_code(), 3);
  EXPECT_EQ(result.error_output(), "Traceback");
  EXPECT_EQ(executor_->Stats().failed(), 1);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, Timeout) {
  Build();
  fake_->SetProgram([](const executor::ContainerSpec&) { return Hang(); });
  proto::ExecuteRequest request = Request("python", "import time; time.sleep(2)");
  request.set_timeout_ms(200);
  proto::ExecuteResult result = executor_->Execute(request, scope_);
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_TRUE(result.timed_out());
  EXPECT_EQ(result.exit_code(), 124);
  EXPECT_GE(result.duration_ms(), 150);
  EXPECT_LT(result.duration_ms(), 3000);
  EXPECT_TRUE(fake_->Killed(result.container_id()));
  EXPECT_TRUE(fake_->Removed(result.container_id()));
  EXPECT_EQ(executor_->ActiveCount(), 0u);
  EXPECT_EQ(executor_->Stats().timeout(), 1);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, CallerDeadlineIsATimeout) {
  Build();
  fake_->SetProgram([](const executor::ContainerSpec&) { return Hang(); });
  util::CancellationScope caller(std::chrono::milliseconds(100));
  proto::ExecuteResult result =
      executor_->Execute(Request("python", "while True: pass"), caller);
  EXPECT_EQ(result.status(), proto::TIMEOUT);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, KillIsIdempotent) {
  Build();
  fake_->SetProgram([](const executor::ContainerSpec&) { return Hang(); });
  proto::ExecuteRequest request = Request("python", "while True: pass");
  request.set_id("kill-me");
  proto::ExecuteResult result;
  std::thread runner([this, &request, &result]() {
    result = executor_->Execute(request, scope_);
  });
  bool active = WaitForActive(*executor_, 1);
  if (active) {
    executor_->Kill("kill-me");
  } else {
    executor_->Close();
  }
  runner.join();
  ASSERT_TRUE(active);
  EXPECT_EQ(result.status(), proto::KILLED);
  EXPECT_TRUE(result.killed());
  EXPECT_EQ(result.exit_code(), 137);
  EXPECT_TRUE(fake_->Killed(result.container_id()));
  EXPECT_TRUE(fake_->Removed(result.container_id()));
  EXPECT_THROW(executor_->Kill("kill-me"), executor::execution_not_found);
  EXPECT_EQ(executor_->Stats().killed(), 1);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, KillWhileStartingIsKilled) {
  Build();
  fake_->OnStart([this]() { executor_->Kill("early-kill"); });
  proto::ExecuteRequest request = Request("python", "print(1)");
  request.set_id("early-kill");
  proto::ExecuteResult result = executor_->Execute(request, scope_);
  EXPECT_EQ(result.status(), proto::KILLED);
  EXPECT_TRUE(result.killed());
  EXPECT_EQ(result.exit_code(), 137);
  EXPECT_FALSE(fake_->Started(result.container_id()));
  EXPECT_TRUE(fake_->Removed(result.container_id()));
  EXPECT_EQ(executor_->ActiveCount(), 0u);
  proto::ExecutorStats stats = executor_->Stats();
  EXPECT_EQ(stats.total(), 1);
  EXPECT_EQ(stats.killed(), 1);
  EXPECT_EQ(stats.failed(), 0);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, DeadlineWhileStartingIsATimeout) {
  Build();
  fake_->OnStart(
      []() { std::this_thread::sleep_for(std::chrono::milliseconds(300)); });
  proto::ExecuteRequest request = Request("python", "print(1)");
  request.set_timeout_ms(50);
  proto::ExecuteResult result = executor_->Execute(request, scope_);
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_TRUE(result.timed_out());
  EXPECT_EQ(result.exit_code(), 124);
  EXPECT_EQ(fake_->Live(), 0u);
  EXPECT_EQ(executor_->Stats().timeout(), 1);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, CloseKillsEverything) {
  Build();
  fake_->SetProgram([](const executor::ContainerSpec&) { return Hang(); });
  proto::ExecuteResult first, second;
  std::thread a([this, &first]() {
    first = executor_->Execute(Request("python", "a"), scope_);
  });
  std::thread b([this, &second]() {
    second = executor_->Execute(Request("javascript", "b"), scope_);
  });
  bool active = WaitForActive(*executor_, 2);
  executor_->Close();
  a.join();
  b.join();
  ASSERT_TRUE(active);
  EXPECT_EQ(first.status(), proto::KILLED);
  EXPECT_EQ(second.status(), proto::KILLED);
  EXPECT_EQ(fake_->Live(), 0u);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, OutputIsBounded) {
  Build();
  std::string flood(3 * 1024 * 1024, 'x');
  fake_->SetProgram([&flood](const executor::ContainerSpec&) {
    return Output(flood, flood);
  });
  proto::ExecuteResult result =
      executor_->Execute(Request("python", "print('x' * 10**7)"), scope_);
  size_t cap = manager_->EffectiveQuota("python").max_output_bytes();
  EXPECT_EQ(result.output().size(), cap);
  EXPECT_EQ(result.error_output().size(), cap);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, CappedOutputIsValidUtf8) {
  config_.default_quota.set_max_output_bytes(4);
  Build();
  fake_->SetProgram([](const executor::ContainerSpec&) {
    return Output("caf\xc3\xa9", "\xff err");
  });
  proto::ExecuteResult result =
      executor_->Execute(Request("c", "int main() {}"), scope_);
  EXPECT_EQ(result.output(), "caf?");
  EXPECT_EQ(result.error_output(), "? er");
}

/*
 * Rejections
 */

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, UnsupportedLanguage) {
  Build();
  EXPECT_THROW(executor_->Execute(Request("cobol", "DISPLAY 'HI'."), scope_),
               executor::unsupported_language);
  EXPECT_THROW(executor_->Execute(Request(" ", "x"), scope_),
               executor::invalid_request);
  EXPECT_EQ(executor_->ActiveCount(), 0u);
  EXPECT_EQ(fake_->Created(), 0u);
  EXPECT_EQ(executor_->Stats().total(), 0);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, PathTraversalIsRejectedForEveryLanguage) {
  Build();
  for (const proto::LanguageTemplate& tmpl : manager_->Templates()) {
    proto::ExecuteRequest request = Request(tmpl.language(), "x");
    (*request.mutable_files())["../../etc/passwd"] = "root::0:0::/:/bin/sh";
    EXPECT_THROW(executor_->Execute(request, scope_), executor::invalid_request)
        << tmpl.language();
  }
  EXPECT_EQ(fake_->Created(), 0u);
  EXPECT_EQ(executor_->ActiveCount(), 0u);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, NothingToRun) {
  Build();
  EXPECT_THROW(executor_->Execute(Request("python", ""), scope_),
               executor::invalid_request);
  EXPECT_EQ(fake_->Created(), 0u);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ExecutionIds) {
  Build();
  for (const std::string& id : {"../evil", "a/b", "..", "with space"}) {
    proto::ExecuteRequest request = Request("python", "print(1)");
    request.set_id(id);
    EXPECT_THROW(executor_->Execute(request, scope_), executor::invalid_request)
        << id;
  }
  proto::ExecuteRequest request = Request("python", "print(1)");
  request.set_id("Run_1.2-b");
  EXPECT_EQ(executor_->Execute(request, scope_).id(), "Run_1.2-b");
  EXPECT_TRUE(executor::ValidExecutionId("0b6f3a9e-5a3c-4a53-9d6c-4c4f3f2a1b00"));
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, MissingImage) {
  Build();
  fake_->SetImagesPresent(false);
  EXPECT_THROW(executor_->Execute(Request("python", "print(1)"), scope_),
               executor::infrastructure_error);
  EXPECT_EQ(fake_->Created(), 0u);
  EXPECT_EQ(executor_->Stats().failed(), 1);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, PullsMissingImage) {
  config_.pull_images = true;
  Build();
  fake_->SetImagesPresent(false);
  proto::ExecuteResult result =
      executor_->Execute(Request("go", "func main() {}"), scope_);
  EXPECT_EQ(result.status(), proto::COMPLETED);
  EXPECT_THAT(fake_->Pulled(), ElementsAre("golang:1.22-bookworm"));
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, NoOrphansWhenStartFails) {
  Build();
  fake_->FailStart("daemon went away");
  proto::ExecuteRequest request = Request("python", "print(1)");
  request.set_id("start-fails");
  try {
    executor_->Execute(request, scope_);
    FAIL() << "Execute did not throw";
  } catch (const executor::infrastructure_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("daemon went away"));
  }
  EXPECT_EQ(fake_->Created(), 1u);
  EXPECT_EQ(fake_->Live(), 0u);
  EXPECT_EQ(executor_->ActiveCount(), 0u);
  EXPECT_FALSE(util::File::Exists(WorkspacePath("start-fails")));
  proto::ExecutorStats stats = executor_->Stats();
  EXPECT_EQ(stats.total(), 1);
  EXPECT_EQ(stats.failed(), 1);
}

/*
 * Isolation modes
 */

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, Gvisor) {
  Build();
  proto::ExecuteRequest request = Request("python", "print(1)");
  request.set_isolation(proto::GVISOR);
  proto::ExecuteResult result = executor_->Execute(request, scope_);
  EXPECT_EQ(result.isolation(), proto::GVISOR);
  EXPECT_EQ(fake_->LastSpec().runtime, "runsc");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, DefaultIsolationFromConfig) {
  config_.isolation = proto::GVISOR;
  Build();
  proto::ExecuteResult result =
      executor_->Execute(Request("python", "print(1)"), scope_);
  EXPECT_EQ(result.isolation(), proto::GVISOR);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, RuntimeNotAllowed) {
  config_.allowed_runtimes = {"runc"};
  Build();
  proto::ExecuteRequest request = Request("python", "print(1)");
  request.set_isolation(proto::GVISOR);
  EXPECT_THROW(executor_->Execute(request, scope_), executor::config_error);
  EXPECT_EQ(fake_->Created(), 0u);
  // The default runtime needs no permission.
  request.set_isolation(proto::CONTAINER);
  EXPECT_EQ(executor_->Execute(request, scope_).status(), proto::COMPLETED);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, GvisorRuntimeNotConfigured) {
  config_.gvisor_runtime = "";
  Build();
  proto::ExecuteRequest request = Request("python", "print(1)");
  request.set_isolation(proto::GVISOR);
  EXPECT_THROW(executor_->Execute(request, scope_), executor::config_error);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, FirecrackerNeedsProxy) {
  Build();
  proto::ExecuteRequest request = Request("python", "print(1)");
  request.set_isolation(proto::FIRECRACKER);
  EXPECT_THROW(executor_->Execute(request, scope_), executor::config_error);
  EXPECT_EQ(executor_->Stats().total(), 0);
}

/*
 * Container configuration
 */

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ContainerIsHardened) {
  Build();
  proto::ExecuteRequest request = Request("python", "print(1)");
  request.set_id("0123456789abcdef");
  executor_->Execute(request, scope_);
  executor::ContainerSpec spec = fake_->LastSpec();
  proto::ResourceQuota quota = manager_->EffectiveQuota("python");
  EXPECT_EQ(spec.name, "codebox-0123456789abcdef");
  EXPECT_EQ(spec.image, "python:3.12-slim-bookworm");
  EXPECT_EQ(spec.work_dir, "/workspace");
  EXPECT_THAT(spec.command, ElementsAre("python3", "-u", "main.py"));
  EXPECT_EQ(spec.runtime, "");
  EXPECT_FALSE(spec.network_enabled);
  EXPECT_TRUE(spec.read_only_rootfs);
  EXPECT_TRUE(spec.no_new_privileges);
  EXPECT_FALSE(spec.open_stdin);
  EXPECT_EQ(spec.tmpfs_options, "rw,noexec,nosuid,size=64m");
  EXPECT_EQ(spec.memory_bytes, quota.memory_bytes());
  EXPECT_EQ(spec.nano_cpus,
            static_cast<int64_t>(quota.cpu_cores() * 1000000000));
  EXPECT_EQ(spec.pids_limit, quota.pids_limit());
  ASSERT_EQ(spec.mounts.size(), 2u);
  EXPECT_EQ(spec.mounts[0].host_path, WorkspacePath("0123456789abcdef"));
  EXPECT_EQ(spec.mounts[0].container_path, "/workspace");
  EXPECT_EQ(spec.mounts[1].host_path, tmp_->Path() + "/cache/shared/pip");
  EXPECT_EQ(spec.mounts[1].container_path, "/cache/pip");
  EXPECT_EQ(spec.env.at("PIP_CACHE_DIR"), "/cache/pip");
  EXPECT_EQ(spec.env.at("PYTHONUNBUFFERED"), "1");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ContainerNamesFollowExecutionIds) {
  Build();
  std::vector<std::string> names;
  for (const std::string& id : {"build-job-00001", "build-job-00002"}) {
    proto::ExecuteRequest request = Request("python", "print(1)");
    request.set_id(id);
    executor_->Execute(request, scope_);
    names.push_back(fake_->LastSpec().name);
  }
  EXPECT_THAT(names,
              ElementsAre("codebox-build-job-00001", "codebox-build-job-00002"));
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, NetworkEnabled) {
  config_.network_enabled = true;
  Build();
  executor_->Execute(Request("python", "print(1)"), scope_);
  EXPECT_TRUE(fake_->LastSpec().network_enabled);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, PackageCacheDisabled) {
  config_.enable_package_cache = false;
  Build();
  executor_->Execute(Request("python", "print(1)"), scope_);
  executor::ContainerSpec spec = fake_->LastSpec();
  EXPECT_EQ(spec.mounts.size(), 1u);
  EXPECT_EQ(spec.env.count("PIP_CACHE_DIR"), 0u);
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, EnvironmentPrecedence) {
  Build();
  proto::LanguageTemplate tmpl;
  tmpl.set_language("shell");
  tmpl.set_file_name("run.sh");
  tmpl.set_image("busybox:1.36");
  tmpl.add_command_template("sh");
  tmpl.add_command_template(manager::kFilePlaceholder);
  (*tmpl.mutable_env())["A"] = "template";
  (*tmpl.mutable_env())["B"] = "template";
  (*tmpl.mutable_env())["C"] = "template";
  proto::CacheMountSpec* cache = tmpl.add_cache_mounts();
  cache->set_name("deps");
  cache->set_container_path("/cache/deps");
  (*cache->mutable_env())["B"] = "cache";
  (*cache->mutable_env())["C"] = "cache";
  manager_->RegisterTemplate(tmpl);

  proto::ExecuteRequest request = Request("shell", "echo $A $B $C");
  request.set_project_id("Team-42");
  (*request.mutable_env())["C"] = "request";
  executor_->Execute(request, scope_);
  executor::ContainerSpec spec = fake_->LastSpec();
  EXPECT_EQ(spec.env.at("A"), "template");
  EXPECT_EQ(spec.env.at("B"), "cache");
  EXPECT_EQ(spec.env.at("C"), "request");
  EXPECT_THAT(spec.command, ElementsAre("sh", "run.sh"));
  ASSERT_EQ(spec.mounts.size(), 2u);
  EXPECT_EQ(spec.mounts[1].host_path, tmp_->Path() + "/cache/team-42/deps");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, JavaClassName) {
  Build();
  executor_->Execute(
      Request("java", "public class Solver {\n"
                      "  public static void main(String[] a) {}\n}\n"),
      scope_);
  executor::ContainerSpec spec = fake_->LastSpec();
  EXPECT_EQ(spec.env.at("CODEBOX_JAVA_CLASS"), "Solver");
  EXPECT_THAT(spec.command,
              ElementsAre("sh", "-lc",
                          "javac Solver.java && java "
                          "${CODEBOX_JAVA_CLASS:-Main}"));
}

/*
 * Standard input
 */

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, StdinIsAttached) {
  Build();
  proto::ExecuteRequest request = Request("python", "print(input())");
  request.set_stdin("5\n");
  proto::ExecuteResult result = executor_->Execute(request, scope_);
  EXPECT_TRUE(fake_->LastSpec().open_stdin);
  EXPECT_EQ(fake_->Stdin(result.container_id()), "5\n");
  EXPECT_TRUE(fake_->StdinFinished(result.container_id()));
  EXPECT_THAT(result.warnings(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, StdinNotDeliveredIsAWarning) {
  Build();
  fake_->FailFinishStdin("attach failed: container already stopped");
  fake_->SetProgram([](const executor::ContainerSpec&) {
    return Output("", "EOFError", 1);
  });
  proto::ExecuteRequest request = Request("python", "print(input())");
  request.set_stdin("5\n");
  proto::ExecuteResult result = executor_->Execute(request, scope_);
  EXPECT_EQ(result.status(), proto::FAILED);
  EXPECT_THAT(result.warnings(),
              ElementsAre("stdin attach warning: attach failed: container "
                          "already stopped"));
  EXPECT_EQ(result.error_output(),
            "stdin attach warning: attach failed: container already "
            "stopped\nEOFError");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, StdinFailureIsAWarning) {
  Build();
  fake_->FailAttach("connection refused");
  fake_->SetProgram([](const executor::ContainerSpec&) {
    return Output("", "EOFError");
  });
  proto::ExecuteRequest request = Request("python", "print(input())");
  request.set_stdin("5\n");
  proto::ExecuteResult result = executor_->Execute(request, scope_);
  EXPECT_EQ(result.status(), proto::COMPLETED);
  EXPECT_THAT(result.warnings(),
              ElementsAre("stdin attach warning: connection refused"));
  EXPECT_EQ(result.error_output(),
            "stdin attach warning: connection refused\nEOFError");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, LogFailureIsAWarning) {
  Build();
  fake_->FailLogs("stream closed");
  fake_->SetProgram([](const executor::ContainerSpec&) {
    return Output("partial");
  });
  proto::ExecuteResult result =
      executor_->Execute(Request("python", "print(1)"), scope_);
  EXPECT_EQ(result.status(), proto::COMPLETED);
  EXPECT_EQ(result.output(), "partial");
  EXPECT_THAT(result.warnings(),
              ElementsAre("log read warning: stream closed"));
}

/*
 * Concurrency
 */

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ConcurrentExecutionsAreIsolated) {
  Build();
  absl::Mutex mutex;
  int running = 0;
  fake_->SetProgram([&mutex, &running](const executor::ContainerSpec& spec) {
    {
      absl::MutexLock lock(&mutex);
      running++;
      EXPECT_TRUE(mutex.AwaitWithTimeout(
          absl::Condition(+[](int* count) { return *count >= 2; }, &running),
          absl::Seconds(5)));
    }
    const std::string& workspace = spec.mounts[0].host_path;
    bool leak = util::File::Exists(workspace + "/a.txt") &&
                util::File::Exists(workspace + "/b.txt");
    return Output(util::File::Read(workspace + "/main.py") + "|" +
                  spec.env.at("SECRET") + "|" + (leak ? "leak" : "ok"));
  });

  auto make_request = [](const std::string& name) {
    proto::ExecuteRequest request = Request("python", "print('" + name + "')");
    request.set_project_id("shared-project");
    (*request.mutable_env())["SECRET"] = name;
    (*request.mutable_files())[name + ".txt"] = name;
    return request;
  };
  proto::ExecuteResult result_a, result_b;
  std::thread a([&]() { result_a = executor_->Execute(make_request("a"), scope_); });
  std::thread b([&]() { result_b = executor_->Execute(make_request("b"), scope_); });
  a.join();
  b.join();
  EXPECT_EQ(result_a.output(), "print('a')|a|ok");
  EXPECT_EQ(result_b.output(), "print('b')|b|ok");
  EXPECT_NE(result_a.id(), result_b.id());
  EXPECT_EQ(fake_->Live(), 0u);
  EXPECT_EQ(executor_->Stats().success(), 2);
}

/*
 * Stats
 */

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, Stats) {
  Build();
  proto::ExecutorStats stats = executor_->Stats();
  EXPECT_EQ(stats.backend(), "docker-cli");
  EXPECT_THAT(stats.features(), Contains("gvisor-runtime"));
  EXPECT_THAT(stats.features(), Contains("firecracker-proxy"));
  EXPECT_EQ(stats.total(), 0);
}

/*
 * Call sequence
 */

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, RuntimeCallSequence) {
  auto* mock = new NiceMock<MockContainerRuntime>();
  Build(std::unique_ptr<executor::ContainerRuntime>(mock));
  {
    InSequence sequence;
    EXPECT_CALL(*mock, HasImage("python:3.12-slim-bookworm", _))
        .WillOnce(Return(true));
    EXPECT_CALL(*mock, Create(_, _)).WillOnce(Return("cid"));
    EXPECT_CALL(*mock, Start("cid", _));
    EXPECT_CALL(*mock, Wait("cid", _, _))
        .WillOnce(DoAll(SetArgPointee<2>(0), Return(true)));
    EXPECT_CALL(*mock, Logs("cid", 1024 * 1024, _, _))
        .WillOnce(Invoke([](const std::string&, int64_t,
                            const util::CancellationScope&,
                            executor::ContainerOutput* output) {
          output->stdout_data = "ok";
        }));
    EXPECT_CALL(*mock, Remove("cid"));
  }
  EXPECT_CALL(*mock, Kill(_)).Times(0);
  EXPECT_CALL(*mock, PullImage(_, _)).Times(0);
  EXPECT_CALL(*mock, AttachStdin(_, _, _)).Times(0);
  proto::ExecuteResult result =
      executor_->Execute(Request("python", "print('ok')"), scope_);
  EXPECT_EQ(result.output(), "ok");
  EXPECT_EQ(result.container_id(), "cid");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, RemoveFailureIsNotPropagated) {
  auto* mock = new NiceMock<MockContainerRuntime>();
  Build(std::unique_ptr<executor::ContainerRuntime>(mock));
  ON_CALL(*mock, HasImage(_, _)).WillByDefault(Return(true));
  ON_CALL(*mock, Create(_, _)).WillByDefault(Return("cid"));
  ON_CALL(*mock, Wait(_, _, _))
      .WillByDefault(DoAll(SetArgPointee<2>(0), Return(true)));
  EXPECT_CALL(*mock, Remove("cid"))
      .WillOnce(Throw(executor::infrastructure_error("rm failed")));
  proto::ExecuteResult result =
      executor_->Execute(Request("python", "print(1)"), scope_);
  EXPECT_EQ(result.status(), proto::COMPLETED);
  EXPECT_EQ(executor_->ActiveCount(), 0u);
}

/*
 * Helpers
 */

// NOLINTNEXTLINE
TEST(EffectiveTimeout, Precedence) {
  proto::ExecuteRequest request;
  proto::ResourceQuota quota;
  EXPECT_EQ(executor::EffectiveTimeout(request, quota).count(), 30000);
  quota.set_timeout_ms(2000);
  EXPECT_EQ(executor::EffectiveTimeout(request, quota).count(), 2000);
  request.set_timeout_ms(100);
  EXPECT_EQ(executor::EffectiveTimeout(request, quota).count(), 100);
}

}  // namespace
