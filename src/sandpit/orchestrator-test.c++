// Sandpit - Sandboxed execution for agent-produced code
// Copyright (c) 2025 Sandstorm Development Group, Inc. and contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "orchestrator.h"
#include <kj/test.h>
#include <capnp/message.h>
#include <capnp/compat/json.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include "fake-engine.h"
#include "util.h"

namespace sandpit {
namespace {

char* makeTempDir(char* pattern) {
  KJ_REQUIRE(mkdtemp(pattern) != nullptr, "mkdtemp failed", pattern);
  return pattern;
}

bool exists(kj::StringPtr path) {
  return access(path.cStr(), F_OK) == 0;
}

struct Fixture {
  char tempdir[32];
  kj::String root;
  FakeEngineFactory engines;

  Fixture()
      : tempdir("/tmp/sandpit-test.XXXXXX"),
        root(kj::heapString(makeTempDir(tempdir))) {}
  ~Fixture() noexcept(false) {
    recursivelyDelete(root);
  }

  Config config() {
    Config config;
    config.workspaceRoot = kj::heapString(root);
    config.interpreter = kj::str("sh");
    config.proxyUpstream = kj::str("http://upstream.test");
    config.proxyBinary = kj::str("/opt/sandpit/bin/sandpit-proxy");
    return config;
  }

  kj::String script(kj::StringPtr name, kj::StringPtr text) {
    auto path = kj::str(root, '/', name);
    writeFile(path, text, 0755);
    return path;
  }

  const FakeContainer& container(kj::StringPtr name) {
    // The most recent container with this name, removed or not. Containers are never deleted
    // from the fake's state, so the reference stays valid.
    auto lock = engines.state.lockExclusive();
    for (size_t i = lock->containers.size(); i > 0; i--) {
      auto& c = *lock->containers[i - 1];
      if (c.name == name) return c;
    }
    KJ_FAIL_ASSERT("no such container", name);
  }
};

struct Input {
  capnp::MallocMessageBuilder message;
  capnp::JsonValue::Reader reader;

  explicit Input(kj::StringPtr text) {
    capnp::JsonCodec json;
    auto root = message.initRoot<capnp::JsonValue>();
    json.decodeRaw(text, root);
    reader = root.asReader();
  }
};

class Completion {
  // Collects the results delivered to finish callbacks, which arrive on background threads.

public:
  Orchestrator::FinishCallback callback() {
    return [this](SandboxResult&& result) {
      auto lock = state.lockExclusive();
      lock->results.add(kj::mv(result));
      ++lock->calls;
    };
  }

  kj::Array<SandboxResult> wait(uint n) {
    auto lock = state.lockExclusive();
    lock.wait([n](const State& s) { return s.results.size() >= n; });
    return lock->results.releaseAsArray();
  }

  SandboxResult waitOne() {
    auto all = wait(1);
    KJ_ASSERT(all.size() == 1);
    return kj::mv(all[0]);
  }

  uint delivered() {
    // Total callback invocations, including results already taken by wait().
    return state.lockExclusive()->calls;
  }

private:
  struct State {
    kj::Vector<SandboxResult> results;
    uint calls = 0;
  };
  kj::MutexGuarded<State> state;
};

void noMount(kj::StringPtr) {}

kj::String workspaceOf(Orchestrator& orchestrator, kj::StringPtr id) {
  KJ_IF_MAYBE(path, orchestrator.workspacePath(id)) {
    return kj::mv(*path);
  }
  KJ_FAIL_ASSERT("sandbox not registered", id);
}

kj::StringPtr failureOf(const SandboxResult& result) {
  KJ_ASSERT(!result.isSuccess());
  return result.outcome.get<SandboxResult::Failure>().error;
}

kj::StringPtr outputOf(const SandboxResult& result) {
  KJ_ASSERT(result.isSuccess(), failureOf(result));
  return result.outcome.get<SandboxResult::Success>().output;
}

const char PONG_SCRIPT[] =
    "cp \"$SANDBOX_WORKSPACE/input.json\" \"$SANDBOX_WORKSPACE/seen.json\"\n"
    "echo hello from sandbox\n"
    "printf '{\"status\": \"success\", \"output\": \"pong\"}' > \"$SANDBOX_WORKSPACE/output.json\"\n";

KJ_TEST("sandbox run: success") {
  Fixture fixture;
  auto script = fixture.script("main.sh", PONG_SCRIPT);
  Input input("{\"ping\": 1}");
  Completion done;

  Orchestrator orchestrator(fixture.config(), fixture.engines);
  auto id = orchestrator.create(script, input.reader, noMount, done.callback());

  KJ_EXPECT(id.startsWith("sandbox_1_"), id);
  KJ_EXPECT(id.size() == strlen("sandbox_1_") + 16, id);

  auto result = done.waitOne();
  KJ_EXPECT(outputOf(result) == "\"pong\"");
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.logs).startsWith("hello from sandbox"));

  KJ_EXPECT(orchestrator.count() == 1);
  auto workspace = workspaceOf(orchestrator, id);
  KJ_EXPECT(workspace == kj::str(fixture.root, '/', id));
  {
    Input seen(readAll(kj::str(workspace, "/seen.json")));
    auto fields = seen.reader.getObject();
    KJ_ASSERT(fields.size() == 1);
    KJ_EXPECT(fields[0].getName() == "ping");
    KJ_EXPECT(fields[0].getValue().getNumber() == 1);
  }

  auto& container = fixture.container(id);
  KJ_EXPECT(container.removed);
  KJ_EXPECT(container.network == "sandbox-network");
  KJ_EXPECT(container.attachedLater.size() == 0);
  KJ_ASSERT(container.env.size() == 2);
  KJ_EXPECT(container.env[0] == "SANDBOX_WORKSPACE=/sandbox");
  KJ_EXPECT(container.env[1] == "SANDBOX_PROXY_URL=http://sandbox_proxy:80");
  KJ_ASSERT(container.binds.size() == 1);
  KJ_EXPECT(container.binds[0].hostPath == workspace);
  KJ_EXPECT(!container.binds[0].readOnly);

  orchestrator.cleanup(id);
  KJ_EXPECT(orchestrator.count() == 0);
  KJ_EXPECT(!exists(workspace));
  KJ_EXPECT(orchestrator.workspacePath(id) == nullptr);

  // Again is harmless.
  orchestrator.cleanup(id);
  orchestrator.cleanup("sandbox_999_0000000000000000");
}

KJ_TEST("sandbox run: guest failures") {
  Fixture fixture;
  auto boom = fixture.script("boom.sh",
      "echo about to fail\n"
      "printf '{\"status\": \"error\", \"error\": \"boom\", \"traceback\": \"at line 3\"}' "
      "> output.json\n");
  auto silent = fixture.script("silent.sh", "echo nothing to report\n");
  auto bogus = fixture.script("bogus.sh",
      "printf '{\"status\": \"maybe\"}' > output.json\n");
  auto noOutput = fixture.script("no-output.sh",
      "printf '{\"status\": \"success\"}' > output.json\n");
  Input input("{}");

  Orchestrator orchestrator(fixture.config(), fixture.engines);

  {
    Completion done;
    orchestrator.create(boom, input.reader, noMount, done.callback());
    auto result = done.waitOne();
    KJ_EXPECT(failureOf(result) == "boom");
    KJ_EXPECT(KJ_ASSERT_NONNULL(result.outcome.get<SandboxResult::Failure>().traceback) ==
              "at line 3");
    KJ_EXPECT(KJ_ASSERT_NONNULL(result.logs) == "about to fail\n");
  }

  {
    Completion done;
    orchestrator.create(silent, input.reader, noMount, done.callback());
    auto result = done.waitOne();
    KJ_EXPECT(failureOf(result) == "failed to read output document");
    KJ_EXPECT(KJ_ASSERT_NONNULL(result.logs) == "nothing to report\n");
  }

  {
    Completion done;
    orchestrator.create(bogus, input.reader, noMount, done.callback());
    KJ_EXPECT(failureOf(done.waitOne()) == "invalid status value: maybe");
  }

  {
    Completion done;
    orchestrator.create(noOutput, input.reader, noMount, done.callback());
    KJ_EXPECT(failureOf(done.waitOne()) == "success status missing output field");
  }

  // Failed runs keep their workspaces until cleaned up, like successful ones.
  KJ_EXPECT(orchestrator.count() == 4);
  orchestrator.cleanupAll();
  KJ_EXPECT(orchestrator.count() == 0);
}

KJ_TEST("sandbox run: mount hook") {
  Fixture fixture;
  auto script = fixture.script("main.sh",
      "if [ -f data/answer.txt ]; then\n"
      "  printf '{\"status\": \"success\", \"output\": %s}' \"$(cat data/answer.txt)\" "
      "> output.json\n"
      "fi\n");
  Input input("{}");
  Orchestrator orchestrator(fixture.config(), fixture.engines);

  {
    Completion done;
    kj::String mountedAt;
    auto id = orchestrator.create(script, input.reader, [&](kj::StringPtr workspace) {
      mountedAt = kj::heapString(workspace);
      auto dir = kj::str(workspace, "/data");
      KJ_SYSCALL(mkdir(dir.cStr(), 0755));
      writeFile(kj::str(dir, "/answer.txt"), "42");
    }, done.callback());
    KJ_EXPECT(mountedAt == workspaceOf(orchestrator, id));
    KJ_EXPECT(outputOf(done.waitOne()) == "42");
  }

  {
    // A failing hook reports before create() returns and leaves nothing behind.
    Completion done;
    kj::String mountedAt;
    auto id = orchestrator.create(script, input.reader, [&](kj::StringPtr workspace) {
      mountedAt = kj::heapString(workspace);
      KJ_FAIL_REQUIRE("no such problem");
    }, done.callback());

    KJ_ASSERT(done.delivered() == 1);
    auto result = done.waitOne();
    KJ_EXPECT(failureOf(result).startsWith("mount hook failed: "), failureOf(result));
    KJ_EXPECT(failureOf(result).endsWith("no such problem"), failureOf(result));
    KJ_EXPECT(result.outcome.get<SandboxResult::Failure>().traceback != nullptr);
    KJ_EXPECT(result.logs == nullptr);

    KJ_EXPECT(orchestrator.workspacePath(id) == nullptr);
    KJ_EXPECT(!exists(mountedAt));
    KJ_EXPECT(fixture.engines.state.lockExclusive()->countNamed(id) == 0);
  }

  {
    // Likewise a missing script.
    Completion done;
    auto id = orchestrator.create(kj::str(fixture.root, "/missing.sh"), input.reader, noMount,
                                  done.callback());
    KJ_ASSERT(done.delivered() == 1);
    KJ_EXPECT(failureOf(done.waitOne()).startsWith("failed to prepare workspace: "));
    KJ_EXPECT(orchestrator.workspacePath(id) == nullptr);
    KJ_EXPECT(!exists(kj::str(fixture.root, '/', id)));
  }

  KJ_EXPECT(orchestrator.count() == 1);
}

KJ_TEST("sandbox run: finish callback that throws") {
  Fixture fixture;
  Input input("{}");
  Orchestrator orchestrator(fixture.config(), fixture.engines);

  KJ_EXPECT_LOG(ERROR, "sandbox completion callback threw");
  orchestrator.create(kj::str(fixture.root, "/missing.sh"), input.reader, noMount,
      [](SandboxResult&& result) {
    KJ_FAIL_REQUIRE("caller bug");
  });
  KJ_EXPECT(orchestrator.count() == 0);
}

KJ_TEST("sandbox run: engine failure mid-run") {
  Fixture fixture;
  auto script = fixture.script("main.sh", PONG_SCRIPT);
  Input input("{}");
  Orchestrator orchestrator(fixture.config(), fixture.engines);
  fixture.engines.state.lockExclusive()->failWait = true;

  Completion done;
  auto id = orchestrator.create(script, input.reader, noMount, done.callback());
  auto result = done.waitOne();
  auto error = failureOf(result);
  KJ_EXPECT(error.startsWith("failed to run: "), error);
  KJ_EXPECT(strstr(error.cStr(), "lost connection to container engine") != nullptr, error);
  KJ_EXPECT(result.outcome.get<SandboxResult::Failure>().traceback != nullptr);
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.logs).startsWith("hello from sandbox"));

  // The container is still known, so cleanup() takes it down along with the workspace.
  auto& container = fixture.container(id);
  KJ_EXPECT(!container.removed);
  auto workspace = workspaceOf(orchestrator, id);
  orchestrator.cleanup(id);
  KJ_EXPECT(container.removed);
  KJ_EXPECT(!exists(workspace));
  KJ_EXPECT(orchestrator.count() == 0);
}

KJ_TEST("sandbox run: streamed logs") {
  Fixture fixture;
  auto script = fixture.script("main.sh", PONG_SCRIPT);
  Input input("{}");
  auto config = fixture.config();
  config.streamLogs = true;
  Orchestrator orchestrator(kj::mv(config), fixture.engines);

  Completion done;
  auto id = orchestrator.create(script, input.reader, noMount, done.callback());
  auto result = done.waitOne();
  KJ_EXPECT(outputOf(result) == "\"pong\"");
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.logs).startsWith("hello from sandbox"));
  KJ_EXPECT(fixture.container(id).removed);
}

KJ_TEST("sandbox run: finish callback runs once") {
  Fixture fixture;
  auto script = fixture.script("main.sh", PONG_SCRIPT);
  Input input("{}");
  Orchestrator orchestrator(fixture.config(), fixture.engines);

  Completion done;
  orchestrator.create(script, input.reader, noMount, done.callback());
  done.waitOne();
  usleep(200000);
  KJ_EXPECT(done.delivered() == 1);

  orchestrator.cleanupAll();
  KJ_EXPECT(orchestrator.count() == 0);
  orchestrator.cleanupAll();
  KJ_EXPECT(orchestrator.count() == 0);
}

KJ_TEST("sandbox run: output document that isn't a file") {
  Fixture fixture;
  auto script = fixture.script("main.sh", "mkfifo output.json\n");
  Input input("{}");
  Orchestrator orchestrator(fixture.config(), fixture.engines);

  Completion done;
  orchestrator.create(script, input.reader, noMount, done.callback());
  KJ_EXPECT(failureOf(done.waitOne()) == "failed to read output document");
}

KJ_TEST("sandbox run: timeout") {
  Fixture fixture;
  auto script = fixture.script("main.sh", "sleep 1000\n");
  Input input("{}");
  auto config = fixture.config();
  config.image = kj::str("hang");

  Orchestrator orchestrator(kj::mv(config), fixture.engines);
  Completion done;
  auto id = orchestrator.create(script, input.reader, noMount, done.callback(),
                                NetworkMode::RESTRICTED, 1 * kj::SECONDS);

  auto result = done.waitOne();
  KJ_EXPECT(failureOf(result) == "timed out after 1 seconds");
  KJ_EXPECT(result.logs != nullptr);

  auto& container = fixture.container(id);
  KJ_EXPECT(container.killed);
  KJ_EXPECT(container.removed);
  KJ_EXPECT(orchestrator.count() == 1);
}

KJ_TEST("sandbox run: network modes") {
  Fixture fixture;
  auto script = fixture.script("main.sh", PONG_SCRIPT);
  Input input("{}");
  Orchestrator orchestrator(fixture.config(), fixture.engines);

  {
    Completion done;
    auto id = orchestrator.create(script, input.reader, noMount, done.callback(),
                                  NetworkMode::DUAL);
    outputOf(done.waitOne());
    auto& container = fixture.container(id);
    KJ_EXPECT(container.network == "sandbox-network");
    KJ_ASSERT(container.attachedLater.size() == 1);
    KJ_EXPECT(container.attachedLater[0] == "bridge");
    KJ_EXPECT(container.env.size() == 2);
  }

  {
    Completion done;
    auto id = orchestrator.create(script, input.reader, noMount, done.callback(),
                                  NetworkMode::PUBLIC);
    outputOf(done.waitOne());
    auto& container = fixture.container(id);
    KJ_EXPECT(container.network == "bridge");
    KJ_EXPECT(container.attachedLater.size() == 0);
    KJ_ASSERT(container.env.size() == 1);
    KJ_EXPECT(container.env[0] == "SANDBOX_WORKSPACE=/sandbox");
  }

  {
    // Failing to reach the external network doesn't fail the run.
    fixture.engines.state.lockExclusive()->failConnect = true;
    Completion done;
    auto id = orchestrator.create(script, input.reader, noMount, done.callback(),
                                  NetworkMode::DUAL);
    KJ_EXPECT(outputOf(done.waitOne()) == "\"pong\"");
    KJ_EXPECT(fixture.container(id).attachedLater.size() == 0);
  }
}

KJ_TEST("concurrency limit") {
  Fixture fixture;
  auto script = fixture.script("main.sh",
      "sleep 0.2\n"
      "printf '{\"status\": \"success\", \"output\": true}' > output.json\n");
  Input input("{}");
  auto config = fixture.config();
  config.proxyEnabled = false;
  config.maxConcurrentRuns = 1;

  Orchestrator orchestrator(kj::mv(config), fixture.engines);
  Completion done;
  for (uint i = 0; i < 4; i++) {
    orchestrator.create(script, input.reader, noMount, done.callback());
  }

  for (auto& result: done.wait(4)) {
    KJ_EXPECT(outputOf(result) == "true");
  }
  KJ_EXPECT(fixture.engines.state.lockExclusive()->maxRunning == 1);
}

KJ_TEST("isolated network and egress proxy") {
  Fixture fixture;

  {
    Orchestrator orchestrator(fixture.config(), fixture.engines);

    {
      auto lock = fixture.engines.state.lockExclusive();
      KJ_ASSERT(lock->networks.size() == 1);
      KJ_EXPECT(lock->networks[0] == "sandbox-network");
      KJ_EXPECT(lock->networkCreates == 1);
    }

    auto& proxy = fixture.container("sandbox_proxy");
    KJ_EXPECT(proxy.started);
    KJ_EXPECT(!proxy.removed);
    KJ_EXPECT(proxy.network == "sandbox-network");
    KJ_ASSERT(proxy.attachedLater.size() == 1);
    KJ_EXPECT(proxy.attachedLater[0] == "bridge");

    KJ_ASSERT(proxy.argv.size() == 6);
    KJ_EXPECT(proxy.argv[0] == "/sandbox_proxy/sandpit-proxy");
    KJ_EXPECT(proxy.argv[1] == "--upstream=http://upstream.test");
    KJ_EXPECT(proxy.argv[2] == "--timeout=600");
    KJ_EXPECT(proxy.argv[3] == "--endpoint=/api/inference");
    KJ_EXPECT(proxy.argv[4] == "--endpoint=/api/embedding");
    KJ_EXPECT(proxy.argv[5] == "*:80");

    KJ_ASSERT(proxy.env.size() == 1);
    KJ_EXPECT(proxy.env[0] == "FORWARD_TO=http://upstream.test");

    KJ_ASSERT(proxy.binds.size() == 1);
    KJ_EXPECT(proxy.binds[0].hostPath == "/opt/sandpit/bin");
    KJ_EXPECT(proxy.binds[0].guestPath == "/sandbox_proxy");
    KJ_EXPECT(proxy.binds[0].readOnly);
  }

  // Shutting down removed the proxy.
  KJ_EXPECT(fixture.container("sandbox_proxy").removed);

  {
    // The network is reused, and a leftover proxy would be replaced.
    Orchestrator orchestrator(fixture.config(), fixture.engines);
    auto lock = fixture.engines.state.lockExclusive();
    KJ_EXPECT(lock->networks.size() == 1);
    KJ_EXPECT(lock->networkCreates == 1);
    KJ_EXPECT(lock->countNamed("sandbox_proxy") == 2);
  }
}

KJ_TEST("configuration errors") {
  Fixture fixture;
  auto config = fixture.config();
  config.proxyUpstream = nullptr;
  KJ_EXPECT_THROW_MESSAGE("PROXY_UPSTREAM must be set",
      Orchestrator(kj::mv(config), fixture.engines));

  // Without the proxy there's nothing to forward to, so it isn't required.
  auto noProxy = fixture.config();
  noProxy.proxyEnabled = false;
  noProxy.proxyUpstream = nullptr;
  Orchestrator orchestrator(kj::mv(noProxy), fixture.engines);
  KJ_EXPECT(fixture.engines.state.lockExclusive()->countNamed("sandbox_proxy") == 0);
}

KJ_TEST("shutdown and forget") {
  Fixture fixture;
  auto script = fixture.script("main.sh", PONG_SCRIPT);
  Input input("{}");
  Orchestrator orchestrator(fixture.config(), fixture.engines);

  Completion done;
  auto kept = orchestrator.create(script, input.reader, noMount, done.callback());
  auto dropped = orchestrator.create(script, input.reader, noMount, done.callback());
  KJ_EXPECT(kept != dropped);
  KJ_EXPECT(dropped.startsWith("sandbox_2_"), dropped);
  done.wait(2);

  auto keptPath = workspaceOf(orchestrator, kept);
  auto droppedPath = workspaceOf(orchestrator, dropped);

  orchestrator.forget(kept);
  KJ_EXPECT(orchestrator.count() == 1);
  KJ_EXPECT(exists(keptPath));

  orchestrator.shutdown();
  KJ_EXPECT(orchestrator.count() == 0);
  KJ_EXPECT(exists(keptPath));
  KJ_EXPECT(!exists(droppedPath));

  KJ_EXPECT_THROW_MESSAGE("shutting down",
      orchestrator.create(script, input.reader, noMount, done.callback()));
  KJ_EXPECT(done.delivered() == 0);

  // The destructor doesn't mind a second shutdown.
}

}  // namespace
}  // namespace sandpit
