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

#include "problem-suite.h"
#include <kj/test.h>
#include <stdlib.h>
#include "fake-engine.h"
#include "util.h"

namespace sandpit {
namespace {

char* makeTempDir(char* pattern) {
  KJ_REQUIRE(mkdtemp(pattern) != nullptr, "mkdtemp failed", pattern);
  return pattern;
}

class TinySuite final: public ProblemSuite {
  // Two problems: "easy" with one test, "huge" with fifty.

public:
  explicit TinySuite(kj::StringPtr scriptDir)
      : agentRunner(kj::str(scriptDir, "/run-agent.sh")),
        testRunner(kj::str(scriptDir, "/run-tests.sh")) {
    writeFile(agentRunner,
        "cd \"$SANDBOX_WORKSPACE\"\n"
        "ok=false\n"
        "if [ -x agent.sh ] && [ -f repo/README ] && [ ! -e repo/tests ] &&\n"
        "   grep -q agent.sh input.json; then ok=true; fi\n"
        "sh agent.sh\n"
        "printf '{\"status\": \"success\", \"output\": %s}' \"$ok\" > output.json\n",
        0755);
    writeFile(testRunner,
        "cd \"$SANDBOX_WORKSPACE\"\n"
        "passed=0\n"
        "if [ -f repo/tests/test_readme ] && grep -q 'fix readme' solution.diff &&\n"
        "   grep -q solution.diff input.json; then passed=1; fi\n"
        "printf '{\"status\": \"success\", \"output\": {\"passed\": %s}}' \"$passed\" "
        "> output.json\n",
        0755);
  }

  void materialize(kj::StringPtr problem, kj::StringPtr directory,
                   MaterializeOptions options) override {
    KJ_REQUIRE(problem == "easy" || problem == "huge", "unknown problem", problem);
    writeFile(kj::str(directory, "/README"), kj::str("problem ", problem, '\n'));
    if (options.includeTests) {
      auto tests = kj::str(directory, "/tests");
      KJ_SYSCALL(mkdir(tests.cStr(), 0755), tests);
      writeFile(kj::str(tests, "/test_readme"), "grep -q fixed README\n");
    }
  }

  uint testCount(kj::StringPtr problem) override {
    return problem == "huge" ? 50 : 1;
  }

  kj::StringPtr agentRunnerScript() override { return agentRunner; }
  kj::StringPtr testRunnerScript() override { return testRunner; }

private:
  kj::String agentRunner;
  kj::String testRunner;
};

struct Fixture {
  char tempdir[32];
  kj::String root;
  FakeEngineFactory engines;
  kj::Own<Orchestrator> orchestrator;
  TinySuite suite;
  SuiteRunner runner;

  Fixture()
      : tempdir("/tmp/sandpit-test.XXXXXX"),
        root(kj::heapString(makeTempDir(tempdir))),
        orchestrator(kj::heap<Orchestrator>(makeConfig(root), engines)),
        suite(root),
        runner(*orchestrator, suite, 10) {}
  ~Fixture() noexcept(false) {
    orchestrator = nullptr;
    recursivelyDelete(root);
  }

  static Config makeConfig(kj::StringPtr root) {
    Config config;
    config.workspaceRoot = kj::heapString(root);
    config.interpreter = kj::str("sh");
    config.proxyEnabled = false;
    return config;
  }
};

struct Outcome {
  kj::MutexGuarded<kj::Maybe<SandboxResult>> result;

  Orchestrator::FinishCallback callback() {
    return [this](SandboxResult&& r) {
      *result.lockExclusive() = kj::mv(r);
    };
  }

  SandboxResult wait() {
    auto lock = result.lockExclusive();
    lock.wait([](const kj::Maybe<SandboxResult>& r) { return r != nullptr; });
    return kj::mv(KJ_ASSERT_NONNULL(*lock));
  }
};

kj::String launched(kj::Maybe<kj::String> id) {
  KJ_IF_MAYBE(i, id) {
    return kj::mv(*i);
  }
  KJ_FAIL_ASSERT("problem was skipped");
}

kj::String workspaceOf(Orchestrator& orchestrator, kj::StringPtr id) {
  KJ_IF_MAYBE(path, orchestrator.workspacePath(id)) {
    return kj::mv(*path);
  }
  KJ_FAIL_ASSERT("sandbox not registered", id);
}

kj::StringPtr outputOf(const SandboxResult& result) {
  KJ_IF_MAYBE(failure, result.outcome.tryGet<SandboxResult::Failure>()) {
    KJ_FAIL_ASSERT("sandbox failed", failure->error);
  }
  return result.outcome.get<SandboxResult::Success>().output;
}

KJ_TEST("suite runner: agent") {
  Fixture fixture;
  auto agent = kj::str(fixture.root, "/agent.sh");
  writeFile(agent, "echo agent ran\n");

  Outcome outcome;
  auto id = launched(fixture.runner.runAgent("easy", agent, outcome.callback()));
  auto result = outcome.wait();
  KJ_EXPECT(outputOf(result) == "true");
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.logs) == "agent ran\n");

  auto workspace = workspaceOf(*fixture.orchestrator, id);
  KJ_EXPECT(readAll(kj::str(workspace, "/repo/README")) == "problem easy\n");
  fixture.orchestrator->cleanup(id);
}

KJ_TEST("suite runner: evaluation") {
  Fixture fixture;

  Outcome outcome;
  auto id = launched(fixture.runner.evaluate(
      "easy", "--- a/README\n+++ b/README\n@@ fix readme @@\n", outcome.callback()));
  KJ_EXPECT(outputOf(outcome.wait()) == "{\"passed\":1}");

  auto workspace = workspaceOf(*fixture.orchestrator, id);
  KJ_EXPECT(readAll(kj::str(workspace, "/solution.diff")).startsWith("--- a/README"));
}

KJ_TEST("suite runner: skipped and broken problems") {
  Fixture fixture;
  auto agent = kj::str(fixture.root, "/agent.sh");
  writeFile(agent, "true\n");

  Outcome outcome;
  KJ_EXPECT(fixture.runner.runAgent("huge", agent, outcome.callback()) == nullptr);
  KJ_EXPECT(fixture.runner.evaluate("huge", "", outcome.callback()) == nullptr);
  KJ_EXPECT(fixture.orchestrator->count() == 0);
  KJ_EXPECT(*outcome.result.lockExclusive() == nullptr);

  // Materialization errors surface through the callback, like any other mount failure.
  auto id = launched(fixture.runner.runAgent("missing", agent, outcome.callback()));
  auto result = outcome.wait();
  KJ_ASSERT(!result.isSuccess());
  auto& error = result.outcome.get<SandboxResult::Failure>().error;
  KJ_EXPECT(error.startsWith("mount hook failed: "), error);
  KJ_EXPECT(fixture.orchestrator->workspacePath(id) == nullptr);
}

}  // namespace
}  // namespace sandpit
