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
#include <kj/debug.h>
#include <capnp/message.h>
#include "util.h"

namespace sandpit {

static void setStringField(capnp::JsonValue::Field::Builder field,
                           kj::StringPtr name, kj::StringPtr value) {
  field.setName(name);
  field.initValue().setString(value);
}

bool SuiteRunner::tooManyTests(kj::StringPtr problem) {
  uint tests = suite.testCount(problem);
  if (tests > maxTests) {
    KJ_LOG(WARNING, "skipping problem with too many tests", problem, tests, maxTests);
    return true;
  }
  return false;
}

kj::Maybe<kj::String> SuiteRunner::runAgent(kj::StringPtr problem, kj::StringPtr agentScript,
                                            Orchestrator::FinishCallback onFinish) {
  if (tooManyTests(problem)) return nullptr;

  auto agentName = baseName(agentScript);

  capnp::MallocMessageBuilder message;
  auto fields = message.initRoot<capnp::JsonValue>().initObject(3);
  setStringField(fields[0], "problem", problem);
  setStringField(fields[1], "repo", PROBLEM_DIRECTORY);
  setStringField(fields[2], "agent", agentName);

  return orchestrator.create(suite.agentRunnerScript(),
      message.getRoot<capnp::JsonValue>().asReader(),
      [&](kj::StringPtr workspace) {
    auto repo = kj::str(workspace, '/', PROBLEM_DIRECTORY);
    KJ_SYSCALL(mkdir(repo.cStr(), 0755), repo);
    suite.materialize(problem, repo, MaterializeOptions());
    writeFile(kj::str(workspace, '/', agentName), readAll(agentScript), 0755);
  }, kj::mv(onFinish));
}

kj::Maybe<kj::String> SuiteRunner::evaluate(kj::StringPtr problem, kj::StringPtr diff,
                                            Orchestrator::FinishCallback onFinish) {
  if (tooManyTests(problem)) return nullptr;

  capnp::MallocMessageBuilder message;
  auto fields = message.initRoot<capnp::JsonValue>().initObject(3);
  setStringField(fields[0], "problem", problem);
  setStringField(fields[1], "repo", PROBLEM_DIRECTORY);
  setStringField(fields[2], "diff", SOLUTION_DIFF);

  return orchestrator.create(suite.testRunnerScript(),
      message.getRoot<capnp::JsonValue>().asReader(),
      [&](kj::StringPtr workspace) {
    auto repo = kj::str(workspace, '/', PROBLEM_DIRECTORY);
    KJ_SYSCALL(mkdir(repo.cStr(), 0755), repo);
    MaterializeOptions options;
    options.includeTests = true;
    suite.materialize(problem, repo, options);
    writeFile(kj::str(workspace, '/', SOLUTION_DIFF), diff);
  }, kj::mv(onFinish));
}

}  // namespace sandpit
