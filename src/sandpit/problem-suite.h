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

#ifndef SANDPIT_PROBLEM_SUITE_H_
#define SANDPIT_PROBLEM_SUITE_H_

#include "orchestrator.h"

namespace sandpit {

struct MaterializeOptions {
  bool includeTests = false;
  // Also write the problem's own tests, which the agent must not see.
};

class ProblemSuite {
  // A set of coding problems. Where problems come from, and how their files are produced, is up
  // to the implementation.

public:
  virtual ~ProblemSuite() noexcept(false) = default;

  virtual void materialize(kj::StringPtr problem, kj::StringPtr directory,
                           MaterializeOptions options) = 0;
  // Write the problem's files into `directory`, which exists and is empty.

  virtual uint testCount(kj::StringPtr problem) = 0;

  virtual kj::StringPtr agentRunnerScript() = 0;
  // Host path of the script that drives an agent inside the sandbox.

  virtual kj::StringPtr testRunnerScript() = 0;
  // Host path of the script that applies `solution.diff` and runs the problem's tests inside the
  // sandbox.
};

constexpr const char* PROBLEM_DIRECTORY = "repo";
constexpr const char* SOLUTION_DIFF = "solution.diff";

class SuiteRunner {
  // Runs agents against the problems of a suite, and evaluates their answers, each in a sandbox.
  //
  // Problem files are materialized into `repo/` inside the workspace. The input document names
  // the problem, plus the agent script (runAgent) or the diff file (evaluate).

public:
  SuiteRunner(Orchestrator& orchestrator, ProblemSuite& suite, uint maxTests)
      : orchestrator(orchestrator), suite(suite), maxTests(maxTests) {}

  kj::Maybe<kj::String> runAgent(kj::StringPtr problem, kj::StringPtr agentScript,
                                 Orchestrator::FinishCallback onFinish);
  // Sandbox the suite's agent runner with `agentScript` copied next to it. Returns the sandbox
  // ID, or null (creating nothing, never calling `onFinish`) if the problem has more than
  // `maxTests` tests.

  kj::Maybe<kj::String> evaluate(kj::StringPtr problem, kj::StringPtr diff,
                                 Orchestrator::FinishCallback onFinish);
  // Sandbox the suite's test runner against `diff`, with the problem's tests included. Same
  // contract as runAgent().

private:
  Orchestrator& orchestrator;
  ProblemSuite& suite;
  uint maxTests;

  bool tooManyTests(kj::StringPtr problem);
};

}  // namespace sandpit

#endif // SANDPIT_PROBLEM_SUITE_H_
