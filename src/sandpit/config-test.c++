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

#include "config.h"
#include <kj/test.h>

namespace sandpit {
namespace {

KJ_TEST("config defaults") {
  auto config = parseConfig("");
  KJ_EXPECT(config.dockerSocket == "/var/run/docker.sock");
  KJ_EXPECT(config.image == "sandbox-image");
  KJ_EXPECT(config.isolatedNetwork == "sandbox-network");
  KJ_EXPECT(config.externalNetwork == "bridge");
  KJ_EXPECT(config.guestWorkspace == "/sandbox");
  KJ_EXPECT(config.interpreter == "python");
  KJ_EXPECT(config.proxyEnabled);
  KJ_EXPECT(config.proxyContainerName == "sandbox_proxy");
  KJ_EXPECT(config.proxyPort == 80);
  KJ_EXPECT(config.proxyTimeout == 600 * kj::SECONDS);
  KJ_ASSERT(config.proxyEndpoints.size() == 2);
  KJ_EXPECT(config.proxyEndpoints[0] == "/api/inference");
  KJ_EXPECT(config.proxyEndpoints[1] == "/api/embedding");
  KJ_EXPECT(config.runTimeout == nullptr);
  KJ_EXPECT(config.maxConcurrentRuns == 0);
  KJ_EXPECT(config.imageBuildDir == nullptr);
  KJ_EXPECT(!config.streamLogs);
  KJ_EXPECT(config.maxOutputSize == 16u << 20);
}

KJ_TEST("config parsing") {
  auto config = parseConfig(
      "# Sandbox settings\n"
      "SANDBOX_IMAGE=agent-sandbox\n"
      "WORKSPACE_ROOT = /var/tmp/sandboxes/\n"
      "GUEST_WORKSPACE=/work/\n"
      "INTERPRETER=python3\n"
      "STREAM_LOGS=yes\n"
      "MAX_CONCURRENT_RUNS=4\n"
      "RUN_TIMEOUT=30\n"
      "MAX_OUTPUT_SIZE=4096\n"
      "PROXY_UPSTREAM=http://inference:8000/\n"
      "PROXY_PORT=8080\n"
      "PROXY_TIMEOUT=5\n"
      "PROXY_ENDPOINTS=/api/inference, /v1/chat ,\n"
      "SOMETHING_ELSE=ignored\n");

  KJ_EXPECT(config.image == "agent-sandbox");
  KJ_EXPECT(config.workspaceRoot == "/var/tmp/sandboxes");
  KJ_EXPECT(config.guestWorkspace == "/work");
  KJ_EXPECT(config.interpreter == "python3");
  KJ_EXPECT(config.streamLogs);
  KJ_EXPECT(config.maxConcurrentRuns == 4);
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.runTimeout) == 30 * kj::SECONDS);
  KJ_EXPECT(config.maxOutputSize == 4096);
  KJ_EXPECT(config.proxyUpstream == "http://inference:8000");
  KJ_EXPECT(config.proxyPort == 8080);
  KJ_EXPECT(config.proxyTimeout == 5 * kj::SECONDS);
  KJ_ASSERT(config.proxyEndpoints.size() == 2);
  KJ_EXPECT(config.proxyEndpoints[0] == "/api/inference");
  KJ_EXPECT(config.proxyEndpoints[1] == "/v1/chat");
}

KJ_TEST("config rejects bad values") {
  KJ_EXPECT_THROW_MESSAGE("MAX_CONCURRENT_RUNS", parseConfig("MAX_CONCURRENT_RUNS=lots"));
  KJ_EXPECT_THROW_MESSAGE("RUN_TIMEOUT", parseConfig("RUN_TIMEOUT=1m"));
  KJ_EXPECT_THROW_MESSAGE("MAX_OUTPUT_SIZE", parseConfig("MAX_OUTPUT_SIZE=0"));
  KJ_EXPECT_THROW_MESSAGE("PROXY_PORT", parseConfig("PROXY_PORT=70000"));
  KJ_EXPECT_THROW_MESSAGE("PROXY_TIMEOUT", parseConfig("PROXY_TIMEOUT=0"));
  KJ_EXPECT_THROW_MESSAGE("GUEST_WORKSPACE", parseConfig("GUEST_WORKSPACE=relative"));
  KJ_EXPECT_THROW_MESSAGE("PROXY_ENDPOINTS", parseConfig("PROXY_ENDPOINTS=api/inference"));
  KJ_EXPECT_THROW_MESSAGE("Invalid config line", parseConfig("NO_EQUALS_SIGN"));
}

KJ_TEST("parseSeconds") {
  KJ_EXPECT(parseSeconds("0") == nullptr);
  auto ninety = parseSeconds("90");
  KJ_EXPECT(KJ_ASSERT_NONNULL(ninety) == 90 * kj::SECONDS);
  KJ_EXPECT_THROW_MESSAGE("expected a number of seconds", parseSeconds("soon"));
}

}  // namespace
}  // namespace sandpit
