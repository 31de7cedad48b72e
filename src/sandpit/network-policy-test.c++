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

#include "network-policy.h"
#include <kj/test.h>
#include "orchestrator.h"

namespace sandpit {
namespace {

class NetworkOnlyEngine final: public ContainerEngine {
  // Records network calls. Containers are not expected.

public:
  kj::Vector<kj::String> networks;
  uint createCalls = 0;
  bool conflictOnCreate = false;
  bool failOnCreate = false;

  kj::Promise<bool> findNetwork(kj::StringPtr name) override {
    for (auto& network: networks) {
      if (network == name) return true;
    }
    return false;
  }
  kj::Promise<bool> createNetwork(kj::StringPtr name, bool internal) override {
    ++createCalls;
    KJ_EXPECT(internal);
    if (failOnCreate) return KJ_EXCEPTION(FAILED, "engine unavailable");
    if (conflictOnCreate) return false;
    networks.add(kj::heapString(name));
    return true;
  }

  kj::Promise<kj::String> createContainer(const ContainerSpec& spec) override {
    KJ_UNIMPLEMENTED("containers");
  }
  kj::Promise<void> startContainer(kj::StringPtr id) override {
    KJ_UNIMPLEMENTED("containers");
  }
  kj::Promise<void> connectNetwork(kj::StringPtr network, kj::StringPtr id) override {
    KJ_UNIMPLEMENTED("containers");
  }
  kj::Promise<int> waitContainer(kj::StringPtr id) override {
    KJ_UNIMPLEMENTED("containers");
  }
  kj::Promise<kj::String> containerLogs(kj::StringPtr id) override {
    KJ_UNIMPLEMENTED("containers");
  }
  kj::Promise<void> followLogs(
      kj::StringPtr id, kj::Function<void(kj::StringPtr line)> onLine) override {
    KJ_UNIMPLEMENTED("containers");
  }
  kj::Promise<void> killContainer(kj::StringPtr id) override {
    KJ_UNIMPLEMENTED("containers");
  }
  kj::Promise<bool> removeContainer(kj::StringPtr id, bool force) override {
    KJ_UNIMPLEMENTED("containers");
  }
};

KJ_TEST("network modes") {
  KJ_EXPECT(parseNetworkMode("sandbox") == NetworkMode::RESTRICTED);
  KJ_EXPECT(parseNetworkMode("both") == NetworkMode::DUAL);
  KJ_EXPECT(parseNetworkMode("public") == NetworkMode::PUBLIC);
  KJ_EXPECT_THROW_MESSAGE("unknown network mode", parseNetworkMode("internet"));

  KJ_EXPECT(networkModeName(NetworkMode::RESTRICTED) == "sandbox");
  KJ_EXPECT(networkModeName(NetworkMode::DUAL) == "both");
  KJ_EXPECT(networkModeName(NetworkMode::PUBLIC) == "public");
}

KJ_TEST("planNetworks") {
  NetworkNames names = { "sandbox-network", "bridge" };

  auto restricted = planNetworks(NetworkMode::RESTRICTED, names);
  KJ_EXPECT(restricted.primary == "sandbox-network");
  KJ_EXPECT(restricted.attachAfterStart == nullptr);

  auto dual = planNetworks(NetworkMode::DUAL, names);
  KJ_EXPECT(dual.primary == "sandbox-network");
  KJ_EXPECT(KJ_ASSERT_NONNULL(dual.attachAfterStart) == "bridge");

  auto pub = planNetworks(NetworkMode::PUBLIC, names);
  KJ_EXPECT(pub.primary == "bridge");
  KJ_EXPECT(pub.attachAfterStart == nullptr);
}

KJ_TEST("sandbox container only reaches the proxy when isolated") {
  Config config;
  config.proxyUpstream = kj::str("http://upstream");

  auto restricted = sandboxContainerSpec(
      config, "sandbox_1_ab", "/tmp/sandbox_1_ab", "main.py", NetworkMode::RESTRICTED);
  KJ_EXPECT(restricted.name == "sandbox_1_ab");
  KJ_EXPECT(restricted.network == "sandbox-network");
  KJ_ASSERT(restricted.argv.size() == 3);
  KJ_EXPECT(restricted.argv[0] == "sh");
  KJ_EXPECT(restricted.argv[2] == "python '/sandbox/main.py' 2>&1");
  KJ_EXPECT(restricted.workingDir == "/sandbox");
  KJ_ASSERT(restricted.binds.size() == 1);
  KJ_EXPECT(restricted.binds[0].hostPath == "/tmp/sandbox_1_ab");
  KJ_EXPECT(restricted.binds[0].guestPath == "/sandbox");
  KJ_EXPECT(!restricted.binds[0].readOnly);
  KJ_ASSERT(restricted.env.size() == 2);
  KJ_EXPECT(restricted.env[0] == "SANDBOX_WORKSPACE=/sandbox");
  KJ_EXPECT(restricted.env[1] == "SANDBOX_PROXY_URL=http://sandbox_proxy:80");

  auto pub = sandboxContainerSpec(
      config, "sandbox_2_cd", "/tmp/sandbox_2_cd", "main.py", NetworkMode::PUBLIC);
  KJ_EXPECT(pub.network == "bridge");
  KJ_ASSERT(pub.env.size() == 1);

  config.proxyEnabled = false;
  auto noProxy = sandboxContainerSpec(
      config, "sandbox_3_ef", "/tmp/sandbox_3_ef", "main.py", NetworkMode::RESTRICTED);
  KJ_EXPECT(noProxy.network == "sandbox-network");
  KJ_EXPECT(noProxy.env.size() == 1);
}

KJ_TEST("ensureIsolatedNetwork is idempotent") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  NetworkOnlyEngine engine;
  ensureIsolatedNetwork(engine, "sandbox-network").wait(waitScope);
  KJ_EXPECT(engine.createCalls == 1);
  KJ_ASSERT(engine.networks.size() == 1);

  ensureIsolatedNetwork(engine, "sandbox-network").wait(waitScope);
  KJ_EXPECT(engine.createCalls == 1);
  KJ_EXPECT(engine.networks.size() == 1);
}

KJ_TEST("ensureIsolatedNetwork tolerates a concurrent creator") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  NetworkOnlyEngine engine;
  engine.conflictOnCreate = true;
  ensureIsolatedNetwork(engine, "sandbox-network").wait(waitScope);
  KJ_EXPECT(engine.createCalls == 1);

  NetworkOnlyEngine broken;
  broken.failOnCreate = true;
  KJ_EXPECT_THROW_MESSAGE("engine unavailable",
      ensureIsolatedNetwork(broken, "sandbox-network").wait(waitScope));
}

}  // namespace
}  // namespace sandpit
