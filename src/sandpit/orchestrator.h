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

#ifndef SANDPIT_ORCHESTRATOR_H_
#define SANDPIT_ORCHESTRATOR_H_

#include <kj/mutex.h>
#include <kj/function.h>
#include <capnp/compat/json.capnp.h>
#include <map>
#include "config.h"
#include "engine.h"
#include "network-policy.h"
#include "protocol.h"

namespace sandpit {

ContainerSpec sandboxContainerSpec(const Config& config, kj::StringPtr id,
                                   kj::StringPtr workspace, kj::StringPtr scriptName,
                                   NetworkMode mode);
// The container a sandbox runs in: named after the sandbox, its workspace bind-mounted read-write
// at the guest path, running the entry script with the configured interpreter.

class Orchestrator {
  // Runs untrusted scripts in throwaway containers, one per sandbox, each with a private workspace
  // directory shared with the host.
  //
  // The caller creates a sandbox with a script, an input document and two callbacks. The mount
  // hook runs before anything is launched and may populate the workspace. The finish callback
  // receives exactly one SandboxResult, on a background thread, once the container has exited
  // (or failed to run). The workspace stays around until the caller calls cleanup().
  //
  // Constructing an Orchestrator provisions the shared isolated network and starts the egress
  // proxy container; destroying it removes every remaining sandbox and the proxy.
  //
  // All methods are thread-safe.

public:
  typedef kj::Function<void(kj::StringPtr workspace)> MountHook;
  typedef kj::Function<void(SandboxResult&& result)> FinishCallback;

  Orchestrator(Config config, ContainerEngineFactory& engineFactory);
  ~Orchestrator() noexcept(false);
  KJ_DISALLOW_COPY(Orchestrator);

  kj::String create(kj::StringPtr scriptPath, capnp::JsonValue::Reader input,
                    MountHook onMount, FinishCallback onFinish,
                    NetworkMode mode = NetworkMode::RESTRICTED);
  kj::String create(kj::StringPtr scriptPath, capnp::JsonValue::Reader input,
                    MountHook onMount, FinishCallback onFinish,
                    NetworkMode mode, kj::Maybe<kj::Duration> timeout);
  // Create a sandbox and launch it in the background. Returns the sandbox ID immediately.
  //
  // If the workspace cannot be prepared, or `onMount` throws, nothing is launched and `onFinish`
  // is called with the failure before create() returns. The returned ID is then not registered.
  //
  // `timeout`, if given, overrides RUN_TIMEOUT for this sandbox. Null means no limit.

  void cleanup(kj::StringPtr id);
  // Forget the sandbox, removing its container (if one still exists) and its workspace. Unknown
  // IDs are ignored with a warning, so calling this twice is harmless.

  void cleanupAll();

  void forget(kj::StringPtr id);
  // Like cleanup(), but leaves the workspace directory in place for inspection. The orchestrator
  // no longer tracks it.

  size_t count();
  // Number of sandboxes created and not yet cleaned up.

  kj::Maybe<kj::String> workspacePath(kj::StringPtr id);

  void shutdown();
  // Refuse further create() calls, clean up every sandbox, wait for all background runs to
  // deliver their results, and remove the egress proxy. Called by the destructor.

  const Config& getConfig() { return config; }

private:
  struct SandboxEntry {
    kj::String id;
    kj::String workspace;
    kj::String scriptName;
    NetworkMode networkMode;

    kj::Maybe<kj::String> containerId;
    // Set while a container exists for this sandbox.
  };

  struct RunState {
    uint64_t serial = 0;
    uint workers = 0;
    // Background runs not yet finished, plus create() calls in progress.

    uint launched = 0;
    // Runs holding a slot of the MAX_CONCURRENT_RUNS gate.

    bool shuttingDown = false;
  };

  struct Job {
    kj::String id;
    kj::String workspace;
    kj::String scriptName;
    NetworkMode mode;
    kj::Maybe<kj::Duration> timeout;
    FinishCallback onFinish;
  };

  class ControlLoop;

  Config config;
  ContainerEngineFactory& engineFactory;
  kj::MutexGuarded<std::map<kj::StringPtr, SandboxEntry>> sandboxes;
  // Keys point into the entry's `id`.

  kj::MutexGuarded<RunState> runState;
  kj::Own<ControlLoop> controlLoop;
  bool proxyStarted = false;
  kj::UnwindDetector unwindDetector;

  void buildImage(kj::StringPtr directory);
  void startEgressProxy();
  void stopEgressProxy();

  void spawnWorker(Job job);
  void runWorker(Job& job);
  SandboxResult execute(Job& job, ContainerEngine& engine, kj::AsyncIoContext& io);
  bool isRegistered(kj::StringPtr id);
  bool recordContainer(kj::StringPtr id, kj::StringPtr containerId);
  void clearContainer(kj::StringPtr id);
  void finishWorker();
  void unregister(kj::StringPtr id, bool deleteWorkspace);
};

}  // namespace sandpit

#endif // SANDPIT_ORCHESTRATOR_H_
