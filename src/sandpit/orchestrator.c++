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
#include <kj/debug.h>
#include <kj/encoding.h>
#include <kj/thread.h>
#include <sodium/randombytes.h>
#include <errno.h>
#include "util.h"

namespace sandpit {

// =======================================================================================
// Control loop
//
// A thread running its own event loop, owning the engine instance used for everything that is not
// a sandbox run: network provisioning, the egress proxy, and cleanup. Other threads hand it work
// through its executor and block until the work completes.

class Orchestrator::ControlLoop {
public:
  explicit ControlLoop(ContainerEngineFactory& engineFactory)
      : thread([this, &engineFactory]() { loop(engineFactory); }) {
    auto lock = state.lockExclusive();
    lock.wait([](const State& s) { return s.ready || s.error != nullptr; });
    KJ_IF_MAYBE(exception, lock->error) {
      kj::throwFatalException(kj::cp(*exception));
    }
  }

  ~ControlLoop() noexcept(false) {
    const kj::Executor* executor;
    kj::PromiseFulfiller<void>* stopper;
    {
      auto lock = state.lockExclusive();
      if (!lock->ready) return;
      executor = lock->executor;
      stopper = lock->stopper;
      lock->ready = false;
    }
    executor->executeSync([stopper]() { stopper->fulfill(); });
    // `thread`'s destructor joins.
  }

  template <typename Func>
  auto run(Func&& func) {
    // Call `func(engine)` on the control loop and wait for the promise it returns.

    const kj::Executor* executor;
    ContainerEngine* engine;
    {
      auto lock = state.lockExclusive();
      KJ_REQUIRE(lock->ready, "control loop is not running");
      executor = lock->executor;
      engine = lock->engine;
    }
    return executor->executeSync([&]() { return func(*engine); });
  }

private:
  struct State {
    bool ready = false;
    kj::Maybe<kj::Exception> error;
    const kj::Executor* executor = nullptr;
    ContainerEngine* engine = nullptr;
    kj::PromiseFulfiller<void>* stopper = nullptr;
  };

  kj::MutexGuarded<State> state;
  kj::Thread thread;

  void loop(ContainerEngineFactory& engineFactory) {
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      auto io = kj::setupAsyncIo();
      auto engine = engineFactory.newEngine(*io.provider);
      auto paf = kj::newPromiseAndFulfiller<void>();

      {
        auto lock = state.lockExclusive();
        lock->executor = &kj::getCurrentThreadExecutor();
        lock->engine = engine.get();
        lock->stopper = paf.fulfiller.get();
        lock->ready = true;
      }

      paf.promise.wait(io.waitScope);
    })) {
      KJ_LOG(ERROR, "control loop failed", *exception);
      auto lock = state.lockExclusive();
      lock->ready = false;
      lock->error = kj::mv(*exception);
    }
  }
};

// =======================================================================================

ContainerSpec sandboxContainerSpec(const Config& config, kj::StringPtr id,
                                   kj::StringPtr workspace, kj::StringPtr scriptName,
                                   NetworkMode mode) {
  auto plan = planNetworks(mode, { config.isolatedNetwork, config.externalNetwork });
  auto guestScript = kj::str(config.guestWorkspace, '/', scriptName);

  ContainerSpec spec;
  spec.name = kj::heapString(id);
  spec.image = kj::heapString(config.image);

  auto argv = kj::heapArrayBuilder<kj::String>(3);
  argv.add(kj::str("sh"));
  argv.add(kj::str("-c"));
  argv.add(kj::str(config.interpreter, ' ', shellQuote(guestScript), " 2>&1"));
  spec.argv = argv.finish();

  bool useProxy = config.proxyEnabled && mode != NetworkMode::PUBLIC;
  auto env = kj::heapArrayBuilder<kj::String>(useProxy ? 2 : 1);
  env.add(kj::str("SANDBOX_WORKSPACE=", config.guestWorkspace));
  if (useProxy) {
    env.add(kj::str("SANDBOX_PROXY_URL=http://", config.proxyContainerName, ':',
                    config.proxyPort));
  }
  spec.env = env.finish();

  spec.workingDir = kj::heapString(config.guestWorkspace);

  auto binds = kj::heapArrayBuilder<BindMount>(1);
  binds.add(BindMount { kj::heapString(workspace), kj::heapString(config.guestWorkspace), false });
  spec.binds = binds.finish();

  spec.network = kj::heapString(plan.primary);
  return spec;
}

static kj::String newSandboxId(uint64_t serial) {
  // The serial makes IDs unique within the process; the random part keeps two processes sharing a
  // workspace root from colliding.
  byte random[8];
  randombytes_buf(random, sizeof(random));
  return kj::str("sandbox_", serial, '_', kj::encodeHex(kj::arrayPtr(random, sizeof(random))));
}

static void discardWorkspace(kj::StringPtr workspace) {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    recursivelyDelete(workspace);
  })) {
    KJ_LOG(WARNING, "couldn't delete sandbox workspace", workspace, *exception);
  }
}

static void deliver(kj::StringPtr id, Orchestrator::FinishCallback& onFinish,
                    SandboxResult&& result) {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    onFinish(kj::mv(result));
  })) {
    KJ_LOG(ERROR, "sandbox completion callback threw", id, *exception);
  }
}

Orchestrator::Orchestrator(Config configParam, ContainerEngineFactory& engineFactory)
    : config(kj::mv(configParam)), engineFactory(engineFactory) {
  if (config.proxyEnabled) {
    KJ_REQUIRE(config.proxyUpstream.size() > 0,
        "PROXY_UPSTREAM must be set when the egress proxy is enabled");
  }

  KJ_IF_MAYBE(dir, config.imageBuildDir) {
    buildImage(*dir);
  }

  controlLoop = kj::heap<ControlLoop>(engineFactory);

  controlLoop->run([this](ContainerEngine& engine) {
    return ensureIsolatedNetwork(engine, config.isolatedNetwork);
  });

  if (config.proxyEnabled) {
    startEgressProxy();
    proxyStarted = true;
  }
}

Orchestrator::~Orchestrator() noexcept(false) {
  unwindDetector.catchExceptionsIfUnwinding([this]() {
    shutdown();
  });
}

void Orchestrator::buildImage(kj::StringPtr directory) {
  KJ_LOG(INFO, "building sandbox image", config.image, directory);
  Subprocess({"docker", "build", "-t", config.image, directory}).waitForSuccess();
}

void Orchestrator::startEgressProxy() {
  ContainerSpec spec;
  spec.name = kj::heapString(config.proxyContainerName);
  spec.image = kj::heapString(config.image);

  auto argv = kj::heapArrayBuilder<kj::String>(4 + config.proxyEndpoints.size());
  argv.add(kj::str("/sandbox_proxy/", baseName(config.proxyBinary)));
  argv.add(kj::str("--upstream=", config.proxyUpstream));
  argv.add(kj::str("--timeout=", config.proxyTimeout / kj::SECONDS));
  for (auto& endpoint: config.proxyEndpoints) {
    argv.add(kj::str("--endpoint=", endpoint));
  }
  argv.add(kj::str("*:", config.proxyPort));
  spec.argv = argv.finish();

  auto env = kj::heapArrayBuilder<kj::String>(1);
  env.add(kj::str("FORWARD_TO=", config.proxyUpstream));
  spec.env = env.finish();

  spec.workingDir = kj::str("/");

  auto binds = kj::heapArrayBuilder<BindMount>(1);
  binds.add(BindMount { dirName(config.proxyBinary), kj::str("/sandbox_proxy"), true });
  spec.binds = binds.finish();

  spec.network = kj::heapString(config.isolatedNetwork);

  controlLoop->run([&](ContainerEngine& engine) {
    return engine.removeContainer(spec.name, true).then([&](bool existed) {
      if (existed) {
        KJ_LOG(INFO, "removed stale egress proxy container", spec.name);
      }
      return engine.createContainer(spec);
    }).then([&](kj::String id) {
      auto promise = engine.startContainer(id);
      return promise.then([this, &engine, KJ_MVCAP(id)]() {
        return engine.connectNetwork(config.externalNetwork, id)
            .catch_([this](kj::Exception&& exception) {
          KJ_LOG(WARNING, "couldn't attach egress proxy to external network",
                 config.externalNetwork, exception);
        });
      });
    });
  });

  KJ_LOG(INFO, "egress proxy started", config.proxyContainerName, config.proxyUpstream);
}

void Orchestrator::stopEgressProxy() {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    bool existed = controlLoop->run([this](ContainerEngine& engine) {
      return engine.removeContainer(config.proxyContainerName, true);
    });
    if (!existed) {
      KJ_LOG(WARNING, "egress proxy container was already gone", config.proxyContainerName);
    }
  })) {
    KJ_LOG(WARNING, "couldn't remove egress proxy container", *exception);
  }
}

kj::String Orchestrator::create(kj::StringPtr scriptPath, capnp::JsonValue::Reader input,
                                MountHook onMount, FinishCallback onFinish,
                                NetworkMode mode) {
  return create(scriptPath, input, kj::mv(onMount), kj::mv(onFinish), mode, config.runTimeout);
}

kj::String Orchestrator::create(kj::StringPtr scriptPath, capnp::JsonValue::Reader input,
                                MountHook onMount, FinishCallback onFinish,
                                NetworkMode mode, kj::Maybe<kj::Duration> timeout) {
  kj::String id;
  {
    auto lock = runState.lockExclusive();
    KJ_REQUIRE(!lock->shuttingDown, "orchestrator is shutting down");
    id = newSandboxId(++lock->serial);
    // Counted as a worker from here on so that shutdown() waits for us.
    ++lock->workers;
  }
  bool spawned = false;
  KJ_DEFER(if (!spawned) finishWorker());

  auto workspace = kj::str(config.workspaceRoot, '/', id);
  auto scriptName = kj::heapString(baseName(scriptPath));

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    KJ_SYSCALL(mkdir(workspace.cStr(), 0700), workspace);
  })) {
    deliver(id, onFinish, SandboxResult::failure(
        kj::str("failed to prepare workspace: ", exception->getDescription()),
        kj::str(*exception)));
    return id;
  }

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    onMount(workspace);
  })) {
    discardWorkspace(workspace);
    deliver(id, onFinish, SandboxResult::failure(
        kj::str("mount hook failed: ", exception->getDescription()),
        kj::str(*exception)));
    return id;
  }

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    writeFile(kj::str(workspace, '/', INPUT_DOCUMENT), encodeInputDocument(input));
    writeFile(kj::str(workspace, '/', scriptName), readAll(scriptPath), 0755);
  })) {
    discardWorkspace(workspace);
    deliver(id, onFinish, SandboxResult::failure(
        kj::str("failed to prepare workspace: ", exception->getDescription()),
        kj::str(*exception)));
    return id;
  }

  {
    SandboxEntry entry {
      kj::heapString(id), kj::heapString(workspace), kj::heapString(scriptName), mode, nullptr
    };
    kj::StringPtr key = entry.id;
    sandboxes.lockExclusive()->insert(std::make_pair(key, kj::mv(entry)));
  }

  KJ_LOG(INFO, "sandbox created", id, networkModeName(mode));

  spawnWorker(Job {
    kj::heapString(id), kj::mv(workspace), kj::mv(scriptName), mode, timeout, kj::mv(onFinish)
  });
  spawned = true;
  return id;
}

void Orchestrator::spawnWorker(Job job) {
  kj::Thread thread([this, KJ_MVCAP(job)]() mutable {
    {
      auto ownJob = kj::mv(job);
      runWorker(ownJob);
    }
    // Nothing of ours may be touched after this.
    finishWorker();
  });
  thread.detach();
}

void Orchestrator::finishWorker() {
  auto lock = runState.lockExclusive();
  --lock->workers;
}

void Orchestrator::runWorker(Job& job) {
  kj::Maybe<SandboxResult> result;

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    auto io = kj::setupAsyncIo();
    auto engine = engineFactory.newEngine(*io.provider);

    bool gated = config.maxConcurrentRuns > 0;
    if (gated) {
      auto lock = runState.lockExclusive();
      lock.wait([this](const RunState& state) {
        return state.launched < config.maxConcurrentRuns || state.shuttingDown;
      });
      ++lock->launched;
    }
    KJ_DEFER(if (gated) --runState.lockExclusive()->launched);

    result = execute(job, *engine, io);
  })) {
    result = SandboxResult::failure(
        kj::str("failed to run: ", exception->getDescription()), kj::str(*exception));
  }

  auto& r = KJ_ASSERT_NONNULL(result);
  if (r.isSuccess()) {
    KJ_LOG(INFO, "sandbox finished", job.id);
  } else {
    KJ_LOG(INFO, "sandbox failed", job.id, r.outcome.get<SandboxResult::Failure>().error);
  }
  deliver(job.id, job.onFinish, kj::mv(r));
}

SandboxResult Orchestrator::execute(Job& job, ContainerEngine& engine, kj::AsyncIoContext& io) {
  auto& waitScope = io.waitScope;

  if (!isRegistered(job.id)) {
    return SandboxResult::failure(kj::str("failed to run: sandbox was cleaned up before launch"));
  }

  auto spec = sandboxContainerSpec(config, job.id, job.workspace, job.scriptName, job.mode);
  auto plan = planNetworks(job.mode, { config.isolatedNetwork, config.externalNetwork });

  kj::Maybe<kj::String> containerId;
  kj::Maybe<kj::String> logs;
  kj::Maybe<SandboxResult> result;

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    auto id = engine.createContainer(spec).wait(waitScope);
    if (!recordContainer(job.id, id)) {
      engine.removeContainer(id, true).wait(waitScope);
      KJ_FAIL_REQUIRE("sandbox was cleaned up while its container was being created");
    }
    containerId = kj::heapString(id);

    engine.startContainer(id).wait(waitScope);

    KJ_IF_MAYBE(external, plan.attachAfterStart) {
      KJ_IF_MAYBE(e, kj::runCatchingExceptions([&]() {
        engine.connectNetwork(*external, id).wait(waitScope);
      })) {
        KJ_LOG(WARNING, "couldn't attach sandbox to external network", job.id, *external, *e);
      }
    }

    kj::Promise<void> exited = nullptr;
    if (config.streamLogs) {
      exited = engine.followLogs(id, [&job](kj::StringPtr line) {
        KJ_LOG(INFO, "sandbox output", job.id, line);
      }).then([&]() {
        return engine.waitContainer(id);
      }).then([&job](int status) {
        KJ_LOG(INFO, "sandbox container exited", job.id, status);
      });
    } else {
      exited = engine.waitContainer(id).then([&job](int status) {
        KJ_LOG(INFO, "sandbox container exited", job.id, status);
      });
    }

    bool timedOut = false;
    KJ_IF_MAYBE(t, job.timeout) {
      exited = exited.exclusiveJoin(io.provider->getTimer().afterDelay(*t)
          .then([&timedOut]() { timedOut = true; }));
    }
    exited.wait(waitScope);

    if (timedOut) {
      auto seconds = KJ_ASSERT_NONNULL(job.timeout) / kj::SECONDS;
      KJ_LOG(WARNING, "sandbox timed out; killing it", job.id, seconds);
      engine.killContainer(id).wait(waitScope);
      logs = engine.containerLogs(id).wait(waitScope);
      engine.removeContainer(id, true).wait(waitScope);
      clearContainer(job.id);
      result = SandboxResult::failure(kj::str("timed out after ", seconds, " seconds"));
      return;
    }

    logs = engine.containerLogs(id).wait(waitScope);
    engine.removeContainer(id, true).wait(waitScope);
    clearContainer(job.id);
    result = readOutputDocument(job.workspace, config.maxOutputSize);
  })) {
    // Logs are worth having even when something else went wrong, if the container exists.
    if (logs == nullptr) {
      KJ_IF_MAYBE(id, containerId) {
        KJ_IF_MAYBE(e, kj::runCatchingExceptions([&]() {
          logs = engine.containerLogs(*id).wait(waitScope);
        })) {
          KJ_LOG(INFO, "couldn't fetch logs of failed sandbox", job.id, e->getDescription());
        }
      }
    }
    result = SandboxResult::failure(
        kj::str("failed to run: ", exception->getDescription()), kj::str(*exception));
  }

  auto finalResult = kj::mv(KJ_ASSERT_NONNULL(result));
  finalResult.logs = kj::mv(logs);
  return finalResult;
}

bool Orchestrator::isRegistered(kj::StringPtr id) {
  auto lock = sandboxes.lockExclusive();
  return lock->find(id) != lock->end();
}

bool Orchestrator::recordContainer(kj::StringPtr id, kj::StringPtr containerId) {
  auto lock = sandboxes.lockExclusive();
  auto iter = lock->find(id);
  if (iter == lock->end()) return false;
  iter->second.containerId = kj::heapString(containerId);
  return true;
}

void Orchestrator::clearContainer(kj::StringPtr id) {
  auto lock = sandboxes.lockExclusive();
  auto iter = lock->find(id);
  if (iter != lock->end()) {
    iter->second.containerId = nullptr;
  }
}

void Orchestrator::cleanup(kj::StringPtr id) {
  unregister(id, true);
}

void Orchestrator::forget(kj::StringPtr id) {
  unregister(id, false);
}

void Orchestrator::unregister(kj::StringPtr id, bool deleteWorkspace) {
  kj::Maybe<SandboxEntry> removed;
  {
    auto lock = sandboxes.lockExclusive();
    auto iter = lock->find(id);
    if (iter == lock->end()) {
      KJ_LOG(WARNING, "cleanup of unknown sandbox", id);
      return;
    }
    removed = kj::mv(iter->second);
    lock->erase(iter);
  }
  auto& entry = KJ_ASSERT_NONNULL(removed);

  KJ_IF_MAYBE(container, entry.containerId) {
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      bool existed = controlLoop->run([&](ContainerEngine& engine) {
        return engine.removeContainer(*container, true);
      });
      if (!existed) {
        KJ_LOG(WARNING, "sandbox container was already gone", entry.id, *container);
      }
    })) {
      KJ_LOG(WARNING, "couldn't remove sandbox container", entry.id, *exception);
    }
  }

  if (deleteWorkspace) {
    discardWorkspace(entry.workspace);
    KJ_LOG(INFO, "sandbox cleaned up", entry.id);
  } else {
    KJ_LOG(INFO, "sandbox released; workspace kept", entry.id, entry.workspace);
  }
}

void Orchestrator::cleanupAll() {
  kj::Vector<kj::String> ids;
  {
    auto lock = sandboxes.lockShared();
    for (auto& entry: *lock) {
      ids.add(kj::heapString(entry.first));
    }
  }
  for (auto& id: ids) {
    cleanup(id);
  }
}

size_t Orchestrator::count() {
  return sandboxes.lockShared()->size();
}

kj::Maybe<kj::String> Orchestrator::workspacePath(kj::StringPtr id) {
  auto lock = sandboxes.lockShared();
  auto iter = lock->find(id);
  if (iter == lock->end()) return nullptr;
  return kj::heapString(iter->second.workspace);
}

void Orchestrator::shutdown() {
  {
    auto lock = runState.lockExclusive();
    if (lock->shuttingDown) return;
    lock->shuttingDown = true;
  }

  KJ_LOG(INFO, "shutting down sandbox orchestrator", count());
  cleanupAll();

  runState.lockExclusive().wait([](const RunState& state) { return state.workers == 0; });

  // A create() that was already past its check may have registered a sandbox after the first
  // sweep.
  cleanupAll();

  if (proxyStarted) {
    stopEgressProxy();
    proxyStarted = false;
  }
  controlLoop = nullptr;
}

}  // namespace sandpit
