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

#include "fake-engine.h"
#include <kj/debug.h>
#include "util.h"

namespace sandpit {

kj::Maybe<FakeContainer&> FakeEngineState::find(kj::StringPtr idOrName) {
  for (auto& container: containers) {
    if (!container->removed && (container->id == idOrName || container->name == idOrName)) {
      return *container;
    }
  }
  return nullptr;
}

uint FakeEngineState::countNamed(kj::StringPtr name) {
  uint count = 0;
  for (auto& container: containers) {
    if (container->name == name) ++count;
  }
  return count;
}

static kj::String replaceAll(kj::StringPtr text, kj::StringPtr from, kj::StringPtr to) {
  kj::Vector<char> result;
  size_t i = 0;
  while (i < text.size()) {
    if (text.slice(i).startsWith(from)) {
      result.addAll(to);
      i += from.size();
    } else {
      result.add(text[i++]);
    }
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

namespace {

class FakeEngine final: public ContainerEngine {
public:
  explicit FakeEngine(FakeEngineFactory& factory): factory(factory) {}

  kj::Promise<bool> findNetwork(kj::StringPtr name) override {
    auto lock = factory.state.lockExclusive();
    for (auto& network: lock->networks) {
      if (network == name) return true;
    }
    return false;
  }

  kj::Promise<bool> createNetwork(kj::StringPtr name, bool internal) override {
    auto lock = factory.state.lockExclusive();
    for (auto& network: lock->networks) {
      if (network == name) return false;
    }
    lock->networks.add(kj::heapString(name));
    ++lock->networkCreates;
    return true;
  }

  kj::Promise<kj::String> createContainer(const ContainerSpec& spec) override {
    auto lock = factory.state.lockExclusive();
    KJ_REQUIRE(lock->find(spec.name) == nullptr, "Conflict. The container name is already in use",
               spec.name);

    auto container = kj::heap<FakeContainer>();
    container->id = kj::str("fake", ++lock->nextId);
    container->name = kj::heapString(spec.name);
    container->image = kj::heapString(spec.image);
    container->argv = KJ_MAP(arg, spec.argv) { return kj::heapString(arg); };
    container->env = KJ_MAP(var, spec.env) { return kj::heapString(var); };
    container->workingDir = kj::heapString(spec.workingDir);
    container->binds = KJ_MAP(bind, spec.binds) {
      return BindMount { kj::heapString(bind.hostPath), kj::heapString(bind.guestPath),
                         bind.readOnly };
    };
    container->network = kj::heapString(spec.network);

    auto id = kj::heapString(container->id);
    lock->containers.add(kj::mv(container));
    return kj::mv(id);
  }

  kj::Promise<void> startContainer(kj::StringPtr id) override {
    kj::String command;
    kj::Vector<kj::String> env;
    kj::String hostDir;
    {
      auto lock = factory.state.lockExclusive();
      auto& container = KJ_REQUIRE_NONNULL(lock->find(id), "No such container", id);
      container.started = true;
      ++lock->running;
      lock->maxRunning = kj::max(lock->maxRunning, lock->running);

      if (container.image == factory.hangImage || container.name == factory.serviceName) {
        return kj::READY_NOW;
      }

      KJ_REQUIRE(container.binds.size() == 1 && container.argv.size() == 3);
      auto& bind = container.binds[0];
      hostDir = kj::heapString(bind.hostPath);
      command = replaceAll(container.argv[2], bind.guestPath, bind.hostPath);
      env.add(kj::str("PATH=/usr/local/bin:/usr/bin:/bin"));
      for (auto& var: container.env) {
        if (var.startsWith("SANDBOX_WORKSPACE=")) {
          env.add(kj::str("SANDBOX_WORKSPACE=", hostDir));
        } else {
          env.add(kj::heapString(var));
        }
      }
    }

    // Run to completion right away; waitContainer() just reports the outcome.
    auto envPtrs = KJ_MAP(var, env) -> const kj::StringPtr { return var; };
    Pipe pipe = Pipe::make();
    Subprocess::Options options({"sh", "-c", command});
    options.environment = envPtrs.asPtr();
    options.workingDirectory = kj::StringPtr(hostDir);
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    auto output = readAll(pipe.readEnd);
    int status = child.waitForExit();

    auto lock = factory.state.lockExclusive();
    auto& container = KJ_REQUIRE_NONNULL(lock->find(id), "No such container", id);
    container.logs = kj::mv(output);
    container.exitStatus = status;
    return kj::READY_NOW;
  }

  kj::Promise<void> connectNetwork(kj::StringPtr network, kj::StringPtr id) override {
    auto lock = factory.state.lockExclusive();
    KJ_REQUIRE(!lock->failConnect, "network attach refused", network);
    auto& container = KJ_REQUIRE_NONNULL(lock->find(id), "No such container", id);
    container.attachedLater.add(kj::heapString(network));
    return kj::READY_NOW;
  }

  kj::Promise<int> waitContainer(kj::StringPtr id) override {
    auto lock = factory.state.lockExclusive();
    if (lock->failWait) {
      KJ_FAIL_REQUIRE("lost connection to container engine", id);
    }
    auto& container = KJ_REQUIRE_NONNULL(lock->find(id), "No such container", id);
    KJ_IF_MAYBE(status, container.exitStatus) {
      return *status;
    }
    if (container.killed) return 137;
    return kj::Promise<int>(kj::NEVER_DONE);
  }

  kj::Promise<kj::String> containerLogs(kj::StringPtr id) override {
    auto lock = factory.state.lockExclusive();
    auto& container = KJ_REQUIRE_NONNULL(lock->find(id), "No such container", id);
    return kj::heapString(container.logs);
  }

  kj::Promise<void> followLogs(
      kj::StringPtr id, kj::Function<void(kj::StringPtr line)> onLine) override {
    kj::String logs;
    {
      auto lock = factory.state.lockExclusive();
      auto& container = KJ_REQUIRE_NONNULL(lock->find(id), "No such container", id);
      logs = kj::heapString(container.logs);
    }
    for (auto line: split(logs, '\n')) {
      if (line.size() > 0) onLine(kj::heapString(line));
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> killContainer(kj::StringPtr id) override {
    auto lock = factory.state.lockExclusive();
    auto& container = KJ_REQUIRE_NONNULL(lock->find(id), "No such container", id);
    container.killed = true;
    return kj::READY_NOW;
  }

  kj::Promise<bool> removeContainer(kj::StringPtr id, bool force) override {
    auto lock = factory.state.lockExclusive();
    KJ_IF_MAYBE(container, lock->find(id)) {
      if (container->started) --lock->running;
      container->removed = true;
      return true;
    } else {
      return false;
    }
  }

private:
  FakeEngineFactory& factory;
};

}  // namespace

kj::Own<ContainerEngine> FakeEngineFactory::newEngine(kj::AsyncIoProvider& ioProvider) {
  return kj::heap<FakeEngine>(*this);
}

}  // namespace sandpit
