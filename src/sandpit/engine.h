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

#ifndef SANDPIT_ENGINE_H_
#define SANDPIT_ENGINE_H_

#include <kj/async-io.h>
#include <kj/function.h>
#include <kj/string.h>

namespace sandpit {

struct BindMount {
  kj::String hostPath;
  kj::String guestPath;
  bool readOnly = false;
};

struct ContainerSpec {
  // Everything needed to create one container.

  kj::String name;
  kj::String image;
  kj::Array<kj::String> argv;
  kj::Array<kj::String> env;   // NAME=VALUE
  kj::String workingDir;
  kj::Array<BindMount> binds;
  kj::String network;
  // The network attached at creation. Further networks can only be added with connectNetwork()
  // once the container exists.
};

class ContainerEngine {
  // The container runtime, as seen by the orchestrator.
  //
  // An instance is bound to the event loop of the thread that created it (see
  // ContainerEngineFactory) and must only be used from that thread. Every thread that talks to
  // the runtime makes its own instance.

public:
  virtual ~ContainerEngine() noexcept(false) = default;

  virtual kj::Promise<bool> findNetwork(kj::StringPtr name) = 0;
  // Returns whether a network with this name exists.

  virtual kj::Promise<bool> createNetwork(kj::StringPtr name, bool internal) = 0;
  // Create a bridge network. If `internal`, it has no route outside the host. Resolves to false,
  // creating nothing, if a network with this name already exists.

  virtual kj::Promise<kj::String> createContainer(const ContainerSpec& spec) = 0;
  // Returns the new container's ID. Fails if a container named `spec.name` already exists.

  virtual kj::Promise<void> startContainer(kj::StringPtr id) = 0;

  virtual kj::Promise<void> connectNetwork(kj::StringPtr network, kj::StringPtr id) = 0;

  virtual kj::Promise<int> waitContainer(kj::StringPtr id) = 0;
  // Resolves to the container's exit status once it stops.

  virtual kj::Promise<kj::String> containerLogs(kj::StringPtr id) = 0;
  // The complete combined stdout/stderr output produced so far.

  virtual kj::Promise<void> followLogs(
      kj::StringPtr id, kj::Function<void(kj::StringPtr line)> onLine) = 0;
  // Deliver output line by line as the container produces it. Resolves when the container stops
  // and the last line has been delivered.

  virtual kj::Promise<void> killContainer(kj::StringPtr id) = 0;
  // SIGKILL the container's process. Not an error if it has already stopped.

  virtual kj::Promise<bool> removeContainer(kj::StringPtr id, bool force) = 0;
  // Delete the container (`force` stops it first). Resolves to false if there was no such
  // container.
};

class ContainerEngineFactory {
public:
  virtual kj::Own<ContainerEngine> newEngine(kj::AsyncIoProvider& ioProvider) = 0;
  // Called once on each thread that needs to talk to the runtime, after that thread has set up
  // its event loop. Must be safe to call from any thread.
};

}  // namespace sandpit

#endif // SANDPIT_ENGINE_H_
