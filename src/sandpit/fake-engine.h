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

#ifndef SANDPIT_FAKE_ENGINE_H_
#define SANDPIT_FAKE_ENGINE_H_
// A ContainerEngine for tests that runs each "container" as a local `sh` process instead, with the
// guest workspace path rewritten to the host workspace. Only linked into tests.

#include "engine.h"
#include <kj/mutex.h>
#include <kj/vector.h>

namespace sandpit {

struct FakeContainer {
  kj::String id;
  kj::String name;
  kj::String image;
  kj::Array<kj::String> argv;
  kj::Array<kj::String> env;
  kj::String workingDir;
  kj::Array<BindMount> binds;
  kj::String network;
  kj::Vector<kj::String> attachedLater;

  bool started = false;
  bool killed = false;
  bool removed = false;
  kj::Maybe<int> exitStatus;
  kj::String logs = kj::str("");
};

struct FakeEngineState {
  kj::Vector<kj::String> networks;
  uint networkCreates = 0;
  kj::Vector<kj::Own<FakeContainer>> containers;

  bool failConnect = false;
  // connectNetwork() throws.

  bool failWait = false;
  // waitContainer() throws, as if the daemon went away mid-run.

  uint running = 0;
  uint maxRunning = 0;
  // Containers started and not yet removed, and the most there ever were at once.

  uint nextId = 0;

  kj::Maybe<FakeContainer&> find(kj::StringPtr idOrName);
  // Excludes removed containers.

  uint countNamed(kj::StringPtr name);
  // Including removed ones.
};

class FakeEngineFactory final: public ContainerEngineFactory {
public:
  FakeEngineFactory() = default;

  kj::MutexGuarded<FakeEngineState> state;

  kj::StringPtr hangImage = "hang";
  // Containers of this image never exit on their own.

  kj::StringPtr serviceName = "sandbox_proxy";
  // The container with this name is treated as a long-running service and not executed.

  kj::Own<ContainerEngine> newEngine(kj::AsyncIoProvider& ioProvider) override;
};

}  // namespace sandpit

#endif // SANDPIT_FAKE_ENGINE_H_
