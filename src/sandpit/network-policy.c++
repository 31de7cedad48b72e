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
#include <kj/debug.h>
#include "util.h"

namespace sandpit {

NetworkMode parseNetworkMode(kj::StringPtr text) {
  if (text == "sandbox") {
    return NetworkMode::RESTRICTED;
  } else if (text == "both") {
    return NetworkMode::DUAL;
  } else if (text == "public") {
    return NetworkMode::PUBLIC;
  } else {
    KJ_FAIL_REQUIRE("unknown network mode; expected sandbox, both or public", text);
  }
}

kj::StringPtr networkModeName(NetworkMode mode) {
  switch (mode) {
    case NetworkMode::RESTRICTED: return "sandbox";
    case NetworkMode::DUAL: return "both";
    case NetworkMode::PUBLIC: return "public";
  }
  KJ_UNREACHABLE;
}

NetworkPlan planNetworks(NetworkMode mode, NetworkNames names) {
  switch (mode) {
    case NetworkMode::RESTRICTED: return { names.isolated, nullptr };
    case NetworkMode::DUAL: return { names.isolated, names.external };
    case NetworkMode::PUBLIC: return { names.external, nullptr };
  }
  KJ_UNREACHABLE;
}

kj::Promise<void> ensureIsolatedNetwork(ContainerEngine& engine, kj::StringPtr name) {
  return engine.findNetwork(name)
      .then([&engine, name = kj::heapString(name)](bool exists) -> kj::Promise<void> {
    if (exists) {
      KJ_LOG(INFO, "using existing sandbox network", name);
      return kj::READY_NOW;
    }

    auto promise = engine.createNetwork(name, true);
    return promise.then([KJ_MVCAP(name)](bool created) {
      if (created) {
        KJ_LOG(INFO, "created sandbox network", name);
      } else {
        KJ_LOG(INFO, "sandbox network was created concurrently; using it", name);
      }
    });
  });
}

}  // namespace sandpit
