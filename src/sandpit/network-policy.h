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

#ifndef SANDPIT_NETWORK_POLICY_H_
#define SANDPIT_NETWORK_POLICY_H_

#include "engine.h"

namespace sandpit {

enum class NetworkMode {
  RESTRICTED,
  // Attached only to the isolated network. Outside services are reachable solely through the
  // egress proxy.

  DUAL,
  // Isolated network plus the external one, attached once the container has started.

  PUBLIC
  // Only the external network. The proxy is unreachable.
};

NetworkMode parseNetworkMode(kj::StringPtr text);
// Accepts "sandbox", "both" and "public".

kj::StringPtr networkModeName(NetworkMode mode);
inline kj::StringPtr KJ_STRINGIFY(NetworkMode mode) { return networkModeName(mode); }

struct NetworkNames {
  kj::StringPtr isolated;
  kj::StringPtr external;
};

struct NetworkPlan {
  kj::StringPtr primary;
  // Attached when the container is created.

  kj::Maybe<kj::StringPtr> attachAfterStart;
};

NetworkPlan planNetworks(NetworkMode mode, NetworkNames names);

kj::Promise<void> ensureIsolatedNetwork(ContainerEngine& engine, kj::StringPtr name);
// Creates the internal bridge network `name` unless it already exists. Safe against another
// process creating it at the same moment.

}  // namespace sandpit

#endif // SANDPIT_NETWORK_POLICY_H_
