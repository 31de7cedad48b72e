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

#ifndef SANDPIT_CONFIG_H_
#define SANDPIT_CONFIG_H_

#include <kj/string.h>
#include <kj/array.h>
#include <kj/time.h>

namespace sandpit {

struct Config {
  kj::String dockerSocket = kj::str("/var/run/docker.sock");
  kj::String dockerApiVersion = kj::str("v1.41");

  kj::String image = kj::str("sandbox-image");
  kj::Maybe<kj::String> imageBuildDir = nullptr;
  // If set, `docker build` is run on this directory at startup to (re)build `image`.

  kj::String isolatedNetwork = kj::str("sandbox-network");
  kj::String externalNetwork = kj::str("bridge");

  kj::String workspaceRoot = kj::str("/tmp");
  kj::String guestWorkspace = kj::str("/sandbox");
  kj::String interpreter = kj::str("python");

  bool streamLogs = false;
  uint maxConcurrentRuns = 0;  // 0 = unlimited
  kj::Maybe<kj::Duration> runTimeout = nullptr;
  size_t maxOutputSize = 16u << 20;  // bytes of output.json the host will read

  bool proxyEnabled = true;
  kj::String proxyBinary = kj::str("/usr/local/bin/sandpit-proxy");
  kj::String proxyContainerName = kj::str("sandbox_proxy");
  uint proxyPort = 80;
  kj::String proxyUpstream = nullptr;
  kj::Duration proxyTimeout = 600 * kj::SECONDS;
  kj::Array<kj::String> proxyEndpoints = defaultProxyEndpoints();

  static kj::Array<kj::String> defaultProxyEndpoints();
};

// Read and return the config file from `path`. Keys not present keep their defaults.
Config readConfig(kj::StringPtr path);

// Parse config file text. Split out from readConfig() for testing.
Config parseConfig(kj::StringPtr text);

kj::Maybe<kj::Duration> parseSeconds(kj::StringPtr value);
// Parses a non-negative number of whole seconds. "0" yields null (no limit).

}  // namespace sandpit

#endif // SANDPIT_CONFIG_H_
