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
#include <kj/debug.h>
#include "util.h"

namespace sandpit {

kj::Array<kj::String> Config::defaultProxyEndpoints() {
  auto builder = kj::heapArrayBuilder<kj::String>(2);
  builder.add(kj::str("/api/inference"));
  builder.add(kj::str("/api/embedding"));
  return builder.finish();
}

kj::Maybe<kj::Duration> parseSeconds(kj::StringPtr value) {
  KJ_IF_MAYBE(n, parseUInt(value, 10)) {
    if (*n == 0) return nullptr;
    return *n * kj::SECONDS;
  } else {
    KJ_FAIL_REQUIRE("expected a number of seconds", value);
  }
}

static kj::Array<kj::String> parseEndpoints(kj::StringPtr value) {
  kj::Vector<kj::String> result;
  for (auto part: split(value, ',')) {
    auto endpoint = trim(part);
    if (endpoint.size() == 0) continue;
    KJ_REQUIRE(endpoint.startsWith("/"), "invalid config value PROXY_ENDPOINTS", endpoint);
    result.add(kj::mv(endpoint));
  }
  return result.releaseAsArray();
}

static kj::String stripTrailingSlashes(kj::String value) {
  // Lets the rest of the code base assume that base URLs and directories don't end in '/'.
  size_t desiredLength = value.size();
  while (desiredLength > 1 && value[desiredLength - 1] == '/') {
    desiredLength -= 1;
  }
  if (desiredLength == value.size()) return kj::mv(value);
  return kj::heapString(value.slice(0, desiredLength));
}

Config parseConfig(kj::StringPtr text) {
  Config config;

  for (auto& line: splitLines(text)) {
    auto equalsPos = KJ_ASSERT_NONNULL(line.findFirst('='), "Invalid config line", line);
    auto key = trim(line.slice(0, equalsPos));
    auto value = trim(line.slice(equalsPos + 1));

    if (key == "DOCKER_SOCKET") {
      config.dockerSocket = kj::mv(value);
    } else if (key == "DOCKER_API_VERSION") {
      config.dockerApiVersion = kj::mv(value);
    } else if (key == "SANDBOX_IMAGE") {
      config.image = kj::mv(value);
    } else if (key == "SANDBOX_IMAGE_BUILD_DIR") {
      config.imageBuildDir = stripTrailingSlashes(kj::mv(value));
    } else if (key == "SANDBOX_NETWORK") {
      config.isolatedNetwork = kj::mv(value);
    } else if (key == "EXTERNAL_NETWORK") {
      config.externalNetwork = kj::mv(value);
    } else if (key == "WORKSPACE_ROOT") {
      config.workspaceRoot = stripTrailingSlashes(kj::mv(value));
    } else if (key == "GUEST_WORKSPACE") {
      KJ_REQUIRE(value.startsWith("/"), "invalid config value GUEST_WORKSPACE", value);
      config.guestWorkspace = stripTrailingSlashes(kj::mv(value));
    } else if (key == "INTERPRETER") {
      config.interpreter = kj::mv(value);
    } else if (key == "STREAM_LOGS") {
      config.streamLogs = parseBool(value);
    } else if (key == "MAX_CONCURRENT_RUNS") {
      KJ_IF_MAYBE(n, parseUInt(value, 10)) {
        config.maxConcurrentRuns = *n;
      } else {
        KJ_FAIL_REQUIRE("invalid config value MAX_CONCURRENT_RUNS", value);
      }
    } else if (key == "RUN_TIMEOUT") {
      KJ_REQUIRE(parseUInt(value, 10) != nullptr, "invalid config value RUN_TIMEOUT", value);
      config.runTimeout = parseSeconds(value);
    } else if (key == "MAX_OUTPUT_SIZE") {
      KJ_IF_MAYBE(n, parseUInt(value, 10)) {
        KJ_REQUIRE(*n > 0, "invalid config value MAX_OUTPUT_SIZE", value);
        config.maxOutputSize = *n;
      } else {
        KJ_FAIL_REQUIRE("invalid config value MAX_OUTPUT_SIZE", value);
      }
    } else if (key == "PROXY_ENABLED") {
      config.proxyEnabled = parseBool(value);
    } else if (key == "PROXY_BINARY") {
      config.proxyBinary = kj::mv(value);
    } else if (key == "PROXY_CONTAINER_NAME") {
      config.proxyContainerName = kj::mv(value);
    } else if (key == "PROXY_PORT") {
      KJ_IF_MAYBE(p, parseUInt(value, 10)) {
        KJ_REQUIRE(*p > 0 && *p < 65536, "invalid config value PROXY_PORT", value);
        config.proxyPort = *p;
      } else {
        KJ_FAIL_REQUIRE("invalid config value PROXY_PORT", value);
      }
    } else if (key == "PROXY_UPSTREAM") {
      config.proxyUpstream = stripTrailingSlashes(kj::mv(value));
    } else if (key == "PROXY_TIMEOUT") {
      KJ_IF_MAYBE(n, parseUInt(value, 10)) {
        KJ_REQUIRE(*n > 0, "invalid config value PROXY_TIMEOUT", value);
        config.proxyTimeout = *n * kj::SECONDS;
      } else {
        KJ_FAIL_REQUIRE("invalid config value PROXY_TIMEOUT", value);
      }
    } else if (key == "PROXY_ENDPOINTS") {
      config.proxyEndpoints = parseEndpoints(value);
    } else {
      KJ_LOG(WARNING, "Ignoring unrecognized config option", key);
    }
  }

  return config;
}

Config readConfig(kj::StringPtr path) {
  return parseConfig(readAll(path));
}

}  // namespace sandpit
