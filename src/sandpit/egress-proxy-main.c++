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

#include <kj/main.h>
#include <kj/debug.h>
#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <stdlib.h>
#include "version.h"
#include "config.h"
#include "egress-proxy.h"
#include "util.h"

namespace sandpit {

class EgressProxyMain {
  // Main class for the egress proxy, which runs inside the proxy container.

public:
  EgressProxyMain(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Sandpit version " SANDPIT_VERSION,
                           "Listens on <bind-address> and relays POST requests for whitelisted "
                           "paths to an upstream HTTP service. The upstream defaults to the "
                           "FORWARD_TO environment variable.")
        .addOptionWithArg({'u', "upstream"}, KJ_BIND_METHOD(*this, setUpstream),
                          "<url>", "forward to <url> instead of $FORWARD_TO")
        .addOptionWithArg({'t', "timeout"}, KJ_BIND_METHOD(*this, setTimeout),
                          "<seconds>", "give up on the upstream after <seconds> (default 600)")
        .addOptionWithArg({'e', "endpoint"}, KJ_BIND_METHOD(*this, addEndpoint),
                          "<path>", "allow <path>; may be repeated (default /api/inference and "
                          "/api/embedding)")
        .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose), "log every request")
        .expectArg("<bind-address>", KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext& context;
  kj::Maybe<kj::String> upstream;
  kj::Duration timeout = 600 * kj::SECONDS;
  kj::Vector<kj::String> endpoints;

  kj::MainBuilder::Validity setUpstream(kj::StringPtr arg) {
    upstream = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity setTimeout(kj::StringPtr arg) {
    KJ_IF_MAYBE(n, parseUInt(arg, 10)) {
      if (*n == 0) return "timeout must be positive";
      timeout = *n * kj::SECONDS;
      return true;
    } else {
      return "timeout must be a number of seconds";
    }
  }

  kj::MainBuilder::Validity addEndpoint(kj::StringPtr arg) {
    if (!arg.startsWith("/")) return "endpoint must be a path starting with '/'";
    endpoints.add(kj::heapString(arg));
    return true;
  }

  kj::MainBuilder::Validity setVerbose() {
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
    return true;
  }

  kj::MainBuilder::Validity run(kj::StringPtr bindAddress) {
    EgressProxyOptions options;
    KJ_IF_MAYBE(u, upstream) {
      options.upstream = kj::mv(*u);
    } else {
      const char* env = getenv("FORWARD_TO");
      if (env == nullptr || *env == '\0') {
        return "no upstream; pass --upstream or set FORWARD_TO";
      }
      options.upstream = kj::str(env);
    }
    while (options.upstream.endsWith("/")) {
      options.upstream = kj::heapString(options.upstream.slice(0, options.upstream.size() - 1));
    }
    options.timeout = timeout;
    options.endpoints = endpoints.size() == 0 ? Config::defaultProxyEndpoints()
                                              : endpoints.releaseAsArray();

    auto io = kj::setupAsyncIo();
    auto& timer = io.provider->getTimer();
    auto& network = io.provider->getNetwork();

    kj::HttpHeaderTable::Builder headerTableBuilder;
    auto client = kj::newHttpClient(timer, headerTableBuilder.getFutureTable(), network, nullptr);
    auto proxy = newEgressProxy(timer, *client, kj::mv(options), headerTableBuilder);
    auto headerTable = headerTableBuilder.build();

    kj::HttpServer server(timer, *headerTable, *proxy);
    auto address = network.parseAddress(bindAddress, 80).wait(io.waitScope);
    auto listener = address->listen();
    KJ_LOG(INFO, "egress proxy listening", address->toString());

    server.listenHttp(*listener).wait(io.waitScope);
    return "proxy listener stopped";
  }
};

}  // namespace sandpit

KJ_MAIN(sandpit::EgressProxyMain)
