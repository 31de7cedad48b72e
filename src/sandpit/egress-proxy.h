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

#ifndef SANDPIT_EGRESS_PROXY_H_
#define SANDPIT_EGRESS_PROXY_H_

#include <kj/compat/http.h>

namespace sandpit {

struct EgressProxyOptions {
  kj::String upstream;
  // Base URL requests are forwarded to, e.g. "http://inference.internal:8000". The request path
  // is appended to it.

  kj::Array<kj::String> endpoints;
  // Paths that may be forwarded. Everything else is refused with 404.

  kj::Duration timeout = 600 * kj::SECONDS;
};

kj::Own<kj::HttpService> newEgressProxy(
    kj::Timer& timer, kj::HttpClient& upstream, EgressProxyOptions options,
    kj::HttpHeaderTable::Builder& headerTableBuilder);
// The egress proxy runs in its own container, reachable from the isolated sandbox network and
// itself attached to the external network. It is the only way for restricted sandboxes to reach
// anything outside: it relays POSTs to a whitelisted set of paths to one upstream service and
// refuses everything else.
//
// Upstream failures are reported to the sandbox as JSON `{"detail": ...}` bodies: 504 when the
// upstream does not answer within the timeout, 502 when the request to it fails.

kj::String requestPath(kj::StringPtr url);
// The path of an origin-form ("/a/b?q") or absolute-form ("http://host/a/b?q") request target,
// without query or fragment.

}  // namespace sandpit

#endif // SANDPIT_EGRESS_PROXY_H_
