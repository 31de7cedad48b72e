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

#include "egress-proxy.h"
#include <kj/debug.h>
#include "util.h"

namespace sandpit {

kj::String requestPath(kj::StringPtr url) {
  kj::StringPtr rest = url;
  KJ_IF_MAYBE(schemeEnd, url.findFirst(':')) {
    if (url.slice(*schemeEnd).startsWith("://")) {
      // Absolute form. Skip the authority.
      rest = url.slice(*schemeEnd + 3);
      KJ_IF_MAYBE(slash, rest.findFirst('/')) {
        rest = rest.slice(*slash);
      } else {
        return kj::str("/");
      }
    }
  }

  size_t end = rest.size();
  KJ_IF_MAYBE(q, rest.findFirst('?')) end = *q;
  KJ_IF_MAYBE(f, rest.findFirst('#')) end = kj::min(end, *f);
  return kj::heapString(rest.slice(0, end));
}

namespace {

struct Relayed {
  // A complete response, ready to be sent back to the sandbox.

  uint statusCode;
  kj::String statusText;
  kj::Maybe<kj::String> contentType;
  kj::String body;
};

Relayed detail(uint statusCode, kj::StringPtr statusText, kj::StringPtr message) {
  return {
    statusCode, kj::str(statusText), nullptr,
    kj::str("{\"detail\":\"", message, "\"}")
  };
}

class EgressProxy final: public kj::HttpService {
public:
  EgressProxy(kj::Timer& timer, kj::HttpClient& upstream, EgressProxyOptions options,
              kj::HttpHeaderTable::Builder& headerTableBuilder)
      : timer(timer), upstream(upstream), options(kj::mv(options)),
        headerTable(headerTableBuilder.getFutureTable()) {}

  kj::Promise<void> request(
      kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody, Response& response) override {
    auto path = requestPath(url);

    if (!isAllowed(path)) {
      KJ_LOG(INFO, "refusing request to non-whitelisted path", method, path);
      return send(response, detail(404, "Not Found", "Not Found"));
    }
    if (method != kj::HttpMethod::POST) {
      return send(response, detail(405, "Method Not Allowed", "Method Not Allowed"));
    }

    auto result = requestBody.readAllText()
        .then([this, KJ_MVCAP(path)](kj::String body) {
      auto timeout = timer.afterDelay(options.timeout).then([this]() {
        KJ_LOG(WARNING, "upstream request timed out", options.timeout / kj::SECONDS);
        return detail(504, "Gateway Timeout", "Proxy timeout forwarding request");
      });
      return forward(path, kj::mv(body)).exclusiveJoin(kj::mv(timeout));
    }, [](kj::Exception&& exception) -> kj::Promise<Relayed> {
      KJ_LOG(ERROR, "proxy failed to handle request", exception);
      return detail(500, "Internal Server Error", "Proxy unexpected error");
    });

    return result.then([this, &response](Relayed&& relayed) {
      return send(response, kj::mv(relayed));
    });
  }

private:
  kj::Timer& timer;
  kj::HttpClient& upstream;
  EgressProxyOptions options;
  kj::HttpHeaderTable& headerTable;

  bool isAllowed(kj::StringPtr path) {
    for (auto& endpoint: options.endpoints) {
      if (endpoint == path) return true;
    }
    return false;
  }

  kj::Promise<Relayed> forward(kj::StringPtr path, kj::String body) {
    auto target = kj::str(options.upstream, path);
    KJ_LOG(INFO, "forwarding request", target, body.size());

    return kj::evalNow([&]() {
      kj::HttpHeaders headers(headerTable);
      headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
      auto request = upstream.request(kj::HttpMethod::POST, target, headers, body.size());
      auto promise = request.body->write(body.begin(), body.size());
      return promise.attach(kj::mv(request.body), kj::mv(body))
          .then([response = kj::mv(request.response)]() mutable { return kj::mv(response); });
    }).then([](kj::HttpClient::Response&& response) {
      kj::Maybe<kj::String> contentType;
      KJ_IF_MAYBE(type, response.headers->get(kj::HttpHeaderId::CONTENT_TYPE)) {
        contentType = kj::str(*type);
      }
      uint statusCode = response.statusCode;
      auto statusText = kj::str(response.statusText);

      auto promise = response.body->readAllText();
      return promise.attach(kj::mv(response.body))
          .then([statusCode, KJ_MVCAP(statusText), KJ_MVCAP(contentType)]
                (kj::String text) mutable {
        return Relayed { statusCode, kj::mv(statusText), kj::mv(contentType), kj::mv(text) };
      });
    }).catch_([](kj::Exception&& exception) {
      KJ_LOG(WARNING, "upstream request failed", exception);
      return detail(502, "Bad Gateway", "Proxy error forwarding request");
    });
  }

  kj::Promise<void> send(Response& response, Relayed relayed) {
    kj::HttpHeaders headers(headerTable);
    KJ_IF_MAYBE(type, relayed.contentType) {
      headers.set(kj::HttpHeaderId::CONTENT_TYPE, *type);
    } else {
      headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
    }
    auto stream = response.send(relayed.statusCode, relayed.statusText, headers,
                                relayed.body.size());
    auto promise = stream->write(relayed.body.begin(), relayed.body.size());
    return promise.attach(kj::mv(stream), kj::mv(relayed));
  }
};

}  // namespace

kj::Own<kj::HttpService> newEgressProxy(
    kj::Timer& timer, kj::HttpClient& upstream, EgressProxyOptions options,
    kj::HttpHeaderTable::Builder& headerTableBuilder) {
  return kj::heap<EgressProxy>(timer, upstream, kj::mv(options), headerTableBuilder);
}

}  // namespace sandpit
