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
#include <kj/test.h>
#include <kj/timer.h>

namespace sandpit {
namespace {

KJ_TEST("requestPath") {
  KJ_EXPECT(requestPath("/api/inference") == "/api/inference");
  KJ_EXPECT(requestPath("/api/inference?stream=1") == "/api/inference");
  KJ_EXPECT(requestPath("http://sandbox_proxy/api/inference") == "/api/inference");
  KJ_EXPECT(requestPath("http://sandbox_proxy:80/api/embedding?x#y") == "/api/embedding");
  KJ_EXPECT(requestPath("http://sandbox_proxy") == "/");
}

class FakeUpstream final: public kj::HttpService {
public:
  enum Mode { ECHO, HANG, FAIL };

  FakeUpstream(kj::HttpHeaderTable& headerTable): headerTable(headerTable) {}

  Mode mode = ECHO;
  kj::Vector<kj::String> urls;
  kj::Vector<kj::String> contentTypes;
  kj::Vector<kj::String> bodies;

  kj::Promise<void> request(
      kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody, Response& response) override {
    KJ_EXPECT(method == kj::HttpMethod::POST);
    urls.add(kj::heapString(url));
    contentTypes.add(kj::heapString(
        KJ_ASSERT_NONNULL(headers.get(kj::HttpHeaderId::CONTENT_TYPE))));

    return requestBody.readAllText().then([this, &response](kj::String body)
        -> kj::Promise<void> {
      bodies.add(kj::heapString(body));
      switch (mode) {
        case HANG:
          return kj::NEVER_DONE;
        case FAIL:
          return KJ_EXCEPTION(DISCONNECTED, "upstream went away");
        case ECHO:
          break;
      }

      auto text = kj::str("{\"echo\":", body, "}");
      kj::HttpHeaders headers(headerTable);
      headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/vnd.test+json");
      auto stream = response.send(201, "Created Here", headers, text.size());
      auto promise = stream->write(text.begin(), text.size());
      return promise.attach(kj::mv(stream), kj::mv(text));
    });
  }

private:
  kj::HttpHeaderTable& headerTable;
};

class BrokenRequestBody final: public kj::HttpService {
  // Passes requests on to `inner` with a request body that fails when read, as when the sandbox
  // disconnects mid-upload.

public:
  explicit BrokenRequestBody(kj::HttpService& inner): inner(inner) {}

  kj::Promise<void> request(
      kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody, Response& response) override {
    return inner.request(method, url, headers, body, response);
  }

private:
  class FailingInput final: public kj::AsyncInputStream {
  public:
    kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override {
      return KJ_EXCEPTION(DISCONNECTED, "sandbox hung up");
    }
  };

  kj::HttpService& inner;
  FailingInput body;
};

struct ProxyFixture {
  kj::EventLoop loop;
  kj::WaitScope waitScope;
  kj::TimerImpl timer;
  kj::HttpHeaderTable upstreamTable;
  FakeUpstream upstream;
  kj::Own<kj::HttpClient> upstreamClient;
  kj::HttpHeaderTable::Builder headerTableBuilder;
  kj::Own<kj::HttpService> proxy;
  kj::Own<kj::HttpHeaderTable> headerTable;
  kj::Own<kj::HttpClient> client;

  ProxyFixture()
      : waitScope(loop),
        timer(kj::origin<kj::TimePoint>()),
        upstream(upstreamTable),
        upstreamClient(kj::newHttpClient(upstream)),
        proxy(newEgressProxy(timer, *upstreamClient, options(), headerTableBuilder)),
        headerTable(headerTableBuilder.build()),
        client(kj::newHttpClient(*proxy)) {}

  static EgressProxyOptions options() {
    EgressProxyOptions result;
    result.upstream = kj::str("http://inference.internal:8000");
    auto endpoints = kj::heapArrayBuilder<kj::String>(2);
    endpoints.add(kj::str("/api/inference"));
    endpoints.add(kj::str("/api/embedding"));
    result.endpoints = endpoints.finish();
    result.timeout = 600 * kj::SECONDS;
    return result;
  }

  struct Reply {
    uint status;
    kj::String statusText;
    kj::String contentType;
    kj::String body;
  };

  kj::Promise<kj::HttpClient::Response> start(
      kj::HttpMethod method, kj::StringPtr url, kj::StringPtr body) {
    kj::HttpHeaders headers(*headerTable);
    auto request = client->request(method, url, headers, body.size());
    if (body.size() > 0) {
      request.body->write(body.begin(), body.size()).wait(waitScope);
    }
    request.body = nullptr;
    return kj::mv(request.response);
  }

  Reply finish(kj::Promise<kj::HttpClient::Response> promise) {
    auto response = promise.wait(waitScope);
    auto text = response.body->readAllText().wait(waitScope);
    return Reply {
      response.statusCode, kj::str(response.statusText),
      kj::str(KJ_ASSERT_NONNULL(response.headers->get(kj::HttpHeaderId::CONTENT_TYPE))),
      kj::mv(text)
    };
  }

  Reply send(kj::HttpMethod method, kj::StringPtr url, kj::StringPtr body) {
    return finish(start(method, url, body));
  }
};

KJ_TEST("egress proxy forwards whitelisted POSTs verbatim") {
  ProxyFixture f;

  auto reply = f.send(kj::HttpMethod::POST, "http://sandbox_proxy/api/inference?trace=1",
                      "{\"prompt\":\"hi\"}");
  KJ_EXPECT(reply.status == 201);
  KJ_EXPECT(reply.statusText == "Created Here");
  KJ_EXPECT(reply.contentType == "application/vnd.test+json");
  KJ_EXPECT(reply.body == "{\"echo\":{\"prompt\":\"hi\"}}");

  KJ_ASSERT(f.upstream.urls.size() == 1);
  KJ_EXPECT(f.upstream.urls[0] == "http://inference.internal:8000/api/inference");
  KJ_EXPECT(f.upstream.contentTypes[0] == "application/json");
  KJ_EXPECT(f.upstream.bodies[0] == "{\"prompt\":\"hi\"}");

  auto embedding = f.send(kj::HttpMethod::POST, "/api/embedding", "[1,2]");
  KJ_EXPECT(embedding.status == 201);
  KJ_EXPECT(f.upstream.urls.size() == 2);
}

KJ_TEST("egress proxy refuses everything else") {
  ProxyFixture f;

  auto notFound = f.send(kj::HttpMethod::POST, "/api/secrets", "");
  KJ_EXPECT(notFound.status == 404);
  KJ_EXPECT(notFound.contentType == "application/json");

  auto wrongMethod = f.send(kj::HttpMethod::GET, "/api/inference", "");
  KJ_EXPECT(wrongMethod.status == 405);

  KJ_EXPECT(f.upstream.urls.size() == 0);
}

KJ_TEST("egress proxy reports upstream failure") {
  ProxyFixture f;
  f.upstream.mode = FakeUpstream::FAIL;

  auto reply = f.send(kj::HttpMethod::POST, "/api/inference", "{}");
  KJ_EXPECT(reply.status == 502);
  KJ_EXPECT(reply.body == "{\"detail\":\"Proxy error forwarding request\"}");
}

KJ_TEST("egress proxy reports its own failures") {
  ProxyFixture f;
  BrokenRequestBody broken(*f.proxy);
  auto client = kj::newHttpClient(broken);

  KJ_EXPECT_LOG(ERROR, "proxy failed to handle request");
  kj::HttpHeaders headers(*f.headerTable);
  auto request = client->request(kj::HttpMethod::POST, "/api/inference", headers, uint64_t(0));
  request.body = nullptr;
  auto reply = f.finish(kj::mv(request.response));
  KJ_EXPECT(reply.status == 500);
  KJ_EXPECT(reply.contentType == "application/json");
  KJ_EXPECT(reply.body == "{\"detail\":\"Proxy unexpected error\"}");
  KJ_EXPECT(f.upstream.urls.size() == 0);
}

KJ_TEST("egress proxy times out") {
  ProxyFixture f;
  f.upstream.mode = FakeUpstream::HANG;

  auto pending = f.start(kj::HttpMethod::POST, "/api/inference", "{}");
  f.waitScope.poll();
  KJ_EXPECT(f.upstream.bodies.size() == 1);

  f.timer.advanceTo(f.timer.now() + 601 * kj::SECONDS);
  auto reply = f.finish(kj::mv(pending));
  KJ_EXPECT(reply.status == 504);
  KJ_EXPECT(reply.body == "{\"detail\":\"Proxy timeout forwarding request\"}");
}

}  // namespace
}  // namespace sandpit
