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

#include "docker.h"
#include <kj/test.h>
#include <string.h>
#include <stdlib.h>
#include <unistd.h>

namespace sandpit {
namespace {

kj::Array<byte> frame(byte stream, kj::StringPtr text) {
  auto result = kj::heapArray<byte>(8 + text.size());
  memset(result.begin(), 0, 8);
  result[0] = stream;
  uint32_t size = text.size();
  result[4] = size >> 24;
  result[5] = size >> 16;
  result[6] = size >> 8;
  result[7] = size;
  memcpy(result.begin() + 8, text.begin(), text.size());
  return result;
}

kj::Array<byte> concat(std::initializer_list<kj::ArrayPtr<const byte>> parts) {
  kj::Vector<byte> result;
  for (auto& part: parts) result.addAll(part);
  return result.releaseAsArray();
}

bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  if (needle.size() > haystack.size()) return false;
  for (size_t i = 0; i <= haystack.size() - needle.size(); i++) {
    if (haystack.slice(i).startsWith(needle)) return true;
  }
  return false;
}

KJ_TEST("DockerLogDecoder") {
  auto stdoutFrame = frame(1, "hello\nwor");
  auto stderrFrame = frame(2, "ld\r\noops");
  auto stream = concat({stdoutFrame, stderrFrame});

  KJ_EXPECT(decodeDockerLogs(stream) == "hello\nworld\r\noops");

  // Fed one byte at a time, lines are reassembled across frame boundaries.
  kj::Vector<kj::String> lines;
  DockerLogDecoder decoder([&](kj::StringPtr line) { lines.add(kj::heapString(line)); });
  for (auto& b: stream) {
    decoder.feed(kj::arrayPtr(&b, 1));
  }
  KJ_ASSERT(lines.size() == 2);
  KJ_EXPECT(lines[0] == "hello");
  KJ_EXPECT(lines[1] == "world");

  decoder.finish();
  KJ_ASSERT(lines.size() == 3);
  KJ_EXPECT(lines[2] == "oops");

  KJ_EXPECT(decodeDockerLogs(nullptr) == "");
  auto empty = frame(1, "");
  KJ_EXPECT(decodeDockerLogs(empty) == "");
}

class FakeDocker final: public kj::HttpService {
  // Serves canned responses, keyed by method and URL, and records every request.

public:
  struct Request {
    kj::HttpMethod method;
    kj::String url;
    kj::Maybe<kj::String> host;
    kj::String body;
  };

  struct Canned {
    kj::HttpMethod method;
    kj::String url;
    uint status;
    kj::Array<byte> body;
  };

  explicit FakeDocker(kj::HttpHeaderTable& headerTable): headerTable(headerTable) {}

  kj::Vector<Request> requests;

  void reply(kj::HttpMethod method, kj::StringPtr url, uint status, kj::StringPtr body) {
    reply(method, url, status, kj::heapArray(body.asBytes()));
  }

  void reply(kj::HttpMethod method, kj::StringPtr url, uint status, kj::Array<byte> body) {
    for (auto& canned: responses) {
      if (canned.method == method && canned.url == url) {
        canned.status = status;
        canned.body = kj::mv(body);
        return;
      }
    }
    responses.add(Canned { method, kj::heapString(url), status, kj::mv(body) });
  }

  kj::Promise<void> request(
      kj::HttpMethod method, kj::StringPtr url, const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody, Response& response) override {
    kj::Maybe<kj::String> host;
    KJ_IF_MAYBE(h, headers.get(kj::HttpHeaderId::HOST)) {
      host = kj::heapString(*h);
    }

    return requestBody.readAllText()
        .then([this, method, url = kj::heapString(url), KJ_MVCAP(host), &response]
              (kj::String body) mutable {
      requests.add(Request { method, kj::heapString(url), kj::mv(host), kj::mv(body) });

      uint status = 404;
      kj::ArrayPtr<const byte> content = kj::StringPtr("{\"message\":\"page not found\"}").asBytes();
      for (auto& canned: responses) {
        if (canned.method == method && canned.url == url) {
          status = canned.status;
          content = canned.body;
        }
      }

      kj::HttpHeaders responseHeaders(headerTable);
      responseHeaders.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
      auto stream = response.send(status, status < 400 ? "OK" : "Error", responseHeaders,
                                  content.size());
      auto promise = stream->write(content.begin(), content.size());
      return promise.attach(kj::mv(stream));
    });
  }

private:
  kj::HttpHeaderTable& headerTable;
  kj::Vector<Canned> responses;
};

char* makeTempDir(char* pattern) {
  KJ_REQUIRE(mkdtemp(pattern) != nullptr, "mkdtemp failed", pattern);
  return pattern;
}

struct DockerFixture {
  char tempdir[32];
  kj::AsyncIoContext io;
  kj::HttpHeaderTable headerTable;
  FakeDocker docker;
  kj::HttpServer server;
  kj::String socketPath;
  kj::Own<kj::ConnectionReceiver> listener;
  kj::Promise<void> listenTask;
  DockerEngine engine;

  DockerFixture()
      : tempdir("/tmp/sandpit-test.XXXXXX"),
        io(kj::setupAsyncIo()),
        docker(headerTable),
        server(io.provider->getTimer(), headerTable, docker),
        socketPath(kj::str(makeTempDir(tempdir), "/docker.sock")),
        listener(io.provider->getNetwork().parseAddress(kj::str("unix:", socketPath))
            .wait(io.waitScope)->listen()),
        listenTask(server.listenHttp(*listener).eagerlyEvaluate([](kj::Exception&& e) {
          KJ_LOG(ERROR, "fake docker server failed", e);
        })),
        engine(io.provider->getNetwork(), socketPath, "v1.41") {}

  ~DockerFixture() noexcept(false) {
    unlink(socketPath.cStr());
    rmdir(tempdir);
  }
};

KJ_TEST("DockerEngine networks") {
  DockerFixture f;
  auto& ws = f.io.waitScope;

  KJ_EXPECT(!f.engine.findNetwork("sandbox-network").wait(ws));
  KJ_ASSERT(f.docker.requests.size() == 1);
  KJ_EXPECT(f.docker.requests[0].method == kj::HttpMethod::GET);
  KJ_EXPECT(f.docker.requests[0].url == "/v1.41/networks/sandbox-network");
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.docker.requests[0].host) == "docker");

  f.docker.reply(kj::HttpMethod::POST, "/v1.41/networks/create", 201, "{\"Id\":\"n1\"}");
  KJ_EXPECT(f.engine.createNetwork("sandbox-network", true).wait(ws));
  auto& create = f.docker.requests.back();
  KJ_EXPECT(contains(create.body, "\"Name\":\"sandbox-network\""), create.body);
  KJ_EXPECT(contains(create.body, "\"Internal\":true"), create.body);
  KJ_EXPECT(contains(create.body, "\"Driver\":\"bridge\""), create.body);

  f.docker.reply(kj::HttpMethod::POST, "/v1.41/networks/create", 409,
                 "{\"message\":\"network with name sandbox-network already exists\"}");
  KJ_EXPECT(!f.engine.createNetwork("sandbox-network", true).wait(ws));

  f.docker.reply(kj::HttpMethod::GET, "/v1.41/networks/sandbox-network", 200,
                 "{\"Id\":\"n1\",\"Name\":\"sandbox-network\",\"Internal\":true,\"Scope\":\"local\"}");
  KJ_EXPECT(f.engine.findNetwork("sandbox-network").wait(ws));

  f.docker.reply(kj::HttpMethod::POST, "/v1.41/networks/bridge/connect", 200, "");
  f.engine.connectNetwork("bridge", "abc123").wait(ws);
  KJ_EXPECT(f.docker.requests.back().body == "{\"Container\":\"abc123\"}");
}

KJ_TEST("DockerEngine container lifecycle") {
  DockerFixture f;
  auto& ws = f.io.waitScope;

  f.docker.reply(kj::HttpMethod::POST, "/v1.41/containers/create?name=sandbox_1_ab", 201,
                 "{\"Id\":\"abc123\",\"Warnings\":[]}");
  f.docker.reply(kj::HttpMethod::POST, "/v1.41/containers/abc123/start", 204, "");
  f.docker.reply(kj::HttpMethod::POST, "/v1.41/containers/abc123/wait", 200,
                 "{\"StatusCode\":3}");
  f.docker.reply(kj::HttpMethod::GET, "/v1.41/containers/abc123/logs?stdout=1&stderr=1", 200,
                 concat({frame(1, "hello\n"), frame(2, "oops\n")}));
  f.docker.reply(kj::HttpMethod::DELETE, "/v1.41/containers/abc123?force=1", 204, "");

  ContainerSpec spec;
  spec.name = kj::str("sandbox_1_ab");
  spec.image = kj::str("sandbox-image");
  spec.argv = kj::heapArray<kj::String>(3);
  spec.argv[0] = kj::str("sh");
  spec.argv[1] = kj::str("-c");
  spec.argv[2] = kj::str("python '/sandbox/main.py' 2>&1");
  spec.env = kj::heapArray<kj::String>(1);
  spec.env[0] = kj::str("SANDBOX_WORKSPACE=/sandbox");
  spec.workingDir = kj::str("/sandbox");
  spec.binds = kj::heapArray<BindMount>(1);
  spec.binds[0] = BindMount { kj::str("/tmp/w"), kj::str("/sandbox"), false };
  spec.network = kj::str("sandbox-network");

  auto id = f.engine.createContainer(spec).wait(ws);
  KJ_EXPECT(id == "abc123");
  auto& body = f.docker.requests.back().body;
  KJ_EXPECT(contains(body, "\"Image\":\"sandbox-image\""), body);
  KJ_EXPECT(contains(body, "\"Cmd\":[\"sh\",\"-c\",\"python '/sandbox/main.py' 2>&1\"]"), body);
  KJ_EXPECT(contains(body, "\"Binds\":[\"/tmp/w:/sandbox:rw\"]"), body);
  KJ_EXPECT(contains(body, "\"NetworkMode\":\"sandbox-network\""), body);
  KJ_EXPECT(contains(body, "\"WorkingDir\":\"/sandbox\""), body);

  f.engine.startContainer(id).wait(ws);
  KJ_EXPECT(f.engine.waitContainer(id).wait(ws) == 3);
  KJ_EXPECT(f.engine.containerLogs(id).wait(ws) == "hello\noops\n");
  KJ_EXPECT(f.engine.removeContainer(id, true).wait(ws));

  // Already gone.
  f.docker.reply(kj::HttpMethod::DELETE, "/v1.41/containers/abc123?force=1", 404,
                 "{\"message\":\"No such container: abc123\"}");
  KJ_EXPECT(!f.engine.removeContainer(id, true).wait(ws));

  // Killing a stopped container is fine.
  f.docker.reply(kj::HttpMethod::POST, "/v1.41/containers/abc123/kill", 409,
                 "{\"message\":\"container abc123 is not running\"}");
  f.engine.killContainer(id).wait(ws);
}

KJ_TEST("DockerEngine reports engine errors") {
  DockerFixture f;
  auto& ws = f.io.waitScope;

  f.docker.reply(kj::HttpMethod::POST, "/v1.41/containers/create?name=sandbox_1_ab", 409,
                 "{\"message\":\"Conflict. The container name is already in use\"}");
  ContainerSpec spec;
  spec.name = kj::str("sandbox_1_ab");
  spec.image = kj::str("sandbox-image");
  spec.workingDir = kj::str("/sandbox");
  spec.network = kj::str("sandbox-network");
  KJ_EXPECT_THROW_MESSAGE("The container name is already in use",
      f.engine.createContainer(spec).wait(ws));

  f.docker.reply(kj::HttpMethod::POST, "/v1.41/containers/abc123/start", 500,
                 "not json at all");
  KJ_EXPECT_THROW_MESSAGE("not json at all", f.engine.startContainer("abc123").wait(ws));
}

KJ_TEST("DockerEngine follows logs") {
  DockerFixture f;
  auto& ws = f.io.waitScope;

  f.docker.reply(kj::HttpMethod::GET,
                 "/v1.41/containers/abc123/logs?follow=1&stdout=1&stderr=1", 200,
                 concat({frame(1, "step 1\nste"), frame(1, "p 2\n"), frame(2, "done")}));

  kj::Vector<kj::String> lines;
  f.engine.followLogs("abc123", [&](kj::StringPtr line) {
    lines.add(kj::heapString(line));
  }).wait(ws);

  KJ_ASSERT(lines.size() == 3);
  KJ_EXPECT(lines[0] == "step 1");
  KJ_EXPECT(lines[1] == "step 2");
  KJ_EXPECT(lines[2] == "done");
}

}  // namespace
}  // namespace sandpit
