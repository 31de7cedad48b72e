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
#include <kj/debug.h>
#include <kj/encoding.h>
#include <string.h>
#include <capnp/message.h>
#include <sandpit/docker-api.capnp.h>

namespace sandpit {

// =======================================================================================
// DockerLogDecoder

DockerLogDecoder::DockerLogDecoder(kj::Function<void(kj::StringPtr line)> onLine)
    : onLine(kj::mv(onLine)) {}

void DockerLogDecoder::feed(kj::ArrayPtr<const byte> data) {
  while (data.size() > 0) {
    if (frameRemaining == 0) {
      size_t n = kj::min(sizeof(header) - headerFill, data.size());
      memcpy(header + headerFill, data.begin(), n);
      headerFill += n;
      data = data.slice(n, data.size());

      if (headerFill == sizeof(header)) {
        frameRemaining = (uint64_t(header[4]) << 24) | (uint64_t(header[5]) << 16) |
                         (uint64_t(header[6]) << 8) | uint64_t(header[7]);
        headerFill = 0;
      }
    } else {
      size_t n = kj::min(frameRemaining, data.size());
      addText(kj::arrayPtr(reinterpret_cast<const char*>(data.begin()), n));
      frameRemaining -= n;
      data = data.slice(n, data.size());
    }
  }
}

void DockerLogDecoder::addText(kj::ArrayPtr<const char> text) {
  KJ_IF_MAYBE(callback, onLine) {
    for (char c: text) {
      if (c == '\n') {
        if (buffer.size() > 0 && buffer.back() == '\r') buffer.removeLast();
        buffer.add('\0');
        (*callback)(kj::StringPtr(buffer.begin(), buffer.size() - 1));
        buffer.clear();
      } else {
        buffer.add(c);
      }
    }
  } else {
    buffer.addAll(text);
  }
}

void DockerLogDecoder::finish() {
  if (headerFill > 0 || frameRemaining > 0) {
    KJ_LOG(WARNING, "container log stream ended in the middle of a frame");
    headerFill = 0;
    frameRemaining = 0;
  }

  KJ_IF_MAYBE(callback, onLine) {
    if (buffer.size() > 0) {
      buffer.add('\0');
      (*callback)(kj::StringPtr(buffer.begin(), buffer.size() - 1));
      buffer.clear();
    }
  }
}

kj::String DockerLogDecoder::releaseText() {
  return kj::heapString(buffer.asPtr());
}

kj::String decodeDockerLogs(kj::ArrayPtr<const byte> data) {
  DockerLogDecoder decoder;
  decoder.feed(data);
  decoder.finish();
  return decoder.releaseText();
}

// =======================================================================================
// DockerEngine

namespace {

struct LogPump {
  kj::Own<kj::AsyncInputStream> input;
  DockerLogDecoder decoder;
  byte buffer[4096];

  LogPump(kj::Own<kj::AsyncInputStream> input, kj::Function<void(kj::StringPtr)> onLine)
      : input(kj::mv(input)), decoder(kj::mv(onLine)) {}

  kj::Promise<void> run() {
    return input->tryRead(buffer, 1, sizeof(buffer)).then([this](size_t n) -> kj::Promise<void> {
      if (n == 0) {
        decoder.finish();
        return kj::READY_NOW;
      }
      decoder.feed(kj::arrayPtr(buffer, n));
      return run();
    });
  }
};

}  // namespace

DockerEngine::DockerEngine(
    kj::Network& network, kj::StringPtr socketPath, kj::StringPtr apiVersion)
    : network(network), socketPath(kj::heapString(socketPath)),
      apiVersion(kj::heapString(apiVersion)) {
  json.handleByAnnotation<docker::ContainerCreateRequest>();
  json.handleByAnnotation<docker::ContainerCreateResponse>();
  json.handleByAnnotation<docker::ContainerWaitResponse>();
  json.handleByAnnotation<docker::NetworkCreateRequest>();
  json.handleByAnnotation<docker::NetworkInspectResponse>();
  json.handleByAnnotation<docker::NetworkConnectRequest>();
}

kj::Promise<kj::HttpClient::Response> DockerEngine::send(
    kj::HttpMethod method, kj::String path, kj::Maybe<kj::String> body) {
  return network.parseAddress(kj::str("unix:", socketPath))
      .then([](kj::Own<kj::NetworkAddress> address) {
    auto promise = address->connect();
    return promise.attach(kj::mv(address));
  }).then([this, method, url = kj::str("/", apiVersion, path), KJ_MVCAP(body)]
          (kj::Own<kj::AsyncIoStream> connection) mutable {
    auto client = kj::newHttpClient(headerTable, *connection);

    kj::HttpHeaders headers(headerTable);
    headers.set(kj::HttpHeaderId::HOST, "docker");
    uint64_t size = 0;
    KJ_IF_MAYBE(b, body) {
      headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
      size = b->size();
    }

    auto request = client->request(method, url, headers, size);

    kj::Promise<void> sent = kj::READY_NOW;
    KJ_IF_MAYBE(b, body) {
      sent = request.body->write(b->begin(), b->size());
    }

    return sent.attach(kj::mv(request.body), kj::mv(body))
        .then([response = kj::mv(request.response)]() mutable { return kj::mv(response); })
        .then([KJ_MVCAP(client), KJ_MVCAP(connection)]
              (kj::HttpClient::Response&& response) mutable {
      // The body must be destroyed before the client and connection it reads from.
      response.body = response.body.attach(kj::mv(client), kj::mv(connection));
      return kj::mv(response);
    });
  });
}

kj::Promise<DockerEngine::Reply> DockerEngine::call(
    kj::HttpMethod method, kj::String path, kj::Maybe<kj::String> body) {
  return send(method, kj::mv(path), kj::mv(body))
      .then([](kj::HttpClient::Response&& response) {
    uint status = response.statusCode;
    auto promise = response.body->readAllText();
    return promise.attach(kj::mv(response.body))
        .then([status](kj::String text) { return Reply { status, kj::mv(text) }; });
  });
}

template <typename T>
typename T::Reader DockerEngine::decode(
    capnp::MallocMessageBuilder& message, kj::ArrayPtr<const char> text) {
  auto root = message.initRoot<T>();
  json.decode(text, root);
  return root.asReader();
}

void DockerEngine::fail(kj::HttpMethod method, kj::StringPtr path,
                        uint statusCode, kj::ArrayPtr<const char> body) {
  kj::String message;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    capnp::MallocMessageBuilder scratch;
    message = kj::str(decode<docker::ErrorResponse>(scratch, body).getMessage());
  })) {
    // Not JSON. Report the raw body instead.
    message = kj::heapString(body);
  }

  KJ_FAIL_REQUIRE("Docker API request failed", method, path, statusCode, message);
}

kj::Promise<bool> DockerEngine::findNetwork(kj::StringPtr name) {
  auto path = kj::str("/networks/", kj::encodeUriComponent(name));
  return call(kj::HttpMethod::GET, kj::heapString(path))
      .then([this, KJ_MVCAP(path)](Reply&& reply) {
    if (reply.statusCode == 404) return false;
    if (reply.statusCode >= 400) fail(kj::HttpMethod::GET, path, reply.statusCode, reply.body);
    return true;
  });
}

kj::Promise<bool> DockerEngine::createNetwork(kj::StringPtr name, bool internal) {
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<docker::NetworkCreateRequest>();
  request.setName(name);
  request.setDriver("bridge");
  request.setInternal(internal);
  request.setCheckDuplicate(true);

  return call(kj::HttpMethod::POST, kj::str("/networks/create"), json.encode(request.asReader()))
      .then([this](Reply&& reply) {
    if (reply.statusCode == 409) return false;
    if (reply.statusCode >= 400) {
      fail(kj::HttpMethod::POST, "/networks/create", reply.statusCode, reply.body);
    }
    return true;
  });
}

kj::Promise<kj::String> DockerEngine::createContainer(const ContainerSpec& spec) {
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<docker::ContainerCreateRequest>();
  request.setImage(spec.image);

  auto cmd = request.initCmd(spec.argv.size());
  for (auto i: kj::indices(spec.argv)) {
    cmd.set(i, spec.argv[i]);
  }
  auto env = request.initEnv(spec.env.size());
  for (auto i: kj::indices(spec.env)) {
    env.set(i, spec.env[i]);
  }
  request.setWorkingDir(spec.workingDir);
  request.setTty(false);
  request.setAttachStdout(true);
  request.setAttachStderr(true);

  auto hostConfig = request.initHostConfig();
  auto binds = hostConfig.initBinds(spec.binds.size());
  for (auto i: kj::indices(spec.binds)) {
    auto& bind = spec.binds[i];
    binds.set(i, kj::str(bind.hostPath, ':', bind.guestPath, bind.readOnly ? ":ro" : ":rw"));
  }
  hostConfig.setNetworkMode(spec.network);
  hostConfig.setAutoRemove(false);

  auto path = kj::str("/containers/create?name=", kj::encodeUriComponent(spec.name));
  return call(kj::HttpMethod::POST, kj::heapString(path), json.encode(request.asReader()))
      .then([this, KJ_MVCAP(path)](Reply&& reply) {
    if (reply.statusCode >= 400) fail(kj::HttpMethod::POST, path, reply.statusCode, reply.body);
    capnp::MallocMessageBuilder scratch;
    auto response = decode<docker::ContainerCreateResponse>(scratch, reply.body);
    KJ_REQUIRE(response.getId().size() > 0, "Docker returned no container ID", reply.body);
    return kj::str(response.getId());
  });
}

kj::Promise<void> DockerEngine::startContainer(kj::StringPtr id) {
  auto path = kj::str("/containers/", kj::encodeUriComponent(id), "/start");
  return call(kj::HttpMethod::POST, kj::heapString(path))
      .then([this, KJ_MVCAP(path)](Reply&& reply) {
    // 304 means it was already running.
    if (reply.statusCode >= 400) fail(kj::HttpMethod::POST, path, reply.statusCode, reply.body);
  });
}

kj::Promise<void> DockerEngine::connectNetwork(kj::StringPtr network, kj::StringPtr id) {
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<docker::NetworkConnectRequest>();
  request.setContainer(id);

  auto path = kj::str("/networks/", kj::encodeUriComponent(network), "/connect");
  return call(kj::HttpMethod::POST, kj::heapString(path), json.encode(request.asReader()))
      .then([this, KJ_MVCAP(path)](Reply&& reply) {
    if (reply.statusCode >= 400) fail(kj::HttpMethod::POST, path, reply.statusCode, reply.body);
  });
}

kj::Promise<int> DockerEngine::waitContainer(kj::StringPtr id) {
  auto path = kj::str("/containers/", kj::encodeUriComponent(id), "/wait");
  return call(kj::HttpMethod::POST, kj::heapString(path))
      .then([this, KJ_MVCAP(path)](Reply&& reply) {
    if (reply.statusCode >= 400) fail(kj::HttpMethod::POST, path, reply.statusCode, reply.body);
    capnp::MallocMessageBuilder scratch;
    return int(decode<docker::ContainerWaitResponse>(scratch, reply.body).getStatusCode());
  });
}

kj::Promise<kj::String> DockerEngine::containerLogs(kj::StringPtr id) {
  auto path = kj::str("/containers/", kj::encodeUriComponent(id), "/logs?stdout=1&stderr=1");
  return send(kj::HttpMethod::GET, kj::heapString(path))
      .then([this, KJ_MVCAP(path)](kj::HttpClient::Response&& response) {
    uint status = response.statusCode;
    auto promise = response.body->readAllBytes();
    return promise.attach(kj::mv(response.body))
        .then([this, status, KJ_MVCAP(path)](kj::Array<byte> bytes) {
      if (status >= 400) fail(kj::HttpMethod::GET, path, status, bytes.asPtr().asChars());
      return decodeDockerLogs(bytes);
    });
  });
}

kj::Promise<void> DockerEngine::followLogs(
    kj::StringPtr id, kj::Function<void(kj::StringPtr line)> onLine) {
  auto path = kj::str("/containers/", kj::encodeUriComponent(id),
                      "/logs?follow=1&stdout=1&stderr=1");
  return send(kj::HttpMethod::GET, kj::heapString(path))
      .then([this, KJ_MVCAP(path), KJ_MVCAP(onLine)]
            (kj::HttpClient::Response&& response) mutable -> kj::Promise<void> {
    if (response.statusCode >= 400) {
      uint status = response.statusCode;
      auto promise = response.body->readAllText();
      return promise.attach(kj::mv(response.body))
          .then([this, status, KJ_MVCAP(path)](kj::String body) {
        fail(kj::HttpMethod::GET, path, status, body);
      });
    }

    auto pump = kj::heap<LogPump>(kj::mv(response.body), kj::mv(onLine));
    auto promise = pump->run();
    return promise.attach(kj::mv(pump));
  });
}

kj::Promise<void> DockerEngine::killContainer(kj::StringPtr id) {
  auto path = kj::str("/containers/", kj::encodeUriComponent(id), "/kill");
  return call(kj::HttpMethod::POST, kj::heapString(path))
      .then([this, KJ_MVCAP(path)](Reply&& reply) {
    // 409: the container is not running.
    if (reply.statusCode == 409) return;
    if (reply.statusCode >= 400) fail(kj::HttpMethod::POST, path, reply.statusCode, reply.body);
  });
}

kj::Promise<bool> DockerEngine::removeContainer(kj::StringPtr id, bool force) {
  auto path = kj::str("/containers/", kj::encodeUriComponent(id), force ? "?force=1" : "?force=0");
  return call(kj::HttpMethod::DELETE, kj::heapString(path))
      .then([this, KJ_MVCAP(path)](Reply&& reply) {
    if (reply.statusCode == 404) return false;
    if (reply.statusCode >= 400) {
      fail(kj::HttpMethod::DELETE, path, reply.statusCode, reply.body);
    }
    return true;
  });
}

kj::Own<ContainerEngine> DockerEngineFactory::newEngine(kj::AsyncIoProvider& ioProvider) {
  return kj::heap<DockerEngine>(ioProvider.getNetwork(), socketPath, apiVersion);
}

}  // namespace sandpit
