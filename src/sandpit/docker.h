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

#ifndef SANDPIT_DOCKER_H_
#define SANDPIT_DOCKER_H_
// ContainerEngine backed by the Docker Engine HTTP API, spoken over the daemon's unix socket.

#include "engine.h"
#include <kj/compat/http.h>
#include <kj/vector.h>
#include <capnp/compat/json.h>
#include "util.h"

namespace sandpit {

class DockerLogDecoder {
  // Docker multiplexes a non-TTY container's stdout and stderr into frames, each preceded by an
  // 8-byte header: one byte naming the stream, three zero bytes, then the payload size as a
  // big-endian uint32. The decoder accepts that stream in arbitrarily-sized pieces and recovers
  // the payload text, interleaved in the order the frames arrived.

public:
  DockerLogDecoder() = default;
  // Accumulate all text; retrieve it with releaseText().

  explicit DockerLogDecoder(kj::Function<void(kj::StringPtr line)> onLine);
  // Deliver each complete line (without its '\n') as soon as it has been received.

  KJ_DISALLOW_COPY(DockerLogDecoder);

  void feed(kj::ArrayPtr<const byte> data);

  void finish();
  // End of stream. In line mode, delivers a final line that lacked a trailing newline.

  kj::String releaseText();

private:
  kj::Maybe<kj::Function<void(kj::StringPtr)>> onLine;
  byte header[8];
  uint headerFill = 0;
  uint64_t frameRemaining = 0;
  kj::Vector<char> buffer;

  void addText(kj::ArrayPtr<const char> text);
};

kj::String decodeDockerLogs(kj::ArrayPtr<const byte> data);
// Decode a complete multiplexed log body.

class DockerEngine final: public ContainerEngine {
public:
  DockerEngine(kj::Network& network, kj::StringPtr socketPath, kj::StringPtr apiVersion);
  // `apiVersion` is the path prefix selecting the API version, e.g. "v1.41".

  kj::Promise<bool> findNetwork(kj::StringPtr name) override;
  kj::Promise<bool> createNetwork(kj::StringPtr name, bool internal) override;
  kj::Promise<kj::String> createContainer(const ContainerSpec& spec) override;
  kj::Promise<void> startContainer(kj::StringPtr id) override;
  kj::Promise<void> connectNetwork(kj::StringPtr network, kj::StringPtr id) override;
  kj::Promise<int> waitContainer(kj::StringPtr id) override;
  kj::Promise<kj::String> containerLogs(kj::StringPtr id) override;
  kj::Promise<void> followLogs(
      kj::StringPtr id, kj::Function<void(kj::StringPtr line)> onLine) override;
  kj::Promise<void> killContainer(kj::StringPtr id) override;
  kj::Promise<bool> removeContainer(kj::StringPtr id, bool force) override;

private:
  struct Reply {
    uint statusCode;
    kj::String body;
  };

  kj::Network& network;
  kj::String socketPath;
  kj::String apiVersion;
  kj::HttpHeaderTable headerTable;
  capnp::JsonCodec json;

  kj::Promise<kj::HttpClient::Response> send(
      kj::HttpMethod method, kj::String path, kj::Maybe<kj::String> body = nullptr);
  // Opens a fresh connection to the daemon and makes one request on it. The connection lives as
  // long as the returned response body.

  kj::Promise<Reply> call(
      kj::HttpMethod method, kj::String path, kj::Maybe<kj::String> body = nullptr);
  // send() and read the whole response body as text.

  template <typename T>
  typename T::Reader decode(
      capnp::MallocMessageBuilder& message, kj::ArrayPtr<const char> text);

  [[noreturn]] void fail(kj::HttpMethod method, kj::StringPtr path,
                         uint statusCode, kj::ArrayPtr<const char> body);
};

class DockerEngineFactory final: public ContainerEngineFactory {
public:
  DockerEngineFactory(kj::String socketPath, kj::String apiVersion)
      : socketPath(kj::mv(socketPath)), apiVersion(kj::mv(apiVersion)) {}

  kj::Own<ContainerEngine> newEngine(kj::AsyncIoProvider& ioProvider) override;

private:
  kj::String socketPath;
  kj::String apiVersion;
};

}  // namespace sandpit

#endif // SANDPIT_DOCKER_H_
