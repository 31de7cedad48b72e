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

#ifndef SANDPIT_PROTOCOL_H_
#define SANDPIT_PROTOCOL_H_
// The file-based contract between the host and the code running in a sandbox.
//
// Before launch the host writes `input.json` into the workspace. The guest reads it, does its
// work, and writes `output.json`, which must be a JSON object of one of the forms:
//
//     {"status": "success", "output": <any JSON value>}
//     {"status": "error", "error": <message>, "traceback": <optional string>}
//
// Anything else, including no file at all, is a protocol violation and is reported as a failure.
// The guest's stdout and stderr are captured as logs but never interpreted.

#include <kj/one-of.h>
#include <kj/string.h>
#include <capnp/compat/json.capnp.h>

namespace sandpit {

constexpr const char* INPUT_DOCUMENT = "input.json";
constexpr const char* OUTPUT_DOCUMENT = "output.json";

struct SandboxResult {
  struct Success {
    kj::String output;
    // The guest's `output` value, as JSON text: the guest's own tokens with the whitespace
    // between them removed, so numbers keep every digit.
  };

  struct Failure {
    kj::String error;
    kj::Maybe<kj::String> traceback;
  };

  kj::OneOf<Success, Failure> outcome;

  kj::Maybe<kj::String> logs;
  // Combined stdout/stderr of the container. Present whenever the container actually ran.

  static SandboxResult success(kj::String output);
  static SandboxResult failure(kj::String error, kj::Maybe<kj::String> traceback = nullptr);

  bool isSuccess() const { return outcome.is<Success>(); }
};

kj::String encodeInputDocument(capnp::JsonValue::Reader input);
// Pretty-printed JSON text for `input.json`.

SandboxResult interpretOutputDocument(kj::Maybe<kj::StringPtr> text);
// Validate the contents of `output.json` (null if the file did not exist). Never throws; every
// violation becomes a Failure. `logs` is left unset.

constexpr size_t DEFAULT_MAX_OUTPUT_SIZE = 16u << 20;

SandboxResult readOutputDocument(kj::StringPtr workspace,
                                 size_t maxSize = DEFAULT_MAX_OUTPUT_SIZE);
// Read and interpret `output.json` from the workspace. Anything but a regular file of at most
// `maxSize` bytes (a FIFO, directory or symlink the guest left there) is treated like a missing
// document.

kj::String encodeResult(const SandboxResult& result);
// The whole result as one JSON object: {status, output | error, traceback?, logs?}.

}  // namespace sandpit

#endif // SANDPIT_PROTOCOL_H_
