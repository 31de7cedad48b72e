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

#include "protocol.h"
#include <kj/test.h>
#include <capnp/message.h>
#include <capnp/compat/json.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>
#include "util.h"

namespace sandpit {
namespace {

kj::String failureMessage(const SandboxResult& result) {
  KJ_ASSERT(!result.isSuccess());
  return kj::heapString(result.outcome.get<SandboxResult::Failure>().error);
}

KJ_TEST("output document: success") {
  auto result = interpretOutputDocument(kj::StringPtr(
      "{\"status\": \"success\", \"output\": {\"answer\": [1, 2, 3]}}"));
  KJ_ASSERT(result.isSuccess());
  KJ_EXPECT(result.outcome.get<SandboxResult::Success>().output ==
            "{\"answer\":[1,2,3]}");
  KJ_EXPECT(result.logs == nullptr);

  // Any JSON value is a valid output, including null.
  auto nullOutput = interpretOutputDocument(kj::StringPtr(
      "{\"status\": \"success\", \"output\": null}"));
  KJ_ASSERT(nullOutput.isSuccess());
  KJ_EXPECT(nullOutput.outcome.get<SandboxResult::Success>().output == "null");
}

KJ_TEST("output document: guest-reported error") {
  auto result = interpretOutputDocument(kj::StringPtr(
      "{\"status\": \"error\", \"error\": \"boom\", \"traceback\": \"line 1\"}"));
  KJ_EXPECT(failureMessage(result) == "boom");
  auto& failure = result.outcome.get<SandboxResult::Failure>();
  KJ_EXPECT(KJ_ASSERT_NONNULL(failure.traceback) == "line 1");

  auto noTraceback = interpretOutputDocument(kj::StringPtr(
      "{\"status\": \"error\", \"error\": {\"code\": 7}, \"traceback\": 12}"));
  KJ_EXPECT(failureMessage(noTraceback) == "{\"code\":7}");
  KJ_EXPECT(noTraceback.outcome.get<SandboxResult::Failure>().traceback == nullptr);
}

KJ_TEST("output document: output is passed through exactly") {
  // Integers beyond double precision keep every digit; only whitespace between tokens goes.
  auto result = interpretOutputDocument(kj::StringPtr(
      "{\"status\": \"success\",\n \"output\": {\"id\": 12345678901234567890,\n"
      "   \"xs\": [1, 2.50, -3e2], \"s\": \"a \\\" b\"}}"));
  KJ_ASSERT(result.isSuccess());
  KJ_EXPECT(result.outcome.get<SandboxResult::Success>().output ==
            "{\"id\":12345678901234567890,\"xs\":[1,2.50,-3e2],\"s\":\"a \\\" b\"}");

  auto scalar = interpretOutputDocument(kj::StringPtr(
      "{\"output\": 9007199254740993, \"status\": \"success\"}"));
  KJ_ASSERT(scalar.isSuccess());
  KJ_EXPECT(scalar.outcome.get<SandboxResult::Success>().output == "9007199254740993");

  // An escaped key still names the member.
  auto escaped = interpretOutputDocument(kj::StringPtr(
      "{\"status\": \"success\", \"outp\\u0075t\": [ true ]}"));
  KJ_ASSERT(escaped.isSuccess());
  KJ_EXPECT(escaped.outcome.get<SandboxResult::Success>().output == "[true]");

  KJ_EXPECT(encodeResult(SandboxResult::success(kj::str("12345678901234567890"))) ==
            "{\"status\":\"success\",\"output\":12345678901234567890}");
}

KJ_TEST("output document: repeated keys") {
  // The last occurrence of a key counts.
  auto result = interpretOutputDocument(kj::StringPtr(
      "{\"status\": \"error\", \"status\": \"success\", \"output\": 1, \"output\": 2}"));
  KJ_ASSERT(result.isSuccess());
  KJ_EXPECT(result.outcome.get<SandboxResult::Success>().output == "2");

  KJ_EXPECT(failureMessage(interpretOutputDocument(kj::StringPtr(
      "{\"status\": \"success\", \"status\": \"error\", \"error\": \"late\"}"))) == "late");
}

KJ_TEST("output document: protocol violations") {
  KJ_EXPECT(failureMessage(interpretOutputDocument(nullptr)) ==
            "failed to read output document");
  KJ_EXPECT(failureMessage(interpretOutputDocument(kj::StringPtr("{not json"))) ==
            "failed to read output document");
  KJ_EXPECT(failureMessage(interpretOutputDocument(kj::StringPtr("[1, 2]"))) ==
            "failed to read output document");
  KJ_EXPECT(failureMessage(interpretOutputDocument(kj::StringPtr("{\"output\": 1}"))) ==
            "output document missing status field");
  KJ_EXPECT(failureMessage(interpretOutputDocument(kj::StringPtr("{\"status\": \"success\"}"))) ==
            "success status missing output field");
  KJ_EXPECT(failureMessage(interpretOutputDocument(kj::StringPtr("{\"status\": \"error\"}"))) ==
            "error status missing error field");
  KJ_EXPECT(failureMessage(interpretOutputDocument(kj::StringPtr("{\"status\": \"bogus\"}"))) ==
            "invalid status value: bogus");
  KJ_EXPECT(failureMessage(interpretOutputDocument(kj::StringPtr("{\"status\": 3}"))) ==
            "invalid status value: 3");
}

KJ_TEST("readOutputDocument") {
  char tempdir[] = "/tmp/sandpit-test.XXXXXX";
  KJ_REQUIRE(mkdtemp(tempdir) != nullptr);
  KJ_DEFER(recursivelyDelete(tempdir));

  KJ_EXPECT(failureMessage(readOutputDocument(tempdir)) == "failed to read output document");

  writeFile(kj::str(tempdir, "/output.json"),
            kj::StringPtr("{\"status\": \"success\", \"output\": \"pong\"}"));
  auto result = readOutputDocument(tempdir);
  KJ_ASSERT(result.isSuccess());
  KJ_EXPECT(result.outcome.get<SandboxResult::Success>().output == "\"pong\"");
}

KJ_TEST("readOutputDocument only reads bounded regular files") {
  char tempdir[] = "/tmp/sandpit-test.XXXXXX";
  KJ_REQUIRE(mkdtemp(tempdir) != nullptr);
  KJ_DEFER(recursivelyDelete(tempdir));
  auto output = kj::str(tempdir, "/output.json");

  // A FIFO with no writer must not block.
  KJ_SYSCALL(mkfifo(output.cStr(), 0600));
  KJ_EXPECT(failureMessage(readOutputDocument(tempdir)) == "failed to read output document");
  KJ_SYSCALL(unlink(output.cStr()));

  KJ_SYSCALL(mkdir(output.cStr(), 0700));
  KJ_EXPECT(failureMessage(readOutputDocument(tempdir)) == "failed to read output document");
  KJ_SYSCALL(rmdir(output.cStr()));

  // Symlinks are not followed, even to a valid document.
  auto elsewhere = kj::str(tempdir, "/elsewhere.json");
  writeFile(elsewhere, kj::StringPtr("{\"status\": \"success\", \"output\": 1}"));
  KJ_SYSCALL(symlink(elsewhere.cStr(), output.cStr()));
  KJ_EXPECT(failureMessage(readOutputDocument(tempdir)) == "failed to read output document");
  KJ_SYSCALL(unlink(output.cStr()));
  KJ_SYSCALL(symlink("/dev/zero", output.cStr()));
  KJ_EXPECT(failureMessage(readOutputDocument(tempdir)) == "failed to read output document");
  KJ_SYSCALL(unlink(output.cStr()));

  // Too large.
  writeFile(output, kj::StringPtr("{\"status\": \"success\", \"output\": 1}"));
  KJ_EXPECT(readOutputDocument(tempdir, 64).isSuccess());
  KJ_EXPECT(failureMessage(readOutputDocument(tempdir, 16)) == "failed to read output document");
}

KJ_TEST("input and result encoding") {
  capnp::JsonCodec json;
  capnp::MallocMessageBuilder message;
  auto input = message.initRoot<capnp::JsonValue>();
  json.decodeRaw(kj::StringPtr("{\"message\": \"ping\", \"n\": 2}"), input);

  // Pretty-printed, but the same document.
  auto text = encodeInputDocument(input.asReader());
  capnp::MallocMessageBuilder reparsed;
  auto root = reparsed.initRoot<capnp::JsonValue>();
  json.decodeRaw(text, root);
  KJ_EXPECT(json.encodeRaw(root.asReader()) == "{\"message\":\"ping\",\"n\":2}");

  auto success = SandboxResult::success(kj::str("{\"a\":1}"));
  success.logs = kj::str("hello\n");
  capnp::MallocMessageBuilder encoded;
  auto encodedRoot = encoded.initRoot<capnp::JsonValue>();
  json.decodeRaw(encodeResult(success), encodedRoot);
  KJ_EXPECT(json.encodeRaw(encodedRoot.asReader()) ==
            "{\"status\":\"success\",\"output\":{\"a\":1},\"logs\":\"hello\\n\"}");

  auto failure = SandboxResult::failure(kj::str("boom"), kj::str("trace"));
  capnp::MallocMessageBuilder encoded2;
  auto encodedRoot2 = encoded2.initRoot<capnp::JsonValue>();
  json.decodeRaw(encodeResult(failure), encodedRoot2);
  KJ_EXPECT(json.encodeRaw(encodedRoot2.asReader()) ==
            "{\"status\":\"error\",\"error\":\"boom\",\"traceback\":\"trace\"}");
}

}  // namespace
}  // namespace sandpit
