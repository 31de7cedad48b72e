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
#include <kj/debug.h>
#include <capnp/message.h>
#include <capnp/compat/json.h>
#include "util.h"

namespace sandpit {

SandboxResult SandboxResult::success(kj::String output) {
  SandboxResult result;
  result.outcome.init<Success>(Success { kj::mv(output) });
  return result;
}

SandboxResult SandboxResult::failure(kj::String error, kj::Maybe<kj::String> traceback) {
  SandboxResult result;
  result.outcome.init<Failure>(Failure { kj::mv(error), kj::mv(traceback) });
  return result;
}

kj::String encodeInputDocument(capnp::JsonValue::Reader input) {
  capnp::JsonCodec json;
  json.setPrettyPrint(true);
  return json.encodeRaw(input);
}

static kj::Maybe<capnp::JsonValue::Reader> findField(
    capnp::List<capnp::JsonValue::Field>::Reader fields, kj::StringPtr name) {
  // Last one wins when a key is repeated.
  kj::Maybe<capnp::JsonValue::Reader> result;
  for (auto field: fields) {
    if (field.getName() == name) result = field.getValue();
  }
  return result;
}

static kj::String textOf(capnp::JsonCodec& json, capnp::JsonValue::Reader value) {
  // Strings as their contents, anything else as JSON.
  if (value.isString()) return kj::str(value.getString());
  return json.encodeRaw(value);
}

// =======================================================================================
// Raw member text
//
// capnp::JsonValue holds numbers as Float64, so re-encoding the guest's `output` would round
// integers above 2^53. Instead the output is taken verbatim from the document. These scanners
// only run on text that JsonCodec has already accepted as an object.

namespace {

class RawObjectScanner {
public:
  RawObjectScanner(capnp::JsonCodec& json, kj::ArrayPtr<const char> text)
      : json(json), text(text) {}

  kj::Maybe<kj::ArrayPtr<const char>> findMember(kj::StringPtr name) {
    kj::Maybe<kj::ArrayPtr<const char>> result;

    pos = 0;
    skipSpace();
    expect('{');
    skipSpace();
    if (peek() == '}') return result;

    for (;;) {
      skipSpace();
      auto key = skipValue();
      skipSpace();
      expect(':');
      skipSpace();
      auto value = skipValue();
      if (keyIs(key, name)) result = value;
      skipSpace();
      if (peek() == ',') {
        ++pos;
      } else {
        expect('}');
        return result;
      }
    }
  }

private:
  capnp::JsonCodec& json;
  kj::ArrayPtr<const char> text;
  size_t pos = 0;

  char peek() {
    KJ_ASSERT(pos < text.size(), "unexpected end of JSON text");
    return text[pos];
  }

  void expect(char c) {
    KJ_ASSERT(peek() == c, "unexpected character in JSON text", c, pos);
    ++pos;
  }

  void skipSpace() {
    while (pos < text.size() &&
           (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r')) {
      ++pos;
    }
  }

  void skipString() {
    expect('"');
    for (;;) {
      char c = peek();
      ++pos;
      if (c == '\\') {
        ++pos;
      } else if (c == '"') {
        return;
      }
    }
  }

  kj::ArrayPtr<const char> skipValue() {
    size_t begin = pos;
    char c = peek();
    if (c == '"') {
      skipString();
    } else if (c == '{' || c == '[') {
      uint depth = 0;
      do {
        c = peek();
        if (c == '"') {
          skipString();
          continue;
        }
        if (c == '{' || c == '[') ++depth;
        if (c == '}' || c == ']') --depth;
        ++pos;
      } while (depth > 0);
    } else {
      while (pos < text.size() && text[pos] != ',' && text[pos] != '}' && text[pos] != ']' &&
             text[pos] != ' ' && text[pos] != '\t' && text[pos] != '\n' && text[pos] != '\r') {
        ++pos;
      }
    }
    return text.slice(begin, pos);
  }

  bool keyIs(kj::ArrayPtr<const char> key, kj::StringPtr name) {
    auto inner = key.slice(1, key.size() - 1);
    for (char c: inner) {
      if (c == '\\') {
        // Escaped key. Let the codec decode it.
        capnp::MallocMessageBuilder scratch;
        auto value = scratch.initRoot<capnp::JsonValue>();
        json.decodeRaw(key, value);
        return value.asReader().getString() == name;
      }
    }
    return inner == name.asArray();
  }
};

}  // namespace

static kj::String compactJson(kj::ArrayPtr<const char> text) {
  // Drop insignificant whitespace, keeping every token as written.
  kj::Vector<char> result(text.size() + 1);
  bool inString = false;
  for (size_t i = 0; i < text.size(); i++) {
    char c = text[i];
    if (inString) {
      result.add(c);
      if (c == '\\' && i + 1 < text.size()) {
        result.add(text[++i]);
      } else if (c == '"') {
        inString = false;
      }
    } else if (c == '"') {
      inString = true;
      result.add(c);
    } else if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      result.add(c);
    }
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

// =======================================================================================

SandboxResult interpretOutputDocument(kj::Maybe<kj::StringPtr> text) {
  capnp::JsonCodec json;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();

  kj::StringPtr source;
  KJ_IF_MAYBE(t, text) {
    source = *t;
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      json.decodeRaw(source, root);
    })) {
      KJ_LOG(INFO, "output document is not valid JSON", exception->getDescription());
      return SandboxResult::failure(kj::str("failed to read output document"));
    }
  } else {
    return SandboxResult::failure(kj::str("failed to read output document"));
  }

  if (!root.isObject()) {
    return SandboxResult::failure(kj::str("failed to read output document"));
  }
  auto fields = root.asReader().getObject();

  capnp::JsonValue::Reader status;
  KJ_IF_MAYBE(s, findField(fields, "status")) {
    status = *s;
  } else {
    return SandboxResult::failure(kj::str("output document missing status field"));
  }

  if (status.isString() && status.getString() == "success") {
    if (findField(fields, "output") == nullptr) {
      return SandboxResult::failure(kj::str("success status missing output field"));
    }
    RawObjectScanner scanner(json, source);
    KJ_IF_MAYBE(raw, scanner.findMember("output")) {
      return SandboxResult::success(compactJson(*raw));
    }
    KJ_FAIL_ASSERT("parsed output field not found in source text");
  } else if (status.isString() && status.getString() == "error") {
    KJ_IF_MAYBE(error, findField(fields, "error")) {
      kj::Maybe<kj::String> traceback;
      KJ_IF_MAYBE(t, findField(fields, "traceback")) {
        if (t->isString()) traceback = kj::str(t->getString());
      }
      return SandboxResult::failure(textOf(json, *error), kj::mv(traceback));
    } else {
      return SandboxResult::failure(kj::str("error status missing error field"));
    }
  } else {
    return SandboxResult::failure(kj::str("invalid status value: ", textOf(json, status)));
  }
}

SandboxResult readOutputDocument(kj::StringPtr workspace, size_t maxSize) {
  // The guest controls this path, so it may be a FIFO, a directory, a symlink to anything, or
  // endlessly large. Only a regular file of bounded size is read; anything else is a protocol
  // violation.
  auto path = kj::str(workspace, '/', OUTPUT_DOCUMENT);
  kj::Maybe<kj::String> text;
  bool readable = true;

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    KJ_IF_MAYBE(fd, raiiOpenIfExists(path, O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC)) {
      struct stat stats;
      KJ_SYSCALL(fstat(*fd, &stats), path);
      if (!S_ISREG(stats.st_mode)) {
        KJ_LOG(INFO, "output document is not a regular file", path, stats.st_mode);
        readable = false;
        return;
      }
      text = readAllBounded(*fd, maxSize);
      if (text == nullptr) {
        KJ_LOG(INFO, "output document is too large", path, maxSize);
        readable = false;
      }
    }
  })) {
    KJ_LOG(INFO, "couldn't read output document", exception->getDescription());
    readable = false;
  }

  if (!readable) {
    return SandboxResult::failure(kj::str("failed to read output document"));
  }
  KJ_IF_MAYBE(t, text) {
    return interpretOutputDocument(kj::StringPtr(*t));
  } else {
    return interpretOutputDocument(nullptr);
  }
}

static kj::String encodeString(capnp::JsonCodec& json, kj::StringPtr text) {
  capnp::MallocMessageBuilder message;
  auto value = message.initRoot<capnp::JsonValue>();
  value.setString(text);
  return json.encodeRaw(value.asReader());
}

kj::String encodeResult(const SandboxResult& result) {
  // Assembled by hand so that the output is spliced in exactly as the guest wrote it.
  capnp::JsonCodec json;
  kj::Vector<kj::String> members;
  auto add = [&](kj::StringPtr name, kj::StringPtr valueJson) {
    members.add(kj::str(encodeString(json, name), ':', valueJson));
  };

  KJ_SWITCH_ONEOF(result.outcome) {
    KJ_CASE_ONEOF(success, SandboxResult::Success) {
      add("status", "\"success\"");
      add("output", success.output);
    }
    KJ_CASE_ONEOF(failure, SandboxResult::Failure) {
      add("status", "\"error\"");
      add("error", encodeString(json, failure.error));
      KJ_IF_MAYBE(traceback, failure.traceback) {
        add("traceback", encodeString(json, *traceback));
      }
    }
  }
  KJ_IF_MAYBE(logs, result.logs) {
    add("logs", encodeString(json, *logs));
  }

  return kj::str('{', kj::strArray(members, ","), '}');
}

}  // namespace sandpit
