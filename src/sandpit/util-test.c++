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

#include "util.h"
#include <kj/test.h>

namespace sandpit {
namespace {

bool hasSubstring(kj::StringPtr haystack, kj::StringPtr needle) {
  if (needle.size() <= haystack.size()) {
    for (size_t i = 0; i <= haystack.size() - needle.size(); i++) {
      if (haystack.slice(i).startsWith(needle)) {
        return true;
      }
    }
  }
  return false;
}

KJ_TEST("Subprocess") {
  {
    Subprocess child({"true"});
    child.waitForSuccess();
  }

  {
    Subprocess child({"false"});
    KJ_EXPECT(child.waitForExit() != 0);
  }

  {
    Subprocess child({"false"});
    KJ_EXPECT_THROW_MESSAGE("child process failed", child.waitForSuccess());
  }

  {
    Subprocess child({"cat"});
    // Will be killed by destructor.
  }

  {
    Subprocess child({"sh", "-c", "kill -9 $$"});
    KJ_EXPECT_THROW_MESSAGE("child process killed by signal", (void)child.waitForExit());
  }

  {
    Pipe pipe = Pipe::make();
    Subprocess::Options options({"echo", "foo"});
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(pipe.readEnd) == "foo\n");
    child.waitForSuccess();
  }

  {
    Pipe pipe = Pipe::make();
    Subprocess::Options options({"no-such-file-eb8c433f35f3063e"});
    options.stderr = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(hasSubstring(readAll(pipe.readEnd), "execvp("));
    KJ_EXPECT(child.waitForExit() != 0);
  }

  {
    Pipe pipe = Pipe::make();
    Subprocess::Options options({"sh", "-c", "echo $UTIL_TEST_ENV; pwd"});
    auto env = kj::heapArray<const kj::StringPtr>({"PATH=/bin:/usr/bin", "UTIL_TEST_ENV=foo"});
    options.environment = env.asPtr();
    options.workingDirectory = kj::StringPtr("/");
    options.stdout = pipe.writeEnd;
    Subprocess child(kj::mv(options));
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAll(pipe.readEnd) == "foo\n/\n");
    child.waitForSuccess();
  }
}

KJ_TEST("readAllBounded") {
  {
    Pipe pipe = Pipe::make();
    kj::FdOutputStream(pipe.writeEnd.get()).write("12345678", 8);
    pipe.writeEnd = nullptr;
    auto content = readAllBounded(pipe.readEnd, 8);
    KJ_EXPECT(KJ_ASSERT_NONNULL(content) == "12345678");
  }

  {
    Pipe pipe = Pipe::make();
    kj::FdOutputStream(pipe.writeEnd.get()).write("123456789", 9);
    pipe.writeEnd = nullptr;
    KJ_EXPECT(readAllBounded(pipe.readEnd, 8) == nullptr);
  }
}

KJ_TEST("shellQuote") {
  KJ_EXPECT(shellQuote("foo") == "'foo'");
  KJ_EXPECT(shellQuote("/sandbox/my script.py") == "'/sandbox/my script.py'");
  KJ_EXPECT(shellQuote("it's") == "'it'\\''s'");

  // Whatever we quote, the shell must give back verbatim.
  kj::StringPtr nasty = "a'b \"c\" $HOME `id`; rm -rf /";
  Pipe pipe = Pipe::make();
  auto command = kj::str("printf %s ", shellQuote(nasty));
  Subprocess::Options options({"sh", "-c", command});
  options.stdout = pipe.writeEnd;
  Subprocess child(kj::mv(options));
  pipe.writeEnd = nullptr;
  KJ_EXPECT(readAll(pipe.readEnd) == nasty);
  child.waitForSuccess();
}

KJ_TEST("path helpers") {
  KJ_EXPECT(baseName("/usr/local/bin/sandpit-proxy") == "sandpit-proxy");
  KJ_EXPECT(baseName("script.py") == "script.py");
  KJ_EXPECT(dirName("/usr/local/bin/sandpit-proxy") == "/usr/local/bin");
  KJ_EXPECT(dirName("/sandpit-proxy") == "/");
  KJ_EXPECT(dirName("sandpit-proxy") == ".");
}

KJ_TEST("split and parse") {
  auto parts = split("a,,b", ',');
  KJ_ASSERT(parts.size() == 3);
  KJ_EXPECT(kj::heapString(parts[0]) == "a");
  KJ_EXPECT(parts[1].size() == 0);
  KJ_EXPECT(kj::heapString(parts[2]) == "b");

  auto lines = splitLines("  FOO=1\n# comment\n\nBAR = 2  \n");
  KJ_ASSERT(lines.size() == 2);
  KJ_EXPECT(lines[0] == "FOO=1");
  KJ_EXPECT(lines[1] == "BAR = 2");

  auto n = parseUInt("42", 10);
  KJ_EXPECT(KJ_ASSERT_NONNULL(n) == 42);
  KJ_EXPECT(parseUInt("42x", 10) == nullptr);
  KJ_EXPECT(parseUInt("", 10) == nullptr);

  KJ_EXPECT(parseBool("true"));
  KJ_EXPECT(parseBool("yes"));
  KJ_EXPECT(!parseBool("1"));
  KJ_EXPECT(!parseBool("false"));
}

KJ_TEST("writeFile and recursivelyDelete") {
  char tempdir[] = "/tmp/sandpit-test.XXXXXX";
  KJ_REQUIRE(mkdtemp(tempdir) != nullptr);
  auto dir = kj::str(tempdir);

  auto script = kj::str(dir, "/run.sh");
  writeFile(script, kj::StringPtr("echo hi\n"), 0755);
  KJ_EXPECT(readAll(script) == "echo hi\n");

  struct stat stats;
  KJ_SYSCALL(stat(script.cStr(), &stats));
  KJ_EXPECT((stats.st_mode & 0777) == 0755);

  // Existing file: truncated, and the mode is applied anyway.
  writeFile(script, kj::StringPtr("x"), 0600);
  KJ_EXPECT(readAll(script) == "x");
  KJ_SYSCALL(stat(script.cStr(), &stats));
  KJ_EXPECT((stats.st_mode & 0777) == 0600);

  KJ_SYSCALL(mkdir(kj::str(dir, "/sub").cStr(), 0700));
  writeFile(kj::str(dir, "/sub/file"), kj::StringPtr("data"));
  KJ_EXPECT(readAll(kj::str(dir, "/sub/file")) == "data");

  recursivelyDelete(dir);
  KJ_EXPECT(access(dir.cStr(), F_OK) != 0);
  KJ_EXPECT(raiiOpenIfExists(script, O_RDONLY) == nullptr);
}

}  // namespace
}  // namespace sandpit
