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

#ifndef SANDPIT_UTIL_H_
#define SANDPIT_UTIL_H_
// Filesystem, string and subprocess helpers shared by the orchestrator, the proxy and the tools.

#include <kj/io.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <unistd.h>
#include <kj/function.h>

namespace sandpit {

#define KJ_MVCAP(var) var = ::kj::mv(var)
// Capture the given variable by move.  Place this in a lambda capture list.  Requires C++14.

typedef unsigned int uint;
typedef unsigned char byte;

struct Pipe {
  kj::AutoCloseFd readEnd;
  kj::AutoCloseFd writeEnd;

  static Pipe make();
};

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode = 0666);

kj::Maybe<kj::AutoCloseFd> raiiOpenIfExists(
    kj::StringPtr name, int flags, mode_t mode = 0666);

kj::String trim(kj::ArrayPtr<const char> slice);
// Remove whitespace from both ends of the char array and return what's left as a String.

kj::Maybe<uint> parseUInt(kj::StringPtr s, int base);
// Try to parse an integer with strtoul(), return null if parsing fails or doesn't consume all
// input.

bool parseBool(kj::StringPtr value);
// Config-style boolean: "true" and "yes" are true, anything else is false.

kj::StringPtr baseName(kj::StringPtr path);
// Everything after the last '/' of `path`, or `path` itself if it has no '/'.

kj::String dirName(kj::StringPtr path);
// Everything before the last '/' of `path`; "." if there is none.

kj::String shellQuote(kj::StringPtr text);
// Wrap `text` in single quotes so that `sh -c` treats it as one literal word.

void recursivelyDelete(kj::StringPtr path);
// Delete the given path, recursively if it is a directory.
//
// Since this may be used in KJ_DEFER to delete temporary directories, all exceptions are
// recoverable (won't throw if already unwinding).

kj::String readAll(int fd);
// Read entire contents of the file descirptor to a String.

kj::Maybe<kj::String> readAllBounded(int fd, size_t limit);
// Like readAll(fd), but gives up and returns null rather than read more than `limit` bytes.

kj::String readAll(kj::StringPtr name);
// Read entire contents of a named file to a String.

void writeFile(kj::StringPtr name, kj::ArrayPtr<const char> content, mode_t mode = 0644);
// Create (or truncate) `name` and write `content` to it. `mode` is applied even if the file
// already existed.

kj::Array<kj::String> splitLines(kj::StringPtr input);
// Split the input into lines, trimming whitespace, and ignoring blank lines or lines that start
// with #.

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim);
// Split the char array on an arbitrary delimiter character.

class Subprocess {
  // A child process, run via execvp() so that the PATH is searched.

public:
  struct Options {
    kj::Array<const kj::StringPtr> argv;
    // Arguments to the program. The first is the executable.

    int stdin = STDIN_FILENO;
    int stdout = STDOUT_FILENO;
    int stderr = STDERR_FILENO;
    // What file descriptors to substitute for standard I/O.
    //
    // Note that if you override these, then the overridden FD is expected to be close-on-exec.
    // `Subprocess` does NOT close the old FD after dup2()ing it over the standard I/O FD.

    kj::Maybe<kj::StringPtr> workingDirectory;
    // Directory to chdir() into before exec. Null to inherit the parent's.

    kj::Maybe<kj::ArrayPtr<const kj::StringPtr>> environment;
    // An array of 'NAME=VALUE' pairs specifying the child's environment. If null, inherits the
    // parent's environment.

    Options(std::initializer_list<const kj::StringPtr> argv): argv(kj::heapArray(argv)) {}
  };

  Subprocess(Options&& options);
  // Start a subprocess based on the given options.

  Subprocess(std::initializer_list<const kj::StringPtr> argv)
      : Subprocess(Options(kj::mv(argv))) {}

  KJ_DISALLOW_COPY(Subprocess);

  inline Subprocess(Subprocess&& other)
      : name(kj::mv(other.name)), pid(other.pid) {
    other.pid = 0;
  }

  ~Subprocess() noexcept(false);
  // Kills the subprocess (with SIGKILL) and waitpid()s it if it hasn't already finished.

  void waitForSuccess();
  // Wait for the child to exit. Throws an exception if it returns a non-zero exit status or is
  // killed by a signal.

  int waitForExit() KJ_WARN_UNUSED_RESULT;
  // Waits for the child to exit and returns the exit status. Throws an exception if it is killed
  // by a signal.

private:
  kj::String name;
  kj::UnwindDetector unwindDetector;
  pid_t pid = 0;  // 0 = not running

  int waitForExitOrSignal();
  static void forceFdAbove(int& fd, int minValue);
};

}  // namespace sandpit

#endif // SANDPIT_UTIL_H_
