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
#include <errno.h>
#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/types.h>
#include <dirent.h>
#include <signal.h>
#include <sys/wait.h>

namespace sandpit {

Pipe Pipe::make() {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));
  return { kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1]) };
}

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode) {
  int fd;
  KJ_SYSCALL(fd = open(name.cStr(), flags, mode), name);
  return kj::AutoCloseFd(fd);
}

kj::Maybe<kj::AutoCloseFd> raiiOpenIfExists(kj::StringPtr name, int flags, mode_t mode) {
  int fd = open(name.cStr(), flags, mode);
  if (fd == -1) {
    if (errno == ENOENT) {
      return nullptr;
    } else {
      KJ_FAIL_SYSCALL("open", errno, name);
    }
  } else {
    return kj::AutoCloseFd(fd);
  }
}

static kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice) {
  while (slice.size() > 0 && isspace(slice[0])) {
    slice = slice.slice(1, slice.size());
  }
  while (slice.size() > 0 && isspace(slice[slice.size() - 1])) {
    slice = slice.slice(0, slice.size() - 1);
  }

  return slice;
}

kj::String trim(kj::ArrayPtr<const char> slice) {
  return kj::heapString(trimArray(slice));
}

kj::Maybe<uint> parseUInt(kj::StringPtr s, int base) {
  char* end;
  uint result = strtoul(s.cStr(), &end, base);
  if (s.size() == 0 || *end != '\0') {
    return nullptr;
  }
  return result;
}

bool parseBool(kj::StringPtr value) {
  return value == "true" || value == "yes";
}

kj::StringPtr baseName(kj::StringPtr path) {
  KJ_IF_MAYBE(slash, path.findLast('/')) {
    return path.slice(*slash + 1);
  } else {
    return path;
  }
}

kj::String dirName(kj::StringPtr path) {
  KJ_IF_MAYBE(slash, path.findLast('/')) {
    if (*slash == 0) return kj::str("/");
    return kj::heapString(path.slice(0, *slash));
  } else {
    return kj::str(".");
  }
}

kj::String shellQuote(kj::StringPtr text) {
  kj::Vector<char> result(text.size() + 3);
  result.add('\'');
  for (char c: text) {
    if (c == '\'') {
      // Close the quote, emit an escaped quote, reopen.
      result.addAll(kj::StringPtr("'\\''"));
    } else {
      result.add(c);
    }
  }
  result.add('\'');
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

static kj::Array<kj::String> listDirectory(kj::StringPtr dirname) {
  DIR* dir = opendir(dirname.cStr());
  if (dir == nullptr) {
    KJ_FAIL_SYSCALL("opendir", errno, dirname);
  }
  KJ_DEFER(closedir(dir));

  kj::Vector<kj::String> entries;
  for (;;) {
    errno = 0;
    struct dirent* entry = readdir(dir);
    if (entry == nullptr) {
      int error = errno;
      if (error == 0) {
        break;
      } else {
        KJ_FAIL_SYSCALL("readdir", error, dirname);
      }
    }

    kj::StringPtr name = entry->d_name;
    if (name != "." && name != "..") {
      entries.add(kj::heapString(entry->d_name));
    }
  }

  return entries.releaseAsArray();
}

void recursivelyDelete(kj::StringPtr path) {
  KJ_REQUIRE(!path.endsWith("/"),
      "refusing to recursively delete directory name with trailing / to reduce risk of "
      "catastrophic empty-string bugs");
  struct stat stats;
  KJ_SYSCALL(lstat(path.cStr(), &stats), path) { return; }
  if (S_ISDIR(stats.st_mode)) {
    for (auto& file: listDirectory(path)) {
      recursivelyDelete(kj::str(path, "/", file));
    }
    KJ_SYSCALL(rmdir(path.cStr()), path) { break; }
  } else {
    KJ_SYSCALL(unlink(path.cStr()), path) { break; }
  }
}

kj::String readAll(int fd) {
  kj::FdInputStream input(fd);
  kj::Vector<char> content;
  for (;;) {
    char buffer[4096];
    size_t n = input.tryRead(buffer, sizeof(buffer), sizeof(buffer));
    content.addAll(buffer, buffer + n);
    if (n < sizeof(buffer)) {
      // Done!
      break;
    }
  }
  content.add('\0');
  return kj::String(content.releaseAsArray());
}

kj::Maybe<kj::String> readAllBounded(int fd, size_t limit) {
  kj::FdInputStream input(fd);
  kj::Vector<char> content;
  for (;;) {
    char buffer[4096];
    size_t n = input.tryRead(buffer, 1, sizeof(buffer));
    if (n == 0) break;
    if (content.size() + n > limit) return nullptr;
    content.addAll(buffer, buffer + n);
  }
  content.add('\0');
  return kj::String(content.releaseAsArray());
}

kj::String readAll(kj::StringPtr name) {
  return readAll(raiiOpen(name, O_RDONLY | O_CLOEXEC));
}

void writeFile(kj::StringPtr name, kj::ArrayPtr<const char> content, mode_t mode) {
  auto fd = raiiOpen(name, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  KJ_SYSCALL(fchmod(fd, mode), name);
  kj::FdOutputStream(fd.get()).write(content.begin(), content.size());
}

kj::Array<kj::String> splitLines(kj::StringPtr input) {
  size_t lineStart = 0;
  kj::Vector<kj::String> results;
  for (size_t i = 0; i < input.size(); i++) {
    if (input[i] == '\n' || input[i] == '#') {
      bool hasComment = input[i] == '#';
      auto line = trim(input.slice(lineStart, i));
      if (line.size() > 0) {
        results.add(kj::mv(line));
      }
      if (hasComment) {
        // Ignore through newline.
        ++i;
        while (i < input.size() && input[i] != '\n') ++i;
      }
      lineStart = i + 1;
    }
  }

  if (lineStart < input.size()) {
    auto lastLine = trim(input.slice(lineStart));
    if (lastLine.size() > 0) {
      results.add(kj::mv(lastLine));
    }
  }

  return results.releaseAsArray();
}

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim) {
  kj::Vector<kj::ArrayPtr<const char>> result;

  size_t start = 0;
  for (size_t i: kj::indices(input)) {
    if (input[i] == delim) {
      result.add(input.slice(start, i));
      start = i + 1;
    }
  }
  result.add(input.slice(start, input.size()));
  return result;
}

// =======================================================================================

Subprocess::Subprocess(Options&& options)
    : name(kj::heapString(options.argv[0])) {
  KJ_SYSCALL(pid = fork());
  if (pid == 0) {
    KJ_DEFER(_exit(1));  // Do not under any circumstances return from this stack frame!
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      // Reset all signal handlers to default.  (exec() will leave ignored signals ignored, and KJ
      // code likes to ignore e.g. SIGPIPE.)
      for (uint i = 1; i < NSIG; i++) {
        ::signal(i, SIG_DFL);  // Only possible error is EINVAL (invalid signum); we don't care.
      }

      // Unblock all signals.  (Yes, the signal mask is inherited over exec...)
      sigset_t sigmask;
      sigemptyset(&sigmask);
      KJ_SYSCALL(sigprocmask(SIG_SETMASK, &sigmask, nullptr));

      // Make sure all of the incoming FDs are outside of the standard I/O range (except where
      // they are already exactly in the right slot).
      int minFd = STDERR_FILENO + 1;

      if (options.stdin != STDIN_FILENO) forceFdAbove(options.stdin, minFd);
      if (options.stdout != STDOUT_FILENO) forceFdAbove(options.stdout, minFd);
      if (options.stderr != STDERR_FILENO) forceFdAbove(options.stderr, minFd);

      if (options.stdin != STDIN_FILENO) {
        KJ_SYSCALL(dup2(options.stdin, STDIN_FILENO));
      }
      if (options.stdout != STDOUT_FILENO) {
        KJ_SYSCALL(dup2(options.stdout, STDOUT_FILENO));
      }
      if (options.stderr != STDERR_FILENO) {
        KJ_SYSCALL(dup2(options.stderr, STDERR_FILENO));
      }

      KJ_IF_MAYBE(dir, options.workingDirectory) {
        KJ_SYSCALL(chdir(dir->cStr()), *dir);
      }

      // Make the args vector.
      char* argv[options.argv.size() + 1];
      for (auto i: kj::indices(options.argv)) {
        // exec*() is not const-correct. :(
        argv[i] = const_cast<char*>(options.argv[i].cStr());
      }
      argv[options.argv.size()] = nullptr;
      char** argvp = argv;  // lambda can't capture variable-size array

      KJ_IF_MAYBE(e, options.environment) {
        // Make the environment vector.
        char* environ[e->size() + 1];
        for (auto i: kj::indices(*e)) {
          // exec*() is not const-correct. :(
          environ[i] = const_cast<char*>((*e)[i].cStr());
        }
        environ[e->size()] = nullptr;
        char** environp = environ;  // lambda can't capture variable-size array

        KJ_SYSCALL(execvpe(argvp[0], argvp, environp), options.argv[0]);
      } else {
        KJ_SYSCALL(execvp(argvp[0], argvp), options.argv[0]);
      }

      KJ_UNREACHABLE;
    })) {
      KJ_LOG(FATAL, *exception);
    }
  }
}

Subprocess::~Subprocess() noexcept(false) {
  if (pid != 0) {
    unwindDetector.catchExceptionsIfUnwinding([this]() {
      KJ_SYSCALL(kill(pid, SIGKILL), name);
      (void)waitForExitOrSignal();
    });
  }
}

void Subprocess::waitForSuccess() {
  int exitCode = waitForExit();
  KJ_ASSERT(exitCode == 0, "child process failed", name, exitCode);
}

int Subprocess::waitForExit() {
  int status = waitForExitOrSignal();
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    int signo = WTERMSIG(status);
    KJ_FAIL_ASSERT("child process killed by signal", name, signo, strsignal(signo));
  } else {
    KJ_FAIL_ASSERT("unknown child wait status", name, status);
  }
}

int Subprocess::waitForExitOrSignal() {
  KJ_REQUIRE(pid != 0, "already waited for this child");
  int status;
  KJ_SYSCALL(waitpid(pid, &status, 0));
  pid = 0;
  return status;
}

void Subprocess::forceFdAbove(int& fd, int minValue) {
  // Force `fd` to have a numeric value of at least `minValue`.

  if (fd < minValue) {
    // fcntl()'s F_DUPFD searches for a slot greater than or equal to some value. The new FD is
    // close-on-exec because it is only a staging copy; it gets dup2()ed back into place.
    KJ_SYSCALL(fd = fcntl(fd, F_DUPFD_CLOEXEC, minValue));
  }
}

}  // namespace sandpit
