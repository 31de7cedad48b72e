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

#include <kj/main.h>
#include <kj/debug.h>
#include <kj/mutex.h>
#include <capnp/message.h>
#include <capnp/compat/json.h>
#include <unistd.h>
#include "version.h"
#include "config.h"
#include "docker.h"
#include "orchestrator.h"
#include "util.h"

namespace sandpit {

class RunMain {
  // Main class for `sandpit-run`, which runs one script in a sandbox and prints its result.

public:
  RunMain(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Sandpit version " SANDPIT_VERSION,
                           "Runs <script> in a fresh sandbox container, waits for it to finish, "
                           "and prints the result as JSON. Exits non-zero if the sandbox "
                           "reported or suffered a failure.")
        .addOptionWithArg({'c', "config"}, KJ_BIND_METHOD(*this, setConfigFile),
                          "<file>", "read settings from <file> (KEY=value lines)")
        .addOptionWithArg({'n', "network"}, KJ_BIND_METHOD(*this, setNetwork),
                          "<mode>", "network access: sandbox (default), both or public")
        .addOptionWithArg({'i', "input"}, KJ_BIND_METHOD(*this, setInputFile),
                          "<file>", "JSON document handed to the script as input.json "
                          "(default {})")
        .addOptionWithArg({'t', "timeout"}, KJ_BIND_METHOD(*this, setTimeout),
                          "<seconds>", "kill the sandbox after <seconds>; 0 for no limit "
                          "(default RUN_TIMEOUT)")
        .addOption({'s', "stream-logs"}, KJ_BIND_METHOD(*this, setStreamLogs),
                   "log the script's output as it is produced")
        .addOption({'k', "keep"}, KJ_BIND_METHOD(*this, setKeep),
                   "don't delete the workspace afterwards")
        .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose), "log progress")
        .expectArg("<script>", KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext& context;
  kj::Maybe<kj::String> configFile;
  kj::Maybe<kj::String> inputFile;
  NetworkMode mode = NetworkMode::RESTRICTED;
  kj::Maybe<kj::Maybe<kj::Duration>> timeout;
  bool streamLogs = false;
  bool keep = false;

  kj::MainBuilder::Validity setConfigFile(kj::StringPtr arg) {
    if (access(arg.cStr(), R_OK) != 0) return "config file is not readable";
    configFile = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity setNetwork(kj::StringPtr arg) {
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() { mode = parseNetworkMode(arg); })) {
      return "network must be one of: sandbox, both, public";
    }
    return true;
  }

  kj::MainBuilder::Validity setInputFile(kj::StringPtr arg) {
    if (access(arg.cStr(), R_OK) != 0) return "input file is not readable";
    inputFile = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity setTimeout(kj::StringPtr arg) {
    if (parseUInt(arg, 10) == nullptr) return "timeout must be a number of seconds";
    timeout = parseSeconds(arg);
    return true;
  }

  kj::MainBuilder::Validity setStreamLogs() {
    streamLogs = true;
    return true;
  }

  kj::MainBuilder::Validity setKeep() {
    keep = true;
    return true;
  }

  kj::MainBuilder::Validity setVerbose() {
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
    return true;
  }

  kj::MainBuilder::Validity run(kj::StringPtr script) {
    if (access(script.cStr(), R_OK) != 0) return "script is not readable";

    Config config;
    KJ_IF_MAYBE(file, configFile) {
      config = readConfig(*file);
    }
    if (streamLogs) config.streamLogs = true;

    capnp::MallocMessageBuilder message;
    auto input = message.initRoot<capnp::JsonValue>();
    KJ_IF_MAYBE(file, inputFile) {
      capnp::JsonCodec json;
      json.decodeRaw(readAll(*file), input);
    } else {
      input.initObject(0);
    }

    DockerEngineFactory engineFactory(kj::heapString(config.dockerSocket),
                                      kj::heapString(config.dockerApiVersion));
    kj::String id = nullptr;
    bool succeeded = false;

    {
      Orchestrator orchestrator(kj::mv(config), engineFactory);

      kj::MutexGuarded<kj::Maybe<SandboxResult>> result;
      auto onFinish = [&result](SandboxResult&& r) {
        *result.lockExclusive() = kj::mv(r);
      };
      auto noMount = [](kj::StringPtr) {};

      KJ_IF_MAYBE(t, timeout) {
        id = orchestrator.create(script, input.asReader(), noMount, onFinish, mode, *t);
      } else {
        id = orchestrator.create(script, input.asReader(), noMount, onFinish, mode);
      }

      SandboxResult finished = ({
        auto lock = result.lockExclusive();
        lock.wait([](const kj::Maybe<SandboxResult>& r) { return r != nullptr; });
        kj::mv(KJ_ASSERT_NONNULL(*lock));
      });
      succeeded = finished.isSuccess();

      auto text = kj::str(encodeResult(finished), '\n');
      kj::FdOutputStream(STDOUT_FILENO).write(text.begin(), text.size());

      if (keep) {
        KJ_IF_MAYBE(path, orchestrator.workspacePath(id)) {
          context.warning(kj::str("workspace kept at ", *path));
        }
        orchestrator.forget(id);
      } else {
        orchestrator.cleanup(id);
      }
      // The orchestrator's destructor removes the egress proxy before we exit.
    }

    if (!succeeded) {
      context.exitError(kj::str("sandbox ", id, " failed"));
    }
    return true;
  }
};

}  // namespace sandpit

KJ_MAIN(sandpit::RunMain)
