// buildd - Build Execution Daemon
// Copyright (c) 2026 The buildd Authors
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

// Main entry point for the build daemon and its helper commands.

#include <kj/main.h>
#include <kj/debug.h>
#include <kj/async-unix.h>
#include <capnp/rpc-twoparty.h>
#include <errno.h>
#include <limits.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include "config.h"
#include "engine.h"
#include "sandbox.h"
#include "chroot.h"
#include "builder.h"
#include "buildrecipe.h"

#ifndef BUILDD_VERSION
#define BUILDD_VERSION "(unknown)"
#endif

namespace buildd {

class BuilddMain {
  // Multi-call main: the daemon itself, the standalone recipe builder and the process reaper
  // that the chroot sandbox runs through sudo.

public:
  BuilddMain(kj::ProcessContext& context): context(context) {
    char buf[PATH_MAX + 1];
    ssize_t n;
    KJ_SYSCALL(n = readlink("/proc/self/exe", buf, sizeof(buf) - 1));
    buf[n] = '\0';
    selfPath = kj::heapString(buf, n);
  }

  kj::MainFunc getMain() {
    static const char* VERSION = "buildd version " BUILDD_VERSION;

    return kj::MainBuilder(context, VERSION,
            "Runs packaging builds on behalf of a remote dispatcher, one at a time, each in "
            "its own sandbox.")
        .addSubCommand("daemon",
            [this]() {
              return kj::MainBuilder(context, VERSION,
                      "Serves the builder protocol on the configured LISTEN address until "
                      "SIGTERM or SIGINT, which abort any active build.")
                  .addOptionWithArg({"config"}, KJ_BIND_METHOD(*this, setConfig), "<file>",
                      "Read configuration from <file> instead of /etc/buildd/buildd.conf.")
                  .addOption({'v', "verbose"}, [this]() { verbose = true; return true; },
                      "Log informational messages.")
                  .callAfterParsing(KJ_BIND_METHOD(*this, daemon))
                  .build();
            },
            "Run the build daemon.")
        .addSubCommand("buildrecipe",
            [this]() {
              alternateMain = getBuildRecipeMain(context, selfPath);
              return alternateMain->getMain();
            },
            "Build a source package recipe in an already prepared sandbox.")
        .addSubCommand("scan-for-processes",
            [this]() {
              return kj::MainBuilder(context, VERSION,
                      "Kills every process whose root directory is inside <root>. Must run as "
                      "root.")
                  .expectArg("<root>", KJ_BIND_METHOD(*this, scanForProcesses))
                  .build();
            },
            "Kill all processes running inside a chroot.")
        .build();
  }

  kj::MainBuilder::Validity setConfig(kj::StringPtr arg) {
    configPath = arg;
    return true;
  }

  kj::MainBuilder::Validity scanForProcesses(kj::StringPtr root) {
    if (root.size() == 0 || root == "/") {
      return "refusing to scan the host root";
    }
    buildd::scanForProcesses(root);
    context.exit();
  }

  kj::MainBuilder::Validity daemon() {
    if (verbose) {
      kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
    }

    auto config = readConfig(configPath);

    kj::UnixEventPort::captureSignal(SIGTERM);
    kj::UnixEventPort::captureSignal(SIGINT);

    auto io = kj::setupAsyncIo();
    auto& timer = io.provider->getTimer();
    SubprocessSet subprocesses(io.unixEventPort);

    SystemSandboxFactory sandboxFactory(config, timer, selfPath);
    StandardBackendFactory backendFactory(config);
    BuildEngine engine(config, timer, *io.lowLevelProvider, subprocesses,
                       sandboxFactory, backendFactory);

    capnp::TwoPartyServer server(kj::heap<BuilderImpl>(engine));

    if (config.listen.startsWith("unix:")) {
      // Clear stale socket, if any.
      auto path = config.listen.slice(strlen("unix:"));
      int result;
      KJ_SYSCALL_HANDLE_ERRORS(result = unlink(path.cStr())) {
        case ENOENT:
          break;
        default:
          KJ_FAIL_SYSCALL("unlink(socket)", error, path);
      }
    }

    auto serve = io.provider->getNetwork().parseAddress(config.listen, 8221)
        .then([&](kj::Own<kj::NetworkAddress>&& address) {
      auto listener = address->listen();
      KJ_LOG(INFO, "listening", config.listen, sandboxTypeName(config.sandbox),
             config.architectureTag);
      auto promise = server.listen(*listener);
      return promise.attach(kj::mv(listener), kj::mv(address));
    });

    auto shutdown = io.unixEventPort.onSignal(SIGTERM)
        .exclusiveJoin(io.unixEventPort.onSignal(SIGINT))
        .then([&](siginfo_t&& info) {
      KJ_LOG(WARNING, "shutting down", strsignal(info.si_signo),
             builderStateName(engine.status().state));
      engine.abort();
      return engine.whenIdle();
    });

    serve.exclusiveJoin(kj::mv(shutdown)).wait(io.waitScope);
    context.exit();
  }

private:
  kj::ProcessContext& context;
  kj::String selfPath;
  kj::StringPtr configPath = "/etc/buildd/buildd.conf";
  bool verbose = false;
  kj::Own<AbstractMain> alternateMain;
};

}  // namespace buildd

KJ_MAIN(buildd::BuilddMain)
