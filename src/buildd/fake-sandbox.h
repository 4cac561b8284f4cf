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

#ifndef BUILDD_FAKE_SANDBOX_H_
#define BUILDD_FAKE_SANDBOX_H_
// Test-only sandbox: a plain host directory standing in for the sandbox root. Commands run on the
// host with the root as their working directory.

#include <kj/debug.h>
#include <sys/stat.h>
#include "sandbox.h"

namespace buildd {
namespace {

struct SandboxEvents {
  kj::Vector<kj::String> calls;
  // One entry per Sandbox method call, e.g. "copyIn /etc/hosts".

  bool failStart = false;
  bool failRemove = false;
  bool hangKill = false;

  kj::Vector<kj::String> extraEnv;
  // NAME=VALUE pairs added to every command, e.g. a PATH that finds stub tools first.

  kj::String rebasePrefix;
  // If non-empty, command arguments starting with this sandbox path are rewritten to the same
  // path below the root, as if the command ran inside the sandbox.

  bool reaperMarker = false;
  // killProcesses() leaves a file named "reaped" at the sandbox root, so that a test command
  // can stand in for a process that nothing but the sandbox's reaper can stop.

  bool contains(kj::StringPtr call) {
    for (auto& c: calls) {
      if (c == call) return true;
    }
    return false;
  }
};

class FakeSandbox final: public Sandbox {
public:
  FakeSandbox(kj::StringPtr buildPath, SandboxEvents& events)
      : Sandbox(buildPath), events(events), root(kj::str(buildPath, "/chroot-autobuild")) {}

  kj::StringPtr getRoot() { return root; }

  kj::Promise<void> create(kj::StringPtr imagePath) override {
    return kj::evalNow([this]() {
      events.calls.add(kj::str("create"));
      KJ_SYSCALL(mkdir(root.cStr(), 0755), root);
    });
  }

  kj::Promise<void> start() override {
    return kj::evalNow([this]() {
      events.calls.add(kj::str("start"));
      KJ_REQUIRE(!events.failStart, "sandbox refused to start");
    });
  }

  kj::Array<kj::String> commandFor(const Command& command) override {
    auto dir = root.asPtr();
    kj::String cwd;
    KJ_IF_MAYBE(c, command.cwd) {
      cwd = kj::str(root, *c);
      dir = cwd;
    }

    kj::Vector<kj::String> env;
    for (auto& var: events.extraEnv) env.add(shellEscape(var));
    for (auto& var: quirks.env) env.add(shellEscape(var));
    for (auto& var: command.env) env.add(shellEscape(var));

    auto argv = KJ_MAP(arg, command.argv) {
      if (events.rebasePrefix.size() > 0 && arg.startsWith(events.rebasePrefix)) {
        return kj::str(root, arg);
      }
      return kj::heapString(arg);
    };

    return makeArgv("/bin/sh", "-c",
        kj::str("cd ", shellEscape(kj::str(dir)), " && exec env ", kj::strArray(env, " "),
                " ", formatCommand(argv)));
  }

  kj::Promise<void> copyIn(kj::StringPtr hostPath, kj::StringPtr targetPath,
                           mode_t mode) override {
    return kj::evalNow([=]() {
      events.calls.add(kj::str("copyIn ", targetPath));
      auto path = kj::str(root, targetPath);
      recursivelyCreateParent(path);
      writeFile(path, readAll(hostPath), mode);
    });
  }

  kj::Promise<void> copyOut(kj::StringPtr targetPath, kj::StringPtr hostPath) override {
    return kj::evalNow([=]() {
      events.calls.add(kj::str("copyOut ", targetPath));
      writeFile(hostPath, readAll(kj::str(root, targetPath)));
    });
  }

  kj::Promise<void> killProcesses() override {
    events.calls.add(kj::str("killProcesses"));
    if (events.hangKill) return kj::NEVER_DONE;
    if (events.reaperMarker && isDirectory(root)) {
      writeFile(kj::str(root, "/reaped"), "");
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> stop() override {
    events.calls.add(kj::str("stop"));
    return kj::READY_NOW;
  }

  kj::Promise<void> remove() override {
    return kj::evalNow([this]() {
      events.calls.add(kj::str("remove"));
      KJ_REQUIRE(!events.failRemove, "sandbox could not be removed");
      if (pathExists(root)) recursivelyDelete(root);
    });
  }

private:
  SandboxEvents& events;
  kj::String root;
};

class FakeSandboxFactory final: public SandboxFactory {
public:
  SandboxEvents events;

  kj::Own<Sandbox> newSandbox(kj::StringPtr buildId, kj::StringPtr buildPath,
                              ProcessSupervisor& supervisor) override {
    return kj::heap<FakeSandbox>(buildPath, events);
  }
};

}  // namespace
}  // namespace buildd

#endif  // BUILDD_FAKE_SANDBOX_H_
