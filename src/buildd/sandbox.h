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

#ifndef BUILDD_SANDBOX_H_
#define BUILDD_SANDBOX_H_

#include <kj/async.h>
#include <kj/time.h>
#include "util.h"
#include "build.h"

namespace buildd {

class ProcessSupervisor;
struct Config;

struct ExecutionQuirks {
  // Adjustments applied to every command run in a sandbox, resolved once per build from the
  // target architecture and series.

  kj::Array<kj::String> argvPrefix;
  // e.g. {"linux32", "--uname-2.6"}; empty if no personality change is needed.

  kj::Array<kj::String> env;
  // NAME=VALUE pairs added to every command's environment.
};

ExecutionQuirks resolveQuirks(kj::StringPtr architectureTag, kj::StringPtr series);
// Throws if the architecture tag is unknown.

bool isKnownArchitecture(kj::StringPtr architectureTag);

kj::String formatMode(mode_t mode);
// Four-digit octal, e.g. "0755", as accepted by install(1) and `lxc file push`.

class Sandbox {
  // An isolated environment for one build, rooted at `<buildPath>/chroot-autobuild` or backed by
  // a container named after the build. The daemon never runs privileged; implementations go
  // through sudo or the container manager's client for anything that needs it, always via the
  // build's ProcessSupervisor so that every helper command shows up in the build log.
  //
  // Teardown steps (killProcesses(), stop(), remove()) are idempotent: calling them again, or
  // after create() failed partway, is harmless.

public:
  explicit Sandbox(kj::StringPtr buildPath): buildPath(kj::heapString(buildPath)) {}
  virtual ~Sandbox() noexcept(false);
  KJ_DISALLOW_COPY(Sandbox);

  kj::StringPtr getBuildPath() { return buildPath; }
  // Host-side working directory of the build.

  void setQuirks(ExecutionQuirks&& newQuirks) { quirks = kj::mv(newQuirks); }

  virtual kj::Promise<void> create(kj::StringPtr imagePath) = 0;
  // Unpack or import the base image at `imagePath`.

  virtual kj::Promise<void> start() = 0;
  // Make the sandbox ready to run commands (mounts, container boot).

  virtual kj::Array<kj::String> commandFor(const Command& command) = 0;
  // Host argv that runs `command` inside the sandbox.

  virtual kj::Promise<void> copyIn(kj::StringPtr hostPath, kj::StringPtr targetPath,
                                   mode_t mode) = 0;
  // Install a host file into the sandbox, owned by root:root with the given mode.

  virtual kj::Promise<void> copyOut(kj::StringPtr targetPath, kj::StringPtr hostPath) = 0;
  // Copy a file out of the sandbox; the copy is owned by the daemon's user.

  virtual kj::Promise<void> killProcesses() = 0;
  virtual kj::Promise<void> stop() = 0;
  virtual kj::Promise<void> remove() = 0;

  kj::Promise<void> destroy();
  // killProcesses(), stop() and remove(), in that order. Every step is attempted even if an
  // earlier one fails; the first failure is rethrown at the end.

protected:
  kj::String buildPath;
  ExecutionQuirks quirks;
};

class SandboxFactory {
public:
  virtual kj::Own<Sandbox> newSandbox(kj::StringPtr buildId, kj::StringPtr buildPath,
                                      ProcessSupervisor& supervisor) = 0;
};

class SystemSandboxFactory final: public SandboxFactory {
  // Creates the sandbox variant selected by the config.

public:
  SystemSandboxFactory(const Config& config, kj::Timer& timer, kj::StringPtr selfPath)
      : config(config), timer(timer), selfPath(kj::heapString(selfPath)) {}
  // `selfPath` is the buildd binary, which the chroot sandbox runs under sudo to reap processes.

  kj::Own<Sandbox> newSandbox(kj::StringPtr buildId, kj::StringPtr buildPath,
                              ProcessSupervisor& supervisor) override;

private:
  const Config& config;
  kj::Timer& timer;
  kj::String selfPath;
};

}  // namespace buildd

#endif  // BUILDD_SANDBOX_H_
