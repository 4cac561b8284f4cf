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

#include "lxd.h"
#include "supervisor.h"

namespace buildd {

kj::String containerNameFor(kj::StringPtr buildId) {
  auto name = kj::str("buildd-", buildId);
  for (char& c: name) {
    if (!(('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || ('0' <= c && c <= '9'))) {
      c = '-';
    }
  }
  if (name.size() > 63) {
    // LXD's limit, inherited from hostnames.
    return kj::heapString(name.slice(0, 63));
  }
  return name;
}

LxdSandbox::LxdSandbox(kj::StringPtr buildId, kj::StringPtr buildPath,
                       ProcessSupervisor& supervisor)
    : Sandbox(buildPath), supervisor(supervisor), name(containerNameFor(buildId)) {}

LxdSandbox::~LxdSandbox() noexcept(false) {}

kj::Promise<void> LxdSandbox::create(kj::StringPtr imagePath) {
  return supervisor.runChecked(makeArgv("lxc", "image", "import", imagePath, "--alias", name))
      .then([this]() {
    imageImported = true;
    return supervisor.runChecked(makeArgv(
        "lxc", "init", name, name,
        "-c", "security.privileged=true",
        "-c", "security.nesting=true"));
  }).then([this]() {
    containerCreated = true;
  });
}

kj::Promise<void> LxdSandbox::start() {
  return supervisor.runChecked(makeArgv("lxc", "start", name)).then([this]() {
    running = true;
  });
}

kj::Array<kj::String> LxdSandbox::commandFor(const Command& command) {
  kj::Vector<kj::String> argv;
  argv.add(kj::str("lxc"));
  argv.add(kj::str("exec"));
  argv.add(kj::heapString(name));
  KJ_IF_MAYBE(cwd, command.cwd) {
    argv.add(kj::str("--cwd"));
    argv.add(kj::heapString(*cwd));
  }
  for (auto& var: quirks.env) {
    argv.add(kj::str("--env"));
    argv.add(kj::heapString(var));
  }
  for (auto& var: command.env) {
    argv.add(kj::str("--env"));
    argv.add(kj::heapString(var));
  }
  argv.add(kj::str("--"));
  for (auto& arg: quirks.argvPrefix) {
    argv.add(kj::heapString(arg));
  }
  for (auto& arg: command.argv) {
    argv.add(kj::heapString(arg));
  }
  return argv.releaseAsArray();
}

kj::Promise<void> LxdSandbox::copyIn(kj::StringPtr hostPath, kj::StringPtr targetPath,
                                     mode_t mode) {
  KJ_REQUIRE(targetPath.startsWith("/"), "sandbox paths must be absolute", targetPath);
  return supervisor.runChecked(makeArgv(
      "lxc", "file", "push", "--create-dirs", "--uid", "0", "--gid", "0",
      "--mode", formatMode(mode), hostPath, kj::str(name, targetPath)));
}

kj::Promise<void> LxdSandbox::copyOut(kj::StringPtr targetPath, kj::StringPtr hostPath) {
  KJ_REQUIRE(targetPath.startsWith("/"), "sandbox paths must be absolute", targetPath);
  return supervisor.runChecked(makeArgv(
      "lxc", "file", "pull", kj::str(name, targetPath), hostPath));
}

kj::Promise<void> LxdSandbox::killProcesses() {
  // Stopping the container kills everything in it; there is no finer-grained reaper.
  if (!running) return kj::READY_NOW;
  auto killer = supervisor.newSibling();
  auto promise = killer->runChecked(makeArgv("lxc", "stop", "--force", name));
  return promise.attach(kj::mv(killer)).then([this]() {
    running = false;
  });
}

kj::Promise<void> LxdSandbox::stop() {
  if (!running) return kj::READY_NOW;
  return supervisor.runChecked(makeArgv("lxc", "stop", "--force", name)).then([this]() {
    running = false;
  });
}

kj::Promise<void> LxdSandbox::remove() {
  kj::Promise<void> promise = kj::READY_NOW;
  if (containerCreated) {
    promise = supervisor.runChecked(makeArgv("lxc", "delete", "--force", name))
        .then([this]() { containerCreated = false; });
  }
  return promise.then([this]() -> kj::Promise<void> {
    if (!imageImported) return kj::READY_NOW;
    return supervisor.runChecked(makeArgv("lxc", "image", "delete", name)).then([this]() {
      imageImported = false;
    });
  });
}

}  // namespace buildd
