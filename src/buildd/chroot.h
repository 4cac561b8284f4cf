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

#ifndef BUILDD_CHROOT_H_
#define BUILDD_CHROOT_H_

#include "sandbox.h"

namespace buildd {

class ChrootSandbox final: public Sandbox {
  // A sandbox unpacked from a tarball into `<buildPath>/chroot-autobuild` and entered with
  // chroot(8) through sudo. Shares the host's kernel, network and process table.

public:
  static constexpr uint MAX_UNMOUNT_ATTEMPTS = 20;

  ChrootSandbox(kj::StringPtr buildPath, ProcessSupervisor& supervisor, kj::Timer& timer,
                kj::StringPtr selfPath);
  ~ChrootSandbox() noexcept(false);

  kj::StringPtr getRoot() { return root; }

  kj::Promise<void> create(kj::StringPtr imagePath) override;
  kj::Promise<void> start() override;
  kj::Array<kj::String> commandFor(const Command& command) override;
  kj::Promise<void> copyIn(kj::StringPtr hostPath, kj::StringPtr targetPath,
                           mode_t mode) override;
  kj::Promise<void> copyOut(kj::StringPtr targetPath, kj::StringPtr hostPath) override;
  kj::Promise<void> killProcesses() override;
  kj::Promise<void> stop() override;
  kj::Promise<void> remove() override;

private:
  ProcessSupervisor& supervisor;
  kj::Timer& timer;
  kj::String selfPath;
  kj::String root;

  kj::Promise<void> unmountAll(uint attempt);
};

kj::Array<kj::String> findMountsUnder(kj::StringPtr mountTable, kj::StringPtr root);
// Given the text of /proc/mounts, return the mount points at or below `root`, most recently
// mounted first, which is the order they must be unmounted in.

uint killProcessesRootedIn(kj::StringPtr root);
// SIGKILL every process whose root directory is `root` or lies below it. Returns how many were
// signaled. Needs root privileges to see and signal other users' processes.

void scanForProcesses(kj::StringPtr root);
// Repeat killProcessesRootedIn() until no process is left. Processes can fork while we scan, so
// a single pass is not enough.

}  // namespace buildd

#endif  // BUILDD_CHROOT_H_
