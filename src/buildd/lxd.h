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

#ifndef BUILDD_LXD_H_
#define BUILDD_LXD_H_

#include "sandbox.h"

namespace buildd {

class LxdSandbox final: public Sandbox {
  // A privileged LXD container created from an imported image, both named after the build.
  // Driven entirely through the `lxc` client, so the daemon's user must be in the lxd group.

public:
  LxdSandbox(kj::StringPtr buildId, kj::StringPtr buildPath, ProcessSupervisor& supervisor);
  ~LxdSandbox() noexcept(false);

  kj::StringPtr getName() { return name; }

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
  kj::String name;

  bool imageImported = false;
  bool containerCreated = false;
  bool running = false;
};

kj::String containerNameFor(kj::StringPtr buildId);
// LXD names allow only letters, digits and '-', and must start with a letter.

}  // namespace buildd

#endif  // BUILDD_LXD_H_
