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

#include "sandbox.h"
#include <kj/test.h>
#include "fake-sandbox.h"

namespace buildd {
namespace {

KJ_TEST("resolveQuirks personalities") {
  auto i386 = resolveQuirks("i386", "jammy");
  KJ_ASSERT(i386.argvPrefix.size() == 1);
  KJ_EXPECT(i386.argvPrefix[0] == "linux32");
  KJ_EXPECT(i386.env.size() == 0);

  auto armhf = resolveQuirks("armhf", "focal");
  KJ_EXPECT(armhf.argvPrefix[0] == "linux32");

  for (auto arch: {"amd64", "arm64", "ppc64el", "riscv64", "s390x", "x32"}) {
    auto quirks = resolveQuirks(arch, "noble");
    KJ_ASSERT(quirks.argvPrefix.size() == 1, arch);
    KJ_EXPECT(quirks.argvPrefix[0] == "linux64", arch);
  }

  KJ_EXPECT(isKnownArchitecture("amd64"));
  KJ_EXPECT(isKnownArchitecture("lpia"));
  KJ_EXPECT(!isKnownArchitecture("vax"));
  KJ_EXPECT_THROW_MESSAGE("unknown architecture", resolveQuirks("vax", "jammy"));
}

KJ_TEST("resolveQuirks historical series") {
  auto quirks = resolveQuirks("i386", "precise");
  KJ_ASSERT(quirks.argvPrefix.size() == 2);
  KJ_EXPECT(quirks.argvPrefix[0] == "linux32");
  KJ_EXPECT(quirks.argvPrefix[1] == "--uname-2.6");
  KJ_ASSERT(quirks.env.size() == 2);
  KJ_EXPECT(quirks.env[0] == "DEB_CFLAGS_APPEND=-Wno-error");
  KJ_EXPECT(quirks.env[1] == "DEB_CXXFLAGS_APPEND=-Wno-error");

  KJ_EXPECT(resolveQuirks("amd64", "hardy").argvPrefix.size() == 2);
  KJ_EXPECT(resolveQuirks("amd64", "trusty").argvPrefix.size() == 1);
  KJ_EXPECT(resolveQuirks("amd64", "trusty").env.size() == 0);
}

KJ_TEST("formatMode") {
  KJ_EXPECT(formatMode(0644) == "0644");
  KJ_EXPECT(formatMode(0755) == "0755");
  KJ_EXPECT(formatMode(04755) == "4755");
  KJ_EXPECT(formatMode(0) == "0000");
}

KJ_TEST("Sandbox::destroy attempts every step") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  auto home = makeTemporaryDirectory("/tmp/buildd-sandbox-test.");
  KJ_DEFER(recursivelyDelete(home));

  SandboxEvents events;
  FakeSandbox sandbox(home, events);
  sandbox.create("unused").wait(waitScope);

  events.failRemove = true;
  events.calls.clear();
  KJ_EXPECT_THROW_MESSAGE("could not be removed", sandbox.destroy().wait(waitScope));
  KJ_ASSERT(events.calls.size() == 3);
  KJ_EXPECT(events.calls[0] == "killProcesses");
  KJ_EXPECT(events.calls[1] == "stop");
  KJ_EXPECT(events.calls[2] == "remove");

  // Repeating teardown once the failure clears is harmless.
  events.failRemove = false;
  sandbox.destroy().wait(waitScope);
  KJ_EXPECT(!pathExists(sandbox.getRoot()));
  sandbox.destroy().wait(waitScope);
}

}  // namespace
}  // namespace buildd
