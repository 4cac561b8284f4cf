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
#include <kj/test.h>
#include <kj/async-unix.h>
#include "supervisor.h"

namespace buildd {
namespace {

KJ_TEST("containerNameFor") {
  KJ_EXPECT(containerNameFor("12345-678") == "buildd-12345-678");
  KJ_EXPECT(containerNameFor("RECIPEBRANCHBUILD-1_2.3~4") ==
            "buildd-RECIPEBRANCHBUILD-1-2-3-4");

  auto longName = containerNameFor(kj::str(kj::repeat('x', 100)));
  KJ_EXPECT(longName.size() == 63);
  KJ_EXPECT(longName.startsWith("buildd-xxx"));
}

struct LxdFixture {
  LxdFixture()
      : io(kj::setupAsyncIo()),
        subprocesses(io.unixEventPort),
        log(io.provider->getTimer(), nullptr),
        supervisor(*io.lowLevelProvider, subprocesses, io.provider->getTimer(), log),
        sandbox("100-1", "/srv/build-100-1", supervisor) {}

  kj::AsyncIoContext io;
  SubprocessSet subprocesses;
  BuildLog log;
  ProcessSupervisor supervisor;
  LxdSandbox sandbox;
};

KJ_TEST("LxdSandbox::commandFor") {
  LxdFixture fixture;
  KJ_EXPECT(fixture.sandbox.getName() == "buildd-100-1");

  Command command;
  command.argv = makeArgv("apt-get", "-y", "update");
  command.env = makeArgv("DEBIAN_FRONTEND=noninteractive");
  command.cwd = kj::str("/home/buildd");

  fixture.sandbox.setQuirks(resolveQuirks("armhf", "lucid"));
  auto argv = fixture.sandbox.commandFor(command);
  KJ_EXPECT(formatCommand(argv) ==
      "lxc exec buildd-100-1 --cwd /home/buildd "
      "--env DEB_CFLAGS_APPEND=-Wno-error --env DEB_CXXFLAGS_APPEND=-Wno-error "
      "--env DEBIAN_FRONTEND=noninteractive -- linux32 --uname-2.6 apt-get -y update",
      formatCommand(argv));

  Command bare;
  bare.argv = makeArgv("true");
  fixture.sandbox.setQuirks(resolveQuirks("amd64", "noble"));
  KJ_EXPECT(formatCommand(fixture.sandbox.commandFor(bare)) ==
            "lxc exec buildd-100-1 -- linux64 true");
}

KJ_TEST("LxdSandbox teardown before create runs nothing") {
  LxdFixture fixture;
  fixture.sandbox.destroy().wait(fixture.io.waitScope);
  fixture.sandbox.destroy().wait(fixture.io.waitScope);
  KJ_EXPECT(fixture.log.getTail().size() == 0);
}

}  // namespace
}  // namespace buildd
