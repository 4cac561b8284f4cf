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

#include "binarypackage.h"
#include <kj/test.h>
#include <kj/timer.h>
#include "config.h"
#include "build-log.h"
#include "fake-sandbox.h"

namespace buildd {
namespace {

Config makeConfig(kj::StringPtr home) {
  Config config;
  config.architectureTag = kj::str("amd64");
  config.buildHome = kj::str(home);
  config.fileCache = kj::str(home, "/filecache");
  return config;
}

BuildDescriptor makeDescriptor(bool archIndep = false) {
  kj::Vector<Parameter> params;
  auto add = [&](kj::StringPtr key, kj::StringPtr value) {
    params.add(Parameter { kj::str(key), kj::str(value) });
  };
  add("suite", "jammy-proposed");
  add("ogrecomponent", "universe");
  add("archive_purpose", "PRIMARY");
  add("build_debug_symbols", "true");
  if (archIndep) add("arch_indep", "true");

  auto files = kj::heapArrayBuilder<FileMapEntry>(2);
  files.add(FileMapEntry { kj::str("hello_2.10-2.dsc"), kj::str("0123abcd") });
  files.add(FileMapEntry { kj::str("hello_2.10.orig.tar.gz"), kj::str("4567ef01") });

  return { kj::str("PACKAGEBUILD-7"), BuildKind::BINARY_PACKAGE, kj::str("chroot.tar.gz"),
           files.finish(), params.releaseAsArray() };
}

kj::Maybe<Outcome> feed(Phase& phase, int exitCode, kj::StringPtr output, BuildLog& log) {
  KJ_ASSERT(phase.captureOutput, phase.name);
  auto& handler = KJ_ASSERT_NONNULL(phase.onResult, phase.name);
  return handler(exitCode, output, log);
}

bool is(kj::Maybe<Outcome> result, Outcome expected) {
  KJ_IF_MAYBE(outcome, result) {
    return *outcome == expected;
  } else {
    return false;
  }
}

bool is(kj::Maybe<kj::String> dep, kj::StringPtr expected) {
  KJ_IF_MAYBE(d, dep) {
    return *d == expected;
  } else {
    return false;
  }
}

KJ_TEST("BinaryPackageBackend phase list") {
  auto config = makeConfig("/home/buildd");
  BinaryPackageBackend backend(config, makeDescriptor());

  auto phases = backend.phases();
  auto names = KJ_MAP(phase, phases) -> kj::StringPtr { return phase.name; };
  KJ_EXPECT(kj::strArray(names, ",") == "update-chroot,upgrade-chroot,sbuild");
  KJ_EXPECT(phases[2].location == PhaseLocation::HOST);
  KJ_EXPECT(phases[0].exits.classify(100) == Outcome::CHROOT_FAILED);

  KJ_EXPECT(backend.getDscName() == "hello_2.10-2.dsc");
  KJ_EXPECT(backend.getChangesName() == "hello_2.10-2_amd64.changes");
}

KJ_TEST("BinaryPackageBackend requires a source package") {
  auto config = makeConfig("/home/buildd");

  auto descriptor = makeDescriptor();
  descriptor.files = nullptr;
  KJ_EXPECT_THROW_MESSAGE("no .dsc", BinaryPackageBackend(config, descriptor).phases());

  descriptor = makeDescriptor();
  descriptor.parameters = nullptr;
  KJ_EXPECT_THROW_MESSAGE("build parameter missing",
                          BinaryPackageBackend(config, descriptor).phases());
}

KJ_TEST("BinaryPackageBackend runs sbuild in the build directory") {
  auto config = makeConfig("/home/buildd");
  config.sbuildPath = kj::str("/usr/bin/sbuild-package");

  {
    BinaryPackageBackend backend(config, makeDescriptor());
    auto command = backend.sbuild().prepare();
    KJ_EXPECT(formatCommand(command.argv) ==
        "/usr/bin/sbuild-package PACKAGEBUILD-7 amd64 jammy-proposed "
        "-c chroot:build-PACKAGEBUILD-7 --arch=amd64 --dist=jammy-proposed --purge=never "
        "--nolog hello_2.10-2.dsc", formatCommand(command.argv));
    KJ_EXPECT(KJ_ASSERT_NONNULL(command.cwd) == "/home/buildd/build-PACKAGEBUILD-7");

    KJ_ASSERT(command.files.size() == 1);
    KJ_EXPECT(command.files[0].targetPath == "/CurrentlyBuilding");
    KJ_EXPECT(KJ_ASSERT_NONNULL(command.files[0].content) ==
        "Package: hello\n"
        "Suite: jammy-proposed\n"
        "Component: universe\n"
        "Purpose: PRIMARY\n"
        "Build-Debug-Symbols: yes\n");
  }

  {
    auto descriptor = makeDescriptor(true);
    descriptor.parameters[0].value = kj::str("noble");
    BinaryPackageBackend backend(config, descriptor);
    auto command = backend.sbuild().prepare();
    KJ_EXPECT(formatCommand(command.argv) ==
        "/usr/bin/sbuild-package PACKAGEBUILD-7 amd64 noble "
        "-c chroot:build-PACKAGEBUILD-7 --arch=amd64 --dist=noble --purge=never "
        "--nolog -A hello_2.10-2.dsc", formatCommand(command.argv));
  }
}

KJ_TEST("classifySbuildExit") {
  KJ_EXPECT(classifySbuildExit(0, "").outcome == Outcome::SUCCESS);
  KJ_EXPECT(classifySbuildExit(1, "").outcome == Outcome::BUILD_FAILED);
  KJ_EXPECT(classifySbuildExit(2, "").outcome == Outcome::BUILD_FAILED);
  KJ_EXPECT(classifySbuildExit(4, "").outcome == Outcome::BUILDER_FAILED);
  KJ_EXPECT(classifySbuildExit(137, "").outcome == Outcome::BUILDER_FAILED);

  // A give-back without a visible reason is a plain failure.
  KJ_EXPECT(classifySbuildExit(3, "something went wrong\n").outcome == Outcome::BUILD_FAILED);

  {
    auto verdict = classifySbuildExit(3,
        "Reading package lists...\n"
        "E: There are problems and -y was used without --force-yes\n");
    KJ_EXPECT(verdict.outcome == Outcome::CHROOT_FAILED);
    KJ_EXPECT(verdict.missingDependency == nullptr);
  }

  {
    auto verdict = classifySbuildExit(3,
        "After installing, the following source dependencies are still unsatisfied:\n"
        "libfoo-dev(inst 1.0-1 ! >= wanted 2.0~beta1)\n");
    KJ_EXPECT(verdict.outcome == Outcome::DEPENDENCY_FAILED);
    KJ_EXPECT(is(kj::mv(verdict.missingDependency), "libfoo-dev (>= 2.0~beta1)"));
  }

  // A dependency wait only counts if it shows up before the toolchain listing.
  KJ_EXPECT(classifySbuildExit(3,
      "Toolchain package versions: gcc-12_12.3.0-1ubuntu1\n"
      "E: Unable to locate package libfoo-dev\n").outcome == Outcome::BUILD_FAILED);
}

KJ_TEST("findDependencyWait") {
  KJ_EXPECT(is(findDependencyWait("libbar1(inst 1.0 ! >> wanted 1:1.2+dfsg-3)\n"),
               "libbar1 (>> 1:1.2+dfsg-3)"));
  KJ_EXPECT(is(findDependencyWait("  python3-baz(inst 3.1 ! = wanted 3.2)\n"),
               "python3-baz (>= 3.2)"));

  // A strictly-newer wait wins over one that appears first.
  KJ_EXPECT(is(findDependencyWait("a(inst 1 ! >= wanted 2)\nb(inst 1 ! >> wanted 2)\n"),
               "b (>> 2)"));

  KJ_EXPECT(is(findDependencyWait(
      "E: Couldn't find package libold-dev\n"
      "E: Couldn't find package libnew-dev\n"), "libnew-dev"));
  KJ_EXPECT(is(findDependencyWait(
      "E: Package 'libgone-dev' has no installation candidate\n"), "libgone-dev"));
  KJ_EXPECT(is(findDependencyWait(
      "E: Package libgone2 has no installation candidate\n"), "libgone2"));
  KJ_EXPECT(is(findDependencyWait(
      "E: Unable to locate package libmissing-dev\n"), "libmissing-dev"));

  KJ_EXPECT(findDependencyWait("") == nullptr);
  KJ_EXPECT(findDependencyWait("E: Package 'x' is broken\n") == nullptr);
  KJ_EXPECT(findDependencyWait("(inst 1.0 ! >= wanted 2.0)\n") == nullptr);
}

KJ_TEST("BinaryPackageBackend collects the changes file and what it lists") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());
  BuildLog log(timer, nullptr);

  auto home = makeTemporaryDirectory("/tmp/buildd-binarypackage-test.");
  KJ_DEFER(recursivelyDelete(home));
  auto config = makeConfig(home);
  auto buildPath = config.getBuildPath("PACKAGEBUILD-7");
  recursivelyCreateParent(kj::str(buildPath, "/x"));

  SandboxEvents events;
  FakeSandbox sandbox(buildPath, events);
  BinaryPackageBackend backend(config, makeDescriptor());
  auto sbuild = backend.sbuild();

  // Nothing built.
  KJ_EXPECT(is(feed(sbuild, 0, "", log), Outcome::BUILD_FAILED));

  writeFile(kj::str(buildPath, "/hello_2.10-2_amd64.changes"),
            "Format: 1.8\n"
            "Source: hello\n"
            "Files:\n"
            " 89ab 51200 devel optional hello_2.10-2_amd64.deb\n"
            " cdef 2048 debug optional hello-dbgsym_2.10-2_amd64.ddeb\n"
            "Checksums-Sha256:\n"
            " 0000 51200 hello_2.10-2_amd64.deb\n");
  writeFile(kj::str(buildPath, "/hello_2.10-2_amd64.deb"), "deb");

  // The changes file lists a package that isn't there.
  KJ_EXPECT(is(feed(sbuild, 0, "", log), Outcome::BUILD_FAILED));

  writeFile(kj::str(buildPath, "/hello-dbgsym_2.10-2_amd64.ddeb"), "ddeb");
  KJ_EXPECT(feed(sbuild, 0, "", log) == nullptr);

  auto names = backend.collectArtifacts(sandbox, buildPath).wait(waitScope);
  KJ_EXPECT(kj::strArray(names, " ") ==
      "hello_2.10-2_amd64.changes hello_2.10-2_amd64.deb hello-dbgsym_2.10-2_amd64.ddeb");
  KJ_EXPECT(events.calls.size() == 0);
}

KJ_TEST("BinaryPackageBackend reports a dependency wait") {
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());
  BuildLog log(timer, nullptr);
  auto config = makeConfig("/home/buildd");
  BinaryPackageBackend backend(config, makeDescriptor());
  auto sbuild = backend.sbuild();

  KJ_EXPECT(is(feed(sbuild, 1, "dh_auto_build: error\n", log), Outcome::BUILD_FAILED));
  KJ_EXPECT(backend.getMissingDependencies() == nullptr);

  KJ_EXPECT(is(feed(sbuild, 3, "E: Unable to locate package libfoo-dev\n", log),
               Outcome::DEPENDENCY_FAILED));
  KJ_EXPECT(KJ_ASSERT_NONNULL(backend.getMissingDependencies()) == "libfoo-dev");

  KJ_EXPECT(is(feed(sbuild, 3, "E: There are problems and -y was used without --force-yes\n",
                    log), Outcome::CHROOT_FAILED));
}

}  // namespace
}  // namespace buildd
