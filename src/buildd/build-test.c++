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

#include "build.h"
#include <kj/test.h>
#include <kj/async-unix.h>
#include "supervisor.h"
#include "fake-sandbox.h"
#include "config.h"

namespace buildd {
namespace {

BuildDescriptor makeDescriptor() {
  auto params = kj::heapArrayBuilder<Parameter>(4);
  params.add(Parameter { kj::str("suite"), kj::str("jammy-updates") });
  params.add(Parameter { kj::str("git"), kj::str("yes") });
  params.add(Parameter { kj::str("archives"),
      kj::str("deb http://archive.example/ubuntu jammy main\n\n  deb-src http://x jammy main \n") });
  params.add(Parameter { kj::str("archive_private"), kj::str("false") });

  auto files = kj::heapArrayBuilder<FileMapEntry>(1);
  files.add(FileMapEntry { kj::str("recipe"), kj::str("0123abcd") });

  return { kj::str("RECIPEBRANCHBUILD-1"), BuildKind::SOURCE_PACKAGE_RECIPE,
           kj::str("chroot-ubuntu-jammy-amd64.tar.gz"), files.finish(), params.finish() };
}

KJ_TEST("build kind names") {
  auto parse = [](kj::StringPtr name) {
    auto kind = parseBuildKind(name);
    return KJ_ASSERT_NONNULL(kind, name);
  };

  for (auto kind: allBuildKinds()) {
    KJ_EXPECT(parse(buildKindName(kind)) == kind);
  }
  KJ_EXPECT(parse("sourcepackagerecipe") == BuildKind::SOURCE_PACKAGE_RECIPE);
  KJ_EXPECT(parse("recipe") == BuildKind::SOURCE_PACKAGE_RECIPE);
  KJ_EXPECT(parseBuildKind("debian") == nullptr);
  KJ_EXPECT(allBuildKinds().size() == 6);

  KJ_EXPECT(outcomeName(Outcome::DEPENDENCY_FAILED) == "DEPENDENCY_FAILED");
  KJ_EXPECT(outcomeName(Outcome::BUILDER_FAILED) == "BUILDER_FAILED");
}

KJ_TEST("ExitMapping") {
  auto mapping = ExitMapping(Outcome::BUILD_FAILED)
      .on(2, Outcome::DEPENDENCY_FAILED)
      .on(100, Outcome::CHROOT_FAILED);

  KJ_EXPECT(mapping.classify(0) == Outcome::SUCCESS);
  KJ_EXPECT(mapping.classify(1) == Outcome::BUILD_FAILED);
  KJ_EXPECT(mapping.classify(2) == Outcome::DEPENDENCY_FAILED);
  KJ_EXPECT(mapping.classify(100) == Outcome::CHROOT_FAILED);
  KJ_EXPECT(mapping.classify(137) == Outcome::BUILD_FAILED);
  KJ_EXPECT(mapping.classify(255) == Outcome::BUILD_FAILED);

  // Success can be overridden too, e.g. for tools that exit 0 on a soft error.
  auto strict = ExitMapping(Outcome::CHROOT_FAILED).on(0, Outcome::BUILD_FAILED);
  KJ_EXPECT(strict.classify(0) == Outcome::BUILD_FAILED);
}

KJ_TEST("BuildDescriptor parameters") {
  auto descriptor = makeDescriptor();

  auto suite = descriptor.findParameter("suite");
  KJ_EXPECT(KJ_ASSERT_NONNULL(suite) == "jammy-updates");
  KJ_EXPECT(descriptor.findParameter("missing") == nullptr);
  KJ_EXPECT(descriptor.getParameter("missing", "fallback") == "fallback");
  KJ_EXPECT(descriptor.requireParameter("suite") == "jammy-updates");
  KJ_EXPECT_THROW_MESSAGE("build parameter missing", descriptor.requireParameter("missing"));

  KJ_EXPECT(descriptor.getFlag("git"));
  KJ_EXPECT(!descriptor.getFlag("archive_private"));
  KJ_EXPECT(!descriptor.getFlag("missing"));

  auto archives = descriptor.getList("archives");
  KJ_ASSERT(archives.size() == 2);
  KJ_EXPECT(archives[0] == "deb http://archive.example/ubuntu jammy main");
  KJ_EXPECT(archives[1] == "deb-src http://x jammy main");
  KJ_EXPECT(descriptor.getList("missing").size() == 0);
}

KJ_TEST("isSafeName") {
  KJ_EXPECT(isSafeName("hello_1.0~ubuntu22.04.1_source.changes"));
  KJ_EXPECT(isSafeName("libfoo+bar-1"));
  KJ_EXPECT(!isSafeName(""));
  KJ_EXPECT(!isSafeName(".hidden"));
  KJ_EXPECT(!isSafeName(".."));
  KJ_EXPECT(!isSafeName("a/b"));
  KJ_EXPECT(!isSafeName("a b"));
  KJ_EXPECT(!isSafeName("a\nb"));
}

KJ_TEST("validateDescriptor") {
  KJ_EXPECT(validateDescriptor(makeDescriptor()) == nullptr);

  {
    auto descriptor = makeDescriptor();
    descriptor.buildId = kj::str("../escape");
    KJ_EXPECT(validateDescriptor(descriptor) != nullptr);
  }
  {
    auto descriptor = makeDescriptor();
    descriptor.baseImage = kj::str("/etc/passwd");
    KJ_EXPECT(validateDescriptor(descriptor) != nullptr);
  }
  {
    auto descriptor = makeDescriptor();
    descriptor.files[0].name = kj::str("buildlog");
    KJ_EXPECT(validateDescriptor(descriptor) != nullptr);
  }
  {
    auto descriptor = makeDescriptor();
    auto files = kj::heapArrayBuilder<FileMapEntry>(2);
    files.add(FileMapEntry { kj::str("recipe"), kj::str("a") });
    files.add(FileMapEntry { kj::str("recipe"), kj::str("b") });
    descriptor.files = files.finish();
    KJ_EXPECT(validateDescriptor(descriptor) != nullptr);
  }
  {
    auto descriptor = makeDescriptor();
    descriptor.parameters[1].key = kj::str("suite");
    KJ_EXPECT(validateDescriptor(descriptor) != nullptr);
  }
}

KJ_TEST("executePhase stages files and classifies the result") {
  auto io = kj::setupAsyncIo();
  SubprocessSet subprocesses(io.unixEventPort);
  BuildLog log(io.provider->getTimer(), nullptr);
  ProcessSupervisor supervisor(*io.lowLevelProvider, subprocesses, io.provider->getTimer(), log);

  auto home = makeTemporaryDirectory("/tmp/buildd-build-test.");
  KJ_DEFER(recursivelyDelete(home));
  SandboxEvents events;
  FakeSandbox sandbox(home, events);
  sandbox.create("unused").wait(io.waitScope);

  kj::Maybe<kj::String> seen;
  Phase phase("check", ExitMapping(Outcome::BUILD_FAILED).on(4, Outcome::DEPENDENCY_FAILED),
      []() {
    Command command;
    command.argv = makeArgv("sh", "-c", "cat etc/greeting; ls -l etc/greeting | cut -c1-10; "
                                        "echo \"$WHO\"; exit 4");
    command.env = makeArgv("WHO=builder");
    command.files = kj::heapArray<StagedFile>(1);
    command.files[0] = stageContent("/etc/greeting", "hello\n", 0640);
    return command;
  });
  phase.captureOutput = true;
  phase.onResult = ResultHandler(
      [&seen](int exitCode, kj::StringPtr output, BuildLog& log) -> kj::Maybe<Outcome> {
    seen = kj::heapString(output);
    return nullptr;
  });

  auto result = executePhase(phase, sandbox, supervisor).wait(io.waitScope);
  KJ_EXPECT(result.exitCode == 4);
  KJ_EXPECT(result.outcome == Outcome::DEPENDENCY_FAILED);
  KJ_EXPECT(KJ_ASSERT_NONNULL(seen) == "hello\n-rw-r-----\nbuilder\n");
  KJ_EXPECT(events.contains("copyIn /etc/greeting"));

  // The staging copy next to the sandbox is gone.
  for (auto& name: listDirectory(home)) {
    KJ_EXPECT(!name.startsWith(".staging"), name);
  }

  // A result handler can veto a successful run.
  Phase vetoed("veto", ExitMapping(Outcome::BUILD_FAILED), []() {
    Command command;
    command.argv = makeArgv("true");
    return command;
  });
  vetoed.onResult = ResultHandler(
      [](int exitCode, kj::StringPtr output, BuildLog& log) -> kj::Maybe<Outcome> {
    log.write("Nothing usable was produced.\n");
    return Outcome::BUILD_FAILED;
  });
  auto vetoResult = executePhase(vetoed, sandbox, supervisor).wait(io.waitScope);
  KJ_EXPECT(vetoResult.exitCode == 0);
  KJ_EXPECT(vetoResult.outcome == Outcome::BUILD_FAILED);

  // Host phases run directly, in the command's working directory.
  Phase host("host", ExitMapping(Outcome::CHROOT_FAILED), []() {
    Command command;
    command.argv = makeArgv("sh", "-c", "test \"$PWD\" = / && test \"$X\" = 1");
    command.env = makeArgv("X=1");
    command.cwd = kj::str("/");
    return command;
  });
  host.location = PhaseLocation::HOST;
  auto hostResult = executePhase(host, sandbox, supervisor).wait(io.waitScope);
  KJ_EXPECT(hostResult.outcome == Outcome::SUCCESS);
}

KJ_TEST("StandardBackendFactory build kinds") {
  Config config;
  config.architectureTag = kj::str("amd64");
  config.buildHome = kj::str("/home/buildd");
  StandardBackendFactory factory(config);

  KJ_EXPECT(factory.isSupported(BuildKind::SOURCE_PACKAGE_RECIPE));
  KJ_EXPECT(factory.isSupported(BuildKind::BINARY_PACKAGE));
  KJ_EXPECT(!factory.isSupported(BuildKind::SNAP));

  config.sandbox = SandboxType::LXD;
  KJ_EXPECT(factory.isSupported(BuildKind::SOURCE_PACKAGE_RECIPE));
  KJ_EXPECT(!factory.isSupported(BuildKind::BINARY_PACKAGE));
}

}  // namespace
}  // namespace buildd
