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

#include "recipe.h"
#include <kj/test.h>
#include <kj/timer.h>
#include "config.h"
#include "build-log.h"
#include "fake-sandbox.h"

namespace buildd {
namespace {

Config makeConfig() {
  Config config;
  config.architectureTag = kj::str("amd64");
  config.buildHome = kj::str("/home/buildd");
  config.fileCache = kj::str("/home/buildd/filecache");
  config.gitProxyHelper = kj::str("/usr/lib/buildd/buildd-git-proxy");
  return config;
}

BuildDescriptor makeDescriptor(bool git, kj::Maybe<kj::StringPtr> proxy = nullptr) {
  kj::Vector<Parameter> params;
  auto add = [&](kj::StringPtr key, kj::StringPtr value) {
    params.add(Parameter { kj::str(key), kj::str(value) });
  };
  add("recipe_text", "# git-build-recipe format 0.4 deb-version {debupstream}-0~{revno}\n"
                     "lp:hello\n");
  add("suite", "jammy");
  add("ogrecomponent", "main");
  add("archive_purpose", "PPA");
  add("distroseries_name", "jammy");
  add("author_name", "Jane Doe");
  add("author_email", "jane@example.org");
  if (git) add("git", "true");
  KJ_IF_MAYBE(p, proxy) add("proxy_url", *p);

  return { kj::str("RECIPEBRANCHBUILD-1"), BuildKind::SOURCE_PACKAGE_RECIPE,
           kj::str("chroot.tar.gz"), nullptr, params.releaseAsArray() };
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

Phase& findPhase(kj::ArrayPtr<Phase> phases, kj::StringPtr name) {
  for (auto& phase: phases) {
    if (phase.name == name) return phase;
  }
  KJ_FAIL_ASSERT("no such phase", name);
  KJ_UNREACHABLE;
}

KJ_TEST("RecipeBackend phase list") {
  auto config = makeConfig();
  RecipeBackend backend(config, makeDescriptor(false));

  auto phases = backend.phases();
  auto names = KJ_MAP(phase, phases) -> kj::StringPtr { return phase.name; };
  KJ_EXPECT(kj::strArray(names, ",") ==
      "update-chroot,upgrade-chroot,install-tooling,query-release,materialize-tree,"
      "inspect-tree,read-changelog,read-control,install-build-deps,build-source-package");

  KJ_EXPECT(findPhase(phases, "install-tooling").exits.classify(100) == Outcome::CHROOT_FAILED);
  KJ_EXPECT(findPhase(phases, "materialize-tree").exits.classify(3) == Outcome::BUILD_FAILED);
  KJ_EXPECT(findPhase(phases, "install-build-deps").exits.classify(100) ==
            Outcome::DEPENDENCY_FAILED);
  KJ_EXPECT(findPhase(phases, "build-source-package").exits.classify(2) ==
            Outcome::BUILD_FAILED);

  KJ_EXPECT(backend.recipePhases().size() == 8);
}

KJ_TEST("RecipeBackend requires its parameters") {
  auto config = makeConfig();
  auto descriptor = makeDescriptor(false);
  descriptor.parameters = nullptr;
  KJ_EXPECT_THROW_MESSAGE("build parameter missing", RecipeBackend(config, descriptor).phases());
}

KJ_TEST("RecipeBackend full phase walk") {
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());
  BuildLog log(timer, nullptr);
  auto config = makeConfig();
  RecipeBackend backend(config, makeDescriptor(false));
  auto phases = backend.recipePhases();

  {
    auto command = findPhase(phases, "install-tooling").prepare();
    KJ_EXPECT(formatCommand(command.argv) ==
              "apt-get -y install bzr-builder lsb-release dpkg-dev apt-utils");
    KJ_ASSERT(command.files.size() == 1);
    KJ_EXPECT(command.files[0].targetPath == "/home/buildd/work/recipe");
  }

  auto& release = findPhase(phases, "query-release");
  KJ_EXPECT(is(feed(release, 0, "", log), Outcome::CHROOT_FAILED));
  KJ_EXPECT(feed(release, 0, "22.04\n", log) == nullptr);
  KJ_EXPECT(backend.getRelease() == "22.04");

  {
    auto command = findPhase(phases, "materialize-tree").prepare();
    KJ_EXPECT(formatCommand(command.argv) ==
        "bzr -Derror dailydeb --safe --no-build --manifest /home/buildd/work/manifest "
        "--distribution jammy --allow-fallback-to-native --append-version '~ubuntu22.04.1' "
        "/home/buildd/work/recipe /home/buildd/work/tree", formatCommand(command.argv));
    KJ_EXPECT(formatCommand(command.env) ==
              "DEBEMAIL=jane@example.org 'DEBFULLNAME=Jane Doe'");
    KJ_EXPECT(KJ_ASSERT_NONNULL(command.cwd) == "/home/buildd/work");
  }

  auto& inspect = findPhase(phases, "inspect-tree");
  KJ_EXPECT(is(feed(inspect, 0, "", log), Outcome::BUILD_FAILED));
  KJ_EXPECT(is(feed(inspect, 0, "hello-1.0\nother\n", log), Outcome::BUILD_FAILED));
  KJ_EXPECT(is(feed(inspect, 0, "..\n", log), Outcome::BUILD_FAILED));
  KJ_EXPECT(feed(inspect, 0, "hello-1.0\n", log) == nullptr);
  KJ_EXPECT(backend.getTreeName() == "hello-1.0");

  auto& changelog = findPhase(phases, "read-changelog");
  KJ_EXPECT(formatCommand(changelog.prepare().argv) ==
            "head -n 1 /home/buildd/work/tree/hello-1.0/debian/changelog");
  KJ_EXPECT(is(feed(changelog, 0, "garbage\n", log), Outcome::BUILD_FAILED));
  KJ_EXPECT(feed(changelog, 0, "hello (1.0-0~42~ubuntu22.04.1) jammy; urgency=low\n", log) ==
            nullptr);
  KJ_EXPECT(backend.getPackageName() == "hello");
  KJ_EXPECT(backend.getVersion() == "1.0-0~42~ubuntu22.04.1");
  KJ_EXPECT(backend.getChangesName() == "hello_1.0-0~42~ubuntu22.04.1_source.changes");

  auto& control = findPhase(phases, "read-control");
  KJ_EXPECT(is(feed(control, 0, "", log), Outcome::BUILD_FAILED));
  KJ_EXPECT(feed(control, 0, "Source: hello\nBuild-Depends: debhelper, libfoo-dev\n\n"
                             "Package: hello\nArchitecture: any\n", log) == nullptr);

  auto& deps = findPhase(phases, "install-build-deps");
  {
    auto command = deps.prepare();
    KJ_EXPECT(KJ_ASSERT_NONNULL(command.cwd) == "/home/buildd/work/apt");
    KJ_ASSERT(command.files.size() == 3);
    KJ_EXPECT(command.files[0].targetPath == "/CurrentlyBuilding");
    KJ_EXPECT(KJ_ASSERT_NONNULL(command.files[0].content) ==
              "Package: hello\nSuite: jammy\nComponent: main\nPurpose: PPA\n"
              "Build-Debug-Symbols: no\n");
    KJ_EXPECT(command.files[1].targetPath == "/home/buildd/work/apt/hello.dsc");
    KJ_EXPECT(findSubstring(KJ_ASSERT_NONNULL(command.files[1].content),
                            "Build-Depends: debhelper, libfoo-dev\n") != nullptr);
    KJ_EXPECT(KJ_ASSERT_NONNULL(command.files[2].content) ==
              "deb-src [trusted=yes] file:/home/buildd/work/apt ./\n");
    KJ_EXPECT(command.argv[2].endsWith("apt-get -y build-dep --only-source hello"));
  }

  KJ_EXPECT(backend.getMissingDependencies() == nullptr);
  KJ_EXPECT(feed(deps, 100,
      "The following packages have unmet dependencies:\n"
      " builddeps:hello : Depends: libfoo-dev (>= 3) but it is not going to be installed\n",
      log) == nullptr);
  auto missing = backend.getMissingDependencies();
  KJ_EXPECT(KJ_ASSERT_NONNULL(missing) == "libfoo-dev (>= 3)");

  {
    auto command = findPhase(phases, "build-source-package").prepare();
    KJ_EXPECT(formatCommand(command.argv) ==
              "dpkg-buildpackage -i -I.bzr -I.git -us -uc -S -sa");
    KJ_EXPECT(KJ_ASSERT_NONNULL(command.cwd) == "/home/buildd/work/tree/hello-1.0");
  }

  auto tail = log.getTail();
  KJ_EXPECT(findSubstring(kj::heapString(tail.asChars()),
                          "Expected exactly one directory in the built tree, found 2.")
            != nullptr);
}

KJ_TEST("RecipeBackend with git and a proxy") {
  auto config = makeConfig();
  config.proxyUrl = kj::str("http://config-proxy:3128");
  RecipeBackend backend(config, makeDescriptor(true, kj::StringPtr("http://build-proxy:8080")));
  auto phases = backend.recipePhases();

  {
    auto command = findPhase(phases, "install-tooling").prepare();
    KJ_EXPECT(command.argv[3] == "git-build-recipe");
    KJ_ASSERT(command.files.size() == 2);
    KJ_EXPECT(command.files[1].targetPath == RecipeBackend::GIT_PROXY_PATH);
    KJ_EXPECT(command.files[1].hostPath == "/usr/lib/buildd/buildd-git-proxy");
    KJ_EXPECT(command.files[1].mode == 0755);
  }
  {
    auto command = findPhase(phases, "materialize-tree").prepare();
    KJ_EXPECT(command.argv[0] == "git-build-recipe");
    KJ_EXPECT(command.argv[1] == "--safe");
    KJ_EXPECT(formatCommand(command.env) ==
        "DEBEMAIL=jane@example.org 'DEBFULLNAME=Jane Doe' "
        "http_proxy=http://build-proxy:8080 https_proxy=http://build-proxy:8080 "
        "GIT_PROXY_COMMAND=/usr/local/bin/buildd-git-proxy");
  }

  // The configured proxy applies when the build doesn't name one.
  RecipeBackend fallback(config, makeDescriptor(true));
  auto fallbackPhases = fallback.recipePhases();
  auto command = findPhase(fallbackPhases, "materialize-tree").prepare();
  KJ_EXPECT(findSubstring(formatCommand(command.env), "http_proxy=http://config-proxy:3128")
            != nullptr);
}

KJ_TEST("RecipeBackend collects the source package") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());
  BuildLog log(timer, nullptr);

  auto home = makeTemporaryDirectory("/tmp/buildd-recipe-test.");
  KJ_DEFER(recursivelyDelete(home));
  SandboxEvents events;
  FakeSandbox sandbox(home, events);
  sandbox.create("unused").wait(waitScope);

  auto config = makeConfig();
  RecipeBackend backend(config, makeDescriptor(false));
  auto phases = backend.recipePhases();
  KJ_ASSERT(feed(findPhase(phases, "inspect-tree"), 0, "hello-1.0\n", log) == nullptr);
  KJ_ASSERT(feed(findPhase(phases, "read-changelog"), 0,
                 "hello (1.0) jammy; urgency=low\n", log) == nullptr);

  auto work = kj::str(sandbox.getRoot(), "/home/buildd/work");
  recursivelyCreateParent(kj::str(work, "/tree/hello-1.0/debian/changelog"));
  writeFile(kj::str(work, "/tree/hello_1.0_source.changes"),
            "Source: hello\n"
            "Files:\n"
            " 0123 10 devel optional hello_1.0.dsc\n"
            " 4567 20 devel optional hello_1.0.tar.xz\n");
  writeFile(kj::str(work, "/tree/hello_1.0.dsc"), "dsc");
  writeFile(kj::str(work, "/tree/hello_1.0.tar.xz"), "tarball");
  writeFile(kj::str(work, "/manifest"), "# manifest\n");

  auto artifactDir = kj::str(home, "/out");
  recursivelyCreateParent(kj::str(artifactDir, "/x"));

  auto names = backend.collectArtifacts(sandbox, artifactDir).wait(waitScope);
  KJ_EXPECT(kj::strArray(names, " ") ==
            "hello_1.0_source.changes hello_1.0.dsc hello_1.0.tar.xz manifest");
  KJ_EXPECT(readAll(kj::str(artifactDir, "/hello_1.0.tar.xz")) == "tarball");
  KJ_EXPECT(readAll(kj::str(artifactDir, "/manifest")) == "# manifest\n");
}

KJ_TEST("standaloneExitCode") {
  KJ_EXPECT(standaloneExitCode("update-chroot") == 200);
  KJ_EXPECT(standaloneExitCode("install-tooling") == 200);
  KJ_EXPECT(standaloneExitCode("materialize-tree") == 201);
  KJ_EXPECT(standaloneExitCode("read-control") == 201);
  KJ_EXPECT(standaloneExitCode("install-build-deps") == 202);
  KJ_EXPECT(standaloneExitCode("build-source-package") == 203);
}

}  // namespace
}  // namespace buildd
