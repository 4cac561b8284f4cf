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

#include "debian.h"
#include <kj/test.h>

namespace buildd {
namespace {

KJ_TEST("parseControlFile") {
  auto paragraphs = parseControlFile(
      "# generated\n"
      "Source: hello\n"
      "Section: devel\n"
      "Build-Depends: debhelper-compat (= 13),\n"
      " libfoo-dev (>= 2.0),\n"
      "\tlibbar-dev\n"
      "Description: multi\n"
      " first\n"
      " .\n"
      " second\n"
      "\n"
      "\n"
      "Package: hello\r\n"
      "Architecture: any\r\n");

  KJ_ASSERT(paragraphs.size() == 2);
  auto& source = paragraphs[0];
  KJ_ASSERT(source.size() == 4);
  KJ_EXPECT(source[0].name == "Source");
  KJ_EXPECT(source[0].value == "hello");
  KJ_EXPECT(source[2].value == "debhelper-compat (= 13), libfoo-dev (>= 2.0), libbar-dev");
  KJ_EXPECT(source[3].value == "multi first second");

  KJ_EXPECT(paragraphs[1][1].value == "any");

  auto section = findField(source, "section");
  KJ_EXPECT(KJ_ASSERT_NONNULL(section) == "devel");
  KJ_EXPECT(findField(source, "Build-Conflicts") == nullptr);

  KJ_EXPECT(parseControlFile("").size() == 0);
  KJ_EXPECT_THROW_MESSAGE("continuation line outside a field", parseControlFile(" oops\n"));
  KJ_EXPECT_THROW_MESSAGE("malformed control file line", parseControlFile("no colon here\n"));
}

KJ_TEST("parseChangesFiles") {
  auto files = parseChangesFiles(
      "Format: 1.8\n"
      "Source: hello\n"
      "Checksums-Sha256:\n"
      " 0123 1234 hello_1.0.dsc\n"
      "Files:\n"
      " d41d8cd98f00b204e9800998ecf8427e 1024 devel optional hello_1.0.dsc\n"
      " 0cc175b9c0f1b6a831c399e269772661 20480 devel optional hello_1.0.tar.xz\n"
      "Changed-By: Someone <someone@example.org>\n");

  KJ_ASSERT(files.size() == 2);
  KJ_EXPECT(files[0] == "hello_1.0.dsc");
  KJ_EXPECT(files[1] == "hello_1.0.tar.xz");

  KJ_EXPECT_THROW_MESSAGE("unexpected file name",
      parseChangesFiles("Files:\n abc 1 devel optional ../../etc/passwd\n"));
}

KJ_TEST("changelog first line") {
  kj::StringPtr line = "hello (1:2.10-1~ubuntu22.04.1) jammy; urgency=medium";
  KJ_EXPECT(parseChangelogPackage(line) == "hello");
  KJ_EXPECT(parseChangelogVersion(line) == "2.10-1~ubuntu22.04.1");
  KJ_EXPECT(parseChangelogVersion("hello (1.0) unstable; urgency=low") == "1.0");

  KJ_EXPECT_THROW_MESSAGE("no version", parseChangelogVersion("hello unstable"));
  KJ_EXPECT_THROW_MESSAGE("invalid source package name", parseChangelogPackage("../x (1.0)"));
  KJ_EXPECT_THROW_MESSAGE("empty first line", parseChangelogPackage(""));
}

KJ_TEST("findUnmetDependency") {
  auto withVersion = findUnmetDependency(
      "Reading package lists...\n"
      "Some packages could not be installed.\n"
      "The following packages have unmet dependencies:\n"
      " builddeps:hello : Depends: libfoo-dev (>= 2.0) but it is not going to be installed\n"
      "E: Unable to correct problems, you have held broken packages.\n");
  KJ_EXPECT(KJ_ASSERT_NONNULL(withVersion) == "libfoo-dev (>= 2.0)");

  auto plain = findUnmetDependency(
      "The following packages have unmet dependencies:\n"
      " builddeps:hello : Depends: libbar-dev but it is not installable\n");
  KJ_EXPECT(KJ_ASSERT_NONNULL(plain) == "libbar-dev");

  KJ_EXPECT(findUnmetDependency("E: Unable to locate package hello\n") == nullptr);
  KJ_EXPECT(findUnmetDependency(
      "The following packages have unmet dependencies:\n"
      " builddeps:hello : PreDepends: dpkg (>= 9)\n") == nullptr);
}

KJ_TEST("dependency stub files") {
  KJ_EXPECT(makeCurrentlyBuilding("hello", "jammy-updates", "main", "PPA") ==
      "Package: hello\n"
      "Suite: jammy-updates\n"
      "Component: main\n"
      "Purpose: PPA\n"
      "Build-Debug-Symbols: no\n");

  auto control = parseControlFile(
      "Source: hello\n"
      "Build-Depends: debhelper (>= 9), libfoo-dev\n"
      "Build-Conflicts-Indep: oldtool\n"
      "Standards-Version: 4.6.0\n");
  KJ_EXPECT(makeDummyDsc("hello", control[0]) ==
      "Format: 1.0\n"
      "Source: hello\n"
      "Architecture: any\n"
      "Version: 99:0\n"
      "Maintainer: invalid@example.org\n"
      "Build-Depends: debhelper (>= 9), libfoo-dev\n"
      "Build-Conflicts-Indep: oldtool\n");
}

KJ_TEST("update-chroot phase") {
  AptSettings settings;
  settings.archives = makeArgv("deb http://archive.example/ubuntu jammy main",
                               "deb http://archive.example/ubuntu jammy-updates main");
  settings.proxyUrl = kj::str("http://proxy.example:3128/");

  auto phase = makeUpdateChrootPhase(kj::mv(settings));
  KJ_EXPECT(phase.name == "update-chroot");
  KJ_EXPECT(phase.exits.classify(100) == Outcome::CHROOT_FAILED);
  KJ_EXPECT(phase.policy == FailurePolicy::HARD);

  auto command = phase.prepare();
  KJ_EXPECT(formatCommand(command.argv) == "apt-get -y update");
  KJ_ASSERT(command.env.size() == 1);
  KJ_EXPECT(command.env[0] == "DEBIAN_FRONTEND=noninteractive");

  KJ_ASSERT(command.files.size() == 3);
  KJ_EXPECT(command.files[0].targetPath == "/etc/apt/sources.list");
  KJ_EXPECT(KJ_ASSERT_NONNULL(command.files[0].content) ==
      "deb http://archive.example/ubuntu jammy main\n"
      "deb http://archive.example/ubuntu jammy-updates main\n");
  KJ_EXPECT(command.files[1].targetPath == "/etc/apt/apt.conf.d/99buildd-retries");
  KJ_EXPECT(KJ_ASSERT_NONNULL(command.files[2].content) ==
      "Acquire::http::Proxy \"http://proxy.example:3128/\";\n");

  // Without overrides only the retry setting is staged.
  auto minimal = makeUpdateChrootPhase(AptSettings()).prepare();
  KJ_ASSERT(minimal.files.size() == 1);
  KJ_EXPECT(minimal.files[0].mode == 0644);
}

KJ_TEST("upgrade-chroot phase") {
  auto phase = makeUpgradeChrootPhase();
  auto command = phase.prepare();
  KJ_EXPECT(formatCommand(command.argv) ==
      "apt-get -y -uV --purge -o DPkg::Options::=--force-confold dist-upgrade");
  KJ_EXPECT(phase.exits.classify(1) == Outcome::CHROOT_FAILED);
}

}  // namespace
}  // namespace buildd
