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

#ifndef BUILDD_DEBIAN_H_
#define BUILDD_DEBIAN_H_
// Helpers shared by the backends that build in Debian-family sandboxes.

#include "build.h"

namespace buildd {

struct ControlField {
  kj::String name;
  kj::String value;
  // Continuation lines are folded into a single line, joined by single spaces.
};

typedef kj::Array<ControlField> ControlParagraph;

kj::Array<ControlParagraph> parseControlFile(kj::StringPtr text);
// Parse deb822 text (debian/control, .dsc, .changes) into paragraphs. Comment lines are
// skipped. Throws on lines that are neither fields nor continuations.

kj::Maybe<kj::StringPtr> findField(kj::ArrayPtr<const ControlField> paragraph,
                                   kj::StringPtr name);
// Field names compare case-insensitively.

kj::Array<kj::String> parseChangesFiles(kj::StringPtr changesText);
// The file names listed in a .changes file's Files: field. Unlike parseControlFile() this keeps
// the field's lines apart, which is how they are delimited.

kj::String parseChangelogPackage(kj::StringPtr firstLine);
// The source package name from the first line of debian/changelog, e.g. "foo" from
// "foo (1.0-1) noble; urgency=medium".

kj::String parseChangelogVersion(kj::StringPtr firstLine);
// The version from the same line, without its epoch: "1.0-1" from "foo (2:1.0-1) noble; ...".
// This is the version as it appears in the names of the files the build produces.

kj::Maybe<kj::String> findUnmetDependency(kj::StringPtr aptOutput);
// Given apt-get's output, the first dependency it reported as unmet, with its version
// constraint if it gave one, e.g. "libfoo-dev (>= 2.0)".

kj::String makeCurrentlyBuilding(kj::StringPtr package, kj::StringPtr suite,
                                 kj::StringPtr component, kj::StringPtr purpose,
                                 bool debugSymbols = false);
// Contents of /CurrentlyBuilding, which in-sandbox tooling reads to learn what it is building.

kj::String makeDummyDsc(kj::StringPtr package, kj::ArrayPtr<const ControlField> source);
// A source package stanza that carries nothing but the build relations of `source` (the first
// paragraph of debian/control). `apt-get build-dep` on it installs the real package's
// build-dependencies.

struct AptSettings {
  kj::Array<kj::String> archives;
  // sources.list lines; if empty, the image's own sources are kept.

  kj::Maybe<kj::String> trustedKeys;
  // ASCII-armored keys for the archives above.

  kj::Maybe<kj::String> proxyUrl;
};

Phase makeUpdateChrootPhase(AptSettings&& settings);
Phase makeUpgradeChrootPhase();
// The first two phases of every Debian-family build. Both fail with CHROOT_FAILED.

kj::Array<kj::String> aptEnvironment();
// Environment for package manager commands, which must never prompt.

}  // namespace buildd

#endif  // BUILDD_DEBIAN_H_
