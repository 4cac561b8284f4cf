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
#include <string.h>
#include <strings.h>

namespace buildd {

kj::Array<ControlParagraph> parseControlFile(kj::StringPtr text) {
  kj::Vector<ControlParagraph> paragraphs;
  kj::Vector<ControlField> fields;
  kj::Vector<kj::String> continuation;

  auto finishField = [&]() {
    if (continuation.size() > 0) {
      KJ_ASSERT(fields.size() > 0);
      auto& field = fields.back();
      kj::Vector<kj::StringPtr> parts;
      if (field.value.size() > 0) parts.add(field.value);
      for (auto& part: continuation) {
        parts.add(part);
      }
      field.value = kj::strArray(parts, " ");
      continuation.clear();
    }
  };
  auto finishParagraph = [&]() {
    finishField();
    if (fields.size() > 0) {
      paragraphs.add(fields.releaseAsArray());
    }
  };

  for (auto line: split(text, '\n')) {
    if (line.size() > 0 && line[line.size() - 1] == '\r') {
      line = line.slice(0, line.size() - 1);
    }

    if (trimArray(line).size() == 0) {
      finishParagraph();
    } else if (line[0] == '#') {
      continue;
    } else if (line[0] == ' ' || line[0] == '\t') {
      KJ_REQUIRE(fields.size() > 0, "control file continuation line outside a field",
                 kj::str(line));
      auto part = trim(line);
      // A lone "." stands for an empty line in multi-line fields.
      if (part != ".") continuation.add(kj::mv(part));
    } else {
      finishField();
      auto rest = line;
      KJ_IF_MAYBE(name, splitFirst(rest, ':')) {
        fields.add(ControlField { trim(*name), trim(rest) });
      } else {
        KJ_FAIL_REQUIRE("malformed control file line", kj::str(line));
      }
    }
  }
  finishParagraph();

  return paragraphs.releaseAsArray();
}

kj::Maybe<kj::StringPtr> findField(kj::ArrayPtr<const ControlField> paragraph,
                                   kj::StringPtr name) {
  for (auto& field: paragraph) {
    if (strcasecmp(field.name.cStr(), name.cStr()) == 0) {
      return kj::StringPtr(field.value);
    }
  }
  return nullptr;
}

kj::Array<kj::String> parseChangesFiles(kj::StringPtr changesText) {
  kj::Vector<kj::String> files;
  bool inFiles = false;

  for (auto line: split(changesText, '\n')) {
    if (line.size() > 0 && (line[0] == ' ' || line[0] == '\t')) {
      if (!inFiles) continue;
      // md5sum size section priority filename
      auto fields = splitSpace(line);
      if (fields.size() == 0) continue;
      auto name = kj::str(fields.back());
      KJ_REQUIRE(isSafeName(name), "unexpected file name in .changes", name);
      files.add(kj::mv(name));
    } else {
      auto rest = line;
      KJ_IF_MAYBE(fieldName, splitFirst(rest, ':')) {
        inFiles = strncasecmp(fieldName->begin(), "Files", fieldName->size()) == 0 &&
                  fieldName->size() == 5;
      } else {
        inFiles = false;
      }
    }
  }

  return files.releaseAsArray();
}

kj::String parseChangelogPackage(kj::StringPtr firstLine) {
  auto fields = splitSpace(firstLine);
  KJ_REQUIRE(fields.size() > 0, "debian/changelog has an empty first line");
  auto name = kj::str(fields[0]);
  KJ_REQUIRE(isSafeName(name), "invalid source package name in debian/changelog", name);
  return name;
}

kj::String parseChangelogVersion(kj::StringPtr firstLine) {
  auto open = KJ_REQUIRE_NONNULL(firstLine.findFirst('('),
                                 "no version in debian/changelog", firstLine);
  auto rest = firstLine.slice(open + 1);
  auto close = KJ_REQUIRE_NONNULL(rest.findFirst(')'),
                                  "no version in debian/changelog", firstLine);
  auto version = kj::str(rest.slice(0, close));
  KJ_IF_MAYBE(colon, version.findFirst(':')) {
    version = kj::str(version.slice(*colon + 1));
  }
  KJ_REQUIRE(isSafeName(version), "invalid version in debian/changelog", firstLine);
  return version;
}

kj::Maybe<kj::String> findUnmetDependency(kj::StringPtr aptOutput) {
  static constexpr const char HEADER[] = "The following packages have unmet dependencies:\n";
  static constexpr const char DEPENDS[] = ": Depends: ";

  KJ_IF_MAYBE(headerPos, findSubstring(aptOutput, HEADER)) {
    auto rest = aptOutput.slice(*headerPos + strlen(HEADER));
    kj::ArrayPtr<const char> line = rest;
    KJ_IF_MAYBE(eol, rest.findFirst('\n')) {
      line = rest.slice(0, *eol);
    }
    auto lineText = kj::str(line);

    KJ_IF_MAYBE(dependsPos, findSubstring(lineText, DEPENDS)) {
      auto dep = lineText.slice(*dependsPos + strlen(DEPENDS));
      size_t end = 0;
      while (end < dep.size() && dep[end] != ' ') ++end;

      // Include a following version constraint, e.g. " (>= 2.0)".
      if (end + 1 < dep.size() && dep[end] == ' ' && dep[end + 1] == '(') {
        KJ_IF_MAYBE(close, dep.slice(end).findFirst(')')) {
          end += *close + 1;
        }
      }

      if (end > 0) return kj::heapString(dep.begin(), end);
    }
  }

  return nullptr;
}

kj::String makeCurrentlyBuilding(kj::StringPtr package, kj::StringPtr suite,
                                 kj::StringPtr component, kj::StringPtr purpose,
                                 bool debugSymbols) {
  return kj::str(
      "Package: ", package, "\n"
      "Suite: ", suite, "\n"
      "Component: ", component, "\n"
      "Purpose: ", purpose, "\n"
      "Build-Debug-Symbols: ", debugSymbols ? "yes" : "no", "\n");
}

kj::String makeDummyDsc(kj::StringPtr package, kj::ArrayPtr<const ControlField> source) {
  static const char* const RELATIONS[] = {
    "Build-Depends", "Build-Depends-Indep", "Build-Conflicts", "Build-Conflicts-Indep"
  };

  kj::Vector<kj::String> lines;
  lines.add(kj::str("Format: 1.0"));
  lines.add(kj::str("Source: ", package));
  lines.add(kj::str("Architecture: any"));
  lines.add(kj::str("Version: 99:0"));
  lines.add(kj::str("Maintainer: invalid@example.org"));
  for (auto field: RELATIONS) {
    KJ_IF_MAYBE(value, findField(source, field)) {
      lines.add(kj::str(field, ": ", *value));
    }
  }
  lines.add(kj::str(""));
  return kj::strArray(lines, "\n");
}

kj::Array<kj::String> aptEnvironment() {
  return kj::arr(kj::str("DEBIAN_FRONTEND=noninteractive"));
}

// =======================================================================================

Phase makeUpdateChrootPhase(AptSettings&& settings) {
  auto prepare = [KJ_MVCAP(settings)]() {
    kj::Vector<StagedFile> files;
    if (settings.archives.size() > 0) {
      auto sources = kj::str(kj::strArray(settings.archives, "\n"), "\n");
      files.add(stageContent("/etc/apt/sources.list", sources));
    }
    KJ_IF_MAYBE(keys, settings.trustedKeys) {
      files.add(stageContent("/etc/apt/trusted.gpg.d/buildd.asc", *keys));
    }
    files.add(stageContent("/etc/apt/apt.conf.d/99buildd-retries",
                           "Acquire::Retries \"3\";\n"));
    KJ_IF_MAYBE(proxy, settings.proxyUrl) {
      files.add(stageContent("/etc/apt/apt.conf.d/99buildd-proxy",
                             kj::str("Acquire::http::Proxy \"", *proxy, "\";\n")));
    }

    return Command {
      makeArgv("apt-get", "-y", "update"),
      aptEnvironment(),
      nullptr,
      files.releaseAsArray()
    };
  };

  return Phase("update-chroot", ExitMapping(Outcome::CHROOT_FAILED), kj::mv(prepare));
}

Phase makeUpgradeChrootPhase() {
  return Phase("upgrade-chroot", ExitMapping(Outcome::CHROOT_FAILED), []() {
    return Command {
      makeArgv("apt-get", "-y", "-uV", "--purge",
               "-o", "DPkg::Options::=--force-confold", "dist-upgrade"),
      aptEnvironment(),
      nullptr,
      nullptr
    };
  });
}

}  // namespace buildd
