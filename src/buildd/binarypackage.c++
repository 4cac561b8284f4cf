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
#include "build-log.h"
#include "config.h"
#include <ctype.h>
#include <string.h>

namespace buildd {

namespace {

const char TOOLCHAIN_LISTING[] = "Toolchain package versions:";
const char APT_GIVE_BACK[] = "E: There are problems and -y was used without --force-yes";

bool isPackageChar(char c) {
  return isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '+' || c == '.';
}

bool isVersionChar(char c) {
  return isPackageChar(c) || c == ':' || c == '~';
}

bool hasPrefixAt(kj::ArrayPtr<const char> text, size_t pos, kj::StringPtr prefix) {
  return pos <= text.size() && text.size() - pos >= prefix.size() &&
      memcmp(text.begin() + pos, prefix.begin(), prefix.size()) == 0;
}

kj::Vector<kj::ArrayPtr<const char>> linesBeforeToolchain(kj::StringPtr output) {
  kj::Vector<kj::ArrayPtr<const char>> result;
  for (auto line: split(output, '\n')) {
    if (hasPrefixAt(line, 0, TOOLCHAIN_LISTING)) break;
    result.add(line);
  }
  return result;
}

kj::Maybe<kj::String> matchVersionWait(kj::ArrayPtr<const char> line, bool strictlyNewer) {
  // "<package>(inst <installed> ! >> wanted <version>)", or ">=" / "=" for a version at least as
  // new.
  static constexpr const char INST[] = "(inst ";

  for (size_t i = 0; i < line.size(); i++) {
    if (!hasPrefixAt(line, i, INST)) continue;

    size_t start = i;
    while (start > 0 && isPackageChar(line[start - 1])) --start;
    if (start == i) continue;

    size_t pos = i + strlen(INST);
    size_t installedEnd = pos;
    while (installedEnd < line.size() && line[installedEnd] != ' ') ++installedEnd;
    if (installedEnd == pos || !hasPrefixAt(line, installedEnd, " ! ")) continue;
    pos = installedEnd + 3;

    kj::StringPtr relation;
    if (strictlyNewer && hasPrefixAt(line, pos, ">> wanted ")) {
      relation = ">>";
      pos += strlen(">> wanted ");
    } else if (!strictlyNewer && hasPrefixAt(line, pos, ">= wanted ")) {
      relation = ">=";
      pos += strlen(">= wanted ");
    } else if (!strictlyNewer && hasPrefixAt(line, pos, "= wanted ")) {
      relation = ">=";
      pos += strlen("= wanted ");
    } else {
      continue;
    }

    size_t versionEnd = pos;
    while (versionEnd < line.size() && isVersionChar(line[versionEnd])) ++versionEnd;
    if (versionEnd == pos || versionEnd == line.size() || line[versionEnd] != ')') continue;

    return kj::str(line.slice(start, i), " (", relation, " ", line.slice(pos, versionEnd), ")");
  }
  return nullptr;
}

kj::Maybe<kj::String> matchAptError(kj::ArrayPtr<const char> line, kj::StringPtr prefix,
                                    bool quoted, kj::StringPtr suffix) {
  if (!hasPrefixAt(line, 0, prefix)) return nullptr;

  size_t pos = prefix.size();
  if (quoted && pos < line.size() && line[pos] == '\'') ++pos;
  size_t end = pos;
  while (end < line.size() && isPackageChar(line[end])) ++end;
  if (end == pos) return nullptr;

  size_t rest = end;
  if (quoted && rest < line.size() && line[rest] == '\'') ++rest;
  if (!hasPrefixAt(line, rest, suffix)) return nullptr;
  return kj::heapString(line.slice(pos, end));
}

}  // namespace

kj::Maybe<kj::String> findDependencyWait(kj::StringPtr output) {
  auto lines = linesBeforeToolchain(output);

  for (bool strictlyNewer: {true, false}) {
    for (auto line: lines) {
      KJ_IF_MAYBE(dep, matchVersionWait(line, strictlyNewer)) {
        return kj::mv(*dep);
      }
    }
  }

  // apt only repeats the last of these errors that matters.
  struct AptError {
    kj::StringPtr prefix;
    bool quoted;
    kj::StringPtr suffix;
  };
  static const AptError APT_ERRORS[] = {
    { "E: Couldn't find package ", false, "" },
    { "E: Package ", true, " has no installation candidate" },
    { "E: Unable to locate package ", false, "" },
  };
  for (auto& error: APT_ERRORS) {
    kj::Maybe<kj::String> last;
    for (auto line: lines) {
      KJ_IF_MAYBE(dep, matchAptError(line, error.prefix, error.quoted, error.suffix)) {
        last = kj::mv(*dep);
      }
    }
    if (last != nullptr) return kj::mv(last);
  }

  return nullptr;
}

SbuildVerdict classifySbuildExit(int exitCode, kj::StringPtr output) {
  switch (exitCode) {
    case 0:
      return { Outcome::SUCCESS, nullptr };
    case 1:
    case 2:
      return { Outcome::BUILD_FAILED, nullptr };
    case 3: {
      // Given back. Only believed if the output shows why.
      for (auto line: linesBeforeToolchain(output)) {
        if (hasPrefixAt(line, 0, APT_GIVE_BACK)) {
          return { Outcome::CHROOT_FAILED, nullptr };
        }
      }
      KJ_IF_MAYBE(dep, findDependencyWait(output)) {
        return { Outcome::DEPENDENCY_FAILED, kj::mv(*dep) };
      }
      return { Outcome::BUILD_FAILED, nullptr };
    }
    default:
      return { Outcome::BUILDER_FAILED, nullptr };
  }
}

// =======================================================================================

BinaryPackageBackend::BinaryPackageBackend(const Config& config,
                                           const BuildDescriptor& descriptor)
    : buildId(kj::heapString(descriptor.buildId)),
      buildPath(config.getBuildPath(descriptor.buildId)),
      sbuildPath(kj::heapString(config.sbuildPath)),
      architecture(kj::heapString(descriptor.getParameter("arch_tag", config.architectureTag))),
      suite(kj::heapString(descriptor.requireParameter("suite"))),
      component(kj::heapString(descriptor.requireParameter("ogrecomponent"))),
      archivePurpose(kj::heapString(descriptor.getParameter("archive_purpose", "PRIMARY"))),
      archIndep(descriptor.getFlag("arch_indep")),
      debugSymbols(descriptor.getFlag("build_debug_symbols")),
      archives(descriptor.getList("archives")) {
  for (auto& file: descriptor.files) {
    if (file.name.endsWith(".dsc")) {
      dscName = kj::heapString(file.name);
    }
  }
  KJ_REQUIRE(dscName.size() > 0, "binary package build has no .dsc in its file map");
  changesName = kj::str(dscName.slice(0, dscName.size() - strlen(".dsc")), "_",
                        architecture, ".changes");

  KJ_IF_MAYBE(keys, descriptor.findParameter("trusted_keys")) {
    if (keys->size() > 0) trustedKeys = kj::heapString(*keys);
  }
  KJ_IF_MAYBE(url, config.aptProxyUrl) {
    aptProxyUrl = kj::heapString(*url);
  }
}

kj::Array<Phase> BinaryPackageBackend::phases() {
  AptSettings settings;
  settings.archives = KJ_MAP(line, archives) { return kj::heapString(line); };
  KJ_IF_MAYBE(keys, trustedKeys) {
    settings.trustedKeys = kj::heapString(*keys);
  }
  KJ_IF_MAYBE(url, aptProxyUrl) {
    settings.proxyUrl = kj::heapString(*url);
  }

  return kj::arr(makeUpdateChrootPhase(kj::mv(settings)), makeUpgradeChrootPhase(), sbuild());
}

kj::Maybe<kj::StringPtr> BinaryPackageBackend::getMissingDependencies() {
  KJ_IF_MAYBE(dep, missingDependency) {
    return kj::StringPtr(*dep);
  } else {
    return nullptr;
  }
}

Phase BinaryPackageBackend::sbuild() {
  Phase phase("sbuild", ExitMapping(Outcome::BUILD_FAILED), [this]() {
    kj::String package;
    KJ_IF_MAYBE(underscore, dscName.findFirst('_')) {
      package = kj::heapString(dscName.slice(0, *underscore));
    } else {
      package = kj::heapString(dscName);
    }

    kj::Vector<kj::String> argv;
    argv.add(kj::heapString(sbuildPath));
    argv.add(kj::heapString(buildId));
    argv.add(kj::heapString(architecture));
    argv.add(kj::heapString(suite));
    argv.add(kj::str("-c"));
    argv.add(kj::str("chroot:build-", buildId));
    argv.add(kj::str("--arch=", architecture));
    argv.add(kj::str("--dist=", suite));
    argv.add(kj::str("--purge=never"));
    argv.add(kj::str("--nolog"));
    if (archIndep) {
      argv.add(kj::str("-A"));
    }
    argv.add(kj::heapString(dscName));

    return Command {
      argv.releaseAsArray(),
      nullptr,
      kj::heapString(buildPath),
      kj::arr(stageContent("/CurrentlyBuilding",
          makeCurrentlyBuilding(package, suite, component, archivePurpose, debugSymbols)))
    };
  });
  phase.location = PhaseLocation::HOST;
  phase.captureOutput = true;
  phase.onResult = ResultHandler([this](int exitCode, kj::StringPtr output, BuildLog& log)
                                 -> kj::Maybe<Outcome> {
    auto verdict = classifySbuildExit(exitCode, output);
    if (verdict.outcome == Outcome::SUCCESS) {
      return checkResults(log);
    }

    KJ_IF_MAYBE(dep, verdict.missingDependency) {
      log.write(kj::str("Unmet build dependency: ", *dep, "\n"));
    }
    missingDependency = kj::mv(verdict.missingDependency);
    return verdict.outcome;
  });
  return phase;
}

kj::Maybe<Outcome> BinaryPackageBackend::checkResults(BuildLog& log) {
  auto changesPath = kj::str(buildPath, "/", changesName);
  if (!pathExists(changesPath)) {
    log.write(kj::str("Failed to gather results: ", changesName, " is missing.\n"));
    return Outcome::BUILD_FAILED;
  }

  kj::Array<kj::String> names;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    names = parseChangesFiles(readAll(changesPath));
  })) {
    log.write(kj::str("Failed to gather results: ", exception->getDescription(), "\n"));
    return Outcome::BUILD_FAILED;
  }

  for (auto& name: names) {
    if (!pathExists(kj::str(buildPath, "/", name))) {
      log.write(kj::str("Failed to gather results: ", changesName, " lists ", name,
                        ", which was not built.\n"));
      return Outcome::BUILD_FAILED;
    }
  }
  listed = kj::mv(names);
  return nullptr;
}

kj::Promise<kj::Array<kj::String>> BinaryPackageBackend::collectArtifacts(
    Sandbox& sandbox, kj::StringPtr artifactDir) {
  // sbuild already left everything in the build directory.
  KJ_REQUIRE(artifactDir == buildPath, "artifacts are expected in the build directory",
             artifactDir);

  auto names = kj::heapArrayBuilder<kj::String>(listed.size() + 1);
  names.add(kj::heapString(changesName));
  for (auto& name: listed) {
    names.add(kj::heapString(name));
  }
  return names.finish();
}

}  // namespace buildd
