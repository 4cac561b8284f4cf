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
#include "sandbox.h"
#include "build-log.h"
#include "config.h"

namespace buildd {

namespace {

const char APT_DIR[] = "/home/buildd/work/apt";
const char APT_LIST[] = "/etc/apt/sources.list.d/buildd.list";

kj::Array<kj::String> nonBlankLines(kj::StringPtr text) {
  kj::Vector<kj::String> result;
  for (auto line: split(text, '\n')) {
    auto item = trim(line);
    if (item.size() > 0) result.add(kj::mv(item));
  }
  return result.releaseAsArray();
}

}  // namespace

RecipeBackend::RecipeBackend(const Config& config, const BuildDescriptor& descriptor)
    : recipeText(kj::heapString(descriptor.requireParameter("recipe_text"))),
      suite(kj::heapString(descriptor.requireParameter("suite"))),
      component(kj::heapString(descriptor.requireParameter("ogrecomponent"))),
      authorName(kj::heapString(descriptor.getParameter("author_name", "buildd"))),
      authorEmail(kj::heapString(descriptor.getParameter("author_email", "buildd@localhost"))),
      archivePurpose(kj::heapString(descriptor.requireParameter("archive_purpose"))),
      useGit(descriptor.getFlag("git")),
      archives(descriptor.getList("archives")),
      gitProxyHelper(kj::heapString(config.gitProxyHelper)) {
  // Needed for the execution quirks; checked here so a bad dispatch is rejected up front.
  descriptor.requireParameter("distroseries_name");

  KJ_IF_MAYBE(keys, descriptor.findParameter("trusted_keys")) {
    if (keys->size() > 0) trustedKeys = kj::heapString(*keys);
  }

  KJ_IF_MAYBE(url, descriptor.findParameter("proxy_url")) {
    if (url->size() > 0) proxyUrl = kj::heapString(*url);
  } else KJ_IF_MAYBE(url, config.proxyUrl) {
    proxyUrl = kj::heapString(*url);
  }

  KJ_IF_MAYBE(url, config.aptProxyUrl) {
    aptProxyUrl = kj::heapString(*url);
  }
}

kj::Array<Phase> RecipeBackend::phases() {
  auto own = recipePhases();
  auto result = kj::heapArrayBuilder<Phase>(own.size() + 2);

  AptSettings settings;
  settings.archives = KJ_MAP(line, archives) { return kj::heapString(line); };
  KJ_IF_MAYBE(keys, trustedKeys) {
    settings.trustedKeys = kj::heapString(*keys);
  }
  KJ_IF_MAYBE(url, aptProxyUrl) {
    settings.proxyUrl = kj::heapString(*url);
  }
  result.add(makeUpdateChrootPhase(kj::mv(settings)));
  result.add(makeUpgradeChrootPhase());

  for (auto& phase: own) {
    result.add(kj::mv(phase));
  }
  return result.finish();
}

kj::Array<Phase> RecipeBackend::recipePhases() {
  return kj::arr(
      installTooling(),
      queryRelease(),
      materializeTree(),
      inspectTree(),
      readChangelog(),
      readControl(),
      installBuildDeps(),
      buildSourcePackage());
}

kj::Maybe<kj::StringPtr> RecipeBackend::getMissingDependencies() {
  KJ_IF_MAYBE(dep, missingDependency) {
    return kj::StringPtr(*dep);
  } else {
    return nullptr;
  }
}

kj::String RecipeBackend::treePath() {
  return kj::str(WORK_DIR, "/tree");
}

kj::String RecipeBackend::packagePath() {
  KJ_REQUIRE(treeName.size() > 0, "source tree has not been inspected yet");
  return kj::str(WORK_DIR, "/tree/", treeName);
}

kj::Array<kj::String> RecipeBackend::authorEnv() {
  return kj::arr(kj::str("DEBEMAIL=", authorEmail), kj::str("DEBFULLNAME=", authorName));
}

kj::Array<kj::String> RecipeBackend::proxyEnv() {
  KJ_IF_MAYBE(url, proxyUrl) {
    return kj::arr(kj::str("http_proxy=", *url),
                   kj::str("https_proxy=", *url),
                   kj::str("GIT_PROXY_COMMAND=", GIT_PROXY_PATH));
  } else {
    return nullptr;
  }
}

// ---------------------------------------------------------------------------------------

Phase RecipeBackend::installTooling() {
  return Phase("install-tooling", ExitMapping(Outcome::CHROOT_FAILED), [this]() {
    kj::Vector<StagedFile> files;
    files.add(stageContent(kj::str(WORK_DIR, "/recipe"), recipeText));
    if (proxyUrl != nullptr) {
      files.add(stageHostFile(GIT_PROXY_PATH, gitProxyHelper, 0755));
    }

    return Command {
      makeArgv("apt-get", "-y", "install", useGit ? "git-build-recipe" : "bzr-builder",
               "lsb-release", "dpkg-dev", "apt-utils"),
      aptEnvironment(),
      nullptr,
      files.releaseAsArray()
    };
  });
}

Phase RecipeBackend::queryRelease() {
  Phase phase("query-release", ExitMapping(Outcome::CHROOT_FAILED), []() {
    return Command { makeArgv("lsb_release", "-r", "-s"), nullptr, nullptr, nullptr };
  });
  phase.captureOutput = true;
  phase.onResult = ResultHandler([this](int exitCode, kj::StringPtr output, BuildLog& log)
                                 -> kj::Maybe<Outcome> {
    if (exitCode != 0) return nullptr;
    release = trim(output);
    if (release.size() == 0 || !isSafeName(release)) {
      log.write(kj::str("Could not determine the sandbox's release: '", output, "'\n"));
      return Outcome::CHROOT_FAILED;
    }
    return nullptr;
  });
  return phase;
}

Phase RecipeBackend::materializeTree() {
  return Phase("materialize-tree", ExitMapping(Outcome::BUILD_FAILED), [this]() {
    kj::Vector<kj::String> argv;
    if (useGit) {
      argv.add(kj::str("git-build-recipe"));
    } else {
      argv.add(kj::str("bzr"));
      argv.add(kj::str("-Derror"));
      argv.add(kj::str("dailydeb"));
    }
    for (auto arg: {"--safe", "--no-build", "--manifest"}) {
      argv.add(kj::str(arg));
    }
    argv.add(kj::str(WORK_DIR, "/manifest"));
    argv.add(kj::str("--distribution"));
    argv.add(kj::heapString(suite));
    argv.add(kj::str("--allow-fallback-to-native"));
    argv.add(kj::str("--append-version"));
    // The sandbox's own release, which may lag behind the suite being built for.
    argv.add(kj::str("~ubuntu", release, ".1"));
    argv.add(kj::str(WORK_DIR, "/recipe"));
    argv.add(treePath());

    kj::Vector<kj::String> env;
    for (auto& var: authorEnv()) env.add(kj::mv(var));
    for (auto& var: proxyEnv()) env.add(kj::mv(var));

    return Command {
      argv.releaseAsArray(),
      env.releaseAsArray(),
      kj::str(WORK_DIR),
      nullptr
    };
  });
}

Phase RecipeBackend::inspectTree() {
  Phase phase("inspect-tree", ExitMapping(Outcome::BUILD_FAILED), [this]() {
    return Command {
      makeArgv("find", treePath(), "-mindepth", "1", "-maxdepth", "1", "-type", "d",
               "-printf", "%f\\n"),
      nullptr, nullptr, nullptr
    };
  });
  phase.captureOutput = true;
  phase.onResult = ResultHandler([this](int exitCode, kj::StringPtr output, BuildLog& log)
                                 -> kj::Maybe<Outcome> {
    if (exitCode != 0) return nullptr;
    auto dirs = nonBlankLines(output);
    if (dirs.size() != 1) {
      log.write(kj::str("Expected exactly one directory in the built tree, found ",
                        dirs.size(), ".\n"));
      return Outcome::BUILD_FAILED;
    }
    if (!isSafeName(dirs[0])) {
      log.write(kj::str("Unusable source tree directory name: ", dirs[0], "\n"));
      return Outcome::BUILD_FAILED;
    }
    treeName = kj::mv(dirs[0]);
    return nullptr;
  });
  return phase;
}

Phase RecipeBackend::readChangelog() {
  Phase phase("read-changelog", ExitMapping(Outcome::BUILD_FAILED), [this]() {
    return Command {
      makeArgv("head", "-n", "1", kj::str(packagePath(), "/debian/changelog")),
      nullptr, nullptr, nullptr
    };
  });
  phase.captureOutput = true;
  phase.onResult = ResultHandler([this](int exitCode, kj::StringPtr output, BuildLog& log)
                                 -> kj::Maybe<Outcome> {
    if (exitCode != 0) return nullptr;
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      auto line = trim(output);
      packageName = parseChangelogPackage(line);
      version = parseChangelogVersion(line);
    })) {
      log.write(kj::str("Malformed debian/changelog: ", exception->getDescription(), "\n"));
      return Outcome::BUILD_FAILED;
    }
    changesName = kj::str(packageName, "_", version, "_source.changes");
    return nullptr;
  });
  return phase;
}

Phase RecipeBackend::readControl() {
  Phase phase("read-control", ExitMapping(Outcome::BUILD_FAILED), [this]() {
    return Command {
      makeArgv("cat", kj::str(packagePath(), "/debian/control")),
      nullptr, nullptr, nullptr
    };
  });
  phase.captureOutput = true;
  phase.onResult = ResultHandler([this](int exitCode, kj::StringPtr output, BuildLog& log)
                                 -> kj::Maybe<Outcome> {
    if (exitCode != 0) return nullptr;
    kj::Maybe<kj::Array<ControlParagraph>> paragraphs;
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      paragraphs = parseControlFile(output);
    })) {
      log.write(kj::str("Malformed debian/control: ", exception->getDescription(), "\n"));
      return Outcome::BUILD_FAILED;
    }

    auto& parsed = KJ_ASSERT_NONNULL(paragraphs);
    if (parsed.size() == 0) {
      log.write("debian/control is empty.\n");
      return Outcome::BUILD_FAILED;
    }
    sourceControl = kj::mv(parsed[0]);
    return nullptr;
  });
  return phase;
}

Phase RecipeBackend::installBuildDeps() {
  Phase phase("install-build-deps", ExitMapping(Outcome::DEPENDENCY_FAILED), [this]() {
    auto files = kj::arr(
        stageContent("/CurrentlyBuilding",
                     makeCurrentlyBuilding(packageName, suite, component, archivePurpose)),
        stageContent(kj::str(APT_DIR, "/", packageName, ".dsc"),
                     makeDummyDsc(packageName, sourceControl)),
        stageContent(APT_LIST, kj::str("deb-src [trusted=yes] file:", APT_DIR, " ./\n")));

    auto script = kj::str(
        "apt-ftparchive -q=2 sources . > Sources"
        " && apt-get update -o Dir::Etc::sourcelist=", APT_LIST,
        " -o Dir::Etc::sourceparts=- -o APT::Get::List-Cleanup=0"
        " && apt-get -y build-dep --only-source ", packageName);

    return Command {
      makeArgv("/bin/sh", "-c", script),
      aptEnvironment(),
      kj::str(APT_DIR),
      kj::mv(files)
    };
  });
  phase.captureOutput = true;
  phase.onResult = ResultHandler([this](int exitCode, kj::StringPtr output, BuildLog& log)
                                 -> kj::Maybe<Outcome> {
    if (exitCode != 0) {
      missingDependency = findUnmetDependency(output);
      KJ_IF_MAYBE(dep, missingDependency) {
        log.write(kj::str("Unmet build dependency: ", *dep, "\n"));
      }
    }
    return nullptr;
  });
  return phase;
}

Phase RecipeBackend::buildSourcePackage() {
  return Phase("build-source-package", ExitMapping(Outcome::BUILD_FAILED), [this]() {
    return Command {
      makeArgv("dpkg-buildpackage", "-i", "-I.bzr", "-I.git", "-us", "-uc", "-S", "-sa"),
      authorEnv(),
      packagePath(),
      nullptr
    };
  });
}

// ---------------------------------------------------------------------------------------

kj::Promise<kj::Array<kj::String>> RecipeBackend::collectArtifacts(
    Sandbox& sandbox, kj::StringPtr artifactDir) {
  KJ_REQUIRE(changesName.size() > 0, "source package name is unknown");

  auto changesHostPath = kj::str(artifactDir, "/", changesName);
  auto promise = sandbox.copyOut(kj::str(treePath(), "/", changesName), changesHostPath);
  return promise.then([this,&sandbox,artifactDir,KJ_MVCAP(changesHostPath)]() {
    auto listed = parseChangesFiles(readAll(changesHostPath));
    return collectFiles(sandbox, artifactDir, kj::mv(listed), 0);
  }).then([this,&sandbox,artifactDir](kj::Array<kj::String> listed) {
    auto promise = sandbox.copyOut(kj::str(WORK_DIR, "/manifest"),
                                   kj::str(artifactDir, "/manifest"));
    return promise.then([this,KJ_MVCAP(listed)]() mutable {
      auto names = kj::heapArrayBuilder<kj::String>(listed.size() + 2);
      names.add(kj::heapString(changesName));
      for (auto& name: listed) {
        names.add(kj::mv(name));
      }
      names.add(kj::str("manifest"));
      return names.finish();
    });
  });
}

kj::Promise<kj::Array<kj::String>> RecipeBackend::collectFiles(
    Sandbox& sandbox, kj::StringPtr artifactDir, kj::Array<kj::String> names, size_t index) {
  if (index == names.size()) return kj::mv(names);

  auto promise = sandbox.copyOut(kj::str(treePath(), "/", names[index]),
                                 kj::str(artifactDir, "/", names[index]));
  return promise.then([this,&sandbox,artifactDir,KJ_MVCAP(names),index]() mutable {
    return collectFiles(sandbox, artifactDir, kj::mv(names), index + 1);
  });
}

// =======================================================================================

int standaloneExitCode(kj::StringPtr phaseName) {
  if (phaseName == "update-chroot" || phaseName == "upgrade-chroot" ||
      phaseName == "install-tooling" || phaseName == "query-release") {
    return 200;
  } else if (phaseName == "install-build-deps") {
    return 202;
  } else if (phaseName == "build-source-package") {
    return 203;
  } else {
    return 201;
  }
}

}  // namespace buildd
