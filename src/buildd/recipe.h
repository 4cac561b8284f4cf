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

#ifndef BUILDD_RECIPE_H_
#define BUILDD_RECIPE_H_

#include "build.h"
#include "debian.h"

namespace buildd {

struct Config;

class RecipeBackend final: public BuildBackend {
  // Builds a Debian source package from a recipe: a description of branches to merge into a
  // source tree. The tree is materialized inside the sandbox, its build-dependencies are
  // installed from a throwaway local archive holding only a stub package, and the source
  // package is built from the result.
  //
  // Phases record what they learn (release, tree, package name, control data) in the backend for
  // the phases after them.

public:
  static constexpr const char* WORK_DIR = "/home/buildd/work";
  static constexpr const char* GIT_PROXY_PATH = "/usr/local/bin/buildd-git-proxy";

  RecipeBackend(const Config& config, const BuildDescriptor& descriptor);
  // Throws if a required parameter is missing.

  kj::Array<Phase> phases() override;
  kj::Promise<kj::Array<kj::String>> collectArtifacts(
      Sandbox& sandbox, kj::StringPtr artifactDir) override;
  kj::Maybe<kj::StringPtr> getMissingDependencies() override;

  kj::Array<Phase> recipePhases();
  // phases() minus the shared update-chroot and upgrade-chroot phases.

  kj::StringPtr getRelease() { return release; }
  kj::StringPtr getTreeName() { return treeName; }
  kj::StringPtr getPackageName() { return packageName; }
  kj::StringPtr getVersion() { return version; }
  kj::StringPtr getChangesName() { return changesName; }

private:
  kj::String recipeText;
  kj::String suite;
  kj::String component;
  kj::String authorName;
  kj::String authorEmail;
  kj::String archivePurpose;
  bool useGit;
  kj::Array<kj::String> archives;
  kj::Maybe<kj::String> trustedKeys;
  kj::Maybe<kj::String> proxyUrl;
  kj::Maybe<kj::String> aptProxyUrl;
  kj::String gitProxyHelper;

  kj::String release;
  kj::String treeName;
  kj::String packageName;
  kj::String version;
  kj::String changesName;
  kj::Array<ControlField> sourceControl;
  kj::Maybe<kj::String> missingDependency;

  kj::String treePath();
  kj::String packagePath();
  kj::Array<kj::String> authorEnv();
  kj::Array<kj::String> proxyEnv();

  Phase installTooling();
  Phase queryRelease();
  Phase materializeTree();
  Phase inspectTree();
  Phase readChangelog();
  Phase readControl();
  Phase installBuildDeps();
  Phase buildSourcePackage();

  kj::Promise<kj::Array<kj::String>> collectFiles(
      Sandbox& sandbox, kj::StringPtr artifactDir, kj::Array<kj::String> names, size_t index);
};

int standaloneExitCode(kj::StringPtr phaseName);
// Exit status of `buildd buildrecipe` when the named phase fails: 200 while installing tooling,
// 201 while building the tree, 202 while installing build-dependencies, 203 while building the
// source package.

}  // namespace buildd

#endif  // BUILDD_RECIPE_H_
