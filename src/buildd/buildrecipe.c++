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

#include "buildrecipe.h"
#include <kj/async-unix.h>
#include <kj/debug.h>
#include <unistd.h>
#include "config.h"
#include "build-log.h"
#include "supervisor.h"
#include "sandbox.h"
#include "recipe.h"

namespace buildd {

class BuildRecipeMain final: public AbstractMain {
public:
  BuildRecipeMain(kj::ProcessContext& context, kj::StringPtr selfPath)
      : context(context), selfPath(kj::heapString(selfPath)) {}

  kj::MainFunc getMain() override {
    return kj::MainBuilder(context, "buildd buildrecipe",
            "Builds a source package from a recipe inside the sandbox of <build-id>, which "
            "must already be created and started. The build log goes to standard output.",
            "Exit status: 0 on success, 200 if the sandbox could not be prepared, 201 if the "
            "recipe could not be turned into a tree, 202 if build-dependencies could not be "
            "installed, 203 if the source package failed to build.")
        .addOptionWithArg({"config"}, KJ_BIND_METHOD(*this, setConfig), "<file>",
            "Read configuration from <file> instead of /etc/buildd/buildd.conf.")
        .addOptionWithArg({"recipe"}, KJ_BIND_METHOD(*this, setRecipe), "<file>",
            "Read the recipe from <file> instead of <build-dir>/recipe.")
        .addOption({"git"}, [this]() { useGit = true; return true; },
            "Use git-build-recipe instead of bzr-builder.")
        .expectArg("<build-id>", KJ_BIND_METHOD(*this, addArg))
        .expectArg("<author-name>", KJ_BIND_METHOD(*this, addArg))
        .expectArg("<author-email>", KJ_BIND_METHOD(*this, addArg))
        .expectArg("<suite>", KJ_BIND_METHOD(*this, addArg))
        .expectArg("<series>", KJ_BIND_METHOD(*this, addArg))
        .expectArg("<component>", KJ_BIND_METHOD(*this, addArg))
        .expectArg("<archive-purpose>", KJ_BIND_METHOD(*this, addArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext& context;
  kj::String selfPath;
  kj::StringPtr configPath = "/etc/buildd/buildd.conf";
  kj::Maybe<kj::StringPtr> recipePath;
  bool useGit = false;
  kj::Vector<kj::StringPtr> args;

  kj::MainBuilder::Validity setConfig(kj::StringPtr arg) {
    configPath = arg;
    return true;
  }

  kj::MainBuilder::Validity setRecipe(kj::StringPtr arg) {
    recipePath = arg;
    return true;
  }

  kj::MainBuilder::Validity addArg(kj::StringPtr arg) {
    args.add(arg);
    return true;
  }

  kj::MainBuilder::Validity run() {
    int exitCode = buildRecipe();
    if (exitCode != 0) {
      // kj::ProcessContext only knows success and failure.
      _exit(exitCode);
    }
    context.exit();
  }

  int buildRecipe() {
    auto config = readConfig(configPath);
    kj::StringPtr buildId = args[0];
    kj::StringPtr series = args[4];
    if (!isSafeName(buildId)) {
      context.exitError(kj::str("invalid build id: ", buildId));
    }
    auto buildPath = config.getBuildPath(buildId);

    kj::String recipeText;
    KJ_IF_MAYBE(path, recipePath) {
      recipeText = readAll(*path);
    } else {
      recipeText = readAll(kj::str(buildPath, "/recipe"));
    }

    kj::Vector<Parameter> parameters;
    auto addParameter = [&](kj::StringPtr key, kj::StringPtr value) {
      parameters.add(Parameter { kj::str(key), kj::str(value) });
    };
    addParameter("recipe_text", recipeText);
    addParameter("author_name", args[1]);
    addParameter("author_email", args[2]);
    addParameter("suite", args[3]);
    addParameter("distroseries_name", series);
    addParameter("ogrecomponent", args[5]);
    addParameter("archive_purpose", args[6]);
    if (useGit) addParameter("git", "true");

    BuildDescriptor descriptor {
      kj::str(buildId), BuildKind::SOURCE_PACKAGE_RECIPE, kj::str(),
      nullptr, parameters.releaseAsArray()
    };
    RecipeBackend backend(config, descriptor);

    auto io = kj::setupAsyncIo();
    auto& timer = io.provider->getTimer();
    SubprocessSet subprocesses(io.unixEventPort);

    int logFd;
    KJ_SYSCALL(logFd = dup(STDOUT_FILENO));
    BuildLog log(timer, kj::AutoCloseFd(logFd));
    ProcessSupervisor supervisor(*io.lowLevelProvider, subprocesses, timer, log);

    SystemSandboxFactory sandboxFactory(config, timer, selfPath);
    auto sandbox = sandboxFactory.newSandbox(buildId, buildPath, supervisor);
    sandbox->setQuirks(resolveQuirks(config.architectureTag, series));

    auto phases = backend.recipePhases();
    for (auto& phase: phases) {
      auto result = executePhase(phase, *sandbox, supervisor).wait(io.waitScope);
      if (result.outcome == Outcome::SUCCESS) continue;

      if (phase.policy == FailurePolicy::SOFT) {
        log.write(kj::str(phase.name, " failed (", outcomeName(result.outcome),
                          "); continuing.\n"));
        continue;
      }

      log.write(kj::str(phase.name, " failed: ", outcomeName(result.outcome), "\n"));
      return standaloneExitCode(phase.name);
    }

    auto artifacts = backend.collectArtifacts(*sandbox, buildPath).wait(io.waitScope);
    for (auto& artifact: artifacts) {
      log.write(kj::str("Collected ", artifact, "\n"));
    }
    return 0;
  }
};

kj::Own<AbstractMain> getBuildRecipeMain(kj::ProcessContext& context, kj::StringPtr selfPath) {
  return kj::heap<BuildRecipeMain>(context, selfPath);
}

}  // namespace buildd
