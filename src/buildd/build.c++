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
#include "sandbox.h"
#include "supervisor.h"
#include "config.h"
#include "recipe.h"
#include "binarypackage.h"

namespace buildd {

namespace {

struct BuildKindInfo {
  BuildKind kind;
  kj::StringPtr name;
};

const BuildKindInfo BUILD_KINDS[] = {
  { BuildKind::BINARY_PACKAGE, "binarypackage" },
  { BuildKind::SOURCE_PACKAGE_RECIPE, "sourcepackagerecipe" },
  { BuildKind::LIVE_FILESYSTEM, "livefs" },
  { BuildKind::SNAP, "snap" },
  { BuildKind::OCI_IMAGE, "oci" },
  { BuildKind::TRANSLATION_TEMPLATES, "translation-templates" },
};

}  // namespace

kj::StringPtr buildKindName(BuildKind kind) {
  for (auto& info: BUILD_KINDS) {
    if (info.kind == kind) return info.name;
  }
  KJ_UNREACHABLE;
}

kj::Maybe<BuildKind> parseBuildKind(kj::StringPtr name) {
  if (name == "recipe") return BuildKind::SOURCE_PACKAGE_RECIPE;
  for (auto& info: BUILD_KINDS) {
    if (info.name == name) return info.kind;
  }
  return nullptr;
}

kj::Array<BuildKind> allBuildKinds() {
  auto result = kj::heapArrayBuilder<BuildKind>(kj::size(BUILD_KINDS));
  for (auto& info: BUILD_KINDS) {
    result.add(info.kind);
  }
  return result.finish();
}

kj::StringPtr outcomeName(Outcome outcome) {
  switch (outcome) {
    case Outcome::SUCCESS: return "SUCCESS";
    case Outcome::BUILD_FAILED: return "BUILD_FAILED";
    case Outcome::DEPENDENCY_FAILED: return "DEPENDENCY_FAILED";
    case Outcome::CHROOT_FAILED: return "CHROOT_FAILED";
    case Outcome::ABORTED: return "ABORTED";
    case Outcome::STALLED: return "STALLED";
    case Outcome::BUILDER_FAILED: return "BUILDER_FAILED";
  }
  KJ_UNREACHABLE;
}

// =======================================================================================
// BuildDescriptor

kj::Maybe<kj::StringPtr> BuildDescriptor::findParameter(kj::StringPtr key) const {
  for (auto& param: parameters) {
    if (param.key == key) return kj::StringPtr(param.value);
  }
  return nullptr;
}

kj::StringPtr BuildDescriptor::requireParameter(kj::StringPtr key) const {
  KJ_IF_MAYBE(value, findParameter(key)) {
    return *value;
  } else {
    KJ_FAIL_REQUIRE("build parameter missing", key, buildId);
  }
}

kj::StringPtr BuildDescriptor::getParameter(kj::StringPtr key,
                                            kj::StringPtr defaultValue) const {
  KJ_IF_MAYBE(value, findParameter(key)) {
    return *value;
  } else {
    return defaultValue;
  }
}

bool BuildDescriptor::getFlag(kj::StringPtr key) const {
  auto value = getParameter(key, "");
  return value == "true" || value == "yes" || value == "1";
}

kj::Array<kj::String> BuildDescriptor::getList(kj::StringPtr key) const {
  kj::Vector<kj::String> result;
  KJ_IF_MAYBE(value, findParameter(key)) {
    for (auto line: split(*value, '\n')) {
      auto item = trim(line);
      if (item.size() > 0) result.add(kj::mv(item));
    }
  }
  return result.releaseAsArray();
}

bool isSafeName(kj::StringPtr name) {
  if (name.size() == 0 || name[0] == '.') return false;
  for (char c: name) {
    if (!(('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || ('0' <= c && c <= '9') ||
          c == '+' || c == '.' || c == '_' || c == '-' || c == '~')) {
      return false;
    }
  }
  return true;
}

kj::Maybe<kj::String> validateDescriptor(const BuildDescriptor& descriptor) {
  if (!isSafeName(descriptor.buildId)) {
    return kj::str("invalid build id: ", descriptor.buildId);
  }
  if (!isSafeName(descriptor.baseImage)) {
    return kj::str("invalid base image reference: ", descriptor.baseImage);
  }

  for (auto i: kj::indices(descriptor.files)) {
    auto& file = descriptor.files[i];
    if (!isSafeName(file.name) || !isSafeName(file.contentRef)) {
      return kj::str("invalid file map entry: ", file.name, " -> ", file.contentRef);
    }
    if (file.name == "buildlog" || file.name == "chroot-autobuild") {
      return kj::str("file map entry collides with the build's own files: ", file.name);
    }
    for (auto j: kj::zeroTo(i)) {
      if (descriptor.files[j].name == file.name) {
        return kj::str("duplicate file map entry: ", file.name);
      }
    }
  }

  for (auto i: kj::indices(descriptor.parameters)) {
    auto& param = descriptor.parameters[i];
    if (param.key.size() == 0) {
      return kj::str("empty parameter name");
    }
    for (auto j: kj::zeroTo(i)) {
      if (descriptor.parameters[j].key == param.key) {
        return kj::str("duplicate parameter: ", param.key);
      }
    }
  }

  return nullptr;
}

// =======================================================================================
// ExitMapping and staging

ExitMapping&& ExitMapping::on(int exitCode, Outcome outcome) && {
  entries.add(Entry { exitCode, outcome });
  return kj::mv(*this);
}

Outcome ExitMapping::classify(int exitCode) const {
  for (auto& entry: entries) {
    if (entry.exitCode == exitCode) return entry.outcome;
  }
  return exitCode == 0 ? Outcome::SUCCESS : otherwise;
}

StagedFile stageContent(kj::StringPtr targetPath, kj::StringPtr content, mode_t mode) {
  return { kj::heapString(targetPath), mode, kj::heapString(content), nullptr };
}

StagedFile stageHostFile(kj::StringPtr targetPath, kj::StringPtr hostPath, mode_t mode) {
  return { kj::heapString(targetPath), mode, nullptr, kj::heapString(hostPath) };
}

static kj::Promise<void> stageFiles(kj::ArrayPtr<StagedFile> files, Sandbox& sandbox,
                                    uint counter) {
  if (files.size() == 0) return kj::READY_NOW;
  auto& file = files[0];
  auto rest = files.slice(1, files.size());

  KJ_IF_MAYBE(content, file.content) {
    // Write the content next to the sandbox so that the sandbox can install it as root.
    auto stagingPath = kj::str(sandbox.getBuildPath(), "/.staging-", counter);
    writeFile(stagingPath, *content, 0600);
    auto promise = sandbox.copyIn(stagingPath, file.targetPath, file.mode);
    return promise.then([&sandbox,rest,counter,KJ_MVCAP(stagingPath)]() {
      KJ_SYSCALL(unlink(stagingPath.cStr()), stagingPath);
      return stageFiles(rest, sandbox, counter + 1);
    });
  } else {
    return sandbox.copyIn(file.hostPath, file.targetPath, file.mode)
        .then([&sandbox,rest,counter]() {
      return stageFiles(rest, sandbox, counter + 1);
    });
  }
}

kj::Promise<PhaseResult> executePhase(Phase& phase, Sandbox& sandbox,
                                      ProcessSupervisor& supervisor) {
  auto command = kj::heap(phase.prepare());
  auto files = command->files.asPtr();
  auto staged = stageFiles(files, sandbox, 0);

  return staged.then([&phase,&sandbox,&supervisor,KJ_MVCAP(command)]() {
    kj::Array<kj::String> argv;
    kj::Maybe<kj::StringPtr> cwd;
    if (phase.location == PhaseLocation::SANDBOX) {
      argv = sandbox.commandFor(*command);
    } else if (command->env.size() > 0) {
      kj::Vector<kj::String> withEnv;
      withEnv.add(kj::str("env"));
      for (auto& var: command->env) withEnv.add(kj::heapString(var));
      for (auto& arg: command->argv) withEnv.add(kj::heapString(arg));
      argv = withEnv.releaseAsArray();
    } else {
      argv = KJ_MAP(arg, command->argv) { return kj::heapString(arg); };
    }
    if (phase.location == PhaseLocation::HOST) {
      KJ_IF_MAYBE(dir, command->cwd) {
        cwd = kj::StringPtr(*dir);
      }
    }
    return supervisor.run(argv, cwd, phase.captureOutput);
  }).then([&phase,&supervisor](ProcessSupervisor::Result&& result) {
    Outcome outcome = phase.exits.classify(result.exitCode);
    KJ_IF_MAYBE(handler, phase.onResult) {
      auto replacement = (*handler)(result.exitCode, result.output, supervisor.getLog());
      KJ_IF_MAYBE(r, replacement) {
        outcome = *r;
      }
    }
    return PhaseResult { result.exitCode, outcome };
  });
}

BuildBackend::~BuildBackend() noexcept(false) {}

kj::Maybe<kj::StringPtr> BuildBackend::getMissingDependencies() {
  return nullptr;
}

// =======================================================================================

bool StandardBackendFactory::isSupported(BuildKind kind) {
  switch (kind) {
    case BuildKind::SOURCE_PACKAGE_RECIPE:
      return true;
    case BuildKind::BINARY_PACKAGE:
      // sbuild is pointed at the build's chroot; a container has none.
      return config.sandbox == SandboxType::CHROOT;
    default:
      return false;
  }
}

kj::Own<BuildBackend> StandardBackendFactory::newBackend(const BuildDescriptor& descriptor) {
  switch (descriptor.kind) {
    case BuildKind::SOURCE_PACKAGE_RECIPE:
      return kj::heap<RecipeBackend>(config, descriptor);
    case BuildKind::BINARY_PACKAGE:
      return kj::heap<BinaryPackageBackend>(config, descriptor);
    default:
      KJ_FAIL_REQUIRE("build kind not supported by this builder",
                      buildKindName(descriptor.kind));
  }
}

}  // namespace buildd
