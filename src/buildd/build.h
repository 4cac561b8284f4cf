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

#ifndef BUILDD_BUILD_H_
#define BUILDD_BUILD_H_
// Types shared by the lifecycle engine and the build backends.

#include <kj/string.h>
#include <kj/array.h>
#include <kj/function.h>
#include <kj/async.h>
#include <sys/types.h>
#include "util.h"

namespace buildd {

class Sandbox;
class ProcessSupervisor;
struct Config;

enum class BuildKind {
  BINARY_PACKAGE,
  SOURCE_PACKAGE_RECIPE,
  LIVE_FILESYSTEM,
  SNAP,
  OCI_IMAGE,
  TRANSLATION_TEMPLATES
};

kj::StringPtr buildKindName(BuildKind kind);
kj::Maybe<BuildKind> parseBuildKind(kj::StringPtr name);
// Wire names: "binarypackage", "sourcepackagerecipe", "livefs", "snap", "oci",
// "translation-templates". "recipe" is accepted as an alias for source package recipes.

kj::Array<BuildKind> allBuildKinds();

enum class Outcome {
  SUCCESS,
  BUILD_FAILED,
  // The package or content did not build. Not an infrastructure problem; never retried.

  DEPENDENCY_FAILED,
  CHROOT_FAILED,
  // The sandbox or the orchestration around it is unusable. Retried on another builder.

  ABORTED,
  STALLED,

  BUILDER_FAILED
  // The builder itself needs repair, e.g. a stale sandbox from an earlier build is still on disk
  // or processes could not be reaped within the abort timeout.
};

kj::StringPtr outcomeName(Outcome outcome);

struct FileMapEntry {
  kj::String name;
  // Logical name; the file is linked into the build's working directory under this name.

  kj::String contentRef;
  // Name of the file in the file cache.
};

struct Parameter {
  kj::String key;
  kj::String value;
};

struct BuildDescriptor {
  kj::String buildId;
  BuildKind kind;
  kj::String baseImage;
  kj::Array<FileMapEntry> files;
  kj::Array<Parameter> parameters;

  kj::Maybe<kj::StringPtr> findParameter(kj::StringPtr key) const;
  kj::StringPtr requireParameter(kj::StringPtr key) const;
  kj::StringPtr getParameter(kj::StringPtr key, kj::StringPtr defaultValue) const;
  bool getFlag(kj::StringPtr key) const;
  // True if the parameter is "true", "yes" or "1".

  kj::Array<kj::String> getList(kj::StringPtr key) const;
  // A newline-separated parameter, split into non-blank lines.
};

kj::Maybe<kj::String> validateDescriptor(const BuildDescriptor& descriptor);
// Returns a description of the problem if the descriptor is malformed.

bool isSafeName(kj::StringPtr name);
// Non-empty, made of [A-Za-z0-9+._~-], and not starting with '.'; safe to use as a single path
// component.

class ExitMapping {
  // Maps a phase's exit code to an Outcome. Total by construction: every non-zero code that is
  // not listed explicitly maps to the fallback given at construction, and that includes the
  // 128 + signo codes of processes killed by a signal. Exit code 0 means SUCCESS unless
  // overridden.

public:
  explicit ExitMapping(Outcome otherwise): otherwise(otherwise) {}

  ExitMapping&& on(int exitCode, Outcome outcome) &&;

  Outcome classify(int exitCode) const;

private:
  struct Entry {
    int exitCode;
    Outcome outcome;
  };

  Outcome otherwise;
  kj::Vector<Entry> entries;
};

struct StagedFile {
  // A file installed into the sandbox right before a phase's command runs.

  kj::String targetPath;
  mode_t mode;
  kj::Maybe<kj::String> content;
  // File content, or null to copy `hostPath` instead.

  kj::String hostPath;
};

StagedFile stageContent(kj::StringPtr targetPath, kj::StringPtr content, mode_t mode = 0644);
StagedFile stageHostFile(kj::StringPtr targetPath, kj::StringPtr hostPath, mode_t mode = 0755);

struct Command {
  kj::Array<kj::String> argv;
  kj::Array<kj::String> env;
  // Extra NAME=VALUE pairs.

  kj::Maybe<kj::String> cwd;
  kj::Array<StagedFile> files;
};

enum class PhaseLocation {
  SANDBOX,
  HOST
};

enum class FailurePolicy {
  HARD,
  // A failure ends the build with the mapped outcome.

  SOFT
  // A failure is logged and the build continues.
};

class BuildLog;

typedef kj::Function<kj::Maybe<Outcome>(int exitCode, kj::StringPtr output, BuildLog& log)>
    ResultHandler;

struct Phase {
  kj::StringPtr name;
  ExitMapping exits;
  kj::Function<Command()> prepare;
  // Builds the command just before it runs, so that it can use state extracted by earlier
  // phases.

  PhaseLocation location = PhaseLocation::SANDBOX;
  FailurePolicy policy = FailurePolicy::HARD;

  bool captureOutput = false;
  // Pass the phase's output to `onResult` in addition to writing it to the build log.

  kj::Maybe<ResultHandler> onResult;
  // Called after every run, successful or not. May record state for later phases. A non-null
  // return replaces the classified outcome, e.g. to fail a phase whose command succeeded but
  // produced something unusable.

  Phase(kj::StringPtr name, ExitMapping&& exits, kj::Function<Command()> prepare)
      : name(name), exits(kj::mv(exits)), prepare(kj::mv(prepare)) {}
};

struct PhaseResult {
  int exitCode;
  Outcome outcome;
};

kj::Promise<PhaseResult> executePhase(Phase& phase, Sandbox& sandbox,
                                      ProcessSupervisor& supervisor);
// Stage the phase's files, run its command inside the sandbox or on the host, and classify the
// result. Exceptions raised along the way (a failed copy, a log write error) propagate.

class BuildBackend {
  // One per build kind. Supplies the ordered phase list and knows how to collect the artifacts
  // the phases produce.

public:
  virtual ~BuildBackend() noexcept(false);

  virtual kj::Array<Phase> phases() = 0;
  // Called once per build, after the sandbox is up.

  virtual kj::Promise<kj::Array<kj::String>> collectArtifacts(
      Sandbox& sandbox, kj::StringPtr artifactDir) = 0;
  // Copy the build's products into `artifactDir` and return their file names.

  virtual kj::Maybe<kj::StringPtr> getMissingDependencies();
  // For DEPENDENCY_FAILED: what could not be installed, if known.
};

class BackendFactory {
public:
  virtual bool isSupported(BuildKind kind) = 0;

  virtual kj::Own<BuildBackend> newBackend(const BuildDescriptor& descriptor) = 0;
  // Throws if the descriptor's parameters are unusable for its kind.
};

class StandardBackendFactory final: public BackendFactory {
  // The build kinds this daemon knows how to run.

public:
  explicit StandardBackendFactory(const Config& config): config(config) {}

  bool isSupported(BuildKind kind) override;
  kj::Own<BuildBackend> newBackend(const BuildDescriptor& descriptor) override;

private:
  const Config& config;
};

}  // namespace buildd

#endif  // BUILDD_BUILD_H_
