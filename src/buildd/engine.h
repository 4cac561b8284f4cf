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

#ifndef BUILDD_ENGINE_H_
#define BUILDD_ENGINE_H_

#include <kj/async-io.h>
#include <kj/time.h>
#include "util.h"
#include "build.h"
#include "config.h"

namespace buildd {

class Sandbox;
class SandboxFactory;
class BuildLog;

enum class BuilderState {
  IDLE,
  BUILDING,
  ABORTED,
  // A build is being torn down after an abort or a stall.

  WAITING
  // A finished build's results are waiting to be collected.
};

kj::StringPtr builderStateName(BuilderState state);

enum class Stage {
  PREPARING,
  RUNNING,
  COLLECTING,
  TEARDOWN
};

kj::StringPtr stageName(Stage stage);

enum class Rejection {
  BUSY,
  UNKNOWN_BUILD_KIND,
  UNKNOWN_FILE,
  INVALID
};

kj::StringPtr rejectionName(Rejection rejection);

struct Rejected {
  Rejection code;
  kj::String reason;
};

struct BuilderStatus {
  BuilderState state = BuilderState::IDLE;
  kj::Maybe<kj::String> buildId;
  kj::Maybe<Stage> stage;
  kj::Maybe<uint> phaseIndex;
  kj::Maybe<kj::String> phase;
  kj::String logTail;

  kj::Maybe<Outcome> outcome;
  // Set once a build has finished.

  kj::Array<kj::String> artifacts;
  kj::Maybe<kj::String> missingDependencies;
};

class BuildEngine final: private kj::TaskSet::ErrorHandler {
  // Owns the builder's single build slot and drives the build in it:
  //
  //     PREPARING -> RUNNING(0..n-1) -> COLLECTING -> TEARDOWN -> idle
  //
  // Any stage can be cut short by a failure, an abort or the stall watchdog; teardown always
  // runs. Everything happens on the event loop, so calls from the control surface never race
  // with the build itself.

public:
  BuildEngine(const Config& config, kj::Timer& timer, kj::LowLevelAsyncIoProvider& ioProvider,
              SubprocessSet& subprocesses, SandboxFactory& sandboxFactory,
              BackendFactory& backendFactory);
  ~BuildEngine() noexcept(false);
  KJ_DISALLOW_COPY(BuildEngine);

  kj::Maybe<Rejected> dispatch(BuildDescriptor&& descriptor);
  // Start a build. Returns null if accepted.

  BuilderStatus status();

  bool abort();
  // Request termination of the active build. Returns false if there is nothing to abort. The
  // slot only becomes idle once teardown has finished.

  bool clean();
  // Discard a finished build's result and its working directory. Returns false if there is none.

  kj::Promise<void> whenIdle();
  // Resolves once no build is active.

  kj::Maybe<kj::Array<byte>> readResultFile(kj::StringPtr name);
  // Read one of the retained result's artifacts, or its "buildlog". The log of a private build
  // comes back with credentials stripped. Null if there is no such file.

  bool addToFileCache(kj::StringPtr name, kj::ArrayPtr<const byte> content);
  // Store `content` in the file cache as `name`. A file already present under that name is left
  // alone, in which case this returns false.

  bool isInFileCache(kj::StringPtr name);

  BackendFactory& getBackendFactory() { return backendFactory; }
  const Config& getConfig() { return config; }

private:
  struct Slot;
  struct Result;

  const Config& config;
  kj::Timer& timer;
  kj::LowLevelAsyncIoProvider& ioProvider;
  SubprocessSet& subprocesses;
  SandboxFactory& sandboxFactory;
  BackendFactory& backendFactory;

  kj::Maybe<kj::Own<Slot>> slot;
  kj::Maybe<kj::Own<Result>> result;
  kj::Vector<kj::Own<kj::PromiseFulfiller<void>>> idleWaiters;
  kj::TaskSet tasks;

  kj::Promise<void> runBuild(Slot& slot);
  kj::Promise<void> prepare(Slot& slot);
  kj::Promise<void> runPhases(Slot& slot, uint index);
  kj::Promise<void> collect(Slot& slot);
  kj::Promise<void> watchdog(Slot& slot);
  kj::Promise<void> teardown(Slot& slot);
  void finish(Slot& slot);

  void recordOutcome(Slot& slot, Outcome outcome);
  // The first failure wins.

  void note(Slot& slot, kj::StringPtr message);
  // Write a line to the build log, falling back to the daemon log if that fails.

  void stageFile(kj::StringPtr source, kj::StringPtr target);
  void removeBuildDirectory(kj::StringPtr path);

  void taskFailed(kj::Exception&& exception) override;
};

kj::String seriesFor(const BuildDescriptor& descriptor);
// The distribution series, used for execution quirks: the `distroseries_name` parameter, or
// the part of `suite` before the first '-' (e.g. "noble" from "noble-proposed").

}  // namespace buildd

#endif  // BUILDD_ENGINE_H_
