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

#include "builder.h"
#include "sandbox.h"

#ifndef BUILDD_VERSION
#define BUILDD_VERSION "(unknown)"
#endif

namespace buildd {

BuildOutcome toWire(Outcome outcome) {
  switch (outcome) {
    case Outcome::SUCCESS: return BuildOutcome::SUCCESS;
    case Outcome::BUILD_FAILED: return BuildOutcome::BUILD_FAILED;
    case Outcome::DEPENDENCY_FAILED: return BuildOutcome::DEPENDENCY_FAILED;
    case Outcome::CHROOT_FAILED: return BuildOutcome::CHROOT_FAILED;
    case Outcome::ABORTED: return BuildOutcome::ABORTED;
    case Outcome::STALLED: return BuildOutcome::STALLED;
    case Outcome::BUILDER_FAILED: return BuildOutcome::BUILDER_FAILED;
  }
  KJ_UNREACHABLE;
}

static Status::State toWire(BuilderState state) {
  switch (state) {
    case BuilderState::IDLE: return Status::State::IDLE;
    case BuilderState::BUILDING: return Status::State::BUILDING;
    case BuilderState::ABORTED: return Status::State::ABORTED;
    case BuilderState::WAITING: return Status::State::WAITING;
  }
  KJ_UNREACHABLE;
}

static BuildRejection::Code toWire(Rejection rejection) {
  switch (rejection) {
    case Rejection::BUSY: return BuildRejection::Code::BUSY;
    case Rejection::UNKNOWN_BUILD_KIND: return BuildRejection::Code::UNKNOWN_BUILD_KIND;
    case Rejection::UNKNOWN_FILE: return BuildRejection::Code::UNKNOWN_FILE;
    case Rejection::INVALID: return BuildRejection::Code::INVALID;
  }
  KJ_UNREACHABLE;
}

void fillStatus(const BuilderStatus& status, Status::Builder builder) {
  builder.setState(toWire(status.state));
  KJ_IF_MAYBE(id, status.buildId) {
    builder.setBuildId(*id);
  }
  KJ_IF_MAYBE(stage, status.stage) {
    builder.setStage(stageName(*stage));
  }
  KJ_IF_MAYBE(phase, status.phase) {
    builder.setPhase(*phase);
  }
  KJ_IF_MAYBE(index, status.phaseIndex) {
    builder.setPhaseIndex(*index);
  }
  builder.setLogTail(status.logTail.asBytes());
  KJ_IF_MAYBE(outcome, status.outcome) {
    builder.setOutcome(toWire(*outcome));
  }
  auto artifacts = builder.initArtifacts(status.artifacts.size());
  for (auto i: kj::indices(status.artifacts)) {
    artifacts.set(i, status.artifacts[i]);
  }
  KJ_IF_MAYBE(deps, status.missingDependencies) {
    builder.setMissingDependencies(*deps);
  }
}

kj::Promise<void> BuilderImpl::echo(EchoContext context) {
  context.getResults().setMessage(context.getParams().getMessage());
  return kj::READY_NOW;
}

kj::Promise<void> BuilderImpl::info(InfoContext context) {
  auto results = context.getResults();
  results.setVersion(BUILDD_VERSION);
  results.setArchitectureTag(engine.getConfig().architectureTag);

  kj::Vector<kj::StringPtr> kinds;
  for (auto kind: allBuildKinds()) {
    if (engine.getBackendFactory().isSupported(kind)) {
      kinds.add(buildKindName(kind));
    }
  }
  auto list = results.initBuildKinds(kinds.size());
  for (auto i: kj::indices(kinds)) {
    list.set(i, kinds[i]);
  }
  return kj::READY_NOW;
}

kj::Promise<void> BuilderImpl::proxyInfo(ProxyInfoContext context) {
  KJ_IF_MAYBE(url, engine.getConfig().proxyUrl) {
    context.getResults().setProxyUrl(*url);
  }
  return kj::READY_NOW;
}

kj::Promise<void> BuilderImpl::status(StatusContext context) {
  fillStatus(engine.status(), context.getResults().initStatus());
  return kj::READY_NOW;
}

kj::Promise<void> BuilderImpl::build(BuildContext context) {
  auto params = context.getParams();
  auto results = context.getResults();

  auto kindName = params.getBuildKind();
  BuildKind kind;
  KJ_IF_MAYBE(k, parseBuildKind(kindName)) {
    kind = *k;
  } else {
    results.setAccepted(false);
    auto rejection = results.initRejection();
    rejection.setCode(BuildRejection::Code::UNKNOWN_BUILD_KIND);
    rejection.setReason(kj::str("unknown build kind: ", kindName));
    return kj::READY_NOW;
  }

  BuildDescriptor descriptor {
    kj::heapString(params.getBuildId()),
    kind,
    kj::heapString(params.getBaseImage()),
    KJ_MAP(entry, params.getFiles()) {
      return FileMapEntry { kj::heapString(entry.getKey()), kj::heapString(entry.getValue()) };
    },
    KJ_MAP(entry, params.getParameters()) {
      return Parameter { kj::heapString(entry.getKey()), kj::heapString(entry.getValue()) };
    }
  };

  KJ_IF_MAYBE(rejected, engine.dispatch(kj::mv(descriptor))) {
    KJ_LOG(WARNING, "rejected build", params.getBuildId(), rejectionName(rejected->code),
           rejected->reason);
    results.setAccepted(false);
    auto rejection = results.initRejection();
    rejection.setCode(toWire(rejected->code));
    rejection.setReason(rejected->reason);
  } else {
    results.setAccepted(true);
  }
  return kj::READY_NOW;
}

kj::Promise<void> BuilderImpl::abort(AbortContext context) {
  context.getResults().setAborted(engine.abort());
  return kj::READY_NOW;
}

kj::Promise<void> BuilderImpl::clean(CleanContext context) {
  context.getResults().setCleaned(engine.clean());
  return kj::READY_NOW;
}

kj::Promise<void> BuilderImpl::getFile(GetFileContext context) {
  auto results = context.getResults();
  KJ_IF_MAYBE(content, engine.readResultFile(context.getParams().getName())) {
    results.setFound(true);
    results.setContent(*content);
  } else {
    results.setFound(false);
  }
  return kj::READY_NOW;
}

kj::Promise<void> BuilderImpl::ensurePresent(EnsurePresentContext context) {
  auto params = context.getParams();
  auto name = params.getName();
  if (params.hasContent()) {
    engine.addToFileCache(name, params.getContent());
  }
  context.getResults().setPresent(engine.isInFileCache(name));
  return kj::READY_NOW;
}

}  // namespace buildd
