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

#include "engine.h"
#include "sandbox.h"
#include "supervisor.h"
#include "build-log.h"
#include <errno.h>
#include <stdio.h>

namespace buildd {

kj::StringPtr builderStateName(BuilderState state) {
  switch (state) {
    case BuilderState::IDLE: return "IDLE";
    case BuilderState::BUILDING: return "BUILDING";
    case BuilderState::ABORTED: return "ABORTED";
    case BuilderState::WAITING: return "WAITING";
  }
  KJ_UNREACHABLE;
}

kj::StringPtr stageName(Stage stage) {
  switch (stage) {
    case Stage::PREPARING: return "PREPARING";
    case Stage::RUNNING: return "RUNNING";
    case Stage::COLLECTING: return "COLLECTING";
    case Stage::TEARDOWN: return "TEARDOWN";
  }
  KJ_UNREACHABLE;
}

kj::StringPtr rejectionName(Rejection rejection) {
  switch (rejection) {
    case Rejection::BUSY: return "BUSY";
    case Rejection::UNKNOWN_BUILD_KIND: return "UNKNOWN_BUILD_KIND";
    case Rejection::UNKNOWN_FILE: return "UNKNOWN_FILE";
    case Rejection::INVALID: return "INVALID";
  }
  KJ_UNREACHABLE;
}

kj::String seriesFor(const BuildDescriptor& descriptor) {
  KJ_IF_MAYBE(series, descriptor.findParameter("distroseries_name")) {
    return kj::heapString(*series);
  }
  auto suite = descriptor.getParameter("suite", "");
  KJ_IF_MAYBE(dash, suite.findFirst('-')) {
    return kj::heapString(suite.slice(0, *dash));
  }
  return kj::heapString(suite);
}

// =======================================================================================

struct BuildEngine::Slot {
  BuildDescriptor descriptor;
  kj::String buildPath;
  kj::Own<BuildLog> log;
  ProcessSupervisor supervisor;
  kj::Own<BuildBackend> backend;
  kj::Maybe<kj::Own<Sandbox>> sandbox;
  kj::Array<Phase> phases;
  // Declared after `backend` because the phases point into it.

  kj::Duration stallTimeout;
  bool privateArchive;

  kj::Maybe<kj::String> brokenLog;
  // Why the build log couldn't be opened; the build is failed in PREPARING.

  Stage stage = Stage::PREPARING;
  kj::Maybe<uint> phaseIndex;
  kj::Maybe<Outcome> outcome;
  bool terminating = false;
  kj::Array<kj::String> artifacts;

  kj::Own<kj::PromiseFulfiller<void>> abortFulfiller;

  Slot(BuildDescriptor&& descriptor, kj::String buildPath, kj::Own<BuildLog> log,
       kj::Own<BuildBackend> backend, kj::LowLevelAsyncIoProvider& ioProvider,
       SubprocessSet& subprocesses, kj::Timer& timer, const Config& config)
      : descriptor(kj::mv(descriptor)), buildPath(kj::mv(buildPath)), log(kj::mv(log)),
        supervisor(ioProvider, subprocesses, timer, *this->log), backend(kj::mv(backend)),
        stallTimeout(config.getStallTimeout(buildKindName(this->descriptor.kind))),
        privateArchive(this->descriptor.getFlag("archive_private")) {}
};

struct BuildEngine::Result {
  kj::String buildId;
  kj::String buildPath;
  Outcome outcome;
  kj::Array<kj::String> artifacts;
  kj::Maybe<kj::String> missingDependencies;
  kj::Array<byte> logTail;
  bool privateArchive;
};

static kj::String formatTail(kj::ArrayPtr<const byte> tail, bool privateArchive) {
  if (privateArchive) {
    return sanitizeLogTail(tail);
  } else {
    return kj::heapString(tail.asChars());
  }
}

BuildEngine::BuildEngine(const Config& config, kj::Timer& timer,
                         kj::LowLevelAsyncIoProvider& ioProvider, SubprocessSet& subprocesses,
                         SandboxFactory& sandboxFactory, BackendFactory& backendFactory)
    : config(config), timer(timer), ioProvider(ioProvider), subprocesses(subprocesses),
      sandboxFactory(sandboxFactory), backendFactory(backendFactory), tasks(*this) {}

BuildEngine::~BuildEngine() noexcept(false) {}

kj::Maybe<Rejected> BuildEngine::dispatch(BuildDescriptor&& descriptor) {
  KJ_IF_MAYBE(active, slot) {
    return Rejected { Rejection::BUSY,
        kj::str("builder is busy with build ", (*active)->descriptor.buildId) };
  }

  KJ_IF_MAYBE(problem, validateDescriptor(descriptor)) {
    return Rejected { Rejection::INVALID, kj::mv(*problem) };
  }

  if (!backendFactory.isSupported(descriptor.kind)) {
    return Rejected { Rejection::UNKNOWN_BUILD_KIND,
        kj::str("unsupported build kind: ", buildKindName(descriptor.kind)) };
  }

  if (!pathExists(kj::str(config.fileCache, "/", descriptor.baseImage))) {
    return Rejected { Rejection::UNKNOWN_FILE,
        kj::str("base image not in file cache: ", descriptor.baseImage) };
  }
  for (auto& file: descriptor.files) {
    if (!pathExists(kj::str(config.fileCache, "/", file.contentRef))) {
      return Rejected { Rejection::UNKNOWN_FILE,
          kj::str("file not in file cache: ", file.contentRef) };
    }
  }

  kj::Maybe<kj::Own<BuildBackend>> maybeBackend;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    maybeBackend = backendFactory.newBackend(descriptor);
  })) {
    return Rejected { Rejection::INVALID, kj::str(exception->getDescription()) };
  }
  auto backend = kj::mv(KJ_ASSERT_NONNULL(maybeBackend));

  // Accepted. A new build supersedes results nobody collected.
  clean();

  auto buildPath = config.getBuildPath(descriptor.buildId);
  kj::Maybe<kj::Own<BuildLog>> maybeLog;
  kj::Maybe<kj::String> brokenLog;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    recursivelyCreateParent(kj::str(buildPath, "/buildlog"));
    maybeLog = BuildLog::open(timer, kj::str(buildPath, "/buildlog"));
  })) {
    KJ_LOG(ERROR, "couldn't open build log", buildPath, *exception);
    brokenLog = kj::str(exception->getDescription());
    maybeLog = kj::heap<BuildLog>(timer, nullptr);
  }

  KJ_LOG(INFO, "starting build", descriptor.buildId, buildKindName(descriptor.kind));

  auto newSlot = kj::heap<Slot>(kj::mv(descriptor), kj::mv(buildPath),
                                kj::mv(KJ_ASSERT_NONNULL(maybeLog)), kj::mv(backend),
                                ioProvider, subprocesses, timer, config);
  newSlot->brokenLog = kj::mv(brokenLog);
  auto& ref = *newSlot;
  slot = kj::mv(newSlot);
  tasks.add(runBuild(ref));
  return nullptr;
}

BuilderStatus BuildEngine::status() {
  BuilderStatus result;

  KJ_IF_MAYBE(active, slot) {
    Slot& s = **active;
    result.state = s.terminating ? BuilderState::ABORTED : BuilderState::BUILDING;
    result.buildId = kj::heapString(s.descriptor.buildId);
    result.stage = s.stage;
    KJ_IF_MAYBE(index, s.phaseIndex) {
      result.phaseIndex = *index;
      result.phase = kj::heapString(s.phases[*index].name);
    }
    result.logTail = formatTail(s.log->getTail(), s.privateArchive);
  } else KJ_IF_MAYBE(finished, this->result) {
    Result& r = **finished;
    result.state = r.outcome == Outcome::ABORTED ? BuilderState::IDLE : BuilderState::WAITING;
    result.buildId = kj::heapString(r.buildId);
    result.outcome = r.outcome;
    result.artifacts = KJ_MAP(name, r.artifacts) { return kj::heapString(name); };
    KJ_IF_MAYBE(deps, r.missingDependencies) {
      result.missingDependencies = kj::heapString(*deps);
    }
    result.logTail = formatTail(r.logTail, r.privateArchive);
  } else {
    result.logTail = kj::heapString("");
  }

  return result;
}

bool BuildEngine::abort() {
  KJ_IF_MAYBE(active, slot) {
    Slot& s = **active;
    if (s.terminating || s.stage == Stage::TEARDOWN) {
      // Already on its way out.
      return false;
    }

    KJ_LOG(INFO, "aborting build", s.descriptor.buildId);
    note(s, "Build aborted by request.");
    recordOutcome(s, Outcome::ABORTED);
    s.terminating = true;
    s.abortFulfiller->fulfill();
    return true;
  } else {
    return false;
  }
}

bool BuildEngine::clean() {
  KJ_IF_MAYBE(finished, result) {
    auto path = kj::mv((*finished)->buildPath);
    result = nullptr;
    removeBuildDirectory(path);
    return true;
  } else {
    return false;
  }
}

kj::Maybe<kj::Array<byte>> BuildEngine::readResultFile(kj::StringPtr name) {
  KJ_IF_MAYBE(finished, result) {
    Result& retained = **finished;
    bool listed = name == "buildlog";
    for (auto& artifact: retained.artifacts) {
      if (artifact == name) listed = true;
    }
    if (!listed) return nullptr;

    auto path = kj::str(retained.buildPath, "/", name);
    if (!pathExists(path)) return nullptr;

    auto content = readAll(path);
    if (name == "buildlog" && retained.privateArchive) {
      content = sanitizeLog(content);
    }
    return kj::heapArray(content.asBytes());
  } else {
    return nullptr;
  }
}

bool BuildEngine::addToFileCache(kj::StringPtr name, kj::ArrayPtr<const byte> content) {
  auto path = kj::str(config.fileCache, "/", name);
  if (isInFileCache(name)) return false;

  // Dispatch must never find a partially written file. isSafeName() rejects the leading dot, so
  // the temporary name can't collide with a real entry.
  auto partial = kj::str(config.fileCache, "/.partial-", name);
  writeFile(partial, content);
  KJ_SYSCALL(rename(partial.cStr(), path.cStr()), path);
  KJ_LOG(INFO, "added to file cache", name, content.size());
  return true;
}

bool BuildEngine::isInFileCache(kj::StringPtr name) {
  KJ_REQUIRE(isSafeName(name), "invalid file cache name", name);
  return pathExists(kj::str(config.fileCache, "/", name));
}

kj::Promise<void> BuildEngine::whenIdle() {
  if (slot == nullptr) return kj::READY_NOW;
  auto paf = kj::newPromiseAndFulfiller<void>();
  idleWaiters.add(kj::mv(paf.fulfiller));
  return kj::mv(paf.promise);
}

// =======================================================================================

kj::Promise<void> BuildEngine::runBuild(Slot& slot) {
  auto paf = kj::newPromiseAndFulfiller<void>();
  slot.abortFulfiller = kj::mv(paf.fulfiller);

  auto work = kj::evalNow([this,&slot]() { return prepare(slot); })
      .then([this,&slot]() { return runPhases(slot, 0); })
      .then([this,&slot]() { return collect(slot); });

  // Whichever comes first: the build finishing, an abort, or a stall. The losers are canceled,
  // which kills nothing by itself; teardown does that.
  return work
      .exclusiveJoin(kj::mv(paf.promise))
      .exclusiveJoin(watchdog(slot))
      .catch_([this,&slot](kj::Exception&& exception) {
    KJ_LOG(ERROR, "build failed with internal error", slot.descriptor.buildId, exception);
    note(slot, kj::str("Internal error: ", exception.getDescription()));
    recordOutcome(slot, Outcome::CHROOT_FAILED);
  }).then([this,&slot]() {
    return teardown(slot);
  }).then([this,&slot]() {
    finish(slot);
  });
}

kj::Promise<void> BuildEngine::prepare(Slot& slot) {
  slot.stage = Stage::PREPARING;

  // Conditions that mean this builder is broken rather than the build.
  KJ_IF_MAYBE(problem, slot.brokenLog) {
    recordOutcome(slot, Outcome::BUILDER_FAILED);
    KJ_FAIL_REQUIRE("couldn't open build log", *problem);
  }
  if (!isDirectory(config.fileCache)) {
    recordOutcome(slot, Outcome::BUILDER_FAILED);
    KJ_FAIL_REQUIRE("file cache is missing", config.fileCache);
  }
  auto imagePath = kj::str(config.fileCache, "/", slot.descriptor.baseImage);
  if (!pathExists(imagePath)) {
    recordOutcome(slot, Outcome::BUILDER_FAILED);
    KJ_FAIL_REQUIRE("base image disappeared from file cache", imagePath);
  }
  if (pathExists(kj::str(slot.buildPath, "/chroot-autobuild"))) {
    recordOutcome(slot, Outcome::BUILDER_FAILED);
    KJ_FAIL_REQUIRE("a sandbox from an earlier build is still present", slot.buildPath);
  }

  for (auto& file: slot.descriptor.files) {
    stageFile(kj::str(config.fileCache, "/", file.contentRef),
              kj::str(slot.buildPath, "/", file.name));
  }

  auto architecture = slot.descriptor.getParameter("arch_tag", config.architectureTag);
  auto quirks = resolveQuirks(architecture, seriesFor(slot.descriptor));

  auto newSandbox = sandboxFactory.newSandbox(
      slot.descriptor.buildId, slot.buildPath, slot.supervisor);
  newSandbox->setQuirks(kj::mv(quirks));
  auto& sandbox = *newSandbox;
  slot.sandbox = kj::mv(newSandbox);

  return sandbox.create(imagePath).then([&sandbox]() {
    return sandbox.start();
  }).then([&slot]() {
    slot.phases = slot.backend->phases();
  });
}

kj::Promise<void> BuildEngine::runPhases(Slot& slot, uint index) {
  if (index >= slot.phases.size()) return kj::READY_NOW;

  slot.stage = Stage::RUNNING;
  slot.phaseIndex = index;
  auto& phase = slot.phases[index];
  auto& sandbox = *KJ_ASSERT_NONNULL(slot.sandbox);

  return executePhase(phase, sandbox, slot.supervisor)
      .then([this,&slot,&phase,index](PhaseResult result) -> kj::Promise<void> {
    if (result.outcome != Outcome::SUCCESS) {
      if (phase.policy == FailurePolicy::SOFT) {
        note(slot, kj::str("Phase ", phase.name, " failed with exit code ", result.exitCode,
                           "; continuing."));
      } else {
        note(slot, kj::str("Phase ", phase.name, " failed with exit code ", result.exitCode,
                           ": ", outcomeName(result.outcome)));
        recordOutcome(slot, result.outcome);
        return kj::READY_NOW;
      }
    }
    return runPhases(slot, index + 1);
  });
}

kj::Promise<void> BuildEngine::collect(Slot& slot) {
  if (slot.outcome != nullptr) return kj::READY_NOW;

  slot.stage = Stage::COLLECTING;
  auto& sandbox = *KJ_ASSERT_NONNULL(slot.sandbox);
  return slot.backend->collectArtifacts(sandbox, slot.buildPath)
      .then([this,&slot](kj::Array<kj::String> artifacts) {
    slot.artifacts = kj::mv(artifacts);
    recordOutcome(slot, Outcome::SUCCESS);
  });
}

kj::Promise<void> BuildEngine::watchdog(Slot& slot) {
  return timer.afterDelay(config.watchdogInterval).then([this,&slot]() -> kj::Promise<void> {
    auto quiet = timer.now() - slot.log->getLastActivity();
    if (quiet < slot.stallTimeout) {
      return watchdog(slot);
    }

    KJ_LOG(WARNING, "build stalled", slot.descriptor.buildId, quiet / kj::SECONDS);
    note(slot, kj::str("STALLED: no output for ", quiet / kj::SECONDS,
                       " seconds; terminating the build."));
    recordOutcome(slot, Outcome::STALLED);
    slot.terminating = true;
    return kj::READY_NOW;
  });
}

kj::Promise<void> BuildEngine::teardown(Slot& slot) {
  slot.stage = Stage::TEARDOWN;

  auto work = kj::evalNow([this,&slot]() -> kj::Promise<void> {
    bool commandRunning = slot.supervisor.isRunning();
    auto terminated = slot.supervisor.terminate(config.killGrace);
    KJ_IF_MAYBE(sandbox, slot.sandbox) {
      if (commandRunning) {
        // Commands in a chroot run as root through sudo, out of reach of our signals. The
        // sandbox's own reaper can get at them, so it runs alongside terminate().
        auto reaped = (*sandbox)->killProcesses().catch_([&slot](kj::Exception&& exception) {
          KJ_LOG(ERROR, "couldn't reap sandbox processes", slot.descriptor.buildId, exception);
        });
        auto both = kj::heapArrayBuilder<kj::Promise<void>>(2);
        both.add(kj::mv(terminated));
        both.add(kj::mv(reaped));
        return kj::joinPromises(both.finish());
      }
    }
    return kj::mv(terminated);
  }).then([&slot]() -> kj::Promise<void> {
    KJ_IF_MAYBE(sandbox, slot.sandbox) {
      return (*sandbox)->destroy();
    } else {
      return kj::READY_NOW;
    }
  }).catch_([this,&slot](kj::Exception&& exception) {
    KJ_LOG(ERROR, "sandbox teardown failed", slot.descriptor.buildId, exception);
    note(slot, kj::str("Sandbox teardown failed: ", exception.getDescription()));
    KJ_IF_MAYBE(outcome, slot.outcome) {
      if (*outcome == Outcome::SUCCESS) slot.outcome = Outcome::CHROOT_FAILED;
    } else {
      slot.outcome = Outcome::CHROOT_FAILED;
    }
  });

  auto timeout = timer.afterDelay(config.abortTimeout).then([this,&slot]() {
    KJ_LOG(ERROR, "sandbox teardown timed out", slot.descriptor.buildId);
    note(slot, "Failed to kill all processes.");
    slot.outcome = Outcome::BUILDER_FAILED;
  });

  return work.exclusiveJoin(kj::mv(timeout));
}

void BuildEngine::finish(Slot& slot) {
  Outcome outcome = Outcome::CHROOT_FAILED;
  KJ_IF_MAYBE(o, slot.outcome) {
    outcome = *o;
  }

  kj::Maybe<kj::String> missing;
  if (outcome == Outcome::DEPENDENCY_FAILED) {
    KJ_IF_MAYBE(deps, slot.backend->getMissingDependencies()) {
      missing = kj::heapString(*deps);
    }
  }

  note(slot, kj::str("Build finished: ", outcomeName(outcome)));
  KJ_LOG(INFO, "build finished", slot.descriptor.buildId, outcomeName(outcome));

  auto finished = kj::heap<Result>();
  finished->buildId = kj::heapString(slot.descriptor.buildId);
  finished->buildPath = kj::heapString(slot.buildPath);
  finished->outcome = outcome;
  if (outcome == Outcome::SUCCESS) {
    finished->artifacts = kj::mv(slot.artifacts);
  }
  finished->missingDependencies = kj::mv(missing);
  finished->logTail = slot.log->getTail();
  finished->privateArchive = slot.privateArchive;
  result = kj::mv(finished);

  // `slot` is gone after this.
  this->slot = nullptr;

  auto waiters = kj::mv(idleWaiters);
  for (auto& waiter: waiters) {
    waiter->fulfill();
  }
}

void BuildEngine::recordOutcome(Slot& slot, Outcome outcome) {
  if (slot.outcome == nullptr) {
    slot.outcome = outcome;
  }
}

void BuildEngine::note(Slot& slot, kj::StringPtr message) {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    slot.log->write(kj::str(message, "\n"));
  })) {
    KJ_LOG(ERROR, "couldn't write to build log", slot.descriptor.buildId, message, *exception);
  }
}

void BuildEngine::stageFile(kj::StringPtr source, kj::StringPtr target) {
  // Hard-link from the cache; fall back to copying across filesystems.
  KJ_SYSCALL_HANDLE_ERRORS(link(source.cStr(), target.cStr())) {
    case EXDEV: {
      struct stat stats;
      KJ_SYSCALL(stat(source.cStr(), &stats), source);
      auto content = readAll(source);
      writeFile(target, content, stats.st_mode & 07777);
      break;
    }
    default:
      KJ_FAIL_SYSCALL("link(source, target)", error, source, target);
  }
}

void BuildEngine::removeBuildDirectory(kj::StringPtr path) {
  if (pathExists(path)) {
    KJ_LOG(INFO, "removing build directory", path);
    recursivelyDelete(path);
  }
}

void BuildEngine::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "build task failed", exception);
}

}  // namespace buildd
