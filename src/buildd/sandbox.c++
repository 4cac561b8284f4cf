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

#include "sandbox.h"
#include "config.h"
#include "chroot.h"
#include "lxd.h"

namespace buildd {

namespace {

const char* const PERSONALITY_32[] = {
  "armel", "armhf", "hppa", "i386", "lpia", "powerpc", "s390", "sparc"
};

const char* const PERSONALITY_64[] = {
  "alpha", "amd64", "arm64", "hppa64", "ia64", "mips64el", "ppc64", "ppc64el", "riscv64",
  "s390x", "sparc64", "x32"
};

const char* const LEGACY_SERIES[] = {
  // These predate the 3.x kernel version scheme and their toolchains treat newer warnings as
  // errors.
  "hardy", "lucid", "maverick", "natty", "oneiric", "precise"
};

template <size_t n>
bool contains(const char* const (&list)[n], kj::StringPtr value) {
  for (auto item: list) {
    if (value == item) return true;
  }
  return false;
}

}  // namespace

bool isKnownArchitecture(kj::StringPtr architectureTag) {
  return contains(PERSONALITY_32, architectureTag) || contains(PERSONALITY_64, architectureTag);
}

ExecutionQuirks resolveQuirks(kj::StringPtr architectureTag, kj::StringPtr series) {
  kj::Vector<kj::String> prefix;
  kj::Vector<kj::String> env;

  if (contains(PERSONALITY_32, architectureTag)) {
    prefix.add(kj::str("linux32"));
  } else if (contains(PERSONALITY_64, architectureTag)) {
    prefix.add(kj::str("linux64"));
  } else {
    KJ_FAIL_REQUIRE("unknown architecture", architectureTag);
  }

  if (contains(LEGACY_SERIES, series)) {
    prefix.add(kj::str("--uname-2.6"));
    env.add(kj::str("DEB_CFLAGS_APPEND=-Wno-error"));
    env.add(kj::str("DEB_CXXFLAGS_APPEND=-Wno-error"));
  }

  return { prefix.releaseAsArray(), env.releaseAsArray() };
}

kj::String formatMode(mode_t mode) {
  char digits[5];
  for (int i = 3; i >= 0; i--) {
    digits[i] = '0' + (mode & 7);
    mode >>= 3;
  }
  digits[4] = '\0';
  return kj::heapString(digits);
}

// =======================================================================================

Sandbox::~Sandbox() noexcept(false) {}

kj::Promise<void> Sandbox::destroy() {
  auto firstError = kj::heap<kj::Maybe<kj::Exception>>();
  auto& error = *firstError;
  auto record = [&error](kj::Exception&& exception) {
    KJ_LOG(ERROR, "sandbox teardown step failed", exception);
    if (error == nullptr) error = kj::mv(exception);
  };

  return kj::evalNow([this]() { return killProcesses(); }).catch_(record)
      .then([this]() { return stop(); }).catch_(record)
      .then([this]() { return remove(); }).catch_(record)
      .then([&error]() {
    KJ_IF_MAYBE(e, error) {
      kj::throwFatalException(kj::mv(*e));
    }
  }).attach(kj::mv(firstError));
}

kj::Own<Sandbox> SystemSandboxFactory::newSandbox(
    kj::StringPtr buildId, kj::StringPtr buildPath, ProcessSupervisor& supervisor) {
  switch (config.sandbox) {
    case SandboxType::CHROOT:
      return kj::heap<ChrootSandbox>(buildPath, supervisor, timer, selfPath);
    case SandboxType::LXD:
      return kj::heap<LxdSandbox>(buildId, buildPath, supervisor);
  }
  KJ_UNREACHABLE;
}

}  // namespace buildd
