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

#ifndef BUILDD_CONFIG_H_
#define BUILDD_CONFIG_H_

#include <kj/string.h>
#include <kj/array.h>
#include <kj/time.h>
#include "util.h"

namespace buildd {

enum class SandboxType {
  CHROOT,
  LXD
};

struct StallOverride {
  kj::String buildKind;
  // Wire name of the build kind, e.g. "sourcepackagerecipe".

  kj::Duration timeout;
};

struct Config {
  kj::String architectureTag = nullptr;
  kj::String buildHome = nullptr;
  kj::String fileCache = nullptr;
  kj::String listen = kj::str("127.0.0.1:8221");
  SandboxType sandbox = SandboxType::CHROOT;

  kj::Duration stallTimeout = 3 * 60 * 60 * kj::SECONDS;
  kj::Array<StallOverride> stallOverrides;
  kj::Duration watchdogInterval = 60 * kj::SECONDS;
  kj::Duration killGrace = 10 * kj::SECONDS;
  kj::Duration abortTimeout = 120 * kj::SECONDS;

  kj::Maybe<kj::String> proxyUrl;
  kj::Maybe<kj::String> aptProxyUrl;
  kj::String gitProxyHelper = kj::str("/usr/lib/buildd/buildd-git-proxy");
  kj::String sbuildPath = kj::str("/usr/share/buildd/bin/sbuild-package");

  kj::Duration getStallTimeout(kj::StringPtr buildKind) const;
  // The inactivity threshold for builds of the given kind.

  kj::String getBuildPath(kj::StringPtr buildId) const;
  // Per-build working directory.
};

Config parseConfig(kj::StringPtr text, kj::Maybe<kj::StringPtr> home);
// Parse config file text. `home` supplies the default for BUILD_HOME, normally $HOME.

Config readConfig(kj::StringPtr path);
// Read and return the config file from `path`.

kj::StringPtr sandboxTypeName(SandboxType type);

}  // namespace buildd

#endif  // BUILDD_CONFIG_H_
