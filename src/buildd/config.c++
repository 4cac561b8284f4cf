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

#include "config.h"
#include <stdlib.h>
#include <string.h>

namespace buildd {

kj::StringPtr sandboxTypeName(SandboxType type) {
  switch (type) {
    case SandboxType::CHROOT: return "chroot";
    case SandboxType::LXD: return "lxd";
  }
  KJ_UNREACHABLE;
}

static kj::Duration parseSeconds(kj::StringPtr key, kj::StringPtr value) {
  KJ_IF_MAYBE(n, parseUInt(value, 10)) {
    KJ_REQUIRE(*n > 0, "config value must be positive", key, value);
    return *n * kj::SECONDS;
  } else {
    KJ_FAIL_REQUIRE("invalid config value", key, value);
  }
}

kj::Duration Config::getStallTimeout(kj::StringPtr buildKind) const {
  for (auto& o: stallOverrides) {
    if (o.buildKind == buildKind) return o.timeout;
  }
  return stallTimeout;
}

kj::String Config::getBuildPath(kj::StringPtr buildId) const {
  KJ_REQUIRE(buildId.size() > 0 && buildId.findFirst('/') == nullptr && buildId != "." &&
             buildId != "..", "invalid build id", buildId);
  return kj::str(buildHome, "/build-", buildId);
}

Config parseConfig(kj::StringPtr text, kj::Maybe<kj::StringPtr> home) {
  Config config;
  kj::Vector<StallOverride> overrides;

  for (auto& line: splitLines(text)) {
    auto equalsPos = KJ_ASSERT_NONNULL(line.findFirst('='), "Invalid config line", line);
    auto key = trim(line.slice(0, equalsPos));
    auto value = trim(line.slice(equalsPos + 1));

    if (key == "ARCHITECTURE_TAG") {
      config.architectureTag = kj::mv(value);
    } else if (key == "BUILD_HOME") {
      // Strip trailing slashes so that paths can be built by simple concatenation.
      size_t desiredLength = value.size();
      while (desiredLength > 1 && value[desiredLength-1] == '/') {
        desiredLength -= 1;
      }
      config.buildHome = kj::str(value.slice(0, desiredLength));
    } else if (key == "FILECACHE") {
      config.fileCache = kj::mv(value);
    } else if (key == "LISTEN") {
      config.listen = kj::mv(value);
    } else if (key == "SANDBOX") {
      if (value == "chroot") {
        config.sandbox = SandboxType::CHROOT;
      } else if (value == "lxd") {
        config.sandbox = SandboxType::LXD;
      } else {
        KJ_FAIL_REQUIRE("invalid config value SANDBOX", value);
      }
    } else if (key == "STALL_TIMEOUT") {
      config.stallTimeout = parseSeconds(key, value);
    } else if (key.startsWith("STALL_TIMEOUT_")) {
      auto kind = kj::heapString(key.slice(strlen("STALL_TIMEOUT_")));
      toLower(kind);
      for (char& c: kind) {
        if (c == '_') c = '-';
      }
      auto timeout = parseSeconds(key, value);
      overrides.add(StallOverride { kj::mv(kind), timeout });
    } else if (key == "WATCHDOG_INTERVAL") {
      config.watchdogInterval = parseSeconds(key, value);
    } else if (key == "KILL_GRACE") {
      config.killGrace = parseSeconds(key, value);
    } else if (key == "ABORT_TIMEOUT") {
      config.abortTimeout = parseSeconds(key, value);
    } else if (key == "PROXY_URL") {
      if (value.size() > 0) config.proxyUrl = kj::mv(value);
    } else if (key == "APT_PROXY_URL") {
      if (value.size() > 0) config.aptProxyUrl = kj::mv(value);
    } else if (key == "GIT_PROXY_HELPER") {
      config.gitProxyHelper = kj::mv(value);
    } else if (key == "SBUILD_PATH") {
      config.sbuildPath = kj::mv(value);
    } else {
      KJ_LOG(WARNING, "Ignoring unrecognized config option", key);
    }
  }

  config.stallOverrides = overrides.releaseAsArray();

  KJ_REQUIRE(config.architectureTag != nullptr && config.architectureTag.size() > 0,
             "config is missing ARCHITECTURE_TAG");

  if (config.buildHome == nullptr) {
    KJ_IF_MAYBE(h, home) {
      config.buildHome = kj::heapString(*h);
    } else {
      KJ_FAIL_REQUIRE("config is missing BUILD_HOME and $HOME is not set");
    }
  }

  if (config.fileCache == nullptr) {
    config.fileCache = kj::str(config.buildHome, "/filecache");
  }

  return config;
}

Config readConfig(kj::StringPtr path) {
  kj::Maybe<kj::StringPtr> home;
  const char* env = getenv("HOME");
  if (env != nullptr && *env != '\0') {
    home = kj::StringPtr(env);
  }
  return parseConfig(readAll(path), home);
}

}  // namespace buildd
