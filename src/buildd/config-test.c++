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
#include <kj/test.h>

namespace buildd {
namespace {

KJ_TEST("parseConfig defaults") {
  auto config = parseConfig("ARCHITECTURE_TAG=amd64\n", kj::StringPtr("/home/buildd"));
  KJ_EXPECT(config.architectureTag == "amd64");
  KJ_EXPECT(config.buildHome == "/home/buildd");
  KJ_EXPECT(config.fileCache == "/home/buildd/filecache");
  KJ_EXPECT(config.listen == "127.0.0.1:8221");
  KJ_EXPECT(config.sandbox == SandboxType::CHROOT);
  KJ_EXPECT(config.stallTimeout == 10800 * kj::SECONDS);
  KJ_EXPECT(config.abortTimeout == 120 * kj::SECONDS);
  KJ_EXPECT(config.proxyUrl == nullptr);
  KJ_EXPECT(config.sbuildPath == "/usr/share/buildd/bin/sbuild-package");
  KJ_EXPECT(config.getBuildPath("1-2") == "/home/buildd/build-1-2");
}

KJ_TEST("parseConfig overrides") {
  auto config = parseConfig(
      "# builder configuration\n"
      "ARCHITECTURE_TAG = armhf\n"
      "BUILD_HOME=/srv/buildd//\n"
      "FILECACHE=/var/cache/buildd\n"
      "LISTEN=unix:/run/buildd.sock\n"
      "SANDBOX=lxd\n"
      "STALL_TIMEOUT=600\n"
      "STALL_TIMEOUT_SOURCEPACKAGERECIPE=1200\n"
      "STALL_TIMEOUT_TRANSLATION_TEMPLATES=60\n"
      "KILL_GRACE=3\n"
      "PROXY_URL=http://proxy.example:3128\n"
      "APT_PROXY_URL=\n"
      "SBUILD_PATH=/opt/sbuild/sbuild-package\n"
      "SOMETHING_ELSE=ignored\n",
      nullptr);

  KJ_EXPECT(config.architectureTag == "armhf");
  KJ_EXPECT(config.buildHome == "/srv/buildd");
  KJ_EXPECT(config.fileCache == "/var/cache/buildd");
  KJ_EXPECT(config.listen == "unix:/run/buildd.sock");
  KJ_EXPECT(config.sandbox == SandboxType::LXD);
  KJ_EXPECT(config.killGrace == 3 * kj::SECONDS);
  KJ_EXPECT(KJ_ASSERT_NONNULL(config.proxyUrl) == "http://proxy.example:3128");
  KJ_EXPECT(config.aptProxyUrl == nullptr);
  KJ_EXPECT(config.sbuildPath == "/opt/sbuild/sbuild-package");

  KJ_EXPECT(config.getStallTimeout("sourcepackagerecipe") == 1200 * kj::SECONDS);
  KJ_EXPECT(config.getStallTimeout("translation-templates") == 60 * kj::SECONDS);
  KJ_EXPECT(config.getStallTimeout("binarypackage") == 600 * kj::SECONDS);
}

KJ_TEST("parseConfig errors") {
  KJ_EXPECT_THROW_MESSAGE("ARCHITECTURE_TAG",
      parseConfig("SANDBOX=chroot\n", kj::StringPtr("/home/buildd")));
  KJ_EXPECT_THROW_MESSAGE("invalid config value SANDBOX",
      parseConfig("ARCHITECTURE_TAG=amd64\nSANDBOX=vm\n", kj::StringPtr("/home/buildd")));
  KJ_EXPECT_THROW_MESSAGE("invalid config value",
      parseConfig("ARCHITECTURE_TAG=amd64\nSTALL_TIMEOUT=soon\n", kj::StringPtr("/home/buildd")));
  KJ_EXPECT_THROW_MESSAGE("Invalid config line",
      parseConfig("ARCHITECTURE_TAG\n", kj::StringPtr("/home/buildd")));
  KJ_EXPECT_THROW_MESSAGE("BUILD_HOME",
      parseConfig("ARCHITECTURE_TAG=amd64\n", nullptr));

  auto config = parseConfig("ARCHITECTURE_TAG=amd64\n", kj::StringPtr("/home/buildd"));
  KJ_EXPECT_THROW_MESSAGE("invalid build id", config.getBuildPath("../etc"));
  KJ_EXPECT_THROW_MESSAGE("invalid build id", config.getBuildPath(""));
}

}  // namespace
}  // namespace buildd
