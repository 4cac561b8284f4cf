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

#ifndef BUILDD_BINARYPACKAGE_H_
#define BUILDD_BINARYPACKAGE_H_

#include "build.h"
#include "debian.h"

namespace buildd {

struct Config;

class BinaryPackageBackend final: public BuildBackend {
  // Builds binary packages from a Debian source package supplied in the file map. sbuild does
  // the work: it runs on the host in the build directory, through a wrapper that points it at
  // the build's chroot, and leaves the .changes file and everything it lists beside the
  // source.

public:
  BinaryPackageBackend(const Config& config, const BuildDescriptor& descriptor);
  // Throws if a required parameter is missing or the file map holds no .dsc.

  kj::Array<Phase> phases() override;
  kj::Promise<kj::Array<kj::String>> collectArtifacts(
      Sandbox& sandbox, kj::StringPtr artifactDir) override;
  kj::Maybe<kj::StringPtr> getMissingDependencies() override;

  kj::StringPtr getDscName() { return dscName; }
  kj::StringPtr getChangesName() { return changesName; }

  Phase sbuild();
  // The phase after the shared update-chroot and upgrade-chroot phases.

private:
  kj::String buildId;
  kj::String buildPath;
  kj::String sbuildPath;
  kj::String architecture;
  kj::String dscName;
  kj::String changesName;
  kj::String suite;
  kj::String component;
  kj::String archivePurpose;
  bool archIndep;
  bool debugSymbols;
  kj::Array<kj::String> archives;
  kj::Maybe<kj::String> trustedKeys;
  kj::Maybe<kj::String> aptProxyUrl;

  kj::Array<kj::String> listed;
  kj::Maybe<kj::String> missingDependency;

  kj::Maybe<Outcome> checkResults(BuildLog& log);
};

struct SbuildVerdict {
  Outcome outcome;
  kj::Maybe<kj::String> missingDependency;
};

SbuildVerdict classifySbuildExit(int exitCode, kj::StringPtr output);
// sbuild exits 0 on success, 1 or 2 if the package failed to build, 3 if the build should be
// given back, and 4 or more if the builder itself is in trouble. A give-back is only trusted if
// the output says why: a missing dependency turns it into DEPENDENCY_FAILED, apt refusing to
// proceed into CHROOT_FAILED so that another builder retries, and anything else counts as a
// plain build failure.

kj::Maybe<kj::String> findDependencyWait(kj::StringPtr output);
// The dependency sbuild could not install, e.g. "libfoo-dev (>= 2.0)" from
// "libfoo-dev(inst 1.0-1 ! >= wanted 2.0)", or a bare package name from apt's "Unable to locate
// package" family of errors. Output after the toolchain version listing is ignored.

}  // namespace buildd

#endif  // BUILDD_BINARYPACKAGE_H_
