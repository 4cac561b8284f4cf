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

#ifndef BUILDD_BUILDER_H_
#define BUILDD_BUILDER_H_

#include <buildd/builder.capnp.h>
#include "engine.h"

namespace buildd {

class BuilderImpl final: public Builder::Server {
  // Exposes a BuildEngine to the dispatcher.

public:
  explicit BuilderImpl(BuildEngine& engine): engine(engine) {}

protected:
  kj::Promise<void> echo(EchoContext context) override;
  kj::Promise<void> info(InfoContext context) override;
  kj::Promise<void> proxyInfo(ProxyInfoContext context) override;
  kj::Promise<void> status(StatusContext context) override;
  kj::Promise<void> build(BuildContext context) override;
  kj::Promise<void> abort(AbortContext context) override;
  kj::Promise<void> clean(CleanContext context) override;
  kj::Promise<void> getFile(GetFileContext context) override;
  kj::Promise<void> ensurePresent(EnsurePresentContext context) override;

private:
  BuildEngine& engine;
};

void fillStatus(const BuilderStatus& status, Status::Builder builder);

BuildOutcome toWire(Outcome outcome);

}  // namespace buildd

#endif  // BUILDD_BUILDER_H_
