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

#ifndef BUILDD_BUILDRECIPE_H_
#define BUILDD_BUILDRECIPE_H_

#include <kj/main.h>
#include "abstract-main.h"

namespace buildd {

kj::Own<AbstractMain> getBuildRecipeMain(kj::ProcessContext& context, kj::StringPtr selfPath);
// `buildd buildrecipe`: run the recipe phases by hand against a sandbox that is already
// unpacked and started, outside the daemon.

}  // namespace buildd

#endif  // BUILDD_BUILDRECIPE_H_
