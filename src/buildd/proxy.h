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

#ifndef BUILDD_PROXY_H_
#define BUILDD_PROXY_H_
// Tunnels a raw TCP connection through an HTTP forward proxy with CONNECT. Used inside sandboxes
// whose only route out is the proxy, e.g. for git:// fetches.

#include <kj/async-io.h>
#include "util.h"

namespace buildd {

struct ProxyUrl {
  kj::String host;
  uint port;

  kj::Maybe<kj::String> credentials;
  // "user:password", already percent-decoded.
};

ProxyUrl parseProxyUrl(kj::StringPtr url);
// Parse "http://[user[:password]@]host[:port][/]". The port defaults to 8080.

kj::String makeConnectRequest(const ProxyUrl& proxy, kj::StringPtr host, uint port);

class AsyncLineReader: public kj::AsyncIoStream {
  // Wraps a stream to allow reading it line by line, then switching to raw reads without losing
  // anything buffered.

public:
  explicit AsyncLineReader(kj::Own<kj::AsyncIoStream> inner): inner(kj::mv(inner)) {}

  kj::Promise<kj::String> readLine();
  // Read through the next '\n', which is included in the result. Throws DISCONNECTED on EOF.

  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override;
  kj::Maybe<uint64_t> tryGetLength() override;
  kj::Promise<void> write(const void* buffer, size_t size) override;
  kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const byte>> pieces) override;
  kj::Promise<void> whenWriteDisconnected() override;
  void shutdownWrite() override;
  void abortRead() override;

private:
  kj::Own<kj::AsyncIoStream> inner;

  uint fill = 0;
  // Number of bytes in `lineBuffer` that have been filled in.

  char lineBuffer[8192];
};

kj::Promise<kj::Own<kj::AsyncIoStream>> openTunnel(
    kj::Network& network, const ProxyUrl& proxy, kj::StringPtr host, uint port);
// Connect to the proxy and ask it for a tunnel to host:port. Fails unless the proxy answers 200.

kj::Promise<void> relay(kj::AsyncIoStream& tunnel, kj::AsyncInputStream& input,
                        kj::AsyncOutputStream& output);
// Copy `input` into the tunnel and the tunnel into `output`. When `input` ends, the tunnel's
// write side is shut down; resolves once the far end closes the tunnel.

}  // namespace buildd

#endif  // BUILDD_PROXY_H_
