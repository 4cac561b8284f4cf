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

#include "proxy.h"
#include <kj/encoding.h>
#include <string.h>

namespace buildd {

ProxyUrl parseProxyUrl(kj::StringPtr url) {
  KJ_REQUIRE(url.startsWith("http://"), "proxy URL must start with http://", url);
  kj::StringPtr rest = url.slice(strlen("http://"));

  kj::ArrayPtr<const char> authority = rest;
  KJ_IF_MAYBE(slash, rest.findFirst('/')) {
    authority = rest.slice(0, *slash);
  }
  auto authorityText = kj::str(authority);

  ProxyUrl result;
  kj::StringPtr hostPort = authorityText;
  KJ_IF_MAYBE(at, authorityText.findLast('@')) {
    auto userInfo = kj::str(authorityText.slice(0, *at));
    auto decoded = kj::decodeUriComponent(userInfo);
    KJ_REQUIRE(!decoded.hadErrors, "invalid escape in proxy credentials");
    result.credentials = kj::mv(decoded);
    hostPort = authorityText.slice(*at + 1);
  }

  kj::ArrayPtr<const char> host = hostPort;
  kj::Maybe<kj::StringPtr> portText;
  if (hostPort.startsWith("[")) {
    // IPv6 literal.
    auto close = KJ_REQUIRE_NONNULL(hostPort.findFirst(']'), "invalid proxy host", url);
    host = hostPort.slice(1, close);
    auto after = hostPort.slice(close + 1);
    if (after.size() > 0) {
      KJ_REQUIRE(after.startsWith(":"), "invalid proxy host", url);
      portText = after.slice(1);
    }
  } else KJ_IF_MAYBE(colon, hostPort.findLast(':')) {
    host = hostPort.slice(0, *colon);
    portText = hostPort.slice(*colon + 1);
  }

  KJ_REQUIRE(host.size() > 0, "proxy URL has no host", url);
  result.host = kj::str(host);

  result.port = 8080;
  KJ_IF_MAYBE(p, portText) {
    auto port = KJ_REQUIRE_NONNULL(parseUInt(*p, 10), "invalid proxy port", url);
    KJ_REQUIRE(port > 0 && port < 65536, "invalid proxy port", url);
    result.port = port;
  }

  return result;
}

kj::String makeConnectRequest(const ProxyUrl& proxy, kj::StringPtr host, uint port) {
  kj::Vector<kj::String> lines;
  lines.add(kj::str("CONNECT ", host, ":", port, " HTTP/1.1"));
  lines.add(kj::str("Host: ", host, ":", port));
  KJ_IF_MAYBE(credentials, proxy.credentials) {
    lines.add(kj::str("Proxy-Authorization: Basic ",
                      kj::encodeBase64(credentials->asBytes())));
  }
  lines.add(kj::str(""));
  lines.add(kj::str(""));
  return kj::strArray(lines, "\r\n");
}

// =======================================================================================

kj::Promise<kj::String> AsyncLineReader::readLine() {
  char* end = reinterpret_cast<char*>(memchr(lineBuffer, '\n', fill));
  if (end == nullptr) {
    if (fill == sizeof(lineBuffer)) {
      return KJ_EXCEPTION(FAILED, "line too long");
    }
    return inner->tryRead(lineBuffer + fill, 1, sizeof(lineBuffer) - fill)
        .then([this](size_t amount) -> kj::Promise<kj::String> {
      if (amount == 0) {
        return KJ_EXCEPTION(DISCONNECTED, "connection closed mid-line");
      }
      fill += amount;
      return readLine();
    });
  }

  size_t len = end - lineBuffer + 1;
  auto result = kj::heapString(lineBuffer, len);
  fill -= len;
  memmove(lineBuffer, lineBuffer + len, fill);
  return kj::mv(result);
}

kj::Promise<size_t> AsyncLineReader::tryRead(void* buffer, size_t minBytes, size_t maxBytes) {
  if (fill == 0) {
    return inner->tryRead(buffer, minBytes, maxBytes);
  }

  size_t n = kj::min(fill, maxBytes);
  memcpy(buffer, lineBuffer, n);
  fill -= n;
  memmove(lineBuffer, lineBuffer + n, fill);
  if (n >= minBytes) {
    return n;
  }
  return inner->tryRead(reinterpret_cast<char*>(buffer) + n, minBytes - n, maxBytes - n)
      .then([n](size_t amount) { return n + amount; });
}

kj::Maybe<uint64_t> AsyncLineReader::tryGetLength() {
  return inner->tryGetLength().map([this](uint64_t size) { return size + fill; });
}

kj::Promise<void> AsyncLineReader::write(const void* buffer, size_t size) {
  return inner->write(buffer, size);
}

kj::Promise<void> AsyncLineReader::write(kj::ArrayPtr<const kj::ArrayPtr<const byte>> pieces) {
  return inner->write(pieces);
}

kj::Promise<void> AsyncLineReader::whenWriteDisconnected() {
  return inner->whenWriteDisconnected();
}

void AsyncLineReader::shutdownWrite() {
  inner->shutdownWrite();
}

void AsyncLineReader::abortRead() {
  inner->abortRead();
}

// =======================================================================================

static kj::Promise<void> readResponseHeaders(AsyncLineReader& reader) {
  return reader.readLine().then([&reader](kj::String line) -> kj::Promise<void> {
    if (trimArray(line).size() == 0) return kj::READY_NOW;
    return readResponseHeaders(reader);
  });
}

kj::Promise<kj::Own<kj::AsyncIoStream>> openTunnel(
    kj::Network& network, const ProxyUrl& proxy, kj::StringPtr host, uint port) {
  auto request = makeConnectRequest(proxy, host, port);
  return network.parseAddress(proxy.host, proxy.port)
      .then([](kj::Own<kj::NetworkAddress> address) {
    return address->connect().attach(kj::mv(address));
  }).then([KJ_MVCAP(request)](kj::Own<kj::AsyncIoStream> connection) {
    auto reader = kj::heap<AsyncLineReader>(kj::mv(connection));
    auto promise = reader->write(request.begin(), request.size());
    return promise.attach(kj::mv(request)).then([KJ_MVCAP(reader)]() mutable {
      auto promise = reader->readLine();
      return promise.then([KJ_MVCAP(reader)](kj::String statusLine) mutable {
        // "HTTP/1.1 200 Connection established"
        auto fields = splitSpace(statusLine);
        KJ_REQUIRE(fields.size() >= 2 && fields[0].size() >= 5 &&
                   memcmp(fields[0].begin(), "HTTP/", 5) == 0 &&
                   kj::str(fields[1]) == "200",
                   "proxy refused tunnel", trim(statusLine));
        auto promise = readResponseHeaders(*reader);
        return promise.then([KJ_MVCAP(reader)]() mutable -> kj::Own<kj::AsyncIoStream> {
          return kj::mv(reader);
        });
      });
    });
  });
}

kj::Promise<void> relay(kj::AsyncIoStream& tunnel, kj::AsyncInputStream& input,
                        kj::AsyncOutputStream& output) {
  auto upstream = input.pumpTo(tunnel).then([&tunnel](uint64_t) {
    tunnel.shutdownWrite();
  }).eagerlyEvaluate([](kj::Exception&& exception) {
    KJ_LOG(ERROR, "error sending to tunnel", exception);
  });

  return tunnel.pumpTo(output).ignoreResult().attach(kj::mv(upstream));
}

}  // namespace buildd
