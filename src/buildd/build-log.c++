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

#include "build-log.h"
#include <time.h>
#include <string.h>

namespace buildd {

BuildLog::BuildLog(kj::Timer& timer, kj::Maybe<kj::AutoCloseFd> fd)
    : timer(timer), fd(kj::mv(fd)), lastActivity(timer.now()) {}

kj::Own<BuildLog> BuildLog::open(kj::Timer& timer, kj::StringPtr path) {
  return kj::heap<BuildLog>(timer,
      raiiOpen(path, O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644));
}

void BuildLog::write(kj::ArrayPtr<const byte> data) {
  KJ_IF_MAYBE(f, fd) {
    kj::FdOutputStream(f->get()).write(data.begin(), data.size());
  }

  tail.addAll(data);
  if (tail.size() > TAIL_SIZE * 2) {
    // Keep the buffer bounded; only the last TAIL_SIZE bytes are ever read.
    auto keep = tail.asPtr().slice(tail.size() - TAIL_SIZE, tail.size());
    kj::Vector<byte> trimmed(TAIL_SIZE * 2);
    trimmed.addAll(keep);
    tail = kj::mv(trimmed);
  }

  lastActivity = timer.now();
}

void BuildLog::writeCommand(kj::ArrayPtr<const kj::String> argv) {
  write(kj::str("[", formatTimestamp(time(nullptr)), "]\nRUN: ", formatCommand(argv), "\n"));
}

void BuildLog::touch() {
  lastActivity = timer.now();
}

kj::Array<byte> BuildLog::getTail() const {
  size_t start = tail.size() > TAIL_SIZE ? tail.size() - TAIL_SIZE : 0;
  return kj::heapArray(tail.asPtr().slice(start, tail.size()));
}

kj::String formatTimestamp(time_t when) {
  struct tm local;
  KJ_ASSERT(localtime_r(&when, &local) != nullptr);
  char buffer[64];
  size_t n = strftime(buffer, sizeof(buffer), "%a %b %e %H:%M:%S %Y", &local);
  return kj::heapString(buffer, n);
}

// =======================================================================================

namespace {

bool isUrlUserInfoChar(char c) {
  return c != ':' && c != '@' && c != '/' && c != '\n';
}

bool isTokenChar(char c) {
  return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || ('0' <= c && c <= '9') || c == '-';
}

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

kj::Maybe<size_t> matchUserInfo(kj::ArrayPtr<const char> text, size_t pos) {
  // Matches "user:password@" followed by at least one non-space character, where the user may
  // be empty but the password may not. Returns the length of the "user:password@" part.

  size_t i = pos;
  while (i < text.size() && isUrlUserInfoChar(text[i])) ++i;
  if (i >= text.size() || text[i] != ':') return nullptr;
  size_t passwordStart = ++i;
  while (i < text.size() && isUrlUserInfoChar(text[i])) ++i;
  if (i == passwordStart || i >= text.size() || text[i] != '@') return nullptr;
  ++i;
  if (i >= text.size() || isSpace(text[i])) return nullptr;
  return i - pos;
}

kj::Maybe<size_t> matchProxyAuth(kj::ArrayPtr<const char> text, size_t pos) {
  // Matches ",proxyauth=<user>:<token>" and returns its length.

  kj::StringPtr prefix = ",proxyauth=";
  if (text.size() - pos < prefix.size() ||
      memcmp(text.begin() + pos, prefix.begin(), prefix.size()) != 0) {
    return nullptr;
  }
  size_t i = pos + prefix.size();
  size_t userStart = i;
  while (i < text.size() && text[i] != ':') ++i;
  if (i == userStart || i >= text.size()) return nullptr;
  size_t tokenStart = ++i;
  while (i < text.size() && isTokenChar(text[i])) ++i;
  if (i == tokenStart) return nullptr;
  return i - pos;
}

kj::Maybe<size_t> findNewline(kj::ArrayPtr<const char> text) {
  for (size_t i: kj::indices(text)) {
    if (text[i] == '\n') return i;
  }
  return nullptr;
}

}  // namespace

kj::String sanitizeLogTail(kj::ArrayPtr<const byte> tail) {
  auto text = kj::arrayPtr(reinterpret_cast<const char*>(tail.begin()), tail.size());

  // The first line is usually cut off mid-URL, where the patterns below can no longer see the
  // credentials in it. A tail without any newline is nothing but that line.
  KJ_IF_MAYBE(eol, findNewline(text)) {
    text = text.slice(*eol + 1, text.size());
  } else {
    return kj::heapString("");
  }

  return sanitizeLog(text);
}

kj::String sanitizeLog(kj::ArrayPtr<const char> text) {
  kj::Vector<char> result(text.size() + 1);
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == ':' && text.size() - i >= 3 && text[i + 1] == '/' && text[i + 2] == '/') {
      result.addAll(text.slice(i, i + 3));
      i += 3;
      KJ_IF_MAYBE(length, matchUserInfo(text, i)) {
        i += *length;
      }
      continue;
    }
    if (text[i] == ',') {
      KJ_IF_MAYBE(length, matchProxyAuth(text, i)) {
        i += *length;
        continue;
      }
    }
    result.add(text[i++]);
  }

  result.add('\0');
  return kj::String(result.releaseAsArray());
}

}  // namespace buildd
