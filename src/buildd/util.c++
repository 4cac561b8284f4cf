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

#include "util.h"
#include <errno.h>
#include <kj/vector.h>
#include <kj/async-unix.h>
#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/types.h>
#include <dirent.h>
#include <signal.h>
#include <sys/wait.h>
#include <map>

namespace buildd {

Pipe Pipe::make() {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));
  return { kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1]) };
}

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode) {
  int fd;
  KJ_SYSCALL(fd = open(name.cStr(), flags, mode), name);
  return kj::AutoCloseFd(fd);
}

kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice) {
  while (slice.size() > 0 && isspace(slice[0])) {
    slice = slice.slice(1, slice.size());
  }
  while (slice.size() > 0 && isspace(slice[slice.size() - 1])) {
    slice = slice.slice(0, slice.size() - 1);
  }

  return slice;
}

kj::String trim(kj::ArrayPtr<const char> slice) {
  return kj::heapString(trimArray(slice));
}

void toLower(kj::ArrayPtr<char> text) {
  for (char& c: text) {
    if ('A' <= c && c <= 'Z') {
      c = c - 'A' + 'a';
    }
  }
}

kj::Maybe<uint> parseUInt(kj::StringPtr s, int base) {
  char* end;
  uint result = strtoul(s.cStr(), &end, base);
  if (s.size() == 0 || *end != '\0') {
    return nullptr;
  }
  return result;
}

bool pathExists(kj::StringPtr path) {
  struct stat stats;
  KJ_SYSCALL_HANDLE_ERRORS(lstat(path.cStr(), &stats)) {
    case ENOENT:
    case ENOTDIR:
      return false;
    default:
      KJ_FAIL_SYSCALL("lstat", error, path);
  }
  return true;
}

bool isDirectory(kj::StringPtr path) {
  struct stat stats;
  KJ_SYSCALL(lstat(path.cStr(), &stats), path);
  return S_ISDIR(stats.st_mode);
}

kj::Array<kj::String> listDirectory(kj::StringPtr dirname) {
  DIR* dir = opendir(dirname.cStr());
  if (dir == nullptr) {
    KJ_FAIL_SYSCALL("opendir", errno, dirname);
  }
  KJ_DEFER(closedir(dir));
  kj::Vector<kj::String> entries;

  for (;;) {
    errno = 0;
    struct dirent* entry = readdir(dir);
    if (entry == nullptr) {
      int error = errno;
      if (error == 0) {
        break;
      } else {
        KJ_FAIL_SYSCALL("readdir", error, dirname);
      }
    }

    kj::StringPtr name = entry->d_name;
    if (name != "." && name != "..") {
      entries.add(kj::heapString(entry->d_name));
    }
  }

  return entries.releaseAsArray();
}

void recursivelyDelete(kj::StringPtr path) {
  KJ_REQUIRE(!path.endsWith("/"),
      "refusing to recursively delete directory name with trailing / to reduce risk of "
      "catastrophic empty-string bugs");
  struct stat stats;
  KJ_SYSCALL(lstat(path.cStr(), &stats), path) { return; }
  if (S_ISDIR(stats.st_mode)) {
    for (auto& file: listDirectory(path)) {
      recursivelyDelete(kj::str(path, "/", file));
    }
    KJ_SYSCALL(rmdir(path.cStr()), path) { break; }
  } else {
    KJ_SYSCALL(unlink(path.cStr()), path) { break; }
  }
}

void recursivelyCreateParent(kj::StringPtr path) {
  KJ_IF_MAYBE(pos, path.findLast('/')) {
    if (*pos == 0) return;

    kj::String parent = kj::heapString(path.slice(0, *pos));

    bool firstTry = true;
    while (mkdir(parent.cStr(), 0777) < 0) {
      int error = errno;
      if (firstTry && error == ENOENT) {
        recursivelyCreateParent(parent);
        firstTry = false;
      } else if (error == EEXIST) {
        break;
      } else if (error != EINTR) {
        KJ_FAIL_SYSCALL("mkdir(parent)", error, parent);
      }
    }
  }
}

kj::String readAll(int fd) {
  kj::FdInputStream input(fd);
  kj::Vector<char> content;
  for (;;) {
    char buffer[4096];
    size_t n = input.tryRead(buffer, sizeof(buffer), sizeof(buffer));
    content.addAll(buffer, buffer + n);
    if (n < sizeof(buffer)) {
      // Done!
      break;
    }
  }
  content.add('\0');
  return kj::String(content.releaseAsArray());
}

kj::String readAll(kj::StringPtr name) {
  return readAll(raiiOpen(name, O_RDONLY | O_CLOEXEC));
}

void writeFile(kj::StringPtr name, kj::ArrayPtr<const byte> content, mode_t mode) {
  auto fd = raiiOpen(name, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  // open() applies the umask; callers asking for a mode mean it.
  KJ_SYSCALL(fchmod(fd, mode), name);
  kj::FdOutputStream(fd.get()).write(content.begin(), content.size());
}

void writeFile(kj::StringPtr name, kj::StringPtr content, mode_t mode) {
  writeFile(name, content.asBytes(), mode);
}

kj::String makeTemporaryDirectory(kj::StringPtr prefix) {
  auto path = kj::str(prefix, "XXXXXX");
  if (mkdtemp(path.begin()) == nullptr) {
    KJ_FAIL_SYSCALL("mkdtemp", errno, path);
  }
  return path;
}

kj::Array<kj::String> splitLines(kj::StringPtr input) {
  size_t lineStart = 0;
  kj::Vector<kj::String> results;
  for (size_t i = 0; i < input.size(); i++) {
    if (input[i] == '\n' || input[i] == '#') {
      bool hasComment = input[i] == '#';
      auto line = trim(input.slice(lineStart, i));
      if (line.size() > 0) {
        results.add(kj::mv(line));
      }
      if (hasComment) {
        // Ignore through newline.
        ++i;
        while (i < input.size() && input[i] != '\n') ++i;
      }
      lineStart = i + 1;
    }
  }

  if (lineStart < input.size()) {
    auto lastLine = trim(input.slice(lineStart));
    if (lastLine.size() > 0) {
      results.add(kj::mv(lastLine));
    }
  }

  return results.releaseAsArray();
}

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim) {
  kj::Vector<kj::ArrayPtr<const char>> result;

  size_t start = 0;
  for (size_t i: kj::indices(input)) {
    if (input[i] == delim) {
      result.add(input.slice(start, i));
      start = i + 1;
    }
  }
  result.add(input.slice(start, input.size()));
  return result;
}

kj::Vector<kj::ArrayPtr<const char>> splitSpace(kj::ArrayPtr<const char> input) {
  kj::Vector<kj::ArrayPtr<const char>> result;

  size_t start = 0;
  for (size_t i: kj::indices(input)) {
    if (isspace(input[i])) {
      if (i > start) {
        result.add(input.slice(start, i));
      }
      start = i + 1;
    }
  }
  if (input.size() > start) {
    result.add(input.slice(start, input.size()));
  }
  return result;
}

kj::Maybe<kj::ArrayPtr<const char>> splitFirst(kj::ArrayPtr<const char>& input, char delim) {
  for (size_t i: kj::indices(input)) {
    if (input[i] == delim) {
      auto result = input.slice(0, i);
      input = input.slice(i + 1, input.size());
      return result;
    }
  }
  return nullptr;
}

kj::Maybe<size_t> findSubstring(kj::StringPtr haystack, kj::StringPtr needle, size_t start) {
  if (needle.size() > haystack.size()) return nullptr;
  for (size_t i = start; i + needle.size() <= haystack.size(); i++) {
    if (memcmp(haystack.begin() + i, needle.begin(), needle.size()) == 0) {
      return i;
    }
  }
  return nullptr;
}

static bool isShellSafe(char c) {
  return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || ('0' <= c && c <= '9') ||
         strchr("+,./:=@_-", c) != nullptr;
}

kj::String shellEscape(kj::StringPtr arg) {
  bool safe = arg.size() > 0;
  for (char c: arg) {
    if (!isShellSafe(c)) {
      safe = false;
      break;
    }
  }
  if (safe) return kj::heapString(arg);

  kj::Vector<char> result(arg.size() + 3);
  result.add('\'');
  for (char c: arg) {
    if (c == '\'') {
      // Close the quote, emit an escaped quote, reopen.
      result.addAll(kj::StringPtr("'\\''"));
    } else {
      result.add(c);
    }
  }
  result.add('\'');
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::String formatCommand(kj::ArrayPtr<const kj::String> argv) {
  return kj::strArray(KJ_MAP(arg, argv) { return shellEscape(arg); }, " ");
}

kj::String formatWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return kj::str("exit status ", WEXITSTATUS(status));
  } else if (WIFSIGNALED(status)) {
    int signo = WTERMSIG(status);
    return kj::str("killed by signal ", signo, " (", strsignal(signo), ")");
  } else {
    return kj::str("unknown wait status ", status);
  }
}

int waitStatusToExitCode(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  } else {
    KJ_FAIL_ASSERT("unknown child wait status", status);
  }
}

// =======================================================================================

static kj::Array<char*> makeNullTerminated(kj::ArrayPtr<const kj::StringPtr> strings) {
  // exec*() is not const-correct.
  auto result = kj::heapArray<char*>(strings.size() + 1);
  for (auto i: kj::indices(strings)) {
    result[i] = const_cast<char*>(strings[i].cStr());
  }
  result[strings.size()] = nullptr;
  return result;
}

static void execChild(Subprocess::Options& options) {
  // Runs in the forked child. Only returns by throwing.

  // KJ ignores some signals (e.g. SIGPIPE), and ignored signals survive exec(). Build tools
  // expect the defaults, and an empty mask.
  for (uint i = 1; i < NSIG; i++) {
    ::signal(i, SIG_DFL);
  }
  sigset_t sigmask;
  sigemptyset(&sigmask);
  KJ_SYSCALL(sigprocmask(SIG_SETMASK, &sigmask, nullptr));

  if (options.newProcessGroup) {
    KJ_SYSCALL(setpgid(0, 0));
  }

  // Move the replacement FDs out of the standard I/O range first, so that dup2()ing one of them
  // into place can't clobber another that is still needed.
  int* const replacements[3] = { &options.stdin, &options.stdout, &options.stderr };
  for (int target = 0; target < 3; target++) {
    int& fd = *replacements[target];
    if (fd != target && fd <= STDERR_FILENO) {
      KJ_SYSCALL(fd = fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1));
    }
  }
  for (int target = 0; target < 3; target++) {
    int fd = *replacements[target];
    if (fd != target) {
      KJ_SYSCALL(dup2(fd, target));
    }
  }

  KJ_IF_MAYBE(dir, options.workingDirectory) {
    KJ_SYSCALL(chdir(dir->cStr()), *dir);
  }

  auto argv = makeNullTerminated(options.argv);
  KJ_SYSCALL(execvp(options.executable.cStr(), argv.begin()), options.executable);
  KJ_UNREACHABLE;
}

Subprocess::Subprocess(Options&& options)
    : name(kj::heapString(options.argv.size() > 0 ? options.argv[0] : options.executable)),
      isGroupLeader(options.newProcessGroup) {
  KJ_SYSCALL(pid = fork());
  if (pid == 0) {
    // Never return into the parent's stack frames from here.
    KJ_DEFER(_exit(127));
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() { execChild(options); })) {
      KJ_LOG(ERROR, "couldn't start command", name, *exception);
    }
  }

  if (options.newProcessGroup) {
    // Also set the group from the parent side so that killGroup() works even if we get there
    // before the child has run. EACCES means the child already exec()ed, which is fine.
    KJ_SYSCALL_HANDLE_ERRORS(setpgid(pid, pid)) {
      case EACCES:
      case ESRCH:
        break;
      default:
        KJ_FAIL_SYSCALL("setpgid", error, name);
    }
  }
}

static void sendSignal(pid_t target, int signo, kj::StringPtr name) {
  KJ_SYSCALL_HANDLE_ERRORS(kill(target, signo)) {
    case EPERM:
    case ESRCH:
      break;
    default:
      KJ_FAIL_SYSCALL("kill", error, name);
  }
}

Subprocess::~Subprocess() noexcept(false) {
  if (pid != 0) {
    unwindDetector.catchExceptionsIfUnwinding([this]() {
      sendSignal(isGroupLeader ? -pid : pid, SIGKILL, name);
      KJ_IF_MAYBE(s, subprocessSet) {
        s->disown(pid);
      } else {
        int status;
        KJ_SYSCALL(waitpid(pid, &status, 0), name);
      }
    });
  }
}

void Subprocess::killGroup(int signo) {
  KJ_REQUIRE(isGroupLeader, "subprocess was not started in its own process group", name);
  if (pid != 0) {
    sendSignal(-pid, signo, name);
  }
}

// -----------------------------------------------------------------------------

struct SubprocessSet::WaitMap {
  struct ProcInfo {
    kj::Own<kj::PromiseFulfiller<int>> fulfiller;
    Subprocess* subprocess;
    // Null once the Subprocess is destroyed.
  };

  std::map<pid_t, ProcInfo> pids;
};

SubprocessSet::SubprocessSet(kj::UnixEventPort& eventPort)
    : eventPort(eventPort), waitMap(kj::heap<WaitMap>()),
      waitTask(waitLoop().eagerlyEvaluate([](kj::Exception&& exception) {
        KJ_LOG(FATAL, "subprocess wait loop failed", exception);
        // The daemon is probably hosed by this. Best to abort.
        abort();
      })) {
  kj::UnixEventPort::captureSignal(SIGCHLD);
}

SubprocessSet::~SubprocessSet() noexcept(false) {}

kj::Promise<int> SubprocessSet::waitForExitOrSignal(Subprocess& subprocess) {
  auto paf = kj::newPromiseAndFulfiller<int>();
  waitMap->pids.insert(std::make_pair(subprocess.getPid(),
      WaitMap::ProcInfo { kj::mv(paf.fulfiller), &subprocess }));
  subprocess.subprocessSet = *this;
  return kj::mv(paf.promise);
}

kj::Promise<void> SubprocessSet::waitLoop() {
  return eventPort.onSignal(SIGCHLD).then([this](auto&&) {
    while (!waitMap->pids.empty()) {
      int status;
      pid_t pid;
      KJ_SYSCALL(pid = waitpid(-1, &status, WNOHANG));
      if (pid == 0) break;

      auto iter = waitMap->pids.find(pid);
      if (iter == waitMap->pids.end()) {
        KJ_LOG(ERROR, "waitpid() returned unexpected PID; is this process running subprocesses "
                      "outside this set?", pid);
      } else {
        if (iter->second.subprocess != nullptr) {
          iter->second.subprocess->notifyExited(status);
          iter->second.fulfiller->fulfill(kj::mv(status));
        }
        waitMap->pids.erase(iter);
      }
    }
    return waitLoop();
  });
}

void SubprocessSet::disown(pid_t pid) {
  auto iter = waitMap->pids.find(pid);
  if (iter != waitMap->pids.end()) {
    iter->second.subprocess = nullptr;
  }
}

}  // namespace buildd
