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

#ifndef BUILDD_UTIL_H_
#define BUILDD_UTIL_H_
// This file contains various utility functions used throughout buildd.

#include <kj/io.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <unistd.h>
#include <kj/async.h>

namespace kj {
  class UnixEventPort;
}

namespace buildd {

#define KJ_MVCAP(var) var = ::kj::mv(var)
// Capture the given variable by move.  Place this in a lambda capture list.  Requires C++14.

typedef unsigned int uint;
typedef unsigned char byte;

struct Pipe {
  kj::AutoCloseFd readEnd;
  kj::AutoCloseFd writeEnd;

  static Pipe make();
};

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode = 0666);

kj::String trim(kj::ArrayPtr<const char> slice);
kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice);
// Remove whitespace from both ends of the char array and return what's left as a String.

void toLower(kj::ArrayPtr<char> text);
// Force entire array of chars to lower-case.

kj::Maybe<uint> parseUInt(kj::StringPtr s, int base);
// Try to parse an integer with strtoul(), return null if parsing fails or doesn't consume all
// input.

bool pathExists(kj::StringPtr path);
bool isDirectory(kj::StringPtr path);

kj::Array<kj::String> listDirectory(kj::StringPtr dirname);
// Get names of all files in the given directory except for "." and "..".

void recursivelyDelete(kj::StringPtr path);
// Delete the given path, recursively if it is a directory.
//
// Since this may be used in KJ_DEFER to delete temporary directories, all exceptions are
// recoverable (won't throw if already unwinding).

void recursivelyCreateParent(kj::StringPtr path);
// Create the parent directory of `path` if it doesn't exist, and the parent's parent, and so on.

kj::String readAll(int fd);
// Read entire contents of the file descirptor to a String.

kj::String readAll(kj::StringPtr name);
// Read entire contents of a named file to a String.

void writeFile(kj::StringPtr name, kj::ArrayPtr<const byte> content, mode_t mode = 0644);
void writeFile(kj::StringPtr name, kj::StringPtr content, mode_t mode = 0644);
// Replace the named file with the given content.

kj::String makeTemporaryDirectory(kj::StringPtr prefix);
// mkdtemp() wrapper. `prefix` is the directory name minus the trailing "XXXXXX".

kj::Array<kj::String> splitLines(kj::StringPtr input);
// Split the input into lines, trimming whitespace, and ignoring blank lines or lines that start
// with #.

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim);
// Split the char array on an arbitrary delimiter character.

kj::Vector<kj::ArrayPtr<const char>> splitSpace(kj::ArrayPtr<const char> input);
// Split the char array on whitespace. Multiple consecutive spaces make a single split -- i.e.
// none of the elements in the returned vector will be empty.

kj::Maybe<kj::ArrayPtr<const char>> splitFirst(kj::ArrayPtr<const char>& input, char delim);
// Split the char array on the first instance of the delimiter. `input` is updated in-place to
// point at the remainder of the array while the prefix that was split off is returned. If the
// delimiter doesn't appear, returns null.

kj::Maybe<size_t> findSubstring(kj::StringPtr haystack, kj::StringPtr needle, size_t start = 0);
// Position of the first occurrence of `needle` at or after `start`.

kj::String shellEscape(kj::StringPtr arg);
// Quote `arg` for a POSIX shell. Arguments made only of characters that are never special are
// returned unchanged.

template <typename... Params>
kj::Array<kj::String> makeArgv(Params&&... params) {
  // Build an argument vector, stringifying each parameter with kj::str().
  return kj::arr(kj::str(kj::fwd<Params>(params))...);
}

kj::String formatCommand(kj::ArrayPtr<const kj::String> argv);
// Join shell-escaped arguments with spaces, for logging and for `sh -c`.

kj::String formatWaitStatus(int status);
// Describe a wait(2) status for humans, e.g. "exit status 2" or "killed by signal 9 (Killed)".

int waitStatusToExitCode(int status);
// Collapse a wait(2) status into the shell convention: the exit code for a normal exit,
// 128 + signal number for a signal death.

class SubprocessSet;

class Subprocess {
  // A forked and exec()ed child. Build commands run as leaders of their own process group so
  // that anything they leave behind can be signaled along with them.

public:
  struct Options {
    kj::StringPtr executable;
    // Looked up in `PATH` unless it contains a '/'.

    kj::ArrayPtr<const kj::StringPtr> argv;
    // Arguments to the program, starting with the program name.

    int stdin = STDIN_FILENO;
    int stdout = STDOUT_FILENO;
    int stderr = STDERR_FILENO;
    // What file descriptors to substitute for standard I/O.
    //
    // Note that if you override these, then the overridden FD is expected to be close-on-exec.
    // `Subprocess` does NOT close the old FD after dup2()ing it over the standard I/O FD.

    kj::Maybe<kj::StringPtr> workingDirectory;
    // Directory to chdir() into before exec. Leave null to inherit the parent's.

    bool newProcessGroup = false;
    // If true, the child becomes the leader of a new process group whose id equals its pid, so
    // that the whole tree it spawns can be signaled at once with killGroup().

    Options(kj::ArrayPtr<const kj::StringPtr> argv): executable(argv[0]), argv(argv) {}
  };

  Subprocess(Options&& options);
  // Start a subprocess based on the given options.

  KJ_DISALLOW_COPY(Subprocess);

  inline Subprocess(Subprocess&& other)
      : name(kj::mv(other.name)), pid(other.pid), isGroupLeader(other.isGroupLeader),
        subprocessSet(other.subprocessSet) {
    other.pid = 0;
  }

  ~Subprocess() noexcept(false);
  // Kills the subprocess (its whole group, if it leads one) with SIGKILL if it hasn't already
  // finished. A child that is being waited for through a SubprocessSet is left to the set to
  // reap, so that a child we may not signal (it became root through sudo) never blocks the
  // event loop. Any other child is waitpid()ed on the spot.

  void killGroup(int signo);
  // Sends the given signal to the child's whole process group. Requires `newProcessGroup`.
  // Members of the group that we lack permission to signal (e.g. because they switched to
  // root through sudo) are skipped silently; the sandbox is responsible for those.

  pid_t getPid() {
    KJ_IREQUIRE(pid != 0, "already exited");
    return pid;
  }

  bool isRunning() {
    return pid != 0;
  }

  void notifyExited(int status) {
    // Call if you receive exit notification from elsewhere, e.g. calling wait() yourself. It is
    // NECESSARY to call this immediately upon receiving an exit notification, otherwise the
    // destructor will try to SIGKILL the pid which might have been re-assigned by then.

    pid = 0;
  }

private:
  kj::String name;
  kj::UnwindDetector unwindDetector;
  pid_t pid = 0;  // 0 = not running
  bool isGroupLeader = false;
  kj::Maybe<SubprocessSet&> subprocessSet;

  friend class SubprocessSet;
};

class SubprocessSet {
  // Represents a set of subprocesses and allows you to asynchronously wait for them to complete.
  // In order to use SubprocessSet, it is necessary that *all* subprocesses of this process are
  // managed through it, and wait() is always called immediately on creation of a new subprocess.

public:
  explicit SubprocessSet(kj::UnixEventPort& eventPort);
  ~SubprocessSet() noexcept(false);
  KJ_DISALLOW_COPY(SubprocessSet);

  kj::Promise<int> waitForExitOrSignal(Subprocess& subprocess);
  // Resolves to the wait(2) status once `subprocess` exits. `subprocess` must outlive the
  // promise.

private:
  struct WaitMap;
  kj::UnixEventPort& eventPort;
  kj::Own<WaitMap> waitMap;
  kj::Promise<void> waitTask;

  kj::Promise<void> waitLoop();

  void disown(pid_t pid);
  // Called when the subprocess is destroyed before it exited. The pid stays in the set until
  // it is reaped. See ~Subprocess().

  friend class Subprocess;
};

}  // namespace buildd

#endif // BUILDD_UTIL_H_
