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

#include "chroot.h"
#include "supervisor.h"
#include <errno.h>
#include <signal.h>
#include <limits.h>
#include <stdlib.h>
#include <unistd.h>

namespace buildd {

ChrootSandbox::ChrootSandbox(kj::StringPtr buildPath, ProcessSupervisor& supervisor,
                             kj::Timer& timer, kj::StringPtr selfPath)
    : Sandbox(buildPath), supervisor(supervisor), timer(timer),
      selfPath(kj::heapString(selfPath)), root(kj::str(buildPath, "/chroot-autobuild")) {}

ChrootSandbox::~ChrootSandbox() noexcept(false) {}

kj::Promise<void> ChrootSandbox::create(kj::StringPtr imagePath) {
  // The tarball's top-level directory is chroot-autobuild.
  return supervisor.runChecked(makeArgv("sudo", "tar", "-C", buildPath, "-xf", imagePath));
}

kj::Promise<void> ChrootSandbox::start() {
  return supervisor.runChecked(makeArgv(
      "sudo", "mount", "-t", "proc", "-o", "nosuid,nodev,noexec", "none",
      kj::str(root, "/proc")))
      .then([this]() {
    return supervisor.runChecked(makeArgv(
        "sudo", "mount", "-t", "devpts", "-o", "gid=5,mode=620,nosuid,noexec", "none",
        kj::str(root, "/dev/pts")));
  }).then([this]() {
    return supervisor.runChecked(makeArgv(
        "sudo", "mount", "-t", "sysfs", "-o", "nosuid,nodev,noexec", "none",
        kj::str(root, "/sys")));
  }).then([this]() {
    return supervisor.runChecked(makeArgv(
        "sudo", "mount", "-t", "tmpfs", "-o", "nosuid,nodev", "none",
        kj::str(root, "/dev/shm")));
  }).then([this]() {
    // Name resolution inside the chroot works the way it does on the host.
    return copyIn("/etc/hosts", "/etc/hosts", 0644);
  }).then([this]() {
    return copyIn("/etc/hostname", "/etc/hostname", 0644);
  }).then([this]() {
    return copyIn("/etc/resolv.conf", "/etc/resolv.conf", 0644);
  });
}

kj::Array<kj::String> ChrootSandbox::commandFor(const Command& command) {
  kj::Vector<kj::String> argv;
  argv.add(kj::str("sudo"));
  argv.add(kj::str("/usr/sbin/chroot"));
  argv.add(kj::heapString(root));
  for (auto& arg: quirks.argvPrefix) {
    argv.add(kj::heapString(arg));
  }
  argv.add(kj::str("env"));
  for (auto& var: quirks.env) {
    argv.add(kj::heapString(var));
  }
  for (auto& var: command.env) {
    argv.add(kj::heapString(var));
  }

  kj::StringPtr cwd = "/";
  KJ_IF_MAYBE(c, command.cwd) {
    cwd = *c;
  }
  argv.add(kj::str("/bin/sh"));
  argv.add(kj::str("-c"));
  argv.add(kj::str("cd ", shellEscape(cwd), " && ", formatCommand(command.argv)));
  return argv.releaseAsArray();
}

kj::Promise<void> ChrootSandbox::copyIn(kj::StringPtr hostPath, kj::StringPtr targetPath,
                                        mode_t mode) {
  KJ_REQUIRE(targetPath.startsWith("/"), "sandbox paths must be absolute", targetPath);
  return supervisor.runChecked(makeArgv(
      "sudo", "install", "-D", "-o", "root", "-g", "root", "-m", formatMode(mode),
      hostPath, kj::str(root, targetPath)));
}

kj::Promise<void> ChrootSandbox::copyOut(kj::StringPtr targetPath, kj::StringPtr hostPath) {
  KJ_REQUIRE(targetPath.startsWith("/"), "sandbox paths must be absolute", targetPath);
  auto owner = kj::str(getuid(), ":", getgid());
  return supervisor.runChecked(makeArgv(
      "sudo", "cp", "--preserve=timestamps", kj::str(root, targetPath), hostPath))
      .then([this,KJ_MVCAP(owner),hostPath = kj::heapString(hostPath)]() {
    return supervisor.runChecked(makeArgv("sudo", "chown", owner, hostPath));
  });
}

kj::Promise<void> ChrootSandbox::killProcesses() {
  if (!isDirectory(root)) return kj::READY_NOW;

  // Runs beside the build command it is meant to kill, which may still hold `supervisor`.
  auto reaper = supervisor.newSibling();
  auto promise = reaper->runChecked(makeArgv("sudo", selfPath, "scan-for-processes", root));
  return promise.attach(kj::mv(reaper));
}

kj::Promise<void> ChrootSandbox::stop() {
  return unmountAll(0);
}

kj::Promise<void> ChrootSandbox::unmountAll(uint attempt) {
  auto mounts = findMountsUnder(readAll(kj::StringPtr("/proc/mounts")), root);
  if (mounts.size() == 0) return kj::READY_NOW;

  KJ_REQUIRE(attempt < MAX_UNMOUNT_ATTEMPTS, "couldn't unmount sandbox", root, mounts[0]);

  kj::Promise<void> promise = nullptr;
  if (attempt == 0) {
    promise = kj::READY_NOW;
  } else {
    promise = timer.afterDelay(1 * kj::SECONDS);
  }

  for (auto& mount: mounts) {
    // A busy mount fails to unmount; the next attempt retries it.
    promise = promise.then([this,path = kj::mv(mount)]() {
      return supervisor.run(makeArgv("sudo", "umount", path)).ignoreResult();
    });
  }

  return promise.then([this,attempt]() { return unmountAll(attempt + 1); });
}

kj::Promise<void> ChrootSandbox::remove() {
  if (!pathExists(root)) return kj::READY_NOW;

  // rm -rf across a live /proc or /dev/pts mount would reach into the host.
  auto mounts = findMountsUnder(readAll(kj::StringPtr("/proc/mounts")), root);
  KJ_REQUIRE(mounts.size() == 0, "refusing to remove a sandbox that is still mounted",
             root, mounts[0]);

  return supervisor.runChecked(makeArgv("sudo", "rm", "-rf", root));
}

// =======================================================================================

static kj::String unescapeMountPath(kj::ArrayPtr<const char> field) {
  // /proc/mounts escapes space, tab, newline and backslash as three-digit octal.
  kj::Vector<char> result(field.size() + 1);
  for (size_t i = 0; i < field.size(); i++) {
    if (field[i] == '\\' && i + 3 < field.size() &&
        '0' <= field[i+1] && field[i+1] <= '7' &&
        '0' <= field[i+2] && field[i+2] <= '7' &&
        '0' <= field[i+3] && field[i+3] <= '7') {
      result.add((field[i+1] - '0') * 64 + (field[i+2] - '0') * 8 + (field[i+3] - '0'));
      i += 3;
    } else {
      result.add(field[i]);
    }
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::Array<kj::String> findMountsUnder(kj::StringPtr mountTable, kj::StringPtr root) {
  auto prefix = kj::str(root, "/");
  kj::Vector<kj::String> found;
  for (auto line: split(mountTable, '\n')) {
    auto fields = splitSpace(line);
    if (fields.size() < 2) continue;
    auto mountPoint = unescapeMountPath(fields[1]);
    if (mountPoint == root || mountPoint.startsWith(prefix)) {
      found.add(kj::mv(mountPoint));
    }
  }

  auto result = kj::heapArrayBuilder<kj::String>(found.size());
  for (size_t i = found.size(); i > 0; i--) {
    result.add(kj::mv(found[i - 1]));
  }
  return result.finish();
}

uint killProcessesRootedIn(kj::StringPtr root) {
  auto prefix = kj::str(root, "/");
  uint count = 0;

  for (auto& entry: listDirectory("/proc")) {
    KJ_IF_MAYBE(pid, parseUInt(entry, 10)) {
      auto link = kj::str("/proc/", *pid, "/root");
      char buffer[PATH_MAX];
      ssize_t n = readlink(link.cStr(), buffer, sizeof(buffer));
      if (n < 0) {
        // The process exited since we listed /proc, or is a kernel thread.
        continue;
      }

      auto processRoot = kj::heapString(buffer, n);
      if (processRoot == root || processRoot.startsWith(prefix)) {
        KJ_SYSCALL_HANDLE_ERRORS(kill(*pid, SIGKILL)) {
          case ESRCH:
            continue;
          default:
            KJ_FAIL_SYSCALL("kill(pid, SIGKILL)", error, *pid);
        }
        ++count;
      }
    }
  }

  return count;
}

void scanForProcesses(kj::StringPtr root) {
  char resolved[PATH_MAX];
  if (realpath(root.cStr(), resolved) == nullptr) {
    KJ_FAIL_SYSCALL("realpath()", errno, root);
  }

  for (;;) {
    uint count = killProcessesRootedIn(resolved);
    if (count == 0) break;
    KJ_LOG(INFO, "killed processes in sandbox", resolved, count);
    usleep(100000);
  }
}

}  // namespace buildd
