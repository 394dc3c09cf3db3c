#include "Subprocess.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>

extern char** environ;

namespace certgen {

static constexpr std::size_t kTailBytes = 2000;

static std::string read_tail(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary | std::ios::ate);
  if (!in) return {};
  const std::streamoff size = in.tellg();
  const std::streamoff start = size > static_cast<std::streamoff>(kTailBytes)
                                 ? size - static_cast<std::streamoff>(kTailBytes) : 0;
  in.seekg(start);
  std::string out(static_cast<std::size_t>(size - start), '\0');
  in.read(out.data(), static_cast<std::streamsize>(out.size()));
  out.resize(static_cast<std::size_t>(in.gcount()));
  return out;
}

static std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) {
    const std::string entry(*e);
    const auto eq = entry.find('=');
    const std::string name = entry.substr(0, eq);
    if (overrides.count(name)) continue;
    out.push_back(entry);
  }
  for (const auto& [k, v] : overrides) out.push_back(k + "=" + v);
  return out;
}

ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout,
                          const std::filesystem::path& logFile,
                          const std::map<std::string, std::string>& env) {
  ProcessResult result;
  if (argv.empty()) {
    result.launchError = "empty command line";
    return result;
  }

  // everything the child touches is prepared before fork()
  std::vector<char*> cargv;
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  const std::vector<std::string> envStrings = merged_environment(env);
  std::vector<char*> cenv;
  for (const auto& e : envStrings) cenv.push_back(const_cast<char*>(e.c_str()));
  cenv.push_back(nullptr);

  const std::string logPath = logFile.string();
  const int logFd = ::open(logPath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
  if (logFd < 0) {
    result.launchError = "cannot open " + logPath + ": " + std::strerror(errno);
    return result;
  }

  // exec failure is reported through a close-on-exec pipe
  int errPipe[2];
  if (::pipe2(errPipe, O_CLOEXEC) != 0) {
    result.launchError = std::string("pipe2: ") + std::strerror(errno);
    ::close(logFd);
    return result;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.launchError = std::string("fork: ") + std::strerror(errno);
    ::close(logFd);
    ::close(errPipe[0]);
    ::close(errPipe[1]);
    return result;
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(logFd, STDOUT_FILENO);
    ::dup2(logFd, STDERR_FILENO);
    ::execvpe(cargv[0], cargv.data(), cenv.data());
    const int err = errno;
    ssize_t ignored = ::write(errPipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  ::close(logFd);
  ::close(errPipe[1]);

  int childErr = 0;
  ssize_t n;
  do {
    n = ::read(errPipe[0], &childErr, sizeof(childErr));
  } while (n < 0 && errno == EINTR);
  ::close(errPipe[0]);

  int status = 0;
  if (n == static_cast<ssize_t>(sizeof(childErr))) {
    ::waitpid(pid, &status, 0);
    result.launchError = "cannot execute " + argv[0] + ": " + std::strerror(childErr);
    return result;
  }
  result.launched = true;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) break;
    if (r < 0 && errno != EINTR) {
      spdlog::error("waitpid({}) failed: {}", pid, std::strerror(errno));
      result.outputTail = read_tail(logFile);
      return result;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      spdlog::warn("process {} ({}) exceeded {} ms, killing group", pid, argv[0], timeout.count());
      ::kill(-pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.timedOut = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.termSignal = WTERMSIG(status);
  }
  result.outputTail = read_tail(logFile);
  return result;
}

} // namespace certgen
