/*
 * EngineContext.cpp
 *
 *  The engine runs in its own process group with the scratch directory as
 *  its working directory and stdout/stderr going to engine.log there.
 *  Killing the group takes any helpers the engine spawned with it.
 */

#include "EngineContext.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <sstream>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

const char* EngineContext::receptorFile = "receptor.pdbqt";
const char* EngineContext::ligandFile = "ligand.pdbqt";
const char* EngineContext::outputFile = "output.pdbqt";
const char* EngineContext::logFile = "engine.log";

static std::string format_fl(fl v) {
  std::ostringstream str;
  str.precision(10);
  str << v;
  return str.str();
}

std::vector<std::string> engineArguments(const DockingJob& job, const path& receptor,
    const path& ligand, const path& out) {
  std::vector<std::string> args;
  args.push_back("--receptor");
  args.push_back(receptor.string());
  args.push_back("--ligand");
  args.push_back(ligand.string());

  const char* centers[] = { "--center_x", "--center_y", "--center_z" };
  const char* sizes[] = { "--size_x", "--size_y", "--size_z" };
  for (unsigned i = 0; i < 3; i++) {
    args.push_back(centers[i]);
    args.push_back(format_fl(job.box.center[i]));
  }
  for (unsigned i = 0; i < 3; i++) {
    args.push_back(sizes[i]);
    args.push_back(format_fl(job.box.size[i]));
  }

  args.push_back("--exhaustiveness");
  args.push_back(boost::lexical_cast<std::string>(job.search.exhaustiveness));
  args.push_back("--num_modes");
  args.push_back(boost::lexical_cast<std::string>(job.search.num_modes));
  args.push_back("--energy_range");
  args.push_back(format_fl(job.search.energy_range));
  if (job.search.seed) {
    args.push_back("--seed");
    args.push_back(boost::lexical_cast<std::string>(*job.search.seed));
  }

  //multithreaded runs of the engine aren't reliable in this environment
  args.push_back("--cpu");
  args.push_back("1");
  args.push_back("--out");
  args.push_back(out.string());
  return args;
}

static bool is_executable_file(const path& p) {
  boost::system::error_code ec;
  return boost::filesystem::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

boost::optional<path> resolveExecutable(const std::string& name) {
  if (name.empty()) return boost::none;
  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name)) return path(name);
    return boost::none;
  }

  const char* env = getenv("PATH");
  if (!env) return boost::none;
  std::vector<std::string> dirs;
  std::string envpath(env);
  boost::split(dirs, envpath, boost::is_any_of(":"));
  for (unsigned i = 0, n = dirs.size(); i < n; i++) {
    if (dirs[i].empty()) continue;
    path p = path(dirs[i]) / name;
    if (is_executable_file(p)) return p;
  }
  return boost::none;
}

EngineContext::EngineContext(const EngineConfig& cfg, Logger& l)
    : config(cfg), log(l), worker(NULL), pid(0), killed(false) {
}

EngineContext::~EngineContext() {
  terminate();
  if (worker) {
    worker->join();
    delete worker;
  }
  removeScratch();
}

void EngineContext::start() {
  if (worker) return;
  worker = new boost::thread(thread_run, this);
}

void EngineContext::terminate() {
  {
    boost::mutex::scoped_lock lock(procMutex);
    killed = true;
    if (pid > 0) kill(-pid, SIGKILL);
  }
  outq.push(AbortMessage());
}

bool EngineContext::engineRunning() {
  boost::mutex::scoped_lock lock(procMutex);
  return pid > 0;
}

bool EngineContext::isKilled() {
  boost::mutex::scoped_lock lock(procMutex);
  return killed;
}

void EngineContext::thread_run(EngineContext* ctx) {
  try {
    ctx->run();
  } catch (std::exception& e) {
    ctx->post(ErrorMessage(EngineCrashed, e.what()));
  }
  ctx->removeScratch();
}

void EngineContext::run() {
  boost::optional<OutboundMessage> msg = outq.pop();
  if (!msg) return;
  InitMessage *init = boost::get<InitMessage>(&*msg);
  if (!init) return; //aborted before anything happened
  DockingJob job = init->job;

  if (!stage(job)) return;

  msg = outq.pop();
  if (!msg || !boost::get<RunMessage>(&*msg)) return;

  if (!execute(job)) return;

  boost::optional<docking_result> result = collect();
  removeScratch();
  if (result) {
    DoneMessage done;
    done.result = *result;
    post(done);
  }
}

bool EngineContext::stage(const DockingJob& job) {
  if (isKilled()) return false;
  post(ProgressMessage(5, JobInitializing));

  boost::optional<path> exe = resolveExecutable(config.executable);
  if (!exe) {
    post(ErrorMessage(EngineInitFailed,
        "engine executable " + config.executable + " not found or not executable"));
    return false;
  }
  engine = *exe;
  post(ProgressMessage(15, JobInitializing));

  try {
    path root = config.scratchRoot.empty() ? boost::filesystem::temp_directory_path() : config.scratchRoot;
    scratch = root / boost::filesystem::unique_path("dockrun-%%%%-%%%%-%%%%-%%%%");
    boost::filesystem::create_directories(scratch);
    write_file(scratch / receptorFile, job.receptor);
    post(ProgressMessage(20, JobFilesStaged));
    write_file(scratch / ligandFile, job.ligand);
    post(ProgressMessage(25, JobFilesStaged));
  } catch (boost::filesystem::filesystem_error& e) {
    post(ErrorMessage(MountFailed, e.what()));
    return false;
  } catch (file_error& e) {
    post(ErrorMessage(MountFailed, "could not write " + e.name.string()));
    return false;
  }
  log.log("job %s staged in %s\n", job.id.c_str(), scratch.c_str());
  return true;
}

bool EngineContext::execute(const DockingJob& job) {
  post(ProgressMessage(30, JobExecuting));

  //everything the child needs is built before forking
  const std::string exe = engine.string();
  const std::string dir = scratch.string();
  const std::string logname = (scratch / logFile).string();
  std::vector<std::string> args = engineArguments(job, scratch / receptorFile,
      scratch / ligandFile, scratch / outputFile);
  std::vector<char*> argv;
  argv.push_back(const_cast<char*>(exe.c_str()));
  for (unsigned i = 0, n = args.size(); i < n; i++) {
    argv.push_back(const_cast<char*>(args[i].c_str()));
  }
  argv.push_back(NULL);

  int logfd = open(logname.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (logfd < 0) {
    post(ErrorMessage(MountFailed, "could not create " + logname + ": " + strerror(errno)));
    return false;
  }

  //closed on a successful exec, carries errno otherwise
  int errpipe[2];
  if (pipe(errpipe) != 0) {
    int err = errno;
    close(logfd);
    post(ErrorMessage(EngineInitFailed, std::string("could not create pipe: ") + strerror(err)));
    return false;
  }
  fcntl(errpipe[0], F_SETFD, FD_CLOEXEC);
  fcntl(errpipe[1], F_SETFD, FD_CLOEXEC);

  boost::mutex::scoped_lock lock(procMutex);
  if (killed) {
    close(logfd);
    close(errpipe[0]);
    close(errpipe[1]);
    return false;
  }

  pid_t child = fork();
  if (child < 0) {
    int err = errno;
    lock.unlock();
    close(logfd);
    close(errpipe[0]);
    close(errpipe[1]);
    post(ErrorMessage(EngineInitFailed, std::string("fork failed: ") + strerror(err)));
    return false;
  }

  if (child == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    dup2(logfd, STDOUT_FILENO);
    dup2(logfd, STDERR_FILENO);
    int err = 0;
    if (chdir(dir.c_str()) == 0) {
      execv(exe.c_str(), &argv[0]);
    }
    err = errno;
    ssize_t ignored = write(errpipe[1], &err, sizeof(err));
    (void) ignored;
    _exit(127);
  }

  setpgid(child, child); //also done by the child, whichever runs first
  pid = child;
  lock.unlock();

  close(logfd);
  close(errpipe[1]);
  int err = 0;
  ssize_t n = 0;
  do {
    n = read(errpipe[0], &err, sizeof(err));
  } while (n < 0 && errno == EINTR);
  close(errpipe[0]);

  int status = 0;
  if (n > 0) {
    waitpid(child, &status, 0);
    {
      boost::mutex::scoped_lock l(procMutex);
      pid = 0;
    }
    post(ErrorMessage(EngineInitFailed, "could not execute " + exe + ": " + strerror(err)));
    return false;
  }
  log.log("job %s engine started, pid %d\n", job.id.c_str(), (int) child);

  std::streamoff offset = 0;
  while (true) {
    pid_t r = waitpid(child, &status, WNOHANG);
    if (r == child) break;
    if (r < 0 && errno != EINTR) {
      int werr = errno;
      {
        boost::mutex::scoped_lock l(procMutex);
        pid = 0;
      }
      post(ErrorMessage(EngineCrashed, std::string("lost track of engine process: ") + strerror(werr)));
      return false;
    }

    streamLog(offset);

    boost::optional<OutboundMessage> msg = outq.popFor(config.pollMs);
    if (msg && boost::get<AbortMessage>(&*msg)) {
      kill(-child, SIGKILL);
      while (waitpid(child, &status, 0) < 0 && errno == EINTR)
        ;
      {
        boost::mutex::scoped_lock l(procMutex);
        pid = 0;
      }
      log.log("job %s engine killed\n", job.id.c_str());
      return false;
    }
  }

  {
    boost::mutex::scoped_lock l(procMutex);
    pid = 0;
  }
  streamLog(offset);
  if (isKilled()) return false;

  if (WIFSIGNALED(status)) {
    log.log("job %s engine killed by signal %d\n", job.id.c_str(), WTERMSIG(status));
    post(ErrorMessage(EngineCrashed,
        "engine killed by signal " + boost::lexical_cast<std::string>(WTERMSIG(status))));
    return false;
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    log.log("job %s engine exited with status %d\n", job.id.c_str(), WEXITSTATUS(status));
    post(ErrorMessage(EngineCrashed,
        "engine exited with status " + boost::lexical_cast<std::string>(WEXITSTATUS(status))));
    return false;
  }
  log.log("job %s engine finished\n", job.id.c_str());
  return true;
}

boost::optional<docking_result> EngineContext::collect() {
  post(ProgressMessage(90, JobParsingOutput));

  path out = scratch / outputFile;
  boost::system::error_code ec;
  if (!boost::filesystem::is_regular_file(out, ec) || boost::filesystem::file_size(out, ec) == 0 || ec) {
    post(ErrorMessage(NoOutputProduced, "engine exited without writing poses"));
    return boost::none;
  }

  try {
    std::string structure = read_file(out);
    std::string engineLog = read_file(scratch / logFile);
    return assemble(engineLog, structure);
  } catch (file_error& e) {
    post(ErrorMessage(NoOutputProduced, "could not read " + e.name.string()));
    return boost::none;
  }
}

//forward whatever the engine wrote since the last call
void EngineContext::streamLog(std::streamoff& offset) {
  boost::filesystem::ifstream in(scratch / logFile, std::ios::in | std::ios::binary);
  if (!in) return;
  in.seekg(offset);
  if (!in) return;
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (text.empty()) return;
  offset += text.size();
  post(PartialOutputMessage(text));
}

void EngineContext::removeScratch() {
  if (scratch.empty()) return;
  boost::system::error_code ec;
  boost::filesystem::remove_all(scratch, ec);
  if (ec) log.log("could not remove %s: %s\n", scratch.c_str(), ec.message().c_str());
  scratch.clear();
}
