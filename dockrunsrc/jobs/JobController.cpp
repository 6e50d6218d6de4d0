#include "JobController.h"
#include <sstream>

JobController::JobController(const EngineConfig& cfg, Logger& l)
    : config(cfg), log(l) {
}

JobController::~JobController() {
  abort();
}

void JobController::submit(const DockingJob& job, JobObserver *observer) {
  boost::mutex::scoped_lock slock(submitMutex);

  //one job per session, the old one goes first
  ActiveJobPtr prev;
  {
    boost::mutex::scoped_lock lock(mu);
    prev = current;
    current.reset();
  }
  if (prev) {
    settle(prev, JobOutcome(JobAborted, Aborted, "superseded by job " + job.id));
    release(prev);
  }

  ActiveJobPtr aj(new ActiveJob);
  aj->id = job.id;
  aj->observer = observer;
  aj->timeoutMs = job.timeoutMs;
  aj->deadline = boost::get_system_time() + boost::posix_time::milliseconds(job.timeoutMs);
  aj->context.reset(new EngineContext(config, log));

  log.log("job %s submitted, timeout %u ms\n", job.id.c_str(), job.timeoutMs);
  InitMessage init;
  init.job = job;
  aj->context->send(init);
  aj->context->send(RunMessage());
  aj->context->start();

  {
    boost::mutex::scoped_lock lock(mu);
    current = aj;
  }
  aj->dispatcher = boost::thread(thread_dispatch, this, aj);
}

void JobController::abort() {
  boost::mutex::scoped_lock slock(submitMutex);
  ActiveJobPtr job;
  {
    boost::mutex::scoped_lock lock(mu);
    job = current;
    current.reset();
  }
  if (!job) return;
  settle(job, JobOutcome(JobAborted, Aborted, "aborted"));
  release(job);
}

bool JobController::wait(unsigned timeoutMs) {
  boost::system_time deadline = boost::get_system_time()
      + boost::posix_time::milliseconds(timeoutMs);
  boost::mutex::scoped_lock lock(mu);
  while (current && !isSettled(current)) {
    if (!settledCond.timed_wait(lock, deadline)) {
      return !current || isSettled(current);
    }
  }
  return true;
}

bool JobController::active() {
  boost::mutex::scoped_lock lock(mu);
  return current && !isSettled(current);
}

bool JobController::engineRunning() {
  boost::mutex::scoped_lock lock(mu);
  return current && current->context && current->context->engineRunning();
}

bool JobController::holdsEngineContext() {
  boost::mutex::scoped_lock lock(mu);
  return current && current->context;
}

boost::optional<JobOutcome> JobController::lastOutcome() {
  boost::mutex::scoped_lock lock(mu);
  return last;
}

void JobController::thread_dispatch(JobController* c, ActiveJobPtr job) {
  c->dispatch(job);
}

//relay context messages to the observer until the job settles or the deadline passes
void JobController::dispatch(ActiveJobPtr job) {
  MessageQueue<InboundMessage>& inbound = job->context->inbound();
  while (true) {
    boost::optional<InboundMessage> msg = inbound.popUntil(job->deadline);
    if (msg) {
      handle(job, *msg);
      if (isSettled(job)) break;
      continue;
    }
    if (inbound.isClosed()) break; //released
    if (boost::get_system_time() >= job->deadline) {
      job->context->terminate();
      std::ostringstream reason;
      reason << "no result within " << job->timeoutMs << " ms";
      settle(job, JobOutcome(JobTimedOut, Timeout, reason.str()));
      break;
    }
  }

  //settled one way or another; the engine and scratch go now, not at the next submit
  boost::shared_ptr<EngineContext> finished;
  {
    boost::mutex::scoped_lock lock(mu);
    finished.swap(job->context);
  }
  finished.reset();
}

void JobController::handle(ActiveJobPtr job, const InboundMessage& msg) {
  if (const ProgressMessage *p = boost::get<ProgressMessage>(&msg)) {
    notifyProgress(job, p->percent, p->state);
  } else if (const PartialOutputMessage *o = boost::get<PartialOutputMessage>(&msg)) {
    boost::mutex::scoped_lock lock(job->settleMutex);
    if (!job->settled && job->observer) job->observer->partialOutput(job->id, o->text);
  } else if (const DoneMessage *d = boost::get<DoneMessage>(&msg)) {
    std::vector<int> mismatched = cross_check_affinities(d->result);
    for (unsigned i = 0, n = mismatched.size(); i < n; i++) {
      log.log("warning: job %s mode %d REMARK VINA RESULT disagrees with the result table\n",
          job->id.c_str(), mismatched[i]);
    }
    notifyProgress(job, 100, JobCompleted);
    JobOutcome outcome(JobCompleted, NoError, "");
    outcome.result = d->result;
    settle(job, outcome);
  } else if (const ErrorMessage *e = boost::get<ErrorMessage>(&msg)) {
    settle(job, JobOutcome(JobFailed, e->error, e->message));
  }
}

void JobController::notifyProgress(ActiveJobPtr job, unsigned percent, JobState state) {
  boost::mutex::scoped_lock lock(job->settleMutex);
  if (job->settled || !job->observer) return;
  job->observer->progress(job->id, percent, state);
}

//first caller wins; the observer hears about exactly one settlement
bool JobController::settle(ActiveJobPtr job, const JobOutcome& outcome) {
  {
    boost::mutex::scoped_lock lock(job->settleMutex);
    if (job->settled) return false;
    job->settled = true;
    job->outcome = outcome;
    log.log("job %s settled: %s %s %s\n", job->id.c_str(), jobStateName(outcome.state),
        jobErrorName(outcome.error), outcome.message.c_str());
    if (job->observer) job->observer->settled(job->id, outcome);
  }
  boost::mutex::scoped_lock lock(mu);
  last = outcome;
  settledCond.notify_all();
  return true;
}

bool JobController::isSettled(ActiveJobPtr job) {
  boost::mutex::scoped_lock lock(job->settleMutex);
  return job->settled;
}

//stop the engine, wait for both threads and drop the context
//the dispatcher may already have dropped it
void JobController::release(ActiveJobPtr job) {
  boost::shared_ptr<EngineContext> context;
  {
    boost::mutex::scoped_lock lock(mu);
    context = job->context;
  }
  if (context) {
    context->terminate();
    context->inbound().close();
  }
  if (job->dispatcher.joinable()) job->dispatcher.join();
  {
    boost::mutex::scoped_lock lock(mu);
    job->context.reset();
  }
}
