/*
 * JobController.h
 *
 *  Runs docking jobs for one session, at most one at a time.  Submitting a
 *  new job tears down the active one (which settles as aborted); nothing is
 *  queued.  submit and abort return without waiting for the engine.
 */

#ifndef DOCKRUN_JOBCONTROLLER_H
#define DOCKRUN_JOBCONTROLLER_H

#include <boost/shared_ptr.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition.hpp>
#include "EngineContext.h"

class JobController {
    //everything belonging to the job in flight
    struct ActiveJob {
        std::string id;
        JobObserver *observer;
        boost::shared_ptr<EngineContext> context; //guarded by mu, dropped once settled
        boost::thread dispatcher;
        boost::system_time deadline;
        unsigned timeoutMs;

        boost::mutex settleMutex; //orders notifications before settlement
        bool settled;
        JobOutcome outcome;

        ActiveJob()
            : observer(NULL), timeoutMs(0), settled(false) {
        }
    };
    typedef boost::shared_ptr<ActiveJob> ActiveJobPtr;

    EngineConfig config;
    Logger& log;

    boost::mutex mu; //protects current, last and each job's context
    boost::condition settledCond; //signaled when a job settles, waits on mu
    ActiveJobPtr current;
    boost::optional<JobOutcome> last;

    boost::mutex submitMutex; //serializes submit, abort and destruction

    static void thread_dispatch(JobController* c, ActiveJobPtr job);
    void dispatch(ActiveJobPtr job);
    void handle(ActiveJobPtr job, const InboundMessage& msg);
    void notifyProgress(ActiveJobPtr job, unsigned percent, JobState state);
    bool settle(ActiveJobPtr job, const JobOutcome& outcome);
    bool isSettled(ActiveJobPtr job);
    void release(ActiveJobPtr job);

    JobController(const JobController&);
    JobController& operator=(const JobController&);
  public:
    JobController(const EngineConfig& cfg, Logger& l);
    ~JobController();

    //start job; observer (may be NULL) must outlive the job's settlement
    void submit(const DockingJob& job, JobObserver *observer);

    //settle the active job as aborted; does nothing if no job is active
    void abort();

    //block until the current job settles or timeoutMs passes; true if settled
    bool wait(unsigned timeoutMs);

    //true if a job has been submitted and not settled
    bool active();

    //true while the current job's engine process exists
    bool engineRunning();

    //true until the current job's engine context has been torn down, which
    //happens shortly after settlement
    bool holdsEngineContext();

    //settlement of the most recent job, if it has settled
    boost::optional<JobOutcome> lastOutcome();
};

#endif /* DOCKRUN_JOBCONTROLLER_H */
