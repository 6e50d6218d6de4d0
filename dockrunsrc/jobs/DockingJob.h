/*
 * DockingJob.h
 *
 *  A single docking request and what the caller hears back about it.
 */

#ifndef DOCKRUN_DOCKINGJOB_H
#define DOCKRUN_DOCKINGJOB_H

#include <string>
#include "box.h"
#include "user_opts.h"
#include "vina_output.h"

enum JobState {
  JobCreated,
  JobInitializing,
  JobFilesStaged,
  JobExecuting,
  JobParsingOutput,
  JobCompleted,
  JobFailed,
  JobAborted,
  JobTimedOut
};

//why a job did not complete; NoError for completed jobs
enum JobError {
  NoError,
  EngineInitFailed, //engine missing, not executable, or couldn't be started
  MountFailed, //scratch directory or staged files couldn't be written
  EngineCrashed, //nonzero exit or killed by a signal
  NoOutputProduced, //clean exit without an output file
  Timeout,
  Aborted
};

const char* jobStateName(JobState s);
const char* jobErrorName(JobError e);

const unsigned defaultJobTimeoutMs = 60000;

struct DockingJob {
    std::string id;
    std::string receptor; //PDBQT text
    std::string ligand; //PDBQT text
    grid_box box;
    search_params search;
    unsigned timeoutMs; //wall clock, from submission

    DockingJob()
        : timeoutMs(defaultJobTimeoutMs) {
    }
};

//the settling event of a job
struct JobOutcome {
    JobState state;
    JobError error;
    std::string message;
    docking_result result; //only filled for completed jobs

    JobOutcome()
        : state(JobCreated), error(NoError) {
    }
    JobOutcome(JobState s, JobError e, const std::string& msg)
        : state(s), error(e), message(msg) {
    }

    bool succeeded() const {
      return state == JobCompleted;
    }
};

//callbacks arrive on a controller thread, never the submitting one, and must
//not call back into the controller
class JobObserver {
  public:
    virtual ~JobObserver() {
    }
    virtual void progress(const std::string& jobid, unsigned percent, JobState state) {
    }
    virtual void partialOutput(const std::string& jobid, const std::string& text) {
    }
    //called exactly once per job, after any progress notifications
    virtual void settled(const std::string& jobid, const JobOutcome& outcome) = 0;
};

#endif /* DOCKRUN_DOCKINGJOB_H */
