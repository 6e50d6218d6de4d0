#include "DockingJob.h"

const char* jobStateName(JobState s) {
  switch (s) {
  case JobCreated:
    return "created";
  case JobInitializing:
    return "initializing";
  case JobFilesStaged:
    return "files staged";
  case JobExecuting:
    return "executing";
  case JobParsingOutput:
    return "parsing output";
  case JobCompleted:
    return "completed";
  case JobFailed:
    return "failed";
  case JobAborted:
    return "aborted";
  case JobTimedOut:
    return "timed out";
  }
  return "unknown";
}

const char* jobErrorName(JobError e) {
  switch (e) {
  case NoError:
    return "none";
  case EngineInitFailed:
    return "EngineInitFailed";
  case MountFailed:
    return "MountFailed";
  case EngineCrashed:
    return "EngineCrashed";
  case NoOutputProduced:
    return "NoOutputProduced";
  case Timeout:
    return "Timeout";
  case Aborted:
    return "Aborted";
  }
  return "unknown";
}
