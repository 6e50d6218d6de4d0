/*
 * EngineContext.h
 *
 *  The isolated place one docking run happens: a private scratch directory,
 *  a thread, and at most one engine process.  A context is used for exactly
 *  one job and then destroyed; it is driven entirely by OutboundMessages and
 *  reports back with InboundMessages.
 */

#ifndef DOCKRUN_ENGINECONTEXT_H
#define DOCKRUN_ENGINECONTEXT_H

#include <string>
#include <vector>
#include <ios>
#include <sys/types.h>
#include <boost/optional.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/filesystem/path.hpp>
#include "JobMessages.h"
#include "Logger.h"

//how to find and run the engine
struct EngineConfig {
    std::string executable; //path, or a name looked up on PATH
    boost::filesystem::path scratchRoot; //parent of per-job directories, system temp if empty
    unsigned pollMs; //how often the running engine is checked on

    EngineConfig()
        : executable("vina"), pollMs(50) {
    }
};

//engine command line for job, without the program name; --cpu 1 is always passed
std::vector<std::string> engineArguments(const DockingJob& job,
    const boost::filesystem::path& receptor, const boost::filesystem::path& ligand,
    const boost::filesystem::path& out);

//absolute path of an executable engine, none if it can't be found
boost::optional<boost::filesystem::path> resolveExecutable(const std::string& name);

class EngineContext {
    EngineConfig config;
    Logger& log;

    MessageQueue<OutboundMessage> outq;
    MessageQueue<InboundMessage> inq;

    boost::filesystem::path engine; //resolved executable
    boost::filesystem::path scratch;
    boost::thread *worker;

    boost::mutex procMutex; //protects pid and killed
    pid_t pid; //process group of the running engine, 0 if none
    bool killed;

    static void thread_run(EngineContext* ctx);
    void run();

    void post(const InboundMessage& msg) {
      inq.push(msg);
    }

    bool isKilled();
    bool stage(const DockingJob& job);
    bool execute(const DockingJob& job);
    boost::optional<docking_result> collect();
    void streamLog(std::streamoff& offset);
    void removeScratch();

    EngineContext(const EngineContext&);
    EngineContext& operator=(const EngineContext&);
  public:
    EngineContext(const EngineConfig& cfg, Logger& l);
    //kills any engine, joins the thread and removes the scratch directory
    ~EngineContext();

    //spawn the context thread; it waits for an InitMessage
    void start();

    void send(const OutboundMessage& msg) {
      outq.push(msg);
    }

    MessageQueue<InboundMessage>& inbound() {
      return inq;
    }

    //kill the engine process group now and tell the thread to stop
    void terminate();

    //true while an engine process exists that has not been reaped
    bool engineRunning();

    static const char* receptorFile;
    static const char* ligandFile;
    static const char* outputFile;
    static const char* logFile;
};

#endif /* DOCKRUN_ENGINECONTEXT_H */
