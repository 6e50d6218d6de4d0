/*
 * Logger.h
 *
 *  A multi-threading aware class for logging concurrently to a file.
 *  An empty log name disables logging.
 */

#ifndef DOCKRUN_LOGGER_H
#define DOCKRUN_LOGGER_H

#include <cstdio>
#include <cstdarg>
#include <string>
#include <boost/thread/mutex.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "file.h"

class Logger {
    FILE *LOG;
    boost::mutex locker;

    Logger(const Logger&);
    Logger& operator=(const Logger&);
  public:
    Logger()
        : LOG(NULL) {
    }

    //throws file_error if logname can't be opened for appending
    explicit Logger(const std::string& logname)
        : LOG(NULL) {
      if (logname.size() == 0) return;
      LOG = fopen(logname.c_str(), "a");
      if (LOG == NULL) {
        throw file_error(path(logname), false);
      }
      setlinebuf(LOG);
    }

    ~Logger() {
      if (LOG) fclose(LOG);
    }

    bool enabled() const {
      return LOG != NULL;
    }

    //output message with printfstyle arguments atomically to log with timestamp
    void log(const char* str, ...) {
      if (!LOG) return;
      va_list argptr;
      va_start(argptr, str);

      boost::mutex::scoped_lock lock(locker);
      boost::posix_time::ptime t(boost::posix_time::second_clock::local_time());
      fprintf(LOG, "%s ", boost::posix_time::to_simple_string(t).c_str());
      vfprintf(LOG, str, argptr);

      va_end(argptr);
    }
};

#endif /* DOCKRUN_LOGGER_H */
