/*
 * JobMessages.h
 *
 *  Messages exchanged between a JobController and an EngineContext.  They
 *  are copied into the queue; neither side holds references into the other.
 */

#ifndef DOCKRUN_JOBMESSAGES_H
#define DOCKRUN_JOBMESSAGES_H

#include <deque>
#include <string>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition.hpp>
#include <boost/thread/thread_time.hpp>
#include "DockingJob.h"

//controller to context
struct InitMessage {
    DockingJob job;
};

struct RunMessage {
};

struct AbortMessage {
};

typedef boost::variant<InitMessage, RunMessage, AbortMessage> OutboundMessage;

//context to controller
struct ProgressMessage {
    unsigned percent;
    JobState state;

    ProgressMessage(unsigned p, JobState s)
        : percent(p), state(s) {
    }
};

struct PartialOutputMessage {
    std::string text;

    explicit PartialOutputMessage(const std::string& t)
        : text(t) {
    }
};

struct DoneMessage {
    docking_result result;
};

struct ErrorMessage {
    JobError error;
    std::string message;

    ErrorMessage(JobError e, const std::string& msg)
        : error(e), message(msg) {
    }
};

typedef boost::variant<ProgressMessage, PartialOutputMessage, DoneMessage, ErrorMessage> InboundMessage;

//unbounded FIFO; once closed pushes are dropped and waiting pops return none
template<typename T>
class MessageQueue {
    std::deque<T> items;
    bool closed;
    boost::mutex mu;
    boost::condition cond;

    MessageQueue(const MessageQueue&);
    MessageQueue& operator=(const MessageQueue&);
  public:
    MessageQueue()
        : closed(false) {
    }

    void push(const T& msg) {
      boost::mutex::scoped_lock lock(mu);
      if (closed) return;
      items.push_back(msg);
      cond.notify_one();
    }

    //block until a message arrives or the queue is closed
    boost::optional<T> pop() {
      boost::mutex::scoped_lock lock(mu);
      while (items.empty() && !closed)
        cond.wait(lock);
      return take();
    }

    //none if nothing arrived before deadline
    boost::optional<T> popUntil(const boost::system_time& deadline) {
      boost::mutex::scoped_lock lock(mu);
      while (items.empty() && !closed) {
        if (!cond.timed_wait(lock, deadline)) break;
      }
      return take();
    }

    boost::optional<T> popFor(unsigned ms) {
      return popUntil(boost::get_system_time() + boost::posix_time::milliseconds(ms));
    }

    void close() {
      boost::mutex::scoped_lock lock(mu);
      closed = true;
      cond.notify_all();
    }

    bool isClosed() {
      boost::mutex::scoped_lock lock(mu);
      return closed;
    }

  private:
    //mu must be held
    boost::optional<T> take() {
      if (items.empty()) return boost::none;
      T msg = items.front();
      items.pop_front();
      return msg;
    }
};

#endif /* DOCKRUN_JOBMESSAGES_H */
