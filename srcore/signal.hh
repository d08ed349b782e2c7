// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __SHEETROCK_SIGNAL_HH__
#define __SHEETROCK_SIGNAL_HH__

#include <srcore/inout.hh>
#include <functional>

namespace Sheetrock {

template<typename> class Signal; // left undefined

/** Signal is a list of callbacks that are invoked together by emit().
 * Handlers are added with `sig() += callback`, which returns a connection id, and removed
 * with `sig() -= id`. Handlers may connect and disconnect during an emission, a handler
 * that is disconnected during an emission is not invoked anymore. New handlers are
 * invoked from the next emission on.
 */
template<class... Args>
class Signal<void (Args...)> {
  typedef std::function<void (Args...)> Callback;
  struct Handler {
    size_t   id;
    bool     connected;
    Callback callback;
  };
  typedef std::shared_ptr<Handler> HandlerP;
  vector<HandlerP> handlers_;
  size_t           last_id_;
  size_t
  connect (const Callback &callback)
  {
    SHEETROCK_ASSERT_RETURN (callback != NULL, 0);
    HandlerP handler = std::make_shared<Handler>();
    handler->id = ++last_id_;
    handler->connected = true;
    handler->callback = callback;
    handlers_.push_back (handler);
    return handler->id;
  }
  bool
  disconnect (size_t id)
  {
    for (auto it = handlers_.begin(); it != handlers_.end(); ++it)
      if ((*it)->id == id)
        {
          (*it)->connected = false;
          handlers_.erase (it);
          return true;
        }
    return false;
  }
public:
  class Connector {
    friend class Signal;
    Signal  &signal_;
    explicit Connector  (Signal &signal) : signal_ (signal) {}
  public:
    /// Add @a callback as handler, returns its connection id.
    size_t   operator+= (const Callback &callback)     { return signal_.connect (callback); }
    /// Remove the handler with connection @a id, returns whether it was connected.
    bool     operator-= (size_t id)                    { return signal_.disconnect (id); }
  };
  Signal               () : last_id_ (0) {}
  SHEETROCK_CLASS_NON_COPYABLE (Signal);
  /// Connector to add or remove handlers with operator+= and operator-=.
  Connector operator() ()               { return Connector (*this); }
  size_t    n_handlers () const         { return handlers_.size(); }
  /// Invoke the handlers in connection order, the signal may be destroyed by a handler.
  void
  emit (Args... args)
  {
    const vector<HandlerP> handlers = handlers_;
    for (const HandlerP &handler : handlers)
      if (handler->connected)
        handler->callback (args...);
  }
};

} // Sheetrock

#endif // __SHEETROCK_SIGNAL_HH__
