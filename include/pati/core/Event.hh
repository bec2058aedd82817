#pragma once

#include <any>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pati {

/// Payload delivered with an event. An "error" event carries a
/// std::exception_ptr as its first argument.
using EventArgs = std::vector<std::any>;

using EventListener = std::function<void(const EventArgs&)>;

/// Name of the event that sources use to report fatal errors.
inline const std::string kErrorEvent = "error";

/// The subscription contract a dispatcher consumes. Implementations deliver
/// emitted events synchronously, in registration order.
class EventSource {
public:
  virtual ~EventSource() = default;

  /// Returns an id that removeListener() accepts.
  virtual std::string addListener(const std::string& eventType, EventListener listener) = 0;

  /// Returns false if no such listener is registered.
  virtual bool removeListener(const std::string& eventType, const std::string& listenerId) = 0;
};

/// In-process EventSource. Emitting kErrorEvent with no listener attached
/// throws the carried exception.
class EventEmitter : public EventSource {
public:
  EventEmitter() = default;

  std::string addListener(const std::string& eventType, EventListener listener) override;
  bool removeListener(const std::string& eventType, const std::string& listenerId) override;

  /// Delivers `args` to a snapshot of the current listeners. Returns true if
  /// at least one listener ran.
  bool emit(const std::string& eventType, const EventArgs& args = {});

  size_t listenerCount(const std::string& eventType) const;

private:
  struct ListenerEntry {
    std::string id;
    EventListener listener;
  };

  mutable std::mutex listenersMutex;
  std::unordered_map<std::string, std::vector<ListenerEntry>> listeners;
};

/// Extracts the exception carried by an "error" event. Payloads without one
/// map to a PatiException with ErrorCode::UnhandledError.
std::exception_ptr errorFromArgs(const EventArgs& args);

} // namespace pati
