#include "pati/core/Event.hh"
#include "pati/core/Log.hh"
#include "pati/utils/ErrorHandling.hh"
#include "pati/utils/Utils.hh"
#include <algorithm>

namespace pati {

std::string EventEmitter::addListener(const std::string& eventType, EventListener listener) {
    if (eventType.empty()) {
        throwError(ErrorCode::InvalidArgument, "Event type cannot be empty");
    }

    if (!listener) {
        throwError(ErrorCode::InvalidArgument, "Event listener cannot be null");
    }

    std::lock_guard<std::mutex> lock(listenersMutex);

    ListenerEntry entry;
    entry.id = Utils::generateUniqueId("l_");
    entry.listener = std::move(listener);
    listeners[eventType].push_back(entry);

    PATI_LOG_DEBUG("Added listener for '{}' with ID '{}'", eventType, entry.id);

    return entry.id;
}

bool EventEmitter::removeListener(const std::string& eventType, const std::string& listenerId) {
    std::lock_guard<std::mutex> lock(listenersMutex);

    auto it = listeners.find(eventType);
    if (it == listeners.end()) {
        return false;
    }

    auto& entries = it->second;
    auto entryIt = std::find_if(entries.begin(), entries.end(),
                                [&listenerId](const ListenerEntry& entry) { return entry.id == listenerId; });

    if (entryIt == entries.end()) {
        return false;
    }

    entries.erase(entryIt);
    if (entries.empty()) {
        listeners.erase(it);
    }
    PATI_LOG_DEBUG("Removed listener for '{}' with ID '{}'", eventType, listenerId);
    return true;
}

bool EventEmitter::emit(const std::string& eventType, const EventArgs& args) {
    std::vector<ListenerEntry> toInvoke;

    {
        std::lock_guard<std::mutex> lock(listenersMutex);

        auto it = listeners.find(eventType);
        if (it != listeners.end()) {
            toInvoke = it->second;
        }
    }

    if (toInvoke.empty()) {
        if (eventType == kErrorEvent) {
            PATI_LOG_ERROR("Unhandled '{}' event", eventType);
            std::rethrow_exception(errorFromArgs(args));
        }
        return false;
    }

    PATI_LOG_TRACE("Emitting '{}' to {} listener(s)", eventType, toInvoke.size());

    // Listeners run outside the lock: they may add or remove listeners.
    for (const auto& entry : toInvoke) {
        entry.listener(args);
    }

    return true;
}

size_t EventEmitter::listenerCount(const std::string& eventType) const {
    std::lock_guard<std::mutex> lock(listenersMutex);

    auto it = listeners.find(eventType);
    return it == listeners.end() ? 0 : it->second.size();
}

std::exception_ptr errorFromArgs(const EventArgs& args) {
    if (!args.empty()) {
        if (const auto* error = std::any_cast<std::exception_ptr>(&args.front()); error && *error) {
            return *error;
        }
    }
    return std::make_exception_ptr(PatiException("Error event without an exception payload", ErrorCode::UnhandledError));
}

} // namespace pati
