#pragma once
/** @file  EventBus.hpp
 *  @brief In-process publish/subscribe with ordered, synchronous delivery.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace dahu {
  namespace core {

    /**
 * @class EventBus
 * @brief One event channel carrying a `Payload`.
 *
 *  * Handlers run in subscription order, inside publish().
 *  * A throwing handler is reported to the error sink and the fan-out continues.
 *  * Nothing is buffered: a handler subscribed after publish() never sees it.
 */
    template <typename Payload> class EventBus {
    public:
      using Handler = std::function<void(const Payload&)>;
      using SubscriptionId = std::uint64_t;
      using ErrorSink = std::function<void(const std::string&)>;

      explicit EventBus(std::string name = "event") : name_(std::move(name)) {}

      /// Receives a message for every handler that throws during publish().
      void setErrorSink(ErrorSink sink) { sink_ = std::move(sink); }

      SubscriptionId subscribe(Handler handler) {
        const SubscriptionId id = nextId_++;
        handlers_.emplace_back(id, std::move(handler));
        return id;
      }

      /** @returns false if \p id is not (or no longer) subscribed. */
      bool unsubscribe(SubscriptionId id) {
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
          if (it->first == id) {
            handlers_.erase(it);
            return true;
          }
        }
        return false;
      }

      void publish(const Payload& payload) {
        // snapshot so handlers may (un)subscribe while we deliver
        const auto targets = handlers_;
        for (const auto& [id, handler] : targets) {
          try {
            handler(payload);
          } catch (const std::exception& e) {
            report(id, e.what());
          } catch (...) {
            report(id, "non-standard exception");
          }
        }
      }

      std::size_t subscriberCount() const { return handlers_.size(); }

    private:
      void report(SubscriptionId id, const std::string& what) {
        if (sink_)
          sink_("[EventBus] " + name_ + " handler #" + std::to_string(id) + " failed: " + what);
      }

      std::string name_;
      std::vector<std::pair<SubscriptionId, Handler>> handlers_;
      SubscriptionId nextId_{ 1 };
      ErrorSink sink_{};
    };

    /** Channels the editor core publishes on; payload is the slide image path. */
    struct EditorEvents {
      EventBus<std::string> slideAdded{ "slideAdded" };
      EventBus<std::string> selectionChanged{ "selectionChanged" };

      /// Route handler faults of every channel to one sink.
      void setErrorSink(const std::function<void(const std::string&)>& sink) {
        slideAdded.setErrorSink(sink);
        selectionChanged.setErrorSink(sink);
      }
    };

  } // namespace core
} // namespace dahu
