#pragma once
/** @file  KeyInput.hpp
 *  @brief Abstract key-event source with listener registration.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace dahu {
  namespace io {

    /**
 * @class KeyInput
 * @brief Base-class for keyboard drivers: holds listeners and delivers
 *        normalized key names ("f7", "escape", ...) to them.
 *
 *  * Derived drivers call `emit()` from their owner thread.
 *  * No copy (listeners capture `this` of their owners).
 */
    class KeyInput {
    public:
      using Listener = std::function<void(const std::string& key)>;
      using ListenerId = std::uint64_t;

      KeyInput() = default;
      virtual ~KeyInput() = default;

      ListenerId addKeyListener(Listener l) {
        const ListenerId id = nextId_++;
        listeners_.emplace_back(id, std::move(l));
        return id;
      }

      /** @returns false if \p id was not registered. */
      bool removeKeyListener(ListenerId id) {
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
          if (it->first == id) {
            listeners_.erase(it);
            return true;
          }
        }
        return false;
      }

      std::size_t listenerCount() const { return listeners_.size(); }

      /// Lower-case, trimmed key name.
      static std::string normalize(const std::string& key);

      // ─── non-copyable ────────────────────────────────────────────────────────
      KeyInput(const KeyInput&) = delete;
      KeyInput& operator=(const KeyInput&) = delete;

    protected:
      /** Derived classes call this for every key press they detect. */
      void emit(const std::string& key) {
        const std::string name = normalize(key);
        const auto targets = listeners_; // a listener may remove itself
        for (const auto& entry : targets)
          entry.second(name);
      }

    private:
      std::vector<std::pair<ListenerId, Listener>> listeners_;
      ListenerId nextId_{ 1 };
    };

    /**
 * @class ConsoleKeyInput
 * @brief Key source fed by the console front end (`key <name>` commands).
 */
    class ConsoleKeyInput : public KeyInput {
    public:
      void press(const std::string& key) { emit(key); }
    };

  } // namespace io
} // namespace dahu
