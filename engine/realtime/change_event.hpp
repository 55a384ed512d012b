#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace quell {
namespace realtime {

// Kind of row change; ANY is only meaningful in a SubscriptionSpec
enum class EventKind {
  INSERT,
  UPDATE,
  DELETE,
  ANY
};

const char* ToString(EventKind kind);

// Parses "INSERT", "UPDATE", "DELETE", "*" / "ANY" (case-insensitive)
bool ParseEventKind(const std::string& text, EventKind* out);

// Row snapshot as delivered by the backend (a JSON object)
using Row = nlohmann::json;

struct InsertEvent {
  std::string table;
  std::string commit_timestamp;
  Row new_row;
};

struct UpdateEvent {
  std::string table;
  std::string commit_timestamp;
  Row old_row;  // May only carry the primary key, depending on replica identity
  Row new_row;
};

struct DeleteEvent {
  std::string table;
  std::string commit_timestamp;
  Row old_row;
};

// Validated change event
using ChangeEvent = std::variant<InsertEvent, UpdateEvent, DeleteEvent>;

EventKind GetEventKind(const ChangeEvent& event);
const std::string& GetTable(const ChangeEvent& event);

// Synthetic envelope delivered when a flush carries more than one event
struct ChangeBatch {
  static constexpr const char* kKind = "batch";

  std::vector<ChangeEvent> events;  // Arrival order

  std::size_t count() const { return events.size(); }
};

// What a subscriber callback receives: one event unwrapped, or a batch
using Delivery = std::variant<ChangeEvent, ChangeBatch>;

/**
 * @brief Validate a raw change payload and convert it to a ChangeEvent
 *
 * Expected shape:
 *   {"eventType": "INSERT"|"UPDATE"|"DELETE", "table": "...",
 *    "new": {...}, "old": {...}, "commit_timestamp": "..."}
 *
 * INSERT requires an object "new", DELETE an object "old", UPDATE an object
 * "new" ("old" defaults to an empty object). Extra fields are ignored.
 *
 * @return false with a reason in *error when the payload is malformed
 */
bool ParseChangeEvent(const nlohmann::json& raw, ChangeEvent* out, std::string* error);

// Back to the raw payload shape (used for logging and the demo app)
nlohmann::json ToJson(const ChangeEvent& event);
nlohmann::json ToJson(const Delivery& delivery);

}  // namespace realtime
}  // namespace quell
