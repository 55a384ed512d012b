#include "change_event.hpp"

#include <algorithm>
#include <cctype>

namespace quell {
namespace realtime {

namespace {

std::string ToUpper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

// Reads an optional string field; non-string values are rejected
bool ReadOptionalString(const nlohmann::json& raw, const char* field, std::string* out,
                        std::string* error) {
  auto it = raw.find(field);
  if (it == raw.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    *error = std::string("field '") + field + "' must be a string";
    return false;
  }
  *out = it->get<std::string>();
  return true;
}

// Reads a row snapshot; absent means empty object when optional
bool ReadRow(const nlohmann::json& raw, const char* field, bool required, Row* out,
             std::string* error) {
  auto it = raw.find(field);
  if (it == raw.end() || it->is_null()) {
    if (required) {
      *error = std::string("missing row snapshot '") + field + "'";
      return false;
    }
    *out = nlohmann::json::object();
    return true;
  }
  if (!it->is_object()) {
    *error = std::string("row snapshot '") + field + "' must be an object";
    return false;
  }
  *out = *it;
  return true;
}

}  // namespace

const char* ToString(EventKind kind) {
  switch (kind) {
    case EventKind::INSERT: return "INSERT";
    case EventKind::UPDATE: return "UPDATE";
    case EventKind::DELETE: return "DELETE";
    case EventKind::ANY: return "*";
  }
  return "*";
}

bool ParseEventKind(const std::string& text, EventKind* out) {
  std::string upper = ToUpper(text);
  if (upper == "INSERT") {
    *out = EventKind::INSERT;
  } else if (upper == "UPDATE") {
    *out = EventKind::UPDATE;
  } else if (upper == "DELETE") {
    *out = EventKind::DELETE;
  } else if (upper == "*" || upper == "ANY") {
    *out = EventKind::ANY;
  } else {
    return false;
  }
  return true;
}

EventKind GetEventKind(const ChangeEvent& event) {
  switch (event.index()) {
    case 0: return EventKind::INSERT;
    case 1: return EventKind::UPDATE;
    default: return EventKind::DELETE;
  }
}

const std::string& GetTable(const ChangeEvent& event) {
  return std::visit([](const auto& e) -> const std::string& { return e.table; }, event);
}

bool ParseChangeEvent(const nlohmann::json& raw, ChangeEvent* out, std::string* error) {
  if (!raw.is_object()) {
    *error = "payload is not an object";
    return false;
  }

  auto type_it = raw.find("eventType");
  if (type_it == raw.end() || !type_it->is_string()) {
    *error = "missing string field 'eventType'";
    return false;
  }
  EventKind kind;
  if (!ParseEventKind(type_it->get<std::string>(), &kind) || kind == EventKind::ANY) {
    *error = "unknown eventType '" + type_it->get<std::string>() + "'";
    return false;
  }

  auto table_it = raw.find("table");
  if (table_it == raw.end() || !table_it->is_string() || table_it->get<std::string>().empty()) {
    *error = "missing string field 'table'";
    return false;
  }
  std::string table = table_it->get<std::string>();

  std::string commit_timestamp;
  if (!ReadOptionalString(raw, "commit_timestamp", &commit_timestamp, error)) {
    return false;
  }

  switch (kind) {
    case EventKind::INSERT: {
      InsertEvent event{table, commit_timestamp, {}};
      if (!ReadRow(raw, "new", true, &event.new_row, error)) return false;
      *out = std::move(event);
      return true;
    }
    case EventKind::UPDATE: {
      UpdateEvent event{table, commit_timestamp, {}, {}};
      if (!ReadRow(raw, "new", true, &event.new_row, error)) return false;
      if (!ReadRow(raw, "old", false, &event.old_row, error)) return false;
      *out = std::move(event);
      return true;
    }
    case EventKind::DELETE: {
      DeleteEvent event{table, commit_timestamp, {}};
      if (!ReadRow(raw, "old", true, &event.old_row, error)) return false;
      *out = std::move(event);
      return true;
    }
    case EventKind::ANY:
      break;
  }
  *error = "unreachable event kind";
  return false;
}

nlohmann::json ToJson(const ChangeEvent& event) {
  nlohmann::json j;
  j["eventType"] = ToString(GetEventKind(event));
  j["table"] = GetTable(event);
  if (const auto* insert = std::get_if<InsertEvent>(&event)) {
    j["new"] = insert->new_row;
    j["commit_timestamp"] = insert->commit_timestamp;
  } else if (const auto* update = std::get_if<UpdateEvent>(&event)) {
    j["new"] = update->new_row;
    j["old"] = update->old_row;
    j["commit_timestamp"] = update->commit_timestamp;
  } else if (const auto* del = std::get_if<DeleteEvent>(&event)) {
    j["old"] = del->old_row;
    j["commit_timestamp"] = del->commit_timestamp;
  }
  return j;
}

nlohmann::json ToJson(const Delivery& delivery) {
  if (const auto* single = std::get_if<ChangeEvent>(&delivery)) {
    return ToJson(*single);
  }
  const auto& batch = std::get<ChangeBatch>(delivery);
  nlohmann::json j;
  j["kind"] = ChangeBatch::kKind;
  j["count"] = batch.count();
  j["events"] = nlohmann::json::array();
  for (const auto& event : batch.events) {
    j["events"].push_back(ToJson(event));
  }
  return j;
}

}  // namespace realtime
}  // namespace quell
