#pragma once

#include "data_kind.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flagstore {

/**
 * Resumption cursor for an update source: an opaque state token plus the
 * version of the data it identifies.
 */
class Selector {
public:
  Selector() = default;
  Selector(std::string state, int64_t version)
      : state_(std::move(state)), version_(version) {}

  static Selector noSelector() { return Selector(); }

  const std::string &getState() const { return state_; }
  int64_t getVersion() const { return version_; }

  bool isDefined() const { return *this != noSelector(); }

  nlohmann::json toJson() const;
  // Throws ValidationException if state or version is missing
  static Selector fromJson(const nlohmann::json &data);

  bool operator==(const Selector &other) const {
    return state_ == other.state_ && version_ == other.version_;
  }
  bool operator!=(const Selector &other) const { return !(*this == other); }

private:
  std::string state_;
  int64_t version_ = 0;
};

enum class IntentCode { TRANSFER_FULL, TRANSFER_CHANGES, TRANSFER_NONE };

// "xfer-full", "xfer-changes", "none"
const char *intentCodeToString(IntentCode code);
std::optional<IntentCode> intentCodeFromString(std::string_view value);

enum class ChangeType { PUT, DELETE };

const char *changeTypeToString(ChangeType type);

struct Change {
  ChangeType action;
  DataKind kind;
  std::string key;
  int64_t version = 0;
  // Item payload; null for deletes
  nlohmann::json object;
};

struct ChangeSet {
  IntentCode intentCode = IntentCode::TRANSFER_NONE;
  std::vector<Change> changes;
  Selector selector;
};

// Starting state produced by an initializer
struct Basis {
  ChangeSet changeSet;
  bool persist = false;
  std::optional<std::string> environmentId;
};

/**
 * Accumulates changes between a server intent and the payload-transferred
 * event that completes them.
 */
class ChangeSetBuilder {
public:
  static ChangeSet noChanges();
  static ChangeSet empty(const Selector &selector);

  void start(IntentCode intent);

  // Turns a TRANSFER_NONE intent into TRANSFER_CHANGES
  void expectChanges();

  // Discards accumulated changes but keeps the intent
  void reset();

  // Completes the current change set. After a full transfer, later change
  // sets from the same builder are deltas.
  ChangeSet finish(const Selector &selector);

  void addPut(DataKind kind, const std::string &key, int64_t version,
              nlohmann::json object);
  void addDelete(DataKind kind, const std::string &key, int64_t version);

  std::optional<IntentCode> getIntent() const { return intent_; }
  const std::vector<Change> &getChanges() const { return changes_; }

private:
  std::optional<IntentCode> intent_;
  std::vector<Change> changes_;
};

} // namespace flagstore
