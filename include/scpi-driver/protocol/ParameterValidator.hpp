#pragma once
#include "scpi-driver/export.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace scpidrv {

using Matrix = std::vector<std::vector<double>>;

/// Loosely typed value as supplied by a caller
using ParamValue =
    std::variant<std::monostate, bool, double, std::string, std::vector<bool>,
                 std::vector<double>, std::vector<std::string>, Matrix>;

/// Flat name/value sequence: name, value, name, value, ...
using ParamList = std::vector<ParamValue>;

enum class FieldShape {
  Numeric, // ^[\w\.\+\-]+$
  Token,   // ^\w+$
};

struct FieldSpec {
  std::string canonical;
  std::vector<std::string> aliases; // lower-case, canonical not required
  FieldShape shape{FieldShape::Numeric};
};

struct Accepted {
  std::string value;
};

struct Rejected {
  std::string reason;
};

using FieldResult = std::variant<Accepted, Rejected>;

/// Canonical name/value pairs in the order of the owning field table
class SCPI_DRIVER_API ParameterSet {
public:
  using Entry = std::pair<std::string, std::string>;

  void set(const std::string &name, const std::string &value);
  bool has(const std::string &name) const;
  std::optional<std::string> get(const std::string &name) const;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
  std::vector<Entry>::const_iterator end() const { return entries_.end(); }

  /// Two-column listing, names padded to 13 characters and values longer
  /// than 44 characters cut to 40 plus " ..."
  std::string format_table() const;
  nlohmann::json to_json() const;

private:
  friend class ParameterValidator;
  std::vector<Entry> entries_;
};

struct ValidationResult {
  ParameterSet params;
  std::vector<std::string> diagnostics;
};

/// Normalizes caller name/value pairs against a closed table of fields.
/// Nothing here throws: unknown names, bad shapes and dangling names become
/// diagnostics and the remaining pairs are still processed.
class SCPI_DRIVER_API ParameterValidator {
public:
  explicit ParameterValidator(std::vector<FieldSpec> fields);

  /// Canonical name for an alias (case-insensitive)
  std::optional<std::string> canonical_name(const std::string &name) const;

  /// Coerce to text: strings upper-cased, lists joined with ", ",
  /// booleans as 0/1, numbers with up to 10 significant digits
  static FieldResult coerce(const ParamValue &value);

  FieldResult validate_field(const FieldSpec &field,
                             const ParamValue &value) const;

  ValidationResult validate(const ParamList &args) const;

  const std::vector<FieldSpec> &fields() const { return fields_; }

private:
  const FieldSpec *find_field(const std::string &canonical) const;

  std::vector<FieldSpec> fields_;
};

} // namespace scpidrv
