#include "scpi-driver/protocol/ParameterValidator.hpp"
#include "scpi-driver/protocol/ResponseParser.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <map>
#include <regex>

namespace scpidrv {

// ParameterSet

void ParameterSet::set(const std::string &name, const std::string &value) {
  for (auto &entry : entries_) {
    if (entry.first == name) {
      entry.second = value;
      return;
    }
  }
  entries_.emplace_back(name, value);
}

bool ParameterSet::has(const std::string &name) const {
  return get(name).has_value();
}

std::optional<std::string> ParameterSet::get(const std::string &name) const {
  for (const auto &entry : entries_) {
    if (entry.first == name) {
      return entry.second;
    }
  }
  return std::nullopt;
}

std::string ParameterSet::format_table() const {
  std::string out;
  for (const auto &[name, value] : entries_) {
    std::string shown = value;
    if (shown.size() > 44) {
      shown = shown.substr(0, 40) + " ...";
    }
    out += fmt::format("  {:<13}: {}\n", name, shown);
  }
  return out;
}

nlohmann::json ParameterSet::to_json() const {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &[name, value] : entries_) {
    j.push_back({{"name", name}, {"value", value}});
  }
  return j;
}

// ParameterValidator

namespace {

std::string format_scalar(double value) { return fmt::format("{:.10g}", value); }

template <typename T, typename Fn>
std::string join(const std::vector<T> &items, Fn &&to_text) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += to_text(items[i]);
  }
  return out;
}

struct Coercer {
  FieldResult operator()(std::monostate) const {
    return Rejected{"empty value"};
  }

  FieldResult operator()(bool value) const {
    return Accepted{value ? "1" : "0"};
  }

  FieldResult operator()(double value) const {
    return Accepted{format_scalar(value)};
  }

  FieldResult operator()(const std::string &value) const {
    if (ResponseParser::trim(value).empty()) {
      return Rejected{"empty value"};
    }
    return Accepted{ResponseParser::to_upper(value)};
  }

  FieldResult operator()(const std::vector<bool> &values) const {
    if (values.empty()) {
      return Rejected{"empty value"};
    }
    return Accepted{join(values, [](bool b) { return b ? "1" : "0"; })};
  }

  FieldResult operator()(const std::vector<double> &values) const {
    if (values.empty()) {
      return Rejected{"empty value"};
    }
    return Accepted{join(values, format_scalar)};
  }

  FieldResult operator()(const std::vector<std::string> &values) const {
    if (values.empty()) {
      return Rejected{"empty value"};
    }
    return Accepted{join(values, [](const std::string &s) {
      return ResponseParser::to_upper(s);
    })};
  }

  FieldResult operator()(const Matrix &rows) const {
    size_t columns = 0;
    for (const auto &row : rows) {
      columns = std::max(columns, row.size());
    }
    if (rows.empty() || columns == 0) {
      return Rejected{"empty value"};
    }
    if (rows.size() > 1 && columns > 1) {
      return Rejected{fmt::format(
          "Invalid type ({}x{} matrix, vector expected). Ignore input",
          rows.size(), columns)};
    }
    std::vector<double> flat;
    for (const auto &row : rows) {
      flat.insert(flat.end(), row.begin(), row.end());
    }
    return (*this)(flat);
  }
};

} // namespace

ParameterValidator::ParameterValidator(std::vector<FieldSpec> fields)
    : fields_(std::move(fields)) {}

std::optional<std::string>
ParameterValidator::canonical_name(const std::string &name) const {
  std::string lower = ResponseParser::to_lower(ResponseParser::trim(name));
  for (const auto &field : fields_) {
    if (lower == ResponseParser::to_lower(field.canonical)) {
      return field.canonical;
    }
    if (std::find(field.aliases.begin(), field.aliases.end(), lower) !=
        field.aliases.end()) {
      return field.canonical;
    }
  }
  return std::nullopt;
}

const FieldSpec *
ParameterValidator::find_field(const std::string &canonical) const {
  for (const auto &field : fields_) {
    if (field.canonical == canonical) {
      return &field;
    }
  }
  return nullptr;
}

FieldResult ParameterValidator::coerce(const ParamValue &value) {
  return std::visit(Coercer{}, value);
}

FieldResult ParameterValidator::validate_field(const FieldSpec &field,
                                               const ParamValue &value) const {
  static const std::regex numeric_pattern(R"(^[\w\.\+\-]+$)");
  static const std::regex token_pattern(R"(^\w+$)");

  FieldResult coerced = coerce(value);
  if (std::holds_alternative<Rejected>(coerced)) {
    return coerced;
  }

  const std::string &text = std::get<Accepted>(coerced).value;
  const std::regex &pattern = field.shape == FieldShape::Numeric
                                  ? numeric_pattern
                                  : token_pattern;
  if (!std::regex_match(text, pattern)) {
    return Rejected{fmt::format("Value '{}' has an invalid format", text)};
  }
  return coerced;
}

ValidationResult ParameterValidator::validate(const ParamList &args) const {
  ValidationResult result;
  std::map<std::string, std::string> accepted;

  size_t paired = args.size() - args.size() % 2;
  if (paired != args.size()) {
    result.diagnostics.push_back(
        "Odd number of parameters. Ignore last input.");
  }

  for (size_t i = 0; i < paired; i += 2) {
    const auto *name = std::get_if<std::string>(&args[i]);
    if (!name) {
      result.diagnostics.push_back(
          "Parameter name must be a string. Ignore parameter.");
      continue;
    }

    auto canonical = canonical_name(*name);
    if (!canonical) {
      result.diagnostics.push_back(fmt::format(
          "Parameter name '{}' is unknown. Ignore parameter.", *name));
      continue;
    }

    FieldResult field_result = validate_field(*find_field(*canonical),
                                              args[i + 1]);
    if (auto *rejected = std::get_if<Rejected>(&field_result)) {
      result.diagnostics.push_back(fmt::format(
          "Parameter '{}': {}. Ignore parameter.", *canonical,
          rejected->reason));
      continue;
    }
    // later occurrences override earlier ones
    accepted[*canonical] = std::get<Accepted>(field_result).value;
  }

  for (const auto &field : fields_) {
    auto it = accepted.find(field.canonical);
    if (it != accepted.end()) {
      result.params.entries_.emplace_back(it->first, it->second);
    }
  }
  return result;
}

} // namespace scpidrv
