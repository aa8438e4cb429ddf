#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace chaosmine::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// Minimal JSON value type (null, bool, integer, number, string, array, object).
//
// Numbers without a fraction or exponent that fit in int64 are kept as exact
// integers. Ledger amounts and block numbers must survive a round trip through
// config files without passing through a double.
struct Value : std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_bool() const;
  bool is_integer() const;
  // True for both integers and floating point numbers.
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const std::int64_t* as_integer() const;
  const double* as_double() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  Array* as_array();
  Object* as_object();

  // Throws std::runtime_error if not present / wrong type.
  const Value& at(const std::string& key) const;
  const Value& at(std::size_t index) const;

  // nullptr if this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Exact non-negative integer. Throws std::runtime_error for floats, negatives or non-numbers.
  std::uint64_t uint_value() const;

  const Object& object() const;
  const Array& array() const;
};

// Parse a JSON document into a tree. Errors include line/col and a caret line.
Value parse(const std::string& text);

// Convert a JSON value to text. Object keys are emitted in sorted order.
std::string stringify(const Value& v, int indent = 2);

Value object(Object o);
Value array(Array a);
Value integer(std::int64_t v);

} // namespace chaosmine::json
