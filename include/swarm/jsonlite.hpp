#pragma once

// swarm/jsonlite.hpp - Minimal strict JSON reader/writer.
//
// DETERMINISM:
//   Objects are std::map, so serialization always emits keys in sorted order.
//   Doubles are written with format_double() (fixed 6 decimals, trailing zeros
//   trimmed). Non-negative integers round-trip exactly as uint64; negative
//   integers are held as double.
//
// STRICTNESS:
//   Duplicate keys, trailing data, NaN/Infinity and unterminated strings are
//   parse errors.

#include <cstdint>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace swarm::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) { set_signed(i); }
  Value(long i) { set_signed(i); }
  Value(long long i) { set_signed(i); }
  Value(unsigned u) : v(static_cast<std::uint64_t>(u)) {}
  Value(unsigned long u) : v(static_cast<std::uint64_t>(u)) {}
  Value(unsigned long long u) : v(static_cast<std::uint64_t>(u)) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }

 private:
  void set_signed(long long i) {
    if (i >= 0) v = static_cast<std::uint64_t>(i);
    else v = static_cast<double>(i);
  }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. On failure *error is set and a null Value returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. A valid non-object document is reported as
// "json_not_object".
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

std::string to_json(const Value& v);
std::string to_json(const Object& o);

std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. A missing key or a wrong type yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
long long get_i64(const Object& obj, const std::string& key, long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
std::map<std::string, double> get_double_map(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);

bool has(const Object& obj, const std::string& key);
bool is_number(const Value& v);

}  // namespace swarm::jsonlite
