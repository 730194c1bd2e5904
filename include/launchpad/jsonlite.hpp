#pragma once

// launchpad/jsonlite.hpp - Minimal strict JSON reader/writer.
//
// Used for the inbound request payload, the config file, the framework config
// written into the sandbox, and every JSON document the CLI prints.
//
// Objects are std::map, so serialization is key-sorted and stable.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace launchpad::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse a document whose top level must be an object. On failure returns an
// empty object and sets *error (when non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

// Parse any JSON value.
std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string to_json_pretty(const Value& v);
std::string escape(const std::string& s);

// Type-safe extractors. Missing keys and wrong types return the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

bool is_string(const Value& v);
bool is_object(const Value& v);
bool is_u64(const Value& v);
bool is_bool(const Value& v);

}  // namespace launchpad::jsonlite
