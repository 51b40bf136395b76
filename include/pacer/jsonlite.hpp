#pragma once

// pacer/jsonlite.hpp — Minimal strict JSON reader for configuration files.
//
// Supports the full JSON value grammar except NaN/Infinity. Duplicate keys are
// rejected. Non-negative integers parse as uint64, negative integers and
// fractional numbers as double; get_i64/get_double accept either.
//
// Writers in this codebase build JSON with string concatenation and escape().

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pacer::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse a document whose root must be an object. On failure returns an empty
// object and sets *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

bool has(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
long long get_i64(const Object& obj, const std::string& key, long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
Object get_object(const Object& obj, const std::string& key);

std::string escape(const std::string& s);
std::string format_double(double d);

}  // namespace pacer::jsonlite
