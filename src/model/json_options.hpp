#pragma once
#include <rack.hpp>
#include <jansson.h>
#include <string>

using namespace rack;

namespace viewidget {
namespace json {

// Typed readers for widget option objects. Each throws viewidget::Error
// naming the widget and key when the value has the wrong JSON type.

double getNumber(json_t* valueJ, const char* widget, const char* key);
bool getBool(json_t* valueJ, const char* widget, const char* key);
std::string getString(json_t* valueJ, const char* widget, const char* key);

// Error for keys the widget does not recognize
[[noreturn]] void unknownKey(const char* widget, const char* key);

// Parse a JSON object from text; throws viewidget::Error on syntax errors.
// The caller owns the returned reference.
json_t* parse(const std::string& text);

}} // namespace viewidget::json
