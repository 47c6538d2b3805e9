#include "json_options.hpp"
#include "common.hpp"

namespace viewidget {
namespace json {

double getNumber(json_t* valueJ, const char* widget, const char* key) {
    if (!json_is_number(valueJ)) {
        throw Error(string::f("%s %s must be a number", widget, key));
    }
    return json_number_value(valueJ);
}

bool getBool(json_t* valueJ, const char* widget, const char* key) {
    if (json_is_boolean(valueJ)) {
        return json_is_true(valueJ);
    }
    // Numeric flags are accepted the way truthiness would treat them
    if (json_is_number(valueJ)) {
        return json_number_value(valueJ) != 0.0;
    }
    throw Error(string::f("%s %s must be a boolean", widget, key));
}

std::string getString(json_t* valueJ, const char* widget, const char* key) {
    if (!json_is_string(valueJ)) {
        throw Error(string::f("%s %s must be a string", widget, key));
    }
    return json_string_value(valueJ);
}

void unknownKey(const char* widget, const char* key) {
    throw Error(string::f("%s init keyword \"%s\" unknown", widget, key));
}

json_t* parse(const std::string& text) {
    json_error_t error;
    json_t* rootJ = json_loads(text.c_str(), 0, &error);
    if (!rootJ) {
        throw Error(string::f("JSON parsing error at %d:%d: %s", error.line, error.column, error.text));
    }
    if (!json_is_object(rootJ)) {
        json_decref(rootJ);
        throw Error("widget options must be a JSON object");
    }
    return rootJ;
}

}} // namespace viewidget::json
