// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <cmath>
#include <iostream>
#include <sstream>
#include <fmt/format.h>

#include <keycase/core/Value.h>
#include <keycase/core/convert.h>
#include <keycase/support/exception.h>
#include <keycase/support/logging.h>
#include <keycase/support/string.h>

namespace keycase::json {

struct EncodeError : public KeycaseException
{
    EncodeError(std::string&& msg) : KeycaseException(std::forward<std::string>(msg)) {}
};

/// Serializer options. They are passed through key conversion untouched.
struct EncodeOptions
{
    bool pretty = false;  ///< one member per line, indented
    int indent = 2;       ///< spaces per nesting level, when pretty
};

namespace impl {

/// Returns the length of the UTF-8 sequence that starts at `str[i]`, or 0 if
/// the sequence is not well formed. Overlong forms, surrogates and code
/// points above U+10FFFF are not well formed.
inline
size_t utf8_length(const StringView& str, size_t i) {
    auto c = (unsigned char)str[i];
    if (c < 0x80) return 1;

    size_t len;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF)      len = 2;
    else if (c == 0xE0)              { len = 3; lo = 0xA0; }
    else if (c >= 0xE1 && c <= 0xEC) len = 3;
    else if (c == 0xED)              { len = 3; hi = 0x9F; }
    else if (c >= 0xEE && c <= 0xEF) len = 3;
    else if (c == 0xF0)              { len = 4; lo = 0x90; }
    else if (c >= 0xF1 && c <= 0xF3) len = 4;
    else if (c == 0xF4)              { len = 4; hi = 0x8F; }
    else return 0;

    if (i + len > str.size()) return 0;
    auto c1 = (unsigned char)str[i + 1];
    if (c1 < lo || c1 > hi) return 0;
    for (size_t j = 2; j < len; ++j) {
        auto cj = (unsigned char)str[i + j];
        if (cj < 0x80 || cj > 0xBF) return 0;
    }
    return len;
}

inline
void write_string(std::ostream& os, const StringView& str) {
    os << '"';
    for (size_t i = 0; i < str.size();) {
        auto c = str[i];
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default: {
                if ((unsigned char)c < 0x20) {
                    os << fmt::format("\\u{:04x}", (unsigned)c);
                } else {
                    auto len = utf8_length(str, i);
                    if (len == 0) {
                        WARN("invalid UTF-8 at byte {} of string", i);
                        throw EncodeError(fmt::format("invalid UTF-8 at byte {} of string", i));
                    }
                    os << str.substr(i, len);
                    i += len;
                    continue;
                }
            }
        }
        ++i;
    }
    os << '"';
}

/// Floats are written in the shortest form that reads back to the same
/// value. Integral floats get a ".0" suffix, so they read back as floats.
inline
void write_float(std::ostream& os, Float f) {
    if (!std::isfinite(f)) {
        WARN("no JSON representation for float {}", f);
        throw EncodeError(fmt::format("no JSON representation for float {}", f));
    }
    auto str = fmt::format("{}", f);
    os << str;
    if (str.find_first_of(".e") == str.npos) os << ".0";
}

inline
void write_newline(std::ostream& os, const EncodeOptions& options, int depth) {
    if (!options.pretty) return;
    os << '\n';
    for (int i = 0; i < depth * options.indent; ++i) os << ' ';
}

} // namespace impl

//////////////////////////////////////////////////////////////////////////////
/// @brief Serialize a Value to JSON without converting keys.
/// - Symbols, as values or keys, are written as strings.
/// - Non-string keys are written as the string form of the key.
/// - Records are written by `Record::to_json`.
/// @throws EncodeError If the tree contains a record without a JSON
///         representation, a non-finite float, or a string or key that is
///         not valid UTF-8. Output already written to
///         the stream is not rolled back.
//////////////////////////////////////////////////////////////////////////////
inline
void to_json(std::ostream& os, const Value& value, const EncodeOptions& options = {}) {
    int depth = 0;
    auto visitor = [&os, &options, &depth] (const Value* p_parent, const Key& key, const Value& value, uint8_t event) -> void {
        bool is_end = event & WalkDF::END_PARENT;

        if (!is_end) {
            if (event & WalkDF::NEXT_VALUE) os << ',';
            if (p_parent != nullptr) impl::write_newline(os, options, depth);
            if (p_parent != nullptr && p_parent->is_map()) {
                impl::write_string(os, key.is_identifier()? key.as<StringView>(): StringView{key.to_str()});
                os << (options.pretty? ": ": ":");
            }
        }

        switch (value.type()) {
            case Value::NIL:   os << "null"; break;
            case Value::BOOL:  os << (value.as<bool>()? "true": "false"); break;
            case Value::INT:   os << int_to_str(value.as<Int>()); break;
            case Value::UINT:  os << int_to_str(value.as<UInt>()); break;
            case Value::FLOAT: impl::write_float(os, value.as<Float>()); break;
            case Value::STR:   [[fallthrough]];
            case Value::SYM:   impl::write_string(os, value.as<StringView>()); break;
            case Value::LIST:  [[fallthrough]];
            case Value::MAP: {
                if (is_end) {
                    --depth;
                    if (value.size() > 0) impl::write_newline(os, options, depth);
                    os << (value.is_map()? '}': ']');
                } else {
                    ++depth;
                    os << (value.is_map()? '{': '[');
                }
                break;
            }
            case Value::RECORD: {
                auto& record = value.record();
                if (!record.to_json(os)) {
                    WARN("no JSON representation for record {}", record.type_name());
                    throw EncodeError(fmt::format("no JSON representation for record {}", record.type_name()));
                }
                break;
            }
            default:
                throw value.wrong_type();
        }
    };

    WalkDF walk{value, visitor};
    while (walk.next());
}

inline
String to_json(const Value& value, const EncodeOptions& options = {}) {
    StringStream ss;
    to_json(ss, value, options);
    return ss.str();
}

/// Convert all keys to camelCase and write the result to a stream.
inline
void encode(std::ostream& os, const Value& value, const EncodeOptions& options = {}) {
    to_json(os, convert_keys(value, to_camel_case), options);
}

/// Convert all keys to camelCase and return the result as JSON text.
inline
String encode(const Value& value, const EncodeOptions& options = {}) {
    return to_json(convert_keys(value, to_camel_case), options);
}

} // namespace keycase::json
