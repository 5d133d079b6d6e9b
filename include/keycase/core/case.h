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

#include "Key.h"
#include "Value.h"

#include <keycase/support/string.h>
#include <keycase/support/types.h>

namespace keycase {

namespace impl {

/// Returns true if a word boundary precedes `str[i]`.
/// - A boundary precedes an uppercase letter that follows a lowercase
///   letter, as in "userName".
/// - A boundary precedes an uppercase letter that follows an uppercase letter
///   or digit, and is itself followed by a lowercase letter. This is the
///   last letter of an acronym run that begins the next word, as in
///   "APIResponse".
/// - There is never a boundary before the first character.
inline
bool is_word_boundary(const StringView& str, size_t i) {
    if (i == 0 || !is_upper(str[i])) return false;
    auto prev = str[i - 1];
    if (is_lower(prev)) return true;
    if (is_upper(prev) || is_digit(prev)) {
        return (i + 1) < str.size() && is_lower(str[i + 1]);
    }
    return false;
}

inline
String snake_case(const StringView& str) {
    String result;
    result.reserve(str.size() + str.size() / 2);
    for (size_t i = 0; i < str.size(); ++i) {
        if (is_word_boundary(str, i)) result.push_back('_');
        result.push_back(to_lower(str[i]));
    }
    return result;
}

inline
String camel_case(const StringView& str) {
    if (str.find('_') == StringView::npos) {
        // shout-case collapses to lowercase, anything else is already camel
        return is_all_upper(str)? to_lower(str): String{str};
    }

    String result;
    result.reserve(str.size());
    size_t beg = 0;
    while (beg <= str.size()) {
        auto end = str.find('_', beg);
        if (end == StringView::npos) end = str.size();
        auto word = str.substr(beg, end - beg);
        if (word.size() > 0) {
            result.push_back(to_upper(word[0]));
            for (size_t i = 1; i < word.size(); ++i)
                result.push_back(to_lower(word[i]));
        }
        beg = end + 1;
    }

    if (result.size() > 0) result[0] = to_lower(result[0]);
    return result;
}

} // namespace impl

//////////////////////////////////////////////////////////////////////////////
/// Convert camelCase to snake_case.
/// - Text converts to text, and a symbol Key or Value converts to a symbol.
/// - Any other Key or Value is returned unchanged.
/// - Acronym runs are kept together: "APIResponse" becomes "api_response",
///   and "API" becomes "api".
/// - Text without uppercase letters is returned unchanged, so the
///   conversion is idempotent on snake_case.
/// - Only ASCII letters are case converted.
///
/// This is a function object so that it can be passed, as is, to
/// `convert_keys` (see keycase/core/convert.h).
//////////////////////////////////////////////////////////////////////////////
struct ToSnakeCase
{
    String operator () (const char* str) const        { return impl::snake_case(str); }
    String operator () (const String& str) const      { return impl::snake_case(str); }
    String operator () (const StringView& str) const  { return impl::snake_case(str); }

    Key operator () (const Key& key) const {
        switch (key.type()) {
            case Key::STR: return StringView{impl::snake_case(key.as<StringView>())};
            case Key::SYM: return Key::symbol(impl::snake_case(key.as<StringView>()));
            default:       return key;
        }
    }

    Value operator () (const Value& value) const {
        switch (value.type()) {
            case Value::STR: return impl::snake_case(value.as<StringView>());
            case Value::SYM: return Value::symbol(impl::snake_case(value.as<StringView>()));
            default:         return value;
        }
    }
};

//////////////////////////////////////////////////////////////////////////////
/// Convert snake_case to camelCase.
/// - Text converts to text, and a symbol Key or Value converts to a symbol.
/// - Any other Key or Value is returned unchanged.
/// - Empty words are dropped, so runs of underscores and leading or
///   trailing underscores disappear: "user__first__name" becomes
///   "userFirstName".
/// - Each word is capitalized, so "API_response" becomes "apiResponse".
/// - Text without an underscore is returned unchanged, unless it has no
///   lowercase letters, in which case it is lowercased ("API" becomes
///   "api").
/// - The conversion is lossy: `to_camel_case(to_snake_case("API"))` is
///   "api".
//////////////////////////////////////////////////////////////////////////////
struct ToCamelCase
{
    String operator () (const char* str) const        { return impl::camel_case(str); }
    String operator () (const String& str) const      { return impl::camel_case(str); }
    String operator () (const StringView& str) const  { return impl::camel_case(str); }

    Key operator () (const Key& key) const {
        switch (key.type()) {
            case Key::STR: return StringView{impl::camel_case(key.as<StringView>())};
            case Key::SYM: return Key::symbol(impl::camel_case(key.as<StringView>()));
            default:       return key;
        }
    }

    Value operator () (const Value& value) const {
        switch (value.type()) {
            case Value::STR: return impl::camel_case(value.as<StringView>());
            case Value::SYM: return Value::symbol(impl::camel_case(value.as<StringView>()));
            default:         return value;
        }
    }
};

inline constexpr ToSnakeCase to_snake_case{};
inline constexpr ToCamelCase to_camel_case{};

} // namespace keycase
