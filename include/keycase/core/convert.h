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

#include <functional>
#include <stack>
#include <utility>

#include "Key.h"
#include "Value.h"
#include "case.h"

namespace keycase {

/// Function applied to each text or symbol key by `convert_keys`.
using KeyFunction = std::function<Key(const Key&)>;

namespace impl {

/// Returns a copy of `value` if it is a scalar or a record, or an empty
/// container of the same type if it is a list or map.
inline
Value shallow_shell(const Value& value) {
    switch (value.type()) {
        case Value::LIST: {
            List list;
            list.reserve(value.size());
            return list;
        }
        case Value::MAP: {
            Map map;
            map.reserve(value.size());
            return map;
        }
        default:
            return value;
    }
}

} // namespace impl

//////////////////////////////////////////////////////////////////////////////
/// @brief Rename the keys of every map in a Value tree.
/// @param value The tree to convert, which is not modified.
/// @param key_fn Function applied to each text or symbol key, such as
///               `to_camel_case` or `to_snake_case`.
/// @return A new tree with the same structure as `value`.
///
/// - A Record is returned as is, and its content is never visited. Copies
///   of a Value share the Record, so `result.is(value)` holds for a record.
/// - Map keys that are not text or symbols are copied unchanged.
/// - When two keys of a map convert to the same key, the value of the later
///   key is kept, at the position of the earlier key.
/// - Other scalars are copied unchanged.
/// - The tree is walked with a heap allocated stack, so deeply nested
///   input cannot overflow the call stack.
/// - Exceptions thrown by `key_fn` propagate unchanged. This function throws
///   no exceptions of its own except `std::bad_alloc`.
//////////////////////////////////////////////////////////////////////////////
inline
Value convert_keys(const Value& value, const KeyFunction& key_fn) {
    using Frame = std::pair<const Value*, Value*>;

    Value result = impl::shallow_shell(value);
    std::stack<Frame> stack;
    if (value.is_container()) stack.emplace(&value, &result);

    while (!stack.empty()) {
        auto [p_src, p_dst] = stack.top();
        stack.pop();

        switch (p_src->type()) {
            case Value::LIST: {
                auto& src = p_src->as<List>();
                auto& dst = p_dst->as<List>();
                for (auto& child : src)
                    dst.push_back(impl::shallow_shell(child));

                // dst is not resized again, so element addresses are stable
                for (size_t i = 0; i < src.size(); ++i) {
                    if (src[i].is_container())
                        stack.emplace(&src[i], &dst[i]);
                }
                break;
            }
            case Value::MAP: {
                auto& src = p_src->as<Map>();
                auto& dst = p_dst->as<Map>();

                // resolve key collisions before filling dst
                tsl::ordered_map<Key, const Value*, KeyHash> renamed;
                renamed.reserve(src.size());
                for (auto& [key, child] : src) {
                    if (key.is_identifier()) renamed.insert_or_assign(key_fn(key), &child);
                    else renamed.insert_or_assign(key, &child);
                }

                for (auto& [key, p_child] : renamed)
                    dst.insert({key, impl::shallow_shell(*p_child)});

                for (auto& [key, p_child] : renamed) {
                    if (p_child->is_container())
                        stack.emplace(p_child, &dst.at(key));
                }
                break;
            }
            default:
                break;
        }
    }

    return result;
}

/// Convert all keys in a tree to camelCase.
inline
Value to_camel_keys(const Value& value) {
    return convert_keys(value, to_camel_case);
}

/// Convert all keys in a tree to snake_case.
inline
Value to_snake_keys(const Value& value) {
    return convert_keys(value, to_snake_case);
}

} // namespace keycase
