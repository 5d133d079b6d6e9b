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

#include <string>
#include <string_view>
#include <vector>
#include <stack>
#include <tuple>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <functional>
#include <cstdint>
#include <type_traits>
#include <tsl/ordered_map.h>

#include "Key.h"
#include "Record.h"

#include <keycase/support/Ref.h>
#include <keycase/support/string.h>
#include <keycase/support/exception.h>
#include <keycase/support/types.h>

namespace keycase {

class Value;

using List = std::vector<Value>;
using Map = tsl::ordered_map<Key, Value, KeyHash>;
using RecordRef = Ref<Record>;

//////////////////////////////////////////////////////////////////////////////
/// @brief Dynamic value for nested payload data.
/// A Value is one of:
/// - a scalar: nil, bool, int, uint, float, string or symbol,
/// - a list of values,
/// - a map from Key to Value, which preserves insertion order,
/// - a Record, which is an opaque composite (see keycase/core/Record.h).
///
/// Values have value semantics: copying a Value copies its strings, lists
/// and maps. Records are the exception. They are immutable and shared, so
/// a copy refers to the same Record instance (see `Value::is`).
//////////////////////////////////////////////////////////////////////////////
class Value
{
  public:
    enum ReprIX {
        NIL,     // json null
        BOOL,
        INT,
        UINT,
        FLOAT,
        STR,
        SYM,
        LIST,
        MAP,     // ordered map
        RECORD   // opaque composite
    };

  private:
    union Repr {
        Repr()            : z{nullptr} {}
        Repr(bool v)      : b{v} {}
        Repr(Int v)       : i{v} {}
        Repr(UInt v)      : u{v} {}
        Repr(Float v)     : f{v} {}
        Repr(String* p)   : ps{p} {}
        Repr(SharedString* p) : s{p} {}
        Repr(List* p)     : pl{p} {}
        Repr(Map* p)      : pm{p} {}
        Repr(Record* p)   : pr{p} {}
        ~Repr() {}

        void*    z;
        bool     b;
        Int      i;
        UInt     u;
        Float    f;
        String*  ps;
        SharedString* s;
        List*    pl;
        Map*     pm;
        Record*  pr;
    };

  public:
    static std::string_view type_name(ReprIX repr_ix) {
      switch (repr_ix) {
          case NIL:    return "nil";
          case BOOL:   return "bool";
          case INT:    return "int";
          case UINT:   return "uint";
          case FLOAT:  return "float";
          case STR:    return "string";
          case SYM:    return "symbol";
          case LIST:   return "list";
          case MAP:    return "map";
          case RECORD: return "record";
          default:     return "<undefined>";
      }
    }

  public:
    Value()                            : m_repr{}, m_repr_ix{NIL} {}
    Value(nil_t)                       : m_repr{}, m_repr_ix{NIL} {}
    Value(const String& str)           : m_repr{new String{str}}, m_repr_ix{STR} {}
    Value(String&& str)                : m_repr{new String{std::move(str)}}, m_repr_ix{STR} {}
    Value(const StringView& sv)        : m_repr{new String{sv}}, m_repr_ix{STR} {}
    Value(const char* v)               : m_repr{}, m_repr_ix{STR} { ASSERT(v != nullptr); m_repr.ps = new String{v}; }
    Value(is_bool auto v)              : m_repr{v}, m_repr_ix{BOOL} {}
    Value(is_like_Float auto v)        : m_repr{(Float)v}, m_repr_ix{FLOAT} {}
    Value(is_like_Int auto v)          : m_repr{(Int)v}, m_repr_ix{INT} {}
    Value(is_like_UInt auto v)         : m_repr{(UInt)v}, m_repr_ix{UINT} {}
    Value(const List& list)            : m_repr{new List{list}}, m_repr_ix{LIST} {}
    Value(List&& list)                 : m_repr{new List{std::move(list)}}, m_repr_ix{LIST} {}
    Value(const Map& map)              : m_repr{new Map{map}}, m_repr_ix{MAP} {}
    Value(Map&& map)                   : m_repr{new Map{std::move(map)}}, m_repr_ix{MAP} {}
    Value(const Key& key);
    Value(ReprIX type);

    template <class R> requires std::is_base_of_v<Record, R>
    Value(const Ref<R>& record) : m_repr{}, m_repr_ix{RECORD} {
        m_repr.pr = const_cast<R*>(record.get());
        inc_record_ref();
    }

    /// Create a symbol value.
    static Value symbol(const StringView& name) { return Key::symbol(name); }

    ~Value() { release(); }

    Value(const Value& other);
    Value(Value&& other) noexcept;

    Value& operator = (const Value& other);
    Value& operator = (Value&& other);

    ReprIX type() const    { return m_repr_ix; }
    auto type_name() const { return type_name(m_repr_ix); }

    bool is_nil() const       { return m_repr_ix == NIL; }
    bool is_str() const       { return m_repr_ix == STR; }
    bool is_sym() const       { return m_repr_ix == SYM; }
    bool is_list() const      { return m_repr_ix == LIST; }
    bool is_map() const       { return m_repr_ix == MAP; }
    bool is_record() const    { return m_repr_ix == RECORD; }
    bool is_container() const { return m_repr_ix == LIST || m_repr_ix == MAP; }
    bool is_num() const       { return m_repr_ix >= INT && m_repr_ix <= FLOAT; }

    template <typename T> bool is_type() const;

    template <typename T> T as() const requires is_byvalue<T>;
    template <typename T> const T& as() const requires std::is_same<T, String>::value;
    template <typename T> T& as() requires std::is_same<T, String>::value;
    template <typename T> const T& as() const requires std::is_same<T, List>::value;
    template <typename T> T& as() requires std::is_same<T, List>::value;
    template <typename T> const T& as() const requires std::is_same<T, Map>::value;
    template <typename T> T& as() requires std::is_same<T, Map>::value;
    template <typename T> StringView as() const requires std::is_same<T, StringView>::value;

    const Record& record() const;
    RecordRef record_ref() const;

    /// Returns the record cast to R, or nullptr if this value does not hold
    /// a record of type R.
    template <class R> const R* record_cast() const;

    Key to_key() const;
    String to_str() const;

    size_t size() const;
    Value get(const Key& key) const;
    Value get(size_t index) const;
    void set(const Key& key, const Value& value);
    void push_back(const Value& value);

    bool is(const Value& other) const;

    bool operator == (const Value& other) const;
    bool operator == (nil_t) const                       { return m_repr_ix == NIL; }
    bool operator == (is_like_string auto&& other) const { return m_repr_ix == STR && *m_repr.ps == StringView{other}; }

    WrongType wrong_type() const                { return type_name(m_repr_ix); };
    WrongType wrong_type(ReprIX expected) const { return {type_name(m_repr_ix), type_name(expected)}; };

  private:
    void take(Value& other);
    void release();
    void inc_record_ref() { ++(m_repr.pr->m_ref_count); }
    void dec_record_ref() { if (--(m_repr.pr->m_ref_count) == 0) delete m_repr.pr; }

  private:
    Repr m_repr;
    ReprIX m_repr_ix;

  friend class WalkDF;
};


inline
Value::Value(const Key& key) : m_repr{}, m_repr_ix{NIL} {
    switch (key.type()) {
        case Key::NIL:   break;
        case Key::BOOL:  m_repr.b = key.as<bool>(); m_repr_ix = BOOL; break;
        case Key::INT:   m_repr.i = key.as<Int>(); m_repr_ix = INT; break;
        case Key::UINT:  m_repr.u = key.as<UInt>(); m_repr_ix = UINT; break;
        case Key::FLOAT: m_repr.f = key.as<Float>(); m_repr_ix = FLOAT; break;
        case Key::STR:   m_repr.ps = new String{key.as<StringView>()}; m_repr_ix = STR; break;
        case Key::SYM:   m_repr.s = SharedString::create(key.as<StringView>()); m_repr_ix = SYM; break;
    }
}

inline
Value::Value(ReprIX type) : m_repr{}, m_repr_ix{type} {
    switch (type) {
        case NIL:    break;
        case BOOL:   m_repr.b = false; break;
        case INT:    m_repr.i = 0; break;
        case UINT:   m_repr.u = 0; break;
        case FLOAT:  m_repr.f = 0; break;
        case STR:    m_repr.ps = new String{}; break;
        case SYM:    m_repr.s = SharedString::create(""); break;
        case LIST:   m_repr.pl = new List{}; break;
        case MAP:    m_repr.pm = new Map{}; break;
        case RECORD: m_repr_ix = NIL; throw wrong_type(RECORD);
    }
}

inline
Value::Value(const Value& other) : m_repr{}, m_repr_ix{other.m_repr_ix} {
    switch (m_repr_ix) {
        case NIL:    break;
        case BOOL:   m_repr.b = other.m_repr.b; break;
        case INT:    m_repr.i = other.m_repr.i; break;
        case UINT:   m_repr.u = other.m_repr.u; break;
        case FLOAT:  m_repr.f = other.m_repr.f; break;
        case STR:    m_repr.ps = new String{*other.m_repr.ps}; break;
        case SYM:    m_repr.s = other.m_repr.s; m_repr.s->retain(); break;
        case LIST:   m_repr.pl = new List{*other.m_repr.pl}; break;
        case MAP:    m_repr.pm = new Map{*other.m_repr.pm}; break;
        case RECORD: m_repr.pr = other.m_repr.pr; inc_record_ref(); break;
    }
}

inline
Value::Value(Value&& other) noexcept : m_repr{}, m_repr_ix{NIL} {
    take(other);
}

inline
Value& Value::operator = (const Value& other) {
    if (this == &other) return *this;
    Value copy{other};
    return operator = (std::move(copy));
}

inline
Value& Value::operator = (Value&& other) {
    if (this == &other) return *this;
    release();
    take(other);
    return *this;
}

/// Move the representation of `other` into this, leaving `other` nil.
inline
void Value::take(Value& other) {
    m_repr_ix = other.m_repr_ix;
    switch (m_repr_ix) {
        case NIL:    break;
        case BOOL:   m_repr.b = other.m_repr.b; break;
        case INT:    m_repr.i = other.m_repr.i; break;
        case UINT:   m_repr.u = other.m_repr.u; break;
        case FLOAT:  m_repr.f = other.m_repr.f; break;
        case STR:    m_repr.ps = other.m_repr.ps; break;
        case SYM:    m_repr.s = other.m_repr.s; break;
        case LIST:   m_repr.pl = other.m_repr.pl; break;
        case MAP:    m_repr.pm = other.m_repr.pm; break;
        case RECORD: m_repr.pr = other.m_repr.pr; break;
    }
    other.m_repr.z = nullptr;
    other.m_repr_ix = NIL;
}

inline
void Value::release() {
    switch (m_repr_ix) {
        case STR:    delete m_repr.ps; break;
        case SYM:    m_repr.s->release(); break;
        case LIST:   delete m_repr.pl; break;
        case MAP:    delete m_repr.pm; break;
        case RECORD: dec_record_ref(); break;
        default:     break;
    }
    m_repr.z = nullptr;
    m_repr_ix = NIL;
}

template <typename T>
bool Value::is_type() const {
    if constexpr (std::is_same<T, nil_t>::value) return m_repr_ix == NIL;
    else if constexpr (std::is_same<T, bool>::value) return m_repr_ix == BOOL;
    else if constexpr (std::is_same<T, Int>::value) return m_repr_ix == INT;
    else if constexpr (std::is_same<T, UInt>::value) return m_repr_ix == UINT;
    else if constexpr (std::is_same<T, Float>::value) return m_repr_ix == FLOAT;
    else if constexpr (std::is_same<T, String>::value) return m_repr_ix == STR;
    else if constexpr (std::is_same<T, List>::value) return m_repr_ix == LIST;
    else if constexpr (std::is_same<T, Map>::value) return m_repr_ix == MAP;
    else if constexpr (std::is_base_of_v<Record, T>) return record_cast<T>() != nullptr;
    else static_assert(!sizeof(T), "unsupported value type");
}

template <typename T>
T Value::as() const requires is_byvalue<T> {
    if constexpr (std::is_same<T, bool>::value) {
        if (m_repr_ix != BOOL) throw wrong_type(BOOL);
        return m_repr.b;
    } else if constexpr (std::is_same<T, Int>::value) {
        if (m_repr_ix != INT) throw wrong_type(INT);
        return m_repr.i;
    } else if constexpr (std::is_same<T, UInt>::value) {
        if (m_repr_ix != UINT) throw wrong_type(UINT);
        return m_repr.u;
    } else {
        if (m_repr_ix != FLOAT) throw wrong_type(FLOAT);
        return m_repr.f;
    }
}

template <typename T>
const T& Value::as() const requires std::is_same<T, String>::value {
    if (m_repr_ix != STR) throw wrong_type(STR);
    return *m_repr.ps;
}

template <typename T>
T& Value::as() requires std::is_same<T, String>::value {
    if (m_repr_ix != STR) throw wrong_type(STR);
    return *m_repr.ps;
}

template <typename T>
const T& Value::as() const requires std::is_same<T, List>::value {
    if (m_repr_ix != LIST) throw wrong_type(LIST);
    return *m_repr.pl;
}

template <typename T>
T& Value::as() requires std::is_same<T, List>::value {
    if (m_repr_ix != LIST) throw wrong_type(LIST);
    return *m_repr.pl;
}

template <typename T>
const T& Value::as() const requires std::is_same<T, Map>::value {
    if (m_repr_ix != MAP) throw wrong_type(MAP);
    return *m_repr.pm;
}

template <typename T>
T& Value::as() requires std::is_same<T, Map>::value {
    if (m_repr_ix != MAP) throw wrong_type(MAP);
    return *m_repr.pm;
}

/// Text of a string or a symbol.
template <typename T>
StringView Value::as() const requires std::is_same<T, StringView>::value {
    switch (m_repr_ix) {
        case STR: return *m_repr.ps;
        case SYM: return m_repr.s->str();
        default:  throw wrong_type(STR);
    }
}

inline
const Record& Value::record() const {
    if (m_repr_ix != RECORD) throw wrong_type(RECORD);
    return *m_repr.pr;
}

inline
RecordRef Value::record_ref() const {
    if (m_repr_ix != RECORD) throw wrong_type(RECORD);
    return RecordRef{m_repr.pr};
}

template <class R>
const R* Value::record_cast() const {
    if (m_repr_ix != RECORD) return nullptr;
    return dynamic_cast<const R*>(m_repr.pr);
}

/// Convert to a Key.
/// Strings convert to text keys, and symbols to symbol keys.
inline
Key Value::to_key() const {
    switch (m_repr_ix) {
        case NIL:   return nil;
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i;
        case UINT:  return m_repr.u;
        case FLOAT: return m_repr.f;
        case STR:   return StringView{*m_repr.ps};
        case SYM:   return Key::symbol(m_repr.s->str());
        default:    throw wrong_type();
    }
}

inline
size_t Value::size() const {
    switch (m_repr_ix) {
        case STR:  return m_repr.ps->size();
        case LIST: return m_repr.pl->size();
        case MAP:  return m_repr.pm->size();
        default:   return 0;
    }
}

/// Returns the value of `key` in a map, or nil if the key does not exist.
inline
Value Value::get(const Key& key) const {
    if (m_repr_ix != MAP) throw wrong_type(MAP);
    auto it = m_repr.pm->find(key);
    if (it == m_repr.pm->end()) return nil;
    return it->second;
}

/// Returns the element at `index` in a list, or nil if out of range.
inline
Value Value::get(size_t index) const {
    if (m_repr_ix != LIST) throw wrong_type(LIST);
    if (index >= m_repr.pl->size()) return nil;
    return (*m_repr.pl)[index];
}

inline
void Value::set(const Key& key, const Value& value) {
    if (m_repr_ix != MAP) throw wrong_type(MAP);
    m_repr.pm->insert_or_assign(key, value);
}

inline
void Value::push_back(const Value& value) {
    if (m_repr_ix != LIST) throw wrong_type(LIST);
    m_repr.pl->push_back(value);
}

/// Returns true if both values are the same instance.
/// - Scalars are compared by value.
/// - Records are compared by address. Copies of a Value holding a Record
///   are the same instance.
/// - Strings, lists and maps are owned, so are only identical to themselves.
inline
bool Value::is(const Value& other) const {
    if (other.m_repr_ix != m_repr_ix) return false;
    switch (m_repr_ix) {
        case NIL:    return true;
        case BOOL:   return m_repr.b == other.m_repr.b;
        case INT:    return m_repr.i == other.m_repr.i;
        case UINT:   return m_repr.u == other.m_repr.u;
        case FLOAT:  return m_repr.f == other.m_repr.f;
        case SYM:    return m_repr.s->str() == other.m_repr.s->str();
        case STR:    return m_repr.ps == other.m_repr.ps;
        case LIST:   return m_repr.pl == other.m_repr.pl;
        case MAP:    return m_repr.pm == other.m_repr.pm;
        case RECORD: return m_repr.pr == other.m_repr.pr;
        default:     throw wrong_type();
    }
}

/// Deep equality. Maps compare equal regardless of insertion order, and
/// numbers compare across int, uint and float.
inline
bool Value::operator == (const Value& other) const {
    if (is(other)) return true;

    switch (m_repr_ix) {
        case NIL:  return other.m_repr_ix == NIL;
        case BOOL: return other.m_repr_ix == BOOL && m_repr.b == other.m_repr.b;
        case INT:
        case UINT:
        case FLOAT: {
            if (!other.is_num()) return false;
            return to_key() == other.to_key();
        }
        case STR: return other.m_repr_ix == STR && *m_repr.ps == *other.m_repr.ps;
        case SYM: return other.m_repr_ix == SYM && m_repr.s->str() == other.m_repr.s->str();
        case LIST: {
            if (other.m_repr_ix != LIST) return false;
            auto& lhs = *m_repr.pl;
            auto& rhs = *other.m_repr.pl;
            if (lhs.size() != rhs.size()) return false;
            for (List::size_type i=0; i<lhs.size(); i++)
                if (!(lhs[i] == rhs[i]))
                    return false;
            return true;
        }
        case MAP: {
            if (other.m_repr_ix != MAP) return false;
            auto& lhs = *m_repr.pm;
            auto& rhs = *other.m_repr.pm;
            if (lhs.size() != rhs.size()) return false;
            for (auto& [key, value] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end() || !(it->second == value))
                    return false;
            }
            return true;
        }
        case RECORD: {
            if (other.m_repr_ix != RECORD) return false;
            return m_repr.pr->equals(*other.m_repr.pr);
        }
        default: throw wrong_type();
    }
}


//////////////////////////////////////////////////////////////////////////////
/// Depth-first walk of a Value tree without recursion.
/// The visitor is called with the parent (nullptr for the root), the key of
/// the value in its parent (the index, for list elements), the value and an
/// event mask. Containers are visited twice, once with BEGIN_PARENT before
/// their children, and once with END_PARENT after. Records are visited once,
/// like scalars.
//////////////////////////////////////////////////////////////////////////////
class WalkDF
{
public:
    static constexpr uint8_t FIRST_VALUE = 0x0;
    static constexpr uint8_t NEXT_VALUE = 0x1;
    static constexpr uint8_t BEGIN_PARENT = 0x2;
    static constexpr uint8_t END_PARENT = 0x4;

    using Item = std::tuple<const Value*, Key, const Value*, uint8_t>;
    using Stack = std::stack<Item>;
    using VisitFunc = std::function<void(const Value*, const Key&, const Value&, uint8_t)>;

public:
    WalkDF(const Value& root, VisitFunc visitor)
    : m_visitor{visitor}
    {
        m_stack.emplace(nullptr, nil, &root, FIRST_VALUE);
    }

    bool next() {
        bool has_next = !m_stack.empty();
        if (has_next) {
            const auto [p_parent, key, p_value, event] = m_stack.top();
            m_stack.pop();

            if (event & END_PARENT) {
                m_visitor(p_parent, key, *p_value, event);
            } else {
                switch (p_value->m_repr_ix) {
                    case Value::LIST: {
                        m_visitor(p_parent, key, *p_value, event | BEGIN_PARENT);
                        m_stack.emplace(p_parent, key, p_value, event | END_PARENT);
                        auto& list = *p_value->m_repr.pl;
                        Int index = list.size() - 1;
                        for (auto it = list.crbegin(); it != list.crend(); it++, index--) {
                            m_stack.emplace(p_value, index, &(*it), (index == 0)? FIRST_VALUE: NEXT_VALUE);
                        }
                        break;
                    }
                    case Value::MAP: {
                        m_visitor(p_parent, key, *p_value, event | BEGIN_PARENT);
                        m_stack.emplace(p_parent, key, p_value, event | END_PARENT);
                        auto& map = *p_value->m_repr.pm;
                        Int index = map.size() - 1;
                        for (auto it = map.rcbegin(); it != map.rcend(); it++, index--) {
                            auto& [child_key, child] = *it;
                            m_stack.emplace(p_value, child_key, &child, (index == 0)? FIRST_VALUE: NEXT_VALUE);
                        }
                        break;
                    }
                    default: {
                        m_visitor(p_parent, key, *p_value, event);
                        break;
                    }
                }
            }
        }
        return has_next;
    }

private:
    VisitFunc m_visitor;
    Stack m_stack;
};


/// Human readable form. Map keys are written quoted when text, and with a
/// leading colon when symbols.
inline
std::ostream& operator<< (std::ostream& os, const Value& value) {
    auto visitor = [&os] (const Value* p_parent, const Key& key, const Value& value, uint8_t event) -> void {
        if (event & WalkDF::NEXT_VALUE && !(event & WalkDF::END_PARENT)) {
            os << ", ";
        }

        if (p_parent != nullptr && p_parent->is_map() && !(event & WalkDF::END_PARENT)) {
            if (key.is_text()) os << std::quoted(key.as<StringView>());
            else os << key;
            os << ": ";
        }

        switch (value.type()) {
            case Value::NIL:    os << "nil"; break;
            case Value::BOOL:   os << (value.as<bool>()? "true": "false"); break;
            case Value::INT:    os << int_to_str(value.as<Int>()); break;
            case Value::UINT:   os << int_to_str(value.as<UInt>()); break;
            case Value::FLOAT:  os << float_to_str(value.as<Float>()); break;
            case Value::STR:    os << std::quoted(value.as<String>()); break;
            case Value::SYM:    os << ':' << value.as<StringView>(); break;
            case Value::LIST:   os << ((event & WalkDF::BEGIN_PARENT)? '[': ']'); break;
            case Value::MAP:    os << ((event & WalkDF::BEGIN_PARENT)? '{': '}'); break;
            case Value::RECORD: value.record().to_str(os); break;
            default:            throw value.wrong_type();
        }
    };

    WalkDF walk{value, visitor};
    while (walk.next());
    return os;
}

inline
String Value::to_str() const {
    switch (m_repr_ix) {
        case STR: return *m_repr.ps;
        case SYM: return m_repr.s->str();
        default: {
            StringStream ss;
            ss << *this;
            return ss.str();
        }
    }
}

} // namespace keycase
