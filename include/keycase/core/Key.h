/** @file */
#pragma once

#include <string>
#include <cstring>
#include <iomanip>
#include <functional>
#include <limits>

#include <keycase/support/string.h>
#include <keycase/support/SharedString.h>
#include <keycase/support/exception.h>
#include <keycase/support/types.h>

using namespace std::literals::string_literals;
using namespace std::literals::string_view_literals;

/// keycase namespace
namespace keycase {

/////////////////////////////////////////////////////////////////////////////
/// A class to represent keys in a map.
/// - The Key class is a dynamic type like the Value class. However, it only
///   supports the following data types:
///     - nil
///     - boolean
///     - integer          (64-bit, as defined in keycase/support/types.h)
///     - unsigned integer (64-bit, as defined in keycase/support/types.h)
///     - floating point   (64-bit, as defined in keycase/support/types.h)
///     - text             (a plain string key)
///     - symbol           (a symbolic identifier, like a Lisp symbol)
/// - Text and symbol keys own their text through a SharedString, which
///   copies of the Key share. They are different types: `"id"_key != "id"_sym`.
/// - Case conversion preserves the type of a key. Only text and symbol keys
///   are subject to conversion; see keycase/core/case.h.
/////////////////////////////////////////////////////////////////////////////
class Key
{
  public:
    enum ReprIX {
        NIL,
        BOOL,
        INT,
        UINT,
        FLOAT,
        STR,
        SYM
    };

  private:
    union Repr {
        Repr()           : z{(void*)0} {}
        Repr(bool v)     : b{v} {}
        Repr(Int v)      : i{v} {}
        Repr(UInt v)     : u{v} {}
        Repr(Float v)    : f{v} {}
        Repr(SharedString* p) : s{p} {}
        ~Repr() {}

        void* z;
        bool  b;
        Int   i;
        UInt  u;
        Float f;
        SharedString* s;
    };

    struct SymbolTag {};
    Key(SharedString* p, SymbolTag) : m_repr{p}, m_repr_ix{SYM} {}

  public:
    static std::string_view type_name(ReprIX repr_ix) {
        switch (repr_ix) {
            case NIL:   return "nil";
            case BOOL:  return "bool";
            case INT:   return "int";
            case UINT:  return "uint";
            case FLOAT: return "float";
            case STR:   return "string";
            case SYM:   return "symbol";
            default:    throw std::logic_error("invalid repr_ix");
        }
    }

  public:
    Key()                     : m_repr{}, m_repr_ix{NIL} {}
    Key(nil_t)                : m_repr{}, m_repr_ix{NIL} {}
    Key(const String& s)      : m_repr{SharedString::create(s)}, m_repr_ix{STR} {}
    Key(const StringView& s)  : m_repr{SharedString::create(s)}, m_repr_ix{STR} {}
    Key(const char* s)        : m_repr{}, m_repr_ix{STR} { ASSERT(s != nullptr); m_repr.s = SharedString::create(s); }
    Key(is_bool auto v)       : m_repr{v}, m_repr_ix{BOOL} {}
    Key(is_like_Float auto v) : m_repr{(Float)v}, m_repr_ix{FLOAT} {}
    Key(is_like_Int auto v)   : m_repr{(Int)v}, m_repr_ix{INT} {}
    Key(is_like_UInt auto v)  : m_repr{(UInt)v}, m_repr_ix{UINT} {}

    /// Create a symbol key.
    /// @param name The text of the symbol.
    static Key symbol(const StringView& name) { return {SharedString::create(name), SymbolTag{}}; }

    ~Key() { release(); }

    Key(const Key& key) {
        m_repr_ix = key.m_repr_ix;
        switch (m_repr_ix) {
            case NIL:   m_repr.z = key.m_repr.z; break;
            case BOOL:  m_repr.b = key.m_repr.b; break;
            case INT:   m_repr.i = key.m_repr.i; break;
            case UINT:  m_repr.u = key.m_repr.u; break;
            case FLOAT: m_repr.f = key.m_repr.f; break;
            case STR:   [[fallthrough]];
            case SYM:   m_repr.s = key.m_repr.s; m_repr.s->retain(); break;
        }
    }

    Key(Key&& key) noexcept : m_repr{}, m_repr_ix{NIL} {
        take(key);
    }

    Key& operator = (const Key& key) {
        if (this == &key) return *this;
        release();
        m_repr_ix = key.m_repr_ix;
        switch (m_repr_ix) {
            case NIL:   m_repr.z = key.m_repr.z; break;
            case BOOL:  m_repr.b = key.m_repr.b; break;
            case INT:   m_repr.i = key.m_repr.i; break;
            case UINT:  m_repr.u = key.m_repr.u; break;
            case FLOAT: m_repr.f = key.m_repr.f; break;
            case STR:   [[fallthrough]];
            case SYM:   m_repr.s = key.m_repr.s; m_repr.s->retain(); break;
        }
        return *this;
    }

    Key& operator = (Key&& key) noexcept {
        if (this == &key) return *this;
        release();
        take(key);
        return *this;
    }

    Key& operator = (nil_t)                { release(); m_repr.z = nullptr; m_repr_ix = NIL; return *this; }
    Key& operator = (is_bool auto v)       { release(); m_repr.b = v; m_repr_ix = BOOL; return *this; }
    Key& operator = (is_like_Int auto v)   { release(); m_repr.i = v; m_repr_ix = INT; return *this; }
    Key& operator = (is_like_UInt auto v)  { release(); m_repr.u = v; m_repr_ix = UINT; return *this; }
    Key& operator = (Float v)              { release(); m_repr.f = v; m_repr_ix = FLOAT; return *this; }

    Key& operator = (const StringView& s) {
        auto p_str = SharedString::create(s);
        release();
        m_repr.s = p_str;
        m_repr_ix = STR;
        return *this;
    }

    Key& operator = (const String& s) { return operator = (StringView{s}); }
    Key& operator = (const char* s)   { return operator = (StringView{s}); }

    bool operator == (nil_t) const {
        return m_repr_ix == NIL;
    }

    /// Compare with text. A symbol key never equals text.
    bool operator == (is_like_string auto&& other) const {
        return (m_repr_ix == STR)? (StringView{m_repr.s->str()} == StringView{other}): false;
    }

    bool operator == (is_bool auto other) const {
        return m_repr_ix == BOOL && m_repr.b == other;
    }

    bool operator == (is_like_Int auto other) const {
        switch (m_repr_ix) {
            case INT:   return m_repr.i == other;
            case UINT:  return other >= 0 && m_repr.u == (UInt)other;
            case FLOAT: return float_equals(m_repr.f, (Int)other);
            default:    return false;
        }
    }

    bool operator == (is_like_UInt auto other) const {
        switch (m_repr_ix) {
            case INT:   return m_repr.i >= 0 && (UInt)m_repr.i == other;
            case UINT:  return m_repr.u == other;
            case FLOAT: return float_equals(m_repr.f, (UInt)other);
            default:    return false;
        }
    }

    bool operator == (is_like_Float auto other) const {
        switch (m_repr_ix) {
            case INT:   return float_equals((Float)other, m_repr.i);
            case UINT:  return float_equals((Float)other, m_repr.u);
            case FLOAT: return m_repr.f == other;
            default:    return false;
        }
    }

    bool operator == (const Key& other) const {
        switch (m_repr_ix) {
            case NIL:   return other == nil;
            case BOOL:  return other == m_repr.b;
            case INT:   return other == m_repr.i;
            case UINT:  return other == m_repr.u;
            case FLOAT: return other == m_repr.f;
            case STR:   [[fallthrough]];
            case SYM:   return other.m_repr_ix == m_repr_ix && other.m_repr.s->str() == m_repr.s->str();
            default:    break;
        }
        return false;
    }

    ReprIX type() const    { return m_repr_ix; }
    auto type_name() const { return type_name(m_repr_ix); }

    /// Returns true if the Key contains the data type, T.
    /// Use `is_text()` and `is_symbol()` to test for string types.
    template <typename T>
    bool is_type() const {
        if constexpr (std::is_same<T, nil_t>::value) return m_repr_ix == NIL;
        else if constexpr (std::is_same<T, bool>::value) return m_repr_ix == BOOL;
        else if constexpr (std::is_same<T, Int>::value) return m_repr_ix == INT;
        else if constexpr (std::is_same<T, UInt>::value) return m_repr_ix == UINT;
        else if constexpr (std::is_same<T, Float>::value) return m_repr_ix == FLOAT;
        else if constexpr (std::is_same<T, String>::value) return m_repr_ix == STR;
        else static_assert(!sizeof(T), "unsupported key type");
    }

    bool is_text() const       { return m_repr_ix == STR; }
    bool is_symbol() const     { return m_repr_ix == SYM; }

    /// Returns true if the Key is text or a symbol, which are the key types
    /// subject to case conversion.
    bool is_identifier() const { return m_repr_ix == STR || m_repr_ix == SYM; }

    /// Returns true if the Key is a INT, UINT, or FLOAT
    bool is_num() const        { return m_repr_ix >= INT && m_repr_ix <= FLOAT; }

    /// Checked access to the backing data.
    /// @tparam T bool, Int, UInt, Float or StringView. StringView access is
    ///           valid for both text and symbol keys.
    template <typename T>
    T as() const requires is_byvalue<T> || std::is_same<T, StringView>::value {
        if constexpr (std::is_same<T, StringView>::value) {
            if (!is_identifier()) throw wrong_type(m_repr_ix, STR);
            return m_repr.s->str();
        } else if constexpr (std::is_same<T, bool>::value) {
            if (m_repr_ix != BOOL) throw wrong_type(m_repr_ix, BOOL);
            return m_repr.b;
        } else if constexpr (std::is_same<T, Int>::value) {
            if (m_repr_ix != INT) throw wrong_type(m_repr_ix, INT);
            return m_repr.i;
        } else if constexpr (std::is_same<T, UInt>::value) {
            if (m_repr_ix != UINT) throw wrong_type(m_repr_ix, UINT);
            return m_repr.u;
        } else {
            if (m_repr_ix != FLOAT) throw wrong_type(m_repr_ix, FLOAT);
            return m_repr.f;
        }
    }

    /// Convert the Key data to a string.
    /// Symbols convert to their text, without decoration.
    String to_str() const {
        switch (m_repr_ix) {
            case NIL:   return "nil";
            case BOOL:  return (m_repr.b? "true": "false");
            case INT:   return keycase::int_to_str(m_repr.i);
            case UINT:  return keycase::int_to_str(m_repr.u);
            case FLOAT: return keycase::float_to_str(m_repr.f);
            case STR:   [[fallthrough]];
            case SYM:   return m_repr.s->str();
            default:
                throw wrong_type(m_repr_ix);
        }
    }

    /// Return the hash value of the Key.
    size_t hash() const {
        static std::hash<Float> float_hash;
        static std::hash<StringView> string_hash;
        switch (m_repr_ix) {
            case NIL:   return 0;
            case BOOL:  return (size_t)m_repr.b;
            case INT:   return (size_t)m_repr.i;
            case UINT:  return (size_t)m_repr.u;
            case FLOAT: {
                // integral floats compare equal to INT and UINT keys, so must hash alike
                auto f = m_repr.f;
                if (f >= -0x1p63 && f < 0x1p63 && f == (Float)(Int)f) return (size_t)(Int)f;
                if (f >= 0 && f < 0x1p64 && f == (Float)(UInt)f) return (size_t)(UInt)f;
                return (size_t)float_hash(f);
            }
            case STR:   return string_hash(m_repr.s->str());
            case SYM:   return ~string_hash(m_repr.s->str());
            default:    throw wrong_type(m_repr_ix);
        }
    }

    static WrongType wrong_type(ReprIX actual)                  { return type_name(actual); };
    static WrongType wrong_type(ReprIX actual, ReprIX expected) { return {type_name(actual), type_name(expected)}; };

    /// Number of keys sharing the text of a text or symbol key, or 0 for
    /// other key types.
    refcnt_t ref_count() const { return is_identifier()? m_repr.s->ref_count(): 0; }

  private:
    /// Exact comparison of a float with an integer. Both convert to the other
    /// type with rounding, so neither conversion alone is enough.
    static bool float_equals(Float f, Int i)  { return f >= -0x1p63 && f < 0x1p63 && f == (Float)(Int)f && (Int)f == i; }
    static bool float_equals(Float f, UInt u) { return f >= 0 && f < 0x1p64 && f == (Float)(UInt)f && (UInt)f == u; }

    /// Move the representation of `key` into this, leaving `key` nil.
    void take(Key& key) {
        m_repr_ix = key.m_repr_ix;
        switch (m_repr_ix) {
            case NIL:   break;
            case BOOL:  m_repr.b = key.m_repr.b; break;
            case INT:   m_repr.i = key.m_repr.i; break;
            case UINT:  m_repr.u = key.m_repr.u; break;
            case FLOAT: m_repr.f = key.m_repr.f; break;
            case STR:   [[fallthrough]];
            case SYM:   m_repr.s = key.m_repr.s; break;
        }
        key.m_repr.z = nullptr;
        key.m_repr_ix = NIL;
    }

    void release() {
        if (m_repr_ix == STR || m_repr_ix == SYM) m_repr.s->release();
        m_repr.z = nullptr;
        m_repr_ix = NIL;
    }

  private:
    Repr m_repr;
    ReprIX m_repr_ix;

  friend std::ostream& operator<< (std::ostream& ostream, const Key& key);
};


inline
Key operator ""_key (const char* str, size_t size) {
    return StringView{str, size};
}

inline
Key operator ""_sym (const char* str, size_t size) {
    return Key::symbol(StringView{str, size});
}

/// Symbols are written with a leading colon, so that test failure messages
/// distinguish `:user_id` from `user_id`.
inline
std::ostream& operator<< (std::ostream& ostream, const Key& key) {
    switch (key.m_repr_ix) {
        case Key::NIL:   return ostream << "nil";
        case Key::BOOL:  return ostream << (key.m_repr.b? "true": "false");
        case Key::INT:   return ostream << key.m_repr.i;
        case Key::UINT:  return ostream << key.m_repr.u;
        case Key::FLOAT: return ostream << key.m_repr.f;
        case Key::STR:   return ostream << key.m_repr.s->str();
        case Key::SYM:   return ostream << ':' << key.m_repr.s->str();
        default:         throw std::invalid_argument("key");
    }
}

struct KeyHash
{
    size_t operator () (const Key& key) const {
        return key.hash();
    }
};

} // namespace keycase


namespace std {

//////////////////////////////////////////////////////////////////////////////
/// Key hash function support
//////////////////////////////////////////////////////////////////////////////
template<>
struct hash<keycase::Key>
{
    std::size_t operator () (const keycase::Key& key) const noexcept {
      return key.hash();
    }
};

} // namespace std
