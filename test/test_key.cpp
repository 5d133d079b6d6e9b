#include <gtest/gtest.h>
#include <keycase/core/Key.h>
#include <unordered_map>
#include <unordered_set>

using namespace keycase;

TEST(Key, Null) {
  Key k;
  EXPECT_TRUE(k == nil);
  EXPECT_EQ(k, Key{});
  EXPECT_EQ(k.to_str(), "nil");
}

TEST(Key, Bool) {
  Key k{true};
  EXPECT_TRUE(k.is_type<bool>());
  EXPECT_EQ(k.to_str(), "true");
  EXPECT_EQ(k.as<bool>(), true);
}

TEST(Key, Int) {
  Int v = std::numeric_limits<Int>::min();
  Key k{v};
  EXPECT_TRUE(k.is_type<Int>());
  EXPECT_EQ(k.to_str(), int_to_str(v));
  EXPECT_EQ(k.as<Int>(), v);
}

TEST(Key, UInt) {
  UInt v = std::numeric_limits<UInt>::max();
  Key k{v};
  EXPECT_TRUE(k.is_type<UInt>());
  EXPECT_EQ(k.to_str(), "18446744073709551615");
  EXPECT_EQ(k.as<UInt>(), v);
}

TEST(Key, Float) {
  double v = 8.8541878128e-12;
  Key k{v};
  EXPECT_TRUE(k.is_type<Float>());
  EXPECT_EQ(k.to_str(), "8.8541878128e-12");
  EXPECT_EQ(k.as<Float>(), v);
}

TEST(Key, Text) {
  Key k{"user_id"s};
  EXPECT_TRUE(k.is_text());
  EXPECT_FALSE(k.is_symbol());
  EXPECT_TRUE(k.is_identifier());
  EXPECT_EQ(k.as<StringView>(), "user_id");
  EXPECT_EQ(k, "user_id");
}

TEST(Key, TextLiteral) {
  auto k = "user_id"_key;
  EXPECT_TRUE(k.is_text());
  EXPECT_EQ(k, Key{"user_id"});
}

TEST(Key, Symbol) {
  auto k = "user_id"_sym;
  EXPECT_TRUE(k.is_symbol());
  EXPECT_FALSE(k.is_text());
  EXPECT_TRUE(k.is_identifier());
  EXPECT_EQ(k.type_name(), "symbol");
  EXPECT_EQ(k.as<StringView>(), "user_id");
  EXPECT_EQ(k.to_str(), "user_id");
  EXPECT_EQ(k, Key::symbol("user_id"));
}

TEST(Key, SymbolNotEqualText) {
  EXPECT_NE("user_id"_sym, "user_id"_key);
  EXPECT_FALSE("user_id"_sym == "user_id");
}

TEST(Key, SymbolAndTextHashDistinctly) {
  std::unordered_set<Key> keys;
  keys.insert("id"_key);
  keys.insert("id"_sym);
  keys.insert(Key{"id"s});
  EXPECT_EQ(keys.size(), 2UL);
}

TEST(Key, NumbersAreNotIdentifiers) {
  EXPECT_FALSE(Key{1}.is_identifier());
  EXPECT_FALSE(Key{true}.is_identifier());
  EXPECT_FALSE(Key{}.is_identifier());
}

TEST(Key, CompareNumbers) {
  EXPECT_EQ(Key{1}, Key{1UL});
  EXPECT_EQ(Key{1}, Key{1.0});
  EXPECT_NE(Key{-1}, Key{(UInt)-1});
  EXPECT_EQ(Key{1}.hash(), Key{1.0}.hash());
}

TEST(Key, AssignText) {
  Key k{7};
  k = "foo"s;
  EXPECT_TRUE(k.is_text());
  EXPECT_EQ(k.as<StringView>(), "foo");
}

TEST(Key, WrongType) {
  Key k{7};
  EXPECT_THROW(k.as<StringView>(), WrongType);
  EXPECT_THROW(k.as<bool>(), WrongType);
}

TEST(Key, Print) {
  std::stringstream ss;
  ss << "user_id"_key << ' ' << "user_id"_sym << ' ' << Key{3};
  EXPECT_EQ(ss.str(), "user_id :user_id 3");
}

TEST(Key, CompareLargeNumbers) {
  UInt big = UInt{1} << 63;
  Key k_uint{big};
  Key k_float{9223372036854775808.0};
  EXPECT_EQ(k_uint, k_float);
  EXPECT_EQ(k_float, k_uint);
  EXPECT_EQ(k_uint.hash(), k_float.hash());
  EXPECT_NE(Key{big + 1}, k_float);
  EXPECT_NE(Key{std::numeric_limits<Int>::max()}, Key{9223372036854775808.0});
  EXPECT_NE(Key{1}, Key{1.5});
}

TEST(Key, LargeNumbersInMap) {
  std::unordered_map<Key, int, KeyHash> map;
  map[Key{UInt{1} << 63}] = 1;
  map[Key{UInt{1} << 62}] = 2;
  EXPECT_EQ(map.at(Key{9223372036854775808.0}), 1);
  EXPECT_EQ(map.at(Key{4611686018427387904.0}), 2);
  EXPECT_EQ(map.at(Key{Int{1} << 62}), 2);
}

TEST(Key, TextStorageShared) {
  Key k{"user_name"s};
  EXPECT_EQ(k.ref_count(), 1UL);
  {
    Key copy = k;
    EXPECT_EQ(k.ref_count(), 2UL);
    EXPECT_EQ(copy, k);
  }
  EXPECT_EQ(k.ref_count(), 1UL);

  Key moved = std::move(k);
  EXPECT_EQ(moved.ref_count(), 1UL);
  EXPECT_EQ(moved, "user_name");
}

TEST(Key, TextStorageNotShared) {
  Key a{"user_name"s};
  Key b{"user_name"s};
  EXPECT_EQ(a, b);
  EXPECT_EQ(a.hash(), b.hash());
  EXPECT_EQ(a.ref_count(), 1UL);
  EXPECT_EQ(b.ref_count(), 1UL);
  EXPECT_EQ(Key{7}.ref_count(), 0UL);
}

TEST(Key, AssignOwnText) {
  Key k{"user_name"s};
  k = k.as<StringView>();
  EXPECT_EQ(k, "user_name");
  EXPECT_EQ(k.ref_count(), 1UL);
}
