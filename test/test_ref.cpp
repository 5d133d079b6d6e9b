#include <gtest/gtest.h>

#include <keycase/support/Ref.h>

using namespace keycase;

struct Thing
{
    Thing(refcnt_t ref_count) : m_ref_count(ref_count) {}
    refcnt_t m_ref_count;
};

TEST(Ref, CreateAndRelease) {
    auto p_thing = new Thing(1);
    {
      Ref<Thing> r_thing = p_thing;
      EXPECT_EQ(p_thing->m_ref_count, 2UL);
    }
    EXPECT_EQ(p_thing->m_ref_count, 1UL);
    delete p_thing;
}

TEST(Ref, CopyRefCountIntegrity) {
    auto p_thing = new Thing(0);
    Ref<Thing> r_thing = p_thing;
    EXPECT_EQ(r_thing.ref_count(), 1UL);
    Ref<Thing> r_copy{r_thing};
    EXPECT_EQ(r_thing.ref_count(), 2UL);
    EXPECT_EQ(r_copy.get(), p_thing);
}

TEST(Ref, MoveRefCountIntegrity) {
    auto p_thing = new Thing(0);
    Ref<Thing> r_thing = p_thing;
    Ref<Thing> r_moved{std::move(r_thing)};
    EXPECT_EQ(r_moved.ref_count(), 1UL);
}

TEST(Ref, AssignRefCountIntegrity) {
    auto p_first = new Thing(1);
    auto p_second = new Thing(0);
    Ref<Thing> r_first = p_first;
    Ref<Thing> r_second = p_second;
    r_first = r_second;
    EXPECT_EQ(p_first->m_ref_count, 1UL);
    EXPECT_EQ(r_second.ref_count(), 2UL);
    delete p_first;
}
