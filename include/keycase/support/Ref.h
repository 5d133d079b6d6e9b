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

#include <keycase/support/types.h>
#include <keycase/support/exception.h>

namespace keycase {

//////////////////////////////////////////////////////////////////////////////
/// Intrusive reference to an instance of T.
/// - T must have an accessible `m_ref_count` member of type refcnt_t, or
///   std::atomic<refcnt_t> if references are copied on more than one thread.
/// - The instance is deleted through a T pointer when the last reference is
///   released, so a polymorphic T needs a virtual destructor.
//////////////////////////////////////////////////////////////////////////////
template <class T>
class Ref
{
  public:
    Ref(T* ptr) : m_ptr(ptr) { ASSERT(m_ptr != nullptr); inc_ref_count(); }
    ~Ref() { if (m_ptr != nullptr) dec_ref_count(); }

    Ref(const Ref& other) : m_ptr{other.m_ptr} {
        if (m_ptr != nullptr) inc_ref_count();
    }

    Ref(Ref&& other) : m_ptr{other.m_ptr} {
        other.m_ptr = nullptr;
    }

    template <class D> requires std::is_base_of_v<T, D>
    Ref(const Ref<D>& other) : m_ptr{const_cast<D*>(other.get())} {
        if (m_ptr != nullptr) inc_ref_count();
    }

    Ref& operator = (const Ref& other) {
        if (m_ptr != other.m_ptr) {
            if (m_ptr != nullptr) dec_ref_count();
            m_ptr = other.m_ptr;
            if (m_ptr != nullptr) inc_ref_count();
        }
        return *this;
    }

    Ref& operator = (Ref&& other) {
        if (m_ptr != other.m_ptr) {
            if (m_ptr != nullptr) dec_ref_count();
            m_ptr = other.m_ptr;
            other.m_ptr = nullptr;
        }
        return *this;
    }

    const T& operator * () const { return *m_ptr; }
    T& operator * ()             { return *m_ptr; }

    const T* operator -> () const { return m_ptr; }
    T* operator -> ()             { return m_ptr; }

    const T* get() const          { return m_ptr; }
    T* get()                      { return m_ptr; }

    refcnt_t ref_count() const { return m_ptr->m_ref_count; }

  private:
    void inc_ref_count() { ++(m_ptr->m_ref_count); }
    void dec_ref_count() { if (--(m_ptr->m_ref_count) == 0) delete m_ptr; }

  private:
    T* m_ptr;
};

} // namespace keycase
