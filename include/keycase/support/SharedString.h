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

#include <atomic>

#include <keycase/support/types.h>

namespace keycase {

/////////////////////////////////////////////////////////////////////////////
/// Immutable text storage shared by copies of a text or symbol Key.
/// - Storage is reference counted, and is freed by the last `release`.
/// - The count is atomic, so copies held by different threads may be
///   retained and released concurrently.
/////////////////////////////////////////////////////////////////////////////
class SharedString
{
  public:
    /// Returns new storage holding one reference.
    static SharedString* create(const StringView& str) { return new SharedString{str}; }

    void retain() const  { ++m_ref_count; }
    void release() const { if (--m_ref_count == 0) delete this; }

    const String& str() const  { return m_str; }
    refcnt_t ref_count() const { return m_ref_count; }

  private:
    explicit SharedString(const StringView& str) : m_ref_count{1}, m_str{str} {}

  private:
    mutable std::atomic<refcnt_t> m_ref_count;
    const String m_str;
};

} // namespace keycase
