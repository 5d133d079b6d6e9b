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
#include <iostream>

#include <keycase/support/Ref.h>
#include <keycase/support/types.h>

namespace keycase {

class Value;

//////////////////////////////////////////////////////////////////////////////
/// Base class of opaque composite values.
/// - A Record is a named value with internal structure, such as a date or a
///   file upload descriptor, that is stored in a Value as a single unit.
/// - Key conversion never descends into a Record. Any class derived from
///   Record is treated this way, so new record types need no support from
///   the conversion code.
/// - Records are immutable once stored in a Value, and are shared by
///   reference count. Copying a Value that holds a Record copies the
///   reference, not the Record. The count is atomic, so copies of a Value
///   may be made and dropped on different threads.
//////////////////////////////////////////////////////////////////////////////
class Record
{
  public:
    Record() : m_ref_count{0} {}
    Record(const Record&) : m_ref_count{0} {}
    Record& operator = (const Record&) { return *this; }
    virtual ~Record() {}

    /// Name of the record type, for example "Date".
    virtual StringView type_name() const = 0;

    /// Value equality with another record of any type.
    /// Implementations return false when `other` has a different type.
    virtual bool equals(const Record& other) const = 0;

    /// Write the JSON representation of the record to `os` and return true,
    /// or return false without writing if the record has none.
    virtual bool to_json(std::ostream& os) const { return false; }

    /// Write a human readable representation of the record.
    virtual void to_str(std::ostream& os) const { os << '#' << type_name() << "<>"; }

    refcnt_t ref_count() const { return m_ref_count; }

  private:
    std::atomic<refcnt_t> m_ref_count;

  template <class> friend class Ref;
  friend class Value;
};

/// Create a reference-counted record of type R.
template <class R, typename ... Args>
Ref<R> make_record(Args&& ... args) {
    return Ref<R>{new R(std::forward<Args>(args)...)};
}

} // namespace keycase
