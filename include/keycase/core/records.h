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

#include <fmt/format.h>

#include "Record.h"
#include "Value.h"

namespace keycase {

/////////////////////////////////////////////////////////////////////////////
/// Calendar date. Encodes to JSON as "YYYY-MM-DD".
/////////////////////////////////////////////////////////////////////////////
class Date : public Record
{
  public:
    Date(int year, int month, int day) : year{year}, month{month}, day{day} {}

    StringView type_name() const override { return "Date"; }

    bool equals(const Record& other) const override {
        auto p_other = dynamic_cast<const Date*>(&other);
        return p_other != nullptr && year == p_other->year && month == p_other->month && day == p_other->day;
    }

    String iso8601() const { return fmt::format("{:04}-{:02}-{:02}", year, month, day); }

    bool to_json(std::ostream& os) const override { os << '"' << iso8601() << '"'; return true; }
    void to_str(std::ostream& os) const override  { os << "#Date<" << iso8601() << '>'; }

    const int year;
    const int month;
    const int day;
};

/////////////////////////////////////////////////////////////////////////////
/// Time of day with microsecond precision. Encodes to JSON as "hh:mm:ss" or
/// "hh:mm:ss.uuuuuu" when the microsecond field is non-zero.
/////////////////////////////////////////////////////////////////////////////
class Time : public Record
{
  public:
    Time(int hour, int minute, int second, int microsecond = 0)
      : hour{hour}, minute{minute}, second{second}, microsecond{microsecond} {}

    StringView type_name() const override { return "Time"; }

    bool equals(const Record& other) const override {
        auto p_other = dynamic_cast<const Time*>(&other);
        return p_other != nullptr && hour == p_other->hour && minute == p_other->minute &&
               second == p_other->second && microsecond == p_other->microsecond;
    }

    String iso8601() const {
        if (microsecond == 0) return fmt::format("{:02}:{:02}:{:02}", hour, minute, second);
        return fmt::format("{:02}:{:02}:{:02}.{:06}", hour, minute, second, microsecond);
    }

    bool to_json(std::ostream& os) const override { os << '"' << iso8601() << '"'; return true; }
    void to_str(std::ostream& os) const override  { os << "#Time<" << iso8601() << '>'; }

    const int hour;
    const int minute;
    const int second;
    const int microsecond;
};

/////////////////////////////////////////////////////////////////////////////
/// Date and time without a time zone.
/////////////////////////////////////////////////////////////////////////////
class NaiveDateTime : public Record
{
  public:
    NaiveDateTime(const Date& date, const Time& time) : date{date}, time{time} {}

    StringView type_name() const override { return "NaiveDateTime"; }

    bool equals(const Record& other) const override {
        auto p_other = dynamic_cast<const NaiveDateTime*>(&other);
        return p_other != nullptr && date.equals(p_other->date) && time.equals(p_other->time);
    }

    String iso8601() const { return date.iso8601() + 'T' + time.iso8601(); }

    bool to_json(std::ostream& os) const override { os << '"' << iso8601() << '"'; return true; }
    void to_str(std::ostream& os) const override  { os << "#NaiveDateTime<" << iso8601() << '>'; }

    const Date date;
    const Time time;
};

/////////////////////////////////////////////////////////////////////////////
/// Date and time in a named time zone with a fixed UTC offset.
/// - The offset is in seconds east of UTC.
/// - Encodes as ISO 8601 with a "Z" suffix when the offset is zero, or a
///   "+hh:mm"/"-hh:mm" suffix otherwise.
/////////////////////////////////////////////////////////////////////////////
class DateTime : public Record
{
  public:
    DateTime(const Date& date, const Time& time, const String& time_zone = "Etc/UTC", int utc_offset = 0)
      : date{date}, time{time}, time_zone{time_zone}, utc_offset{utc_offset} {}

    StringView type_name() const override { return "DateTime"; }

    bool equals(const Record& other) const override {
        auto p_other = dynamic_cast<const DateTime*>(&other);
        return p_other != nullptr && date.equals(p_other->date) && time.equals(p_other->time) &&
               time_zone == p_other->time_zone && utc_offset == p_other->utc_offset;
    }

    String iso8601() const {
        auto base = date.iso8601() + 'T' + time.iso8601();
        if (utc_offset == 0) return base + 'Z';
        auto offset = utc_offset < 0? -utc_offset: utc_offset;
        return fmt::format("{}{}{:02}:{:02}", base, (utc_offset < 0? '-': '+'), offset / 3600, (offset % 3600) / 60);
    }

    bool to_json(std::ostream& os) const override { os << '"' << iso8601() << '"'; return true; }
    void to_str(std::ostream& os) const override  { os << "#DateTime<" << iso8601() << ' ' << time_zone << '>'; }

    const Date date;
    const Time time;
    const String time_zone;
    const int utc_offset;
};

/////////////////////////////////////////////////////////////////////////////
/// Descriptor of an uploaded file, as produced by multipart body parsing.
/// Uploads have no JSON representation.
/////////////////////////////////////////////////////////////////////////////
class Upload : public Record
{
  public:
    Upload(const String& path, const String& content_type, const String& filename)
      : path{path}, content_type{content_type}, filename{filename} {}

    StringView type_name() const override { return "Upload"; }

    bool equals(const Record& other) const override {
        auto p_other = dynamic_cast<const Upload*>(&other);
        return p_other != nullptr && path == p_other->path && content_type == p_other->content_type &&
               filename == p_other->filename;
    }

    void to_str(std::ostream& os) const override { os << "#Upload<" << filename << '>'; }

    const String path;
    const String content_type;
    const String filename;
};

/////////////////////////////////////////////////////////////////////////////
/// Opaque handle to a connection.
/// The `assigns` map belongs to the connection, and its keys keep their
/// original naming when the connection is stored in a converted tree.
/// Connections have no JSON representation.
/////////////////////////////////////////////////////////////////////////////
class Connection : public Record
{
  public:
    Connection(const String& adapter, const Value& assigns = Map{})
      : adapter{adapter}, assigns{assigns} {}

    StringView type_name() const override { return "Connection"; }

    bool equals(const Record& other) const override {
        auto p_other = dynamic_cast<const Connection*>(&other);
        return p_other != nullptr && adapter == p_other->adapter && assigns == p_other->assigns;
    }

    void to_str(std::ostream& os) const override { os << "#Connection<" << adapter << '>'; }

    const String adapter;
    const Value assigns;
};

} // namespace keycase
