#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <sstream>

#include <cpptrace/cpptrace.hpp>

#define ASSERT(cond) { if (!(cond)) throw ::keycase::Assert{#cond}; }

namespace keycase {

class KeycaseException : public cpptrace::exception_with_message
{
  public:
    KeycaseException(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
    KeycaseException() : KeycaseException{""} {}
};

class Assert : public cpptrace::exception_with_message
{
  public:
    Assert(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
};

struct WrongType : public KeycaseException
{
    static std::string make_message(const std::string_view& actual) {
        std::stringstream ss;
        ss << "type=" << actual;
        return ss.str();
    }

    static std::string make_message(const std::string_view& actual, const std::string_view& expected) {
        std::stringstream ss;
        ss << "type=" << actual << ", expected=" << expected;
        return ss.str();
    }

    WrongType(const std::string_view& actual) : KeycaseException(make_message(actual)) {}
    WrongType(const std::string_view& actual, const std::string_view& expected) : KeycaseException(make_message(actual, expected)) {}
};

} // keycase namespace
