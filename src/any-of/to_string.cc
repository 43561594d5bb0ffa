#include "to_string.hh"

#include <charconv>
#include <cstdint>

namespace
{
// large enough for any integer and the shortest round-trip double
constexpr int max_number_chars = 64;

template <class T>
std::string number_to_string(T v)
{
    char buf[max_number_chars];
    auto const [end, ec] = std::to_chars(buf, buf + max_number_chars, v);
    if (ec != std::errc{})
        return "<unprintable>";
    return std::string(buf, end);
}
} // namespace

std::string ao::to_string(void const* ptr)
{
    char buf[max_number_chars] = {'0', 'x'};
    auto const [end, ec] = std::to_chars(buf + 2, buf + max_number_chars, reinterpret_cast<std::uintptr_t>(ptr), 16);
    if (ec != std::errc{})
        return "<unprintable>";
    return std::string(buf, end);
}

std::string ao::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string ao::to_string(char c)
{
    return std::string(1, c);
}

std::string ao::to_string(signed char i)
{
    return number_to_string(int(i));
}

std::string ao::to_string(unsigned char i)
{
    return number_to_string(unsigned(i));
}

std::string ao::to_string(signed short i)
{
    return number_to_string(i);
}

std::string ao::to_string(unsigned short i)
{
    return number_to_string(i);
}

std::string ao::to_string(signed int i)
{
    return number_to_string(i);
}

std::string ao::to_string(unsigned int i)
{
    return number_to_string(i);
}

std::string ao::to_string(signed long i)
{
    return number_to_string(i);
}

std::string ao::to_string(unsigned long i)
{
    return number_to_string(i);
}

std::string ao::to_string(signed long long i)
{
    return number_to_string(i);
}

std::string ao::to_string(unsigned long long i)
{
    return number_to_string(i);
}

std::string ao::to_string(float f)
{
    return number_to_string(f);
}

std::string ao::to_string(double f)
{
    return number_to_string(f);
}

std::string ao::to_string(char const* s)
{
    return s ? std::string(s) : std::string();
}

std::string ao::to_string(std::string s)
{
    return s;
}

std::string ao::to_string(std::string_view s)
{
    return std::string(s);
}
