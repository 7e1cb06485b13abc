#include "to_string.hh"

#include <charconv>
#include <cstdint>
#include <system_error>

namespace
{
template <class T>
std::string chars_of(T v, int base = 10)
{
    char buf[32];
    auto const [end, ec] = std::to_chars(buf, buf + sizeof(buf), v, base);
    // 32 chars hold every 64 bit integer in base 10 or 16
    return std::string(buf, ec == std::errc{} ? end : buf);
}

template <class T>
std::string chars_of_float(T v)
{
    char buf[64];
    auto const [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, ec == std::errc{} ? end : buf);
}

std::string hex_of(std::uintmax_t v, int min_digits)
{
    auto digits = chars_of(v, 16);
    for (auto& c : digits)
        if (c >= 'a' && c <= 'f')
            c = char(c - 'a' + 'A');
    if (int(digits.size()) < min_digits)
        digits.insert(0, min_digits - digits.size(), '0');
    return "0x" + digits;
}
} // namespace

std::string lc::to_string(void const* ptr)
{
    return hex_of(reinterpret_cast<std::uintptr_t>(ptr), 1);
}

std::string lc::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string lc::to_string(byte b)
{
    return hex_of(static_cast<unsigned char>(b), 2);
}

std::string lc::to_string(char c)
{
    return std::string(1, c);
}

std::string lc::to_string(signed char i)
{
    return chars_of(int(i));
}

std::string lc::to_string(unsigned char i)
{
    return chars_of(unsigned(i));
}

std::string lc::to_string(signed short i)
{
    return chars_of(i);
}

std::string lc::to_string(unsigned short i)
{
    return chars_of(i);
}

std::string lc::to_string(signed int i)
{
    return chars_of(i);
}

std::string lc::to_string(unsigned int i)
{
    return chars_of(i);
}

std::string lc::to_string(signed long i)
{
    return chars_of(i);
}

std::string lc::to_string(unsigned long i)
{
    return chars_of(i);
}

std::string lc::to_string(signed long long i)
{
    return chars_of(i);
}

std::string lc::to_string(unsigned long long i)
{
    return chars_of(i);
}

std::string lc::to_string(float f)
{
    return chars_of_float(f);
}

std::string lc::to_string(double f)
{
    return chars_of_float(f);
}

std::string lc::to_string(char const* s)
{
    return {s};
}

std::string lc::to_string(std::string_view s)
{
    return std::string(s);
}
