#ifndef UTIL_PRINT_HPP
#define UTIL_PRINT_HPP

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace util
{

namespace detail
{

template <typename T>
std::string to_string(const T& value)
{
    std::ostringstream oss;
    oss << std::boolalpha << value;
    return oss.str();
}

// Replaces each "{}" in order with the next argument.  Placeholders left
// over once the arguments run out are written verbatim.
template <typename... Args>
std::string format(const std::string& template_str, const Args&... args)
{
    const std::vector<std::string> arg_list = {to_string(args)...};

    std::string out;
    out.reserve(template_str.size());

    size_t arg_index = 0;
    size_t start_pos = 0;
    while (start_pos < template_str.size())
    {
        const size_t open_brace = template_str.find("{}", start_pos);
        if (open_brace == std::string::npos)
        {
            out.append(template_str, start_pos, std::string::npos);
            break;
        }

        out.append(template_str, start_pos, open_brace - start_pos);
        if (arg_index < arg_list.size())
            out += arg_list[arg_index++];
        else
            out += "{}";

        start_pos = open_brace + 2;
    }

    return out;
}

}  // namespace detail

template <typename... Args>
std::string format(const std::string& message, const Args&... args)
{
    return detail::format(message, args...);
}

template <typename... Args>
void println(const std::string& message, const Args&... args)
{
    std::cout << detail::format(message, args...) << std::endl;
}

template <typename... Args>
void eprintln(const std::string& message, const Args&... args)
{
    std::cerr << detail::format(message, args...) << std::endl;
}

}  // namespace util

#endif  // UTIL_PRINT_HPP
