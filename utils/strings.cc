#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <sstream>
#include "utils/throw_line.hh"
#include "strings.hh"



namespace mediarip
{

void trim_inplace(std::string &s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), s.end());
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); }));
}


std::string trim(std::string s)
{
    trim_inplace(s);
    return s;
}


std::string extend_left(std::string s, char c, size_t width)
{
    return std::string(width - std::min(width, s.length()), c) + s;
}


std::string str_lowercase(const std::string &s)
{
    std::string str_lc;
    std::transform(s.begin(), s.end(), std::back_inserter(str_lc), [](unsigned char c) { return std::tolower(c); });

    return str_lc;
}


std::string str_uppercase(const std::string &s)
{
    std::string str_uc;
    std::transform(s.begin(), s.end(), std::back_inserter(str_uc), [](unsigned char c) { return std::toupper(c); });

    return str_uc;
}


std::vector<std::string> tokenize(const std::string &str, const char *delimiters, const char *quotes)
{
    std::vector<std::string> tokens;

    std::set<char> delimiter;
    for(auto d = delimiters; *d != '\0'; ++d)
        delimiter.insert(*d);

    bool in = false;
    std::string::const_iterator s;
    for(auto it = str.begin(); it < str.end(); ++it)
    {
        if(in)
        {
            // quoted
            if(quotes != nullptr && *s == quotes[0])
            {
                if(*it == quotes[1])
                {
                    ++s;
                    tokens.emplace_back(s, it);
                    in = false;
                }
            }
            // unquoted
            else if(delimiter.find(*it) != delimiter.end())
            {
                tokens.emplace_back(s, it);
                in = false;
            }
        }
        else if(delimiter.find(*it) == delimiter.end())
        {
            s = it;
            in = true;
        }
    }

    // remaining entry
    if(in)
        tokens.emplace_back(s, str.end());

    return tokens;
}


std::string replace_nonprint(std::string s, char r)
{
    std::transform(s.begin(), s.end(), s.begin(), [r](unsigned char c) { return isprint(c) ? (char)c : r; });
    return s;
}


std::string normalize_string(const std::string &s)
{
    std::string ns;

    auto tokens = tokenize(s, " \t\r\n", nullptr);
    for(auto const &t : tokens)
        ns += replace_nonprint(t, '.') + ' ';

    if(!ns.empty())
        ns.pop_back();

    return ns;
}


std::optional<uint64_t> str_to_uint64(std::string::const_iterator str_begin, std::string::const_iterator str_end)
{
    uint64_t value = 0;

    bool valid = false;
    for(auto it = str_begin; it != str_end; ++it)
    {
        if(std::isdigit((unsigned char)*it))
        {
            value = (value * 10) + (*it - '0');
            valid = true;
        }
        else
        {
            valid = false;
            break;
        }
    }

    return valid ? std::make_optional(value) : std::nullopt;
}


std::optional<uint64_t> str_to_uint64(const std::string &str)
{
    return str_to_uint64(str.cbegin(), str.cend());
}


uint64_t str_to_uint(const std::string &str)
{
    auto value = str_to_uint64(str);
    if(!value)
        throw_line("string is not an unsigned integer number ({})", str);

    return *value;
}


std::vector<std::pair<uint64_t, uint64_t>> string_to_ranges(const std::string &str)
{
    std::vector<std::pair<uint64_t, uint64_t>> ranges;

    std::istringstream iss(str);
    for(std::string range; std::getline(iss, range, ':');)
    {
        if(range.empty())
            continue;

        auto dash = range.find('-');
        uint64_t first = str_to_uint(range.substr(0, dash));
        uint64_t last = dash == std::string::npos ? first : str_to_uint(range.substr(dash + 1));
        if(last < first)
            throw_line("invalid range ({})", range);

        ranges.emplace_back(first, last + 1);
    }

    return ranges;
}


std::string ranges_to_string(const std::vector<std::pair<uint64_t, uint64_t>> &ranges)
{
    std::string str;

    for(auto const &r : ranges)
        str += r.second - r.first == 1 ? fmt::format("{}:", r.first) : fmt::format("{}-{}:", r.first, r.second - 1);

    if(!str.empty())
        str.pop_back();

    return str;
}

}
