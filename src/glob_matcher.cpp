#include "core/glob_matcher.hpp"
#include "core/scan_error.hpp"
#include "logging/logger.hpp"
#include <cstring>

namespace
{
    bool isRegexSpecial(char c)
    {
        return std::strchr(".^$|()[]{}+*?\\", c) != nullptr;
    }

    void appendLiteral(std::string &out, char c)
    {
        if (isRegexSpecial(c))
        {
            out += '\\';
        }
        out += c;
    }

    // Translates the class starting at pattern[start] == '['. Returns the index
    // just past the closing ']'.
    size_t translateClass(const std::string &pattern, size_t start, std::string &out)
    {
        size_t i = start + 1;
        bool negated = false;
        if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^'))
        {
            negated = true;
            ++i;
        }

        std::string body;
        bool first = true;
        while (i < pattern.size())
        {
            char c = pattern[i];
            if (c == ']' && !first)
            {
                // Negated classes must not cross a path separator either
                out += negated ? "[^/" : "[";
                out += body;
                out += ']';
                return i + 1;
            }
            if (c == '\\')
            {
                if (i + 1 >= pattern.size())
                {
                    break;
                }
                ++i;
                c = pattern[i];
            }
            if (c == '\\' || c == ']' || c == '[' || c == '^')
            {
                body += '\\';
            }
            body += c;
            first = false;
            ++i;
        }

        throw ScanError::validation("Invalid glob pattern '" + pattern + "': unclosed character class");
    }
}

std::string GlobMatcher::toRegex(const std::string &pattern)
{
    if (pattern.empty())
    {
        throw ScanError::validation("Invalid glob pattern: pattern is empty");
    }

    std::string out;
    size_t i = 0;
    while (i < pattern.size())
    {
        char c = pattern[i];
        switch (c)
        {
        case '*':
        {
            size_t run = i;
            while (run < pattern.size() && pattern[run] == '*')
            {
                ++run;
            }
            if (run - i == 1)
            {
                out += "[^/]*";
                i = run;
                break;
            }
            bool at_segment_start = (i == 0 || pattern[i - 1] == '/');
            if (at_segment_start && run < pattern.size() && pattern[run] == '/')
            {
                out += "(?:.*/)?";
                i = run + 1;
            }
            else
            {
                out += ".*";
                i = run;
            }
            break;
        }
        case '?':
            out += "[^/]";
            ++i;
            break;
        case '[':
            i = translateClass(pattern, i, out);
            break;
        case '\\':
            if (i + 1 >= pattern.size())
            {
                throw ScanError::validation("Invalid glob pattern '" + pattern + "': dangling escape");
            }
            appendLiteral(out, pattern[i + 1]);
            i += 2;
            break;
        default:
            appendLiteral(out, c);
            ++i;
            break;
        }
    }
    return out;
}

GlobMatcher GlobMatcher::compile(const std::vector<std::string> &patterns)
{
    GlobMatcher matcher;
    for (const auto &pattern : patterns)
    {
        std::string body = toRegex(pattern);
        try
        {
            CompiledPattern compiled{std::regex(body, std::regex::ECMAScript | std::regex::optimize),
                                     pattern.find('/') == std::string::npos};
            matcher.compiled_.push_back(std::move(compiled));
        }
        catch (const std::regex_error &e)
        {
            throw ScanError::validation("Invalid glob pattern '" + pattern + "': " + e.what());
        }
        matcher.sources_.push_back(pattern);
        Logger::trace("Compiled glob '" + pattern + "' as /" + body + "/");
    }
    return matcher;
}

bool GlobMatcher::matches(const std::string &path) const
{
    if (compiled_.empty())
    {
        return false;
    }

    std::string file_name = path;
    auto slash = path.find_last_of('/');
    if (slash != std::string::npos)
    {
        file_name = path.substr(slash + 1);
    }

    for (const auto &compiled : compiled_)
    {
        if (std::regex_match(path, compiled.regex))
        {
            return true;
        }
        if (compiled.match_file_name && slash != std::string::npos &&
            std::regex_match(file_name, compiled.regex))
        {
            return true;
        }
    }
    return false;
}
