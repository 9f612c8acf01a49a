#pragma once

#include <regex>
#include <string>
#include <vector>

/**
 * @brief Set of compiled glob patterns
 *
 * Supported syntax:
 *   `*`      any run of characters except '/'
 *   `**`     any run of characters including '/'; `**` followed by '/' also
 *            matches zero directories
 *   `?`      exactly one character except '/'
 *   `[a-z]`  character class, `[!...]` or `[^...]` negates it
 *   `\x`     literal x
 *
 * Paths are matched with '/' separators. A pattern without any '/' is also
 * tried against the last path component, so "*.jpg" selects JPEGs at any depth.
 */
class GlobMatcher
{
public:
    GlobMatcher() = default;

    /**
     * @brief Compile a list of glob patterns
     * @param patterns Glob strings, one pattern per element
     * @return Matcher that accepts a path if any pattern matches it
     * @throws ScanError (ErrorKind::Validation) if any pattern is malformed
     */
    static GlobMatcher compile(const std::vector<std::string> &patterns);

    /**
     * @brief Check a path against the compiled patterns
     * @param path Path relative to the scan root, '/'-separated
     */
    bool matches(const std::string &path) const;

    bool empty() const { return compiled_.empty(); }
    const std::vector<std::string> &patterns() const { return sources_; }

    /**
     * @brief Translate one glob into an ECMAScript regular expression body
     * @throws ScanError (ErrorKind::Validation) on malformed syntax
     */
    static std::string toRegex(const std::string &pattern);

private:
    struct CompiledPattern
    {
        std::regex regex;
        bool match_file_name; // pattern has no '/', also try the last component
    };

    std::vector<CompiledPattern> compiled_;
    std::vector<std::string> sources_;
};
