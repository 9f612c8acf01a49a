#pragma once

#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief Serialize a JSON value for a file or the terminal
 *
 * File names on Linux are arbitrary bytes. Bytes that are not valid UTF-8 are
 * written as U+FFFD instead of making the dump throw.
 *
 * @param indent Spaces per level, -1 for a single line
 */
template <typename Json>
std::string toJsonText(const Json &json, int indent = 2)
{
    return json.dump(indent, ' ', false, Json::error_handler_t::replace);
}
