#pragma once

#include <string>
#include <vector>

/**
 * @brief Extension-based classification of supported image files
 *
 * The check is purely syntactic, file contents are never inspected.
 */
class MediaClassifier
{
public:
    /**
     * @brief Check if a path names a supported image (raster or RAW container)
     * @param file_path Path to check, need not exist
     * @return true if the lower-cased extension is supported
     */
    static bool isSupportedFile(const std::string &file_path);

    /**
     * @brief Get the lower-cased extension without the leading dot
     * @return Empty string if the last path component has no extension
     */
    static std::string getFileExtension(const std::string &file_path);

    static const std::vector<std::string> &getSupportedExtensions();
};
