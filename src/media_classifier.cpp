#include "core/media_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

const std::vector<std::string> &MediaClassifier::getSupportedExtensions()
{
    static const std::vector<std::string> extensions = {
        "jpg", "jpeg", "png", "heic", "heif",
        "raw", "cr2", "nef", "arw", "dng",
        "tiff", "tif", "webp"};
    return extensions;
}

bool MediaClassifier::isSupportedFile(const std::string &file_path)
{
    std::string ext = getFileExtension(file_path);
    if (ext.empty())
    {
        return false;
    }
    const auto &supported = getSupportedExtensions();
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

std::string MediaClassifier::getFileExtension(const std::string &file_path)
{
    // fs::path treats a leading dot as part of the stem (".jpg" has no extension)
    std::string ext = fs::path(file_path).extension().string();
    if (ext.size() <= 1)
    {
        return "";
    }
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}
