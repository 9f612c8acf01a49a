#include "core/file_utils.hpp"
#include "core/scan_error.hpp"
#include "logging/logger.hpp"
#include <openssl/evp.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <sys/stat.h>
#include <vector>

namespace
{
    struct EvpContextDeleter
    {
        void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
    };

    using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

    EvpContext newSha256Context()
    {
        EvpContext ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        {
            throw ScanError::internal("Failed to initialise SHA-256 digest");
        }
        return ctx;
    }
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::trace("Hashing file: " + file_path);

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        throw ScanError::io("Cannot open file for hashing: " + file_path + ": " + std::strerror(errno));
    }

    EvpContext ctx = newSha256Context();
    std::vector<char> buffer(kHashChunkSize);
    while (file)
    {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(bytes_read)) != 1)
        {
            throw ScanError::internal("SHA-256 update failed for: " + file_path);
        }
    }
    if (file.bad())
    {
        throw ScanError::io("Read error while hashing: " + file_path);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1)
    {
        throw ScanError::internal("SHA-256 finalisation failed for: " + file_path);
    }
    return toHex(digest, length);
}

std::string FileUtils::computeHash(const std::string &data)
{
    EvpContext ctx = newSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    {
        throw ScanError::internal("SHA-256 update failed");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1)
    {
        throw ScanError::internal("SHA-256 finalisation failed");
    }
    return toHex(digest, length);
}

std::string FileUtils::toHex(const unsigned char *digest, unsigned int length)
{
    std::stringstream ss;
    for (unsigned int i = 0; i < length; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return ss.str();
}

FileMetadata FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (::stat(file_path.c_str(), &st) != 0)
    {
        throw ScanError::io("Cannot read metadata of " + file_path + ": " + std::strerror(errno));
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.modification_time = std::chrono::system_clock::from_time_t(st.st_mtim.tv_sec) +
                                 std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                     std::chrono::nanoseconds(st.st_mtim.tv_nsec));
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    return metadata;
}

std::string FileUtils::toRfc3339(std::chrono::system_clock::time_point time)
{
    auto since_epoch = time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds).count();
    if (nanos < 0)
    {
        seconds -= std::chrono::seconds(1);
        nanos += 1000000000;
    }

    std::time_t as_time_t = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    if (gmtime_r(&as_time_t, &utc) == nullptr)
    {
        throw ScanError::internal("Failed to format timestamp: " + std::to_string(seconds.count()));
    }

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (nanos != 0)
    {
        std::stringstream frac;
        frac << std::setw(9) << std::setfill('0') << nanos;
        std::string digits = frac.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        ss << '.' << digits;
    }
    ss << 'Z';
    return ss.str();
}

std::string FileUtils::nowRfc3339()
{
    return toRfc3339(std::chrono::system_clock::now());
}
