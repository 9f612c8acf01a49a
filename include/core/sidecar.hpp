#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#ifndef SIDECAR_SCANNER_VERSION
#define SIDECAR_SCANNER_VERSION "0.0.0"
#endif

// Sidecars are written with keys in declaration order
using SidecarJson = nlohmann::ordered_json;

/**
 * @brief Identifiers stamped into every sidecar produced by this build
 */
struct SidecarSchema
{
    static constexpr const char *kSchemaVersion = "1.0.0";
    static constexpr const char *kProducerVersion = SIDECAR_SCANNER_VERSION;
    static constexpr const char *kHashAlgorithm = "sha256";
};

/**
 * @brief Which schema, hash algorithm and models produced a sidecar
 *
 * Used by downstream tools to decide whether a sidecar is stale.
 */
struct PipelineSignature
{
    std::string schema_version;
    std::string producer_version;
    std::string hash_algorithm;
    std::optional<std::string> face_model;
    std::optional<std::string> tag_model;
    std::string created_at; // RFC3339

    /**
     * @brief Signature for this build, stamped with the given time
     */
    static PipelineSignature current(const std::string &created_at);

    /**
     * @brief Compatible iff schema version and hash algorithm agree
     *
     * Producer version and model identifiers may differ. This is weaker than
     * operator==.
     */
    bool isCompatibleWith(const PipelineSignature &other) const;

    bool operator==(const PipelineSignature &other) const;
    bool operator!=(const PipelineSignature &other) const { return !(*this == other); }
};

/**
 * @brief Facts about the original file, read directly from the filesystem
 */
struct SourceInfo
{
    std::string file_path;
    uint64_t file_size_bytes = 0;
    std::string file_hash;        // lowercase hex digest
    std::string file_modified_at; // RFC3339
};

/**
 * @brief Image properties, filled in by metadata extractors
 */
struct ImageInfo
{
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    std::optional<std::string> format;
    std::optional<uint8_t> orientation; // EXIF orientation 1-8
    std::optional<std::string> datetime_original;
    std::optional<std::string> camera_make;
    std::optional<std::string> camera_model;
    std::optional<double> gps_latitude;
    std::optional<double> gps_longitude;
};

struct FaceDetection
{
    std::array<float, 4> bbox{}; // x, y, width, height (normalised)
    float score = 0.0f;
    std::optional<std::string> embedding_hash;
    std::optional<std::string> person;
};

enum class TagSource
{
    Ml,
    Rules,
    User
};

struct Tag
{
    std::string label;
    std::optional<float> score;
    TagSource source = TagSource::User;
};

struct ThumbnailInfo
{
    std::string path;
    uint32_t size = 0; // longest edge in pixels
    std::string format;
};

/**
 * @brief Metadata record persisted beside one original file
 *
 * A fresh sidecar has created_at == updated_at, no image block and empty
 * faces/tags/thumbnails; those are populated by downstream tools.
 */
struct Sidecar
{
    std::string schema_version;
    std::string producer_version;
    std::string created_at;
    std::string updated_at;
    PipelineSignature pipeline_signature;
    SourceInfo source;
    std::optional<ImageInfo> image;
    std::vector<FaceDetection> faces;
    std::vector<Tag> tags;
    std::vector<ThumbnailInfo> thumbnails;

    /**
     * @brief Build a fresh sidecar for a just-scanned file
     * @param source Facts read from the original
     * @param now RFC3339 timestamp used for created_at, updated_at and the signature
     */
    static Sidecar create(SourceInfo source, const std::string &now);

    /**
     * @brief Record a modification; created_at is left untouched
     */
    void touch(const std::string &now) { updated_at = now; }

    /// Pretty-printed JSON, two-space indent, keys in declaration order
    std::string toJsonString() const;

    /**
     * @brief Parse a sidecar document
     * @throws ScanError (ErrorKind::Validation) on malformed JSON or missing fields
     */
    static Sidecar fromJsonString(const std::string &text);
};

void to_json(SidecarJson &j, const PipelineSignature &signature);
void from_json(const SidecarJson &j, PipelineSignature &signature);
void to_json(SidecarJson &j, const SourceInfo &source);
void from_json(const SidecarJson &j, SourceInfo &source);
void to_json(SidecarJson &j, const ImageInfo &image);
void from_json(const SidecarJson &j, ImageInfo &image);
void to_json(SidecarJson &j, const FaceDetection &face);
void from_json(const SidecarJson &j, FaceDetection &face);
void to_json(SidecarJson &j, const Tag &tag);
void from_json(const SidecarJson &j, Tag &tag);
void to_json(SidecarJson &j, const ThumbnailInfo &thumbnail);
void from_json(const SidecarJson &j, ThumbnailInfo &thumbnail);
void to_json(SidecarJson &j, const Sidecar &sidecar);
void from_json(const SidecarJson &j, Sidecar &sidecar);

NLOHMANN_JSON_SERIALIZE_ENUM(TagSource, {
                                            {TagSource::Ml, "ml"},
                                            {TagSource::Rules, "rules"},
                                            {TagSource::User, "user"},
                                        })
