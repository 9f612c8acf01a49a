#include "core/sidecar.hpp"
#include "core/json_text.hpp"
#include "core/scan_error.hpp"

namespace
{
    template <typename T>
    void putIfPresent(SidecarJson &j, const char *key, const std::optional<T> &value)
    {
        if (value)
        {
            j[key] = *value;
        }
    }

    template <typename T>
    void readOptional(const SidecarJson &j, const char *key, std::optional<T> &out)
    {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null())
        {
            out = it->template get<T>();
        }
        else
        {
            out.reset();
        }
    }

    template <typename T>
    void readList(const SidecarJson &j, const char *key, std::vector<T> &out)
    {
        out.clear();
        auto it = j.find(key);
        if (it != j.end() && !it->is_null())
        {
            out = it->template get<std::vector<T>>();
        }
    }
}

PipelineSignature PipelineSignature::current(const std::string &created_at)
{
    PipelineSignature signature;
    signature.schema_version = SidecarSchema::kSchemaVersion;
    signature.producer_version = SidecarSchema::kProducerVersion;
    signature.hash_algorithm = SidecarSchema::kHashAlgorithm;
    signature.created_at = created_at;
    return signature;
}

bool PipelineSignature::isCompatibleWith(const PipelineSignature &other) const
{
    return schema_version == other.schema_version && hash_algorithm == other.hash_algorithm;
}

bool PipelineSignature::operator==(const PipelineSignature &other) const
{
    return schema_version == other.schema_version &&
           producer_version == other.producer_version &&
           hash_algorithm == other.hash_algorithm &&
           face_model == other.face_model &&
           tag_model == other.tag_model &&
           created_at == other.created_at;
}

Sidecar Sidecar::create(SourceInfo source, const std::string &now)
{
    Sidecar sidecar;
    sidecar.schema_version = SidecarSchema::kSchemaVersion;
    sidecar.producer_version = SidecarSchema::kProducerVersion;
    sidecar.created_at = now;
    sidecar.updated_at = now;
    sidecar.pipeline_signature = PipelineSignature::current(now);
    sidecar.source = std::move(source);
    return sidecar;
}

std::string Sidecar::toJsonString() const
{
    SidecarJson j = *this;
    return toJsonText(j);
}

Sidecar Sidecar::fromJsonString(const std::string &text)
{
    try
    {
        return SidecarJson::parse(text).get<Sidecar>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ScanError::validation(std::string("Invalid sidecar JSON: ") + e.what());
    }
}

void to_json(SidecarJson &j, const PipelineSignature &signature)
{
    j = SidecarJson{
        {"schema_version", signature.schema_version},
        {"producer_version", signature.producer_version},
        {"hash_algorithm", signature.hash_algorithm}};
    putIfPresent(j, "face_model", signature.face_model);
    putIfPresent(j, "tag_model", signature.tag_model);
    j["created_at"] = signature.created_at;
}

void from_json(const SidecarJson &j, PipelineSignature &signature)
{
    j.at("schema_version").get_to(signature.schema_version);
    j.at("producer_version").get_to(signature.producer_version);
    j.at("hash_algorithm").get_to(signature.hash_algorithm);
    readOptional(j, "face_model", signature.face_model);
    readOptional(j, "tag_model", signature.tag_model);
    j.at("created_at").get_to(signature.created_at);
}

void to_json(SidecarJson &j, const SourceInfo &source)
{
    j = SidecarJson{
        {"file_path", source.file_path},
        {"file_size_bytes", source.file_size_bytes},
        {"file_hash", source.file_hash},
        {"file_modified_at", source.file_modified_at}};
}

void from_json(const SidecarJson &j, SourceInfo &source)
{
    j.at("file_path").get_to(source.file_path);
    j.at("file_size_bytes").get_to(source.file_size_bytes);
    j.at("file_hash").get_to(source.file_hash);
    j.at("file_modified_at").get_to(source.file_modified_at);
}

void to_json(SidecarJson &j, const ImageInfo &image)
{
    j = SidecarJson::object();
    putIfPresent(j, "width", image.width);
    putIfPresent(j, "height", image.height);
    putIfPresent(j, "format", image.format);
    putIfPresent(j, "orientation", image.orientation);
    putIfPresent(j, "datetime_original", image.datetime_original);
    putIfPresent(j, "camera_make", image.camera_make);
    putIfPresent(j, "camera_model", image.camera_model);
    putIfPresent(j, "gps_latitude", image.gps_latitude);
    putIfPresent(j, "gps_longitude", image.gps_longitude);
}

void from_json(const SidecarJson &j, ImageInfo &image)
{
    readOptional(j, "width", image.width);
    readOptional(j, "height", image.height);
    readOptional(j, "format", image.format);
    readOptional(j, "orientation", image.orientation);
    readOptional(j, "datetime_original", image.datetime_original);
    readOptional(j, "camera_make", image.camera_make);
    readOptional(j, "camera_model", image.camera_model);
    readOptional(j, "gps_latitude", image.gps_latitude);
    readOptional(j, "gps_longitude", image.gps_longitude);
}

void to_json(SidecarJson &j, const FaceDetection &face)
{
    j = SidecarJson{
        {"bbox", face.bbox},
        {"score", face.score}};
    putIfPresent(j, "embedding_hash", face.embedding_hash);
    putIfPresent(j, "person", face.person);
}

void from_json(const SidecarJson &j, FaceDetection &face)
{
    j.at("bbox").get_to(face.bbox);
    j.at("score").get_to(face.score);
    readOptional(j, "embedding_hash", face.embedding_hash);
    readOptional(j, "person", face.person);
}

void to_json(SidecarJson &j, const Tag &tag)
{
    j = SidecarJson{{"label", tag.label}};
    putIfPresent(j, "score", tag.score);
    j["source"] = tag.source;
}

void from_json(const SidecarJson &j, Tag &tag)
{
    j.at("label").get_to(tag.label);
    readOptional(j, "score", tag.score);
    j.at("source").get_to(tag.source);
}

void to_json(SidecarJson &j, const ThumbnailInfo &thumbnail)
{
    j = SidecarJson{
        {"path", thumbnail.path},
        {"size", thumbnail.size},
        {"format", thumbnail.format}};
}

void from_json(const SidecarJson &j, ThumbnailInfo &thumbnail)
{
    j.at("path").get_to(thumbnail.path);
    j.at("size").get_to(thumbnail.size);
    j.at("format").get_to(thumbnail.format);
}

void to_json(SidecarJson &j, const Sidecar &sidecar)
{
    j = SidecarJson{
        {"schema_version", sidecar.schema_version},
        {"producer_version", sidecar.producer_version},
        {"created_at", sidecar.created_at},
        {"updated_at", sidecar.updated_at},
        {"pipeline_signature", sidecar.pipeline_signature},
        {"source", sidecar.source}};
    putIfPresent(j, "image", sidecar.image);
    j["faces"] = sidecar.faces;
    j["tags"] = sidecar.tags;
    j["thumbnails"] = sidecar.thumbnails;
}

void from_json(const SidecarJson &j, Sidecar &sidecar)
{
    j.at("schema_version").get_to(sidecar.schema_version);
    j.at("producer_version").get_to(sidecar.producer_version);
    j.at("created_at").get_to(sidecar.created_at);
    j.at("updated_at").get_to(sidecar.updated_at);
    j.at("pipeline_signature").get_to(sidecar.pipeline_signature);
    j.at("source").get_to(sidecar.source);
    readOptional(j, "image", sidecar.image);
    readList(j, "faces", sidecar.faces);
    readList(j, "tags", sidecar.tags);
    readList(j, "thumbnails", sidecar.thumbnails);
}
