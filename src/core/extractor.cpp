/**
 * LSV Inspector - Extraction facade implementation
 */

#include "lsv/extractor.hpp"
#include "lsv/logging.hpp"
#include "lsv/text_utils.hpp"
#include "lsv/value_decoder.hpp"

namespace lsv {

namespace {

std::string join_path(const std::vector<std::string>& path) {
    std::string joined;
    for (const auto& segment : path) {
        if (!joined.empty()) joined += '/';
        joined += segment;
    }
    return joined;
}

} // anonymous namespace

Result<ResourceDocument> extract_document(std::span<const uint8_t> package_bytes, const std::string& member_name) {
    return extract_document(make_shared_bytes(std::vector<uint8_t>(package_bytes.begin(), package_bytes.end())),
                            member_name);
}

Result<ResourceDocument> extract_document(SharedBytes package_bytes, const std::string& member_name) {
    auto package = PackageReader::open(std::move(package_bytes));
    if (!package) {
        return package.error();
    }
    return extract_document(*package, member_name);
}

Result<ResourceDocument> extract_document(const Package& package, const std::string& member_name) {
    auto bytes = PackageReader::read_member(package, member_name);
    if (!bytes) {
        LSV_LOG_ERROR("Extractor", "Cannot read member " << member_name << ": " << bytes.error().full_message());
        return bytes.error();
    }

    auto document = LsfReader::read(*bytes);
    if (!document) {
        return Error(document.code(), document.error().message, member_name);
    }

    LSV_LOG_INFO("Extractor", "Extracted " << member_name << " (" << bytes->size() << " bytes)");
    return document;
}

Result<Attribute> find_attribute(const ResourceDocument& document,
                                 const std::vector<std::string>& path,
                                 std::string_view attribute_name) {
    if (path.empty()) {
        return Error::invalid_argument("Empty node path");
    }

    size_t node = document.find_region(path[0]);
    if (node == npos) {
        LSV_LOG_DEBUG("Extractor", "No region named " << path[0]);
        return Error::not_found("Region", path[0]);
    }

    for (size_t i = 1; i < path.size(); ++i) {
        size_t child = document.find_child(node, path[i]);
        if (child == npos) {
            std::vector<std::string> walked(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(i) + 1);
            LSV_LOG_DEBUG("Extractor", "No node at " << join_path(walked));
            return Error::not_found("Node", join_path(walked));
        }
        node = child;
    }

    size_t attribute = document.find_attribute(node, attribute_name);
    if (attribute == npos) {
        return Error::not_found("Attribute", join_path(path) + "/" + std::string(attribute_name));
    }
    return document.attributes()[attribute];
}

Result<Value> value_at(const ResourceDocument& document,
                       const std::vector<std::string>& path,
                       std::string_view attribute_name) {
    LSV_TRY_ASSIGN(attribute, find_attribute(document, path, attribute_name));
    return decode_value(document, attribute);
}

Result<Blob> blob_at(const ResourceDocument& document,
                     const std::vector<std::string>& path,
                     std::string_view attribute_name) {
    LSV_TRY_ASSIGN(attribute, find_attribute(document, path, attribute_name));
    if (attribute.type != DataType::ScratchBuffer) {
        return Error::type_mismatch(std::string("Attribute is ") + data_type_string(attribute.type) +
                                    ", not ScratchBuffer", join_path(path) + "/" + std::string(attribute_name));
    }

    LSV_TRY_ASSIGN(value, decode_value(document, attribute));
    const Blob* blob = value.get_if<Blob>();
    if (!blob) {
        return Error::type_mismatch("Decoded value is not a blob");
    }
    return *blob;
}

Result<ResourceDocument> load_globals(const Package& package) {
    const FileEntry* entry = package.find_entry_nocase(GLOBALS_MEMBER);
    if (!entry) {
        LSV_LOG_ERROR("Extractor", "Package has no " << GLOBALS_MEMBER);
        return Error::not_found("Package member", GLOBALS_MEMBER);
    }
    return extract_document(package, entry->name);
}

Result<std::vector<NamedDocument>> load_all_resources(const Package& package) {
    std::vector<NamedDocument> documents;

    for (const auto& entry : package.entries()) {
        if (!path_ends_with(entry.name, ".lsf")) {
            continue;
        }
        LSV_TRY_ASSIGN(document, extract_document(package, entry.name));
        documents.push_back(NamedDocument{entry.name, std::move(document)});
    }

    LSV_LOG_INFO("Extractor", "Loaded " << documents.size() << " resource(s)");
    return documents;
}

std::vector<std::string> split_node_path(std::string_view path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.emplace_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

} // namespace lsv
