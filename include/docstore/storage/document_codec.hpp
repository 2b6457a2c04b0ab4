#pragma once

#include "docstore/catalog/document.hpp"
#include "docstore/catalog/value.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace docstore::storage {

// Persisted form: {"meta":…,"tables":…,"roles":…} with camelCase keys.
class DocumentCodec final {
public:
    static constexpr std::size_t kIndent = 2U;

    [[nodiscard]] static catalog::Value encode(const catalog::Document& document);
    [[nodiscard]] static std::string serialize(const catalog::Document& document);

    // Decoding errors are std::errc::invalid_argument; `message` names the
    // offending field when provided.
    [[nodiscard]] static std::error_code decode(const catalog::Value& value,
                                                catalog::Document& document,
                                                std::string* message = nullptr);
    [[nodiscard]] static std::error_code deserialize(std::string_view text,
                                                     catalog::Document& document,
                                                     std::string* message = nullptr);

    // Writes `<path>.tmp` and renames it over `path`.
    [[nodiscard]] static std::error_code write_file(const catalog::Document& document, const std::filesystem::path& path);
    // Only an absent file yields no_such_file_or_directory; an existing file
    // that cannot be read is io_error or is_a_directory.
    [[nodiscard]] static std::error_code read_file(const std::filesystem::path& path,
                                                   catalog::Document& document,
                                                   std::string* message = nullptr);
};

}  // namespace docstore::storage
