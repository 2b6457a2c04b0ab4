#pragma once

#include <system_error>

namespace docstore::catalog {

enum class CatalogErrc {
    Success = 0,
    SchemaError,
    ConflictError,
    NotFoundError,
    PrivilegeError,
    ValidationError,
    PersistenceFailed,
    ExecutionFailed
};

const std::error_category& catalog_error_category() noexcept;
std::error_code make_error_code(CatalogErrc value) noexcept;

// Short kind name used in result details ("SchemaError", "NotFoundError", ...).
const char* error_kind_name(std::error_code error) noexcept;

}  // namespace docstore::catalog

namespace std {

template <>
struct is_error_code_enum<docstore::catalog::CatalogErrc> : true_type {
};

}  // namespace std
