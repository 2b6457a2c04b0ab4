#include "docstore/catalog/catalog_errors.hpp"

namespace docstore::catalog {

namespace {

class CatalogErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "docstore.catalog";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<CatalogErrc>(condition)) {
        case CatalogErrc::Success:
            return "success";
        case CatalogErrc::SchemaError:
            return "invalid or conflicting schema definition";
        case CatalogErrc::ConflictError:
            return "object already exists";
        case CatalogErrc::NotFoundError:
            return "referenced object not found";
        case CatalogErrc::PrivilegeError:
            return "insufficient privilege";
        case CatalogErrc::ValidationError:
            return "row data violates column constraints";
        case CatalogErrc::PersistenceFailed:
            return "document persistence failed";
        case CatalogErrc::ExecutionFailed:
            return "operation execution failed";
        default:
            return "unknown catalog error";
        }
    }
};

const CatalogErrorCategory kCategory{};

}  // namespace

const std::error_category& catalog_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(CatalogErrc value) noexcept
{
    return {static_cast<int>(value), catalog_error_category()};
}

const char* error_kind_name(std::error_code error) noexcept
{
    if (!error) {
        return "Success";
    }
    if (error.category() != catalog_error_category()) {
        return "SystemError";
    }

    switch (static_cast<CatalogErrc>(error.value())) {
    case CatalogErrc::Success:
        return "Success";
    case CatalogErrc::SchemaError:
        return "SchemaError";
    case CatalogErrc::ConflictError:
        return "ConflictError";
    case CatalogErrc::NotFoundError:
        return "NotFoundError";
    case CatalogErrc::PrivilegeError:
        return "PrivilegeError";
    case CatalogErrc::ValidationError:
        return "ValidationError";
    case CatalogErrc::PersistenceFailed:
        return "PersistenceFailed";
    case CatalogErrc::ExecutionFailed:
    default:
        return "ExecutionFailed";
    }
}

}  // namespace docstore::catalog
