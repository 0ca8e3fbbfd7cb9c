#include "cbudget/scope.h"

#include "enuminfo.h"
#include "infra/exception.h"
#include "infra/string.h"

#include <array>

namespace cbudget {

using namespace inf;

static const std::array<MultiEnumInfo<Scope>, 5> s_scopes = {
    MultiEnumInfo<Scope>{Scope::S1, {"S1"}, "Direct emissions"},
    MultiEnumInfo<Scope>{Scope::S2, {"S2"}, "Indirect emissions from purchased energy"},
    MultiEnumInfo<Scope>{Scope::S1S2, {"S1S2", "S1+S2"}, "Direct and energy indirect emissions"},
    MultiEnumInfo<Scope>{Scope::S3, {"S3"}, "Other indirect emissions of the value chain"},
    MultiEnumInfo<Scope>{Scope::S1S2S3, {"S1S2S3", "S1+S2+S3"}, "All emission scopes"},
};

std::string_view scope_name(Scope scope) noexcept
{
    for (const auto& info : s_scopes) {
        if (info.id == scope) {
            return info.serialized_name();
        }
    }

    return "";
}

std::optional<Scope> try_scope_from_string(std::string_view str) noexcept
{
    auto trimmed = str::trimmed_view(str);
    for (const auto& info : s_scopes) {
        if (info.is_serialized_name(trimmed)) {
            return info.id;
        }
    }

    return {};
}

Scope scope_from_string(std::string_view str)
{
    if (auto scope = try_scope_from_string(str); scope.has_value()) {
        return *scope;
    }

    throw RuntimeError("Invalid scope: '{}' (expected one of S1, S2, S1S2, S3, S1S2S3)", str);
}

}
