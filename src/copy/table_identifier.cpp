#include "copy/table_identifier.hpp"

#include <format>
#include <regex>

namespace gpcopy {

namespace {

// Each part optionally wrapped in a matching pair of double quotes
const std::regex& unqualified_pattern() {
    static const std::regex re(R"re(^("?)([0-9A-Za-z_]+)\1$)re");
    return re;
}

const std::regex& qualified_pattern() {
    static const std::regex re(R"re(^(("?)[0-9A-Za-z_]+\2)\.("?)([0-9A-Za-z_]+)\3$)re");
    return re;
}

std::string malformed_message(std::string_view text) {
    return std::format(
        "The table name '{}' is illegal. Set it with the table option as "
        "\"schemaName\".\"tableName\", schemaName.tableName or just tableName "
        "(which resolves against the default schema, usually public). Each part "
        "may contain only letters, digits and underscores.",
        text);
}

} // anonymous namespace

TableIdentifier TableIdentifier::parse(std::string_view text) {
    const std::string s(text);
    std::smatch m;

    if (std::regex_match(s, m, unqualified_pattern())) {
        return TableIdentifier{std::nullopt, m[2].str()};
    }
    if (std::regex_match(s, m, qualified_pattern())) {
        return TableIdentifier{m[1].str(), m[4].str()};
    }
    throw MalformedIdentifierError(malformed_message(text));
}

Result<TableIdentifier> TableIdentifier::try_parse(std::string_view text) {
    try {
        return Result<TableIdentifier>::ok(parse(text));
    } catch (const MalformedIdentifierError& e) {
        return Result<TableIdentifier>::error(e.category(), e.what());
    }
}

std::string unqualified_name(std::string_view table) {
    const size_t dot = table.rfind('.');
    if (dot == std::string_view::npos) {
        return std::string(table);
    }
    return std::string(table.substr(dot + 1));
}

} // namespace gpcopy
