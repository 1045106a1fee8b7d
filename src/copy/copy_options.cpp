#include "copy/copy_options.hpp"
#include "copy/row_encoder.hpp"
#include "copy/table_identifier.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace gpcopy {

bool is_valid_delimiter(char delimiter) {
    const auto c = static_cast<unsigned char>(delimiter);
    if (c == 0 || c >= 0x80) return false;
    if (delimiter == '\\' || delimiter == '\n' || delimiter == '\r' || delimiter == '.') {
        return false;
    }
    if (std::islower(c) || std::isdigit(c)) return false;
    // The server rejects a delimiter that appears in the NULL string
    return kNullToken.find(delimiter) == std::string_view::npos;
}

std::vector<std::string> validate_copy_options(const CopyOptions& options) {
    std::vector<std::string> errors;

    if (options.table.empty()) {
        errors.emplace_back("table must not be empty");
    } else {
        const auto parsed = TableIdentifier::try_parse(options.table);
        if (parsed.is_error()) {
            errors.push_back(parsed.error_message());
        }
    }

    if (!options.connection_factory) {
        errors.emplace_back("connection factory must be set");
    }

    if (!is_valid_delimiter(options.delimiter)) {
        errors.push_back(std::format(
            "delimiter 0x{:02x} is not allowed: it must be a single ASCII character other "
            "than backslash, newline, carriage return, '.', a lowercase letter, a digit "
            "or a character of '{}'",
            static_cast<unsigned>(static_cast<unsigned char>(options.delimiter)), kNullToken));
    }

    if (options.copy_timeout <= std::chrono::milliseconds::zero()) {
        errors.emplace_back("copy_timeout must be > 0");
    } else if (options.copy_timeout > kMaxCopyTimeout) {
        errors.push_back(std::format("copy_timeout must be at most {}h",
            std::chrono::duration_cast<std::chrono::hours>(kMaxCopyTimeout).count()));
    }

    return errors;
}

std::filesystem::path resolve_local_dir(const CopyOptions& options) {
    if (!options.local_dir.empty()) {
        return options.local_dir;
    }
    return std::filesystem::temp_directory_path() / "gpcopy";
}

std::unique_ptr<IDbConnection> open_connection(const CopyOptions& options) {
    if (!options.connection_factory) {
        throw ConnectionError("No connection factory configured");
    }
    auto conn = options.connection_factory->create(options.connection_string);
    if (!conn) {
        throw ConnectionError("Failed to open a database connection");
    }
    return conn;
}

void close_connection_silently(IDbConnection* conn) noexcept {
    if (!conn) return;
    try {
        conn->close();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Exception occurred when closing connection: {}", e.what()));
    }
}

} // namespace gpcopy
