#pragma once


/*
    ------------------------------------------------------------
    yamlsort::LoadError / yamlsort::EmitError - Failure reporting
    ------------------------------------------------------------
    Both halves of the pipeline report failures as plain structs returned
    through `std::expected`, never by throwing:

    - `LoadError` is produced while turning YAML text into a `value`
      (see `load(...)`). It carries the byte offset and 1-based line/column
      reported by the YAML parser when one is available.
    - `EmitError` is produced while rendering a `value` as sorted YAML
      (see `serialize(...)`). It names the offending node kind, the node's
      content and the key path leading to it, e.g. `spec.ports[0].enabled`.
    - `DocumentError` wraps either of the above, or an I/O failure, with
      the index of the document being processed (see `sort_documents(...)`).

    `msg` is meant for humans and log output; match on `errc` instead.
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "yamlsort/config.hpp"
#include "yamlsort/value.hpp"


/// @defgroup YamlsortError Errors
/// @ingroup Yamlsort
/// @brief Error structures produced by the loader and the emitter
namespace yamlsort {

    /// @ingroup YamlsortError
    /// @brief Failure while loading YAML text into a `value`
    struct LoadError {
        /// @brief Error categories reported by `load(...)`
        ///
        /// - `syntax_error`
        ///     The YAML parser rejected the input (bad indentation, unclosed
        ///     flow collection, unknown alias, ...).
        /// - `unsupported_key`
        ///     A mapping key is itself a sequence or a mapping.
        /// - `depth_limit_exceeded`
        ///     Nesting went deeper than `LoadOptions::max_depth`.
        enum class code : uint8_t {
            syntax_error,
            unsupported_key,
            depth_limit_exceeded,
        };

        code errc{};
        std::size_t offset{}; ///< Byte offset into the document (0 when unknown)
        std::size_t line{};   ///< 1-based line, 0 when unknown
        std::size_t column{}; ///< 1-based column, 0 when unknown
        std::string msg{};

        /// @brief Builds a fully populated `LoadError`
        YAMLSORT_API static LoadError make(code c, std::size_t o, std::size_t l, std::size_t col, std::string_view m);
    };

    /// @ingroup YamlsortError
    /// @brief Failure while rendering a `value`
    ///
    /// @details
    /// Emission stops at the first node the emitter cannot render; the whole
    /// document is considered failed.
    struct EmitError {
        enum class code : uint8_t {
            unsupported_kind, ///< Node kind outside {null, mapping, sequence, string, integer, floating}
        };

        code errc{};
        kind offending{};  ///< Kind of the node that could not be rendered
        std::string path{}; ///< Key path of the node, empty for the document root
        std::string msg{};

        /// @brief Builds an `unsupported_kind` error for node @p v found at @p path
        YAMLSORT_API static EmitError unsupported(const value& v, std::string_view path);
    };

    /// @ingroup YamlsortError
    /// @brief Failure while sorting a multi-document stream
    struct DocumentError {
        enum class code : uint8_t {
            load_failed, ///< A document did not load; `msg` carries the position
            emit_failed, ///< A document loaded but could not be rendered
            io_failed,   ///< The destination could not be opened or written
        };

        code errc{};
        std::size_t document{}; ///< 1-based index of the failing document, 0 when not tied to one
        std::string msg{};

        YAMLSORT_API static DocumentError make(code c, std::size_t doc, std::string_view m);
    };

} // namespace yamlsort
