#pragma once


/*
    -------------------------------------------------------------
    yamlsort - Deterministic, diff-friendly YAML pretty-printer
    -------------------------------------------------------------

    This is the main public header for yamlsort.

    It brings together:
        - The YAML DOM type:            `yamlsort::value`
        - Error reporting types:        `yamlsort::LoadError`, `yamlsort::EmitError`
        - Loading functions:            `yamlsort::load(...)`
        - Sorted emission:              `yamlsort::serialize(...)`
        - The emitter's building blocks: `key_less`, `ordered_keys`,
                                        `classify`, `needs_quotes`,
                                        `format_scalar`
        - Multi-document helpers:       `split_documents`, `write_document`,
                                        `sort_documents`, `sort_to_file`

    -------------------
    High-Level Overview
    -------------------
    - Loading:
        * `std::expected<value, LoadError> load(std::string_view, const LoadOptions& = {})`
        * YAML text is parsed with yaml-cpp and reduced to the yamlsort DOM:
          null, boolean, integer, floating, string, sequence, mapping
    - Emitting:
        * `std::expected<std::string, EmitError> serialize(const value&, const EmitOptions& = {})`
        * Mapping keys are written in byte order, except that a key spelled
          exactly `name` always comes first
        * Strings a YAML reader would mistype are double-quoted
        * Empty mappings and sequences are written as `{}` and `[]`
        * Booleans are not part of the output model and fail emission

    -----
    Usage
    -----
        #include <yamlsort/yamlsort.hpp>

        int main() {
            auto doc = yamlsort::load("b: 2\na: 1\nname: x\n");
            if (!doc) return 1;
            auto out = yamlsort::serialize(*doc);
            if (!out) {
                std::println(stderr, "{}", out.error().msg);
                return 1;
            }
            std::print("{}", *out); // name: x / a: 1 / b: 2
        }
*/

/// @defgroup YamlsortAPI Top-level Loading and Emitting API
/// @ingroup Yamlsort

#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "yamlsort/config.hpp"
#include "yamlsort/document.hpp"
#include "yamlsort/error.hpp"
#include "yamlsort/options.hpp"
#include "yamlsort/value.hpp"

namespace yamlsort {

    /// @ingroup YamlsortAPI
    /// @brief Result of `load(...)`
    using LoadResult = std::expected<value, LoadError>;

    /// @ingroup YamlsortAPI
    /// @brief Result of the string-returning `serialize(...)`
    using EmitResult = std::expected<std::string, EmitError>;

    /// @ingroup YamlsortAPI
    /// @brief Loads a single YAML document
    ///
    /// @details
    /// Plain scalars are resolved with YAML 1.1 rules: `~`/`null` become null,
    /// `yes`/`On`/`FALSE`... become booleans, decimal and `0x` numbers become
    /// integers, decimal fractions and `.inf`/`.nan` become floating values.
    /// Quoted scalars always stay strings. An empty document loads as null.
    ///
    /// @param input YAML text holding one document
    /// @param opts Loader configuration
    [[nodiscard]] YAMLSORT_API LoadResult load(std::string_view input, const LoadOptions& opts = {});

    /// @ingroup YamlsortAPI
    /// @brief Reads @p is to the end and loads it as a single YAML document
    [[nodiscard]] YAMLSORT_API LoadResult load(std::istream& is, const LoadOptions& opts = {});

    /// @ingroup YamlsortAPI
    /// @brief Renders @p v as sorted YAML text
    ///
    /// @details
    /// Nothing is returned but the error when any node of @p v is of an
    /// unsupported kind; the rendering is all-or-nothing.
    ///
    /// Example:
    /// @code
    /// yamlsort::value v;
    /// v["b"] = "2";
    /// v["a"] = "1";
    /// v["name"] = "x";
    /// auto out = yamlsort::serialize(v);
    /// // *out == "name: x\na: \"1\"\nb: \"2\"\n"
    /// @endcode
    [[nodiscard]] YAMLSORT_API EmitResult serialize(const value& v, const EmitOptions& opts = {});

    /// @ingroup YamlsortAPI
    /// @brief Renders @p v as sorted YAML text directly into @p os
    ///
    /// @details
    /// Text is streamed as it is produced. On failure, whatever was written
    /// before the offending node stays in @p os; buffer on the caller side if
    /// the destination must not see partial documents.
    YAMLSORT_API std::expected<void, EmitError> serialize(const value& v, std::ostream& os, const EmitOptions& opts = {});

    // ------------------------------------------------------------
    // Emitter building blocks
    // ------------------------------------------------------------

    /// @ingroup YamlsortAPI
    /// @brief Key order used for every mapping: `name` first, then byte order
    [[nodiscard]] YAMLSORT_API bool key_less(std::string_view lhs, std::string_view rhs) noexcept;

    /// @ingroup YamlsortAPI
    /// @brief Returns the keys of @p m in emission order
    /// @details The views refer to the keys stored in @p m.
    [[nodiscard]] YAMLSORT_API std::vector<std::string_view> ordered_keys(const mapping& m);

    /// @ingroup YamlsortAPI
    /// @brief How a value is written after its mapping key
    enum class shape : uint8_t {
        omitted,        ///< `key:`             (null)
        block,          ///< `key:` + nested lines (non-empty mapping or sequence)
        empty_mapping,  ///< `key: {}`
        empty_sequence, ///< `key: []`
        inline_scalar,  ///< `key: <scalar>`    (string, integer, floating)
        unsupported,    ///< anything else; fails emission
    };

    /// @ingroup YamlsortAPI
    /// @brief Chooses the textual shape for @p v
    [[nodiscard]] YAMLSORT_API shape classify(const value& v) noexcept;

    /// @ingroup YamlsortAPI
    /// @brief Whether string scalar @p s must be written in double quotes
    ///
    /// @details
    /// True when `opts.quote_strings` is set, when @p s is empty, when it
    /// equals `true`, `false`, `yes`, `no`, `on` or `off` ignoring case, or
    /// when it starts with a digit or a comma.
    [[nodiscard]] YAMLSORT_API bool needs_quotes(std::string_view s, const EmitOptions& opts = {}) noexcept;

    /// @ingroup YamlsortAPI
    /// @brief Renders a scalar value exactly as the emitter writes it
    /// @throws std::invalid_argument If `v.is_scalar()` is false
    [[nodiscard]] YAMLSORT_API std::string format_scalar(const value& v, const EmitOptions& opts = {});

} // namespace yamlsort
