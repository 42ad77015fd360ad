#pragma once


/*
    ------------------------------
    yamlsort loading and emitting options
    ------------------------------
    - `LoadOptions` tunes `yamlsort::load(...)`:
        * `max_depth`: maximum nesting of sequences/mappings, 0 = unlimited
    - `EmitOptions` tunes `yamlsort::serialize(...)`:
        * `quote_strings`: wrap every string scalar in double quotes, not
          only the ones a YAML reader would otherwise mistype

    Both are plain aggregates:
        yamlsort::serialize(v, { .quote_strings = true });
*/


#include <cstddef>

/// @defgroup YamlsortOptions Loading and Emitting Options
/// @ingroup Yamlsort

namespace yamlsort {

    /// @ingroup YamlsortOptions
    /// @brief Configuration for `load(...)`
    struct LoadOptions {
        std::size_t max_depth = 0; ///< Maximum nesting depth (0 = unlimited)
    };

    /// @ingroup YamlsortOptions
    /// @brief Configuration for `serialize(...)`
    ///
    /// @details
    /// Without `quote_strings` a string is quoted only when it is empty,
    /// spells a YAML 1.1 boolean (`yes`, `Off`, ...), or starts with a digit
    /// or a comma.
    struct EmitOptions {
        bool quote_strings = false; ///< Quote every string scalar
    };

} // namespace yamlsort
