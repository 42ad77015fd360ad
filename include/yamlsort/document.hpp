#pragma once


/*
    -------------------------------------------
    yamlsort multi-document stream helpers
    -------------------------------------------
    Input files may hold several documents separated by a line that is
    exactly `---`. `split_documents` cuts such a stream into one text per
    document; `write_document` frames a rendered document for output:

        ---
        # yamlsort output
        <rendered document>
        <blank line>

    `sort_documents` runs the whole pipeline (split, load, serialize,
    frame) into a stream, flushing after every document. `sort_to_file`
    targets a file; in buffered mode the file is only touched once every
    document rendered, which is what rewriting a file in place needs.
*/

#include <cstddef>
#include <expected>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "yamlsort/config.hpp"
#include "yamlsort/error.hpp"
#include "yamlsort/options.hpp"

namespace yamlsort {

    /// @brief Separator line between documents
    inline constexpr std::string_view document_separator = "---";

    /// @brief Comment written after every separator in the output
    inline constexpr std::string_view document_comment = "# yamlsort output";

    /// @brief Splits a multi-document stream on lines equal to `---`
    ///
    /// @details
    /// Each returned text is the sequence of lines between separators, every
    /// line terminated by `\n`. A trailing `\r` is dropped from each line.
    /// Segments with no lines at all (leading separator, two separators in a
    /// row) are skipped; a segment made of blank lines is kept.
    [[nodiscard]] YAMLSORT_API std::vector<std::string> split_documents(std::string_view text);

    /// @brief Writes the separator, the output comment, @p body and a blank line
    YAMLSORT_API void write_document(std::ostream& os, std::string_view body);

    /// @brief Result of the stream sorters: number of documents written
    using SortResult = std::expected<std::size_t, DocumentError>;

    /// @brief Sorts every document of @p input into @p os
    ///
    /// @details
    /// Documents are written and flushed one at a time. Processing stops at
    /// the first failing document; the documents before it stay written.
    [[nodiscard]] YAMLSORT_API SortResult sort_documents(std::string_view input, std::ostream& os,
                                                         const LoadOptions& load_opts = {},
                                                         const EmitOptions& emit_opts = {});

    /// @brief Sorts every document of @p input into the file at @p output
    ///
    /// @param buffered When true the whole output is rendered in memory first
    ///                 and @p output is left untouched if any document fails.
    [[nodiscard]] YAMLSORT_API SortResult sort_to_file(std::string_view input, const std::filesystem::path& output,
                                                       bool buffered,
                                                       const LoadOptions& load_opts = {},
                                                       const EmitOptions& emit_opts = {});

    /// @brief Whether @p a and @p b name the same existing file
    [[nodiscard]] YAMLSORT_API bool same_file(const std::filesystem::path& a, const std::filesystem::path& b) noexcept;

} // namespace yamlsort
