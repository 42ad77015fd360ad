#include "yamlsort/document.hpp"
#include "yamlsort/yamlsort.hpp"

#include <format>
#include <fstream>
#include <ostream>
#include <sstream>
#include <system_error>


namespace yamlsort {

    std::vector<std::string> split_documents(std::string_view text) {
        std::vector<std::string> docs;
        std::string current;

        size_t pos = 0;
        while (pos < text.size()) {
            size_t eol = text.find('\n', pos);
            size_t next = eol == std::string_view::npos ? text.size() : eol + 1;
            std::string_view line = text.substr(pos, (eol == std::string_view::npos ? text.size() : eol) - pos);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            pos = next;

            if (line == document_separator) {
                if (!current.empty()) docs.push_back(std::move(current));
                current.clear();
                continue;
            }
            current.append(line);
            current.push_back('\n');
        }
        if (!current.empty()) docs.push_back(std::move(current));
        return docs;
    }

    void write_document(std::ostream& os, std::string_view body) {
        os << document_separator << '\n'
           << document_comment << '\n'
           << body << '\n';
    }

    SortResult sort_documents(std::string_view input, std::ostream& os,
                              const LoadOptions& load_opts, const EmitOptions& emit_opts) {
        auto docs = split_documents(input);

        for (std::size_t i = 0; i < docs.size(); i++) {
            std::size_t n = i + 1;

            auto doc = load(docs[i], load_opts);
            if (!doc) {
                const auto& err = doc.error();
                return std::unexpected(DocumentError::make(DocumentError::code::load_failed, n,
                    std::format("line {}, column {}: {}", err.line, err.column, err.msg)));
            }

            auto body = serialize(*doc, emit_opts);
            if (!body) return std::unexpected(DocumentError::make(DocumentError::code::emit_failed, n, body.error().msg));

            write_document(os, *body);
            os.flush();
            if (!os) return std::unexpected(DocumentError::make(DocumentError::code::io_failed, n, "write failed"));
        }
        return docs.size();
    }

    SortResult sort_to_file(std::string_view input, const std::filesystem::path& output, bool buffered,
                            const LoadOptions& load_opts, const EmitOptions& emit_opts) {
        if (!buffered) {
            std::ofstream ofs(output, std::ios::binary | std::ios::trunc);
            if (!ofs) return std::unexpected(DocumentError::make(DocumentError::code::io_failed, 0, "cannot open output file: " + output.string()));
            return sort_documents(input, ofs, load_opts, emit_opts);
        }

        std::ostringstream buffer;
        auto r = sort_documents(input, buffer, load_opts, emit_opts);
        if (!r) return r;

        std::ofstream ofs(output, std::ios::binary | std::ios::trunc);
        if (!ofs) return std::unexpected(DocumentError::make(DocumentError::code::io_failed, 0, "cannot open output file: " + output.string()));
        ofs << buffer.view();
        ofs.flush();
        if (!ofs) return std::unexpected(DocumentError::make(DocumentError::code::io_failed, 0, "failed to write output file: " + output.string()));
        return r;
    }

    bool same_file(const std::filesystem::path& a, const std::filesystem::path& b) noexcept {
        if (a.empty() || b.empty()) return false;
        std::error_code ec;
        return std::filesystem::equivalent(a, b, ec);
    }

} // namespace yamlsort
