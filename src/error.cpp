#include "yamlsort/error.hpp"
#include "yamlsort/yamlsort.hpp"


namespace yamlsort {

    LoadError LoadError::make(code c, std::size_t o, std::size_t l, std::size_t col, std::string_view m) {
        LoadError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    DocumentError DocumentError::make(code c, std::size_t doc, std::string_view m) {
        DocumentError e;
        e.errc = c;
        e.document = doc;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    namespace {

        // Content of the offending node for diagnostics. Containers are
        // summarized by size rather than dumped.
        std::string describe(const value& v) {
            switch (v.type()) {
            case kind::null: return "null";
            case kind::boolean: return v.as_bool() ? "true" : "false";
            case kind::sequence: return "sequence of " + std::to_string(v.size());
            case kind::mapping: return "mapping of " + std::to_string(v.size());
            case kind::integer:
            case kind::floating:
            case kind::string:
                return format_scalar(v);
            }
            return {};
        }

    } // namespace

    EmitError EmitError::unsupported(const value& v, std::string_view path) {
        EmitError e;
        e.errc = code::unsupported_kind;
        e.offending = v.type();
        e.path.assign(path.begin(), path.end());
        e.msg = "unsupported value kind: ";
        e.msg += to_string(e.offending);
        e.msg += "  data: ";
        e.msg += describe(v);
        if (!e.path.empty()) {
            e.msg += "  at: ";
            e.msg += e.path;
        }
        return e;
    }

} // namespace yamlsort
