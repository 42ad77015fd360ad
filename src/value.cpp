#include "yamlsort/value.hpp"

#include <memory>
#include <stdexcept>


namespace yamlsort {

    std::string_view to_string(kind k) noexcept {
        switch (k) {
        case kind::null: return "null";
        case kind::boolean: return "boolean";
        case kind::integer: return "integer";
        case kind::floating: return "floating";
        case kind::string: return "string";
        case kind::sequence: return "sequence";
        case kind::mapping: return "mapping";
        }
        return "unknown";
    }

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ d } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ s, res } } {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ sv.begin(), sv.end(), res } } {}

    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(s) } {}

    value::value(sequence a, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(a) } {}

    value::value(mapping m, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(m) } {}

    value::value(const value& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = clone_storage(other.m_Storage, other.m_MemRes);
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(other.m_Storage);
        return *this;
    }

    kind value::type() const noexcept {
        switch (m_Storage.index()) {
        case 0: return kind::null;
        case 1: return kind::boolean;
        case 2: return kind::integer;
        case 3: return kind::floating;
        case 4: return kind::string;
        case 5: return kind::sequence;
        case 6: return kind::mapping;
        }
        return kind::null;
    }

    bool& value::as_bool() { return std::get<bool>(m_Storage); }
    const bool& value::as_bool() const { return std::get<bool>(m_Storage); }
    std::int64_t& value::as_integer() { return std::get<std::int64_t>(m_Storage); }
    const std::int64_t& value::as_integer() const { return std::get<std::int64_t>(m_Storage); }
    double& value::as_floating() { return std::get<double>(m_Storage); }
    const double& value::as_floating() const { return std::get<double>(m_Storage); }
    string& value::as_string() { return std::get<string>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }
    sequence& value::as_sequence() { if (!is_sequence()) m_Storage = sequence{ allocator_type(m_MemRes) }; return std::get<sequence>(m_Storage); }
    const sequence& value::as_sequence() const { return std::get<sequence>(m_Storage); }
    mapping& value::as_mapping() { if (!is_mapping()) m_Storage = mapping{ allocator_type(m_MemRes) }; return std::get<mapping>(m_Storage); }
    const mapping& value::as_mapping() const { return std::get<mapping>(m_Storage); }

    std::size_t value::size() const noexcept {
        if (is_sequence()) return as_sequence().size();
        if (is_mapping()) return as_mapping().size();
        return 0;
    }

    value& value::operator[](std::size_t idx) {
        auto& seq = as_sequence();
        if (idx >= seq.size()) {
            seq.resize(idx + 1, value{ m_MemRes });
        }
        return seq[idx];
    }

    const value& value::operator[](std::size_t idx) const {
        static const value null_sentinel{};
        if (!is_sequence()) return null_sentinel;
        const auto& seq = as_sequence();
        if (idx >= seq.size()) return null_sentinel;
        return seq[idx];
    }

    value& value::operator[](std::string_view key) {
        auto& m = as_mapping();
        auto it = m.find(key);
        if (it == m.end()) {
            it = m.emplace(string{ key.begin(), key.end(), m_MemRes }, value{ m_MemRes }).first;
        }
        return it->second;
    }

    const value* value::find(std::string_view key) const {
        if (!is_mapping()) return nullptr;
        const auto& m = as_mapping();
        auto it = m.find(key);
        if (it == m.end()) return nullptr;
        return std::addressof(it->second);
    }

    const value& value::at(std::string_view key) const {
        if (auto* v = find(key)) return *v;
        throw std::out_of_range{ "yamlsort::value::at: key not found" };
    }

    bool operator==(const value& lhs, const value& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        switch (s.index()) {
        case 0: return std::monostate{};
        case 1: return std::get<bool>(s);
        case 2: return std::get<std::int64_t>(s);
        case 3: return std::get<double>(s);
        case 4: {
            const auto& str = std::get<string>(s);
            return string{ str, res };
        }
        case 5: {
            const auto& seq = std::get<sequence>(s);
            sequence copy(allocator_type{ res });
            copy.reserve(seq.size());
            for (const auto& v : seq) copy.emplace_back(v);
            return copy;
        }
        case 6: {
            const auto& m = std::get<mapping>(s);
            mapping copy{ std::less<>{}, res };
            for (const auto& [k, v] : m) copy.emplace(string{ k, res }, value{ v });
            return copy;
        }
        }
        return std::monostate{};
    }

} // namespace yamlsort
