/**
 * @file journal_field.hpp
 * @brief Encoding and decoding of journal native protocol fields
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A record sent to the journal is a sequence of fields. sjournal always emits
 * the binary-safe form:
 *
 *   NAME '\n' <uint64 little-endian length of value> <value bytes> '\n'
 *
 * The decoder additionally accepts the simple text form NAME=value '\n',
 * which the journal daemon also understands.
 */
#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sjournal
{

/**
 * @brief A decoded name/value pair
 */
struct journal_field
{
    std::string name;
    std::string value;

    bool operator==(const journal_field &) const = default;
};

/**
 * @brief Exact number of bytes encode_field() produces for a pair
 */
inline constexpr size_t encoded_field_size(std::string_view name, std::string_view value) noexcept
{
    return name.size() + value.size() + sizeof(uint64_t) + 2;
}

/**
 * @brief Append one binary-form field to @p out
 *
 * @p name must not contain a newline. This is not checked; a bad name makes
 * the whole record unparseable for the daemon.
 */
inline void append_field(std::string &out, std::string_view name, std::string_view value)
{
    uint64_t len = value.size();
    char sz[sizeof(uint64_t)];
    for (size_t i = 0; i < sizeof(sz); ++i) { sz[i] = static_cast<char>((len >> (8 * i)) & 0xff); }

    out.append(name);
    out.push_back('\n');
    out.append(sz, sizeof(sz));
    out.append(value);
    out.push_back('\n');
}

/**
 * @brief Encode a single field
 */
inline std::string encode_field(std::string_view name, std::string_view value)
{
    std::string out;
    out.reserve(encoded_field_size(name, value));
    append_field(out, name, value);
    return out;
}

namespace detail
{

inline uint64_t read_le64(const char *p) noexcept
{
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(uint64_t); ++i) { v |= static_cast<uint64_t>(static_cast<unsigned char>(p[i])) << (8 * i); }
    return v;
}

} // namespace detail

/**
 * @brief Parse an encoded record back into its fields
 * @param record The datagram payload
 * @return Fields in wire order, or std::nullopt if the record is malformed
 *
 * Accepts both the binary and the NAME=value forms. Malformed means a
 * truncated length or value, a missing trailing newline after a binary
 * value, or a final line without a terminating newline.
 */
inline std::optional<std::vector<journal_field>> decode_record(std::string_view record)
{
    std::vector<journal_field> fields;
    size_t pos = 0;

    while (pos < record.size())
    {
        size_t nl = record.find('\n', pos);
        if (nl == std::string_view::npos) return std::nullopt;

        std::string_view line = record.substr(pos, nl - pos);
        size_t eq             = line.find('=');

        if (eq != std::string_view::npos)
        {
            // NAME=value form
            fields.push_back({std::string(line.substr(0, eq)), std::string(line.substr(eq + 1))});
            pos = nl + 1;
            continue;
        }

        // Binary form: the line is the name, followed by the length and the value
        pos = nl + 1;
        if (record.size() - pos < sizeof(uint64_t)) return std::nullopt;

        uint64_t len = detail::read_le64(record.data() + pos);
        pos += sizeof(uint64_t);

        if (len > record.size() - pos || record.size() - pos - len < 1) return std::nullopt;

        std::string_view value = record.substr(pos, static_cast<size_t>(len));
        pos += static_cast<size_t>(len);
        if (record[pos] != '\n') return std::nullopt;
        pos++;

        fields.push_back({std::string(line), std::string(value)});
    }

    return fields;
}

/**
 * @brief First value stored under @p name, if any
 */
inline std::optional<std::string> find_field(const std::vector<journal_field> &fields, std::string_view name)
{
    for (const auto &f : fields)
    {
        if (f.name == name) return f.value;
    }
    return std::nullopt;
}

/**
 * @brief Number of fields stored under @p name
 */
inline size_t count_field(const std::vector<journal_field> &fields, std::string_view name)
{
    size_t n = 0;
    for (const auto &f : fields)
    {
        if (f.name == name) n++;
    }
    return n;
}

} // namespace sjournal
