#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// RESP2 values, as much of the protocol as the balance store speaks.
struct RespValue {
    enum class Type { SimpleString, Error, Integer, BulkString, Array, Null };

    Type type{Type::Null};
    std::string str;
    std::int64_t integer{0};
    std::vector<RespValue> elements;

    bool is_null() const { return type == Type::Null; }
    bool is_error() const { return type == Type::Error; }
};

// Encodes a command as an array of bulk strings.
std::string encode_command(const std::vector<std::string>& args);

// Parses one value starting at pos. Returns nullopt and leaves pos alone when
// buf does not yet hold a complete value; throws StoreError on malformed input.
std::optional<RespValue> parse_resp(const std::string& buf, std::size_t& pos);
