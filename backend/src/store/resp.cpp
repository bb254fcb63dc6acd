#include "store/resp.hpp"

#include <charconv>

#include "store/shared_store.hpp"

namespace {
    std::optional<std::string> read_line(const std::string& buf, std::size_t& pos) {
        const auto end = buf.find("\r\n", pos);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        std::string line = buf.substr(pos, end - pos);
        pos = end + 2;
        return line;
    }

    std::int64_t to_int(const std::string& s) {
        std::int64_t v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc() || ptr != s.data() + s.size()) {
            throw StoreError("resp: bad integer '" + s + "'");
        }
        return v;
    }
}

std::string encode_command(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n";
        out += a;
        out += "\r\n";
    }
    return out;
}

std::optional<RespValue> parse_resp(const std::string& buf, std::size_t& pos) {
    if (pos >= buf.size()) {
        return std::nullopt;
    }
    std::size_t cur = pos;
    const char tag = buf[cur++];
    auto line = read_line(buf, cur);
    if (!line) {
        return std::nullopt;
    }

    RespValue v;
    switch (tag) {
        case '+':
            v.type = RespValue::Type::SimpleString;
            v.str = *line;
            break;
        case '-':
            v.type = RespValue::Type::Error;
            v.str = *line;
            break;
        case ':':
            v.type = RespValue::Type::Integer;
            v.integer = to_int(*line);
            break;
        case '$': {
            const std::int64_t len = to_int(*line);
            if (len < 0) {
                v.type = RespValue::Type::Null;
                break;
            }
            const auto need = static_cast<std::size_t>(len);
            if (buf.size() < cur + need + 2) {
                return std::nullopt;
            }
            v.type = RespValue::Type::BulkString;
            v.str = buf.substr(cur, need);
            cur += need + 2;
            break;
        }
        case '*': {
            const std::int64_t count = to_int(*line);
            if (count < 0) {
                v.type = RespValue::Type::Null;
                break;
            }
            v.type = RespValue::Type::Array;
            for (std::int64_t i = 0; i < count; ++i) {
                auto item = parse_resp(buf, cur);
                if (!item) {
                    return std::nullopt;
                }
                v.elements.push_back(std::move(*item));
            }
            break;
        }
        default:
            throw StoreError(std::string("resp: unexpected type byte '") + tag + "'");
    }
    pos = cur;
    return v;
}
