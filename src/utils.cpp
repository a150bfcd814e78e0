#include <wolgate/utils.hpp>

#include <cctype>

#include <spdlog/fmt/fmt.h>

static std::string_view trim_front(std::string_view s) noexcept {
    size_t pos = 0;
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    return s.substr(pos);
}

static std::string_view trim_back(std::string_view s) noexcept {
    size_t pos = s.size();
    while (pos > 0 && std::isspace(static_cast<unsigned char>(s[pos-1]))) {
        --pos;
    }
    return s.substr(0, pos);
}

std::string_view trim(std::string_view s) noexcept {
    return trim_back(trim_front(s));
}

std::vector<std::string_view> split_all(std::string_view s, char c) {
    std::vector<std::string_view> ret;
    for (;;) {
        auto pos = s.find_first_of(c);
        if (pos == std::string_view::npos) {
            ret.push_back(s);
            return ret;
        }
        ret.push_back(s.substr(0, pos));
        s = s.substr(pos + 1);
    }
}

std::string escape(std::string_view s) {
    std::string ret;
    ret.reserve(s.size());
    for (auto c : s) {
        switch (c) {
            case '\n':
                ret += "\\n";
                break;
            case '\r':
                ret += "\\r";
                break;
            case '\t':
                ret += "\\t";
                break;
            case '\\':
                ret += "\\\\";
                break;
            case '\'':
                ret += "\\'";
                break;
            case '"':
                ret += "\\\"";
                break;
            default:
                if (c < 0x20 || c > 0x7e) {
                    ret += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
                } else {
                    ret.push_back(c);
                }
                break;
        }
    }
    return ret;
}
