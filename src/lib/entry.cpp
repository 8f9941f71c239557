#include <array>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include "entry.hpp"

namespace {

constexpr std::string_view kHeaderKey = "last_id ";
constexpr std::size_t kFieldCount = 4;

void append_escaped(std::string& out, std::string_view field) {
    for (char c : field) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\t': out += "\\t"; break;
        case '\n': out += "\\n"; break;
        default:   out += c;
        }
    }
}

std::optional<std::string> unescape(std::string_view field) {
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] != '\\') {
            out += field[i];
            continue;
        }
        if (++i == field.size()) return std::nullopt; // dangling backslash
        switch (field[i]) {
        case '\\': out += '\\'; break;
        case 't':  out += '\t'; break;
        case 'n':  out += '\n'; break;
        default:   return std::nullopt;
        }
    }
    return out;
}

std::optional<int> parse_int(std::string_view s) {
    int value = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

} // namespace

std::ostream& operator<<(std::ostream& os, const Entry& e) {
    return os << e.id << ' ' << e.name << ' ' << e.surname << ' ' << e.phone_number;
}

std::string serialize_payload(const EntrySnapshot& snapshot) {
    std::string out;
    out.append(kHeaderKey);
    out.append(std::to_string(snapshot.last_id));
    out += '\n';

    for (const auto& e : snapshot.entries) {
        out.append(std::to_string(e.id));
        out += '\t';
        append_escaped(out, e.name);
        out += '\t';
        append_escaped(out, e.surname);
        out += '\t';
        append_escaped(out, e.phone_number);
        out += '\n';
    }
    return out;
}

bool EntryParser::fail(std::string_view why) {
    ok_ = false;
    err_ = why;
    return false;
}

bool EntryParser::read_header() {
    header_read_ = true;

    const std::size_t nl = payload_.find('\n');
    if (nl == std::string_view::npos) {
        return fail("missing last_id header");
    }

    std::string_view line = payload_.substr(0, nl);
    if (line.substr(0, kHeaderKey.size()) != kHeaderKey) {
        return fail("missing last_id header");
    }

    auto id = parse_int(line.substr(kHeaderKey.size()));
    if (!id || *id < 0) {
        return fail("invalid last_id");
    }

    last_id_ = *id;
    pos_ = nl + 1;
    return true;
}

bool EntryParser::next(Entry& out) {
    if (!ok_) return false; // sticky
    if (!header_read_ && !read_header()) return false;
    if (pos_ >= payload_.size()) return false; // passed the limit

    const std::size_t nl = payload_.find('\n', pos_);
    if (nl == std::string_view::npos) {
        return fail("truncated entry line");
    }
    std::string_view line = payload_.substr(pos_, nl - pos_);

    // Split on raw tabs; escaped tabs never appear unescaped in a field.
    std::array<std::string_view, kFieldCount> fields;
    std::size_t count = 0;
    std::size_t begin = 0;
    while (true) {
        const std::size_t tab = line.find('\t', begin);
        if (count == kFieldCount) {
            return fail("too many fields in entry");
        }
        fields[count++] = line.substr(begin, tab == std::string_view::npos
                                                 ? std::string_view::npos
                                                 : tab - begin);
        if (tab == std::string_view::npos) break;
        begin = tab + 1;
    }
    if (count != kFieldCount) {
        return fail("missing fields in entry");
    }

    auto id = parse_int(fields[0]);
    if (!id || *id <= 0) {
        return fail("invalid entry id");
    }

    auto name = unescape(fields[1]);
    auto surname = unescape(fields[2]);
    auto phone = unescape(fields[3]);
    if (!name || !surname || !phone) {
        return fail("bad escape sequence in entry");
    }

    out.id = *id;
    out.name = std::move(*name);
    out.surname = std::move(*surname);
    out.phone_number = std::move(*phone);
    pos_ = nl + 1;
    return true;
}

EntrySnapshot EntryParser::parse_all() {
    EntrySnapshot snapshot;
    Entry e;
    while (next(e)) {
        snapshot.entries.push_back(e);
        e = Entry{}; // reset for next iteration
    }
    snapshot.last_id = last_id_;
    return snapshot;
}
