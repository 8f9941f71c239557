#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

struct Entry {
    int id = 0;               // 0 until the phone book assigns one
    std::string name;
    std::string surname;
    std::string phone_number;

    bool operator==(const Entry&) const noexcept = default;

    // Exact, case-sensitive match against name or surname.
    bool matches_name(std::string_view term) const {
        return name == term || surname == term;
    }
};

std::ostream& operator<<(std::ostream& os, const Entry& e);

// Everything the storage layer persists: the collection plus the largest
// id ever handed out, so that ids of deleted entries stay retired.
struct EntrySnapshot {
    int last_id = 0;
    std::vector<Entry> entries;
};

// payload = "last_id <n>\n" followed by one "<id>\t<name>\t<surname>\t<phone>\n"
// line per entry. Tabs, newlines and backslashes inside fields are escaped.
std::string serialize_payload(const EntrySnapshot& snapshot);

class EntryParser {
public:
    explicit EntryParser(std::string_view payload) : payload_(payload) {}

    // Returns true and fills `out` if an entry was parsed; false = no more
    // entries or corruption (check ok()).
    bool next(Entry& out);

    // Parse the header and all remaining entries.
    EntrySnapshot parse_all();

    int last_id() const { return last_id_; }

    bool ok() const { return ok_; }
    std::string_view error() const { return err_; }

private:
    bool read_header();
    bool fail(std::string_view why);

    std::string_view payload_;
    std::size_t pos_ = 0;
    bool header_read_ = false;
    int last_id_ = 0;
    bool ok_ = true;
    std::string_view err_{};
};
