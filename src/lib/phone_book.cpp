#include "phone_book.hpp"
#include <algorithm>
#include <exception>
#include <iterator>
#include <limits>
#include <string>

Status PhoneBook::ensure_loaded() {
    if (loaded_) return {};

    try {
        snapshot_ = storage_->load();
    } catch (const std::exception& e) {
        return StoreError{std::string("cannot load phone book: ") + e.what()};
    }
    loaded_ = true;
    return {};
}

Status PhoneBook::persist() {
    try {
        storage_->save(snapshot_);
    } catch (const std::exception& e) {
        return StoreError{std::string("cannot save phone book: ") + e.what()};
    }
    return {};
}

// nullopt once INT_MAX has been handed out.
std::optional<int> PhoneBook::next_id() const {
    int max_id = snapshot_.last_id;
    for (const auto& e : snapshot_.entries) {
        max_id = std::max(max_id, e.id);
    }
    if (max_id == std::numeric_limits<int>::max()) return std::nullopt;
    return max_id + 1;
}

Result<std::vector<Entry>> PhoneBook::get_list() {
    if (Status s = ensure_loaded(); !s.ok()) return s.error();
    return snapshot_.entries;
}

Result<Entry> PhoneBook::search(const std::vector<Entry>& entries,
                                std::string_view term) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [term](const Entry& e) { return e.phone_number == term; });
    if (it == entries.end()) {
        it = std::find_if(entries.begin(), entries.end(),
                          [term](const Entry& e) { return e.matches_name(term); });
    }
    if (it == entries.end()) {
        return StoreError{"no entry matches \"" + std::string(term) + "\""};
    }
    return *it;
}

Result<int> PhoneBook::insert(Entry entry) {
    if (Status s = ensure_loaded(); !s.ok()) return s.error();

    auto id = next_id();
    if (!id) {
        return StoreError{"identifier space exhausted"};
    }

    auto& entries = snapshot_.entries;
    const int previous_last_id = snapshot_.last_id;
    entry.id = *id;
    snapshot_.last_id = entry.id;
    entries.push_back(std::move(entry));

    if (Status s = persist(); !s.ok()) {
        entries.pop_back();
        snapshot_.last_id = previous_last_id;
        return s.error();
    }
    return snapshot_.last_id;
}

Status PhoneBook::remove(std::string_view phone_number) {
    if (Status s = ensure_loaded(); !s.ok()) return s;

    auto& entries = snapshot_.entries;
    auto it = std::find_if(entries.begin(), entries.end(), [&](const Entry& e) {
        return e.phone_number == phone_number;
    });
    if (it == entries.end()) {
        return StoreError{"no entry with phone number " + std::string(phone_number)};
    }

    const auto index = std::distance(entries.begin(), it);
    Entry removed = std::move(*it);
    entries.erase(it);

    if (Status s = persist(); !s.ok()) {
        entries.insert(entries.begin() + index, std::move(removed));
        return s;
    }
    return {};
}
