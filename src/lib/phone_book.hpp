#pragma once

#include "entry.hpp"
#include "entry_storage.hpp"
#include "result.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

// Owns the contact collection for one run of the program. The collection
// is loaded from storage on first use and written back after every
// successful insert or remove. Failures come back as StoreError values.
class PhoneBook {
public:
    explicit PhoneBook(std::unique_ptr<IEntryStorage> storage)
        : storage_(std::move(storage)) {}

    Result<std::vector<Entry>> get_list();

    // Exact, case-sensitive lookup in two passes: the first entry whose
    // phone number equals `term`, else the first whose name or surname does.
    static Result<Entry> search(const std::vector<Entry>& entries,
                                std::string_view term);

    // Assigns the next id (never reusing a retired one), appends the entry
    // and persists the collection. Returns the assigned id.
    Result<int> insert(Entry entry);

    // Removes the entry keyed by `phone_number`, keeping the order of the rest.
    Status remove(std::string_view phone_number);

private:
    Status ensure_loaded();
    Status persist();
    std::optional<int> next_id() const;

    std::unique_ptr<IEntryStorage> storage_;
    EntrySnapshot snapshot_;
    bool loaded_ = false;
};
