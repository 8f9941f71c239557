#include "lib/commands.hpp"
#include "lib/entry_storage.hpp"
#include "lib/i_payload_codec.hpp"
#include "lib/phone_book.hpp"
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <zlib.h>

namespace fs = std::filesystem;

// $PHONEBOOK_FILE, else ~/.phonebook.db, else ./phonebook.db
fs::path find_phonebook_file() {
  if (const char* file = std::getenv("PHONEBOOK_FILE"); file && *file)
    return fs::path(file);
  if (const char* home = std::getenv("HOME"); home && *home)
    return fs::path(home) / ".phonebook.db";
  return fs::current_path() / "phonebook.db";
}

int main(int argc, char *argv[]) {
  std::cout << std::unitbuf;
  std::cerr << std::unitbuf;

  try {
    auto storage = std::make_unique<FileEntryStorage>(
        make_zlib_codec(Z_DEFAULT_COMPRESSION), find_phonebook_file());
    PhoneBook book{std::move(storage)};

    // Exit status is 0 whatever the command's outcome.
    dispatch(argc, argv, book, std::cout);
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
