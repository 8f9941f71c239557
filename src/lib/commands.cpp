// commands.cpp
#include <cstdlib>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "commands.hpp"
#include "entry.hpp"
#include "phone_book.hpp"

// ----------------------------- search ------------------------------------

struct SearchCommand : ICommand {
  const char* name() const override { return "search"; }
  int execute(int argc, char** argv, PhoneBook& book, std::ostream& out) override {
    if (argc != 3) {
      out << "Please provide a search term\n";
      return EXIT_FAILURE;
    }

    auto entries = book.get_list();
    if (!entries.ok()) {
      out << entries.error().message << "\n";
      return EXIT_FAILURE;
    }

    auto found = PhoneBook::search(entries.value(), argv[2]);
    if (!found.ok()) {
      out << found.error().message << "\n";
      return EXIT_FAILURE;
    }

    out << found.value() << "\n";
    return EXIT_SUCCESS;
  }
};

// ------------------------------ list -------------------------------------

struct ListCommand : ICommand {
  const char* name() const override { return "list"; }
  int execute(int /*argc*/, char** /*argv*/, PhoneBook& book, std::ostream& out) override {
    auto entries = book.get_list();
    if (!entries.ok()) {
      out << entries.error().message << "\n";
      return EXIT_FAILURE;
    }

    for (const auto& e : entries.value()) {
      out << e << "\n";
    }
    return EXIT_SUCCESS;
  }
};

// ----------------------------- insert ------------------------------------

struct InsertCommand : ICommand {
  const char* name() const override { return "insert"; }
  int execute(int argc, char** argv, PhoneBook& book, std::ostream& out) override {
    if (argc != 5) {
      out << "not enough arguments for insert\n";
      return EXIT_FAILURE;
    }

    Entry entry;
    entry.name = argv[2];
    entry.surname = argv[3];
    entry.phone_number = argv[4];

    auto id = book.insert(std::move(entry));
    if (!id.ok()) {
      out << id.error().message << "\n";
      return EXIT_FAILURE;
    }

    out << "successfully inserted with id = " << id.value() << "\n";
    return EXIT_SUCCESS;
  }
};

// ----------------------------- delete ------------------------------------

struct DeleteCommand : ICommand {
  const char* name() const override { return "delete"; }
  int execute(int argc, char** argv, PhoneBook& book, std::ostream& out) override {
    if (argc != 3) {
      out << "not enough arguments for delete\n";
      return EXIT_FAILURE;
    }

    Status status = book.remove(argv[2]);
    if (!status.ok()) {
      out << status.error().message << "\n";
      return EXIT_FAILURE;
    }

    out << "successfully deleted\n";
    return EXIT_SUCCESS;
  }
};

// ------------------------------- Factory ---------------------------------

std::unique_ptr<ICommand> make_command(const std::string& name) {
  if (name == "search") return std::make_unique<SearchCommand>();
  if (name == "list")   return std::make_unique<ListCommand>();
  if (name == "insert") return std::make_unique<InsertCommand>();
  if (name == "delete") return std::make_unique<DeleteCommand>();
  return nullptr;
}

int dispatch(int argc, char** argv, PhoneBook& book, std::ostream& out) {
  if (argc < 2) {
    out << "Please enter required arguments!!\n";
    return EXIT_FAILURE;
  }

  auto cmd = make_command(argv[1]);
  if (!cmd) {
    out << "not valid option\n";
    return EXIT_FAILURE;
  }
  return cmd->execute(argc, argv, book, out);
}
