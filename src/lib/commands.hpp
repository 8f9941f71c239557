#pragma once
#include "phone_book.hpp"
#include <memory>
#include <ostream>
#include <string>


// Minimal interface that all commands implement. argv[0] is the program
// name and argv[1] the command name.
struct ICommand {
    virtual ~ICommand() = default;
    virtual int execute(int argc, char** argv, PhoneBook& book, std::ostream& out) = 0;
    virtual const char* name() const = 0;
};

// Factory defined in commands.cpp; nullptr for an unknown name.
std::unique_ptr<ICommand> make_command(const std::string& name);

// Validates argv, routes it to the matching command and prints the outcome
// to `out`. Returns the command's status; every path returns normally.
int dispatch(int argc, char** argv, PhoneBook& book, std::ostream& out);
