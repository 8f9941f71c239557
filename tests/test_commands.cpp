#include <gtest/gtest.h>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "lib/commands.hpp"
#include "lib/phone_book.hpp"
#include "fake_storage.hpp"

// Runs the dispatcher on a full argument vector (program name included)
// and returns what it printed.
class CommandsTest : public ::testing::Test {
protected:
    CommandsTest() : book_(std::make_unique<FakeStorage>(state_)) {}

    std::string run(std::initializer_list<std::string> args) {
        std::vector<std::string> storage(args);
        storage.insert(storage.begin(), "phonebook");
        std::vector<char*> argv;
        for (auto& s : storage) argv.push_back(s.data());
        argv.push_back(nullptr);

        std::ostringstream out;
        status_ = dispatch(static_cast<int>(storage.size()), argv.data(), book_, out);
        return out.str();
    }

    void seed() {
        state_.stored.last_id = 2;
        state_.stored.entries = {
            make_entry(1, "Alice", "Smith", "555-0100"),
            make_entry(2, "Bob", "Jones", "555-0101"),
        };
    }

    FakeState state_;
    PhoneBook book_;
    int status_ = -1;
};

TEST_F(CommandsTest, NoSubcommandAsksForArguments) {
    EXPECT_EQ(run({}), "Please enter required arguments!!\n");
    EXPECT_EQ(state_.loads, 0);
    EXPECT_EQ(state_.saves, 0);
}

TEST_F(CommandsTest, UnknownSubcommand) {
    EXPECT_EQ(run({"update", "x"}), "not valid option\n");
    EXPECT_EQ(run({"SEARCH", "x"}), "not valid option\n");
    EXPECT_EQ(state_.loads, 0);
}

TEST_F(CommandsTest, FactoryKnowsFourCommands) {
    for (const char* name : {"search", "list", "insert", "delete"}) {
        auto cmd = make_command(name);
        ASSERT_TRUE(cmd != nullptr) << name;
        EXPECT_STREQ(cmd->name(), name);
    }
    EXPECT_TRUE(make_command("init") == nullptr);
}

// ----------------------------- search ------------------------------------

TEST_F(CommandsTest, SearchWithoutTermMakesNoStoreCall) {
    EXPECT_EQ(run({"search"}), "Please provide a search term\n");
    EXPECT_EQ(run({"search", "a", "b"}), "Please provide a search term\n");
    EXPECT_EQ(state_.loads, 0);
}

TEST_F(CommandsTest, SearchPrintsMatch) {
    seed();
    EXPECT_EQ(run({"search", "Jones"}), "2 Bob Jones 555-0101\n");
    EXPECT_EQ(status_, EXIT_SUCCESS);
}

TEST_F(CommandsTest, SearchMissPrintsNotFound) {
    seed();
    EXPECT_EQ(run({"search", "Zed"}), "no entry matches \"Zed\"\n");
    EXPECT_EQ(status_, EXIT_FAILURE);
}

TEST_F(CommandsTest, SearchPropagatesLoadError) {
    state_.fail_load = true;
    EXPECT_EQ(run({"search", "Alice"}), "cannot load phone book: disk on fire\n");
}

// ------------------------------ list -------------------------------------

TEST_F(CommandsTest, ListPrintsEveryEntry) {
    seed();
    EXPECT_EQ(run({"list"}), "1 Alice Smith 555-0100\n2 Bob Jones 555-0101\n");
}

TEST_F(CommandsTest, ListOfEmptyBookPrintsNothing) {
    EXPECT_EQ(run({"list"}), "");
    EXPECT_EQ(status_, EXIT_SUCCESS);
}

TEST_F(CommandsTest, ListPropagatesLoadError) {
    state_.fail_load = true;
    EXPECT_EQ(run({"list"}), "cannot load phone book: disk on fire\n");
    EXPECT_EQ(status_, EXIT_FAILURE);
}

// ----------------------------- insert ------------------------------------

TEST_F(CommandsTest, InsertNeedsThreeFields) {
    EXPECT_EQ(run({"insert", "Alice", "Smith"}), "not enough arguments for insert\n");
    EXPECT_EQ(run({"insert", "a", "b", "c", "d"}), "not enough arguments for insert\n");
    EXPECT_EQ(state_.loads, 0);
    EXPECT_EQ(state_.saves, 0);
}

TEST_F(CommandsTest, InsertPrintsAssignedId) {
    seed();
    EXPECT_EQ(run({"insert", "Carol", "White", "555-0102"}),
              "successfully inserted with id = 3\n");
    ASSERT_EQ(state_.stored.entries.size(), 3u);
    EXPECT_EQ(state_.stored.entries.back(), make_entry(3, "Carol", "White", "555-0102"));
}

TEST_F(CommandsTest, InsertPropagatesSaveError) {
    state_.fail_save = true;
    EXPECT_EQ(run({"insert", "Carol", "White", "555-0102"}),
              "cannot save phone book: disk full\n");
}

// ----------------------------- delete ------------------------------------

TEST_F(CommandsTest, DeleteNeedsPhone) {
    seed();
    EXPECT_EQ(run({"delete"}), "not enough arguments for delete\n");
    EXPECT_EQ(run({"delete", "555-0100", "extra"}), "not enough arguments for delete\n");
    EXPECT_EQ(state_.saves, 0);
}

TEST_F(CommandsTest, DeleteUnknownPhoneLeavesBookAlone) {
    seed();
    const auto before = state_.stored.entries;
    EXPECT_EQ(run({"delete", "000"}), "no entry with phone number 000\n");
    EXPECT_EQ(state_.stored.entries, before);
    EXPECT_EQ(state_.saves, 0);
}

TEST_F(CommandsTest, DeleteRemovesOneEntry) {
    seed();
    EXPECT_EQ(run({"delete", "555-0100"}), "successfully deleted\n");
    ASSERT_EQ(state_.stored.entries.size(), 1u);
    EXPECT_EQ(state_.stored.entries[0].name, "Bob");
}

TEST_F(CommandsTest, SharedPhoneIsInsertedTwiceAndDeletedOnce) {
    EXPECT_EQ(run({"insert", "Alice", "Smith", "555-0100"}),
              "successfully inserted with id = 1\n");
    EXPECT_EQ(run({"insert", "Bob", "Jones", "555-0100"}),
              "successfully inserted with id = 2\n");
    EXPECT_EQ(run({"delete", "555-0100"}), "successfully deleted\n");
    EXPECT_EQ(run({"list"}), "2 Bob Jones 555-0100\n");
}

TEST_F(CommandsTest, SearchByPhoneSkipsNameCollision) {
    run({"insert", "555-0199", "Smith", "555-0100"});
    run({"insert", "Bob", "Jones", "555-0199"});
    EXPECT_EQ(run({"search", "555-0199"}), "2 Bob Jones 555-0199\n");
}

TEST_F(CommandsTest, InsertReportsExhaustedIds) {
    state_.stored.last_id = std::numeric_limits<int>::max();
    EXPECT_EQ(run({"insert", "A", "B", "C"}), "identifier space exhausted\n");
    EXPECT_TRUE(state_.stored.entries.empty());
}

// ---------------------------- scenario -----------------------------------

TEST_F(CommandsTest, InsertSearchDeleteSearch) {
    EXPECT_EQ(run({"insert", "Alice", "Smith", "555-0100"}),
              "successfully inserted with id = 1\n");
    EXPECT_EQ(run({"search", "555-0100"}), "1 Alice Smith 555-0100\n");
    EXPECT_EQ(run({"delete", "555-0100"}), "successfully deleted\n");
    EXPECT_EQ(run({"search", "555-0100"}), "no entry matches \"555-0100\"\n");
    EXPECT_EQ(run({"list"}), "");
}
