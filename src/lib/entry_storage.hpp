#pragma once

#include "entry.hpp"
#include "i_payload_codec.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <openssl/sha.h>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

// Where the phone book keeps its entries between runs. Both operations
// throw std::runtime_error on failure.
class IEntryStorage {
public:
    virtual ~IEntryStorage() = default;
    virtual EntrySnapshot load() = 0;
    virtual void save(const EntrySnapshot& snapshot) = 0;
};

struct ParsedHeader {
    std::string type;         // always "phonebook"
    std::size_t size;         // payload size
    std::size_t header_len;   // number of bytes up to and including the NUL
};

// Single compressed file:
//   codec( "phonebook <size>\0" + payload + sha1(header + payload) )
class FileEntryStorage : public IEntryStorage {
public:
    FileEntryStorage(std::unique_ptr<IPayloadCodec> codec, fs::path file)
        : codec_(std::move(codec)), path_(std::move(file)) {}

    // A missing file loads as an empty snapshot.
    EntrySnapshot load() override;
    void save(const EntrySnapshot& snapshot) override;

    static ParsedHeader parse_header(std::string_view object_bytes);
    static std::string encode(const EntrySnapshot& snapshot);
    static EntrySnapshot decode(std::string_view object_bytes);

private:
    std::unique_ptr<IPayloadCodec> codec_;
    fs::path path_;
};
