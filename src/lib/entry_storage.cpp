#include "entry_storage.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <openssl/sha.h>
#include <stdexcept>
#include <string>
#include <system_error>

static constexpr std::string_view kObjectType = "phonebook";

static std::string sha1_digest(std::string_view bytes) {
    std::string digest(SHA_DIGEST_LENGTH, '\0');
    SHA1(reinterpret_cast<const unsigned char*>(bytes.data()),
         bytes.size(),
         reinterpret_cast<unsigned char*>(digest.data()));
    return digest;
}

ParsedHeader FileEntryStorage::parse_header(std::string_view object_bytes) {
    const std::size_t sp = object_bytes.find(' ');
    if (sp == std::string_view::npos) {
        throw std::runtime_error("invalid phone book: missing space after type");
    }

    ParsedHeader h;
    h.type = std::string(object_bytes.substr(0, sp));
    if (h.type != kObjectType) {
        throw std::runtime_error("invalid phone book: unexpected type '" + h.type + "'");
    }

    const std::size_t nul = object_bytes.find('\0', sp + 1);
    if (nul == std::string_view::npos) {
        throw std::runtime_error("invalid phone book: missing NUL after size");
    }
    if (nul == sp + 1) {
        throw std::runtime_error("invalid phone book: empty size");
    }

    // Parse decimal size
    std::size_t declared_size = 0;
    for (std::size_t i = sp + 1; i < nul; ++i) {
        char c = object_bytes[i];
        if (c < '0' || c > '9') {
            throw std::runtime_error("invalid phone book: size not decimal");
        }
        declared_size = declared_size * 10 + static_cast<std::size_t>(c - '0');
    }

    h.size = declared_size;
    h.header_len = nul + 1;

    // header + payload + trailing digest must account for every byte
    if (object_bytes.size() != h.header_len + h.size + SHA_DIGEST_LENGTH) {
        throw std::runtime_error("invalid phone book: size mismatch");
    }

    return h;
}

std::string FileEntryStorage::encode(const EntrySnapshot& snapshot) {
    const std::string payload = serialize_payload(snapshot);

    std::string object_bytes;
    object_bytes.append(kObjectType);
    object_bytes += ' ';
    object_bytes.append(std::to_string(payload.size()));
    object_bytes += '\0';
    object_bytes.append(payload);
    object_bytes.append(sha1_digest(object_bytes));
    return object_bytes;
}

EntrySnapshot FileEntryStorage::decode(std::string_view object_bytes) {
    ParsedHeader h = parse_header(object_bytes);

    const std::size_t body_len = h.header_len + h.size;
    if (sha1_digest(object_bytes.substr(0, body_len)) != object_bytes.substr(body_len)) {
        throw std::runtime_error("invalid phone book: checksum mismatch");
    }

    EntryParser parser{object_bytes.substr(h.header_len, h.size)};
    EntrySnapshot snapshot = parser.parse_all();
    if (!parser.ok()) {
        throw std::runtime_error("invalid phone book: " + std::string(parser.error()));
    }
    return snapshot;
}

EntrySnapshot FileEntryStorage::load() {
    if (!fs::exists(path_)) {
        return EntrySnapshot{};
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path_.string() + " for read");
    }
    std::string compressed((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("read failed: " + path_.string());
    }

    return decode(codec_->decompress(compressed));
}

void FileEntryStorage::save(const EntrySnapshot& snapshot) {
    const std::string compressed = codec_->compress(encode(snapshot));

    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path());
    }

    auto tmp = path_;
    tmp += ".tmp";

    try {
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("cannot open " + tmp.string() + " for write");
            }

            out.write(compressed.data(), static_cast<std::streamsize>(compressed.size()));

            if (!out) throw std::runtime_error("write failed: " + tmp.string());
            out.close();
        }

        fs::rename(tmp, path_);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tmp, ec); // no partial file left behind
        throw;
    }
}
