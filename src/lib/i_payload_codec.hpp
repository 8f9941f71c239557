#pragma once

#include <memory>
#include <string>
#include <string_view>

// Transforms the phone book file's bytes on their way to and from disk.
class IPayloadCodec {
public:
    virtual ~IPayloadCodec() = default;
    virtual std::string compress(std::string_view uncompressed) = 0;
    virtual std::string decompress(std::string_view compressed) = 0;
};

std::unique_ptr<IPayloadCodec> make_zlib_codec(int level);
