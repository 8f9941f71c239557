#include "i_payload_codec.hpp"
#include <cstddef>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <zlib.h>
#include <zstr.hpp>

class ZlibCodec: public IPayloadCodec {
public:
    explicit ZlibCodec(int level) : level_(level) {}

    std::string compress(std::string_view s) override {
        uLongf cap = compressBound(static_cast<uLong>(s.size()));
        std::string out;
        out.resize(cap);

        int ret = compress2(reinterpret_cast<Bytef*>(&out[0]), &cap,
                            reinterpret_cast<const Bytef*>(s.data()),
                            static_cast<uLong>(s.size()), level_);
        if (ret != Z_OK) throw std::runtime_error("zlib compress2 failed");
        out.resize(cap);
        return out;
    }

    std::string decompress(std::string_view s) override {
        std::stringbuf buf;
        buf.sputn(s.data(), static_cast<std::streamsize>(s.size()));
        zstr::istream in(&buf);
        try {
            return {std::istreambuf_iterator<char>(in), {}};
        } catch (const zstr::Exception& e) {
            throw std::runtime_error(std::string("zlib inflate failed: ") + e.what());
        }
    }

private:
    int level_;
};

std::unique_ptr<IPayloadCodec> make_zlib_codec(int level) {
    return std::make_unique<ZlibCodec>(level);
}
