#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <zlib.h>
#include "gzip/gzip_streambuf.h"
#include "rdb/rdb_error.h"
#include "rdbdump.h"

using namespace rdbdump;

// Single gzip member holding `text`.
static auto gzip_compress(const std::string& text) -> std::string {
    z_stream zs{};
    int rc = deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                          Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string out(deflateBound(&zs, static_cast<uLong>(text.size())) + 32, '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
    zs.avail_in = static_cast<uInt>(text.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    rc = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(zs.total_out);
    return out;
}

static auto inflate_all(const std::string& compressed, std::size_t chunk) -> std::string {
    std::istringstream src(compressed);
    gzip::GzipInputBuffer buf(src, chunk);
    std::istream in(&buf);
    in.exceptions(std::ios::badbit);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

static auto convert(const std::string& input, bool gzipped) -> std::string {
    std::istringstream in(input);
    std::ostringstream out;
    DumpOptions opt{};
    opt.gzipped = gzipped;
    RdbDump::ConvertStream(in, out, opt);
    return out.str();
}

static auto fails_with_io_error(const std::string& compressed) -> bool {
    try {
        convert(compressed, true);
    } catch (const rdb::RdbError& e) {
        return e.kind() == rdb::ErrorKind::IoFailure;
    }
    return false;
}

int main()
{
    const std::string doc =
        "name = \"ada\"\n"
        "\n"
        "[person]\n"
        "age = 30\n"
        "city = \"nyc\"\n"
        "\n"
        "tags = [\"a\", \"b\", \"a\"]\n";

    // Round trip through the streambuf, with tiny and default chunk sizes
    const auto gz = gzip_compress(doc);
    assert(inflate_all(gz, 7) == doc);
    assert(inflate_all(gz, 64 * 1024) == doc);

    // Larger input spanning many output chunks
    std::string big;
    for (int i = 0; i < 5000; ++i) {
        big += "key" + std::to_string(i) + " = " + std::to_string(i * 3) + "\n";
    }
    assert(inflate_all(gzip_compress(big), 512) == big);

    // Concatenated members decode back to back
    assert(inflate_all(gzip_compress("a = 1\n") + gzip_compress("b = 2\n"), 16) == "a = 1\nb = 2\n");

    // Gzipped conversion matches the plain one
    assert(convert(gz, true) == convert(doc, false));

    // Empty compressed input is an empty document
    assert(convert("", true) == convert("", false));

    // Truncated and corrupt streams
    assert(fails_with_io_error(gz.substr(0, gz.size() / 2)));
    assert(fails_with_io_error("this is not gzip data at all"));
    std::string corrupt = gz;
    corrupt[corrupt.size() / 2] = static_cast<char>(corrupt[corrupt.size() / 2] ^ 0x5A);
    assert(fails_with_io_error(corrupt));

    std::cout << "All tests passed.\n";
    return 0;
}
