#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "rdb/rdb_checksum_sink.h"
#include "rdb/rdb_crc64.h"
#include "rdb/rdb_error.h"

using namespace rdbdump::rdb;

static auto crc_of(const std::string& s, std::uint64_t seed = 0) -> std::uint64_t {
    return crc64_jones(seed, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

static auto as_bytes(const std::string& s) -> std::vector<std::uint8_t> {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

int main()
{
    // Redis check value
    assert(crc_of("123456789") == 0xe9c6d914c4b8d9caull);

    // Empty input leaves the seed untouched
    assert(crc_of("") == 0);
    assert(crc_of("", 0x1234) == 0x1234);

    // Incremental equals one-shot
    const std::string text = "REDIS0007\xfe";
    for (std::size_t split = 0; split <= text.size(); ++split) {
        const auto head = crc_of(text.substr(0, split));
        assert(crc_of(text.substr(split), head) == crc_of(text));
    }

    // Sink forwards bytes and accumulates in emission order
    {
        std::ostringstream out;
        ChecksumSink sink(out);
        assert(sink.checksum() == 0);
        sink.write(as_bytes("12345"));
        const auto crc = sink.write(as_bytes("6789"));
        assert(crc == 0xe9c6d914c4b8d9caull);
        assert(sink.checksum() == crc);
        sink.write_unchecksummed(as_bytes("zz"));
        assert(sink.checksum() == crc);
        assert(sink.bytes_written() == 11);
        sink.flush();
        assert(out.str() == "123456789zz");
    }

    // Write failures surface as IoFailure
    {
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        ChecksumSink sink(out);
        bool threw = false;
        try {
            sink.write(as_bytes("x"));
        } catch (const RdbError& e) {
            threw = e.kind() == ErrorKind::IoFailure;
        }
        assert(threw);
    }

    std::cout << "All tests passed.\n";
    return 0;
}
