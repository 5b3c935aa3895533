#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>
#include "rdb/rdb_error.h"
#include "rdb/rdb_length.h"
#include "rdb/rdb_record.h"

using namespace rdbdump::rdb;
using bytes_t = std::vector<std::uint8_t>;

static auto cat(std::initializer_list<bytes_t> parts) -> bytes_t {
    bytes_t out;
    for (const auto& p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

static auto kind_of(const std::string& fragment) -> ErrorKind {
    try {
        record_from_fragment(fragment);
    } catch (const RdbError& e) {
        return e.kind();
    }
    assert(false && "fragment was expected to fail");
    return ErrorKind::IoFailure;
}

int main()
{
    // Scalar -> string record
    {
        const auto rec = record_from_fragment("name = \"ada\"");
        assert(std::holds_alternative<StringRecord>(rec));
        assert(record_key(rec) == "name");
        assert(record_kind_name(rec) == "string");
        assert(encode_record(rec)
               == cat({{kTypeString}, encode_string("name"), encode_string("ada")}));
    }

    // Non-string scalars are stringified
    {
        const auto rec = record_from_fragment("port = 6379");
        assert(encode_record(rec)
               == cat({{kTypeString}, encode_string("port"), encode_string("6379")}));
    }

    // Table block -> hash record, fields in declaration order
    {
        const auto rec = record_from_fragment("[person]\nage = 30\ncity = \"nyc\"");
        assert(std::holds_alternative<HashRecord>(rec));
        assert(encode_record(rec)
               == cat({{kTypeHash}, encode_string("person"), encode_length(2),
                       encode_string("age"), encode_string("30"),
                       encode_string("city"), encode_string("nyc")}));
    }

    // Declaration order, not key order
    {
        const auto rec = record_from_fragment("[z]\nzeta = 1\nalpha = 2\nmid = 3");
        const auto& hash = std::get<HashRecord>(rec);
        assert(hash.fields.size() == 3);
        assert(hash.fields[0].first == "zeta");
        assert(hash.fields[1].first == "alpha");
        assert(hash.fields[2].first == "mid");
    }

    // Inline table and dotted key also become hashes
    {
        const auto inline_rec = record_from_fragment("point = { x = 1, y = 2.5 }");
        const auto& hash = std::get<HashRecord>(inline_rec);
        assert(hash.key == "point");
        assert(hash.fields[1].second == "2.5");

        const auto dotted = record_from_fragment("server.port = 80");
        assert(std::get<HashRecord>(dotted).key == "server");
        assert(std::get<HashRecord>(dotted).fields[0].first == "port");
    }

    // Empty table block
    {
        const auto rec = record_from_fragment("[empty]");
        assert(encode_record(rec) == cat({{kTypeHash}, encode_string("empty"), encode_length(0)}));
    }

    // List -> set record, duplicates preserved
    {
        const auto rec = record_from_fragment("tags = [\"a\",\"b\",\"a\"]");
        assert(std::holds_alternative<SetRecord>(rec));
        assert(encode_record(rec)
               == cat({{kTypeSet}, encode_string("tags"), encode_length(3),
                       encode_string("a"), encode_string("b"), encode_string("a")}));
    }

    // Mixed scalar members
    {
        const auto rec = record_from_fragment("mixed = [1, true, \"x\", 1.5]");
        const auto& set = std::get<SetRecord>(rec);
        assert((set.members == std::vector<std::string>{"1", "true", "x", "1.5"}));
    }

    // Only the first top-level key is encoded
    {
        const auto rec = record_from_fragment("[b]\nx = 1\n[a]\ny = 2");
        assert(record_key(rec) == "b");
    }

    // Failures
    assert(kind_of("name = ") == ErrorKind::MalformedFragment);
    assert(kind_of("[person]\nage = = 30") == ErrorKind::MalformedFragment);
    assert(kind_of("just some words") == ErrorKind::MalformedFragment);
    assert(kind_of("# only a comment") == ErrorKind::InvalidKeyedRecord);
    assert(kind_of("") == ErrorKind::InvalidKeyedRecord);
    assert(kind_of("people = [{ name = \"a\" }]") == ErrorKind::UnsupportedScalarKind);
    assert(kind_of("matrix = [[1, 2], [3]]") == ErrorKind::UnsupportedScalarKind);
    assert(kind_of("[a]\n[a.b]\nx = 1") == ErrorKind::UnsupportedScalarKind);
    assert(kind_of("[a]\nlist = [1, 2]") == ErrorKind::UnsupportedScalarKind);

    // Writing goes through the sink and advances the checksum
    {
        std::ostringstream out;
        ChecksumSink sink(out);
        const auto rec = record_from_fragment("k = \"v\"");
        const auto crc = write_record(rec, sink);
        const auto expected = encode_record(rec);
        assert(crc != 0);
        assert(out.str() == std::string(expected.begin(), expected.end()));
        assert(sink.bytes_written() == expected.size());
    }

    std::cout << "All tests passed.\n";
    return 0;
}
