#include <QueryFusion/decoder.hpp>
#include <QueryFusion/encoder.hpp>
#include "../test_helpers.hpp"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <list>
#include <optional>
#include <string>
#include <vector>

using namespace QueryFusion;
using namespace TestHelpers;

struct Pagination {
    std::uint32_t limit;
    std::uint32_t offset;
    bool operator==(const Pagination &) const = default;
};

struct Search {
    std::string name;
    std::uint8_t age;
    Pagination pagination;
    std::vector<int> ids;
    std::optional<std::vector<std::string>> hobbies;
    std::optional<std::string> op;
    bool operator==(const Search &) const = default;
};

struct Person {
    int age;
    std::string name;
    Pagination pagination;
};

struct Scalars {
    bool flag;
    char letter;
    std::int16_t small;
    std::uint64_t big;
    __int128 huge;
    double ratio;
    float f;
};

struct Tagged {
    int id;
    std::optional<Pagination> page;
    std::list<std::string> tags;
};

struct Blob {
    std::vector<std::byte> data;
};

struct Snapshot {
    double ratio;
    float scale;
    __int128 low;
    unsigned __int128 high;
    std::vector<std::byte> blob;
    std::optional<std::string> note;
    std::optional<int> retries;
    std::optional<Pagination> window;
    std::vector<double> samples;
    bool operator==(const Snapshot &) const = default;
};

int main() {
    std::cout << "=== Decoding Tests ===\n\n";

    // Test 1: Full record, keys in arbitrary order
    {
        std::cout << "Test 1: Decode search request... ";
        Search s{};
        auto result = Decode(s, "age=37&name=test&offset=0&limit=10&ids=1&ids=2&op=some&hobbies=moto&hobbies=code");
        assert(result);
        Search expected{
            .name = "test",
            .age = 37,
            .pagination = {.limit = 10, .offset = 0},
            .ids = {1, 2},
            .hobbies = std::vector<std::string>{"moto", "code"},
            .op = "some",
        };
        assert(s == expected);
        std::cout << "PASSED\n";
    }

    // Test 2: Nested record flattening regardless of key order
    {
        std::cout << "Test 2: Flattened nested record... ";
        Person p{};
        assert(DecodeSucceeds(p, "age=37&name=test&limit=10&offset=0"));
        assert(p.age == 37 && p.name == "test");
        assert(p.pagination.limit == 10 && p.pagination.offset == 0);

        Person q{};
        assert(DecodeSucceeds(q, "offset=3&limit=4&name=n&age=1"));
        assert(q.pagination.limit == 4 && q.pagination.offset == 3);
        std::cout << "PASSED\n";
    }

    // Test 3: Absent optionals and sequences
    {
        std::cout << "Test 3: Absent optionals and sequences... ";
        Search s{};
        s.op = "stale";
        assert(DecodeSucceeds(s, "name=a&age=2&limit=1&offset=1"));
        assert(s.ids.empty());
        assert(!s.hobbies.has_value());
        assert(!s.op.has_value());
        std::cout << "PASSED\n";
    }

    // Test 4: Empty value is a present optional string
    {
        std::cout << "Test 4: Empty values... ";
        Search s{};
        assert(DecodeSucceeds(s, "name=&age=2&limit=1&offset=1&op="));
        assert(s.name.empty());
        assert(s.op.has_value() && s.op->empty());
        std::cout << "PASSED\n";
    }

    // Test 5: All scalar kinds
    {
        std::cout << "Test 5: Scalar kinds... ";
        Scalars v{};
        assert(DecodeSucceeds(v,
            "flag=true&letter=Z&small=-32768&big=18446744073709551615"
            "&huge=-170141183460469231731687303715884105728&ratio=0.25&f=1e3"));
        assert(v.flag);
        assert(v.letter == 'Z');
        assert(v.small == -32768);
        assert(v.big == 18446744073709551615ull);
        assert(v.huge == -(static_cast<__int128>(1) << 126) * 2);
        assert(v.ratio == 0.25);
        assert(v.f == 1000.0f);
        std::cout << "PASSED\n";
    }

    // Test 6: Special float literals from the shortest encoder form
    {
        std::cout << "Test 6: Float specials... ";
        Scalars v{};
        assert(DecodeSucceeds(v, "flag=false&letter=a&small=0&big=0&huge=0&ratio=inf&f=nan"));
        assert(std::isinf(v.ratio));
        assert(std::isnan(v.f));
        std::cout << "PASSED\n";
    }

    // Test 7: Optional nested record present when any of its keys is present
    {
        std::cout << "Test 7: Optional nested record... ";
        Tagged t{};
        assert(DecodeSucceeds(t, "id=1&limit=5&offset=6&tags=x&tags=y"));
        assert(t.page.has_value());
        assert(t.page->limit == 5 && t.page->offset == 6);
        assert((t.tags == std::list<std::string>{"x", "y"}));

        Tagged none{};
        assert(DecodeSucceeds(none, "id=1"));
        assert(!none.page.has_value());
        assert(none.tags.empty());

        Tagged partial{};
        assert(DecodeFailsAtKey(partial, "id=1&limit=5", ErrorCode::NO_VALUE, "offset"));
        std::cout << "PASSED\n";
    }

    // Test 8: Unknown keys are ignored
    {
        std::cout << "Test 8: Unknown keys... ";
        Person p{};
        assert(DecodeSucceeds(p, "utm_source=mail&age=3&name=x&limit=1&offset=2&x="));
        assert(p.age == 3);
        std::cout << "PASSED\n";
    }

    // Test 9: Repeated key for a scalar takes the first value
    {
        std::cout << "Test 9: Repeated scalar key... ";
        Person p{};
        assert(DecodeSucceeds(p, "age=1&age=2&name=x&limit=1&offset=2"));
        assert(p.age == 1);
        std::cout << "PASSED\n";
    }

    // Test 10: Byte buffer from unpadded base64
    {
        std::cout << "Test 10: Byte buffer... ";
        Blob b{};
        assert(DecodeSucceeds(b, "data=Zm9vYmE"));
        assert(b.data.size() == 5);
        assert(b.data[0] == std::byte{'f'} && b.data[4] == std::byte{'a'});
        assert(DecodeFailsWith(b, "data=Zm9v!", ErrorCode::INVALID_LITERAL));
        std::cout << "PASSED\n";
    }

    // Test 11: Empty text is an empty field map
    {
        std::cout << "Test 11: Empty text... ";
        Tagged t{};
        assert(DecodeFailsAtKey(t, "", ErrorCode::NO_VALUE, "id"));
        Blob b{};
        assert(DecodeFailsAtKey(b, "", ErrorCode::NO_VALUE, "data"));
        std::cout << "PASSED\n";
    }

    // Test 12: Encode then decode reproduces the value
    {
        std::cout << "Test 12: Round trip... ";
        Snapshot full{
            .ratio = 0.1,
            .scale = 1.0f / 3.0f,
            .low = -(static_cast<__int128>(1) << 126) * 2,
            .high = ~static_cast<unsigned __int128>(0),
            .blob = {std::byte{0}, std::byte{0xff}, std::byte{'&'}, std::byte{'='}, std::byte{0x7f}},
            .note = "",
            .retries = std::nullopt,
            .window = Pagination{.limit = 50, .offset = 100},
            .samples = {1e-300, 2.2250738585072014e-308, 1.7976931348623157e308, -2.5},
        };
        assert(RoundTripEquals(full));

        Snapshot sparse{
            .ratio = -1e21,
            .scale = 3.0e-38f,
            .low = 0,
            .high = 1,
            .blob = {},
            .note = std::nullopt,
            .retries = 7,
            .window = std::nullopt,
            .samples = {},
        };
        assert(RoundTripEquals(sparse));

        std::string text;
        assert(Encode(sparse, text));
        assert(text.find("limit") == std::string::npos);
        assert(text.find("note") == std::string::npos);
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
