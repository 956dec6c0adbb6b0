#include <QueryFusion/encoder.hpp>
#include "../test_helpers.hpp"
#include <cassert>
#include <cstdint>
#include <deque>
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
};

struct Search {
    std::string name;
    std::uint8_t age;
    Pagination pagination;
    std::vector<int> ids;
    std::optional<std::vector<std::string>> hobbies;
    std::optional<std::string> op;
};

struct Flags {
    bool on;
    bool off;
    char grade;
};

struct Numbers {
    std::int8_t i8;
    std::uint16_t u16;
    std::int64_t i64;
    __int128 big;
    unsigned __int128 ubig;
};

struct Floats {
    double ratio;
    float small;
};

struct Sequences {
    std::list<std::string> tags;
    std::deque<std::uint8_t> levels;
};

struct Inner {
    int depth;
};
struct Middle {
    Inner inner;
    std::string label;
};
struct Outer {
    int id;
    Middle middle;
    std::optional<Inner> extra;
};

struct Blob {
    std::vector<std::byte> data;
};

struct Empty {};

int main() {
    std::cout << "=== Encoding Tests ===\n\n";

    // Test 1: Full record with nested, repeated and optional fields
    {
        std::cout << "Test 1: Encode search request... ";
        Search s{
            .name = "test",
            .age = 37,
            .pagination = {.limit = 10, .offset = 0},
            .ids = {1, 2},
            .hobbies = std::vector<std::string>{"moto", "code"},
            .op = "some",
        };
        std::string out;
        auto result = Encode(s, out);
        assert(result);
        assert(out == "name=test&age=37&limit=10&offset=0&ids=1&ids=2&hobbies=moto&hobbies=code&op=some");
        std::cout << "PASSED (" << out << ")\n";
    }

    // Test 2: Absent optionals and empty sequences emit no key
    {
        std::cout << "Test 2: Absent optionals and empty sequences... ";
        Search s{.name = "x", .age = 1, .pagination = {5, 6}, .ids = {}, .hobbies = std::nullopt, .op = std::nullopt};
        assert(EncodesTo(s, "name=x&age=1&limit=5&offset=6"));
        std::cout << "PASSED\n";
    }

    // Test 3: Present but empty optional sequence still writes nothing
    {
        std::cout << "Test 3: Present empty optional sequence... ";
        Search s{.name = "x", .age = 1, .pagination = {5, 6}, .ids = {7}, .hobbies = std::vector<std::string>{}, .op = ""};
        assert(EncodesTo(s, "name=x&age=1&limit=5&offset=6&ids=7&op="));
        std::cout << "PASSED\n";
    }

    // Test 4: Booleans and chars
    {
        std::cout << "Test 4: Booleans and chars... ";
        assert(EncodesTo(Flags{true, false, 'B'}, "on=true&off=false&grade=B"));
        std::cout << "PASSED\n";
    }

    // Test 5: Integer widths, including 128-bit
    {
        std::cout << "Test 5: Integer widths... ";
        Numbers n{-128, 65535, -9000000000, 0, 0};
        n.big = __int128(1) << 100;
        n.ubig = ~static_cast<unsigned __int128>(0);
        assert(EncodesTo(n,
            "i8=-128&u16=65535&i64=-9000000000"
            "&big=1267650600228229401496703205376"
            "&ubig=340282366920938463463374607431768211455"));
        std::cout << "PASSED\n";
    }

    // Test 6: Floats use the shortest round-trip form
    {
        std::cout << "Test 6: Shortest float text... ";
        assert(EncodesTo(Floats{0.1, 2.5f}, "ratio=0.1&small=2.5"));
        assert(EncodesTo(Floats{1e21, -0.0f}, "ratio=1e+21&small=-0"));
        std::cout << "PASSED\n";
    }

    // Test 7: Any dynamic container is a repeated-key sequence
    {
        std::cout << "Test 7: list and deque sequences... ";
        Sequences s{{"a", "b c", ""}, {3, 1}};
        assert(EncodesTo(s, "tags=a&tags=b c&tags=&levels=3&levels=1"));
        std::cout << "PASSED\n";
    }

    // Test 8: Deep nesting flattens without prefixes
    {
        std::cout << "Test 8: Deep nesting... ";
        assert(EncodesTo(Outer{1, {{2}, "l"}, std::nullopt}, "id=1&depth=2&label=l"));
        std::cout << "PASSED\n";
    }

    // Test 9: Byte buffers are unpadded base64
    {
        std::cout << "Test 9: Byte buffer... ";
        Blob b{{std::byte{'f'}, std::byte{'o'}, std::byte{'o'}, std::byte{'b'}}};
        assert(EncodesTo(b, "data=Zm9vYg"));
        assert(EncodesTo(Blob{}, "data="));
        std::cout << "PASSED\n";
    }

    // Test 10: Output is replaced, not appended
    {
        std::cout << "Test 10: Output string is reset... ";
        std::string out = "stale";
        auto result = Encode(Flags{false, false, 'x'}, out);
        assert(result);
        assert(out == "on=false&off=false&grade=x");
        std::cout << "PASSED\n";
    }

    // Test 11: Record without fields
    {
        std::cout << "Test 11: Empty record... ";
        assert(EncodesTo(Empty{}, ""));
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
