// Basic QueryFusion usage example
// Compile: g++ -std=gnu++23 -I../include basic_usage.cpp -lyyjson -lfmt -lspdlog -o basic_usage

#include <QueryFusion/decoder.hpp>
#include <QueryFusion/encoder.hpp>
#include <QueryFusion/error_formatting.hpp>
#include <QueryFusion/query.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

using namespace QueryFusion;
using namespace QueryFusion::options;

struct Pagination {
    std::uint32_t limit;
    std::uint32_t offset;
};

struct SearchRequest {
    std::string name;
    std::uint8_t age;
    Pagination pagination;
    std::vector<int> ids;
    std::optional<std::vector<std::string>> hobbies;
    A<std::optional<std::string>, key<"op">> operation;
    Array<std::string> tags;
};

int main() {
    spdlog::set_level(spdlog::level::debug);

    SearchRequest req{
        .name = "test",
        .age = 37,
        .pagination = {.limit = 10, .offset = 0},
        .ids = {1, 2},
        .hobbies = std::vector<std::string>{"moto", "code"},
        .operation = std::string("some"),
        .tags = {"new", "sale"},
    };

    std::string text;
    if (auto res = Encode(req, text); !res) {
        spdlog::error("encode failed: {}", ResultToString(res));
        return 1;
    }
    spdlog::info("encoded: {}", text);

    SearchRequest back{};
    if (auto res = Decode(back, text); !res) {
        spdlog::error("decode failed: {}", ResultToString(res));
        return 1;
    }
    spdlog::info("decoded name={} age={} limit={} ids={} tags={}",
                 back.name, back.age, back.pagination.limit, back.ids.size(), back.tags.size());

    const std::string request = "/search?" + text + "#results";
    auto ok = Query<SearchRequest>::FromTarget(request);
    spdlog::info("request status {}", ok.status);
    if (!ok) {
        return 1;
    }

    // rejected: age does not fit uint8
    auto bad = Query<SearchRequest>::FromTarget("/search?name=x&age=300&limit=1&offset=0&tags=[]");
    spdlog::info("request status {}: {}", bad.status, bad.error);

    std::string target;
    if (auto res = ok.query->ToTarget("/search", target); !res) {
        spdlog::error("target failed: {}", ResultToString(res));
        return 1;
    }
    spdlog::info("target: {}", target);
    return 0;
}
