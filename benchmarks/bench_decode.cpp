/// @file bench_decode.cpp
/// @brief Performance benchmarks for yadec decoding.
///
/// Measured operations:
///   - JSON decoding into records (small, medium, large documents)
///   - JSON decoding with mismatches under the lenient policy
///   - JSON decoding into the type-erased Value model
///   - XML decoding into records, with and without mismatches
///   - Descriptor cache lookups

#include <yadec/yadec.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace yadec;

// ═══════════════════════════════════════════════════════════════════════════════
// Schemas
// ═══════════════════════════════════════════════════════════════════════════════

struct BenchUser {
    int64_t id = 0;
    std::string name;
    std::string email;
    bool active = false;
    double score = 0;
};
YADEC_DEFINE_XML_SCHEMA(BenchUser, "user",
    (id,     R"(json:"id" xml:"id,attr")"),
    (name,   R"(json:"name" xml:"name")"),
    (email,  R"(json:"email" xml:"email")"),
    (active, R"(json:"active" xml:"active")"),
    (score,  R"(json:"score" xml:"score")"))

struct BenchPage {
    std::vector<BenchUser> users;
    int total = 0;
    int page = 0;
    std::string version;
};
YADEC_DEFINE_XML_SCHEMA(BenchPage, "page",
    (users,   R"(json:"users" xml:"users>user")"),
    (total,   R"(json:"total" xml:"total")"),
    (page,    R"(json:"page" xml:"number")"),
    (version, R"(json:"version" xml:"version,attr")"))

struct BenchItem {
    int id = 0;
    std::string title;
    std::string description;
    double price = 0;
    int quantity = 0;
    std::vector<std::string> tags;
    bool active = false;
};
YADEC_DEFINE_SCHEMA(BenchItem,
    (id,          R"(json:"id")"),
    (title,       R"(json:"title")"),
    (description, R"(json:"description")"),
    (price,       R"(json:"price")"),
    (quantity,    R"(json:"quantity")"),
    (tags,        R"(json:"tags")"),
    (active,      R"(json:"active")"))

struct BenchCatalog {
    std::vector<BenchItem> data;
    Value meta;
};
YADEC_DEFINE_SCHEMA(BenchCatalog, (data, R"(json:"data")"), (meta, R"(json:"meta")"))

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Generate small JSON object (~100 bytes).
static std::string generate_small_json() {
    return R"({"id":7,"name":"John","email":"john@test.com","active":true,"score":95.5})";
}

/// Generate medium JSON document (~2KB). Every third user carries
/// mismatched fields when @p mismatched is set.
static std::string generate_medium_json(bool mismatched = false) {
    std::string s = R"({"users":[)";
    for (int i = 0; i < 20; ++i) {
        if (i > 0) s += ",";
        const bool bad = mismatched && i % 3 == 0;
        s += R"({"id":)" + (bad ? std::string(R"("x")") : std::to_string(i)) +
             R"(,"name":)" + (bad ? std::string("42") : "\"user_" + std::to_string(i) + "\"") +
             R"(,"email":"user)" + std::to_string(i) +
             R"(@test.com","active":)" + (i % 2 == 0 ? "true" : "false") +
             R"(,"score":)" + (bad ? std::string("[1,2]") : std::to_string(50.0 + i * 2.5)) + "}";
    }
    s += R"(],"total":20,"page":1,"version":"2.0"})";
    return s;
}

/// Generate large JSON document (~300KB).
static std::string generate_large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with some longer title text for realism")" +
             R"(,"description":"This is a detailed description for item )" +
             std::to_string(i) +
             R"( which contains enough text to be representative of real data.")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"quantity":)" + std::to_string(i % 100) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","tag)" + std::to_string(i % 5) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

/// Generate medium XML document, the same page as generate_medium_json().
static std::string generate_medium_xml(bool mismatched = false) {
    std::string s(xml::kHeader);
    s += R"(<page version="2.0"><users>)";
    for (int i = 0; i < 20; ++i) {
        const bool bad = mismatched && i % 3 == 0;
        s += R"(<user id=")" + (bad ? std::string("x") : std::to_string(i)) + R"(">)";
        s += "<name>user_" + std::to_string(i) + "</name>";
        s += "<email>user" + std::to_string(i) + "@test.com</email>";
        s += std::string("<active>") + (i % 2 == 0 ? "true" : "false") + "</active>";
        s += "<score>" + (bad ? std::string("n/a") : std::to_string(50.0 + i * 2.5)) + "</score>";
        s += "</user>";
    }
    s += "</users><total>20</total><number>1</number></page>";
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════════
// JSON benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_JsonDecodeSmall(benchmark::State& state) {
    auto input = generate_small_json();
    for (auto _ : state) {
        BenchUser u;
        json::decode(input, u);
        benchmark::DoNotOptimize(u);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_JsonDecodeSmall);

static void BM_JsonDecodeMedium(benchmark::State& state) {
    auto input = generate_medium_json();
    for (auto _ : state) {
        BenchPage p;
        json::decode(input, p);
        benchmark::DoNotOptimize(p);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_JsonDecodeMedium);

static void BM_JsonDecodeMediumLenient(benchmark::State& state) {
    auto input = generate_medium_json(true);
    for (auto _ : state) {
        BenchPage p;
        json::Decoder dec(input);
        dec.allow_type_mismatch();
        dec.decode(p);
        benchmark::DoNotOptimize(p);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_JsonDecodeMediumLenient);

static void BM_JsonDecodeLarge(benchmark::State& state) {
    auto input = generate_large_json();
    for (auto _ : state) {
        BenchCatalog c;
        json::decode(input, c);
        benchmark::DoNotOptimize(c);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_JsonDecodeLarge);

static void BM_JsonDecodeValue(benchmark::State& state) {
    auto input = generate_large_json();
    for (auto _ : state) {
        Value v;
        json::decode(input, v);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_JsonDecodeValue);

static void BM_JsonDecodeIntArray(benchmark::State& state) {
    const auto count = state.range(0);
    std::string input = "[";
    for (int64_t i = 0; i < count; ++i) {
        if (i > 0) input += ",";
        input += std::to_string(i);
    }
    input += "]";
    for (auto _ : state) {
        std::vector<int> v;
        json::decode(input, v);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_JsonDecodeIntArray)->Arg(100)->Arg(1000)->Arg(10000);

// ═══════════════════════════════════════════════════════════════════════════════
// XML benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_XmlDecodeMedium(benchmark::State& state) {
    auto input = generate_medium_xml();
    for (auto _ : state) {
        BenchPage p;
        xml::decode(input, p);
        benchmark::DoNotOptimize(p);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_XmlDecodeMedium);

static void BM_XmlDecodeMediumLenient(benchmark::State& state) {
    auto input = generate_medium_xml(true);
    for (auto _ : state) {
        BenchPage p;
        xml::Decoder dec(input);
        dec.allow_type_mismatch();
        dec.decode(p);
        benchmark::DoNotOptimize(p);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_XmlDecodeMediumLenient);

// ═══════════════════════════════════════════════════════════════════════════════
// Descriptor cache
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_CacheLookup(benchmark::State& state) {
    auto& cache = DescriptorCache::global();
    cache.get<BenchPage>();
    for (auto _ : state) {
        const Descriptor& d = cache.get<BenchPage>();
        benchmark::DoNotOptimize(&d);
    }
}
BENCHMARK(BM_CacheLookup)->Threads(1)->Threads(4);

static void BM_CacheBuild(benchmark::State& state) {
    for (auto _ : state) {
        DescriptorCache cache;
        const Descriptor& d = cache.get<BenchCatalog>();
        benchmark::DoNotOptimize(&d);
    }
}
BENCHMARK(BM_CacheBuild);
