////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `mummy-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "tools.hpp"
#include "pfs/mummy/mummy.hpp"
#include <array>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <tuple>

struct particle
{
    std::uint64_t id {0};
    mummy::string name;
    mummy::vector<double> samples;
    std::uint32_t flags {0};

    auto fields () const { return std::tie(name, samples); }
    auto fields () { return std::tie(name, samples); }
};

struct cluster
{
    mummy::string label;
    mummy::vector<particle> members;

    auto fields () const { return std::tie(label, members); }
    auto fields () { return std::tie(label, members); }
};

namespace mummy {

template <>
struct tomb<particle> : record_tomb<particle> {};

template <>
struct tomb<cluster> : record_tomb<cluster> {};

} // namespace mummy

static particle make_particle (std::uint64_t id, char const * name, std::initializer_list<double> samples)
{
    particle p;
    p.id = id;
    p.name = name;
    p.samples = samples;
    p.flags = static_cast<std::uint32_t>(id * 3);
    return p;
}

TEST_CASE("record fields") {
    auto p = make_particle(1, "alpha", {0.5, 1.5});

    archive_t ar;
    mummy::tomb<particle>::entomb(p, ar);

    // Name text then samples block
    REQUIRE_EQ(ar.size(), 5 + 2 * sizeof(double));
    CHECK_EQ(mummy::tomb<particle>::extent(p), ar.size());
    CHECK_EQ(std::string(ar.data(), 5), "alpha");

    tools::image<particle> img {p};
    mummy::tomb<particle>::embalm(*img);

    CHECK(img->name.data() == nullptr);
    CHECK(img->samples.data() == nullptr);
    CHECK_EQ(img->id, 1);
    CHECK_EQ(img->flags, 3);

    auto bytes = mummy::byte_span{ar.data(), ar.size()};

    REQUIRE(mummy::tomb<particle>::exhume(*img, bytes));
    CHECK_EQ(img->name, "alpha");
    CHECK_EQ(img->samples, p.samples);
    CHECK(bytes.empty());
}

TEST_CASE("records round trip") {
    mummy::vector<particle> particles;

    for (std::uint64_t i = 0; i < 32; i++) {
        auto name = std::to_string(i);
        particles.push_back(make_particle(i, name.c_str(), {double(i), double(i) / 2}));
    }

    particles.push_back(make_particle(100, "", {}));

    archive_t ar;
    mummy::encode(particles, ar);

    CHECK_EQ(ar.size(), mummy::measure(particles));

    auto result = mummy::decode<particle>(ar);

    REQUIRE(result);
    REQUIRE_EQ(result->size(), particles.size());
    CHECK(result.remaining().empty());

    for (std::size_t i = 0; i < particles.size(); i++) {
        auto const & decoded = (*result)[i];
        CHECK_EQ(decoded.id, particles[i].id);
        CHECK_EQ(decoded.flags, particles[i].flags);
        CHECK_EQ(decoded.name, particles[i].name);
        CHECK_EQ(decoded.samples, particles[i].samples);
    }
}

TEST_CASE("nested records") {
    cluster c1;
    c1.label = "first";
    c1.members.push_back(make_particle(1, "a", {1.0}));
    c1.members.push_back(make_particle(2, "bc", {2.0, 3.0}));

    cluster c2;
    c2.label = "empty";

    std::vector<cluster> clusters;
    clusters.push_back(c1);
    clusters.push_back(c2);

    archive_t ar;
    mummy::encode(clusters, ar);

    auto result = mummy::decode<cluster>(ar);

    REQUIRE(result);
    REQUIRE_EQ(result->size(), 2);

    auto const & d1 = (*result)[0];
    CHECK_EQ(d1.label, "first");
    REQUIRE_EQ(d1.members.size(), 2);
    CHECK_EQ(d1.members[0].name, "a");
    CHECK_EQ(d1.members[1].name, "bc");
    CHECK_EQ(d1.members[1].samples, (mummy::vector<double>{2.0, 3.0}));
    CHECK_EQ(d1.members[1].id, 2);

    auto const & d2 = (*result)[1];
    CHECK_EQ(d2.label, "empty");
    CHECK(d2.members.empty());

    auto truncated = tools::truncated(ar, ar.size() - 1);
    CHECK_FALSE(mummy::decode<cluster>(truncated));
}

TEST_CASE("tuples round trip") {
    using item_t = std::tuple<std::uint8_t, mummy::string, mummy::vector<std::uint16_t>>;

    std::vector<item_t> items;
    items.emplace_back(1, "one", mummy::vector<std::uint16_t>{1});
    items.emplace_back(2, "", mummy::vector<std::uint16_t>{});
    items.emplace_back(3, "three", mummy::vector<std::uint16_t>{1, 2, 3});

    archive_t ar;
    mummy::encode(items, ar);

    auto result = mummy::decode<item_t>(ar);

    REQUIRE(result);
    REQUIRE_EQ(result->size(), items.size());

    for (std::size_t i = 0; i < items.size(); i++) {
        CHECK_EQ(std::get<0>((*result)[i]), std::get<0>(items[i]));
        CHECK_EQ(std::get<1>((*result)[i]), std::get<1>(items[i]));
        CHECK_EQ(std::get<2>((*result)[i]), std::get<2>(items[i]));
    }
}

TEST_CASE("arrays round trip") {
    using item_t = std::array<mummy::string, 2>;

    std::vector<item_t> items;
    items.push_back(item_t{{"key", "value"}});
    items.push_back(item_t{{"", "x"}});

    archive_t ar;
    mummy::encode(items, ar);

    CHECK_EQ(ar.size(), sizeof(mummy::slice<item_t>) + 2 * sizeof(item_t) + 9);

    auto result = mummy::decode<item_t>(ar);

    REQUIRE(result);
    REQUIRE_EQ(result->size(), 2);
    CHECK_EQ((*result)[0][0], "key");
    CHECK_EQ((*result)[0][1], "value");
    CHECK((*result)[1][0].empty());
    CHECK_EQ((*result)[1][1], "x");
}
