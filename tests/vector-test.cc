#include <soa-core/vector.hh>

#include <nexus/test.hh>

#include <array>
#include <limits>
#include <string>

#include "test-support.hh"

using soa_test::named;
using soa_test::particle;
using soa_test::plain_pair;
using soa_test::Tracked;
using soa_test::tracked_row;

namespace
{
particle make_particle(int i)
{
    return particle{float(i), float(2 * i), i};
}

soa::vector<particle> make_particles(int count)
{
    soa::vector<particle> v;
    for (int i = 0; i < count; ++i)
        v.push_back(make_particle(i));
    return v;
}

// ids of all rows, in order
std::string ids_of(soa::vector<particle> const& v)
{
    std::string s;
    for (int id : v.get<&particle::id>())
        s += std::to_string(id) + ";";
    return s;
}
} // namespace

TEST("vector - default construction invariants")
{
    SECTION("empty state")
    {
        soa::vector<particle> v;
        CHECK(v.size() == 0);
        CHECK(v.empty());
        CHECK(v.capacity() == 0);
        CHECK(v.begin().index() == v.end().index());
        CHECK(v.get<0>().empty());
        CHECK(v.get<0>().data() != nullptr);
        CHECK(!v.storage().is_allocated());
        CHECK(v.resource() == soa::default_memory_resource);
    }

    SECTION("iteration on empty vector")
    {
        soa::vector<particle> v;
        int count = 0;
        for ([[maybe_unused]] auto row : v)
            ++count;
        CHECK(count == 0);
    }

    SECTION("no elements are constructed")
    {
        Tracked::reset_counters();
        {
            soa::vector<tracked_row> v;
            CHECK(v.capacity() == 0);
        }
        CHECK(Tracked::default_ctor_count == 0);
        CHECK(Tracked::dtor_count == 0);
    }
}

TEST("vector - push_back and growth")
{
    soa::vector<particle> v;

    auto row = v.push_back(make_particle(1));
    CHECK(row.get<&particle::id>() == 1);
    CHECK(v.size() == 1);
    CHECK(v.capacity() == soa::vector<particle>::min_growth_capacity);

    for (int i = 2; i <= 4; ++i)
        v.push_back(make_particle(i));
    CHECK(v.capacity() == 4);

    v.push_back(make_particle(5));
    CHECK(v.capacity() == 8);

    for (int i = 6; i <= 17; ++i)
        v.push_back(make_particle(i));
    CHECK(v.size() == 17);
    CHECK(v.capacity() == 32);

    for (int i = 0; i < 17; ++i)
        CHECK(v[i] == make_particle(i + 1));

    CHECK(v.front().get<2>() == 1);
    CHECK(v.back().get<2>() == 17);
}

TEST("vector - emplace_back")
{
    SECTION("one value per field")
    {
        soa::vector<particle> v;
        auto row = v.emplace_back(1.f, 2.f, 3);
        CHECK(row.get<0>() == 1.f);
        CHECK(v.size() == 1);

        for (int i = 0; i < 10; ++i)
            v.emplace_back(float(i), 0.f, i);
        CHECK(v.size() == 11);
        CHECK(v.back().get<2>() == 9);
    }

    SECTION("arguments may refer to the vector itself")
    {
        auto v = make_particles(4);
        REQUIRE(v.size() == v.capacity());

        // growth relocates the columns before the new row is written
        v.emplace_back(v[1].get<0>(), v[2].get<1>(), v[3].get<2>());
        CHECK(v.size() == 5);
        CHECK(v.back().get<0>() == 1.f);
        CHECK(v.back().get<1>() == 4.f);
        CHECK(v.back().get<2>() == 3);
    }

    SECTION("non-trivial fields")
    {
        soa::vector<named> v;
        v.emplace_back(std::string("first"), 1);
        v.emplace_back("second", 2);
        CHECK(v[0].get<&named::name>() == "first");
        CHECK(v[1].get<&named::name>() == "second");
    }
}

TEST("vector - insert_at")
{
    auto v = make_particles(4);

    v.insert_at(0, make_particle(10));
    CHECK(ids_of(v) == "10;0;1;2;3;");

    v.insert_at(5, make_particle(11));
    CHECK(ids_of(v) == "10;0;1;2;3;11;");

    auto row = v.insert_at(2, make_particle(12));
    CHECK(row.get<&particle::id>() == 12);
    CHECK(ids_of(v) == "10;0;12;1;2;3;11;");

    for (int i = 0; i < 7; ++i)
        CHECK(v[i].get<&particle::x>() == float(v[i].get<&particle::id>()));
}

TEST("vector - removal")
{
    SECTION("pop_back and remove_back")
    {
        auto v = make_particles(3);
        auto const last = v.pop_back();
        CHECK(last == make_particle(2));
        v.remove_back();
        CHECK(ids_of(v) == "0;");
    }

    SECTION("ordered removal")
    {
        auto v = make_particles(5);

        auto const p = v.pop_at(1);
        CHECK(p.id == 1);
        CHECK(ids_of(v) == "0;2;3;4;");

        v.remove_at(0);
        CHECK(ids_of(v) == "2;3;4;");

        v.remove_at(2);
        CHECK(ids_of(v) == "2;3;");
    }

    SECTION("unordered removal")
    {
        auto v = make_particles(5);

        auto const p = v.pop_at_unordered(1);
        CHECK(p.id == 1);
        CHECK(ids_of(v) == "0;4;2;3;");

        v.remove_at_unordered(3);
        CHECK(ids_of(v) == "0;4;2;");

        v.remove_at_unordered(0);
        CHECK(ids_of(v) == "2;4;");
    }

    SECTION("clear keeps the capacity")
    {
        auto v = make_particles(5);
        auto const capacity = v.capacity();
        v.clear();
        CHECK(v.empty());
        CHECK(v.capacity() == capacity);
    }
}

TEST("vector - element lifetimes")
{
    Tracked::reset_counters();
    {
        soa::vector<tracked_row> v;
        for (int i = 0; i < 6; ++i)
            v.push_back(tracked_row{Tracked(i), i});
        CHECK(Tracked::live_count() == 6);

        v.insert_at(1, tracked_row{Tracked(10), 10});
        CHECK(Tracked::live_count() == 7);
        CHECK(v[1].get<0>().value == 10);
        CHECK(v[2].get<0>().value == 1);

        {
            auto const r = v.pop_at(0);
            CHECK(r.item.value == 0);
        }
        CHECK(Tracked::live_count() == 6);

        v.remove_at(2);
        v.remove_at_unordered(0);
        CHECK(Tracked::live_count() == 4);
        CHECK(v[0].get<0>().value == 5);

        {
            auto const r = v.pop_at_unordered(3);
            CHECK(r.tag == 4);
        }
        CHECK(Tracked::live_count() == 3);

        v.shrink_to_fit();
        CHECK(v.capacity() == 3);
        CHECK(Tracked::live_count() == 3);

        auto copy = v;
        CHECK(Tracked::live_count() == 6);
        CHECK(copy[2].get<0>().value == v[2].get<0>().value);

        copy.clear();
        CHECK(Tracked::live_count() == 3);

        v.resize(5);
        CHECK(Tracked::live_count() == 5);
        v.resize(1);
        CHECK(Tracked::live_count() == 1);
    }
    CHECK(Tracked::live_count() == 0);
}

TEST("vector - capacity management")
{
    SECTION("reserve")
    {
        soa::vector<particle> v;
        v.reserve(10);
        CHECK(v.capacity() == 10);
        CHECK(v.empty());

        v.reserve(5);
        CHECK(v.capacity() == 10);
    }

    SECTION("reserve keeps existing rows")
    {
        auto v = make_particles(3);
        v.reserve(100);
        CHECK(v.capacity() == 100);
        CHECK(ids_of(v) == "0;1;2;");
    }

    SECTION("try_reserve reports failures")
    {
        soa_test::counting_resource resource;
        soa::vector<particle> v(&resource);
        v.push_back(make_particle(7));

        CHECK(v.try_reserve(std::numeric_limits<soa::isize>::max()) == soa::storage_error::overflow);
        CHECK(v.capacity() == 4);

        resource.max_block_bytes = 100;
        CHECK(v.try_reserve(1000) == soa::storage_error::allocation_failure);
        CHECK(v.capacity() == 4);
        CHECK(v[0] == make_particle(7));

        CHECK(v.try_reserve(8) == soa::storage_error::none);
        CHECK(v.capacity() == 8);
    }

    SECTION("fatal reserve")
    {
        soa::vector<particle> v;
        CHECK(soa_test::triggers_assert([&] { v.reserve(std::numeric_limits<soa::isize>::max()); }));
        CHECK(v.capacity() == 0);
    }

    SECTION("shrink_to_fit")
    {
        soa_test::counting_resource resource;
        soa::vector<particle> v(&resource);
        for (int i = 0; i < 5; ++i)
            v.push_back(make_particle(i));
        CHECK(v.capacity() == 8);

        v.shrink_to_fit();
        CHECK(v.capacity() == 5);
        CHECK(ids_of(v) == "0;1;2;3;4;");

        v.clear();
        v.shrink_to_fit();
        CHECK(v.capacity() == 0);
        CHECK(!v.storage().is_allocated());
        CHECK(resource.live_bytes == 0);
    }

    SECTION("max_capacity")
    {
        CHECK(soa::vector<particle>::max_capacity() > 0);
        CHECK(soa::vector<particle>::max_capacity() <= std::numeric_limits<soa::isize>::max() / 12);
    }
}

TEST("vector - resize")
{
    soa::vector<particle> v;
    v.resize(3);
    CHECK(v.size() == 3);
    CHECK(v[2] == particle{});

    v[1].get<&particle::id>() = 5;
    v.resize(1);
    CHECK(v.size() == 1);
    v.resize(2);
    CHECK(v[1].get<&particle::id>() == 0);
}

TEST("vector - columns and slices")
{
    auto v = make_particles(6);

    auto xs = v.get<&particle::x>();
    CHECK(xs.size() == 6);
    for (auto& x : xs)
        x *= 10.f;
    CHECK(v[3].get<0>() == 30.f);

    auto const& cv = v;
    CHECK(cv.get<2>().size() == 6);
    CHECK(cv.get<&particle::y>()[5] == 10.f);

    auto const all = v.slices();
    CHECK(all.size() == 6);
    CHECK(all.get<2>().data() == v.get<2>().data());

    auto const part = cv.slices(2, 5);
    CHECK(part.size() == 3);
    CHECK(part.row(0).get<&particle::id>() == 2);

    int visited = 0;
    for (auto row : cv)
    {
        CHECK(row.get<&particle::id>() == visited);
        ++visited;
    }
    CHECK(visited == 6);

    for (auto row : v)
        row.get<&particle::y>() = -1.f;
    CHECK(v[0].get<1>() == -1.f);
}

TEST("vector - copy, move and comparison")
{
    soa_test::counting_resource resource;
    soa::vector<named> v(&resource);
    v.push_back(named{"a long enough name to leave the small buffer", 1});
    v.push_back(named{"b", 2});

    SECTION("copy is deep and uses the same resource")
    {
        auto copy = v;
        CHECK(copy == v);
        CHECK(copy.resource() == &resource);
        CHECK(copy.get<0>().data() != v.get<0>().data());

        copy[0].get<&named::count>() = 5;
        CHECK(copy != v);
        CHECK(v[0].get<&named::count>() == 1);
    }

    SECTION("copy assignment")
    {
        soa::vector<named> other;
        other.push_back(named{"to be replaced", 0});
        other = v;
        CHECK(other == v);
        CHECK(other.size() == 2);
    }

    SECTION("move leaves the source empty")
    {
        auto const* const block = v.storage().as_bytes();
        auto moved = soa::move(v);
        CHECK(moved.size() == 2);
        CHECK(moved.storage().as_bytes() == block);
        CHECK(v.empty());
        CHECK(v.capacity() == 0);

        soa::vector<named> target;
        target.push_back(named{"dropped", 0});
        target = soa::move(moved);
        CHECK(target.size() == 2);
        CHECK(target[1].get<&named::name>() == "b");
    }

    SECTION("comparison")
    {
        soa::vector<named> shorter(&resource);
        shorter.push_back(named{"a long enough name to leave the small buffer", 1});
        CHECK(shorter != v);

        shorter.push_back(named{"b", 2});
        CHECK(shorter == v);
    }
}

TEST("vector - records without operator==")
{
    soa::vector<plain_pair> a = {plain_pair{1, 2}, plain_pair{3, 4}};
    soa::vector<plain_pair> b = a;
    bool const equal = a == b;
    CHECK(equal);

    b[1].get<&plain_pair::second>() = 5;
    bool const changed = a != b;
    CHECK(changed);
}

TEST("vector - factories")
{
    SECTION("create_with_capacity")
    {
        soa_test::counting_resource resource;
        auto v = soa::vector<particle>::create_with_capacity(20, &resource);
        CHECK(v.capacity() == 20);
        CHECK(v.empty());
        CHECK(resource.allocations == 1);
    }

    SECTION("create_copy_of records")
    {
        std::array<particle, 3> const records = {make_particle(1), make_particle(2), make_particle(3)};
        auto v = soa::vector<particle>::create_copy_of(soa::span<particle const>(records.data(), 3));
        CHECK(v.size() == 3);
        CHECK(ids_of(v) == "1;2;3;");
        CHECK(v.get<&particle::y>()[2] == 6.f);
    }

    SECTION("create_copy_of slice")
    {
        auto const source = make_particles(6);
        auto v = soa::vector<particle>::create_copy_of(source.slices(1, 4));
        CHECK(ids_of(v) == "1;2;3;");
    }

    SECTION("initializer list")
    {
        soa::vector<particle> v = {make_particle(4), make_particle(5)};
        CHECK(v.size() == 2);
        CHECK(v.capacity() == 2);
        CHECK(v[1] == make_particle(5));
    }
}

TEST("vector - custom resource")
{
    soa_test::arena_resource arena;
    {
        soa::vector<particle> v(&arena);
        for (int i = 0; i < 40; ++i)
            v.push_back(make_particle(i));

        // doubling resizes the only block in place
        CHECK(arena.allocations == 1);
        CHECK(arena.resizes_in_place == 4);
        CHECK(v.resource() == &arena);

        for (int i = 0; i < 40; ++i)
            CHECK(v[i].get<&particle::id>() == i);
    }
    CHECK(arena.deallocations == 1);
}

#if SOA_ASSERT_ENABLED
TEST("vector - contract violations")
{
    auto v = make_particles(2);

    CHECK(soa_test::triggers_assert([&] { (void)v[2]; }));
    CHECK(soa_test::triggers_assert([&] { (void)v.row(-1); }));
    CHECK(soa_test::triggers_assert([&] { v.insert_at(3, make_particle(0)); }));
    CHECK(soa_test::triggers_assert([&] { v.remove_at(2); }));
    CHECK(soa_test::triggers_assert([&] { (void)v.slices(1, 3); }));

    soa::vector<particle> empty;
    CHECK(soa_test::triggers_assert([&] { (void)empty.front(); }));
    CHECK(soa_test::triggers_assert([&] { empty.remove_back(); }));

    CHECK(v.size() == 2);
}
#endif
