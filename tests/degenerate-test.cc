#include <soa-core/raw_storage.hh>
#include <soa-core/vector.hh>

#include <nexus/test.hh>

#include <limits>
#include <sstream>

#include "test-support.hh"

using soa_test::marker;

TEST("zero-field records - storage never touches the resource")
{
    soa_test::counting_resource resource;
    soa::raw_storage<marker> s(&resource);

    CHECK(s.capacity() == std::numeric_limits<soa::isize>::max());
    CHECK(soa::raw_storage<marker>::max_capacity() == std::numeric_limits<soa::isize>::max());
    CHECK(!s.is_allocated());
    CHECK(s.as_bytes() == nullptr);
    CHECK(s.resource() == &resource);

    CHECK(s.try_allocate(4) == soa::storage_error::none);
    CHECK(s.try_grow(4, 1000, 4) == soa::storage_error::none);
    CHECK(s.try_shrink(1000, 2, 2) == soa::storage_error::none);
    CHECK(s.try_allocate(std::numeric_limits<soa::isize>::max()) == soa::storage_error::none);

    s.write(0, marker{});
    s.emplace(1);
    s.copy_within(0, 1, 1);
    CHECK(s.read(0) == marker{});
    s.destroy(0, 2);

    auto const slice = s.slice(3, 10);
    CHECK(slice.size() == 7);
    int rows = 0;
    for ([[maybe_unused]] auto row : slice)
        ++rows;
    CHECK(rows == 7);

    s.deallocate(2);

    CHECK(resource.allocations == 0);
    CHECK(resource.deallocations == 0);
    CHECK(resource.refused == 0);
}

TEST("zero-field records - raw parts carry only the resource")
{
    soa_test::counting_resource resource;
    soa::raw_storage<marker> s(&resource);

    auto const parts = s.release_raw_parts();
    CHECK(parts.block == nullptr);
    CHECK(parts.resource == &resource);

    auto const adopted = soa::raw_storage<marker>::from_raw_parts(parts);
    CHECK(adopted.custom_resource() == &resource);
}

TEST("zero-field records - rows")
{
    soa::raw_storage<marker> s;
    auto const row = s.row(5);

    CHECK(row == marker{});
    CHECK(row == s.row(0));
    CHECK(soa::with_record(row, [](marker const&) { return 42; }) == 42);

    std::ostringstream ss;
    ss << row;
    CHECK(ss.str() == "()");
}

TEST("zero-field records - vector counts without allocating")
{
    soa_test::counting_resource resource;
    soa::vector<marker> v(&resource);

    CHECK(v.capacity() == std::numeric_limits<soa::isize>::max());

    for (int i = 0; i < 1000; ++i)
        v.push_back(marker{});
    v.emplace_back();
    v.insert_at(3, marker{});
    CHECK(v.size() == 1002);

    CHECK(v.pop_back() == marker{});
    CHECK(v.pop_at(0) == marker{});
    CHECK(v.pop_at_unordered(5) == marker{});
    v.remove_back();
    v.remove_at(0);
    v.remove_at_unordered(0);
    CHECK(v.size() == 996);

    int visited = 0;
    for ([[maybe_unused]] auto row : v)
        ++visited;
    CHECK(visited == 996);
    CHECK(v.slices(10, 20).size() == 10);

    SECTION("capacity operations are no-ops")
    {
        v.reserve(1 << 20);
        CHECK(v.try_reserve(std::numeric_limits<soa::isize>::max()) == soa::storage_error::none);
        v.shrink_to_fit();
        CHECK(v.capacity() == std::numeric_limits<soa::isize>::max());
    }

    SECTION("copy, compare and resize")
    {
        auto copy = v;
        CHECK(copy.size() == v.size());
        CHECK(copy == v);

        copy.resize(3);
        CHECK(copy != v);
        copy.resize(10);
        CHECK(copy.size() == 10);

        copy.clear();
        CHECK(copy.empty());
    }

    CHECK(resource.allocations == 0);
    CHECK(resource.deallocations == 0);
}
