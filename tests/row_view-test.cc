#include <soa-core/row_view.hh>

#include <nexus/test.hh>

#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>

#include "test-support.hh"

using soa_test::guarded;
using soa_test::named;
using soa_test::particle;
using soa_test::plain_pair;
using soa_test::Tracked;
using soa_test::tracked_row;

namespace
{
template <class Row>
std::string to_text(Row const& row)
{
    std::ostringstream ss;
    ss << row;
    return ss.str();
}
} // namespace

TEST("row_view - field access")
{
    float x = 1.f;
    float y = 2.f;
    int id = 3;

    auto const row = soa::row_view<particle>(std::tuple(&x, &y, &id));

    SECTION("by index and by member")
    {
        CHECK(row.get<0>() == 1.f);
        CHECK(row.get<1>() == 2.f);
        CHECK(row.get<2>() == 3);

        CHECK(&row.get<&particle::x>() == &x);
        CHECK(&row.get<&particle::y>() == &y);
        CHECK(&row.get<&particle::id>() == &id);
    }

    SECTION("writes go to the columns")
    {
        row.get<&particle::y>() = 20.f;
        row.get<2>() += 1;
        CHECK(y == 20.f);
        CHECK(id == 4);
    }

    SECTION("read-only rows")
    {
        soa::row_view<particle const> const c = row;
        static_assert(std::is_same_v<decltype(c.get<0>()), float const&>);
        static_assert(std::is_same_v<decltype(c.get<&particle::id>()), int const&>);
        CHECK(&c.get<1>() == &y);
    }

    SECTION("to_record and assign")
    {
        auto const copy = row.to_record();
        CHECK(copy.x == x);
        CHECK(copy.y == y);
        CHECK(copy.id == id);

        auto const replacement = particle{7.f, 8.f, 9};
        row.assign(replacement);
        CHECK(x == 7.f);
        CHECK(y == 8.f);
        CHECK(id == 9);
    }
}

TEST("row_view - equality")
{
    float xs[] = {1.f, 1.f, 5.f};
    float ys[] = {2.f, 2.f, 2.f};
    int ids[] = {3, 3, 3};

    auto const row_at = [&](int i) { return soa::row_view<particle>(std::tuple(xs + i, ys + i, ids + i)); };

    auto const same = particle{1.f, 2.f, 3};
    auto const other = particle{1.f, 2.f, 4};

    CHECK(row_at(0) == row_at(1));
    CHECK(row_at(0) != row_at(2));

    CHECK(row_at(0) == same);
    CHECK(row_at(0) != other);
    CHECK(same == row_at(1));

    soa::row_view<particle const> const c = row_at(0);
    CHECK(c == same);
    CHECK(c == soa::row_view<particle const>(row_at(1)));

    SECTION("records without operator== compare field by field")
    {
        int firsts[] = {1, 1, 1};
        int seconds[] = {2, 2, 3};
        auto const pair_at = [&](int i) { return soa::row_view<plain_pair>(std::tuple(firsts + i, seconds + i)); };

        CHECK(pair_at(0) == pair_at(1));
        CHECK(pair_at(0) != pair_at(2));

        auto const value = plain_pair{1, 3};
        bool const matches = pair_at(2) == value;
        bool const differs = pair_at(0) != value;
        CHECK(matches);
        CHECK(differs);
    }
}

TEST("row_view - streaming")
{
    float x = 1.5f;
    float y = -2.f;
    int id = 7;
    auto const row = soa::row_view<particle const>(std::tuple(&x, &y, &id));

    CHECK(to_text(row) == "particle{1.5, -2, #7}");

    SECTION("records without operator<< print their fields")
    {
        int first = 4;
        int second = 5;
        auto const pair = soa::row_view<plain_pair>(std::tuple(&first, &second));
        CHECK(to_text(pair) == "(4, 5)");
    }
}

TEST("row_view - borrowed records")
{
    SECTION("bitwise snapshot never runs the record destructor")
    {
        int handles[] = {11, 11, 12};
        auto const row_at = [&](int i) { return soa::row_view<guarded>(std::tuple(handles + i)); };

        auto const destroyed_before = guarded::destroyed;

        auto const handle = soa::with_record(row_at(0), [](guarded const& g) { return g.handle; });
        CHECK(handle == 11);

        {
            soa::borrowed_record<guarded> snapshot(row_at(2));
            CHECK(snapshot->handle == 12);
            CHECK((*snapshot).handle == 12);
            CHECK(&snapshot.get() == &*snapshot);
        }

        CHECK(row_at(0) == row_at(1));
        CHECK(row_at(0) != row_at(2));

        CHECK(guarded::destroyed == destroyed_before);
    }

    SECTION("snapshot refers to a copy of the row")
    {
        float x = 1.f;
        float y = 2.f;
        int id = 3;
        auto const row = soa::row_view<particle>(std::tuple(&x, &y, &id));

        auto const expected = particle{1.f, 2.f, 3};
        soa::borrowed_record<particle> snapshot(row);
        CHECK(&snapshot->x != &x);
        CHECK(*snapshot == expected);
    }

    SECTION("non-trivial fields are copied and released")
    {
        Tracked::reset_counters();
        {
            Tracked item(5);
            int tag = 6;
            auto const row = soa::row_view<tracked_row>(std::tuple(&item, &tag));

            auto const sum = soa::with_record(row, [](tracked_row const& r) { return r.item.value + r.tag; });
            CHECK(sum == 11);
            CHECK(Tracked::copy_ctor_count == 1);
            CHECK(Tracked::live_count() == 1);
            CHECK(item.value == 5);
        }
        CHECK(Tracked::live_count() == 0);
    }

    SECTION("strings stay with the row")
    {
        std::string name = "a name that does not fit into the small string buffer";
        int count = 2;
        auto const row = soa::row_view<named>(std::tuple(&name, &count));

        auto const length = soa::with_record(row, [](named const& n) { return n.name.size(); });
        CHECK(length == name.size());
        CHECK(name == "a name that does not fit into the small string buffer");

        auto const expected = named{"a name that does not fit into the small string buffer", 2};
        bool const equal = row == expected;
        CHECK(equal);
    }
}
